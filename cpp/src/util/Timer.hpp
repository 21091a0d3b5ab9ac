#pragma once

#include <chrono>

namespace fcs {

// Wall time spent in a scan cycle or a broker request.
class Timer {
  public:
    using clock = std::chrono::steady_clock;

    void start() { start_ = clock::now(); }

    double elapsedMilliseconds() const {
        return std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(clock::now() - start_).count();
    }

    bool expired(double limitMilliseconds) const { return elapsedMilliseconds() >= limitMilliseconds; }

  private:
    clock::time_point start_ = clock::now();
};

}  // namespace fcs
