#ifndef KGSCORE_UTIL_H
#define KGSCORE_UTIL_H

#include <chrono>

#include "common/datatypes.h"

class Timer {
   public:
    std::chrono::time_point<std::chrono::high_resolution_clock> start_time_;
    std::chrono::time_point<std::chrono::high_resolution_clock> stop_time_;

    Timer() {}

    void start() { start_time_ = std::chrono::high_resolution_clock::now(); }

    void stop() { stop_time_ = std::chrono::high_resolution_clock::now(); }

    int64_t getDuration(bool ms = true) {
        int64_t duration;
        if (ms) {
            duration = std::chrono::duration_cast<std::chrono::milliseconds>(stop_time_ - start_time_).count();
        } else {
            duration = std::chrono::duration_cast<std::chrono::microseconds>(stop_time_ - start_time_).count();
        }
        return duration;
    }
};

bool has_nans(torch::Tensor values);

void assert_no_nans(torch::Tensor values);

void assert_defined(const torch::Tensor &values);

void assert_floating(const torch::Tensor &values, const std::string &name);

std::string shape_to_string(const torch::Tensor &values);

#endif  // KGSCORE_UTIL_H
