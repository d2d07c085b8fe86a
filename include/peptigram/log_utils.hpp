#pragma once

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>

namespace peptigram {
namespace log_utils {

// Human-readable duration: "850 ms", "4.2 s", "3m 12s", "1h 5m 0s"
inline std::string format_duration_ms(int64_t ms) {
    if (ms < 0) ms = 0;
    if (ms < 1000) {
        return std::to_string(ms) + " ms";
    }

    const int64_t total_seconds = ms / 1000;
    if (total_seconds < 60) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1)
            << (static_cast<double>(ms) / 1000.0) << " s";
        return oss.str();
    }

    const int64_t seconds = total_seconds % 60;
    const int64_t total_minutes = total_seconds / 60;
    if (total_minutes < 60) {
        return std::to_string(total_minutes) + "m " + std::to_string(seconds) + "s";
    }

    const int64_t minutes = total_minutes % 60;
    const int64_t hours = total_minutes / 60;
    return std::to_string(hours) + "h " + std::to_string(minutes) + "m " +
           std::to_string(seconds) + "s";
}

template <typename Clock, typename DurA, typename DurB>
inline std::string format_elapsed(
    const std::chrono::time_point<Clock, DurA>& start,
    const std::chrono::time_point<Clock, DurB>& end) {
    const auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    return format_duration_ms(ms);
}

// Wall-clock timer for "  <label> runtime: ..." log lines
class StepTimer {
public:
    explicit StepTimer(std::string label)
        : label_(std::move(label)), start_(std::chrono::steady_clock::now()) {}

    std::string elapsed() const {
        return format_elapsed(start_, std::chrono::steady_clock::now());
    }

    void report(std::ostream& out) const {
        out << "  " << label_ << " runtime: " << elapsed() << std::endl;
    }

private:
    std::string label_;
    std::chrono::steady_clock::time_point start_;
};

}  // namespace log_utils
}  // namespace peptigram
