#include "progress.hpp"
#include <core/time_utils.hpp>
#include <fmt/format.h>

Progress::Progress(int total) : started_(std::chrono::steady_clock::now()) {
    counts_.total = total;
}

Progress::Counts Progress::record(bool success) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++counts_.done;
    if (success) {
        ++counts_.succeeded;
    } else {
        ++counts_.failed;
    }
    Counts c = counts_;
    c.elapsed_seconds = static_cast<long>(std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - started_).count());
    return c;
}

Progress::Counts Progress::counts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Counts c = counts_;
    c.elapsed_seconds = static_cast<long>(std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - started_).count());
    return c;
}

std::string Progress::format(const Counts& c) {
    return fmt::format("[{}/{}] {} ok, {} failed, {}", c.done, c.total, c.succeeded, c.failed,
                       format_elapsed(c.elapsed_seconds));
}

std::string Progress::line() const {
    return format(counts());
}
