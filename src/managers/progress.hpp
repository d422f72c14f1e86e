#pragma once

#include <chrono>
#include <mutex>
#include <string>

// Shared count of finished items. Workers call record() from any thread.
class Progress {
public:
    struct Counts {
        int total = 0;
        int done = 0;
        int succeeded = 0;
        int failed = 0;
        long elapsed_seconds = 0;
    };

    explicit Progress(int total);

    // Returns the counts including this item.
    Counts record(bool success);

    Counts counts() const;

    // "[3/10] 2 ok, 1 failed, 1m20s"
    std::string line() const;
    static std::string format(const Counts& c);

private:
    mutable std::mutex mutex_;
    Counts counts_;
    std::chrono::steady_clock::time_point started_;
};
