#include "connection_pool.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

ConnectionPool::ConnectionPool(Factory factory, int size, std::chrono::seconds timeout)
    : factory_(std::move(factory)), size_(size < 1 ? 1 : size), timeout_(timeout) {}

ConnectionPool::~ConnectionPool() {
    shutdown();
}

Result<std::unique_ptr<RemoteChannel>> ConnectionPool::acquire() {
    using R = Result<std::unique_ptr<RemoteChannel>>;
    std::unique_lock<std::mutex> lock(mutex_);

    auto deadline = std::chrono::steady_clock::now() + timeout_;
    for (;;) {
        if (closed_) return R::Err("connection pool is shut down");

        if (!idle_.empty()) {
            auto conn = std::move(idle_.back());
            idle_.pop_back();
            if (conn->alive()) return R::Ok(std::move(conn));
            // Went stale while idle
            --live_;
            ferry_log("[pool] dropping dead idle connection");
            continue;
        }

        if (live_ < size_) {
            ++live_;
            lock.unlock();
            auto made = factory_();
            lock.lock();
            if (made.is_err() || !made.value) {
                --live_;
                cv_.notify_one();
                return R::Err("cannot open pooled connection: " +
                              (made.is_err() ? made.error : std::string("factory returned nothing")));
            }
            ++created_;
            ferry_log(fmt::format("[pool] opened connection {}/{}", live_, size_));
            return R::Ok(std::move(made.value));
        }

        if (cv_.wait_until(lock, deadline) == std::cv_status::timeout) {
            // One last look: a release may have raced the timeout
            if (!idle_.empty() || live_ < size_) continue;
            return R::Err(fmt::format("no connection available after {}s ({} in use)",
                                      timeout_.count(), live_));
        }
    }
}

void ConnectionPool::release(std::unique_ptr<RemoteChannel> conn) {
    if (!conn) return;
    std::unique_ptr<RemoteChannel> discard;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || !conn->is_active()) {
            --live_;
            discard = std::move(conn);
            if (!closed_) ferry_log("[pool] dropped dead connection on release");
        } else {
            idle_.push_back(std::move(conn));
        }
    }
    cv_.notify_one();
    // discard closes outside the lock
}

void ConnectionPool::shutdown() {
    std::vector<std::unique_ptr<RemoteChannel>> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        closed_ = true;
        live_ -= static_cast<int>(idle_.size());
        drained.swap(idle_);
    }
    cv_.notify_all();
    if (!drained.empty()) {
        ferry_log(fmt::format("[pool] closed {} idle connection(s)", drained.size()));
    }
}

int ConnectionPool::live() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return live_;
}

int ConnectionPool::idle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(idle_.size());
}

int ConnectionPool::created() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return created_;
}
