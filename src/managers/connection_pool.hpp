#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>
#include <core/types.hpp>
#include <ssh/remote_channel.hpp>

// At most `size` live channels shared by worker threads.
//
// acquire() hands out an idle channel, opens a new one while below the
// limit, and otherwise waits for a release. Dead channels are dropped on
// release, which frees their slot for a fresh connection.
class ConnectionPool {
public:
    using Factory = std::function<Result<std::unique_ptr<RemoteChannel>>()>;

    ConnectionPool(Factory factory, int size, std::chrono::seconds timeout);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    Result<std::unique_ptr<RemoteChannel>> acquire();
    void release(std::unique_ptr<RemoteChannel> conn);

    // Close idle channels and refuse further acquires. Checked-out
    // channels are closed by whoever holds them.
    void shutdown();

    int size() const { return size_; }
    int live() const;
    int idle() const;
    int created() const;

private:
    Factory factory_;
    int size_;
    std::chrono::seconds timeout_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::unique_ptr<RemoteChannel>> idle_;
    int live_ = 0;              // idle + checked out + being opened
    int created_ = 0;
    bool closed_ = false;
};

// Holds one pooled channel for a scope and returns it on destruction.
class PooledChannel {
public:
    PooledChannel(ConnectionPool& pool, std::unique_ptr<RemoteChannel> conn)
        : pool_(pool), conn_(std::move(conn)) {}
    ~PooledChannel() { pool_.release(std::move(conn_)); }

    PooledChannel(const PooledChannel&) = delete;
    PooledChannel& operator=(const PooledChannel&) = delete;

    RemoteChannel& operator*() { return *conn_; }
    RemoteChannel* operator->() { return conn_.get(); }

private:
    ConnectionPool& pool_;
    std::unique_ptr<RemoteChannel> conn_;
};
