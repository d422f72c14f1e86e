#pragma once

// Test doubles: a RemoteChannel backed by the local filesystem and
// /bin/sh, plus local byte sources with fault injection.

#include <ssh/remote_channel.hpp>
#include <transfer/byte_source.hpp>
#include <core/checksum.hpp>
#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <mutex>
#include <random>
#include <sstream>
#include <string>
#include <vector>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

// Scratch directory removed on destruction.
class TempDir {
public:
    TempDir() {
        std::string tmpl = (fs::temp_directory_path() / "ferry_test_XXXXXX").string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        char* made = mkdtemp(buf.data());
        path_ = made ? fs::path(made) : fs::temp_directory_path() / "ferry_test_fallback";
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    const fs::path& path() const { return path_; }
    fs::path operator/(const std::string& rel) const { return path_ / rel; }

private:
    fs::path path_;
};

inline void write_random_file(const fs::path& path, size_t size, unsigned seed = 7) {
    fs::create_directories(path.parent_path());
    std::mt19937 rng(seed);
    std::string data(size, '\0');
    for (auto& c : data) c = static_cast<char>(rng() & 0xff);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
}

inline void write_text_file(const fs::path& path, const std::string& text) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << text;
}

inline std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

inline std::string md5_of(const fs::path& path) {
    auto r = compute_file_md5(path);
    return r.is_ok() ? r.value : "error: " + r.error;
}

// ── Fake worker ─────────────────────────────────────────────

class FakeRemote : public RemoteChannel {
public:
    explicit FakeRemote(fs::path scratch) : scratch_(std::move(scratch)) {
        fs::create_directories(scratch_);
    }

    SSHResult run(const std::string& command, int = 0) override {
        if (lost()) return {-1, "", "connection dropped"};
        ++commands_run;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            commands.push_back(command);
        }

        static std::atomic<int> seq{0};
        std::string id = std::to_string(::getpid()) + "_" + std::to_string(seq++);
        fs::path script = scratch_ / ("cmd_" + id + ".sh");
        fs::path out = scratch_ / ("out_" + id);
        fs::path err = scratch_ / ("err_" + id);
        write_text_file(script, command + "\n");

        std::string line = "/bin/sh '" + script.string() + "' >'" + out.string() +
                           "' 2>'" + err.string() + "'";
        int status = std::system(line.c_str());
        SSHResult r{WIFEXITED(status) ? WEXITSTATUS(status) : -1, read_file(out), read_file(err)};

        std::error_code ec;
        fs::remove(script, ec);
        fs::remove(out, ec);
        fs::remove(err, ec);
        after_op();
        return r;
    }

    // A silent drop keeps reporting active until an operation fails
    bool is_active() const override { return !dropped_ || silent_; }
    bool alive() override { return !dropped_; }

    Result<void> reconnect() override {
        ++reconnects;
        if (refuse_reconnect) return Result<void>::Err("connection refused");
        dropped_ = false;
        silent_ = false;
        return Result<void>::Ok();
    }

    Result<std::optional<uint64_t>> stat_size(const std::string& path) override {
        using R = Result<std::optional<uint64_t>>;
        if (lost()) return R::Err("connection dropped");
        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) return R::Ok(std::nullopt);
        return R::Ok(static_cast<uint64_t>(fs::file_size(path, ec)));
    }

    Result<void> write_chunk(const std::string& path, const char* data, size_t len,
                             bool append) override {
        if (lost()) return Result<void>::Err("connection dropped");

        size_t allowed = len;
        bool cut = false;
        if (fail_after_bytes >= 0) {
            uint64_t budget = static_cast<uint64_t>(fail_after_bytes);
            uint64_t used = bytes_written;
            uint64_t room = used >= budget ? 0 : budget - used;
            if (room < len) {
                allowed = static_cast<size_t>(room);
                cut = true;
            }
        }

        std::ofstream out(path, std::ios::binary | (append ? std::ios::app : std::ios::trunc));
        if (!out) return Result<void>::Err("cannot open " + path);
        if (allowed > 0) out.write(data, static_cast<std::streamsize>(allowed));
        out.close();
        bytes_written += allowed;
        ++writes;

        if (cut) {
            fail_after_bytes = -1;
            if (drop_on_fault) dropped_ = true;
            return Result<void>::Err("connection reset by peer");
        }
        after_op();
        return Result<void>::Ok();
    }

    Result<uint64_t> read_from(const std::string& path, uint64_t offset,
                               const ByteSink& sink) override {
        if (lost()) return Result<uint64_t>::Err("connection dropped");
        std::ifstream in(path, std::ios::binary);
        if (!in) return Result<uint64_t>::Err("cannot open " + path);
        in.seekg(static_cast<std::streamoff>(offset));
        std::vector<char> buf(64 * 1024);
        uint64_t total = 0;
        while (in) {
            in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
            std::streamsize n = in.gcount();
            if (n <= 0) break;
            if (!sink(buf.data(), static_cast<size_t>(n))) break;
            total += static_cast<uint64_t>(n);
        }
        bytes_read += total;
        return Result<uint64_t>::Ok(total);
    }

    void drop() { dropped_ = true; }

    // Peer goes away without the flag noticing, like an idle TCP timeout
    void drop_silently() {
        silent_ = true;
        dropped_ = true;
    }

    int count_commands(const std::string& needle) const {
        std::lock_guard<std::mutex> lock(mutex_);
        int n = 0;
        for (const auto& c : commands) {
            if (c.find(needle) != std::string::npos) ++n;
        }
        return n;
    }

    // Fault injection: the write that crosses this many total bytes is cut
    // short and fails. -1 disables.
    int64_t fail_after_bytes = -1;
    bool drop_on_fault = false;
    bool refuse_reconnect = false;

    // Runs after every command and successful write
    std::function<void()> on_op;

    std::atomic<int> reconnects{0};
    std::atomic<int> commands_run{0};
    std::atomic<int> writes{0};
    std::atomic<uint64_t> bytes_written{0};
    std::atomic<uint64_t> bytes_read{0};
    std::vector<std::string> commands;

private:
    void after_op() {
        if (on_op) on_op();
    }

    bool lost() {
        if (!dropped_) return false;
        silent_ = false;
        return true;
    }

    fs::path scratch_;
    std::atomic<bool> dropped_{false};
    std::atomic<bool> silent_{false};
    mutable std::mutex mutex_;
};

// ── Fake archive source ─────────────────────────────────────

// Streams a local file, honoring ranges unless told otherwise.
class LocalFileSource : public ByteSource {
public:
    explicit LocalFileSource(fs::path file) : file_(std::move(file)) {}

    std::string describe() const override { return "local:" + file_.string(); }

    TransferResult stream(uint64_t offset, const StreamStart& on_start,
                          const ByteSink& sink) override {
        ++streams;
        std::error_code ec;
        if (!fs::exists(file_, ec)) {
            return TransferResult::Err(TransferErrorKind::FATAL, "404 " + file_.string());
        }
        uint64_t size = fs::file_size(file_, ec);

        StreamInfo info;
        if (declare_size) info.total_size = size;
        info.range_honored = honor_ranges && offset <= size;
        uint64_t start = info.range_honored ? offset : 0;
        if (!on_start(info)) {
            return TransferResult::Err(TransferErrorKind::FATAL, "refused");
        }

        std::ifstream in(file_, std::ios::binary);
        in.seekg(static_cast<std::streamoff>(start));
        std::vector<char> buf(64 * 1024);
        uint64_t sent = 0;
        while (in) {
            in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
            std::streamsize n = in.gcount();
            if (n <= 0) break;
            size_t len = static_cast<size_t>(n);
            if (fail_after_bytes >= 0 && sent + len > static_cast<uint64_t>(fail_after_bytes)) {
                size_t keep = static_cast<size_t>(static_cast<uint64_t>(fail_after_bytes) - sent);
                if (keep > 0) sink(buf.data(), keep);
                bytes_sent += keep;
                fail_after_bytes = -1;
                return TransferResult::Err(TransferErrorKind::TRANSIENT, "connection reset");
            }
            if (!sink(buf.data(), len)) {
                return TransferResult::Err(TransferErrorKind::FATAL, "receiver aborted");
            }
            sent += len;
            bytes_sent += len;
        }
        return TransferResult::Ok(start + sent, start);
    }

    bool honor_ranges = true;
    bool declare_size = true;
    int64_t fail_after_bytes = -1;
    std::atomic<int> streams{0};
    std::atomic<uint64_t> bytes_sent{0};

private:
    fs::path file_;
};

// Serves archives from a local directory by name.
class FakeArchiveSource : public ArchiveSource {
public:
    explicit FakeArchiveSource(fs::path dir) : dir_(std::move(dir)) {}

    std::unique_ptr<ByteSource> open(const std::string& archive_name) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++opens[archive_name];
        return std::make_unique<LocalFileSource>(dir_ / archive_name);
    }

    int total_opens() const {
        std::lock_guard<std::mutex> lock(mutex_);
        int n = 0;
        for (const auto& [name, count] : opens) n += count;
        return n;
    }

    std::map<std::string, int> opens;

private:
    fs::path dir_;
    mutable std::mutex mutex_;
};
