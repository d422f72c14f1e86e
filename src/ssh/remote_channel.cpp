#include "remote_channel.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <sstream>

static std::string short_stderr(const SSHResult& r) {
    std::string err = r.stderr_data.empty() ? r.stdout_data : r.stderr_data;
    trim(err);
    return truncate_text(err, STDERR_KEEP_CHARS);
}

Result<void> RemoteChannel::run_checked(const std::string& command, const std::string& what,
                                        int timeout_secs) {
    auto r = run(command, timeout_secs);
    if (r.failed()) {
        ferry_log_ssh("[remote] " + what, command, r);
        return Result<void>::Err(fmt::format("{} failed (exit {}): {}", what, r.exit_code,
                                             short_stderr(r)));
    }
    return Result<void>::Ok();
}

Result<void> RemoteChannel::ensure_connected() {
    if (alive()) return Result<void>::Ok();
    ferry_log("[remote] transport lost, reconnecting");
    auto r = reconnect();
    if (r.is_err()) ferry_log("[remote] reconnect failed: " + r.error);
    return r;
}

// test(1) exits 1 for "no", anything else is a channel or shell failure.
static Result<bool> probe(RemoteChannel& ch, const std::string& flag, const std::string& path) {
    auto r = ch.run(fmt::format("test {} {}", flag, shell_quote(path)));
    if (r.exit_code == 0) return Result<bool>::Ok(true);
    if (r.exit_code == 1) return Result<bool>::Ok(false);
    return Result<bool>::Err(fmt::format("probe {} {} failed: {}", flag, path, short_stderr(r)));
}

Result<bool> RemoteChannel::file_exists(const std::string& path) {
    return probe(*this, "-f", path);
}

Result<bool> RemoteChannel::dir_exists(const std::string& path) {
    return probe(*this, "-d", path);
}

Result<std::vector<std::string>> RemoteChannel::list(const std::string& dir,
                                                     const std::string& glob,
                                                     EntryType type, bool recursive) {
    std::string cmd = fmt::format(
        "[ -d {0} ] || exit 0; find {0} -mindepth 1 {1}-type {2} -name {3} -printf '%P\\n'",
        shell_quote(dir), recursive ? "" : "-maxdepth 1 ",
        type == EntryType::DIRECTORY ? "d" : "f", shell_quote(glob));
    auto r = run(cmd);
    if (r.failed()) {
        ferry_log_ssh("[remote] list", cmd, r);
        return Result<std::vector<std::string>>::Err("listing " + dir + " failed: " + short_stderr(r));
    }

    std::vector<std::string> names;
    std::istringstream in(r.stdout_data);
    std::string line;
    while (std::getline(in, line)) {
        trim(line);
        if (!line.empty()) names.push_back(line);
    }
    std::sort(names.begin(), names.end());
    return Result<std::vector<std::string>>::Ok(names);
}

Result<void> RemoteChannel::mkdir_p(const std::string& path) {
    return run_checked("mkdir -p " + shell_quote(path), "mkdir " + path);
}

Result<void> RemoteChannel::remove_file(const std::string& path) {
    return run_checked("rm -f " + shell_quote(path), "rm " + path);
}

Result<void> RemoteChannel::remove_tree(const std::string& path) {
    return run_checked("rm -rf " + shell_quote(path), "rm -rf " + path);
}

Result<void> RemoteChannel::rename(const std::string& from, const std::string& to) {
    return run_checked(fmt::format("mv -f {} {}", shell_quote(from), shell_quote(to)),
                       "mv " + from);
}

Result<std::string> RemoteChannel::md5(const std::string& path,
                                       std::optional<uint64_t> prefix_bytes) {
    std::string cmd = prefix_bytes
        ? fmt::format("head -c {} {} | md5sum", *prefix_bytes, shell_quote(path))
        : fmt::format("md5sum {}", shell_quote(path));
    auto r = run(cmd, CHECKSUM_TIMEOUT_SECS);
    if (r.failed()) {
        ferry_log_ssh("[remote] md5", cmd, r);
        return Result<std::string>::Err("md5 of " + path + " failed: " + short_stderr(r));
    }
    std::string hash = parse_md5_from_output(r.stdout_data);
    if (hash.empty()) {
        return Result<std::string>::Err("no md5 in output: " + truncate_text(r.stdout_data, 80));
    }
    return Result<std::string>::Ok(hash);
}

Result<void> RemoteChannel::write_text(const std::string& path, const std::string& content) {
    return write_chunk(path, content.data(), content.size(), false);
}

Result<std::string> RemoteChannel::read_text(const std::string& path) {
    std::string out;
    auto r = read_from(path, 0, [&out](const char* data, size_t len) {
        out.append(data, len);
        return true;
    });
    if (r.is_err()) return Result<std::string>::Err(r.error);
    return Result<std::string>::Ok(out);
}

Result<void> RemoteChannel::append_line(const std::string& path, const std::string& line) {
    std::string data = line + "\n";
    return write_chunk(path, data.data(), data.size(), true);
}
