#pragma once

#include <string>
#include <core/types.hpp>

// Debug log: one timestamped line per call, appended to a single file.
// Safe to call from worker threads.

// Defaults to $TMPDIR/ferry_debug.log until set_ferry_log_path() is called.
std::string ferry_log_path();
void set_ferry_log_path(const std::string& path);

void ferry_log(const std::string& msg);

// Log a remote command with its exit code and truncated output.
void ferry_log_ssh(const std::string& label, const std::string& cmd,
                   const SSHResult& r);
