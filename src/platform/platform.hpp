#pragma once

#include <filesystem>
#include <string>

namespace platform {

// $HOME, or the temp directory when unset.
std::filesystem::path home_dir();

std::filesystem::path temp_dir();

// Short host name of this machine, "unknown" if it cannot be read.
std::string hostname();

void sleep_ms(int ms);

} // namespace platform
