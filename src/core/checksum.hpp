#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <cstdint>
#include "types.hpp"

// MD5 (lowercase hex) of a local file, matching remote `md5sum` output.
// max_bytes limits the digest to the file's first max_bytes bytes; the
// file must be at least that long.
Result<std::string> compute_file_md5(const std::filesystem::path& path,
                                     std::optional<uint64_t> max_bytes = std::nullopt);
