#pragma once

#include <filesystem>
#include <core/types.hpp>

namespace platform {

// Open an archive and read every entry's data to the end. Ok means the
// archive is structurally sound and all member checksums verified.
Result<void> verify_archive(const std::filesystem::path& path);

} // namespace platform
