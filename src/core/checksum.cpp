#include "checksum.hpp"
#include "constants.hpp"
#include <openssl/evp.h>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>
#include <memory>
#include <vector>

namespace fs = std::filesystem;

Result<std::string> compute_file_md5(const fs::path& path, std::optional<uint64_t> max_bytes) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<std::string>::Err("Cannot open file: " + path.string());
    }

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
        return Result<std::string>::Err("Failed to initialize MD5 digest");
    }

    std::vector<char> buf(CHECKSUM_BUF_SIZE);
    uint64_t consumed = 0;
    while (true) {
        std::size_t want = buf.size();
        if (max_bytes) {
            if (consumed >= *max_bytes) break;
            want = static_cast<std::size_t>(std::min<uint64_t>(want, *max_bytes - consumed));
        }
        in.read(buf.data(), static_cast<std::streamsize>(want));
        auto got = in.gcount();
        if (got <= 0) break;
        if (EVP_DigestUpdate(ctx.get(), buf.data(), static_cast<size_t>(got)) != 1) {
            return Result<std::string>::Err("MD5 update failed");
        }
        consumed += static_cast<uint64_t>(got);
    }

    if (in.bad()) {
        return Result<std::string>::Err("Read error on " + path.string());
    }
    if (max_bytes && consumed < *max_bytes) {
        return Result<std::string>::Err(fmt::format(
            "File {} is shorter ({} bytes) than requested prefix ({} bytes)",
            path.string(), consumed, *max_bytes));
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &len) != 1) {
        return Result<std::string>::Err("MD5 finalize failed");
    }

    std::string hex;
    hex.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        hex += fmt::format("{:02x}", digest[i]);
    }
    return Result<std::string>::Ok(hex);
}
