#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <core/credentials.hpp>
#include "byte_source.hpp"

// Total size from a Content-Range value: "bytes 100-199/1000" and the
// 416 form "bytes */1000" both give 1000. An unknown total ("*") is nullopt.
std::optional<uint64_t> content_range_total(const std::string& value);

// 416 means the partial file does not fit the resource; 408, 429 and 5xx
// are worth retrying; anything else is final.
TransferErrorKind classify_http_status(long status);

// HTTP(S) GET with a byte-range request. 206 continues the partial file,
// 200 means the server ignored the range and the body starts at zero.
class HttpByteSource : public ByteSource {
public:
    HttpByteSource(std::string url, CredentialManager* credentials)
        : url_(std::move(url)), credentials_(credentials) {}

    std::string describe() const override { return url_; }
    TransferResult stream(uint64_t offset, const StreamStart& on_start,
                          const ByteSink& sink) override;

private:
    std::string url_;
    CredentialManager* credentials_;
};

// Archive source that fills "{name}" in a URL template.
class UrlTemplateSource : public ArchiveSource {
public:
    UrlTemplateSource(std::string url_template, CredentialManager* credentials)
        : url_template_(std::move(url_template)), credentials_(credentials) {}

    std::unique_ptr<ByteSource> open(const std::string& archive_name) override;

private:
    std::string url_template_;
    CredentialManager* credentials_;
};
