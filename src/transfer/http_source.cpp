#include "http_source.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <curl/curl.h>
#include <fmt/format.h>
#include <cctype>
#include <memory>
#include <optional>

namespace {

struct StreamState {
    CURL* curl = nullptr;
    const StreamStart* on_start = nullptr;
    const ByteSink* sink = nullptr;
    uint64_t offset = 0;
    bool started = false;
    bool aborted = false;
    long status = 0;
    std::optional<uint64_t> range_total;   // from Content-Range: bytes a-b/total
    uint64_t delivered = 0;
};

size_t on_header(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* st = static_cast<StreamState*>(userdata);
    std::string line(buffer, size * nitems);
    const std::string key = "content-range:";
    if (line.size() > key.size()) {
        std::string head = line.substr(0, key.size());
        for (auto& c : head) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (head == key) st->range_total = content_range_total(line.substr(key.size()));
    }
    return size * nitems;
}

bool begin_stream(StreamState* st) {
    st->started = true;
    curl_easy_getinfo(st->curl, CURLINFO_RESPONSE_CODE, &st->status);
    if (st->status != 200 && st->status != 206) return false;

    StreamInfo info;
    info.range_honored = st->status == 206;
    if (info.range_honored) {
        info.total_size = st->range_total;
    } else {
        curl_off_t len = -1;
        curl_easy_getinfo(st->curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &len);
        if (len >= 0) info.total_size = static_cast<uint64_t>(len);
    }
    if (!(*st->on_start)(info)) {
        st->aborted = true;
        return false;
    }
    return true;
}

size_t on_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* st = static_cast<StreamState*>(userdata);
    size_t n = size * nmemb;
    if (!st->started && !begin_stream(st)) return 0;
    if (!(*st->sink)(ptr, n)) {
        st->aborted = true;
        return 0;
    }
    st->delivered += n;
    return n;
}

} // namespace

std::optional<uint64_t> content_range_total(const std::string& value) {
    auto slash = value.rfind('/');
    if (slash == std::string::npos) return std::nullopt;
    std::string tail = value.substr(slash + 1);
    trim(tail);
    if (tail.empty() || tail.find_first_not_of("0123456789") != std::string::npos) return std::nullopt;
    return safe_stoull(tail);
}

TransferErrorKind classify_http_status(long status) {
    if (status == 416) return TransferErrorKind::INTEGRITY_MISMATCH;
    if (status == 408 || status == 429 || status >= 500) return TransferErrorKind::TRANSIENT;
    return TransferErrorKind::FATAL;
}

TransferResult HttpByteSource::stream(uint64_t offset, const StreamStart& on_start,
                                      const ByteSink& sink) {
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) {
        return TransferResult::Err(TransferErrorKind::TRANSIENT, "curl_easy_init failed");
    }

    std::string token;
    struct curl_slist* headers = nullptr;
    if (credentials_) {
        auto t = credentials_->get_token();
        if (t.is_err()) {
            return TransferResult::Err(TransferErrorKind::FATAL, "no source credentials: " + t.error);
        }
        token = t.value;
        headers = curl_slist_append(headers, ("Authorization: Bearer " + token).c_str());
    }
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> header_guard(headers, curl_slist_free_all);

    StreamState st;
    st.curl = curl.get();
    st.on_start = &on_start;
    st.sink = &sink;
    st.offset = offset;

    std::string range = fmt::format("{}-", offset);
    curl_easy_setopt(curl.get(), CURLOPT_URL, url_.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    if (headers) curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers);
    if (offset > 0) curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, on_header);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &st);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, on_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &st);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, static_cast<long>(HTTP_CONNECT_TIMEOUT_SECS));
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, static_cast<long>(HTTP_LOW_SPEED_SECS));

    CURLcode rc = curl_easy_perform(curl.get());
    if (st.status == 0) curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &st.status);

    if (st.status == 401 || st.status == 403) {
        // Expired token: swap it and let the retry loop try again
        if (credentials_) {
            auto fresh = credentials_->refresh(token);
            if (fresh.is_ok()) {
                return TransferResult::Err(TransferErrorKind::TRANSIENT,
                                           fmt::format("HTTP {} (token refreshed)", st.status));
            }
        }
        return TransferResult::Err(TransferErrorKind::FATAL, fmt::format("HTTP {} from {}", st.status, url_));
    }
    if (st.status == 416 && offset > 0 && st.range_total && *st.range_total == offset) {
        // The partial file already holds every byte
        StreamInfo info{true, offset};
        if (!on_start(info)) {
            return TransferResult::Err(TransferErrorKind::FATAL, "download aborted by receiver");
        }
        return TransferResult::Ok(offset, offset);
    }
    if (st.status >= 400) {
        return TransferResult::Err(classify_http_status(st.status),
                                   fmt::format("HTTP {} from {}", st.status, url_));
    }
    if (st.aborted) {
        return TransferResult::Err(TransferErrorKind::FATAL, "download aborted by receiver");
    }
    if (rc != CURLE_OK) {
        return TransferResult::Err(TransferErrorKind::TRANSIENT,
                                   fmt::format("{} after {} bytes", curl_easy_strerror(rc), st.delivered));
    }

    // Empty body: nothing triggered the write callback
    if (!st.started && !begin_stream(&st)) {
        return TransferResult::Err(TransferErrorKind::FATAL,
                                   fmt::format("unexpected HTTP {} from {}", st.status, url_));
    }

    uint64_t start = st.status == 206 ? offset : 0;
    return TransferResult::Ok(start + st.delivered, start);
}

std::unique_ptr<ByteSource> UrlTemplateSource::open(const std::string& archive_name) {
    std::string url = replace_placeholder(url_template_, "name", archive_name);
    return std::make_unique<HttpByteSource>(url, credentials_);
}
