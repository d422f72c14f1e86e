#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

namespace platform {

struct HttpResponse {
    long status = 0;
    std::string body;
};

// curl_global_init / cleanup. Call once from main before any worker starts.
void init_http();
void shutdown_http();

// POST a JSON body. Transport errors are Err; any HTTP status is Ok.
Result<HttpResponse> http_post_json(const std::string& url,
                                    const std::string& json_body,
                                    const std::vector<std::string>& headers,
                                    int timeout_secs);

} // namespace platform
