#include "utils.hpp"
#include <fmt/format.h>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <cctype>
#include <regex>

std::string now_iso() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return std::string(buf);
}

std::time_t parse_iso_time(const std::string& iso) {
    struct tm tm_buf = {};
    if (sscanf(iso.c_str(), "%d-%d-%dT%d:%d:%d",
               &tm_buf.tm_year, &tm_buf.tm_mon, &tm_buf.tm_mday,
               &tm_buf.tm_hour, &tm_buf.tm_min, &tm_buf.tm_sec) == 6) {
        tm_buf.tm_year -= 1900;
        tm_buf.tm_mon -= 1;
        tm_buf.tm_isdst = -1;
        return mktime(&tm_buf);
    }
    return 0;
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        return fallback;
    }
}

uint64_t safe_stoull(const std::string& s, uint64_t fallback) {
    auto start = s.find_first_of("0123456789");
    if (start == std::string::npos) return fallback;
    try {
        return std::stoull(s.substr(start));
    } catch (const std::exception&) {
        return fallback;
    }
}

std::string normalize_archive_name(const std::string& stem) {
    static const std::regex rere_suffix("_rere_\\d+$");
    return std::regex_replace(stem, rere_suffix, "");
}

std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

std::string truncate_text(const std::string& s, std::size_t max_len) {
    if (s.size() <= max_len) return s;
    return s.substr(0, max_len) + "...";
}

std::string format_size(uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;
    double b = static_cast<double>(bytes);
    if (b >= GB) return fmt::format("{:.2f}GB", b / GB);
    if (b >= MB) return fmt::format("{:.2f}MB", b / MB);
    return fmt::format("{:.2f}KB", b / KB);
}

std::string parse_md5_from_output(const std::string& output) {
    // md5sum prints "hash  filename"; shells may add banners around it
    size_t run = 0;
    for (size_t i = 0; i < output.size(); ++i) {
        if (std::isxdigit(static_cast<unsigned char>(output[i]))) {
            ++run;
            bool at_end = (i + 1 == output.size()) ||
                          !std::isxdigit(static_cast<unsigned char>(output[i + 1]));
            if (run == 32 && at_end) {
                std::string hash = output.substr(i + 1 - 32, 32);
                for (auto& c : hash) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
                return hash;
            }
        } else {
            run = 0;
        }
    }
    return "";
}

std::string replace_placeholder(std::string tmpl, const std::string& key,
                                const std::string& value) {
    const std::string token = "{" + key + "}";
    size_t pos = 0;
    while ((pos = tmpl.find(token, pos)) != std::string::npos) {
        tmpl.replace(pos, token.size(), value);
        pos += value.size();
    }
    return tmpl;
}
