#pragma once

#include <string>

// 45 -> "45s", 330 -> "5m30s", 8100 -> "2h15m". Negative counts as 0.
std::string format_elapsed(long seconds);

// Time between two ISO timestamps (YYYY-MM-DDTHH:MM:SS), formatted like
// format_elapsed. An empty end_time means now; "-" if start is empty,
// "?" if either fails to parse.
std::string format_duration(const std::string& start_time, const std::string& end_time = "");

// "2025-01-15T14:35:22" -> "01-15 14:35". "-" if empty, "?" on parse failure.
std::string format_timestamp(const std::string& iso_time);
