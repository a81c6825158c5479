#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>

namespace util {
    std::string current_iso8601();
    int64_t current_timestamp_ms();
    std::vector<std::string> split(const std::string& str, char delim);
    std::string to_lower(std::string str);
}
