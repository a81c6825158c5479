#include "util.hpp"
#include <fmt/format.h>
#include <sstream>
#include <ctime>
#include <algorithm>
#include <cctype>

namespace util {

// UTC with millisecond precision, e.g. 2024-06-10T06:15:23.456Z
std::string current_iso8601() {
    int64_t now_ms = current_timestamp_ms();
    std::time_t seconds = static_cast<std::time_t>(now_ms / 1000);

    std::tm utc{};
    gmtime_r(&seconds, &utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &utc);
    return fmt::format("{}.{:03d}Z", buf, static_cast<int>(now_ms % 1000));
}

int64_t current_timestamp_ms() {
    using namespace std::chrono;
    return time_point_cast<milliseconds>(system_clock::now()).time_since_epoch().count();
}

std::vector<std::string> split(const std::string& str, char delim) {
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;
    while (std::getline(ss, token, delim)) {
        token.erase(0, token.find_first_not_of(" \t\n\r"));
        token.erase(token.find_last_not_of(" \t\n\r") + 1);
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }
    return tokens;
}

std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

} // namespace util
