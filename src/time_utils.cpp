#include "time_utils.hpp"
#include <chrono>
#include <ctime>

std::string timestamp() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return std::string(buf);
}

std::string format_duration_short(std::chrono::seconds dur) {
    long long total = dur.count() < 0 ? 0 : dur.count();
    const long long hours = total / 3600;
    const long long minutes = (total / 60) % 60;
    const long long seconds = total % 60;
    std::string out;
    if (hours > 0)
        out += std::to_string(hours) + "h";
    if (minutes > 0 || hours > 0)
        out += std::to_string(minutes) + "m";
    out += std::to_string(seconds) + "s";
    return out;
}
