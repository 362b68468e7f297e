#include "parse_utils.hpp"
#include <algorithm>
#include <cctype>
#include <limits>

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static bool all_digits(const std::string& s) {
    return !s.empty() &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

size_t parse_size_t(const std::string& value, size_t min, size_t max, bool& ok) {
    ok = false;
    if (!all_digits(value))
        return 0;
    unsigned long long v = 0;
    for (char c : value) {
        unsigned digit = static_cast<unsigned>(c - '0');
        if (v > (std::numeric_limits<unsigned long long>::max() - digit) / 10)
            return 0;
        v = v * 10 + digit;
    }
    if (v < min || v > max)
        return 0;
    ok = true;
    return static_cast<size_t>(v);
}

size_t parse_bytes(const std::string& value, bool& ok) {
    ok = false;
    size_t pos = 0;
    while (pos < value.size() && std::isdigit(static_cast<unsigned char>(value[pos])))
        ++pos;
    std::string unit = to_lower(value.substr(pos));
    size_t mult = 1;
    if (unit.empty() || unit == "b")
        mult = 1;
    else if (unit == "kb" || unit == "k")
        mult = 1024ULL;
    else if (unit == "mb" || unit == "m")
        mult = 1024ULL * 1024ULL;
    else if (unit == "gb" || unit == "g")
        mult = 1024ULL * 1024ULL * 1024ULL;
    else
        return 0;
    bool num_ok = false;
    size_t num = parse_size_t(value.substr(0, pos), 0, std::numeric_limits<size_t>::max(), num_ok);
    if (!num_ok || (num != 0 && mult > std::numeric_limits<size_t>::max() / num))
        return 0;
    ok = true;
    return num * mult;
}

bool parse_bool(const std::string& value, bool& ok) {
    std::string v = to_lower(value);
    ok = true;
    if (v.empty() || v == "1" || v == "true" || v == "yes" || v == "on")
        return true;
    if (v == "0" || v == "false" || v == "no" || v == "off")
        return false;
    ok = false;
    return false;
}
