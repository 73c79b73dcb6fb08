#include "utils/string_utils.h"
#include <algorithm>
#include <cctype>

namespace tradegate {
namespace utils {

std::string to_lower_ascii(std::string_view input) {
    std::string out(input.begin(), input.end());
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

std::string to_upper_ascii(std::string_view input) {
    std::string out(input.begin(), input.end());
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return out;
}

std::string capitalize_ascii(std::string_view input) {
    std::string out = to_lower_ascii(input);
    if (!out.empty()) {
        out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
    }
    return out;
}

std::string trim_ascii(std::string_view input) {
    auto begin = input.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) return {};
    auto end = input.find_last_not_of(" \t\r\n");
    return std::string(input.substr(begin, end - begin + 1));
}

std::string redact(std::string_view value, std::size_t keep) {
    if (value.size() < 12 || value.size() <= keep * 2) {
        return std::string(value.empty() ? 0 : 3, '*');
    }
    std::string out(value.substr(0, keep));
    out += "...";
    out += value.substr(value.size() - keep);
    return out;
}

std::string normalize_venue_key(std::string_view venue) {
    return to_lower_ascii(trim_ascii(venue));
}

} // namespace utils
} // namespace tradegate
