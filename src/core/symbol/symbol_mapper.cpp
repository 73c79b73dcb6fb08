/**
 * @file symbol_mapper.cpp
 * @brief Default symbol normalization implementation.
 */

#include "core/symbol/symbol_mapper.h"
#include "utils/string_utils.h"
#include <algorithm>
#include <array>

namespace tradegate {

static inline std::string_view trim_settle_suffix(std::string_view s) {
    auto colon = s.find(':');
    if (colon != std::string_view::npos) return s.substr(0, colon);
    return s;
}

static inline std::string strip_separators(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '-' || c == '/' || c == '_' || c == ' ') continue;
        out.push_back(c);
    }
    return out;
}

static inline bool ends_with(const std::string& s, std::string_view suffix) {
    return s.size() > suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string DefaultSymbolMapper::to_compact(std::string_view symbol) const {
    std::string upper = utils::to_upper_ascii(utils::trim_ascii(trim_settle_suffix(symbol)));
    // Drop a trailing -PERP suffix from hyphen form when building compact
    if (ends_with(upper, "-PERP")) upper.erase(upper.size() - 5);
    return strip_separators(upper);
}

std::string DefaultSymbolMapper::to_base(std::string_view symbol) const {
    std::string compact = to_compact(symbol);
    if (ends_with(compact, "PERP")) compact.erase(compact.size() - 4);
    // Longest suffix first so "USDT" wins over "USD".
    static const std::array<std::string_view, 3> quotes = {"USDT", "USDC", "USD"};
    for (auto q : quotes) {
        if (ends_with(compact, q)) {
            compact.erase(compact.size() - q.size());
            break;
        }
    }
    return compact;
}

std::vector<std::string> DefaultSymbolMapper::perp_candidates(std::string_view symbol) const {
    std::vector<std::string> out;
    auto add = [&out](std::string s) {
        if (!s.empty() && std::find(out.begin(), out.end(), s) == out.end()) out.push_back(std::move(s));
    };
    add(utils::to_upper_ascii(utils::trim_ascii(symbol)));
    add(to_compact(symbol));
    add(to_base(symbol));
    return out;
}

} // namespace tradegate
