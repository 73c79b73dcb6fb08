/**
 * @file encoding.cpp
 */

#include "core/util/encoding.h"
#include <openssl/evp.h>
#include <algorithm>
#include <array>

namespace tradegate::util {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";
constexpr char kBase58Alphabet[] = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

const std::array<int, 128>& base58_index() {
    static const std::array<int, 128> table = [] {
        std::array<int, 128> t{};
        t.fill(-1);
        for (int i = 0; i < 58; ++i) {
            t[static_cast<unsigned char>(kBase58Alphabet[i])] = i;
        }
        return t;
    }();
    return table;
}

} // namespace

std::string hex_encode(const std::uint8_t* data, std::size_t len, bool with_prefix) {
    std::string out;
    out.reserve(len * 2 + 2);
    if (with_prefix) out += "0x";
    for (std::size_t i = 0; i < len; ++i) {
        out.push_back(kHexDigits[data[i] >> 4]);
        out.push_back(kHexDigits[data[i] & 0x0f]);
    }
    return out;
}

std::optional<Bytes> hex_decode(std::string_view s) {
    if (s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) s.remove_prefix(2);
    if (s.empty() || s.size() % 2 != 0) return std::nullopt;
    Bytes out;
    out.reserve(s.size() / 2);
    for (std::size_t i = 0; i < s.size(); i += 2) {
        const int hi = hex_value(s[i]);
        const int lo = hex_value(s[i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return out;
}

std::string base58_encode(const std::uint8_t* data, std::size_t len) {
    std::size_t zeros = 0;
    while (zeros < len && data[zeros] == 0) ++zeros;

    // log(256) / log(58) ~= 1.37
    std::vector<std::uint8_t> digits((len - zeros) * 138 / 100 + 1, 0);
    std::size_t used = 0;
    for (std::size_t i = zeros; i < len; ++i) {
        int carry = data[i];
        std::size_t j = 0;
        for (auto it = digits.rbegin(); (carry != 0 || j < used) && it != digits.rend(); ++it, ++j) {
            carry += 256 * (*it);
            *it = static_cast<std::uint8_t>(carry % 58);
            carry /= 58;
        }
        used = j;
    }
    auto it = std::find_if(digits.begin(), digits.end(), [](std::uint8_t d) { return d != 0; });
    std::string out(zeros, '1');
    for (; it != digits.end(); ++it) out.push_back(kBase58Alphabet[*it]);
    return out;
}

std::optional<Bytes> base58_decode(std::string_view s) {
    if (s.empty()) return std::nullopt;
    const auto& index = base58_index();
    std::size_t zeros = 0;
    while (zeros < s.size() && s[zeros] == '1') ++zeros;

    // log(58) / log(256) ~= 0.733
    std::vector<std::uint8_t> bytes((s.size() - zeros) * 733 / 1000 + 1, 0);
    std::size_t used = 0;
    for (std::size_t i = zeros; i < s.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(s[i]);
        if (c >= 128 || index[c] < 0) return std::nullopt;
        int carry = index[c];
        std::size_t j = 0;
        for (auto it = bytes.rbegin(); (carry != 0 || j < used) && it != bytes.rend(); ++it, ++j) {
            carry += 58 * (*it);
            *it = static_cast<std::uint8_t>(carry % 256);
            carry /= 256;
        }
        if (carry != 0) return std::nullopt;
        used = j;
    }
    auto it = std::find_if(bytes.begin(), bytes.end(), [](std::uint8_t b) { return b != 0; });
    Bytes out(zeros, 0);
    out.insert(out.end(), it, bytes.end());
    return out;
}

std::string base64_encode(const Bytes& data) {
    if (data.empty()) return {};
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  data.data(), static_cast<int>(data.size()));
    out.resize(static_cast<std::size_t>(n));
    return out;
}

std::optional<Bytes> base64_decode(std::string_view s) {
    if (s.empty() || s.size() % 4 != 0) return std::nullopt;
    Bytes out(3 * s.size() / 4, 0);
    const int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(s.data()),
                                  static_cast<int>(s.size()));
    if (n < 0) return std::nullopt;
    // EVP_DecodeBlock keeps the zero bytes produced by '=' padding.
    std::size_t padding = 0;
    if (s.back() == '=') ++padding;
    if (s.size() >= 2 && s[s.size() - 2] == '=') ++padding;
    out.resize(static_cast<std::size_t>(n) - padding);
    return out;
}

} // namespace tradegate::util
