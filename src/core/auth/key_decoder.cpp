/**
 * @file key_decoder.cpp
 */

#include "core/auth/key_decoder.h"
#include "core/errors.h"
#include "utils/string_utils.h"

#include <rapidjson/document.h>

namespace tradegate::auth {

std::optional<util::Bytes> decode_hex_key(std::string_view text) {
    return util::hex_decode(text);
}

std::optional<util::Bytes> decode_base58_key(std::string_view text) {
    return util::base58_decode(text);
}

std::optional<util::Bytes> decode_json_array_key(std::string_view text) {
    if (text.empty() || text.front() != '[') return std::nullopt;
    rapidjson::Document doc;
    doc.Parse(text.data(), text.size());
    if (doc.HasParseError() || !doc.IsArray() || doc.Empty()) return std::nullopt;
    util::Bytes out;
    out.reserve(doc.Size());
    for (const auto& v : doc.GetArray()) {
        if (!v.IsUint() || v.GetUint() > 255) return std::nullopt;
        out.push_back(static_cast<std::uint8_t>(v.GetUint()));
    }
    return out;
}

const std::vector<KeyDecoder>& default_key_decoders() {
    static const std::vector<KeyDecoder> decoders = {
        {"hex", &decode_hex_key},
        {"base58", &decode_base58_key},
        {"json_array", &decode_json_array_key},
    };
    return decoders;
}

util::Bytes decode_private_key(std::string_view text,
                               const KeyAcceptor& accept,
                               const std::vector<KeyDecoder>& decoders) {
    const std::string trimmed = utils::trim_ascii(text);
    for (const auto& decoder : decoders) {
        auto bytes = decoder.decode(trimmed);
        if (bytes && accept(*bytes)) return std::move(*bytes);
    }
    throw InputError("invalid key format");
}

} // namespace tradegate::auth
