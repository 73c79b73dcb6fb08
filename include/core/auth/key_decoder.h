/**
 * @file key_decoder.h
 * @brief Ordered private-key text decoders (hex, base58, JSON byte array).
 */

#pragma once

#include "core/util/encoding.h"

#include <functional>
#include <optional>
#include <string_view>
#include <vector>

namespace tradegate::auth {

struct KeyDecoder {
    std::string_view name;
    std::function<std::optional<util::Bytes>(std::string_view)> decode;
};

using KeyAcceptor = std::function<bool(const util::Bytes&)>;

std::optional<util::Bytes> decode_hex_key(std::string_view text);
std::optional<util::Bytes> decode_base58_key(std::string_view text);
std::optional<util::Bytes> decode_json_array_key(std::string_view text);

/// hex, base58, JSON array, in that order.
const std::vector<KeyDecoder>& default_key_decoders();

/**
 * @brief Try each decoder in order; the first output the acceptor approves wins.
 * @throws InputError("invalid key format") when no decoder yields an accepted key.
 */
util::Bytes decode_private_key(std::string_view text,
                               const KeyAcceptor& accept,
                               const std::vector<KeyDecoder>& decoders = default_key_decoders());

} // namespace tradegate::auth
