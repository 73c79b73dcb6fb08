/**
 * @file exec_dto.cpp
 */

#include "engine/exec_dto.h"
#include "core/errors.h"
#include "core/util/num_string.h"
#include "utils/string_utils.h"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <string>

namespace tradegate {

namespace {

std::optional<std::string> string_field(const rapidjson::Value& obj, const char* key) {
    if (!obj.HasMember(key) || obj[key].IsNull()) return std::nullopt;
    const auto& v = obj[key];
    if (!v.IsString()) throw InputError(std::string("field '") + key + "' must be a string");
    return std::string(v.GetString(), v.GetStringLength());
}

// Decimal text exactly as given; numbers are rendered without exponent.
std::optional<std::string> decimal_text_field(const rapidjson::Value& obj, const char* key) {
    if (!obj.HasMember(key) || obj[key].IsNull()) return std::nullopt;
    const auto& v = obj[key];
    if (v.IsString()) return std::string(v.GetString(), v.GetStringLength());
    if (v.IsInt64()) return std::to_string(v.GetInt64());
    if (v.IsUint64()) return std::to_string(v.GetUint64());
    if (v.IsNumber()) return util::format_decimal(v.GetDouble(), 12);
    throw InputError(std::string("field '") + key + "' must be a number");
}

std::optional<double> number_field(const rapidjson::Value& obj, const char* key) {
    const auto text = decimal_text_field(obj, key);
    if (!text) return std::nullopt;
    const auto v = util::parse_decimal(utils::trim_ascii(*text));
    if (!v) throw InputError(std::string("field '") + key + "' is not a number: " + *text);
    return v;
}

std::optional<bool> bool_field(const rapidjson::Value& obj, const char* key) {
    if (!obj.HasMember(key) || obj[key].IsNull()) return std::nullopt;
    const auto& v = obj[key];
    if (v.IsBool()) return v.GetBool();
    if (v.IsString()) {
        const auto s = utils::to_lower_ascii(v.GetString());
        if (s == "true" || s == "1") return true;
        if (s == "false" || s == "0") return false;
    }
    throw InputError(std::string("field '") + key + "' must be a boolean");
}

} // namespace

IntentRequest parse_trade_intent_json(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());
    if (doc.HasParseError()) {
        throw InputError(std::string("intent JSON parse error at offset ") + std::to_string(doc.GetErrorOffset()) +
                         ": " + rapidjson::GetParseError_En(doc.GetParseError()));
    }
    if (!doc.IsObject()) throw InputError("intent JSON must be an object");

    IntentRequest req;
    TradeIntent& intent = req.intent;
    intent.id = string_field(doc, "id").value_or(generate_intent_id());

    const auto venue_text = string_field(doc, "venue");
    if (!venue_text) throw InputError("field 'venue' is required");
    const auto venue = parse_venue(*venue_text);
    if (!venue) throw InputError("unknown venue: " + *venue_text);
    intent.venue = *venue;

    intent.symbol = string_field(doc, "symbol").value_or("");

    const auto side_text = string_field(doc, "side").value_or("buy");
    const auto side = parse_side(side_text);
    if (!side) throw InputError("unknown side: " + side_text);
    intent.side = *side;

    intent.amount = utils::trim_ascii(decimal_text_field(doc, "amount").value_or(""));
    intent.leverage = number_field(doc, "leverage");
    intent.price = number_field(doc, "price");
    intent.reduce_only = bool_field(doc, "reduce_only").value_or(false);

    const auto action = utils::to_lower_ascii(string_field(doc, "action").value_or("open"));
    if (action == "open") {
        intent.action = IntentAction::Open;
    } else if (action == "close") {
        intent.action = IntentAction::Close;
    } else {
        throw InputError("unknown action: " + action);
    }

    if (doc.HasMember("constraints") && !doc["constraints"].IsNull()) {
        const auto& c = doc["constraints"];
        if (!c.IsObject()) throw InputError("field 'constraints' must be an object");
        if (const auto bps = number_field(c, "max_slippage_bps")) {
            intent.constraints.max_slippage_bps = static_cast<int>(*bps);
        }
        if (const auto ms = number_field(c, "time_limit_ms")) {
            if (*ms <= 0) throw InputError("time_limit_ms must be positive");
            intent.constraints.time_limit = std::chrono::milliseconds(static_cast<std::int64_t>(*ms));
        }
        intent.constraints.min_liquidity = number_field(c, "min_liquidity");
    }

    if (doc.HasMember("credentials") && !doc["credentials"].IsNull()) {
        const auto& c = doc["credentials"];
        if (!c.IsObject()) throw InputError("field 'credentials' must be an object");
        req.credentials.api_key = string_field(c, "api_key").value_or("");
        req.credentials.api_secret = string_field(c, "api_secret").value_or("");
        req.credentials.private_key = string_field(c, "private_key").value_or("");
        req.credentials.wallet_address = string_field(c, "wallet_address").value_or("");
        req.credentials.vault_address = string_field(c, "vault_address").value_or("");
    }
    return req;
}

} // namespace tradegate
