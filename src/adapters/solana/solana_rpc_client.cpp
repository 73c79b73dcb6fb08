/**
 * @file solana_rpc_client.cpp
 */

#include "adapters/solana/solana_rpc_client.h"
#include "core/errors.h"
#include "core/util/num_string.h"
#include "engine/execution_context.h"

#include <spdlog/spdlog.h>


namespace tradegate::solana {

namespace {

const rapidjson::Value* find_path(const rapidjson::Value& root, std::initializer_list<const char*> keys) {
    const rapidjson::Value* cur = &root;
    for (const char* key : keys) {
        if (!cur->IsObject()) return nullptr;
        auto it = cur->FindMember(key);
        if (it == cur->MemberEnd()) return nullptr;
        cur = &it->value;
    }
    return cur;
}

std::string to_json_text(const rapidjson::Value& v) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    v.Accept(writer);
    return buffer.GetString();
}

} // namespace

int commitment_rank(const std::string& level) {
    if (level == "processed") return 1;
    if (level == "confirmed") return 2;
    if (level == "finalized") return 3;
    return 0;
}

SolanaRpcClient::SolanaRpcClient(std::shared_ptr<const nethttp::IHttpClient> http,
                                 std::string rpc_url,
                                 ExecutionContext* ctx)
    : http_(std::move(http)), rpc_url_(std::move(rpc_url)), ctx_(ctx) {}

std::string SolanaRpcClient::call(const char* method, const ParamsWriter& params, rapidjson::Document& doc) const {
    rapidjson::StringBuffer buffer;
    Writer writer(buffer);
    writer.StartObject();
    writer.Key("jsonrpc"); writer.String("2.0");
    writer.Key("id"); writer.Int(1);
    writer.Key("method"); writer.String(method);
    writer.Key("params");
    writer.StartArray();
    params(writer);
    writer.EndArray();
    writer.EndObject();
    const std::string body = buffer.GetString();

    if (ctx_) ctx_->record_request(method, body);
    const std::string raw = http_->post_json(rpc_url_, body);
    if (ctx_) ctx_->record_response(method, raw);

    doc.Parse(raw.c_str());
    if (doc.HasParseError() || !doc.IsObject()) {
        throw VenueRejection(std::string("malformed RPC response to ") + method, {}, raw);
    }
    if (doc.HasMember("error") && doc["error"].IsObject()) {
        const auto& err = doc["error"];
        std::string code;
        if (err.HasMember("code") && err["code"].IsInt64()) code = std::to_string(err["code"].GetInt64());
        const std::string message = err.HasMember("message") && err["message"].IsString()
            ? err["message"].GetString() : "RPC error";
        spdlog::error("[SolanaRpcClient] {} failed: {} ({})", method, message, code);
        throw VenueRejection(std::string(method) + ": " + message, code, raw);
    }
    if (!doc.HasMember("result")) {
        throw VenueRejection(std::string("RPC response to ") + method + " has no result", {}, raw);
    }
    return raw;
}

TokenBalance SolanaRpcClient::token_balance(const std::string& owner, const std::string& mint) const {
    rapidjson::Document doc;
    const std::string raw = call("getTokenAccountsByOwner", [&](Writer& w) {
        w.String(owner.c_str());
        w.StartObject();
        w.Key("mint"); w.String(mint.c_str());
        w.EndObject();
        w.StartObject();
        w.Key("encoding"); w.String("jsonParsed");
        w.EndObject();
    }, doc);

    const auto* accounts = find_path(doc, {"result", "value"});
    if (!accounts || !accounts->IsArray()) {
        throw VenueRejection("getTokenAccountsByOwner: unexpected result shape", {}, raw);
    }
    TokenBalance balance;
    if (accounts->Empty()) return balance;

    const auto* token_amount = find_path((*accounts)[0], {"account", "data", "parsed", "info", "tokenAmount"});
    if (!token_amount || !token_amount->IsObject()) {
        throw VenueRejection("getTokenAccountsByOwner: token account is not parsed", {}, raw);
    }
    const auto* amount = find_path(*token_amount, {"amount"});
    const auto* decimals = find_path(*token_amount, {"decimals"});
    if (!amount || !amount->IsString() || !decimals || !decimals->IsInt()) {
        throw VenueRejection("getTokenAccountsByOwner: missing tokenAmount fields", {}, raw);
    }
    const auto units = util::to_base_units(amount->GetString(), 0);
    if (!units) throw VenueRejection("getTokenAccountsByOwner: bad amount", {}, raw);
    balance.amount = *units;
    balance.decimals = decimals->GetInt();
    const auto* ui = find_path(*token_amount, {"uiAmount"});
    balance.ui_amount = (ui && ui->IsNumber()) ? ui->GetDouble()
                                               : util::from_base_units(balance.amount, balance.decimals);
    return balance;
}

std::optional<int> SolanaRpcClient::mint_decimals(const std::string& mint) const {
    rapidjson::Document doc;
    call("getAccountInfo", [&](Writer& w) {
        w.String(mint.c_str());
        w.StartObject();
        w.Key("encoding"); w.String("jsonParsed");
        w.EndObject();
    }, doc);
    const auto* decimals = find_path(doc, {"result", "value", "data", "parsed", "info", "decimals"});
    if (!decimals || !decimals->IsInt()) return std::nullopt;
    return decimals->GetInt();
}

std::string SolanaRpcClient::send_transaction(const std::string& base64_tx,
                                              const std::string& preflight_commitment) const {
    rapidjson::Document doc;
    const std::string raw = call("sendTransaction", [&](Writer& w) {
        w.String(base64_tx.c_str());
        w.StartObject();
        w.Key("encoding"); w.String("base64");
        w.Key("skipPreflight"); w.Bool(false);
        w.Key("preflightCommitment"); w.String(preflight_commitment.c_str());
        w.Key("maxRetries"); w.Int(3);
        w.EndObject();
    }, doc);
    if (!doc["result"].IsString()) {
        throw VenueRejection("sendTransaction: result is not a signature", {}, raw);
    }
    return doc["result"].GetString();
}

std::optional<SignatureStatus> SolanaRpcClient::signature_status(const std::string& signature) const {
    rapidjson::Document doc;
    const std::string raw = call("getSignatureStatuses", [&](Writer& w) {
        w.StartArray();
        w.String(signature.c_str());
        w.EndArray();
        w.StartObject();
        w.Key("searchTransactionHistory"); w.Bool(true);
        w.EndObject();
    }, doc);
    const auto* value = find_path(doc, {"result", "value"});
    if (!value || !value->IsArray()) {
        throw VenueRejection("getSignatureStatuses: unexpected result shape", {}, raw);
    }
    if (value->Empty() || (*value)[0].IsNull()) return std::nullopt;

    const auto& entry = (*value)[0];
    SignatureStatus status;
    const auto* level = find_path(entry, {"confirmationStatus"});
    if (level && level->IsString()) status.confirmation_status = level->GetString();
    const auto* err = find_path(entry, {"err"});
    if (err && !err->IsNull()) status.err = to_json_text(*err);
    return status;
}

} // namespace tradegate::solana
