/**
 * @file solana_jupiter_adapter.cpp
 */

#include "adapters/solana/solana_jupiter_adapter.h"
#include "adapters/solana/jupiter_client.h"
#include "adapters/solana/solana_keypair.h"
#include "adapters/solana/solana_rpc_client.h"
#include "adapters/solana/solana_transaction.h"
#include "core/errors.h"
#include "core/util/encoding.h"
#include "core/util/num_string.h"
#include "engine/submission_tracker.h"
#include "utils/string_utils.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <thread>

namespace tradegate {

namespace {

constexpr int kDefaultDecimals = 9;

} // namespace

SolanaJupiterAdapter::SolanaJupiterAdapter(std::shared_ptr<const nethttp::IHttpClient> http,
                                           SolanaSettings settings,
                                           Sleeper sleeper)
    : http_(std::move(http)), settings_(std::move(settings)), sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

int SolanaJupiterAdapter::slippage_for(const TradeIntent& intent) const {
    const int bps = intent.constraints.max_slippage_bps.value_or(
        intent.action == IntentAction::Close ? settings_.close_slippage_bps : settings_.open_slippage_bps);
    if (bps < kMinSlippageBps || bps > kMaxSlippageBps) {
        throw InputError("slippage must be between " + std::to_string(kMinSlippageBps) + " and " +
                         std::to_string(kMaxSlippageBps) + " bps, got " + std::to_string(bps));
    }
    return bps;
}

int SolanaJupiterAdapter::token_decimals(const std::string& mint, const solana::SolanaRpcClient& rpc,
                                         ExecutionContext& ctx) const {
    if (mint == solana::kUsdcMint) return 6;
    if (mint == solana::kWrappedSolMint) return 9;
    const auto decimals = rpc.mint_decimals(mint);
    if (!decimals) {
        ctx.warn("decimals unavailable for " + mint + ", assuming " + std::to_string(kDefaultDecimals));
        return kDefaultDecimals;
    }
    return *decimals;
}

std::optional<std::string> SolanaJupiterAdapter::broadcast(const solana::SolanaRpcClient& rpc,
                                                           const std::string& base64_tx,
                                                           SubmissionTracker& tracker, ExecutionContext& ctx) const {
    const int attempts = std::max(1, settings_.broadcast_attempts);
    bool transport_fault = false;
    for (int attempt = 1;; ++attempt) {
        try {
            const std::string signature = rpc.send_transaction(base64_tx, settings_.commitment);
            tracker.advance(SubmissionState::Broadcast);
            return signature;
        } catch (const ExecutionError& e) {
            if (e.kind() == ErrorKind::Transport && attempt < attempts) {
                spdlog::warn("[SolanaJupiterAdapter] Broadcast attempt {}/{} failed: {}", attempt, attempts,
                             e.what());
                transport_fault = true;
                sleeper_(settings_.poll_interval);
                continue;
            }
            if (e.kind() != ErrorKind::Transport && transport_fault) {
                // An earlier send may have reached the leader; only the chain can tell.
                tracker.advance(SubmissionState::Broadcast);
                ctx.warn(std::string("resend rejected after transport fault, checking chain: ") + e.what());
                return std::nullopt;
            }
            tracker.advance(SubmissionState::Failed);
            throw;
        }
    }
}

void SolanaJupiterAdapter::await_confirmation(const solana::SolanaRpcClient& rpc, const std::string& signature,
                                              std::chrono::milliseconds timeout, SubmissionTracker& tracker,
                                              ExecutionContext& ctx) const {
    const int target = solana::commitment_rank(settings_.commitment);
    std::chrono::milliseconds waited{0};
    for (;;) {
        std::optional<solana::SignatureStatus> status;
        try {
            status = rpc.signature_status(signature);
        } catch (const ExecutionError& e) {
            // The transaction is already out; a failed poll says nothing about it.
            spdlog::warn("[SolanaJupiterAdapter] Status poll failed: {}", e.what());
        }

        if (status) {
            if (status->err) {
                tracker.advance(SubmissionState::Failed);
                spdlog::error("[SolanaJupiterAdapter] Transaction {} failed: {}", signature, *status->err);
                throw VenueRejection("transaction failed: " + *status->err, {}, ctx.last_response());
            }
            if (solana::commitment_rank(status->confirmation_status) >= target) {
                tracker.advance(SubmissionState::Confirmed);
                spdlog::info("[SolanaJupiterAdapter] Transaction {} {}", signature, status->confirmation_status);
                return;
            }
        }

        if (waited >= timeout) {
            tracker.advance(SubmissionState::TimedOut);
            spdlog::warn("[SolanaJupiterAdapter] No {} status for {} after {}ms", settings_.commitment, signature,
                         waited.count());
            throw SettlementTimeout("confirmation timed out after " + std::to_string(waited.count()) +
                                    "ms; transaction " + signature + " may still land");
        }
        const auto step = std::min(settings_.poll_interval, timeout - waited);
        sleeper_(step);
        waited += step;
    }
}

VenueFill SolanaJupiterAdapter::execute(const TradeIntent& intent, ExecutionContext& ctx) {
    ctx.enter(Stage::Prepare);
    const auto* creds = std::get_if<auth::WalletCredentials>(&intent.credentials);
    if (!creds) throw InputError("Solana requires wallet credentials");
    const std::string mint = utils::trim_ascii(intent.symbol);
    if (mint.empty()) throw InputError("empty symbol");
    const bool closing = intent.action == IntentAction::Close;
    const int slippage_bps = slippage_for(intent);
    std::optional<double> requested;
    if (!closing) {
        requested = util::parse_decimal(intent.amount);
        if (!requested || *requested <= 0.0) throw InputError("invalid amount: " + intent.amount);
    }

    const auto keypair = solana::SolanaKeypair::from_text(creds->private_key);
    const std::string owner = keypair.address();
    spdlog::info("[SolanaJupiterAdapter] Wallet: {}", utils::redact(owner));

    solana::SolanaRpcClient rpc(http_, settings_.rpc_url, &ctx);
    solana::JupiterClient jupiter(http_, settings_.jupiter_url, &ctx);

    ctx.enter(Stage::Resolve);
    std::string input_mint;
    std::string output_mint;
    int input_decimals = 0;
    int output_decimals = 0;
    std::uint64_t amount_units = 0;
    if (closing) {
        const auto balance = rpc.token_balance(owner, mint);
        spdlog::info("[SolanaJupiterAdapter] Balance for {}: {} ({} raw)", mint, balance.ui_amount, balance.amount);
        if (balance.amount == 0) {
            VenueFill fill;
            fill.status = ExecutionStatus::NoPosition;
            fill.correlation_id = intent.id;
            fill.message = "no position to close";
            return fill;
        }
        input_mint = mint;
        output_mint = solana::kUsdcMint;
        input_decimals = balance.decimals;
        output_decimals = 6;
        amount_units = balance.amount;
    } else {
        const bool is_buy = intent.side == Side::Buy;
        input_mint = is_buy ? std::string(solana::kUsdcMint) : mint;
        output_mint = is_buy ? mint : std::string(solana::kUsdcMint);
        input_decimals = token_decimals(input_mint, rpc, ctx);
        output_decimals = token_decimals(output_mint, rpc, ctx);
        const auto units = util::to_base_units(utils::trim_ascii(intent.amount), input_decimals);
        if (!units || *units == 0) throw InputError("amount rounds to zero: " + intent.amount);
        amount_units = *units;
    }

    ctx.enter(Stage::Quote);
    spdlog::info("[SolanaJupiterAdapter] Quote {} -> {} amount={} slippage={}bps", input_mint, output_mint,
                 amount_units, slippage_bps);
    const auto quote = jupiter.quote(input_mint, output_mint, amount_units, slippage_bps);

    ctx.enter(Stage::Build);
    SubmissionTracker tracker;
    const std::string unsigned_b64 = jupiter.swap_transaction(quote, owner);
    const auto wire = util::base64_decode(unsigned_b64);
    if (!wire) throw VenueRejection("swapTransaction is not valid base64", {}, ctx.last_response());

    ctx.enter(Stage::Sign);
    auto tx = solana::SolanaTransaction::parse(*wire);
    tx.sign(keypair);
    tracker.advance(SubmissionState::Signed);
    const std::string signed_b64 = util::base64_encode(tx.serialize());
    const std::string expected_sig = tx.id();
    ctx.set_reference(expected_sig);

    ctx.enter(Stage::Submit);
    const auto reported_sig = broadcast(rpc, signed_b64, tracker, ctx);
    if (reported_sig && *reported_sig != expected_sig) {
        ctx.warn("node reported signature " + *reported_sig + ", expected " + expected_sig);
    }
    tracker.advance(SubmissionState::Pending);
    spdlog::info("[SolanaJupiterAdapter] Signature: {}", expected_sig);

    ctx.enter(Stage::Confirm);
    auto timeout = settings_.confirm_timeout;
    if (intent.constraints.time_limit) timeout = std::min(timeout, *intent.constraints.time_limit);
    await_confirmation(rpc, expected_sig, timeout, tracker, ctx);

    const double in_ui = util::from_base_units(quote.in_amount ? quote.in_amount : amount_units, input_decimals);
    const double out_ui = util::from_base_units(quote.out_amount, output_decimals);

    VenueFill fill;
    fill.status = ExecutionStatus::Filled;
    fill.tx_hash = expected_sig;
    fill.correlation_id = intent.id;
    fill.executed_amount = in_ui;
    fill.executed_price = in_ui > 0.0 ? out_ui / in_ui : 0.0;
    fill.slippage_bps = quote.price_impact_pct * 100.0;
    fill.message = closing ? "position closed" : "swap confirmed";
    return fill;
}

} // namespace tradegate
