// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <ethbridge/core/config.hpp>
#include <ethbridge/core/likely.h>
#include <ethbridge/core/result.hpp>
#include <ethbridge/execution/bridge/account_store.hpp>
#include <ethbridge/execution/bridge/ante_error.hpp>
#include <ethbridge/execution/bridge/ante_handler.hpp>
#include <ethbridge/execution/bridge/chain_id.hpp>
#include <ethbridge/execution/bridge/context.hpp>
#include <ethbridge/execution/bridge/gas_meter.hpp>
#include <ethbridge/execution/bridge/gas_metered_account_store.hpp>
#include <ethbridge/execution/bridge/rlp/embedded_batch_rlp.hpp>
#include <ethbridge/execution/bridge/tx_result.hpp>
#include <ethbridge/execution/bridge/validate_embedded_batch.hpp>
#include <ethbridge/execution/ethereum/core/fmt/hex_fmt.hpp>
#include <ethbridge/execution/ethereum/core/wire_transaction.hpp>

#include <quill/Quill.h>

#include <string>
#include <utility>
#include <variant>

ETHBRIDGE_NAMESPACE_BEGIN

ETHBRIDGE_ANONYMOUS_NAMESPACE_BEGIN

AnteOutcome reject(Context const &ctx, AnteError const error, std::string log)
{
    LOG_DEBUG("ante handler rejected tx: {}", log);
    auto const &meter = ctx.gas_meter();
    return AnteOutcome{
        .context = ctx,
        .result =
            TxResult{
                .status = error,
                .log = std::move(log),
                .gas_wanted = meter.limit().value_or(0),
                .gas_used = meter.consumed()},
        .abort = true};
}

AnteOutcome accept(Context const &ctx)
{
    auto const &meter = ctx.gas_meter();
    return AnteOutcome{
        .context = ctx,
        .result =
            TxResult{
                .gas_wanted = meter.limit().value_or(0),
                .gas_used = meter.consumed()},
        .abort = false};
}

ETHBRIDGE_ANONYMOUS_NAMESPACE_END

AnteHandler::AnteHandler(AnteHandlerConfig config, AccountStore &store)
    : config_{std::move(config)}
    , store_{store}
{
}

AnteOutcome
AnteHandler::operator()(Context const &ctx, SubmittedTx const &submitted) const
{
    auto const *const tx = std::get_if<WireTransaction>(&submitted);
    if (ETHBRIDGE_UNLIKELY(tx == nullptr)) {
        LOG_DEBUG("ante handler rejected tx: not a wire transaction");
        return AnteOutcome{
            .context = ctx,
            .result =
                TxResult{
                    .status = AnteError::TypeMismatch,
                    .log = "invalid transaction type"},
            .abort = true};
    }

    Context new_ctx = ctx.with_gas_meter(GasMeter{tx->data().gas_limit});

    try {
        auto const chain_id = parse_chain_id(new_ctx.chain_id());
        if (ETHBRIDGE_UNLIKELY(!chain_id.has_value())) {
            return reject(
                new_ctx,
                AnteError::InvalidChainId,
                "invalid chainID: " + new_ctx.chain_id());
        }

        new_ctx.gas_meter().consume(
            config_.gas.sig_verify_cost, "ante verify: secp256k1");

        auto const sender = tx->derive_sender(*chain_id);
        if (ETHBRIDGE_UNLIKELY(sender.has_error())) {
            return reject(
                new_ctx,
                AnteError::SignatureInvalid,
                "signature verification failed");
        }
        LOG_DEBUG("recovered sender {}", sender.value());

        if (!tx->is_embedded_carrier(config_.reserved_address)) {
            return accept(new_ctx);
        }

        auto batch = rlp::decode_embedded_batch(*tx);
        if (ETHBRIDGE_UNLIKELY(batch.has_error())) {
            return reject(
                new_ctx,
                AnteError::DecodeFailure,
                std::string{"failed to decode embedded batch: "} +
                    batch.error().message().c_str());
        }

        GasMeteredAccountStore metered{
            store_, new_ctx.gas_meter(), config_.gas};
        return validate_embedded_batch(
            new_ctx, batch.value(), metered, config_.gas);
    }
    catch (OutOfGas const &e) {
        auto const &meter = new_ctx.gas_meter();
        LOG_DEBUG("out of gas in location: {}", e.descriptor());
        return AnteOutcome{
            .context = new_ctx,
            .result =
                TxResult{
                    .status = AnteError::OutOfGas,
                    .log = std::string{"out of gas in location: "} +
                           e.descriptor(),
                    .gas_wanted = tx->data().gas_limit,
                    .gas_used = meter.consumed()},
            .abort = true};
    }
}

ETHBRIDGE_NAMESPACE_END
