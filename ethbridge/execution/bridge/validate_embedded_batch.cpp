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

#include <ethbridge/core/bytes.hpp>
#include <ethbridge/core/config.hpp>
#include <ethbridge/core/keccak.hpp>
#include <ethbridge/core/likely.h>
#include <ethbridge/core/result.hpp>
#include <ethbridge/execution/bridge/account_store.hpp>
#include <ethbridge/execution/bridge/ante_error.hpp>
#include <ethbridge/execution/bridge/context.hpp>
#include <ethbridge/execution/bridge/embedded_batch.hpp>
#include <ethbridge/execution/bridge/embedded_message.hpp>
#include <ethbridge/execution/bridge/gas_meter.hpp>
#include <ethbridge/execution/bridge/tx_result.hpp>
#include <ethbridge/execution/bridge/validate_embedded_batch.hpp>
#include <ethbridge/execution/ethereum/core/ecdsa.hpp>
#include <ethbridge/execution/ethereum/core/fmt/hex_fmt.hpp>

#include <quill/Quill.h>

#include <cstddef>
#include <optional>
#include <string>
#include <utility>

ETHBRIDGE_NAMESPACE_BEGIN

ETHBRIDGE_ANONYMOUS_NAMESPACE_BEGIN

AnteOutcome
finish(Context &ctx, Result<void> status, std::string log, bool const abort)
{
    auto const &meter = ctx.gas_meter();
    TxResult result{
        .status = std::move(status),
        .log = std::move(log),
        .gas_wanted = meter.limit().value_or(0),
        .gas_used = meter.consumed()};
    return AnteOutcome{
        .context = ctx, .result = std::move(result), .abort = abort};
}

AnteOutcome reject(Context &ctx, Result<void> status, std::string log)
{
    LOG_DEBUG("embedded batch rejected: {}", log);
    return finish(ctx, std::move(status), std::move(log), true);
}

AnteOutcome reject(Context &ctx, Result<void> status)
{
    auto log = std::string{status.error().message().c_str()};
    return reject(ctx, std::move(status), std::move(log));
}

ETHBRIDGE_ANONYMOUS_NAMESPACE_END

AnteOutcome validate_embedded_batch(
    Context &ctx, EmbeddedBatch const &batch, AccountStore &store,
    GasConfig const &gas)
{
    auto const signers = batch.required_signers();
    if (ETHBRIDGE_UNLIKELY(batch.signatures.size() != signers.size())) {
        return reject(
            ctx,
            AnteError::Unauthorized,
            "provided signature length does not match required length");
    }

    for (auto const &msg : batch.messages) {
        if (ETHBRIDGE_UNLIKELY(message_type(msg) == ETHEREUM_TX_TYPE)) {
            return reject(
                ctx,
                AnteError::DecodeFailure,
                "invalid nesting: Ethereum transactions cannot be embedded");
        }
        if (auto res = validate_message(msg);
            ETHBRIDGE_UNLIKELY(res.has_error())) {
            return reject(ctx, std::move(res));
        }
    }

    for (size_t i = 0; i < signers.size(); ++i) {
        auto const &signer = signers[i];

        auto account = store.get_account(signer);
        if (ETHBRIDGE_UNLIKELY(account.has_error())) {
            return reject(ctx, std::move(account).as_failure());
        }

        auto const doc = embedded_sign_bytes(
            batch,
            ctx.chain_id(),
            account.value().account_number,
            account.value().sequence);

        ctx.gas_meter().consume(gas.sig_verify_cost, "ante verify: secp256k1");

        auto const sig = from_compact(batch.signatures[i]);
        auto const recovered =
            sig.has_value()
                ? recover_address(
                      to_bytes(keccak256(to_byte_string_view(doc))), *sig)
                : std::nullopt;
        if (ETHBRIDGE_UNLIKELY(
                !recovered.has_value() || *recovered != signer)) {
            LOG_DEBUG("signature by {} does not verify", signer);
            return reject(
                ctx, AnteError::Unauthorized, "signature verification failed");
        }

        if (auto res = store.increment_sequence(signer);
            ETHBRIDGE_UNLIKELY(res.has_error())) {
            return reject(ctx, std::move(res));
        }
    }

    using BOOST_OUTCOME_V2_NAMESPACE::success;
    return finish(ctx, success(), std::string{}, false);
}

ETHBRIDGE_NAMESPACE_END
