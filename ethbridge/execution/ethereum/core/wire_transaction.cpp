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

#include <ethbridge/core/byte_string.hpp>
#include <ethbridge/core/bytes.hpp>
#include <ethbridge/core/config.hpp>
#include <ethbridge/core/keccak.hpp>
#include <ethbridge/core/likely.h>
#include <ethbridge/core/result.hpp>
#include <ethbridge/execution/ethereum/core/address.hpp>
#include <ethbridge/execution/ethereum/core/ecdsa.hpp>
#include <ethbridge/execution/ethereum/core/rlp/wire_transaction_rlp.hpp>
#include <ethbridge/execution/ethereum/core/signature.hpp>
#include <ethbridge/execution/ethereum/core/wire_transaction.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>
// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/generic_code.hpp>
#endif

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <utility>

ETHBRIDGE_NAMESPACE_BEGIN

using BOOST_OUTCOME_V2_NAMESPACE::success;

bytes32_t signing_hash(TxData const &data, uint256_t const &chain_id)
{
    return to_bytes(
        keccak256(rlp::encode_wire_transaction_for_signing(data, chain_id)));
}

WireTransaction::WireTransaction(TxData data)
    : data_{std::move(data)}
{
}

Result<void>
WireTransaction::sign(uint256_t const &chain_id, SecretKey const &secret_key)
{
    if (ETHBRIDGE_UNLIKELY(chain_id > MAX_CHAIN_ID)) {
        return WireTransactionError::InvalidChainId;
    }
    auto const signature =
        sign_digest(signing_hash(data_, chain_id), secret_key);
    if (ETHBRIDGE_UNLIKELY(!signature.has_value())) {
        return WireTransactionError::InvalidSecretKey;
    }

    SignatureAndChain const sc{
        .r = signature->r,
        .s = signature->s,
        .chain_id =
            chain_id == 0 ? std::nullopt : std::make_optional(chain_id),
        .y_parity = signature->y_parity};
    data_.v = get_v(sc);
    data_.r = sc.r;
    data_.s = sc.s;

    hash_.reset();
    size_.reset();
    sender_.reset();
    return success();
}

Result<Address> WireTransaction::derive_sender(uint256_t const &chain_id) const
{
    if (auto const *const cached = sender_.get();
        cached != nullptr && cached->first == chain_id) {
        return cached->second;
    }

    auto const sc =
        to_signature_and_chain(data_.v, data_.r, data_.s, chain_id);
    if (ETHBRIDGE_UNLIKELY(!sc.has_value())) {
        return WireTransactionError::InvalidSignature;
    }

    // EIP-2
    if (ETHBRIDGE_UNLIKELY(!is_valid_signature(sc->r, sc->s))) {
        return WireTransactionError::InvalidSignature;
    }

    auto const sender = recover_address(
        signing_hash(data_, chain_id),
        RecoverableSignature{.r = sc->r, .s = sc->s, .y_parity = sc->y_parity});
    if (ETHBRIDGE_UNLIKELY(!sender.has_value())) {
        return WireTransactionError::InvalidSignature;
    }

    sender_.reset();
    sender_.set({chain_id, *sender});
    return *sender;
}

bytes32_t const &WireTransaction::hash() const
{
    return hash_.get_or_init([this] {
        return to_bytes(keccak256(rlp::encode_wire_transaction(*this)));
    });
}

size_t WireTransaction::size() const
{
    return size_.get_or_init(
        [this] { return rlp::encode_wire_transaction(*this).size(); });
}

bool WireTransaction::is_embedded_carrier(
    Address const &reserved_address) const noexcept
{
    return data_.recipient.has_value() && *data_.recipient == reserved_address;
}

Result<void> WireTransaction::validate_basic() const
{
    if (ETHBRIDGE_UNLIKELY(data_.gas_price == 0)) {
        return WireTransactionError::NonPositiveGasPrice;
    }
    if (ETHBRIDGE_UNLIKELY(data_.amount == 0)) {
        return WireTransactionError::NonPositiveAmount;
    }
    return success();
}

ETHBRIDGE_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<quick_status_code_from_enum<
    ethbridge::WireTransactionError>::mapping> const &
quick_status_code_from_enum<ethbridge::WireTransactionError>::value_mappings()
{
    using ethbridge::WireTransactionError;

    static std::initializer_list<mapping> const v = {
        {WireTransactionError::Success, "success", {errc::success}},
        {WireTransactionError::InvalidSignature, "invalid signature", {}},
        {WireTransactionError::InvalidSecretKey, "invalid secret key", {}},
        {WireTransactionError::InvalidChainId,
         "chain id too large for EIP-155",
         {}},
        {WireTransactionError::NonPositiveGasPrice,
         "gas price must be positive",
         {}},
        {WireTransactionError::NonPositiveAmount,
         "amount must be positive",
         {}}};

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
