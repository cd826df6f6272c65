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

#pragma once

#include <ethbridge/core/byte_string.hpp>
#include <ethbridge/core/bytes.hpp>
#include <ethbridge/core/config.hpp>
#include <ethbridge/core/int.hpp>
#include <ethbridge/core/once_cell.hpp>
#include <ethbridge/core/result.hpp>
#include <ethbridge/execution/ethereum/core/address.hpp>
#include <ethbridge/execution/ethereum/core/ecdsa.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <utility>

ETHBRIDGE_NAMESPACE_BEGIN

enum class WireTransactionError
{
    Success = 0,
    InvalidSignature,
    InvalidSecretKey,
    InvalidChainId,
    NonPositiveGasPrice,
    NonPositiveAmount,
};

// Ethereum legacy transaction fields, in wire order
struct TxData
{
    uint64_t nonce{};
    uint256_t gas_price{};
    uint64_t gas_limit{};
    std::optional<Address> recipient{};
    uint256_t amount{};
    byte_string payload{};
    uint256_t v{};
    uint256_t r{};
    uint256_t s{};

    friend bool operator==(TxData const &, TxData const &) = default;
};

class WireTransaction
{
    TxData data_{};

    mutable OnceCell<bytes32_t> hash_{};
    mutable OnceCell<size_t> size_{};
    // keyed by the chain id the sender was recovered under
    mutable OnceCell<std::pair<uint256_t, Address>> sender_{};

public:
    WireTransaction() = default;
    explicit WireTransaction(TxData);

    TxData const &data() const noexcept
    {
        return data_;
    }

    /// Overwrites v, r, s with an EIP-155 signature for `chain_id`
    Result<void> sign(uint256_t const &chain_id, SecretKey const &);

    Result<Address> derive_sender(uint256_t const &chain_id) const;

    bytes32_t const &hash() const;
    size_t size() const;

    bool is_embedded_carrier(Address const &reserved_address) const noexcept;

    Result<void> validate_basic() const;

    friend bool
    operator==(WireTransaction const &a, WireTransaction const &b) noexcept
    {
        return a.data_ == b.data_;
    }
};

bytes32_t signing_hash(TxData const &, uint256_t const &chain_id);

ETHBRIDGE_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<ethbridge::WireTransactionError>
    : quick_status_code_from_enum_defaults<ethbridge::WireTransactionError>
{
    static constexpr auto const domain_name = "Wire Transaction Error";
    static constexpr auto const domain_uuid =
        "8d3f1e26-5a7b-4c90-b1e2-7f64a0c9d5e3";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
