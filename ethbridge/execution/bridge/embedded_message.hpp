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

#include <ethbridge/core/config.hpp>
#include <ethbridge/core/int.hpp>
#include <ethbridge/core/result.hpp>
#include <ethbridge/execution/ethereum/core/address.hpp>
#include <ethbridge/execution/ethereum/core/wire_transaction.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

ETHBRIDGE_NAMESPACE_BEGIN

inline constexpr std::string_view SEND_TYPE = "send";
inline constexpr std::string_view MULTI_SEND_TYPE = "multisend";
// foreign-chain transaction; only ever decoded so it can be rejected
inline constexpr std::string_view ETHEREUM_TX_TYPE = "Ethereum";

enum class MessageError
{
    Success = 0,
    NonPositiveAmount,
    SelfTransfer,
    NoInputs,
    NoOutputs,
    InputOutputMismatch,
};

struct MsgSend
{
    Address from{};
    Address to{};
    uint256_t amount{};

    friend bool operator==(MsgSend const &, MsgSend const &) = default;
};

struct TransferEntry
{
    Address address{};
    uint256_t amount{};

    friend bool
    operator==(TransferEntry const &, TransferEntry const &) = default;
};

struct MsgMultiSend
{
    std::vector<TransferEntry> inputs{};
    std::vector<TransferEntry> outputs{};

    friend bool
    operator==(MsgMultiSend const &, MsgMultiSend const &) = default;
};

struct MsgEthereumTx
{
    WireTransaction tx{};

    friend bool
    operator==(MsgEthereumTx const &, MsgEthereumTx const &) = default;
};

using EmbeddedMessage = std::variant<MsgSend, MsgMultiSend, MsgEthereumTx>;

std::string_view message_type(EmbeddedMessage const &);

/// Addresses whose signatures authorize the message, in declaration order
std::vector<Address> message_signers(EmbeddedMessage const &);

/// Canonical JSON with sorted keys; embedded verbatim in the batch sign
/// document
std::string message_sign_bytes(EmbeddedMessage const &);

Result<void> validate_message(EmbeddedMessage const &);

ETHBRIDGE_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<ethbridge::MessageError>
    : quick_status_code_from_enum_defaults<ethbridge::MessageError>
{
    static constexpr auto const domain_name = "Message Error";
    static constexpr auto const domain_uuid =
        "5e92b7c4-0d1a-4f38-a6e5-91c3d2b8f07a";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
