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
#include <ethbridge/core/int.hpp>
#include <ethbridge/core/likely.h>
#include <ethbridge/core/result.hpp>
#include <ethbridge/execution/bridge/embedded_message.hpp>
#include <ethbridge/execution/ethereum/core/address.hpp>

#include <evmc/hex.hpp>
#include <intx/intx.hpp>
#include <nlohmann/json.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

ETHBRIDGE_NAMESPACE_BEGIN

ETHBRIDGE_ANONYMOUS_NAMESPACE_BEGIN

template <class... Ts>
struct overloaded : Ts...
{
    using Ts::operator()...;
};

std::string to_json_hex(Address const &address)
{
    return "0x" + evmc::hex(address);
}

nlohmann::json entries_json(std::vector<TransferEntry> const &entries)
{
    auto array = nlohmann::json::array();
    for (auto const &entry : entries) {
        array.push_back(nlohmann::json{
            {"address", to_json_hex(entry.address)},
            {"amount", intx::to_string(entry.amount)}});
    }
    return array;
}

uint512_t sum_amounts(std::vector<TransferEntry> const &entries)
{
    uint512_t sum{0};
    for (auto const &entry : entries) {
        sum += uint512_t{entry.amount};
    }
    return sum;
}

Result<void> validate_entries(std::vector<TransferEntry> const &entries)
{
    for (auto const &entry : entries) {
        if (ETHBRIDGE_UNLIKELY(entry.amount == 0)) {
            return MessageError::NonPositiveAmount;
        }
    }
    using BOOST_OUTCOME_V2_NAMESPACE::success;
    return success();
}

ETHBRIDGE_ANONYMOUS_NAMESPACE_END

std::string_view message_type(EmbeddedMessage const &msg)
{
    return std::visit(
        overloaded{
            [](MsgSend const &) { return SEND_TYPE; },
            [](MsgMultiSend const &) { return MULTI_SEND_TYPE; },
            [](MsgEthereumTx const &) { return ETHEREUM_TX_TYPE; }},
        msg);
}

std::vector<Address> message_signers(EmbeddedMessage const &msg)
{
    return std::visit(
        overloaded{
            [](MsgSend const &send) { return std::vector<Address>{send.from}; },
            [](MsgMultiSend const &multi) {
                std::vector<Address> signers;
                signers.reserve(multi.inputs.size());
                for (auto const &input : multi.inputs) {
                    signers.push_back(input.address);
                }
                return signers;
            },
            [](MsgEthereumTx const &) { return std::vector<Address>{}; }},
        msg);
}

std::string message_sign_bytes(EmbeddedMessage const &msg)
{
    nlohmann::json const doc = std::visit(
        overloaded{
            [](MsgSend const &send) -> nlohmann::json {
                return {
                    {"amount", intx::to_string(send.amount)},
                    {"from", to_json_hex(send.from)},
                    {"to", to_json_hex(send.to)},
                    {"type", SEND_TYPE}};
            },
            [](MsgMultiSend const &multi) -> nlohmann::json {
                return {
                    {"inputs", entries_json(multi.inputs)},
                    {"outputs", entries_json(multi.outputs)},
                    {"type", MULTI_SEND_TYPE}};
            },
            [](MsgEthereumTx const &eth) -> nlohmann::json {
                return {
                    {"hash", "0x" + evmc::hex(eth.tx.hash())},
                    {"type", ETHEREUM_TX_TYPE}};
            }},
        msg);
    return doc.dump();
}

Result<void> validate_message(EmbeddedMessage const &msg)
{
    using BOOST_OUTCOME_V2_NAMESPACE::success;

    if (auto const *const send = std::get_if<MsgSend>(&msg)) {
        if (ETHBRIDGE_UNLIKELY(send->amount == 0)) {
            return MessageError::NonPositiveAmount;
        }
        if (ETHBRIDGE_UNLIKELY(send->from == send->to)) {
            return MessageError::SelfTransfer;
        }
        return success();
    }

    if (auto const *const multi = std::get_if<MsgMultiSend>(&msg)) {
        if (ETHBRIDGE_UNLIKELY(multi->inputs.empty())) {
            return MessageError::NoInputs;
        }
        if (ETHBRIDGE_UNLIKELY(multi->outputs.empty())) {
            return MessageError::NoOutputs;
        }
        BOOST_OUTCOME_TRY(validate_entries(multi->inputs));
        BOOST_OUTCOME_TRY(validate_entries(multi->outputs));
        if (ETHBRIDGE_UNLIKELY(
                sum_amounts(multi->inputs) != sum_amounts(multi->outputs))) {
            return MessageError::InputOutputMismatch;
        }
        return success();
    }

    // nesting is rejected by the batch validator, not here
    return success();
}

ETHBRIDGE_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<ethbridge::MessageError>::mapping> const &
quick_status_code_from_enum<ethbridge::MessageError>::value_mappings()
{
    using ethbridge::MessageError;

    static std::initializer_list<mapping> const v = {
        {MessageError::Success, "success", {errc::success}},
        {MessageError::NonPositiveAmount, "amount must be positive", {}},
        {MessageError::SelfTransfer, "sender and recipient are equal", {}},
        {MessageError::NoInputs, "no inputs to send transaction", {}},
        {MessageError::NoOutputs, "no outputs to send transaction", {}},
        {MessageError::InputOutputMismatch,
         "sum inputs != sum outputs",
         {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
