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
#include <ethbridge/core/int.hpp>
#include <ethbridge/execution/bridge/ante_handler.hpp>
#include <ethbridge/execution/bridge/cached_account_store.hpp>
#include <ethbridge/execution/bridge/chain_id.hpp>
#include <ethbridge/execution/bridge/context.hpp>
#include <ethbridge/execution/bridge/gas_meter.hpp>
#include <ethbridge/execution/bridge/genesis_accounts.hpp>
#include <ethbridge/execution/bridge/in_memory_account_store.hpp>
#include <ethbridge/execution/bridge/tx_result.hpp>
#include <ethbridge/execution/ethereum/core/address.hpp>
#include <ethbridge/execution/ethereum/core/ecdsa.hpp>
#include <ethbridge/execution/ethereum/core/fmt/hex_fmt.hpp>
#include <ethbridge/execution/ethereum/core/rlp/wire_transaction_rlp.hpp>
#include <ethbridge/execution/ethereum/core/wire_transaction.hpp>

#include <CLI/CLI.hpp>

#include <evmc/hex.hpp>

#include <intx/intx.hpp>

#include <nlohmann/json.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>

#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>

using namespace ethbridge;

namespace fs = std::filesystem;

namespace
{
    std::unordered_map<std::string, quill::LogLevel> const log_level_map = {
        {"tracel3", quill::LogLevel::TraceL3},
        {"tracel2", quill::LogLevel::TraceL2},
        {"tracel1", quill::LogLevel::TraceL1},
        {"debug", quill::LogLevel::Debug},
        {"info", quill::LogLevel::Info},
        {"warning", quill::LogLevel::Warning},
        {"error", quill::LogLevel::Error},
        {"critical", quill::LogLevel::Critical},
        {"none", quill::LogLevel::None}};

    struct SignArgs
    {
        std::string secret_key;
        uint64_t nonce{0};
        std::string gas_price{"1"};
        uint64_t gas_limit{21'000};
        std::string to;
        std::string amount{"1"};
        std::string payload;
    };

    struct ValidateArgs
    {
        std::string reserved_address;
        fs::path genesis;
        std::string tx;
        uint64_t sig_verify_cost{GasConfig{}.sig_verify_cost};
    };

    template <class T>
    T parse_hex(std::string const &s, char const *const what)
    {
        auto const value = evmc::from_hex<T>(s);
        if (!value.has_value()) {
            throw std::invalid_argument{std::string{"malformed "} + what};
        }
        return *value;
    }

    byte_string parse_bytes(std::string const &s, char const *const what)
    {
        auto const value = evmc::from_hex(s);
        if (!value.has_value()) {
            throw std::invalid_argument{std::string{"malformed "} + what};
        }
        return *value;
    }

    int run_sign(std::string const &chain_id_str, SignArgs const &args)
    {
        auto const chain_id = parse_chain_id(chain_id_str);
        if (!chain_id.has_value()) {
            LOG_ERROR("invalid chain id {}", chain_id_str);
            return 1;
        }
        auto const secret_key =
            parse_hex<SecretKey>(args.secret_key, "secret key");

        std::optional<Address> recipient;
        if (!args.to.empty()) {
            recipient = parse_hex<Address>(args.to, "recipient");
        }

        WireTransaction tx{TxData{
            .nonce = args.nonce,
            .gas_price = intx::from_string<uint256_t>(args.gas_price),
            .gas_limit = args.gas_limit,
            .recipient = recipient,
            .amount = intx::from_string<uint256_t>(args.amount),
            .payload = parse_bytes(args.payload, "payload")}};

        if (auto const res = tx.sign(*chain_id, secret_key); res.has_error()) {
            LOG_ERROR("signing failed: {}", res.error().message().c_str());
            return 1;
        }
        auto const sender = tx.derive_sender(*chain_id);
        if (sender.has_error()) {
            LOG_ERROR(
                "signed transaction does not recover: {}",
                sender.error().message().c_str());
            return 1;
        }
        LOG_INFO("signed tx {} from {}", tx.hash(), sender.value());

        nlohmann::json const out = {
            {"tx", "0x" + evmc::hex(rlp::encode_wire_transaction(tx))},
            {"hash", "0x" + evmc::hex(tx.hash())},
            {"sender", "0x" + evmc::hex(sender.value())}};
        std::cout << out.dump() << std::endl;
        return 0;
    }

    int run_validate(std::string const &chain_id, ValidateArgs const &args)
    {
        auto const encoded = parse_bytes(args.tx, "transaction");
        byte_string_view enc{encoded};
        auto tx = rlp::decode_wire_transaction(enc);
        if (tx.has_error() || !enc.empty()) {
            LOG_ERROR(
                "failed to decode transaction: {}",
                tx.has_error() ? tx.error().message().c_str()
                               : "trailing bytes");
            return 1;
        }
        if (auto const res = tx.value().validate_basic(); res.has_error()) {
            LOG_ERROR("invalid transaction: {}", res.error().message().c_str());
            return 1;
        }

        InMemoryAccountStore store;
        if (!args.genesis.empty()) {
            LOG_INFO(
                "loading accounts from genesis {}", args.genesis.string());
            if (auto const res = load_genesis_accounts(args.genesis, store);
                res.has_error()) {
                LOG_ERROR(
                    "failed to load genesis: {}",
                    res.error().message().c_str());
                return 1;
            }
        }

        GasConfig gas{};
        gas.sig_verify_cost = args.sig_verify_cost;
        AnteHandlerConfig const config{
            parse_hex<Address>(args.reserved_address, "reserved address"),
            gas};

        CachedAccountStore cache{store};
        AnteHandler const handler{config, cache};
        auto const out = handler(Context{chain_id}, tx.value());

        if (!out.abort) {
            if (auto const res = cache.write(); res.has_error()) {
                LOG_ERROR("commit failed: {}", res.error().message().c_str());
                return 1;
            }
        }
        LOG_INFO(
            "tx {} {} gas_used={} gas_wanted={}",
            tx.value().hash(),
            out.abort ? "rejected" : "accepted",
            out.result.gas_used,
            out.result.gas_wanted);

        nlohmann::json const result = {
            {"ok", out.result.is_ok()},
            {"error",
             out.result.is_ok() ? std::string{}
                                : std::string{out.result.status.error()
                                                  .message()
                                                  .c_str()}},
            {"log", out.result.log},
            {"gas_wanted", out.result.gas_wanted},
            {"gas_used", out.result.gas_used}};
        std::cout << result.dump() << std::endl;
        return out.abort ? 1 : 0;
    }
}

int main(int const argc, char const *argv[])
{
    CLI::App cli{"ethbridge"};
    cli.option_defaults()->always_capture_default();
    cli.require_subcommand(1);
    cli.fallthrough();

    std::string chain_id;
    auto log_level = quill::LogLevel::Info;

    cli.add_option("--chain_id", chain_id, "chain identifier")->required();
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));

    SignArgs sign_args;
    auto *const sign = cli.add_subcommand("sign", "sign a legacy transaction");
    sign->add_option("--secret_key", sign_args.secret_key, "hex secret key")
        ->required();
    sign->add_option("--nonce", sign_args.nonce, "account nonce");
    sign->add_option("--gas_price", sign_args.gas_price, "gas price");
    sign->add_option("--gas_limit", sign_args.gas_limit, "gas limit");
    sign->add_option(
        "--to", sign_args.to, "recipient address, empty for contract creation");
    sign->add_option("--amount", sign_args.amount, "amount to transfer");
    sign->add_option("--payload", sign_args.payload, "hex payload");

    ValidateArgs validate_args;
    auto *const validate = cli.add_subcommand(
        "validate", "run the ante handler over an encoded transaction");
    validate->add_option("--tx", validate_args.tx, "hex encoded transaction")
        ->required();
    validate
        ->add_option(
            "--reserved_address",
            validate_args.reserved_address,
            "recipient that marks an embedded batch carrier")
        ->required();
    validate->add_option("--genesis", validate_args.genesis, "genesis accounts")
        ->check(CLI::ExistingFile);
    validate->add_option(
        "--sig_verify_cost",
        validate_args.sig_verify_cost,
        "gas charged per signature verification");

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    // stdout carries only the JSON result
    auto stderr_handler = quill::stderr_handler();
    stderr_handler->set_pattern(
        "%(ascii_time) [%(thread)] %(filename):%(lineno) LOG_%(level_name)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stderr_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    try {
        if (sign->parsed()) {
            return run_sign(chain_id, sign_args);
        }
        return run_validate(chain_id, validate_args);
    }
    catch (std::exception const &e) {
        LOG_ERROR("{}", e.what());
        return 1;
    }
}
