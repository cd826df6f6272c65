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

#include <ethbridge/core/assert.h>
#include <ethbridge/core/config.hpp>
#include <ethbridge/core/result.hpp>
#include <ethbridge/execution/bridge/account_store.hpp>
#include <ethbridge/execution/bridge/genesis_accounts.hpp>
#include <ethbridge/execution/ethereum/core/address.hpp>

#include <boost/outcome/try.hpp>
#include <evmc/hex.hpp>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

ETHBRIDGE_NAMESPACE_BEGIN

Result<void> load_genesis_accounts(
    nlohmann::json const &genesis_json, AccountStore &store)
{
    for (auto const &account_info : genesis_json.items()) {
        auto const address = evmc::from_hex<Address>(account_info.key());
        ETHBRIDGE_ASSERT(address.has_value(), "malformed genesis address");

        BOOST_OUTCOME_TRY(auto account, store.create_account(*address));
        account.sequence = account_info.value().value("sequence", int64_t{0});
        ETHBRIDGE_ASSERT(account.sequence >= 0);
        BOOST_OUTCOME_TRY(store.set_account(account));
    }
    using BOOST_OUTCOME_V2_NAMESPACE::success;
    return success();
}

Result<void> load_genesis_accounts(
    std::filesystem::path const &genesis_file, AccountStore &store)
{
    std::ifstream ifile(genesis_file.c_str());
    auto const genesis_json = nlohmann::json::parse(ifile);
    return load_genesis_accounts(genesis_json, store);
}

ETHBRIDGE_NAMESPACE_END
