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
#include <ethbridge/core/result.hpp>
#include <ethbridge/execution/bridge/account_store.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>

ETHBRIDGE_NAMESPACE_BEGIN

// {"0x<address>": {"sequence": n}, ...}; account numbers follow key order
Result<void>
load_genesis_accounts(nlohmann::json const &genesis_json, AccountStore &);

Result<void> load_genesis_accounts(
    std::filesystem::path const &genesis_file, AccountStore &);

ETHBRIDGE_NAMESPACE_END
