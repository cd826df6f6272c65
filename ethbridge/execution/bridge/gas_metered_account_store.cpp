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
#include <ethbridge/core/result.hpp>
#include <ethbridge/execution/bridge/account.hpp>
#include <ethbridge/execution/bridge/account_store.hpp>
#include <ethbridge/execution/bridge/gas_meter.hpp>
#include <ethbridge/execution/bridge/gas_metered_account_store.hpp>
#include <ethbridge/execution/bridge/rlp/account_rlp.hpp>
#include <ethbridge/execution/ethereum/core/address.hpp>

#include <boost/outcome/try.hpp>

#include <cstdint>

ETHBRIDGE_NAMESPACE_BEGIN

ETHBRIDGE_ANONYMOUS_NAMESPACE_BEGIN

uint64_t record_size(Account const &account)
{
    return rlp::encode_account(account).size();
}

ETHBRIDGE_ANONYMOUS_NAMESPACE_END

GasMeteredAccountStore::GasMeteredAccountStore(
    AccountStore &store, GasMeter &meter, GasConfig const &config)
    : store_{store}
    , meter_{meter}
    , config_{config}
{
}

Result<Account> GasMeteredAccountStore::get_account(Address const &address)
{
    meter_.consume(config_.read_cost_flat, "ReadFlat");
    BOOST_OUTCOME_TRY(auto const account, store_.get_account(address));
    meter_.consume(
        config_.read_cost_per_byte * record_size(account), "ReadPerByte");
    return account;
}

bool GasMeteredAccountStore::has_account(Address const &address)
{
    meter_.consume(config_.has_cost, "HasCheck");
    return store_.has_account(address);
}

Result<void> GasMeteredAccountStore::set_account(Account const &account)
{
    meter_.consume(config_.write_cost_flat, "WriteFlat");
    meter_.consume(
        config_.write_cost_per_byte * record_size(account), "WritePerByte");
    return store_.set_account(account);
}

int64_t GasMeteredAccountStore::next_account_number() const
{
    meter_.consume(config_.read_cost_flat, "ReadFlat");
    return store_.next_account_number();
}

ETHBRIDGE_NAMESPACE_END
