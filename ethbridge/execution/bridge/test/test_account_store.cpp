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

#include <ethbridge/execution/bridge/account.hpp>
#include <ethbridge/execution/bridge/account_error.hpp>
#include <ethbridge/execution/bridge/cached_account_store.hpp>
#include <ethbridge/execution/bridge/gas_meter.hpp>
#include <ethbridge/execution/bridge/gas_metered_account_store.hpp>
#include <ethbridge/execution/bridge/genesis_accounts.hpp>
#include <ethbridge/execution/bridge/in_memory_account_store.hpp>
#include <ethbridge/execution/bridge/rlp/account_rlp.hpp>

#include <evmc/evmc.hpp>

#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

using namespace ethbridge;
using namespace evmc::literals;

namespace
{
    constexpr auto a{0x00000000000000000000000000000000000000aa_address};
    constexpr auto b{0x00000000000000000000000000000000000000bb_address};
    constexpr auto c{0x00000000000000000000000000000000000000cc_address};
}

TEST(AccountStore, create_account)
{
    InMemoryAccountStore store;
    EXPECT_FALSE(store.has_account(a));

    auto const first = store.create_account(a);
    ASSERT_FALSE(first.has_error());
    EXPECT_EQ(first.value().address, a);
    EXPECT_EQ(first.value().account_number, 0);
    EXPECT_EQ(first.value().sequence, 0);
    EXPECT_TRUE(store.has_account(a));

    auto const second = store.create_account(b);
    ASSERT_FALSE(second.has_error());
    EXPECT_EQ(second.value().account_number, 1);

    auto const again = store.create_account(a);
    ASSERT_TRUE(again.has_error());
    EXPECT_EQ(again.error(), AccountError::AccountExists);
    EXPECT_EQ(store.size(), 2);
}

TEST(AccountStore, unknown_account)
{
    InMemoryAccountStore store;

    auto const account = store.get_account(a);
    ASSERT_TRUE(account.has_error());
    EXPECT_EQ(account.error(), AccountError::UnknownAccount);

    auto const sequence = store.get_sequence(a);
    ASSERT_TRUE(sequence.has_error());
    EXPECT_EQ(sequence.error(), AccountError::UnknownAccount);

    auto const res = store.increment_sequence(a);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), AccountError::UnknownAccount);
}

TEST(AccountStore, increment_sequence)
{
    InMemoryAccountStore store;
    ASSERT_FALSE(store.create_account(a).has_error());

    ASSERT_FALSE(store.increment_sequence(a).has_error());
    ASSERT_FALSE(store.increment_sequence(a).has_error());
    EXPECT_EQ(store.get_sequence(a).value(), 2);
    EXPECT_EQ(store.get_account(a).value().account_number, 0);
}

TEST(AccountStore, sequence_overflow)
{
    InMemoryAccountStore store;
    Account const account{
        .address = a,
        .account_number = 4,
        .sequence = std::numeric_limits<int64_t>::max()};
    ASSERT_FALSE(store.set_account(account).has_error());

    auto const res = store.increment_sequence(a);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), AccountError::SequenceOverflow);
    EXPECT_EQ(store.get_account(a).value(), account);
}

TEST(AccountStore, account_numbers_follow_highest)
{
    InMemoryAccountStore store;
    ASSERT_FALSE(
        store.set_account(Account{.address = a, .account_number = 7})
            .has_error());
    EXPECT_EQ(store.next_account_number(), 8);
    EXPECT_EQ(store.create_account(b).value().account_number, 8);
}

TEST(Rlp_Account, encode_decode)
{
    Account const account{.address = a, .account_number = 1, .sequence = 300};
    auto const encoded = rlp::encode_account(account);
    EXPECT_EQ(encoded, byte_string({0xc4, 0x01, 0x82, 0x01, 0x2c}));

    byte_string_view enc{encoded};
    auto const decoded = rlp::decode_account(a, enc);
    ASSERT_FALSE(decoded.has_error());
    EXPECT_EQ(decoded.value(), account);
    EXPECT_TRUE(enc.empty());
}

TEST(CachedAccountStore, write_commits)
{
    InMemoryAccountStore parent;
    ASSERT_FALSE(parent.create_account(a).has_error());

    CachedAccountStore cache{parent};
    ASSERT_FALSE(cache.create_account(b).has_error());
    ASSERT_FALSE(cache.increment_sequence(a).has_error());

    EXPECT_TRUE(cache.has_account(b));
    EXPECT_EQ(cache.get_account(b).value().account_number, 1);
    EXPECT_EQ(cache.get_sequence(a).value(), 1);
    EXPECT_FALSE(parent.has_account(b));
    EXPECT_EQ(parent.get_sequence(a).value(), 0);
    EXPECT_EQ(cache.pending(), 2);

    ASSERT_FALSE(cache.write().has_error());
    EXPECT_EQ(cache.pending(), 0);
    EXPECT_TRUE(parent.has_account(b));
    EXPECT_EQ(parent.get_sequence(a).value(), 1);
    EXPECT_EQ(parent.next_account_number(), 2);
}

TEST(CachedAccountStore, discard_rolls_back)
{
    InMemoryAccountStore parent;
    ASSERT_FALSE(parent.create_account(a).has_error());

    {
        CachedAccountStore cache{parent};
        ASSERT_FALSE(cache.increment_sequence(a).has_error());
        ASSERT_FALSE(cache.create_account(b).has_error());
        cache.discard();
        EXPECT_EQ(cache.get_sequence(a).value(), 0);
        EXPECT_FALSE(cache.has_account(b));
        EXPECT_EQ(cache.next_account_number(), 1);
    }

    {
        CachedAccountStore cache{parent};
        ASSERT_FALSE(cache.create_account(c).has_error());
    }

    EXPECT_EQ(parent.get_sequence(a).value(), 0);
    EXPECT_FALSE(parent.has_account(b));
    EXPECT_FALSE(parent.has_account(c));
    EXPECT_EQ(parent.size(), 1);
}

TEST(GasMeter, consume)
{
    GasMeter meter{100};
    meter.consume(60, "first");
    meter.consume(40, "second");
    EXPECT_EQ(meter.consumed(), 100);
    EXPECT_FALSE(meter.is_past_limit());

    try {
        meter.consume(1, "third");
        FAIL() << "expected out of gas";
    }
    catch (OutOfGas const &e) {
        EXPECT_EQ(e.descriptor(), "third");
        EXPECT_STREQ(e.what(), "out of gas in location: third");
    }
    EXPECT_EQ(meter.consumed(), 101);
    EXPECT_TRUE(meter.is_past_limit());
}

TEST(GasMeter, infinite)
{
    GasMeter meter;
    EXPECT_FALSE(meter.limit().has_value());
    meter.consume(std::numeric_limits<uint64_t>::max() - 1, "big");
    EXPECT_FALSE(meter.is_past_limit());
}

TEST(GasMeter, overflow_saturates)
{
    GasMeter meter{std::numeric_limits<uint64_t>::max()};
    meter.consume(std::numeric_limits<uint64_t>::max(), "fill");
    EXPECT_THROW(meter.consume(1, "overflow"), OutOfGas);
    EXPECT_EQ(meter.consumed(), std::numeric_limits<uint64_t>::max());
}

TEST(GasMeteredAccountStore, charges)
{
    InMemoryAccountStore store;
    ASSERT_FALSE(store.create_account(a).has_error());

    GasMeter meter;
    GasConfig const config{};
    GasMeteredAccountStore metered{store, meter, config};

    // [0, 0] encodes to three bytes
    EXPECT_TRUE(metered.has_account(a));
    EXPECT_EQ(meter.consumed(), 10);

    ASSERT_FALSE(metered.get_account(a).has_error());
    EXPECT_EQ(meter.consumed(), 10 + 10 + 3);

    ASSERT_FALSE(metered.increment_sequence(a).has_error());
    EXPECT_EQ(meter.consumed(), 23 + 13 + 10 + 30);
    EXPECT_EQ(store.get_sequence(a).value(), 1);

    // a missing record costs only the flat read
    auto const missing = metered.get_account(b);
    ASSERT_TRUE(missing.has_error());
    EXPECT_EQ(missing.error(), AccountError::UnknownAccount);
    EXPECT_EQ(meter.consumed(), 76 + 10);
}

TEST(GasMeteredAccountStore, out_of_gas)
{
    InMemoryAccountStore store;
    GasMeter meter{20};
    GasConfig const config{};
    GasMeteredAccountStore metered{store, meter, config};

    try {
        (void)metered.set_account(Account{.address = a});
        FAIL() << "expected out of gas";
    }
    catch (OutOfGas const &e) {
        EXPECT_EQ(e.descriptor(), "WritePerByte");
    }
    EXPECT_EQ(meter.consumed(), 40);
    EXPECT_FALSE(store.has_account(a));
}

TEST(GenesisAccounts, load)
{
    auto const genesis = nlohmann::json::parse(R"({
        "0x00000000000000000000000000000000000000bb": {},
        "0x00000000000000000000000000000000000000aa": {"sequence": 5}
    })");

    InMemoryAccountStore store;
    ASSERT_FALSE(load_genesis_accounts(genesis, store).has_error());

    EXPECT_EQ(
        store.get_account(a).value(),
        (Account{.address = a, .account_number = 0, .sequence = 5}));
    EXPECT_EQ(
        store.get_account(b).value(),
        (Account{.address = b, .account_number = 1, .sequence = 0}));

    auto const again = load_genesis_accounts(genesis, store);
    ASSERT_TRUE(again.has_error());
    EXPECT_EQ(again.error(), AccountError::AccountExists);
}
