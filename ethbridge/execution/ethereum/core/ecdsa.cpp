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
#include <ethbridge/execution/ethereum/core/address.hpp>
#include <ethbridge/execution/ethereum/core/ecdsa.hpp>

#include <silkpre/ecdsa.h>
#include <silkpre/secp256k1n.hpp>

#include <intx/intx.hpp>

#include <secp256k1.h>
#include <secp256k1_recovery.h>

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <optional>

ETHBRIDGE_ANONYMOUS_NAMESPACE_BEGIN

secp256k1_context *context()
{
    thread_local std::unique_ptr<
        secp256k1_context,
        decltype(&secp256k1_context_destroy)> const
        context(
            secp256k1_context_create(
                SILKPRE_SECP256K1_CONTEXT_FLAGS | SECP256K1_CONTEXT_SIGN),
            &secp256k1_context_destroy);
    return context.get();
}

ETHBRIDGE_ANONYMOUS_NAMESPACE_END

ETHBRIDGE_NAMESPACE_BEGIN

std::optional<RecoverableSignature>
sign_digest(bytes32_t const &digest, SecretKey const &secret_key)
{
    if (ETHBRIDGE_UNLIKELY(
            !secp256k1_ec_seckey_verify(context(), secret_key.bytes))) {
        return std::nullopt;
    }

    secp256k1_ecdsa_recoverable_signature signature;
    if (ETHBRIDGE_UNLIKELY(!secp256k1_ecdsa_sign_recoverable(
            context(),
            &signature,
            digest.bytes,
            secret_key.bytes,
            nullptr,
            nullptr))) {
        return std::nullopt;
    }

    uint8_t compact[64];
    int recovery_id = 0;
    secp256k1_ecdsa_recoverable_signature_serialize_compact(
        context(), compact, &recovery_id, &signature);

    return RecoverableSignature{
        .r = intx::be::unsafe::load<uint256_t>(compact),
        .s = intx::be::unsafe::load<uint256_t>(compact + 32),
        .y_parity = static_cast<uint8_t>(recovery_id)};
}

std::optional<Address> recover_address(
    bytes32_t const &digest, RecoverableSignature const &signature)
{
    if (signature.y_parity > 1) {
        return std::nullopt;
    }

    uint8_t compact[64];
    intx::be::unsafe::store(compact, signature.r);
    intx::be::unsafe::store(compact + 32, signature.s);

    Address result;
    if (!silkpre_recover_address(
            result.bytes,
            digest.bytes,
            compact,
            signature.y_parity,
            context())) {
        return std::nullopt;
    }
    return result;
}

std::optional<Address> address_from_secret(SecretKey const &secret_key)
{
    secp256k1_pubkey public_key;
    if (!secp256k1_ec_pubkey_create(
            context(), &public_key, secret_key.bytes)) {
        return std::nullopt;
    }

    uint8_t serialized[65];
    size_t size = sizeof(serialized);
    secp256k1_ec_pubkey_serialize(
        context(),
        serialized,
        &size,
        &public_key,
        SECP256K1_EC_UNCOMPRESSED);

    // drop the 0x04 prefix, the address is the last 20 bytes of the hash
    auto const hash = keccak256(byte_string_view{serialized + 1, 64});
    Address result;
    std::memcpy(result.bytes, hash.bytes + 12, sizeof(result.bytes));
    return result;
}

bool is_valid_signature(uint256_t const &r, uint256_t const &s) noexcept
{
    return silkpre::is_valid_signature(r, s, /* homestead */ true);
}

byte_string to_compact(RecoverableSignature const &signature)
{
    byte_string result(COMPACT_SIGNATURE_SIZE, 0);
    intx::be::unsafe::store(result.data(), signature.r);
    intx::be::unsafe::store(result.data() + 32, signature.s);
    result[64] = signature.y_parity;
    return result;
}

std::optional<RecoverableSignature> from_compact(byte_string_view const sig)
{
    if (ETHBRIDGE_UNLIKELY(sig.size() != COMPACT_SIGNATURE_SIZE)) {
        return std::nullopt;
    }
    return RecoverableSignature{
        .r = intx::be::unsafe::load<uint256_t>(sig.data()),
        .s = intx::be::unsafe::load<uint256_t>(sig.data() + 32),
        .y_parity = sig[64]};
}

ETHBRIDGE_NAMESPACE_END
