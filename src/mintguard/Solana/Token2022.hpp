#pragma once

#include "mintguard/Solana/Token.hpp"

#include <cstdint>
#include <span>

namespace Mintguard
{
namespace Solana
{

// Token-2022 mints are padded to the token account length so that the account type
// byte sits at the same offset for mints and token accounts.
static constexpr size_t token_2022_account_length( ) { return 165; }
static constexpr size_t token_2022_account_type_offset( ) { return token_2022_account_length( ); }
static constexpr size_t token_2022_extensions_offset( ) { return token_2022_account_type_offset( ) + 1; }

enum class Token2022AccountType : uint8_t
{
    Uninitialized = 0,
    Mint = 1,
    Account = 2
};

enum class ExtensionType : uint16_t
{
    Uninitialized = 0,
    // Payload begins with the address of the mint's metadata record.
    MetadataAccount = 12,
    // Payload begins with a flag telling whether an update authority exists.
    UpdateAuthority = 13
};

// Decodes a Token-2022 mint: the base mint, then the type-length-value extension chain.
// Never throws; truncated or overrunning input sets parseFail and keeps what was read.
MintFacts decode_token2022_mint( std::span< const std::byte > data );

} // namespace Solana
} // namespace Mintguard
