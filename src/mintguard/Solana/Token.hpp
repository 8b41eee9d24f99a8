#pragma once

#include "mintguard/Core/PublicKey.hpp"
#include "mintguard/Solana/ByteCursor.hpp"

#include <cstdint>
#include <optional>
#include <ostream>
#include <span>

namespace Mintguard
{
namespace Solana
{

// TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA
const Core::PublicKey & spl_token_program_id( );

// TokenzQdBNbLqP5VEhdkAS6EPFLC1PHnBqCXEpPxuEb
const Core::PublicKey & token_2022_program_id( );

// Authority and supply state of a token mint, from either token program.
struct MintFacts
{
    // Length of the base mint record shared by both token programs.
    static constexpr size_t size( ) { return 82; }

    bool operator==( const MintFacts & ) const = default;

    std::optional< Core::PublicKey > mintAuthority;
    uint64_t supply = 0;
    uint8_t decimals = 0;
    bool isInitialized = false;
    /// Optional authority to freeze token accounts.
    std::optional< Core::PublicKey > freezeAuthority;

    // Set when decoded from a Token-2022 account.
    bool isToken2022 = false;
    // Metadata record address carried by the metadata account extension.
    std::optional< Core::PublicKey > metadataPointer;
    // First byte of the update authority extension, if the mint carries one.
    std::optional< bool > updateAuthorityPresent;
    bool foundExtension = false;
    // Decoding stopped at a truncated or overrunning field.
    bool parseFail = false;
};

std::ostream & operator <<( std::ostream & os, const MintFacts & facts );

// Reads the 82-byte base mint layout at the cursor, std::nullopt if the buffer is too short.
std::optional< MintFacts > read_base_mint( ByteCursor & cursor );

// Decodes a legacy SPL Token mint, std::nullopt unless data is exactly 82 bytes.
std::optional< MintFacts > decode_legacy_mint( std::span< const std::byte > data );

} // namespace Solana
} // namespace Mintguard
