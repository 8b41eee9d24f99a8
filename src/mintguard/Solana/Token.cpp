#include "mintguard/Solana/Token.hpp"

#include <fmt/format.h>

namespace Mintguard
{
namespace Solana
{

namespace
{

// COption< Pubkey >: a u32 tag followed by a key slot that is always present.
std::optional< std::optional< Core::PublicKey > > read_authority_option( ByteCursor & cursor )
{
    auto tag = cursor.read_u32( );
    auto key = cursor.read_public_key( );
    if ( !tag || !key )
    {
        return std::nullopt;
    }

    return *tag == 1 ? std::optional< Core::PublicKey >( *key ) : std::nullopt;
}

} // namespace

const Core::PublicKey & spl_token_program_id( )
{
    static const auto programId = Core::PublicKey::from_base58( "TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA" );
    return programId;
}

const Core::PublicKey & token_2022_program_id( )
{
    static const auto programId = Core::PublicKey::from_base58( "TokenzQdBNbLqP5VEhdkAS6EPFLC1PHnBqCXEpPxuEb" );
    return programId;
}

std::ostream & operator <<( std::ostream & os, const MintFacts & facts )
{
    return os
        << fmt::format
        (
            "supply: {}, decimals: {:d}, initialized: {}, mint authority: {}, freeze authority: {}, token-2022: {}",
            facts.supply,
            facts.decimals,
            facts.isInitialized,
            facts.mintAuthority ? facts.mintAuthority->enc_base58_text( ) : "none",
            facts.freezeAuthority ? facts.freezeAuthority->enc_base58_text( ) : "none",
            facts.isToken2022
        );
}

std::optional< MintFacts > read_base_mint( ByteCursor & cursor )
{
    if ( cursor.remaining( ) < MintFacts::size( ) )
    {
        return std::nullopt;
    }

    MintFacts facts;

    auto mintAuthority = read_authority_option( cursor );
    auto supply = cursor.read_u64( );
    auto decimals = cursor.read_u8( );
    auto isInitialized = cursor.read_u8( );
    auto freezeAuthority = read_authority_option( cursor );
    if ( !mintAuthority || !supply || !decimals || !isInitialized || !freezeAuthority )
    {
        return std::nullopt;
    }

    facts.mintAuthority = *mintAuthority;
    facts.supply = *supply;
    facts.decimals = *decimals;
    facts.isInitialized = *isInitialized != 0;
    facts.freezeAuthority = *freezeAuthority;

    return facts;
}

std::optional< MintFacts > decode_legacy_mint( std::span< const std::byte > data )
{
    if ( data.size( ) != MintFacts::size( ) )
    {
        return std::nullopt;
    }

    ByteCursor cursor( data );
    return read_base_mint( cursor );
}

} // namespace Solana
} // namespace Mintguard
