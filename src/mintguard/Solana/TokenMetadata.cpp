#include "mintguard/Solana/TokenMetadata.hpp"

#include "mintguard/Core/ProgramAddress.hpp"
#include "mintguard/Solana/ByteCursor.hpp"

#include <array>

namespace Mintguard
{
namespace Solana
{

namespace
{

// Skips a u32 length-prefixed string.
bool skip_string( ByteCursor & cursor )
{
    auto length = cursor.read_u32( );
    return length && cursor.skip( *length );
}

} // namespace

const Core::PublicKey & token_metadata_program_id( )
{
    static const auto programId = Core::PublicKey::from_base58( "metaqbxxUerdq28cj1RbAWkYQm3ybzjb6a8bt518x1s" );
    return programId;
}

std::optional< MetadataAccount > decode_metadata_account( std::span< const std::byte > data )
{
    if ( data.size( ) < MetadataAccount::min_size( ) )
    {
        return std::nullopt;
    }

    ByteCursor cursor( data );

    auto key = cursor.read_u8( );
    if ( !key || *key != static_cast< uint8_t >( MetadataKey::MetadataV1 ) )
    {
        return std::nullopt;
    }

    MetadataAccount metadata;

    auto updateAuthority = cursor.read_public_key( );
    auto mint = cursor.read_public_key( );
    if ( !updateAuthority || !mint )
    {
        return std::nullopt;
    }
    metadata.updateAuthority = *updateAuthority;
    metadata.mint = *mint;

    // name, symbol, uri
    for ( int field = 0; field < 3; ++field )
    {
        if ( !skip_string( cursor ) )
        {
            return std::nullopt;
        }
    }

    // Seller fee basis points.
    if ( !cursor.skip( sizeof( uint16_t ) ) )
    {
        return std::nullopt;
    }

    auto hasCreators = cursor.read_u8( );
    if ( !hasCreators )
    {
        return std::nullopt;
    }
    if ( *hasCreators != 0 )
    {
        auto creatorCount = cursor.read_u32( );
        if ( !creatorCount )
        {
            return std::nullopt;
        }
        // 64-bit product cannot wrap for a u32 count.
        uint64_t creatorBytes = static_cast< uint64_t >( *creatorCount ) * MetadataAccount::creator_size( );
        if ( creatorBytes > cursor.remaining( ) || !cursor.skip( static_cast< size_t >( creatorBytes ) ) )
        {
            return std::nullopt;
        }
    }

    auto primarySaleHappened = cursor.read_u8( );
    auto isMutable = cursor.read_u8( );
    if ( !primarySaleHappened || !isMutable )
    {
        return std::nullopt;
    }
    metadata.primarySaleHappened = *primarySaleHappened != 0;
    metadata.isMutable = *isMutable != 0;

    return metadata;
}

std::optional< bool > decode_metadata_mutability( std::span< const std::byte > data )
{
    auto metadata = decode_metadata_account( data );
    if ( !metadata )
    {
        return std::nullopt;
    }
    return metadata->isMutable;
}

std::optional< std::pair< Core::PublicKey, uint8_t > > find_metadata_address( const Core::PublicKey & mint )
{
    constexpr std::array< char, 8 > prefix = { 'm', 'e', 't', 'a', 'd', 'a', 't', 'a' };

    const auto & programId = token_metadata_program_id( );
    const std::array< Core::Seed, 3 > seeds =
    {
        Core::Seed( reinterpret_cast< const std::byte * >( prefix.data( ) ), prefix.size( ) ),
        Core::Seed( programId.data( ) ),
        Core::Seed( mint.data( ) )
    };

    return Core::find_program_address( seeds, programId );
}

} // namespace Solana
} // namespace Mintguard
