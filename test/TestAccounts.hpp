#pragma once

#include "mintguard/Core/PublicKey.hpp"
#include "mintguard/Security/AccountFetcher.hpp"
#include "mintguard/Solana/Token.hpp"
#include "mintguard/Solana/TokenMetadata.hpp"
#include "mintguard/Util/Utils.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// Builders for synthetic mint and metadata accounts.

namespace Mintguard
{
namespace Testing
{

inline Core::PublicKey key_of( uint8_t fill )
{
    std::array< std::byte, Core::PublicKey::size > bytes;
    bytes.fill( static_cast< std::byte >( fill ) );
    return Core::PublicKey( bytes );
}

inline void put_u8( std::vector< std::byte > & buffer, uint8_t value )
{
    buffer.push_back( static_cast< std::byte >( value ) );
}

inline void put_u16( std::vector< std::byte > & buffer, uint16_t value )
{
    for ( int i = 0; i < 2; ++i )
    {
        put_u8( buffer, static_cast< uint8_t >( value >> ( 8 * i ) ) );
    }
}

inline void put_u32( std::vector< std::byte > & buffer, uint32_t value )
{
    for ( int i = 0; i < 4; ++i )
    {
        put_u8( buffer, static_cast< uint8_t >( value >> ( 8 * i ) ) );
    }
}

inline void put_u64( std::vector< std::byte > & buffer, uint64_t value )
{
    for ( int i = 0; i < 8; ++i )
    {
        put_u8( buffer, static_cast< uint8_t >( value >> ( 8 * i ) ) );
    }
}

inline void put_key( std::vector< std::byte > & buffer, const Core::PublicKey & key )
{
    buffer.insert( buffer.end( ), key.data( ).begin( ), key.data( ).end( ) );
}

inline void put_string( std::vector< std::byte > & buffer, const std::string & text )
{
    put_u32( buffer, static_cast< uint32_t >( text.size( ) ) );
    for ( char c : text )
    {
        put_u8( buffer, static_cast< uint8_t >( c ) );
    }
}

class MintBuilder
{
public:
    MintBuilder & mint_authority( const Core::PublicKey & key ) { _mintAuthority = key; return *this; }
    MintBuilder & freeze_authority( const Core::PublicKey & key ) { _freezeAuthority = key; return *this; }
    MintBuilder & supply( uint64_t supply ) { _supply = supply; return *this; }
    MintBuilder & decimals( uint8_t decimals ) { _decimals = decimals; return *this; }
    MintBuilder & account_type( uint8_t accountType ) { _accountType = accountType; return *this; }

    MintBuilder & extension( uint16_t type, std::vector< std::byte > payload )
    {
        _extensions.emplace_back( type, std::move( payload ) );
        return *this;
    }

    // 82-byte base mint.
    std::vector< std::byte > legacy( ) const
    {
        std::vector< std::byte > buffer;
        put_u32( buffer, _mintAuthority ? 1 : 0 );
        put_key( buffer, _mintAuthority.value_or( Core::PublicKey( ) ) );
        put_u64( buffer, _supply );
        put_u8( buffer, _decimals );
        put_u8( buffer, 1 );
        put_u32( buffer, _freezeAuthority ? 1 : 0 );
        put_key( buffer, _freezeAuthority.value_or( Core::PublicKey( ) ) );
        return buffer;
    }

    // Base mint, padding to the account type byte, then the extension chain.
    std::vector< std::byte > token2022( ) const
    {
        auto buffer = legacy( );
        buffer.resize( 165, std::byte{ 0 } );
        put_u8( buffer, _accountType );
        for ( const auto & [ type, payload ] : _extensions )
        {
            put_u16( buffer, type );
            put_u16( buffer, static_cast< uint16_t >( payload.size( ) ) );
            buffer.insert( buffer.end( ), payload.begin( ), payload.end( ) );
        }
        return buffer;
    }

private:
    std::optional< Core::PublicKey > _mintAuthority;
    std::optional< Core::PublicKey > _freezeAuthority;
    uint64_t _supply = 0;
    uint8_t _decimals = 0;
    uint8_t _accountType = 1;
    std::vector< std::pair< uint16_t, std::vector< std::byte > > > _extensions;
};

inline std::vector< std::byte > key_payload( const Core::PublicKey & key )
{
    return std::vector< std::byte >( key.data( ).begin( ), key.data( ).end( ) );
}

inline std::vector< std::byte > metadata_record
(
    bool isMutable,
    const Core::PublicKey & mint,
    uint32_t creatorCount = 0,
    const std::string & uri = "https://arweave.net/metadata.json"
)
{
    std::vector< std::byte > buffer;
    put_u8( buffer, static_cast< uint8_t >( Solana::MetadataKey::MetadataV1 ) );
    put_key( buffer, key_of( 0xaa ) );
    put_key( buffer, mint );
    put_string( buffer, "Test Token" );
    put_string( buffer, "TEST" );
    put_string( buffer, uri );
    put_u16( buffer, 500 );
    put_u8( buffer, creatorCount > 0 ? 1 : 0 );
    if ( creatorCount > 0 )
    {
        put_u32( buffer, creatorCount );
        for ( uint32_t i = 0; i < creatorCount; ++i )
        {
            put_key( buffer, key_of( static_cast< uint8_t >( 0x10 + i ) ) );
            put_u8( buffer, 1 );
            put_u8( buffer, static_cast< uint8_t >( 100 / creatorCount ) );
        }
    }
    put_u8( buffer, 1 );
    put_u8( buffer, isMutable ? 1 : 0 );
    return buffer;
}

inline Solana::AccountInfo account_of( const Core::PublicKey & owner, std::vector< std::byte > data )
{
    Solana::AccountInfo account;
    account.lamports = 1461600;
    account.owner = owner;
    account.data = std::move( data );
    return account;
}

// In-memory fetcher. Addresses marked failing throw MintguardError.
class FakeAccountFetcher : public Security::AccountFetcher
{
public:
    void add( const Core::PublicKey & address, Solana::AccountInfo account )
    {
        _accounts.insert_or_assign( address, std::move( account ) );
    }

    void fail( const Core::PublicKey & address ) { _failing.insert( address.enc_base58_text( ) ); }

    std::optional< Solana::AccountInfo > fetch_account( const Core::PublicKey & address ) override
    {
        ++_fetchCount;
        if ( _failing.contains( address.enc_base58_text( ) ) )
        {
            throw MintguardError( "node unavailable" );
        }

        auto findAccount = _accounts.find( address );
        if ( findAccount == _accounts.end( ) )
        {
            return std::nullopt;
        }
        return findAccount->second;
    }

    size_t fetch_count( ) const { return _fetchCount; }

private:
    std::unordered_map< Core::PublicKey, Solana::AccountInfo > _accounts;
    std::set< std::string > _failing;
    size_t _fetchCount = 0;
};

} // namespace Testing
} // namespace Mintguard
