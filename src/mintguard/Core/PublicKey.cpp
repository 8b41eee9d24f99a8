#include "mintguard/Core/PublicKey.hpp"

#include "mintguard/Util/StringEncode.hpp"
#include "mintguard/Util/Utils.hpp"

#include <algorithm>

namespace Mintguard
{
namespace Core
{

// Hash

bool Hash::is_zero( ) const
{
    return std::find_if( _hash.begin( ), _hash.end( ), [ ]( std::byte value ){ return value != std::byte{ 0x00 }; } ) == _hash.end( );
}

bool Hash::init_from_base58( std::string_view text )
{
    auto result = dec_base58( text );
    if ( !result || result->size( ) != Hash::size )
    {
        return false;
    }

    std::copy( result->begin( ), result->end( ), _hash.begin( ) );
    return true;
}

std::string Hash::enc_base58_text( ) const
{
    return enc_base58( _hash );
}

std::ostream & operator <<( std::ostream & o, const Hash & binaryHash )
{
    return o << binaryHash.enc_base58_text( );
}

// PublicKey

PublicKey PublicKey::from_base58( std::string_view text )
{
    PublicKey key;
    if ( !key.init_from_base58( text ) )
    {
        throw MintguardError( fmt::format( "Invalid base58 public key: '{}'", text ) );
    }
    return key;
}

std::optional< PublicKey > PublicKey::from_bytes( std::span< const std::byte > bytes )
{
    if ( bytes.size( ) != PublicKey::size )
    {
        return std::nullopt;
    }

    PublicKey key;
    std::copy( bytes.begin( ), bytes.end( ), key._hash.begin( ) );
    return key;
}

} // namespace Core
} // namespace Mintguard
