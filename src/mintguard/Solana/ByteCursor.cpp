#include "mintguard/Solana/ByteCursor.hpp"

#include <boost/endian/conversion.hpp>

namespace Mintguard
{
namespace Solana
{

namespace
{

const unsigned char * as_uchar( std::span< const std::byte > bytes )
{
    return reinterpret_cast< const unsigned char * >( bytes.data( ) );
}

} // namespace

std::optional< std::span< const std::byte > > ByteCursor::read_bytes( size_t count )
{
    if ( count > remaining( ) )
    {
        return std::nullopt;
    }

    auto bytes = _data.subspan( _offset, count );
    _offset += count;
    return bytes;
}

bool ByteCursor::skip( size_t count )
{
    return read_bytes( count ).has_value( );
}

std::optional< uint8_t > ByteCursor::read_u8( )
{
    auto bytes = read_bytes( sizeof( uint8_t ) );
    if ( !bytes )
    {
        return std::nullopt;
    }
    return static_cast< uint8_t >( ( *bytes )[ 0 ] );
}

std::optional< uint16_t > ByteCursor::read_u16( )
{
    auto bytes = read_bytes( sizeof( uint16_t ) );
    if ( !bytes )
    {
        return std::nullopt;
    }
    return boost::endian::load_little_u16( as_uchar( *bytes ) );
}

std::optional< uint32_t > ByteCursor::read_u32( )
{
    auto bytes = read_bytes( sizeof( uint32_t ) );
    if ( !bytes )
    {
        return std::nullopt;
    }
    return boost::endian::load_little_u32( as_uchar( *bytes ) );
}

std::optional< uint64_t > ByteCursor::read_u64( )
{
    auto bytes = read_bytes( sizeof( uint64_t ) );
    if ( !bytes )
    {
        return std::nullopt;
    }
    return boost::endian::load_little_u64( as_uchar( *bytes ) );
}

std::optional< Core::PublicKey > ByteCursor::read_public_key( )
{
    auto bytes = read_bytes( Core::PublicKey::size );
    if ( !bytes )
    {
        return std::nullopt;
    }
    return Core::PublicKey::from_bytes( *bytes );
}

} // namespace Solana
} // namespace Mintguard
