#include "mintguard/Util/StringEncode.hpp"

#include <array>
#include <cstdint>

namespace Mintguard
{

namespace
{

constexpr std::string_view base58_alphabet( )
{
    return "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";
}

constexpr std::string_view base64_alphabet( )
{
    return "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
}

template< size_t AlphabetSize >
constexpr std::array< int8_t, 256 > make_reverse_map( std::string_view alphabet )
{
    std::array< int8_t, 256 > map{ };
    map.fill( -1 );
    for ( size_t i = 0; i < AlphabetSize; ++i )
    {
        map[ static_cast< uint8_t >( alphabet[ i ] ) ] = static_cast< int8_t >( i );
    }
    return map;
}

constexpr auto BASE58_MAP = make_reverse_map< 58 >( base58_alphabet( ) );
constexpr auto BASE64_MAP = make_reverse_map< 64 >( base64_alphabet( ) );

} // namespace

std::string enc_base58( std::span< const std::byte > source )
{
    size_t zeros = 0;
    while ( zeros < source.size( ) && source[ zeros ] == std::byte{ 0 } )
    {
        ++zeros;
    }

    // log(256) / log(58), rounded up.
    std::vector< uint8_t > digits( ( source.size( ) - zeros ) * 138 / 100 + 1 );
    size_t length = 0;
    for ( size_t i = zeros; i < source.size( ); ++i )
    {
        uint32_t carry = static_cast< uint32_t >( source[ i ] );
        size_t j = 0;
        for ( auto it = digits.rbegin( ); ( carry != 0 || j < length ) && it != digits.rend( ); ++it, ++j )
        {
            carry += 256U * *it;
            *it = static_cast< uint8_t >( carry % 58 );
            carry /= 58;
        }
        length = j;
    }

    auto it = digits.begin( ) + static_cast< std::ptrdiff_t >( digits.size( ) - length );
    while ( it != digits.end( ) && *it == 0 )
    {
        ++it;
    }

    std::string result( zeros, '1' );
    result.reserve( zeros + static_cast< size_t >( digits.end( ) - it ) );
    for ( ; it != digits.end( ); ++it )
    {
        result.push_back( base58_alphabet( )[ *it ] );
    }
    return result;
}

std::optional< std::vector< std::byte > > dec_base58( std::string_view text )
{
    size_t zeros = 0;
    while ( zeros < text.size( ) && text[ zeros ] == '1' )
    {
        ++zeros;
    }

    // log(58) / log(256), rounded up.
    std::vector< uint8_t > bytes( ( text.size( ) - zeros ) * 733 / 1000 + 1 );
    size_t length = 0;
    for ( size_t i = zeros; i < text.size( ); ++i )
    {
        auto digit = BASE58_MAP[ static_cast< uint8_t >( text[ i ] ) ];
        if ( digit < 0 )
        {
            return std::nullopt;
        }

        uint32_t carry = static_cast< uint32_t >( digit );
        size_t j = 0;
        for ( auto it = bytes.rbegin( ); ( carry != 0 || j < length ) && it != bytes.rend( ); ++it, ++j )
        {
            carry += 58U * *it;
            *it = static_cast< uint8_t >( carry & 0xff );
            carry >>= 8;
        }
        length = j;
    }

    auto it = bytes.begin( ) + static_cast< std::ptrdiff_t >( bytes.size( ) - length );
    while ( it != bytes.end( ) && *it == 0 )
    {
        ++it;
    }

    std::vector< std::byte > result( zeros, std::byte{ 0 } );
    result.reserve( zeros + static_cast< size_t >( bytes.end( ) - it ) );
    for ( ; it != bytes.end( ); ++it )
    {
        result.push_back( static_cast< std::byte >( *it ) );
    }
    return result;
}

std::string enc_base64( std::span< const std::byte > source )
{
    std::string result;
    result.reserve( ( source.size( ) + 2 ) / 3 * 4 );

    size_t i = 0;
    for ( ; i + 3 <= source.size( ); i += 3 )
    {
        uint32_t triple = ( static_cast< uint32_t >( source[ i ] ) << 16 )
            | ( static_cast< uint32_t >( source[ i + 1 ] ) << 8 )
            | static_cast< uint32_t >( source[ i + 2 ] );
        result.push_back( base64_alphabet( )[ ( triple >> 18 ) & 0x3f ] );
        result.push_back( base64_alphabet( )[ ( triple >> 12 ) & 0x3f ] );
        result.push_back( base64_alphabet( )[ ( triple >> 6 ) & 0x3f ] );
        result.push_back( base64_alphabet( )[ triple & 0x3f ] );
    }

    size_t remaining = source.size( ) - i;
    if ( remaining > 0 )
    {
        uint32_t triple = static_cast< uint32_t >( source[ i ] ) << 16;
        if ( remaining == 2 )
        {
            triple |= static_cast< uint32_t >( source[ i + 1 ] ) << 8;
        }
        result.push_back( base64_alphabet( )[ ( triple >> 18 ) & 0x3f ] );
        result.push_back( base64_alphabet( )[ ( triple >> 12 ) & 0x3f ] );
        result.push_back( remaining == 2 ? base64_alphabet( )[ ( triple >> 6 ) & 0x3f ] : '=' );
        result.push_back( '=' );
    }

    return result;
}

std::optional< std::vector< std::byte > > dec_base64( std::string_view text )
{
    size_t padding = 0;
    while ( padding < 2 && padding < text.size( ) && text[ text.size( ) - 1 - padding ] == '=' )
    {
        ++padding;
    }
    std::string_view symbols = text.substr( 0, text.size( ) - padding );
    if ( padding > 0 && text.size( ) % 4 != 0 )
    {
        return std::nullopt;
    }
    if ( symbols.size( ) % 4 == 1 )
    {
        return std::nullopt;
    }

    std::vector< std::byte > result;
    result.reserve( symbols.size( ) * 3 / 4 );

    uint32_t accumulator = 0;
    int bits = 0;
    for ( char symbol : symbols )
    {
        auto value = BASE64_MAP[ static_cast< uint8_t >( symbol ) ];
        if ( value < 0 )
        {
            return std::nullopt;
        }
        accumulator = ( accumulator << 6 ) | static_cast< uint32_t >( value );
        bits += 6;
        if ( bits >= 8 )
        {
            bits -= 8;
            result.push_back( static_cast< std::byte >( ( accumulator >> bits ) & 0xff ) );
        }
    }

    return result;
}

} // namespace Mintguard
