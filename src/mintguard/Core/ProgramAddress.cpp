#include "mintguard/Core/ProgramAddress.hpp"

#include <boost/multiprecision/cpp_int.hpp>

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <functional>
#include <iterator>
#include <memory>
#include <vector>

namespace Mintguard
{
namespace Core
{

namespace
{

using boost::multiprecision::cpp_int;

// 2^255 - 19
const cpp_int & field_prime( )
{
    static const cpp_int prime = ( cpp_int( 1 ) << 255 ) - 19;
    return prime;
}

// -121665 / 121666 mod p
const cpp_int & edwards_d( )
{
    static const cpp_int d( "37095705934669439343138083508754565189542113879843219016388785533085940283555" );
    return d;
}

constexpr std::array< char, 21 > pda_marker( )
{
    return { 'P','r','o','g','r','a','m','D','e','r','i','v','e','d','A','d','d','r','e','s','s' };
}

bool sha256_digest( const std::vector< std::byte > & buffer, std::array< std::byte, Hash::size > & result )
{
    std::unique_ptr< EVP_MD_CTX, std::function< void( EVP_MD_CTX * ) > > mctx
    (
        EVP_MD_CTX_new( ),
        [ ]( EVP_MD_CTX * context ) { EVP_MD_CTX_free( context ); }
    );

    if ( !mctx || !EVP_DigestInit_ex( mctx.get( ), EVP_sha256( ), NULL ) )
    {
        return false;
    }

    if ( !EVP_DigestUpdate( mctx.get( ), buffer.data( ), buffer.size( ) ) )
    {
        return false;
    }

    unsigned int digestSize = 0;
    return EVP_DigestFinal_ex( mctx.get( ), reinterpret_cast< unsigned char * >( result.data( ) ), &digestSize ) && digestSize == Hash::size;
}

} // namespace

bool is_on_curve( const PublicKey & key )
{
    const cpp_int & p = field_prime( );

    // Little-endian y coordinate, the top bit carries the sign of x.
    cpp_int y = 0;
    for ( size_t i = Hash::size; i-- > 0; )
    {
        auto byte = static_cast< uint8_t >( key.data( )[ i ] );
        if ( i == Hash::size - 1 )
        {
            byte &= 0x7f;
        }
        y <<= 8;
        y |= byte;
    }
    y %= p;

    // x^2 = ( y^2 - 1 ) / ( d * y^2 + 1 ), the point exists iff x^2 is a square.
    cpp_int ySquared = ( y * y ) % p;
    cpp_int u = ( ySquared + p - 1 ) % p;
    cpp_int v = ( edwards_d( ) * ySquared + 1 ) % p;
    if ( v == 0 )
    {
        return u == 0;
    }

    cpp_int inverseExponent = p - 2;
    cpp_int vInverse = boost::multiprecision::powm( v, inverseExponent, p );
    cpp_int xSquared = ( u * vInverse ) % p;
    if ( xSquared == 0 )
    {
        return true;
    }

    cpp_int eulerExponent = ( p - 1 ) / 2;
    cpp_int legendre = boost::multiprecision::powm( xSquared, eulerExponent, p );
    return legendre == 1;
}

std::optional< PublicKey > create_program_address( std::span< const Seed > seeds, const PublicKey & programId )
{
    if ( seeds.size( ) > max_seeds( ) )
    {
        return std::nullopt;
    }

    std::vector< std::byte > buffer;
    for ( const auto & seed : seeds )
    {
        if ( seed.size( ) > max_seed_length( ) )
        {
            return std::nullopt;
        }
        buffer.insert( buffer.end( ), seed.begin( ), seed.end( ) );
    }
    buffer.insert( buffer.end( ), programId.data( ).begin( ), programId.data( ).end( ) );

    constexpr auto marker = pda_marker( );
    std::transform( marker.begin( ), marker.end( ), std::back_inserter( buffer ), [ ]( char c ) { return static_cast< std::byte >( c ); } );

    std::array< std::byte, Hash::size > digest;
    if ( !sha256_digest( buffer, digest ) )
    {
        return std::nullopt;
    }

    PublicKey address( digest );
    if ( is_on_curve( address ) )
    {
        return std::nullopt;
    }
    return address;
}

std::optional< std::pair< PublicKey, uint8_t > > find_program_address( std::span< const Seed > seeds, const PublicKey & programId )
{
    std::vector< Seed > bumpedSeeds( seeds.begin( ), seeds.end( ) );
    std::array< std::byte, 1 > bump;
    bumpedSeeds.push_back( bump );

    for ( int bumpSeed = 255; bumpSeed >= 0; --bumpSeed )
    {
        bump[ 0 ] = static_cast< std::byte >( bumpSeed );
        if ( auto address = create_program_address( bumpedSeeds, programId ) )
        {
            return std::make_pair( *address, static_cast< uint8_t >( bumpSeed ) );
        }
    }

    return std::nullopt;
}

} // namespace Core
} // namespace Mintguard
