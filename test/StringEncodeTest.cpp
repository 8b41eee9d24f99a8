#include "mintguard/Util/StringEncode.hpp"

#include "mintguard/Core/PublicKey.hpp"
#include "mintguard/Util/Utils.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace Mintguard;

namespace
{

std::vector< std::byte > bytes_of( std::string_view text )
{
    std::vector< std::byte > result;
    for ( char c : text )
    {
        result.push_back( static_cast< std::byte >( c ) );
    }
    return result;
}

} // namespace

TEST( Base58, Encode )
{
    EXPECT_EQ( enc_base58( { } ), "" );
    EXPECT_EQ( enc_base58( bytes_of( "Hello World" ) ), "JxF12TrwUP45BMd" );

    std::vector< std::byte > leadingZeros = { std::byte{ 0 }, std::byte{ 0 }, std::byte{ 0 }, std::byte{ 1 } };
    EXPECT_EQ( enc_base58( leadingZeros ), "1112" );
}

TEST( Base58, Decode )
{
    auto decoded = dec_base58( "JxF12TrwUP45BMd" );
    ASSERT_TRUE( decoded );
    EXPECT_EQ( *decoded, bytes_of( "Hello World" ) );

    auto zeros = dec_base58( "1112" );
    ASSERT_TRUE( zeros );
    ASSERT_EQ( zeros->size( ), 4u );
    EXPECT_EQ( ( *zeros )[ 0 ], std::byte{ 0 } );
    EXPECT_EQ( ( *zeros )[ 3 ], std::byte{ 1 } );
}

TEST( Base58, RejectsCharactersOutsideAlphabet )
{
    EXPECT_FALSE( dec_base58( "0OIl" ) );
    EXPECT_FALSE( dec_base58( "Tokenkeg+" ) );
}

TEST( Base58, SystemProgramIsAllZeroKey )
{
    Core::PublicKey key;
    ASSERT_TRUE( key.init_from_base58( "11111111111111111111111111111111" ) );
    EXPECT_TRUE( key.is_zero( ) );
    EXPECT_EQ( key.enc_base58_text( ), "11111111111111111111111111111111" );
}

TEST( Base64, Encode )
{
    EXPECT_EQ( enc_base64( bytes_of( "" ) ), "" );
    EXPECT_EQ( enc_base64( bytes_of( "f" ) ), "Zg==" );
    EXPECT_EQ( enc_base64( bytes_of( "fo" ) ), "Zm8=" );
    EXPECT_EQ( enc_base64( bytes_of( "foo" ) ), "Zm9v" );
    EXPECT_EQ( enc_base64( bytes_of( "foobar" ) ), "Zm9vYmFy" );
}

TEST( Base64, Decode )
{
    EXPECT_EQ( dec_base64( "Zg==" ), bytes_of( "f" ) );
    EXPECT_EQ( dec_base64( "Zm8=" ), bytes_of( "fo" ) );
    EXPECT_EQ( dec_base64( "Zm9vYmFy" ), bytes_of( "foobar" ) );
    EXPECT_EQ( dec_base64( "" ), bytes_of( "" ) );
}

TEST( Base64, RejectsMalformedInput )
{
    EXPECT_FALSE( dec_base64( "Zm9v!" ) );
    EXPECT_FALSE( dec_base64( "Zg=" ) );
    EXPECT_FALSE( dec_base64( "Z" ) );
}

TEST( PublicKey, FromBase58 )
{
    auto key = Core::PublicKey::from_base58( "TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA" );
    EXPECT_EQ( key.data( )[ 0 ], std::byte{ 0x06 } );
    EXPECT_EQ( key.data( )[ 31 ], std::byte{ 0xa9 } );
    EXPECT_EQ( fmt::format( "{}", key ), "TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA" );

    EXPECT_THROW( Core::PublicKey::from_base58( "not a key" ), MintguardError );
    // Valid base58 but not 32 bytes.
    EXPECT_THROW( Core::PublicKey::from_base58( "JxF12TrwUP45BMd" ), MintguardError );
}

TEST( PublicKey, FromBytes )
{
    std::vector< std::byte > bytes( Core::PublicKey::size, std::byte{ 7 } );
    auto key = Core::PublicKey::from_bytes( bytes );
    ASSERT_TRUE( key );
    EXPECT_EQ( key->data( )[ 5 ], std::byte{ 7 } );

    bytes.pop_back( );
    EXPECT_FALSE( Core::PublicKey::from_bytes( bytes ) );
}
