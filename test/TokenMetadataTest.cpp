#include "mintguard/Solana/TokenMetadata.hpp"

#include "TestAccounts.hpp"

#include <gtest/gtest.h>

using namespace Mintguard;
using Solana::MetadataAccount;

namespace
{

// Offset of the uri length field in a record built by Testing::metadata_record.
size_t uri_length_offset( )
{
    return MetadataAccount::prefix_size( ) + ( 4 + std::string( "Test Token" ).size( ) ) + ( 4 + std::string( "TEST" ).size( ) );
}

} // namespace

TEST( MetadataAccount, DecodesMutability )
{
    auto mint = Testing::key_of( 0x33 );

    auto metadata = Solana::decode_metadata_account( Testing::metadata_record( true, mint ) );
    ASSERT_TRUE( metadata );
    EXPECT_TRUE( metadata->isMutable );
    EXPECT_TRUE( metadata->primarySaleHappened );
    EXPECT_EQ( metadata->mint, mint );
    EXPECT_EQ( metadata->updateAuthority, Testing::key_of( 0xaa ) );

    EXPECT_EQ( Solana::decode_metadata_mutability( Testing::metadata_record( false, mint ) ), false );
    EXPECT_EQ( Solana::decode_metadata_mutability( Testing::metadata_record( true, mint ) ), true );
}

TEST( MetadataAccount, SkipsCreators )
{
    auto mint = Testing::key_of( 0x33 );

    EXPECT_EQ( Solana::decode_metadata_mutability( Testing::metadata_record( false, mint, 1 ) ), false );
    EXPECT_EQ( Solana::decode_metadata_mutability( Testing::metadata_record( true, mint, 3 ) ), true );
}

TEST( MetadataAccount, IgnoresTrailingBytes )
{
    auto data = Testing::metadata_record( false, Testing::key_of( 0x33 ) );
    // Edition nonce, token standard and collection fields follow the mutability flag.
    data.resize( 679, std::byte{ 0 } );

    EXPECT_EQ( Solana::decode_metadata_mutability( data ), false );
}

TEST( MetadataAccount, ShortBufferIsRejected )
{
    auto data = Testing::metadata_record( true, Testing::key_of( 0x33 ) );

    EXPECT_FALSE( Solana::decode_metadata_mutability( { } ) );
    EXPECT_FALSE( Solana::decode_metadata_mutability( std::span( data ).first( MetadataAccount::min_size( ) - 1 ) ) );

    for ( size_t length = MetadataAccount::min_size( ); length < data.size( ); ++length )
    {
        std::vector< std::byte > truncated( data.begin( ), data.begin( ) + static_cast< std::ptrdiff_t >( length ) );
        EXPECT_FALSE( Solana::decode_metadata_mutability( truncated ) ) << "length " << length;
    }
}

TEST( MetadataAccount, OverrunningUriLengthIsRejected )
{
    auto data = Testing::metadata_record( false, Testing::key_of( 0x33 ) );

    const auto offset = uri_length_offset( );
    const uint32_t remaining = static_cast< uint32_t >( data.size( ) - offset - 4 );
    for ( uint32_t length : { remaining + 1, 0x7fffffffu, 0xffffffffu } )
    {
        auto corrupt = data;
        for ( int i = 0; i < 4; ++i )
        {
            corrupt[ offset + i ] = static_cast< std::byte >( length >> ( 8 * i ) );
        }
        EXPECT_FALSE( Solana::decode_metadata_mutability( corrupt ) ) << "uri length " << length;
    }
}

TEST( MetadataAccount, OverrunningCreatorCountIsRejected )
{
    auto data = Testing::metadata_record( true, Testing::key_of( 0x33 ), 2 );

    // Creator count sits after the uri, the fee and the has-creators flag.
    const auto offset = uri_length_offset( ) + 4 + std::string( "https://arweave.net/metadata.json" ).size( ) + 2 + 1;
    for ( uint32_t count : { 3u, 0x10000000u, 0xffffffffu } )
    {
        auto corrupt = data;
        for ( int i = 0; i < 4; ++i )
        {
            corrupt[ offset + i ] = static_cast< std::byte >( count >> ( 8 * i ) );
        }
        EXPECT_FALSE( Solana::decode_metadata_mutability( corrupt ) ) << "creator count " << count;
    }
}

TEST( MetadataAccount, WrongKeyIsRejected )
{
    auto data = Testing::metadata_record( true, Testing::key_of( 0x33 ) );

    for ( auto key : { Solana::MetadataKey::Uninitialized, Solana::MetadataKey::EditionV1, Solana::MetadataKey::MasterEditionV1 } )
    {
        data[ 0 ] = static_cast< std::byte >( key );
        EXPECT_FALSE( Solana::decode_metadata_account( data ) );
    }
}

TEST( MetadataAccount, ProgramId )
{
    EXPECT_EQ( Solana::token_metadata_program_id( ).enc_base58_text( ), "metaqbxxUerdq28cj1RbAWkYQm3ybzjb6a8bt518x1s" );
    EXPECT_EQ( Solana::token_metadata_program_id( ).data( )[ 0 ], std::byte{ 0x0b } );
}
