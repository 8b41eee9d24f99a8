#include "mintguard/Security/AccountSnapshot.hpp"

#include "mintguard/Security/MintInspector.hpp"
#include "mintguard/Util/StringEncode.hpp"

#include "TestAccounts.hpp"

#include <gtest/gtest.h>

#include <fmt/format.h>

#include <algorithm>
#include <filesystem>
#include <fstream>

using namespace Mintguard;
using namespace Mintguard::Security;

namespace
{

std::string account_json( const Core::PublicKey & owner, const std::string & data )
{
    return fmt::format
    (
        R"({{ "data": {}, "executable": false, "lamports": 1461600, "owner": "{}", "rentEpoch": 361 }})",
        data,
        owner.enc_base58_text( )
    );
}

std::string base64_data( std::span< const std::byte > bytes )
{
    return fmt::format( R"([ "{}", "base64" ])", enc_base64( bytes ) );
}

} // namespace

TEST( AccountSnapshot, ParsesAccounts )
{
    auto mint = Testing::key_of( 0x5a );
    auto missing = Testing::key_of( 0x5b );
    auto mintData = Testing::MintBuilder( ).supply( 1000 ).decimals( 2 ).legacy( );

    auto json = fmt::format
    (
        R"({{ "accounts": {{ "{}": {}, "{}": null }} }})",
        mint.enc_base58_text( ),
        account_json( Solana::spl_token_program_id( ), base64_data( mintData ) ),
        missing.enc_base58_text( )
    );

    auto snapshot = AccountSnapshot::parse( json );
    EXPECT_EQ( snapshot.size( ), 2u );

    auto account = snapshot.fetch_account( mint );
    ASSERT_TRUE( account );
    EXPECT_EQ( account->owner, Solana::spl_token_program_id( ) );
    EXPECT_EQ( account->lamports, 1461600u );
    EXPECT_FALSE( account->executable );
    EXPECT_EQ( account->data, mintData );

    EXPECT_FALSE( snapshot.fetch_account( missing ) );
    EXPECT_FALSE( snapshot.fetch_account( Testing::key_of( 0x5c ) ) );
}

TEST( AccountSnapshot, AcceptsBase58Data )
{
    auto address = Testing::key_of( 0x01 );
    std::vector< std::byte > data = { std::byte{ 1 }, std::byte{ 2 }, std::byte{ 3 } };

    auto plain = fmt::format
    (
        R"({{ "accounts": {{ "{}": {} }} }})",
        address.enc_base58_text( ),
        account_json( Testing::key_of( 0x02 ), fmt::format( R"("{}")", enc_base58( data ) ) )
    );
    EXPECT_EQ( AccountSnapshot::parse( plain ).fetch_account( address )->data, data );

    auto tagged = fmt::format
    (
        R"({{ "accounts": {{ "{}": {} }} }})",
        address.enc_base58_text( ),
        account_json( Testing::key_of( 0x02 ), fmt::format( R"([ "{}", "base58" ])", enc_base58( data ) ) )
    );
    EXPECT_EQ( AccountSnapshot::parse( tagged ).fetch_account( address )->data, data );
}

TEST( AccountSnapshot, TokenAccountsInAddressOrder )
{
    AccountSnapshot snapshot;
    auto legacy = Testing::key_of( 0x30 );
    auto extensible = Testing::key_of( 0x10 );
    auto metadata = Testing::key_of( 0x20 );

    snapshot.add_account( legacy, Testing::account_of( Solana::spl_token_program_id( ), Testing::MintBuilder( ).legacy( ) ) );
    snapshot.add_account( extensible, Testing::account_of( Solana::token_2022_program_id( ), Testing::MintBuilder( ).token2022( ) ) );
    snapshot.add_account( metadata, Testing::account_of( Solana::token_metadata_program_id( ), { } ) );
    snapshot.add_account( Testing::key_of( 0x40 ), std::nullopt );

    auto tokens = snapshot.token_accounts( );
    ASSERT_EQ( tokens.size( ), 2u );
    EXPECT_LT( tokens[ 0 ].enc_base58_text( ), tokens[ 1 ].enc_base58_text( ) );
    EXPECT_NE( std::find( tokens.begin( ), tokens.end( ), legacy ), tokens.end( ) );
    EXPECT_NE( std::find( tokens.begin( ), tokens.end( ), extensible ), tokens.end( ) );
}

TEST( AccountSnapshot, MalformedInputThrows )
{
    const auto address = Testing::key_of( 0x01 ).enc_base58_text( );
    const auto owner = Solana::spl_token_program_id( );

    // Not json.
    EXPECT_THROW( AccountSnapshot::parse( "accounts" ), MintguardError );
    // Missing "accounts".
    EXPECT_THROW( AccountSnapshot::parse( R"({ "mints": { } })" ), MintguardError );
    // Address is not a public key.
    EXPECT_THROW( AccountSnapshot::parse( R"({ "accounts": { "not-a-key": null } })" ), MintguardError );
    // Unsupported data encoding.
    EXPECT_THROW
    (
        AccountSnapshot::parse
        (
            fmt::format( R"({{ "accounts": {{ "{}": {} }} }})", address, account_json( owner, R"([ "AAAA", "base64+zstd" ])" ) )
        ),
        MintguardError
    );
    // Invalid base64.
    EXPECT_THROW
    (
        AccountSnapshot::parse
        (
            fmt::format( R"({{ "accounts": {{ "{}": {} }} }})", address, account_json( owner, R"([ "A!AA", "base64" ])" ) )
        ),
        MintguardError
    );
    // Invalid owner.
    EXPECT_THROW
    (
        AccountSnapshot::parse
        (
            fmt::format
            (
                R"({{ "accounts": {{ "{}": {{ "data": "", "executable": false, "lamports": 0, "owner": "0x00" }} }} }})",
                address
            )
        ),
        MintguardError
    );
}

TEST( AccountSnapshot, LoadFromFile )
{
    auto mint = Testing::key_of( 0x5a );
    auto mintData = Testing::MintBuilder( ).freeze_authority( Testing::key_of( 0x46 ) ).legacy( );

    auto path = std::filesystem::temp_directory_path( ) / "mintguard_snapshot_test.json";
    {
        std::ofstream file( path );
        file << fmt::format
        (
            R"({{ "accounts": {{ "{}": {} }} }})",
            mint.enc_base58_text( ),
            account_json( Solana::spl_token_program_id( ), base64_data( mintData ) )
        );
    }

    auto snapshot = AccountSnapshot::load( path );
    std::filesystem::remove( path );

    MintInspector inspector( snapshot );
    auto inspection = inspector.inspect( mint );
    EXPECT_EQ( inspection.verdict, ( Verdict::danger( { ReasonTag::Freezable, ReasonTag::UndeterminedMetadata } ) ) );

    EXPECT_THROW( AccountSnapshot::load( path ), MintguardError );
}

TEST( AccountSnapshot, LoadMalformedFileNamesPath )
{
    auto path = std::filesystem::temp_directory_path( ) / "mintguard_malformed_snapshot_test.json";
    {
        std::ofstream file( path );
        file << R"({ "accounts": { "not-a-key": null } })";
    }

    std::string message;
    try
    {
        AccountSnapshot::load( path );
    }
    catch ( const MintguardError & ex )
    {
        message = ex.what( );
    }
    std::filesystem::remove( path );

    EXPECT_NE( message.find( "Malformed account snapshot" ), std::string::npos );
    EXPECT_NE( message.find( path.string( ) ), std::string::npos );
}
