#include "mintguard/Security/AccountSnapshot.hpp"

#include "mintguard/Security/MintInspector.hpp"
#include "mintguard/Solana/AccountJson.hpp"
#include "mintguard/Util/Utils.hpp"

#include <simdjson.h>

#include <fmt/format.h>

#include <algorithm>

namespace Mintguard
{
namespace Security
{

AccountSnapshot AccountSnapshot::load( const std::filesystem::path & path )
{
    auto json = simdjson::padded_string::load( path.string( ) );
    if ( json.error( ) )
    {
        throw MintguardError
        (
            fmt::format( "Unable to read account snapshot {}: {}", path.string( ), simdjson::error_message( json.error( ) ) )
        );
    }

    return parse( json.value_unsafe( ), path.string( ) );
}

AccountSnapshot AccountSnapshot::parse( std::string_view json )
{
    return parse( simdjson::padded_string( json ), "<memory>" );
}

AccountSnapshot AccountSnapshot::parse( const simdjson::padded_string & json, std::string_view source )
{
    AccountSnapshot snapshot;

    try
    {
        simdjson::ondemand::parser parser;
        simdjson::ondemand::document document = parser.iterate( json );

        simdjson::ondemand::object accounts = document[ "accounts" ].get_object( );
        for ( auto field : accounts )
        {
            std::string_view addressText = field.unescaped_key( );
            auto address = Core::PublicKey::from_base58( addressText );

            simdjson::ondemand::value accountValue = field.value( );
            if ( accountValue.type( ).value( ) == simdjson::ondemand::json_type::null )
            {
                snapshot.add_account( address, std::nullopt );
                continue;
            }

            snapshot.add_account( address, json_to< Solana::AccountInfo >( accountValue ) );
        }
    }
    catch ( const simdjson::simdjson_error & ex )
    {
        throw MintguardError( fmt::format( "Malformed account snapshot {}: {}", source, ex.what( ) ) );
    }
    catch ( const MintguardError & ex )
    {
        throw MintguardError( fmt::format( "Malformed account snapshot {}: {}", source, ex.what( ) ) );
    }

    return snapshot;
}

void AccountSnapshot::add_account( const Core::PublicKey & address, std::optional< Solana::AccountInfo > account )
{
    _accounts.insert_or_assign( address, std::move( account ) );
}

std::optional< Solana::AccountInfo > AccountSnapshot::fetch_account( const Core::PublicKey & address )
{
    auto findAccount = _accounts.find( address );
    if ( findAccount == _accounts.end( ) )
    {
        return std::nullopt;
    }
    return findAccount->second;
}

std::vector< Core::PublicKey > AccountSnapshot::token_accounts( ) const
{
    std::vector< Core::PublicKey > addresses;
    for ( const auto & [ address, account ] : _accounts )
    {
        if ( account && token_program_of( account->owner ) != TokenProgram::Unrecognized )
        {
            addresses.push_back( address );
        }
    }

    std::sort
    (
        addresses.begin( ),
        addresses.end( ),
        [ ]( const Core::PublicKey & lhs, const Core::PublicKey & rhs )
        {
            return lhs.enc_base58_text( ) < rhs.enc_base58_text( );
        }
    );
    return addresses;
}

} // namespace Security
} // namespace Mintguard
