#include "mintguard/Solana/AccountJson.hpp"

#include "mintguard/Util/StringEncode.hpp"
#include "mintguard/Util/Utils.hpp"

#include <fmt/format.h>

#include <optional>
#include <string>
#include <vector>

namespace Mintguard
{
namespace Solana
{

AccountInfo tag_invoke( json_to_tag< AccountInfo >, simdjson::ondemand::value jsonValue )
{
    AccountInfo response;

    response.executable = jsonValue[ "executable" ].get_bool( ).value( );
    response.lamports = jsonValue[ "lamports" ].get_uint64( ).value( );

    std::string_view owner = jsonValue[ "owner" ].get_string( ).value( );
    if ( !response.owner.init_from_base58( owner ) )
    {
        throw MintguardError( fmt::format( "Invalid account owner: '{}'", owner ) );
    }

    auto dataObject = jsonValue[ "data" ].value( );

    std::optional< std::vector< std::byte > > data;
    switch ( dataObject.type( ).value( ) )
    {
        case simdjson::ondemand::json_type::string:
        {
            // Default base58 encoding.
            data = dec_base58( dataObject.get_string( ).value( ) );
            break;
        }
        case simdjson::ondemand::json_type::array:
        {
            std::vector< std::string > fields;
            for ( auto field : dataObject.get_array( ) )
            {
                fields.emplace_back( field.get_string( ).value( ) );
            }

            if ( fields.size( ) != 2 )
            {
                throw MintguardError( "Expected [ data, encoding ] in 'data' field" );
            }
            if ( fields[ 1 ] == "base64" )
            {
                data = dec_base64( fields[ 0 ] );
            }
            else if ( fields[ 1 ] == "base58" )
            {
                data = dec_base58( fields[ 0 ] );
            }
            else
            {
                throw MintguardError( fmt::format( "Unsupported account data encoding: '{}'", fields[ 1 ] ) );
            }
            break;
        }
        default:
        {
            throw MintguardError( "Invalid 'data' field type" );
        }
    }

    if ( !data )
    {
        throw MintguardError( "Account data is not validly encoded" );
    }
    response.data = std::move( *data );

    return response;
}

} // namespace Solana
} // namespace Mintguard
