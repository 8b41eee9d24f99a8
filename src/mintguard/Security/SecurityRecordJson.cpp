#include "mintguard/Security/SecurityRecordJson.hpp"

#include <boost/json/array.hpp>
#include <boost/json/object.hpp>
#include <boost/json/string.hpp>

#include <magic_enum/magic_enum.hpp>

namespace Mintguard
{
namespace Security
{

void tag_invoke( boost::json::value_from_tag, boost::json::value & jsonValue, const SecurityRecord & record )
{
    boost::json::array reasons;
    for ( auto reason : record.reasons )
    {
        reasons.emplace_back( boost::json::string( magic_enum::enum_name( reason ) ) );
    }

    boost::json::value metadataMutable;
    if ( record.metadataMutable )
    {
        metadataMutable = *record.metadataMutable ? 1 : 0;
    }
    else
    {
        metadataMutable = "unknown";
    }

    jsonValue = boost::json::object
    {
        { "mint_address", record.mintAddress.enc_base58_text( ) },
        { "token_program", std::string( magic_enum::enum_name( record.program ) ) },
        { "is_spl2022", record.isSpl2022 ? 1 : 0 },
        { "mint_authority_exist", record.mintAuthorityExist ? 1 : 0 },
        { "freeze_authority_exist", record.freezeAuthorityExist ? 1 : 0 },
        { "metadata_mutable", std::move( metadataMutable ) },
        { "supply", record.supply },
        { "decimals", record.decimals },
        { "security_status", std::string( security_status_name( record.securityStatus ) ) },
        { "reasons", std::move( reasons ) },
        { "health_summary", record.healthSummary }
    };
}

} // namespace Security
} // namespace Mintguard
