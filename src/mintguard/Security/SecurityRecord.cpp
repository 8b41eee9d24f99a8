#include "mintguard/Security/SecurityRecord.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace Mintguard
{
namespace Security
{

std::string health_summary( const Inspection & inspection )
{
    const auto & verdict = inspection.verdict;
    switch ( verdict.status( ) )
    {
        case SecurityStatus::Safe:
        {
            return "Safe";
        }
        case SecurityStatus::Danger:
        {
            std::vector< std::string_view > phrases;
            for ( auto reason : verdict.reasons( ) )
            {
                phrases.push_back( reason_phrase( reason ) );
            }
            return fmt::format( "Danger - {}", fmt::join( phrases, ", " ) );
        }
        case SecurityStatus::Unknown:
        {
            return inspection.facts.outcome == InspectionOutcome::UnrecognizedOwner
                ? "Unknown - unrecognized owner"
                : "Unknown - account not found";
        }
    }
    return "Unknown";
}

SecurityRecord make_security_record( const Inspection & inspection )
{
    const auto & facts = inspection.facts;

    SecurityRecord record;
    record.mintAddress = inspection.mintAddress;
    record.program = facts.program;
    record.securityStatus = inspection.verdict.status( );
    record.reasons = inspection.verdict.reasons( );
    record.healthSummary = health_summary( inspection );

    if ( facts.outcome == InspectionOutcome::Decoded )
    {
        record.isSpl2022 = facts.mint.isToken2022;
        record.mintAuthorityExist = facts.mint.mintAuthority.has_value( );
        record.freezeAuthorityExist = facts.mint.freezeAuthority.has_value( );
        record.metadataMutable = facts.metadata.isMutable;
        record.supply = facts.mint.supply;
        record.decimals = facts.mint.decimals;
    }

    return record;
}

} // namespace Security
} // namespace Mintguard
