#include "mintguard/Security/SecurityTypes.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>

namespace Mintguard
{
namespace Security
{

std::string_view security_status_name( SecurityStatus status )
{
    switch ( status )
    {
        case SecurityStatus::Safe: return "SAFE";
        case SecurityStatus::Danger: return "DANGER";
        case SecurityStatus::Unknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}

std::string_view reason_phrase( ReasonTag reason )
{
    switch ( reason )
    {
        case ReasonTag::Mintable: return "mintable";
        case ReasonTag::Freezable: return "freezable";
        case ReasonTag::MutableMetadata: return "mutable metadata";
        case ReasonTag::UndeterminedMetadata: return "undetermined metadata";
        case ReasonTag::MalformedRecord: return "malformed record";
    }
    return "unknown reason";
}

Verdict Verdict::danger( std::vector< ReasonTag > reasons )
{
    std::vector< ReasonTag > unique;
    for ( auto reason : reasons )
    {
        if ( std::find( unique.begin( ), unique.end( ), reason ) == unique.end( ) )
        {
            unique.push_back( reason );
        }
    }

    if ( unique.empty( ) )
    {
        return safe( );
    }
    return Verdict( SecurityStatus::Danger, std::move( unique ) );
}

bool Verdict::has_reason( ReasonTag reason ) const
{
    return std::find( _reasons.begin( ), _reasons.end( ), reason ) != _reasons.end( );
}

std::ostream & operator <<( std::ostream & os, const Verdict & verdict )
{
    os << security_status_name( verdict.status( ) );
    if ( !verdict.reasons( ).empty( ) )
    {
        std::vector< std::string_view > phrases;
        for ( auto reason : verdict.reasons( ) )
        {
            phrases.push_back( reason_phrase( reason ) );
        }
        os << fmt::format( " [{}]", fmt::join( phrases, ", " ) );
    }
    return os;
}

} // namespace Security
} // namespace Mintguard
