#include "mintguard/Security/RiskClassifier.hpp"

namespace Mintguard
{
namespace Security
{

Verdict classify_risk( const InspectionFacts & facts )
{
    if ( facts.outcome != InspectionOutcome::Decoded )
    {
        return Verdict::unknown( );
    }

    std::vector< ReasonTag > reasons;

    if ( facts.mint.mintAuthority )
    {
        reasons.push_back( ReasonTag::Mintable );
    }
    if ( facts.mint.freezeAuthority )
    {
        reasons.push_back( ReasonTag::Freezable );
    }

    if ( !facts.metadata.isMutable )
    {
        reasons.push_back( ReasonTag::UndeterminedMetadata );
    }
    else if ( *facts.metadata.isMutable )
    {
        reasons.push_back( ReasonTag::MutableMetadata );
    }

    if ( facts.mint.parseFail )
    {
        reasons.push_back( ReasonTag::MalformedRecord );
    }

    return Verdict::danger( std::move( reasons ) );
}

} // namespace Security
} // namespace Mintguard
