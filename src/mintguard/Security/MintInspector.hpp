#pragma once

#include "mintguard/Security/AccountFetcher.hpp"
#include "mintguard/Security/SecurityTypes.hpp"
#include "mintguard/Util/Logger.hpp"

#include <optional>
#include <string_view>

namespace Mintguard
{
namespace Security
{

TokenProgram token_program_of( const Core::PublicKey & owner );

// Fetches a mint, decodes it with the layout of its owning token program, locates and
// decodes its metadata record, and classifies the result.
class MintInspector
{
public:
    explicit MintInspector( AccountFetcher & fetcher )
        : _fetcher( &fetcher )
    { }

    // Exceptions thrown while fetching the mint account itself propagate.
    Inspection inspect( const Core::PublicKey & mint );

    constexpr std::string_view name( ) const & { return "MintInspector"; }

private:
    MetadataFacts inspect_metadata( const Core::PublicKey & mint, const Solana::MintFacts & mintFacts );
    std::optional< bool > fetch_metadata_mutability( const Core::PublicKey & metadataAddress );

    AccountFetcher * _fetcher;

    MintguardLogger _logger;
};

} // namespace Security
} // namespace Mintguard
