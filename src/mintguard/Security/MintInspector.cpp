#include "mintguard/Security/MintInspector.hpp"

#include "mintguard/Security/RiskClassifier.hpp"
#include "mintguard/Solana/Token.hpp"
#include "mintguard/Solana/Token2022.hpp"
#include "mintguard/Solana/TokenMetadata.hpp"

#include <fmt/format.h>

namespace Mintguard
{
namespace Security
{

TokenProgram token_program_of( const Core::PublicKey & owner )
{
    if ( owner == Solana::spl_token_program_id( ) )
    {
        return TokenProgram::Legacy;
    }
    if ( owner == Solana::token_2022_program_id( ) )
    {
        return TokenProgram::Extensible;
    }
    return TokenProgram::Unrecognized;
}

Inspection MintInspector::inspect( const Core::PublicKey & mint )
{
    Inspection inspection;
    inspection.mintAddress = mint;
    auto & facts = inspection.facts;

    auto account = _fetcher->fetch_account( mint );
    if ( !account )
    {
        MINTGUARD_LOG_INFO( _logger ) << fmt::format( "[{}] Mint account not found: {}", name( ), mint );

        facts.outcome = InspectionOutcome::AccountNotFound;
        inspection.verdict = classify_risk( facts );
        return inspection;
    }

    facts.program = token_program_of( account->owner );
    switch ( facts.program )
    {
        case TokenProgram::Legacy:
        {
            auto mintFacts = Solana::decode_legacy_mint( account->data );
            if ( mintFacts )
            {
                facts.mint = *mintFacts;
            }
            else
            {
                MINTGUARD_LOG_INFO( _logger )
                    << fmt::format( "[{}] Malformed legacy mint {}, size: {}", name( ), mint, account->data.size( ) );
                facts.mint.parseFail = true;
            }
            facts.outcome = InspectionOutcome::Decoded;
            facts.metadata = inspect_metadata( mint, facts.mint );
            break;
        }
        case TokenProgram::Extensible:
        {
            facts.mint = Solana::decode_token2022_mint( account->data );
            if ( facts.mint.parseFail )
            {
                MINTGUARD_LOG_INFO( _logger )
                    << fmt::format( "[{}] Malformed Token-2022 mint {}, size: {}", name( ), mint, account->data.size( ) );
            }
            facts.outcome = InspectionOutcome::Decoded;
            facts.metadata = inspect_metadata( mint, facts.mint );
            break;
        }
        case TokenProgram::Unrecognized:
        {
            MINTGUARD_LOG_INFO( _logger )
                << fmt::format( "[{}] Account {} is owned by {}, not a token program", name( ), mint, account->owner );
            facts.outcome = InspectionOutcome::UnrecognizedOwner;
            break;
        }
    }

    inspection.verdict = classify_risk( facts );

    MINTGUARD_LOG_DEBUG( _logger )
        << fmt::format( "[{}] Inspected mint {}, verdict: ", name( ), mint ) << inspection.verdict;

    return inspection;
}

MetadataFacts MintInspector::inspect_metadata( const Core::PublicKey & mint, const Solana::MintFacts & mintFacts )
{
    // TODO: confirm with product whether an extension-less Token-2022 mint should fall back
    // to the derived metadata record instead of staying undetermined.
    if ( mintFacts.isToken2022 && !mintFacts.foundExtension )
    {
        MINTGUARD_LOG_DEBUG( _logger ) << fmt::format( "[{}] Token-2022 mint {} carries no extensions", name( ), mint );
        return MetadataFacts{ };
    }

    std::optional< Core::PublicKey > metadataAddress = mintFacts.metadataPointer;
    if ( !metadataAddress )
    {
        if ( auto derived = Solana::find_metadata_address( mint ) )
        {
            metadataAddress = derived->first;
        }
    }

    if ( metadataAddress )
    {
        if ( auto isMutable = fetch_metadata_mutability( *metadataAddress ) )
        {
            return MetadataFacts{ .isMutable = isMutable, .source = MetadataSource::MetadataAccount };
        }
    }

    if ( mintFacts.updateAuthorityPresent )
    {
        return MetadataFacts{ .isMutable = mintFacts.updateAuthorityPresent, .source = MetadataSource::UpdateAuthorityExtension };
    }

    return MetadataFacts{ };
}

std::optional< bool > MintInspector::fetch_metadata_mutability( const Core::PublicKey & metadataAddress )
{
    std::optional< Solana::AccountInfo > account;
    try
    {
        account = _fetcher->fetch_account( metadataAddress );
    }
    catch ( const std::exception & ex )
    {
        MINTGUARD_LOG_WARNING( _logger )
            << fmt::format( "[{}] Failed to fetch metadata account {}: {}", name( ), metadataAddress, ex.what( ) );
        return std::nullopt;
    }

    if ( !account )
    {
        MINTGUARD_LOG_DEBUG( _logger ) << fmt::format( "[{}] Metadata account not found: {}", name( ), metadataAddress );
        return std::nullopt;
    }

    auto isMutable = Solana::decode_metadata_mutability( account->data );
    if ( !isMutable )
    {
        MINTGUARD_LOG_WARNING( _logger )
            << fmt::format( "[{}] Malformed metadata account {}, size: {}", name( ), metadataAddress, account->data.size( ) );
    }
    return isMutable;
}

} // namespace Security
} // namespace Mintguard
