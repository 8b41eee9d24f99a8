#include "mintguard/Security/TokenInspector/TokenInspectorImpl.hpp"

#include "mintguard/Security/RiskClassifier.hpp"

#include <boost/asio/use_awaitable.hpp>

#include <fmt/format.h>

#include <algorithm>

namespace asio = boost::asio;

namespace Mintguard
{
namespace Security
{

TokenInspectorImpl::TokenInspectorImpl( asio::io_context & ioContext, AccountFetcher & accountFetcher )
    : _strand( ioContext.get_executor( ) )
    , _mintInspector( accountFetcher )
{ }

asio::awaitable< Inspection > TokenInspectorImpl::do_inspect( Core::PublicKey mint )
{
    co_return _mintInspector.inspect( mint );
}

asio::awaitable< std::vector< Inspection > > TokenInspectorImpl::do_inspect_batch( std::vector< Core::PublicKey > mints )
{
    MINTGUARD_LOG_INFO( _logger ) << fmt::format( "[{}] Inspecting batch of {} mints", name( ), mints.size( ) );

    std::vector< Inspection > inspections;
    inspections.reserve( mints.size( ) );
    for ( const auto & mint : mints )
    {
        inspections.push_back( inspect_or_unknown( mint ) );
    }

    auto countStatus = [ &inspections ]( SecurityStatus status )
    {
        return std::count_if
        (
            inspections.begin( ),
            inspections.end( ),
            [ status ]( const Inspection & inspection ) { return inspection.verdict.status( ) == status; }
        );
    };

    MINTGUARD_LOG_INFO( _logger )
        << fmt::format
        (
            "[{}] Batch complete: {} safe, {} danger, {} unknown",
            name( ),
            countStatus( SecurityStatus::Safe ),
            countStatus( SecurityStatus::Danger ),
            countStatus( SecurityStatus::Unknown )
        );

    co_return inspections;
}

Inspection TokenInspectorImpl::inspect_or_unknown( const Core::PublicKey & mint )
{
    try
    {
        return _mintInspector.inspect( mint );
    }
    catch ( const std::exception & ex )
    {
        MINTGUARD_LOG_ERROR( _logger ) << fmt::format( "[{}] Failed to inspect mint {}: {}", name( ), mint, ex.what( ) );

        Inspection inspection;
        inspection.mintAddress = mint;
        inspection.facts.outcome = InspectionOutcome::AccountNotFound;
        inspection.verdict = classify_risk( inspection.facts );
        return inspection;
    }
}

} // namespace Security
} // namespace Mintguard
