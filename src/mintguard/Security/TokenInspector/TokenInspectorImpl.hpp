#pragma once

#include "mintguard/Security/AccountFetcher.hpp"
#include "mintguard/Security/MintInspector.hpp"
#include "mintguard/Security/SecurityTypes.hpp"
#include "mintguard/Util/Logger.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>

#include <string_view>
#include <vector>

namespace Mintguard
{
namespace Security
{

class TokenInspectorImpl
{
public:
    TokenInspectorImpl( boost::asio::io_context & ioContext, AccountFetcher & accountFetcher );

    template< class CompletionHandlerType >
    void inspect( Core::PublicKey mint, CompletionHandlerType completionHandler )
    {
        co_spawn( _strand, do_inspect( mint ), completionHandler );
    }

    template< class CompletionHandlerType >
    void inspect_batch( std::vector< Core::PublicKey > mints, CompletionHandlerType completionHandler )
    {
        co_spawn( _strand, do_inspect_batch( std::move( mints ) ), completionHandler );
    }

    constexpr std::string_view name( ) const & { return "TokenInspector"; }

private:
    boost::asio::awaitable< Inspection > do_inspect( Core::PublicKey mint );
    boost::asio::awaitable< std::vector< Inspection > > do_inspect_batch( std::vector< Core::PublicKey > mints );

    // A failure on one mint is logged and reported as Unknown.
    Inspection inspect_or_unknown( const Core::PublicKey & mint );

    boost::asio::strand< boost::asio::io_context::executor_type > _strand;
    MintInspector _mintInspector;

    MintguardLogger _logger;
};

} // namespace Security
} // namespace Mintguard
