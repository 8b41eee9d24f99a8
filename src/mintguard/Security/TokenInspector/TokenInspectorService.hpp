#pragma once

#include "mintguard/Security/TokenInspector/TokenInspectorImpl.hpp"

#include "mintguard/Util/Logger.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/execution.hpp>
#include <boost/asio/execution_context.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/require.hpp>

#include <thread>

namespace Mintguard
{
namespace Security
{

class TokenInspectorService : public boost::asio::execution_context::service
{
public:
    // Constructor creates a thread to run a private io_context.
    TokenInspectorService
    (
        boost::asio::execution_context & executionContext,
        AccountFetcher & accountFetcher
    )
        : boost::asio::execution_context::service( executionContext )
        , _ioContext( )
        , _work( boost::asio::require( _ioContext.get_executor( ),
                 boost::asio::execution::outstanding_work.tracked ) )
        , _inspector( _ioContext, accountFetcher )
        , _workThread( [ this ]( ){ return this->_ioContext.run( ); } )
    { }

    ~TokenInspectorService( )
    {
        // Indicate that we have finished with the private io_context.
        // io_context::run( ) function will exit once all other work has completed.
        _work = boost::asio::any_io_executor( );
    }

    TokenInspectorImpl & inspector( ) { return _inspector; }

    static inline boost::asio::execution_context::id id;

private:
    // Destroy all user-defined handler objects owned by the service.
    void shutdown( ) noexcept override
    {
        MINTGUARD_LOG_INFO( _logger ) << "Shutting down TokenInspectorService";
    }

    // Private io_context used for performing operations on this thread.
    boost::asio::io_context _ioContext;
    // A work-tracking executor giving work for the private io_context to perform.
    boost::asio::any_io_executor _work;

    TokenInspectorImpl _inspector;

    // Joined before _inspector is destroyed.
    std::jthread _workThread;

    MintguardLogger _logger;
};

} // namespace Security
} // namespace Mintguard
