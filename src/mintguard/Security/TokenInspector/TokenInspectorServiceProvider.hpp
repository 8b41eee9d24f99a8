#pragma once

#include "mintguard/Security/AccountFetcher.hpp"
#include "mintguard/Security/SecurityTypes.hpp"

// Boost 1.74 asio/awaitable.hpp uses std::exchange without including <utility>.
#include <utility>

#include <boost/asio/async_result.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <exception>
#include <memory>
#include <vector>

namespace Mintguard
{
namespace Security
{

template< class Service >
class TokenInspectorServiceProvider
{
public:
    explicit TokenInspectorServiceProvider( Service & service )
        : _service( &service )
    { }

    TokenInspectorServiceProvider( boost::asio::io_context & ioContext, AccountFetcher & accountFetcher )
        : _service( &boost::asio::make_service< Service >( ioContext, accountFetcher ) )
    { }

    // Inspects one mint. Errors fetching the mint account are delivered through the exception_ptr.
    template< boost::asio::completion_token_for< void( std::exception_ptr, Inspection ) > CompletionToken = boost::asio::use_awaitable_t< > >
    auto inspect( Core::PublicKey mint, CompletionToken && token = { } )
    {
        return boost::asio::async_initiate< CompletionToken, void( std::exception_ptr, Inspection ) >
        (
            [ this, mint ]< class Handler >( Handler && self )
            {
                _service->inspector( ).inspect
                (
                    mint,
                    [ self = std::make_shared< Handler >( std::forward< Handler >( self ) ) ]( std::exception_ptr ex, Inspection inspection )
                    {
                        ( *self )( ex, std::move( inspection ) );
                    }
                );
            },
            token
        );
    }

    // Inspects mints in order, one result per mint. A mint that fails to inspect is reported as Unknown.
    template< boost::asio::completion_token_for< void( std::exception_ptr, std::vector< Inspection > ) > CompletionToken = boost::asio::use_awaitable_t< > >
    auto inspect_batch( std::vector< Core::PublicKey > mints, CompletionToken && token = { } )
    {
        return boost::asio::async_initiate< CompletionToken, void( std::exception_ptr, std::vector< Inspection > ) >
        (
            [ this, mints = std::move( mints ) ]< class Handler >( Handler && self ) mutable
            {
                _service->inspector( ).inspect_batch
                (
                    std::move( mints ),
                    [ self = std::make_shared< Handler >( std::forward< Handler >( self ) ) ]( std::exception_ptr ex, std::vector< Inspection > inspections )
                    {
                        ( *self )( ex, std::move( inspections ) );
                    }
                );
            },
            token
        );
    }

private:
    Service * _service;
};

} // namespace Security
} // namespace Mintguard
