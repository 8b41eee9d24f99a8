#pragma once

#include "mintguard/Core/PublicKey.hpp"
#include "mintguard/Solana/SolanaTypes.hpp"

#include <optional>

namespace Mintguard
{
namespace Security
{

// Source of raw account bytes. Retry, throttling and transport belong to implementations.
class AccountFetcher
{
public:
    virtual ~AccountFetcher( ) = default;

    // Returns std::nullopt if the account does not exist. May throw MintguardError
    // when the source itself fails.
    virtual std::optional< Solana::AccountInfo > fetch_account( const Core::PublicKey & address ) = 0;
};

} // namespace Security
} // namespace Mintguard
