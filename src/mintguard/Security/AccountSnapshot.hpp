#pragma once

#include "mintguard/Security/AccountFetcher.hpp"

#include <simdjson.h>

#include <filesystem>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace Mintguard
{
namespace Security
{

// Accounts captured ahead of time, served as an AccountFetcher.
//
// Document layout:
//   { "accounts": { "<base58 address>": <getAccountInfo value or null>, ... } }
// A null entry records an address the node reported as missing.
class AccountSnapshot : public AccountFetcher
{
public:
    AccountSnapshot( ) = default;

    // Throw MintguardError naming the source on unreadable or malformed input.
    static AccountSnapshot load( const std::filesystem::path & path );
    static AccountSnapshot parse( std::string_view json );

    void add_account( const Core::PublicKey & address, std::optional< Solana::AccountInfo > account );

    std::optional< Solana::AccountInfo > fetch_account( const Core::PublicKey & address ) override;

    // Addresses of accounts owned by either token program, in base58 order.
    std::vector< Core::PublicKey > token_accounts( ) const;

    size_t size( ) const { return _accounts.size( ); }

private:
    static AccountSnapshot parse( const simdjson::padded_string & json, std::string_view source );

    std::unordered_map< Core::PublicKey, std::optional< Solana::AccountInfo > > _accounts;
};

} // namespace Security
} // namespace Mintguard
