#pragma once

#include "mintguard/Core/PublicKey.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <utility>

namespace Mintguard
{
namespace Solana
{

// metaqbxxUerdq28cj1RbAWkYQm3ybzjb6a8bt518x1s
const Core::PublicKey & token_metadata_program_id( );

enum class MetadataKey : uint8_t
{
    Uninitialized = 0,
    EditionV1 = 1,
    MasterEditionV1 = 2,
    ReservationListV1 = 3,
    MetadataV1 = 4
};

struct MetadataAccount
{
    // Key byte plus update authority and mint.
    static constexpr size_t prefix_size( ) { return 1 + 2 * Core::PublicKey::size; }
    static constexpr size_t min_size( ) { return 67; }
    // Creator address, verified flag and share.
    static constexpr size_t creator_size( ) { return Core::PublicKey::size + 2; }

    Core::PublicKey updateAuthority;
    Core::PublicKey mint;
    bool primarySaleHappened = false;
    bool isMutable = false;
};

// Decodes a Metaplex metadata record, skipping its variable-length strings and creators.
// Returns std::nullopt on a short buffer, a key other than MetadataV1, or any overrunning length.
std::optional< MetadataAccount > decode_metadata_account( std::span< const std::byte > data );

std::optional< bool > decode_metadata_mutability( std::span< const std::byte > data );

// Metadata record address of a mint: PDA of ( "metadata", metadata program, mint ).
std::optional< std::pair< Core::PublicKey, uint8_t > > find_metadata_address( const Core::PublicKey & mint );

} // namespace Solana
} // namespace Mintguard
