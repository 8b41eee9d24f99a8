#pragma once

#include "mintguard/Core/PublicKey.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <utility>

namespace Mintguard
{
namespace Core
{

using Seed = std::span< const std::byte >;

static constexpr size_t max_seeds( ) { return 16; }
static constexpr size_t max_seed_length( ) { return 32; }

// True if key is the compressed encoding of a point on the ed25519 curve.
bool is_on_curve( const PublicKey & key );

// sha256( seeds... || programId || "ProgramDerivedAddress" ).
// Returns std::nullopt if the seeds exceed the seed limits or the hash lands on the curve.
std::optional< PublicKey > create_program_address( std::span< const Seed > seeds, const PublicKey & programId );

// Searches bump seeds from 255 down to 0, returning the first off-curve address and its bump.
std::optional< std::pair< PublicKey, uint8_t > > find_program_address( std::span< const Seed > seeds, const PublicKey & programId );

} // namespace Core
} // namespace Mintguard
