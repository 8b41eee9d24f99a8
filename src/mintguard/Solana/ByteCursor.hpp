#pragma once

#include "mintguard/Core/PublicKey.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace Mintguard
{
namespace Solana
{

// Bounds-checked little-endian reader over an account buffer.
// A read that would pass the end returns std::nullopt and leaves the cursor where it was.
class ByteCursor
{
public:
    explicit ByteCursor( std::span< const std::byte > data, size_t offset = 0 )
        : _data( data )
        , _offset( offset <= data.size( ) ? offset : data.size( ) )
    { }

    size_t offset( ) const { return _offset; }
    size_t remaining( ) const { return _data.size( ) - _offset; }
    bool empty( ) const { return remaining( ) == 0; }

    std::optional< uint8_t > read_u8( );
    std::optional< uint16_t > read_u16( );
    std::optional< uint32_t > read_u32( );
    std::optional< uint64_t > read_u64( );
    std::optional< Core::PublicKey > read_public_key( );
    std::optional< std::span< const std::byte > > read_bytes( size_t count );

    // Advances count bytes, false if fewer remain.
    bool skip( size_t count );

private:
    std::span< const std::byte > _data;
    size_t _offset;
};

} // namespace Solana
} // namespace Mintguard
