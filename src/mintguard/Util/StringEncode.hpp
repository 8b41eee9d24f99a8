#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// Conversions between binary-encoded and string-encoded data.

namespace Mintguard
{

std::string enc_base58( std::span< const std::byte > source );

// Returns std::nullopt if text contains a character outside the base58 alphabet.
std::optional< std::vector< std::byte > > dec_base58( std::string_view text );

std::string enc_base64( std::span< const std::byte > source );

// Returns std::nullopt on characters outside the base64 alphabet or misplaced padding.
std::optional< std::vector< std::byte > > dec_base64( std::string_view text );

} // namespace Mintguard
