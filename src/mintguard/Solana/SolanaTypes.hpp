#pragma once

#include "mintguard/Core/PublicKey.hpp"

#include <cstdint>
#include <vector>

namespace Mintguard
{
namespace Solana
{

// Raw account as returned by a node.
struct AccountInfo
{
    bool executable = false;
    uint64_t lamports = 0;
    Core::PublicKey owner;
    std::vector< std::byte > data;
};

} // namespace Solana
} // namespace Mintguard
