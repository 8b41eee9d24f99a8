#pragma once

#include "mintguard/Security/SecurityTypes.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Mintguard
{
namespace Security
{

// Ledger row for one inspected mint, keyed by mint address.
struct SecurityRecord
{
    Core::PublicKey mintAddress;
    TokenProgram program = TokenProgram::Unrecognized;
    bool isSpl2022 = false;
    bool mintAuthorityExist = false;
    bool freezeAuthorityExist = false;
    // std::nullopt is written as "unknown".
    std::optional< bool > metadataMutable;
    uint64_t supply = 0;
    uint8_t decimals = 0;
    SecurityStatus securityStatus = SecurityStatus::Unknown;
    std::vector< ReasonTag > reasons;
    std::string healthSummary;
};

// "Safe", "Danger - mintable, freezable", "Unknown - account not found", ...
std::string health_summary( const Inspection & inspection );

SecurityRecord make_security_record( const Inspection & inspection );

} // namespace Security
} // namespace Mintguard
