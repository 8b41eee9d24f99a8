#pragma once

#include "mintguard/Core/PublicKey.hpp"
#include "mintguard/Solana/Token.hpp"

#include <cstdint>
#include <optional>
#include <ostream>
#include <string_view>
#include <vector>

namespace Mintguard
{
namespace Security
{

// Owning program of an inspected account.
enum class TokenProgram : uint8_t
{
    Legacy = 0,
    Extensible = 1,
    Unrecognized = 2
};

enum class InspectionOutcome : uint8_t
{
    AccountNotFound = 0,
    UnrecognizedOwner = 1,
    Decoded = 2
};

// Where a mutability answer came from.
enum class MetadataSource : uint8_t
{
    None = 0,
    MetadataAccount = 1,
    UpdateAuthorityExtension = 2
};

struct MetadataFacts
{
    bool operator==( const MetadataFacts & ) const = default;

    // std::nullopt when mutability could not be determined.
    std::optional< bool > isMutable;
    MetadataSource source = MetadataSource::None;
};

enum class SecurityStatus : uint8_t
{
    Safe = 0,
    Danger = 1,
    Unknown = 2
};

// Declared in evaluation order.
enum class ReasonTag : uint8_t
{
    Mintable = 0,
    Freezable = 1,
    MutableMetadata = 2,
    UndeterminedMetadata = 3,
    MalformedRecord = 4
};

std::string_view security_status_name( SecurityStatus status );
std::string_view reason_phrase( ReasonTag reason );

class Verdict
{
public:
    static Verdict safe( ) { return Verdict( SecurityStatus::Safe, { } ); }
    static Verdict unknown( ) { return Verdict( SecurityStatus::Unknown, { } ); }

    // Collapses to safe( ) when reasons is empty; duplicate reasons are dropped, order kept.
    static Verdict danger( std::vector< ReasonTag > reasons );

    SecurityStatus status( ) const { return _status; }
    const std::vector< ReasonTag > & reasons( ) const { return _reasons; }

    bool is_safe( ) const { return _status == SecurityStatus::Safe; }
    bool is_danger( ) const { return _status == SecurityStatus::Danger; }
    bool is_unknown( ) const { return _status == SecurityStatus::Unknown; }

    bool has_reason( ReasonTag reason ) const;

    bool operator==( const Verdict & ) const = default;

    friend std::ostream & operator <<( std::ostream & os, const Verdict & verdict );

private:
    Verdict( SecurityStatus status, std::vector< ReasonTag > reasons )
        : _status( status )
        , _reasons( std::move( reasons ) )
    { }

    SecurityStatus _status;
    std::vector< ReasonTag > _reasons;
};

struct InspectionFacts
{
    InspectionOutcome outcome = InspectionOutcome::AccountNotFound;
    TokenProgram program = TokenProgram::Unrecognized;
    Solana::MintFacts mint;
    MetadataFacts metadata;
};

struct Inspection
{
    Core::PublicKey mintAddress;
    InspectionFacts facts;
    Verdict verdict = Verdict::unknown( );
};

} // namespace Security
} // namespace Mintguard
