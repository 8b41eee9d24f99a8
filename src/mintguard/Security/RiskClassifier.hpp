#pragma once

#include "mintguard/Security/SecurityTypes.hpp"

namespace Mintguard
{
namespace Security
{

// Folds decoded facts into a verdict.
//
// Unknown: the account was not found or its owner is neither token program.
// Otherwise reasons accumulate in order: mint authority, freeze authority,
// mutable metadata, undetermined metadata, malformed record. No reasons means Safe.
// Undetermined metadata counts against the token: an unverifiable state is never Safe.
Verdict classify_risk( const InspectionFacts & facts );

} // namespace Security
} // namespace Mintguard
