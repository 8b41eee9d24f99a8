#pragma once

#include "mintguard/Solana/SolanaTypes.hpp"
#include "mintguard/Util/JsonUtils.hpp"

#include <simdjson.h>

namespace Mintguard
{
namespace Solana
{

// Parses the "value" object of a getAccountInfo response. Account data may be a base58
// string or a [ "<data>", "base64" ] pair. Throws MintguardError on malformed fields.
AccountInfo tag_invoke( json_to_tag< AccountInfo >, simdjson::ondemand::value jsonValue );

} // namespace Solana
} // namespace Mintguard
