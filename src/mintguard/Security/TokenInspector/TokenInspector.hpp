#pragma once

#include "mintguard/Security/TokenInspector/TokenInspectorServiceProvider.hpp"
#include "mintguard/Security/TokenInspector/TokenInspectorService.hpp"

namespace Mintguard
{
namespace Security
{
    using TokenInspector = TokenInspectorServiceProvider< TokenInspectorService >;
} // namespace Security
} // namespace Mintguard
