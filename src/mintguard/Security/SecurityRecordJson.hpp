#pragma once

#include "mintguard/Security/SecurityRecord.hpp"

#include <boost/json/value.hpp>
#include <boost/json/value_from.hpp>

namespace Mintguard
{
namespace Security
{

void tag_invoke( boost::json::value_from_tag, boost::json::value & jsonValue, const SecurityRecord & record );

} // namespace Security
} // namespace Mintguard
