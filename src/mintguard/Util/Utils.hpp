#pragma once

#include <stdexcept>

namespace Mintguard
{

class MintguardError : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

} // namespace Mintguard
