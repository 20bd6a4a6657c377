#pragma once

#include "xrun/core/env.hpp"
#include "xrun/security/policy.hpp"

namespace xrun::security {

// Environment handed to untrusted children. Strict replaces the environment
// outright; moderate strips loader and interpreter search variables;
// permissive passes it through.
auto secure_environment(SecurityLevel level, core::env::Environment inherited) -> core::env::Environment;

} // namespace xrun::security
