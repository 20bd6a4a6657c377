#include <array>
#include <string>
#include <string_view>
#include <utility>

#include "xrun/security/environment.hpp"

namespace xrun::security {

namespace {

constexpr std::array<std::string_view, 12> STRIPPED_VARIABLES{
    "LD_PRELOAD", "LD_LIBRARY_PATH", "LD_AUDIT",  "PYTHONPATH", "PYTHONHOME",   "NODE_PATH",
    "PERL5LIB",   "RUBYLIB",         "CLASSPATH", "JAVA_HOME",  "ANDROID_HOME", "PYTHONSTARTUP",
};

} // namespace

auto secure_environment(SecurityLevel level, core::env::Environment inherited) -> core::env::Environment {
  switch (level) {
    case SecurityLevel::Strict:
      return core::env::Environment{
          {"PATH", "/usr/bin:/bin"},
          {"HOME", "/tmp"},
          {"USER", "nobody"},
          {"SHELL", "/bin/sh"},
      };
    case SecurityLevel::Permissive: return inherited;
    case SecurityLevel::Moderate:
    case SecurityLevel::Custom: break;
  }

  for (auto name : STRIPPED_VARIABLES) {
    inherited.erase(std::string{name});
  }
  return inherited;
}

} // namespace xrun::security
