#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "xrun/process/runner.hpp"
#include "xrun/runtime/language.hpp"

namespace xrun::runtime {

struct LanguageInfo {
  std::string name_;
  std::string extension_;
  bool        requires_compilation_;
  bool        available_;
  double      timeout_multiplier_;
  double      memory_multiplier_;
};

// Availability is checked lazily, once for all languages, and cached until refresh().
class LanguageRuntimeRegistry {
  std::shared_ptr<process::ProcessRunner> runner_;

  mutable std::mutex               mutex_;
  mutable bool                     checked_ = false;
  mutable std::map<Language, bool> availability_;

  void check_locked() const;

public:
  explicit LanguageRuntimeRegistry(std::shared_ptr<process::ProcessRunner> runner);

  [[nodiscard]] auto get_config(Language language) const -> std::optional<LanguageConfig>;
  [[nodiscard]] auto is_available(Language language) const -> bool;
  [[nodiscard]] auto list_available() const -> std::set<Language>;
  [[nodiscard]] auto supported() const -> std::vector<Language>;
  [[nodiscard]] auto info(Language language) const -> LanguageInfo;

  void refresh();
};

} // namespace xrun::runtime
