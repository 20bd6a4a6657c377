#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "xrun/core/constant.hpp"
#include "xrun/core/log.hpp"
#include "xrun/runtime/registry.hpp"

namespace xrun::runtime {

LanguageRuntimeRegistry::LanguageRuntimeRegistry(std::shared_ptr<process::ProcessRunner> runner)
    : runner_(std::move(runner)) {}

void LanguageRuntimeRegistry::check_locked() const {
  if (checked_) {
    return;
  }

  // Identical checks run once.
  std::map<std::vector<std::string>, bool> seen;
  for (auto language : all_languages()) {
    auto const& check = config_for(language).version_check_;
    if (auto it = seen.find(check); it != seen.end()) {
      availability_[language] = it->second;
      continue;
    }

    process::RunRequest request;
    request.argv_             = check;
    request.timeout_          = core::constant::CHECK_TIMEOUT;
    request.max_output_bytes_ = core::constant::READ_CHUNK_SIZE;

    bool available = false;
    if (auto outcome = runner_->run(request); outcome) {
      available = outcome->succeeded();
    } else {
      core::log::debug("{} runtime not found: {}", to_string(language), outcome.error());
    }

    seen.emplace(check, available);
    availability_[language] = available;
  }
  checked_ = true;
}

auto LanguageRuntimeRegistry::get_config(Language language) const -> std::optional<LanguageConfig> {
  return config_for(language);
}

auto LanguageRuntimeRegistry::is_available(Language language) const -> bool {
  std::lock_guard lock(mutex_);
  check_locked();
  auto it = availability_.find(language);
  return it != availability_.end() && it->second;
}

auto LanguageRuntimeRegistry::list_available() const -> std::set<Language> {
  std::lock_guard lock(mutex_);
  check_locked();
  std::set<Language> result;
  for (auto const& [language, available] : availability_) {
    if (available) {
      result.insert(language);
    }
  }
  return result;
}

auto LanguageRuntimeRegistry::supported() const -> std::vector<Language> {
  return all_languages();
}

auto LanguageRuntimeRegistry::info(Language language) const -> LanguageInfo {
  auto const& config = config_for(language);
  return LanguageInfo{
      .name_                 = config.name_,
      .extension_            = config.extension_,
      .requires_compilation_ = config.requires_compilation_,
      .available_            = is_available(language),
      .timeout_multiplier_   = config.timeout_multiplier_,
      .memory_multiplier_    = config.memory_multiplier_,
  };
}

void LanguageRuntimeRegistry::refresh() {
  std::lock_guard lock(mutex_);
  availability_.clear();
  checked_ = false;
  check_locked();
}

} // namespace xrun::runtime
