#pragma once

#include <chrono>
#include <cstddef>
#include <string_view>

namespace xrun::core::constant {

constexpr std::string_view EXE_NAME = "xrun";
constexpr std::string_view EXE_DESC = "Sandboxed code execution engine";
constexpr std::string_view VERSION  = "v0.1.0-dev";

constexpr std::string_view ENV_EXECUTION_MODE = "EXECUTION_MODE";
constexpr std::string_view ENV_SECURITY_LEVEL = "XRUN_SECURITY_LEVEL";
constexpr std::string_view ENV_POLICY_FILE    = "XRUN_POLICY_FILE";
constexpr std::string_view ENV_LOG_LEVEL      = "XRUN_LOG_LEVEL";
constexpr std::string_view ENV_WORK_DIR       = "XRUN_WORK_DIR";

constexpr std::string_view SHELL_PATH = "/bin/sh";

constexpr std::chrono::milliseconds TERMINATE_GRACE_PERIOD{1000};
constexpr std::chrono::seconds      CHECK_TIMEOUT{5};
constexpr std::chrono::seconds      DEFAULT_COMPILE_TIMEOUT{60};
constexpr std::chrono::milliseconds POLL_INTERVAL{50};

constexpr std::size_t HISTORY_CAPACITY  = 100;
constexpr std::size_t READ_CHUNK_SIZE   = 4096;
constexpr std::size_t MEGABYTE          = 1024 * 1024;
constexpr int         EXIT_EXEC_FAILURE = 127;

} // namespace xrun::core::constant
