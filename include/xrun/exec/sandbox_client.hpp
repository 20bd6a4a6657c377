#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "xrun/core/result.hpp"
#include "xrun/process/runner.hpp"

namespace xrun::exec {

struct SessionSpec {
  std::string template_;
  int         memory_mb_   = 512;
  double      cpu_         = 1.0;
  bool        network_     = false;
  int         timeout_sec_ = 300;
};

struct RemoteCommand {
  std::vector<std::string>  argv_;
  std::string               cwd_;
  std::chrono::milliseconds timeout_{std::chrono::seconds{30}};
};

struct RemoteOutcome {
  std::string stdout_;
  std::string stderr_;
  int         exit_code_ = -1;
  bool        timed_out_ = false;
};

// Transport of the sandbox gateway protocol:
//   POST   /sandboxes                 -> {"id"}
//   PUT    /sandboxes/{id}/files      {"path", "content"}
//   POST   /sandboxes/{id}/commands   -> {"stdout", "stderr", "exit_code", "timed_out"}
//   DELETE /sandboxes/{id}
class SandboxClient {
public:
  virtual ~SandboxClient() = default;

  virtual auto create_session(SessionSpec const& spec) -> core::Result<std::string> = 0;
  virtual auto upload(std::string const& session, std::string const& path, std::string_view content)
      -> core::Result<void>                                                                          = 0;
  virtual auto run(std::string const& session, RemoteCommand const& command) -> core::Result<RemoteOutcome> = 0;
  virtual auto destroy_session(std::string const& session) -> core::Result<void>                           = 0;

  // Whether requests can be sent at all.
  [[nodiscard]] virtual auto reachable() -> bool = 0;
};

struct GatewayEndpoint {
  std::string url_;
  std::string api_key_;
};

// Speaks the gateway protocol through the curl binary. The API key travels
// in a header file inside a private workspace, never on a command line.
class CurlGatewayClient : public SandboxClient {
  std::shared_ptr<process::ProcessRunner> runner_;
  GatewayEndpoint                         endpoint_;
  std::string                             curl_binary_;

  std::mutex          check_mutex_;
  std::optional<bool> reachable_;

  // A null body sends no payload.
  auto request(
      std::string_view          method,
      std::string const&        path,
      nlohmann::json const&     body,
      std::chrono::milliseconds timeout
  ) -> core::Result<nlohmann::json>;

public:
  CurlGatewayClient(std::shared_ptr<process::ProcessRunner> runner, GatewayEndpoint endpoint, std::string curl_binary);

  auto create_session(SessionSpec const& spec) -> core::Result<std::string> override;
  auto upload(std::string const& session, std::string const& path, std::string_view content)
      -> core::Result<void> override;
  auto run(std::string const& session, RemoteCommand const& command) -> core::Result<RemoteOutcome> override;
  auto destroy_session(std::string const& session) -> core::Result<void> override;

  [[nodiscard]] auto reachable() -> bool override;
};

// Splits curl output written with `-w "\n%{http_code}"` into body and status.
auto split_http_status(std::string_view output) -> core::Result<std::pair<std::string, int>>;

} // namespace xrun::exec
