#include <charconv>
#include <chrono>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "xrun/core/constant.hpp"
#include "xrun/core/log.hpp"
#include "xrun/core/string_utils.hpp"
#include "xrun/exec/sandbox_client.hpp"
#include "xrun/process/workspace.hpp"

namespace xrun::exec {

namespace {

constexpr std::chrono::seconds GATEWAY_TIMEOUT{60};

// Headroom between the remote command's own timeout and the HTTP request carrying it.
constexpr std::chrono::seconds TRANSPORT_SLACK{30};

auto dump(nlohmann::json const& document) -> std::string {
  return document.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace

auto split_http_status(std::string_view output) -> core::Result<std::pair<std::string, int>> {
  auto pos = output.rfind('\n');
  if (pos == std::string_view::npos) {
    return std::unexpected("missing HTTP status in gateway response");
  }

  auto code_text = core::util::trim(output.substr(pos + 1));
  int  code      = 0;
  auto [ptr, ec] = std::from_chars(code_text.data(), code_text.data() + code_text.size(), code);
  if (ec != std::errc{} || ptr != code_text.data() + code_text.size()) {
    return std::unexpected(fmt::format("invalid HTTP status '{}' in gateway response", code_text));
  }
  return std::pair{std::string(output.substr(0, pos)), code};
}

CurlGatewayClient::CurlGatewayClient(
    std::shared_ptr<process::ProcessRunner> runner,
    GatewayEndpoint                         endpoint,
    std::string                             curl_binary
)
    : runner_(std::move(runner)), endpoint_(std::move(endpoint)), curl_binary_(std::move(curl_binary)) {
  while (!endpoint_.url_.empty() && endpoint_.url_.back() == '/') {
    endpoint_.url_.pop_back();
  }
}

auto CurlGatewayClient::request(
    std::string_view          method,
    std::string const&        path,
    nlohmann::json const&     body,
    std::chrono::milliseconds timeout
) -> core::Result<nlohmann::json> {
  auto workspace = process::Workspace::create("xrun_gateway_");
  if (!workspace) {
    return std::unexpected(workspace.error());
  }

  auto headers = workspace->write_file(
      "headers",
      fmt::format(
          "Authorization: Bearer {}\nContent-Type: application/json\nAccept: application/json\n", endpoint_.api_key_
      )
  );
  if (!headers) {
    return std::unexpected(headers.error());
  }

  auto max_time = std::chrono::ceil<std::chrono::seconds>(timeout).count();

  // clang-format off
  std::vector<std::string> argv{
    curl_binary_, "-sS",
    "-X", std::string(method),
    "-H", fmt::format("@{}", headers->string()),
    "-w", "\n%{http_code}",
    "--max-time", fmt::format("{}", max_time),
  };
  // clang-format on

  if (!body.is_null()) {
    auto payload = workspace->write_file("body.json", dump(body));
    if (!payload) {
      return std::unexpected(payload.error());
    }
    argv.insert(argv.end(), {"--data-binary", fmt::format("@{}", payload->string())});
  }
  argv.push_back(endpoint_.url_ + path);

  process::RunRequest run;
  run.argv_     = std::move(argv);
  run.work_dir_ = workspace->path();
  run.timeout_  = timeout + std::chrono::seconds{5};

  auto outcome = runner_->run(run);
  if (!outcome) {
    return std::unexpected(fmt::format("gateway request failed: {}", outcome.error()));
  }
  if (outcome->timed_out_) {
    return std::unexpected(fmt::format("gateway request {} {} timed out", method, path));
  }
  if (!outcome->succeeded()) {
    return std::unexpected(
        fmt::format("curl exited with code {}: {}", outcome->exit_code_, core::util::trim(outcome->stderr_))
    );
  }

  auto split = split_http_status(outcome->stdout_);
  if (!split) {
    return std::unexpected(split.error());
  }
  auto const& [text, status] = *split;
  if (status < 200 || status >= 300) {
    return std::unexpected(fmt::format("gateway returned HTTP {} for {} {}", status, method, path));
  }

  if (core::util::trim(text).empty()) {
    return nlohmann::json{};
  }
  auto document = nlohmann::json::parse(text, nullptr, false);
  if (document.is_discarded()) {
    return std::unexpected(fmt::format("malformed JSON from gateway for {} {}", method, path));
  }
  return document;
}

auto CurlGatewayClient::create_session(SessionSpec const& spec) -> core::Result<std::string> {
  nlohmann::json body{
      {"template", spec.template_},
      {"memory_mb", spec.memory_mb_},
      {"cpu", spec.cpu_},
      {"network", spec.network_},
      {"timeout_sec", spec.timeout_sec_},
  };

  auto response = request("POST", "/sandboxes", body, GATEWAY_TIMEOUT);
  if (!response) {
    return std::unexpected(response.error());
  }
  if (!response->is_object() || !response->contains("id") || !(*response)["id"].is_string()) {
    return std::unexpected("gateway response carries no session id");
  }
  return (*response)["id"].get<std::string>();
}

auto CurlGatewayClient::upload(std::string const& session, std::string const& path, std::string_view content)
    -> core::Result<void> {
  nlohmann::json body{
      {"path", path},
      {"content", std::string(content)},
  };
  auto response = request("PUT", fmt::format("/sandboxes/{}/files", session), body, GATEWAY_TIMEOUT);
  if (!response) {
    return std::unexpected(response.error());
  }
  return {};
}

auto CurlGatewayClient::run(std::string const& session, RemoteCommand const& command) -> core::Result<RemoteOutcome> {
  nlohmann::json body{
      {"argv", command.argv_},
      {"cwd", command.cwd_},
      {"timeout_sec", std::chrono::ceil<std::chrono::seconds>(command.timeout_).count()},
  };

  auto response =
      request("POST", fmt::format("/sandboxes/{}/commands", session), body, command.timeout_ + TRANSPORT_SLACK);
  if (!response) {
    return std::unexpected(response.error());
  }
  if (!response->is_object()) {
    return std::unexpected("gateway returned no command result");
  }

  RemoteOutcome outcome;
  outcome.stdout_    = response->value("stdout", std::string{});
  outcome.stderr_    = response->value("stderr", std::string{});
  outcome.exit_code_ = response->value("exit_code", -1);
  outcome.timed_out_ = response->value("timed_out", false);
  return outcome;
}

auto CurlGatewayClient::destroy_session(std::string const& session) -> core::Result<void> {
  auto response = request("DELETE", fmt::format("/sandboxes/{}", session), nlohmann::json{}, GATEWAY_TIMEOUT);
  if (!response) {
    return std::unexpected(response.error());
  }
  return {};
}

auto CurlGatewayClient::reachable() -> bool {
  std::lock_guard lock(check_mutex_);
  if (!reachable_) {
    process::RunRequest check;
    check.argv_    = {curl_binary_, "--version"};
    check.timeout_ = core::constant::CHECK_TIMEOUT;

    auto outcome = runner_->run(check);
    reachable_   = outcome && outcome->succeeded();
    core::log::debug("curl transport {}", *reachable_ ? "found" : "missing");
  }
  return *reachable_;
}

} // namespace xrun::exec
