#include "config/agent_config.hpp"

#include <unistd.h>

#include <charconv>
#include <format>
#include <string_view>

#include "util/logging.hpp"
#include "util/utils.hpp"

namespace pollagent {

namespace {

bool parse_int(std::string_view value, int* out) {
  if (value.empty()) {
    return false;
  }
  auto result = std::from_chars(value.data(), value.data() + value.size(), *out);
  return result.ec == std::errc() && result.ptr == value.data() + value.size();
}

bool parse_seconds(const std::string& flag, std::string_view value, int* out,
                   std::string* error) {
  int parsed = 0;
  if (!parse_int(value, &parsed) || parsed < 0) {
    *error = std::format("invalid value for --{}: '{}'", flag, value);
    return false;
  }
  *out = parsed;
  return true;
}

}  // namespace

std::string agent_usage(const char* program) {
  return std::format(
      "Usage: {} [options]\n"
      "  --pipeline=FILE            pipeline definition (default {})\n"
      "  --namespaces=A,B           pollster namespaces (default {})\n"
      "  --pollster-list=P1,P2      only load pollsters matching these globs\n"
      "  --group-prefix=PREFIX      partition group prefix\n"
      "  --backend-url=URL          coordination backend, grpc://host:port\n"
      "  --heartbeat=SECONDS        coordination heartbeat period (default {})\n"
      "  --shuffle-time=SECONDS     random delay before first poll (default 0)\n"
      "  --poll-timeout=SECONDS     per plugin call timeout, 0 = none\n"
      "  --refresh-pipeline=SECONDS reload pipeline file on change, 0 = off\n"
      "  --agent-id=ID              member id (default hostname-pid)\n"
      "  --log-dir=DIR              log directory\n",
      program, kDefaultPipelineFile, kDefaultNamespace, kDefaultHeartbeat);
}

std::string default_agent_id() {
  return std::format("{}-{}", get_hostname(), static_cast<long>(::getpid()));
}

bool parse_agent_args(int argc, const char* const argv[], AgentConfig* config,
                      std::string* error) {
  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      *error = agent_usage(argv[0]);
      return false;
    }
    if (arg.rfind("--", 0) != 0) {
      *error = std::format("unexpected argument '{}'", arg);
      return false;
    }
    auto eq = arg.find('=');
    if (eq == std::string_view::npos) {
      *error = std::format("option '{}' needs a value (--key=value)", arg);
      return false;
    }
    std::string key(arg.substr(2, eq - 2));
    std::string_view value = arg.substr(eq + 1);

    if (key == "pipeline") {
      config->pipeline_cfg_file = std::string(value);
    } else if (key == "namespaces") {
      config->namespaces = split(std::string(value), ',');
    } else if (key == "pollster-list") {
      config->pollster_list = split(std::string(value), ',');
    } else if (key == "group-prefix") {
      config->group_prefix = std::string(value);
    } else if (key == "backend-url") {
      config->backend_url = std::string(value);
    } else if (key == "heartbeat") {
      if (!parse_seconds(key, value, &config->heartbeat, error)) return false;
    } else if (key == "shuffle-time") {
      if (!parse_seconds(key, value, &config->shuffle_time_before_polling_task,
                         error))
        return false;
    } else if (key == "poll-timeout") {
      if (!parse_seconds(key, value, &config->poll_call_timeout, error))
        return false;
    } else if (key == "refresh-pipeline") {
      if (!parse_seconds(key, value, &config->refresh_pipeline_interval, error))
        return false;
    } else if (key == "agent-id") {
      config->agent_id = std::string(value);
    } else if (key == "log-dir") {
      config->log_dir = std::string(value);
    } else {
      *error = std::format("unknown option '--{}'", key);
      return false;
    }
  }

  if (config->namespaces.empty()) {
    *error = "at least one namespace is required";
    return false;
  }
  if (config->heartbeat <= 0) {
    *error = "--heartbeat must be positive";
    return false;
  }
  if (config->agent_id.empty()) {
    config->agent_id = default_agent_id();
  }
  if (config->log_dir.empty()) {
    config->log_dir = kDefaultAgentLogDir;
  }
  return true;
}

}  // namespace pollagent
