/**
 * @file mcplinkd.cc
 * @brief Command line front end for the connection registry
 *
 * Usage: mcplinkd [--config FILE] [--servers FILE] [--log-level LEVEL]
 *                 <command> [args]
 *
 * Commands:
 *   restore                      reconnect servers recorded as connected,
 *                                then wait for SIGINT or SIGTERM
 *   list <id>                    print the tools of a server
 *   call <id> <tool> [json-args] invoke a tool and print the result
 *   status                       list configured servers and their status
 *
 * Every live connection is closed before exit.
 */

#include <signal.h>

#include <atomic>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "mcplink/config/config_error.h"
#include "mcplink/config/settings.h"
#include "mcplink/config/yaml_server_store.h"
#include "mcplink/core/errors.h"
#include "mcplink/event/event_loop.h"
#include "mcplink/json.h"
#include "mcplink/registry/connection_registry.h"
#include "mcplink/transport/child_process.h"
#include "mcplink/transport/client_factory.h"

#define MCPLINK_LOG_COMPONENT "mcplinkd"
#include "mcplink/logging/log_macros.h"

namespace mcplink {
namespace examples {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

struct CommandLine {
  std::string config_path;
  std::string servers_path;
  std::string log_level;
  std::string command;
  std::vector<std::string> args;
};

void printUsage(const char* program) {
  std::cerr << "Usage: " << program
            << " [--config FILE] [--servers FILE] [--log-level LEVEL]"
               " <command> [args]\n\n"
            << "Commands:\n"
            << "  restore                       restore connections and wait "
               "for a signal\n"
            << "  list <id>                     print the tools of a server\n"
            << "  call <id> <tool> [json-args]  invoke a tool\n"
            << "  status                        list servers and their "
               "status\n";
}

bool parseArguments(int argc, char* argv[], CommandLine& out) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto value = [&](std::string& target) {
      if (i + 1 >= argc) {
        std::cerr << "missing value for " << arg << "\n";
        return false;
      }
      target = argv[++i];
      return true;
    };

    if (arg == "--help" || arg == "-h") {
      return false;
    } else if (arg == "--config") {
      if (!value(out.config_path)) return false;
    } else if (arg == "--servers") {
      if (!value(out.servers_path)) return false;
    } else if (arg == "--log-level") {
      if (!value(out.log_level)) return false;
    } else if (out.command.empty()) {
      out.command = arg;
    } else {
      out.args.push_back(arg);
    }
  }

  if (out.command == "restore" || out.command == "status") {
    return out.args.empty();
  }
  if (out.command == "list") {
    return out.args.size() == 1;
  }
  if (out.command == "call") {
    return out.args.size() == 2 || out.args.size() == 3;
  }
  if (!out.command.empty()) {
    std::cerr << "unknown command '" << out.command << "'\n";
  }
  return false;
}

void printContent(const ContentBlock& block) {
  match(
      block,
      [](const TextContent& text) { std::cout << text.text << "\n"; },
      [](const ImageContent& image) {
        std::cout << "[image " << image.mimeType << ", " << image.data.size()
                  << " bytes base64]\n";
      },
      [](const ResourceContent& resource) {
        json j;
        to_json(j, resource);
        std::cout << j.dump(2) << "\n";
      });
}

/**
 * Owns the dispatcher thread and everything living on it, and tears them
 * down in dependency order.
 */
class Daemon {
 public:
  Daemon(const config::Settings& settings, config::YamlServerStore& store)
      : dispatcher_(event::createLibeventDispatcherFactory()->createDispatcher(
            "mcplinkd")),
        factory_(std::make_unique<transport::DefaultClientFactory>(
            *dispatcher_, settings.client)),
        registry_(std::make_unique<registry::ConnectionRegistry>(
            *dispatcher_, store, *factory_)) {
    auto stop = [this]() { requestStop(); };
    sigint_ = dispatcher_->listenForSignal(SIGINT, stop);
    sigterm_ = dispatcher_->listenForSignal(SIGTERM, stop);
    stopped_ = stop_promise_.get_future();

    loop_ = std::thread([this]() {
      dispatcher_->run(event::RunType::RunUntilExit);
    });
  }

  ~Daemon() {
    try {
      registry_->disconnectAllAsync().wait();
    } catch (const std::exception& e) {
      MCPLINK_LOG_ERROR("shutdown: {}", e.what());
    }
    dispatcher_->exit();
    loop_.join();

    // Clients may reference the factory's HTTP client; free them first
    registry_.reset();
    dispatcher_->clearDeferredDeleteList();
    factory_.reset();
    sigint_.reset();
    sigterm_.reset();
  }

  registry::ConnectionRegistry& registry() { return *registry_; }

  void waitForSignal() { stopped_.wait(); }

 private:
  void requestStop() {
    if (!stop_requested_.exchange(true)) {
      MCPLINK_LOG_INFO("signal received, shutting down");
      stop_promise_.set_value();
    }
  }

  event::DispatcherPtr dispatcher_;
  std::unique_ptr<transport::DefaultClientFactory> factory_;
  std::unique_ptr<registry::ConnectionRegistry> registry_;
  event::SignalEventPtr sigint_;
  event::SignalEventPtr sigterm_;
  std::promise<void> stop_promise_;
  std::future<void> stopped_;
  std::atomic<bool> stop_requested_{false};
  std::thread loop_;
};

int runCommand(const CommandLine& cmd,
               Daemon& daemon,
               config::YamlServerStore& store) {
  auto& registry = daemon.registry();

  if (cmd.command == "restore") {
    auto summary = registry.restoreConnectionsAsync().get();
    std::cout << "restored " << summary.succeeded << " connection(s), "
              << summary.failed << " failed\n";
    for (const auto& id : registry.getConnectedIds()) {
      std::cout << "  " << id << "\n";
    }
    std::cout << "waiting for SIGINT/SIGTERM" << std::endl;
    daemon.waitForSignal();
    return kExitOk;
  }

  if (cmd.command == "status") {
    for (const auto& id : store.ids()) {
      auto persisted = store.statusOf(id);
      std::cout << id << "\t"
                << (persisted ? toString(*persisted) : "unknown") << "\t"
                << toString(registry.getStatus(id)) << "\n";
    }
    return kExitOk;
  }

  if (cmd.command == "list") {
    auto tools = registry.getToolsAsync(cmd.args[0]).get();
    for (const auto& tool : tools) {
      std::cout << tool.name;
      if (tool.description) {
        std::cout << "\t" << *tool.description;
      }
      std::cout << "\n";
    }
    return kExitOk;
  }

  // call
  json arguments = json::object();
  if (cmd.args.size() == 3) {
    try {
      arguments = json::parse(cmd.args[2]);
    } catch (const json::parse_error& e) {
      std::cerr << "invalid JSON arguments: " << e.what() << "\n";
      return kExitUsage;
    }
  }
  auto result =
      registry.callToolAsync(cmd.args[0], cmd.args[1], arguments).get();
  for (const auto& block : result.content) {
    printContent(block);
  }
  return result.isError ? kExitFailure : kExitOk;
}

int run(int argc, char* argv[]) {
  CommandLine cmd;
  if (!parseArguments(argc, argv, cmd)) {
    printUsage(argv[0]);
    return kExitUsage;
  }

  config::Settings settings;
  std::unique_ptr<config::YamlServerStore> store;
  try {
    settings = config::loadSettings(cmd.config_path);
    if (!cmd.log_level.empty()) {
      auto level = logging::parseLogLevel(cmd.log_level);
      if (!level) {
        throw config::ConfigError("unknown log level '" + cmd.log_level + "'",
                                  "--log-level");
      }
      settings.logging.level = *level;
    }
    config::applyLoggingSettings(settings.logging);

    const std::string servers_path =
        cmd.servers_path.empty() ? settings.servers_file : cmd.servers_path;
    store = std::make_unique<config::YamlServerStore>(servers_path,
                                                      settings.default_timeout);
  } catch (const config::ConfigError& e) {
    std::cerr << e.what() << "\n";
    return kExitUsage;
  }

  transport::ignoreSigpipe();

  Daemon daemon(settings, *store);
  try {
    return runCommand(cmd, daemon, *store);
  } catch (const McpError& e) {
    std::cerr << "error (" << errorKindToString(e.kind()) << "): " << e.what()
              << "\n";
    return kExitFailure;
  }
}

}  // namespace examples
}  // namespace mcplink

int main(int argc, char* argv[]) { return mcplink::examples::run(argc, argv); }
