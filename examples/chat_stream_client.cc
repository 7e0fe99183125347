/**
 * @file chat_stream_client.cc
 * @brief Streams one chat turn over the WebSocket endpoint
 *
 * USAGE:
 *   chat_stream_client --config <file> --body <file> [options]
 *
 * OPTIONS:
 *   --config <file>         YAML or JSON client configuration
 *   --body <file>           JSON object sent as the response.create body
 *   --conversation <id>     Conversation id (default: cli-conversation)
 *   --turn <id>             Turn id (default: turn-1)
 *   --verbose               Enable debug logging
 *   --help                  Show this help message
 *
 * The bearer credential is read from the CHATWS_TOKEN environment variable.
 * Every received event is printed to stdout as one JSON line. Ctrl-C closes
 * all connections, which fails the request in flight.
 */

#include <signal.h>

#include <cstdlib>
#include <fstream>
#include <future>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "chatws/chat/connection_registry.h"
#include "chatws/config/chat_socket_config.h"
#include "chatws/event/event_loop.h"
#include "chatws/event/libevent_dispatcher.h"
#include "chatws/json/json_bridge.h"
#include "chatws/logging/logger_registry.h"
#include "chatws/transport/libevent_websocket_transport.h"

#define CHATWS_LOG_COMPONENT "chatws.client"
#include "chatws/logging/log_macros.h"

using namespace chatws;

namespace {

struct ClientOptions {
  std::string config_file;
  std::string body_file;
  std::string conversation_id{"cli-conversation"};
  std::string turn_id{"turn-1"};
  bool verbose{false};
};

void printUsage(const char* program) {
  std::cerr << "USAGE: " << program << " --config <file> --body <file> "
            << "[options]\n\n";
  std::cerr << "OPTIONS:\n";
  std::cerr << "  --config <file>         YAML or JSON client configuration\n";
  std::cerr << "  --body <file>           JSON request body\n";
  std::cerr << "  --conversation <id>     Conversation id "
            << "(default: cli-conversation)\n";
  std::cerr << "  --turn <id>             Turn id (default: turn-1)\n";
  std::cerr << "  --verbose               Enable debug logging\n";
  std::cerr << "  --help                  Show this help message\n";
}

bool parseArguments(int argc, char* argv[], ClientOptions& options) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      printUsage(argv[0]);
      std::exit(0);
    } else if (arg == "--config" && i + 1 < argc) {
      options.config_file = argv[++i];
    } else if (arg == "--body" && i + 1 < argc) {
      options.body_file = argv[++i];
    } else if (arg == "--conversation" && i + 1 < argc) {
      options.conversation_id = argv[++i];
    } else if (arg == "--turn" && i + 1 < argc) {
      options.turn_id = argv[++i];
    } else if (arg == "--verbose") {
      options.verbose = true;
    } else {
      std::cerr << "[ERROR] Unknown option: " << arg << std::endl;
      return false;
    }
  }
  return !options.config_file.empty() && !options.body_file.empty();
}

bool readBody(const std::string& path, json::JsonValue& body) {
  std::ifstream in(path);
  if (!in) {
    std::cerr << "[ERROR] Cannot open " << path << std::endl;
    return false;
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  try {
    body = json::JsonValue::parse(buffer.str());
  } catch (const json::JsonException& e) {
    std::cerr << "[ERROR] Invalid request body: " << e.what() << std::endl;
    return false;
  }
  if (!body.isObject()) {
    std::cerr << "[ERROR] Request body must be a JSON object" << std::endl;
    return false;
  }
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  ClientOptions options;
  if (!parseArguments(argc, argv, options)) {
    printUsage(argv[0]);
    return 1;
  }

  const char* token = std::getenv("CHATWS_TOKEN");
  if (!token || !*token) {
    std::cerr << "[ERROR] CHATWS_TOKEN is not set" << std::endl;
    return 1;
  }

  auto loaded = config::loadConfigFile(options.config_file);
  if (auto* error = getError(loaded)) {
    std::cerr << "[ERROR] " << error->message << std::endl;
    return 1;
  }
  auto settings = get<config::ChatSocketConfig>(loaded);
  if (options.verbose) {
    settings.logging.level = "debug";
  }
  auto logging_result = config::applyLoggingSettings(settings.logging);
  if (auto* error = getError(logging_result)) {
    std::cerr << "[ERROR] " << error->message << std::endl;
    return 1;
  }

  json::JsonValue body;
  if (!readBody(options.body_file, body)) {
    return 1;
  }

  auto dispatcher = std::make_unique<event::LibeventDispatcher>("chat-client");
  event::LibeventDispatcher& libevent_dispatcher = *dispatcher;
  auto factory = std::make_shared<transport::LibeventWebSocketTransportFactory>(
      libevent_dispatcher, transport::transportOptionsFromConfig(settings));
  auto registry = std::make_unique<chat::ConnectionRegistryImpl>(
      libevent_dispatcher, factory, settings);

  auto worker = event::createWorker("chat-client", std::move(dispatcher));
  worker->start();

  event::SignalEventPtr sigint;
  event::SignalEventPtr sigterm;

  // Resolves with the request, or with nothing when connecting failed
  std::promise<chat::RequestHandleSharedPtr> started;
  auto started_future = started.get_future();
  libevent_dispatcher.post([&]() {
    auto shutdown = [&registry]() {
      std::cerr << "\n[INFO] Interrupted, closing connections..." << std::endl;
      registry->closeAll();
    };
    sigint = libevent_dispatcher.listenForSignal(SIGINT, shutdown);
    sigterm = libevent_dispatcher.listenForSignal(SIGTERM, shutdown);

    registry->getOrCreate(
        options.conversation_id, options.turn_id, token,
        [&](const Result<chat::ChatConnectionSharedPtr>& result) {
          if (auto* error = getError(result)) {
            CHATWS_LOG(Error, "Connect failed: {}", error->message);
            started.set_value(nullptr);
            return;
          }
          auto connection = get<chat::ChatConnectionSharedPtr>(result);
          try {
            auto request = connection->send(body);
            request->onEvent([](const json::JsonValue& event) {
              std::cout << event.toString() << std::endl;
            });
            started.set_value(request);
          } catch (const std::exception& e) {
            CHATWS_LOG(Error, "Send failed: {}", e.what());
            started.set_value(nullptr);
          }
        });
  });

  int exit_code = 0;
  auto request = started_future.get();
  if (!request) {
    exit_code = 1;
  } else {
    try {
      request->done().get();
      CHATWS_LOG(Info, "Response completed");
    } catch (const chat::RequestError& e) {
      std::cerr << "[ERROR] " << e.what() << std::endl;
      exit_code = 1;
    }
  }

  // Connections and transports belong to the dispatcher thread
  std::promise<void> released;
  libevent_dispatcher.post([&]() {
    sigint.reset();
    sigterm.reset();
    registry->closeAll();
    registry.reset();
    factory.reset();
    released.set_value();
  });
  released.get_future().wait();
  worker->stop();
  return exit_code;
}
