// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "errors.hpp"
#include "network/message.hpp"
#include "session/session_builder.hpp"
#include "util/logging.hpp"
#include "version.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <future>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>  // For write(), STDOUT_FILENO (async-signal-safe)

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_USAGE = 1;
constexpr int EXIT_CONFIG = 2;
constexpr int EXIT_SETTINGS = 3;
constexpr int EXIT_IO = 4;

const skiff::network::MessageType ECHO{1, "echo"};

std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int) {
  static const char msg[] = "\nReceived signal\n";
  (void)write(STDOUT_FILENO, msg, sizeof(msg) - 1);
  g_shutdown_requested = true;
}

void setup_signal_handlers() {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);
  // Ignore SIGPIPE to prevent crashes on broken network connections
  std::signal(SIGPIPE, SIG_IGN);
}

// Replies with the message it was given.
class EchoHandler : public skiff::network::MessageHandler {
public:
  std::optional<skiff::network::Message> handle(const skiff::network::Message& message,
                                                const skiff::network::MessageContext& context) override {
    LOG_APP_INFO("echo {} from {}:{}", message.to_string(), context.remote_address, context.remote_port);
    return message;
  }
};

// Hands the first reply to whoever is waiting on the future.
class ReplyHandler : public skiff::network::MessageHandler {
public:
  explicit ReplyHandler(std::shared_ptr<std::promise<skiff::network::Message>> reply) : reply_(std::move(reply)) {}

  std::optional<skiff::network::Message> handle(const skiff::network::Message& message,
                                                const skiff::network::MessageContext&) override {
    if (!delivered_.exchange(true)) {
      reply_->set_value(message);
    }
    return std::nullopt;
  }

private:
  std::shared_ptr<std::promise<skiff::network::Message>> reply_;
  std::atomic<bool> delivered_{false};
};

void PrintUsage(const char* program_name) {
  std::cout << "Skiff - SCTP message endpoints\n\n"
            << "Usage: " << program_name << " [options] <command> [params] [--setting value ...]\n\n"
            << "Options:\n"
            << "  --log-level=<level>  trace, debug, info, warn, error (default: info)\n"
            << "  --version            Show version information\n"
            << "  --help               Show this help message\n\n"
            << "Commands:\n"
            << "  server                       Run an echo server (type 1) until interrupted\n"
            << "  send <type-id> <json>        Send one message and print the reply, if any\n\n"
            << "Settings (also read from skiff.properties in /etc, /opt/local/etc, ~ and .):\n"
            << "  --host <address>             Host to bind or connect to (default: 127.0.0.1)\n"
            << "  --port <port>                Port (default: 8007)\n"
            << "  --acceptor.threads <n>       Acceptor / event loop threads (default: 1)\n"
            << "  --worker.threads <n>         Server worker threads, -1 for 2 x cores (default: -1)\n"
            << "  --encoding <bson|json>       Payload encoding (default: bson)\n"
            << "  --reply.timeout_ms <ms>      How long send waits for a reply (default: 2000)\n"
            << std::endl;
}

int RunServer(std::vector<std::string> settings_args) {
  skiff::session::SessionBuilder builder;
  builder.bind<EchoHandler>(ECHO);

  auto control = builder.build_server(std::move(settings_args));
  auto& server = control.get();
  std::cout << "Listening on " << server.host() << ":" << server.local_port() << " ("
            << skiff::network::encoding_name(control.config().encoding) << ")" << std::endl;

  setup_signal_handlers();
  while (!g_shutdown_requested) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  control.shutdown();
  return EXIT_OK;
}

int RunSend(const std::string& type_arg, const std::string& body_arg, std::vector<std::string> settings_args) {
  int type_id = 0;
  auto [ptr, ec] = std::from_chars(type_arg.data(), type_arg.data() + type_arg.size(), type_id);
  if (ec != std::errc{} || ptr != type_arg.data() + type_arg.size() || type_id < 0 || type_id > 0xFFFF) {
    std::cerr << "Error: type id must be an integer in 0..65535, got '" << type_arg << "'\n";
    return EXIT_USAGE;
  }

  nlohmann::json body;
  try {
    body = nlohmann::json::parse(body_arg);
  } catch (const nlohmann::json::parse_error& e) {
    std::cerr << "Error: body is not valid JSON: " << e.what() << "\n";
    return EXIT_USAGE;
  }

  skiff::network::MessageType type(static_cast<uint16_t>(type_id), "cli");
  auto reply = std::make_shared<std::promise<skiff::network::Message>>();
  std::future<skiff::network::Message> reply_future = reply->get_future();

  skiff::session::SessionBuilder builder;
  builder.bind(type, skiff::network::HandlerDescriptor{"ReplyHandler", [reply]() {
                                                         return std::make_unique<ReplyHandler>(reply);
                                                       }});

  auto control = builder.build_sender(std::move(settings_args));
  const auto& config = control.config();
  int timeout_ms = config.settings.get_int("reply.timeout_ms").value_or(2000);

  if (!control.get().send(type, body)) {
    std::cerr << "Error: association to " << config.host << ":" << config.port << " closed\n";
    return EXIT_IO;
  }

  if (reply_future.wait_for(std::chrono::milliseconds(timeout_ms)) == std::future_status::ready) {
    std::cout << reply_future.get().to_string() << std::endl;
  } else {
    LOG_APP_INFO("no reply for {} within {} ms", type.to_string(), timeout_ms);
  }

  control.shutdown();
  return EXIT_OK;
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    PrintUsage(argv[0]);
    return EXIT_USAGE;
  }

  std::string log_level = "info";
  std::string command;
  std::vector<std::string> params;
  std::vector<std::string> settings_args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      PrintUsage(argv[0]);
      return EXIT_OK;
    } else if (arg == "--version" || arg == "-v") {
      std::cout << skiff::GetFullVersionString() << std::endl;
      std::cout << skiff::GetCopyrightString() << std::endl;
      return EXIT_OK;
    } else if (arg.starts_with("--log-level=")) {
      log_level = arg.substr(12);
    } else if (arg.starts_with("--")) {
      // Everything else from here on is a setting for the builder
      settings_args.assign(argv + i, argv + argc);
      break;
    } else if (command.empty()) {
      command = arg;
    } else {
      params.push_back(arg);
    }
  }

  skiff::util::LogManager::Initialize(log_level);

  int rc = EXIT_USAGE;
  try {
    if (command == "server" && params.empty()) {
      rc = RunServer(std::move(settings_args));
    } else if (command == "send" && params.size() == 2) {
      rc = RunSend(params[0], params[1], std::move(settings_args));
    } else {
      std::cerr << "Error: unknown command or wrong number of parameters\n";
      PrintUsage(argv[0]);
      rc = EXIT_USAGE;
    }
  } catch (const skiff::ConfigurationError& e) {
    std::cerr << "Configuration error: " << e.what() << "\n";
    rc = EXIT_CONFIG;
  } catch (const skiff::SettingsLoadError& e) {
    std::cerr << "Settings error: " << e.what() << "\n";
    rc = EXIT_SETTINGS;
  } catch (const skiff::IOError& e) {
    std::cerr << "I/O error: " << e.what() << "\n";
    rc = EXIT_IO;
  } catch (const skiff::CodecError& e) {
    std::cerr << "Error: " << e.what() << "\n";
    rc = EXIT_USAGE;
  }

  skiff::util::LogManager::Shutdown();
  return rc;
}
