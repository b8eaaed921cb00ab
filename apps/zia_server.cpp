#include "zia.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <sockpp/socket.h>
#include <thread>

namespace {

std::atomic<bool> g_terminate{false};

void on_signal(int /* sig */) { g_terminate.store(true); }

}  // namespace

int main(int argc, char* argv[]) {
  int exit_code = 0;
  auto config = zia::parse_server_config(argc, argv, exit_code);
  if (!config.has_value()) {
    return exit_code;
  }
  zia::Logger::set_level(config->log_level);

  sockpp::initialize();
  std::signal(SIGPIPE, SIG_IGN);
  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  try {
    zia::Server server(config.value());

    std::atomic<bool> finished{false};
    auto result = zia::expected<void, zia::ErrorCode>::success();
    std::thread runner([&] {
      result = server.run();
      finished.store(true);
    });

    while (!finished.load()) {
      if (g_terminate.load()) {
        ZIA_LOG_INFO("Termination signal received, quitting...");
        server.stop();
        break;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    runner.join();

    if (!result.has_value()) {
      return 1;
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
