#include <asio.hpp>
#include <csignal>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

#include "warden/warden.hpp"

using namespace warden;

// Permission request waiting for the next input line
static std::mutex g_pending_mutex;
static std::optional<Session::PermissionRespond> g_pending_respond;

// Ctrl+C aborts the running turn
static void wait_interrupt(asio::signal_set& signals, std::shared_ptr<Session> session) {
  signals.async_wait([&signals, session](const asio::error_code& ec, int) {
    if (ec) return;
    std::cout << "\n[Interrupted]\n" << std::flush;
    session->abort();
    wait_interrupt(signals, session);
  });
}

static void print_event(const OutwardEvent& event) {
  const auto& data = event.data;
  switch (event.type) {
    case EventType::Message:
      if (data.value("role", "") == "assistant") {
        std::cout << data.value("content", "") << std::flush;
      }
      break;
    case EventType::ToolUse:
      std::cout << "\n[Calling tool: " << data.value("tool-name", "") << "]\n";
      break;
    case EventType::ToolResult: {
      auto content = data.value("content", "");
      if (content.size() > 500) {
        content = content.substr(0, 500) + "...";
      }
      std::cout << "[Tool " << (data.value("is-error", false) ? "failed" : "completed") << ": " << content << "]\n";
      break;
    }
    case EventType::PermissionRequest:
      std::cout << "\n[Permission requested: " << data.value("tool-name", "") << "]\n";
      std::cout << data["input"].dump(2) << "\n";
      if (!data.value("inferred-pattern", "").empty()) {
        std::cout << "Pattern: " << data.value("inferred-pattern", "") << "\n";
      }
      std::cout << "Allow? (y/n/a = always): " << std::flush;
      break;
    case EventType::PermissionTimeout:
      std::cout << "\n[Permission request timed out]\n> " << std::flush;
      break;
    case EventType::Done:
      std::cout << "\n[tokens: " << data.value("total-tokens", 0) << "]\n> " << std::flush;
      break;
    case EventType::Aborted:
      std::cout << "\n[Aborted]\n> " << std::flush;
      break;
    case EventType::Error:
      std::cerr << "\n[Error: " << data.value("message", "") << "]\n> " << std::flush;
      break;
    default:
      break;
  }
}

// Answers the waiting permission request, if any; returns false otherwise
static bool answer_permission(const std::string& input) {
  std::optional<Session::PermissionRespond> respond;
  {
    std::lock_guard lock(g_pending_mutex);
    respond.swap(g_pending_respond);
  }
  if (!respond) return false;

  PermissionResponse response;
  response.allow = input == "y" || input == "Y" || input == "yes" || input == "a";
  response.remember = input == "a";
  if (!response.allow) {
    response.message = "Denied by user";
  }
  (*respond)(std::move(response));
  return true;
}

int main(int argc, char* argv[]) {
  auto config = Config::from_env();
  if (argc > 1) {
    config.working_dir = argv[1];
  }
  warden::init(config);

  asio::io_context io_ctx;
  auto work = asio::make_work_guard(io_ctx);
  std::thread io_thread([&io_ctx] { io_ctx.run(); });

  auto network = std::make_unique<AgentNetwork>(io_ctx, config);
  auto session = network->main_agent();

  network->events()->subscribe(io_ctx.get_executor(), print_event);
  session->set_permission_handler([](const PermissionRequest&, Session::PermissionRespond respond) {
    std::lock_guard lock(g_pending_mutex);
    g_pending_respond = std::move(respond);
  });

  asio::signal_set signals(io_ctx, SIGINT);
  wait_interrupt(signals, session);

  std::cout << "warden " << version() << " in " << config.working_dir.string() << "\n";
  std::cout << "Commands: /abort, /restart, /q\n\n> " << std::flush;

  std::string line;
  while (std::getline(std::cin, line)) {
    if (answer_permission(line)) {
      continue;
    }

    if (line == "/q" || line == "/quit") {
      break;
    } else if (line == "/abort") {
      session->abort();
    } else if (line == "/restart") {
      session->restart();
      std::cout << "> " << std::flush;
    } else if (!line.empty()) {
      session->send_message(line);
    } else {
      std::cout << "> " << std::flush;
    }
  }

  asio::post(io_ctx, [&signals] { signals.cancel(); });
  session.reset();
  network.reset();

  work.reset();
  io_thread.join();

  warden::shutdown();
  return 0;
}
