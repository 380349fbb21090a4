// Copyright (c) 2025 <Your Name>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <string>

#include "ysfreflector/reflector_server.hpp"

namespace {
/**
 * @brief Thread-safe logger for server messages.
 */
class Logger {
 public:
  explicit Logger(bool debug) : debug_(debug) {}

  void Log(const std::string& msg) {
    if (!debug_ && msg.compare(0, 7, "[DEBUG ") == 0) return;
    std::lock_guard<std::mutex> lock(mutex_);
    std::fprintf(stderr, "%s\n", msg.c_str());
  }

 private:
  bool debug_;
  std::mutex mutex_;
};

void PrintUsage() {
  std::fprintf(
      stderr,
      "Usage: ysfreflector [--port N] [--name S] [--desc S] [--id N] "
      "[--timeout SEC] [--debug]\n"
      "       Commands on stdin: help | list | stats | kick ADDR PORT | "
      "quit\n");
}

void PrintClients(const ysfreflector::ReflectorServer& server) {
  auto clients = server.Clients();
  std::printf("%zu linked\n", clients.size());
  for (const auto& c : clients) {
    auto idle = std::chrono::duration_cast<std::chrono::seconds>(c.idle);
    std::printf("  %-10s %s:%u idle=%llds\n", c.callsign.c_str(),
                c.address.c_str(), c.port,
                static_cast<long long>(idle.count()));
  }
}

void PrintStats(const ysfreflector::ReflectorServer& server) {
  auto s = server.GetStats();
  std::printf(
      "rx=%llu fwd=%llu tx=%llu invalid=%llu unknown=%llu rx_err=%llu "
      "tx_err=%llu links=%llu unlinks=%llu timeouts=%llu active=%llu\n",
      static_cast<unsigned long long>(s.packets_received),
      static_cast<unsigned long long>(s.packets_forwarded),
      static_cast<unsigned long long>(s.packets_sent),
      static_cast<unsigned long long>(s.invalid_packets),
      static_cast<unsigned long long>(s.unknown_sender),
      static_cast<unsigned long long>(s.recv_errors),
      static_cast<unsigned long long>(s.send_errors),
      static_cast<unsigned long long>(s.links),
      static_cast<unsigned long long>(s.unlinks),
      static_cast<unsigned long long>(s.timeouts),
      static_cast<unsigned long long>(s.active_clients));
  if (!s.last_error.empty()) {
    std::printf("last error: %s\n", s.last_error.c_str());
  }
}
}  // namespace

int main(int argc, char** argv) {
  uint16_t port = 42000;
  std::string name = ysfreflector::Options::kDefaultName;
  std::string desc = ysfreflector::Options::kDefaultDescription;
  uint32_t id = 0;
  int timeout_sec = 60;
  bool debug = false;

  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto need = [&](int n) { return i + n < argc; };
    if (a == "--port" && need(1)) {
      port = static_cast<uint16_t>(std::atoi(argv[++i]));
    } else if (a == "--name" && need(1)) {
      name = argv[++i];
    } else if (a == "--desc" && need(1)) {
      desc = argv[++i];
    } else if (a == "--id" && need(1)) {
      id = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 10));
    } else if (a == "--timeout" && need(1)) {
      timeout_sec = std::atoi(argv[++i]);
    } else if (a == "--debug") {
      debug = true;
    } else if (a == "-h" || a == "--help") {
      PrintUsage();
      return 0;
    } else {
      std::fprintf(stderr, "Unknown option: %s\n", a.c_str());
      PrintUsage();
      return 2;
    }
  }

  Logger logger(debug);
  auto log_callback = [&logger](const std::string& msg) { logger.Log(msg); };

  auto opts = ysfreflector::Options::Builder()
                  .Name(name)
                  .Description(desc)
                  .Id(id)
                  .ClientTimeout(std::chrono::seconds(timeout_sec))
                  .LogSink(log_callback)
                  .Build();

  ysfreflector::ReflectorServer server;
  if (!server.Start(port, opts)) {
    std::fprintf(stderr, "failed to start reflector: %s\n",
                 server.GetStats().last_error.c_str());
    return 1;
  }
  std::printf("%s (id %05u) running on UDP %u\n", opts.Name().c_str(),
              opts.Id(), server.Port());
  std::printf("stdin commands: help | list | stats | kick ADDR PORT | quit\n");

  char line[256];
  while (std::fgets(line, sizeof(line), stdin)) {
    size_t len = std::strlen(line);
    while (len && (line[len - 1] == '\n' || line[len - 1] == '\r'))
      line[--len] = 0;
    if (len == 0) continue;
    if (!server.IsRunning()) {
      std::fprintf(stderr, "reflector stopped: %s\n",
                   server.GetStats().last_error.c_str());
      return 1;
    }
    if (std::strcmp(line, "help") == 0) {
      PrintUsage();
      continue;
    }
    if (std::strcmp(line, "quit") == 0 || std::strcmp(line, "exit") == 0) {
      break;
    }
    if (std::strcmp(line, "list") == 0) {
      PrintClients(server);
      continue;
    }
    if (std::strcmp(line, "stats") == 0) {
      PrintStats(server);
      continue;
    }
    if (std::strncmp(line, "kick ", 5) == 0) {
      char addr[128];
      int kick_port = 0;
      if (std::sscanf(line + 5, "%127s %d", addr, &kick_port) != 2) {
        std::fprintf(stderr, "usage: kick ADDR PORT\n");
        continue;
      }
      if (server.Disconnect(addr, kick_port)) {
        std::printf("disconnected %s:%d\n", addr, kick_port);
      } else {
        std::printf("no such client %s:%d\n", addr, kick_port);
      }
      continue;
    }
    std::fprintf(stderr, "unknown command: %s\n", line);
  }

  server.Stop();
  return 0;
}
