// Copyright (c) 2024 liudegui. MIT License.
//
// forge_demo.cpp -- Supervised system with a live status endpoint.
//
// Demonstrates:
//   1. Settings from the environment, overridden by an optional properties file
//   2. A system of two components: an HTTP "greeter" and a background "ticker"
//   3. One transactional Reset(), fatal on failure
//   4. The long-poll status server (development mode): the greeter page
//      reloads itself whenever the supervised system changes state
//   5. SIGINT/SIGTERM routed to Supervisor::Stop()
//
// Usage:
//   PORT=8080 ./forge_demo [dev/env.properties]
//
// Recognized settings: PORT (required), TICK_MS, LOG_LEVEL, DEVELOPMENT,
// STATUS_PORT.

#include "forge/config.hpp"
#include "forge/log.hpp"
#include "forge/net.hpp"
#include "forge/shutdown.hpp"
#include "forge/status_server.hpp"
#include "forge/supervisor.hpp"

#include <unistd.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

extern char** environ;

// ============================================================================
// Greeter - minimal HTTP page showing the current status
// ============================================================================

class Greeter final : public forge::Component {
 public:
  Greeter(uint16_t port, const forge::StatusRegister& status, bool development,
          uint16_t status_port)
      : port_(port),
        status_(status),
        development_(development),
        status_port_(status_port) {}

  ~Greeter() override { (void)Stop(); }

  forge::expected<void, forge::Fault> Start() override {
    auto listener = forge::net::TcpServer::Listen("0.0.0.0", port_);
    if (!listener) {
      return forge::expected<void, forge::Fault>::error(forge::Fault::Make(
          static_cast<int32_t>(listener.get_error()), "listen on port %u: %s",
          static_cast<unsigned>(port_),
          forge::net::NetErrorName(listener.get_error())));
    }
    listener_ = std::move(listener).value();
    running_.store(true, std::memory_order_release);
    thread_ = std::thread([this] { ServeLoop(); });
    FORGE_LOG_INFO("Greeter", "serving on http://localhost:%u",
                   static_cast<unsigned>(port_));
    return forge::expected<void, forge::Fault>::success();
  }

  forge::expected<void, forge::Fault> Stop() override {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
      return forge::expected<void, forge::Fault>::success();
    }
    listener_.Shutdown();
    if (thread_.joinable()) thread_.join();
    listener_.Close();
    FORGE_LOG_INFO("Greeter", "stopped");
    return forge::expected<void, forge::Fault>::success();
  }

 private:
  void ServeLoop() {
    while (running_.load(std::memory_order_acquire)) {
      auto conn = listener_.Accept();
      if (!conn) continue;
      Serve(conn.value());
      conn.value().Close();
    }
  }

  void Serve(forge::net::TcpClient& client) {
    (void)client.SetRecvTimeout(1000U);
    char buf[2048];
    size_t used = 0;
    while (used < sizeof(buf) - 1U) {
      auto n = client.Recv(buf + used, sizeof(buf) - 1U - used);
      if (!n || n.value() == 0U) return;
      used += n.value();
      buf[used] = '\0';
      if (std::strstr(buf, "\r\n\r\n") != nullptr) break;
    }

    std::string body = RenderPage();
    char head[160];
    int len = std::snprintf(head, sizeof(head),
                            "HTTP/1.1 200 OK\r\n"
                            "Content-Type: text/html\r\n"
                            "Content-Length: %zu\r\n"
                            "Connection: close\r\n\r\n",
                            body.size());
    if (len <= 0) return;
    if (!client.SendAll(head, static_cast<size_t>(len))) return;
    (void)client.SendAll(body.data(), body.size());
  }

  std::string RenderPage() const {
    forge::Outcome outcome = status_.Get();
    std::string page =
        "<!doctype html><html><head><title>forge demo</title></head>"
        "<body style='padding: 1rem; font-family: monospace'>";
    page += "<p>Status: ";
    page += outcome.ok() ? "healthy" : "unhealthy";
    page += " (transition #" + std::to_string(outcome.sequence) + ")</p>";
    for (const auto& c : outcome.system.components) {
      page += "<p>";
      page += c.name.c_str();
      page += ": ";
      page += forge::ComponentStateName(c.state);
      page += "</p>";
    }
    page += "<p>Development mode: ";
    page += development_ ? "true" : "false";
    page += "</p>";
    if (development_ && status_port_ != 0U) {
      page += "<script>fetch('http://localhost:" + std::to_string(status_port_) +
              "/').then(function () { location.reload() })</script>";
    }
    page += "</body></html>";
    return page;
  }

  uint16_t port_;
  const forge::StatusRegister& status_;
  bool development_;
  uint16_t status_port_;
  forge::net::TcpServer listener_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

// ============================================================================
// Ticker - background thread doing periodic work
// ============================================================================

class Ticker final : public forge::Component {
 public:
  explicit Ticker(uint32_t interval_ms) : interval_ms_(interval_ms) {}

  ~Ticker() override { (void)Stop(); }

  forge::expected<void, forge::Fault> Start() override {
    if (interval_ms_ == 0U) {
      return forge::expected<void, forge::Fault>::error(
          forge::Fault::Make(0, "TICK_MS must be positive"));
    }
    if (thread_.joinable()) {
      return forge::expected<void, forge::Fault>::success();  // already running
    }
    {
      std::lock_guard<std::mutex> lk(mtx_);
      quit_ = false;
    }
    thread_ = std::thread([this] { Run(); });
    return forge::expected<void, forge::Fault>::success();
  }

  forge::expected<void, forge::Fault> Stop() override {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      quit_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
    return forge::expected<void, forge::Fault>::success();
  }

 private:
  void Run() {
    uint64_t ticks = 0;
    std::unique_lock<std::mutex> lk(mtx_);
    while (!cv_.wait_for(lk, std::chrono::milliseconds(interval_ms_),
                         [this] { return quit_; })) {
      FORGE_LOG_DEBUG("Ticker", "tick %llu", static_cast<unsigned long long>(++ticks));
    }
  }

  uint32_t interval_ms_;
  std::mutex mtx_;
  std::condition_variable cv_;
  std::thread thread_;
  bool quit_ = false;
};

// ============================================================================
// Shutdown hooks
// ============================================================================

struct StopContext {
  forge::Supervisor* supervisor = nullptr;
  bool ok = true;
};

static void StopSystem(void* ctx, int signo) {
  auto* sc = static_cast<StopContext*>(ctx);
  FORGE_LOG_INFO("Main", "shutdown requested (signal %d)", signo);
  sc->ok = sc->supervisor->Stop().has_value();
}

static void StopStatusServer(void* ctx, int) {
  static_cast<forge::StatusServer*>(ctx)->Stop();
}

// ============================================================================
// main
// ============================================================================

int main(int argc, char* argv[]) {
  forge::log::Init();

  auto settings = std::make_unique<forge::Settings>();
  if (!settings->MergeEnvironment(environ)) {
    FORGE_LOG_ERROR("Main", "environment does not fit into the settings store");
    return 1;
  }
  if (argc > 1) {
    auto loaded = settings->LoadFile(argv[1]);
    if (!loaded) {
      FORGE_LOG_ERROR("Main", "cannot load %s (error %d)", argv[1],
                      static_cast<int>(loaded.get_error()));
      return 1;
    }
  }
  forge::log::SetLevel(
      forge::log::ParseLevel(settings->GetString("", "LOG_LEVEL", "info")));

  forge::StatusRegister status;
  forge::Supervisor supervisor(status);
  supervisor.SetDevelopment(settings->GetBool("", "DEVELOPMENT", true));

  forge::StatusServer status_server(status);
  uint16_t status_port = 0;
  if (supervisor.IsDevelopment()) {
    forge::StatusServerConfig cfg;
    cfg.port = settings->GetPort("", "STATUS_PORT", 0);
    auto started = status_server.Start(cfg);
    if (started) {
      status_port = started.value();
    } else {
      FORGE_LOG_WARN("Main", "status server unavailable, pages will not auto-refresh");
    }
  }

  const forge::Settings& cfg = *settings;
  const bool development = supervisor.IsDevelopment();
  supervisor.SetConstructor([&cfg, &status, development, status_port](
                                const forge::System*) {
    using Result = forge::expected<forge::System, forge::Fault>;
    auto port = cfg.GetStrict("", "PORT");
    if (!port) {
      return Result::error(forge::Fault::Make(0, "PORT is not configured"));
    }
    auto port_num = cfg.FindInt("", "PORT");
    if (!port_num.has_value() || port_num.value() <= 0 || port_num.value() > 65535) {
      return Result::error(forge::Fault::Make(0, "PORT is not a port: %s", port.value()));
    }

    forge::System sys;
    auto added = sys.Emplace<Ticker>(
        "ticker", static_cast<uint32_t>(cfg.GetInt("", "TICK_MS", 1000)));
    if (added) {
      added = sys.Emplace<Greeter>("greeter", static_cast<uint16_t>(port_num.value()),
                                   status, development, status_port);
    }
    if (!added) {
      return Result::error(forge::Fault::Make(0, "cannot assemble the system"));
    }
    return Result::success(std::move(sys));
  });

  auto reset = supervisor.Reset();
  if (!reset) {
    const forge::TransitionFailure& f = reset.get_error();
    FORGE_LOG_ERROR("Main", "%s: %s", forge::ResetErrorName(f.error),
                    f.cause.message.c_str());
    (void)supervisor.Stop();
    return 1;
  }

  forge::ShutdownSignal shutdown;
  StopContext stop_ctx;
  stop_ctx.supervisor = &supervisor;
  // Hooks run newest first: the system stops before the status server.
  if (!shutdown.Register(&StopStatusServer, &status_server) ||
      !shutdown.Register(&StopSystem, &stop_ctx) || !shutdown.Install()) {
    FORGE_LOG_ERROR("Main", "cannot install the shutdown handler");
    (void)supervisor.Stop();
    return 1;
  }

  FORGE_LOG_INFO("Main", "running %u components, Ctrl-C to stop",
                 reset.value().Size());
  shutdown.Wait();
  forge::log::Shutdown();
  return stop_ctx.ok ? 0 : 1;
}
