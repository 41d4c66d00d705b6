/**
 * @file status_server.hpp
 * @brief HTTP long-poll endpoint that answers once the status changes.
 *
 * Each request is held open until the StatusRegister publishes the next
 * outcome, then answered with `204 No Content`. A development page issues
 * the request in the background and reloads itself when it completes, so
 * every reset or stop refreshes the browser.
 *
 * The server only reads the register; it never drives the Supervisor.
 *
 * Usage:
 * @code
 *   forge::StatusServer server(status);
 *   if (server.Start()) {
 *     FORGE_LOG_INFO("Main", "status on http://localhost:%u", server.Port());
 *   }
 * @endcode
 */

#ifndef FORGE_STATUS_SERVER_HPP_
#define FORGE_STATUS_SERVER_HPP_

#include "forge/log.hpp"
#include "forge/net.hpp"
#include "forge/platform.hpp"
#include "forge/status.hpp"
#include "forge/vocabulary.hpp"

#include <atomic>
#include <cstdint>
#include <cstring>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace forge {

struct StatusServerConfig {
  const char* host = "127.0.0.1";
  uint16_t port = 0;               ///< 0 picks a free port
  uint32_t max_connections = 64;   ///< Further connections are refused
  uint32_t poll_interval_ms = 100; ///< Granularity at which Stop() is noticed
};

class StatusServer final {
 public:
  explicit StatusServer(StatusRegister& status) noexcept : status_(status) {}

  ~StatusServer() { Stop(); }

  StatusServer(const StatusServer&) = delete;
  StatusServer& operator=(const StatusServer&) = delete;

  /**
   * @brief Start listening. A running server is stopped first.
   * @return The bound port on success.
   */
  expected<uint16_t, net::NetError> Start(const StatusServerConfig& cfg = {}) {
    std::lock_guard<std::mutex> lk(lifecycle_mtx_);
    StopLocked();

    auto listener = net::TcpServer::Listen(cfg.host, cfg.port);
    if (!listener) {
      FORGE_LOG_ERROR("StatusServer", "listen on %s:%u: %s", cfg.host,
                      static_cast<unsigned>(cfg.port),
                      net::NetErrorName(listener.get_error()));
      return expected<uint16_t, net::NetError>::error(listener.get_error());
    }

    cfg_ = cfg;
    listener_ = std::move(listener).value();
    port_.store(listener_.LocalPort(), std::memory_order_release);
    running_.store(true, std::memory_order_release);
    accept_thread_ = std::thread([this] { AcceptLoop(); });

    FORGE_LOG_INFO("StatusServer", "listening on %s:%u", cfg.host,
                   static_cast<unsigned>(Port()));
    return expected<uint16_t, net::NetError>::success(Port());
  }

  /// Stop listening and release every pending request. Idempotent.
  void Stop() {
    std::lock_guard<std::mutex> lk(lifecycle_mtx_);
    StopLocked();
  }

  bool IsRunning() const noexcept {
    return running_.load(std::memory_order_acquire);
  }

  /// Bound port, or 0 when stopped.
  uint16_t Port() const noexcept { return port_.load(std::memory_order_acquire); }

  uint32_t ActiveConnections() const noexcept {
    return active_.load(std::memory_order_relaxed);
  }

 private:
  struct WorkerEntry {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> finished;
  };

  void StopLocked() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) return;

    listener_.Shutdown();
    if (accept_thread_.joinable()) accept_thread_.join();
    listener_.Close();

    std::vector<WorkerEntry> workers;
    {
      std::lock_guard<std::mutex> wl(workers_mtx_);
      workers.swap(workers_);
    }
    for (auto& w : workers) {
      if (w.thread.joinable()) w.thread.join();
    }
    port_.store(0, std::memory_order_release);
    FORGE_LOG_INFO("StatusServer", "stopped");
  }

  void ReapFinishedWorkers() {
    std::lock_guard<std::mutex> wl(workers_mtx_);
    for (size_t i = 0; i < workers_.size();) {
      if (workers_[i].finished->load(std::memory_order_acquire)) {
        if (workers_[i].thread.joinable()) workers_[i].thread.join();
        workers_[i] = std::move(workers_.back());
        workers_.pop_back();
      } else {
        ++i;
      }
    }
  }

  void AcceptLoop() {
    while (running_.load(std::memory_order_acquire)) {
      ReapFinishedWorkers();

      auto conn = listener_.Accept();
      if (!conn) {
        if (!running_.load(std::memory_order_acquire)) break;
        FORGE_LOG_WARN("StatusServer", "%s",
                       net::NetErrorName(conn.get_error()));
        continue;
      }
      if (active_.load(std::memory_order_relaxed) >= cfg_.max_connections) {
        FORGE_LOG_WARN("StatusServer", "connection limit reached");
        continue;
      }

      // Taken before the worker starts so that no change in between is lost.
      const uint64_t seen = status_.Sequence();
      auto finished = std::make_shared<std::atomic<bool>>(false);
      auto client = std::make_shared<net::TcpClient>(std::move(conn).value());
      // Released by the worker when it finishes.
      active_.fetch_add(1, std::memory_order_relaxed);
      std::lock_guard<std::mutex> wl(workers_mtx_);
      workers_.push_back(WorkerEntry{
          std::thread([this, client, seen, finished] {
            HandleConnection(*client, seen);
            client->Close();
            active_.fetch_sub(1, std::memory_order_relaxed);
            finished->store(true, std::memory_order_release);
          }),
          finished});
    }
  }

  void HandleConnection(net::TcpClient& client, uint64_t seen) {
    if (!ReadRequestHead(client)) return;

    while (running_.load(std::memory_order_acquire)) {
      auto changed = status_.AwaitChangeAfter(seen, cfg_.poll_interval_ms);
      if (changed) {
        static constexpr char kResponse[] =
            "HTTP/1.1 204 No Content\r\n"
            "Access-Control-Allow-Origin: *\r\n"
            "Connection: close\r\n"
            "\r\n";
        auto sent = client.SendAll(kResponse, sizeof(kResponse) - 1U);
        if (!sent) {
          FORGE_LOG_DEBUG("StatusServer", "client went away before the change");
        }
        return;
      }
    }
  }

  /// Consume the request up to the blank line; the request itself is ignored.
  bool ReadRequestHead(net::TcpClient& client) {
    (void)client.SetRecvTimeout(cfg_.poll_interval_ms);
    char buf[1024];
    size_t used = 0;
    while (running_.load(std::memory_order_acquire)) {
      auto n = client.Recv(buf + used, sizeof(buf) - 1U - used);
      if (!n) {
        if (n.get_error() == net::NetError::kTimeout) continue;
        return false;
      }
      if (n.value() == 0U) return false;
      used += n.value();
      buf[used] = '\0';
      if (std::strstr(buf, "\r\n\r\n") != nullptr) return true;
      if (used == sizeof(buf) - 1U) return true;  // oversized head, answer anyway
    }
    return false;
  }

  StatusRegister& status_;
  StatusServerConfig cfg_;
  net::TcpServer listener_;
  std::thread accept_thread_;
  std::mutex lifecycle_mtx_;
  std::mutex workers_mtx_;
  std::vector<WorkerEntry> workers_;
  std::atomic<bool> running_{false};
  std::atomic<uint16_t> port_{0};
  std::atomic<uint32_t> active_{0};
};

}  // namespace forge

#endif  // FORGE_STATUS_SERVER_HPP_
