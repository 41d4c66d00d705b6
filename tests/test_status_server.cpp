/**
 * @file test_status_server.cpp
 * @brief Tests for status_server.hpp
 */

#include <catch2/catch.hpp>

#ifdef FORGE_HAS_SOCKPP

#include "forge/status_server.hpp"

#include <chrono>
#include <cstring>
#include <string>
#include <thread>
#include <vector>

using forge::net::TcpClient;

namespace {

constexpr char kRequest[] =
    "GET /status HTTP/1.1\r\n"
    "Host: localhost\r\n"
    "\r\n";

bool WaitForWaiters(const forge::StatusRegister& reg, uint32_t n) {
  for (int i = 0; i < 3000; ++i) {
    if (reg.WaiterCount() >= n) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return false;
}

TcpClient SendRequest(uint16_t port) {
  auto r = TcpClient::Connect("127.0.0.1", port, 1000);
  REQUIRE(r.has_value());
  TcpClient client = std::move(r.value());
  REQUIRE(client.SendAll(kRequest, sizeof(kRequest) - 1U).has_value());
  REQUIRE(client.SetRecvTimeout(5000U));
  return client;
}

/// Read until the server closes the connection.
std::string ReadAll(TcpClient& client) {
  std::string out;
  char buf[256];
  for (;;) {
    auto n = client.Recv(buf, sizeof(buf));
    if (!n.has_value() || n.value() == 0U) break;
    out.append(buf, n.value());
  }
  return out;
}

void Publish(forge::StatusRegister& status) {
  status.Set(forge::Outcome::Healthy(forge::TransitionKind::kReset,
                                     forge::SystemSnapshot{}));
}

}  // namespace

TEST_CASE("StatusServer binds a free port and stops idempotently", "[status_server]") {
  forge::StatusRegister status;
  forge::StatusServer server(status);
  REQUIRE(!server.IsRunning());
  REQUIRE(server.Port() == 0U);

  auto port = server.Start();
  REQUIRE(port.has_value());
  REQUIRE(port.value() > 0U);
  REQUIRE(server.IsRunning());
  REQUIRE(server.Port() == port.value());

  server.Stop();
  REQUIRE(!server.IsRunning());
  REQUIRE(server.Port() == 0U);
  server.Stop();
  REQUIRE(!server.IsRunning());
}

TEST_CASE("StatusServer answers 204 after the next status change", "[status_server]") {
  forge::StatusRegister status;
  forge::StatusServer server(status);
  auto port = server.Start();
  REQUIRE(port.has_value());

  TcpClient client = SendRequest(port.value());
  REQUIRE(WaitForWaiters(status, 1U));
  REQUIRE(server.ActiveConnections() == 1U);

  Publish(status);
  std::string response = ReadAll(client);
  REQUIRE(response.rfind("HTTP/1.1 204 No Content\r\n", 0) == 0);
  REQUIRE(response.find("Access-Control-Allow-Origin: *\r\n") != std::string::npos);
}

TEST_CASE("StatusServer releases every pending request on one change", "[status_server]") {
  forge::StatusRegister status;
  forge::StatusServer server(status);
  auto port = server.Start();
  REQUIRE(port.has_value());

  std::vector<TcpClient> clients;
  for (int i = 0; i < 4; ++i) clients.push_back(SendRequest(port.value()));
  REQUIRE(WaitForWaiters(status, 4U));

  Publish(status);
  for (auto& c : clients) {
    REQUIRE(ReadAll(c).rfind("HTTP/1.1 204", 0) == 0);
  }
}

TEST_CASE("StatusServer Stop closes pending requests without a response", "[status_server]") {
  forge::StatusRegister status;
  forge::StatusServer server(status);
  auto port = server.Start();
  REQUIRE(port.has_value());

  TcpClient client = SendRequest(port.value());
  REQUIRE(WaitForWaiters(status, 1U));

  server.Stop();
  REQUIRE(ReadAll(client).empty());
  REQUIRE(server.ActiveConnections() == 0U);
  REQUIRE(status.Sequence() == 0U);
}

TEST_CASE("StatusServer Start restarts a running server", "[status_server]") {
  forge::StatusRegister status;
  forge::StatusServer server(status);
  REQUIRE(server.Start().has_value());

  auto second = server.Start();
  REQUIRE(second.has_value());
  REQUIRE(server.IsRunning());

  TcpClient client = SendRequest(second.value());
  REQUIRE(WaitForWaiters(status, 1U));
  Publish(status);
  REQUIRE(ReadAll(client).rfind("HTTP/1.1 204", 0) == 0);
}

TEST_CASE("StatusServer connection limit holds under a burst", "[status_server]") {
  forge::StatusRegister status;
  forge::StatusServer server(status);
  forge::StatusServerConfig cfg;
  cfg.max_connections = 1U;
  auto port = server.Start(cfg);
  REQUIRE(port.has_value());

  // Both connect before either request is read.
  std::vector<TcpClient> clients;
  for (int i = 0; i < 2; ++i) {
    auto r = TcpClient::Connect("127.0.0.1", port.value(), 1000);
    REQUIRE(r.has_value());
    clients.push_back(std::move(r.value()));
  }
  for (auto& c : clients) {
    (void)c.SendAll(kRequest, sizeof(kRequest) - 1U);
    REQUIRE(c.SetRecvTimeout(2000U));
  }
  REQUIRE(WaitForWaiters(status, 1U));
  REQUIRE(server.ActiveConnections() == 1U);

  Publish(status);
  int answered = 0;
  for (auto& c : clients) {
    if (ReadAll(c).rfind("HTTP/1.1 204", 0) == 0) ++answered;
  }
  REQUIRE(answered == 1);
}

#endif  // FORGE_HAS_SOCKPP
