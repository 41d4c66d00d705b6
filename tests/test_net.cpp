/**
 * @file test_net.cpp
 * @brief Tests for forge::net (sockpp integration layer).
 */

#include <catch2/catch.hpp>

#ifdef FORGE_HAS_SOCKPP

#include "forge/net.hpp"

#include <atomic>
#include <chrono>
#include <cstring>
#include <thread>

using namespace forge::net;

TEST_CASE("TcpServer listens on an OS-assigned port", "[net][tcp]") {
  auto server_r = TcpServer::Listen("127.0.0.1", 0);
  REQUIRE(server_r.has_value());
  auto server = std::move(server_r.value());
  REQUIRE(server.IsOpen());
  REQUIRE(server.Fd() >= 0);
  REQUIRE(server.LocalPort() > 0);

  server.Close();
  REQUIRE(!server.IsOpen());
  REQUIRE(server.LocalPort() == 0);
}

TEST_CASE("TcpClient exchanges data with an accepted connection", "[net][tcp]") {
  auto server_r = TcpServer::Listen("127.0.0.1", 0);
  REQUIRE(server_r.has_value());
  auto server = std::move(server_r.value());
  const uint16_t port = server.LocalPort();

  std::atomic<bool> server_ok{false};
  std::thread server_thread([&server, &server_ok]() {
    auto accepted_r = server.Accept();
    if (!accepted_r.has_value()) return;
    auto accepted = std::move(accepted_r.value());

    char buf[64] = {};
    auto recv_r = accepted.Recv(buf, sizeof(buf) - 1U);
    if (!recv_r.has_value() || std::strcmp(buf, "ping") != 0) return;
    auto send_r = accepted.SendAll("pong", 4U);
    server_ok.store(send_r.has_value());
  });

  auto client_r = TcpClient::Connect("127.0.0.1", port, 1000);
  REQUIRE(client_r.has_value());
  auto client = std::move(client_r.value());

  auto send_r = client.SendAll("ping", 4U);
  REQUIRE(send_r.has_value());
  REQUIRE(send_r.value() == 4U);

  char buf[64] = {};
  auto recv_r = client.Recv(buf, sizeof(buf) - 1U);
  REQUIRE(recv_r.has_value());
  REQUIRE(recv_r.value() == 4U);
  REQUIRE(std::strcmp(buf, "pong") == 0);

  server_thread.join();
  REQUIRE(server_ok.load());
}

TEST_CASE("TcpClient reports a closed peer as a zero-length read", "[net][tcp]") {
  auto server_r = TcpServer::Listen("127.0.0.1", 0);
  REQUIRE(server_r.has_value());
  auto server = std::move(server_r.value());

  auto client_r = TcpClient::Connect("127.0.0.1", server.LocalPort(), 1000);
  REQUIRE(client_r.has_value());
  auto client = std::move(client_r.value());

  auto accepted_r = server.Accept();
  REQUIRE(accepted_r.has_value());
  accepted_r.value().Close();

  char buf[8];
  auto recv_r = client.Recv(buf, sizeof(buf));
  REQUIRE(recv_r.has_value());
  REQUIRE(recv_r.value() == 0U);
}

TEST_CASE("TcpClient Recv times out when nothing arrives", "[net][tcp]") {
  auto server_r = TcpServer::Listen("127.0.0.1", 0);
  REQUIRE(server_r.has_value());
  auto server = std::move(server_r.value());

  auto client_r = TcpClient::Connect("127.0.0.1", server.LocalPort(), 1000);
  REQUIRE(client_r.has_value());
  auto client = std::move(client_r.value());
  auto accepted_r = server.Accept();
  REQUIRE(accepted_r.has_value());

  REQUIRE(client.SetRecvTimeout(30U));
  char buf[8];
  auto recv_r = client.Recv(buf, sizeof(buf));
  REQUIRE(!recv_r.has_value());
  REQUIRE(recv_r.get_error() == NetError::kTimeout);
}

TEST_CASE("TcpClient fails to connect to a port nobody listens on", "[net][tcp]") {
  auto client_r = TcpClient::Connect("127.0.0.1", 1, 100);
  REQUIRE(!client_r.has_value());
  REQUIRE(client_r.get_error() == NetError::kConnectFailed);
}

TEST_CASE("TcpClient operations on a closed socket", "[net][tcp]") {
  TcpClient client;
  REQUIRE(!client.IsOpen());
  char buf[4];
  REQUIRE(client.Recv(buf, sizeof(buf)).get_error() == NetError::kClosed);
  REQUIRE(client.SendAll("x", 1U).get_error() == NetError::kClosed);
}

TEST_CASE("TcpServer Shutdown wakes a blocked Accept", "[net][tcp]") {
  auto server_r = TcpServer::Listen("127.0.0.1", 0);
  REQUIRE(server_r.has_value());
  auto server = std::move(server_r.value());

  std::atomic<bool> returned{false};
  std::atomic<bool> failed{false};
  std::thread acceptor([&] {
    auto r = server.Accept();
    failed.store(!r.has_value());
    returned.store(true);
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  REQUIRE(!returned.load());
  server.Shutdown();
  acceptor.join();
  REQUIRE(returned.load());
  REQUIRE(failed.load());
}

TEST_CASE("TcpClient and TcpServer move semantics", "[net][tcp]") {
  auto server_r = TcpServer::Listen("127.0.0.1", 0);
  REQUIRE(server_r.has_value());
  TcpServer server1 = std::move(server_r.value());
  const int server_fd = server1.Fd();

  TcpServer server2;
  server2 = std::move(server1);
  REQUIRE(server2.Fd() == server_fd);
  REQUIRE(!server1.IsOpen());

  auto client_r = TcpClient::Connect("127.0.0.1", server2.LocalPort(), 1000);
  REQUIRE(client_r.has_value());
  TcpClient client1 = std::move(client_r.value());
  const int client_fd = client1.Fd();

  TcpClient client2(std::move(client1));
  REQUIRE(client2.IsOpen());
  REQUIRE(client2.Fd() == client_fd);
  REQUIRE(!client1.IsOpen());
}

#endif  // FORGE_HAS_SOCKPP
