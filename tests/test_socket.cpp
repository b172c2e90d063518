/**
 * @file test_socket.cpp
 * @brief Tests for socket.hpp: SocketAddress, TcpSocket, TcpListener.
 */

#include <catch2/catch_test_macros.hpp>
#include "labxfer/socket.hpp"

#include <cstring>
#include <thread>

namespace {

labxfer::TcpListener MakeLoopbackListener() {
  auto created = labxfer::TcpListener::Create();
  REQUIRE(created.has_value());
  labxfer::TcpListener l = static_cast<labxfer::TcpListener&&>(created.value());
  REQUIRE(l.SetReuseAddr(true).has_value());
  auto addr = labxfer::SocketAddress::FromIpv4("127.0.0.1", 0);
  REQUIRE(addr.has_value());
  REQUIRE(l.Bind(addr.value()).has_value());
  REQUIRE(l.Listen().has_value());
  return l;
}

}  // namespace

TEST_CASE("socket - TcpSocket::Create succeeds", "[socket][tcp]") {
  auto result = labxfer::TcpSocket::Create();
  REQUIRE(result.has_value());
  REQUIRE(result.value().IsValid());
  REQUIRE(result.value().Fd() >= 0);
}

TEST_CASE("socket - SocketAddress::FromIpv4 valid", "[socket][address]") {
  auto result = labxfer::SocketAddress::FromIpv4("127.0.0.1", 5001);
  REQUIRE(result.has_value());
  REQUIRE(result.value().Size() == sizeof(sockaddr_in));
  REQUIRE(result.value().Port() == 5001);
  char buf[INET_ADDRSTRLEN];
  REQUIRE(std::strcmp(result.value().ToString(buf, sizeof(buf)), "127.0.0.1") ==
          0);
}

TEST_CASE("socket - SocketAddress::FromIpv4 rejects names", "[socket][address]") {
  auto result = labxfer::SocketAddress::FromIpv4("not.an.ip.address", 80);
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == labxfer::SocketError::kResolveFailed);
}

TEST_CASE("socket - SocketAddress::Resolve", "[socket][address]") {
  auto literal = labxfer::SocketAddress::Resolve("10.0.0.7", 80);
  REQUIRE(literal.has_value());
  REQUIRE(literal.value().Port() == 80);

  auto local = labxfer::SocketAddress::Resolve("localhost", 5001);
  REQUIRE(local.has_value());
  REQUIRE(local.value().Port() == 5001);

  auto empty = labxfer::SocketAddress::Resolve("", 1);
  REQUIRE(!empty.has_value());
  REQUIRE(empty.get_error() == labxfer::SocketError::kResolveFailed);
}

TEST_CASE("socket - TcpSocket move semantics", "[socket][tcp]") {
  auto result = labxfer::TcpSocket::Create();
  REQUIRE(result.has_value());
  labxfer::TcpSocket a = static_cast<labxfer::TcpSocket&&>(result.value());
  const int32_t fd = a.Fd();

  labxfer::TcpSocket b(static_cast<labxfer::TcpSocket&&>(a));
  REQUIRE(!a.IsValid());
  REQUIRE(b.Fd() == fd);

  labxfer::TcpSocket c;
  c = static_cast<labxfer::TcpSocket&&>(b);
  REQUIRE(!b.IsValid());
  REQUIRE(c.Fd() == fd);
}

TEST_CASE("socket - TcpSocket Close is idempotent", "[socket][tcp]") {
  auto result = labxfer::TcpSocket::Create();
  REQUIRE(result.has_value());
  labxfer::TcpSocket sock = static_cast<labxfer::TcpSocket&&>(result.value());
  sock.Close();
  REQUIRE(!sock.IsValid());
  sock.Close();
  REQUIRE(!sock.IsValid());
}

TEST_CASE("socket - listener on port 0 reports its port", "[socket][listener]") {
  labxfer::TcpListener l = MakeLoopbackListener();
  REQUIRE(l.LocalPort() != 0);
}

TEST_CASE("socket - Accept times out with no peer", "[socket][listener]") {
  labxfer::TcpListener l = MakeLoopbackListener();
  auto r = l.Accept(50);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == labxfer::SocketError::kTimeout);
}

TEST_CASE("socket - loopback send and receive", "[socket][tcp]") {
  labxfer::TcpListener l = MakeLoopbackListener();
  const uint16_t port = l.LocalPort();

  bool client_ok = false;
  std::thread client([port, &client_ok]() {
    auto created = labxfer::TcpSocket::Create();
    if (!created.has_value()) return;
    labxfer::TcpSocket s = static_cast<labxfer::TcpSocket&&>(created.value());
    auto addr = labxfer::SocketAddress::FromIpv4("127.0.0.1", port);
    if (!addr.has_value() || !s.Connect(addr.value(), 2000).has_value()) return;
    auto sent = s.Send("ping", 4);
    client_ok = sent.has_value() && sent.value() == 4;
  });

  labxfer::SocketAddress peer;
  auto accepted = l.Accept(2000, &peer);
  REQUIRE(accepted.has_value());
  labxfer::TcpSocket conn = static_cast<labxfer::TcpSocket&&>(accepted.value());
  REQUIRE(conn.WaitReadable(2000).has_value());

  char buf[8] = {};
  size_t total = 0;
  while (total < 4U) {
    auto n = conn.Recv(buf + total, sizeof(buf) - total);
    REQUIRE(n.has_value());
    if (n.value() == 0) break;
    total += static_cast<size_t>(n.value());
  }
  client.join();
  REQUIRE(client_ok);
  REQUIRE(total == 4U);
  REQUIRE(std::memcmp(buf, "ping", 4) == 0);
  REQUIRE(peer.Port() != 0);
}

TEST_CASE("socket - Connect to a closed port is refused", "[socket][tcp]") {
  uint16_t port = 0;
  {
    labxfer::TcpListener l = MakeLoopbackListener();
    port = l.LocalPort();
  }
  auto created = labxfer::TcpSocket::Create();
  REQUIRE(created.has_value());
  labxfer::TcpSocket s = static_cast<labxfer::TcpSocket&&>(created.value());
  auto addr = labxfer::SocketAddress::FromIpv4("127.0.0.1", port);
  auto r = s.Connect(addr.value(), 2000);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == labxfer::SocketError::kConnectRefused);
}
