#include <catch2/catch_test_macros.hpp>

#include "network/chat_manager.hpp"
#include "support/test_support.hpp"

#include <QSignalSpy>

using namespace lanlink;
using namespace lanlink::network;
using namespace std::chrono_literals;

namespace {

const QString kLoopback = QStringLiteral("127.0.0.1");

// Two chat peers on one host; each dials the other's listen port.
struct ChatPair {
    ChatPair()
        : port_a(test::free_port())
        , port_b(test::free_port())
        , a(ChatConfig{.listen_port = port_a, .peer_port = port_b, .local_ip = kLoopback})
        , b(ChatConfig{.listen_port = port_b, .peer_port = port_a, .local_ip = kLoopback})
    {
        REQUIRE(a.start().is_ok());
        REQUIRE(b.start().is_ok());
    }

    quint16 port_a;
    quint16 port_b;
    ChatConnectionManager a;
    ChatConnectionManager b;
};

} // namespace

TEST_CASE("Chat: opening a session connects both sides", "[integration][chat]") {
    ChatPair p;
    QSignalSpy a_connected(&p.a, &ChatConnectionManager::chatConnected);
    QSignalSpy b_connected(&p.b, &ChatConnectionManager::chatConnected);
    QSignalSpy b_session(&p.b, &ChatConnectionManager::sessionChanged);

    REQUIRE(p.a.openSession(kLoopback).is_ok());
    REQUIRE(p.a.activePeer() == kLoopback);

    REQUIRE(test::wait_until([&] { return p.a.isSessionConnected() && p.b.isSessionConnected(); }));
    // Incoming chat while idle is auto-accepted and answered with a connect-back.
    REQUIRE(p.b.activePeer() == kLoopback);
    REQUIRE(test::wait_until([&] { return p.b.peers().size() == 1 && p.a.peers().size() == 1; }));
    REQUIRE(b_session.count() >= 1);

    // One logical connection per peer, however many legs it has.
    QTest::qWait(600);
    REQUIRE(a_connected.count() == 1);
    REQUIRE(b_connected.count() == 1);
}

TEST_CASE("Chat: messages travel in both directions", "[integration][chat]") {
    ChatPair p;
    QSignalSpy a_got(&p.a, &ChatConnectionManager::chatMessageReceived);
    QSignalSpy b_got(&p.b, &ChatConnectionManager::chatMessageReceived);

    REQUIRE(p.a.openSession(kLoopback).is_ok());
    REQUIRE(test::wait_until([&] { return p.a.isConnected(kLoopback); }));

    const auto sent = p.a.send(kLoopback, QStringLiteral("hello there"));
    REQUIRE(sent.is_ok());
    REQUIRE(sent.unwrap().from_ip == kLoopback);
    REQUIRE(sent.unwrap().timestamp > 0);

    REQUIRE(test::wait_until([&] { return b_got.count() == 1; }));
    const auto received = b_got.first().first().value<ChatMessage>();
    REQUIRE(received.content == QStringLiteral("hello there"));
    REQUIRE(received.from_ip == kLoopback);

    REQUIRE(test::wait_until([&] { return p.b.isConnected(kLoopback); }));
    REQUIRE(p.b.send(kLoopback, QStringLiteral("hi back")).is_ok());
    REQUIRE(test::wait_until([&] { return a_got.count() == 1; }));
    REQUIRE(a_got.first().first().value<ChatMessage>().content == QStringLiteral("hi back"));
}

TEST_CASE("Chat: sending without a connection fails", "[integration][chat]") {
    ChatPair p;

    const auto sent = p.a.send(QStringLiteral("10.1.2.3"), QStringLiteral("anyone?"));

    REQUIRE(sent.is_err());
    REQUIRE(sent.unwrap_err().kind == ErrorKind::NotConnected);
}

TEST_CASE("Chat: disconnect is seen by the peer", "[integration][chat]") {
    ChatPair p;
    QSignalSpy b_disconnected(&p.b, &ChatConnectionManager::chatDisconnected);

    REQUIRE(p.a.openSession(kLoopback).is_ok());
    REQUIRE(test::wait_until([&] { return p.b.isSessionConnected(); }));
    // Let the connect-back settle so it does not revive the channel.
    QTest::qWait(600);

    p.a.disconnectPeer(kLoopback);

    REQUIRE(test::wait_until([&] { return b_disconnected.count() >= 1; }));
    REQUIRE(test::wait_until([&] { return !p.b.isSessionConnected(); }));
    REQUIRE_FALSE(p.a.isConnected(kLoopback));
    REQUIRE(p.a.send(kLoopback, QStringLiteral("gone")).unwrap_err().kind == ErrorKind::NotConnected);
}

TEST_CASE("Chat: reconnecting replaces the old connection", "[integration][chat]") {
    ChatPair p;

    REQUIRE(p.a.openSession(kLoopback).is_ok());
    REQUIRE(test::wait_until([&] { return p.a.isSessionConnected(); }));
    QTest::qWait(600);
    p.a.disconnectAll();
    REQUIRE(test::wait_until([&] { return p.a.peers().isEmpty(); }));

    REQUIRE(p.a.connectTo(kLoopback).is_ok());
    REQUIRE(test::wait_until([&] { return p.a.isConnected(kLoopback); }));
    QTest::qWait(500);

    REQUIRE(p.a.peers() == QStringList{kLoopback});
    REQUIRE(p.b.peers() == QStringList{kLoopback});
}

TEST_CASE("Chat: messages flow both ways right after a reconnect", "[integration][chat]") {
    ChatPair p;
    QSignalSpy a_got(&p.a, &ChatConnectionManager::chatMessageReceived);
    QSignalSpy b_got(&p.b, &ChatConnectionManager::chatMessageReceived);
    QSignalSpy b_connected(&p.b, &ChatConnectionManager::chatConnected);
    QSignalSpy b_disconnected(&p.b, &ChatConnectionManager::chatDisconnected);

    REQUIRE(p.a.openSession(kLoopback).is_ok());
    REQUIRE(test::wait_until([&] { return p.b.isSessionConnected(); }));
    QTest::qWait(600);
    p.a.disconnectAll();
    REQUIRE(test::wait_until([&] { return b_disconnected.count() >= 1 && p.b.peers().isEmpty(); }));

    REQUIRE(p.a.connectTo(kLoopback).is_ok());
    REQUIRE(test::wait_until([&] { return b_connected.count() == 2; }));

    // b talks first, before its connect-back has necessarily completed.
    REQUIRE(p.b.send(kLoopback, QStringLiteral("welcome back")).is_ok());
    REQUIRE(test::wait_until([&] { return a_got.count() == 1; }));
    REQUIRE(a_got.first().first().value<ChatMessage>().content == QStringLiteral("welcome back"));

    REQUIRE(p.a.send(kLoopback, QStringLiteral("glad to be here")).is_ok());
    REQUIRE(test::wait_until([&] { return b_got.count() == 1; }));
    REQUIRE(b_got.first().first().value<ChatMessage>().content == QStringLiteral("glad to be here"));

    // Once b has dialed back, its messages still arrive on the same channel.
    REQUIRE(test::wait_until([&] { return p.b.isSessionConnected(); }));
    QTest::qWait(600);
    REQUIRE(p.b.send(kLoopback, QStringLiteral("still here")).is_ok());
    REQUIRE(test::wait_until([&] { return a_got.count() == 2; }));
    REQUIRE(a_got.last().first().value<ChatMessage>().content == QStringLiteral("still here"));
    REQUIRE(p.a.peers() == QStringList{kLoopback});
    REQUIRE(p.b.peers() == QStringList{kLoopback});
}

TEST_CASE("Chat: closing the session tears the connection down", "[integration][chat]") {
    ChatPair p;
    QSignalSpy a_session(&p.a, &ChatConnectionManager::sessionChanged);

    REQUIRE(p.a.openSession(kLoopback).is_ok());
    REQUIRE(test::wait_until([&] { return p.a.isSessionConnected(); }));
    QTest::qWait(600);

    p.a.closeSession();

    REQUIRE(p.a.activePeer().isEmpty());
    REQUIRE_FALSE(p.a.isSessionConnected());
    REQUIRE(test::wait_until([&] { return !p.b.isSessionConnected(); }));
    REQUIRE(a_session.last().at(0).toString().isEmpty());
}

TEST_CASE("Chat: unreachable peer reports a connect failure", "[integration][chat]") {
    ChatPair p;
    QSignalSpy failed(&p.a, &ChatConnectionManager::chatConnectFailed);

    REQUIRE(p.a.connectTo(kLoopback, test::free_port()).is_ok());

    REQUIRE(test::wait_until([&] { return failed.count() == 1; }, 8s));
    REQUIRE(failed.first().at(0).toString() == kLoopback);
    REQUIRE_FALSE(p.a.isConnected(kLoopback));
}

TEST_CASE("Chat: invalid addresses are rejected", "[integration][chat]") {
    ChatPair p;

    REQUIRE(p.a.connectTo(QStringLiteral("not-an-ip")).unwrap_err().kind == ErrorKind::InvalidArgument);
    REQUIRE(p.a.openSession(QString()).is_err());
}

TEST_CASE("Chat: starting twice keeps the same port", "[integration][chat]") {
    ChatPair p;

    const auto again = p.a.start();

    REQUIRE(again.is_ok());
    REQUIRE(again.unwrap() == p.port_a);
}
