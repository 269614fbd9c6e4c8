// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <doctest/doctest.h>

#include <QBuffer>
#include <QTemporaryFile>
#include <thread>
#include <vector>

#include "ConnectionLimiter.h"
#include "FakeTransport.h"
#include "SessionManager.h"

namespace {
    const QHostAddress kDevice(QStringLiteral("10.0.0.2"));

    void addDevice(FakeTransport& transport, const QHostAddress& address = kDevice) {
        transport.addHost(address, FakeTransport::Host{{QStringLiteral("comma")}});
        transport.addDirectory(QStringLiteral("/data/openpilot"));
    }

    SessionManager::Options sessionOptions() {
        SessionManager::Options o;
        o.keyFile = QStringLiteral("/nonexistent/opensshkey");
        return o;
    }

    QStringList paths(const QList<RemoteEntry>& entries) {
        QStringList out;
        for (const RemoteEntry& e : entries) out << e.fullPath;
        return out;
    }
}

TEST_CASE("concurrent connect calls run one handshake and all see Connected") {
    FakeTransport transport;
    addDevice(transport);
    transport.handshakeDelayMs = 50;

    ConnectionLimiter limiter;
    SessionManager session(Device(kDevice, DeviceVariant::GenerationThree), transport, limiter, sessionOptions());

    constexpr int kCallers = 8;
    std::vector<std::thread> threads;
    std::atomic<int> succeeded{0};
    for (int i = 0; i < kCallers; ++i) {
        threads.emplace_back([&] {
            if (session.connect()) ++succeeded;
        });
    }
    for (auto& t : threads) t.join();

    CHECK(succeeded.load() == kCallers);
    CHECK(session.state() == SessionManager::State::Connected);
    CHECK(session.handshakeCount() == 1);
    CHECK(transport.fileHandshakes.load() == 1);
    CHECK(transport.commandHandshakes.load() == 1);
}

TEST_CASE("the limiter slot is held only during the handshake") {
    FakeTransport transport;
    addDevice(transport);

    ConnectionLimiter limiter(1);
    SessionManager session(Device(kDevice, DeviceVariant::GenerationThree), transport, limiter, sessionOptions());

    REQUIRE(session.connect());
    CHECK(limiter.available() == 1);
    CHECK(limiter.peakInUse() == 1);
}

TEST_CASE("a limiter of capacity one serializes handshakes across sessions") {
    FakeTransport transport;
    const QList<QHostAddress> addresses{QHostAddress(QStringLiteral("10.0.0.2")), QHostAddress(QStringLiteral("10.0.0.3")),
                                        QHostAddress(QStringLiteral("10.0.0.4")), QHostAddress(QStringLiteral("10.0.0.5"))};
    for (const auto& a : addresses) addDevice(transport, a);
    transport.handshakeDelayMs = 30;

    ConnectionLimiter limiter(1);
    std::vector<std::unique_ptr<SessionManager>> sessions;
    for (const auto& a : addresses) {
        sessions.push_back(std::make_unique<SessionManager>(Device(a, DeviceVariant::GenerationThree), transport, limiter,
                                                            sessionOptions()));
    }

    std::vector<std::thread> threads;
    for (auto& s : sessions) {
        threads.emplace_back([&s] { CHECK(s->connect()); });
    }
    for (auto& t : threads) t.join();

    CHECK(transport.peakHandshakesInFlight.load() == 1);
    CHECK(transport.fileHandshakes.load() == 4);
    CHECK(limiter.available() == 1);
}

TEST_CASE("operations connect on demand") {
    FakeTransport transport;
    addDevice(transport);
    transport.addFile(QStringLiteral("/data/openpilot/README.md"), QByteArrayLiteral("hello"));

    ConnectionLimiter limiter;
    SessionManager session(Device(kDevice, DeviceVariant::GenerationThree), transport, limiter, sessionOptions());
    CHECK(session.state() == SessionManager::State::Disconnected);

    auto entries = session.listDirectory(QStringLiteral("."));
    REQUIRE(entries.has_value());
    CHECK(paths(*entries) == QStringList{QStringLiteral("/data/openpilot/README.md")});
    CHECK(session.isConnected());
    CHECK(session.workingDirectory() == QStringLiteral("/data/openpilot/"));

    QBuffer buffer;
    buffer.open(QIODevice::WriteOnly);
    CHECK(session.readFile(QStringLiteral("README.md"), buffer));
    CHECK(buffer.data() == QByteArrayLiteral("hello"));

    CHECK(session.handshakeCount() == 1);
}

TEST_CASE("a failed command handshake leaves nothing half-open") {
    FakeTransport transport;
    addDevice(transport);
    transport.failCommandConnect = true;

    ConnectionLimiter limiter;
    SessionManager session(Device(kDevice, DeviceVariant::GenerationThree), transport, limiter, sessionOptions());

    TransportError err;
    CHECK_FALSE(session.connect(&err));
    CHECK(err.kind == TransportError::Kind::HandshakeFailed);
    CHECK(session.state() == SessionManager::State::Disconnected);
    CHECK(transport.liveFileConnections.load() == 0);
    CHECK(limiter.available() == limiter.capacity());

    // A later attempt re-establishes both halves
    transport.failCommandConnect = false;
    CHECK(session.connect());
    CHECK(transport.fileHandshakes.load() == 2);
    CHECK(transport.commandHandshakes.load() == 1);
    CHECK(transport.liveFileConnections.load() == 1);
}

TEST_CASE("a rejected key is reported as such") {
    FakeTransport transport;
    transport.addHost(kDevice, FakeTransport::Host{});

    ConnectionLimiter limiter;
    SessionManager session(Device(kDevice, DeviceVariant::Unknown), transport, limiter, sessionOptions());

    TransportError err;
    CHECK_FALSE(session.listDirectory(QStringLiteral("/"), &err).has_value());
    CHECK(err.kind == TransportError::Kind::AuthenticationRejected);
}

TEST_CASE("a missing working directory fails the connect") {
    FakeTransport transport;
    transport.addHost(kDevice, FakeTransport::Host{{QStringLiteral("comma")}});

    ConnectionLimiter limiter;
    SessionManager session(Device(kDevice, DeviceVariant::GenerationThree), transport, limiter, sessionOptions());

    TransportError err;
    CHECK_FALSE(session.connect(&err));
    CHECK(err.kind == TransportError::Kind::HandshakeFailed);
    CHECK(transport.liveFileConnections.load() == 0);
}

TEST_CASE("disconnect tears down and the next operation reconnects") {
    FakeTransport transport;
    addDevice(transport);

    ConnectionLimiter limiter;
    SessionManager session(Device(kDevice, DeviceVariant::GenerationThree), transport, limiter, sessionOptions());

    REQUIRE(session.connect());
    session.disconnect();
    CHECK(session.state() == SessionManager::State::Disconnected);
    CHECK(transport.liveFileConnections.load() == 0);

    CHECK(session.execute(QStringLiteral("true")).has_value());
    CHECK(session.handshakeCount() == 2);
}

TEST_CASE("enumerateFiles walks depth first in path order") {
    FakeTransport transport;
    addDevice(transport);
    transport.addFile(QStringLiteral("/tree/b.txt"));
    transport.addFile(QStringLiteral("/tree/a/z.txt"));
    transport.addFile(QStringLiteral("/tree/a/deep/x.txt"));
    transport.addFile(QStringLiteral("/tree/c/y.txt"));
    transport.addDirectory(QStringLiteral("/tree/empty"));

    ConnectionLimiter limiter;
    SessionManager session(Device(kDevice, DeviceVariant::GenerationThree), transport, limiter, sessionOptions());

    auto files = session.enumerateFiles(QStringLiteral("/tree"));
    REQUIRE(files.has_value());
    CHECK(paths(*files) == QStringList{
        QStringLiteral("/tree/a/deep/x.txt"),
        QStringLiteral("/tree/a/z.txt"),
        QStringLiteral("/tree/b.txt"),
        QStringLiteral("/tree/c/y.txt"),
    });

    auto entries = session.enumerateEntries(QStringLiteral("/tree"));
    REQUIRE(entries.has_value());
    CHECK(paths(*entries) == QStringList{
        QStringLiteral("/tree/a/deep/x.txt"),
        QStringLiteral("/tree/a/deep"),
        QStringLiteral("/tree/a/z.txt"),
        QStringLiteral("/tree/a"),
        QStringLiteral("/tree/b.txt"),
        QStringLiteral("/tree/c/y.txt"),
        QStringLiteral("/tree/c"),
        QStringLiteral("/tree/empty"),
    });
}

TEST_CASE("deep trees do not recurse") {
    FakeTransport transport;
    addDevice(transport);

    QString path = QStringLiteral("/deep");
    for (int i = 0; i < 500; ++i) path += QStringLiteral("/d");
    transport.addFile(path + QStringLiteral("/leaf"));

    ConnectionLimiter limiter;
    SessionManager session(Device(kDevice, DeviceVariant::GenerationThree), transport, limiter, sessionOptions());

    auto files = session.enumerateFiles(QStringLiteral("/deep"));
    REQUIRE(files.has_value());
    REQUIRE(files->size() == 1);
    CHECK(files->first().name == QStringLiteral("leaf"));
}

TEST_CASE("the tree walker is lazy and restartable") {
    FakeTransport transport;
    addDevice(transport);
    transport.addFile(QStringLiteral("/tree/a/1"));
    transport.addFile(QStringLiteral("/tree/b/2"));

    ConnectionLimiter limiter;
    SessionManager session(Device(kDevice, DeviceVariant::GenerationThree), transport, limiter, sessionOptions());
    REQUIRE(session.connect());

    RemoteTreeWalker walker(session, QStringLiteral("/tree"), RemoteTreeWalker::Mode::FilesOnly);
    const qsizetype before = transport.listedDirectories().size();

    auto first = walker.next();
    REQUIRE(first.has_value());
    CHECK(first->fullPath == QStringLiteral("/tree/a/1"));
    CHECK(transport.listedDirectories().size() - before == 2); // /tree and /tree/a, not yet /tree/b

    walker.restart();
    auto again = walker.next();
    REQUIRE(again.has_value());
    CHECK(again->fullPath == QStringLiteral("/tree/a/1"));
}

TEST_CASE("enumerating a missing directory reports PathNotFound") {
    FakeTransport transport;
    addDevice(transport);

    ConnectionLimiter limiter;
    SessionManager session(Device(kDevice, DeviceVariant::GenerationThree), transport, limiter, sessionOptions());

    TransportError err;
    CHECK_FALSE(session.enumerateFiles(QStringLiteral("/missing"), &err).has_value());
    CHECK(err.kind == TransportError::Kind::PathNotFound);
    CHECK(session.isConnected());
}

TEST_CASE("uploadFile copies a local file to the device") {
    FakeTransport transport;
    addDevice(transport);

    QTemporaryFile local;
    REQUIRE(local.open());
    local.write("payload");
    local.close();

    ConnectionLimiter limiter;
    SessionManager session(Device(kDevice, DeviceVariant::GenerationThree), transport, limiter, sessionOptions());

    REQUIRE(session.uploadFile(local.fileName(), QStringLiteral("/data/openpilot/uploaded.bin")));

    QBuffer buffer;
    buffer.open(QIODevice::WriteOnly);
    REQUIRE(session.readFile(QStringLiteral("/data/openpilot/uploaded.bin"), buffer));
    CHECK(buffer.data() == QByteArrayLiteral("payload"));

    TransportError err;
    CHECK_FALSE(session.uploadFile(QStringLiteral("/nonexistent/file"), QStringLiteral("x"), &err));
    CHECK(err.kind == TransportError::Kind::IoFailure);
}

TEST_CASE("executeStreaming hands over every line") {
    FakeTransport transport;
    addDevice(transport);
    transport.setCommandHandler([](const QString&, const CommandClient::LineCallback& onLine) {
        if (onLine) {
            onLine(QStringLiteral("one"));
            onLine(QStringLiteral("two"));
        }
        return CommandResult{0, QByteArrayLiteral("one\ntwo\n"), {}};
    });

    ConnectionLimiter limiter;
    SessionManager session(Device(kDevice, DeviceVariant::GenerationThree), transport, limiter, sessionOptions());

    QStringList lines;
    auto result = session.executeStreaming(QStringLiteral("printf"), [&lines](const QString& l) { lines << l; });
    REQUIRE(result.has_value());
    CHECK(result->exitStatus == 0);
    CHECK(lines == QStringList{QStringLiteral("one"), QStringLiteral("two")});
}
