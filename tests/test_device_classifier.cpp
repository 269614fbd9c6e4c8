// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <doctest/doctest.h>

#include "ConnectionLimiter.h"
#include "DeviceClassifier.h"
#include "FakeTransport.h"

static QHostAddress addr(const char* s) {
    return QHostAddress(QString::fromLatin1(s));
}

static DeviceClassifier::Options options() {
    DeviceClassifier::Options o;
    o.timeoutMs = 100;
    o.keyFile = QStringLiteral("/nonexistent/opensshkey");
    return o;
}

TEST_CASE("no answer means no device, without trying to authenticate") {
    FakeTransport transport;
    ConnectionLimiter limiter(1);
    DeviceClassifier classifier(transport, limiter, options());

    CHECK_FALSE(classifier.classify(addr("10.0.0.9")).has_value());
    CHECK(transport.probes.load() == 1);
    CHECK(transport.authentications.load() == 0);
}

TEST_CASE("a host that rejects the device key is an Unknown device") {
    FakeTransport transport;
    transport.addHost(addr("10.0.0.2"), FakeTransport::Host{});
    ConnectionLimiter limiter(1);
    DeviceClassifier classifier(transport, limiter, options());

    auto device = classifier.classify(addr("10.0.0.2"));
    REQUIRE(device.has_value());
    CHECK(device->variant() == DeviceVariant::Unknown);
    CHECK(device->address() == addr("10.0.0.2"));
}

TEST_CASE("accepting both the device user and the admin user means generation two") {
    FakeTransport transport;
    transport.addHost(addr("10.0.0.2"), FakeTransport::Host{{QStringLiteral("comma"), QStringLiteral("root")}});
    ConnectionLimiter limiter(1);
    DeviceClassifier classifier(transport, limiter, options());

    auto device = classifier.classify(addr("10.0.0.2"));
    REQUIRE(device.has_value());
    CHECK(device->variant() == DeviceVariant::GenerationTwo);
    CHECK(transport.authentications.load() == 2);
}

TEST_CASE("accepting only the device user means generation three") {
    FakeTransport transport;
    transport.addHost(addr("10.0.0.3"), FakeTransport::Host{{QStringLiteral("comma")}});
    ConnectionLimiter limiter(1);
    DeviceClassifier classifier(transport, limiter, options());

    auto device = classifier.classify(addr("10.0.0.3"));
    REQUIRE(device.has_value());
    CHECK(device->variant() == DeviceVariant::GenerationThree);
    CHECK(device->port() == Device::kDefaultPort);
}

TEST_CASE("other failures during the first login are swallowed as no device") {
    FakeTransport transport;
    FakeTransport::Host host;
    host.failAuthenticationWithIoError = true;
    transport.addHost(addr("10.0.0.4"), host);
    ConnectionLimiter limiter(1);
    DeviceClassifier classifier(transport, limiter, options());

    CHECK_FALSE(classifier.classify(addr("10.0.0.4")).has_value());
}

TEST_CASE("a cancelled classification finds nothing") {
    FakeTransport transport;
    transport.addHost(addr("10.0.0.3"), FakeTransport::Host{{QStringLiteral("comma")}});
    ConnectionLimiter limiter(1);
    DeviceClassifier classifier(transport, limiter, options());

    std::atomic<bool> cancelled{true};
    CHECK_FALSE(classifier.classify(addr("10.0.0.3"), &cancelled).has_value());
    CHECK(transport.probes.load() == 0);
}

TEST_CASE("each login holds a connection slot, the reachability check does not") {
    FakeTransport transport;
    transport.addHost(addr("10.0.0.2"), FakeTransport::Host{{QStringLiteral("comma"), QStringLiteral("root")}});
    ConnectionLimiter limiter(1);
    DeviceClassifier classifier(transport, limiter, options());

    {
        ConnectionLimiter::Slot held = limiter.acquire();
        // Nothing listens here, so no login is attempted and the held slot is no obstacle
        CHECK_FALSE(classifier.classify(addr("10.0.0.9")).has_value());
        CHECK(transport.probes.load() == 1);
    }

    auto device = classifier.classify(addr("10.0.0.2"));
    REQUIRE(device.has_value());
    CHECK(limiter.peakInUse() == 1);
    CHECK(limiter.available() == 1);
}
