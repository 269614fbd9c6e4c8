// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <doctest/doctest.h>

#include "AddressSpace.h"

using namespace AddressSpace;

static InterfaceAddress iface(const char* address, const char* netmask) {
    return InterfaceAddress{QStringLiteral("test0"), QHostAddress(QString::fromLatin1(address)),
                            QHostAddress(QString::fromLatin1(netmask))};
}

static Limits noTethering() {
    Limits limits;
    limits.tetheringAddress = QHostAddress();
    return limits;
}

TEST_CASE("rangeFor computes first usable address and count from address and mask") {
    auto r = rangeFor(QHostAddress(QStringLiteral("192.168.1.77")), QHostAddress(QStringLiteral("255.255.255.0")));
    REQUIRE(r.has_value());
    CHECK(QHostAddress(r->networkAddress) == QHostAddress(QStringLiteral("192.168.1.0")));
    CHECK(QHostAddress(r->firstUsableAddress) == QHostAddress(QStringLiteral("192.168.1.1")));
    CHECK(r->addressCount == 255u);
    CHECK(r->contains(QHostAddress(QStringLiteral("192.168.1.255")).toIPv4Address()));
    CHECK_FALSE(r->contains(QHostAddress(QStringLiteral("192.168.2.1")).toIPv4Address()));
}

TEST_CASE("rangeFor rejects non-IPv4 addresses") {
    CHECK_FALSE(rangeFor(QHostAddress(QStringLiteral("fe80::1")), QHostAddress(QStringLiteral("ffff:ffff:ffff:ffff::"))).has_value());
}

TEST_CASE("a /24 network is swept without the local address") {
    const auto candidates = candidatesFor({iface("10.0.0.5", "255.255.255.0")}, noTethering());

    CHECK(candidates.size() == 254);
    CHECK_FALSE(candidates.contains(QHostAddress(QStringLiteral("10.0.0.5"))));
    CHECK(candidates.contains(QHostAddress(QStringLiteral("10.0.0.1"))));
    CHECK(candidates.contains(QHostAddress(QStringLiteral("10.0.0.255"))));
    CHECK_FALSE(candidates.contains(QHostAddress(QStringLiteral("10.0.0.0"))));
}

TEST_CASE("networks with more than 1024 addresses yield no candidates") {
    CHECK(candidatesFor({iface("10.1.2.3", "255.255.0.0")}, noTethering()).isEmpty());
    CHECK(candidatesFor({iface("172.16.4.9", "255.255.248.0")}, noTethering()).isEmpty()); // 2047 hosts
}

TEST_CASE("a /22 network is within the limit and is scanned") {
    // /22 has ~mask == 1023
    const auto candidates = candidatesFor({iface("10.9.0.1", "255.255.252.0")}, noTethering());
    CHECK(candidates.size() == 1022);
}

TEST_CASE("the tethering address is probed first and only once") {
    Limits limits;
    const auto candidates = candidatesFor({iface("192.168.43.100", "255.255.255.0"),
                                           iface("192.168.43.100", "255.255.255.0")}, limits);

    REQUIRE_FALSE(candidates.isEmpty());
    CHECK(candidates.first() == QHostAddress(QStringLiteral("192.168.43.1")));
    CHECK(candidates.count(QHostAddress(QStringLiteral("192.168.43.1"))) == 1);
}

TEST_CASE("on a hotspot network only the tethering address is probed") {
    const auto candidates = candidatesFor({iface("192.168.43.100", "255.255.255.0")}, Limits{});
    REQUIRE(candidates.size() == 1);
    CHECK(candidates.first() == QHostAddress(QStringLiteral("192.168.43.1")));
}

TEST_CASE("a network too large to sweep yields nothing, not even the tethering address") {
    const auto candidates = candidatesFor({iface("192.168.40.10", "255.255.248.0")}, Limits{});
    CHECK(candidates.isEmpty());
}

TEST_CASE("the tethering address is not scheduled for unrelated networks") {
    const auto candidates = candidatesFor({iface("10.0.0.5", "255.255.255.0")}, Limits{});
    CHECK_FALSE(candidates.contains(QHostAddress(QStringLiteral("192.168.43.1"))));
}

TEST_CASE("the local machine is never probed even when it owns the tethering address") {
    const auto candidates = candidatesFor({iface("192.168.43.1", "255.255.255.0")}, Limits{});
    CHECK_FALSE(candidates.contains(QHostAddress(QStringLiteral("192.168.43.1"))));
    CHECK(candidates.size() == 254);
}

TEST_CASE("overlapping interfaces are de-duplicated") {
    const auto candidates = candidatesFor({iface("10.0.0.5", "255.255.255.0"), iface("10.0.0.6", "255.255.255.0")},
                                          noTethering());
    // Each interface skips only its own address; the other one is scheduled by its peer.
    CHECK(candidates.size() == 255);
}
