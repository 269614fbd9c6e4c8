// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef PILOTDECK_ADDRESSSPACE_H
#define PILOTDECK_ADDRESSSPACE_H

#include <QHostAddress>
#include <QList>
#include <QString>
#include <optional>

namespace AddressSpace {
    inline constexpr quint32 kMaxAddressesPerInterface = 1024;

    /**
     * The scannable part of one IPv4 network. Addresses are in host byte order.
     */
    struct NetworkInterfaceRange {
        quint32 networkAddress = 0;
        quint32 firstUsableAddress = 0;
        quint32 addressCount = 0; // hosts from firstUsableAddress on, inclusive
        quint32 localAddress = 0;

        [[nodiscard]] bool contains(quint32 address) const {
            return address >= firstUsableAddress && address - firstUsableAddress < addressCount;
        }
    };

    /**
     * One unicast address configured on a local interface.
     */
    struct InterfaceAddress {
        QString interfaceName;
        QHostAddress address;
        QHostAddress netmask;
    };

    struct Limits {
        quint32 maxAddressesPerInterface = kMaxAddressesPerInterface;
        QHostAddress tetheringAddress{QStringLiteral("192.168.43.1")};
    };

    /**
     * Computes the network range of an IPv4 address and its subnet mask.
     *
     * @param address Local IPv4 address of the interface.
     * @param netmask Its subnet mask.
     * @return std::nullopt if either address is not IPv4.
     */
    [[nodiscard]] std::optional<NetworkInterfaceRange> rangeFor(const QHostAddress& address, const QHostAddress& netmask);

    /**
     * Builds the ordered, de-duplicated list of addresses to probe.
     *
     * - Non-IPv4 addresses are skipped.
     * - Networks with more than maxAddressesPerInterface addresses are skipped entirely,
     *   tethering address included.
     * - The tethering address is scheduled first for every other network that contains
     *   it. A network whose first usable address is the tethering address is a phone
     *   hotspot: only the phone is probed.
     * - The local address itself is never a candidate.
     */
    [[nodiscard]] QList<QHostAddress> candidatesFor(const QList<InterfaceAddress>& interfaces, const Limits& limits = {});

    /**
     * IPv4 unicast addresses of every local interface that is up and not a loopback.
     */
    [[nodiscard]] QList<InterfaceAddress> localInterfaceAddresses();

    // candidatesFor(localInterfaceAddresses(), limits)
    [[nodiscard]] QList<QHostAddress> localCandidates(const Limits& limits = {});
}

#endif //PILOTDECK_ADDRESSSPACE_H
