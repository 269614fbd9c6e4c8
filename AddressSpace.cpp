// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "AddressSpace.h"

#include <QDebug>
#include <QNetworkAddressEntry>
#include <QNetworkInterface>
#include <QSet>

namespace AddressSpace {
    std::optional<NetworkInterfaceRange> rangeFor(const QHostAddress& address, const QHostAddress& netmask) {
        if (address.protocol() != QAbstractSocket::IPv4Protocol
            || netmask.protocol() != QAbstractSocket::IPv4Protocol) {
            return std::nullopt;
        }

        // toIPv4Address() is already in host order
        const quint32 ip = address.toIPv4Address();
        const quint32 mask = netmask.toIPv4Address();

        NetworkInterfaceRange r;
        r.networkAddress = ip & mask;
        r.firstUsableAddress = r.networkAddress + 1;
        r.addressCount = ~mask;
        r.localAddress = ip;
        return r;
    }

    QList<QHostAddress> candidatesFor(const QList<InterfaceAddress>& interfaces, const Limits& limits) {
        QList<QHostAddress> out;
        QSet<quint32> scheduled;

        auto schedule = [&](quint32 host) {
            if (scheduled.contains(host)) return;
            scheduled.insert(host);
            out.push_back(QHostAddress(host));
        };

        const bool haveTethering = limits.tetheringAddress.protocol() == QAbstractSocket::IPv4Protocol;
        const quint32 tethering = haveTethering ? limits.tetheringAddress.toIPv4Address() : 0;

        for (const InterfaceAddress& iface : interfaces) {
            const auto range = rangeFor(iface.address, iface.netmask);
            if (!range) {
                qInfo().noquote() << "Network is not an IPv4 network:" << iface.interfaceName;
                continue;
            }

            if (range->addressCount > limits.maxAddressesPerInterface) {
                qInfo().noquote() << "Subnet contains more than" << limits.maxAddressesPerInterface
                                  << "addresses, skipping:" << iface.interfaceName
                                  << " Address count:" << range->addressCount;
                continue;
            }

            if (haveTethering && tethering != range->localAddress
                && (tethering & iface.netmask.toIPv4Address()) == range->networkAddress) {
                schedule(tethering);

                if (range->firstUsableAddress == tethering) {
                    qInfo().noquote() << "Hotspot network on" << iface.interfaceName
                                      << "- probing" << limits.tetheringAddress.toString() << "only";
                    continue;
                }
            }

            if (range->addressCount == 0) {
                continue;
            }

            qInfo().noquote() << "Scanning IP range:"
                              << QHostAddress(range->firstUsableAddress).toString() << "-"
                              << QHostAddress(range->networkAddress + range->addressCount).toString();

            for (quint32 i = 0; i < range->addressCount; ++i) {
                const quint32 host = range->firstUsableAddress + i;
                if (host == range->localAddress) continue;
                schedule(host);
            }
        }

        return out;
    }

    QList<InterfaceAddress> localInterfaceAddresses() {
        QList<InterfaceAddress> out;

        const QList<QNetworkInterface> interfaces = QNetworkInterface::allInterfaces();
        for (const QNetworkInterface& iface : interfaces) {
            const auto flags = iface.flags();
            if (!(flags & QNetworkInterface::IsUp) || (flags & QNetworkInterface::IsLoopBack)) {
                continue;
            }

            qInfo().noquote() << "Found network interface:" << iface.humanReadableName();

            const QList<QNetworkAddressEntry> entries = iface.addressEntries();
            for (const QNetworkAddressEntry& entry : entries) {
                if (entry.ip().protocol() != QAbstractSocket::IPv4Protocol) {
                    qInfo().noquote() << "Network is not an IPv4 network:" << iface.humanReadableName();
                    continue;
                }

                out.push_back(InterfaceAddress{iface.humanReadableName(), entry.ip(), entry.netmask()});
            }
        }

        return out;
    }

    QList<QHostAddress> localCandidates(const Limits& limits) {
        return candidatesFor(localInterfaceAddresses(), limits);
    }
}
