// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef PILOTDECK_DEVICECLASSIFIER_H
#define PILOTDECK_DEVICECLASSIFIER_H

#include <QHostAddress>
#include <QString>
#include <atomic>
#include <optional>

#include "Device.h"
#include "transport/RemoteTransport.h"

class ConnectionLimiter;

/**
 * Decides whether an address hosts a device and which generation it is.
 *
 * The decision is made from authentication behaviour alone:
 *   - no TCP answer                      -> nothing there
 *   - low-privilege login rejected       -> Unknown (something answers, not one of ours)
 *   - low-privilege ok, admin login ok   -> GenerationTwo
 *   - low-privilege ok, admin login fails -> GenerationThree
 *
 * Each login is a full handshake and holds a ConnectionLimiter slot while it runs. The
 * plain TCP probe does not.
 */
class DeviceClassifier {
public:
    struct Options {
        quint16 port = Device::kDefaultPort;
        int timeoutMs = 5000;
        QString keyFile;
        QString deviceUser = QStringLiteral("comma");
        QString adminUser = QStringLiteral("root");
    };

    DeviceClassifier(RemoteTransport& transport, ConnectionLimiter& limiter, Options options);

    /**
     * Probes one address. Never fails: every error is logged and reported as "no device".
     *
     * @param address Candidate host.
     * @param cancelled Optional flag; once set, remaining steps are skipped and no device is reported.
     * @return The classified device, an Unknown device, or std::nullopt if nothing usable answered.
     */
    [[nodiscard]] std::optional<Device> classify(const QHostAddress& address,
                                                 const std::atomic<bool>* cancelled = nullptr) const;

    [[nodiscard]] const Options& options() const { return m_options; }

private:
    bool authenticate(const RemoteEndpoint& endpoint, TransportError* errorOut) const;

    RemoteTransport& m_transport;
    ConnectionLimiter& m_limiter;
    Options m_options;
};

#endif //PILOTDECK_DEVICECLASSIFIER_H
