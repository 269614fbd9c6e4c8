// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "DeviceClassifier.h"

#include <QDebug>
#include <exception>

#include "ConnectionLimiter.h"

static bool isCancelled(const std::atomic<bool>* cancelled) {
    return cancelled && cancelled->load();
}

DeviceClassifier::DeviceClassifier(RemoteTransport& transport, ConnectionLimiter& limiter, Options options)
    : m_transport(transport), m_limiter(limiter), m_options(std::move(options)) {}

bool DeviceClassifier::authenticate(const RemoteEndpoint& endpoint, TransportError* errorOut) const {
    ConnectionLimiter::Slot slot = m_limiter.acquire();
    return m_transport.authenticate(endpoint, errorOut);
}

std::optional<Device> DeviceClassifier::classify(const QHostAddress& address,
                                                 const std::atomic<bool>* cancelled) const {
    const QString host = address.toString();

    try {
        if (isCancelled(cancelled)) return std::nullopt;

        // 1) Is anything listening at all?
        if (!m_transport.probe(address, m_options.port, m_options.timeoutMs, cancelled)) {
            return std::nullopt;
        }

        qInfo().noquote() << "Connected to" << host << "on port" << m_options.port;

        if (isCancelled(cancelled)) return std::nullopt;

        // 2) Low-privilege login with the bundled key
        RemoteEndpoint endpoint{address, m_options.port, m_options.deviceUser, m_options.keyFile};

        TransportError err;
        if (!authenticate(endpoint, &err)) {
            if (err.kind == TransportError::Kind::AuthenticationRejected) {
                qInfo().noquote() << "Host" << host << "rejected the device key, not a recognized device";
                return Device(address, DeviceVariant::Unknown, m_options.port);
            }

            qWarning().noquote() << "Failed to connect to" << host << "with the following error:" << err.message;
            return std::nullopt;
        }

        if (isCancelled(cancelled)) return std::nullopt;

        // 3) Only the older generation lets the same key in as the administrative user
        endpoint.username = m_options.adminUser;
        TransportError adminErr;
        if (authenticate(endpoint, &adminErr)) {
            qInfo().noquote() << "Connected to" << Device::variantName(DeviceVariant::GenerationTwo)
                              << "device at" << host << "on port" << m_options.port;
            return Device(address, DeviceVariant::GenerationTwo, m_options.port);
        }

        if (adminErr.kind == TransportError::Kind::Cancelled) return std::nullopt;

        qInfo().noquote() << "Connected to" << Device::variantName(DeviceVariant::GenerationThree)
                          << "device at" << host << "on port" << m_options.port;
        return Device(address, DeviceVariant::GenerationThree, m_options.port);
    } catch (const std::exception& e) {
        qWarning().noquote() << "Failed to connect to" << host << "with the following exception:" << e.what();
    }

    return std::nullopt;
}
