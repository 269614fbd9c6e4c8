// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef PILOTDECK_DEVICE_H
#define PILOTDECK_DEVICE_H

#include <QHostAddress>
#include <QHash>
#include <QString>
#include <functional>
#include <optional>

enum class DeviceVariant : quint8 {
    GenerationTwo,
    GenerationThree,
    Unknown
};

/**
 * Remote command lines and paths that differ between hardware generations.
 */
struct DeviceProfile {
    QString storageDirectory;
    QString workingDirectory;
    QString rebootCommand;
    QString shutdownCommand;
    QString flashPandaCommand;
    QString installEmuCommand;
};

/**
 * A device found on the local network.
 *
 * Identity is the IP address alone: two Device values compare equal (and hash equal)
 * whenever their addresses match, whatever their variant or display name.
 */
class Device {
public:
    Device() = default;
    Device(QHostAddress address, DeviceVariant variant, quint16 port = kDefaultPort, QString displayName = {});

    static constexpr quint16 kDefaultPort = 8022;

    [[nodiscard]] const QHostAddress& address() const { return m_address; }
    [[nodiscard]] DeviceVariant variant() const { return m_variant; }
    [[nodiscard]] quint16 port() const { return m_port; }

    [[nodiscard]] const QString& displayName() const { return m_displayName; }
    void setDisplayName(const QString& name) { m_displayName = name; }

    [[nodiscard]] bool isRecognized() const { return m_variant != DeviceVariant::Unknown; }

    /**
     * Command profile for this device's generation, or std::nullopt for Unknown hosts.
     */
    [[nodiscard]] std::optional<DeviceProfile> profile() const;

    // "192.168.43.1" or "192.168.43.1 - Garage"
    [[nodiscard]] QString toString() const;

    [[nodiscard]] static QString variantName(DeviceVariant variant);

    friend bool operator==(const Device& a, const Device& b) { return a.m_address == b.m_address; }
    friend bool operator!=(const Device& a, const Device& b) { return !(a == b); }

private:
    QHostAddress m_address;
    DeviceVariant m_variant = DeviceVariant::Unknown;
    quint16 m_port = kDefaultPort;
    QString m_displayName;
};

size_t qHash(const Device& device, size_t seed = 0) noexcept;

namespace std {
    template<>
    struct hash<Device> {
        size_t operator()(const Device& d) const noexcept { return qHash(d); }
    };
}

#endif //PILOTDECK_DEVICE_H
