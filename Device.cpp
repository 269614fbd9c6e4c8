// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "Device.h"

static const QString kStorageDirectory = QStringLiteral("/data/media/0/realdata/");
static const QString kWorkingDirectory = QStringLiteral("/data/openpilot/");
static const QString kFlashPandaCommand = QStringLiteral("cd /data/openpilot/panda/board && ./recover.sh");
static const QString kInstallEmuCommand = QStringLiteral(
    "cd /data/openpilot && echo 'y' | bash <(curl -fsSL install.emu.sh) && source /data/community/.bashrc");

Device::Device(QHostAddress address, DeviceVariant variant, quint16 port, QString displayName)
    : m_address(std::move(address))
    , m_variant(variant)
    , m_port(port)
    , m_displayName(std::move(displayName)) {}

std::optional<DeviceProfile> Device::profile() const {
    switch (m_variant) {
        case DeviceVariant::GenerationTwo:
            // Android userspace
            return DeviceProfile{
                kStorageDirectory,
                kWorkingDirectory,
                QStringLiteral("am start -a android.intent.action.REBOOT"),
                QStringLiteral("am start -n android/com.android.internal.app.ShutdownActivity"),
                kFlashPandaCommand,
                kInstallEmuCommand
            };
        case DeviceVariant::GenerationThree:
            // Ubuntu userspace, the login user has passwordless sudo
            return DeviceProfile{
                kStorageDirectory,
                kWorkingDirectory,
                QStringLiteral("sudo reboot"),
                QStringLiteral("sudo poweroff"),
                kFlashPandaCommand,
                kInstallEmuCommand
            };
        case DeviceVariant::Unknown:
            break;
    }
    return std::nullopt;
}

QString Device::toString() const {
    const QString ip = m_address.toString();
    if (m_displayName.trimmed().isEmpty()) return ip;
    return ip + QStringLiteral(" - ") + m_displayName;
}

QString Device::variantName(DeviceVariant variant) {
    switch (variant) {
        case DeviceVariant::GenerationTwo: return QStringLiteral("comma two");
        case DeviceVariant::GenerationThree: return QStringLiteral("comma three");
        case DeviceVariant::Unknown: break;
    }
    return QStringLiteral("Unknown");
}

size_t qHash(const Device& device, size_t seed) noexcept {
    return qHash(device.address(), seed);
}
