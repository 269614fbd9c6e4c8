// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef PILOTDECK_SETTINGS_H
#define PILOTDECK_SETTINGS_H

#include <QString>

class QSettings;

namespace Settings {
    struct Config {
        // [discovery]
        quint16 sshPort = 8022;
        int probeTimeoutMs = 5000;       // raw TCP connect per host
        int discoveryWaitMs = 10000;     // per-wait deadline, reset whenever a probe completes
        quint32 maxAddressesPerInterface = 1024;
        QString tetheringAddress = QStringLiteral("192.168.43.1");

        // [session]
        int maxConcurrentConnections = 10;
        QString sshProgram = QStringLiteral("ssh");
        int sshConnectTimeoutSeconds = 10;
        QString keyFile;

        // [device]
        QString deviceUser = QStringLiteral("comma");
        QString adminUser = QStringLiteral("root");
    };

    /**
     * Location of the bundled private key: "opensshkey" next to the running executable,
     * or in the current directory when no QCoreApplication exists.
     */
    [[nodiscard]] QString defaultKeyFile();

    /**
     * Reads every value from settings, falling back to the Config defaults for missing keys.
     */
    [[nodiscard]] Config load(QSettings& settings);

    // Same as load(QSettings&) with the application's default QSettings.
    [[nodiscard]] Config load();

    void save(QSettings& settings, const Config& config);
}

#endif //PILOTDECK_SETTINGS_H
