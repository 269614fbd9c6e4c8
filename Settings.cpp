// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "Settings.h"

#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QSettings>

namespace Settings {
    QString defaultKeyFile() {
        const QString baseDir = QCoreApplication::instance()
            ? QCoreApplication::applicationDirPath()
            : QDir::currentPath();
        return QDir(baseDir).filePath(QStringLiteral("opensshkey"));
    }

    Config load(QSettings& s) {
        const Config defaults;
        Config c;

        s.beginGroup(QStringLiteral("discovery"));
        c.sshPort = static_cast<quint16>(s.value(QStringLiteral("sshPort"), defaults.sshPort).toUInt());
        c.probeTimeoutMs = s.value(QStringLiteral("probeTimeoutMs"), defaults.probeTimeoutMs).toInt();
        c.discoveryWaitMs = s.value(QStringLiteral("discoveryWaitMs"), defaults.discoveryWaitMs).toInt();
        c.maxAddressesPerInterface = s.value(QStringLiteral("maxAddressesPerInterface"),
                                             defaults.maxAddressesPerInterface).toUInt();
        c.tetheringAddress = s.value(QStringLiteral("tetheringAddress"), defaults.tetheringAddress).toString();
        s.endGroup();

        s.beginGroup(QStringLiteral("session"));
        c.maxConcurrentConnections = s.value(QStringLiteral("maxConcurrentConnections"),
                                             defaults.maxConcurrentConnections).toInt();
        c.sshProgram = s.value(QStringLiteral("sshProgram"), defaults.sshProgram).toString();
        c.sshConnectTimeoutSeconds = s.value(QStringLiteral("sshConnectTimeoutSeconds"),
                                             defaults.sshConnectTimeoutSeconds).toInt();
        c.keyFile = s.value(QStringLiteral("keyFile"), defaultKeyFile()).toString();
        s.endGroup();

        s.beginGroup(QStringLiteral("device"));
        c.deviceUser = s.value(QStringLiteral("deviceUser"), defaults.deviceUser).toString();
        c.adminUser = s.value(QStringLiteral("adminUser"), defaults.adminUser).toString();
        s.endGroup();

        if (c.maxConcurrentConnections < 1) {
            qWarning() << "session/maxConcurrentConnections must be at least 1, using" << defaults.maxConcurrentConnections;
            c.maxConcurrentConnections = defaults.maxConcurrentConnections;
        }
        if (c.probeTimeoutMs <= 0) {
            qWarning() << "discovery/probeTimeoutMs must be positive, using" << defaults.probeTimeoutMs;
            c.probeTimeoutMs = defaults.probeTimeoutMs;
        }
        if (c.discoveryWaitMs <= 0) {
            qWarning() << "discovery/discoveryWaitMs must be positive, using" << defaults.discoveryWaitMs;
            c.discoveryWaitMs = defaults.discoveryWaitMs;
        }

        return c;
    }

    Config load() {
        QSettings s;
        return load(s);
    }

    void save(QSettings& s, const Config& c) {
        s.beginGroup(QStringLiteral("discovery"));
        s.setValue(QStringLiteral("sshPort"), c.sshPort);
        s.setValue(QStringLiteral("probeTimeoutMs"), c.probeTimeoutMs);
        s.setValue(QStringLiteral("discoveryWaitMs"), c.discoveryWaitMs);
        s.setValue(QStringLiteral("maxAddressesPerInterface"), c.maxAddressesPerInterface);
        s.setValue(QStringLiteral("tetheringAddress"), c.tetheringAddress);
        s.endGroup();

        s.beginGroup(QStringLiteral("session"));
        s.setValue(QStringLiteral("maxConcurrentConnections"), c.maxConcurrentConnections);
        s.setValue(QStringLiteral("sshProgram"), c.sshProgram);
        s.setValue(QStringLiteral("sshConnectTimeoutSeconds"), c.sshConnectTimeoutSeconds);
        s.setValue(QStringLiteral("keyFile"), c.keyFile);
        s.endGroup();

        s.beginGroup(QStringLiteral("device"));
        s.setValue(QStringLiteral("deviceUser"), c.deviceUser);
        s.setValue(QStringLiteral("adminUser"), c.adminUser);
        s.endGroup();
    }
}
