// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <doctest/doctest.h>

#include <QSettings>
#include <QTemporaryDir>

#include "Settings.h"

TEST_CASE("an empty settings file yields the defaults") {
    QTemporaryDir dir;
    QSettings s(dir.filePath(QStringLiteral("pilotdeck.ini")), QSettings::IniFormat);

    const Settings::Config c = Settings::load(s);
    CHECK(c.sshPort == 8022);
    CHECK(c.probeTimeoutMs == 5000);
    CHECK(c.discoveryWaitMs == 10000);
    CHECK(c.maxAddressesPerInterface == 1024u);
    CHECK(c.tetheringAddress == QStringLiteral("192.168.43.1"));
    CHECK(c.maxConcurrentConnections == 10);
    CHECK(c.deviceUser == QStringLiteral("comma"));
    CHECK(c.adminUser == QStringLiteral("root"));
    CHECK(c.keyFile.endsWith(QStringLiteral("opensshkey")));
}

TEST_CASE("saved values load back") {
    QTemporaryDir dir;
    const QString path = dir.filePath(QStringLiteral("pilotdeck.ini"));

    Settings::Config c;
    c.sshPort = 22;
    c.maxConcurrentConnections = 3;
    c.keyFile = QStringLiteral("/etc/pilotdeck/key");
    c.tetheringAddress = QStringLiteral("172.20.10.1");
    {
        QSettings s(path, QSettings::IniFormat);
        Settings::save(s, c);
    }

    QSettings s(path, QSettings::IniFormat);
    const Settings::Config loaded = Settings::load(s);
    CHECK(loaded.sshPort == 22);
    CHECK(loaded.maxConcurrentConnections == 3);
    CHECK(loaded.keyFile == QStringLiteral("/etc/pilotdeck/key"));
    CHECK(loaded.tetheringAddress == QStringLiteral("172.20.10.1"));
}

TEST_CASE("invalid values fall back to defaults") {
    QTemporaryDir dir;
    QSettings s(dir.filePath(QStringLiteral("pilotdeck.ini")), QSettings::IniFormat);
    s.setValue(QStringLiteral("session/maxConcurrentConnections"), 0);
    s.setValue(QStringLiteral("discovery/probeTimeoutMs"), -5);

    const Settings::Config c = Settings::load(s);
    CHECK(c.maxConcurrentConnections == 10);
    CHECK(c.probeTimeoutMs == 5000);
}
