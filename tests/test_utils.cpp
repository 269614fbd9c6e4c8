// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <doctest/doctest.h>

#include "Utils.h"

TEST_CASE("shellQuote wraps values in single quotes") {
    CHECK(Utils::shellQuote(QStringLiteral("plain")) == QStringLiteral("'plain'"));
    CHECK(Utils::shellQuote(QStringLiteral("two words")) == QStringLiteral("'two words'"));
    CHECK(Utils::shellQuote(QStringLiteral("it's")) == QStringLiteral("'it'\\''s'"));
    CHECK(Utils::shellQuote(QString()) == QStringLiteral("''"));
}

TEST_CASE("joinRemotePath puts exactly one slash between the parts") {
    CHECK(Utils::joinRemotePath(QStringLiteral("/data"), QStringLiteral("x")) == QStringLiteral("/data/x"));
    CHECK(Utils::joinRemotePath(QStringLiteral("/data/"), QStringLiteral("x")) == QStringLiteral("/data/x"));
    CHECK(Utils::joinRemotePath(QStringLiteral("/data/"), QStringLiteral("/x")) == QStringLiteral("/data/x"));
    CHECK(Utils::joinRemotePath(QStringLiteral("/"), QStringLiteral("x")) == QStringLiteral("/x"));
}

TEST_CASE("resolveRemotePath resolves against the working directory") {
    const QString wd = QStringLiteral("/data/openpilot/");
    CHECK(Utils::resolveRemotePath(wd, QStringLiteral("/abs")) == QStringLiteral("/abs"));
    CHECK(Utils::resolveRemotePath(wd, QStringLiteral(".")) == wd);
    CHECK(Utils::resolveRemotePath(wd, QString()) == wd);
    CHECK(Utils::resolveRemotePath(wd, QStringLiteral("panda")) == QStringLiteral("/data/openpilot/panda"));
}
