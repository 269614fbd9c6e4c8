// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include <QCoreApplication>

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationDomain(QStringLiteral("reikooters.net"));
    QCoreApplication::setApplicationName(QStringLiteral("pilotdeck_tests"));

    doctest::Context context;
    context.applyCommandLine(argc, argv);
    return context.run();
}
