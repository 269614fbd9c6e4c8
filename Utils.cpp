// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "Utils.h"

namespace Utils {
    QString shellQuote(const QString& value) {
        QString out;
        out.reserve(value.size() + 2);
        out += QLatin1Char('\'');
        for (const QChar c : value) {
            if (c == QLatin1Char('\'')) {
                out += QStringLiteral("'\\''");
            } else {
                out += c;
            }
        }
        out += QLatin1Char('\'');
        return out;
    }

    QString joinRemotePath(const QString& directory, const QString& name) {
        if (directory.isEmpty()) return name;
        if (name.isEmpty()) return directory;

        const bool dirSlash = directory.endsWith(QLatin1Char('/'));
        const bool nameSlash = name.startsWith(QLatin1Char('/'));

        if (dirSlash && nameSlash) return directory + name.mid(1);
        if (dirSlash || nameSlash) return directory + name;
        return directory + QLatin1Char('/') + name;
    }

    QString resolveRemotePath(const QString& workingDirectory, const QString& path) {
        if (path.startsWith(QLatin1Char('/'))) return path;
        if (path.isEmpty() || path == QStringLiteral(".")) {
            return workingDirectory.isEmpty() ? QStringLiteral(".") : workingDirectory;
        }
        if (workingDirectory.isEmpty()) return path;
        return joinRemotePath(workingDirectory, path);
    }
}
