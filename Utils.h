// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef PILOTDECK_UTILS_H
#define PILOTDECK_UTILS_H

#include <QString>

namespace Utils {
    /**
     * Quotes a string for a POSIX shell so it is passed as exactly one word.
     *
     * @param value Any string, including ones containing quotes or whitespace.
     * @return The value wrapped in single quotes, with embedded single quotes escaped.
     */
    [[nodiscard]] QString shellQuote(const QString& value);

    /**
     * Joins a remote directory and an entry name with exactly one '/' between them.
     */
    [[nodiscard]] QString joinRemotePath(const QString& directory, const QString& name);

    /**
     * Resolves a remote path against a working directory. Absolute paths are returned
     * unchanged; "." and an empty path resolve to the working directory itself.
     */
    [[nodiscard]] QString resolveRemotePath(const QString& workingDirectory, const QString& path);
}

#endif //PILOTDECK_UTILS_H
