// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef PILOTDECK_DRIVEEXPORTER_H
#define PILOTDECK_DRIVEEXPORTER_H

#include <QString>
#include <QStringList>
#include <functional>
#include <optional>

#include "Drive.h"

class SessionManager;

struct ExportResult {
    bool success = false;
    QStringList files;     // local files written or already present, in segment order
    QString playlist;      // .m3u path, empty when none was written
    QStringList failures;  // one message per segment that could not be exported
};

/**
 * Copies a drive's camera streams from the device into a local directory, as-is.
 */
class DriveExporter {
public:
    // Called with the index of every segment that has been handled. May be called from
    // worker threads, but never concurrently.
    using ProgressCallback = std::function<void(int segmentIndex)>;

    struct Options {
        // One "<drive><camera>.hevc" instead of one file per segment plus a playlist
        bool combineSegments = false;
    };

    explicit DriveExporter(SessionManager& session);

    ExportResult exportDrive(const Drive& drive, Camera camera, const QString& outputDirectory,
                             const Options& options, const ProgressCallback& progress = {});

    /**
     * Downloads one segment's stream over its own short-lived connection.
     *
     * @return The local file name ("<segment folder><camera>.hevc"), an empty string when
     *         the segment has no such stream, or std::nullopt on failure.
     */
    std::optional<QString> exportSegment(const Segment& segment, Camera camera, const QString& outputDirectory,
                                         TransportError* errorOut = nullptr);

    [[nodiscard]] static QString combinedFileName(const Drive& drive, Camera camera);
    [[nodiscard]] static QString segmentFileName(const Segment& segment, Camera camera);
    [[nodiscard]] static QString playlistFileName(const Drive& drive, Camera camera);

private:
    ExportResult exportCombined(const Drive& drive, Camera camera, const QString& outputDirectory,
                                const ProgressCallback& progress);
    ExportResult exportSegments(const Drive& drive, Camera camera, const QString& outputDirectory,
                                const ProgressCallback& progress);

    SessionManager& m_session;
};

#endif //PILOTDECK_DRIVEEXPORTER_H
