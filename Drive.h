// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef PILOTDECK_DRIVE_H
#define PILOTDECK_DRIVE_H

#include <QDateTime>
#include <QList>
#include <QString>
#include <optional>

#include "transport/RemoteTransport.h"

/**
 * Camera streams a segment may carry. The value is the letter used in exported file names.
 */
enum class Camera : char {
    Front = 'f',
    Driver = 'd',
    Wide = 'e'
};

/**
 * One fixed-length slice of a drive, backed by one remote folder.
 *
 * Every file handle is optional; devices routinely upload or delete parts of a segment.
 */
struct Segment {
    static constexpr auto kFrontCameraFile = "fcamera.hevc";
    static constexpr auto kDriverCameraFile = "dcamera.hevc";
    static constexpr auto kWideCameraFile = "ecamera.hevc";
    static constexpr auto kQuickLogFile = "qlog.bz2";
    static constexpr auto kRawLogFile = "rlog.bz2";
    static constexpr auto kFrontCameraPreviewFile = "qcamera.ts";

    int index = 0;
    QString folderName; // e.g. "2024-01-01--10-00-00--3"
    QString folderPath;

    std::optional<RemoteEntry> frontCamera;
    std::optional<RemoteEntry> driverCamera;
    std::optional<RemoteEntry> wideCamera;
    std::optional<RemoteEntry> quickLog;
    std::optional<RemoteEntry> rawLog;
    std::optional<RemoteEntry> frontCameraPreview;

    [[nodiscard]] const std::optional<RemoteEntry>& camera(Camera camera) const;

    /**
     * Fills the handle whose well-known name matches entry.name (case-insensitive).
     *
     * @return false if the name is not one of the six well-known files.
     */
    bool assign(const RemoteEntry& entry);
};

/**
 * A continuous recording: every segment folder that shares the same start timestamp.
 */
struct Drive {
    QDateTime date;
    QList<Segment> segments; // ascending by index

    // "2024-01-01--10-00-00", the prefix shared by the drive's segment folders
    [[nodiscard]] QString toString() const;
};

namespace DriveNaming {
    struct SegmentFolder {
        QDateTime date;
        int index = 0;
    };

    /**
     * Parses a storage folder name of the form "yyyy-MM-dd--HH-mm-ss--<index>".
     *
     * @return std::nullopt for any other name, including impossible dates and times.
     */
    [[nodiscard]] std::optional<SegmentFolder> parseSegmentFolder(const QString& name);

    [[nodiscard]] QString formatDate(const QDateTime& date);
    [[nodiscard]] QString segmentFolderName(const QDateTime& date, int index);
}

#endif //PILOTDECK_DRIVE_H
