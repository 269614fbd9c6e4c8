// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "Drive.h"

#include <QRegularExpression>
#include <QTimeZone>

static const QString kDateFormat = QStringLiteral("yyyy-MM-dd--HH-mm-ss");

const std::optional<RemoteEntry>& Segment::camera(Camera camera) const {
    switch (camera) {
        case Camera::Driver: return driverCamera;
        case Camera::Wide: return wideCamera;
        case Camera::Front: break;
    }
    return frontCamera;
}

bool Segment::assign(const RemoteEntry& entry) {
    auto is = [&entry](const char* name) {
        return entry.name.compare(QLatin1String(name), Qt::CaseInsensitive) == 0;
    };

    if (is(kFrontCameraFile)) frontCamera = entry;
    else if (is(kDriverCameraFile)) driverCamera = entry;
    else if (is(kWideCameraFile)) wideCamera = entry;
    else if (is(kQuickLogFile)) quickLog = entry;
    else if (is(kRawLogFile)) rawLog = entry;
    else if (is(kFrontCameraPreviewFile)) frontCameraPreview = entry;
    else return false;

    return true;
}

QString Drive::toString() const {
    return DriveNaming::formatDate(date);
}

namespace DriveNaming {
    std::optional<SegmentFolder> parseSegmentFolder(const QString& name) {
        static const QRegularExpression re(
            QStringLiteral("^(\\d{4}-\\d{2}-\\d{2})--(\\d{2}-\\d{2}-\\d{2})--(\\d+)$"));

        const QRegularExpressionMatch m = re.match(name);
        if (!m.hasMatch()) return std::nullopt;

        const QDate date = QDate::fromString(m.captured(1), QStringLiteral("yyyy-MM-dd"));
        const QTime time = QTime::fromString(m.captured(2), QStringLiteral("HH-mm-ss"));
        if (!date.isValid() || !time.isValid()) return std::nullopt;

        bool ok = false;
        const int index = m.captured(3).toInt(&ok);
        if (!ok) return std::nullopt;

        // Folder names carry no zone; UTC keeps every name representable (no DST gaps).
        return SegmentFolder{QDateTime(date, time, QTimeZone::utc()), index};
    }

    QString formatDate(const QDateTime& date) {
        return date.toString(kDateFormat);
    }

    QString segmentFolderName(const QDateTime& date, int index) {
        return formatDate(date) + QStringLiteral("--") + QString::number(index);
    }
}
