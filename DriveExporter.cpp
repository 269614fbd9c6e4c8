// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "DriveExporter.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QMutexLocker>
#include <QSaveFile>
#include <QTextStream>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <vector>

#include "ConnectionLimiter.h"
#include "SessionManager.h"

DriveExporter::DriveExporter(SessionManager& session)
    : m_session(session) {}

QString DriveExporter::combinedFileName(const Drive& drive, Camera camera) {
    return drive.toString() + QChar::fromLatin1(static_cast<char>(camera)) + QStringLiteral(".hevc");
}

QString DriveExporter::segmentFileName(const Segment& segment, Camera camera) {
    return segment.folderName + QChar::fromLatin1(static_cast<char>(camera)) + QStringLiteral(".hevc");
}

QString DriveExporter::playlistFileName(const Drive& drive, Camera camera) {
    return drive.toString() + QChar::fromLatin1(static_cast<char>(camera)) + QStringLiteral(".m3u");
}

ExportResult DriveExporter::exportDrive(const Drive& drive, Camera camera, const QString& outputDirectory,
                                        const Options& options, const ProgressCallback& progress) {
    if (!QDir().mkpath(outputDirectory)) {
        ExportResult result;
        result.failures << QStringLiteral("Cannot create %1").arg(outputDirectory);
        return result;
    }

    qInfo().noquote() << "Exporting drive" << drive.toString() << "camera"
                      << QChar::fromLatin1(static_cast<char>(camera)) << "to" << outputDirectory;

    return options.combineSegments
        ? exportCombined(drive, camera, outputDirectory, progress)
        : exportSegments(drive, camera, outputDirectory, progress);
}

ExportResult DriveExporter::exportCombined(const Drive& drive, Camera camera, const QString& outputDirectory,
                                           const ProgressCallback& progress) {
    ExportResult result;

    const QString filePath = QDir(outputDirectory).filePath(combinedFileName(drive, camera));
    QFile out(filePath);
    if (!out.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        result.failures << QStringLiteral("Cannot open %1: %2").arg(filePath, out.errorString());
        return result;
    }

    // Through the device's own session, one segment after the other
    for (const Segment& segment : drive.segments) {
        const auto& stream = segment.camera(camera);
        if (stream) {
            TransportError err;
            if (!m_session.readFile(stream->fullPath, out, &err)) {
                qWarning().noquote() << "Failed to read" << stream->fullPath << ":" << err.message;
                out.close();
                QFile::remove(filePath);
                result.failures << QStringLiteral("%1: %2").arg(stream->fullPath, err.message);
                return result;
            }
        }

        if (progress) progress(segment.index);
    }

    const bool written = out.size() > 0;
    out.close();

    if (written) {
        result.files << filePath;
    } else {
        QFile::remove(filePath);
    }

    result.success = true;
    return result;
}

ExportResult DriveExporter::exportSegments(const Drive& drive, Camera camera, const QString& outputDirectory,
                                           const ProgressCallback& progress) {
    ExportResult result;

    const size_t count = static_cast<size_t>(drive.segments.size());
    std::vector<std::optional<QString>> names(count);
    std::vector<QString> errors(count);
    QMutex progressMutex;

    // Grain size 1: every segment is a separate download. The limiter still caps the
    // number of handshakes in flight.
    tbb::parallel_for(
        tbb::blocked_range<size_t>(0, count, 1),
        [&](const tbb::blocked_range<size_t>& r) {
            for (size_t i = r.begin(); i != r.end(); ++i) {
                const Segment& segment = drive.segments[static_cast<qsizetype>(i)];

                TransportError err;
                names[i] = exportSegment(segment, camera, outputDirectory, &err);
                if (!names[i]) {
                    errors[i] = QStringLiteral("Segment %1: %2").arg(segment.index).arg(err.message);
                }

                if (progress) {
                    QMutexLocker lock(&progressMutex);
                    progress(segment.index);
                }
            }
        });

    QStringList playlist;
    for (size_t i = 0; i < count; ++i) {
        if (!names[i]) {
            result.failures << errors[i];
            continue;
        }
        if (names[i]->isEmpty()) continue;

        result.files << QDir(outputDirectory).filePath(*names[i]);
        playlist << *names[i];
    }

    if (playlist.size() > 1) {
        const QString playlistPath = QDir(outputDirectory).filePath(playlistFileName(drive, camera));
        QSaveFile file(playlistPath);
        if (file.open(QIODevice::WriteOnly | QIODevice::Text)) {
            QTextStream stream(&file);
            stream << playlist.join(QLatin1Char('\n'));
            stream.flush();
        }
        if (file.commit()) {
            result.playlist = playlistPath;
        } else {
            result.failures << QStringLiteral("Cannot write %1: %2").arg(playlistPath, file.errorString());
        }
    }

    result.success = result.failures.isEmpty();
    return result;
}

std::optional<QString> DriveExporter::exportSegment(const Segment& segment, Camera camera,
                                                    const QString& outputDirectory, TransportError* errorOut) {
    const auto& stream = segment.camera(camera);
    if (!stream) {
        return QString();
    }

    const QString fileName = segmentFileName(segment, camera);
    const QString filePath = QDir(outputDirectory).filePath(fileName);

    if (QFileInfo::exists(filePath)) {
        qDebug().noquote() << "Skipping" << filePath << "(already exported)";
        return fileName;
    }

    auto client = m_session.transport().createFileTransferClient(m_session.endpoint());
    {
        ConnectionLimiter::Slot slot = m_session.limiter().acquire();
        if (!client->connect(errorOut)) {
            return std::nullopt;
        }
    }

    QFile out(filePath);
    if (!out.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        client->disconnect();
        setTransportError(errorOut, TransportError::Kind::IoFailure,
                          QStringLiteral("Cannot open %1: %2").arg(filePath, out.errorString()));
        return std::nullopt;
    }

    const bool ok = client->readFile(stream->fullPath, out, errorOut);
    out.close();
    client->disconnect();

    if (!ok) {
        qWarning().noquote() << "Failed to export" << stream->fullPath;
        QFile::remove(filePath);
        return std::nullopt;
    }

    return fileName;
}
