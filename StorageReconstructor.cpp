// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "StorageReconstructor.h"

#include <QDebug>
#include <algorithm>

#include "SessionManager.h"
#include "Utils.h"

DriveSequence::DriveSequence(SessionManager& session, QString storageDirectory)
    : m_session(session), m_storageDirectory(std::move(storageDirectory)) {}

bool DriveSequence::load(TransportError* errorOut) {
    m_loaded = true;

    if (m_storageDirectory.isEmpty()) {
        setTransportError(errorOut, TransportError::Kind::HandshakeFailed,
                          QStringLiteral("%1 is not a recognized device").arg(m_session.device().toString()));
        finish();
        return false;
    }

    TransportError err;
    auto listing = m_session.listDirectory(m_storageDirectory, &err);
    if (!listing) {
        if (err.kind == TransportError::Kind::PathNotFound) {
            qInfo().noquote() << "No storage directory on" << m_session.device().toString();
            finish();
            return true;
        }
        if (errorOut) *errorOut = err;
        finish();
        return false;
    }

    for (const RemoteEntry& entry : *listing) {
        auto folder = DriveNaming::parseSegmentFolder(entry.name);
        if (!folder) continue;
        m_entries.push_back(Entry{*folder, entry.name, entry.fullPath});
    }

    std::sort(m_entries.begin(), m_entries.end(), [](const Entry& a, const Entry& b) {
        if (a.folder.date != b.folder.date) return a.folder.date < b.folder.date;
        return a.folder.index < b.folder.index;
    });

    qDebug() << "Found" << m_entries.size() << "segment folder(s)";
    return true;
}

std::optional<Drive> DriveSequence::next(TransportError* errorOut) {
    if (m_done) return std::nullopt;

    if (!m_loaded && !load(errorOut)) {
        return std::nullopt;
    }

    if (m_position >= m_entries.size()) {
        finish();
        return std::nullopt;
    }

    // A drive is the maximal run of folders whose timestamps are identical.
    Drive drive;
    drive.date = m_entries[m_position].folder.date;

    while (m_position < m_entries.size() && m_entries[m_position].folder.date == drive.date) {
        const Entry& entry = m_entries[m_position];

        auto segment = StorageReconstructor::resolveSegment(m_session, entry.fullPath, entry.name,
                                                            entry.folder.index, errorOut);
        if (!segment) {
            finish();
            return std::nullopt;
        }

        drive.segments.push_back(std::move(*segment));
        ++m_position;
    }

    return drive;
}

QList<Drive> DriveSequence::collect(TransportError* errorOut) {
    QList<Drive> out;
    while (auto drive = next(errorOut)) {
        out.push_back(std::move(*drive));
    }
    return out;
}

StorageReconstructor::StorageReconstructor(SessionManager& session, QString storageDirectory)
    : m_session(session), m_storageDirectory(std::move(storageDirectory)) {}

QString StorageReconstructor::storageDirectory() const {
    if (!m_storageDirectory.isEmpty()) return m_storageDirectory;

    const auto profile = m_session.device().profile();
    return profile ? profile->storageDirectory : QString();
}

DriveSequence StorageReconstructor::listDrives() const {
    return DriveSequence(m_session, storageDirectory());
}

std::optional<Segment> StorageReconstructor::resolveSegment(const QDateTime& date, int index, TransportError* errorOut) const {
    const QString root = storageDirectory();
    if (root.isEmpty()) {
        setTransportError(errorOut, TransportError::Kind::HandshakeFailed,
                          QStringLiteral("%1 is not a recognized device").arg(m_session.device().toString()));
        return std::nullopt;
    }

    const QString name = DriveNaming::segmentFolderName(date, index);
    return resolveSegment(m_session, Utils::joinRemotePath(root, name), name, index, errorOut);
}

std::optional<Segment> StorageReconstructor::resolveSegment(SessionManager& session, const QString& folderPath,
                                                            const QString& folderName, int index,
                                                            TransportError* errorOut) {
    Segment segment;
    segment.index = index;
    segment.folderName = folderName;
    segment.folderPath = folderPath;

    TransportError err;
    auto files = session.listDirectory(folderPath, &err);
    if (!files) {
        if (err.kind == TransportError::Kind::PathNotFound) {
            return segment;
        }
        if (errorOut) *errorOut = err;
        return std::nullopt;
    }

    for (const RemoteEntry& file : *files) {
        if (file.isDirectory) continue;
        segment.assign(file);
    }

    return segment;
}
