// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef PILOTDECK_STORAGERECONSTRUCTOR_H
#define PILOTDECK_STORAGERECONSTRUCTOR_H

#include <QDateTime>
#include <QList>
#include <QString>
#include <optional>

#include "Drive.h"

class SessionManager;

/**
 * One pass over a device's storage root, handing out Drives in (date, index) order.
 *
 * Nothing is listed until the first next(). Segment folders are listed only when the
 * Drive they belong to is handed out.
 */
class DriveSequence {
public:
    /**
     * @param errorOut Set when the sequence ended because of a transport failure. A missing
     *                 storage root is not a failure; the sequence is simply empty.
     * @return The next Drive, or std::nullopt when there are no more.
     */
    std::optional<Drive> next(TransportError* errorOut = nullptr);

    QList<Drive> collect(TransportError* errorOut = nullptr);

private:
    friend class StorageReconstructor;

    struct Entry {
        DriveNaming::SegmentFolder folder;
        QString name;
        QString fullPath;
    };

    DriveSequence(SessionManager& session, QString storageDirectory);

    bool load(TransportError* errorOut);
    void finish() { m_entries.clear(); m_position = 0; m_done = true; }

    SessionManager& m_session;
    QString m_storageDirectory;

    QList<Entry> m_entries;
    qsizetype m_position = 0;
    bool m_loaded = false;
    bool m_done = false;
};

/**
 * Rebuilds the Drive/Segment model from the device's storage directory.
 */
class StorageReconstructor {
public:
    /**
     * @param storageDirectory Storage root; empty means the one from the device's profile.
     */
    explicit StorageReconstructor(SessionManager& session, QString storageDirectory = {});

    /**
     * Every call starts a fresh listing of the storage root.
     */
    [[nodiscard]] DriveSequence listDrives() const;

    /**
     * Lists one segment folder and fills in whichever well-known files it holds.
     *
     * A folder that vanished yields a Segment with no handles set.
     */
    std::optional<Segment> resolveSegment(const QDateTime& date, int index, TransportError* errorOut = nullptr) const;

    static std::optional<Segment> resolveSegment(SessionManager& session, const QString& folderPath,
                                                 const QString& folderName, int index,
                                                 TransportError* errorOut = nullptr);

    [[nodiscard]] QString storageDirectory() const;

private:
    SessionManager& m_session;
    QString m_storageDirectory;
};

#endif //PILOTDECK_STORAGERECONSTRUCTOR_H
