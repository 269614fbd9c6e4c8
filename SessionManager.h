// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef PILOTDECK_SESSIONMANAGER_H
#define PILOTDECK_SESSIONMANAGER_H

#include <QList>
#include <QMutex>
#include <QString>
#include <atomic>
#include <memory>
#include <optional>
#include <vector>

#include "Device.h"
#include "transport/RemoteTransport.h"

class ConnectionLimiter;
class QIODevice;

/**
 * Owns the connection to one device.
 *
 * A session is two sub-connections, file transfer and remote commands, opened together
 * by connect(). Every data operation calls connect() first, so callers never need to.
 * Concurrent connect() calls for the same device run the handshake once; the others
 * wait for it and share the outcome.
 *
 * The process-wide ConnectionLimiter is held only while the handshakes are in flight.
 */
class SessionManager {
public:
    enum class State : quint8 {
        Disconnected,
        Connecting,
        Connected
    };

    struct Options {
        QString username = QStringLiteral("comma");
        QString keyFile;
        QString workingDirectory = QStringLiteral("/data/openpilot/");
    };

    SessionManager(Device device, RemoteTransport& transport, ConnectionLimiter& limiter, Options options);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /**
     * Opens both sub-connections unless they are already open. Idempotent and thread safe.
     *
     * The sequence is atomic: if the command half fails after the file-transfer half came
     * up, the file-transfer half is closed again and the session stays Disconnected.
     *
     * @param errorOut Receives the underlying failure (Unreachable, AuthenticationRejected,
     *                 HandshakeFailed, ...).
     * @return true when the session is Connected on return.
     */
    bool connect(TransportError* errorOut = nullptr);

    void disconnect();

    [[nodiscard]] State state() const { return m_state.load(std::memory_order_acquire); }
    [[nodiscard]] bool isConnected() const { return state() == State::Connected; }

    [[nodiscard]] const Device& device() const { return m_device; }
    [[nodiscard]] RemoteEndpoint endpoint() const;
    [[nodiscard]] RemoteTransport& transport() const { return m_transport; }
    [[nodiscard]] ConnectionLimiter& limiter() const { return m_limiter; }

    // Number of completed connect sequences over the lifetime of this session.
    [[nodiscard]] int handshakeCount() const { return m_handshakes.load(); }

    std::optional<QList<RemoteEntry>> listDirectory(const QString& path, TransportError* errorOut = nullptr);

    /**
     * Every regular file below path, depth first, siblings ordered by full path.
     */
    std::optional<QList<RemoteEntry>> enumerateFiles(const QString& path, TransportError* errorOut = nullptr);

    /**
     * Every entry below path, depth first, siblings ordered by full path. A directory is
     * reported after its own contents.
     */
    std::optional<QList<RemoteEntry>> enumerateEntries(const QString& path = QStringLiteral("/"),
                                                       TransportError* errorOut = nullptr);

    bool readFile(const QString& path, QIODevice& sink, TransportError* errorOut = nullptr);
    bool uploadFile(const QString& localPath, const QString& remotePath, TransportError* errorOut = nullptr);

    bool changeDirectory(const QString& path, TransportError* errorOut = nullptr);
    [[nodiscard]] QString workingDirectory();

    std::optional<CommandResult> execute(const QString& command, TransportError* errorOut = nullptr);
    std::optional<CommandResult> executeStreaming(const QString& command,
                                                  const CommandClient::LineCallback& onLine,
                                                  TransportError* errorOut = nullptr);

private:
    // Drops to Disconnected after an I/O failure so the next connect() re-checks both halves.
    void noteFailure(const TransportError& error);

    Device m_device;
    RemoteTransport& m_transport;
    ConnectionLimiter& m_limiter;
    Options m_options;

    std::atomic<State> m_state{State::Disconnected};
    std::atomic<int> m_handshakes{0};

    // Serializes connect()/disconnect()
    QMutex m_connectMutex;

    // Guard the sub-connections themselves; never taken before m_connectMutex
    QMutex m_filesMutex;
    QMutex m_commandsMutex;

    std::unique_ptr<FileTransferClient> m_files;
    std::unique_ptr<CommandClient> m_commands;
};

/**
 * Walks a remote tree with an explicit work list instead of recursion.
 *
 * The walk is lazy: each directory is listed when the walker reaches it. restart()
 * begins a fresh walk with fresh listings.
 */
class RemoteTreeWalker {
public:
    enum class Mode : quint8 {
        FilesOnly,  // regular files only
        AllEntries  // files and directories, each directory after its contents
    };

    RemoteTreeWalker(SessionManager& session, QString root, Mode mode);

    /**
     * @return The next entry, or std::nullopt when the walk is over. If it ended because a
     *         listing failed, errorOut says why and the walk stays over until restart().
     */
    std::optional<RemoteEntry> next(TransportError* errorOut = nullptr);

    void restart();

private:
    struct Frame {
        QList<RemoteEntry> entries;
        qsizetype nextIndex = 0;
        std::optional<RemoteEntry> owner; // directory to report once this frame is exhausted
    };

    bool pushDirectory(const QString& path, std::optional<RemoteEntry> owner, TransportError* errorOut);

    SessionManager& m_session;
    QString m_root;
    Mode m_mode;

    std::vector<Frame> m_stack;
    bool m_started = false;
    bool m_failed = false;
};

#endif //PILOTDECK_SESSIONMANAGER_H
