// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "SessionManager.h"

#include <QDebug>
#include <QFile>
#include <QMutexLocker>
#include <algorithm>

#include "ConnectionLimiter.h"

SessionManager::SessionManager(Device device, RemoteTransport& transport, ConnectionLimiter& limiter, Options options)
    : m_device(std::move(device))
    , m_transport(transport)
    , m_limiter(limiter)
    , m_options(std::move(options)) {}

SessionManager::~SessionManager() {
    disconnect();
}

RemoteEndpoint SessionManager::endpoint() const {
    return RemoteEndpoint{m_device.address(), m_device.port(), m_options.username, m_options.keyFile};
}

bool SessionManager::connect(TransportError* errorOut) {
    // Fast path, no locking
    if (m_state.load(std::memory_order_acquire) == State::Connected) {
        return true;
    }

    QMutexLocker connectLock(&m_connectMutex);

    // Someone else may have finished the handshake while we waited. Trust it only if
    // both halves are still really up.
    if (m_state.load(std::memory_order_acquire) == State::Connected) {
        QMutexLocker filesLock(&m_filesMutex);
        QMutexLocker commandsLock(&m_commandsMutex);
        if (m_files && m_files->isConnected() && m_commands && m_commands->isConnected()) {
            return true;
        }
    }

    m_state.store(State::Connecting, std::memory_order_release);

    // Drop whatever is left of a previous session before building a new one.
    {
        QMutexLocker filesLock(&m_filesMutex);
        QMutexLocker commandsLock(&m_commandsMutex);
        if (m_files) m_files->disconnect();
        if (m_commands) m_commands->disconnect();
        m_files.reset();
        m_commands.reset();
    }

    const RemoteEndpoint ep = endpoint();
    auto files = m_transport.createFileTransferClient(ep);
    auto commands = m_transport.createCommandClient(ep);

    auto fail = [&](TransportError error, const char* stage) {
        if (error.kind == TransportError::Kind::None) {
            error.kind = TransportError::Kind::HandshakeFailed;
        }
        qWarning().noquote() << "Connecting to" << m_device.toString() << "failed while" << stage << ":" << error.message;
        if (errorOut) *errorOut = error;
        m_state.store(State::Disconnected, std::memory_order_release);
        return false;
    };

    {
        // More than ~10 handshakes at once makes the transport fail, so wait for a slot.
        ConnectionLimiter::Slot slot = m_limiter.acquire();

        TransportError err;
        if (!files->connect(&err)) {
            return fail(err, "opening the file-transfer connection");
        }

        if (!m_options.workingDirectory.isEmpty() && !files->changeDirectory(m_options.workingDirectory, &err)) {
            files->disconnect();
            if (err.kind == TransportError::Kind::PathNotFound) err.kind = TransportError::Kind::HandshakeFailed;
            return fail(err, "changing the working directory");
        }

        if (!commands->connect(&err)) {
            // Never leave a half-open session behind
            files->disconnect();
            return fail(err, "opening the command connection");
        }
    }

    {
        QMutexLocker filesLock(&m_filesMutex);
        QMutexLocker commandsLock(&m_commandsMutex);
        m_files = std::move(files);
        m_commands = std::move(commands);
    }

    m_handshakes.fetch_add(1);
    m_state.store(State::Connected, std::memory_order_release);
    qInfo().noquote() << "Connected to" << m_device.toString();
    return true;
}

void SessionManager::disconnect() {
    QMutexLocker connectLock(&m_connectMutex);
    QMutexLocker filesLock(&m_filesMutex);
    QMutexLocker commandsLock(&m_commandsMutex);

    if (m_files) m_files->disconnect();
    if (m_commands) m_commands->disconnect();
    m_files.reset();
    m_commands.reset();

    m_state.store(State::Disconnected, std::memory_order_release);
}

void SessionManager::noteFailure(const TransportError& error) {
    if (error.kind == TransportError::Kind::IoFailure) {
        m_state.store(State::Disconnected, std::memory_order_release);
    }
}

static bool notConnected(TransportError* errorOut) {
    setTransportError(errorOut, TransportError::Kind::IoFailure, QStringLiteral("Session is not connected"));
    return false;
}

std::optional<QList<RemoteEntry>> SessionManager::listDirectory(const QString& path, TransportError* errorOut) {
    if (!connect(errorOut)) return std::nullopt;

    QMutexLocker lock(&m_filesMutex);
    if (!m_files) {
        notConnected(errorOut);
        return std::nullopt;
    }

    TransportError err;
    auto entries = m_files->listDirectory(path, &err);
    if (!entries) {
        noteFailure(err);
        if (errorOut) *errorOut = err;
    }
    return entries;
}

std::optional<QList<RemoteEntry>> SessionManager::enumerateFiles(const QString& path, TransportError* errorOut) {
    RemoteTreeWalker walker(*this, path, RemoteTreeWalker::Mode::FilesOnly);

    QList<RemoteEntry> out;
    TransportError err;
    while (auto entry = walker.next(&err)) {
        out.push_back(*entry);
    }

    if (err.isError()) {
        if (errorOut) *errorOut = err;
        return std::nullopt;
    }
    return out;
}

std::optional<QList<RemoteEntry>> SessionManager::enumerateEntries(const QString& path, TransportError* errorOut) {
    RemoteTreeWalker walker(*this, path, RemoteTreeWalker::Mode::AllEntries);

    QList<RemoteEntry> out;
    TransportError err;
    while (auto entry = walker.next(&err)) {
        out.push_back(*entry);
    }

    if (err.isError()) {
        if (errorOut) *errorOut = err;
        return std::nullopt;
    }
    return out;
}

bool SessionManager::readFile(const QString& path, QIODevice& sink, TransportError* errorOut) {
    if (!connect(errorOut)) return false;

    QMutexLocker lock(&m_filesMutex);
    if (!m_files) return notConnected(errorOut);

    TransportError err;
    if (!m_files->readFile(path, sink, &err)) {
        noteFailure(err);
        if (errorOut) *errorOut = err;
        return false;
    }
    return true;
}

bool SessionManager::uploadFile(const QString& localPath, const QString& remotePath, TransportError* errorOut) {
    QFile source(localPath);
    if (!source.open(QIODevice::ReadOnly)) {
        setTransportError(errorOut, TransportError::Kind::IoFailure,
                          QStringLiteral("Cannot open %1: %2").arg(localPath, source.errorString()));
        return false;
    }

    if (!connect(errorOut)) return false;

    QMutexLocker lock(&m_filesMutex);
    if (!m_files) return notConnected(errorOut);

    TransportError err;
    if (!m_files->writeFile(source, remotePath, &err)) {
        noteFailure(err);
        if (errorOut) *errorOut = err;
        return false;
    }
    return true;
}

bool SessionManager::changeDirectory(const QString& path, TransportError* errorOut) {
    if (!connect(errorOut)) return false;

    QMutexLocker lock(&m_filesMutex);
    if (!m_files) return notConnected(errorOut);

    TransportError err;
    if (!m_files->changeDirectory(path, &err)) {
        noteFailure(err);
        if (errorOut) *errorOut = err;
        return false;
    }
    return true;
}

QString SessionManager::workingDirectory() {
    QMutexLocker lock(&m_filesMutex);
    return m_files ? m_files->workingDirectory() : QString();
}

std::optional<CommandResult> SessionManager::execute(const QString& command, TransportError* errorOut) {
    return executeStreaming(command, {}, errorOut);
}

std::optional<CommandResult> SessionManager::executeStreaming(const QString& command,
                                                              const CommandClient::LineCallback& onLine,
                                                              TransportError* errorOut) {
    if (!connect(errorOut)) return std::nullopt;

    QMutexLocker lock(&m_commandsMutex);
    if (!m_commands) {
        notConnected(errorOut);
        return std::nullopt;
    }

    qDebug().noquote() << m_device.address().toString() << "$" << command;

    TransportError err;
    auto result = onLine ? m_commands->executeStreaming(command, onLine, &err)
                         : m_commands->execute(command, &err);
    if (!result) {
        noteFailure(err);
        if (errorOut) *errorOut = err;
    }
    return result;
}

RemoteTreeWalker::RemoteTreeWalker(SessionManager& session, QString root, Mode mode)
    : m_session(session), m_root(std::move(root)), m_mode(mode) {}

void RemoteTreeWalker::restart() {
    m_stack.clear();
    m_started = false;
    m_failed = false;
}

bool RemoteTreeWalker::pushDirectory(const QString& path, std::optional<RemoteEntry> owner, TransportError* errorOut) {
    auto entries = m_session.listDirectory(path, errorOut);
    if (!entries) {
        m_failed = true;
        m_stack.clear();
        return false;
    }

    std::sort(entries->begin(), entries->end(), [](const RemoteEntry& a, const RemoteEntry& b) {
        return a.fullPath < b.fullPath;
    });

    m_stack.push_back(Frame{std::move(*entries), 0, std::move(owner)});
    return true;
}

std::optional<RemoteEntry> RemoteTreeWalker::next(TransportError* errorOut) {
    if (m_failed) return std::nullopt;

    if (!m_started) {
        m_started = true;
        if (!pushDirectory(m_root, std::nullopt, errorOut)) return std::nullopt;
    }

    while (!m_stack.empty()) {
        Frame& top = m_stack.back();

        if (top.nextIndex >= top.entries.size()) {
            std::optional<RemoteEntry> owner = std::move(top.owner);
            m_stack.pop_back();
            if (owner && m_mode == Mode::AllEntries) {
                return owner;
            }
            continue;
        }

        RemoteEntry entry = top.entries[top.nextIndex++];
        if (entry.name == QStringLiteral(".") || entry.name == QStringLiteral("..")) {
            continue;
        }

        if (entry.isDirectory) {
            // `top` is invalid after this push
            if (!pushDirectory(entry.fullPath, entry, errorOut)) return std::nullopt;
            continue;
        }

        return entry;
    }

    return std::nullopt;
}
