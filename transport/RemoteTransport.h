// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef PILOTDECK_TRANSPORT_REMOTETRANSPORT_H
#define PILOTDECK_TRANSPORT_REMOTETRANSPORT_H

#include <QByteArray>
#include <QHostAddress>
#include <QList>
#include <QString>
#include <atomic>
#include <functional>
#include <memory>
#include <optional>

class QIODevice;

/**
 * Where and as whom to open an authenticated connection.
 */
struct RemoteEndpoint {
    QHostAddress address;
    quint16 port = 0;
    QString username;
    QString keyFile; // private key used for public key authentication
};

/**
 * One entry of a remote directory listing. Never "." or "..".
 */
struct RemoteEntry {
    QString name;
    QString fullPath;
    bool isDirectory = false;
    qint64 size = -1; // -1 when the listing does not report sizes
};

struct CommandResult {
    int exitStatus = -1;
    QByteArray standardOutput;
    QByteArray standardError;
};

struct TransportError {
    enum class Kind : quint8 {
        None,
        Unreachable,            // nothing answered within the timeout
        AuthenticationRejected, // the host answered but refused the credential
        HandshakeFailed,        // connect sequence failed after the host answered
        PathNotFound,           // remote path does not exist
        IoFailure,              // any other fault while talking to the host
        Cancelled
    };

    Kind kind = Kind::None;
    QString message;

    [[nodiscard]] bool isError() const { return kind != Kind::None; }
};

/**
 * Stores an error into an optional out-parameter.
 */
inline void setTransportError(TransportError* errorOut, TransportError::Kind kind, const QString& message) {
    if (errorOut) {
        errorOut->kind = kind;
        errorOut->message = message;
    }
}

/**
 * The file-transfer half of a device session.
 *
 * Relative paths passed to listDirectory(), readFile() and writeFile() are resolved
 * against workingDirectory().
 */
class FileTransferClient {
public:
    virtual ~FileTransferClient() = default;

    virtual bool connect(TransportError* errorOut = nullptr) = 0;
    [[nodiscard]] virtual bool isConnected() const = 0;
    virtual void disconnect() = 0;

    virtual bool changeDirectory(const QString& path, TransportError* errorOut = nullptr) = 0;
    [[nodiscard]] virtual QString workingDirectory() const = 0;

    /**
     * Lists the direct children of a remote directory.
     *
     * @param path Remote directory.
     * @param errorOut Receives PathNotFound when the directory does not exist.
     * @return The entries in no particular order, or std::nullopt on failure.
     */
    virtual std::optional<QList<RemoteEntry>> listDirectory(const QString& path, TransportError* errorOut = nullptr) = 0;

    /**
     * Streams a remote file into sink as it arrives.
     */
    virtual bool readFile(const QString& path, QIODevice& sink, TransportError* errorOut = nullptr) = 0;

    virtual bool writeFile(QIODevice& source, const QString& path, TransportError* errorOut = nullptr) = 0;
};

/**
 * The remote-command half of a device session.
 */
class CommandClient {
public:
    using LineCallback = std::function<void(const QString& line)>;

    virtual ~CommandClient() = default;

    virtual bool connect(TransportError* errorOut = nullptr) = 0;
    [[nodiscard]] virtual bool isConnected() const = 0;
    virtual void disconnect() = 0;

    virtual std::optional<CommandResult> execute(const QString& command, TransportError* errorOut = nullptr) = 0;

    /**
     * Runs a command and hands every output line (stdout and stderr) to onLine while it runs.
     * The returned result still carries the complete captured output.
     */
    virtual std::optional<CommandResult> executeStreaming(const QString& command,
                                                          const LineCallback& onLine,
                                                          TransportError* errorOut = nullptr) = 0;
};

/**
 * Factory and probe surface of the secure remote transport.
 */
class RemoteTransport {
public:
    virtual ~RemoteTransport() = default;

    /**
     * Attempts a raw TCP connection and closes it again.
     *
     * @param cancelled Optional flag; when it becomes true the attempt gives up early.
     * @return true if the connection was accepted within timeoutMs.
     */
    virtual bool probe(const QHostAddress& address, quint16 port, int timeoutMs,
                       const std::atomic<bool>* cancelled = nullptr) = 0;

    /**
     * Performs one complete authenticated handshake and closes the connection.
     * A refused credential is reported as AuthenticationRejected.
     */
    virtual bool authenticate(const RemoteEndpoint& endpoint, TransportError* errorOut = nullptr) = 0;

    virtual std::unique_ptr<FileTransferClient> createFileTransferClient(const RemoteEndpoint& endpoint) = 0;
    virtual std::unique_ptr<CommandClient> createCommandClient(const RemoteEndpoint& endpoint) = 0;
};

#endif //PILOTDECK_TRANSPORT_REMOTETRANSPORT_H
