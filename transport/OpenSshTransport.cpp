// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "OpenSshTransport.h"

#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QIODevice>
#include <QTcpSocket>
#include <atomic>

#include "ProcessRunner.h"
#include "../Utils.h"

namespace {
    constexpr int kControlTimeoutMs = 10'000;

    std::atomic<quint64> g_nextControlId{1};

    QString controlPathFor(const RemoteEndpoint& endpoint) {
        // Unix socket paths are limited to ~108 bytes, keep this short.
        const QString name = QStringLiteral("pd-%1-%2-%3.ctl")
            .arg(QCoreApplication::applicationPid())
            .arg(g_nextControlId.fetch_add(1))
            .arg(endpoint.username);
        return QDir(QDir::tempPath()).filePath(name);
    }

    /**
     * Options shared by every ssh invocation that performs a handshake.
     */
    QStringList handshakeArguments(const RemoteEndpoint& endpoint, int connectTimeoutSeconds) {
        return {
            QStringLiteral("-p"), QString::number(endpoint.port),
            QStringLiteral("-i"), endpoint.keyFile,
            QStringLiteral("-l"), endpoint.username,
            QStringLiteral("-o"), QStringLiteral("BatchMode=yes"),
            QStringLiteral("-o"), QStringLiteral("IdentitiesOnly=yes"),
            QStringLiteral("-o"), QStringLiteral("StrictHostKeyChecking=no"),
            QStringLiteral("-o"), QStringLiteral("UserKnownHostsFile=/dev/null"),
            QStringLiteral("-o"), QStringLiteral("LogLevel=ERROR"),
            QStringLiteral("-o"), QStringLiteral("ConnectTimeout=%1").arg(connectTimeoutSeconds),
        };
    }

    /**
     * Maps a failed ssh run onto the transport error taxonomy.
     * ssh reports its own failures with exit status 255 and a diagnostic on stderr.
     */
    TransportError classifySshFailure(const ProcessRunner::Result& r) {
        if (!r.started) {
            return {TransportError::Kind::IoFailure, r.error};
        }
        if (r.cancelled) {
            return {TransportError::Kind::Cancelled, QStringLiteral("Cancelled")};
        }
        if (r.timedOut) {
            return {TransportError::Kind::Unreachable, r.error};
        }

        const QString diagnostic = QString::fromLocal8Bit(r.stderrData).trimmed();

        if (diagnostic.contains(QStringLiteral("Permission denied"))
            || diagnostic.contains(QStringLiteral("Too many authentication failures"))) {
            return {TransportError::Kind::AuthenticationRejected, diagnostic};
        }

        if (diagnostic.contains(QStringLiteral("Connection refused"))
            || diagnostic.contains(QStringLiteral("timed out"))
            || diagnostic.contains(QStringLiteral("No route to host"))
            || diagnostic.contains(QStringLiteral("Network is unreachable"))) {
            return {TransportError::Kind::Unreachable, diagnostic};
        }

        return {
            TransportError::Kind::HandshakeFailed,
            diagnostic.isEmpty() ? QStringLiteral("ssh exited with status %1").arg(r.exitCode) : diagnostic
        };
    }

    void storeError(TransportError* errorOut, const TransportError& e) {
        if (errorOut) *errorOut = e;
    }

    /**
     * One OpenSSH control master and the plumbing to run commands over it.
     */
    class SshChannel {
    public:
        SshChannel(const OpenSshTransport::Options& options, RemoteEndpoint endpoint)
            : m_options(options), m_endpoint(std::move(endpoint)) {}

        ~SshChannel() { close(); }

        SshChannel(const SshChannel&) = delete;
        SshChannel& operator=(const SshChannel&) = delete;

        bool open(TransportError* errorOut) {
            if (isOpen()) return true;

            m_controlPath = controlPathFor(m_endpoint);
            QFile::remove(m_controlPath);

            QStringList args = handshakeArguments(m_endpoint, m_options.connectTimeoutSeconds);
            args << QStringLiteral("-M") << QStringLiteral("-S") << m_controlPath
                 << QStringLiteral("-f") << QStringLiteral("-N")
                 << m_endpoint.address.toString();

            ProcessRunner::Options opts;
            opts.timeoutMs = (m_options.connectTimeoutSeconds + 5) * 1000;

            const auto r = ProcessRunner::run(m_options.sshProgram, args, opts);
            if (!r.succeeded()) {
                storeError(errorOut, classifySshFailure(r));
                m_controlPath.clear();
                return false;
            }

            m_open = true;
            qDebug() << "ssh master up for" << m_endpoint.username << "@" << m_endpoint.address.toString();
            return true;
        }

        [[nodiscard]] bool isOpen() const {
            return m_open && QFileInfo::exists(m_controlPath);
        }

        void close() {
            if (!m_open) return;
            m_open = false;

            const QStringList args{
                QStringLiteral("-S"), m_controlPath,
                QStringLiteral("-O"), QStringLiteral("exit"),
                m_endpoint.address.toString()
            };

            ProcessRunner::Options opts;
            opts.timeoutMs = kControlTimeoutMs;
            const auto r = ProcessRunner::run(m_options.sshProgram, args, opts);
            if (!r.succeeded()) {
                qDebug() << "ssh master for" << m_endpoint.address.toString()
                         << "did not exit cleanly:" << QString::fromLocal8Bit(r.stderrData).trimmed();
            }

            QFile::remove(m_controlPath);
            m_controlPath.clear();
        }

        /**
         * Runs one remote shell command over the master connection.
         * Returns std::nullopt when ssh itself could not run the command.
         */
        std::optional<ProcessRunner::Result> run(const QString& command,
                                                 const ProcessRunner::Options& opts,
                                                 TransportError* errorOut) {
            if (!isOpen()) {
                setTransportError(errorOut, TransportError::Kind::IoFailure,
                                  QStringLiteral("Not connected to %1").arg(m_endpoint.address.toString()));
                return std::nullopt;
            }

            const QStringList args{
                QStringLiteral("-S"), m_controlPath,
                QStringLiteral("-o"), QStringLiteral("BatchMode=yes"),
                QStringLiteral("-p"), QString::number(m_endpoint.port),
                QStringLiteral("-l"), m_endpoint.username,
                m_endpoint.address.toString(),
                command
            };

            auto r = ProcessRunner::run(m_options.sshProgram, args, opts);
            if (!r.started || r.timedOut || r.cancelled || r.crashed) {
                TransportError e = classifySshFailure(r);
                if (e.kind == TransportError::Kind::HandshakeFailed) e.kind = TransportError::Kind::IoFailure;
                storeError(errorOut, e);
                return std::nullopt;
            }

            // 255 is ssh's own failure status; if the master went away the command never ran.
            if (r.exitCode == 255 && !QFileInfo::exists(m_controlPath)) {
                m_open = false;
                setTransportError(errorOut, TransportError::Kind::IoFailure,
                                  QString::fromLocal8Bit(r.stderrData).trimmed());
                return std::nullopt;
            }

            return r;
        }

        [[nodiscard]] const RemoteEndpoint& endpoint() const { return m_endpoint; }

    private:
        OpenSshTransport::Options m_options;
        RemoteEndpoint m_endpoint;
        QString m_controlPath;
        bool m_open = false;
    };

    bool isMissingPath(const QByteArray& stderrData) {
        return stderrData.contains("No such file or directory");
    }

    class SshFileTransferClient final : public FileTransferClient {
    public:
        SshFileTransferClient(const OpenSshTransport::Options& options, const RemoteEndpoint& endpoint)
            : m_channel(options, endpoint) {}

        bool connect(TransportError* errorOut) override { return m_channel.open(errorOut); }
        [[nodiscard]] bool isConnected() const override { return m_channel.isOpen(); }
        void disconnect() override { m_channel.close(); }

        bool changeDirectory(const QString& path, TransportError* errorOut) override {
            const QString target = Utils::resolveRemotePath(m_workingDirectory, path);

            const auto r = m_channel.run(QStringLiteral("test -d %1").arg(Utils::shellQuote(target)), {}, errorOut);
            if (!r) return false;

            if (r->exitCode != 0) {
                setTransportError(errorOut, TransportError::Kind::PathNotFound,
                                  QStringLiteral("No such directory: %1").arg(target));
                return false;
            }

            m_workingDirectory = target;
            return true;
        }

        [[nodiscard]] QString workingDirectory() const override { return m_workingDirectory; }

        std::optional<QList<RemoteEntry>> listDirectory(const QString& path, TransportError* errorOut) override {
            const QString dir = Utils::resolveRemotePath(m_workingDirectory, path);

            // -A drops "." and "..", -p marks directories with a trailing '/'
            const auto r = m_channel.run(QStringLiteral("LC_ALL=C ls -1Ap %1").arg(Utils::shellQuote(dir)), {}, errorOut);
            if (!r) return std::nullopt;

            if (r->exitCode != 0) {
                if (isMissingPath(r->stderrData)) {
                    setTransportError(errorOut, TransportError::Kind::PathNotFound,
                                      QStringLiteral("No such directory: %1").arg(dir));
                } else {
                    setTransportError(errorOut, TransportError::Kind::IoFailure,
                                      QString::fromLocal8Bit(r->stderrData).trimmed());
                }
                return std::nullopt;
            }

            QList<RemoteEntry> entries;
            const QList<QByteArray> lines = r->stdoutData.split('\n');
            for (const QByteArray& raw : lines) {
                QString name = QString::fromUtf8(raw);
                if (name.isEmpty()) continue;

                RemoteEntry entry;
                if (name.endsWith(QLatin1Char('/'))) {
                    entry.isDirectory = true;
                    name.chop(1);
                }
                entry.name = name;
                entry.fullPath = Utils::joinRemotePath(dir, name);
                entries.push_back(entry);
            }

            return entries;
        }

        bool readFile(const QString& path, QIODevice& sink, TransportError* errorOut) override {
            const QString file = Utils::resolveRemotePath(m_workingDirectory, path);

            ProcessRunner::Options opts;
            opts.stdoutSink = &sink;

            const auto r = m_channel.run(QStringLiteral("cat %1").arg(Utils::shellQuote(file)), opts, errorOut);
            if (!r) return false;

            if (!r->error.isEmpty()) {
                setTransportError(errorOut, TransportError::Kind::IoFailure, r->error);
                return false;
            }

            if (r->exitCode != 0) {
                setTransportError(errorOut,
                                  isMissingPath(r->stderrData) ? TransportError::Kind::PathNotFound
                                                               : TransportError::Kind::IoFailure,
                                  QString::fromLocal8Bit(r->stderrData).trimmed());
                return false;
            }

            return true;
        }

        bool writeFile(QIODevice& source, const QString& path, TransportError* errorOut) override {
            const QString file = Utils::resolveRemotePath(m_workingDirectory, path);

            ProcessRunner::Options opts;
            opts.stdinSource = &source;

            const auto r = m_channel.run(QStringLiteral("cat > %1").arg(Utils::shellQuote(file)), opts, errorOut);
            if (!r) return false;

            if (r->exitCode != 0) {
                setTransportError(errorOut,
                                  isMissingPath(r->stderrData) ? TransportError::Kind::PathNotFound
                                                               : TransportError::Kind::IoFailure,
                                  QString::fromLocal8Bit(r->stderrData).trimmed());
                return false;
            }

            return true;
        }

    private:
        SshChannel m_channel;
        QString m_workingDirectory;
    };

    class SshCommandClient final : public CommandClient {
    public:
        SshCommandClient(const OpenSshTransport::Options& options, const RemoteEndpoint& endpoint)
            : m_channel(options, endpoint) {}

        bool connect(TransportError* errorOut) override { return m_channel.open(errorOut); }
        [[nodiscard]] bool isConnected() const override { return m_channel.isOpen(); }
        void disconnect() override { m_channel.close(); }

        std::optional<CommandResult> execute(const QString& command, TransportError* errorOut) override {
            return executeStreaming(command, {}, errorOut);
        }

        std::optional<CommandResult> executeStreaming(const QString& command,
                                                      const LineCallback& onLine,
                                                      TransportError* errorOut) override {
            ProcessRunner::Options opts;
            if (onLine) {
                opts.onLine = [&onLine](QByteArrayView line) {
                    onLine(QString::fromUtf8(line.data(), line.size()));
                };
            }

            const auto r = m_channel.run(command, opts, errorOut);
            if (!r) return std::nullopt;

            CommandResult out;
            out.exitStatus = r->exitCode;
            out.standardOutput = r->stdoutData;
            out.standardError = r->stderrData;
            return out;
        }

    private:
        SshChannel m_channel;
    };
}

OpenSshTransport::OpenSshTransport() : OpenSshTransport(Options{}) {}

OpenSshTransport::OpenSshTransport(Options options) : m_options(std::move(options)) {}

bool OpenSshTransport::probe(const QHostAddress& address, quint16 port, int timeoutMs,
                             const std::atomic<bool>* cancelled) {
    if (cancelled && cancelled->load()) {
        return false;
    }

    QTcpSocket socket;
    socket.connectToHost(address, port);

    // waitForConnected() aborts the attempt on timeout, so it cannot be sliced.
    if (!socket.waitForConnected(timeoutMs)) {
        socket.abort();
        return false;
    }

    socket.disconnectFromHost();
    if (socket.state() != QAbstractSocket::UnconnectedState) {
        socket.waitForDisconnected(1000);
    }
    return true;
}

bool OpenSshTransport::authenticate(const RemoteEndpoint& endpoint, TransportError* errorOut) {
    QStringList args = handshakeArguments(endpoint, m_options.connectTimeoutSeconds);
    args << endpoint.address.toString() << QStringLiteral("exit 0");

    ProcessRunner::Options opts;
    opts.timeoutMs = (m_options.connectTimeoutSeconds + 5) * 1000;

    const auto r = ProcessRunner::run(m_options.sshProgram, args, opts);
    if (r.succeeded()) {
        return true;
    }

    storeError(errorOut, classifySshFailure(r));
    return false;
}

std::unique_ptr<FileTransferClient> OpenSshTransport::createFileTransferClient(const RemoteEndpoint& endpoint) {
    return std::make_unique<SshFileTransferClient>(m_options, endpoint);
}

std::unique_ptr<CommandClient> OpenSshTransport::createCommandClient(const RemoteEndpoint& endpoint) {
    return std::make_unique<SshCommandClient>(m_options, endpoint);
}
