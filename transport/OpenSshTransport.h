// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef PILOTDECK_TRANSPORT_OPENSSHTRANSPORT_H
#define PILOTDECK_TRANSPORT_OPENSSHTRANSPORT_H

#include <QString>

#include "RemoteTransport.h"

/**
 * RemoteTransport backed by the OpenSSH client.
 *
 * Every FileTransferClient and CommandClient owns one OpenSSH control master
 * ("ssh -M -S <socket> -f -N"). The handshake is complete when the backgrounding
 * ssh process exits; all later operations are multiplexed over the master socket,
 * so each one costs a local process spawn but no new handshake.
 *
 * Host keys are not verified: the devices regenerate them on every reinstall.
 */
class OpenSshTransport final : public RemoteTransport {
public:
    struct Options {
        QString sshProgram = QStringLiteral("ssh");
        int connectTimeoutSeconds = 10;
    };

    OpenSshTransport();
    explicit OpenSshTransport(Options options);

    bool probe(const QHostAddress& address, quint16 port, int timeoutMs,
               const std::atomic<bool>* cancelled = nullptr) override;

    bool authenticate(const RemoteEndpoint& endpoint, TransportError* errorOut = nullptr) override;

    std::unique_ptr<FileTransferClient> createFileTransferClient(const RemoteEndpoint& endpoint) override;
    std::unique_ptr<CommandClient> createCommandClient(const RemoteEndpoint& endpoint) override;

private:
    Options m_options;
};

#endif //PILOTDECK_TRANSPORT_OPENSSHTRANSPORT_H
