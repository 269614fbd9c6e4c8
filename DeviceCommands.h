// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef PILOTDECK_DEVICECOMMANDS_H
#define PILOTDECK_DEVICECOMMANDS_H

#include <QString>
#include <functional>
#include <optional>
#include <utility>

#include "Device.h"
#include "transport/RemoteTransport.h"

class SessionManager;

struct ForkResult {
    bool success = false;
    QString message;
};

struct InstallProgress {
    int percent = 0;
    QString label; // e.g. "Receiving objects"
};

/**
 * Maintenance commands run on a device through its session.
 */
class DeviceCommands {
public:
    using ProgressCallback = std::function<void(const InstallProgress&)>;

    explicit DeviceCommands(SessionManager& session);

    // Each returns true when the remote command exited with status 0.
    bool reboot(TransportError* errorOut = nullptr);
    bool shutdown(TransportError* errorOut = nullptr);
    bool flashPanda(TransportError* errorOut = nullptr);
    bool installEmu(TransportError* errorOut = nullptr);

    /**
     * Replaces the device's openpilot checkout with a shallow clone of
     * https://github.com/<username>/openpilot.git at branch, then reboots the device.
     *
     * @param progress Receives clone progress whenever the percentage changes.
     */
    ForkResult installFork(const QString& username, const QString& branch, const ProgressCallback& progress = {});

    /**
     * Reinstalls whatever fork and branch the device currently runs.
     */
    ForkResult reinstallFork(const ProgressCallback& progress = {});

    [[nodiscard]] static QString installForkCommand(const QString& username, const QString& branch);

    /**
     * Extracts "NN%" progress from one line of git output.
     *
     * @param previousPercent Last percentage reported; an unchanged value yields std::nullopt.
     */
    [[nodiscard]] static std::optional<InstallProgress> parseProgress(const QString& line, int previousPercent);

    /**
     * Extracts (username, branch) from the output of
     * "git remote get-url origin && git rev-parse --abbrev-ref HEAD".
     */
    [[nodiscard]] static std::optional<std::pair<QString, QString>> parseOrigin(const QString& output);

private:
    std::optional<DeviceProfile> requireProfile(TransportError* errorOut) const;
    bool runProfileCommand(QString DeviceProfile::* command, TransportError* errorOut);

    SessionManager& m_session;
};

#endif //PILOTDECK_DEVICECOMMANDS_H
