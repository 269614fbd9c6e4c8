// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "DeviceCommands.h"

#include <QDebug>
#include <QRegularExpression>
#include <QStringList>

#include "SessionManager.h"
#include "Utils.h"

DeviceCommands::DeviceCommands(SessionManager& session)
    : m_session(session) {}

std::optional<DeviceProfile> DeviceCommands::requireProfile(TransportError* errorOut) const {
    auto profile = m_session.device().profile();
    if (!profile) {
        setTransportError(errorOut, TransportError::Kind::HandshakeFailed,
                          QStringLiteral("%1 is not a recognized device").arg(m_session.device().toString()));
    }
    return profile;
}

bool DeviceCommands::runProfileCommand(QString DeviceProfile::* command, TransportError* errorOut) {
    const auto profile = requireProfile(errorOut);
    if (!profile) return false;

    auto result = m_session.execute((*profile).*command, errorOut);
    if (!result) return false;

    if (result->exitStatus != 0) {
        qWarning().noquote() << (*profile).*command << "exited with status" << result->exitStatus
                             << QString::fromUtf8(result->standardError).trimmed();
    }
    return result->exitStatus == 0;
}

bool DeviceCommands::reboot(TransportError* errorOut) {
    return runProfileCommand(&DeviceProfile::rebootCommand, errorOut);
}

bool DeviceCommands::shutdown(TransportError* errorOut) {
    return runProfileCommand(&DeviceProfile::shutdownCommand, errorOut);
}

bool DeviceCommands::flashPanda(TransportError* errorOut) {
    return runProfileCommand(&DeviceProfile::flashPandaCommand, errorOut);
}

bool DeviceCommands::installEmu(TransportError* errorOut) {
    return runProfileCommand(&DeviceProfile::installEmuCommand, errorOut);
}

QString DeviceCommands::installForkCommand(const QString& username, const QString& branch) {
    const QString url = QStringLiteral("https://github.com/%1/openpilot.git").arg(username);
    return QStringLiteral("cd /data && rm -rf openpilot ; git clone -b %1 --depth 1 --single-branch --progress "
                          "--recurse-submodules --shallow-submodules %2 openpilot")
        .arg(Utils::shellQuote(branch), Utils::shellQuote(url));
}

std::optional<InstallProgress> DeviceCommands::parseProgress(const QString& line, int previousPercent) {
    static const QRegularExpression re(QStringLiteral("\\d+(?=%)"));

    const QRegularExpressionMatch m = re.match(line);
    if (!m.hasMatch()) return std::nullopt;

    bool ok = false;
    const int percent = m.captured(0).toInt(&ok);
    if (!ok || percent == previousPercent) return std::nullopt;

    // "Receiving objects:  45% (450/1000)" -> "Receiving objects"
    QString label = line.left(m.capturedStart(0)).trimmed();
    if (label.endsWith(QLatin1Char(':'))) label.chop(1);

    return InstallProgress{percent, label.trimmed()};
}

std::optional<std::pair<QString, QString>> DeviceCommands::parseOrigin(const QString& output) {
    const QStringList lines = output.split(QLatin1Char('\n'), Qt::SkipEmptyParts);
    if (lines.size() < 2) return std::nullopt;

    // https://github.com/<user>/openpilot.git or git@github.com:<user>/openpilot.git
    static const QRegularExpression re(QStringLiteral("github\\.com[/:]([^/]+)/"));
    const QRegularExpressionMatch m = re.match(lines[0].trimmed());
    if (!m.hasMatch()) return std::nullopt;

    const QString branch = lines[1].trimmed();
    if (branch.isEmpty()) return std::nullopt;

    return std::make_pair(m.captured(1), branch);
}

ForkResult DeviceCommands::installFork(const QString& username, const QString& branch, const ProgressCallback& progress) {
    TransportError err;
    const auto profile = requireProfile(&err);
    if (!profile) return ForkResult{false, err.message};

    qInfo().noquote() << "Installing fork" << username << "/" << branch << "on" << m_session.device().toString();

    int previousPercent = 0;
    QString lastLine;

    auto onLine = [&](const QString& line) {
        if (line.trimmed().isEmpty()) return;
        lastLine = line;

        if (!progress) return;
        if (auto p = parseProgress(line, previousPercent)) {
            previousPercent = p->percent;
            progress(*p);
        }
    };

    auto result = m_session.executeStreaming(installForkCommand(username, branch), onLine, &err);
    if (!result) return ForkResult{false, err.message};

    const QString output = QString::fromUtf8(result->standardOutput).trimmed();
    const bool success = result->exitStatus == 0;

    if (success) {
        // The connection usually drops while the device goes down
        TransportError rebootErr;
        auto reboot = m_session.execute(profile->rebootCommand, &rebootErr);
        if (!reboot) {
            qDebug().noquote() << "Reboot after install:" << rebootErr.message;
        }
    }

    return ForkResult{success, output.isEmpty() ? lastLine : output};
}

ForkResult DeviceCommands::reinstallFork(const ProgressCallback& progress) {
    TransportError err;
    const auto profile = requireProfile(&err);
    if (!profile) return ForkResult{false, err.message};

    const QString command = QStringLiteral("cd %1 && git remote get-url origin && git rev-parse --abbrev-ref HEAD")
                                .arg(Utils::shellQuote(profile->workingDirectory));

    auto result = m_session.execute(command, &err);
    if (!result) return ForkResult{false, err.message};

    const QString output = QString::fromUtf8(result->standardOutput);
    if (result->exitStatus != 0) {
        const QString message = output.trimmed().isEmpty()
            ? QString::fromUtf8(result->standardError).trimmed()
            : output.trimmed();
        return ForkResult{false, message};
    }

    const auto origin = parseOrigin(output);
    if (!origin) {
        return ForkResult{false, QStringLiteral("Unrecognized origin: %1").arg(output.trimmed())};
    }

    return installFork(origin->first, origin->second, progress);
}
