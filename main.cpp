// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QSettings>
#include <QTextStream>
#include <KAboutData>
#include <memory>

#include "AddressSpace.h"
#include "ConnectionLimiter.h"
#include "DeviceClassifier.h"
#include "DeviceCommands.h"
#include "DriveExporter.h"
#include "ProbeScheduler.h"
#include "SessionManager.h"
#include "Settings.h"
#include "StorageReconstructor.h"
#include "Version.h"
#include "transport/OpenSshTransport.h"

namespace {
    constexpr int kExitSuccess = 0;
    constexpr int kExitUsage = 1;
    constexpr int kExitFailure = 2;

    QTextStream& out() {
        static QTextStream stream(stdout);
        return stream;
    }

    int usage(const QCommandLineParser& parser, const QString& message) {
        qCritical().noquote() << message;
        qCritical().noquote() << parser.helpText();
        return kExitUsage;
    }

    DeviceClassifier::Options classifierOptions(const Settings::Config& config) {
        DeviceClassifier::Options options;
        options.port = config.sshPort;
        options.timeoutMs = config.probeTimeoutMs;
        options.keyFile = config.keyFile;
        options.deviceUser = config.deviceUser;
        options.adminUser = config.adminUser;
        return options;
    }

    /**
     * Everything one command needs to talk to one device.
     */
    struct Context {
        Settings::Config config;
        std::unique_ptr<OpenSshTransport> transport;
        std::unique_ptr<ConnectionLimiter> limiter;

        explicit Context(Settings::Config c)
            : config(std::move(c))
            , transport(std::make_unique<OpenSshTransport>(
                  OpenSshTransport::Options{config.sshProgram, config.sshConnectTimeoutSeconds}))
            , limiter(std::make_unique<ConnectionLimiter>(config.maxConcurrentConnections)) {}

        std::unique_ptr<SessionManager> openSession(const QString& addressText, QString* errorOut) {
            const QHostAddress address(addressText);
            if (address.isNull()) {
                if (errorOut) *errorOut = QStringLiteral("Not an IP address: %1").arg(addressText);
                return nullptr;
            }

            DeviceClassifier classifier(*transport, *limiter, classifierOptions(config));
            auto device = classifier.classify(address);
            if (!device) {
                if (errorOut) *errorOut = QStringLiteral("No device found at %1").arg(addressText);
                return nullptr;
            }

            qInfo().noquote() << "Found" << Device::variantName(device->variant()) << "at" << device->toString();

            SessionManager::Options options;
            options.username = config.deviceUser;
            options.keyFile = config.keyFile;
            if (auto profile = device->profile()) {
                options.workingDirectory = profile->workingDirectory;
            }
            return std::make_unique<SessionManager>(*device, *transport, *limiter, options);
        }
    };

    int runDiscover(Context& ctx) {
        AddressSpace::Limits limits;
        limits.maxAddressesPerInterface = ctx.config.maxAddressesPerInterface;
        limits.tetheringAddress = QHostAddress(ctx.config.tetheringAddress);

        const QList<QHostAddress> candidates = AddressSpace::localCandidates(limits);

        DeviceClassifier classifier(*ctx.transport, *ctx.limiter, classifierOptions(ctx.config));
        ProbeScheduler scheduler(classifier, ProbeScheduler::Options{ctx.config.discoveryWaitMs});

        auto stream = scheduler.start(candidates);
        int found = 0;
        while (auto device = stream->next()) {
            out() << device->toString() << '\t' << Device::variantName(device->variant()) << Qt::endl;
            ++found;
        }

        qInfo() << "Discovery finished," << found << "device(s) found";
        return kExitSuccess;
    }

    int runDrives(Context& ctx, const QString& address) {
        QString error;
        auto session = ctx.openSession(address, &error);
        if (!session) {
            qCritical().noquote() << error;
            return kExitFailure;
        }

        StorageReconstructor reconstructor(*session);
        DriveSequence drives = reconstructor.listDrives();

        TransportError err;
        while (auto drive = drives.next(&err)) {
            out() << drive->toString() << '\t' << drive->segments.size() << " segment(s)" << Qt::endl;
        }

        if (err.isError()) {
            qCritical().noquote() << "Listing drives failed:" << err.message;
            return kExitFailure;
        }
        return kExitSuccess;
    }

    int runExport(Context& ctx, const QCommandLineParser& parser, const QStringList& args) {
        if (args.size() != 4) {
            return usage(parser, QStringLiteral("export needs <address> <drive> <directory>"));
        }

        const QString cameraText = parser.value(QStringLiteral("camera"));
        Camera camera = Camera::Front;
        if (cameraText == QLatin1String("d")) camera = Camera::Driver;
        else if (cameraText == QLatin1String("e")) camera = Camera::Wide;
        else if (cameraText != QLatin1String("f")) {
            return usage(parser, QStringLiteral("--camera must be one of f, d, e"));
        }

        QString error;
        auto session = ctx.openSession(args[1], &error);
        if (!session) {
            qCritical().noquote() << error;
            return kExitFailure;
        }

        StorageReconstructor reconstructor(*session);
        DriveSequence drives = reconstructor.listDrives();

        TransportError err;
        std::optional<Drive> wanted;
        while (auto drive = drives.next(&err)) {
            if (drive->toString() == args[2]) {
                wanted = std::move(drive);
                break;
            }
        }

        if (err.isError()) {
            qCritical().noquote() << "Listing drives failed:" << err.message;
            return kExitFailure;
        }
        if (!wanted) {
            qCritical().noquote() << "No drive" << args[2] << "on" << session->device().toString();
            return kExitFailure;
        }

        DriveExporter exporter(*session);
        DriveExporter::Options options;
        options.combineSegments = parser.isSet(QStringLiteral("combine"));

        const qsizetype total = wanted->segments.size();
        qsizetype done = 0;
        const ExportResult result = exporter.exportDrive(*wanted, camera, args[3], options, [&](int index) {
            ++done;
            qInfo().noquote() << QStringLiteral("[%1/%2] segment %3").arg(done).arg(total).arg(index);
        });

        for (const QString& file : result.files) {
            out() << file << Qt::endl;
        }
        for (const QString& failure : result.failures) {
            qWarning().noquote() << failure;
        }

        return result.success ? kExitSuccess : kExitFailure;
    }

    int runExec(Context& ctx, const QString& address, const QString& command) {
        QString error;
        auto session = ctx.openSession(address, &error);
        if (!session) {
            qCritical().noquote() << error;
            return kExitFailure;
        }

        TransportError err;
        auto result = session->executeStreaming(command, [](const QString& line) {
            out() << line << Qt::endl;
        }, &err);

        if (!result) {
            qCritical().noquote() << "Command failed:" << err.message;
            return kExitFailure;
        }
        return result->exitStatus == 0 ? kExitSuccess : kExitFailure;
    }

    int runSimple(Context& ctx, const QString& address, bool (DeviceCommands::*operation)(TransportError*)) {
        QString error;
        auto session = ctx.openSession(address, &error);
        if (!session) {
            qCritical().noquote() << error;
            return kExitFailure;
        }

        DeviceCommands commands(*session);
        TransportError err;
        if (!(commands.*operation)(&err)) {
            if (err.isError()) qCritical().noquote() << err.message;
            return kExitFailure;
        }
        return kExitSuccess;
    }

    int reportFork(const ForkResult& result) {
        if (!result.success) {
            qCritical().noquote() << "Install failed:" << result.message;
            return kExitFailure;
        }
        out() << result.message << Qt::endl;
        return kExitSuccess;
    }

    void printProgress(const InstallProgress& p) {
        qInfo().noquote() << QStringLiteral("%1: %2%").arg(p.label).arg(p.percent);
    }
}

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationDomain(QStringLiteral("reikooters.net"));

    KAboutData aboutData(
        QStringLiteral("pilotdeck"),
        QStringLiteral("Pilotdeck"),
        QString::fromUtf8(Version::VERSION),
        QStringLiteral("Finds comma devices on the local network and manages their drives and software."),
        KAboutLicense::GPL_V3,
        QStringLiteral("(c) 2026 Reikooters <https://github.com/Reikooters>")
    );

    aboutData.addAuthor(QStringLiteral("Reikooters"), QStringLiteral("Developer"), QStringLiteral("https://github.com/Reikooters"));

    KAboutData::setApplicationData(aboutData);

    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);

    parser.addPositionalArgument(QStringLiteral("command"),
        QStringLiteral("discover | drives | export | exec | reboot | shutdown | flash-panda | install-fork | reinstall"));
    parser.addPositionalArgument(QStringLiteral("arguments"), QStringLiteral("Command arguments"), QStringLiteral("[arguments...]"));

    parser.addOption({QStringLiteral("config"), QStringLiteral("Settings file to use."), QStringLiteral("file")});
    parser.addOption({QStringLiteral("port"), QStringLiteral("SSH port on the device."), QStringLiteral("port")});
    parser.addOption({QStringLiteral("key"), QStringLiteral("Private key file."), QStringLiteral("file")});
    parser.addOption({QStringLiteral("camera"), QStringLiteral("Camera to export: f, d or e."), QStringLiteral("camera"),
                      QStringLiteral("f")});
    parser.addOption({QStringLiteral("combine"), QStringLiteral("Export one combined file instead of one per segment.")});

    parser.process(app);
    aboutData.processCommandLine(&parser);

    Settings::Config config;
    if (parser.isSet(QStringLiteral("config"))) {
        QSettings settings(parser.value(QStringLiteral("config")), QSettings::IniFormat);
        config = Settings::load(settings);
    } else {
        config = Settings::load();
    }

    if (parser.isSet(QStringLiteral("port"))) {
        bool ok = false;
        const uint port = parser.value(QStringLiteral("port")).toUInt(&ok);
        if (!ok || port == 0 || port > 65535) {
            return usage(parser, QStringLiteral("Invalid --port"));
        }
        config.sshPort = static_cast<quint16>(port);
    }
    if (parser.isSet(QStringLiteral("key"))) {
        config.keyFile = parser.value(QStringLiteral("key"));
    }

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        return usage(parser, QStringLiteral("No command given"));
    }

    qDebug().noquote() << "pilotdeck" << QString::fromUtf8(Version::VERSION);

    Context ctx(config);
    const QString& command = args[0];

    if (command == QLatin1String("discover")) {
        return runDiscover(ctx);
    }
    if (command == QLatin1String("export")) {
        return runExport(ctx, parser, args);
    }

    // Everything below works on one device
    if (args.size() < 2) {
        return usage(parser, QStringLiteral("%1 needs a device address").arg(command));
    }
    const QString& address = args[1];

    if (command == QLatin1String("drives")) {
        return runDrives(ctx, address);
    }
    if (command == QLatin1String("exec")) {
        if (args.size() < 3) return usage(parser, QStringLiteral("exec needs a command"));
        return runExec(ctx, address, args.mid(2).join(QLatin1Char(' ')));
    }
    if (command == QLatin1String("reboot")) {
        return runSimple(ctx, address, &DeviceCommands::reboot);
    }
    if (command == QLatin1String("shutdown")) {
        return runSimple(ctx, address, &DeviceCommands::shutdown);
    }
    if (command == QLatin1String("flash-panda")) {
        return runSimple(ctx, address, &DeviceCommands::flashPanda);
    }
    if (command == QLatin1String("install-fork") || command == QLatin1String("reinstall")) {
        const bool reinstall = command == QLatin1String("reinstall");
        if (!reinstall && args.size() != 4) {
            return usage(parser, QStringLiteral("install-fork needs <address> <user> <branch>"));
        }

        QString error;
        auto session = ctx.openSession(address, &error);
        if (!session) {
            qCritical().noquote() << error;
            return kExitFailure;
        }

        DeviceCommands commands(*session);
        return reportFork(reinstall ? commands.reinstallFork(printProgress)
                                    : commands.installFork(args[2], args[3], printProgress));
    }

    return usage(parser, QStringLiteral("Unknown command: %1").arg(command));
}
