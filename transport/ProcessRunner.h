// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef PILOTDECK_TRANSPORT_PROCESSRUNNER_H
#define PILOTDECK_TRANSPORT_PROCESSRUNNER_H

#include <QByteArray>
#include <QByteArrayView>
#include <QString>
#include <QStringList>
#include <atomic>
#include <functional>

class QIODevice;

namespace ProcessRunner {
    struct Options {
        // Kill the process after this many milliseconds; -1 waits forever.
        int timeoutMs = -1;

        // Checked between polls; the process is killed once it reads true.
        const std::atomic<bool>* cancelled = nullptr;

        // Receives every complete stdout/stderr line while the process runs.
        // Lines are split on '\n' and '\r' (git reports progress with carriage returns).
        std::function<void(QByteArrayView line)> onLine;

        // When set, stdout is streamed here instead of being buffered in the result.
        QIODevice* stdoutSink = nullptr;

        // When set, its whole content is written to the process' stdin, which is then closed.
        QIODevice* stdinSource = nullptr;
    };

    struct Result {
        bool started = false;
        bool timedOut = false;
        bool cancelled = false;
        bool crashed = false;
        int exitCode = -1;
        QByteArray stdoutData;
        QByteArray stderrData;
        QString error; // empty unless the process could not be run to completion

        [[nodiscard]] bool succeeded() const {
            return started && !timedOut && !cancelled && !crashed && exitCode == 0;
        }
    };

    /**
     * Runs a program to completion on the calling thread.
     *
     * Output is drained continuously so a chatty child can never block on a full pipe.
     * Safe to call from worker threads without an event loop.
     *
     * @param program Executable name or path.
     * @param arguments Arguments passed verbatim (no shell involved).
     * @param options Timeout, cancellation and streaming hooks.
     */
    Result run(const QString& program, const QStringList& arguments, const Options& options = {});
}

#endif //PILOTDECK_TRANSPORT_PROCESSRUNNER_H
