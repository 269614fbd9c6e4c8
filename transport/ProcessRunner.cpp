// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <QDebug>
#include <QElapsedTimer>
#include <QIODevice>
#include <QProcess>
#include <memory>

#include "ProcessRunner.h"

namespace ProcessRunner {
    namespace {
        constexpr int kPollMs = 100;
        constexpr qint64 kStdinChunk = 64 * 1024;

        /**
         * Splits complete lines off the front of buffer and hands them to onLine.
         * Whatever follows the last separator stays in the buffer.
         */
        void consumeLines(QByteArray& buffer, const std::function<void(QByteArrayView)>& onLine, bool flushPartialLine) {
            while (true) {
                qsizetype sep = -1;
                for (qsizetype i = 0; i < buffer.size(); ++i) {
                    if (buffer[i] == '\n' || buffer[i] == '\r') {
                        sep = i;
                        break;
                    }
                }
                if (sep < 0) {
                    break;
                }

                if (sep > 0 && onLine) {
                    onLine(QByteArrayView(buffer.constData(), sep));
                }
                buffer.remove(0, sep + 1);
            }

            if (flushPartialLine && !buffer.isEmpty()) {
                if (onLine) {
                    onLine(QByteArrayView(buffer));
                }
                buffer.clear();
            }
        }
    }

    Result run(const QString& program, const QStringList& arguments, const Options& options) {
        Result result;

        auto proc = std::make_unique<QProcess>();
        proc->start(program, arguments);

        if (!proc->waitForStarted()) {
            result.error = QStringLiteral("Failed to start %1: %2").arg(program, proc->errorString());
            return result;
        }
        result.started = true;

        QByteArray stdoutLines;
        QByteArray stderrLines;

        auto drain = [&](bool flushPartialLine) {
            const QByteArray out = proc->readAllStandardOutput();
            if (!out.isEmpty()) {
                if (options.stdoutSink) {
                    if (options.stdoutSink->write(out) != out.size() && result.error.isEmpty()) {
                        result.error = QStringLiteral("Failed to write output: %1").arg(options.stdoutSink->errorString());
                    }
                } else {
                    result.stdoutData += out;
                    if (options.onLine) {
                        stdoutLines += out;
                    }
                }
            }

            const QByteArray err = proc->readAllStandardError();
            result.stderrData += err;
            if (options.onLine) {
                stderrLines += err;
            }

            if (options.onLine) {
                consumeLines(stdoutLines, options.onLine, flushPartialLine);
                consumeLines(stderrLines, options.onLine, flushPartialLine);
            }
        };

        QElapsedTimer elapsed;
        elapsed.start();

        // Kills the child once it was cancelled or ran out of time
        auto stopRequested = [&]() {
            if (options.cancelled && options.cancelled->load()) {
                result.cancelled = true;
            } else if (options.timeoutMs >= 0 && elapsed.elapsed() >= options.timeoutMs) {
                result.timedOut = true;
                result.error = QStringLiteral("%1 timed out after %2 ms").arg(program).arg(options.timeoutMs);
            } else {
                return false;
            }
            proc->kill();
            proc->waitForFinished();
            return true;
        };

        if (options.stdinSource) {
            bool writing = true;
            while (writing && !options.stdinSource->atEnd()) {
                const QByteArray chunk = options.stdinSource->read(kStdinChunk);
                if (chunk.isEmpty()) {
                    break;
                }
                proc->write(chunk);
                while (proc->bytesToWrite() > 0) {
                    if (stopRequested()) {
                        return result;
                    }
                    if (!proc->waitForBytesWritten(kPollMs) && proc->state() != QProcess::Running) {
                        writing = false;
                        break;
                    }
                    drain(false);
                }
            }
        }
        proc->closeWriteChannel();

        // Loop until finished, draining as we go
        while (!proc->waitForFinished(kPollMs)) {
            if (proc->state() == QProcess::NotRunning) {
                break;
            }

            drain(false);

            if (stopRequested()) {
                return result;
            }
        }

        // Drain any remaining stdout/stderr after exit
        drain(true);

        result.crashed = proc->exitStatus() == QProcess::CrashExit;
        result.exitCode = proc->exitCode();
        if (result.crashed && result.error.isEmpty()) {
            result.error = QStringLiteral("%1 crashed").arg(program);
        }

        return result;
    }
}
