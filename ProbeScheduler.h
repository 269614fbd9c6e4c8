// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef PILOTDECK_PROBESCHEDULER_H
#define PILOTDECK_PROBESCHEDULER_H

#include <QHostAddress>
#include <QList>
#include <atomic>
#include <functional>
#include <memory>
#include <optional>

#include "Device.h"

class DeviceClassifier;
class QThreadPool;

/**
 * Devices found by one discovery run, handed out in completion order.
 *
 * next() waits for the next probe to finish, at most waitTimeoutMs per call; the
 * deadline restarts whenever any probe completes. When a wait times out the stream
 * ends, whatever was already returned stays valid, and probes still running are
 * cancelled and their results dropped. A finished stream stays finished.
 */
class DiscoveryStream {
public:
    ~DiscoveryStream();

    DiscoveryStream(const DiscoveryStream&) = delete;
    DiscoveryStream& operator=(const DiscoveryStream&) = delete;

    /**
     * Blocks until the next device is found.
     *
     * @return The device, or std::nullopt once every probe has been collected or a wait timed out.
     */
    std::optional<Device> next();

    // Drains the stream.
    QList<Device> collect();

    [[nodiscard]] bool finished() const { return m_finished; }
    [[nodiscard]] bool timedOut() const { return m_timedOut; }

    // Probes submitted and not yet collected by next().
    [[nodiscard]] int outstanding() const;

    /**
     * Ends the stream now and asks running probes to stop at their next network step.
     */
    void cancel();

private:
    friend class ProbeScheduler;

    struct State;

    DiscoveryStream(std::shared_ptr<State> state, std::unique_ptr<QThreadPool> pool, int waitTimeoutMs);

    void finish();

    std::shared_ptr<State> m_state;
    std::unique_ptr<QThreadPool> m_pool;
    int m_waitTimeoutMs = 0;
    bool m_finished = false;
    bool m_timedOut = false;
};

/**
 * Runs one probe per candidate address, all at once.
 */
class ProbeScheduler {
public:
    using ProbeFunction = std::function<std::optional<Device>(const QHostAddress& address,
                                                              const std::atomic<bool>* cancelled)>;

    struct Options {
        int waitTimeoutMs = 10000;
    };

    ProbeScheduler(ProbeFunction probe, Options options);

    // Probes with classifier.classify(); the classifier must outlive every stream started here.
    ProbeScheduler(const DeviceClassifier& classifier, Options options);

    /**
     * Submits a probe for every distinct candidate and returns the stream of results.
     */
    [[nodiscard]] std::unique_ptr<DiscoveryStream> start(const QList<QHostAddress>& candidates) const;

private:
    ProbeFunction m_probe;
    Options m_options;
};

#endif //PILOTDECK_PROBESCHEDULER_H
