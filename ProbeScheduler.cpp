// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "ProbeScheduler.h"

#include <QDeadlineTimer>
#include <QDebug>
#include <QMutex>
#include <QMutexLocker>
#include <QQueue>
#include <QSet>
#include <QThreadPool>
#include <QWaitCondition>
#include <algorithm>

#include "DeviceClassifier.h"

static constexpr uint kProbeThreadStackSize = 512 * 1024;

struct DiscoveryStream::State {
    QMutex mutex;
    QWaitCondition completedCondition;

    // One entry per finished probe, std::nullopt when nothing was found
    QQueue<std::optional<Device>> completed;

    // Probes not yet collected by next()
    int uncollected = 0;

    std::atomic<bool> cancelled{false};
};

DiscoveryStream::DiscoveryStream(std::shared_ptr<State> state, std::unique_ptr<QThreadPool> pool, int waitTimeoutMs)
    : m_state(std::move(state)), m_pool(std::move(pool)), m_waitTimeoutMs(waitTimeoutMs) {}

DiscoveryStream::~DiscoveryStream() {
    cancel();

    // Cancelled probes bail out at their next network step; don't leave threads behind.
    if (m_pool) {
        m_pool->waitForDone();
    }
}

std::optional<Device> DiscoveryStream::next() {
    if (m_finished) {
        return std::nullopt;
    }

    QMutexLocker lock(&m_state->mutex);

    while (true) {
        if (!m_state->completed.isEmpty()) {
            std::optional<Device> result = m_state->completed.dequeue();
            --m_state->uncollected;
            if (result) {
                return result;
            }
            // A probe completed without a device: the next wait gets a fresh deadline.
            continue;
        }

        if (m_state->uncollected <= 0) {
            lock.unlock();
            finish();
            return std::nullopt;
        }

        QDeadlineTimer deadline(m_waitTimeoutMs);
        while (m_state->completed.isEmpty()) {
            if (!m_state->completedCondition.wait(&m_state->mutex, deadline) && m_state->completed.isEmpty()) {
                qInfo() << "Timed out waiting for" << m_state->uncollected << "probe(s)";
                m_timedOut = true;
                lock.unlock();
                finish();
                return std::nullopt;
            }
        }
    }
}

QList<Device> DiscoveryStream::collect() {
    QList<Device> out;
    while (auto device = next()) {
        out.push_back(*device);
    }
    return out;
}

int DiscoveryStream::outstanding() const {
    QMutexLocker lock(&m_state->mutex);
    return m_state->uncollected;
}

void DiscoveryStream::cancel() {
    finish();
}

void DiscoveryStream::finish() {
    m_finished = true;
    m_state->cancelled.store(true);
}

ProbeScheduler::ProbeScheduler(ProbeFunction probe, Options options)
    : m_probe(std::move(probe)), m_options(options) {}

ProbeScheduler::ProbeScheduler(const DeviceClassifier& classifier, Options options)
    : ProbeScheduler(
        [&classifier](const QHostAddress& address, const std::atomic<bool>* cancelled) {
            return classifier.classify(address, cancelled);
        },
        options) {}

std::unique_ptr<DiscoveryStream> ProbeScheduler::start(const QList<QHostAddress>& candidates) const {
    qInfo() << "Scanning network for devices.";

    QList<QHostAddress> unique;
    QSet<QHostAddress> seen;
    for (const QHostAddress& address : candidates) {
        if (seen.contains(address)) continue;
        seen.insert(address);
        unique.push_back(address);
    }

    auto state = std::make_shared<DiscoveryStream::State>();
    state->uncollected = static_cast<int>(unique.size());

    // Every probe runs at once. Logins inside the probe wait on the connection limiter.
    auto pool = std::make_unique<QThreadPool>();
    pool->setMaxThreadCount(std::max<int>(1, static_cast<int>(unique.size())));
    pool->setStackSize(kProbeThreadStackSize);

    for (const QHostAddress& address : unique) {
        pool->start([state, probe = m_probe, address]() {
            std::optional<Device> result;
            if (!state->cancelled.load()) {
                result = probe(address, &state->cancelled);
            }

            if (state->cancelled.load()) {
                result.reset();
            }

            QMutexLocker lock(&state->mutex);
            state->completed.enqueue(result);
            state->completedCondition.wakeAll();
        });
    }

    qInfo() << "Submitted" << unique.size() << "probe(s)";

    return std::unique_ptr<DiscoveryStream>(new DiscoveryStream(std::move(state), std::move(pool), m_options.waitTimeoutMs));
}
