// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef PILOTDECK_CONNECTIONLIMITER_H
#define PILOTDECK_CONNECTIONLIMITER_H

#include <QAtomicInt>
#include <QSemaphore>

/**
 * Process-wide cap on simultaneous connection handshakes.
 *
 * The remote transport fails outright when more than a handful of handshakes are in
 * flight, so every session and every transient export connection acquires a Slot
 * before connecting and drops it once the handshake is done. One instance is created
 * by the application and shared by reference; tests create their own, usually with a
 * capacity of 1.
 */
class ConnectionLimiter {
public:
    static constexpr int kDefaultCapacity = 10;

    explicit ConnectionLimiter(int capacity = kDefaultCapacity);

    ConnectionLimiter(const ConnectionLimiter&) = delete;
    ConnectionLimiter& operator=(const ConnectionLimiter&) = delete;

    /**
     * Holds one unit of the limiter; released on destruction or release().
     */
    class Slot {
    public:
        Slot() = default;
        ~Slot() { release(); }

        Slot(Slot&& other) noexcept : m_limiter(other.m_limiter) { other.m_limiter = nullptr; }
        Slot& operator=(Slot&& other) noexcept;

        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;

        void release();
        [[nodiscard]] bool isHeld() const { return m_limiter != nullptr; }

    private:
        friend class ConnectionLimiter;
        explicit Slot(ConnectionLimiter* limiter) : m_limiter(limiter) {}

        ConnectionLimiter* m_limiter = nullptr;
    };

    /**
     * Blocks until a slot is free.
     */
    [[nodiscard]] Slot acquire();

    [[nodiscard]] int capacity() const { return m_capacity; }
    [[nodiscard]] int available() const { return m_semaphore.available(); }

    // Highest number of slots that were held at the same time.
    [[nodiscard]] int peakInUse() const;

private:
    void releaseOne();

    const int m_capacity;
    QSemaphore m_semaphore;
    QAtomicInt m_inUse{0};
    QAtomicInt m_peakInUse{0};
};

#endif //PILOTDECK_CONNECTIONLIMITER_H
