// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "ConnectionLimiter.h"

#include <algorithm>

ConnectionLimiter::ConnectionLimiter(int capacity)
    : m_capacity(std::max(1, capacity))
    , m_semaphore(std::max(1, capacity)) {}

ConnectionLimiter::Slot& ConnectionLimiter::Slot::operator=(Slot&& other) noexcept {
    if (this != &other) {
        release();
        m_limiter = other.m_limiter;
        other.m_limiter = nullptr;
    }
    return *this;
}

void ConnectionLimiter::Slot::release() {
    if (m_limiter) {
        m_limiter->releaseOne();
        m_limiter = nullptr;
    }
}

ConnectionLimiter::Slot ConnectionLimiter::acquire() {
    m_semaphore.acquire();

    const int now = m_inUse.fetchAndAddOrdered(1) + 1;
    int peak = m_peakInUse.loadAcquire();
    while (now > peak && !m_peakInUse.testAndSetOrdered(peak, now)) {
        peak = m_peakInUse.loadAcquire();
    }

    return Slot(this);
}

int ConnectionLimiter::peakInUse() const {
    return m_peakInUse.loadAcquire();
}

void ConnectionLimiter::releaseOne() {
    m_inUse.fetchAndAddOrdered(-1);
    m_semaphore.release();
}
