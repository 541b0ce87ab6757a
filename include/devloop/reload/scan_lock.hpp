#pragma once

/// @file scan_lock.hpp
/// @brief Lock shared by the dev-mode scan and the continuous test scan

#include <atomic>
#include <mutex>

namespace devloop_reload {

/// Reentrant lock that keeps the dev-mode scan and the test scan from
/// compiling at the same time. Always taken after a coordinator's own scan
/// lock, never before it. Satisfies Lockable.
class ScanningLock {
public:
    ScanningLock() = default;

    ScanningLock(const ScanningLock&) = delete;
    ScanningLock& operator=(const ScanningLock&) = delete;

    void lock() {
        m_mutex.lock();
        m_depth.fetch_add(1);
    }

    bool try_lock() {
        if (!m_mutex.try_lock()) {
            return false;
        }
        m_depth.fetch_add(1);
        return true;
    }

    void unlock() {
        m_depth.fetch_sub(1);
        m_mutex.unlock();
    }

    /// Nonzero while some thread holds the lock
    [[nodiscard]] int hold_count() const { return m_depth.load(); }

private:
    std::recursive_mutex m_mutex;
    std::atomic<int> m_depth{0};
};

} // namespace devloop_reload
