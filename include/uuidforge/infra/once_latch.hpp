/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file once_latch.hpp
 * @brief Initialize-once primitive that only memoizes success.
 *
 * @details
 * Guards the lazily-seeded generator state (clock sequence, hardware address).
 * A failed initializer is not cached, and `done()` reports completion without
 * running anything.
 */

#pragma once

#include <atomic>
#include <mutex>

namespace uuidforge::infra {

/**
 * @class OnceLatch
 * @brief Runs an initializer until it completes successfully, then never again.
 *
 * @details
 * **Concurrency Model:**
 * - The first caller runs the initializer while holding the latch mutex.
 * - Concurrent callers block on the mutex and observe the finished state.
 * - If the initializer throws, the latch stays open and the exception
 *   propagates; the next caller runs the initializer again.
 */
class OnceLatch {
  public:
    OnceLatch() = default;

    OnceLatch(const OnceLatch&) = delete;
    OnceLatch& operator=(const OnceLatch&) = delete;

    /**
     * @brief Invokes `init` unless a previous invocation already succeeded.
     *
     * @param init A callable with signature `void()`. It may throw.
     */
    template <typename Init> void call(Init&& init)
    {
        if (done_.load(std::memory_order_acquire)) {
            return;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (done_.load(std::memory_order_relaxed)) {
            return;
        }

        init();
        done_.store(true, std::memory_order_release);
    }

    /// @brief Reports whether an initializer has completed successfully.
    bool done() const
    {
        return done_.load(std::memory_order_acquire);
    }

  private:
    std::mutex mutex_;
    std::atomic<bool> done_{false};
};

} // namespace uuidforge::infra
