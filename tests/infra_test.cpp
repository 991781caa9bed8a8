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
 * @file infra_test.cpp
 * @brief Unit tests for shared infrastructure primitives (Logger, OnceLatch, String).
 */

#include "framework.hpp"
#include "uuidforge/infra/logger.hpp"
#include "uuidforge/infra/once_latch.hpp"
#include "uuidforge/infra/string.hpp"

#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using uuidforge::infra::Logger;
using uuidforge::infra::LogLevel;
using uuidforge::infra::OnceLatch;
using uuidforge::infra::String;

/**
 * @brief Messages below the threshold are filtered out.
 */
void test_logger_threshold()
{
    LogLevel saved = Logger::level();

    Logger::set_level(LogLevel::WARN);
    ASSERT_TRUE(Logger::level() == LogLevel::WARN);
    ASSERT_FALSE(Logger::enabled(LogLevel::DEBUG));
    ASSERT_FALSE(Logger::enabled(LogLevel::INFO));
    ASSERT_TRUE(Logger::enabled(LogLevel::WARN));
    ASSERT_TRUE(Logger::enabled(LogLevel::FATAL));

    Logger::set_level(LogLevel::TRACE);
    ASSERT_TRUE(Logger::enabled(LogLevel::TRACE));

    Logger::set_level(saved);
}

/**
 * @brief A throwing initializer does not mark the latch as done.
 */
void test_once_latch_retry_after_failure()
{
    OnceLatch latch;
    int attempts = 0;

    bool threw = false;
    try {
        latch.call([&] {
            ++attempts;
            throw std::runtime_error("transient");
        });
    } catch (const std::runtime_error&) {
        threw = true;
    }
    ASSERT_TRUE(threw);
    ASSERT_FALSE(latch.done());

    latch.call([&] { ++attempts; });
    ASSERT_TRUE(latch.done());
    ASSERT_EQ(attempts, 2);

    // Memoized: later calls do not run the initializer.
    latch.call([&] { ++attempts; });
    ASSERT_EQ(attempts, 2);
}

/**
 * @brief Concurrent callers run the initializer exactly once.
 */
void test_once_latch_concurrent()
{
    OnceLatch latch;
    std::atomic<int> runs{0};
    std::atomic<int> observed_done{0};

    std::vector<std::thread> workers;
    for (int t = 0; t < 8; ++t) {
        workers.emplace_back([&] {
            latch.call([&] {
                std::this_thread::yield();
                runs.fetch_add(1);
            });
            if (latch.done()) {
                observed_done.fetch_add(1);
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    ASSERT_EQ(runs.load(), 1);
    ASSERT_EQ(observed_done.load(), 8);
}

/**
 * @brief Malformed option values are reported with the option and the value.
 */
void test_string_to_long()
{
    ASSERT_EQ(String::to_long("--count", "3"), 3L);
    ASSERT_EQ(String::to_long("--domain", "0"), 0L);
    ASSERT_EQ(String::to_long("--domain", "-1"), -1L);

    auto err = ASSERT_THROWS(String::to_long("--count", "abc"), std::invalid_argument);
    ASSERT_EQ(std::string(err.what()), std::string("invalid value 'abc' for option --count"));

    err = ASSERT_THROWS(String::to_long("-v", "99999999999999999999999"), std::invalid_argument);
    ASSERT_TRUE(std::string(err.what()).find("-v") != std::string::npos);
    ASSERT_TRUE(std::string(err.what()).find("99999999999999999999999") != std::string::npos);

    // Trailing garbage and empty values are rejected too.
    err = ASSERT_THROWS(String::to_long("--count", "12x"), std::invalid_argument);
    ASSERT_TRUE(std::string(err.what()).find("'12x'") != std::string::npos);
    ASSERT_THROWS(String::to_long("--count", ""), std::invalid_argument);
}
