/**
 * @copyright Copyright (c) 2025 DESY and the Beacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include <catch2/catch_test_macros.hpp>

#include "beacon/core/discovery/definitions.hpp"
#include "beacon/core/log/log.hpp"
#include "beacon/core/log/Logger.hpp"
#include "beacon/core/log/SinkManager.hpp"
#include "beacon/core/utils/enum.hpp"

using namespace beacon::discovery;
using namespace beacon::log;
using namespace beacon::utils;

// NOLINTBEGIN(cert-err58-cpp,misc-use-anonymous-namespace)

TEST_CASE("Topics are upper-case and shared", "[logging]") {
    const Logger logger {"Pub"};
    const Logger other {"PUB"};
    REQUIRE(logger.getTopic() == "PUB");

    SinkManager::getInstance().setConsoleLevels(INFO, {{"pub", DEBUG}});
    REQUIRE(logger.getLevel() == DEBUG);
    REQUIRE(other.getLevel() == DEBUG);
}

TEST_CASE("Log all levels", "[logging]") {
    const Logger logger {"AllLevels"};

    SinkManager::getInstance().setConsoleLevels(TRACE);
    REQUIRE(logger.shouldLog(TRACE));

    LOG(logger, TRACE) << "trace";
    LOG(logger, DEBUG) << "debug";
    LOG(logger, INFO) << "info";
    LOG(logger, WARNING) << "warning";
    LOG(logger, STATUS) << "status";
    LOG(logger, CRITICAL) << "critical";
}

TEST_CASE("Logging enums", "[logging]") {
    const Logger logger {"LoggingEnums"};
    SinkManager::getInstance().setConsoleLevels(TRACE);
    LOG(logger, INFO) << "Status " << RoleStatus::RUNNING << ", service " << ServiceStatus::DISCOVERED;
    REQUIRE(enum_name(RoleStatus::RUNNING) == "RUNNING");
    REQUIRE(enum_name(ServiceStatus::DEAD) == "DEAD");
}

TEST_CASE("Rate-limited logging", "[logging]") {
    const Logger logger {"RateLimited"};
    SinkManager::getInstance().setConsoleLevels(TRACE);

    int count {0};
    for(int i = 0; i < 5; ++i) {
        LOG_N(logger, WARNING, 3) << "datagram dropped, i=" << i << ", count " << ++count;
    }
    REQUIRE(count == 3);
}

TEST_CASE("Stream expression not evaluated below level", "[logging]") {
    const Logger logger {"LazyEvaluation"};

    SinkManager::getInstance().setConsoleLevels(WARNING);

    int count {0};
    LOG(logger, DEBUG) << ++count;
    LOG(logger, CRITICAL) << ++count;
    REQUIRE(count == 1);

    // Rate limit is not consumed by suppressed messages
    int count_n {0};
    for(int i = 0; i < 3; ++i) {
        LOG_N(logger, DEBUG, 1) << ++count_n;
    }
    REQUIRE(count_n == 0);
}

TEST_CASE("Console levels", "[logging]") {
    const Logger logger {"ConsoleLevels"};

    SinkManager::getInstance().setConsoleLevels(STATUS);
    REQUIRE(logger.getLevel() == STATUS);

    // Topic override takes precedence over the global level
    SinkManager::getInstance().setConsoleLevels(TRACE, {{"CONSOLELEVELS", WARNING}});
    REQUIRE(logger.getLevel() == WARNING);

    SinkManager::getInstance().setConsoleLevels(TRACE, {{"consolelevels", CRITICAL}});
    REQUIRE(logger.getLevel() == CRITICAL);

    // Overrides are replaced on every call and apply to loggers created later
    SinkManager::getInstance().setConsoleLevels(DEBUG, {{"LATELOGGER", OFF}});
    const Logger late_logger {"LateLogger"};
    REQUIRE(late_logger.getLevel() == OFF);
    REQUIRE(logger.getLevel() == DEBUG);
}

// NOLINTEND(cert-err58-cpp,misc-use-anonymous-namespace)
