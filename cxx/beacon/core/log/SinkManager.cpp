/**
 * @file
 * @brief Implementation of the sink manager
 *
 * @copyright Copyright (c) 2025 DESY and the Beacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "SinkManager.hpp"

#include <array>
#include <cstddef>
#include <ctime>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/common.h>
#include <spdlog/details/log_msg.h>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "beacon/core/log/Level.hpp"
#include "beacon/core/utils/enum.hpp"
#include "beacon/core/utils/string.hpp"

using namespace beacon::log;
using namespace beacon::utils;

namespace {

    // Level name right-aligned to the width of the longest level name
    class LevelFlag : public spdlog::custom_flag_formatter {
    public:
        void format(const spdlog::details::log_msg& msg, const std::tm& /*tm*/, spdlog::memory_buf_t& dest) override {
            constexpr std::size_t width = 8;
            const auto name = enum_name(from_spdlog_level(msg.level));
            for(auto pad = name.size(); pad < width; ++pad) {
                dest.push_back(' ');
            }
            dest.append(name.data(), name.data() + name.size());
        }

        std::unique_ptr<spdlog::custom_flag_formatter> clone() const override { return std::make_unique<LevelFlag>(); }
    };

    constexpr std::array<std::pair<Level, const char*>, 6> console_colors {{
        {TRACE, "\x1B[90m"},
        {DEBUG, "\x1B[36m"},
        {INFO, "\x1B[36;1m"},
        {WARNING, "\x1B[33;1m"},
        {STATUS, "\x1B[32;1m"},
        {CRITICAL, "\x1B[31;1m"},
    }};

} // namespace

SinkManager& SinkManager::getInstance() {
    static SinkManager instance {};
    return instance;
}

SinkManager::SinkManager() : console_sink_(std::make_shared<spdlog::sinks::stdout_color_sink_mt>()) {
    // One worker thread shared by all topics
    spdlog::init_thread_pool(1024, 1);

    // |2025-01-10 00:16:40.922|  WARNING [LSTN] message
    auto formatter = std::make_unique<spdlog::pattern_formatter>();
    formatter->add_flag<LevelFlag>('*');
    formatter->set_pattern("|%Y-%m-%d %H:%M:%S.%e| %^%*%$ [%n] %v");
    console_sink_->set_formatter(std::move(formatter));

    for(const auto& [level, color] : console_colors) {
        console_sink_->set_color(to_spdlog_level(level), color);
    }
}

SinkManager::~SinkManager() {
    const std::lock_guard loggers_lock {mutex_};
    for(const auto& [topic, logger] : loggers_) {
        logger->flush();
    }
    loggers_.clear();
}

std::shared_ptr<spdlog::async_logger> SinkManager::getLogger(std::string_view topic) {
    auto topic_uc = transform(topic, ::toupper);

    const std::lock_guard loggers_lock {mutex_};
    const auto logger_it = loggers_.find(topic_uc);
    if(logger_it != loggers_.end()) {
        return logger_it->second;
    }

    // Drop oldest messages instead of blocking the network threads if the queue is full
    auto logger = std::make_shared<spdlog::async_logger>(
        topic_uc, console_sink_, spdlog::thread_pool(), spdlog::async_overflow_policy::overrun_oldest);
    logger->set_level(to_spdlog_level(level_for(topic_uc)));
    loggers_.emplace(std::move(topic_uc), logger);
    return logger;
}

void SinkManager::setConsoleLevels(Level global_level, const std::map<std::string, Level>& topic_levels) {
    const std::lock_guard loggers_lock {mutex_};
    global_level_ = global_level;
    topic_levels_.clear();
    for(const auto& [topic, level] : topic_levels) {
        topic_levels_.insert_or_assign(transform(topic, ::toupper), level);
    }

    for(const auto& [topic, logger] : loggers_) {
        logger->set_level(to_spdlog_level(level_for(topic)));
    }
}

Level SinkManager::level_for(const std::string& topic) const {
    const auto level_it = topic_levels_.find(topic);
    return level_it != topic_levels_.end() ? level_it->second : global_level_;
}
