// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#include <logging.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/null_sink.h>

#include <cstdio>

namespace pagewright::internal {

namespace {

const char *LOGGER_NAME = "pagewright";

std::shared_ptr<spdlog::logger> create_logger() noexcept {
    try {
        auto logger = spdlog::get(LOGGER_NAME);
        if(logger) {
            return logger;
        }
        logger = spdlog::stderr_color_mt(LOGGER_NAME);
        logger->set_level(spdlog::level::warn);
        // SPDLOG_LEVEL=pagewright=debug overrides the default.
        spdlog::cfg::load_env_levels();
        return logger;
    } catch(const spdlog::spdlog_ex &ex) {
        fprintf(stderr, "Could not create logger: %s\n", ex.what());
        return std::make_shared<spdlog::logger>(LOGGER_NAME,
                                                std::make_shared<spdlog::sinks::null_sink_mt>());
    }
}

} // namespace

std::shared_ptr<spdlog::logger> get_logger() noexcept {
    static std::shared_ptr<spdlog::logger> logger = create_logger();
    return logger;
}

void set_log_level(spdlog::level::level_enum level) noexcept { get_logger()->set_level(level); }

} // namespace pagewright::internal
