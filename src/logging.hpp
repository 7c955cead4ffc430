// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#pragma once

#include <spdlog/logger.h>

#include <memory>

namespace pagewright::internal {

// Process wide logger. Created on first use, never null.
std::shared_ptr<spdlog::logger> get_logger() noexcept;

void set_log_level(spdlog::level::level_enum level) noexcept;

} // namespace pagewright::internal
