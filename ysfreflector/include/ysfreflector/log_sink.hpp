// Copyright (c) 2025 <Your Name>
/**
 * @file log_sink.hpp
 * @brief Log sink callback shared by reflector components.
 */
#pragma once

#include <functional>
#include <string>

namespace ysfreflector {

/**
 * Receives one formatted log line. Components emit nothing when the sink
 * is empty. The sink may be called from any internal thread.
 */
using LogCallback = std::function<void(const std::string&)>;

}  // namespace ysfreflector
