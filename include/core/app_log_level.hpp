// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

/**
 * @file app_log_level.hpp
 * @brief Application-level log level abstraction
 * @details Defines the AppLogLevel enum exposed on the command line and its
 *          conversions to the spdlog-backed logging::LogLevel and to/from
 *          display strings.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "core/logging.hpp"

#include <optional>
#include <string>

namespace volmorph {

/**
 * @brief Application-level log levels with simplified 4-tier model.
 *
 * The levels are hierarchical: setting the level to Information captures
 * Exception + Error + Information messages.
 */
enum class AppLogLevel {
    Exception = 0,    ///< Unintended errors (crashes, unexpected failures)
    Error = 1,        ///< Intended error messages (validation, user-facing errors)
    Information = 2,  ///< Minimal information flow (key operations, state transitions)
    Debug = 3         ///< Maximum information flow (element geometry, per-pass traces)
};

/**
 * @brief Convert AppLogLevel to the logger level.
 */
inline logging::LogLevel to_log_level(AppLogLevel level) {
    switch (level) {
        case AppLogLevel::Exception:   return logging::LogLevel::Critical;
        case AppLogLevel::Error:       return logging::LogLevel::Error;
        case AppLogLevel::Information: return logging::LogLevel::Info;
        case AppLogLevel::Debug:       return logging::LogLevel::Debug;
    }
    return logging::LogLevel::Info;
}

/**
 * @brief Convert a logger level to AppLogLevel.
 */
inline AppLogLevel from_log_level(logging::LogLevel level) {
    switch (level) {
        case logging::LogLevel::Critical: return AppLogLevel::Exception;
        case logging::LogLevel::Error:    return AppLogLevel::Error;
        case logging::LogLevel::Warning:  return AppLogLevel::Information;
        case logging::LogLevel::Info:     return AppLogLevel::Information;
        case logging::LogLevel::Debug:    return AppLogLevel::Debug;
        case logging::LogLevel::Trace:    return AppLogLevel::Debug;
        case logging::LogLevel::Off:      return AppLogLevel::Exception;
    }
    return AppLogLevel::Information;
}

/**
 * @brief Convert AppLogLevel to display string.
 */
inline std::string to_string(AppLogLevel level) {
    switch (level) {
        case AppLogLevel::Exception:   return "Exception";
        case AppLogLevel::Error:       return "Error";
        case AppLogLevel::Information: return "Information";
        case AppLogLevel::Debug:       return "Debug";
    }
    return "Information";
}

/**
 * @brief Parse a level name given on the command line.
 * @return Level, or std::nullopt for an unknown name
 */
inline std::optional<AppLogLevel> app_log_level_from_string(const std::string& str) {
    if (str == "Exception" || str == "exception") return AppLogLevel::Exception;
    if (str == "Error" || str == "error")         return AppLogLevel::Error;
    if (str == "Information" || str == "info")    return AppLogLevel::Information;
    if (str == "Debug" || str == "debug")         return AppLogLevel::Debug;
    return std::nullopt;
}

}  // namespace volmorph
