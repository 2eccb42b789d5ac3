/*
 * SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

/**
 * @file dispatch_log_macros.hpp
 * @brief Logging macros with component filtering and event tagging
 *
 * Three families are provided for every level:
 * - GPUD_LOG_<LEVEL>(fmt, ...) logs through the global threshold only
 * - GPUD_LOGC_<LEVEL>(component, fmt, ...) additionally checks the component level
 * - GPUD_LOGEC_<LEVEL>(component, event, fmt, ...) also tags the record with an event
 */

#ifndef GPUDISPATCH_LOG_DISPATCH_LOG_MACROS_HPP
#define GPUDISPATCH_LOG_DISPATCH_LOG_MACROS_HPP

#include <quill/LogMacros.h>

#include "log/dispatch_log.hpp"

// NOLINTBEGIN(cppcoreguidelines-macro-usage,cppcoreguidelines-avoid-do-while)

#ifdef __clang__
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wgnu-zero-variadic-macro-arguments"
#endif

#define GPUD_GET_LOGGER() ::gpudispatch::log::detail::get_quill_logger()

/**
 * Component logging helper
 *
 * @param level_enum gpudispatch::log::LogLevel enumerator
 * @param quill_level quill macro suffix
 * @param component Component enumerator
 * @param message Format string
 */
#define GPUD_LOGC_HELPER(level_enum, quill_level, component, message, ...)                         \
    do {                                                                                           \
        if (::gpudispatch::log::ComponentLevelStorage<decltype(component)>::should_log(            \
                    component, ::gpudispatch::log::LogLevel::level_enum)) {                        \
            QUILL_LOG_##quill_level(                                                               \
                    GPUD_GET_LOGGER(),                                                             \
                    "[{}] " message,                                                               \
                    ::gpudispatch::log::format_component_name(component),                          \
                    ##__VA_ARGS__);                                                                \
        }                                                                                          \
    } while (0)

/**
 * Component and event logging helper
 *
 * @param level_enum gpudispatch::log::LogLevel enumerator
 * @param quill_level quill macro suffix
 * @param component Component enumerator
 * @param event Event enumerator
 * @param message Format string
 */
#define GPUD_LOGEC_HELPER(level_enum, quill_level, component, event, message, ...)                 \
    do {                                                                                           \
        if (::gpudispatch::log::ComponentLevelStorage<decltype(component)>::should_log(            \
                    component, ::gpudispatch::log::LogLevel::level_enum)) {                        \
            QUILL_LOG_##quill_level(                                                               \
                    GPUD_GET_LOGGER(),                                                             \
                    "[{}] EVENT [{}] " message,                                                    \
                    ::gpudispatch::log::format_component_name(component),                          \
                    ::gpudispatch::log::format_event_name(event),                                  \
                    ##__VA_ARGS__);                                                                \
        }                                                                                          \
    } while (0)

/**
 * Make a value type loggable
 *
 * Creates the fmtquill formatter and the quill codec for @p type. Deferred
 * formatting copies the object to the backend thread, so @p type must only
 * hold values.
 *
 * @param type Type to make loggable
 * @param format_str Format string for the members
 * @param ... Member expressions, the object is named obj
 */
#define GPUD_LOGGABLE_DEFERRED_FORMAT(type, format_str, ...)                                       \
    template <> struct fmtquill::formatter<type> {                                                 \
        constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {                 \
            return ctx.begin();                                                                    \
        }                                                                                          \
                                                                                                   \
        template <typename FormatContext>                                                          \
        auto format(const type &obj, FormatContext &ctx) const -> decltype(ctx.out()) {            \
            return fmtquill::format_to(ctx.out(), format_str, __VA_ARGS__);                        \
        }                                                                                          \
    };                                                                                             \
                                                                                                   \
    template <> struct quill::Codec<type> : quill::DeferredFormatCodec<type> {};

#define GPUD_LOG_TRACE_L1(fmt, ...) QUILL_LOG_TRACE_L1(GPUD_GET_LOGGER(), fmt, ##__VA_ARGS__)
#define GPUD_LOGC_TRACE_L1(c, m, ...) GPUD_LOGC_HELPER(TraceL1, TRACE_L1, c, m, ##__VA_ARGS__)
#define GPUD_LOGEC_TRACE_L1(c, e, m, ...)                                                          \
    GPUD_LOGEC_HELPER(TraceL1, TRACE_L1, c, e, m, ##__VA_ARGS__)

#define GPUD_LOG_DEBUG(fmt, ...) QUILL_LOG_DEBUG(GPUD_GET_LOGGER(), fmt, ##__VA_ARGS__)
#define GPUD_LOGC_DEBUG(c, m, ...) GPUD_LOGC_HELPER(Debug, DEBUG, c, m, ##__VA_ARGS__)
#define GPUD_LOGEC_DEBUG(c, e, m, ...) GPUD_LOGEC_HELPER(Debug, DEBUG, c, e, m, ##__VA_ARGS__)

#define GPUD_LOG_INFO(fmt, ...) QUILL_LOG_INFO(GPUD_GET_LOGGER(), fmt, ##__VA_ARGS__)
#define GPUD_LOGC_INFO(c, m, ...) GPUD_LOGC_HELPER(Info, INFO, c, m, ##__VA_ARGS__)
#define GPUD_LOGEC_INFO(c, e, m, ...) GPUD_LOGEC_HELPER(Info, INFO, c, e, m, ##__VA_ARGS__)

#define GPUD_LOG_NOTICE(fmt, ...) QUILL_LOG_NOTICE(GPUD_GET_LOGGER(), fmt, ##__VA_ARGS__)
#define GPUD_LOGC_NOTICE(c, m, ...) GPUD_LOGC_HELPER(Notice, NOTICE, c, m, ##__VA_ARGS__)
#define GPUD_LOGEC_NOTICE(c, e, m, ...) GPUD_LOGEC_HELPER(Notice, NOTICE, c, e, m, ##__VA_ARGS__)

#define GPUD_LOG_WARN(fmt, ...) QUILL_LOG_WARNING(GPUD_GET_LOGGER(), fmt, ##__VA_ARGS__)
#define GPUD_LOGC_WARN(c, m, ...) GPUD_LOGC_HELPER(Warn, WARNING, c, m, ##__VA_ARGS__)
#define GPUD_LOGEC_WARN(c, e, m, ...) GPUD_LOGEC_HELPER(Warn, WARNING, c, e, m, ##__VA_ARGS__)

#define GPUD_LOG_ERROR(fmt, ...) QUILL_LOG_ERROR(GPUD_GET_LOGGER(), fmt, ##__VA_ARGS__)
#define GPUD_LOGC_ERROR(c, m, ...) GPUD_LOGC_HELPER(Error, ERROR, c, m, ##__VA_ARGS__)
#define GPUD_LOGEC_ERROR(c, e, m, ...) GPUD_LOGEC_HELPER(Error, ERROR, c, e, m, ##__VA_ARGS__)

#define GPUD_LOG_CRITICAL(fmt, ...) QUILL_LOG_CRITICAL(GPUD_GET_LOGGER(), fmt, ##__VA_ARGS__)
#define GPUD_LOGC_CRITICAL(c, m, ...) GPUD_LOGC_HELPER(Critical, CRITICAL, c, m, ##__VA_ARGS__)
#define GPUD_LOGEC_CRITICAL(c, e, m, ...)                                                          \
    GPUD_LOGEC_HELPER(Critical, CRITICAL, c, e, m, ##__VA_ARGS__)

#ifdef __clang__
#pragma clang diagnostic pop
#endif

// NOLINTEND(cppcoreguidelines-macro-usage,cppcoreguidelines-avoid-do-while)

#endif // GPUDISPATCH_LOG_DISPATCH_LOG_MACROS_HPP
