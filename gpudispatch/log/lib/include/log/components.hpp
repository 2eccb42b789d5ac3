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
 * @file components.hpp
 * @brief Log levels plus per-component and per-event naming and filtering
 */

#ifndef GPUDISPATCH_LOG_COMPONENTS_HPP
#define GPUDISPATCH_LOG_COMPONENTS_HPP

#include <array>
#include <atomic>
#include <cstddef>
#include <mutex>
#include <string_view>
#include <unordered_map>

#include <wise_enum.h>

namespace gpudispatch::log {

/**
 * Severity levels understood by the dispatcher logger
 *
 * Ordered from most verbose to most severe so that a plain comparison
 * decides whether a message passes a threshold.
 */
enum class LogLevel {
    TraceL1,  //!< Step-level tracing
    Debug,    //!< Debug messages
    Info,     //!< Informational messages
    Notice,   //!< Notable but expected conditions
    Warn,     //!< Warnings
    Error,    //!< Errors
    Critical  //!< Unrecoverable conditions
};

} // namespace gpudispatch::log

// WISE_ENUM_ADAPT must be called at global namespace scope for ADL to work
WISE_ENUM_ADAPT(gpudispatch::log::LogLevel, TraceL1, Debug, Info, Notice, Warn, Error, Critical)

namespace gpudispatch::log {

/**
 * Level given to every component that has not been registered explicitly
 *
 * @return Default component level
 */
LogLevel get_logger_default_level();

/**
 * Name lookup for contiguous wise_enum enumerations
 *
 * @tparam EnumType Enumeration declared through wise_enum
 */
template <typename EnumType> struct EnumRegistry final {
    static constexpr std::size_t NUM_VALUES = ::wise_enum::size<EnumType>; //!< Enumerator count

    /**
     * Name of an enumerator
     *
     * @param[in] value Enumerator to resolve
     * @return Enumerator name, or "UNKNOWN" when out of range
     */
    static std::string_view get_name(const EnumType value) {
        static const std::array<std::string_view, NUM_VALUES> names = [] {
            std::array<std::string_view, NUM_VALUES> table{};
            std::size_t idx = 0;
            for (const auto entry : ::wise_enum::range<EnumType>) {
                // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-constant-array-index)
                table[idx++] = std::string_view{entry.name.data(), entry.name.size()};
            }
            return table;
        }();
        const auto idx = static_cast<std::size_t>(value);
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-constant-array-index)
        return idx < NUM_VALUES ? names[idx] : std::string_view{"UNKNOWN"};
    }

    /**
     * Check that a value maps to a declared enumerator
     *
     * @param[in] value Value to check
     * @return true when in range
     */
    static constexpr bool is_valid(const EnumType value) {
        return static_cast<std::size_t>(value) < NUM_VALUES;
    }
};

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

/**
 * Declare a log component enumeration
 *
 * @param ComponentType Name of the component enum type
 * @param ... Component names
 */
#define DECLARE_LOG_COMPONENT(ComponentType, ...) WISE_ENUM_CLASS(ComponentType, __VA_ARGS__)

/**
 * Declare a log event enumeration
 *
 * @param EventType Name of the event enum type
 * @param ... Event names
 */
#define DECLARE_LOG_EVENT(EventType, ...) WISE_ENUM_CLASS(EventType, __VA_ARGS__)

// NOLINTEND(cppcoreguidelines-macro-usage)

/**
 * Per-component level table
 *
 * One table exists per component enumeration. Levels are stored as atomics
 * so that worker threads can filter while another thread reconfigures.
 *
 * @tparam ComponentType Component enumeration
 */
template <typename ComponentType> class ComponentLevelStorage final {
private:
    static constexpr std::size_t NUM_COMPONENTS = ::wise_enum::size<ComponentType>;

    static std::array<std::atomic<LogLevel>, NUM_COMPONENTS> &levels() {
        static std::array<std::atomic<LogLevel>, NUM_COMPONENTS> table{};
        static std::once_flag init_flag;
        std::call_once(init_flag, [] {
            for (auto &level : table) {
                level.store(get_logger_default_level(), std::memory_order_relaxed);
            }
        });
        return table;
    }

public:
    /**
     * Current level of a component
     *
     * @param[in] component Component to query
     * @return Component level, or the default level for an out-of-range value
     */
    static LogLevel get_level(const ComponentType component) {
        const auto idx = static_cast<std::size_t>(component);
        if (idx >= NUM_COMPONENTS) {
            return get_logger_default_level();
        }
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-constant-array-index)
        return levels()[idx].load(std::memory_order_relaxed);
    }

    /**
     * Change the level of one component
     *
     * @param[in] component Component to configure
     * @param[in] level New threshold
     */
    static void set_level(const ComponentType component, const LogLevel level) {
        const auto idx = static_cast<std::size_t>(component);
        if (idx < NUM_COMPONENTS) {
            // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-constant-array-index)
            levels()[idx].store(level, std::memory_order_relaxed);
        }
    }

    /**
     * Change the level of every component of this enumeration
     *
     * @param[in] level New threshold
     */
    static void set_all_levels(const LogLevel level) {
        for (auto &entry : levels()) {
            entry.store(level, std::memory_order_relaxed);
        }
    }

    /**
     * Decide whether a message passes the component threshold
     *
     * @param[in] component Component the message belongs to
     * @param[in] message_level Severity of the message
     * @return true when the message should be emitted
     */
    static bool should_log(const ComponentType component, const LogLevel message_level) {
        return message_level >= get_level(component);
    }
};

/**
 * Component name used in log prefixes
 *
 * @tparam ComponentType Component enumeration
 * @param[in] component Component value
 * @return Component name
 */
template <typename ComponentType>
std::string_view format_component_name(const ComponentType component) {
    return EnumRegistry<ComponentType>::get_name(component);
}

/**
 * Event name used in log prefixes
 *
 * @tparam EventType Event enumeration
 * @param[in] event Event value
 * @return Event name
 */
template <typename EventType> std::string_view format_event_name(const EventType event) {
    return EnumRegistry<EventType>::get_name(event);
}

/**
 * Register components with individual levels
 *
 * @tparam ComponentType Component enumeration
 * @param[in] component_levels Level per component
 */
template <typename ComponentType>
void register_component(const std::unordered_map<ComponentType, LogLevel> &component_levels) {
    for (const auto &[component, level] : component_levels) {
        ComponentLevelStorage<ComponentType>::set_level(component, level);
    }
}

/**
 * Register every component of an enumeration with the same level
 *
 * @tparam ComponentType Component enumeration
 * @param[in] level Level applied to all components
 */
template <typename ComponentType> void register_component(const LogLevel level) {
    ComponentLevelStorage<ComponentType>::set_all_levels(level);
}

/**
 * Current level of a component
 *
 * @tparam ComponentType Component enumeration
 * @param[in] component Component to query
 * @return Current level
 */
template <typename ComponentType>
[[nodiscard]] LogLevel get_component_level(const ComponentType component) {
    return ComponentLevelStorage<ComponentType>::get_level(component);
}

} // namespace gpudispatch::log

#endif // GPUDISPATCH_LOG_COMPONENTS_HPP
