//------------------------------------------------------------------------------
/*
    This file is part of marketsync
    Copyright (c) 2025, the marketsync developers.

    Permission to use, copy, modify, and distribute this software for any
    purpose with or without fee is hereby granted, provided that the above
    copyright notice and this permission notice appear in all copies.

    THE  SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES
    WITH  REGARD  TO  THIS  SOFTWARE  INCLUDING  ALL  IMPLIED  WARRANTIES  OF
    MERCHANTABILITY  AND  FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR
    ANY  SPECIAL,  DIRECT,  INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
    WHATSOEVER  RESULTING  FROM  LOSS  OF USE, DATA OR PROFITS, WHETHER IN AN
    ACTION  OF  CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
    OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
*/
//==============================================================================

#pragma once

#include "util/Assert.hpp"
#include "util/config/ConfigConstraints.hpp"
#include "util/config/Error.hpp"
#include "util/config/Types.hpp"

#include <fmt/core.h>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace util::config {

/**
 * @brief Represents the config values for Json/Yaml config
 *
 * Used in ConfigDefinition to indicate the type of value (Integer, String, Double, Boolean), whether it is optional
 * and an optional default value.
 */
class ConfigValue {
public:
    /**
     * @brief Constructor initializing with the config type
     *
     * @param type The type of the config value
     */
    constexpr ConfigValue(ConfigType type) : type_(type)
    {
    }

    /**
     * @brief Sets the value of the config once the user's config file is parsed
     *
     * @param value The value to set
     * @param key The config key this value belongs to, used for error messages
     * @return An Error if the value is invalid; nullopt otherwise
     */
    [[nodiscard]] std::optional<Error>
    setValue(Value value, std::optional<std::string_view> key = std::nullopt)
    {
        auto err = checkTypeConsistency(type_, value);
        if (err.has_value()) {
            if (key.has_value())
                err->error = fmt::format("{} {}", key.value(), err->error);
            return err;
        }

        if (cons_.has_value()) {
            auto constraintCheck = cons_->get().checkConstraint(value);
            if (constraintCheck.has_value()) {
                if (key.has_value())
                    constraintCheck->error = fmt::format("{} {}", key.value(), constraintCheck->error);
                return constraintCheck;
            }
        }

        // integers are accepted where doubles are expected
        if (type_ == ConfigType::Double && std::holds_alternative<int64_t>(value)) {
            value_ = static_cast<double>(std::get<int64_t>(value));
        } else {
            value_ = std::move(value);
        }
        return std::nullopt;
    }

    /**
     * @brief Assigns a constraint to the ConfigValue.
     *
     * @param cons The constraint to assign
     * @return Reference to this ConfigValue
     */
    [[nodiscard]] ConfigValue&
    withConstraint(Constraint const& cons)
    {
        cons_ = std::reference_wrapper<Constraint const>(cons);
        ASSERT(cons_.has_value(), "Constraint must be defined");

        if (value_.has_value()) {
            auto const err = cons_->get().checkConstraint(value_.value());
            ASSERT(
                !err.has_value(), "Default value does not satisfy the constraint: {}", err.has_value() ? err->error : ""
            );
        }
        return *this;
    }

    /**
     * @brief Sets the default value for the config
     *
     * @param value The default value
     * @return Reference to this ConfigValue
     */
    [[nodiscard]] ConfigValue&
    defaultValue(Value value)
    {
        auto const err = setValue(std::move(value));
        ASSERT(!err.has_value(), "Default value does not match the type: {}", err.has_value() ? err->error : "");
        return *this;
    }

    /**
     * @brief Sets the config value as optional, meaning the user doesn't have to provide the value in their config
     *
     * @return Reference to this ConfigValue
     */
    [[nodiscard]] ConfigValue&
    optional()
    {
        optional_ = true;
        return *this;
    }

    /**
     * @brief Gets the config type
     *
     * @return The config type
     */
    [[nodiscard]] constexpr ConfigType
    type() const
    {
        return type_;
    }

    /**
     * @brief Check if value is optional
     *
     * @return if value is optional, false otherwise
     */
    [[nodiscard]] constexpr bool
    isOptional() const
    {
        return optional_;
    }

    /**
     * @brief Check if value has a value or not
     *
     * @return true if has a value; false otherwise
     */
    [[nodiscard]] constexpr bool
    hasValue() const
    {
        return value_.has_value();
    }

    /**
     * @brief Get the value of the config
     *
     * @return The value
     */
    [[nodiscard]] Value const&
    getValue() const
    {
        ASSERT(value_.has_value(), "Config value is not set");
        return value_.value();
    }

private:
    [[nodiscard]] static std::optional<Error>
    checkTypeConsistency(ConfigType type, Value const& value)
    {
        if (type == ConfigType::String && !std::holds_alternative<std::string>(value))
            return Error{"value does not match type string"};
        if (type == ConfigType::Boolean && !std::holds_alternative<bool>(value))
            return Error{"value does not match type boolean"};
        if (type == ConfigType::Double && !std::holds_alternative<double>(value) &&
            !std::holds_alternative<int64_t>(value))
            return Error{"value does not match type double"};
        if (type == ConfigType::Integer && !std::holds_alternative<int64_t>(value))
            return Error{"value does not match type integer"};
        return std::nullopt;
    }

    ConfigType type_{};
    bool optional_{false};
    std::optional<Value> value_;
    std::optional<std::reference_wrapper<Constraint const>> cons_;
};

}  // namespace util::config
