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
#include "util/config/ConfigValue.hpp"
#include "util/config/Error.hpp"
#include "util/config/Types.hpp"

#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace util::config {

/**
 * @brief Array definition to store multiple values provided by the user from Json/Yaml
 *
 * Used in ConfigDefinition to represent multiple potential values (like whitelist)
 * Is constructed with only 1 element which states which type/constraint must every element
 * In the array satisfy
 */
class Array {
public:
    /**
     * @brief Constructs an Array with provided Arg
     *
     * @param arg Argument to set the type and constraint of ConfigValues in Array
     */
    Array(ConfigValue arg) : itemPattern_{std::move(arg)}
    {
    }

    /**
     * @brief Add ConfigValues to Array class
     *
     * @param value The ConfigValue to add; std::nullopt when the element was not provided
     * @param key optional string key to include that will show in error message
     * @return optional error if adding config value to array fails. nullopt otherwise
     */
    [[nodiscard]] std::optional<Error>
    addValue(std::optional<Value> value, std::optional<std::string_view> key = std::nullopt)
    {
        auto element = itemPattern_;
        if (not value.has_value()) {
            if (not element.isOptional() and not element.hasValue())
                return Error{key.value_or("array element"), "is required in user Config"};

            elements_.push_back(std::move(element));
            return std::nullopt;
        }

        if (auto err = element.setValue(std::move(value).value(), key); err.has_value())
            return err;

        elements_.push_back(std::move(element));
        return std::nullopt;
    }

    /**
     * @brief Returns the number of values stored in the Array
     *
     * @return Number of values stored in the Array
     */
    [[nodiscard]] std::size_t
    size() const
    {
        return elements_.size();
    }

    /**
     * @brief Returns the ConfigValue at the specified index
     *
     * @param idx The index of the ConfigValue to return
     * @return ConfigValue at the specified index
     */
    [[nodiscard]] ConfigValue const&
    at(std::size_t idx) const
    {
        ASSERT(idx < elements_.size(), "Index is out of scope");
        return elements_[idx];
    }

    /**
     * @brief Removes all values previously parsed into the Array
     */
    void
    clear()
    {
        elements_.clear();
    }

private:
    ConfigValue itemPattern_;
    std::vector<ConfigValue> elements_;
};

}  // namespace util::config
