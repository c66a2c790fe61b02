/* NCLP a live preview compiler for NCL templates
   Copyright © 2023 ef3d0c3e

   This program is free software: you can redistribute it and/or modify
   it under the terms of the GNU Affero General Public License as
   published by the Free Software Foundation, either version 3 of the
   License, or any later version.

   This program is distributed in the hope that it will be useful,
   but WITHOUT ANY WARRANTY; without even the implied warranty of
   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
   GNU Affero General Public License for more details.

   You should have received a copy of the GNU Affero General Public License
   along with this program.  If not, see <http://www.gnu.org/licenses/>. */

#ifndef NCLP_ATTRIBUTES_HPP
#define NCLP_ATTRIBUTES_HPP

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <functional>
#include <initializer_list>

/**
 * @brief Flat attribute list of a tag
 *
 * Attributes are `name="value"`, `name='value'`, `name=value` pairs or bare
 * flags. Lookup is order independent, the source order is kept for
 * re-serialization. Anything that does not look like an attribute is skipped.
 */
class Attributes
{
public:
	struct Attribute
	{
		std::string name;
		std::optional<std::string> value; ///< Empty for bare flags
	};

private:
	std::vector<Attribute> m_attrs;

public:
	/**
	 * @brief Parses an attribute string
	 *
	 * @param s Text between the tag name and the end of the tag
	 * @returns Parsed attributes
	 */
	[[nodiscard]] static Attributes parse(std::string_view s);

	/**
	 * @brief Gets whether an attribute is present
	 *
	 * @param name Attribute's name
	 * @returns true If present (with or without value)
	 */
	[[nodiscard]] bool has(std::string_view name) const;

	/**
	 * @brief Gets an attribute's value
	 *
	 * @param name Attribute's name
	 * @returns The value, "" for bare flags, std::nullopt when absent
	 */
	[[nodiscard]] std::optional<std::string> get(std::string_view name) const;

	/**
	 * @brief Gets an attribute's value or a default
	 *
	 * Present but empty values also give the default.
	 *
	 * @param name Attribute's name
	 * @param def Default value
	 * @returns Value or def
	 */
	[[nodiscard]] std::string get_or(std::string_view name, std::string_view def) const;

	/**
	 * @brief Gets a boolean flag
	 *
	 * @param name Attribute's name
	 * @returns true if the attribute is bare or equals "true"
	 */
	[[nodiscard]] bool flag(std::string_view name) const;

	/**
	 * @brief Serializes attributes back to markup
	 *
	 * Values are double quoted, `"` inside a value is written `&quot;`.
	 *
	 * @param skip Names to leave out
	 * @returns Attributes, each preceded by a space
	 */
	[[nodiscard]] std::string to_string(std::initializer_list<std::string_view> skip = {}) const;

	/**
	 * @brief Iterates over attributes in source order
	 *
	 * @param fn Callback
	 */
	void for_each(const std::function<void(const Attribute&)>& fn) const
	{
		for (const auto& attr : m_attrs)
			fn(attr);
	}

	[[nodiscard]] std::size_t size() const noexcept { return m_attrs.size(); }
	[[nodiscard]] bool empty() const noexcept { return m_attrs.empty(); }
};

#endif // NCLP_ATTRIBUTES_HPP
