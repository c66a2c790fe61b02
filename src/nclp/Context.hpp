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

#ifndef NCLP_CONTEXT_HPP
#define NCLP_CONTEXT_HPP

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

/**
 * @brief Read-only data context used by loops and substitutions
 *
 * A root JSON object plus a stack of named scopes pushed by loops.
 * Lookups resolve the innermost scope first, then the root.
 */
class Context
{
	const nlohmann::json* m_root;
	std::vector<std::pair<std::string, nlohmann::json>> m_scopes; ///< Innermost last

public:
	/**
	 * @brief Constructor
	 *
	 * @param root Root data, must outlive the context
	 */
	explicit Context(const nlohmann::json& root):
		m_root{&root} {}

	/**
	 * @brief Creates a child context with a new scope
	 *
	 * @param name Name bound in the new scope
	 * @param value Value of name
	 * @returns Child context
	 */
	[[nodiscard]] Context with(std::string name, nlohmann::json value) const;

	/**
	 * @brief Looks up a name or a dotted path
	 *
	 * Path segments index objects by key and arrays by position.
	 * `len` and `length` on an array give its size. A trailing `()` is
	 * ignored, so `todos.len()` is the same as `todos.len`.
	 *
	 * @param path Name or dotted path
	 * @returns Value, or std::nullopt if any segment fails
	 */
	[[nodiscard]] std::optional<nlohmann::json> find(std::string_view path) const;

	/**
	 * @brief Looks up a path and formats it as text
	 *
	 * Only scalars (strings, numbers, booleans) have a text form.
	 *
	 * @param path Name or dotted path
	 * @returns Text, or std::nullopt if not found or not a scalar
	 */
	[[nodiscard]] std::optional<std::string> resolve(std::string_view path) const;

	/**
	 * @brief Gets whether a name is bound by a loop scope
	 *
	 * @param name Name
	 * @returns true If name is bound by a scope (not the root)
	 */
	[[nodiscard]] bool scoped(std::string_view name) const;

	/**
	 * @brief Formats a scalar value
	 *
	 * @param value Value
	 * @returns Text form, std::nullopt for null, objects and arrays
	 */
	[[nodiscard]] static std::optional<std::string> to_string(const nlohmann::json& value);

	/**
	 * @brief Gets the built-in preview data
	 *
	 * @returns Default data context
	 */
	[[nodiscard]] static const nlohmann::json& defaults();
};

#endif // NCLP_CONTEXT_HPP
