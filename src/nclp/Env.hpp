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

#ifndef NCLP_ENV_HPP
#define NCLP_ENV_HPP

#include "Context.hpp"

#include <map>
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <functional>
#include <initializer_list>

/**
 * @brief Island and template lookup table, keyed by path
 */
using Islands = std::map<std::string, std::string, std::less<>>;

/**
 * @brief Component definitions declared in the source, keyed by name
 *
 * Bodies are kept unprocessed (including their `<n:props>` block).
 */
using Definitions = std::map<std::string, std::string, std::less<>>;

/**
 * @brief Per-compile state shared by the passes
 *
 * Nothing in here outlives a compile call.
 */
struct Env
{
	Context context; ///< Data for loops and substitutions
	const Islands* islands = nullptr; ///< Lookup table (may be null)
	Definitions definitions; ///< Declared components
	std::optional<std::string> title; ///< Title from the page root
	std::vector<std::string> includes; ///< Include chain, innermost last
	std::size_t depth = 0; ///< Nesting of `process` calls

	/**
	 * @brief Runs the directive passes on nested content
	 *
	 * Set by the pipeline. Used for loop bodies, included templates
	 * and expanded components.
	 */
	std::function<std::string(std::string_view, Env&)> process;

	/**
	 * @brief Constructor
	 *
	 * @param context Data context
	 * @param islands Lookup table
	 */
	Env(Context context, const Islands* islands):
		context{std::move(context)}, islands{islands} {}

	/**
	 * @brief Looks up the table
	 *
	 * @param key Path, tried as is then with each suffix
	 * @param suffixes Suffixes to try
	 * @returns <key found, content>, std::nullopt if absent
	 */
	[[nodiscard]] std::optional<std::pair<std::string, std::string_view>> lookup(std::string_view key,
			std::initializer_list<std::string_view> suffixes) const
	{
		if (!islands)
			return std::nullopt;

		if (auto it = islands->find(key); it != islands->end())
			return std::make_pair(it->first, std::string_view{it->second});
		for (const auto suffix : suffixes)
		{
			const std::string name = std::string{key}.append(suffix);
			if (auto it = islands->find(name); it != islands->end())
				return std::make_pair(it->first, std::string_view{it->second});
		}
		return std::nullopt;
	}
};

#endif // NCLP_ENV_HPP
