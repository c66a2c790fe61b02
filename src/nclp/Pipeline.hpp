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

#ifndef NCLP_PIPELINE_HPP
#define NCLP_PIPELINE_HPP

#include "Env.hpp"

#include <string>
#include <string_view>
#include <vector>
#include <functional>

class Benchmark;

/**
 * @brief Fixed sequence of rewriting stages
 *
 * The directive passes run first, in order, followed by the component
 * renderer, the substitution engine, the normalization and the final sweep.
 */
namespace Pipeline
{
	/**
	 * @brief A named rewriting stage
	 */
	struct Pass
	{
		std::string_view name;
		std::function<std::string(std::string_view, Env&)> fn;
	};

	/**
	 * @brief Called after every stage
	 *
	 * Receives the stage's name, its input and its output.
	 */
	using Observer = std::function<void(std::string_view, std::string_view, std::string_view)>;

	/**
	 * @brief Gets the directive passes, in order
	 */
	[[nodiscard]] const std::vector<Pass>& directives();

	/**
	 * @brief Gets every stage, in order
	 *
	 * The directive passes followed by `component-render`, `substitution`,
	 * `normalize` and `sweep`.
	 */
	[[nodiscard]] const std::vector<Pass>& stages();

	/**
	 * @brief Runs the directive passes on nested content
	 *
	 * Every directive pass except component declarations is applied. Used for
	 * loop bodies, included templates and expanded components.
	 *
	 * @param s Content
	 * @param env Environment of the content
	 * @returns Processed content (unchanged past the maximum nesting)
	 */
	[[nodiscard]] std::string process(std::string_view s, Env& env);

	/**
	 * @brief Runs every stage on a source document
	 *
	 * @param source Source document
	 * @param env Environment, receives the title and component definitions
	 * @param observer Called after every stage
	 * @param bench Times every stage when not null
	 * @returns Document body
	 */
	[[nodiscard]] std::string run(std::string_view source, Env& env,
			const Observer& observer = {}, Benchmark* bench = nullptr);
} // Pipeline

#endif // NCLP_PIPELINE_HPP
