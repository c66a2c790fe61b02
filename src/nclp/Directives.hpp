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

#ifndef NCLP_DIRECTIVES_HPP
#define NCLP_DIRECTIVES_HPP

#include "Env.hpp"

#include <string>
#include <string_view>
#include <optional>
#include <functional>

/**
 * @brief Directive passes
 *
 * Every pass takes and returns the whole text and recognizes a single family
 * of `n:` tags. Passes never throw: anything they do not understand is left
 * as it is.
 */
namespace Directives
{
	/**
	 * @brief Resolves a condition before the heuristic
	 *
	 * Returns std::nullopt to fall back to the heuristic.
	 */
	using ConditionResolver = std::function<std::optional<bool>(std::string_view)>;

	/**
	 * @brief Approximates a condition
	 *
	 * A condition is known-false if it compares to zero (`== 0`), or checks for
	 * emptiness (`is empty`, `is_empty()` not negated by `!`). Anything else is
	 * assumed true.
	 *
	 * @param condition Condition text
	 * @returns Whether the guarded content is kept
	 */
	[[nodiscard]] bool condition(std::string_view condition);

	/**
	 * @brief `<n:component name="X">body</n:component>`
	 *
	 * Removes declarations and stores them in env.definitions.
	 */
	[[nodiscard]] std::string components(std::string_view s, Env& env);

	/**
	 * @brief `<n:view title="T" layout="L">body</n:view>`
	 *
	 * Records the title, unwraps the body. A layout emits a marker comment.
	 * A bare `<view>` element is the same page root.
	 */
	[[nodiscard]] std::string view(std::string_view s, Env& env);

	/**
	 * @brief `<n:layout name="L">` and `</n:layout>`
	 */
	[[nodiscard]] std::string layout(std::string_view s, Env& env);

	/**
	 * @brief `<n:slot />`, `<n:slot name="x" />` and `<n:props>...</n:props>`
	 */
	[[nodiscard]] std::string slots(std::string_view s, Env& env);

	/**
	 * @brief `<style scoped>`
	 */
	[[nodiscard]] std::string scoped_styles(std::string_view s, Env& env);

	/**
	 * @brief `<n:for item="x" in="path">body</n:for>`
	 *
	 * The body is processed once per element, in a scope binding item to the
	 * element.
	 */
	[[nodiscard]] std::string loops(std::string_view s, Env& env);

	/**
	 * @brief `{% for x in path %}body{% endfor %}`
	 */
	[[nodiscard]] std::string bracket_loops(std::string_view s, Env& env);

	/**
	 * @brief `<n:if condition="c">` and `{% if c %}...{% else %}...{% endif %}`
	 *
	 * @param s Text
	 * @param resolver Called first on every condition
	 * @returns Text with conditionals resolved
	 */
	[[nodiscard]] std::string conditionals(std::string_view s, const ConditionResolver& resolver = {});

	/**
	 * @brief `<n:island client:mode>body</n:island>`
	 */
	[[nodiscard]] std::string inline_islands(std::string_view s, Env& env);

	/**
	 * @brief `<n:island src="path" client:mode />`
	 */
	[[nodiscard]] std::string external_islands(std::string_view s, Env& env);

	/**
	 * @brief `<n:link href="h">body</n:link>`
	 */
	[[nodiscard]] std::string links(std::string_view s, Env& env);

	/**
	 * @brief `<n:image src="s" alt="a" />`
	 */
	[[nodiscard]] std::string images(std::string_view s, Env& env);

	/**
	 * @brief `<n:model ... />` and `<n:load>...</n:load>`
	 */
	[[nodiscard]] std::string data(std::string_view s, Env& env);

	/**
	 * @brief `<n:client>...</n:client>`
	 */
	[[nodiscard]] std::string client(std::string_view s, Env& env);

	/**
	 * @brief `<n:script>...</n:script>`
	 */
	[[nodiscard]] std::string server_scripts(std::string_view s, Env& env);

	/**
	 * @brief `<n:form>`, `<n:step>` and `<n:field>`
	 */
	[[nodiscard]] std::string forms(std::string_view s, Env& env);

	/**
	 * @brief `<n:include src="name" />`
	 */
	[[nodiscard]] std::string includes(std::string_view s, Env& env);

	/**
	 * @brief Escapes every directive tag still present
	 *
	 * @param s Text
	 * @returns Text where leftover `<n:...>` tags are visible literal text
	 */
	[[nodiscard]] std::string sweep(std::string_view s);
} // Directives

#endif // NCLP_DIRECTIVES_HPP
