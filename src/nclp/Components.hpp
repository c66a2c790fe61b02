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

#ifndef NCLP_COMPONENTS_HPP
#define NCLP_COMPONENTS_HPP

#include "Env.hpp"

#include <string>
#include <string_view>
#include <map>

class Attributes;

/**
 * @brief Component renderer
 *
 * Expands the tags of components declared in the source, then the built-in
 * UI components.
 */
namespace Components
{
	/**
	 * @brief Renders a built-in component
	 *
	 * @param attrs Tag attributes
	 * @param content Tag content (empty for self-closing tags)
	 * @returns Markup
	 */
	using Renderer = std::string(*)(const Attributes& attrs, std::string_view content);

	/**
	 * @brief Gets the built-in registry
	 *
	 * @returns Map from tag name to renderer
	 */
	[[nodiscard]] const std::map<std::string_view, Renderer>& builtins();

	/**
	 * @brief Parses the `<n:props>` block of a component body
	 *
	 * Every entry reads `name: Type = "default"` (the type and default are
	 * optional). Entries are separated by newlines, `,` or `;`.
	 *
	 * @param body Component body
	 * @returns Map from prop name to default value
	 */
	[[nodiscard]] std::map<std::string, std::string, std::less<>> props(std::string_view body);

	/**
	 * @brief Expands declared components
	 *
	 * Every round replaces the tags named after a definition of env by its
	 * body, with props, conditions and the default slot resolved. Rounds stop
	 * when nothing changes or after a fixed depth.
	 *
	 * @param s Markup
	 * @param env Environment holding the definitions
	 * @returns Markup with declared components expanded
	 */
	[[nodiscard]] std::string expand(std::string_view s, Env& env);

	/**
	 * @brief Renders the built-in components
	 *
	 * @param s Markup
	 * @returns Markup with built-in component tags replaced
	 */
	[[nodiscard]] std::string render_builtins(std::string_view s);

	/**
	 * @brief Expands declared components then renders built-ins
	 *
	 * @param s Markup
	 * @param env Environment
	 * @returns Rendered markup
	 */
	[[nodiscard]] std::string render(std::string_view s, Env& env);
} // Components

#endif // NCLP_COMPONENTS_HPP
