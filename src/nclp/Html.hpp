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

#ifndef NCLP_HTML_HPP
#define NCLP_HTML_HPP

#include <string>
#include <string_view>
#include <functional>

namespace Html
{
	/**
	 * @brief Escapes text for markup
	 *
	 * @param s Text
	 * @returns s with `<`, `>`, `&` and `"` escaped
	 */
	[[nodiscard]] std::string escape(std::string_view s);

	/**
	 * @brief Pretty prints markup
	 *
	 * Every tag is put on its own line, nested elements are indented by two
	 * spaces per level. Void elements, comments and declarations do not
	 * open a level. `<script>`, `<style>`, `<pre>` and `<textarea>` elements
	 * are copied verbatim.
	 *
	 * @param s Markup
	 * @returns Indented markup
	 */
	[[nodiscard]] std::string indent(std::string_view s);

	/**
	 * @brief Rewrites everything except `<script>` and `<style>` elements
	 *
	 * Raw elements (tag, content and closing tag) are copied untouched.
	 * An unterminated raw element extends to the end of the input.
	 *
	 * @param s Markup
	 * @param fn Called on every segment outside raw elements
	 * @returns Rewritten markup
	 */
	[[nodiscard]] std::string outside_raw(std::string_view s, const std::function<std::string(std::string_view)>& fn);
} // Html

#endif // NCLP_HTML_HPP
