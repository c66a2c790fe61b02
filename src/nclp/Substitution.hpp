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

#ifndef NCLP_SUBSTITUTION_HPP
#define NCLP_SUBSTITUTION_HPP

#include <string>
#include <string_view>

class Context;

/**
 * @brief Interpolation of `{{ token }}` and `{token}`
 */
namespace Substitution
{
	/**
	 * @brief Resolves tokens against a context
	 *
	 * Dotted tokens (`{{ a.b }}`, `{a.b}`, optionally ending with `()`) are
	 * resolved first, then single tokens (`{{ a }}`, `{a}`) against scalar
	 * entries. Unresolvable tokens are left unchanged. The content of
	 * `<script>` and `<style>` elements is never touched.
	 *
	 * @param s Markup
	 * @param ctx Data context
	 * @param scopedOnly Only resolve tokens whose first segment is bound by a loop scope,
	 * such tokens are written `[a.b]` when they do not resolve
	 * @returns Markup with resolved tokens
	 */
	[[nodiscard]] std::string apply(std::string_view s, const Context& ctx, bool scopedOnly = false);

	/**
	 * @brief Rewrites the remaining token syntax
	 *
	 * `{{ x }}` becomes `[x]` and `{% x %}` becomes `[% x %]`. Single-brace
	 * `{x}` / `{a.b}` become `[x]` / `[a.b]` outside of script and style content.
	 *
	 * @param s Markup
	 * @returns Markup without token syntax
	 */
	[[nodiscard]] std::string normalize(std::string_view s);
} // Substitution

#endif // NCLP_SUBSTITUTION_HPP
