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

#ifndef NCLP_EXPRESSION_HPP
#define NCLP_EXPRESSION_HPP

#include <string>
#include <string_view>
#include <optional>

/**
 * @brief Restricted arithmetic used by computed bindings
 *
 * Grammar:
 * @code
 * expr    := term (('+' | '-') term)*
 * term    := unary (('*' | '/' | '%') unary)*
 * unary   := '-' unary | '*' PARAM | primary
 * primary := NUMBER | PARAM | '(' expr ')'
 * @endcode
 */
namespace Expression
{
	/**
	 * @brief Re-targets a closure body to the runtime state
	 *
	 * @param expr Closure body
	 * @param param Closure parameter
	 * @param target Replacement for the parameter (e.g. `state.count`)
	 * @returns Equivalent script expression, std::nullopt if expr is not in the grammar
	 */
	[[nodiscard]] std::optional<std::string> retarget(std::string_view expr, std::string_view param, std::string_view target);
} // Expression

#endif // NCLP_EXPRESSION_HPP
