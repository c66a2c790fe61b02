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

#include "Substitution.hpp"
#include "Context.hpp"
#include "Scanner.hpp"
#include "Html.hpp"

#include <fmt/format.h>

using namespace std::literals;

/**
 * @brief Replaces tokens matched by a regex
 *
 * Group 1 holds the path of a double-brace token, group 2 the path of a
 * single-brace token.
 */
[[nodiscard]] static std::string resolveTokens(std::string_view s, const std::regex& re, const Context& ctx, bool scopedOnly)
{
	return Scanner::replace(s, re, [&](const Scanner::Match& m)
	{
		const std::string_view path = m[1].matched ? Scanner::group(m, 1) : Scanner::group(m, 2);
		if (scopedOnly && !ctx.scoped(path.substr(0, path.find('.'))))
			return m.str(0);

		if (const auto value = ctx.resolve(path); value.has_value())
			return Html::escape(*value);
		// A scoped name must not fall back to an outer entry of the same name
		if (scopedOnly)
			return fmt::format("[{}]", path);
		return m.str(0);
	});
}

[[nodiscard]] std::string Substitution::apply(std::string_view s, const Context& ctx, bool scopedOnly)
{
	static const std::regex dotted = Scanner::make(
		R"(\{\{\s*([A-Za-z_]\w*(?:\.\w+)+(?:\(\))?)\s*\}\}|\{\s*([A-Za-z_]\w*(?:\.\w+)+(?:\(\))?)\s*\})");
	static const std::regex single = Scanner::make(
		R"(\{\{\s*([A-Za-z_]\w*)(?:\(\))?\s*\}\}|\{\s*([A-Za-z_]\w*)\s*\})");

	return Html::outside_raw(s, [&](std::string_view part)
	{
		return resolveTokens(resolveTokens(part, dotted, ctx, scopedOnly), single, ctx, scopedOnly);
	});
}

[[nodiscard]] std::string Substitution::normalize(std::string_view s)
{
	static const std::regex doubles = Scanner::make(R"(\{\{\s*([^{}]*?)\s*\}\})");
	static const std::regex statements = Scanner::make(R"(\{%\s*([^%]*?)\s*%\})");
	static const std::regex single = Scanner::make(R"(\{\s*([A-Za-z_]\w*(?:\.\w+)*(?:\(\))?)\s*\})");

	std::string result = Scanner::replace(s, doubles, [](const Scanner::Match& m)
	{
		return fmt::format("[{}]", Scanner::group(m, 1));
	});
	result = Scanner::replace(result, statements, [](const Scanner::Match& m)
	{
		return fmt::format("[% {} %]", Scanner::group(m, 1));
	});

	return Html::outside_raw(result, [](std::string_view part)
	{
		return Scanner::replace(part, single, [](const Scanner::Match& m)
		{
			return fmt::format("[{}]", Scanner::group(m, 1));
		});
	});
}
