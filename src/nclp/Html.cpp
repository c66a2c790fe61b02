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

#include "Html.hpp"
#include "Scanner.hpp"
#include "Util.hpp"

#include <set>
#include <vector>
#include <fmt/format.h>

using namespace std::literals;

[[nodiscard]] std::string Html::escape(std::string_view s)
{
	return replace_each(s,
			make_array<std::pair<char, std::string_view>>(
				std::make_pair('<', "&lt;"sv),
				std::make_pair('>', "&gt;"sv),
				std::make_pair('&', "&amp;"sv),
				std::make_pair('"', "&quot;"sv)
			));
}

/**
 * @brief Gets the lowercase tag name of a line starting with a tag
 *
 * @param line Line
 * @returns Tag name, empty if none
 */
[[nodiscard]] static std::string tagName(std::string_view line)
{
	std::string name;
	for (std::size_t i = 1; i < line.size(); ++i)
	{
		const char c = line[i];
		if (!is_word(c) && c != '-' && c != ':')
			break;
		name.push_back(static_cast<char>((c >= 'A' && c <= 'Z') ? c - 'A' + 'a' : c));
	}
	return name;
}

/**
 * @brief Splits markup in the lines of the pretty printer
 *
 * Adjacent tags are split and every line is trimmed. Elements whose content
 * is whitespace sensitive are kept whole on a single line.
 *
 * @param s Markup
 * @returns Lines
 */
[[nodiscard]] static std::vector<std::string> lines(std::string_view s)
{
	static const std::regex raw = Scanner::make(
		fmt::format(R"(<(script|style|pre|textarea)\b{}>)", Scanner::attribute_list), true);

	std::vector<std::string> result;
	const auto split = [&result](std::string_view part)
	{
		const std::string text = replace_all(part, "><"sv, ">\n<"sv);
		std::size_t pos = 0;
		while (pos <= text.size())
		{
			std::size_t end = text.find('\n', pos);
			if (end == std::string::npos)
				end = text.size();
			if (const std::string_view line = trim(std::string_view{text}.substr(pos, end-pos)); !line.empty())
				result.emplace_back(line);
			pos = end+1;
		}
	};

	std::size_t pos = 0;
	Scanner::Match m;
	while (pos < s.size() && Scanner::search(s, pos, raw, m))
	{
		const std::size_t begin = pos + m.position(0);
		const std::size_t content = begin + m.length(0);
		split(s.substr(pos, begin-pos));

		// Unterminated elements extend to the end
		const std::regex closer = Scanner::make(fmt::format(R"(</{}\s*>)", Scanner::group(m, 1)), true);
		Scanner::Match close;
		const std::size_t end = Scanner::search(s, content, closer, close)
			? content + close.position(0) + close.length(0)
			: s.size();

		result.emplace_back(s.substr(begin, end-begin));
		pos = end;
	}
	if (pos < s.size())
		split(s.substr(pos));

	return result;
}

[[nodiscard]] std::string Html::indent(std::string_view s)
{
	static const std::set<std::string, std::less<>> voids{
		"area", "base", "br", "col", "embed", "hr", "img", "input",
		"link", "meta", "source", "track", "wbr",
	};

	std::string result;
	std::size_t depth = 0;
	for (const std::string_view line : lines(s))
	{
		if (line.starts_with("</"sv) && depth != 0)
			--depth;

		result.append(depth*2, ' ').append(line).push_back('\n');

		if (line.front() == '<'
			&& !line.starts_with("</"sv)
			&& !line.starts_with("<!"sv)
			&& !line.ends_with("/>"sv)
			&& line.find("</"sv) == std::string_view::npos
			&& voids.find(tagName(line)) == voids.end())
			++depth;
	}

	if (!result.empty())
		result.pop_back();
	return result;
}

[[nodiscard]] std::string Html::outside_raw(std::string_view s, const std::function<std::string(std::string_view)>& fn)
{
	static const std::regex opener = Scanner::make(fmt::format(R"(<(script|style)\b{}>)", Scanner::attribute_list), true);
	static const std::regex scriptEnd = Scanner::make(R"(</script\s*>)", true);
	static const std::regex styleEnd = Scanner::make(R"(</style\s*>)", true);

	std::string result;
	result.reserve(s.size());

	std::size_t pos = 0;
	Scanner::Match m;
	while (pos < s.size())
	{
		if (!Scanner::search(s, pos, opener, m))
			break;

		const std::size_t begin = pos + m.position(0);
		const std::size_t content = begin + m.length(0);
		result.append(fn(s.substr(pos, begin-pos)));

		const bool script = (Scanner::group(m, 1).size() == 6);
		Scanner::Match close;
		if (!Scanner::search(s, content, script ? scriptEnd : styleEnd, close))
		{
			result.append(s.substr(begin));
			return result;
		}

		const std::size_t end = content + close.position(0) + close.length(0);
		result.append(s.substr(begin, end-begin));
		pos = end;
	}
	if (pos < s.size())
		result.append(fn(s.substr(pos)));

	return result;
}
