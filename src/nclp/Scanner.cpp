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

#include "Scanner.hpp"
#include "Util.hpp"

#include <fmt/format.h>

using namespace std::literals;

[[nodiscard]] std::regex Scanner::make(const std::string& re, bool icase)
{
	try
	{
		auto flags = std::regex::ECMAScript;
		if (icase)
			flags |= std::regex::icase;
		return std::regex(re, flags);
	}
	catch (std::regex_error& e)
	{
		throw Error(fmt::format("regex_error() : regex `{}` failed to compile with message : {}", re, e.what()));
	}
}

[[nodiscard]] bool Scanner::search(std::string_view input, std::size_t pos, const std::regex& re, Match& m)
{
	if (pos > input.size()) [[unlikely]]
		return false;

	auto flags = std::regex_constants::match_default;
	if (pos != 0)
		flags |= std::regex_constants::match_prev_avail;
	return std::regex_search(input.cbegin()+pos, input.cend(), m, re, flags);
}

[[nodiscard]] static bool selfClosing(const Scanner::Match& m)
{
	return m.length(0) >= 2 && std::string_view(m[0].first, m[0].second).ends_with("/>"sv);
}

[[nodiscard]] std::string Scanner::replace(std::string_view input, const std::regex& re, const MatchCallback& fn)
{
	std::string result;
	result.reserve(input.size());

	std::size_t pos = 0;
	Match m;
	while (pos <= input.size() && search(input, pos, re, m))
	{
		const std::size_t begin = pos + m.position(0);
		const std::size_t end = begin + m.length(0);

		result.append(input.substr(pos, begin-pos));
		result.append(fn(m));

		if (end == begin) [[unlikely]] // Empty match, move forward
		{
			if (end == input.size())
			{
				pos = end+1;
				break;
			}
			result.push_back(input[end]);
			pos = end+1;
		}
		else
			pos = end;
	}
	if (pos < input.size())
		result.append(input.substr(pos));

	return result;
}

[[nodiscard]] std::pair<std::size_t, std::size_t> Scanner::find_closer(std::string_view input, std::size_t from,
		const std::regex& opener, const std::regex& closer)
{
	std::size_t depth = 1;
	std::size_t cursor = from;

	Match open, close;
	while (cursor <= input.size())
	{
		if (!search(input, cursor, closer, close))
			return {std::string::npos, std::string::npos};
		const std::size_t close_begin = cursor + close.position(0);
		const std::size_t close_end = close_begin + close.length(0);

		// Nested opener before the closer
		if (search(input, cursor, opener, open) && cursor + open.position(0) < close_begin)
		{
			const std::size_t open_end = cursor + open.position(0) + open.length(0);
			if (!selfClosing(open))
				++depth;
			cursor = std::max(open_end, cursor+1);
			continue;
		}

		if (--depth == 0)
			return {close_begin, close_end};
		cursor = close_end;
	}

	return {std::string::npos, std::string::npos};
}

[[nodiscard]] std::string Scanner::replace_blocks(std::string_view input,
		const std::regex& opener, const std::regex& closer,
		const BlockCallback& fn)
{
	std::string result;
	result.reserve(input.size());

	std::size_t pos = 0;
	Match m;
	while (pos < input.size() && search(input, pos, opener, m))
	{
		const std::size_t open_begin = pos + m.position(0);
		const std::size_t open_end = open_begin + m.length(0);

		if (open_end == open_begin) [[unlikely]] // Empty opener, not a block
		{
			result.append(input.substr(pos, open_end-pos+1));
			pos = open_end+1;
			continue;
		}

		if (selfClosing(m))
		{
			result.append(input.substr(pos, open_end-pos));
			pos = open_end;
			continue;
		}

		const auto [close_begin, close_end] = find_closer(input, open_end, opener, closer);
		if (close_begin == std::string::npos) // Unterminated: leave as literal text
		{
			result.append(input.substr(pos, open_end-pos));
			pos = open_end;
			continue;
		}

		const Block block{
			.open = m,
			.body = input.substr(open_end, close_begin-open_end),
			.whole = input.substr(open_begin, close_end-open_begin),
		};

		result.append(input.substr(pos, open_begin-pos));
		if (auto replacement = fn(block); replacement.has_value())
		{
			result.append(*replacement);
			pos = close_end;
		}
		else
		{
			result.append(input.substr(open_begin, open_end-open_begin));
			pos = open_end;
		}
	}
	if (pos < input.size())
		result.append(input.substr(pos));

	return result;
}

[[nodiscard]] std::string_view Scanner::group(const Match& m, std::size_t i) noexcept
{
	if (i >= m.size() || !m[i].matched)
		return {};
	return std::string_view(m[i].first, m[i].second);
}
