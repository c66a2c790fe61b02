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

#include "Util.hpp"

#include <fmt/format.h>

using namespace std::literals;

bool Colors::enabled = true;
const std::string_view Colors::reset = "\033[0m"sv;
const std::string_view Colors::bold = "\033[1m"sv;
const std::string_view Colors::red = "\033[31m"sv;
const std::string_view Colors::green = "\033[32m"sv;
const std::string_view Colors::yellow = "\033[33m"sv;
const std::string_view Colors::blue = "\033[34m"sv;
const std::string_view Colors::magenta = "\033[35m"sv;
const std::string_view Colors::cyan = "\033[36m"sv;

[[nodiscard]] std::string Colors::paint(std::string_view color, std::string_view s)
{
	if (!enabled)
		return std::string{s};
	return fmt::format("{}{}{}", color, s, reset);
}

Error::Error(const std::string& msg, const std::source_location& loc)
{
	m_msg = fmt::format("{}({}:{}) `{}` {}", loc.file_name(), loc.line(), loc.column(), loc.function_name(), msg);
}

std::string Error::what() const throw()
{
	return m_msg;
}

[[nodiscard]] std::string_view trim(std::string_view s) noexcept
{
	const auto is_space = [](char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v'; };

	while (!s.empty() && is_space(s.front()))
		s.remove_prefix(1);
	while (!s.empty() && is_space(s.back()))
		s.remove_suffix(1);
	return s;
}

[[nodiscard]] std::string replace_all(std::string_view s, std::string_view from, std::string_view to)
{
	if (from.empty()) [[unlikely]]
		return std::string{s};

	std::string result;
	result.reserve(s.size());

	std::size_t pos = 0;
	for (std::size_t next = s.find(from); next != std::string_view::npos; next = s.find(from, pos))
	{
		result.append(s.substr(pos, next-pos)).append(to);
		pos = next + from.size();
	}
	result.append(s.substr(pos));

	return result;
}
