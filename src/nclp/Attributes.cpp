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

#include "Attributes.hpp"
#include "Scanner.hpp"
#include "Util.hpp"

#include <algorithm>
#include <fmt/format.h>

using namespace std::literals;

[[nodiscard]] Attributes Attributes::parse(std::string_view s)
{
	static const std::regex attr = Scanner::make(
		R"re(([A-Za-z_:@][\w:.@-]*)(?:\s*=\s*(?:"([^"]*)"|'([^']*)'|([^\s"'=<>`/]+)))?)re");

	Attributes attrs;
	for (auto it = std::regex_iterator<std::string_view::const_iterator>(s.cbegin(), s.cend(), attr);
			it != std::regex_iterator<std::string_view::const_iterator>{}; ++it)
	{
		const Scanner::Match& m = *it;
		Attribute a{.name = std::string{Scanner::group(m, 1)}, .value = std::nullopt};
		for (std::size_t i = 2; i <= 4; ++i)
		{
			if (m[i].matched)
			{
				a.value = std::string{Scanner::group(m, i)};
				break;
			}
		}

		// Later duplicates override earlier ones
		auto prev = std::find_if(attrs.m_attrs.begin(), attrs.m_attrs.end(),
				[&a](const Attribute& other) { return other.name == a.name; });
		if (prev != attrs.m_attrs.end())
			prev->value = std::move(a.value);
		else
			attrs.m_attrs.push_back(std::move(a));
	}

	return attrs;
}

[[nodiscard]] bool Attributes::has(std::string_view name) const
{
	return std::any_of(m_attrs.cbegin(), m_attrs.cend(),
			[name](const Attribute& a) { return a.name == name; });
}

[[nodiscard]] std::optional<std::string> Attributes::get(std::string_view name) const
{
	for (const auto& a : m_attrs)
	{
		if (a.name != name)
			continue;
		return a.value.value_or(""s);
	}
	return std::nullopt;
}

[[nodiscard]] std::string Attributes::get_or(std::string_view name, std::string_view def) const
{
	const auto value = get(name);
	if (!value.has_value() || value->empty())
		return std::string{def};
	return *value;
}

[[nodiscard]] bool Attributes::flag(std::string_view name) const
{
	for (const auto& a : m_attrs)
	{
		if (a.name != name)
			continue;
		return !a.value.has_value() || *a.value == "true"sv;
	}
	return false;
}

[[nodiscard]] std::string Attributes::to_string(std::initializer_list<std::string_view> skip) const
{
	std::string s;
	for (const auto& a : m_attrs)
	{
		if (std::find(skip.begin(), skip.end(), std::string_view{a.name}) != skip.end())
			continue;

		if (a.value.has_value())
			s.append(fmt::format(" {}=\"{}\"", a.name, replace_all(*a.value, "\"", "&quot;")));
		else
			s.append(fmt::format(" {}", a.name));
	}
	return s;
}
