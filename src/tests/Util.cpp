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
#include <utility>
#include <array>
#include <ranges>
#include <string_view>
#include <cstdint>
#include <iterator>
#include <utf8.h>

using namespace std::literals;

static constexpr std::array<std::pair<std::uint32_t, std::uint32_t>, 18> ranges = {
	std::make_pair<std::uint32_t, std::uint32_t>(0x20, 0x7E), // Printable ASCII
	std::make_pair<std::uint32_t, std::uint32_t>(0x20, 0x7E),
	std::make_pair<std::uint32_t, std::uint32_t>(0x9, 0xD), // Whitespace
	std::make_pair<std::uint32_t, std::uint32_t>(0x80, 0xFF), // Latin-1 Supplement
	std::make_pair<std::uint32_t, std::uint32_t>(0x370, 0x3FF), // Greek and Coptic
	std::make_pair<std::uint32_t, std::uint32_t>(0x400, 0x4FF), // Cyrillic
	std::make_pair<std::uint32_t, std::uint32_t>(0x590, 0x5FF), // Hebrew
	std::make_pair<std::uint32_t, std::uint32_t>(0x600, 0x6FF), // Arabic
	std::make_pair<std::uint32_t, std::uint32_t>(0x900, 0x97F), // Devanagari
	std::make_pair<std::uint32_t, std::uint32_t>(0x2000, 0x206F), // General Punctuation
	std::make_pair<std::uint32_t, std::uint32_t>(0x2190, 0x21FF), // Arrows
	std::make_pair<std::uint32_t, std::uint32_t>(0x3040, 0x309F), // Hiragana
	std::make_pair<std::uint32_t, std::uint32_t>(0x4E00, 0x9FCC), // CJK Unified Ideographs
	std::make_pair<std::uint32_t, std::uint32_t>(0xAC00, 0xD7A3), // Hangul Syllables
	std::make_pair<std::uint32_t, std::uint32_t>(0xFE00, 0xFE0F), // Variation Selectors
	std::make_pair<std::uint32_t, std::uint32_t>(0x1F300, 0x1F5FF), // Miscellaneous Symbols And Pictographs
	std::make_pair<std::uint32_t, std::uint32_t>(0x1F601, 0x1F64F), // Emoticons
	std::make_pair<std::uint32_t, std::uint32_t>(0x20000, 0x2A6D6), // CJK Unified Ideographs Extension B
};

static constexpr auto fragments = std::to_array<std::string_view>({
	"<n:view title=\""sv, "</n:view>"sv, "<n:for item=\"x\" in=\"users\">"sv, "</n:for>"sv,
	"<n:if condition=\""sv, "</n:if>"sv, "{% for p in posts %}"sv, "{% endfor %}"sv,
	"{% if x == 0 %}"sv, "{% else %}"sv, "{% endif %}"sv, "<n:island client:visible>"sv,
	"</n:island>"sv, "<n:island src=\"a\" />"sv, "count = signal(0);"sv, "onclick={ count.update(|n| *n += 1) }"sv,
	"<n:component name=\"C\">"sv, "</n:component>"sv, "<C>"sv, "</C>"sv, "<n:slot />"sv,
	"<Button variant=\"ghost\">"sv, "</Button>"sv, "<StatCard value=\"1\" trend=\"+2\" />"sv,
	"<n:include src=\"x\" />"sv, "<n:form action=\"/a\">"sv, "</n:form>"sv, "<n:field label=\"l\" />"sv,
	"{{ user.name }}"sv, "{count}"sv, "{{"sv, "}}"sv, "{"sv, "}"sv, "<"sv, ">"sv, "/>"sv, "\""sv,
	"<script>"sv, "</script>"sv, "<style scoped>"sv, "</style>"sv, "<n:"sv, "</n:"sv, "="sv,
});

std::string randomString(std::mt19937& mt, std::size_t len)
{
	auto getCodepoint = [&mt] -> std::uint32_t
	{
		// Get random range
		std::uniform_int_distribution<std::size_t> distrib(0uz, ranges.size()-1uz);
		auto&& [lo, hi] = ranges[distrib(mt)];

		// Get random codepoint
		std::uniform_int_distribution<std::uint32_t> codepoint(lo, hi);
		return codepoint(mt);
	};

	std::string r;
	for ([[maybe_unused]] const auto _ : std::ranges::iota_view{0uz, len})
		utf8::append(getCodepoint(), std::back_inserter(r));

	return r;
}

std::string randomTemplate(std::mt19937& mt, std::size_t len)
{
	std::uniform_int_distribution<std::size_t> choice(0uz, fragments.size());
	std::uniform_int_distribution<std::size_t> textLength(1uz, 6uz);

	std::string r;
	for ([[maybe_unused]] const auto _ : std::ranges::iota_view{0uz, len})
	{
		// One extra choice for plain text
		if (const auto i = choice(mt); i < fragments.size())
			r.append(fragments[i]);
		else
			r.append(randomString(mt, textLength(mt)));
	}

	return r;
}
