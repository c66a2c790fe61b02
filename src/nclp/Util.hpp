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

#ifndef NCLP_UTIL_HPP
#define NCLP_UTIL_HPP

#include <string>
#include <string_view>
#include <cstdint>
#include <source_location>
#include <array>
#include <algorithm>

namespace Colors
{
	extern bool enabled;

	extern const std::string_view reset;
	extern const std::string_view bold;
	extern const std::string_view red;
	extern const std::string_view green;
	extern const std::string_view yellow;
	extern const std::string_view blue;
	extern const std::string_view magenta;
	extern const std::string_view cyan;

	/**
	 * @brief Wraps text in a color if colors are enabled
	 *
	 * @param color Color escape sequence
	 * @param s Text to color
	 * @returns Colored text
	 */
	[[nodiscard]] std::string paint(std::string_view color, std::string_view s);
} // Colors

/**
 * @brief Error exception
 *
 * Thrown when there is an error outside of the compiling pipeline
 * (files, command line, mock data)
 */
class Error
{
	std::string m_msg; ///< Error message

public:
	/**
	 * @brief Constructor
	 *
	 * @param msg Error message
	 * @param loc Location
	 */
	Error(const std::string& msg, const std::source_location& loc = std::source_location::current());

	/**
	 * @brief what()
	 *
	 * @returns Error message
	 */
	virtual std::string what() const throw();
};

/**
 * @brief Constructs an array in place
 *
 * @param args Elements of the array
 * @tparam T Array's type
 * @returns An array of type T containing args
 */
template <class T, class... Args>
static constexpr auto make_array(Args&&... args) noexcept
{
	return std::array<T, sizeof...(Args)>{std::forward<Args>(args)...};
}

/**
 * @brief Replaces every matching character in string
 *
 * @param input Input string
 * @param replace Characters to replace/with
 */
template <std::size_t N>
static std::string replace_each(
		const std::string_view& input,
		const std::array<std::pair<char, std::string_view>, N>& replace)
{
	// Result string's size
	std::size_t new_size = input.size();
	for (const auto c : input)
	{
		[&]<std::size_t... i>(std::index_sequence<i...>)
		{
			((new_size += (c == replace[i].first) ? replace[i].second.size()-1 : 0), ...);
		}(std::make_index_sequence<N>{});
	}

	std::string result(new_size, '\0');
	std::size_t j = 0;
	for (const auto c : input)
	{
		auto fn = [&]<std::size_t i>() -> bool
		{
			if (c != replace[i].first)
				return false;

			for (const auto c : replace[i].second)
				result[j++] = c;

			return true;
		};

		[&]<std::size_t... i>(std::index_sequence<i...>)
		{
			if ( !((fn.template operator()<i>()) || ...) ) // Shortcut
				result[j++] = c;
		}(std::make_index_sequence<N>{});
	}

	return result;
}

/**
 * @brief Removes leading and trailing whitespaces
 *
 * @param s String to trim
 * @returns View on the trimmed part of s
 */
[[nodiscard]] std::string_view trim(std::string_view s) noexcept;

/**
 * @brief Replaces every occurence of a substring
 *
 * @param s Input string
 * @param from Substring to replace (must not be empty)
 * @param to Replacement
 * @returns s with every `from` replaced by `to`
 */
[[nodiscard]] std::string replace_all(std::string_view s, std::string_view from, std::string_view to);

/**
 * @brief Checks if a character can be part of an identifier
 */
[[nodiscard]] constexpr bool is_word(char c) noexcept
{
	return (c >= '0' && c <= '9')
		|| (c >= 'A' && c <= 'Z')
		|| (c >= 'a' && c <= 'z')
		||  c == '_';
}

#endif // NCLP_UTIL_HPP
