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

#ifndef NCLP_SCANNER_HPP
#define NCLP_SCANNER_HPP

#include <string>
#include <string_view>
#include <functional>
#include <optional>
#include <regex>

/**
 * @brief Text rewriting primitives shared by every pass
 *
 * Regexes are only used for bounded shapes (tag openers, attributes, tokens).
 * Bodies are delimited by `replace_blocks`, which counts nested openers
 * instead of relying on a lazy `[\s\S]*?` that would stop at the first closer.
 */
namespace Scanner
{
	using Match = std::match_results<std::string_view::const_iterator>;

	/**
	 * @brief A block delimited by an opener and its matching closer
	 */
	struct Block
	{
		const Match& open; ///< Opener match (capture groups of the opener regex)
		std::string_view body; ///< Content between opener and closer
		std::string_view whole; ///< Opener, body and closer
	};

	/**
	 * @brief Regex source of a tag's attribute list
	 *
	 * Quoted values may contain `>`. An unbalanced quote does not match.
	 */
	constexpr std::string_view attribute_list = R"re((?:[^>"']|"[^"]*"|'[^']*')*)re";

	using MatchCallback = std::function<std::string(const Match&)>;
	using BlockCallback = std::function<std::optional<std::string>(const Block&)>;

	/**
	 * @brief Compiles a regex
	 *
	 * @param re Regex source (ECMAScript)
	 * @param icase Whether the regex is case insensitive
	 * @returns Compiled regex
	 * @note Throws an Error if the regex is invalid
	 */
	[[nodiscard]] std::regex make(const std::string& re, bool icase = false);

	/**
	 * @brief Searches a regex starting at a position
	 *
	 * Characters before `pos` are visible to `\b` and `^`.
	 *
	 * @param input Input text
	 * @param pos Start position
	 * @param re Regex
	 * @param m Match result, positions are relative to pos
	 * @returns true if found
	 */
	[[nodiscard]] bool search(std::string_view input, std::size_t pos, const std::regex& re, Match& m);

	/**
	 * @brief Replaces every match of a regex by the callback's result
	 *
	 * @param input Input text
	 * @param re Regex to search for
	 * @param fn Called for every match, returns the replacement
	 * @returns Rewritten text
	 */
	[[nodiscard]] std::string replace(std::string_view input, const std::regex& re, const MatchCallback& fn);

	/**
	 * @brief Replaces every block by the callback's result
	 *
	 * Openers whose text ends with `/>` are self-closing and never own a body.
	 * An opener without a matching closer is left untouched.
	 * When the callback returns `std::nullopt`, the opener is left untouched and
	 * scanning resumes right after it (so the body is still scanned).
	 *
	 * @param input Input text
	 * @param opener Regex matching an opener
	 * @param closer Regex matching a closer
	 * @param fn Called for every outermost block
	 * @returns Rewritten text
	 */
	[[nodiscard]] std::string replace_blocks(std::string_view input,
			const std::regex& opener, const std::regex& closer,
			const BlockCallback& fn);

	/**
	 * @brief Finds the closer matching an opener
	 *
	 * @param input Input text
	 * @param from Position right after the opener
	 * @param opener Regex matching an opener
	 * @param closer Regex matching a closer
	 * @returns <begin, end> of the closer, begin is npos if not found
	 */
	[[nodiscard]] std::pair<std::size_t, std::size_t> find_closer(std::string_view input, std::size_t from,
			const std::regex& opener, const std::regex& closer);

	/**
	 * @brief Gets a capture group as a view on the input
	 *
	 * @param m Match
	 * @param i Group index
	 * @returns View on the group (empty if it did not participate)
	 */
	[[nodiscard]] std::string_view group(const Match& m, std::size_t i) noexcept;
} // Scanner

#endif // NCLP_SCANNER_HPP
