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

#ifndef NCLP_COMPILER_HPP
#define NCLP_COMPILER_HPP

#include "Env.hpp"
#include "Context.hpp"

#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

class Benchmark;

/**
 * @brief Options for a compiler
 */
struct CompilerOptions
{
	nlohmann::json data = Context::defaults(); ///< Mock data context
	std::string default_title = "NCL Preview"; ///< Title when the source has none
	bool base_styles = true; ///< Whether the base stylesheet is emitted
	bool pretty = false; ///< Whether the body is indented
	Benchmark* benchmark = nullptr; ///< Times every stage when not null
};

/**
 * @brief Abstract class for a NCL compiler
 */
class Compiler
{
protected:
	CompilerOptions m_opts;
public:
	/**
	 * @brief Constructor
	 * @param opts Options for the compiler
	 */
	Compiler(CompilerOptions&& opts):
		m_opts{std::move(opts)} {}

	/**
	 * @brief Destructor
	 */
	virtual ~Compiler() {}

	/**
	 * @brief Gets options for compiler
	 *
	 * @return Compiler options
	 */
	[[nodiscard]] const CompilerOptions& getOptions() const { return m_opts; }

	/**
	 * @param Gets compiler name
	 *
	 * @returns Compiler's name
	 */
	[[nodiscard]] virtual std::string get_name() const = 0;

	/**
	 * @brief Compiles a source document
	 *
	 * Never throws on malformed input.
	 *
	 * @param source NCL source
	 * @param style Stylesheet appended after the base styles
	 * @param islands Island and template lookup table
	 * @returns Compiler output
	 */
	[[nodiscard]] virtual std::string compile(std::string_view source, std::string_view style,
			const Islands& islands) const = 0;
};

#endif // NCLP_COMPILER_HPP
