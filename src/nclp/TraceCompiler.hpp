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

#ifndef NCLP_TRACECOMPILER_HPP
#define NCLP_TRACECOMPILER_HPP

#include "Compiler.hpp"

/**
 * @brief Outputs the text after every stage, then the document
 */
class TraceCompiler : public Compiler
{
public:
	TraceCompiler(CompilerOptions&& opts):
		Compiler(std::move(opts)) {}

	[[nodiscard]] virtual std::string get_name() const;
	[[nodiscard]] virtual std::string compile(std::string_view source, std::string_view style,
			const Islands& islands) const;
};

#endif // NCLP_TRACECOMPILER_HPP
