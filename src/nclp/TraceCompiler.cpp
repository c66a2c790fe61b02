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

#include "TraceCompiler.hpp"
#include "HTMLCompiler.hpp"
#include "Pipeline.hpp"

#include <fmt/format.h>

[[nodiscard]] std::string TraceCompiler::get_name() const
{
	return "Trace";
}

[[nodiscard]] std::string TraceCompiler::compile(std::string_view source, std::string_view style,
		const Islands& islands) const
{
	std::string out;
	const auto observer = [&out](std::string_view name, std::string_view before, std::string_view after)
	{
		out.append(fmt::format("=== {} ===\n", name));
		if (before == after)
			out.append("(unchanged)\n");
		else
			out.append(after).append("\n");
	};

	Env env{Context{m_opts.data}, &islands};
	const std::string body = Pipeline::run(source, env, observer, m_opts.benchmark);

	out.append("=== document ===\n");
	out.append(HTMLCompiler::document(m_opts, env.title, body, style));
	return out;
}
