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

#include "Pipeline.hpp"
#include "Benchmark.hpp"
#include "Components.hpp"
#include "Directives.hpp"
#include "Substitution.hpp"

using namespace std::literals;

/// Maximum nesting of process() calls
static constexpr std::size_t MaxProcessDepth = 16;

[[nodiscard]] const std::vector<Pipeline::Pass>& Pipeline::directives()
{
	static const std::vector<Pass> passes{
		{"components"sv, Directives::components},
		{"view"sv, Directives::view},
		{"layout"sv, Directives::layout},
		{"slots"sv, Directives::slots},
		{"scoped-styles"sv, Directives::scoped_styles},
		{"for"sv, Directives::loops},
		{"bracket-for"sv, Directives::bracket_loops},
		{"if"sv, [](std::string_view s, Env&) { return Directives::conditionals(s); }},
		{"inline-islands"sv, Directives::inline_islands},
		{"external-islands"sv, Directives::external_islands},
		{"links"sv, Directives::links},
		{"images"sv, Directives::images},
		{"data"sv, Directives::data},
		{"client"sv, Directives::client},
		{"server-scripts"sv, Directives::server_scripts},
		{"forms"sv, Directives::forms},
		{"includes"sv, Directives::includes},
	};
	return passes;
}

[[nodiscard]] const std::vector<Pipeline::Pass>& Pipeline::stages()
{
	static const std::vector<Pass> all = []
	{
		std::vector<Pass> list = directives();
		list.push_back({"component-render"sv, Components::render});
		list.push_back({"substitution"sv, [](std::string_view s, Env& env) { return Substitution::apply(s, env.context); }});
		list.push_back({"normalize"sv, [](std::string_view s, Env&) { return Substitution::normalize(s); }});
		list.push_back({"sweep"sv, [](std::string_view s, Env&) { return Directives::sweep(s); }});
		return list;
	}();
	return all;
}

[[nodiscard]] std::string Pipeline::process(std::string_view s, Env& env)
{
	if (env.depth >= MaxProcessDepth) [[unlikely]]
		return std::string{s};
	++env.depth;

	const auto& passes = directives();
	std::string text{s};
	// Component declarations are only extracted from the top-level document
	for (auto it = passes.cbegin() + 1; it != passes.cend(); ++it)
		text = it->fn(text, env);

	return text;
}

[[nodiscard]] std::string Pipeline::run(std::string_view source, Env& env, const Observer& observer, Benchmark* bench)
{
	if (!env.process)
		env.process = process;

	std::string text{source};
	for (const auto& pass : stages())
	{
		if (bench)
			bench->push(std::string{pass.name});

		std::string next = pass.fn(text, env);

		if (bench)
			bench->pop();
		if (observer)
			observer(pass.name, text, next);

		text = std::move(next);
	}

	return text;
}
