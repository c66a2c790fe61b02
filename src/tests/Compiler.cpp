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
#include "nclp/HTMLCompiler.hpp"
#include "nclp/TraceCompiler.hpp"
#include "nclp/Benchmark.hpp"
#include "nclp/Pipeline.hpp"

using namespace std::literals;

namespace
{
	/**
	 * @brief Compiles with default options and extracts the body
	 */
	std::string body(std::string_view source, const Islands& islands = {})
	{
		const HTMLCompiler c{CompilerOptions{}};
		const std::string doc = c.compile(source, "", islands);

		const auto begin = doc.find("<body>\n");
		const auto end = doc.rfind("\n</body>");
		REQUIRE(begin != std::string::npos);
		REQUIRE(end != std::string::npos);
		return doc.substr(begin + 7, end - begin - 7);
	}
}

TEST_CASE("Documents", "[Compiler]")
{
	SECTION("Page root")
	{
		const HTMLCompiler c{CompilerOptions{}};
		const std::string doc = c.compile("<n:view title=\"Hello\"><p>Hi</p></n:view>", "", {});
		REQUIRE(doc.starts_with("<!DOCTYPE html>\n<html>\n<head>\n"));
		REQUIRE(doc.find("<title>Hello</title>") != std::string::npos);
		REQUIRE(doc.find("<body>\n<p>Hi</p>\n</body>") != std::string::npos);
		REQUIRE(doc.find("n:view") == std::string::npos);
	}

	SECTION("Bare page root")
	{
		const HTMLCompiler c{CompilerOptions{}};
		const std::string doc = c.compile("<view title=\"Hello\"><p>Hi</p></view>", "", {});
		REQUIRE(doc.find("<title>Hello</title>") != std::string::npos);
		REQUIRE(doc.find("<body>\n<p>Hi</p>\n</body>") != std::string::npos);
	}

	SECTION("Island runtime")
	{
		const std::string out = body(
			"<n:island>count = signal(0);"
			"<button onclick={ count.update(|n| *n += 1) }>+</button><span>{count}</span></n:island>");
		REQUIRE(out.find("state.count = 0") != std::string::npos);
		REQUIRE(out.find("data-n-action=\"count:+=:1\"") != std::string::npos);
		REQUIRE(out.find("<span><span data-n-bind=\"count\"></span></span>") != std::string::npos);
	}

	SECTION("Button with a destination")
	{
		const std::string out = body("<Button href=\"/docs\" variant=\"secondary\">Docs</Button>");
		REQUIRE(out == "<a href=\"/docs\" class=\"btn btn-secondary btn-medium\">Docs</a>");
	}

	SECTION("Titles")
	{
		const HTMLCompiler c{CompilerOptions{}};
		REQUIRE(c.compile("<p>x</p>", "", {}).find("<title>NCL Preview</title>") != std::string::npos);

		const HTMLCompiler custom{CompilerOptions{.default_title = "A < B"}};
		REQUIRE(custom.compile("<p>x</p>", "", {}).find("<title>A &lt; B</title>") != std::string::npos);
	}

	SECTION("Stylesheets")
	{
		const HTMLCompiler c{CompilerOptions{}};
		const std::string doc = c.compile("x", ".mine{}", {});
		REQUIRE(doc.find(".btn {") != std::string::npos);
		REQUIRE(doc.find(".mine{}\n</style>") != std::string::npos);

		const HTMLCompiler bare{CompilerOptions{.base_styles = false}};
		const std::string plain = bare.compile("x", ".mine{}", {});
		REQUIRE(plain.find("<style>\n.mine{}\n</style>") != std::string::npos);
		REQUIRE(plain.find(".btn {") == std::string::npos);
	}

	SECTION("Pretty output")
	{
		const HTMLCompiler c{CompilerOptions{.pretty = true}};
		REQUIRE(c.compile("<div><p>a</p></div>", "", {}).find("<body>\n<div>\n  <p>a</p>\n</div>\n</body>") != std::string::npos);
	}
}

TEST_CASE("Mock data", "[Compiler]")
{
	REQUIRE(body("<ul><n:for item=\"u\" in=\"users\"><li>{u.name}</li></n:for></ul>")
		== "<ul><li>Alex</li>\n<li>Sam</li>\n<li>Jordan</li></ul>");
	REQUIRE(body("<n:for item=\"x\" in=\"nothing\">a</n:for>") == "<!-- Loop: nothing (empty) -->");
	REQUIRE(body("{{ user.name }} {stats.revenue} {{ todos.len() }}") == "Alice Johnson $89,234 3");
	REQUIRE(body("{{ missing.x }}") == "[missing.x]");
	REQUIRE(body("{% if count == 0 %}zero{% else %}more{% endif %}") == "more");
	REQUIRE(body("<n:for item=\"t\" in=\"todos\"><Badge>{t.title}</Badge></n:for>")
		== "<span class=\"badge badge-default\">Learn Nucleus basics</span>\n"
		"<span class=\"badge badge-default\">Build a todo app</span>\n"
		"<span class=\"badge badge-default\">Deploy to production</span>");

	const nlohmann::json data = nlohmann::json::parse(R"({ "greeting": "Hey" })");
	const HTMLCompiler c{CompilerOptions{.data = data}};
	REQUIRE(c.compile("{greeting} {user.name}", "", {}).find("<body>\nHey [user.name]\n</body>") != std::string::npos);

	// A missing property of a loop element shadows the root entry of the same name
	const nlohmann::json posts = nlohmann::json::parse(R"({
		"posts": [{ "title": "A" }, { "title": "B", "author": "Bob" }],
		"post": { "author": "ROOT" }
	})");
	const HTMLCompiler blog{CompilerOptions{.data = posts}};
	REQUIRE(blog.compile("<n:for item=\"post\" in=\"posts\"><li>{{ post.title }} by {{ post.author }}</li></n:for>", "", {})
		.find("<li>A by [post.author]</li>\n<li>B by Bob</li>") != std::string::npos);
}

TEST_CASE("Declarations and includes", "[Compiler]")
{
	REQUIRE(body("<n:component name=\"Hello\"><p>Hi {{ who }}</p></n:component><Hello who=\"Bo\" />") == "<p>Hi Bo</p>");

	const Islands islands{
		{"partials/nav.ncl", "<nav><NavItem href=\"/\" active>Home</NavItem></nav>"},
		{"counter.ncl", "let n = signal(5);\n<b>{n}</b>"},
	};
	REQUIRE(body("<n:include src=\"partials/nav\" />", islands) == "<nav><a href=\"/\" class=\"nav-item active\">Home</a></nav>");

	const std::string island = body("<n:island src=\"counter\" client:visible />", islands);
	REQUIRE(island.starts_with("<div data-island=\"counter\" data-hydrate=\"visible\"><b><span data-n-bind=\"n\"></span></b><script>"));
	REQUIRE(island.find("state.n = 5;") != std::string::npos);
}

TEST_CASE("Malformed input", "[Compiler]")
{
	SECTION("Leftover directives are escaped")
	{
		const std::string out = body("<n:for item=\"u\"><n:if>oops</n:unknown>");
		REQUIRE(out.find("<n:") == std::string::npos);
		REQUIRE(out.find("</n:") == std::string::npos);
		REQUIRE(out.find("oops") != std::string::npos);
	}

	SECTION("Random templates")
	{
		const auto source = GENERATE(take(50, randomTemplates(0, 40)));
		const HTMLCompiler c{CompilerOptions{}};

		std::string first;
		REQUIRE_NOTHROW(first = c.compile(source, "", {}));
		REQUIRE(c.compile(source, "", {}) == first);
	}
}

TEST_CASE("Pipeline", "[Compiler]")
{
	REQUIRE(Pipeline::directives().size() == 17);
	REQUIRE(Pipeline::stages().size() == 21);
	REQUIRE(Pipeline::directives().front().name == "components");
	REQUIRE(Pipeline::stages()[17].name == "component-render");
	REQUIRE(Pipeline::stages().back().name == "sweep");

	SECTION("Stage timings")
	{
		Benchmark bench;
		const HTMLCompiler c{CompilerOptions{.benchmark = &bench}};
		const std::string doc = c.compile("<p>x</p>", "", {});
		REQUIRE(bench.getResults().size() == Pipeline::stages().size());
		REQUIRE(bench.getResults().front().getName() == "components");
		REQUIRE(!bench.display().empty());
	}

	SECTION("Trace")
	{
		const TraceCompiler c{CompilerOptions{}};
		REQUIRE(c.get_name() == "Trace");
		const std::string out = c.compile("<n:view title=\"T\">x</n:view>", "", {});
		REQUIRE(out.starts_with("=== components ===\n(unchanged)\n=== view ===\nx\n=== layout ===\n(unchanged)\n"));
		REQUIRE(out.find("=== sweep ===\n(unchanged)\n=== document ===\n<!DOCTYPE html>") != std::string::npos);
		REQUIRE(out.find("<title>T</title>") != std::string::npos);
	}

	SECTION("Nested processing is bounded")
	{
		const nlohmann::json data = nlohmann::json::object();
		Env env{Context{data}, nullptr};
		env.depth = 16;
		REQUIRE(Pipeline::process("<n:link href=\"/\">x</n:link>", env) == "<n:link href=\"/\">x</n:link>");
	}
}

TEST_CASE("Benchmark", "[Benchmark]")
{
	Benchmark bench;
	bench.push("outer");
	bench.push("inner");
	bench.pop();
	bench.pop();
	bench.pop(); // Unbalanced

	REQUIRE(bench.getResults().size() == 1);
	const auto& outer = bench.getResults().front();
	REQUIRE(outer.getName() == "outer");
	REQUIRE(outer.getSub().size() == 1);
	REQUIRE(outer.getSub().front().getName() == "inner");
	REQUIRE(outer.getSubDuration() <= outer.getDuration());

	const std::string text = bench.display();
	REQUIRE(text.find(" * outer") != std::string::npos);
	REQUIRE(text.find("   - inner") != std::string::npos);
	REQUIRE(bench.display(0).find("inner") == std::string::npos);

	bench.clear();
	REQUIRE(bench.getResults().empty());
}
