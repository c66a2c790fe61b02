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
#include "nclp/Directives.hpp"
#include "nclp/Pipeline.hpp"

using namespace std::literals;

namespace
{
	const nlohmann::json& sample()
	{
		static const nlohmann::json data = nlohmann::json::parse(R"({
			"users": [{ "name": "A" }, { "name": "B" }],
			"groups": [{ "items": ["x", "y"] }, { "items": ["z"] }],
			"none": []
		})");
		return data;
	}

	const Islands& files()
	{
		static const Islands islands{
			{"widgets/clock.ncl", "let t = signal(0);\n<p>{t}</p>"},
			{"plain.rs", "fn main() {}\n<p>static</p>"},
			{"partials/nav.ncl", "<n:component name=\"Tag\"><i>t</i></n:component><nav>{{ user.name }}</nav>"},
			{"self.ncl", "x<n:include src=\"self\" />"},
		};
		return islands;
	}

	Env makeEnv()
	{
		Env env{Context{sample()}, &files()};
		env.process = Pipeline::process;
		return env;
	}
}

TEST_CASE("Condition heuristic", "[Directives]")
{
	REQUIRE(!Directives::condition("count == 0"));
	REQUIRE(Directives::condition("count == 0.5"));
	REQUIRE(!Directives::condition("items is empty"));
	REQUIRE(!Directives::condition("items.is_empty()"));
	REQUIRE(Directives::condition("!items.is_empty()"));
	REQUIRE(Directives::condition("x > 1"));
}

TEST_CASE("Page structure", "[Directives]")
{
	Env env = makeEnv();

	SECTION("Component declarations")
	{
		REQUIRE(Directives::components("<n:component name=\"Box\"><p>x</p></n:component>rest", env) == "rest");
		REQUIRE(env.definitions.at("Box") == "<p>x</p>");
		REQUIRE(Directives::components("<n:component><p>x</p></n:component>", env) == "<n:component><p>x</p></n:component>");
	}

	SECTION("Views")
	{
		REQUIRE(Directives::view("<n:view title=\"Home\" layout=\"Main\"><p>a</p></n:view>", env) == "<!-- Layout: Main -->\n<p>a</p>");
		REQUIRE(Directives::view("<n:view title=\"Other\">b</n:view>", env) == "b");
		REQUIRE(env.title == "Home");
	}

	SECTION("Bare views")
	{
		REQUIRE(Directives::view("<view title=\"Hello\"><p>Hi</p></view>", env) == "<p>Hi</p>");
		REQUIRE(env.title == "Hello");
		REQUIRE(Directives::view("<viewport>x</viewport><view/>", env) == "<viewport>x</viewport><view/>");
	}

	SECTION("Layouts")
	{
		REQUIRE(Directives::layout("<n:layout name=\"Base\">x</n:layout>", env) == "<!-- Layout: Base -->x");
		REQUIRE(Directives::layout("<n:layout>x", env) == "<n:layout>x");
	}

	SECTION("Slots and props")
	{
		REQUIRE(Directives::slots("<n:slot /><n:slot name=\"head\"></n:slot><n:props>title: String</n:props>", env)
			== "<!-- slot content --><!-- slot: head -->");
	}

	SECTION("Scoped styles")
	{
		REQUIRE(Directives::scoped_styles("<style scoped>a{}</style><STYLE scoped media=\"x\"><style>", env)
			== "<style>a{}</style><style media=\"x\"><style>");
	}
}

TEST_CASE("Loops", "[Directives]")
{
	Env env = makeEnv();

	SECTION("Tag loops")
	{
		REQUIRE(Directives::loops("<n:for item=\"u\" in=\"users\"><li>{u.name}</li></n:for>", env)
			== "<li>A</li>\n<li>B</li>");
	}

	SECTION("Nested loops")
	{
		REQUIRE(Directives::loops("<n:for item=\"g\" in=\"groups\"><n:for item=\"i\" in=\"g.items\">{i}</n:for>;</n:for>", env)
			== "x\ny;\nz;");
	}

	SECTION("Empty collections")
	{
		REQUIRE(Directives::loops("<n:for item=\"u\" in=\"none\">x</n:for>", env) == "<!-- Loop: none (empty) -->");
		REQUIRE(Directives::loops("<n:for item=\"u\" in=\"nope\">x</n:for>", env) == "<!-- Loop: nope (empty) -->");
		REQUIRE(Directives::bracket_loops("{% for u in users.0 %}x{% endfor %}", env) == "<!-- Loop: users.0 (empty) -->");
	}

	SECTION("Malformed loops are left alone")
	{
		REQUIRE(Directives::loops("<n:for item=\"1x\" in=\"users\">x</n:for>", env) == "<n:for item=\"1x\" in=\"users\">x</n:for>");
		REQUIRE(Directives::loops("<n:for item=\"u\">x</n:for>", env) == "<n:for item=\"u\">x</n:for>");
	}

	SECTION("Bracket loops")
	{
		REQUIRE(Directives::bracket_loops("{% for u in users %}{{ u.name }},{% endfor %}", env) == "A,\nB,");
	}

	SECTION("Outer names survive")
	{
		REQUIRE(Directives::loops("<n:for item=\"u\" in=\"users\">{u.name}{{ user.name }}</n:for>", env)
			== "A{{ user.name }}\nB{{ user.name }}");
	}
}

TEST_CASE("Conditionals", "[Directives]")
{
	SECTION("Tag conditionals")
	{
		REQUIRE(Directives::conditionals("<n:if condition=\"count == 0\">x</n:if>y") == "y");
		REQUIRE(Directives::conditionals("<n:if condition=\"ok\">x<n:if condition=\"list.is_empty()\">z</n:if></n:if>") == "x");
		REQUIRE(Directives::conditionals("<n:if>x</n:if>") == "<n:if>x</n:if>");
	}

	SECTION("Quoted values may contain angle brackets")
	{
		REQUIRE(Directives::conditionals("<n:if condition=\"count > 0\"><p>yes</p></n:if>") == "<p>yes</p>");
		REQUIRE(Directives::conditionals("<n:if condition='a > 0 == 0'><p>no</p></n:if>z") == "z");
	}

	SECTION("Bracket conditionals")
	{
		REQUIRE(Directives::conditionals("{% if a %}1{% if b == 0 %}2{% else %}3{% endif %}{% else %}4{% endif %}") == "13");
		REQUIRE(Directives::conditionals("{% if items is empty %}none{% endif %}!") == "!");
	}

	SECTION("Resolver")
	{
		const auto resolver = [](std::string_view c) -> std::optional<bool>
		{
			if (c == "hidden")
				return false;
			return std::nullopt;
		};
		REQUIRE(Directives::conditionals("<n:if condition=\" hidden \">A</n:if><n:if condition=\"shown\">B</n:if>", resolver) == "B");
	}
}

TEST_CASE("Islands", "[Directives]")
{
	Env env = makeEnv();

	SECTION("Island files")
	{
		const std::string clock = Directives::external_islands("<n:island src=\"widgets/clock\" client:idle />", env);
		REQUIRE(clock.starts_with("<div data-island=\"widgets-clock\" data-hydrate=\"idle\"><p><span data-n-bind=\"t\"></span></p><script>"));
		REQUIRE(clock.ends_with("</script></div>"));
	}

	SECTION("Stateless files become counters")
	{
		const std::string plain = Directives::external_islands("<n:island src=\"plain\" />", env);
		REQUIRE(plain.starts_with("<div data-island=\"plain\" data-hydrate=\"load\"><div class=\"n-counter\">"));
	}

	SECTION("Missing files")
	{
		REQUIRE(Directives::external_islands("<n:island src=\"nope\" client:visible />", env)
			== "<div data-island=\"nope\" data-hydrate=\"visible\"><!-- Island: nope (hydrate: visible) --></div>");
		REQUIRE(Directives::inline_islands("<n:island src=\"nope\"></n:island>", env)
			== "<div data-island=\"nope\" data-hydrate=\"load\"><!-- Island: nope (hydrate: load) --></div>");
	}

	SECTION("Inline islands")
	{
		const std::string island = Directives::inline_islands(
			"<n:island client:visible>count = signal(1);<button onclick={ count.update(|n| *n += 1) }>+</button></n:island>", env);
		REQUIRE(island.starts_with(
			"<div data-island=\"inline\" data-hydrate=\"visible\">"
			"<button onclick=\"return false\" data-n-action=\"count:+=:1\">+</button><script>"));
		REQUIRE(island.find("IntersectionObserver") != std::string::npos);
	}

	SECTION("Host code before the first tag is dropped")
	{
		const std::string island = Directives::inline_islands(
			"<n:island>let count = signal(0);\nfn helper() { 1 }\n<p>{count}</p></n:island>", env);
		REQUIRE(island.starts_with("<div data-island=\"inline\" data-hydrate=\"load\"><p><span data-n-bind=\"count\">"));
		REQUIRE(island.find("helper") == std::string::npos);
	}
}

TEST_CASE("Markup directives", "[Directives]")
{
	Env env = makeEnv();

	SECTION("Links")
	{
		REQUIRE(Directives::links("<n:link href=\"/a\" class=\"x\">Go</n:link>", env)
			== "<a href=\"/a\" data-prefetch=\"true\" class=\"x\">Go</a>");
		REQUIRE(Directives::links("<n:link>Go</n:link>", env) == "<n:link>Go</n:link>");
	}

	SECTION("Images")
	{
		REQUIRE(Directives::images("<n:image src=\"a.png\" alt=\"A\" width=\"3\" />", env)
			== "<img src=\"a.png\" alt=\"A\" loading=\"lazy\" decoding=\"async\" width=\"3\" />");
		REQUIRE(Directives::images("<n:image src=\"b.png\" />", env)
			== "<img src=\"b.png\" alt=\"\" loading=\"lazy\" decoding=\"async\" />");
	}

	SECTION("Data bindings")
	{
		REQUIRE(Directives::data("<n:model name=\"x\">a</n:model><n:load src=\"y\">b</n:load><n:load src=\"z\" />c", env)
			== "<!-- data model binding -->ac");
	}

	SECTION("Scripts")
	{
		REQUIRE(Directives::client("<n:client defer>run()</n:client>", env) == "<script defer>run()</script>");
		REQUIRE(Directives::server_scripts("a<n:script>secret</n:script>b", env) == "ab");
	}

	SECTION("Forms")
	{
		const std::string form = Directives::forms(
			"<n:form action=\"/save\" class=\"wide\"><n:step id=\"one\" title=\"First\">"
			"<n:field label=\"Name\" name=\"name\" required /></n:step></n:form>", env);
		REQUIRE(form.starts_with("<form action=\"/save\" class=\"nucleus-form wide\" onsubmit=\"event.preventDefault(); "));
		REQUIRE(form.find("window.parent.postMessage({ type: 'form:submit', action: '/save', formData }, '*');\">") != std::string::npos);
		REQUIRE(form.ends_with(
			"<fieldset class=\"wizard-step\" data-step=\"one\"><legend>First</legend>"
			"<div class=\"form-field\"><label for=\"name\">Name</label>"
			"<input type=\"text\" id=\"name\" name=\"name\" required class=\"form-input\" /></div>"
			"</fieldset></form>"));

		REQUIRE(Directives::forms("<n:form action=\"it's\"></n:form>", env).find("action: 'it\\'s'") != std::string::npos);
		REQUIRE(Directives::forms("<n:field label=\"Bio\"><textarea></textarea></n:field>", env)
			== "<div class=\"form-field\"><label>Bio</label><textarea></textarea></div>");
	}

	SECTION("Includes")
	{
		REQUIRE(Directives::includes("<n:include src=\"partials/nav\" />", env) == "<nav>{{ user.name }}</nav>");
		REQUIRE(env.definitions.contains("Tag"));
		REQUIRE(Directives::includes("<n:include src=\"self\" />", env) == "x<n:include src=\"self\" />");
		REQUIRE(Directives::includes("<n:include src=\"nope\" />", env) == "<n:include src=\"nope\" />");

		Env bare{Context{sample()}, nullptr};
		REQUIRE(Directives::includes("<n:include src=\"self\" />", bare) == "<n:include src=\"self\" />");
	}

	SECTION("Leftover tags")
	{
		REQUIRE(Directives::sweep("<n:unknown a=\"1\">x</n:unknown><script>'<n:x>'</script>")
			== "&lt;n:unknown a=&quot;1&quot;&gt;x&lt;/n:unknown&gt;<script>'<n:x>'</script>");
		REQUIRE(Directives::sweep("a <n: b") == "a &lt;n: b");
	}
}
