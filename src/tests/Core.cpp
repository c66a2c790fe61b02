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
#include "nclp/Context.hpp"
#include "nclp/Html.hpp"
#include "nclp/Expression.hpp"
#include "nclp/Util.hpp"

using namespace std::literals;

TEST_CASE("Context lookups", "[Context]")
{
	const nlohmann::json root = nlohmann::json::parse(R"({
		"users": [{ "name": "A", "tags": ["x", "y"] }, { "name": "B" }],
		"count": 3,
		"ratio": 1.5,
		"flag": true,
		"nothing": null,
		"obj": { "k": "v" }
	})");
	const Context ctx{root};

	SECTION("Scalars")
	{
		REQUIRE(ctx.resolve("count") == "3");
		REQUIRE(ctx.resolve("ratio") == "1.5");
		REQUIRE(ctx.resolve("flag") == "true");
		REQUIRE(ctx.resolve("obj.k") == "v");
	}

	SECTION("Arrays")
	{
		REQUIRE(ctx.resolve("users.0.name") == "A");
		REQUIRE(ctx.resolve("users.0.tags.1") == "y");
		REQUIRE(ctx.resolve("users.len") == "2");
		REQUIRE(ctx.resolve("users.len()") == "2");
		REQUIRE(ctx.resolve("users.length") == "2");
		REQUIRE(!ctx.resolve("users.5.name").has_value());
	}

	SECTION("Values without a text form")
	{
		REQUIRE(!ctx.resolve("obj").has_value());
		REQUIRE(!ctx.resolve("users").has_value());
		REQUIRE(!ctx.resolve("nothing").has_value());
		REQUIRE(!ctx.resolve("missing.x").has_value());
		REQUIRE(!ctx.resolve("count.x").has_value());
		REQUIRE(!ctx.resolve("").has_value());
		REQUIRE(ctx.find("users").has_value());
	}

	SECTION("Scopes")
	{
		const Context child = ctx.with("user", root["users"][1]);
		REQUIRE(child.resolve("user.name") == "B");
		REQUIRE(child.scoped("user"));
		REQUIRE(!child.scoped("users"));
		REQUIRE(!ctx.resolve("user.name").has_value());

		const Context shadow = child.with("count", "x");
		REQUIRE(shadow.resolve("count") == "x");
		REQUIRE(shadow.resolve("user.name") == "B");
	}

	SECTION("Built-in data")
	{
		const Context defaults{Context::defaults()};
		REQUIRE(defaults.resolve("user.name") == "Alice Johnson");
		REQUIRE(defaults.resolve("post.author") == "John Doe");
		REQUIRE(defaults.resolve("stats.revenue") == "$89,234");
		REQUIRE(defaults.resolve("todos.len()") == "3");
		REQUIRE(defaults.resolve("users.0.name") == "Alex");
		REQUIRE(defaults.resolve("count") == "0");
	}
}

TEST_CASE("Html", "[Html]")
{
	SECTION("Escape")
	{
		REQUIRE(Html::escape(R"(<a href="x">&</a>)") == "&lt;a href=&quot;x&quot;&gt;&amp;&lt;/a&gt;");
		REQUIRE(Html::escape("plain") == "plain");
	}

	SECTION("Indent")
	{
		REQUIRE(Html::indent(R"(<div><p>Hi</p><br><img src="a" /></div>)")
			== "<div>\n  <p>Hi</p>\n  <br>\n  <img src=\"a\" />\n</div>");
		REQUIRE(Html::indent("<ul><li><b>x</b></li></ul>") == "<ul>\n  <li>\n    <b>x</b>\n  </li>\n</ul>");
		REQUIRE(Html::indent("<!DOCTYPE html><p>x</p>") == "<!DOCTYPE html>\n<p>x</p>");
	}

	SECTION("Whitespace sensitive content is kept")
	{
		REQUIRE(Html::indent("<div><pre>a\n  b</pre><script>if(a){}</script></div>")
			== "<div>\n  <pre>a\n  b</pre>\n  <script>if(a){}</script>\n</div>");
		REQUIRE(Html::indent("<p>x</p><textarea rows=\"2\">  <b></b>\n</TEXTAREA><p>y</p>")
			== "<p>x</p>\n<textarea rows=\"2\">  <b></b>\n</TEXTAREA>\n<p>y</p>");
		REQUIRE(Html::indent("<style>a>b{}\n</style>") == "<style>a>b{}\n</style>");
		REQUIRE(Html::indent("<div><pre>  open") == "<div>\n  <pre>  open");
	}

	SECTION("Raw elements")
	{
		const auto upper = [](std::string_view s) { return replace_all(s, "a"sv, "b"sv); };
		REQUIRE(Html::outside_raw("a<script>a</script>a<STYLE>a</STYLE>a", upper)
			== "b<script>a</script>b<STYLE>a</STYLE>b");
		REQUIRE(Html::outside_raw("a<script>a", upper) == "b<script>a");
		REQUIRE(Html::outside_raw("a<script data-x=\"a>b\">a</script>a", upper)
			== "b<script data-x=\"a>b\">a</script>b");
		REQUIRE(Html::outside_raw("", upper) == "");
	}
}

TEST_CASE("Expression retargeting", "[Expression]")
{
	const auto retarget = [](std::string_view e) { return Expression::retarget(e, "n", "state.count"); };

	SECTION("Arithmetic")
	{
		REQUIRE(retarget("*n * 2") == "state.count * 2");
		REQUIRE(retarget("n + 1") == "state.count + 1");
		REQUIRE(retarget("(n + 1) * 2i32") == "(state.count + 1) * 2");
		REQUIRE(retarget("-n % 3") == "-state.count % 3");
		REQUIRE(retarget("1.5 * n - 4 / 2") == "1.5 * state.count - 4 / 2");
	}

	SECTION("Repeated negation")
	{
		REQUIRE(retarget("--n") == "-(-state.count)");
		REQUIRE(retarget("n * - -2") == "state.count * -(-2)");
		REQUIRE(retarget("---n") == "-(-(-state.count))");
		REQUIRE(retarget("n - -2") == "state.count - -2");
	}

	SECTION("Exponents")
	{
		REQUIRE(retarget("n * 1e3") == "state.count * 1e3");
		REQUIRE(retarget("n * 2.5E-2") == "state.count * 2.5E-2");
		REQUIRE(retarget("n * 1e+2f64") == "state.count * 1e+2");
		REQUIRE(retarget("n * 2e") == "state.count * 2");
	}

	SECTION("Outside the grammar")
	{
		REQUIRE(!retarget("n.len()").has_value());
		REQUIRE(!retarget("other + 1").has_value());
		REQUIRE(!retarget("(n + 1").has_value());
		REQUIRE(!retarget("n n").has_value());
		REQUIRE(!retarget("*2").has_value());
		REQUIRE(!retarget("").has_value());
	}
}

TEST_CASE("Util", "[Util]")
{
	REQUIRE(trim("  a b \n") == "a b");
	REQUIRE(trim(" \t ").empty());
	REQUIRE(replace_all("a-b-c", "-", "--") == "a--b--c");
	REQUIRE(replace_all("abc", "", "x") == "abc");

	Colors::enabled = false;
	REQUIRE(Colors::paint(Colors::red, "x") == "x");
	Colors::enabled = true;
	REQUIRE(Colors::paint(Colors::red, "x") == "\033[31mx\033[0m");

	const Error e("boom");
	REQUIRE(e.what().ends_with("boom"));
}
