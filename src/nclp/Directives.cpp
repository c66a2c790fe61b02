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

#include "Directives.hpp"
#include "Attributes.hpp"
#include "Scanner.hpp"
#include "Reactive.hpp"
#include "Substitution.hpp"
#include "Html.hpp"
#include "Util.hpp"

#include <algorithm>
#include <fmt/format.h>

using namespace std::literals;

/// Maximum length of an include chain
static constexpr std::size_t MaxIncludeDepth = 8;

/**
 * @brief Makes the regex of a directive's opening tag
 *
 * Group 1 holds the attributes (with the trailing `/` of self-closing tags).
 *
 * @param name Directive name (without `n:`)
 * @returns Compiled regex
 */
[[nodiscard]] static std::regex openTag(std::string_view name)
{
	return Scanner::make(fmt::format(R"(<n:{}\b({})>)", name, Scanner::attribute_list));
}

/**
 * @brief Makes the regex of a directive's closing tag
 *
 * @param name Directive name (without `n:`)
 * @returns Compiled regex
 */
[[nodiscard]] static std::regex closeTag(std::string_view name)
{
	return Scanner::make(fmt::format(R"(</n:{}\s*>)", name));
}

/**
 * @brief Makes the regex of a self-closing directive tag
 *
 * @param name Directive name (without `n:`)
 * @returns Compiled regex
 */
[[nodiscard]] static std::regex selfTag(std::string_view name)
{
	return Scanner::make(fmt::format(R"(<n:{}\b({})/>)", name, Scanner::attribute_list));
}

[[nodiscard]] static Attributes attributes(const Scanner::Match& m)
{
	return Attributes::parse(Scanner::group(m, 1));
}

[[nodiscard]] bool Directives::condition(std::string_view condition)
{
	static const std::regex zero = Scanner::make(R"(==\s*0(?![\d.]))");
	static const std::regex empty = Scanner::make(R"(\bis\s+empty\b)");
	static const std::regex isEmpty = Scanner::make(R"((!\s*)?[\w.]*is_empty\s*\(\s*\))");

	Scanner::Match m;
	if (Scanner::search(condition, 0, zero, m) || Scanner::search(condition, 0, empty, m))
		return false;

	for (auto it = std::regex_iterator<std::string_view::const_iterator>(condition.cbegin(), condition.cend(), isEmpty);
			it != std::regex_iterator<std::string_view::const_iterator>{}; ++it)
	{
		if (!(*it)[1].matched)
			return false;
	}

	return true;
}

[[nodiscard]] std::string Directives::components(std::string_view s, Env& env)
{
	static const std::regex open = openTag("component"sv);
	static const std::regex close = closeTag("component"sv);

	return Scanner::replace_blocks(s, open, close, [&](const Scanner::Block& b) -> std::optional<std::string>
	{
		const auto name = attributes(b.open).get("name");
		if (!name || name->empty())
			return std::nullopt;

		env.definitions[*name] = std::string{b.body};
		return ""s;
	});
}

[[nodiscard]] std::string Directives::view(std::string_view s, Env& env)
{
	static const std::regex open = openTag("view"sv);
	static const std::regex close = closeTag("view"sv);
	// Bare spelling of the page root
	static const std::regex bareOpen = Scanner::make(fmt::format(R"(<view(?=[\s/>])({})>)", Scanner::attribute_list));
	static const std::regex bareClose = Scanner::make(R"(</view\s*>)");

	const Scanner::BlockCallback root = [&](const Scanner::Block& b) -> std::optional<std::string>
	{
		const auto attrs = attributes(b.open);
		if (auto title = attrs.get("title"); title.has_value() && !env.title.has_value())
			env.title = std::move(*title);

		if (const auto layout = attrs.get("layout"); layout.has_value() && !layout->empty())
			return fmt::format("<!-- Layout: {} -->\n{}", *layout, b.body);
		return std::string{b.body};
	};

	return Scanner::replace_blocks(Scanner::replace_blocks(s, open, close, root), bareOpen, bareClose, root);
}

[[nodiscard]] std::string Directives::layout(std::string_view s, Env&)
{
	static const std::regex open = openTag("layout"sv);
	static const std::regex close = closeTag("layout"sv);

	const std::string result = Scanner::replace(s, open, [](const Scanner::Match& m)
	{
		const auto name = attributes(m).get("name");
		if (!name.has_value())
			return m.str(0);
		return fmt::format("<!-- Layout: {} -->", *name);
	});

	return Scanner::replace(result, close, [](const Scanner::Match&) { return ""s; });
}

[[nodiscard]] std::string Directives::slots(std::string_view s, Env&)
{
	static const std::regex slot = openTag("slot"sv);
	static const std::regex slotClose = closeTag("slot"sv);
	static const std::regex propsOpen = openTag("props"sv);
	static const std::regex propsClose = closeTag("props"sv);

	std::string result = Scanner::replace(s, slot, [](const Scanner::Match& m)
	{
		if (const auto name = attributes(m).get("name"); name.has_value() && !name->empty())
			return fmt::format("<!-- slot: {} -->", *name);
		return "<!-- slot content -->"s;
	});
	result = Scanner::replace(result, slotClose, [](const Scanner::Match&) { return ""s; });

	return Scanner::replace_blocks(result, propsOpen, propsClose, [](const Scanner::Block&) -> std::optional<std::string>
	{
		return ""s;
	});
}

[[nodiscard]] std::string Directives::scoped_styles(std::string_view s, Env&)
{
	static const std::regex style = Scanner::make(fmt::format(R"(<style\b({})>)", Scanner::attribute_list), true);

	return Scanner::replace(s, style, [](const Scanner::Match& m)
	{
		const auto attrs = attributes(m);
		if (!attrs.has("scoped"))
			return m.str(0);
		return fmt::format("<style{}>", attrs.to_string({"scoped"sv}));
	});
}

/**
 * @brief Expands a loop body once per element of a collection
 *
 * @param env Environment
 * @param item Name bound to each element
 * @param path Collection's path
 * @param body Loop body
 * @returns Expanded bodies joined by newlines, or the empty-loop marker
 */
[[nodiscard]] static std::string iterate(Env& env, const std::string& item, std::string_view path, std::string_view body)
{
	const auto collection = env.context.find(path);
	if (!collection.has_value() || !collection->is_array() || collection->empty())
		return fmt::format("<!-- Loop: {} (empty) -->", path);

	std::string result;
	std::size_t index = 0;
	for (const auto& element : *collection)
	{
		Env child{env};
		child.context = env.context.with(item, element);

		const std::string expanded = env.process ? env.process(body, child) : std::string{body};
		if (index++ != 0)
			result.push_back('\n');
		result.append(Substitution::apply(expanded, child.context, true));
	}

	return result;
}

[[nodiscard]] std::string Directives::loops(std::string_view s, Env& env)
{
	static const std::regex open = openTag("for"sv);
	static const std::regex close = closeTag("for"sv);
	static const std::regex identifier = Scanner::make(R"([A-Za-z_]\w*)");

	return Scanner::replace_blocks(s, open, close, [&](const Scanner::Block& b) -> std::optional<std::string>
	{
		const auto attrs = attributes(b.open);
		const auto item = attrs.get("item");
		const auto in = attrs.get("in");
		if (!item || !in || !std::regex_match(*item, identifier) || trim(*in).empty())
			return std::nullopt;

		return iterate(env, *item, trim(*in), b.body);
	});
}

[[nodiscard]] std::string Directives::bracket_loops(std::string_view s, Env& env)
{
	static const std::regex open = Scanner::make(R"(\{%\s*for\s+([A-Za-z_]\w*)\s+in\s+([A-Za-z_][\w.]*(?:\(\))?)\s*%\})");
	static const std::regex close = Scanner::make(R"(\{%\s*endfor\s*%\})");

	return Scanner::replace_blocks(s, open, close, [&](const Scanner::Block& b) -> std::optional<std::string>
	{
		return iterate(env, std::string{Scanner::group(b.open, 1)}, Scanner::group(b.open, 2), b.body);
	});
}

/**
 * @brief Splits the body of a bracket conditional on its top-level else
 *
 * @param body Body
 * @returns <then branch, else branch>
 */
[[nodiscard]] static std::pair<std::string_view, std::string_view> splitElse(std::string_view body)
{
	static const std::regex token = Scanner::make(R"(\{%\s*(if|endif|else)\b[^%]*%\})");

	std::size_t depth = 0;
	std::size_t pos = 0;
	Scanner::Match m;
	while (Scanner::search(body, pos, token, m))
	{
		const std::size_t begin = pos + m.position(0);
		const std::size_t end = begin + m.length(0);
		const std::string_view keyword = Scanner::group(m, 1);

		if (keyword == "if"sv)
			++depth;
		else if (keyword == "endif"sv)
		{
			if (depth != 0)
				--depth;
		}
		else if (depth == 0)
			return {body.substr(0, begin), body.substr(end)};

		pos = end;
	}

	return {body, ""sv};
}

[[nodiscard]] std::string Directives::conditionals(std::string_view s, const ConditionResolver& resolver)
{
	static const std::regex open = openTag("if"sv);
	static const std::regex close = closeTag("if"sv);
	static const std::regex bracketOpen = Scanner::make(R"(\{%\s*if\s+([^%]+?)\s*%\})");
	static const std::regex bracketClose = Scanner::make(R"(\{%\s*endif\s*%\})");

	const auto decide = [&resolver](std::string_view c)
	{
		if (resolver)
		{
			if (const auto resolved = resolver(trim(c)); resolved.has_value())
				return *resolved;
		}
		return condition(c);
	};

	const std::string result = Scanner::replace_blocks(s, open, close, [&](const Scanner::Block& b) -> std::optional<std::string>
	{
		const auto cond = attributes(b.open).get("condition");
		if (!cond.has_value())
			return std::nullopt;

		if (!decide(*cond))
			return ""s;
		return conditionals(b.body, resolver);
	});

	return Scanner::replace_blocks(result, bracketOpen, bracketClose, [&](const Scanner::Block& b) -> std::optional<std::string>
	{
		const auto [then, otherwise] = splitElse(b.body);
		return conditionals(decide(Scanner::group(b.open, 1)) ? then : otherwise, resolver);
	});
}

/**
 * @brief Renders an island referencing an entry of the lookup table
 *
 * @param attrs Island attributes
 * @param env Environment
 * @returns Island markup, std::nullopt without a src attribute
 */
[[nodiscard]] static std::optional<std::string> externalIsland(const Attributes& attrs, const Env& env)
{
	const auto src = attrs.get("src");
	if (!src.has_value() || src->empty())
		return std::nullopt;

	const Reactive::Hydration h = Reactive::get_hydration(attrs);
	if (const auto found = env.lookup(*src, {".ncl"sv, ".rs"sv}); found.has_value())
	{
		Reactive::Island island = Reactive::transpile(found->second, found->first.ends_with(".rs"sv));
		if (island.signals.empty())
			island = Reactive::counter();
		return island.render(replace_all(*src, "/"sv, "-"sv), h);
	}

	return fmt::format("<div data-island=\"{0}\" data-hydrate=\"{1}\"><!-- Island: {0} (hydrate: {1}) --></div>",
			Html::escape(*src), Reactive::get_hydration_name(h));
}

[[nodiscard]] std::string Directives::inline_islands(std::string_view s, Env& env)
{
	static const std::regex open = openTag("island"sv);
	static const std::regex close = closeTag("island"sv);

	return Scanner::replace_blocks(s, open, close, [&](const Scanner::Block& b) -> std::optional<std::string>
	{
		const auto attrs = attributes(b.open);
		if (attrs.has("src"))
			return externalIsland(attrs, env);

		return Reactive::transpile(b.body, true).render("inline"sv, Reactive::get_hydration(attrs));
	});
}

[[nodiscard]] std::string Directives::external_islands(std::string_view s, Env& env)
{
	static const std::regex island = selfTag("island"sv);

	return Scanner::replace(s, island, [&](const Scanner::Match& m)
	{
		return externalIsland(attributes(m), env).value_or(m.str(0));
	});
}

[[nodiscard]] std::string Directives::links(std::string_view s, Env& env)
{
	static const std::regex open = openTag("link"sv);
	static const std::regex close = closeTag("link"sv);

	return Scanner::replace_blocks(s, open, close, [&](const Scanner::Block& b) -> std::optional<std::string>
	{
		const auto attrs = attributes(b.open);
		const auto href = attrs.get("href");
		if (!href.has_value())
			return std::nullopt;

		return fmt::format("<a href=\"{}\" data-prefetch=\"true\"{}>{}</a>",
				*href, attrs.to_string({"href"sv, "data-prefetch"sv}), links(b.body, env));
	});
}

[[nodiscard]] std::string Directives::images(std::string_view s, Env&)
{
	static const std::regex image = openTag("image"sv);

	return Scanner::replace(s, image, [](const Scanner::Match& m)
	{
		const auto attrs = attributes(m);
		const auto src = attrs.get("src");
		if (!src.has_value())
			return m.str(0);

		return fmt::format("<img src=\"{}\" alt=\"{}\" loading=\"lazy\" decoding=\"async\"{} />",
				*src, attrs.get_or("alt", ""), attrs.to_string({"src"sv, "alt"sv, "loading"sv, "decoding"sv}));
	});
}

[[nodiscard]] std::string Directives::data(std::string_view s, Env&)
{
	static const std::regex model = openTag("model"sv);
	static const std::regex modelClose = closeTag("model"sv);
	static const std::regex loadOpen = openTag("load"sv);
	static const std::regex loadClose = closeTag("load"sv);
	static const std::regex loadSelf = selfTag("load"sv);

	std::string result = Scanner::replace(s, model, [](const Scanner::Match&) { return "<!-- data model binding -->"s; });
	result = Scanner::replace(result, modelClose, [](const Scanner::Match&) { return ""s; });
	result = Scanner::replace_blocks(result, loadOpen, loadClose, [](const Scanner::Block&) -> std::optional<std::string>
	{
		return ""s;
	});
	return Scanner::replace(result, loadSelf, [](const Scanner::Match&) { return ""s; });
}

[[nodiscard]] std::string Directives::client(std::string_view s, Env&)
{
	static const std::regex open = openTag("client"sv);
	static const std::regex close = closeTag("client"sv);

	return Scanner::replace_blocks(s, open, close, [](const Scanner::Block& b) -> std::optional<std::string>
	{
		return fmt::format("<script{}>{}</script>", attributes(b.open).to_string(), b.body);
	});
}

[[nodiscard]] std::string Directives::server_scripts(std::string_view s, Env&)
{
	static const std::regex open = openTag("script"sv);
	static const std::regex close = closeTag("script"sv);

	return Scanner::replace_blocks(s, open, close, [](const Scanner::Block&) -> std::optional<std::string>
	{
		return ""s;
	});
}

/**
 * @brief Escapes a value for a single-quoted script string inside an attribute
 *
 * @param s Value
 * @returns Escaped value
 */
[[nodiscard]] static std::string scriptString(std::string_view s)
{
	return Html::escape(replace_all(replace_all(s, "\\"sv, "\\\\"sv), "'"sv, "\\'"sv));
}

[[nodiscard]] static std::string steps(std::string_view s)
{
	static const std::regex open = openTag("step"sv);
	static const std::regex close = closeTag("step"sv);

	return Scanner::replace_blocks(s, open, close, [](const Scanner::Block& b) -> std::optional<std::string>
	{
		const auto attrs = attributes(b.open);
		const auto id = attrs.get("id");
		if (!id.has_value())
			return std::nullopt;

		std::string legend;
		if (const auto title = attrs.get("title"); title.has_value())
			legend = fmt::format("<legend>{}</legend>", *title);
		return fmt::format("<fieldset class=\"wizard-step\" data-step=\"{}\">{}{}</fieldset>", *id, legend, steps(b.body));
	});
}

[[nodiscard]] static std::string fields(std::string_view s)
{
	static const std::regex open = openTag("field"sv);
	static const std::regex close = closeTag("field"sv);
	static const std::regex single = selfTag("field"sv);

	const auto label = [](const Attributes& attrs, std::string_view text)
	{
		if (const auto name = attrs.get("name"); name.has_value() && !name->empty())
			return fmt::format("<label for=\"{}\">{}</label>", *name, text);
		return fmt::format("<label>{}</label>", text);
	};

	const std::string result = Scanner::replace_blocks(s, open, close, [&](const Scanner::Block& b) -> std::optional<std::string>
	{
		const auto attrs = attributes(b.open);
		const auto text = attrs.get("label");
		if (!text.has_value())
			return std::nullopt;

		return fmt::format("<div class=\"form-field\">{}{}</div>", label(attrs, *text), fields(b.body));
	});

	return Scanner::replace(result, single, [&](const Scanner::Match& m)
	{
		const auto attrs = attributes(m);
		const auto text = attrs.get("label");
		if (!text.has_value())
			return m.str(0);

		std::string input = fmt::format("<input type=\"{}\"", attrs.get_or("type", "text"));
		if (const auto name = attrs.get("name"); name.has_value() && !name->empty())
			input.append(fmt::format(" id=\"{0}\" name=\"{0}\"", *name));
		if (attrs.flag("required"))
			input.append(" required");
		input.append(" class=\"form-input\" />");

		return fmt::format("<div class=\"form-field\">{}{}</div>", label(attrs, *text), input);
	});
}

[[nodiscard]] std::string Directives::forms(std::string_view s, Env&)
{
	static const std::regex open = openTag("form"sv);
	static const std::regex close = closeTag("form"sv);

	const std::string result = Scanner::replace_blocks(s, open, close, [](const Scanner::Block& b) -> std::optional<std::string>
	{
		const auto attrs = attributes(b.open);
		const auto extra = attrs.get("class");
		const std::string classes = (extra.has_value() && !extra->empty())
			? fmt::format("nucleus-form {}", *extra)
			: "nucleus-form"s;

		const std::string handler = fmt::format(
			"event.preventDefault(); "
			"const formData = Object.fromEntries(new FormData(event.target)); "
			"window.parent.postMessage({{ type: 'form:submit', action: '{}', formData }}, '*');",
			scriptString(attrs.get_or("action", "")));

		return fmt::format("<form{} class=\"{}\" onsubmit=\"{}\">{}</form>",
				attrs.to_string({"class"sv, "onsubmit"sv}), classes, handler, b.body);
	});

	return fields(steps(result));
}

[[nodiscard]] std::string Directives::includes(std::string_view s, Env& env)
{
	static const std::regex include = openTag("include"sv);

	return Scanner::replace(s, include, [&](const Scanner::Match& m)
	{
		const auto src = attributes(m).get("src");
		if (!src.has_value() || src->empty() || env.includes.size() >= MaxIncludeDepth)
			return m.str(0);

		const auto found = env.lookup(*src, {".ncl"sv});
		if (!found.has_value()
			|| std::find(env.includes.cbegin(), env.includes.cend(), found->first) != env.includes.cend())
			return m.str(0);

		// Declarations of the included template are visible to the whole document
		const std::string content = components(found->second, env);

		Env child{env};
		child.includes.push_back(found->first);
		return env.process ? env.process(content, child) : content;
	});
}

[[nodiscard]] std::string Directives::sweep(std::string_view s)
{
	static const std::regex tag = Scanner::make(fmt::format(R"(</?n:[\w-]*(?:{}>)?)", Scanner::attribute_list));

	return Html::outside_raw(s, [](std::string_view part)
	{
		return Scanner::replace(part, tag, [](const Scanner::Match& m)
		{
			return Html::escape(m.str(0));
		});
	});
}
