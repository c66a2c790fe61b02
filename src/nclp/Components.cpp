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

#include "Components.hpp"
#include "Attributes.hpp"
#include "Directives.hpp"
#include "Scanner.hpp"
#include "Util.hpp"

#include <vector>
#include <fmt/format.h>

using namespace std::literals;

/// Maximum number of declared component expansion rounds
static constexpr std::size_t MaxExpansionDepth = 8;

/**
 * @brief Formats an optional attribute
 *
 * @param name Attribute's name
 * @param value Attribute's value
 * @returns ` name="value"`, or nothing when value is absent or empty
 */
[[nodiscard]] static std::string optional_attribute(std::string_view name, const std::optional<std::string>& value)
{
	if (!value.has_value() || value->empty())
		return "";
	return fmt::format(" {}=\"{}\"", name, *value);
}

/**
 * @brief Joins the base classes of a component with its `class` attribute
 */
[[nodiscard]] static std::string classes(std::string base, const Attributes& attrs)
{
	if (const auto extra = attrs.get("class"); extra.has_value() && !extra->empty())
		base.append(" ").append(*extra);
	return base;
}

[[nodiscard]] static std::string renderButton(const Attributes& attrs, std::string_view content)
{
	const std::string cls = classes(fmt::format("btn btn-{} btn-{}",
		attrs.get_or("variant", "primary"), attrs.get_or("size", "medium")), attrs);
	const std::string id = optional_attribute("id", attrs.get("id"));
	const std::string onclick = optional_attribute("onclick", attrs.get("onclick"));

	if (const auto href = attrs.get("href"); href.has_value() && !href->empty())
		return fmt::format("<a href=\"{}\"{} class=\"{}\"{}>{}</a>", *href, id, cls, onclick, content);

	return fmt::format("<button type=\"{}\"{} class=\"{}\"{}{}>{}</button>",
		attrs.get_or("type", "button"), id, cls, onclick, attrs.flag("disabled") ? " disabled" : "", content);
}

/**
 * @brief Renders the label of a form control
 *
 * A required control gets a ` *` suffix.
 */
[[nodiscard]] static std::string label(const Attributes& attrs, std::string_view name)
{
	return fmt::format("<label for=\"{}\">{}{}</label>",
		name, attrs.get_or("label", name), attrs.flag("required") ? " *" : "");
}

[[nodiscard]] static std::string renderTextInput(const Attributes& attrs, std::string_view)
{
	const std::string name = attrs.get_or("name", "");
	const auto error = attrs.get("error");
	const bool failed = error.has_value() && !error->empty();

	std::string result = fmt::format("<div class=\"form-field{}\">{}", failed ? " has-error" : "", label(attrs, name));
	result.append(fmt::format("<input type=\"{0}\" id=\"{1}\" name=\"{1}\"", attrs.get_or("type", "text"), name));
	result.append(optional_attribute("placeholder", attrs.get("placeholder")));
	result.append(optional_attribute("value", attrs.get("value")));
	if (attrs.flag("required"))
		result.append(" required");
	if (attrs.flag("disabled"))
		result.append(" disabled");
	result.append(" class=\"form-input\" />");

	if (const auto help = attrs.get("help"); help.has_value() && !help->empty())
		result.append(fmt::format("<p class=\"form-help\">{}</p>", *help));
	if (failed)
		result.append(fmt::format("<p class=\"form-error\">{}</p>", *error));

	return result.append("</div>");
}

[[nodiscard]] static std::string renderSelect(const Attributes& attrs, std::string_view content)
{
	const std::string name = attrs.get_or("name", "");
	const auto error = attrs.get("error");
	const bool failed = error.has_value() && !error->empty();

	return fmt::format("<div class=\"form-field{0}\">{1}<select id=\"{2}\" name=\"{2}\"{3}"
		" class=\"form-input\">{4}</select>{5}</div>",
		failed ? " has-error" : "",
		label(attrs, name),
		name,
		attrs.flag("required") ? " required" : "",
		content,
		failed ? fmt::format("<p class=\"form-error\">{}</p>", *error) : "");
}

[[nodiscard]] static std::string renderCheckbox(const Attributes& attrs, std::string_view)
{
	const std::string input = fmt::format("<input type=\"checkbox\" name=\"{}\"{}{} />",
		attrs.get_or("name", ""),
		attrs.flag("required") ? " required" : "",
		attrs.flag("checked") ? " checked" : "");
	const std::string text = attrs.get_or("label", "");

	if (attrs.get_or("variant", "default") == "toggle"sv)
		return fmt::format("<label class=\"toggle\">{}<span class=\"toggle-track\"></span><span>{}</span></label>", input, text);
	return fmt::format("<label class=\"checkbox\">{}<span>{}</span></label>", input, text);
}

[[nodiscard]] static std::string renderCard(const Attributes& attrs, std::string_view content)
{
	const std::string variant = attrs.get_or("variant", "default");
	const bool glass = attrs.flag("glass") || variant == "glass"sv;

	return fmt::format("<div class=\"{}\">{}</div>",
		classes(fmt::format("card card-{}{}", variant, glass ? " glass" : ""), attrs), content);
}

[[nodiscard]] static std::string renderBadge(const Attributes& attrs, std::string_view content)
{
	std::string icon = attrs.get_or("icon", "");
	if (!icon.empty())
		icon.push_back(' ');

	return fmt::format("<span class=\"{}\">{}{}</span>",
		classes(fmt::format("badge badge-{}", attrs.get_or("variant", "default")), attrs), icon, content);
}

[[nodiscard]] static std::string renderStatCard(const Attributes& attrs, std::string_view)
{
	const std::string trend = attrs.get_or("trend", "");
	std::string trendMarkup;
	if (!trend.empty())
	{
		const std::string_view direction = trend.front() == '+' ? " up"sv
			: trend.front() == '-' ? " down"sv
			: ""sv;
		trendMarkup = fmt::format("<div class=\"stat-trend{}\">{}</div>", direction, trend);
	}

	return fmt::format("<div class=\"stat-card{}\"><div class=\"stat-label\">{}</div>"
		"<div class=\"stat-value\">{}</div>{}</div>",
		attrs.flag("highlight") ? " highlight" : "",
		attrs.get_or("label", ""),
		attrs.get_or("value", ""),
		trendMarkup);
}

[[nodiscard]] static std::string renderFeatureCard(const Attributes& attrs, std::string_view)
{
	return fmt::format("<div class=\"feature-card\"><div class=\"feature-icon\">{}</div><h3>{}</h3><p>{}</p></div>",
		attrs.get_or("icon", "\xF0\x9F\x9A\x80"), // Rocket
		attrs.get_or("title", ""),
		attrs.get_or("description", ""));
}

[[nodiscard]] static std::string renderFormGroup(const Attributes& attrs, std::string_view content)
{
	std::string columns = attrs.get_or("columns", "1");
	if (columns.empty() || !std::all_of(columns.cbegin(), columns.cend(), [](char c) { return c >= '0' && c <= '9'; }))
		columns = "1";

	std::string legend;
	if (const auto text = attrs.get("legend"); text.has_value() && !text->empty())
		legend = fmt::format("<legend>{}</legend>", *text);

	return fmt::format("<fieldset class=\"form-group\">{}<div class=\"form-grid\" "
		"style=\"grid-template-columns: repeat({}, minmax(0, 1fr))\">{}</div></fieldset>",
		legend, columns, content);
}

[[nodiscard]] static std::string renderNavItem(const Attributes& attrs, std::string_view content)
{
	std::string icon;
	if (const auto text = attrs.get("icon"); text.has_value() && !text->empty())
		icon = fmt::format("<span class=\"nav-icon\">{}</span>", *text);

	return fmt::format("<a href=\"{}\" class=\"nav-item{}\">{}{}</a>",
		attrs.get_or("href", "#"), attrs.flag("active") ? " active" : "", icon, content);
}

[[nodiscard]] const std::map<std::string_view, Components::Renderer>& Components::builtins()
{
	static const std::map<std::string_view, Renderer> registry{
		{"Button"sv, renderButton},
		{"TextInput"sv, renderTextInput},
		{"Select"sv, renderSelect},
		{"Checkbox"sv, renderCheckbox},
		{"Card"sv, renderCard},
		{"Badge"sv, renderBadge},
		{"StatCard"sv, renderStatCard},
		{"FeatureCard"sv, renderFeatureCard},
		{"FormGroup"sv, renderFormGroup},
		{"NavItem"sv, renderNavItem},
	};
	return registry;
}

/**
 * @brief Regexes of a component tag
 */
struct TagPattern
{
	std::regex open; ///< `<Name attrs>`
	std::regex close; ///< `</Name>`
	std::regex single; ///< `<Name attrs />`

	explicit TagPattern(std::string_view name):
		open{Scanner::make(fmt::format(R"(<{}\b({})>)", name, Scanner::attribute_list))},
		close{Scanner::make(fmt::format(R"(</{}\s*>)", name))},
		single{Scanner::make(fmt::format(R"(<{}\b({})/>)", name, Scanner::attribute_list))}
	{}
};

/**
 * @brief Replaces every tag of a component
 *
 * Container tags are rendered outermost first, with nested tags of the same
 * component rendered in their content. Self-closing tags get an empty content.
 *
 * @param s Markup
 * @param pattern Tag regexes
 * @param fn Renders one tag from its attributes and content
 * @returns Rendered markup
 */
[[nodiscard]] static std::string replace_tags(std::string_view s, const TagPattern& pattern,
		const std::function<std::string(const Attributes&, std::string_view)>& fn)
{
	const std::string result = Scanner::replace_blocks(s, pattern.open, pattern.close,
		[&](const Scanner::Block& b) -> std::optional<std::string>
	{
		return fn(Attributes::parse(Scanner::group(b.open, 1)), replace_tags(b.body, pattern, fn));
	});

	return Scanner::replace(result, pattern.single, [&](const Scanner::Match& m)
	{
		return fn(Attributes::parse(Scanner::group(m, 1)), ""sv);
	});
}

[[nodiscard]] std::string Components::render_builtins(std::string_view s)
{
	static const std::vector<std::pair<TagPattern, Renderer>> patterns = []
	{
		std::vector<std::pair<TagPattern, Renderer>> list;
		for (const auto& [name, renderer] : builtins())
			list.emplace_back(TagPattern{name}, renderer);
		return list;
	}();

	std::string result{s};
	for (const auto& [pattern, renderer] : patterns)
		result = replace_tags(result, pattern, renderer);
	return result;
}

[[nodiscard]] std::map<std::string, std::string, std::less<>> Components::props(std::string_view body)
{
	static const std::regex open = Scanner::make(fmt::format(R"(<n:props\b{}>)", Scanner::attribute_list));
	static const std::regex close = Scanner::make(R"(</n:props\s*>)");
	static const std::regex entry = Scanner::make(
		R"re(([A-Za-z_]\w*)\s*:[ \t]*[^=,;\n]*?(?:=\s*(?:"([^"]*)"|'([^']*)'|([^\s,;]+)))?[ \t]*(?:[,;\n]|$))re");

	std::map<std::string, std::string, std::less<>> result;

	Scanner::Match m;
	if (!Scanner::search(body, 0, open, m))
		return result;
	const std::size_t begin = m.position(0) + m.length(0);
	const auto [closeBegin, closeEnd] = Scanner::find_closer(body, begin, open, close);
	if (closeBegin == std::string_view::npos)
		return result;

	const std::string_view block = body.substr(begin, closeBegin - begin);
	for (auto it = std::regex_iterator<std::string_view::const_iterator>(block.cbegin(), block.cend(), entry);
			it != std::regex_iterator<std::string_view::const_iterator>{}; ++it)
	{
		const auto& e = *it;
		std::string value;
		for (std::size_t i = 2; i <= 4; ++i)
		{
			if (e[i].matched)
				value = e[i].str();
		}
		result.insert_or_assign(e[1].str(), std::move(value));
	}

	return result;
}

/**
 * @brief Instantiates a declared component
 *
 * @param body Definition body
 * @param attrs Tag attributes, overriding prop defaults
 * @param content Tag content, filling the default slot
 * @param env Environment
 * @returns Processed markup
 */
[[nodiscard]] static std::string instantiate(std::string_view body, const Attributes& attrs,
		std::string_view content, Env& env)
{
	static const std::regex token = Scanner::make(R"(\{\{\s*(?:props\.)?([A-Za-z_]\w*)\s*\}\})");
	static const std::regex slot = Scanner::make(R"(<n:slot\s*/?>)");

	auto values = Components::props(body);
	attrs.for_each([&](const Attributes::Attribute& attr)
	{
		values.insert_or_assign(attr.name, attr.value.value_or("true"));
	});

	const auto resolver = [&values](std::string_view condition) -> std::optional<bool>
	{
		bool negated = false;
		if (condition.starts_with('!'))
		{
			negated = true;
			condition = trim(condition.substr(1));
		}
		if (condition.starts_with("props."sv))
			condition.remove_prefix(6);

		const auto it = values.find(condition);
		if (it == values.end())
			return std::nullopt;

		const bool set = !it->second.empty() && it->second != "false"sv;
		return set != negated;
	};

	std::string text = Directives::conditionals(body, resolver);
	text = Scanner::replace(text, token, [&](const Scanner::Match& m)
	{
		if (const auto it = values.find(Scanner::group(m, 1)); it != values.end())
			return it->second;
		return m.str(0);
	});
	text = Scanner::replace(text, slot, [&](const Scanner::Match&) { return std::string{content}; });

	if (!env.process)
		return text;
	Env child{env};
	return env.process(text, child);
}

[[nodiscard]] std::string Components::expand(std::string_view s, Env& env)
{
	static const std::regex tagName = Scanner::make(R"([A-Za-z][\w-]*)");

	std::vector<std::pair<TagPattern, std::string>> declared;
	for (const auto& [name, body] : env.definitions)
	{
		if (builtins().contains(name) || !std::regex_match(name, tagName))
			continue;
		declared.emplace_back(TagPattern{name}, body);
	}

	std::string result{s};
	for (std::size_t round = 0; round < MaxExpansionDepth && !declared.empty(); ++round)
	{
		std::string next = result;
		for (const auto& [pattern, body] : declared)
		{
			next = replace_tags(next, pattern, [&](const Attributes& attrs, std::string_view content)
			{
				return instantiate(body, attrs, content, env);
			});
		}

		if (next == result)
			break;
		result = std::move(next);
	}

	return result;
}

[[nodiscard]] std::string Components::render(std::string_view s, Env& env)
{
	return render_builtins(expand(s, env));
}
