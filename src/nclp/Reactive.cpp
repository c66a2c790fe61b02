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

#include "Reactive.hpp"
#include "Attributes.hpp"
#include "Expression.hpp"
#include "Scanner.hpp"
#include "Html.hpp"
#include "Util.hpp"

#include <fmt/format.h>

using namespace std::literals;

[[nodiscard]] Reactive::Hydration Reactive::get_hydration(const Attributes& attrs)
{
	static constexpr auto modes = make_array<std::pair<std::string_view, Hydration>>(
		std::make_pair("load"sv, Hydration::LOAD),
		std::make_pair("visible"sv, Hydration::VISIBLE),
		std::make_pair("idle"sv, Hydration::IDLE)
	);

	std::string_view mode;
	std::string value;
	attrs.for_each([&](const Attributes::Attribute& a)
	{
		if (!mode.empty())
			return;
		if (a.name.starts_with("client:"sv))
			mode = std::string_view{a.name}.substr(7);
		else if (a.name == "client"sv && a.value.has_value())
		{
			value = *a.value;
			mode = value;
		}
	});

	for (const auto& [name, h] : modes)
		if (name == mode)
			return h;
	return Hydration::LOAD;
}

[[nodiscard]] std::string_view Reactive::get_hydration_name(Hydration h) noexcept
{
	switch (h)
	{
		case Hydration::VISIBLE: return "visible"sv;
		case Hydration::IDLE: return "idle"sv;
		default: return "load"sv;
	}
}

[[nodiscard]] static bool isNumeric(std::string_view literal)
{
	static const std::regex numeric = Scanner::make(R"(-?\d+(\.\d+)?)");
	return std::regex_match(literal.cbegin(), literal.cend(), numeric);
}

[[nodiscard]] const Reactive::Signal* Reactive::Island::primary() const
{
	for (const auto& sig : signals)
		if (isNumeric(sig.initial))
			return &sig;
	return nullptr;
}

/**
 * @brief Makes a literal safe to embed in a script element
 *
 * @param literal Literal
 * @returns literal with `</` escaped
 */
[[nodiscard]] static std::string scriptSafe(std::string_view literal)
{
	return replace_all(literal, "</"sv, "<\\/"sv);
}

[[nodiscard]] std::string Reactive::Island::runtime(Hydration h) const
{
	if (signals.empty())
		return ""s;

	std::string s = "(function(root) {\n"s;
	s.append("\tfunction hydrate() {\n");

	// State
	s.append("\t\tconst state = {};\n");
	for (const auto& sig : signals)
		s.append(fmt::format("\t\tstate.{} = {};\n", sig.name, scriptSafe(sig.initial)));

	// Computed values
	s.append("\t\tconst derived = {};\n");
	s.append("\t\tconst deps = {};\n");
	for (const auto& c : computed)
	{
		s.append(fmt::format("\t\tdeps.{} = '{}';\n", c.name, c.dep));
		if (c.derivation.has_value())
			s.append(fmt::format("\t\tderived.{} = function() {{ return {}; }};\n", c.name, *c.derivation));
	}

	// Rendering
	s.append(
		"\t\tfunction render(changed) {\n"
		"\t\t\troot.querySelectorAll('[data-n-bind]').forEach(function(el) {\n"
		"\t\t\t\tconst key = el.dataset.nBind;\n"
		"\t\t\t\tif (changed !== undefined && key !== changed && deps[key] !== changed) return;\n"
		"\t\t\t\tif (key in derived) el.textContent = derived[key]();\n"
		"\t\t\t\telse if (key in state) el.textContent = state[key];\n"
		"\t\t\t});\n");
	if (const Signal* p = primary(); p)
	{
		s.append(fmt::format(
			"\t\t\tconst marker = root.querySelector('[data-n-bind=\"{0}\"]');\n"
			"\t\t\tif (marker && marker.parentElement) {{\n"
			"\t\t\t\tconst even = Math.abs(state.{0}) % 2 === 0;\n"
			"\t\t\t\tmarker.parentElement.classList.toggle('n-even', even);\n"
			"\t\t\t\tmarker.parentElement.classList.toggle('n-odd', !even);\n"
			"\t\t\t}}\n", p->name));
	}
	s.append("\t\t}\n");

	// Actions
	s.append(
		"\t\troot.querySelectorAll('[data-n-action]').forEach(function(el) {\n"
		"\t\t\tel.addEventListener('click', function(e) {\n"
		"\t\t\t\te.preventDefault();\n"
		"\t\t\t\tconst action = el.dataset.nAction.split(':');\n"
		"\t\t\t\tconst sig = action[0], op = action[1], val = parseFloat(action[2]);\n"
		"\t\t\t\tif (!(sig in state)) return;\n"
		"\t\t\t\tif (op === '+=') state[sig] += val;\n"
		"\t\t\t\telse if (op === '-=') state[sig] -= val;\n"
		"\t\t\t\telse state[sig] = val;\n"
		"\t\t\t\trender(sig);\n"
		"\t\t\t});\n"
		"\t\t});\n"
		"\t\trender();\n"
		"\t}\n");

	// Hydration
	switch (h)
	{
		case Hydration::VISIBLE:
			s.append(
				"\tif ('IntersectionObserver' in window) {\n"
				"\t\tconst observer = new IntersectionObserver(function(entries) {\n"
				"\t\t\tif (!entries.some(function(e) { return e.isIntersecting; })) return;\n"
				"\t\t\tobserver.disconnect();\n"
				"\t\t\thydrate();\n"
				"\t\t});\n"
				"\t\tobserver.observe(root);\n"
				"\t} else hydrate();\n");
			break;
		case Hydration::IDLE:
			s.append(
				"\tif ('requestIdleCallback' in window) requestIdleCallback(hydrate);\n"
				"\telse setTimeout(hydrate, 1);\n");
			break;
		default:
			s.append("\thydrate();\n");
			break;
	}
	s.append("})(document.currentScript.parentElement);");

	return s;
}

[[nodiscard]] std::string Reactive::Island::render(std::string_view name, Hydration h) const
{
	const std::string script = runtime(h);
	if (script.empty())
		return fmt::format("<div data-island=\"{}\" data-hydrate=\"{}\">{}</div>",
				Html::escape(name), get_hydration_name(h), markup);

	return fmt::format("<div data-island=\"{}\" data-hydrate=\"{}\">{}<script>{}</script></div>",
			Html::escape(name), get_hydration_name(h), markup, script);
}

/**
 * @brief Extracts signal declarations
 *
 * @param source Island body
 * @param island Island to record signals in
 * @returns source without the declarations
 */
[[nodiscard]] static std::string extractSignals(std::string_view source, Reactive::Island& island)
{
	static const std::regex decl = Scanner::make(
		R"((?:\blet\s+)?(?:\bmut\s+)?\b([A-Za-z_]\w*)\s*=\s*(?:Signal::new|create_signal|signal)\s*\(\s*)"
		R"((-?\d+(?:\.\d+)?|"(?:[^"\\]|\\.)*"|'(?:[^'\\]|\\.)*'|true|false)\s*\)[ \t]*;?)");

	return Scanner::replace(source, decl, [&](const Scanner::Match& m)
	{
		std::string name{Scanner::group(m, 1)};
		std::string initial{Scanner::group(m, 2)};

		// Redeclaration: first position, last value
		auto it = std::find_if(island.signals.begin(), island.signals.end(),
				[&name](const Reactive::Signal& sig) { return sig.name == name; });
		if (it != island.signals.end())
			it->initial = std::move(initial);
		else
			island.signals.push_back({std::move(name), std::move(initial)});

		return ""s;
	});
}

/**
 * @brief Extracts computed declarations
 *
 * The closure body extends to the parenthesis closing `computed(`.
 *
 * @param source Island body
 * @param island Island to record computed values in
 * @returns source without the declarations
 */
[[nodiscard]] static std::string extractComputed(std::string_view source, Reactive::Island& island)
{
	static const std::regex head = Scanner::make(
		R"((?:\blet\s+)?(?:\bmut\s+)?\b([A-Za-z_]\w*)\s*=\s*computed\s*\(\s*([A-Za-z_]\w*)\.clone\(\)\s*,\s*)"
		R"((?:move\s+)?\|\s*&?\s*([A-Za-z_]\w*)\s*(?::[^|]*)?\|)");

	std::string result;
	std::size_t pos = 0;
	Scanner::Match m;
	while (pos < source.size() && Scanner::search(source, pos, head, m))
	{
		const std::size_t begin = pos + m.position(0);
		const std::size_t body = begin + m.length(0);

		std::size_t i = body;
		for (std::size_t depth = 0; i < source.size(); ++i)
		{
			if (source[i] == '(')
				++depth;
			else if (source[i] == ')')
			{
				if (depth == 0)
					break;
				--depth;
			}
		}
		if (i >= source.size()) // Unterminated
		{
			result.append(source.substr(pos, body-pos));
			pos = body;
			continue;
		}

		std::size_t end = i+1;
		while (end < source.size() && (source[end] == ' ' || source[end] == '\t'))
			++end;
		if (end < source.size() && source[end] == ';')
			++end;

		const std::string dep{Scanner::group(m, 2)};
		island.computed.push_back({
			.name = std::string{Scanner::group(m, 1)},
			.dep = dep,
			.derivation = Expression::retarget(trim(source.substr(body, i-body)), Scanner::group(m, 3), fmt::format("state.{}", dep)),
		});

		result.append(source.substr(pos, begin-pos));
		pos = end;
	}
	if (pos < source.size())
		result.append(source.substr(pos));

	return result;
}

/**
 * @brief Replaces click handlers by action markers
 *
 * Unrecognized handlers are kept as they are.
 *
 * @param source Markup
 * @param island Island to record actions in
 * @returns Markup with action markers
 */
[[nodiscard]] static std::string extractActions(std::string_view source, Reactive::Island& island)
{
	static const std::regex handler = Scanner::make(R"(\bonclick\s*=\s*\{)", true);
	static const std::regex update = Scanner::make(R"(\b([A-Za-z_]\w*)\s*\.\s*update\b)", true);
	static const std::regex op = Scanner::make(R"((\+=|-=|=)\s*(\d+(?:\.\d+)?))");

	std::string result;
	std::size_t pos = 0;
	Scanner::Match m;
	while (pos < source.size() && Scanner::search(source, pos, handler, m))
	{
		const std::size_t begin = pos + m.position(0);
		const std::size_t body = begin + m.length(0);

		// Matching brace
		std::size_t i = body;
		for (std::size_t depth = 1; i < source.size(); ++i)
		{
			if (source[i] == '{')
				++depth;
			else if (source[i] == '}' && --depth == 0)
				break;
		}
		if (i >= source.size()) // Unterminated
		{
			result.append(source.substr(pos, body-pos));
			pos = body;
			continue;
		}

		const std::string_view closure = source.substr(body, i-body);
		Scanner::Match target, assign;
		if (!Scanner::search(closure, 0, update, target)
			|| !Scanner::search(closure, target.position(0) + target.length(0), op, assign))
		{
			result.append(source.substr(pos, i+1-pos));
			pos = i+1;
			continue;
		}

		Reactive::Action action{
			.signal = std::string{Scanner::group(target, 1)},
			.op = std::string{Scanner::group(assign, 1)},
			.operand = std::string{Scanner::group(assign, 2)},
		};
		result.append(source.substr(pos, begin-pos));
		result.append(fmt::format("onclick=\"return false\" data-n-action=\"{}:{}:{}\"", action.signal, action.op, action.operand));
		island.actions.push_back(std::move(action));
		pos = i+1;
	}
	if (pos < source.size())
		result.append(source.substr(pos));

	return result;
}

[[nodiscard]] Reactive::Island Reactive::transpile(std::string_view source, bool fromFirstTag)
{
	static const std::regex tag = Scanner::make(R"(<[A-Za-z])");
	static const std::regex use = Scanner::make(R"((^|\n)[ \t]*use\s+[\w:{}*, \t]+;[ \t]*(?=\n|$))");
	static const std::regex binding = Scanner::make(R"((\{)?\{\s*([A-Za-z_]\w*)\s*\}(\})?)");

	Island island;

	std::string markup = Scanner::replace(source, use, [](const Scanner::Match& m)
	{
		return std::string{Scanner::group(m, 1)};
	});
	markup = extractComputed(markup, island);
	markup = extractSignals(markup, island);
	markup = extractActions(markup, island);

	if (Scanner::Match m; fromFirstTag && Scanner::search(markup, 0, tag, m))
		markup.erase(0, m.position(0));

	// Without state, tokens are left to the substitution engine
	if (island.signals.empty())
	{
		island.markup = std::string{trim(markup)};
		return island;
	}

	island.markup = std::string{trim(Html::outside_raw(markup, [](std::string_view s)
	{
		return Scanner::replace(s, binding, [](const Scanner::Match& m)
		{
			if (m[1].matched || m[3].matched) // Double brace
				return m.str(0);
			return fmt::format("<span data-n-bind=\"{}\"></span>", Scanner::group(m, 2));
		});
	}))};

	return island;
}

[[nodiscard]] Reactive::Island Reactive::counter()
{
	Island island;
	island.markup =
		"<div class=\"n-counter\">"
		"<button onclick=\"return false\" data-n-action=\"count:-=:1\">-</button>"
		"<span data-n-bind=\"count\"></span>"
		"<button onclick=\"return false\" data-n-action=\"count:+=:1\">+</button>"
		"</div>"s;
	island.signals.push_back({"count"s, "0"s});
	island.actions.push_back({"count"s, "-="s, "1"s});
	island.actions.push_back({"count"s, "+="s, "1"s});

	return island;
}
