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

#include "HTMLCompiler.hpp"
#include "Html.hpp"
#include "Pipeline.hpp"

#include <fmt/format.h>

using namespace std::literals;

[[nodiscard]] std::string HTMLCompiler::get_name() const
{
	return "HTML";
}

[[nodiscard]] std::string_view HTMLCompiler::base_styles()
{
	return R"(*, *::before, *::after { box-sizing: border-box; }
body { margin: 0; padding: 1.5rem; font-family: system-ui, -apple-system, "Segoe UI", sans-serif; line-height: 1.5; color: #111827; background: #f9fafb; }
img { max-width: 100%; height: auto; }
a { color: #4f46e5; }

.btn { display: inline-flex; align-items: center; gap: .5rem; border: 1px solid transparent; border-radius: .5rem; font-weight: 500; cursor: pointer; text-decoration: none; transition: background .15s; }
.btn[disabled] { opacity: .5; cursor: not-allowed; }
.btn-small, .btn-sm { padding: .25rem .75rem; font-size: .875rem; }
.btn-medium, .btn-md { padding: .5rem 1rem; }
.btn-large, .btn-lg { padding: .75rem 1.5rem; font-size: 1.125rem; }
.btn-primary { background: #4f46e5; color: #fff; }
.btn-primary:hover { background: #4338ca; }
.btn-secondary { background: #fff; color: #374151; border-color: #d1d5db; }
.btn-ghost { background: transparent; color: #4b5563; }
.btn-gradient { background: linear-gradient(90deg, #6366f1, #a855f7); color: #fff; }

.card { background: #fff; border: 1px solid #f3f4f6; border-radius: .75rem; padding: 1.5rem; box-shadow: 0 1px 2px rgba(0,0,0,.05); }
.card-feature { background: linear-gradient(135deg, #9333ea, #2563eb); color: #fff; }
.card.glass { background: rgba(0,0,0,.9); color: #fff; border-color: rgba(255,255,255,.1); backdrop-filter: blur(24px); }

.badge { display: inline-block; padding: .25rem .75rem; border-radius: 9999px; font-size: .875rem; font-weight: 500; background: rgba(107,114,128,.1); color: #6b7280; }
.badge-primary { background: rgba(99,102,241,.1); color: #6366f1; }

.form-field { margin-bottom: 1rem; }
.form-field label { display: block; font-size: .875rem; font-weight: 500; margin-bottom: .25rem; }
.form-input { width: 100%; padding: .5rem 1rem; border: 1px solid #d1d5db; border-radius: .5rem; background: #fff; }
.form-input:focus { outline: 2px solid #6366f1; }
.form-help { margin: .25rem 0 0; font-size: .875rem; color: #6b7280; }
.form-error { margin: .25rem 0 0; font-size: .875rem; color: #dc2626; }
.has-error label { color: #dc2626; }
.has-error .form-input { border-color: #fca5a5; }
.checkbox, .toggle { display: flex; align-items: center; gap: .5rem; margin-bottom: 1rem; cursor: pointer; }
.toggle input { position: absolute; opacity: 0; }
.toggle-track { width: 2.75rem; height: 1.5rem; border-radius: 9999px; background: #e5e7eb; transition: background .15s; }
.toggle input:checked + .toggle-track { background: #4f46e5; }
.form-group { margin: 0 0 1.5rem; border: 0; padding: 0; }
.form-group legend { font-size: 1.125rem; font-weight: 600; margin-bottom: 1rem; }
.form-grid { display: grid; gap: 1rem; }
.nucleus-form { display: block; }
.wizard-step { border: 1px solid #e5e7eb; border-radius: .5rem; padding: 1rem; margin-bottom: 1rem; }

.stat-card { background: #fff; border: 1px solid #f3f4f6; border-radius: .75rem; padding: 1.5rem; }
.stat-card.highlight { border-color: #6366f1; }
.stat-label { font-size: .75rem; font-weight: 600; text-transform: uppercase; letter-spacing: .05em; color: #6b7280; }
.stat-value { font-size: 1.875rem; font-weight: 700; }
.stat-trend { margin-top: .5rem; font-size: .875rem; color: #6b7280; }
.stat-trend.up { color: #10b981; }
.stat-trend.down { color: #f43f5e; }

.feature-card { padding: 1.5rem; border-radius: 1rem; background: #1e293b; color: #fff; }
.feature-icon { font-size: 1.5rem; margin-bottom: 1rem; }
.feature-card p { color: #94a3b8; }

.nav-item { display: flex; align-items: center; gap: .75rem; padding: .75rem 1rem; border-radius: .5rem; color: #4b5563; text-decoration: none; font-weight: 500; }
.nav-item:hover { background: #f9fafb; }
.nav-item.active { background: #eef2ff; color: #4338ca; }

[data-island] { position: relative; }
[data-n-bind] { font-variant-numeric: tabular-nums; }
.n-even { color: #059669; }
.n-odd { color: #d97706; }
.n-counter { display: inline-flex; align-items: center; gap: .75rem; }
)"sv;
}

[[nodiscard]] std::string HTMLCompiler::document(const CompilerOptions& opts, const std::optional<std::string>& title,
		std::string_view body, std::string_view style)
{
	std::string stylesheet;
	if (opts.base_styles)
		stylesheet.append(base_styles());
	stylesheet.append(style);

	return fmt::format("<!DOCTYPE html>\n"
		"<html>\n"
		"<head>\n"
		"<meta charset=\"utf-8\">\n"
		"<meta name=\"viewport\" content=\"width=device-width, initial-scale=1\">\n"
		"<title>{}</title>\n"
		"<style>\n{}\n</style>\n"
		"</head>\n"
		"<body>\n{}\n</body>\n"
		"</html>\n",
		Html::escape(title.value_or(opts.default_title)),
		stylesheet,
		opts.pretty ? Html::indent(body) : std::string{body});
}

[[nodiscard]] std::string HTMLCompiler::compile(std::string_view source, std::string_view style,
		const Islands& islands) const
{
	Env env{Context{m_opts.data}, &islands};
	const std::string body = Pipeline::run(source, env, {}, m_opts.benchmark);

	return document(m_opts, env.title, body, style);
}
