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

#include "Context.hpp"
#include "Util.hpp"

#include <charconv>

using namespace std::literals;

[[nodiscard]] Context Context::with(std::string name, nlohmann::json value) const
{
	Context child{*this};
	child.m_scopes.emplace_back(std::move(name), std::move(value));
	return child;
}

[[nodiscard]] std::optional<nlohmann::json> Context::find(std::string_view path) const
{
	path = trim(path);
	if (path.ends_with("()"sv))
		path.remove_suffix(2);
	if (path.empty())
		return std::nullopt;

	const std::size_t dot = path.find('.');
	const std::string_view head = path.substr(0, dot);

	// Root segment
	const nlohmann::json* value = nullptr;
	for (auto it = m_scopes.crbegin(); it != m_scopes.crend(); ++it)
	{
		if (it->first == head)
		{
			value = &it->second;
			break;
		}
	}
	if (value == nullptr)
	{
		if (!m_root->is_object())
			return std::nullopt;
		const auto it = m_root->find(std::string{head});
		if (it == m_root->end())
			return std::nullopt;
		value = &(*it);
	}
	if (dot == std::string_view::npos)
		return *value;

	// Remaining segments
	std::string_view rest = path.substr(dot+1);
	while (true)
	{
		const std::size_t next = rest.find('.');
		std::string_view seg = trim(rest.substr(0, next));
		if (seg.ends_with("()"sv))
			seg.remove_suffix(2);

		if (value->is_object())
		{
			const auto it = value->find(std::string{seg});
			if (it == value->end())
				return std::nullopt;
			value = &(*it);
		}
		else if (value->is_array())
		{
			if (seg == "len"sv || seg == "length"sv)
			{
				if (next != std::string_view::npos)
					return std::nullopt;
				return nlohmann::json(value->size());
			}

			std::size_t index = 0;
			const auto [end, err] = std::from_chars(seg.data(), seg.data()+seg.size(), index);
			if (err != std::errc{} || end != seg.data()+seg.size() || index >= value->size())
				return std::nullopt;
			value = &(*value)[index];
		}
		else
			return std::nullopt;

		if (next == std::string_view::npos)
			break;
		rest = rest.substr(next+1);
	}

	return *value;
}

[[nodiscard]] std::optional<std::string> Context::resolve(std::string_view path) const
{
	const auto value = find(path);
	if (!value.has_value())
		return std::nullopt;
	return to_string(*value);
}

[[nodiscard]] bool Context::scoped(std::string_view name) const
{
	return std::any_of(m_scopes.cbegin(), m_scopes.cend(),
			[name](const auto& scope) { return scope.first == name; });
}

[[nodiscard]] std::optional<std::string> Context::to_string(const nlohmann::json& value)
{
	if (value.is_string())
		return value.get<std::string>();
	if (value.is_boolean())
		return value.get<bool>() ? "true"s : "false"s;
	if (value.is_number())
		return value.dump();
	return std::nullopt;
}

[[nodiscard]] const nlohmann::json& Context::defaults()
{
	static const nlohmann::json data = nlohmann::json::parse(R"({
	"users": [
		{ "name": "Alex", "email": "alex@example.com", "role": "Admin", "avatar": "https://ui-avatars.com/api/?name=Alex&background=6366f1&color=fff" },
		{ "name": "Sam", "email": "sam@example.com", "role": "Editor", "avatar": "https://ui-avatars.com/api/?name=Sam&background=10b981&color=fff" },
		{ "name": "Jordan", "email": "jordan@example.com", "role": "Viewer", "avatar": "https://ui-avatars.com/api/?name=Jordan&background=f59e0b&color=fff" }
	],
	"posts": [
		{
			"title": "Getting Started with Nucleus",
			"slug": "getting-started",
			"excerpt": "Learn the basics of Nucleus framework in 5 minutes.",
			"author": "Alex",
			"date": "Oct 12, 2025",
			"category": "Tutorial",
			"cover_image": "https://images.unsplash.com/photo-1498050108023-c5249f4df085?auto=format&fit=crop&w=800&q=80"
		},
		{
			"title": "Why Rust?",
			"slug": "why-rust",
			"excerpt": "Exploring the benefits of Rust for web development.",
			"author": "Sam",
			"date": "Oct 15, 2025",
			"category": "Opinion",
			"cover_image": "https://images.unsplash.com/photo-1518770660439-4636190af475?auto=format&fit=crop&w=800&q=80"
		},
		{
			"title": "Islands Architecture Explained",
			"slug": "islands-architecture",
			"excerpt": "How Partial Hydration works under the hood.",
			"author": "Jordan",
			"date": "Oct 20, 2025",
			"category": "Deep Dive",
			"cover_image": "https://images.unsplash.com/photo-1451187580459-43490279c0fa?auto=format&fit=crop&w=800&q=80"
		}
	],
	"featured": {
		"title": "Building Full-Stack Apps with Nucleus",
		"excerpt": "A complete guide to building modern web applications using the Nucleus framework.",
		"slug": "full-stack-nucleus"
	},
	"stats": {
		"total_users": "12,345",
		"revenue": "$89,234",
		"orders": "1,234"
	},
	"todos": [
		{ "id": 1, "title": "Learn Nucleus basics", "completed": true },
		{ "id": 2, "title": "Build a todo app", "completed": false },
		{ "id": 3, "title": "Deploy to production", "completed": false }
	],
	"count": 0,
	"user": {
		"name": "Alice Johnson",
		"email": "alice@example.com",
		"avatar": "https://i.pravatar.cc/40?1",
		"role": "Admin"
	},
	"post": {
		"title": "Getting Started with Nucleus",
		"slug": "getting-started",
		"excerpt": "Learn how to build modern web apps...",
		"author": "John Doe",
		"date": "Jan 8, 2026",
		"cover_image": "https://picsum.photos/400/200",
		"category": "Tutorial"
	}
})");

	return data;
}
