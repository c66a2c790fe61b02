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

#include "Expression.hpp"
#include "Util.hpp"

#include <vector>
#include <fmt/format.h>

using namespace std::literals;

namespace
{
	struct Token
	{
		enum Type
		{
			NUMBER,
			IDENT,
			OP,
			LPAREN,
			RPAREN,
		} type;
		std::string_view text;
	};

	/**
	 * @brief Splits an expression in tokens
	 *
	 * @param s Expression
	 * @param tokens Output tokens
	 * @returns false on an unexpected character
	 */
	[[nodiscard]] bool tokenize(std::string_view s, std::vector<Token>& tokens)
	{
		std::size_t i = 0;
		while (i < s.size())
		{
			const char c = s[i];
			if (c == ' ' || c == '\t' || c == '\n' || c == '\r')
			{
				++i;
				continue;
			}

			if (c >= '0' && c <= '9')
			{
				const std::size_t start = i;
				while (i < s.size() && s[i] >= '0' && s[i] <= '9')
					++i;
				if (i+1 < s.size() && s[i] == '.' && s[i+1] >= '0' && s[i+1] <= '9')
				{
					++i;
					while (i < s.size() && s[i] >= '0' && s[i] <= '9')
						++i;
				}
				if (i < s.size() && (s[i] == 'e' || s[i] == 'E'))
				{
					std::size_t exp = i+1;
					if (exp < s.size() && (s[exp] == '+' || s[exp] == '-'))
						++exp;
					if (exp < s.size() && s[exp] >= '0' && s[exp] <= '9')
					{
						i = exp;
						while (i < s.size() && s[i] >= '0' && s[i] <= '9')
							++i;
					}
				}
				// Integer suffixes (2i32, 1.5f64)
				const std::size_t end = i;
				while (i < s.size() && is_word(s[i]))
					++i;
				tokens.push_back({Token::NUMBER, s.substr(start, end-start)});
			}
			else if (is_word(c))
			{
				const std::size_t start = i;
				while (i < s.size() && is_word(s[i]))
					++i;
				tokens.push_back({Token::IDENT, s.substr(start, i-start)});
			}
			else if (c == '+' || c == '-' || c == '*' || c == '/' || c == '%')
				tokens.push_back({Token::OP, s.substr(i++, 1)});
			else if (c == '(')
				tokens.push_back({Token::LPAREN, s.substr(i++, 1)});
			else if (c == ')')
				tokens.push_back({Token::RPAREN, s.substr(i++, 1)});
			else
				return false;
		}

		return true;
	}

	/**
	 * @brief Recursive descent over the token list
	 */
	class ExpressionParser
	{
		const std::vector<Token>& m_tokens;
		std::size_t m_pos = 0;
		std::string_view m_param;
		std::string_view m_target;

		[[nodiscard]] const Token* peek() const
		{
			return m_pos < m_tokens.size() ? &m_tokens[m_pos] : nullptr;
		}

		[[nodiscard]] bool isOp(std::string_view ops) const
		{
			const Token* t = peek();
			return t && t->type == Token::OP && ops.find(t->text[0]) != std::string_view::npos;
		}

		[[nodiscard]] std::optional<std::string> primary()
		{
			const Token* t = peek();
			if (!t)
				return std::nullopt;

			switch (t->type)
			{
				case Token::NUMBER:
					++m_pos;
					return std::string{t->text};
				case Token::IDENT:
					if (t->text != m_param)
						return std::nullopt;
					++m_pos;
					return std::string{m_target};
				case Token::LPAREN:
				{
					++m_pos;
					auto inner = expr();
					if (!inner || !peek() || peek()->type != Token::RPAREN)
						return std::nullopt;
					++m_pos;
					return fmt::format("({})", *inner);
				}
				default:
					return std::nullopt;
			}
		}

		[[nodiscard]] std::optional<std::string> unary()
		{
			if (isOp("-"sv))
			{
				++m_pos;
				auto operand = unary();
				if (!operand)
					return std::nullopt;
				if (operand->starts_with('-'))
					return fmt::format("-({})", *operand);
				return fmt::format("-{}", *operand);
			}
			if (isOp("*"sv)) // Dereference
			{
				++m_pos;
				const Token* t = peek();
				if (!t || t->type != Token::IDENT || t->text != m_param)
					return std::nullopt;
				++m_pos;
				return std::string{m_target};
			}
			return primary();
		}

		[[nodiscard]] std::optional<std::string> term()
		{
			auto lhs = unary();
			while (lhs && isOp("*/%"sv))
			{
				const char op = peek()->text[0];
				++m_pos;
				auto rhs = unary();
				if (!rhs)
					return std::nullopt;
				lhs = fmt::format("{} {} {}", *lhs, op, *rhs);
			}
			return lhs;
		}

	public:
		ExpressionParser(const std::vector<Token>& tokens, std::string_view param, std::string_view target):
			m_tokens{tokens}, m_param{param}, m_target{target} {}

		[[nodiscard]] std::optional<std::string> expr()
		{
			auto lhs = term();
			while (lhs && isOp("+-"sv))
			{
				const char op = peek()->text[0];
				++m_pos;
				auto rhs = term();
				if (!rhs)
					return std::nullopt;
				lhs = fmt::format("{} {} {}", *lhs, op, *rhs);
			}
			return lhs;
		}

		[[nodiscard]] bool done() const { return m_pos == m_tokens.size(); }
	};
}

[[nodiscard]] std::optional<std::string> Expression::retarget(std::string_view expr, std::string_view param, std::string_view target)
{
	std::vector<Token> tokens;
	if (!tokenize(expr, tokens) || tokens.empty())
		return std::nullopt;

	ExpressionParser parser(tokens, param, target);
	auto result = parser.expr();
	if (!result || !parser.done())
		return std::nullopt;

	return result;
}
