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

#ifndef NCLP_REACTIVE_HPP
#define NCLP_REACTIVE_HPP

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <cstdint>

class Attributes;

/**
 * @brief Island transpiler
 *
 * Turns the body of an island into markup with binding markers and a
 * self-contained runtime script.
 */
namespace Reactive
{
	/**
	 * @brief When an island's runtime starts
	 */
	enum class Hydration : std::uint8_t
	{
		LOAD, ///< Immediately
		VISIBLE, ///< On first intersection with the viewport
		IDLE, ///< When the browser is idle
	};

	/**
	 * @brief Gets the hydration mode from a `client:mode` attribute
	 *
	 * @param attrs Island attributes
	 * @returns Hydration mode (LOAD when absent or unknown)
	 */
	[[nodiscard]] Hydration get_hydration(const Attributes& attrs);

	/**
	 * @brief Gets a hydration mode's name
	 *
	 * @param h Hydration mode
	 * @returns "load", "visible" or "idle"
	 */
	[[nodiscard]] std::string_view get_hydration_name(Hydration h) noexcept;

	/**
	 * @brief Reactive cell declared with a literal initial value
	 */
	struct Signal
	{
		std::string name;
		std::string initial; ///< Literal, verbatim
	};

	/**
	 * @brief Value derived from a single signal
	 */
	struct Computed
	{
		std::string name;
		std::string dep; ///< Signal this value depends on
		std::optional<std::string> derivation; ///< Script expression, if the closure could be re-targeted
	};

	/**
	 * @brief Click action applying an operator to a signal
	 */
	struct Action
	{
		std::string signal;
		std::string op; ///< `+=`, `-=` or `=`
		std::string operand;
	};

	/**
	 * @brief Transpiled island
	 */
	struct Island
	{
		std::string markup; ///< Markup with binding and action markers
		std::vector<Signal> signals; ///< In declaration order
		std::vector<Computed> computed;
		std::vector<Action> actions;

		/**
		 * @brief Gets the primary signal
		 *
		 * @returns First signal with a numeric initial value, nullptr if none
		 */
		[[nodiscard]] const Signal* primary() const;

		/**
		 * @brief Generates the runtime script
		 *
		 * The script is an immediately invoked function bound to the island's
		 * root element (the script's parent). It owns its own state.
		 *
		 * @param h Hydration mode
		 * @returns Runtime script, empty when there are no signals
		 */
		[[nodiscard]] std::string runtime(Hydration h) const;

		/**
		 * @brief Wraps the island for the output document
		 *
		 * @param name Value of `data-island`
		 * @param h Hydration mode
		 * @returns `<div data-island data-hydrate>` with markup and runtime
		 */
		[[nodiscard]] std::string render(std::string_view name, Hydration h) const;
	};

	/**
	 * @brief Transpiles an island body
	 *
	 * Signal and computed declarations and `use` lines are extracted from the
	 * body, the rest is kept as markup. Recognized click handlers become
	 * action markers, bare `{name}` tokens become binding markers.
	 *
	 * @param source Island body
	 * @param fromFirstTag Drop whatever precedes the first tag (for island files
	 * where the markup follows host code)
	 * @returns Transpiled island
	 */
	[[nodiscard]] Island transpile(std::string_view source, bool fromFirstTag = false);

	/**
	 * @brief Gets the stand-in counter island
	 *
	 * @returns Island with a single `count` signal and -1/+1 actions
	 */
	[[nodiscard]] Island counter();
} // Reactive

#endif // NCLP_REACTIVE_HPP
