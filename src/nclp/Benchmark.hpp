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

#ifndef NCLP_BENCHMARK_HPP
#define NCLP_BENCHMARK_HPP

#include <deque>
#include <stack>
#include <string>
#include <string_view>
#include <chrono>
#include <ratio>

using BenchDur = std::chrono::duration<double, std::micro>;

class BenchmarkResult
{
	std::string m_name; ///< Name of the timed stage
	BenchDur m_dur{}; ///< Stage duration

	std::deque<BenchmarkResult> m_sub; ///< Nested stages
public:
	/**
	 * @brief Constructor
	 *
	 * @param name Stage name
	 */
	BenchmarkResult(std::string&& name):
		m_name{std::move(name)} {}

	/**
	 * @brief Gets the stage name
	 */
	[[nodiscard]] const std::string& getName() const { return m_name; }

	/**
	 * @brief Sets stage duration
	 *
	 * @param dur New duration
	 */
	void setDuration(BenchDur dur) { m_dur = dur; }

	/**
	 * @brief Gets stage duration
	 *
	 * @returns Stage duration
	 */
	[[nodiscard]] BenchDur getDuration() const { return m_dur; };

	/**
	 * @brief Gets duration of nested stages
	 *
	 * @return Sum of the durations of all nested stages
	 */
	[[nodiscard]] BenchDur getSubDuration() const;

	/**
	 * @brief Gets nested stages
	 */
	[[nodiscard]] const std::deque<BenchmarkResult>& getSub() const { return m_sub; }

	/**
	 * @brief Adds nested stage
	 *
	 * @param sub Nested stage to add
	 */
	void addSub(BenchmarkResult&& sub) { m_sub.push_back(std::move(sub)); }

	/**
	 * @brief Displays stage and nested stages
	 *
	 * Nested stages show their share of the parent's duration.
	 *
	 * @params depth Maximum depth (default = infinite depth)
	 * @return Formatted durations
	 */
	[[nodiscard]] std::string display(std::size_t depth = -1) const;
};

/**
 * @brief Nested stage timer
 *
 * Stages are started with push() and stopped with pop(). A stage pushed
 * while another is running is nested in it.
 */
class Benchmark
{
	std::chrono::steady_clock m_clk; ///< Clock used for timing

	std::deque<BenchmarkResult> m_results; ///< Finished top-level stages
	std::stack<BenchmarkResult> m_benchStack;
	std::stack<std::chrono::time_point<decltype(m_clk)>> m_timeStack;

public:
	/**
	 * @brief Starts a stage
	 *
	 * @param name Stage name
	 */
	void push(std::string&& name);

	/**
	 * @brief Stops the last started stage
	 *
	 * Does nothing if no stage is running.
	 */
	void pop();

	/**
	 * @brief Gets finished top-level stages
	 */
	[[nodiscard]] const std::deque<BenchmarkResult>& getResults() const { return m_results; }

	/**
	 * @brief Forgets finished stages
	 */
	void clear() { m_results.clear(); }

	/**
	 * @brief Displays stages
	 *
	 * @params depth Maximum depth (default = infinite depth)
	 * @return Formatted durations
	 */
	[[nodiscard]] std::string display(std::size_t depth = -1) const;
};

#endif // NCLP_BENCHMARK_HPP
