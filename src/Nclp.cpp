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

#include <cxxopts.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <thread>
#include <chrono>
#include <clocale>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "nclp/Util.hpp"
#include "nclp/Benchmark.hpp"
#include "nclp/HTMLCompiler.hpp"
#include "nclp/TraceCompiler.hpp"

using namespace std::literals;
namespace fs = std::filesystem;

/**
 * @brief Reads a whole file
 *
 * @param path File path
 * @returns File content
 */
[[nodiscard]] static std::string readFile(const fs::path& path)
{
	std::ifstream in(path, std::ios::binary);
	if (!in.good())
		throw Error(fmt::format("Could not open file '{}'", path.string()));

	return std::string((std::istreambuf_iterator<char>(in)), (std::istreambuf_iterator<char>()));
}

/**
 * @brief Loads a directory into a lookup table
 *
 * @param dir Directory
 * @returns Table keyed by path relative to dir (with `/` separators)
 */
[[nodiscard]] static Islands loadIslands(const fs::path& dir)
{
	std::error_code ec;
	if (!fs::is_directory(dir, ec))
		throw Error(fmt::format("Islands directory '{}' is not a directory", dir.string()));

	Islands islands;
	for (const auto& entry : fs::recursive_directory_iterator(dir))
	{
		if (!entry.is_regular_file())
			continue;
		islands.emplace(fs::relative(entry.path(), dir).generic_string(), readFile(entry.path()));
	}
	return islands;
}

/**
 * @brief Loads mock data
 *
 * @param path JSON file
 * @returns Parsed data
 */
[[nodiscard]] static nlohmann::json loadData(const fs::path& path)
{
	const std::string content = readFile(path);
	try
	{
		return nlohmann::json::parse(content);
	}
	catch (nlohmann::json::parse_error& e)
	{
		throw Error(fmt::format("Invalid mock data in '{}': {}", path.string(), e.what()));
	}
}

/**
 * @brief Paths and settings of a build
 */
struct Build
{
	std::string compiler;
	fs::path input;
	std::optional<fs::path> style;
	std::optional<fs::path> data;
	std::optional<fs::path> islands;
	std::optional<fs::path> output;
	std::string title;
	bool base_styles;
	bool pretty;
	bool bench;
};

/**
 * @brief Loads every input, compiles and writes the result
 *
 * @param build Build settings
 */
static void compile(const Build& build)
{
	Benchmark bench;
	CompilerOptions opts;
	if (build.data)
		opts.data = loadData(*build.data);
	if (!build.title.empty())
		opts.default_title = build.title;
	opts.base_styles = build.base_styles;
	opts.pretty = build.pretty;
	if (build.bench)
		opts.benchmark = &bench;

	std::unique_ptr<Compiler> c;
	if (build.compiler == "html")
		c = std::make_unique<HTMLCompiler>(std::move(opts));
	else if (build.compiler == "trace")
		c = std::make_unique<TraceCompiler>(std::move(opts));
	else
		throw Error(fmt::format("Unknown compiler: '{}'", build.compiler));

	const std::string source = readFile(build.input);
	const std::string style = build.style ? readFile(*build.style) : "";
	const Islands islands = build.islands ? loadIslands(*build.islands) : Islands{};

	const std::string res = c->compile(source, style, islands);
	if (!build.output)
		std::cout << res << std::flush;
	else
	{
		std::ofstream out(*build.output, std::ios::binary);
		if (!out.good())
			throw Error(fmt::format("Unable to open output file '{}'", build.output->string()));
		out.write(res.data(), res.size());
	}

	if (build.bench)
		fmt::print(stderr, "{}{}", Colors::paint(Colors::bold, fmt::format("{} compiler:\n", c->get_name())), bench.display());
}

/**
 * @brief Gets the latest modification time of every input
 *
 * Files that cannot be inspected are skipped.
 *
 * @param build Build settings
 * @returns Latest modification time
 */
[[nodiscard]] static fs::file_time_type latestChange(const Build& build)
{
	fs::file_time_type latest{};
	const auto visit = [&latest](const fs::path& path)
	{
		std::error_code ec;
		const auto time = fs::last_write_time(path, ec);
		if (!ec && time > latest)
			latest = time;
	};

	visit(build.input);
	if (build.style)
		visit(*build.style);
	if (build.data)
		visit(*build.data);
	if (build.islands)
	{
		std::error_code ec;
		visit(*build.islands);
		for (auto it = fs::recursive_directory_iterator(*build.islands, ec); !ec && it != fs::recursive_directory_iterator{}; it.increment(ec))
			visit(it->path());
	}

	return latest;
}

/**
 * @brief Compiles and reports errors
 *
 * @param build Build settings
 * @returns true on success
 */
static bool report(const Build& build)
{
	try
	{
		compile(build);
	}
	catch (Error& e)
	{
		std::cerr << Colors::paint(Colors::red, "Error: ") << e.what() << std::endl;
		return false;
	}
	catch (fs::filesystem_error& e)
	{
		std::cerr << Colors::paint(Colors::red, "Error: ") << e.what() << std::endl;
		return false;
	}
	return true;
}

/**
 * @brief Recompiles whenever an input changes
 *
 * A change is compiled once the inputs stay untouched for the debounce
 * period. Never returns.
 *
 * @param build Build settings
 * @param debounce Quiet period
 */
[[noreturn]] static void watch(const Build& build, std::chrono::milliseconds debounce)
{
	static constexpr auto poll = 50ms;

	auto compiled = latestChange(build);
	std::optional<std::chrono::steady_clock::time_point> pending;
	fs::file_time_type seen = compiled;

	fmt::print(stderr, "{}\n", Colors::paint(Colors::cyan, fmt::format("Watching '{}'...", build.input.string())));
	while (true)
	{
		std::this_thread::sleep_for(poll);

		const auto latest = latestChange(build);
		if (latest != seen)
		{
			seen = latest;
			pending = std::chrono::steady_clock::now();
			continue;
		}

		if (!pending || std::chrono::steady_clock::now() - *pending < debounce)
			continue;

		pending.reset();
		if (seen == compiled)
			continue;
		compiled = seen;

		if (report(build))
			fmt::print(stderr, "{}\n", Colors::paint(Colors::green, "Recompiled"));
	}
}

int main(int argc, char* argv[])
{
	std::setlocale(LC_ALL, "en_US.UTF-8");

	cxxopts::Options opts("nclp", "NCLP a live preview compiler for NCL templates");

	std::string in_file, out_file, style_file, data_file, islands_dir, compiler, title;
	std::size_t debounce;
	opts.add_options()
		("h,help",    "Displays help", cxxopts::value<bool>()->default_value("false"))
		("v,version", "Displays version", cxxopts::value<bool>()->default_value("false"))
		("i,input", "Sets input template", cxxopts::value<std::string>(in_file))
		("s,style", "Sets stylesheet appended after the base styles", cxxopts::value<std::string>(style_file))
		("d,data", "Sets JSON mock data file", cxxopts::value<std::string>(data_file))
		("I,islands", "Sets islands and includes directory", cxxopts::value<std::string>(islands_dir))
		("o,output", "Sets output file", cxxopts::value<std::string>(out_file))
		("c,compiler", "Sets compiler (html, trace)", cxxopts::value<std::string>(compiler)->default_value("html"))
		("t,title", "Sets default title", cxxopts::value<std::string>(title))
		("no-base-styles", "Omits the base styles", cxxopts::value<bool>()->default_value("false"))
		("p,pretty", "Indents the output", cxxopts::value<bool>()->default_value("false"))
		("b,bench", "Prints stage timings", cxxopts::value<bool>()->default_value("false"))
		("w,watch", "Recompiles when inputs change", cxxopts::value<bool>()->default_value("false"))
		("debounce", "Sets watch quiet period (ms)", cxxopts::value<std::size_t>(debounce)->default_value("300"))
		("no-colors", "Disables colors in messages", cxxopts::value<bool>()->default_value("false"));

	decltype(opts.parse(argc, argv)) result;
	try
	{
		result = opts.parse(argc, argv);
	}
	catch (cxxopts::OptionException& e)
	{
		std::cerr << e.what() << std::endl;
		std::exit(EXIT_FAILURE);
	}

	if (result["no-colors"].as<bool>())
		Colors::enabled = false;

	if (result["help"].as<bool>())
	{
		std::cout << opts.help() << std::endl;
		std::exit(EXIT_SUCCESS);
	}

	if (result["version"].as<bool>())
	{
		std::cout << "NCLP v0.1\n"
			<< "License: GNU Affero General Public License version 3 (AGPLv3)\n"
			<< "see <https://www.gnu.org/licenses/agpl-3.0.en.html>\n"
			<< "This is free software: you are free to change and redistribute it.\n"
			<< "There is NO WARRANTY, to the extent permitted by law.\n"
			<< "\n"
			<< "Author(s):\n"
			<< " - ef3d0c3e <ef3d0c3e@pundalik.org>\n";

		std::exit(EXIT_SUCCESS);
	}

	if (!result.count("input"))
	{
		std::cerr << Colors::paint(Colors::red, "You must specify an input file.") << std::endl;
		std::exit(EXIT_FAILURE);
	}

	const auto optionalPath = [&result](const std::string& name, const std::string& value) -> std::optional<fs::path>
	{
		if (!result.count(name))
			return std::nullopt;
		return fs::path{value};
	};

	const Build build{
		.compiler = compiler,
		.input = fs::path{in_file},
		.style = optionalPath("style", style_file),
		.data = optionalPath("data", data_file),
		.islands = optionalPath("islands", islands_dir),
		.output = optionalPath("output", out_file),
		.title = title,
		.base_styles = !result["no-base-styles"].as<bool>(),
		.pretty = result["pretty"].as<bool>(),
		.bench = result["bench"].as<bool>(),
	};

	if (!report(build) && !result["watch"].as<bool>())
		return EXIT_FAILURE;

	if (result["watch"].as<bool>())
		watch(build, std::chrono::milliseconds{debounce});

	return EXIT_SUCCESS;
}
