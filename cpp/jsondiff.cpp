#include "diff.hpp"
#include "json.hpp"
#include "matching.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/ostream.h>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

constexpr auto usage = "usage: jsondiff [--inclusive] [--assume-float] [--ignore PATH]... [--ignore-order PATH]... ACTUAL EXPECTED\n"
	"       jsondiff -p|--print FILE";

struct Options
{
	CompareMode compare_mode = CompareMode::Strict;
	NumericMode numeric_mode = NumericMode::Strict;
	std::vector<std::string> ignore_paths;
	std::vector<std::string> ignore_orders;
	std::vector<const char*> files;
	bool print = false;
};

std::optional<std::string> read_file(const char* file_name)
{
	std::ifstream f(file_name);
	if (not f) return std::nullopt;
	std::string contents{std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>()};
	return contents;
}

std::optional<Options> parse_args(int argc, char *argv[])
{
	Options options;
	for (int i = 1; i < argc; ++i)
	{
		const std::string_view arg = argv[i];
		const bool takes_value = arg == "--ignore" or arg == "--ignore-order";
		if (takes_value and i + 1 >= argc)
		{
			spdlog::error("{} needs a path", arg);
			return std::nullopt;
		}
		if (arg == "-p" or arg == "--print") options.print = true;
		else if (arg == "--inclusive") options.compare_mode = CompareMode::Inclusive;
		else if (arg == "--assume-float") options.numeric_mode = NumericMode::AssumeFloat;
		else if (arg == "--ignore") options.ignore_paths.emplace_back(argv[++i]);
		else if (arg == "--ignore-order") options.ignore_orders.emplace_back(argv[++i]);
		else if (arg.starts_with("-"))
		{
			spdlog::error("unknown option {}", arg);
			return std::nullopt;
		}
		else options.files.push_back(argv[i]);
	}
	return options;
}

std::optional<Json> load(const char* file)
{
	const auto text = read_file(file);
	if (not text)
	{
		spdlog::error("cannot read {}", file);
		return std::nullopt;
	}
	return match(parse(*text),
		[](Json&& json) -> std::optional<Json> {
			return std::move(json);
		},
		[&](Error e, std::string_view rest) -> std::optional<Json> {
			spdlog::error("{}: {} at offset {}", file, fmt::streamed(e), text->size() - rest.size());
			return std::nullopt;
		});
}

int compare(const Options& options)
{
	const auto actual = load(options.files[0]);
	const auto expected = load(options.files[1]);
	if (not actual or not expected) return 2;

	return match(make_config(options.compare_mode, options.numeric_mode, options.ignore_paths, options.ignore_orders),
		[&](Config&& config) {
			spdlog::debug("{} comparison, {} numbers, {} ignored, {} unordered",
				config.compare_mode == CompareMode::Strict ? "strict" : "inclusive",
				config.numeric_mode == NumericMode::Strict ? "strict" : "float",
				config.ignore_paths.size(), config.ignore_orders.size());
			const auto differences = diff(*actual, *expected, config);
			for (const auto& difference: differences) std::cout << difference << "\n";
			spdlog::info("{} difference(s) between {} and {}", differences.size(), options.files[0], options.files[1]);
			return differences.empty() ? 0 : 1;
		},
		[](PathError e, std::string_view text) {
			spdlog::error("invalid path '{}': {}", text, fmt::streamed(e));
			return 2;
		});
}

int main(int argc, char *argv[])
{
	spdlog::set_default_logger(spdlog::stderr_color_mt("jsondiff"));
	spdlog::cfg::load_env_levels();

	const auto options = parse_args(argc, argv);
	if (not options) return 2;
	if (options->print and options->files.size() == 1)
	{
		const auto json = load(options->files[0]);
		if (not json) return 2;
		std::cout << *json << "\n";
		return 0;
	}
	if (options->print or options->files.size() != 2)
	{
		spdlog::error("{}", usage);
		return 2;
	}
	return compare(*options);
}
