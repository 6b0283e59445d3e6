#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include "diff.hpp"
#include "matching.hpp"

namespace
{

struct Collect
{
	std::vector<Difference>& out;

	bool record(const Address& at, const Json* actual, const Json* expected, CompareMode mode)
	{
		out.push_back(Difference{at, actual, expected, mode});
		return true;
	}
};

// Stops the walk at the first recorded difference.
struct Detect
{
	bool record(const Address&, const Json*, const Json*, CompareMode)
	{
		return false;
	}
};

// -0 has no integer representation and reads as the double -0.0.
bool is_floating(const Number& n)
{
	return n.floating or (n.negative and n.integer == 0);
}

bool numbers_equal(const Number& a, const Number& b, NumericMode mode)
{
	if (mode == NumericMode::AssumeFloat) return a.to_double() == b.to_double();
	if (is_floating(a) != is_floating(b)) return false;
	if (is_floating(a)) return a.to_double() == b.to_double();
	return a.integer == b.integer and a.negative == b.negative;
}

// Every member returns false once the sink asks to stop.
template<typename Sink>
struct Walk
{
	const Config& config;
	Sink& sink;

	// Ignore paths are checked here, at every point a difference is recorded,
	// so subtrees below an ignored location are still walked.
	bool emit(const Address& at, const Json* actual, const Json* expected)
	{
		if (config.to_ignore(at)) return true;
		return sink.record(at, actual, expected, config.compare_mode);
	}

	bool operator()(const Json& actual, const Json& expected, const Address& at)
	{
		return match(expected.value,
			[&](const Number& e) {
				const auto* a = as<Number>(actual.value);
				if (a != nullptr and numbers_equal(*a, e, config.numeric_mode)) return true;
				return emit(at, &actual, &expected);
			},
			[&](const Array& e) {
				const auto* a = as<Array>(actual.value);
				if (a == nullptr) return emit(at, &actual, &expected);
				if (config.to_ignore_order(at)) return unordered(actual, expected, *a, e, at);
				return ordered(*a, e, at);
			},
			[&](const Object& e) {
				const auto* a = as<Object>(actual.value);
				if (a == nullptr) return emit(at, &actual, &expected);
				return members(*a, e, at);
			},
			[&](const auto&) {
				if (actual == expected) return true;
				return emit(at, &actual, &expected);
			});
	}

	bool ordered(const Array& actual, const Array& expected, const Address& at)
	{
		const size_t count = config.compare_mode == CompareMode::Strict
			? std::max(actual.size(), expected.size())
			: expected.size();
		for (size_t i = 0; i < count; ++i)
		{
			const auto path = append(at, Index{i});
			bool keep_going = true;
			if (i < actual.size() and i < expected.size()) keep_going = (*this)(actual[i], expected[i], path);
			else if (i < expected.size()) keep_going = emit(path, nullptr, &expected[i]);
			else keep_going = emit(path, &actual[i], nullptr);
			if (not keep_going) return false;
		}
		return true;
	}

	bool members(const Object& actual, const Object& expected, const Address& at)
	{
		std::vector<const std::string*> keys;
		keys.reserve(expected.size());
		for (const auto& [key, value]: expected) keys.push_back(&key);
		if (config.compare_mode == CompareMode::Strict)
		{
			for (const auto& [key, value]: actual)
			{
				if (not expected.contains(key)) keys.push_back(&key);
			}
		}
		std::ranges::sort(keys, {}, [](const std::string* key) -> const std::string& {return *key;});

		for (const auto* key: keys)
		{
			const auto path = append(at, Field{*key});
			const auto a = actual.find(*key);
			const auto e = expected.find(*key);
			bool keep_going = true;
			if (a != actual.end() and e != expected.end()) keep_going = (*this)(a->second, e->second, path);
			else if (e != expected.end()) keep_going = emit(path, nullptr, &e->second);
			else keep_going = emit(path, &a->second, nullptr);
			if (not keep_going) return false;
		}
		return true;
	}

	// Greedy first-fit: each expected element claims the first unclaimed
	// actual element it walks against without differences. There is no
	// backtracking, so an element can take a candidate a later element needed
	// and the later one is reported as unmatched. Mismatches are recorded
	// against the whole array, not per element.
	bool unordered(const Json& actual_json, const Json& expected_json, const Array& actual, const Array& expected, const Address& at)
	{
		const bool length_mismatch = expected.size() > actual.size()
			or (config.compare_mode == CompareMode::Strict and expected.size() != actual.size());
		if (length_mismatch and not emit(at, &actual_json, &expected_json)) return false;

		std::vector<bool> claimed(actual.size(), false);
		size_t matched = 0;
		for (size_t i = 0; i < expected.size(); ++i)
		{
			const auto path = append(at, Index{i});
			bool found = false;
			for (size_t j = 0; j < actual.size() and not found; ++j)
			{
				if (claimed[j]) continue;
				Detect probe;
				if (not Walk<Detect>{config, probe}(actual[j], expected[i], path)) continue;
				claimed[j] = true;
				found = true;
				++matched;
			}
			if (not found and not emit(at, &actual_json, &expected_json)) return false;
		}
		if (matched != actual.size()) return emit(at, &actual_json, &expected_json);
		return true;
	}
};

auto parse_all(const std::vector<std::string>& texts) -> std::variant<std::vector<Address>, PathErr>
{
	std::vector<Address> addresses;
	addresses.reserve(texts.size());
	for (const auto& text: texts)
	{
		auto r = parse_address(text);
		if (std::holds_alternative<PathErr>(r)) return std::get<PathErr>(r);
		addresses.push_back(std::move(std::get<Address>(r)));
	}
	return addresses;
}

auto indent(const std::string& text, size_t width)
{
	const std::string pad(width, ' ');
	std::istringstream lines(text);
	std::string out;
	std::string line;
	while (std::getline(lines, line))
	{
		if (not out.empty()) out += '\n';
		out += pad + line;
	}
	return out;
}

}

bool Config::to_ignore(const Address& address) const
{
	return std::ranges::any_of(ignore_paths, [&](const Address& pattern) {return prefixes(pattern, address);});
}

bool Config::to_ignore_order(const Address& address) const
{
	return std::ranges::any_of(ignore_orders, [&](const Address& pattern) {return matches(pattern, address);});
}

auto make_config(CompareMode compare_mode, NumericMode numeric_mode,
	const std::vector<std::string>& ignore_paths,
	const std::vector<std::string>& ignore_orders) -> ConfigResult
{
	return match(parse_all(ignore_paths),
		[&](std::vector<Address>&& paths) {
			return match(parse_all(ignore_orders),
				[&](std::vector<Address>&& orders) {
					return ConfigResult{Config{compare_mode, numeric_mode, std::move(paths), std::move(orders)}};
				},
				[](PathError e, std::string_view s) {
					return ConfigResult{PathErr{e, s}};
				});
		},
		[](PathError e, std::string_view s) {
			return ConfigResult{PathErr{e, s}};
		});
}

auto diff(const Json& actual, const Json& expected, const Config& config) -> std::vector<Difference>
{
	std::vector<Difference> out;
	Collect sink{out};
	Walk<Collect>{config, sink}(actual, expected, root());
	return out;
}

bool differs(const Json& actual, const Json& expected, const Config& config)
{
	Detect sink;
	return not Walk<Detect>{config, sink}(actual, expected, root());
}

auto render(const Difference& difference) -> std::string
{
	const auto path = to_string(difference.address);
	const auto* actual = difference.actual;
	const auto* expected = difference.expected;
	if (actual != nullptr and expected != nullptr)
	{
		return fmt::format("json atoms at path \"{}\" are not equal:\n    expected:\n{}\n    actual:\n{}",
			path, indent(pretty(*expected), 8), indent(pretty(*actual), 8));
	}
	if (expected != nullptr) return fmt::format("json atom at path \"{}\" is missing from actual", path);
	if (actual == nullptr) throw std::logic_error("difference without either side");
	if (difference.mode == CompareMode::Inclusive) throw std::logic_error("inclusive comparison never reports data missing from expected");
	return fmt::format("json atom at path \"{}\" is missing from expected", path);
}

std::ostream& operator<<(std::ostream& o, const Difference& difference)
{
	return o << render(difference);
}
