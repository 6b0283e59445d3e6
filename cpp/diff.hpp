#pragma once

#include <ostream>
#include <string>
#include <variant>
#include <vector>

#include "address.hpp"
#include "json.hpp"

enum class CompareMode
{
	// Everything in expected must be found in actual; actual may carry more.
	Inclusive,
	// Both sides must match exactly.
	Strict,
};

enum class NumericMode
{
	// 1 and 1.0 differ.
	Strict,
	// Both sides are converted to double before comparing.
	AssumeFloat,
};

struct Config
{
	CompareMode compare_mode;
	NumericMode numeric_mode = NumericMode::Strict;
	std::vector<Address> ignore_paths = {};
	std::vector<Address> ignore_orders = {};

	// Covered by some ignore path, including from above.
	bool to_ignore(const Address& address) const;
	// Arrays at this exact location are compared as multisets.
	bool to_ignore_order(const Address& address) const;
};

using ConfigResult = std::variant<Config, PathErr>;

// Fails on the first path text that does not parse.
auto make_config(CompareMode compare_mode, NumericMode numeric_mode,
	const std::vector<std::string>& ignore_paths,
	const std::vector<std::string>& ignore_orders) -> ConfigResult;

// A mismatch at one location. A null side is absent there. The values
// point into the documents passed to diff() and live as long as they do.
struct Difference
{
	Address address;
	const Json* actual;
	const Json* expected;
	CompareMode mode;
};

// Walks both documents. Members and elements are visited in the order the
// expected side gives them in Inclusive mode, and over the union of both
// sides in Strict mode.
auto diff(const Json& actual, const Json& expected, const Config& config) -> std::vector<Difference>;

// Same walk, stopping at the first difference that is not ignored.
bool differs(const Json& actual, const Json& expected, const Config& config);

// Throws std::logic_error for combinations the walk never records.
auto render(const Difference& difference) -> std::string;

std::ostream& operator<<(std::ostream& o, const Difference& difference);
