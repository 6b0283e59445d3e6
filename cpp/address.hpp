#pragma once

#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "json.hpp"

// One step of a JSONPath-like address. The first two are concrete locations,
// the rest are patterns that only make sense on the pattern side of prefixes().

struct Field
{
	std::string name;

	bool operator==(const Field&) const = default;
};

struct Index
{
	size_t value;

	bool operator==(const Index&) const = default;
};

// Matches start <= i < end.
struct IndexRange
{
	size_t start;
	size_t end;

	bool operator==(const IndexRange&) const = default;
};

struct IndexRangeFrom
{
	size_t start;

	bool operator==(const IndexRangeFrom&) const = default;
};

struct IndexRangeTo
{
	size_t end;

	bool operator==(const IndexRangeTo&) const = default;
};

struct WildcardIndex
{
	bool operator==(const WildcardIndex&) const = default;
};

struct WildcardField
{
	bool operator==(const WildcardField&) const = default;
};

using Step = std::variant<Index, IndexRange, IndexRangeFrom, IndexRangeTo, WildcardIndex, WildcardField, Field>;

// The root when there are no steps.
struct Address
{
	std::vector<Step> steps;

	bool is_root() const {return steps.empty();}
	bool operator==(const Address&) const = default;
};

inline Address root()
{
	return Address{};
}

auto append(const Address& address, Step step) -> Address;

enum class PathError
{
	Empty,
	RootExpected,
	Malformed,
	IndexOutOfRange,
};

using PathErr = std::pair<PathError, std::string_view>;

using AddressResult = std::variant<Address, PathErr>;

// Grammar:
//   address := '$' bracket? segment*
//   segment := '.' '*' | '.' ident bracket?
//   bracket := '[' ( digits | '*' | digits? ':' digits? ) ']'
//   ident   := [a-zA-Z_][a-zA-Z0-9_]*
bool is_valid_address(std::string_view s);

// Rejects anything is_valid_address() rejects before looking at segments.
auto parse_address(std::string_view s) -> AddressResult;

// True when every step of pattern matches the step of subject at the same
// position. subject may be longer: a pattern covers everything beneath it.
bool prefixes(const Address& pattern, const Address& subject);

// prefixes() restricted to addresses of the same length.
bool matches(const Address& pattern, const Address& subject);

// Follows Field and Index steps from the document root. nullptr when a step
// is missing, lands on the wrong container, or is a pattern step.
auto resolve(const Json& json, const Address& address) -> const Json*;

// Display form: ".a[0].b", or "(root)".
auto to_string(const Address& address) -> std::string;

// Re-parseable form: "$.a[0].b", or "$".
auto to_jsonpath(const Address& address) -> std::string;

std::ostream& operator<<(std::ostream& o, const Step& step);
std::ostream& operator<<(std::ostream& o, const Address& address);
std::ostream& operator<<(std::ostream& o, const PathError& error);

template<>
struct std::hash<Address>
{
	size_t operator()(const Address& address) const noexcept;
};
