#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>
#include <ostream>

struct Null
{
	bool operator==(const Null&) const = default;
};

// Number literal kept in parts. `floating` is set when the literal had a
// fraction or an exponent, which is what separates 1 from 1.0.
struct Number
{
	bool negative = false;
	unsigned long integer = 0;
	unsigned long fraction = 0;
	size_t precision = 0;
	long exponent = 0;
	bool floating = false;

	bool operator==(const Number&) const = default;

	double to_double() const;
};

inline Number operator-(Number n)
{
	n.negative = not n.negative;
	return n;
}

struct Json;

using Array = std::vector<Json>;
using Object = std::unordered_map<std::string, Json>;

struct NonCopyable
{
	constexpr NonCopyable() noexcept = default;
	NonCopyable(const NonCopyable&) = delete;
	constexpr NonCopyable(NonCopyable&&) noexcept = default;

	NonCopyable& operator=(NonCopyable&&) = default;
	NonCopyable& operator=(const NonCopyable&) = delete;
};

struct Json
{
	using t = std::variant<Null, bool, Number, std::string, Array, Object>;

	bool operator==(const Json& other) const {return value == other.value;};

	t value;
	[[no_unique_address]] NonCopyable _n = {};
};

static_assert(std::is_nothrow_move_constructible_v<Json>);
static_assert(std::is_aggregate_v<Json>);
static_assert(not std::is_copy_constructible_v<Json>);

enum class Error
{
	EmptyString,
	CharMismatch,
	HexCharExpected,
	NullExpected,
	TrueExpected,
	FalseExpected,
	ExponentRequired,
	UnrecognisedEscapeSequence,
	InvalidValue,
	OutOfBounds,
	Garbage,
	NumberOutOfRange,
	LeadingZero,
	InvalidSurrogate,
	Failure,
};

template<typename T>
using Ok = std::pair<T, std::string_view>;
using Err = std::pair<Error, std::string_view>;

template<typename T>
using Result = std::variant<Ok<T>, Err>;

using JsonPart = Result<Json>;

using JsonResult = std::variant<Json, Err>;

inline Json null()
{
	return Json{Null{}};
}

inline Json True()
{
	return Json{true};
}

inline Json False()
{
	return Json{false};
}

auto parse(std::string_view s) -> JsonResult;

// Members of an object ordered by key.
auto sorted_members(const Object& obj) -> std::vector<const Object::value_type*>;

// Indented rendering with sorted keys, two spaces per level.
auto pretty(const Json& json) -> std::string;

std::ostream& operator<<(std::ostream& o, const Json& json);
std::ostream& operator<<(std::ostream& o, const Error& error);
