#include <algorithm>
#include <charconv>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <type_traits>

#include "address.hpp"
#include "chars.hpp"
#include "matching.hpp"

namespace
{

using Rest = std::optional<std::string_view>;
using StepResult = std::variant<Step, PathErr>;

Rest expect(std::string_view s, char ch)
{
	if (s.empty() or s.front() != ch) return std::nullopt;
	return s.substr(1);
}

std::string_view skip_digits(std::string_view s)
{
	return {std::find_if_not(std::begin(s), std::end(s), is_digit), std::end(s)};
}

Rest scan_bracket(std::string_view s)
{
	const auto open = expect(s, '[');
	if (not open) return std::nullopt;
	if (const auto star = expect(*open, '*')) return expect(*star, ']');
	const auto after_start = skip_digits(*open);
	if (const auto colon = expect(after_start, ':')) return expect(skip_digits(*colon), ']');
	if (after_start.length() == open->length()) return std::nullopt;
	return expect(after_start, ']');
}

Rest scan_segment(std::string_view s)
{
	const auto dot = expect(s, '.');
	if (not dot) return std::nullopt;
	if (const auto star = expect(*dot, '*')) return star;
	if (dot->empty() or not is_ident_start(dot->front())) return std::nullopt;
	const std::string_view after{std::find_if_not(std::begin(*dot), std::end(*dot), is_ident), std::end(*dot)};
	if (not after.empty() and after.front() == '[') return scan_bracket(after);
	return after;
}

std::optional<size_t> to_index(std::string_view digits)
{
	size_t value = 0;
	const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
	if (ec != std::errc{} or ptr != digits.data() + digits.size()) return std::nullopt;
	return value;
}

// Bracket tokens arrive with their closing ']' and without the '['.
auto parse_step(std::string_view token, std::string_view text) -> StepResult
{
	if (not token.ends_with(']'))
	{
		if (token == "*") return Step{WildcardField{}};
		return Step{Field{std::string(token)}};
	}
	token.remove_suffix(1);
	if (token == "*" or token == ":") return Step{WildcardIndex{}};

	const auto colon = token.find(':');
	if (colon == std::string_view::npos)
	{
		const auto index = to_index(token);
		if (not index) return PathErr{PathError::IndexOutOfRange, text};
		return Step{Index{*index}};
	}

	const auto start_digits = token.substr(0, colon);
	const auto end_digits = token.substr(colon + 1);
	const auto start = to_index(start_digits);
	const auto end = to_index(end_digits);
	if (start_digits.empty())
	{
		if (not end) return PathErr{PathError::IndexOutOfRange, text};
		return Step{IndexRangeTo{*end}};
	}
	if (not start) return PathErr{PathError::IndexOutOfRange, text};
	if (end_digits.empty()) return Step{IndexRangeFrom{*start}};
	if (not end) return PathErr{PathError::IndexOutOfRange, text};
	return Step{IndexRange{*start, *end}};
}

bool step_matches(const Step& pattern, const Step& subject)
{
	return match2(pattern, subject,
		[](const WildcardField&, const Field&) {
			return true;
		},
		[](const WildcardIndex&, const Index&) {
			return true;
		},
		[](const IndexRange& range, const Index& index) {
			return range.start <= index.value and index.value < range.end;
		},
		[](const IndexRangeFrom& range, const Index& index) {
			return range.start <= index.value;
		},
		[](const IndexRangeTo& range, const Index& index) {
			return index.value < range.end;
		},
		[]<typename P, typename S>(const P& p, const S& s) {
			if constexpr (std::is_same_v<P, S>) return p == s;
			else return false;
		});
}

size_t hash_step(const Step& step)
{
	const size_t payload = match(step,
		[](const Field& field) {
			return std::hash<std::string>{}(field.name);
		},
		[](const Index& index) {
			return std::hash<size_t>{}(index.value);
		},
		[](const IndexRange& range) {
			return std::hash<size_t>{}(range.start) * 31 + std::hash<size_t>{}(range.end);
		},
		[](const IndexRangeFrom& range) {
			return std::hash<size_t>{}(range.start);
		},
		[](const IndexRangeTo& range) {
			return std::hash<size_t>{}(range.end);
		},
		[](const auto&) {
			return size_t{0};
		});
	return payload * 8 + step.index();
}

}

auto append(const Address& address, Step step) -> Address
{
	Address copy = address;
	copy.steps.push_back(std::move(step));
	return copy;
}

bool is_valid_address(std::string_view s)
{
	auto rest = expect(s, '$');
	if (rest and not rest->empty() and rest->front() == '[') rest = scan_bracket(*rest);
	while (rest and not rest->empty()) rest = scan_segment(*rest);
	return rest.has_value();
}

auto parse_address(std::string_view s) -> AddressResult
{
	if (s.empty()) return PathErr{PathError::Empty, s};
	if (s.front() != '$') return PathErr{PathError::RootExpected, s};
	if (not is_valid_address(s)) return PathErr{PathError::Malformed, s};

	Address address;
	// Every remaining token starts with a separator: '.' for fields, '[' for brackets.
	std::string_view body = s.substr(1);
	while (not body.empty())
	{
		body.remove_prefix(1);
		const auto end = body.find_first_of(".[");
		auto step = parse_step(body.substr(0, end), s);
		if (std::holds_alternative<PathErr>(step)) return std::get<PathErr>(step);
		address.steps.push_back(std::move(std::get<Step>(step)));
		body = end == std::string_view::npos ? std::string_view{} : body.substr(end);
	}
	return address;
}

bool prefixes(const Address& pattern, const Address& subject)
{
	if (pattern.is_root()) return true;
	if (subject.is_root()) return false;
	if (pattern.steps.size() > subject.steps.size()) return false;
	return std::equal(std::begin(pattern.steps), std::end(pattern.steps), std::begin(subject.steps), step_matches);
}

bool matches(const Address& pattern, const Address& subject)
{
	return pattern.steps.size() == subject.steps.size() and prefixes(pattern, subject);
}

auto resolve(const Json& json, const Address& address) -> const Json*
{
	const Json* current = &json;
	for (const auto& step: address.steps)
	{
		current = match(step,
			[&](const Field& field) -> const Json* {
				const auto* obj = as<Object>(current->value);
				if (obj == nullptr) return nullptr;
				const auto it = obj->find(field.name);
				return it == obj->end() ? nullptr : &it->second;
			},
			[&](const Index& index) -> const Json* {
				const auto* arr = as<Array>(current->value);
				if (arr == nullptr or index.value >= arr->size()) return nullptr;
				return &(*arr)[index.value];
			},
			[](const auto&) -> const Json* {
				return nullptr;
			});
		if (current == nullptr) return nullptr;
	}
	return current;
}

auto to_string(const Address& address) -> std::string
{
	std::ostringstream o;
	o << address;
	return o.str();
}

auto to_jsonpath(const Address& address) -> std::string
{
	std::ostringstream o;
	o << '$';
	for (const auto& step: address.steps) o << step;
	return o.str();
}

std::ostream& operator<<(std::ostream& o, const Step& step)
{
	return match(step,
		[&](const Field& field) -> std::ostream& {
			return o << '.' << field.name;
		},
		[&](const Index& index) -> std::ostream& {
			return o << '[' << index.value << ']';
		},
		[&](const IndexRange& range) -> std::ostream& {
			return o << '[' << range.start << ':' << range.end << ']';
		},
		[&](const IndexRangeFrom& range) -> std::ostream& {
			return o << '[' << range.start << ":]";
		},
		[&](const IndexRangeTo& range) -> std::ostream& {
			return o << "[:" << range.end << ']';
		},
		[&](const WildcardIndex&) -> std::ostream& {
			return o << "[*]";
		},
		[&](const WildcardField&) -> std::ostream& {
			return o << ".*";
		});
}

std::ostream& operator<<(std::ostream& o, const Address& address)
{
	if (address.is_root()) return o << "(root)";
	for (const auto& step: address.steps) o << step;
	return o;
}

std::ostream& operator<<(std::ostream& o, const PathError& error)
{
	switch (error)
	{
		case PathError::Empty: return o << "Empty";
		case PathError::RootExpected: return o << "RootExpected";
		case PathError::Malformed: return o << "Malformed";
		case PathError::IndexOutOfRange: return o << "IndexOutOfRange";
	}
	throw std::runtime_error("Invalid PathError value");
}

size_t std::hash<Address>::operator()(const Address& address) const noexcept
{
	size_t seed = address.steps.size();
	for (const auto& step: address.steps) seed ^= hash_step(step) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
	return seed;
}
