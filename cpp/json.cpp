#include <algorithm>
#include <charconv>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <variant>

#include "chars.hpp"
#include "json.hpp"
#include "matching.hpp"

template<typename T>
Result<T> ok(T val, std::string_view s)
{
	return Ok<T>{std::move(val), s};
}
template<typename T>
Result<T> err(Error e, std::string_view s)
{
	return Err{e, s};
}

template<typename T>
JsonPart part(T val, std::string_view s)
{
	return JsonPart{ok(Json{std::move(val)}, s)};
}
JsonPart nth(Error e, std::string_view s)
{
	return JsonPart{Err{e, s}};
}

auto parse_value(std::string_view s) -> JsonPart;

std::string_view next(std::string_view s, std::size_t increment = 1)
{
	return s.substr(increment);
}

template<typename F>
auto take(std::string_view s, F&& f) -> Result<std::string>
{
	const auto begin = std::begin(s);
	const auto end = std::end(s);
	const auto it = std::find_if_not(begin, end, std::forward<F>(f));
	if (it != begin)
	{
		return ok(std::string(begin, it), {it, end});
	}
	return Err{Error::EmptyString, s};
}

template<typename F>
auto ask(std::string_view s, F&& f) -> Result<std::string>
{
	std::string buf;
	buf.reserve(64);
	std::string_view span = s;
	while (not span.empty())
	{
		const auto r = f(span);
		if (std::holds_alternative<Err>(r))
		{
			auto [e, s] = std::get<Err>(r);
			return Err{e, s};
		}
		else if (std::holds_alternative<Ok<std::optional<std::string>>>(r))
		{
			const auto& [piece, cont] = std::get<Ok<std::optional<std::string>>>(r);
			if (piece.has_value())
			{
				buf += *piece;
				span = cont;
			}
			else break;
		}
		else return Err(Error::Failure, s);
	}
	return ok(std::move(buf), span);
}

template<typename F>
auto skip(std::string_view s, F&& f) -> std::string_view
{
	const auto begin = std::begin(s);
	const auto end = std::end(s);
	auto it = std::find_if_not(begin, end, std::forward<F>(f));
	return {it, end};
}

auto skip_ws(std::string_view s)
{
	return skip(s, is_ws);
}

auto chr(std::string_view s, char ch) -> Result<char>
{
	if (s.empty()) return Err{Error::OutOfBounds, s};
	if (s.front() == ch) return Ok<char>{ch, next(s)};
	return Err{Error::CharMismatch, s};
}

JsonPart parse_null(std::string_view s)
{
	return match(take(s, is_alpha),
		[](std::string&& str, std::string_view s) {
			if (str == "null") return part(null(), s);
			else return nth(Error::NullExpected, s);
		},
		[](Error e, std::string_view s) {
			return nth(e, s);
		});
}

JsonPart parse_true(std::string_view s)
{
	return match(take(s, is_alpha),
		[](std::string&& str, std::string_view s) {
			if (str == "true") return part(true, s);
			else return nth(Error::TrueExpected, s);
		},
		[](Error e, std::string_view s) {
			return nth(e, s);
		});
}

JsonPart parse_false(std::string_view s)
{
	return match(take(s, is_alpha),
		[](std::string&& str, std::string_view s) {
			if (str == "false") return part(false, s);
			else return nth(Error::FalseExpected, s);
		},
		[](Error e, std::string_view s) {
			return nth(e, s);
		});
}

auto to_ulong(const std::string& digits, std::string_view s) -> Result<unsigned long>
{
	unsigned long value = 0;
	const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
	if (ec != std::errc{}) return err<unsigned long>(Error::NumberOutOfRange, s);
	return ok(value, s);
}

// Digits after the '.', nullopt when the literal has no fraction.
auto parse_fraction(std::string_view s) -> Result<std::optional<std::string>>
{
	return match(chr(s, '.'),
		[](char, std::string_view s) {
			return match(take(s, is_digit),
				[](std::string&& digits, std::string_view s) {
					return ok(std::optional(std::move(digits)), s);
				},
				[](Error, std::string_view s) {
					return ok(std::optional(std::string()), s);
				});
		},
		[](Error, std::string_view s) {
			return ok<std::optional<std::string>>(std::nullopt, s);
		});
}

auto exponent_marker(std::string_view s) -> Result<char>
{
	if (s.empty()) return Err{Error::OutOfBounds, s};
	if (s.front() == 'e' or s.front() == 'E') return Ok<char>{s.front(), next(s)};
	return Err{Error::CharMismatch, s};
}

auto parse_exponent(std::string_view sv) -> Result<long>
{
	std::string_view s = sv;
	const bool negative = not s.empty() and s.front() == '-';
	if (not s.empty() and (s.front() == '-' or s.front() == '+')) s = next(s);
	return match(take(s, is_digit),
		[=](std::string&& str, std::string_view s){
			return match(to_ulong(str, s),
				[=](unsigned long magnitude, std::string_view s){
					if (magnitude > static_cast<unsigned long>(std::numeric_limits<long>::max()))
						return err<long>(Error::NumberOutOfRange, s);
					const long exponent = static_cast<long>(magnitude);
					return ok(negative ? -exponent : exponent, s);
				},
				[](Error e, std::string_view s){
					return err<long>(e, s);
				});
		},
		[](Error, std::string_view s){
			return err<long>(Error::ExponentRequired, s);
		});
}

auto parse_exponent_part(std::string_view s) -> Result<std::optional<long>>
{
	return match(exponent_marker(s),
		[](char, std::string_view s){
			return match(parse_exponent(s),
				[](long exponent, std::string_view s){
					return ok(std::optional(exponent), s);
				},
				[](Error e, std::string_view s){
					return err<std::optional<long>>(e, s);
				});
		},
		[](Error, std::string_view s){
			return ok<std::optional<long>>(std::nullopt, s);
		});
}

// Every 19 digit decimal fits in an unsigned long.
constexpr size_t max_digits = 19;

// Literals with more digits than a Number holds keep their leading
// significant digits, rounded half up, and become floating like any number
// a double cannot hold exactly.
auto rounded(const std::string& int_digits, const std::string& frac_digits, long exponent, std::string_view s) -> Result<Number>
{
	const std::string digits = int_digits + frac_digits;
	const auto first = digits.find_first_not_of('0');
	if (first == std::string::npos) return ok(Number{.floating=true}, s);
	const std::string_view significant = std::string_view(digits).substr(first);
	const auto kept = significant.substr(0, max_digits);
	unsigned long integer = 0;
	if (std::from_chars(kept.data(), kept.data() + kept.size(), integer).ec != std::errc{})
		return err<Number>(Error::NumberOutOfRange, s);
	if (significant.length() > kept.length() and significant[kept.length()] >= '5') ++integer;

	const long shift = static_cast<long>(significant.length() - kept.length()) - static_cast<long>(frac_digits.length());
	if ((shift > 0 and exponent > std::numeric_limits<long>::max() - shift)
		or (shift < 0 and exponent < std::numeric_limits<long>::min() - shift))
		return err<Number>(Error::NumberOutOfRange, s);
	return ok(Number{.integer=integer, .exponent=exponent + shift, .floating=true}, s);
}

auto make_number(const std::string& int_digits, const std::optional<std::string>& frac_digits, std::optional<long> exponent, std::string_view s) -> Result<Number>
{
	const std::string fraction_text = frac_digits.value_or(std::string());
	const bool floating = frac_digits.has_value() or exponent.has_value();
	unsigned long integer = 0;
	const auto [ptr, ec] = std::from_chars(int_digits.data(), int_digits.data() + int_digits.size(), integer);
	if (ec != std::errc{} or fraction_text.length() > max_digits)
		return rounded(int_digits, fraction_text, exponent.value_or(0), s);

	return match(fraction_text.empty() ? ok(0ul, s) : to_ulong(fraction_text, s),
		[&](unsigned long fraction, std::string_view s){
			return ok(Number{
				.integer=integer,
				.fraction=fraction,
				.precision=fraction_text.length(),
				.exponent=exponent.value_or(0),
				.floating=floating
			}, s);
		},
		[](Error e, std::string_view s){
			return err<Number>(e, s);
		});
}

auto parse_number_parts(std::string_view s) -> Result<Number>
{
	return match(take(s, is_digit),
		[&](std::string&& int_digits, std::string_view rest) {
			if (int_digits.length() > 1 and int_digits.front() == '0') return err<Number>(Error::LeadingZero, s);
			return match(parse_fraction(rest),
				[&](std::optional<std::string>&& frac_digits, std::string_view after_fraction){
					return match(parse_exponent_part(after_fraction),
						[&](std::optional<long> exponent, std::string_view after_exponent){
							return make_number(int_digits, frac_digits, exponent, after_exponent);
						},
						[](Error e, std::string_view s){
							return err<Number>(e, s);
						});
				},
				[](Error e, std::string_view s){
					return err<Number>(e, s);
				});
		},
		[](Error e, std::string_view s) {
			return err<Number>(e, s);
		});
}

JsonPart parse_number(std::string_view s)
{
	return match(parse_number_parts(s),
		[](Number&& num, std::string_view s){
			return part(std::move(num), s);
		},
		[](Error e, std::string_view s){
			return nth(e, s);
		});
}

JsonPart parse_negative_number(std::string_view s)
{
	return match(chr(s, '-'),
		[](char, std::string_view s){
			return match(parse_number_parts(s),
				[](Number&& num, std::string_view s){
					return part(-num, s);
				},
				[](Error e, std::string_view s){
					return nth(e, s);
				});
		},
		[](Error e, std::string_view s){
			return nth(e, s);
		});
}

using Piece = std::optional<std::string>;

auto hexword(std::string_view s) -> Result<char32_t>
{
	if (s.length() < 4) return err<char32_t>(Error::OutOfBounds, s);
	if (not is_hex(s[0])) return err<char32_t>(Error::HexCharExpected, s);
	if (not is_hex(s[1])) return err<char32_t>(Error::HexCharExpected, next(s, 1));
	if (not is_hex(s[2])) return err<char32_t>(Error::HexCharExpected, next(s, 2));
	if (not is_hex(s[3])) return err<char32_t>(Error::HexCharExpected, next(s, 3));
	unsigned value = 0;
	if (std::from_chars(s.data(), s.data() + 4, value, 16).ec != std::errc{})
		return err<char32_t>(Error::HexCharExpected, s);
	return ok(static_cast<char32_t>(value), next(s, 4));
}

bool is_high_surrogate(char32_t cp)
{
	return cp >= 0xD800 and cp <= 0xDBFF;
}

bool is_low_surrogate(char32_t cp)
{
	return cp >= 0xDC00 and cp <= 0xDFFF;
}

std::string utf8(char32_t cp)
{
	std::string out;
	if (cp < 0x80)
	{
		out += static_cast<char>(cp);
	}
	else if (cp < 0x800)
	{
		out += static_cast<char>(0xC0 | (cp >> 6));
		out += static_cast<char>(0x80 | (cp & 0x3F));
	}
	else if (cp < 0x10000)
	{
		out += static_cast<char>(0xE0 | (cp >> 12));
		out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
		out += static_cast<char>(0x80 | (cp & 0x3F));
	}
	else
	{
		out += static_cast<char>(0xF0 | (cp >> 18));
		out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
		out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
		out += static_cast<char>(0x80 | (cp & 0x3F));
	}
	return out;
}

// s starts after "\u". A high surrogate must be followed by an escaped low one.
auto unicode_escape(std::string_view s) -> Result<Piece>
{
	return match(hexword(s),
		[](char32_t high, std::string_view s){
			if (is_low_surrogate(high)) return err<Piece>(Error::InvalidSurrogate, s);
			if (not is_high_surrogate(high)) return ok<Piece>(utf8(high), s);
			if (not s.starts_with("\\u")) return err<Piece>(Error::InvalidSurrogate, s);
			return match(hexword(next(s, 2)),
				[=](char32_t low, std::string_view s){
					if (not is_low_surrogate(low)) return err<Piece>(Error::InvalidSurrogate, s);
					return ok<Piece>(utf8(0x10000 + ((high - 0xD800) << 10) + (low - 0xDC00)), s);
				},
				[](Error e, std::string_view s){
					return err<Piece>(e, s);
				});
		},
		[](Error e, std::string_view s){
			return err<Piece>(e, s);
		});
}

auto string_char(std::string_view s) -> Result<Piece>
{
	if (s.empty()) return err<Piece>(Error::OutOfBounds, s);
	const char ch = s[0];
	switch (ch)
	{
		case '"': return ok<Piece>(std::nullopt, next(s));
		case '\\':
		{
			auto cont = next(s);
			if (cont.length() < 1) return err<Piece>(Error::OutOfBounds, cont);
			switch (cont[0])
			{
				case '"': return ok<Piece>("\"", next(cont));
				case '\\': return ok<Piece>("\\", next(cont));
				case '/': return ok<Piece>("/", next(cont));
				case 'b': return ok<Piece>("\b", next(cont));
				case 'f': return ok<Piece>("\f", next(cont));
				case 'n': return ok<Piece>("\n", next(cont));
				case 'r': return ok<Piece>("\r", next(cont));
				case 't': return ok<Piece>("\t", next(cont));
				case 'u': return unicode_escape(next(cont));
				default: return err<Piece>(Error::UnrecognisedEscapeSequence, s);
			}
		}
		default: return ok<Piece>(std::string(1, ch), next(s));
	}
}

auto parse_string_raw(std::string_view s) -> Result<std::string>
{
	return match(chr(s, '"'),
		[](char, std::string_view s){
			return match(ask(s, string_char),
				[](std::string&& str, std::string_view s){
					return match(chr(s, '"'),
						[&](char, std::string_view s){
							return ok<std::string>(std::move(str), s);
						},
						[](Error e, std::string_view s){
							return err<std::string>(e, s);
						});
				},
				[](Error e, std::string_view s){
					return err<std::string>(e, s);
				});
		},
		[](Error e, std::string_view s){
			return err<std::string>(e, s);
		});
}

auto parse_string(std::string_view s) -> JsonPart
{
	return match(parse_string_raw(s),
		[](std::string&& str, std::string_view s){
			return part(std::move(str), s);
		},
		[](Error e, std::string_view s){
			return nth(e, s);
		});
}

auto parse_array_items_tail(Json&& head, std::string_view s) -> Result<Array>
{
	Array buf;
	buf.reserve(8);
	buf.push_back(std::move(head));
	std::string_view cont = s;
	while (not cont.empty())
	{
		const auto r = chr(skip_ws(cont), ',');
		if (std::holds_alternative<Err>(r))
		{
			auto [e, s] = std::get<Err>(r);
			return ok(std::move(buf), s);
		}
		else if (std::holds_alternative<Ok<char>>(r))
		{
			auto [c, s] = std::get<Ok<char>>(r);
			auto r = parse_value(s);
			if (std::holds_alternative<Err>(r))
			{
				auto [e, s] = std::get<Err>(r);
				return err<Array>(e, s);
			}
			else if (std::holds_alternative<Ok<Json>>(r))
			{
				auto&& [json, s] = std::get<Ok<Json>>(r);
				buf.push_back(std::move(json));
				cont = s;
			}
			else return err<Array>(Error::Failure, cont);
		}
		else return err<Array>(Error::Failure, cont);
	}
	return err<Array>(Error::OutOfBounds, cont);
}

// Empty only when ']' follows; otherwise the first element must parse.
auto parse_array_items(std::string_view s) -> Result<Array>
{
	const auto rest = skip_ws(s);
	if (rest.empty()) return err<Array>(Error::OutOfBounds, rest);
	if (rest.front() == ']') return ok(Array(), rest);
	return match(parse_value(rest),
		[](Json&& json, std::string_view s){
			return parse_array_items_tail(std::move(json), s);
		},
		[](Error e, std::string_view s){
			return err<Array>(e, s);
		});
}

auto parse_array(std::string_view s) -> JsonPart
{
	return match(chr(s, '['),
		[](char, std::string_view s){
			return match(parse_array_items(s),
				[](Array&& items, std::string_view s){
					return match(chr(skip_ws(s), ']'),
						[&](char, std::string_view s){
							return part(std::move(items), s);
						},
						[](Error e, std::string_view s){
							return nth(e, s);
						});
				},
				[](Error e, std::string_view s){
					return nth(e, s);
				});
		},
		[](Error e, std::string_view s){
			return nth(e, s);
		});
}

auto parse_object_items_tail(std::string key, Json&& value, std::string_view s) -> Result<Object>
{
	std::string_view cont = s;
	Object buf;
	buf.reserve(8);
	buf.emplace(std::move(key), std::move(value));
	while (not cont.empty())
	{
		const auto r = chr(skip_ws(cont), ',');
		if (std::holds_alternative<Err>(r))
		{
			auto [e, s] = std::get<Err>(r);
			return ok(std::move(buf), s);
		}
		else if (std::holds_alternative<Ok<char>>(r))
		{
			auto [c, s] = std::get<Ok<char>>(r);
			auto r = parse_string_raw(skip_ws(s));
			if (std::holds_alternative<Err>(r))
			{
				auto [e, s] = std::get<Err>(r);
				return err<Object>(e, s);
			}
			else if (std::holds_alternative<Ok<std::string>>(r))
			{
				auto&& [key, s] = std::get<Ok<std::string>>(r);
				const auto r = chr(skip_ws(s), ':');
				if (std::holds_alternative<Err>(r))
				{
					auto [e, s] = std::get<Err>(r);
					return err<Object>(e, s);
				}
				else if (std::holds_alternative<Ok<char>>(r))
				{
					auto [c, s] = std::get<Ok<char>>(r);
					auto r = parse_value(s);
					if (std::holds_alternative<Err>(r))
					{
						auto [e, s] = std::get<Err>(r);
						return err<Object>(e, s);
					}
					else if (std::holds_alternative<Ok<Json>>(r))
					{
						auto&& [value, s] = std::get<Ok<Json>>(r);
						cont = s;
						buf.insert_or_assign(std::move(key), std::move(value));
					}
					else return err<Object>(Error::Failure, cont);
				}
				else return err<Object>(Error::Failure, cont);
			}
			else return err<Object>(Error::Failure, cont);
		}
		else return err<Object>(Error::Failure, cont);
	}
	return err<Object>(Error::OutOfBounds, cont);
}

auto parse_object_items(std::string_view s) -> Result<Object>
{
	const auto rest = skip_ws(s);
	if (not rest.empty() and rest.front() == '}') return ok(Object(), rest);
	return match(parse_string_raw(rest),
		[](std::string&& key, std::string_view s){
			return match(chr(skip_ws(s), ':'),
				[&](char, std::string_view s){
					return match(parse_value(s),
						[&](Json&& value, std::string_view s){
							return parse_object_items_tail(std::move(key), std::move(value), s);
						},
						[](Error e, std::string_view s){
							return err<Object>(e, s);
						});
				},
				[](Error e, std::string_view s){
					return err<Object>(e, s);
				});
		},
		[](Error e, std::string_view s){
			return err<Object>(e, s);
		});
}

auto parse_object(std::string_view s) -> JsonPart
{
	return match(chr(s, '{'),
		[](char, std::string_view s){
			return match(parse_object_items(s),
				[](Object&& items, std::string_view s){
					return match(chr(skip_ws(s), '}'),
						[&](char, std::string_view s){
							return part(std::move(items), s);
						},
						[](Error e, std::string_view s){
							return nth(e, s);
						});
				},
				[](Error e, std::string_view s){
					return nth(e, s);
				});
		},
		[](Error e, std::string_view s){
			return nth(e, s);
		});
}

auto parse_value(std::string_view sv) -> JsonPart
{
	std::string_view s = skip_ws(sv);
	if (s.empty()) return nth(Error::InvalidValue, s);
	switch (s[0])
	{
		case 'n': return parse_null(s);
		case 't': return parse_true(s);
		case 'f': return parse_false(s);
		case '0'...'9': return parse_number(s);
		case '-': return parse_negative_number(s);
		case '"': return parse_string(s);
		case '[': return parse_array(s);
		case '{': return parse_object(s);
	}
	return nth(Error::InvalidValue, s);
}

auto parse(std::string_view sv) -> JsonResult
{
	std::string_view s = skip_ws(sv);
	if (s.empty()) return JsonResult(Err{Error::EmptyString, s});
	return match(parse_value(s),
		[](Json&& json, std::string_view sv){
			std::string_view s = skip_ws(sv);
			if (s.empty()) return JsonResult{std::move(json)};
			else return JsonResult{Err{Error::Garbage, s}};
		},
		[](Error e, std::string_view s){
			return JsonResult{Err{e, s}};
		});
}

auto escape(const std::string& str)
{
	std::string buf;
	buf.reserve(str.length());
	for (auto ch: str)
	{
		switch (ch)
		{
			case '\"': buf += "\\\""; break;
			case '\\': buf += "\\\\"; break;
			case '\r': buf += "\\r"; break;
			case '\n': buf += "\\n"; break;
			case '\t': buf += "\\t"; break;
			case '\b': buf += "\\b"; break;
			case '\f': buf += "\\f"; break;
			default: buf += ch;
		}
	}
	return buf;
}

// Fraction digits with the leading zeros the precision implies.
auto fraction_digits(const Number& num)
{
	const auto digits = std::to_string(num.fraction);
	return std::string(num.precision - std::min(num.precision, digits.length()), '0') + digits;
}

double Number::to_double() const
{
	std::string literal = negative ? "-" : "";
	literal += std::to_string(integer);
	if (precision > 0) literal += '.' + fraction_digits(*this);
	if (exponent != 0) literal += 'e' + std::to_string(exponent);
	double value = 0.0;
	const auto [ptr, ec] = std::from_chars(literal.data(), literal.data() + literal.size(), value);
	if (ec == std::errc::result_out_of_range)
	{
		const double magnitude = exponent < 0 ? 0.0 : std::numeric_limits<double>::infinity();
		return negative ? -magnitude : magnitude;
	}
	return value;
}

auto sorted_members(const Object& obj) -> std::vector<const Object::value_type*>
{
	std::vector<const Object::value_type*> members;
	members.reserve(obj.size());
	for (const auto& member: obj) members.push_back(&member);
	std::ranges::sort(members, {}, [](const Object::value_type* m) -> const std::string& {return m->first;});
	return members;
}

std::ostream& operator<<(std::ostream& o, Null)
{
	return o << "null";
}

std::ostream& operator<<(std::ostream& o, const Number& num)
{
	if (num.negative) o << '-';
	o << num.integer;
	if (num.precision > 0) o << '.' << fraction_digits(num);
	else if (num.floating and num.exponent == 0) o << ".0";
	if (num.exponent != 0) o << 'e' << num.exponent;
	return o;
}

std::ostream& operator<<(std::ostream& o, const Array& arr)
{
	o << '[';
	for (auto it = std::begin(arr); it != std::end(arr); ++it)
	{
		if (it != std::begin(arr)) o << ", ";
		o << *it;
	}
	o << ']';
	return o;
}

std::ostream& operator<<(std::ostream& o, const Object& obj)
{
	o << '{';
	const auto members = sorted_members(obj);
	for (auto it = std::begin(members); it != std::end(members); ++it)
	{
		auto& [key, value] = **it;
		if (it != std::begin(members)) o << ", ";
		o << '"' << escape(key) << "\": " << value;
	}
	o << '}';
	return o;
}

std::ostream& operator<<(std::ostream& o, const Json& json)
{
	return match(json.value,
		[&](const std::string& str) -> std::ostream& {
			return o << '"' << escape(str) << '"';
		},
		[&](bool b) -> std::ostream& {
			return o << (b ? "true" : "false");
		},
		[&](const auto& value) -> std::ostream& {
			return o << value;
		});
}

void write_pretty(std::ostream& o, const Json& json, size_t depth)
{
	const std::string pad((depth + 1) * 2, ' ');
	const std::string closing(depth * 2, ' ');
	match(json.value,
		[&](const Array& arr) {
			if (arr.empty())
			{
				o << "[]";
				return;
			}
			o << "[\n";
			for (auto it = std::begin(arr); it != std::end(arr); ++it)
			{
				if (it != std::begin(arr)) o << ",\n";
				o << pad;
				write_pretty(o, *it, depth + 1);
			}
			o << '\n' << closing << ']';
		},
		[&](const Object& obj) {
			if (obj.empty())
			{
				o << "{}";
				return;
			}
			o << "{\n";
			const auto members = sorted_members(obj);
			for (auto it = std::begin(members); it != std::end(members); ++it)
			{
				auto& [key, value] = **it;
				if (it != std::begin(members)) o << ",\n";
				o << pad << '"' << escape(key) << "\": ";
				write_pretty(o, value, depth + 1);
			}
			o << '\n' << closing << '}';
		},
		[&](const auto&) {
			o << json;
		});
}

auto pretty(const Json& json) -> std::string
{
	std::ostringstream o;
	write_pretty(o, json, 0);
	return o.str();
}

std::ostream& operator<<(std::ostream& o, const Error& error)
{
	switch (error)
	{
		case Error::EmptyString: return o << "EmptyString";
		case Error::CharMismatch: return o << "CharMismatch";
		case Error::HexCharExpected: return o << "HexCharExpected";
		case Error::NullExpected: return o << "NullExpected";
		case Error::TrueExpected: return o << "TrueExpected";
		case Error::FalseExpected: return o << "FalseExpected";
		case Error::ExponentRequired: return o << "ExponentRequired";
		case Error::UnrecognisedEscapeSequence: return o << "UnrecognisedEscapeSequence";
		case Error::InvalidValue: return o << "InvalidValue";
		case Error::OutOfBounds: return o << "OutOfBounds";
		case Error::Garbage: return o << "Garbage";
		case Error::NumberOutOfRange: return o << "NumberOutOfRange";
		case Error::LeadingZero: return o << "LeadingZero";
		case Error::InvalidSurrogate: return o << "InvalidSurrogate";
		case Error::Failure: return o << "Failure";
	}
	throw std::runtime_error("Invalid Error value");
}

