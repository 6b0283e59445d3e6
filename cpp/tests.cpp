#include "testing.hpp"
#include "json.hpp"
#include "matching.hpp"

#include <limits>
#include <sstream>

#define FAILS(f, arg, expected_error) \
	match(f(arg), \
		[](Json&& actual_json){ \
			CAPTURE(actual_json, expected_error); \
			CHECK(false); \
		}, \
		[](Error actual_error, std::string_view){ \
			CHECK(expected_error == actual_error); \
		})

#define OK(f, arg, expected_json) \
	match(f(arg), \
		[](Json&& actual_json){ \
			CHECK(actual_json == expected_json); \
		}, \
		[](Error actual_error, std::string_view){ \
			CAPTURE(actual_error, expected_json); \
			CHECK(false); \
		})

TEST_CASE("basic cases")
{
	FAILS(parse, "", Error::EmptyString);
	FAILS(parse, "x", Error::InvalidValue);
}

TEST_CASE("literals")
{
	OK(parse, "null", Json{Null{}});
	OK(parse, "true", Json{true});
	OK(parse, "false", Json{false});
	FAILS(parse, "truefalse", Error::TrueExpected);
	FAILS(parse, "nul", Error::NullExpected);
}

TEST_CASE("numbers")
{
	OK(parse, "42", (Json{Number{.integer=42}}));
	OK(parse, "0", (Json{Number{}}));
	OK(parse, "-1", (Json{Number{.negative=true, .integer=1}}));
	OK(parse, "1.23", (Json{Number{.integer=1, .fraction=23, .precision=2, .floating=true}}));
	OK(parse, "1.230", (Json{Number{.integer=1, .fraction=230, .precision=3, .floating=true}}));
	OK(parse, "1.", (Json{Number{.integer=1, .floating=true}}));
	OK(parse, "0.", (Json{Number{.floating=true}}));
	OK(parse, "-0.", (Json{Number{.negative=true, .floating=true}}));
	OK(parse, "6.999e3", (Json{Number{.integer=6, .fraction=999, .precision=3, .exponent=3, .floating=true}}));
	OK(parse, "-1.2e9", (Json{Number{.negative=true, .integer=1, .fraction=2, .precision=1, .exponent=9, .floating=true}}));
	FAILS(parse, "6.999e", Error::ExponentRequired);
	OK(parse, "1.e1", (Json{Number{.integer=1, .exponent=1, .floating=true}}));
	FAILS(parse, "1.x", Error::Garbage);
	FAILS(parse, "1.y", Error::Garbage);
	FAILS(parse, ".12", Error::InvalidValue);
	FAILS(parse, "-.12", Error::EmptyString);
	OK(parse, "1.05", (Json{Number{.integer=1, .fraction=5, .precision=2, .floating=true}}));
	OK(parse, "2E+4", (Json{Number{.integer=2, .exponent=4, .floating=true}}));
	OK(parse, "5e-3", (Json{Number{.integer=5, .exponent=-3, .floating=true}}));
	FAILS(parse, "5e+", Error::ExponentRequired);
	OK(parse, "123456789012345678901234567890", (Json{Number{.integer=1234567890123456789, .exponent=11, .floating=true}}));
	OK(parse, "1.123456789012345678901234567890", (Json{Number{.integer=1123456789012345679, .exponent=-18, .floating=true}}));
	OK(parse, "18446744073709551615", (Json{Number{.integer=18446744073709551615ul}}));
	OK(parse, "18446744073709551616", (Json{Number{.integer=1844674407370955162, .exponent=1, .floating=true}}));
	OK(parse, "0.00000000000000000000000012", (Json{Number{.integer=12, .exponent=-26, .floating=true}}));
	OK(parse, "0.00000000000000000000", (Json{Number{.floating=true}}));
	FAILS(parse, "1e99999999999999999999", Error::NumberOutOfRange);
	FAILS(parse, "01", Error::LeadingZero);
	FAILS(parse, "-01", Error::LeadingZero);
	FAILS(parse, "00.5", Error::LeadingZero);
	OK(parse, "0.5", (Json{Number{.fraction=5, .precision=1, .floating=true}}));
}

TEST_CASE("number conversion")
{
	CHECK(Number{.integer=42}.to_double() == 42.0);
	CHECK(Number{.negative=true, .integer=1, .fraction=5, .precision=1, .floating=true}.to_double() == -1.5);
	CHECK(Number{.integer=1, .fraction=5, .precision=2, .floating=true}.to_double() == 1.05);
	CHECK(Number{.integer=25, .exponent=-2, .floating=true}.to_double() == 0.25);
	CHECK(Number{.integer=1, .exponent=400, .floating=true}.to_double() == std::numeric_limits<double>::infinity());
	CHECK(Number{.negative=true, .integer=1, .exponent=-400, .floating=true}.to_double() == 0.0);
	CHECK(std::get<Number>(json("3.14159265358979323846264").value).to_double() == 3.14159265358979323846);
	CHECK(std::get<Number>(json("18446744073709551616").value).to_double() == 18446744073709551616.0);
}

TEST_CASE("strings")
{
	OK(parse, R"("")", (Json{std::string()}));
	FAILS(parse, R"(")", (Error::OutOfBounds));
	OK(parse, R"("foobar")", (Json{std::string("foobar")}));
	OK(parse, R"("a\nb")", (Json{std::string("a\nb")}));
	OK(parse, R"("foo\\bar")", (Json{std::string(R"(foo\bar)")}));
	OK(parse, R"("foo bar")", (Json{std::string(R"(foo bar)")}));
	OK(parse, R"("foo/bar")", (Json{std::string(R"(foo/bar)")}));
	FAILS(parse, R"("foobar)", (Error::OutOfBounds));
	FAILS(parse, R"("foo"bar)", (Error::Garbage));
	FAILS(parse, R"("foo\"bar)", (Error::OutOfBounds));
	OK(parse, R"("a b c")", (Json{std::string(R"(a b c)")}));
	OK(parse, R"(" a b c ")", (Json{std::string(R"( a b c )")}));
	OK(parse, R"("foo\"bar")", (Json{std::string(R"(foo"bar)")}));
	OK(parse, R"("\u0041")", (Json{std::string("A")}));
	OK(parse, R"("\u1234")", (Json{std::string("\xE1\x88\xB4")}));
	OK(parse, R"("\u1234\uabcd")", (Json{std::string("\xE1\x88\xB4" "\xEA\xAF\x8D")}));
	OK(parse, R"("\u1234\uabcd\u00Ff")", (Json{std::string("\xE1\x88\xB4" "\xEA\xAF\x8D" "\xC3\xBF")}));
	OK(parse, R"("foo\u12cdbar")", (Json{std::string("foo" "\xE1\x8B\x8D" "bar")}));
	OK(parse, R"("\ud83d\ude00")", (Json{std::string("\xF0\x9F\x98\x80")}));
	FAILS(parse, R"("\ud83d")", (Error::InvalidSurrogate));
	FAILS(parse, R"("\ud83dx")", (Error::InvalidSurrogate));
	FAILS(parse, R"("\ud83d\u0041")", (Error::InvalidSurrogate));
	FAILS(parse, R"("\ude00")", (Error::InvalidSurrogate));
	FAILS(parse, R"("\ud83d\u12")", (Error::OutOfBounds));
	FAILS(parse, R"("\u12cx")", (Error::HexCharExpected));
	FAILS(parse, R"("\)", (Error::OutOfBounds));
}

TEST_CASE("arrays")
{
	OK(parse, R"([])", (Json{Array()}));
	OK(parse, R"([null])", (Json{make_array(null())}));
	OK(parse, R"([[null]])", (Json{make_array(Json{make_array(null())})}));
	OK(parse, R"([true])", (Json{make_array(True())}));
	OK(parse, R"([false])", (Json{make_array(False())}));
	OK(parse, R"([true,false])", (Json{make_array(True(), False())}));
	OK(parse, R"([1.2])", (Json{make_array(Json{Number{.integer=1, .fraction=2, .precision=1, .floating=true}})}));
	OK(parse, R"(["abc"])", (Json{make_array(Json{"abc"})}));
	OK(parse, R"([[[]]])", (Json{make_array(Json{make_array(Json{make_array()})})}));
	OK(parse, R"([[["a"]]])", (Json{make_array(Json{make_array(Json{make_array(Json{"a"})})})}));
	FAILS(parse, R"([)", (Error::OutOfBounds));
	FAILS(parse, R"(])", (Error::InvalidValue));
	FAILS(parse, R"([[[)", (Error::OutOfBounds));
	FAILS(parse, R"(]]])", (Error::InvalidValue));
	OK(parse, R"([1,2,3])", (Json{make_array(
		Json{Number{.integer=1}},
		Json{Number{.integer=2}},
		Json{Number{.integer=3}}
	)}));
	FAILS(parse, R"(["])", (Error::OutOfBounds));
	OK(parse, R"([true,false,null,0])", (Json{make_array(
		True(),
		False(),
		null(),
		Json{Number{}}
	)}));
	OK(parse, R"([[],[]])", (Json{make_array( Json{make_array()}, Json{make_array()} )}));
	FAILS(parse, R"([1,)", (Error::InvalidValue));
	FAILS(parse, R"([1,])", (Error::InvalidValue));
	FAILS(parse, R"([1,2,])", (Error::InvalidValue));
	FAILS(parse, R"([1,2,)", (Error::InvalidValue));
	FAILS(parse, R"([nul])", (Error::NullExpected));
	FAILS(parse, R"([tru])", (Error::TrueExpected));
	FAILS(parse, R"([-])", (Error::EmptyString));
	FAILS(parse, R"([01])", (Error::LeadingZero));
	FAILS(parse, R"([x])", (Error::InvalidValue));
	OK(parse, R"([18446744073709551616])", (Json{make_array(
		Json{Number{.integer=1844674407370955162, .exponent=1, .floating=true}}
	)}));
}

TEST_CASE("objects")
{
	OK(parse, R"({})", (Json{Object{}}));
	OK(parse, R"({"1":1})", (Json{make_object(
		std::pair{std::string{"1"}, Json{Number{.integer=1}}}
	)}));
	OK(parse, R"({"foo":"bar"})", (Json{make_object(
		std::pair{std::string{"foo"}, Json{"bar"}}
	)}));
	OK(parse, R"({"":""})", (Json(make_object(
		std::pair{std::string{""}, Json{""}}
	))));
	OK(parse, R"({"12":[]})", (Json(make_object(
		std::pair{std::string{"12"}, Json{make_array()}}
	))));
	OK(parse, R"({"a":1,"b":2,"c":3})", (Json(make_object(
		std::pair{std::string{"a"}, Json{Number{.integer=1}}},
		std::pair{std::string{"b"}, Json{Number{.integer=2}}},
		std::pair{std::string{"c"}, Json{Number{.integer=3}}}
	))));
	OK(parse, R"({"x":9.8e7})", (Json{make_object(
		std::pair{std::string{"x"}, Json{Number{.integer=9, .fraction=8, .precision=1, .exponent=7, .floating=true}}}
	)}));
	FAILS(parse, R"({"1":1)", (Error::OutOfBounds));
	FAILS(parse, R"({"foo")", (Error::OutOfBounds));
	FAILS(parse, R"({"foo":)", (Error::InvalidValue));
	FAILS(parse, R"({)", (Error::OutOfBounds));
	FAILS(parse, R"({x})", (Error::CharMismatch));
	FAILS(parse, R"({"a\q":1})", (Error::UnrecognisedEscapeSequence));
	FAILS(parse, R"({"a":[nul]})", (Error::NullExpected));
}

TEST_CASE("values with spaces")
{
	FAILS(parse, R"(   )", (Error::EmptyString));
	FAILS(parse, R"( [  )", (Error::OutOfBounds));
	OK(parse, R"(   null   )", (Json{Null{}}));
	OK(parse, R"(   true   )", (Json{True()}));
	OK(parse, R"(   false   )", (Json{False()}));
	OK(parse, R"(" \u1234 \uabcd \u00Ff ")", (Json{" \xE1\x88\xB4 \xEA\xAF\x8D \xC3\xBF "}));
	OK(parse, R"([ true, false, null ])", (Json{make_array(
		True(), False(), null()
	)}));
	OK(parse, R"( [ true , false , null ] )", (Json{make_array(
		True(), False(), null()
	)}));
	OK(parse, R"( { "a" : true , "b" : false , "c" : null } )", (Json{make_object(
		std::pair{std::string{"a"}, True()},
		std::pair{std::string{"b"}, False()},
		std::pair{std::string{"c"}, null()}
	)}));
	OK(parse, R"( {  } )", (Json{Object{}}));
	OK(parse, R"( [  ] )", (Json{make_array()}));
}

template<typename T>
std::string printed(const T& value)
{
	std::ostringstream o;
	o << value;
	return o.str();
}

TEST_CASE("compact output")
{
	CHECK(printed(json(R"([1, 2, 3])")) == "[1, 2, 3]");
	CHECK(printed(json(R"({"b": [], "a": {"c": null}})")) == R"({"a": {"c": null}, "b": []})");
	CHECK(printed(json(R"("a\"b\n")")) == R"("a\"b\n")");
	CHECK(printed(json("-1.05e-3")) == "-1.05e-3");
	CHECK(printed(json("1.")) == "1.0");
	CHECK(printed(json("[true, false, null]")) == "[true, false, null]");
	CHECK(printed(Error::NumberOutOfRange) == "NumberOutOfRange");
}

TEST_CASE("pretty output")
{
	CHECK(pretty(json("42")) == "42");
	CHECK(pretty(json("[]")) == "[]");
	CHECK(pretty(json("{}")) == "{}");
	CHECK(pretty(json(R"({"b": [1, {"c": true}], "a": "x"})")) ==
		"{\n"
		"  \"a\": \"x\",\n"
		"  \"b\": [\n"
		"    1,\n"
		"    {\n"
		"      \"c\": true\n"
		"    }\n"
		"  ]\n"
		"}");
}

TEST_CASE("sorted members")
{
	const auto doc = json(R"({"b": 1, "c": 2, "a": 3})");
	const auto members = sorted_members(std::get<Object>(doc.value));
	REQUIRE(members.size() == 3);
	CHECK(members[0]->first == "a");
	CHECK(members[1]->first == "b");
	CHECK(members[2]->first == "c");
}
