#include "testing.hpp"
#include "address.hpp"

#include <string>
#include <unordered_set>
#include <vector>

namespace
{

Address steps(std::vector<Step> s)
{
	return Address{std::move(s)};
}

PathError failure(std::string_view text)
{
	auto r = parse_address(text);
	INFO(text);
	REQUIRE(std::holds_alternative<PathErr>(r));
	return std::get<PathErr>(r).first;
}

}

TEST_CASE("root address")
{
	CHECK(path("$").is_root());
	CHECK(path("$") == root());
	CHECK(to_string(root()) == "(root)");
	CHECK(to_jsonpath(root()) == "$");
}

TEST_CASE("field and index steps")
{
	CHECK(path("$.a.b.c") == steps({Field{"a"}, Field{"b"}, Field{"c"}}));
	CHECK(path("$.a[0].b.c") == steps({Field{"a"}, Index{0}, Field{"b"}, Field{"c"}}));
	CHECK(path("$.a[0].b[1].c") == steps({Field{"a"}, Index{0}, Field{"b"}, Index{1}, Field{"c"}}));
	CHECK(path("$[3]") == steps({Index{3}}));
	CHECK(path("$._id.user_2") == steps({Field{"_id"}, Field{"user_2"}}));
}

TEST_CASE("pattern steps")
{
	CHECK(path("$.a[0].b[1:2].c") == steps({Field{"a"}, Index{0}, Field{"b"}, IndexRange{1, 2}, Field{"c"}}));
	CHECK(path("$.a[0].b[*].*.c[0:1]") == steps({
		Field{"a"}, Index{0}, Field{"b"}, WildcardIndex{}, WildcardField{}, Field{"c"}, IndexRange{0, 1}
	}));
	CHECK(path("$[:].a[3:].b[4:].*.c[0:1]") == steps({
		WildcardIndex{}, Field{"a"}, IndexRangeFrom{3}, Field{"b"}, IndexRangeFrom{4}, WildcardField{}, Field{"c"}, IndexRange{0, 1}
	}));
	CHECK(path("$.a[:5]") == steps({Field{"a"}, IndexRangeTo{5}}));
	CHECK(path("$[*].a") == steps({WildcardIndex{}, Field{"a"}}));
}

TEST_CASE("malformed addresses")
{
	CHECK(failure("") == PathError::Empty);
	CHECK(failure("id") == PathError::RootExpected);
	CHECK(failure(".a.b.c") == PathError::RootExpected);
	CHECK(failure("$.a.b.c[") == PathError::Malformed);
	CHECK(failure("$.a.b.c[]") == PathError::Malformed);
	CHECK(failure("$.a.b.c[1:") == PathError::Malformed);
	CHECK(failure("$.a.b.c[1:2") == PathError::Malformed);
	CHECK(failure("$.") == PathError::Malformed);
	CHECK(failure("$..a") == PathError::Malformed);
	CHECK(failure("$a") == PathError::Malformed);
	CHECK(failure("$.1a") == PathError::Malformed);
	CHECK(failure("$.a[0][1]") == PathError::Malformed);
	CHECK(failure("$.*[0]") == PathError::Malformed);
	CHECK(failure("$.a[-1]") == PathError::Malformed);
	CHECK(failure("$.a b") == PathError::Malformed);
	CHECK(failure("$[99999999999999999999999]") == PathError::IndexOutOfRange);
	CHECK(failure("$[1:99999999999999999999999]") == PathError::IndexOutOfRange);
}

TEST_CASE("error carries the offending text")
{
	const std::string text = "$.a[";
	auto r = parse_address(text);
	REQUIRE(std::holds_alternative<PathErr>(r));
	CHECK(std::get<PathErr>(r).second == "$.a[");
}

TEST_CASE("grammar check")
{
	CHECK(is_valid_address("$"));
	CHECK(is_valid_address("$[0].a.*"));
	CHECK(is_valid_address("$.a[:]"));
	CHECK_FALSE(is_valid_address("$.a[*"));
	CHECK_FALSE(is_valid_address("$$"));
}

TEST_CASE("display form")
{
	CHECK(to_string(path("$.a[0].*")) == ".a[0].*");
	CHECK(to_string(path("$.id")) == ".id");
	CHECK(to_string(path("$[1:4].b[2:].c[:5].d[*]")) == "[1:4].b[2:].c[:5].d[*]");
	CHECK(to_jsonpath(path("$[:]")) == "$[*]");
}

TEST_CASE("reparsing the jsonpath form")
{
	for (const auto* text: {"$", "$.a", "$[3]", "$[*].a", "$.a.*.c[0:3]", "$[:].a[3:].b[4:].*.c[0:1]", "$.x[:7]"})
	{
		const auto address = path(text);
		const auto again = to_jsonpath(address);
		INFO(text << " -> " << again);
		CHECK(is_valid_address(again));
		CHECK(path(again) == address);
	}
}

TEST_CASE("prefixes")
{
	CHECK(prefixes(path("$.a.b.c"), path("$.a.b.c")));
	CHECK(prefixes(path("$.a.b"), path("$.a.b.c")));
	CHECK_FALSE(prefixes(path("$.a.b.c"), path("$.a.b")));
	CHECK_FALSE(prefixes(path("$.a.b.c"), path("$.a.b.d")));
	CHECK(prefixes(path("$.a.*.c[0:3]"), path("$.a.b.c[1]")));
	CHECK_FALSE(prefixes(path("$.a.*.c[0:3]"), path("$.a.b.c[3]")));
	CHECK_FALSE(prefixes(path("$.a.*.c[0]"), path("$.a[1].c[0]")));
	CHECK_FALSE(prefixes(path("$.a.*.c[0].*"), path("$.a.d.c[0]")));
	CHECK(prefixes(path("$.a.*.c[:3]"), path("$.a.d.c[2]")));
	CHECK_FALSE(prefixes(path("$.a.*.c[:3]"), path("$.a.d.c[4]")));
	CHECK(prefixes(path("$.a.*.c[3:]"), path("$.a.d.c[4]")));
	CHECK(prefixes(path("$.a.*.c[3:]"), path("$.a.d.c[3]")));
	CHECK(prefixes(path("$[*]"), path("$[7].x")));
	CHECK_FALSE(prefixes(path("$[*]"), path("$.x")));
	CHECK_FALSE(prefixes(path("$.*"), path("$[0]")));
}

TEST_CASE("root prefixes everything and nothing prefixes root")
{
	for (const auto* text: {"$", "$.a", "$[0]", "$.*", "$[1:2].b"})
	{
		const auto address = path(text);
		INFO(text);
		CHECK(prefixes(root(), address));
		CHECK(prefixes(address, root()) == address.is_root());
	}
}

TEST_CASE("matches stops at the pattern's depth")
{
	CHECK(matches(path("$.a[*]"), path("$.a[3]")));
	CHECK_FALSE(matches(path("$.a[*]"), path("$.a[3].b")));
	CHECK(prefixes(path("$.a[*]"), path("$.a[3].b")));
	CHECK(matches(root(), root()));
	CHECK_FALSE(matches(root(), path("$.a")));
	CHECK(matches(path("$.items"), path("$.items")));
}

TEST_CASE("append leaves the parent untouched")
{
	const auto parent = path("$.a");
	const auto child = append(parent, Index{2});
	CHECK(parent == path("$.a"));
	CHECK(child == path("$.a[2]"));
	CHECK(append(root(), Field{"x"}) == path("$.x"));
}

TEST_CASE("structural equality and hashing")
{
	CHECK(path("$.a[0:3].*") == path("$.a[0:3].*"));
	CHECK_FALSE(path("$.a[0]") == path("$.a[1]"));
	CHECK_FALSE(path("$[0]") == path("$[0:1]"));
	CHECK(std::hash<Address>{}(path("$.a[*]")) == std::hash<Address>{}(path("$.a[:]")));

	std::unordered_set<Address> seen;
	seen.insert(path("$.a"));
	seen.insert(path("$.a"));
	seen.insert(path("$.b"));
	seen.insert(root());
	CHECK(seen.size() == 3);
	CHECK(seen.contains(path("$.b")));
}

TEST_CASE("resolve concrete addresses")
{
	const auto doc = json(R"({"id": 7, "items": [{"name": "a"}, {"name": "b"}]})");
	REQUIRE(resolve(doc, root()) == &doc);
	const auto* id = resolve(doc, path("$.id"));
	REQUIRE(id != nullptr);
	CHECK(*id == Json{Number{.integer=7}});
	const auto* name = resolve(doc, path("$.items[1].name"));
	REQUIRE(name != nullptr);
	CHECK(*name == Json{"b"});
	CHECK(resolve(doc, path("$.items[2]")) == nullptr);
	CHECK(resolve(doc, path("$.missing")) == nullptr);
	CHECK(resolve(doc, path("$.id.x")) == nullptr);
	CHECK(resolve(doc, path("$[0]")) == nullptr);
	CHECK(resolve(doc, path("$.items[*].name")) == nullptr);
	CHECK(resolve(doc, path("$.*")) == nullptr);
}
