#pragma once

#include <catch2/catch.hpp>

#include <string_view>
#include <utility>
#include <variant>

#include "address.hpp"
#include "json.hpp"

template <typename ...Jsons>
Array make_array(Jsons&&... jsons)
{
	Array arr;
	arr.reserve(sizeof...(jsons));
	(arr.push_back(std::forward<Jsons>(jsons)), ...);
	return arr;
}

template <typename ...Jsons>
Object make_object(std::pair<std::string, Jsons>&&... kvs)
{
	Object obj;
	(obj.insert(std::forward<std::pair<std::string, Jsons>>(kvs)), ...);
	return obj;
}

inline Json json(std::string_view text)
{
	auto r = parse(text);
	INFO(text);
	REQUIRE(std::holds_alternative<Json>(r));
	return std::get<Json>(std::move(r));
}

inline Address path(std::string_view text)
{
	auto r = parse_address(text);
	INFO(text);
	REQUIRE(std::holds_alternative<Address>(r));
	return std::get<Address>(std::move(r));
}
