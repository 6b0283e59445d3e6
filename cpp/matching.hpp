#pragma once

#include <variant>
#include <utility>

template<typename ...Fs>
struct overloaded : Fs...
{
	using Fs::operator()...;
};
template<typename ...Fs> overloaded(Fs...) -> overloaded<Fs...>;

// Visit a variant with a set of lambdas. Alternatives that are pairs (the
// Ok/Err results) are unpacked into two arguments.
template<typename ...Ts, typename ...Fs>
decltype(auto) match(std::variant<Ts...>&& v, Fs&&... f)
{
	auto overload = overloaded{std::forward<Fs>(f)...};
	auto unpair = [&]<typename A, typename B>(std::pair<A, B> p){return overload(std::move(p.first), std::move(p.second));};
	return std::visit(overloaded{unpair, std::move(overload)}, std::move(v));
}
template<typename ...Ts, typename ...Fs>
decltype(auto) match(const std::variant<Ts...>& v, Fs&&... f)
{
	auto overload = overloaded{std::forward<Fs>(f)...};
	auto unpair = [&]<typename A, typename B>(const std::pair<A, B>& p){return overload(p.first, p.second);};
	return std::visit(overloaded{unpair, std::move(overload)}, v);
}

// Visit two variants together, e.g. a pattern step against a concrete step.
template<typename ...Ts, typename ...Us, typename ...Fs>
decltype(auto) match2(const std::variant<Ts...>& a, const std::variant<Us...>& b, Fs&&... f)
{
	return std::visit(overloaded{std::forward<Fs>(f)...}, a, b);
}

template<typename T, typename ...Ts>
const T* as(const std::variant<Ts...>& v)
{
	return std::get_if<T>(&v);
}
