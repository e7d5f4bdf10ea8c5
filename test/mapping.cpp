#include "../combitoy.hpp"

//---------------------------------------------------------------------------
// TEST CASES
//---------------------------------------------------------------------------
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "./fw/doctest-setup.hpp"

// Global env. for the test cases...
using namespace Combitoy;

auto letter = Satisfy("letter", [](char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); });
auto digit  = Satisfy("digit",  [](char c) { return c >= '0' && c <= '9'; });

int to_int(std::vector<char>&& digits)
{
	int n = 0;
	for (char d : digits) n = n * 10 + (d - '0');
	return n;
}


CASE("Map: identity changes nothing") {
	auto same = Map(digit, [](char c) { return c; });
	for (string_view text : {"5x", "x5", "", "9"}) {
		for (size_t pos = 0; pos <= text.length() + 1; ++pos) {
			auto a = digit.parse(text, pos);
			auto b = same.parse(text, pos);
			REQUIRE(a.ok() == b.ok());
			if (a) {
				CHECK(a.value() == b.value());
				CHECK(a.next() == b.next());
			} else {
				CHECK(a.failure().kind == b.failure().kind);
				CHECK(a.failure().pos == b.failure().pos);
				CHECK(a.failure().expected == b.failure().expected);
			}
		}
	}
}

CASE("Map: to another type") {
	auto number = Map(ManyOne(digit), to_int);
	auto r = parse(number, "1024 bytes");
	REQUIRE(r);
	CHECK(r.value() == 1024);
	CHECK(r.next() == 4);
}

CASE("Map: failure passes through") {
	auto r = parse(Map(ManyOne(digit), to_int), "KB");
	REQUIRE(!r);
	CHECK(r.failure().kind == ErrorKind::Unsatisfied);
	CHECK(r.failure().expected == "digit");
}

CASE("Map: of a Pair") {
	auto tag = Map(And(letter, digit), [](Pair<char, char>&& p) { return fmt::format("{}{}", p.second, p.first); });
	CHECK(parse(tag, "h1").value() == "1h");
}

CASE("TryMap: accepted") {
	auto even = TryMap(digit, [](char c) -> std::optional<int> {
		int n = c - '0'; if (n % 2) return std::nullopt; return n;
	}, ErrorKind::Unsatisfied, "even digit");

	auto r = parse(even, "4");
	REQUIRE(r);
	CHECK(r.value() == 4);
	CHECK(r.next() == 1);
	____
	r = even.parse("ab3", 2);
	REQUIRE(!r);
	CHECK(r.failure().kind == ErrorKind::Unsatisfied);
	CHECK(r.failure().pos == 2); // nothing consumed
	CHECK(r.failure().expected == "even digit");
	____
	r = parse(even, "x");
	REQUIRE(!r);
	CHECK(r.failure().expected == "digit"); // the inner one's own failure
}

CASE("TryMap: rejected match is reported at its start") {
	auto small = TryMap(ManyOne(digit), [](std::vector<char>&& d) -> std::optional<int> {
		if (d.size() > 3) return std::nullopt;
		return to_int(std::move(d));
	}, ErrorKind::NumericOverflow, "number up to 999");

	CHECK(parse(small, "999").value() == 999);

	auto r = small.parse("x=12345", 2);
	REQUIRE(!r);
	CHECK(r.failure().kind == ErrorKind::NumericOverflow);
	CHECK(r.failure().pos == 2);
	CHECK(r.failure().is_fatal());
}

CASE("Rule: type-erased handle") {
	Rule<int> number("number", Map(ManyOne(digit), to_int));
	CHECK(number.name() == "number");

	auto r = parse(number, "42");
	REQUIRE(r);
	CHECK(r.value() == 42);
	____
	// Copies are fine (and share nothing mutable)
	Rule<int> copy = number;
	CHECK(parse(copy, "7").value() == 7);
	____
	auto list = And(number, Many(RightOnly(Satisfy("','", [](char c) { return c == ','; }), number)));
	auto l = parse(list, "1,22,333");
	REQUIRE(l);
	CHECK(l.value().first == 1);
	CHECK(l.value().second == std::vector<int>{22, 333});
	CHECK(l.next() == 8);
}

CASE("Rule: wraps other Rules") {
	Rule<char> alnum("alnum", OrElse(Rule<char>("letter", letter), Rule<char>("digit", digit)));
	CHECK(parse(alnum, "a").value() == 'a');
	CHECK(parse(alnum, "1").value() == '1');
	CHECK(!parse(alnum, "-"));
}
