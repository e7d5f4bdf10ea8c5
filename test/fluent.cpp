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
auto dot    = Satisfy("'.'",    [](char c) { return c == '.'; });

int to_int(std::vector<char>&& digits)
{
	int n = 0;
	for (char d : digits) n = n * 10 + (d - '0');
	return n;
}


CASE("same types as the factories") {
	static_assert(std::is_same_v<decltype(letter.and_with(digit)), decltype(And(letter, digit))>);
	static_assert(std::is_same_v<decltype(dot.and_then(letter)),   decltype(RightOnly(dot, letter))>);
	static_assert(std::is_same_v<decltype(letter.or_else(digit)),  decltype(OrElse(letter, digit))>);
	static_assert(Parser<decltype(ManyOne(digit).map(to_int))>);
}

CASE("and_with") {
	auto r = parse(letter.and_with(digit), "a1");
	REQUIRE(r);
	CHECK(r.value() == Pair<char, char>{'a', '1'});
	CHECK(r.next() == 2);

	r = parse(letter.and_with(digit), "ab");
	REQUIRE(!r);
	CHECK(r.failure().kind == ErrorKind::SequenceFailure);
	CHECK(r.failure().pos == 1);
}

CASE("and_then") {
	auto r = parse(dot.and_then(letter), ".x");
	REQUIRE(r);
	CHECK(r.value() == 'x');
	CHECK(r.next() == 2);
}

CASE("or_else") {
	CHECK(parse(letter.or_else(digit), "5").value() == '5');
	CHECK(parse(letter.or_else(digit), "q").value() == 'q');
	CHECK(!parse(letter.or_else(digit), "."));
}

CASE("map") {
	auto r = parse(ManyOne(digit).map(to_int), "42");
	REQUIRE(r);
	CHECK(r.value() == 42);
}

CASE("chained") {
	// ".12" -> 12, or a letter -> its position in the alphabet
	auto p = dot.and_then(ManyOne(digit).map(to_int))
		.or_else(letter.map([](char c) { return c - 'a' + 1; }));

	CHECK(parse(p, ".12").value() == 12);
	CHECK(parse(p, "c").value() == 3);

	auto r = parse(p, ".x");
	REQUIRE(!r);
	CHECK(r.failure().pos == 1); // further than the letter's attempt
	CHECK(r.failure().expected == "digit");
}

CASE("on a Rule") {
	Rule<int> number("number", ManyOne(digit).map(to_int));
	auto plus = Satisfy("'+'", [](char c) { return c == '+'; });

	auto sum = number.and_with(Many(plus.and_then(number)))
		.map([](Pair<int, std::vector<int>>&& terms) {
			int n = terms.first;
			for (int x : terms.second) n += x;
			return n;
		});

	auto r = parse(LeftOnly(sum, Eof()), "1+22+300");
	REQUIRE(r);
	CHECK(r.value() == 323);
	____
	r = parse(LeftOnly(sum, Eof()), "1+22+");
	REQUIRE(!r);
	CHECK(r.failure().pos == 5);
	CHECK(r.failure().expected == "digit");
}
