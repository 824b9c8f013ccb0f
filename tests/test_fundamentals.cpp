#include <cstddef>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>
#include <catch2/catch.hpp>
#include <bytecmb/bytecmb.hpp>

namespace pc = bytecmb;

template <typename T, typename U>
inline constexpr bool same_type_v =
	std::is_same_v<std::decay_t<T>, std::decay_t<U>>;

TEST_CASE("'source' is a view over the bytes of the input", "[source]") {
	SECTION("from a string literal") {
		pc::source src = "test";

		REQUIRE(src.length() == 4);
		REQUIRE(src.at(0) == 't');
		REQUIRE(src.at(3) == 't');
		REQUIRE(!src.is_end(3));
		REQUIRE(src.is_end(4));
	}

	SECTION("from a byte vector") {
		std::vector<pc::byte> bytes = { 0x00, 0xff, 0x7f };
		pc::source src = bytes;

		REQUIRE(src.length() == 3);
		REQUIRE(src.data() == bytes.data());
		REQUIRE(src.at(1) == 0xff);
	}

	SECTION("from a string") {
		std::string str = "ab";
		pc::source src = str;

		REQUIRE(src.length() == 2);
		REQUIRE(src.at(1) == 'b');
	}

	SECTION("empty") {
		pc::source src;

		REQUIRE(src.length() == 0);
		REQUIRE(src.is_end(0));
	}
}

TEST_CASE("'outcome' is either a success or a failure", "[outcome]") {
	SECTION("success carries the position and the value") {
		pc::outcome<int> res = pc::success(42, 3);

		REQUIRE(res.is_success());
		REQUIRE(!res.is_failure());
		REQUIRE(res.success().position() == 3);
		REQUIRE(res.success().value() == 42);
	}

	SECTION("failure carries nothing") {
		pc::outcome<int> res = pc::failure();

		REQUIRE(res.is_failure());
		REQUIRE(!res.is_success());
	}

	SECTION("equality") {
		pc::outcome<int> fail1 = pc::failure();
		pc::outcome<int> fail2 = pc::failure();
		pc::outcome<int> succ1 = pc::success(1, 1);
		pc::outcome<int> succ2 = pc::success(1, 1);
		pc::outcome<int> other_pos = pc::success(1, 2);
		pc::outcome<int> other_val = pc::success(2, 1);

		REQUIRE(fail1 == fail2);
		REQUIRE(succ1 == succ2);
		REQUIRE(succ1 != fail1);
		REQUIRE(fail1 != succ1);
		REQUIRE(succ1 != other_pos);
		REQUIRE(succ1 != other_val);
	}
}

TEST_CASE("'readchar' returns a byte if there is one", "[readchar]") {
	auto p = pc::readchar();

	REQUIRE(same_type_v<decltype(p), pc::parser<pc::byte>>);

	SECTION("there is a byte to consume") {
		auto res = p.parse(0, "test");

		REQUIRE(res.is_success());
		auto succ = res.success();
		REQUIRE(succ.position() == 1);
		REQUIRE(succ.value() == 't');
	}

	SECTION("consumes from the middle") {
		auto res = p.parse(2, "test");

		REQUIRE(res == pc::outcome<pc::byte>(pc::success(pc::byte('s'), 3)));
	}

	SECTION("there is no byte to consume") {
		REQUIRE(p.parse(4, "test").is_failure());
		REQUIRE(p.parse(0, "").is_failure());
	}

	SECTION("parsing without a position starts at the beginning") {
		auto res = p.parse("xy");

		REQUIRE(res.is_success());
		REQUIRE(res.success().value() == 'x');
		REQUIRE(res.success().position() == 1);
	}

	SECTION("reads raw bytes") {
		std::vector<pc::byte> bytes = { 0x80, 0x00 };

		auto res1 = p.parse(0, bytes);
		auto res2 = p.parse(1, bytes);

		REQUIRE(res1.success().value() == 0x80);
		REQUIRE(res2.success().value() == 0x00);
		REQUIRE(res2.success().position() == 2);
	}
}

// A user-defined parser, derived the same way the library's ones are
class digit_t : public pc::combinator<digit_t, int> {
public:
	pc::outcome<int> parse(std::size_t position, pc::source const& src) const override {
		if (src.is_end(position)) {
			return pc::failure();
		}
		auto c = src.at(position);
		if (c < '0' || c > '9') {
			return pc::failure();
		}
		return pc::success(int(c - '0'), position + 1);
	}
};

TEST_CASE("parser handles can be copied and moved", "[parser]") {
	auto p = pc::make_parser<digit_t>();

	SECTION("a user-defined parser works through the handle") {
		REQUIRE(p.parse(0, "7") == pc::outcome<int>(pc::success(7, 1)));
		REQUIRE(p.parse(0, "x").is_failure());
	}

	SECTION("copies behave the same as the original") {
		auto copy = p;

		REQUIRE(copy.parse(0, "5") == p.parse(0, "5"));
		REQUIRE(copy.parse(0, "a") == p.parse(0, "a"));
	}

	SECTION("a copy outlives the original") {
		auto copy = pc::parser<int>(p);
		{
			auto moved = std::move(p);
			REQUIRE(moved.parse(0, "3").success().value() == 3);
		}

		REQUIRE(copy.parse(0, "3").success().value() == 3);
	}

	SECTION("assignment replaces the parser") {
		auto count = [](std::vector<pc::byte> v) { return int(v.size()); };
		auto other = pc::make_parser<digit_t>();
		auto bytes = pc::concat({ pc::readchar() })[count];

		other = bytes;

		REQUIRE(other.parse(0, "x") == pc::outcome<int>(pc::success(1, 1)));
		REQUIRE(bytes.parse(0, "x") == pc::outcome<int>(pc::success(1, 1)));
	}

	SECTION("combinators hold their own copies of the children") {
		auto seq = pc::concat({ p, p });
		auto res = seq.parse(0, "12");

		auto expected = std::vector<int>{ 1, 2 };
		REQUIRE(res.is_success());
		REQUIRE(res.success().value() == expected);
		REQUIRE(res.success().position() == 2);

		auto seq_copy = seq;
		REQUIRE(seq_copy.parse(0, "12") == res);
	}
}

static int count_bytes(std::vector<pc::byte> const& bs) {
	return int(bs.size());
}

TEST_CASE("callables are checked at compile time", "[traits]") {
	int captured = 0;
	auto stateless = [](pc::byte) { return 0; };
	auto stateful = [captured](pc::byte) { return captured; };

	SECTION("only functions and capture-less lambdas are stateless") {
		REQUIRE(pc::detail::is_stateless_v<decltype(stateless)>);
		REQUIRE(pc::detail::is_stateless_v<decltype(&count_bytes)>);
		REQUIRE(pc::detail::is_stateless_v<decltype(stateless) const&>);
		REQUIRE(!pc::detail::is_stateless_v<decltype(stateful)>);
		REQUIRE(!pc::detail::is_stateless_v<int*>);
		REQUIRE(!pc::detail::is_stateless_v<std::string>);
	}

	SECTION("the mapped value type drops references and qualifiers") {
		auto first = [](std::vector<int> const& v) -> int const& { return v[0]; };

		REQUIRE(same_type_v<
			pc::detail::process_value_t<std::vector<pc::byte>, decltype(&count_bytes)>,
			int
		>);
		REQUIRE(std::is_same_v<
			pc::detail::process_value_t<std::vector<int>, decltype(first)>,
			int
		>);
		REQUIRE(std::is_same_v<
			pc::detail::remove_cvref_t<std::string const&>,
			std::string
		>);
	}
}
