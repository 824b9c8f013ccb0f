/**
 * Evaluates sums and differences of integers, like "10+5-3".
 * Parses user-input line by line.
 */

#include <cctype>
#include <iostream>
#include <numeric>
#include <string>
#include <vector>
#include <bytecmb/bytecmb.hpp>

namespace pc = bytecmb;

bool is_digit(pc::byte const& c) { return std::isdigit(c) != 0; }

// Nine digits always fit into an int
bool fits_int(std::vector<pc::byte> const& digits) {
    return digits.size() <= 9;
}

int to_num(std::vector<pc::byte> const& digits) {
    int n = 0;
    for (auto c : digits) n = n * 10 + (c - '0');
    return n;
}

int add_all(std::vector<int> const& xs) {
    return std::accumulate(xs.begin(), xs.end(), 0);
}

int mul_all(std::vector<int> const& xs) {
    return std::accumulate(xs.begin(), xs.end(), 1,
        [](int a, int b) { return a * b; });
}

int positive(std::vector<pc::byte> const&) { return 1; }
int negative(std::vector<pc::byte> const&) { return -1; }
int nothing(pc::unit) { return 0; }

pc::parser<int> make_expression() {
    auto num = pc::require(fits_int, +pc::require(is_digit, pc::readchar()))[to_num];
    auto sign = pc::tag("+")[positive] | pc::tag("-")[negative];
    auto term = pc::concat({ sign, num })[mul_all];
    auto expr = pc::concat({ num, (*term)[add_all] })[add_all];
    return pc::concat({ expr, pc::end()[nothing] })[add_all];
}

int main() {
    auto parser = make_expression();
    std::string line;

    while (std::getline(std::cin, line)) {
        auto res = parser.parse(line);
        if (res.is_success()) {
            std::cout << "Result = " << res.success().value() << std::endl;
        }
        else {
            std::cout << "Failed to parse expression!" << std::endl;
        }
    }

    return 0;
}
