/**
 * Splits user-input into words, line by line, and prints them one per line.
 * Anything after the last word that is not whitespace is reported.
 */

#include <cctype>
#include <iostream>
#include <string>
#include <utility>
#include <vector>
#include <bytecmb/bytecmb.hpp>

namespace pc = bytecmb;

bool is_alnum(pc::byte const& c) { return std::isalnum(c) != 0; }
bool is_space(pc::byte const& c) { return std::isspace(c) != 0; }

std::string decode(std::vector<pc::byte> const& bs) {
    return std::string(bs.begin(), bs.end());
}

std::string second(std::vector<std::string> const& v) { return v[1]; }

int main() {
    auto spaces = (*pc::require(is_space, pc::readchar()))[decode];
    auto word = (+pc::require(is_alnum, pc::readchar()))[decode];
    auto words = *pc::concat({ spaces, word })[second];
    std::string line;

    while (std::getline(std::cin, line)) {
        auto res = words.parse(line);
        // Words never fail, at worst they match nothing
        auto succ = std::move(res).success();
        for (auto const& w : succ.value()) {
            std::cout << w << std::endl;
        }
        auto rest = spaces.parse(succ.position(), line);
        if (rest.is_success() && rest.success().position() < line.size()) {
            std::cout << "Unexpected input: "
                      << line.substr(rest.success().position()) << std::endl;
        }
    }

    return 0;
}
