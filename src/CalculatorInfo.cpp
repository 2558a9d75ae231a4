/*
 * CalculatorInfo.cpp
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */

#include "CalculatorInfo.h"
#include "JsonUtil.h"
#include <cstdlib>
#include <cerrno>
#include <vector>

bool CalculatorInfo::parse_args(int argc, char** argv, std::string& error) {
    std::vector<std::string> positional;
    bool options_done = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (options_done)
            positional.push_back(arg);
        else if (arg == "--")
            options_done = true; // everything after is an item name or quantity
        else if (arg == "--json")
            json = true;
        else if (arg == "--no-tree")
            print_tree = false;
        else if (arg == "--no-costs")
            print_costs = false;
        else if (arg == "--debug")
            debug = true;
        else if (arg.compare(0, 2, "--") == 0) {
            error = "unknown option " + arg;
            return false;
        }
        else
            positional.push_back(arg);
    }

    if (positional.size() > 2) {
        error = "too many arguments";
        return false;
    }
    if (!positional.empty())
        target = positional[0];
    if (positional.size() == 2) {
        const char* text = positional[1].c_str();
        char* end = nullptr;
        errno = 0;
        long long value = std::strtoll(text, &end, 10);
        if (errno != 0 || end == text || *end != '\0' || value < 0) {
            error = "invalid quantity " + positional[1];
            return false;
        }
        quantity = value;
    }
    return true;
}

std::string CalculatorInfo::to_json() const {
    std::ostringstream oss;
    oss << "{";
    oss << "\"target\":" << json_quote(target) << ",";
    oss << "\"quantity\":" << quantity << ",";
    oss << "\"print_tree\":" << (print_tree ? "true" : "false") << ",";
    oss << "\"print_costs\":" << (print_costs ? "true" : "false") << ",";
    oss << "\"json\":" << (json ? "true" : "false") << ",";
    oss << "\"debug\":" << (debug ? "true" : "false");
    oss << "}";
    return oss.str();
}

std::string CalculatorInfo::usage(const char* program) {
    return std::string("usage: ") + program + " [--json] [--no-tree] [--no-costs] [--debug] [--] [item [quantity]]";
}
