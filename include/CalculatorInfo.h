/*
 * CalculatorInfo.h
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

#ifndef CALCULATORINFO_H
#define CALCULATORINFO_H

#include <cstdint>
#include <string>
#include <sstream>

/**
 * @brief Class to store the parameters of a calculator run.
 */
class CalculatorInfo {
public:
    std::string target;  // requested item; empty runs the demo requests
    int64_t quantity;    // requested quantity
    bool print_tree;     // print the ingredient tree
    bool print_costs;    // print the simulated costs
    bool json;           // print one JSON document per request instead of text
    bool debug;          // dump these parameters before running

    /**
     * @brief Default constructor with default values.
     */
    CalculatorInfo()
        : target(""), quantity(1), print_tree(true), print_costs(true),
          json(false), debug(false) {}

    /**
     * @brief Fill the parameters from command line arguments.
     *
     * Accepted form: [--json] [--no-tree] [--no-costs] [--debug] [--] [item [quantity]]
     *
     * @return false and an error message if the arguments are invalid.
     */
    bool parse_args(int argc, char** argv, std::string& error);

    /**
     * @brief Convert the calculator info to a JSON string.
     * @return A JSON string representation of the run parameters.
     */
    std::string to_json() const;

    static std::string usage(const char* program);
};

#endif // CALCULATORINFO_H
