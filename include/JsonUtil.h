/*
 * JsonUtil.h
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

#ifndef JSONUTIL_H
#define JSONUTIL_H

#include <string>
#include <vector>

/**
 * Returns the string as a quoted JSON string literal.
 */
std::string json_quote(const std::string& text);

/**
 * Joins the to_json() of every element into a JSON array.
 */
template <typename T>
std::string json_array(const std::vector<T>& values) {
    std::string out = "[";
    for (size_t i = 0; i < values.size(); ++i) {
        out += values[i].to_json();
        if (i + 1 < values.size()) out += ",";
    }
    out += "]";
    return out;
}

#endif // JSONUTIL_H
