/*
 * Item.cpp
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

#include "Item.h"
#include "JsonUtil.h"
#include <sstream>
#include <utility>

Item::Item(std::string name, int64_t quantity) : name(std::move(name)), quantity(quantity) {}

std::string Item::to_string() const {
    return name + " x" + std::to_string(quantity);
}

std::string Item::to_json() const {
    std::ostringstream oss;
    oss << "{";
    oss << "\"name\":" << json_quote(name) << ",";
    oss << "\"quantity\":" << quantity;
    oss << "}";
    return oss.str();
}

bool Item::operator==(const Item& other) const {
    return name == other.name && quantity == other.quantity;
}
