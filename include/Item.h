/*
 * Item.h
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

#ifndef ITEM_H
#define ITEM_H

#include <cstdint>
#include <string>

/**
 * @brief An item name paired with a quantity.
 *
 * Items are compared structurally: two items are equal when both the name
 * (case-sensitive) and the quantity match.
 */
class Item {
public:
    std::string name;
    int64_t quantity{1};

    Item() {};
    Item(std::string name, int64_t quantity = 1);

    /**
     * Returns "<name> x<quantity>".
     */
    std::string to_string() const;

    /**
     * Convert the item to a JSON object string.
     */
    std::string to_json() const;

    bool operator==(const Item& other) const;
    bool operator!=(const Item& other) const { return !(*this == other); }
};

#endif // ITEM_H
