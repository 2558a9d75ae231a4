/*
 * ItemPool.h
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

#ifndef ITEMPOOL_H
#define ITEMPOOL_H

#include "Item.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @brief Name-keyed accumulator of items that remembers first-insertion order.
 *
 * Adding an item whose name is already present sums the quantities; the entry
 * keeps the position it got when the name was first added. Entries are never
 * removed, even when their quantity drops to zero.
 */
class ItemPool {
public:
    /**
     * Adds quantity to the named entry, creating it with quantity 0 first if needed.
     * Returns the entry.
     */
    Item& add(const std::string& name, int64_t quantity);
    Item& add(const Item& item) { return add(item.name, item.quantity); }

    /**
     * Returns the named entry, or nullptr if the name was never added.
     */
    Item* find(const std::string& name);
    const Item* find(const std::string& name) const;

    /**
     * Quantity of the named entry, 0 if absent.
     */
    int64_t quantity_of(const std::string& name) const;

    /**
     * Entries in first-insertion order.
     */
    const std::vector<Item>& items() const { return entries; }

    /**
     * Entries sorted by quantity, largest first. Entries with equal quantity
     * keep their first-insertion order.
     */
    std::vector<Item> sorted_by_quantity() const;

    size_t size() const { return entries.size(); }
    bool empty() const { return entries.empty(); }

private:
    std::vector<Item> entries;
    std::unordered_map<std::string, size_t> index;
};

#endif // ITEMPOOL_H
