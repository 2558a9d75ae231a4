/*
 * ItemPool.cpp
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

#include "ItemPool.h"
#include <algorithm>

Item& ItemPool::add(const std::string& name, int64_t quantity) {
    auto it = index.find(name);
    if (it == index.end()) {
        index.emplace(name, entries.size());
        entries.emplace_back(name, 0);
        Item& entry = entries.back();
        entry.quantity += quantity;
        return entry;
    }
    Item& entry = entries[it->second];
    entry.quantity += quantity;
    return entry;
}

Item* ItemPool::find(const std::string& name) {
    auto it = index.find(name);
    return it == index.end() ? nullptr : &entries[it->second];
}

const Item* ItemPool::find(const std::string& name) const {
    auto it = index.find(name);
    return it == index.end() ? nullptr : &entries[it->second];
}

int64_t ItemPool::quantity_of(const std::string& name) const {
    const Item* entry = find(name);
    return entry ? entry->quantity : 0;
}

std::vector<Item> ItemPool::sorted_by_quantity() const {
    std::vector<Item> sorted(entries);
    std::stable_sort(sorted.begin(), sorted.end(), [](const Item& a, const Item& b) {
        return a.quantity > b.quantity;
    });
    return sorted;
}
