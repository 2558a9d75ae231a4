/*
 * ProcessQueue.cpp
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

#include "ProcessQueue.h"
#include <stdexcept>
#include <utility>

void ProcessQueue::push(const std::string& name, int64_t quantity) {
    auto it = index.find(name);
    if (it != index.end()) {
        slots[it->second].quantity += quantity;
        return;
    }
    index.emplace(name, slots.size());
    slots.emplace_back(name, quantity);
}

Item ProcessQueue::pop() {
    if (slots.empty())
        throw std::out_of_range("pop from an empty process queue");
    Item item = std::move(slots.back());
    slots.pop_back();
    index.erase(item.name);
    return item;
}

int64_t ProcessQueue::pending(const std::string& name) const {
    auto it = index.find(name);
    return it == index.end() ? 0 : slots[it->second].quantity;
}
