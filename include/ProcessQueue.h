/*
 * ProcessQueue.h
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

#ifndef PROCESSQUEUE_H
#define PROCESSQUEUE_H

#include "Item.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @brief Pending demand waiting to be processed, one slot per distinct name.
 *
 * Queue rules:
 * - A name gets a slot the first time it is pushed while not pending.
 * - Pushing a name that is already pending only adds to its quantity; the slot does not move.
 * - pop() removes the most recently slotted pending name.
 * - A name pushed again after being popped gets a fresh slot at the end.
 */
class ProcessQueue {
public:
    void push(const std::string& name, int64_t quantity);
    void push(const Item& item) { push(item.name, item.quantity); }

    /**
     * Removes and returns the most recently slotted pending item.
     * Throws std::out_of_range if the queue is empty.
     */
    Item pop();

    /**
     * Pending quantity for name, 0 if it has no slot.
     */
    int64_t pending(const std::string& name) const;

    bool empty() const { return slots.empty(); }
    size_t size() const { return slots.size(); }

private:
    std::vector<Item> slots; // slot order; only the back is ever removed
    std::unordered_map<std::string, size_t> index;
};

#endif // PROCESSQUEUE_H
