/*
 * ProcessSimulator.h
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

#ifndef PROCESSSIMULATOR_H
#define PROCESSSIMULATOR_H

#include "Item.h"
#include "ItemPool.h"
#include "ProcessQueue.h"
#include "RecipeGroup.h"
#include <string>
#include <vector>

/**
 * @brief Outcome of one simulation.
 */
struct CostsResult {
    std::vector<Item> total_costs;          // raw materials consumed, largest first
    std::vector<Item> excess_items;         // surplus left at the end, largest first
    std::vector<Item> intermediate_history; // amount processed per craftable item, in processing order

    bool operator==(const CostsResult& other) const {
        return total_costs == other.total_costs &&
               excess_items == other.excess_items &&
               intermediate_history == other.intermediate_history;
    }

    /**
     * Convert the result to a JSON object string.
     */
    std::string to_json() const;
};

/**
 * @brief The ProcessSimulator resolves the total cost of a request across the whole recipe graph.
 *
 * Simulation rules:
 * - Demand for the same item is consolidated system-wide in a processing queue.
 * - Items without a recipe are raw materials and are added to the total costs.
 * - Items with a recipe first consume whole batches of banked surplus, then are
 *   produced in whole batches; their ingredients go back into the queue.
 * - Batch-rounding overproduction and byproducts are banked as excess, available
 *   to later demand for the same item.
 * - The queue pops the most recently slotted pending item first.
 *
 * All pools belong to one call of get_total_costs(); nothing is shared between calls.
 * The recipe graph must be acyclic, otherwise the simulation never ends.
 */
class ProcessSimulator {
public:
    /**
     * Simulates producing a single item.
     */
    static CostsResult get_total_costs(const RecipeGroup& recipes, const Item& item);
    /**
     * Simulates producing every item of the list; duplicate names are merged.
     */
    static CostsResult get_total_costs(const RecipeGroup& recipes, const std::vector<Item>& items);

private:
    explicit ProcessSimulator(const RecipeGroup& recipes) : recipes(recipes) {}

    const RecipeGroup& recipes;

    // State
    ProcessQueue processing_queue;
    ItemPool excess_items;
    ItemPool total_costs;
    ItemPool intermediate_history;

    void run(const std::vector<Item>& items);
    /**
     * Processes one popped queue entry.
     */
    void process(Item item);
    /**
     * Offsets demand with banked surplus, one whole batch at a time.
     */
    void consume_excess(Item& item, int64_t batch_size);
    CostsResult collect() const;
};

#endif // PROCESSSIMULATOR_H
