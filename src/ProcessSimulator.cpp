/*
 * ProcessSimulator.cpp
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

#include "ProcessSimulator.h"
#include "BatchMath.h"
#include "JsonUtil.h"
#include <cstdio>
#include <sstream>
#include <stdexcept>
#include <utility>

#define DEBUG 0

std::string CostsResult::to_json() const {
    std::ostringstream oss;
    oss << "{";
    oss << "\"total_costs\":" << json_array(total_costs) << ",";
    oss << "\"excess_items\":" << json_array(excess_items) << ",";
    oss << "\"intermediate_history\":" << json_array(intermediate_history);
    oss << "}";
    return oss.str();
}

CostsResult ProcessSimulator::get_total_costs(const RecipeGroup& recipes, const Item& item) {
    return get_total_costs(recipes, std::vector<Item>{item});
}

CostsResult ProcessSimulator::get_total_costs(const RecipeGroup& recipes, const std::vector<Item>& items) {
    ProcessSimulator sim(recipes);
    sim.run(items);
    return sim.collect();
}

void ProcessSimulator::run(const std::vector<Item>& items) {
    // Seed the queue with every requested item
    for (const Item& item : items) {
        processing_queue.push(item);
    }

    while (!processing_queue.empty()) {
        process(processing_queue.pop());
    }
}

void ProcessSimulator::process(Item item) {
    const Recipe* recipe = recipes.get_recipe(item.name);

    // Raw material: nothing to craft
    if (recipe == nullptr) {
        if (DEBUG) {
            std::printf("RAW: %s\n", item.to_string().c_str());
        }
        total_costs.add(item);
        return;
    }

    int64_t batch_size = recipe->batch_size();
    if (batch_size < 1)
        throw std::invalid_argument("recipe for " + item.name + " has batch size " + std::to_string(batch_size));
    consume_excess(item, batch_size);

    int64_t actual = required_quantity(item.quantity, batch_size);
    int64_t times = process_times(item.quantity, batch_size);

    for (const Item& ingredient : recipe->ingredients) {
        processing_queue.push(ingredient.name, ingredient.quantity * times);
    }
    for (const Item& byproduct : recipe->byproducts) {
        excess_items.add(byproduct.name, byproduct.quantity * times);
    }

    intermediate_history.add(item);

    // Batch rounding overproduction is kept for later demand
    if (actual > item.quantity) {
        excess_items.add(item.name, actual - item.quantity);
    }

    if (DEBUG) {
        std::printf("CRAFT: %s times=%lld actual=%lld\n", item.to_string().c_str(),
                    (long long)times, (long long)actual);
    }
}

void ProcessSimulator::consume_excess(Item& item, int64_t batch_size) {
    Item* extra = excess_items.find(item.name);
    if (extra == nullptr)
        return;
    while (batch_size <= extra->quantity && batch_size <= item.quantity) {
        extra->quantity -= batch_size;
        item.quantity -= batch_size;
    }
}

CostsResult ProcessSimulator::collect() const {
    CostsResult result;
    result.total_costs = total_costs.sorted_by_quantity();
    result.excess_items = excess_items.sorted_by_quantity();
    result.intermediate_history = intermediate_history.items();
    return result;
}
