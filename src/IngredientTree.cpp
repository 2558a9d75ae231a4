/*
 * IngredientTree.cpp
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

#include "IngredientTree.h"
#include "BatchMath.h"
#include "JsonUtil.h"
#include <sstream>

IngredientTree::IngredientTree(const Item& item, const RecipeGroup& recipes)
    : requested(item), actual(item.quantity) {
    calculate_children(recipes);
}

IngredientTree IngredientTree::build(const Item& item, const RecipeGroup& recipes) {
    return IngredientTree(item, recipes);
}

void IngredientTree::calculate_children(const RecipeGroup& recipes) {
    const Recipe* recipe = recipes.get_recipe(requested.name);
    if (recipe == nullptr)
        return; // raw material

    actual = required_quantity(requested.quantity, recipe->batch_size());
    int64_t times = process_times(requested.quantity, recipe->batch_size());

    nodes.reserve(recipe->ingredients.size());
    for (const Item& ingredient : recipe->ingredients) {
        nodes.emplace_back(Item(ingredient.name, ingredient.quantity * times), recipes);
    }
    side_outputs.reserve(recipe->byproducts.size());
    for (const Item& byproduct : recipe->byproducts) {
        side_outputs.emplace_back(byproduct.name, byproduct.quantity * times);
    }
}

std::string IngredientTree::to_string() const {
    std::string out;
    render(out, true, true, "");
    return out;
}

void IngredientTree::render(std::string& out, bool is_root, bool is_last, const std::string& prefix) const {
    if (!is_root) {
        out += '\n';
        out += prefix;
        out += is_last ? "\\-" : "|-";
    }
    out += requested.to_string();

    if (actual != requested.quantity)
        out += " (+" + std::to_string(actual - requested.quantity) + ")";

    if (!side_outputs.empty()) {
        out += " [";
        for (size_t i = 0; i < side_outputs.size(); ++i) {
            if (i > 0) out += " + ";
            out += side_outputs[i].to_string();
        }
        out += "]";
    }

    std::string child_prefix = is_root ? "" : prefix + (is_last ? "  " : "| ");
    for (size_t i = 0; i < nodes.size(); ++i) {
        nodes[i].render(out, false, i + 1 == nodes.size(), child_prefix);
    }
}

std::string IngredientTree::to_json() const {
    std::ostringstream oss;
    oss << "{";
    oss << "\"item\":" << requested.to_json() << ",";
    oss << "\"actual_quantity\":" << actual << ",";
    oss << "\"byproducts\":" << json_array(side_outputs) << ",";
    oss << "\"children\":" << json_array(nodes);
    oss << "}";
    return oss.str();
}
