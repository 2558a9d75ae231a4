/*
 * IngredientTree.h
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

#ifndef INGREDIENTTREE_H
#define INGREDIENTTREE_H

#include "Item.h"
#include "RecipeGroup.h"
#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief Per-branch breakdown of the ingredients needed for an item.
 *
 * Tree rules:
 * - A node whose item has no recipe is a leaf and produces exactly the requested quantity.
 * - A node with a recipe produces the requested quantity rounded up to whole batches;
 *   it has one child per recipe ingredient, scaled by the number of batches.
 * - Byproducts are scaled by the number of batches and only reported, never reused.
 * - Shared ingredients are recomputed in every branch; nothing is consolidated.
 *
 * The recipe graph must be acyclic: a cycle recurses without bound.
 */
class IngredientTree {
public:
    /**
     * Builds the node for item and, recursively, all of its ingredients.
     */
    IngredientTree(const Item& item, const RecipeGroup& recipes);

    static IngredientTree build(const Item& item, const RecipeGroup& recipes);

    const Item& item() const { return requested; }
    int64_t actual_quantity() const { return actual; }
    const std::vector<IngredientTree>& children() const { return nodes; }
    const std::vector<Item>& byproducts() const { return side_outputs; }

    /**
     * Overproduction at this node caused by batch rounding.
     */
    int64_t excess_quantity() const { return actual - requested.quantity; }

    /**
     * Renders the tree, one node per line, depth-first:
     *
     *     Wooden Pickaxe x1
     *     |-Stick x2 (+2)
     *     | \-Wood Plank x2 (+2)
     *     |   \-Log x1
     *     \-Wood Plank x3 (+1)
     *       \-Log x1
     */
    std::string to_string() const;

    /**
     * Convert the tree to a nested JSON object string.
     */
    std::string to_json() const;

private:
    Item requested;
    int64_t actual{0};
    std::vector<IngredientTree> nodes;
    std::vector<Item> side_outputs;

    void calculate_children(const RecipeGroup& recipes);
    void render(std::string& out, bool is_root, bool is_last, const std::string& prefix) const;
};

#endif // INGREDIENTTREE_H
