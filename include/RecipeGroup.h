/*
 * RecipeGroup.h
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

#ifndef RECIPEGROUP_H
#define RECIPEGROUP_H

#include "Item.h"
#include "Recipe.h"
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @brief The recipe catalog: recipes keyed by the name of their main product.
 *
 * At most one recipe is kept per output name; registering a recipe for a name
 * that is already present replaces the previous one. The tree builder and the
 * process simulator only read from the catalog, so it must not be modified
 * while either of them is running.
 */
class RecipeGroup {
public:
    RecipeGroup() {};
    RecipeGroup(const std::vector<Recipe>& recipes);

    /**
     * Registers a recipe built from its parts. Returns the group for chaining.
     */
    RecipeGroup& add_recipe(const Item& main_product, const std::vector<Item>& ingredients,
                            const std::vector<Item>& byproducts = {});
    /**
     * Registers a recipe. Returns the group for chaining.
     */
    RecipeGroup& add_recipe(const Recipe& recipe);
    /**
     * Registers every recipe of the list, in order.
     */
    RecipeGroup& add_recipes(const std::vector<Recipe>& recipes);

    /**
     * Returns the recipe producing the named item, or nullptr when the item
     * has no recipe (a raw material).
     */
    const Recipe* get_recipe(const std::string& item_name) const;

    bool contains(const std::string& item_name) const { return recipes.count(item_name) > 0; }
    size_t size() const { return recipes.size(); }

private:
    std::unordered_map<std::string, Recipe> recipes;
};

#endif // RECIPEGROUP_H
