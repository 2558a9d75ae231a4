/*
 * RecipeGroup.cpp
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

#include "RecipeGroup.h"

RecipeGroup::RecipeGroup(const std::vector<Recipe>& recipes) {
    add_recipes(recipes);
}

RecipeGroup& RecipeGroup::add_recipe(const Item& main_product, const std::vector<Item>& ingredients,
                                     const std::vector<Item>& byproducts) {
    return add_recipe(Recipe(main_product, ingredients, byproducts));
}

RecipeGroup& RecipeGroup::add_recipe(const Recipe& recipe) {
    // Last registration for a name wins.
    recipes.insert_or_assign(recipe.name(), recipe);
    return *this;
}

RecipeGroup& RecipeGroup::add_recipes(const std::vector<Recipe>& list) {
    for (const Recipe& recipe : list) {
        add_recipe(recipe);
    }
    return *this;
}

const Recipe* RecipeGroup::get_recipe(const std::string& item_name) const {
    auto it = recipes.find(item_name);
    if (it == recipes.end())
        return nullptr;
    return &it->second;
}
