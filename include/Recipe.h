/*
 * Recipe.h
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

#ifndef RECIPE_H
#define RECIPE_H

#include "Item.h"
#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief A recipe turns one batch of ingredients into one batch of its main product.
 *
 * Recipe rules:
 * - The main product names the output and its quantity is the batch size.
 * - Ingredients are consumed per batch, in order.
 * - Byproducts are side outputs produced per batch; they are optional.
 */
class Recipe {
public:
    Item main_product;
    std::vector<Item> ingredients;
    std::vector<Item> byproducts;

    Recipe(Item main_product, std::vector<Item> ingredients, std::vector<Item> byproducts = {});

    /**
     * Quantity of main product yielded by one execution of the recipe.
     */
    int64_t batch_size() const { return main_product.quantity; }

    /**
     * Name of the main product, which is also the key of the recipe in a RecipeGroup.
     */
    const std::string& name() const { return main_product.name; }

    bool operator==(const Recipe& other) const;
};

#endif // RECIPE_H
