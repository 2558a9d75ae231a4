/*
 * Recipe.cpp
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

#include "Recipe.h"
#include <utility>

Recipe::Recipe(Item main_product, std::vector<Item> ingredients, std::vector<Item> byproducts)
    : main_product(std::move(main_product)),
      ingredients(std::move(ingredients)),
      byproducts(std::move(byproducts)) {}

bool Recipe::operator==(const Recipe& other) const {
    return main_product == other.main_product &&
           ingredients == other.ingredients &&
           byproducts == other.byproducts;
}
