/*
 * DefaultRecipes.cpp
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

#include "DefaultRecipes.h"

RecipeGroup default_recipes() {
    return RecipeGroup({
        Recipe(Item("Wood Plank", 4), {Item("Log")}),
        Recipe(Item("Stick", 4), {Item("Wood Plank", 2)}),
        Recipe(Item("Wooden Pickaxe"), {Item("Stick", 2), Item("Wood Plank", 3)}),
        Recipe(Item("Cake"),
               {Item("Wheat", 3), Item("Milk Bucket", 3), Item("Egg"), Item("Sugar", 2)},
               {Item("Bucket", 3)}), // the milk buckets come back empty
        Recipe(Item("Bucket"), {Item("Iron Ingot", 3)}),
        Recipe(Item("Sugar"), {Item("Sugar Cane")}),
    });
}

std::vector<Item> demo_requests() {
    return {
        Item("Cake", 1),
        Item("Cake", 5),
        Item("Wooden Pickaxe", 1),
        Item("Wooden Pickaxe", 2),
        Item("Wooden Pickaxe", 11),
    };
}
