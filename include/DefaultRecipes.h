/*
 * DefaultRecipes.h
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

#ifndef DEFAULTRECIPES_H
#define DEFAULTRECIPES_H

#include "Item.h"
#include "RecipeGroup.h"
#include <vector>

/**
 * Builds the sample catalog used by the command line tool (tools, cake, bucket).
 */
RecipeGroup default_recipes();

/**
 * The requests the command line tool runs when no item is given.
 */
std::vector<Item> demo_requests();

#endif // DEFAULTRECIPES_H
