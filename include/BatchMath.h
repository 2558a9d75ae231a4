/*
 * BatchMath.h
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

#ifndef BATCHMATH_H
#define BATCHMATH_H

#include <cstdint>

/**
 * Number of recipe executions needed to obtain at least min_quantity items
 * when one execution yields batch_size items: ceil(min_quantity / batch_size).
 * Returns 0 when min_quantity is 0.
 * Throws std::invalid_argument when batch_size < 1.
 */
int64_t process_times(int64_t min_quantity, int64_t batch_size);

/**
 * Amount actually produced to cover min_quantity: the smallest multiple of
 * batch_size that is >= min_quantity.
 * Throws std::invalid_argument when batch_size < 1.
 */
int64_t required_quantity(int64_t min_quantity, int64_t batch_size);

#endif // BATCHMATH_H
