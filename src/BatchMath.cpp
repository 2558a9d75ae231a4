/*
 * BatchMath.cpp
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

#include "BatchMath.h"
#include <stdexcept>
#include <string>

int64_t process_times(int64_t min_quantity, int64_t batch_size) {
    if (batch_size < 1)
        throw std::invalid_argument("batch size must be at least 1, got " + std::to_string(batch_size));
    // Integer ceiling without forming min_quantity + batch_size, which can overflow.
    return min_quantity / batch_size + (min_quantity % batch_size != 0 ? 1 : 0);
}

int64_t required_quantity(int64_t min_quantity, int64_t batch_size) {
    return process_times(min_quantity, batch_size) * batch_size;
}
