/*
 * median.cpp
 * levtools: Levenshtein distances, string similarities, edit operation
 * algebra, median strings and other goodies.
 *
 * This program is free software; you can redistribute it and/or modify it
 * under the terms of the GNU General Public License as published by the Free
 * Software Foundation; either version 2 of the License, or (at your option)
 * any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT
 * ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 * FITNESS FOR A PARTICULAR PURPOSE.  See the GNU General Public License for
 * more details.
 *
 * You should have received a copy of the GNU General Public License along
 * with this program; if not, write to the Free Software Foundation, Inc.,
 * 59 Temple Place, Suite 330, Boston, MA 02111-1307 USA.
 **/

#include "median.hpp"

#include <string>

namespace levtools {
namespace detail {

std::vector<double> resolve_weights(size_t n, const std::vector<double>& weights, const char* name)
{
    if (weights.empty()) return std::vector<double>(n, 1.0);

    if (weights.size() != n)
        throw invalid_argument(std::string(name) + " got " + std::to_string(n) + " strings but " +
                               std::to_string(weights.size()) + " weights");

    for (double w : weights) {
        if (w < 0) throw invalid_argument(std::string(name) + " negative weight");
    }

    return weights;
}

} // namespace detail
} // namespace levtools
