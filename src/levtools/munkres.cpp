/*
 * munkres.cpp
 * levtools: Levenshtein distances, string similarities, edit operation
 * algebra, median strings and other goodies.
 *
 * Copyright (C) 2002-2003 David Necas (Yeti) <yeti@physics.muni.cz>.
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

#include "set_distance.hpp"

#include <algorithm>
#include <limits>

/* values smaller than this are considered to be zero */
#define LEVTOOLS_EPSILON 1e-14

namespace levtools {

/*
 * Munkres-Blackman algorithm.
 *
 * Columns are the @n1 elements of the smaller set, rows the @n2 elements of
 * the larger one.  zstarc/zstarr/zprimer hold 1-based indices, 0 meaning
 * none.
 */
std::vector<size_t> munkres_blackman(size_t n1, size_t n2, std::vector<double>& dists)
{
    std::vector<size_t> covc(n1);
    std::vector<size_t> zstarc(n1);
    std::vector<size_t> covr(n2);
    std::vector<size_t> zstarr(n2);
    std::vector<size_t> zprimer(n2);

    auto cell = [&](size_t i, size_t j) -> double& {
        return dists[i * n1 + j];
    };

    /* step 0 (subtract minimal distance) and step 1 (find zeroes) */
    for (size_t j = 0; j < n1; j++) {
        size_t minidx = 0;
        double min = cell(0, j);
        for (size_t i = 1; i < n2; i++) {
            if (min > cell(i, j)) {
                minidx = i;
                min = cell(i, j);
            }
        }
        /* subtract */
        for (size_t i = 0; i < n2; i++) {
            cell(i, j) -= min;
            if (cell(i, j) < LEVTOOLS_EPSILON) cell(i, j) = 0.0;
        }
        /* star the zero, if possible */
        if (!zstarc[j] && !zstarr[minidx]) {
            zstarc[j] = minidx + 1;
            zstarr[minidx] = j + 1;
        }
        else {
            /* otherwise try to find some other */
            for (size_t i = 0; i < n2; i++) {
                if (i != minidx && cell(i, j) == 0.0 && !zstarc[j] && !zstarr[i]) {
                    zstarc[j] = i + 1;
                    zstarr[i] = j + 1;
                    break;
                }
            }
        }
    }

    /* step 3 (find uncovered zeroes): primes them, covering rows with a z*
     * and uncovering its column, until a zero without z* in its row turns
     * up.  returns its row + 1, or 0 when there's no uncovered zero left */
    auto find_uncovered_zero = [&]() -> size_t {
        for (;;) {
            bool restart = false;
            for (size_t j = 0; j < n1 && !restart; j++) {
                if (covc[j]) continue;
                for (size_t i = 0; i < n2; i++) {
                    if (covr[i] || cell(i, j) != 0.0) continue;
                    /* when a zero is found, prime it */
                    zprimer[i] = j + 1;
                    /* if there's no z*, we are at the end of our path and
                     * can convert z' to z* */
                    if (!zstarr[i]) return i + 1;
                    /* if there's a z* in the same row,
                     * uncover the column, cover the row and redo */
                    covr[i] = 1;
                    covc[zstarr[i] - 1] = 0;
                    restart = true;
                    break;
                }
            }
            if (!restart) return 0;
        }
    };

    /* step 5 (new zero manufacturer) */
    auto make_zero = [&]() {
        /* find the smallest uncovered entry */
        double min = std::numeric_limits<double>::max();
        for (size_t j = 0; j < n1; j++) {
            if (covc[j]) continue;
            for (size_t i = 0; i < n2; i++) {
                if (!covr[i] && min > cell(i, j)) min = cell(i, j);
            }
        }
        /* add it to all covered rows */
        for (size_t i = 0; i < n2; i++) {
            if (!covr[i]) continue;
            for (size_t j = 0; j < n1; j++)
                cell(i, j) += min;
        }
        /* subtract it from all uncovered columns */
        for (size_t j = 0; j < n1; j++) {
            if (covc[j]) continue;
            for (size_t i = 0; i < n2; i++) {
                cell(i, j) -= min;
                if (cell(i, j) < LEVTOOLS_EPSILON) cell(i, j) = 0.0;
            }
        }
    };

    /* main */
    for (;;) {
        /* step 2 (cover columns containing z*) */
        size_t nc = 0;
        for (size_t j = 0; j < n1; j++) {
            if (zstarc[j]) {
                covc[j] = 1;
                nc++;
            }
        }
        if (nc == n1) break;

        size_t i;
        while (!(i = find_uncovered_zero()))
            make_zero();

        /* step 4 (increment the number of z*)
         * i is the row number + 1 (we get it from step 3) */
        do {
            size_t x = i;

            i--;
            size_t j = zprimer[i] - 1; /* move to z' in the same row */
            zstarr[i] = j + 1;         /* mark it as z* in row buffer */
            i = zstarc[j];             /* move to z* in the same column */
            zstarc[j] = x;             /* mark the z' as being new z* */
        } while (i);

        std::fill(zprimer.begin(), zprimer.end(), 0);
        std::fill(covr.begin(), covr.end(), 0);
        std::fill(covc.begin(), covc.end(), 0);
    }

    for (auto& z : zstarc)
        z--;
    return zstarc;
}

} // namespace levtools
