#pragma once

#include "log.hpp"
#include "sequence.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <new>
#include <rapidfuzz/distance/Indel.hpp>
#include <string>
#include <utility>
#include <vector>

namespace levtools {

/* Munkres-Blackman assignment of the @n1 columns to distinct rows of the
 * @n2 x @n1 row-major cost matrix @dists, @n1 <= @n2.  @dists is used as
 * scratch space.  Returns the row index assigned to each column. */
std::vector<size_t> munkres_blackman(size_t n1, size_t n2, std::vector<double>& dists);

namespace detail {

/* cost of replacing one token by another: 0 for identical strings, 2 for
 * completely unsimilar ones */
template <typename CharT>
static inline double token_cost(const rapidfuzz::CachedIndel<CharT>& scorer, const std::basic_string<CharT>& s1,
                                const std::basic_string<CharT>& s2)
{
    if (s1.empty() && s2.empty()) return 0.0;
    return 2.0 * scorer.normalized_distance(s2);
}

template <typename CharT>
double seq_distance(const std::basic_string<CharT>* strings1, size_t n1,
                    const std::basic_string<CharT>* strings2, size_t n2)
{
    /* make the inner cycle (i.e. strings2) the longer one */
    if (n1 > n2) return seq_distance(strings2, n2, strings1, n1);

    /* equal leading tokens cost nothing */
    while (n1 > 0 && n2 > 0 && *strings1 == *strings2) {
        n1--;
        n2--;
        strings1++;
        strings2++;
    }

    /* nor do equal trailing ones */
    while (n1 > 0 && n2 > 0 && strings1[n1 - 1] == strings2[n2 - 1]) {
        n1--;
        n2--;
    }

    /* catch trivial cases */
    if (n1 == 0) return (double)n2;
    if (n2 == 0) return (double)n1;

    /* row 0: distances from the empty token prefix */
    auto row = std::make_unique<double[]>(n2 + 1);
    for (size_t i = 0; i <= n2; i++)
        row[i] = (double)i;

    for (size_t i = 1; i <= n1; i++) {
        const auto& str1 = strings1[i - 1];
        rapidfuzz::CachedIndel<CharT> scorer(str1);
        double* p = row.get() + 1;
        double D = (double)i - 1.0;
        double x = (double)i;
        for (size_t j = 0; j < n2; j++) {
            double q = D + token_cost(scorer, str1, strings2[j]);
            x += 1.0;
            if (x > q) x = q;
            D = *p;
            if (x > D + 1.0) x = D + 1.0;
            *(p++) = x;
        }
    }

    return row[n2];
}

template <typename CharT>
double set_distance(const std::vector<std::basic_string<CharT>>& strings1,
                    const std::vector<std::basic_string<CharT>>& strings2)
{
    /* make the number of columns (n1) smaller than the number of rows */
    if (strings1.size() > strings2.size()) return set_distance(strings2, strings1);

    size_t n1 = strings1.size();
    size_t n2 = strings2.size();

    /* catch trivial cases */
    if (n1 == 0) return (double)n2;

    /* extra-conservative overflow check */
    if (SIZE_MAX / sizeof(double) / n1 <= n2) throw std::bad_alloc();

    /* full n1 x n2 cost matrix */
    std::vector<double> dists(n1 * n2);
    for (size_t i = 0; i < n2; i++) {
        rapidfuzz::CachedIndel<CharT> scorer(strings2[i]);
        for (size_t j = 0; j < n1; j++)
            dists[i * n1 + j] = scorer.normalized_distance(strings1[j]);
    }

    /* column i is assigned row map[i] */
    std::vector<size_t> map = munkres_blackman(n1, n2, dists);

    /* sum the set distance, every unmatched string costs 1 */
    double sum = (double)(n2 - n1);
    for (size_t j = 0; j < n1; j++) {
        const auto& str2 = strings2[map[j]];
        rapidfuzz::CachedIndel<CharT> scorer(strings1[j]);
        sum += token_cost(scorer, strings1[j], str2);
    }

    log("set_distance", log::DEBUG)() << "assigned " << n1 << " of " << n2 << " strings, distance " << sum;

    return sum;
}

/* common normalization of seq_ratio() and set_ratio() */
static inline double distance_to_ratio(size_t n1, size_t n2, double dist)
{
    size_t lensum = n1 + n2;
    if (!lensum) return 1.0;
    if (!n1 || !n2) return 0.0;
    return ((double)lensum - dist) / (double)lensum;
}

} // namespace detail

/**
 * seq_distance:
 * @strings1: A sequence of strings.
 * @strings2: Another sequence of strings.
 *
 * Finds the distance between string sequences @strings1 and @strings2.
 *
 * In other words, this is a double-Levenshtein algorithm.
 *
 * The cost of string replace operation is based on string similarity: it's
 * zero for identical strings and 2 for completely unsimilar strings.
 *
 * Returns: The distance of the two sequences.
 **/
template <typename CharT>
double seq_distance(const std::vector<std::basic_string<CharT>>& strings1,
                    const std::vector<std::basic_string<CharT>>& strings2)
{
    return detail::seq_distance(strings1.data(), strings1.size(), strings2.data(), strings2.size());
}

/* similarity of two string sequences, 1.0 for two empty sequences */
template <typename CharT>
double seq_ratio(const std::vector<std::basic_string<CharT>>& strings1,
                 const std::vector<std::basic_string<CharT>>& strings2)
{
    if (strings1.empty() || strings2.empty())
        return detail::distance_to_ratio(strings1.size(), strings2.size(), 0.0);

    return detail::distance_to_ratio(strings1.size(), strings2.size(), seq_distance(strings1, strings2));
}

/**
 * set_distance:
 * @strings1: A set of strings.
 * @strings2: Another set of strings.
 *
 * Finds the distance between string sets @strings1 and @strings2.
 *
 * The difference from seq_distance() is that order doesn't matter.
 * The optimal association of @strings1 and @strings2 is found first and
 * the similarity is computed for that.
 *
 * Uses sequential Munkres-Blackman algorithm.
 *
 * Returns: The distance of the two sets.
 **/
template <typename CharT>
double set_distance(const std::vector<std::basic_string<CharT>>& strings1,
                    const std::vector<std::basic_string<CharT>>& strings2)
{
    return detail::set_distance(strings1, strings2);
}

template <typename CharT>
double set_ratio(const std::vector<std::basic_string<CharT>>& strings1,
                 const std::vector<std::basic_string<CharT>>& strings2)
{
    if (strings1.empty() || strings2.empty())
        return detail::distance_to_ratio(strings1.size(), strings2.size(), 0.0);

    return detail::distance_to_ratio(strings1.size(), strings2.size(), set_distance(strings1, strings2));
}

} // namespace levtools
