#pragma once

#include "errors.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <rapidfuzz/distance/Hamming.hpp>
#include <rapidfuzz/distance/Indel.hpp>
#include <rapidfuzz/distance/Jaro.hpp>
#include <rapidfuzz/distance/Levenshtein.hpp>
#include <string>

namespace levtools {

/**
 * levenshtein:
 * @s1: The source string.
 * @s2: The destination string.
 * @substitution_weight: The cost of a replace operation.  1 is the classic
 *                       Levenshtein distance, 2 makes replace as expensive
 *                       as delete + insert (i.e. Indel distance).
 *
 * Computes Levenshtein edit distance of two strings.
 *
 * Returns: The edit distance.
 **/
template <typename CharT>
size_t levenshtein(const std::basic_string<CharT>& s1, const std::basic_string<CharT>& s2,
                   size_t substitution_weight = 1)
{
    if (substitution_weight != 1 && substitution_weight != 2)
        throw invalid_argument("substitution weight must be 1 or 2");

    rapidfuzz::LevenshteinWeightTable weights;
    weights.insert_cost = 1;
    weights.delete_cost = 1;
    weights.replace_cost = (int64_t)substitution_weight;
    return (size_t)rapidfuzz::levenshtein_distance(s1, s2, weights);
}

/* absolute Levenshtein distance, all operations have weight 1 */
template <typename CharT>
size_t distance(const std::basic_string<CharT>& s1, const std::basic_string<CharT>& s2)
{
    return (size_t)rapidfuzz::levenshtein_distance(s1, s2);
}

/**
 * ratio:
 * @s1: The first string.
 * @s2: The second string.
 *
 * Computes similarity of two strings.
 *
 * The similarity is a number between 0 and 1, based on the edit distance
 * with replace weighted 2, so it's comparable to block matching ratios.
 *
 * Returns: The similarity, 1.0 for two empty strings.
 **/
template <typename CharT>
double ratio(const std::basic_string<CharT>& s1, const std::basic_string<CharT>& s2)
{
    size_t lensum = s1.size() + s2.size();
    if (!lensum) return 1.0;

    size_t ldist = (size_t)rapidfuzz::indel_distance(s1, s2);
    return (double)(lensum - ldist) / (double)lensum;
}

/**
 * hamming:
 * @s1: The first string.
 * @s2: The second string, of the same length as @s1.
 *
 * Computes Hamming distance of two strings, the number of differing
 * characters.
 *
 * Returns: The Hamming distance.
 **/
template <typename CharT>
size_t hamming(const std::basic_string<CharT>& s1, const std::basic_string<CharT>& s2)
{
    if (s1.size() != s2.size())
        throw length_mismatch("hamming expected two strings of the same length");

    return (size_t)rapidfuzz::hamming_distance(s1, s2);
}

/* Jaro string similarity metric, 0 for completely different strings and 1
 * for identical ones */
template <typename CharT>
double jaro(const std::basic_string<CharT>& s1, const std::basic_string<CharT>& s2)
{
    /* catch trivial cases */
    if (s1.empty() && s2.empty()) return 1.0;
    if (s1.empty() || s2.empty()) return 0.0;

    return rapidfuzz::jaro_similarity(s1, s2);
}

/**
 * jaro_winkler:
 * @s1: The first string.
 * @s2: The second string.
 * @prefix_weight: Weight of the common prefix.
 *
 * Computes Jaro-Winkler string similarity metric of two strings.
 *
 * The formula is J + @prefix_weight * P * (1 - J), where J is the Jaro
 * metric and P the length of the common prefix, at most 4.  The prefix
 * weight is the inverse of the common prefix length sufficient to consider
 * the strings identical; @prefix_weight * P is capped at 1.
 *
 * Returns: The similarity.
 **/
template <typename CharT>
double jaro_winkler(const std::basic_string<CharT>& s1, const std::basic_string<CharT>& s2,
                    double prefix_weight = 0.1)
{
    if (prefix_weight < 0) throw invalid_argument("jaro_winkler negative prefix weight");

    double j = jaro(s1, s2);

    size_t max_prefix = std::min<size_t>(4, std::min(s1.size(), s2.size()));
    size_t prefix = 0;
    while (prefix < max_prefix && s1[prefix] == s2[prefix])
        prefix++;

    double boost = prefix_weight * (double)prefix;
    if (boost > 1.0) boost = 1.0;

    return j + boost * (1.0 - j);
}

} // namespace levtools
