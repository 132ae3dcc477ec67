#pragma once

#include "editops.hpp"
#include "log.hpp"
#include "sequence.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <memory>
#include <numeric>
#include <stdexcept>
#include <rapidfuzz/distance/Levenshtein.hpp>
#include <string>
#include <vector>

namespace levtools {
namespace detail {

/* check the weights of @n strings, an empty list means weight 1 for all */
std::vector<double> resolve_weights(size_t n, const std::vector<double>& weights, const char* name);

template <typename CharT>
static inline size_t max_length(const std::vector<std::basic_string<CharT>>& strings)
{
    size_t maxlen = 0;
    for (const auto& string : strings)
        maxlen = std::max(maxlen, string.size());
    return maxlen;
}

/* one DP row per input string, each starting as the distances from the
 * empty median */
template <typename CharT>
std::vector<std::unique_ptr<size_t[]>> make_rows(const std::vector<std::basic_string<CharT>>& strings)
{
    std::vector<std::unique_ptr<size_t[]>> rows(strings.size());
    for (size_t i = 0; i < strings.size(); i++) {
        size_t leni = strings[i].size();
        rows[i] = std::make_unique<size_t[]>(leni + 1);
        std::iota(rows[i].get(), rows[i].get() + leni + 1, 0);
    }
    return rows;
}

/* advance every per-string row by one median symbol; @row is the common
 * work buffer and row[0] must already hold the new median length */
template <typename CharT>
void advance_rows(CharT symbol, const std::vector<std::basic_string<CharT>>& strings,
                  std::vector<std::unique_ptr<size_t[]>>& rows, std::unique_ptr<size_t[]>& row)
{
    for (size_t i = 0; i < strings.size(); i++) {
        const auto& stri = strings[i];
        size_t* oldrow = rows[i].get();
        /* next row: delete, insert or substitute, whichever is cheapest */
        for (size_t k = 1; k <= stri.size(); k++) {
            size_t c1 = oldrow[k] + 1;
            size_t c2 = row[k - 1] + 1;
            size_t c3 = oldrow[k - 1] + (symbol != stri[k - 1]);
            row[k] = c2 > c3 ? c3 : c2;
            if (row[k] > c1) row[k] = c1;
        }
        std::copy_n(row.get(), stri.size() + 1, oldrow);
    }
}

/**
 * greedy_median:
 * @strings: The input strings.
 * @weights: One non-negative weight per string, acting as a multiplicity.
 *
 * Grows the median one symbol at a time.  Each input keeps the last row of
 * its Levenshtein matrix against the median built so far; at every length
 * the symbol with the lowest weighted sum of row minima is appended.
 *
 * A weight of 2 costs the same as weight 1, duplicating the string costs
 * twice as much.
 *
 * Returns: The best prefix found, possibly empty.
 **/
template <typename CharT>
std::basic_string<CharT> greedy_median(const std::vector<std::basic_string<CharT>>& strings,
                                       const std::vector<double>& weights)
{
    std::basic_string<CharT> result_median;

    std::vector<CharT> symlist = make_symlist(strings);
    if (symlist.empty()) return result_median;

    auto rows = make_rows(strings);
    size_t maxlen = max_length(strings);
    size_t stoplen = 2 * maxlen + 1;
    auto row = std::make_unique<size_t[]>(stoplen + 1);

    /* median[k] is the symbol at position k, mediandist[k] the total
     * distance of the k symbols long prefix; mediandist[0] is the empty
     * string */
    auto median = std::make_unique<CharT[]>(stoplen);
    auto mediandist = std::make_unique<double[]>(stoplen + 1);
    mediandist[0] = 0.0;
    for (size_t i = 0; i < strings.size(); i++)
        mediandist[0] += (double)strings[i].size() * weights[i];

    /* the loop always leaves through the break at stoplen */
    for (size_t len = 1; len <= stoplen; len++) {
        double best_minsum = std::numeric_limits<double>::max();
        row[0] = len;
        for (CharT symbol : symlist) {
            double totaldist = 0.0;
            double minsum = 0.0;
            for (size_t i = 0; i < strings.size(); i++) {
                /* the next row for this string, evaluated in place: only its
                 * minimum and last cell are needed */
                const size_t* prev = rows[i].get();
                size_t min = len;
                size_t x = len;
                for (CharT ch : strings[i]) {
                    size_t diag = *(prev++) + (symbol != ch);
                    x++;
                    if (x > diag) x = diag;
                    if (x > *prev + 1) x = *prev + 1;
                    if (x < min) min = x;
                }
                minsum += (double)min * weights[i];
                totaldist += (double)x * weights[i];
            }
            if (minsum < best_minsum) {
                best_minsum = minsum;
                mediandist[len] = totaldist;
                median[len - 1] = symbol;
            }
        }
        /* past maxlen a longer median only helps while the total keeps
         * dropping */
        if (len == stoplen || (len > maxlen && mediandist[len] > mediandist[len - 1])) {
            stoplen = len;
            break;
        }
        advance_rows(median[len - 1], strings, rows, row);
    }

    size_t bestlen =
        (size_t)std::distance(mediandist.get(), std::min_element(mediandist.get(), mediandist.get() + stoplen));

    log("median", log::DEBUG)() << "greedy median of " << strings.size() << " strings: length " << bestlen
                                << ", total distance " << mediandist[bestlen];

    result_median.assign(median.get(), median.get() + bestlen);
    return result_median;
}

/*
 * Weighted total distance of the candidate median whose first symbols are
 * already folded into @rows; @string1 is the remaining tail.  Each row[0]
 * holds the length of that folded prefix.  @row is scratch space of at
 * least max length + 1 cells.
 */
template <typename CharT>
double finish_distance_computations(const sequence_view<CharT>& string1,
                                    const std::vector<std::basic_string<CharT>>& strings,
                                    const std::vector<double>& weights,
                                    const std::vector<std::unique_ptr<size_t[]>>& rows,
                                    std::unique_ptr<size_t[]>& row)
{
    double distsum = 0.0;
    if (string1.empty()) {
        for (size_t j = 0; j < strings.size(); j++)
            distsum += (double)rows[j][strings[j].size()] * weights[j];
        return distsum;
    }

    for (size_t j = 0; j < strings.size(); j++) {
        const size_t* rowj = rows[j].get();
        auto s1 = string1;
        auto s2 = make_view(strings[j]);

        /* a shared suffix is free; the prefix is already in the row */
        rapidfuzz::detail::remove_common_suffix(s1, s2);

        if (s1.empty()) {
            distsum += (double)rowj[length(s2)] * weights[j];
            continue;
        }
        size_t prefix_len = rowj[0];
        if (s2.empty()) {
            distsum += (double)(prefix_len + length(s1)) * weights[j];
            continue;
        }

        std::copy_n(rowj, length(s2) + 1, row.get());

        size_t i = 0;
        for (auto ch1 : s1) {
            size_t* p = row.get() + 1;
            size_t diag = ++i + prefix_len;
            size_t x = diag;
            for (auto ch2 : s2) {
                size_t c3 = --diag + (ch1 != ch2);
                x++;
                if (x > c3) x = c3;
                diag = *p + 1;
                if (x > diag) x = diag;
                *(p++) = x;
            }
        }
        distsum += weights[j] * (double)row[length(s2)];
    }

    return distsum;
}

/**
 * median_improve:
 * @string: The candidate median.
 * @strings: The input strings.
 * @weights: One non-negative weight per string, acting as a multiplicity.
 *
 * One left-to-right pass of local search over @string.  At each position
 * replacing the symbol, inserting a symbol before it and deleting it are
 * tried against every known symbol; the best strict improvement of the
 * weighted total distance is applied.
 *
 * Returns: A string whose total distance does not exceed the one of
 *          @string.
 **/
template <typename CharT>
std::basic_string<CharT> median_improve(const std::basic_string<CharT>& string,
                                        const std::vector<std::basic_string<CharT>>& strings,
                                        const std::vector<double>& weights)
{
    std::vector<CharT> symlist = make_symlist(strings);
    if (symlist.empty()) return std::basic_string<CharT>();

    auto rows = make_rows(strings);
    auto row = std::make_unique<size_t[]>(max_length(strings) + 1);

    /* buffer[0] is scratch for trying insertions at position 0, the median
     * proper starts at buffer[1] */
    std::vector<CharT> buffer(string.size() + 1, CharT());
    std::copy(std::begin(string), std::end(string), buffer.begin() + 1);
    size_t medlen = string.size();

    CharT* median = buffer.data() + 1;
    double minminsum = finish_distance_computations(sequence_view<CharT>(median, median + medlen), strings,
                                                    weights, rows, row);
    double startsum = minminsum;

    for (size_t pos = 0; pos <= medlen;) {
        median = buffer.data() + 1;
        CharT symbol = (pos < medlen) ? median[pos] : CharT();
        EditType operation = EDIT_KEEP;
        double sum;

        if (pos < medlen) {
            CharT orig_symbol = median[pos];
            for (CharT candidate : symlist) {
                if (candidate == orig_symbol) continue;
                median[pos] = candidate;
                sum = finish_distance_computations(sequence_view<CharT>(median + pos, median + medlen),
                                                   strings, weights, rows, row);
                if (sum < minminsum) {
                    minminsum = sum;
                    symbol = candidate;
                    operation = EDIT_REPLACE;
                }
            }
            median[pos] = orig_symbol;
        }

        /* an insertion at pos is evaluated by overwriting median[pos - 1],
         * which is already folded into the rows */
        CharT prev_symbol = median[(std::ptrdiff_t)pos - 1];
        for (CharT candidate : symlist) {
            median[(std::ptrdiff_t)pos - 1] = candidate;
            sum = finish_distance_computations(sequence_view<CharT>(median + pos - 1, median + medlen), strings,
                                               weights, rows, row);
            if (sum < minminsum) {
                minminsum = sum;
                symbol = candidate;
                operation = EDIT_INSERT;
            }
        }
        median[(std::ptrdiff_t)pos - 1] = prev_symbol;

        if (pos < medlen) {
            sum = finish_distance_computations(sequence_view<CharT>(median + pos + 1, median + medlen), strings,
                                               weights, rows, row);
            if (sum < minminsum) {
                minminsum = sum;
                operation = EDIT_DELETE;
            }
        }

        switch (operation) {
        case EDIT_REPLACE: median[pos] = symbol; break;

        case EDIT_INSERT:
            buffer.insert(buffer.begin() + 1 + pos, symbol);
            medlen++;
            break;

        case EDIT_DELETE:
            buffer.erase(buffer.begin() + 1 + pos);
            medlen--;
            break;

        default: break;
        }

        /* after a deletion the next symbol moved to pos, so stay there */
        if (operation == EDIT_DELETE) continue;

        /* fold the symbol now at pos into the rows; at the end of the
         * median there is nothing left to fold */
        if (pos < medlen) {
            median = buffer.data() + 1;
            row[0] = pos + 1;
            advance_rows(median[pos], strings, rows, row);
        }
        pos++;
    }

    log("median", log::DEBUG)() << "median improvement: total distance " << startsum << " -> " << minminsum;

    return std::basic_string<CharT>(buffer.data() + 1, medlen);
}

/*
 * Quick (voting) median.
 *
 * The median length is the weighted mean length.  Each median position is
 * stretched over every string proportionally, the symbols it covers vote with
 * the string weight times the covered fraction.
 */
template <typename CharT>
std::basic_string<CharT> quick_median(const std::vector<std::basic_string<CharT>>& strings,
                                      const std::vector<double>& weights)
{
    std::basic_string<CharT> median;

    /* ml: weighted mean length, wl: total weight */
    double ml = 0;
    double wl = 0;
    for (size_t i = 0; i < strings.size(); i++) {
        ml += weights[i] * (double)strings[i].size();
        wl += weights[i];
    }

    if (wl == 0.0) return median;
    ml = std::floor(ml / wl + 0.499999);
    median.resize((size_t)ml);
    if (median.empty()) return median;

    /* some string is non-empty here */
    std::vector<CharT> symlist = make_symlist(strings);
    if (symlist.empty()) throw std::logic_error("quick_median: no symbols in non-empty strings");
    std::vector<double> symset(symlist.size());

    auto vote = [&](CharT c, double weight) {
        size_t idx = (size_t)std::distance(symlist.begin(), std::lower_bound(symlist.begin(), symlist.end(), c));
        symset[idx] += weight;
    };

    for (size_t j = 0; j < median.size(); j++) {
        std::fill(symset.begin(), symset.end(), 0.0);

        for (size_t i = 0; i < strings.size(); i++) {
            const auto& stri = strings[i];
            if (stri.empty()) continue;

            double weighti = weights[i];
            size_t lengthi = stri.size();
            double start = (double)lengthi / ml * (double)j;
            double end = start + (double)lengthi / ml;
            size_t istart = (size_t)std::floor(start);
            size_t iend = (size_t)std::ceil(end);

            /* [start, end) is this median position projected onto stri;
             * clamp against floating point drift */
            if (iend > lengthi) iend = lengthi;
            if (istart >= iend) istart = iend - 1;

            /* whole symbols after istart, then the covered part of
             * stri[istart], minus the uncovered part of stri[iend - 1]
             * (also correct when both are the same symbol) */
            for (size_t k = istart + 1; k < iend; k++)
                vote(stri[k], weighti);
            vote(stri[istart], weighti * ((double)(1 + istart) - start));
            vote(stri[iend - 1], -weighti * ((double)iend - end));
        }

        /* first maximum in symbol order */
        size_t k = 0;
        for (size_t i = 1; i < symlist.size(); i++) {
            if (symset[i] > symset[k]) k = i;
        }
        median[j] = symlist[k];
    }

    return median;
}

/**
 * set_median_index:
 * @strings: The input strings.
 * @weights: One non-negative weight per string.
 *
 * Picks the input string with the lowest weighted total distance to all the
 * others.  A candidate is abandoned as soon as its partial sum reaches the
 * best one so far.
 *
 * Returns: The index of the set median, the earliest one on ties.
 **/
template <typename CharT>
size_t set_median_index(const std::vector<std::basic_string<CharT>>& strings, const std::vector<double>& weights)
{
    size_t n = strings.size();
    size_t minidx = 0;
    double mindist = std::numeric_limits<double>::max();
    /* lower triangle of the distance matrix, -1 for not computed yet */
    std::vector<long int> distances(n * (n - 1) / 2, -1);

    for (size_t i = 0; i < n; i++) {
        rapidfuzz::CachedLevenshtein<CharT> scorer(strings[i]);
        double dist = 0.0;

        for (size_t j = 0; j < n && dist < mindist; j++) {
            if (j == i) continue;
            size_t dindex = (i > j) ? i * (i - 1) / 2 + j : j * (j - 1) / 2 + i;
            if (distances[dindex] < 0) distances[dindex] = (long int)scorer.distance(strings[j]);
            dist += weights[j] * (double)distances[dindex];
        }

        if (dist < mindist) {
            mindist = dist;
            minidx = i;
        }
    }

    return minidx;
}

} // namespace detail

/* approximate generalized median, greedy_median() above */
template <typename CharT>
std::basic_string<CharT> greedy_median(const std::vector<std::basic_string<CharT>>& strings,
                                       const std::vector<double>& weights = {})
{
    if (strings.empty()) return std::basic_string<CharT>();
    auto w = detail::resolve_weights(strings.size(), weights, "greedy_median");
    return detail::greedy_median(strings, w);
}

template <typename CharT>
std::basic_string<CharT> median(const std::vector<std::basic_string<CharT>>& strings,
                                const std::vector<double>& weights = {})
{
    return greedy_median(strings, weights);
}

/* One local search pass over @string; repeated calls may improve it
 * further while it is still far from the median. */
template <typename CharT>
std::basic_string<CharT> median_improve(const std::basic_string<CharT>& string,
                                        const std::vector<std::basic_string<CharT>>& strings,
                                        const std::vector<double>& weights = {})
{
    if (strings.empty()) return std::basic_string<CharT>();
    auto w = detail::resolve_weights(strings.size(), weights, "median_improve");
    return detail::median_improve(string, strings, w);
}

/* Fast, rough median by proportional voting.  Quality and cost lie
 * between set_median() and picking an input at random. */
template <typename CharT>
std::basic_string<CharT> quick_median(const std::vector<std::basic_string<CharT>>& strings,
                                      const std::vector<double>& weights = {})
{
    if (strings.empty()) return std::basic_string<CharT>();
    auto w = detail::resolve_weights(strings.size(), weights, "quick_median");
    return detail::quick_median(strings, w);
}

/* the input string closest to all the others */
template <typename CharT>
std::basic_string<CharT> set_median(const std::vector<std::basic_string<CharT>>& strings,
                                    const std::vector<double>& weights = {})
{
    if (strings.empty()) return std::basic_string<CharT>();
    auto w = detail::resolve_weights(strings.size(), weights, "set_median");
    return strings[detail::set_median_index(strings, w)];
}

} // namespace levtools
