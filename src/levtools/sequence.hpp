#pragma once

#include <algorithm>
#include <cstddef>
#include <rapidfuzz/details/common.hpp>
#include <set>
#include <string>
#include <vector>

namespace levtools {

using rapidfuzz::detail::Range;

/* Symbol sequences.
 * Owned values are plain basic_strings, std::string for bytes and
 * std::u32string for code points.  The algorithms work on read-only
 * Range views over them, so both share a single implementation. */
template <typename CharT>
using basic_sequence = std::basic_string<CharT>;

using byte_sequence = basic_sequence<char>;
using code_point_sequence = basic_sequence<char32_t>;

template <typename CharT>
using sequence_view = Range<const CharT*>;

template <typename CharT>
static inline sequence_view<CharT> make_view(const std::basic_string<CharT>& str)
{
    return sequence_view<CharT>(str.data(), str.data() + str.size());
}

template <typename Iter>
static inline size_t length(const Range<Iter>& range)
{
    return static_cast<size_t>(range.size());
}

/* compute the set of symbols present in any of the strings.  the result is
 * a dense, ascending symbol table, so we can easily iterate over only
 * characters present in the strings */
template <typename CharT>
std::vector<CharT> make_symlist(const std::vector<std::basic_string<CharT>>& strings)
{
    std::vector<CharT> symlist;
    auto is_empty_str = [](const std::basic_string<CharT>& x) {
        return x.empty();
    };
    if (std::all_of(std::begin(strings), std::end(strings), is_empty_str)) return symlist;

    std::set<CharT> symmap;
    for (const auto& string : strings)
        symmap.insert(std::begin(string), std::end(string));

    symlist.insert(std::end(symlist), std::begin(symmap), std::end(symmap));
    return symlist;
}

} // namespace levtools
