#pragma once

#include "errors.hpp"
#include "sequence.hpp"

#include <cstddef>
#include <cstdint>
#include <new>
#include <stdexcept>
#include <string>
#include <vector>

namespace levtools {

/* Edit operation type
 * DON'T CHANGE! used as array indices and the bits are occasionally used
 * as flags */
enum EditType {
    EDIT_KEEP = 0,
    EDIT_REPLACE = 1,
    EDIT_INSERT = 2,
    EDIT_DELETE = 3,
    EDIT_LAST /* never a valid operation */
};

/* Edit operation (atomic).
 * It represents a change of one character, not a block.  We usually don't
 * care about EDIT_KEEP, though the functions can handle them.  The positions
 * are interpreted as at the left edge of a character.
 */
struct EditOp {
    EditType type; /* editing operation type */
    size_t spos;   /* source block position */
    size_t dpos;   /* destination position */
};

/* Edit operation (difflib-compatible block).
 * Sequences must span over complete strings, subsequences are simply edit
 * sequences with more (or larger) EDIT_KEEP blocks.
 */
struct OpCode {
    EditType type;     /* editing operation type */
    size_t sbeg, send; /* source block begin, end */
    size_t dbeg, dend; /* destination block begin, end */
};

/* Matching block (difflib-compatible). */
struct MatchingBlock {
    size_t spos;
    size_t dpos;
    size_t len;
};

static inline bool operator==(const EditOp& a, const EditOp& b)
{
    return a.type == b.type && a.spos == b.spos && a.dpos == b.dpos;
}

static inline bool operator!=(const EditOp& a, const EditOp& b)
{
    return !(a == b);
}

static inline bool operator==(const OpCode& a, const OpCode& b)
{
    return a.type == b.type && a.sbeg == b.sbeg && a.send == b.send && a.dbeg == b.dbeg &&
           a.dend == b.dend;
}

static inline bool operator!=(const OpCode& a, const OpCode& b)
{
    return !(a == b);
}

static inline bool operator==(const MatchingBlock& a, const MatchingBlock& b)
{
    return a.spos == b.spos && a.dpos == b.dpos && a.len == b.len;
}

static inline bool operator!=(const MatchingBlock& a, const MatchingBlock& b)
{
    return !(a == b);
}

/* structural checks; the error code is returned, never thrown */
EditOpError check_errors(size_t len1, size_t len2, const std::vector<EditOp>& ops);
EditOpError check_errors(size_t len1, size_t len2, const std::vector<OpCode>& bops);

std::vector<OpCode> to_opcodes(const std::vector<EditOp>& ops, size_t len1, size_t len2);
std::vector<EditOp> to_editops(const std::vector<OpCode>& bops, bool keepkeep);

/* validating conversions */
std::vector<OpCode> opcodes(const std::vector<EditOp>& ops, size_t len1, size_t len2);
std::vector<EditOp> editops(const std::vector<OpCode>& bops, size_t len1, size_t len2);

std::vector<EditOp> invert(const std::vector<EditOp>& ops);
std::vector<OpCode> invert(const std::vector<OpCode>& bops);

std::vector<MatchingBlock> matching_blocks(const std::vector<EditOp>& ops, size_t len1, size_t len2);
std::vector<MatchingBlock> matching_blocks(const std::vector<OpCode>& bops, size_t len1, size_t len2);

std::vector<EditOp> normalize(const std::vector<EditOp>& ops);
std::vector<EditOp> subtract(const std::vector<EditOp>& ops, const std::vector<EditOp>& sub);

size_t total_cost(const std::vector<EditOp>& ops);
size_t total_cost(const std::vector<OpCode>& bops);

namespace detail {

void check_types(const std::vector<EditOp>& ops);

/**
 * editops_from_cost_matrix:
 * @s1: The source string, with common prefix and suffix already stripped.
 * @off1: The offset where the matrix starts from the start of the source.
 * @s2: The destination string, stripped the same way.
 * @off2: The offset where the matrix starts from the start of the
 *        destination.
 * @matrix: The (@s1.size() + 1) x (@s2.size() + 1) cost matrix.
 *
 * Reconstructs the optimal edit sequence from the cost matrix @matrix.
 *
 * Returns: The optimal edit sequence, normalized.
 **/
template <typename InputIt1, typename InputIt2>
std::vector<EditOp> editops_from_cost_matrix(const Range<InputIt1>& s1, size_t off1,
                                             const Range<InputIt2>& s2, size_t off2,
                                             const std::vector<size_t>& matrix)
{
    size_t len1 = length(s1) + 1;
    size_t len2 = length(s2) + 1;
    size_t pos = matrix[len1 * len2 - 1];
    std::vector<EditOp> ops(pos);
    if (ops.empty()) return ops;

    int dir = 0;
    size_t i = len1 - 1;
    size_t j = len2 - 1;
    const size_t* p = matrix.data() + len1 * len2 - 1;
    while (i || j) {
        /* prefer continuing in the same direction */
        if (dir < 0 && j && *p == *(p - 1) + 1) {
            j--;
            ops[--pos] = {EDIT_INSERT, i + off1, j + off2};
            p--;
            continue;
        }
        if (dir > 0 && i && *p == *(p - len2) + 1) {
            i--;
            ops[--pos] = {EDIT_DELETE, i + off1, j + off2};
            p -= len2;
            continue;
        }
        if (i && j && *p == *(p - len2 - 1) && s1[i - 1] == s2[j - 1]) {
            /* don't store EDIT_KEEP */
            i--;
            j--;
            p -= len2 + 1;
            dir = 0;
            continue;
        }
        if (i && j && *p == *(p - len2 - 1) + 1) {
            i--;
            j--;
            ops[--pos] = {EDIT_REPLACE, i + off1, j + off2};
            p -= len2 + 1;
            dir = 0;
            continue;
        }
        /* we can't turn directly from -1 to 1, in this case it would be better
         * to go diagonally, but check it (dir == 0) */
        if (dir == 0 && j && *p == *(p - 1) + 1) {
            j--;
            ops[--pos] = {EDIT_INSERT, i + off1, j + off2};
            p--;
            dir = -1;
            continue;
        }
        if (dir == 0 && i && *p == *(p - len2) + 1) {
            i--;
            ops[--pos] = {EDIT_DELETE, i + off1, j + off2};
            p -= len2;
            dir = 1;
            continue;
        }
        throw std::logic_error("lost in the cost matrix");
    }

    return ops;
}

/**
 * editops_find:
 * @s1: The source string.
 * @s2: The destination string.
 *
 * Find an optimal edit sequence from @s1 to @s2.
 *
 * When there's more than one optimal sequence, a one is arbitrarily (though
 * deterministically) chosen.
 *
 * Returns: The optimal edit sequence.  It is normalized, i.e., keep
 *          operations are not included.
 **/
template <typename InputIt1, typename InputIt2>
std::vector<EditOp> editops_find(Range<InputIt1> s1, Range<InputIt2> s2)
{
    size_t prefix = rapidfuzz::detail::remove_common_prefix(s1, s2);
    rapidfuzz::detail::remove_common_suffix(s1, s2);

    size_t len1 = length(s1) + 1;
    size_t len2 = length(s2) + 1;

    /* extra-conservative overflow check */
    if (SIZE_MAX / len1 <= len2) throw std::bad_alloc();

    /* initialize first row and column */
    std::vector<size_t> matrix(len1 * len2);
    for (size_t i = 0; i < len2; i++)
        matrix[i] = i;
    for (size_t i = 1; i < len1; i++)
        matrix[len2 * i] = i;

    /* find the costs and fill the matrix */
    for (size_t i = 1; i < len1; i++) {
        const size_t* prev = matrix.data() + (i - 1) * len2;
        size_t* p = matrix.data() + i * len2 + 1;
        const auto char1 = s1[i - 1];
        size_t x = i;
        for (auto char2 : s2) {
            size_t c3 = *(prev++) + (char1 != char2);
            x++;
            if (x > c3) x = c3;
            c3 = *prev + 1;
            if (x > c3) x = c3;
            *(p++) = x;
        }
    }

    /* find the way back */
    return editops_from_cost_matrix(s1, prefix, s2, prefix, matrix);
}

/* Applies a partial edit @ops from @s1 to @s2.
 * NB: @ops is not checked for applicability. */
template <typename CharT>
std::basic_string<CharT> editops_apply(const std::basic_string<CharT>& s1,
                                       const std::basic_string<CharT>& s2,
                                       const std::vector<EditOp>& ops)
{
    std::basic_string<CharT> dst;
    dst.reserve(ops.size() + s1.size());

    /* this looks too complex for such a simple task, but note ops is not
     * a complete edit sequence, we have to be able to apply anything anywhere */
    size_t spos = 0;
    for (const auto& op : ops) {
        size_t j = op.spos - spos + (op.type == EDIT_KEEP);
        if (j) {
            dst.append(s1, spos, j);
            spos += j;
        }
        switch (op.type) {
        case EDIT_DELETE: spos++; break;

        case EDIT_REPLACE:
            spos++;
            dst.push_back(s2[op.dpos]);
            break;

        case EDIT_INSERT: dst.push_back(s2[op.dpos]); break;

        default: break;
        }
    }
    dst.append(s1, spos, std::basic_string<CharT>::npos);

    return dst;
}

/* Applies a sequence of difflib block operations to a string.
 * NB: @bops is not checked for applicability. */
template <typename CharT>
std::basic_string<CharT> opcodes_apply(const std::basic_string<CharT>& s1,
                                       const std::basic_string<CharT>& s2,
                                       const std::vector<OpCode>& bops)
{
    std::basic_string<CharT> dst;
    dst.reserve(s1.size() + s2.size());

    for (const auto& b : bops) {
        switch (b.type) {
        case EDIT_INSERT:
        case EDIT_REPLACE: dst.append(s2, b.dbeg, b.dend - b.dbeg); break;

        case EDIT_KEEP: dst.append(s1, b.sbeg, b.send - b.sbeg); break;

        default: break;
        }
    }

    return dst;
}

} // namespace detail

/**
 * editops:
 * @s1: The source string.
 * @s2: The destination string.
 *
 * Finds sequence of edit operations transforming @s1 to @s2.
 *
 * Returns: The optimal edit sequence of atomic operations, without keep
 *          operations.
 **/
template <typename CharT>
std::vector<EditOp> editops(const std::basic_string<CharT>& s1, const std::basic_string<CharT>& s2)
{
    return detail::editops_find(make_view(s1), make_view(s2));
}

/* same as editops(), as difflib-like block operations */
template <typename CharT>
std::vector<OpCode> opcodes(const std::basic_string<CharT>& s1, const std::basic_string<CharT>& s2)
{
    return to_opcodes(editops(s1, s2), s1.size(), s2.size());
}

/**
 * apply:
 * @ops: An ordered subset of an edit sequence transforming @s1 to @s2.
 * @s1: The source string.
 * @s2: The destination string.
 *
 * Applies a (partial) edit to a string.  @ops is validated first.
 *
 * Returns: The edited string.
 **/
template <typename CharT>
std::basic_string<CharT> apply(const std::vector<EditOp>& ops, const std::basic_string<CharT>& s1,
                               const std::basic_string<CharT>& s2)
{
    if (ops.empty()) return s1;

    EditOpError err = check_errors(s1.size(), s2.size(), ops);
    if (err != EDIT_ERR_OK) throw invalid_edit_ops(err);

    return detail::editops_apply(s1, s2, ops);
}

template <typename CharT>
std::basic_string<CharT> apply(const std::vector<OpCode>& bops, const std::basic_string<CharT>& s1,
                               const std::basic_string<CharT>& s2)
{
    if (bops.empty()) return s1;

    EditOpError err = check_errors(s1.size(), s2.size(), bops);
    if (err != EDIT_ERR_OK) throw invalid_edit_ops(err);

    return detail::opcodes_apply(s1, s2, bops);
}

} // namespace levtools
