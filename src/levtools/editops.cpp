/*
 * editops.cpp
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

#include "editops.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <utility>

namespace levtools {

/****************************************************************************
 *
 * Editops and other difflib-like stuff.
 *
 ****************************************************************************/
/* {{{ */

/*
 * Skips a run of identical consecutive operations starting at @i, moving
 * @spos and @dpos past it.  Keep operations must already be skipped.
 *
 * Returns: The index of the first operation after the run.
 */
static size_t skip_run(const std::vector<EditOp>& ops, size_t i, size_t& spos, size_t& dpos)
{
    EditType type = ops[i].type;
    do {
        switch (type) {
        case EDIT_REPLACE:
            spos++;
            dpos++;
            break;

        case EDIT_DELETE: spos++; break;

        case EDIT_INSERT: dpos++; break;

        default: break;
        }
        i++;
    } while (i < ops.size() && ops[i].type == type && spos == ops[i].spos && dpos == ops[i].dpos);

    return i;
}

/**
 * check_errors:
 * @len1: The length of an eventual @ops source string.
 * @len2: The length of an eventual @ops destination string.
 * @ops: An array of elementary edit operations.
 *
 * Checks whether @ops is consistent and applicable as a partial edit from a
 * string of length @len1 to a string of length @len2.
 *
 * Returns: EDIT_ERR_OK if @ops seems OK, an error code otherwise.
 **/
EditOpError check_errors(size_t len1, size_t len2, const std::vector<EditOp>& ops)
{
    if (ops.empty()) return EDIT_ERR_OK;

    /* check bounds */
    for (const auto& o : ops) {
        if (o.type < EDIT_KEEP || o.type >= EDIT_LAST) return EDIT_ERR_TYPE;
        if (o.spos > len1 || o.dpos > len2) return EDIT_ERR_OUT;
        if (o.spos == len1 && o.type != EDIT_INSERT) return EDIT_ERR_OUT;
        if (o.dpos == len2 && o.type != EDIT_DELETE) return EDIT_ERR_OUT;
    }

    /* check ordering; a symbol consumed by one operation can't be touched
     * again by a later one */
    size_t smin = 0;
    size_t dmin = 0;
    for (const auto& o : ops) {
        if (o.spos < smin || o.dpos < dmin) return EDIT_ERR_ORDER;
        smin = (o.type == EDIT_INSERT) ? o.spos : o.spos + 1;
        dmin = (o.type == EDIT_DELETE) ? o.dpos : o.dpos + 1;
    }

    return EDIT_ERR_OK;
}

/**
 * check_errors:
 * @len1: The length of an eventual @bops source string.
 * @len2: The length of an eventual @bops destination string.
 * @bops: An array of difflib block edit operation codes.
 *
 * Checks whether @bops is consistent and applicable as an edit from a
 * string of length @len1 to a string of length @len2.
 *
 * Returns: EDIT_ERR_OK if @bops seems OK, an error code otherwise.
 **/
EditOpError check_errors(size_t len1, size_t len2, const std::vector<OpCode>& bops)
{
    /* only the edit between two empty strings may be empty */
    if (bops.empty()) return (len1 || len2) ? EDIT_ERR_SPAN : EDIT_ERR_OK;

    /* check completeness */
    if (bops.front().sbeg || bops.front().dbeg || bops.back().send != len1 || bops.back().dend != len2)
        return EDIT_ERR_SPAN;

    /* check bounds and block consistency */
    for (const auto& b : bops) {
        if (b.send > len1 || b.dend > len2) return EDIT_ERR_OUT;
        if (b.sbeg > b.send || b.dbeg > b.dend) return EDIT_ERR_BLOCK;
        switch (b.type) {
        case EDIT_KEEP:
        case EDIT_REPLACE:
            if (b.dend - b.dbeg != b.send - b.sbeg || b.dend == b.dbeg) return EDIT_ERR_BLOCK;
            break;

        case EDIT_INSERT:
            if (b.dend - b.dbeg == 0 || b.send - b.sbeg != 0) return EDIT_ERR_BLOCK;
            break;

        case EDIT_DELETE:
            if (b.send - b.sbeg == 0 || b.dend - b.dbeg != 0) return EDIT_ERR_BLOCK;
            break;

        default: return EDIT_ERR_TYPE;
        }
    }

    /* check ordering */
    for (size_t i = 1; i < bops.size(); i++) {
        if (bops[i].sbeg != bops[i - 1].send || bops[i].dbeg != bops[i - 1].dend) return EDIT_ERR_ORDER;
    }

    return EDIT_ERR_OK;
}

namespace detail {

void check_types(const std::vector<EditOp>& ops)
{
    for (const auto& o : ops)
        if (o.type < EDIT_KEEP || o.type >= EDIT_LAST) throw invalid_edit_ops(EDIT_ERR_TYPE);
}

static void check_types(const std::vector<OpCode>& bops)
{
    for (const auto& b : bops)
        if (b.type < EDIT_KEEP || b.type >= EDIT_LAST) throw invalid_edit_ops(EDIT_ERR_TYPE);
}

} // namespace detail

/**
 * to_editops:
 * @bops: An array of difflib block edit operation codes.
 * @keepkeep: If true, keep operations will be included.  Otherwise the
 *            result will be normalized, i.e. without any keep operations.
 *
 * Converts difflib block operation codes to elementary edit operations.
 *
 * Returns: The converted edit operations.
 **/
std::vector<EditOp> to_editops(const std::vector<OpCode>& bops, bool keepkeep)
{
    /* compute the number of atomic operations */
    size_t n = 0;
    for (const auto& b : bops) {
        if (b.type == EDIT_KEEP && !keepkeep) continue;
        n += std::max(b.send - b.sbeg, b.dend - b.dbeg);
    }

    /* convert */
    std::vector<EditOp> ops;
    ops.reserve(n);
    for (const auto& b : bops) {
        switch (b.type) {
        case EDIT_KEEP:
            if (keepkeep) {
                for (size_t j = 0; j < b.send - b.sbeg; j++)
                    ops.push_back({EDIT_KEEP, b.sbeg + j, b.dbeg + j});
            }
            break;

        case EDIT_REPLACE:
            for (size_t j = 0; j < b.send - b.sbeg; j++)
                ops.push_back({EDIT_REPLACE, b.sbeg + j, b.dbeg + j});
            break;

        case EDIT_DELETE:
            for (size_t j = 0; j < b.send - b.sbeg; j++)
                ops.push_back({EDIT_DELETE, b.sbeg + j, b.dbeg});
            break;

        case EDIT_INSERT:
            for (size_t j = 0; j < b.dend - b.dbeg; j++)
                ops.push_back({EDIT_INSERT, b.sbeg, b.dbeg + j});
            break;

        default: break;
        }
    }

    return ops;
}

/**
 * to_opcodes:
 * @ops: An array of elementary edit operations.
 * @len1: The length of the source string.
 * @len2: The length of the destination string.
 *
 * Converts elementary edit operations to difflib block operation codes.
 *
 * Note the string lengths are necessary since difflib doesn't allow omitting
 * keep operations.
 *
 * Returns: The converted block operation codes.
 **/
std::vector<OpCode> to_opcodes(const std::vector<EditOp>& ops, size_t len1, size_t len2)
{
    std::vector<OpCode> bops;
    size_t spos = 0;
    size_t dpos = 0;
    for (size_t i = 0; i < ops.size();) {
        /* simply pretend there are no keep blocks */
        if (ops[i].type == EDIT_KEEP) {
            i++;
            continue;
        }
        const EditOp& o = ops[i];
        if (spos < o.spos || dpos < o.dpos) {
            if (o.spos - spos != o.dpos - dpos) throw invalid_edit_ops(EDIT_ERR_SPAN);
            bops.push_back({EDIT_KEEP, spos, o.spos, dpos, o.dpos});
            spos = o.spos;
            dpos = o.dpos;
        }
        OpCode b = {o.type, spos, 0, dpos, 0};
        i = skip_run(ops, i, spos, dpos);
        b.send = spos;
        b.dend = dpos;
        bops.push_back(b);
    }
    if (spos < len1 || dpos < len2) {
        if (len1 - spos != len2 - dpos) throw invalid_edit_ops(EDIT_ERR_SPAN);
        bops.push_back({EDIT_KEEP, spos, len1, dpos, len2});
    }

    return bops;
}

std::vector<OpCode> opcodes(const std::vector<EditOp>& ops, size_t len1, size_t len2)
{
    EditOpError err = check_errors(len1, len2, ops);
    if (err != EDIT_ERR_OK) throw invalid_edit_ops(err);

    return to_opcodes(ops, len1, len2);
}

std::vector<EditOp> editops(const std::vector<OpCode>& bops, size_t len1, size_t len2)
{
    EditOpError err = check_errors(len1, len2, bops);
    if (err != EDIT_ERR_OK) throw invalid_edit_ops(err);

    return to_editops(bops, false);
}

/**
 * invert:
 * @ops: An array of elementary edit operations.
 *
 * Inverts the sense of @ops.
 *
 * In other words, the result is a valid partial edit for the original
 * source and destination strings with their roles exchanged.
 *
 * Returns: The inverted edit operations.
 **/
std::vector<EditOp> invert(const std::vector<EditOp>& ops)
{
    detail::check_types(ops);

    std::vector<EditOp> inv(ops);
    for (auto& o : inv) {
        std::swap(o.spos, o.dpos);
        if (o.type & 2) o.type = static_cast<EditType>(o.type ^ 1);
    }

    return inv;
}

/* block version of invert(), the source and destination ranges swap */
std::vector<OpCode> invert(const std::vector<OpCode>& bops)
{
    detail::check_types(bops);

    std::vector<OpCode> inv(bops);
    for (auto& b : inv) {
        std::swap(b.sbeg, b.dbeg);
        std::swap(b.send, b.dend);
        if (b.type & 2) b.type = static_cast<EditType>(b.type ^ 1);
    }

    return inv;
}

/*
 * Matching blocks of an already validated edit, without the terminating
 * zero-length block.
 */
static std::vector<MatchingBlock> editops_matching_blocks(size_t len1, size_t len2,
                                                          const std::vector<EditOp>& ops)
{
    std::vector<MatchingBlock> mblocks;
    size_t spos = 0;
    size_t dpos = 0;
    for (size_t i = 0; i < ops.size();) {
        /* simply pretend there are no keep blocks */
        if (ops[i].type == EDIT_KEEP) {
            i++;
            continue;
        }
        const EditOp& o = ops[i];
        if (spos < o.spos || dpos < o.dpos) {
            if (o.spos - spos != o.dpos - dpos) throw invalid_edit_ops(EDIT_ERR_SPAN);
            mblocks.push_back({spos, dpos, o.spos - spos});
            spos = o.spos;
            dpos = o.dpos;
        }
        i = skip_run(ops, i, spos, dpos);
    }
    if (spos < len1 || dpos < len2) {
        if (len1 - spos != len2 - dpos) throw invalid_edit_ops(EDIT_ERR_SPAN);
        mblocks.push_back({spos, dpos, len1 - spos});
    }

    return mblocks;
}

static std::vector<MatchingBlock> opcodes_matching_blocks(size_t len1, const std::vector<OpCode>& bops)
{
    std::vector<MatchingBlock> mblocks;
    for (size_t i = 0; i < bops.size();) {
        if (bops[i].type != EDIT_KEEP) {
            i++;
            continue;
        }
        MatchingBlock mb = {bops[i].sbeg, bops[i].dbeg, 0};
        /* adjacent KEEP blocks -- we never produce it, but... */
        while (i < bops.size() && bops[i].type == EDIT_KEEP)
            i++;
        mb.len = (i < bops.size() ? bops[i].sbeg : len1) - mb.spos;
        mblocks.push_back(mb);
    }

    return mblocks;
}

/**
 * matching_blocks:
 * @ops: An array of elementary edit operations.
 * @len1: The length of the source string.
 * @len2: The length of the destination string.
 *
 * Computes the matching blocks corresponding to an optimal edit @ops.
 *
 * The last block is always the zero-length (@len1, @len2, 0), as difflib
 * emits it.
 *
 * Returns: The matching blocks.
 **/
std::vector<MatchingBlock> matching_blocks(const std::vector<EditOp>& ops, size_t len1, size_t len2)
{
    EditOpError err = check_errors(len1, len2, ops);
    if (err != EDIT_ERR_OK) throw invalid_edit_ops(err);

    std::vector<MatchingBlock> mblocks = editops_matching_blocks(len1, len2, ops);
    mblocks.push_back({len1, len2, 0});
    return mblocks;
}

std::vector<MatchingBlock> matching_blocks(const std::vector<OpCode>& bops, size_t len1, size_t len2)
{
    EditOpError err = check_errors(len1, len2, bops);
    if (err != EDIT_ERR_OK) throw invalid_edit_ops(err);

    std::vector<MatchingBlock> mblocks = opcodes_matching_blocks(len1, bops);
    mblocks.push_back({len1, len2, 0});
    return mblocks;
}

/* Normalizes a list of edit operations to contain no keep operations. */
std::vector<EditOp> normalize(const std::vector<EditOp>& ops)
{
    std::vector<EditOp> opsnorm;
    std::copy_if(std::begin(ops), std::end(ops), std::back_inserter(opsnorm), [](const EditOp& op) {
        return op.type != EDIT_KEEP;
    });
    return opsnorm;
}

/**
 * subtract:
 * @ops: An array of elementary edit operations.
 * @sub: A subsequence (ordered subset) of @ops.
 *
 * Subtracts a subsequence of elementary edit operations from a sequence.
 *
 * The remainder is a sequence that, applied to result of application of @sub,
 * gives the same final result as application of @ops to original string.
 *
 * Returns: The remainder.  It is always normalized, i.e, without any keep
 *          operations.
 **/
std::vector<EditOp> subtract(const std::vector<EditOp>& ops, const std::vector<EditOp>& sub)
{
    static const int shifts[] = {0, 0, 1, -1};

    detail::check_types(ops);
    detail::check_types(sub);

    /* compute remainder size */
    auto is_edit = [](const EditOp& op) {
        return op.type != EDIT_KEEP;
    };
    size_t nr = (size_t)std::count_if(std::begin(ops), std::end(ops), is_edit);
    size_t nn = (size_t)std::count_if(std::begin(sub), std::end(sub), is_edit);
    if (nn > nr) throw invalid_edit_ops(EDIT_ERR_ORDER, "subtracted sequence is longer than the edit");

    /* we could simply return an empty sequence when nr == nn, but then it
     * would be possible to subtract *any* sequence of the right length to get
     * an empty sequence -- clearly incorrectly; so we have to scan the list
     * to check */
    std::vector<EditOp> rem;
    rem.reserve(nr - nn);

    size_t j = 0;
    std::ptrdiff_t shift = 0;
    auto keep_remaining = [&](const EditOp& op) {
        if (op.type == EDIT_KEEP) return;
        EditOp o = op;
        o.spos = (size_t)((std::ptrdiff_t)o.spos + shift);
        rem.push_back(o);
    };

    for (const auto& s : sub) {
        while (j < ops.size() && ops[j] != s)
            keep_remaining(ops[j++]);
        if (j == ops.size())
            throw invalid_edit_ops(EDIT_ERR_ORDER, "subtracted sequence is not an ordered subset of the edit");

        shift += shifts[s.type];
        j++;
    }

    while (j < ops.size())
        keep_remaining(ops[j++]);

    return rem;
}

/* number of atomic edits, keep operations are free */
size_t total_cost(const std::vector<EditOp>& ops)
{
    return (size_t)std::count_if(std::begin(ops), std::end(ops), [](const EditOp& op) {
        return op.type != EDIT_KEEP;
    });
}

size_t total_cost(const std::vector<OpCode>& bops)
{
    size_t sum = 0;
    for (const auto& b : bops) {
        if (b.type == EDIT_KEEP) continue;
        sum += std::max(b.send - b.sbeg, b.dend - b.dbeg);
    }
    return sum;
}

/* }}} */

} // namespace levtools
