#include <levtools/distance.hpp>
#include <levtools/editops.hpp>

#include <gtest/gtest.h>

#include <random>
#include <string>
#include <vector>

using namespace levtools;

namespace {

std::string join_blocks(const std::string& a, const std::vector<MatchingBlock>& mblocks)
{
    std::string joined;
    for (const auto& mb : mblocks)
        joined += a.substr(mb.spos, mb.len);
    return joined;
}

std::string random_string(std::mt19937& gen, size_t maxlen)
{
    std::uniform_int_distribution<size_t> len_dist(0, maxlen);
    std::uniform_int_distribution<int> sym_dist('a', 'c');
    std::string s(len_dist(gen), ' ');
    for (auto& c : s)
        c = (char)sym_dist(gen);
    return s;
}

size_t edits_of_source(const std::vector<EditOp>& ops)
{
    size_t n = 0;
    for (const auto& op : ops)
        n += (op.type == EDIT_DELETE || op.type == EDIT_REPLACE);
    return n;
}

} // namespace

TEST(EditOps, Find)
{
    std::vector<EditOp> expected = {{EDIT_DELETE, 0, 0}, {EDIT_INSERT, 3, 2}, {EDIT_REPLACE, 3, 3}};
    EXPECT_EQ(editops(std::string("spam"), std::string("park")), expected);

    EXPECT_TRUE(editops(std::string("spam"), std::string("spam")).empty());
    EXPECT_EQ(editops(std::string(""), std::string("ab")).size(), 2u);
}

TEST(EditOps, FindCommonPrefix)
{
    std::vector<EditOp> expected = {
        {EDIT_INSERT, 2, 2}, {EDIT_REPLACE, 3, 4}, {EDIT_DELETE, 6, 7}, {EDIT_DELETE, 9, 9}};
    EXPECT_EQ(editops(std::string("Levenshtein"), std::string("Lenvinsten")), expected);
}

TEST(EditOps, ApplyRoundTrip)
{
    std::vector<std::pair<std::string, std::string>> pairs = {
        {"spam", "park"}, {"Levenshtein", "Lenvinsten"}, {"", "abc"}, {"abc", ""}, {"man", "scotsman"}};
    for (const auto& p : pairs) {
        auto ops = editops(p.first, p.second);
        EXPECT_EQ(apply(ops, p.first, p.second), p.second);
        EXPECT_EQ(apply(invert(ops), p.second, p.first), p.first);
        EXPECT_EQ(total_cost(ops), levtools::distance(p.first, p.second));
    }
}

TEST(EditOps, ApplyPartial)
{
    std::string a = "man";
    std::string b = "scotsman";
    auto ops = editops(a, b);
    ASSERT_EQ(ops.size(), 5u);

    std::vector<EditOp> head(ops.begin(), ops.begin() + 3);
    EXPECT_EQ(apply(head, a, b), "scoman");
    EXPECT_EQ(apply(std::vector<EditOp>(), a, b), a);
}

TEST(EditOps, ApplyInvalid)
{
    std::vector<EditOp> ops = {{EDIT_REPLACE, 4, 0}};
    try {
        apply(ops, std::string("spam"), std::string("park"));
        FAIL() << "expected invalid_edit_ops";
    }
    catch (const invalid_edit_ops& e) {
        EXPECT_EQ(e.code(), EDIT_ERR_OUT);
    }
}

TEST(EditOps, Invert)
{
    auto ops = editops(std::string("spam"), std::string("park"));
    std::vector<EditOp> expected = {{EDIT_INSERT, 0, 0}, {EDIT_DELETE, 2, 3}, {EDIT_REPLACE, 3, 3}};
    EXPECT_EQ(invert(ops), expected);
    EXPECT_EQ(invert(ops), editops(std::string("park"), std::string("spam")));
    EXPECT_EQ(invert(invert(ops)), ops);
}

TEST(OpCodes, Find)
{
    std::vector<OpCode> expected = {
        {EDIT_DELETE, 0, 1, 0, 0}, {EDIT_KEEP, 1, 3, 0, 2}, {EDIT_INSERT, 3, 3, 2, 3}, {EDIT_REPLACE, 3, 4, 3, 4}};
    EXPECT_EQ(opcodes(std::string("spam"), std::string("park")), expected);
}

TEST(OpCodes, Conversions)
{
    std::string a = "Levenshtein";
    std::string b = "Lenvinsten";
    auto ops = editops(a, b);
    auto bops = opcodes(ops, a.size(), b.size());

    EXPECT_EQ(bops, opcodes(a, b));
    EXPECT_EQ(editops(bops, a.size(), b.size()), ops);
    EXPECT_EQ(apply(bops, a, b), b);
    EXPECT_EQ(apply(invert(bops), b, a), a);
    EXPECT_EQ(total_cost(bops), total_cost(ops));

    /* blocks partition both strings */
    size_t spos = 0;
    size_t dpos = 0;
    for (const auto& op : bops) {
        EXPECT_EQ(op.sbeg, spos);
        EXPECT_EQ(op.dbeg, dpos);
        spos = op.send;
        dpos = op.dend;
    }
    EXPECT_EQ(spos, a.size());
    EXPECT_EQ(dpos, b.size());
}

TEST(OpCodes, KeepKeep)
{
    auto bops = opcodes(std::string("spam"), std::string("park"));
    auto ops = to_editops(bops, true);
    ASSERT_EQ(ops.size(), 5u);
    EXPECT_EQ(ops[1].type, EDIT_KEEP);
    EXPECT_EQ(ops[2].type, EDIT_KEEP);
    EXPECT_EQ(normalize(ops), to_editops(bops, false));
    EXPECT_EQ(apply(ops, std::string("spam"), std::string("park")), "park");
}

TEST(OpCodes, ToOpcodesMismatchedTail)
{
    std::vector<EditOp> ops = {{EDIT_DELETE, 0, 0}};
    EXPECT_THROW(to_opcodes(ops, 4, 4), invalid_edit_ops);
}

TEST(MatchingBlocks, Basic)
{
    std::string a = "spam";
    std::string b = "park";
    std::vector<MatchingBlock> expected = {{1, 0, 2}, {4, 4, 0}};
    EXPECT_EQ(matching_blocks(editops(a, b), a.size(), b.size()), expected);
    EXPECT_EQ(matching_blocks(opcodes(a, b), a.size(), b.size()), expected);
}

TEST(MatchingBlocks, Joined)
{
    std::string a = "dog kennels";
    std::string b = "mattresses";
    auto mblocks = matching_blocks(editops(a, b), a.size(), b.size());
    EXPECT_EQ(join_blocks(a, mblocks), "ees");

    /* the terminating block */
    EXPECT_EQ(mblocks.back(), (MatchingBlock{a.size(), b.size(), 0}));

    size_t matched = 0;
    for (const auto& mb : mblocks)
        matched += mb.len;
    EXPECT_EQ(matched, 3u);
}

TEST(Subtract, Remainder)
{
    std::string a = "man";
    std::string b = "scotsman";
    auto ops = editops(a, b);
    std::vector<EditOp> sub(ops.begin(), ops.begin() + 3);

    auto rem = subtract(ops, sub);
    ASSERT_EQ(rem.size(), 2u);
    EXPECT_EQ(rem[0], (EditOp{EDIT_INSERT, 3, 3}));
    EXPECT_EQ(apply(rem, apply(sub, a, b), b), apply(ops, a, b));
}

TEST(Subtract, NotASubset)
{
    auto ops = editops(std::string("spam"), std::string("park"));
    std::vector<EditOp> sub = {{EDIT_REPLACE, 0, 0}};
    EXPECT_THROW(subtract(ops, sub), invalid_edit_ops);

    std::vector<EditOp> longer(ops);
    longer.push_back({EDIT_INSERT, 4, 4});
    EXPECT_THROW(subtract(ops, longer), invalid_edit_ops);
}

TEST(CheckErrors, EditOps)
{
    EXPECT_EQ(check_errors(4, 4, std::vector<EditOp>()), EDIT_ERR_OK);
    EXPECT_EQ(check_errors(4, 4, editops(std::string("spam"), std::string("park"))), EDIT_ERR_OK);
    EXPECT_EQ(check_errors(4, 4, std::vector<EditOp>{{EDIT_LAST, 0, 0}}), EDIT_ERR_TYPE);
    EXPECT_EQ(check_errors(4, 4, std::vector<EditOp>{{EDIT_DELETE, 4, 0}}), EDIT_ERR_OUT);
    EXPECT_EQ(check_errors(4, 4, std::vector<EditOp>{{EDIT_INSERT, 0, 4}}), EDIT_ERR_OUT);
    EXPECT_EQ(check_errors(4, 4, std::vector<EditOp>{{EDIT_DELETE, 2, 0}, {EDIT_DELETE, 1, 0}}), EDIT_ERR_ORDER);
}

TEST(CheckErrors, OpCodes)
{
    EXPECT_EQ(check_errors(0, 0, std::vector<OpCode>()), EDIT_ERR_OK);
    EXPECT_EQ(check_errors(1, 0, std::vector<OpCode>()), EDIT_ERR_SPAN);
    EXPECT_EQ(check_errors(4, 4, opcodes(std::string("spam"), std::string("park"))), EDIT_ERR_OK);
    EXPECT_EQ(check_errors(4, 4, std::vector<OpCode>{{EDIT_KEEP, 0, 3, 0, 3}}), EDIT_ERR_SPAN);
    EXPECT_EQ(check_errors(4, 4, std::vector<OpCode>{{EDIT_KEEP, 0, 4, 0, 3}, {EDIT_INSERT, 4, 4, 3, 4}}),
              EDIT_ERR_BLOCK);
    EXPECT_EQ(check_errors(4, 4, std::vector<OpCode>{{EDIT_KEEP, 0, 2, 0, 2}, {EDIT_INSERT, 2, 4, 2, 4}}),
              EDIT_ERR_BLOCK);
    EXPECT_EQ(check_errors(4, 4, std::vector<OpCode>{{EDIT_KEEP, 0, 1, 0, 1}, {EDIT_REPLACE, 2, 4, 2, 4}}),
              EDIT_ERR_ORDER);
    EXPECT_EQ(check_errors(4, 4, std::vector<OpCode>{{EDIT_LAST, 0, 4, 0, 4}}), EDIT_ERR_TYPE);

    EXPECT_STREQ(error_message(EDIT_ERR_OK), "no error");
    EXPECT_THROW(editops(std::vector<OpCode>(), 1, 0), invalid_edit_ops);
}

TEST(CheckErrors, ConsumedPosition)
{
    /* the insert would go before a symbol that is already deleted */
    std::vector<EditOp> ops = {{EDIT_DELETE, 0, 0}, {EDIT_INSERT, 0, 0}};
    EXPECT_EQ(check_errors(2, 2, ops), EDIT_ERR_ORDER);
    EXPECT_THROW(apply(ops, std::string("ab"), std::string("xb")), invalid_edit_ops);

    EXPECT_EQ(check_errors(2, 2, std::vector<EditOp>{{EDIT_REPLACE, 0, 0}, {EDIT_REPLACE, 0, 1}}),
              EDIT_ERR_ORDER);
    EXPECT_EQ(check_errors(2, 2, std::vector<EditOp>{{EDIT_INSERT, 0, 0}, {EDIT_INSERT, 0, 0}}),
              EDIT_ERR_ORDER);
    /* an insert leaves the source position, a delete the destination one */
    EXPECT_EQ(check_errors(2, 2, std::vector<EditOp>{{EDIT_INSERT, 0, 0}, {EDIT_DELETE, 0, 1}}), EDIT_ERR_OK);
    EXPECT_EQ(check_errors(2, 2, std::vector<EditOp>{{EDIT_DELETE, 0, 0}, {EDIT_INSERT, 1, 0}}), EDIT_ERR_OK);
}

TEST(OpCodes, UnequalGap)
{
    /* one source symbol but no destination symbol between the two ops */
    std::vector<EditOp> ops = {{EDIT_DELETE, 0, 0}, {EDIT_INSERT, 2, 0}};
    ASSERT_EQ(check_errors(2, 1, ops), EDIT_ERR_OK);

    try {
        opcodes(ops, 2, 1);
        FAIL() << "expected invalid_edit_ops";
    }
    catch (const invalid_edit_ops& e) {
        EXPECT_EQ(e.code(), EDIT_ERR_SPAN);
    }
    EXPECT_THROW(to_opcodes(ops, 2, 1), invalid_edit_ops);
    EXPECT_THROW(matching_blocks(ops, 2, 1), invalid_edit_ops);
}

TEST(EditOps, RandomPairs)
{
    std::mt19937 gen(20021123);
    std::bernoulli_distribution coin(0.5);

    for (int iter = 0; iter < 500; iter++) {
        std::string a = random_string(gen, 8);
        std::string b = random_string(gen, 8);
        SCOPED_TRACE("\"" + a + "\" -> \"" + b + "\"");

        auto ops = editops(a, b);
        ASSERT_EQ(check_errors(a.size(), b.size(), ops), EDIT_ERR_OK);
        EXPECT_EQ(total_cost(ops), levtools::distance(a, b));
        EXPECT_EQ(apply(ops, a, b), b);
        EXPECT_EQ(apply(invert(ops), b, a), a);

        auto bops = opcodes(ops, a.size(), b.size());
        EXPECT_EQ(check_errors(a.size(), b.size(), bops), EDIT_ERR_OK);
        EXPECT_EQ(apply(bops, a, b), b);

        auto mblocks = matching_blocks(ops, a.size(), b.size());
        size_t matched = 0;
        for (const auto& mb : mblocks) {
            EXPECT_EQ(a.substr(mb.spos, mb.len), b.substr(mb.dpos, mb.len));
            matched += mb.len;
        }
        EXPECT_EQ(matched, a.size() - edits_of_source(ops));
        EXPECT_EQ(mblocks.back(), (MatchingBlock{a.size(), b.size(), 0}));

        std::vector<EditOp> sub;
        for (const auto& op : ops) {
            if (coin(gen)) sub.push_back(op);
        }
        std::string partial = apply(sub, a, b);
        auto rem = subtract(ops, sub);
        EXPECT_EQ(rem.size(), ops.size() - sub.size());
        EXPECT_EQ(check_errors(partial.size(), b.size(), rem), EDIT_ERR_OK);
        EXPECT_EQ(apply(rem, partial, b), b);
    }
}
