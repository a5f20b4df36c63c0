#include <gtest/gtest.h>
#include "command_tokenizer.hpp"
#include "gate_error.hpp"

using namespace urgate;

namespace {

class CommandTokenizerTest : public ::testing::Test {
protected:
    CommandTokenizerTest() : table_(SessionFlags{}, "/srv/sync"), tokenizer_(table_) {}

    GateError tokenize_error(const std::string& remainder) {
        try {
            tokenizer_.tokenize(remainder);
        } catch (const GateError& e) {
            return e;
        }
        ADD_FAILURE() << "expected rejection of: " << remainder;
        return GateError(GateErrorCode::ConfigError, "none");
    }

    OptionPolicyTable table_;
    CommandTokenizer tokenizer_;
};

} // namespace

TEST(CommandTokenizerSplitTest, SplitsOnUnescapedWhitespace) {
    auto words = CommandTokenizer::split_words("-vlr  .\tmy\\ docs x", 10);
    ASSERT_EQ(words.size(), 4u);
    EXPECT_EQ(words[0].text, "-vlr");
    EXPECT_EQ(words[0].position, 10u);
    EXPECT_EQ(words[1].text, ".");
    EXPECT_EQ(words[2].text, "my docs");
    EXPECT_EQ(words[2].raw, "my\\ docs");
    EXPECT_EQ(words[3].text, "x");
}

TEST(CommandTokenizerSplitTest, DanglingEscapeIsMalformed) {
    try {
        CommandTokenizer::split_words("-v . docs\\", 0);
        FAIL();
    } catch (const GateError& e) {
        EXPECT_EQ(e.code(), GateErrorCode::MalformedSyntax);
        EXPECT_EQ(e.position(), 9u);
    }
}

TEST_F(CommandTokenizerTest, ClassifiesRegions) {
    auto tokens = tokenizer_.tokenize("-vlogDtpr --partial-dir .tmp --bwlimit=100 . docs pics");
    ASSERT_EQ(tokens.size(), 7u);
    EXPECT_EQ(tokens[0].kind, TokenKind::OptionShortCluster);
    EXPECT_EQ(tokens[1].kind, TokenKind::OptionLong);
    EXPECT_EQ(tokens[1].name, "partial-dir");
    EXPECT_EQ(tokens[2].kind, TokenKind::OptionValue);
    EXPECT_EQ(tokens[2].name, "partial-dir");
    EXPECT_EQ(tokens[2].text, ".tmp");
    EXPECT_EQ(tokens[3].kind, TokenKind::OptionLong);
    EXPECT_TRUE(tokens[3].has_inline_value);
    EXPECT_EQ(tokens[3].value, "100");
    EXPECT_EQ(tokens[4].kind, TokenKind::RegionSeparator);
    EXPECT_EQ(tokens[5].kind, TokenKind::PathArgument);
    EXPECT_EQ(tokens[6].kind, TokenKind::PathArgument);
}

TEST_F(CommandTokenizerTest, PendingValueIsNotASeparator) {
    auto tokens = tokenizer_.tokenize("--temp-dir . . docs");
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[1].kind, TokenKind::OptionValue);
    EXPECT_EQ(tokens[2].kind, TokenKind::RegionSeparator);
}

TEST_F(CommandTokenizerTest, OptionLikePathsAfterSeparator) {
    auto tokens = tokenizer_.tokenize("-r . --delete -x");
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[2].kind, TokenKind::PathArgument);
    EXPECT_EQ(tokens[3].kind, TokenKind::PathArgument);
}

TEST_F(CommandTokenizerTest, CapabilitySuffix) {
    EXPECT_NO_THROW(tokenizer_.tokenize("-vlogDtpre.iLsfxCIvu . docs"));
    EXPECT_NO_THROW(tokenizer_.tokenize("-e.LsfxC . docs"));
    EXPECT_NO_THROW(tokenizer_.tokenize("-vre31.iLsf . docs"));
    EXPECT_EQ(tokenize_error("-vre.i/x . docs").code(), GateErrorCode::DisallowedOption);
    EXPECT_EQ(tokenize_error("-vressh . docs").code(), GateErrorCode::DisallowedOption);
}

TEST_F(CommandTokenizerTest, NumericShortOptions) {
    EXPECT_NO_THROW(tokenizer_.tokenize("-B4096 . docs"));
    EXPECT_NO_THROW(tokenizer_.tokenize("-@1 . docs"));
    EXPECT_EQ(tokenize_error("-B . docs").code(), GateErrorCode::DisallowedOption);
    EXPECT_EQ(tokenize_error("-B12k . docs").code(), GateErrorCode::DisallowedOption);
}

TEST_F(CommandTokenizerTest, RejectsDisallowedShortLetters) {
    EXPECT_EQ(tokenize_error("-vs . docs").code(), GateErrorCode::DisallowedOption);
    // non-root confinement disables -L
    EXPECT_EQ(tokenize_error("-vL . docs").code(), GateErrorCode::DisallowedOption);
    EXPECT_EQ(tokenize_error("-vZ . docs").code(), GateErrorCode::DisallowedOption);
    EXPECT_EQ(tokenize_error("- . docs").code(), GateErrorCode::DisallowedOption);
}

TEST_F(CommandTokenizerTest, RejectsDisallowedLongOptions) {
    GateError e = tokenize_error("-v --rsh=sh . docs");
    EXPECT_EQ(e.code(), GateErrorCode::DisallowedOption);
    EXPECT_EQ(e.subject(), "--rsh=sh");
    EXPECT_EQ(e.position(), 3u);

    EXPECT_EQ(tokenize_error("--daemon . docs").code(), GateErrorCode::DisallowedOption);
    EXPECT_EQ(tokenize_error("--sender . docs").code(), GateErrorCode::DisallowedOption);
    EXPECT_EQ(tokenize_error("-- . docs").code(), GateErrorCode::DisallowedOption);
    EXPECT_EQ(tokenize_error("--delete=yes . docs").code(), GateErrorCode::DisallowedOption);
}

TEST_F(CommandTokenizerTest, BareWordInOptionsRegion) {
    EXPECT_EQ(tokenize_error("docs . x").code(), GateErrorCode::DisallowedOption);
}

TEST_F(CommandTokenizerTest, MissingValueIsMalformed) {
    GateError e = tokenize_error("-v --partial-dir");
    EXPECT_EQ(e.code(), GateErrorCode::MalformedSyntax);
    EXPECT_EQ(e.position(), 3u);
}

TEST_F(CommandTokenizerTest, MissingSeparatorIsMalformed) {
    EXPECT_EQ(tokenize_error("-vlogDtpr").code(), GateErrorCode::MalformedSyntax);
    EXPECT_EQ(tokenize_error("").code(), GateErrorCode::MalformedSyntax);
}

TEST_F(CommandTokenizerTest, SeparatorWithoutPaths) {
    auto tokens = tokenizer_.tokenize("-vlogDtpr .");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[1].kind, TokenKind::RegionSeparator);
}
