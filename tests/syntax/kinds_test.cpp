//! # Syntax Model Tests
//!
//! Kind tables, trivia rendering, RawSyntax accessors, source reconstruction
//! and the tree walker.

#include "syntax/raw_syntax.hpp"
#include "syntax/visitor.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace lth::syntax;
using lth::test::missing_tok;
using lth::test::node;
using lth::test::spaces;
using lth::test::tok;

// ============================================================================
// Token Kinds
// ============================================================================

TEST(TokenKindTest, NamesRoundTrip) {
    for (auto kind : {TokenKind::kw_let, TokenKind::l_paren, TokenKind::pound_if,
                      TokenKind::identifier, TokenKind::string_interpolation_anchor,
                      TokenKind::eof}) {
        auto back = token_kind_from_name(token_kind_name(kind));
        ASSERT_TRUE(back.has_value()) << token_kind_name(kind);
        EXPECT_EQ(*back, kind);
    }
    EXPECT_FALSE(token_kind_from_name("kw_nonsense").has_value());
}

TEST(TokenKindTest, FixedText) {
    EXPECT_EQ(fixed_token_text(TokenKind::kw_let).value(), "let");
    EXPECT_EQ(fixed_token_text(TokenKind::equal).value(), "=");
    EXPECT_EQ(fixed_token_text(TokenKind::pound_endif).value(), "#endif");
    EXPECT_EQ(fixed_token_text(TokenKind::string_interpolation_anchor).value(), ")");
    EXPECT_EQ(fixed_token_text(TokenKind::eof).value(), "");
    EXPECT_FALSE(fixed_token_text(TokenKind::identifier).has_value());
    EXPECT_FALSE(fixed_token_text(TokenKind::integer_literal).has_value());
}

TEST(TokenKindTest, KeywordRanges) {
    EXPECT_TRUE(is_keyword(TokenKind::kw_associatedtype));
    EXPECT_TRUE(is_keyword(TokenKind::kw__));
    EXPECT_FALSE(is_keyword(TokenKind::l_paren));
    EXPECT_TRUE(is_pound_keyword(TokenKind::pound_if));
    EXPECT_TRUE(is_pound_keyword(TokenKind::pound_colorLiteral));
    EXPECT_FALSE(is_pound_keyword(TokenKind::pound));
    EXPECT_FALSE(is_pound_keyword(TokenKind::integer_literal));
}

// ============================================================================
// Syntax Kinds
// ============================================================================

TEST(SyntaxKindTest, NamesRoundTrip) {
    for (auto kind : {SyntaxKind::Unknown, SyntaxKind::SourceFile, SyntaxKind::IfConfigClause,
                      SyntaxKind::EnumCasePattern}) {
        auto back = syntax_kind_from_name(syntax_kind_name(kind));
        ASSERT_TRUE(back.has_value());
        EXPECT_EQ(*back, kind);
    }
    EXPECT_FALSE(syntax_kind_from_name("SourceFileSyntax").has_value());
}

TEST(SyntaxKindTest, DisplayNameAppendsSyntax) {
    EXPECT_EQ(syntax_kind_display_name(SyntaxKind::VariableDecl), "VariableDeclSyntax");
    EXPECT_EQ(syntax_kind_display_name(SyntaxKind::UnknownExpr), "UnknownExprSyntax");
}

TEST(SyntaxKindTest, UnknownKinds) {
    EXPECT_TRUE(is_unknown_kind(SyntaxKind::Unknown));
    EXPECT_TRUE(is_unknown_kind(SyntaxKind::UnknownPattern));
    EXPECT_FALSE(is_unknown_kind(SyntaxKind::SourceFile));
}

// ============================================================================
// Trivia
// ============================================================================

TEST(TriviaTest, CountPiecesRepeat) {
    std::string out;
    write_trivia({TriviaPiece::counted(TriviaKind::Newline, 2),
                  TriviaPiece::counted(TriviaKind::Space, 3),
                  TriviaPiece::counted(TriviaKind::CarriageReturnLineFeed, 1),
                  TriviaPiece::counted(TriviaKind::Tab, 1)},
                 out);
    EXPECT_EQ(out, "\n\n   \r\n\t");
}

TEST(TriviaTest, TextPiecesWriteVerbatim) {
    std::string out;
    TriviaPiece::with_text(TriviaKind::LineComment, "// note").write(out);
    TriviaPiece::with_text(TriviaKind::GarbageText, "\xEF\xBB\xBF").write(out);
    EXPECT_EQ(out, "// note\xEF\xBB\xBF");
}

TEST(TriviaTest, KindNames) {
    EXPECT_EQ(trivia_kind_from_name("DocBlockComment"), TriviaKind::DocBlockComment);
    EXPECT_EQ(trivia_kind_name(TriviaKind::Formfeed), "Formfeed");
    EXPECT_FALSE(trivia_kind_from_name("Whitespace").has_value());
    EXPECT_TRUE(is_count_trivia(TriviaKind::Backtick));
    EXPECT_FALSE(is_count_trivia(TriviaKind::LineComment));
    EXPECT_TRUE(is_comment_trivia(TriviaKind::DocLineComment));
    EXPECT_FALSE(is_comment_trivia(TriviaKind::GarbageText));
}

// ============================================================================
// RawSyntax
// ============================================================================

TEST(RawSyntaxTest, TokenAccessors) {
    auto let = tok(TokenKind::kw_let, "let", {}, spaces(1));
    EXPECT_TRUE(let->is_token());
    EXPECT_TRUE(let->is_present());
    EXPECT_FALSE(let->is_unknown());
    EXPECT_EQ(let->num_children(), 0u);
    EXPECT_EQ(let->child(0), nullptr);
    EXPECT_EQ(let->display_name(), "TokenSyntax");
    EXPECT_EQ(let->as<TokenData>().kind, TokenKind::kw_let);
    EXPECT_THROW((void)let->as<LayoutData>(), std::bad_variant_access);
}

TEST(RawSyntaxTest, LayoutAccessors) {
    auto x = tok(TokenKind::identifier, "x");
    auto pattern = node(SyntaxKind::IdentifierPattern, {x, nullptr});
    EXPECT_FALSE(pattern->is_token());
    EXPECT_EQ(pattern->num_children(), 2u);
    EXPECT_EQ(pattern->child(0), x.get());
    EXPECT_EQ(pattern->child(1), nullptr);
    EXPECT_EQ(pattern->child(5), nullptr);
    EXPECT_EQ(pattern->display_name(), "IdentifierPatternSyntax");
    EXPECT_TRUE(node(SyntaxKind::UnknownStmt, {})->is_unknown());
}

TEST(RawSyntaxTest, SourceTextSkipsMissingAndAbsentNodes) {
    auto tree = node(SyntaxKind::CodeBlockItem,
                     {tok(TokenKind::identifier, "foo", spaces(2), {}), nullptr,
                      missing_tok(TokenKind::semi),
                      tok(TokenKind::eof, "", {TriviaPiece::counted(TriviaKind::Newline, 1)},
                          {})});
    EXPECT_EQ(source_text(*tree), "  foo\n");
}

TEST(RawSyntaxTest, MissingLayoutContributesNothing) {
    auto missing = RawSyntax::make_layout(
        LayoutData{SyntaxKind::CodeBlock, {tok(TokenKind::l_brace, "{")}}, std::nullopt,
        SourcePresence::Missing);
    EXPECT_EQ(source_text(*missing), "");
}

// ============================================================================
// Visitor
// ============================================================================

namespace {

/// Records the traversal order as a flat event list.
class RecordingVisitor : public SyntaxVisitor {
public:
    std::vector<std::string> events;
    SyntaxKind skip = SyntaxKind::Unknown;

    auto visit_pre(const RawSyntax& node) -> bool override {
        events.push_back("pre " + node.display_name());
        return !(node.is<LayoutData>() && node.as<LayoutData>().kind == skip);
    }

    void visit_post(const RawSyntax& node) override {
        events.push_back("post " + node.display_name());
    }

    void visit_token(const RawSyntax& token) override {
        events.push_back("token " + token.as<TokenData>().text);
    }
};

auto sample_tree() -> RawSyntaxPtr {
    return node(SyntaxKind::SequenceExpr,
                {tok(TokenKind::integer_literal, "1"),
                 node(SyntaxKind::ExprList, {tok(TokenKind::spaced_binary_operator, "+")}),
                 nullptr, tok(TokenKind::integer_literal, "2")});
}

} // namespace

TEST(VisitorTest, WalksDepthFirstInChildOrder) {
    RecordingVisitor visitor;
    walk(*sample_tree(), visitor);

    std::vector<std::string> expected = {
        "pre SequenceExprSyntax", "token 1",    "pre ExprListSyntax",
        "token +",                "post ExprListSyntax", "token 2",
        "post SequenceExprSyntax",
    };
    EXPECT_EQ(visitor.events, expected);
}

TEST(VisitorTest, DeclinedSubtreeIsSkipped) {
    RecordingVisitor visitor;
    visitor.skip = SyntaxKind::ExprList;
    walk(*sample_tree(), visitor);

    std::vector<std::string> expected = {
        "pre SequenceExprSyntax", "token 1", "pre ExprListSyntax", "token 2",
        "post SequenceExprSyntax",
    };
    EXPECT_EQ(visitor.events, expected);
}
