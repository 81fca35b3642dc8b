//! # Syntax Classification Implementation
//!
//! `TokenClassifier` walks the tree with the parent node and an "inside
//! `#if` condition" flag, which is all the context the rules need.
//! `MarkupWriter` is a `SyntaxVisitor` that emits the marked-up text.

#include "syntax/classifier.hpp"

#include "log/log.hpp"
#include "syntax/visitor.hpp"

#include <optional>

namespace lth::syntax {

namespace {

/// Child slot of `IfConfigClause` that holds the condition.
constexpr size_t IF_CONFIG_CONDITION_INDEX = 1;

auto is_editor_placeholder(std::string_view text) -> bool {
    return text.size() >= 4 && text.starts_with("<#") && text.ends_with("#>");
}

auto classify_by_kind(const TokenData& token) -> SyntaxClassification {
    if (is_keyword(token.kind)) {
        return SyntaxClassification::Keyword;
    }

    switch (token.kind) {
    case TokenKind::contextual_keyword:
        return SyntaxClassification::Keyword;
    case TokenKind::pound_if:
    case TokenKind::pound_else:
    case TokenKind::pound_elseif:
    case TokenKind::pound_endif:
    case TokenKind::pound_sourceLocation:
    case TokenKind::pound_warning:
    case TokenKind::pound_error:
        return SyntaxClassification::PoundDirectiveKeyword;
    case TokenKind::pound_fileLiteral:
    case TokenKind::pound_imageLiteral:
    case TokenKind::pound_colorLiteral:
        return SyntaxClassification::ObjectLiteral;
    case TokenKind::identifier:
        return is_editor_placeholder(token.text) ? SyntaxClassification::EditorPlaceholder
                                                 : SyntaxClassification::Identifier;
    case TokenKind::dollarident:
        return SyntaxClassification::DollarIdentifier;
    case TokenKind::integer_literal:
        return SyntaxClassification::IntegerLiteral;
    case TokenKind::floating_literal:
        return SyntaxClassification::FloatingLiteral;
    case TokenKind::string_literal:
    case TokenKind::string_segment:
    case TokenKind::string_quote:
    case TokenKind::single_quote:
    case TokenKind::multiline_string_quote:
    case TokenKind::raw_string_delimiter:
        return SyntaxClassification::StringLiteral;
    case TokenKind::string_interpolation_anchor:
        return SyntaxClassification::StringInterpolationAnchor;
    default:
        break;
    }

    if (is_pound_keyword(token.kind)) {
        return SyntaxClassification::Keyword;
    }
    return SyntaxClassification::None;
}

class TokenClassifier {
public:
    explicit TokenClassifier(ClassificationMap& out) : out_(out) {}

    void visit(const RawSyntax& node, const RawSyntax* parent, bool in_condition) {
        if (node.is_token()) {
            out_[&node] = classify(node.as<TokenData>(), parent, in_condition);
            return;
        }

        const auto& layout = node.as<LayoutData>();
        for (size_t i = 0; i < layout.children.size(); ++i) {
            const auto& child = layout.children[i];
            if (!child) {
                continue;
            }
            bool child_in_condition =
                in_condition ||
                (layout.kind == SyntaxKind::IfConfigClause && i == IF_CONFIG_CONDITION_INDEX);
            visit(*child, &node, child_in_condition);
        }
    }

private:
    ClassificationMap& out_;

    static auto parent_kind(const RawSyntax* parent) -> std::optional<SyntaxKind> {
        if (!parent) {
            return std::nullopt;
        }
        return parent->as<LayoutData>().kind;
    }

    static auto classify(const TokenData& token, const RawSyntax* parent, bool in_condition)
        -> SyntaxClassification {
        auto base = classify_by_kind(token);
        if (base == SyntaxClassification::EditorPlaceholder) {
            return base;
        }

        auto parent_of = parent_kind(parent);

        if (parent_of == SyntaxKind::ExpressionSegment &&
            (token.kind == TokenKind::backslash || token.kind == TokenKind::l_paren ||
             token.kind == TokenKind::r_paren ||
             token.kind == TokenKind::string_interpolation_anchor)) {
            return SyntaxClassification::StringInterpolationAnchor;
        }

        if (parent_of == SyntaxKind::Attribute &&
            (token.kind == TokenKind::at_sign || token.kind == TokenKind::identifier)) {
            return SyntaxClassification::Attribute;
        }

        if (token.kind == TokenKind::identifier) {
            if (in_condition) {
                return SyntaxClassification::BuildConfigId;
            }
            if (parent_of == SyntaxKind::SimpleTypeIdentifier ||
                parent_of == SyntaxKind::MemberTypeIdentifier) {
                return SyntaxClassification::TypeIdentifier;
            }
        }

        return base;
    }
};

class MarkupWriter : public SyntaxVisitor {
public:
    explicit MarkupWriter(const ClassificationMap& classifications)
        : classifications_(classifications) {}

    auto visit_pre(const RawSyntax& node) -> bool override {
        return node.is_present();
    }

    void visit_token(const RawSyntax& node) override {
        if (node.is_missing()) {
            return;
        }
        const auto& token = node.as<TokenData>();
        write_trivia(token.leading_trivia);

        auto it = classifications_.find(&node);
        auto classification =
            it != classifications_.end() ? it->second : SyntaxClassification::None;
        record_tag(classification_tag(classification));
        out_ += token.text;

        write_trivia(token.trailing_trivia);
    }

    auto finish() -> std::string {
        record_tag("");
        return std::move(out_);
    }

private:
    const ClassificationMap& classifications_;
    std::string out_;
    std::string_view current_tag_;

    void write_trivia(const Trivia& trivia) {
        for (const auto& piece : trivia) {
            record_tag(classification_tag(classify_trivia(piece.kind)));
            piece.write(out_);
        }
    }

    void record_tag(std::string_view tag) {
        if (tag == current_tag_) {
            return;
        }
        if (!current_tag_.empty()) {
            out_ += "</";
            out_ += current_tag_;
            out_ += ">";
        }
        if (!tag.empty()) {
            out_ += "<";
            out_ += tag;
            out_ += ">";
        }
        current_tag_ = tag;
    }
};

} // namespace

auto classify_tokens(const RawSyntax& root) -> ClassificationMap {
    ClassificationMap result;
    TokenClassifier classifier(result);
    classifier.visit(root, nullptr, false);
    LTH_LOG_DEBUG("classify", "Classified " << result.size() << " tokens");
    return result;
}

auto classify_trivia(TriviaKind kind) -> SyntaxClassification {
    switch (kind) {
    case TriviaKind::LineComment:
        return SyntaxClassification::LineComment;
    case TriviaKind::DocLineComment:
        return SyntaxClassification::DocLineComment;
    case TriviaKind::BlockComment:
        return SyntaxClassification::BlockComment;
    case TriviaKind::DocBlockComment:
        return SyntaxClassification::DocBlockComment;
    default:
        return SyntaxClassification::None;
    }
}

auto classification_tag(SyntaxClassification classification) -> std::string_view {
    switch (classification) {
    case SyntaxClassification::None:
    case SyntaxClassification::Identifier:
        return "";
    case SyntaxClassification::Keyword:
        return "kw";
    case SyntaxClassification::TypeIdentifier:
        return "type";
    case SyntaxClassification::DollarIdentifier:
        return "dollar";
    case SyntaxClassification::IntegerLiteral:
        return "int";
    case SyntaxClassification::FloatingLiteral:
        return "float";
    case SyntaxClassification::StringLiteral:
        return "str";
    case SyntaxClassification::StringInterpolationAnchor:
        return "anchor";
    case SyntaxClassification::PoundDirectiveKeyword:
        return "#kw";
    case SyntaxClassification::BuildConfigId:
        return "#id";
    case SyntaxClassification::Attribute:
        return "attr-builtin";
    case SyntaxClassification::ObjectLiteral:
        return "object-literal";
    case SyntaxClassification::EditorPlaceholder:
        return "placeholder";
    case SyntaxClassification::LineComment:
        return "comment-line";
    case SyntaxClassification::DocLineComment:
        return "doc-comment-line";
    case SyntaxClassification::BlockComment:
        return "comment-block";
    case SyntaxClassification::DocBlockComment:
        return "doc-comment-block";
    }
    return "";
}

auto ClassifiedTreePrinter::print(const RawSyntax& root) -> std::string {
    MarkupWriter writer(classifications_);
    walk(root, writer);
    return writer.finish();
}

} // namespace lth::syntax
