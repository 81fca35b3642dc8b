//! # Syntax Kind Tables

#include "syntax/syntax_kind.hpp"

#include <array>
#include <unordered_map>

namespace lth::syntax {

namespace {

/// Serialized names, indexed by `SyntaxKind`.
constexpr std::array<std::string_view, static_cast<size_t>(SyntaxKind::EnumCasePattern) + 1>
    SYNTAX_KIND_NAMES = {
        "Unknown",
        "UnknownDecl",
        "UnknownExpr",
        "UnknownStmt",
        "UnknownType",
        "UnknownPattern",
        "SourceFile",
        "CodeBlockItemList",
        "CodeBlockItem",
        "CodeBlock",
        "MemberDeclBlock",
        "MemberDeclList",
        "MemberDeclListItem",
        "TokenList",
        "NonEmptyTokenList",
        "VariableDecl",
        "PatternBindingList",
        "PatternBinding",
        "InitializerClause",
        "TypeAnnotation",
        "AccessorBlock",
        "FunctionDecl",
        "FunctionSignature",
        "ParameterClause",
        "FunctionParameterList",
        "FunctionParameter",
        "ReturnClause",
        "InitializerDecl",
        "DeinitializerDecl",
        "StructDecl",
        "ClassDecl",
        "EnumDecl",
        "EnumCaseDecl",
        "EnumCaseElementList",
        "EnumCaseElement",
        "ProtocolDecl",
        "ExtensionDecl",
        "TypealiasDecl",
        "TypeInitializerClause",
        "ImportDecl",
        "AccessPath",
        "AccessPathComponent",
        "ModifierList",
        "DeclModifier",
        "AttributeList",
        "Attribute",
        "CustomAttribute",
        "TypeInheritanceClause",
        "InheritedTypeList",
        "InheritedType",
        "GenericParameterClause",
        "GenericParameterList",
        "GenericParameter",
        "GenericArgumentClause",
        "GenericArgumentList",
        "GenericArgument",
        "GenericWhereClause",
        "IfConfigDecl",
        "IfConfigClauseList",
        "IfConfigClause",
        "PoundErrorDecl",
        "PoundWarningDecl",
        "PoundSourceLocation",
        "PoundSourceLocationArgs",
        "IdentifierExpr",
        "IntegerLiteralExpr",
        "FloatLiteralExpr",
        "BooleanLiteralExpr",
        "NilLiteralExpr",
        "StringLiteralExpr",
        "StringLiteralSegments",
        "StringSegment",
        "ExpressionSegment",
        "SequenceExpr",
        "ExprList",
        "BinaryOperatorExpr",
        "PrefixOperatorExpr",
        "PostfixUnaryExpr",
        "FunctionCallExpr",
        "TupleExprElementList",
        "TupleExprElement",
        "MemberAccessExpr",
        "TupleExpr",
        "ArrayExpr",
        "ArrayElementList",
        "ArrayElement",
        "DictionaryExpr",
        "DictionaryElementList",
        "DictionaryElement",
        "ClosureExpr",
        "ClosureSignature",
        "AssignmentExpr",
        "TryExpr",
        "AsExpr",
        "IsExpr",
        "TernaryExpr",
        "DiscardAssignmentExpr",
        "SuperRefExpr",
        "ObjectLiteralExpr",
        "EditorPlaceholderExpr",
        "KeyPathExpr",
        "PoundLineExpr",
        "PoundFileExpr",
        "PoundColumnExpr",
        "PoundFunctionExpr",
        "ExpressionStmt",
        "ReturnStmt",
        "IfStmt",
        "ConditionElementList",
        "ConditionElement",
        "AvailabilityCondition",
        "GuardStmt",
        "WhileStmt",
        "RepeatWhileStmt",
        "ForInStmt",
        "SwitchStmt",
        "SwitchCaseList",
        "SwitchCase",
        "SwitchCaseLabel",
        "SwitchDefaultLabel",
        "CaseItemList",
        "CaseItem",
        "BreakStmt",
        "ContinueStmt",
        "FallthroughStmt",
        "DeferStmt",
        "ThrowStmt",
        "DoStmt",
        "CatchClauseList",
        "CatchClause",
        "SimpleTypeIdentifier",
        "MemberTypeIdentifier",
        "ArrayType",
        "DictionaryType",
        "OptionalType",
        "ImplicitlyUnwrappedOptionalType",
        "TupleType",
        "TupleTypeElementList",
        "TupleTypeElement",
        "FunctionType",
        "AttributedType",
        "CompositionType",
        "CompositionTypeElementList",
        "CompositionTypeElement",
        "IdentifierPattern",
        "WildcardPattern",
        "TuplePattern",
        "TuplePatternElementList",
        "TuplePatternElement",
        "ValueBindingPattern",
        "ExpressionPattern",
        "IsTypePattern",
        "EnumCasePattern",
};

static_assert(SYNTAX_KIND_NAMES.back() == "EnumCasePattern",
              "SYNTAX_KIND_NAMES must have one entry per SyntaxKind");

} // namespace

auto syntax_kind_name(SyntaxKind kind) -> std::string_view {
    return SYNTAX_KIND_NAMES[static_cast<size_t>(kind)];
}

auto syntax_kind_display_name(SyntaxKind kind) -> std::string {
    return std::string(syntax_kind_name(kind)) + "Syntax";
}

auto syntax_kind_from_name(std::string_view name) -> std::optional<SyntaxKind> {
    static const std::unordered_map<std::string_view, SyntaxKind> by_name = [] {
        std::unordered_map<std::string_view, SyntaxKind> map;
        for (size_t i = 0; i < SYNTAX_KIND_NAMES.size(); ++i) {
            map.emplace(SYNTAX_KIND_NAMES[i], static_cast<SyntaxKind>(i));
        }
        return map;
    }();

    auto it = by_name.find(name);
    if (it == by_name.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace lth::syntax
