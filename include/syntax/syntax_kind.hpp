//! # Syntax Node Kinds
//!
//! The closed set of layout node kinds. A node's serialized name is the
//! enumerator name (`SourceFile`, `VariableDecl`, ...); its display name adds
//! the `Syntax` suffix (`SourceFileSyntax`).
//!
//! The `Unknown*` kinds mark subtrees the front-end could not parse. They
//! deserialize and render like any other node, but tree-structure printing
//! treats them as a contract violation.

#ifndef LTH_SYNTAX_SYNTAX_KIND_HPP
#define LTH_SYNTAX_SYNTAX_KIND_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace lth::syntax {

enum class SyntaxKind : uint8_t {
    // Unknown (unparsed) kinds
    Unknown,
    UnknownDecl,
    UnknownExpr,
    UnknownStmt,
    UnknownType,
    UnknownPattern,

    // Structure
    SourceFile,
    CodeBlockItemList,
    CodeBlockItem,
    CodeBlock,
    MemberDeclBlock,
    MemberDeclList,
    MemberDeclListItem,
    TokenList,
    NonEmptyTokenList,

    // Declarations
    VariableDecl,
    PatternBindingList,
    PatternBinding,
    InitializerClause,
    TypeAnnotation,
    AccessorBlock,
    FunctionDecl,
    FunctionSignature,
    ParameterClause,
    FunctionParameterList,
    FunctionParameter,
    ReturnClause,
    InitializerDecl,
    DeinitializerDecl,
    StructDecl,
    ClassDecl,
    EnumDecl,
    EnumCaseDecl,
    EnumCaseElementList,
    EnumCaseElement,
    ProtocolDecl,
    ExtensionDecl,
    TypealiasDecl,
    TypeInitializerClause,
    ImportDecl,
    AccessPath,
    AccessPathComponent,
    ModifierList,
    DeclModifier,
    AttributeList,
    Attribute,
    CustomAttribute,
    TypeInheritanceClause,
    InheritedTypeList,
    InheritedType,
    GenericParameterClause,
    GenericParameterList,
    GenericParameter,
    GenericArgumentClause,
    GenericArgumentList,
    GenericArgument,
    GenericWhereClause,
    IfConfigDecl,
    IfConfigClauseList,
    IfConfigClause,
    PoundErrorDecl,
    PoundWarningDecl,
    PoundSourceLocation,
    PoundSourceLocationArgs,

    // Expressions
    IdentifierExpr,
    IntegerLiteralExpr,
    FloatLiteralExpr,
    BooleanLiteralExpr,
    NilLiteralExpr,
    StringLiteralExpr,
    StringLiteralSegments,
    StringSegment,
    ExpressionSegment,
    SequenceExpr,
    ExprList,
    BinaryOperatorExpr,
    PrefixOperatorExpr,
    PostfixUnaryExpr,
    FunctionCallExpr,
    TupleExprElementList,
    TupleExprElement,
    MemberAccessExpr,
    TupleExpr,
    ArrayExpr,
    ArrayElementList,
    ArrayElement,
    DictionaryExpr,
    DictionaryElementList,
    DictionaryElement,
    ClosureExpr,
    ClosureSignature,
    AssignmentExpr,
    TryExpr,
    AsExpr,
    IsExpr,
    TernaryExpr,
    DiscardAssignmentExpr,
    SuperRefExpr,
    ObjectLiteralExpr,
    EditorPlaceholderExpr,
    KeyPathExpr,
    PoundLineExpr,
    PoundFileExpr,
    PoundColumnExpr,
    PoundFunctionExpr,

    // Statements
    ExpressionStmt,
    ReturnStmt,
    IfStmt,
    ConditionElementList,
    ConditionElement,
    AvailabilityCondition,
    GuardStmt,
    WhileStmt,
    RepeatWhileStmt,
    ForInStmt,
    SwitchStmt,
    SwitchCaseList,
    SwitchCase,
    SwitchCaseLabel,
    SwitchDefaultLabel,
    CaseItemList,
    CaseItem,
    BreakStmt,
    ContinueStmt,
    FallthroughStmt,
    DeferStmt,
    ThrowStmt,
    DoStmt,
    CatchClauseList,
    CatchClause,

    // Types
    SimpleTypeIdentifier,
    MemberTypeIdentifier,
    ArrayType,
    DictionaryType,
    OptionalType,
    ImplicitlyUnwrappedOptionalType,
    TupleType,
    TupleTypeElementList,
    TupleTypeElement,
    FunctionType,
    AttributedType,
    CompositionType,
    CompositionTypeElementList,
    CompositionTypeElement,

    // Patterns
    IdentifierPattern,
    WildcardPattern,
    TuplePattern,
    TuplePatternElementList,
    TuplePatternElement,
    ValueBindingPattern,
    ExpressionPattern,
    IsTypePattern,
    EnumCasePattern,
};

/// Serialized name of a node kind (e.g. "SourceFile").
[[nodiscard]] auto syntax_kind_name(SyntaxKind kind) -> std::string_view;

/// Display name with the `Syntax` suffix (e.g. "SourceFileSyntax").
[[nodiscard]] auto syntax_kind_display_name(SyntaxKind kind) -> std::string;

/// Looks up a node kind by its serialized name.
[[nodiscard]] auto syntax_kind_from_name(std::string_view name) -> std::optional<SyntaxKind>;

/// True for `Unknown` and the `Unknown*` category kinds.
[[nodiscard]] inline auto is_unknown_kind(SyntaxKind kind) -> bool {
    return kind <= SyntaxKind::UnknownPattern;
}

} // namespace lth::syntax

#endif // LTH_SYNTAX_SYNTAX_KIND_HPP
