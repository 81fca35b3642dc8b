//! # Syntax Visitor
//!
//! Depth-first traversal over a `RawSyntax` tree. `walk` calls
//! `visit_pre` on a layout node, descends into its present child slots in
//! order if `visit_pre` returned true, then calls `visit_post`. Tokens go
//! to `visit_token`. Absent child slots are skipped; missing nodes are
//! passed to the visitor like any other node.
//!
//! ```cpp
//! class TokenCounter : public SyntaxVisitor {
//! public:
//!     size_t count = 0;
//!     void visit_token(const RawSyntax&) override { ++count; }
//! };
//! ```

#ifndef LTH_SYNTAX_VISITOR_HPP
#define LTH_SYNTAX_VISITOR_HPP

#include "syntax/raw_syntax.hpp"

namespace lth::syntax {

class SyntaxVisitor {
public:
    virtual ~SyntaxVisitor() = default;

    /// Called before the children of a layout node. Return false to skip
    /// the children and the matching `visit_post`.
    virtual auto visit_pre(const RawSyntax& /*node*/) -> bool {
        return true;
    }

    /// Called after the children of a layout node.
    virtual void visit_post(const RawSyntax& /*node*/) {}

    virtual void visit_token(const RawSyntax& /*token*/) {}
};

/// Walks `root` depth-first, dispatching to `visitor`.
void walk(const RawSyntax& root, SyntaxVisitor& visitor);

} // namespace lth::syntax

#endif // LTH_SYNTAX_VISITOR_HPP
