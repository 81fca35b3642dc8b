#include "syntax/visitor.hpp"

namespace lth::syntax {

void walk(const RawSyntax& root, SyntaxVisitor& visitor) {
    if (root.is_token()) {
        visitor.visit_token(root);
        return;
    }
    if (!visitor.visit_pre(root)) {
        return;
    }
    for (const auto& child : root.as<LayoutData>().children) {
        if (child) {
            walk(*child, visitor);
        }
    }
    visitor.visit_post(root);
}

} // namespace lth::syntax
