//! # Action Executors Implementation

#include "cli/actions.hpp"

#include "cli/flags.hpp"
#include "cli/utils.hpp"
#include "log/log.hpp"
#include "syntax/classifier.hpp"
#include "syntax/deserializer.hpp"
#include "syntax/parser.hpp"
#include "syntax/visitor.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>

namespace lth::cli {

namespace {

using syntax::RawSyntax;
using syntax::RawSyntaxPtr;

auto check_readable(const std::string& path) -> Result<bool, HarnessError> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return HarnessError::file_access(
            path, "Cannot read file '" + path + "': " + std::strerror(errno));
    }
    return true;
}

/// Parses `-source-file` with the external compiler.
auto parse_source_file(const ArgumentStore& args) -> Result<RawSyntaxPtr, HarnessError> {
    auto source = args.get_required(flags::SOURCE_FILE);
    if (is_err(source)) {
        return unwrap_err(source);
    }
    const std::string& path = unwrap(source);

    auto readable = check_readable(path);
    if (is_err(readable)) {
        return unwrap_err(readable);
    }

    auto tree = syntax::SyntaxTreeParser::parse(path, args.get(flags::SWIFTC));
    if (is_err(tree)) {
        return HarnessError::collaborator(unwrap_err(tree).message, path);
    }
    return unwrap(tree);
}

/// Writes the tree structure through the visitor interface.
class NodePrinter : public syntax::SyntaxVisitor {
public:
    auto visit_pre(const RawSyntax& node) -> bool override {
        check_known(node);
        if (node.is_missing()) {
            return false;
        }
        out_ += "<" + node.display_name() + ">";
        return true;
    }

    void visit_post(const RawSyntax& node) override {
        out_ += "</" + node.display_name() + ">";
    }

    void visit_token(const RawSyntax& node) override {
        syntax::write_source(node, out_);
    }

    auto take() -> std::string {
        return std::move(out_);
    }

private:
    std::string out_;

    static void check_known(const RawSyntax& node) {
        if (node.is_unknown()) {
            LTH_LOG_FATAL("actions", "Unknown node " << node.display_name()
                                                     << " in syntax tree; cannot print structure");
            log::Logger::instance().flush();
            std::abort();
        }
    }
};

} // namespace

auto perform_deserialize(const ArgumentStore& args) -> Result<ActionOutput, HarnessError> {
    auto pre_edit_path = args.get_required(flags::PRE_EDIT_TREE);
    if (is_err(pre_edit_path)) {
        return unwrap_err(pre_edit_path);
    }
    auto out_path = args.get_required(flags::OUT);
    if (is_err(out_path)) {
        return unwrap_err(out_path);
    }
    auto format = resolve_format(args);
    if (is_err(format)) {
        return unwrap_err(format);
    }

    auto bytes = read_file_bytes(unwrap(pre_edit_path));
    if (is_err(bytes)) {
        return unwrap_err(bytes);
    }

    syntax::SyntaxTreeDeserializer session;
    auto tree = session.deserialize(unwrap(bytes), unwrap(format));
    if (is_err(tree)) {
        return HarnessError::collaborator("Failed to deserialize '" + unwrap(pre_edit_path) +
                                              "': " + unwrap_err(tree).message,
                                          unwrap(pre_edit_path));
    }

    auto written = write_file(unwrap(out_path), syntax::source_text(*unwrap(tree)));
    if (is_err(written)) {
        return unwrap_err(written);
    }
    LTH_LOG_INFO("actions", "Wrote source of " << unwrap(pre_edit_path) << " to "
                                               << unwrap(out_path));
    return ActionOutput{};
}

auto perform_round_trip(const ArgumentStore& args) -> Result<ActionOutput, HarnessError> {
    auto pre_edit_path = args.get_required(flags::PRE_EDIT_TREE);
    if (is_err(pre_edit_path)) {
        return unwrap_err(pre_edit_path);
    }
    auto incr_path = args.get_required(flags::INCR_TREE);
    if (is_err(incr_path)) {
        return unwrap_err(incr_path);
    }
    auto out_path = args.get_required(flags::OUT);
    if (is_err(out_path)) {
        return unwrap_err(out_path);
    }
    auto format = resolve_format(args);
    if (is_err(format)) {
        return unwrap_err(format);
    }

    auto pre_edit_bytes = read_file_bytes(unwrap(pre_edit_path));
    if (is_err(pre_edit_bytes)) {
        return unwrap_err(pre_edit_bytes);
    }
    auto incr_bytes = read_file_bytes(unwrap(incr_path));
    if (is_err(incr_bytes)) {
        return unwrap_err(incr_bytes);
    }

    // One session for both payloads: the incremental tree refers back to
    // nodes recorded while reading the pre-edit tree.
    syntax::SyntaxTreeDeserializer session;
    auto pre_edit = session.deserialize(unwrap(pre_edit_bytes), unwrap(format));
    if (is_err(pre_edit)) {
        return HarnessError::collaborator("Failed to deserialize pre-edit tree '" +
                                              unwrap(pre_edit_path) +
                                              "': " + unwrap_err(pre_edit).message,
                                          unwrap(pre_edit_path));
    }

    auto post_edit = session.deserialize(unwrap(incr_bytes), unwrap(format));
    if (is_err(post_edit)) {
        return HarnessError::collaborator("Failed to deserialize incremental tree '" +
                                              unwrap(incr_path) +
                                              "': " + unwrap_err(post_edit).message,
                                          unwrap(incr_path));
    }
    LTH_LOG_DEBUG("actions", "Incremental transfer resolved against "
                                 << session.recorded_nodes() << " recorded nodes");

    auto written = write_file(unwrap(out_path), syntax::source_text(*unwrap(post_edit)));
    if (is_err(written)) {
        return unwrap_err(written);
    }
    return ActionOutput{};
}

auto perform_classify_syntax(const ArgumentStore& args) -> Result<ActionOutput, HarnessError> {
    auto tree = parse_source_file(args);
    if (is_err(tree)) {
        return unwrap_err(tree);
    }
    const auto& root = *unwrap(tree);

    auto classifications = syntax::classify_tokens(root);
    syntax::ClassifiedTreePrinter printer(classifications);
    std::string result = printer.print(root);

    if (auto out_path = args.get(flags::OUT)) {
        auto written = write_file(*out_path, result);
        if (is_err(written)) {
            return unwrap_err(written);
        }
        return ActionOutput{};
    }
    return result + "\n";
}

auto perform_print_tree(const ArgumentStore& args) -> Result<ActionOutput, HarnessError> {
    auto tree = parse_source_file(args);
    if (is_err(tree)) {
        return unwrap_err(tree);
    }
    return print_tree_structure(*unwrap(tree));
}

auto print_tree_structure(const RawSyntax& root) -> std::string {
    NodePrinter printer;
    syntax::walk(root, printer);
    return printer.take();
}

auto run_action(Action action, const ArgumentStore& args) -> Result<ActionOutput, HarnessError> {
    LTH_LOG_INFO("actions", "Running " << action_name(action));
    switch (action) {
    case Action::Deserialize:
        return perform_deserialize(args);
    case Action::IncrementalRoundTrip:
        return perform_round_trip(args);
    case Action::ClassifySyntaxColoring:
        return perform_classify_syntax(args);
    case Action::PrintTreeStructure:
        return perform_print_tree(args);
    case Action::Help:
        return usage_text();
    }
    return HarnessError::no_action();
}

} // namespace lth::cli
