//! # JSON Tree Reader
//!
//! Converts a JSON tree payload into `RawSyntax` nodes.
//!
//! ```json
//! {"id": 1, "kind": "SourceFile", "presence": "Present", "layout": [
//!     {"id": 2, "tokenKind": {"kind": "kw_let"}, "presence": "Present",
//!      "leadingTrivia": [], "trailingTrivia": [{"kind": "Space", "value": 1}]},
//!     {"id": 7, "omitted": true},
//!     null
//! ]}
//! ```

#include "json/json_parser.hpp"
#include "syntax/deserializer.hpp"

#include <string>

namespace lth::syntax {

namespace {

using json::JsonValue;

auto error(std::string message) -> SyntaxError {
    return SyntaxError::make("malformed JSON syntax tree: " + std::move(message));
}

class JsonTreeReader {
public:
    explicit JsonTreeReader(NodeLookupTable& table) : table_(table) {}

    auto read_node(const JsonValue& value) -> Result<RawSyntaxPtr, SyntaxError>;

private:
    NodeLookupTable& table_;
    uint64_t repeated_ = 0; ///< Sum of trivia repeat counts read so far

    auto read_token(const JsonValue& value, std::optional<uint64_t> id, SourcePresence presence)
        -> Result<RawSyntaxPtr, SyntaxError>;
    auto read_layout(const JsonValue& value, std::optional<uint64_t> id, SourcePresence presence)
        -> Result<RawSyntaxPtr, SyntaxError>;
    auto read_trivia(const JsonValue* value, Trivia& out) -> Result<bool, SyntaxError>;

    void record(const RawSyntaxPtr& node) {
        if (node->id) {
            table_[*node->id] = node;
        }
    }
};

auto JsonTreeReader::read_node(const JsonValue& value) -> Result<RawSyntaxPtr, SyntaxError> {
    if (!value.is_object()) {
        return error(std::string("expected a node object, found ") + value.type_name());
    }

    std::optional<uint64_t> id;
    if (const auto* id_value = value.get("id")) {
        id = id_value->try_as_u64();
        if (!id) {
            return error("node id must be an unsigned integer");
        }
    }

    if (const auto* omitted = value.get("omitted"); omitted && omitted->is_bool() &&
                                                     omitted->as_bool()) {
        if (!id) {
            return error("omitted node has no id");
        }
        auto it = table_.find(*id);
        if (it == table_.end()) {
            return SyntaxError::make("omitted node with id " + std::to_string(*id) +
                                     " was not found in the lookup table");
        }
        return it->second;
    }

    SourcePresence presence = SourcePresence::Present;
    if (const auto* presence_value = value.get("presence")) {
        if (!presence_value->is_string()) {
            return error("node presence must be a string");
        }
        const auto& text = presence_value->as_string();
        if (text == "Missing") {
            presence = SourcePresence::Missing;
        } else if (text != "Present") {
            return error("unknown presence '" + text + "'");
        }
    }

    Result<RawSyntaxPtr, SyntaxError> node = value.get("tokenKind")
                                                 ? read_token(value, id, presence)
                                                 : read_layout(value, id, presence);
    if (is_ok(node)) {
        record(unwrap(node));
    }
    return node;
}

auto JsonTreeReader::read_token(const JsonValue& value, std::optional<uint64_t> id,
                                SourcePresence presence) -> Result<RawSyntaxPtr, SyntaxError> {
    const auto* token_kind = value.get("tokenKind");
    const auto* kind_name = token_kind->get("kind");
    if (!kind_name || !kind_name->is_string()) {
        return error("token has no kind name");
    }
    auto kind = token_kind_from_name(kind_name->as_string());
    if (!kind) {
        return error("unknown token kind '" + kind_name->as_string() + "'");
    }

    TokenData token{*kind, {}, {}, {}};
    if (const auto* text = token_kind->get("text")) {
        if (!text->is_string()) {
            return error("token text must be a string");
        }
        token.text = text->as_string();
    } else if (auto fixed = fixed_token_text(*kind)) {
        token.text = std::string(*fixed);
    }

    auto leading = read_trivia(value.get("leadingTrivia"), token.leading_trivia);
    if (is_err(leading)) {
        return unwrap_err(leading);
    }
    auto trailing = read_trivia(value.get("trailingTrivia"), token.trailing_trivia);
    if (is_err(trailing)) {
        return unwrap_err(trailing);
    }

    return RawSyntax::make_token(std::move(token), id, presence);
}

auto JsonTreeReader::read_layout(const JsonValue& value, std::optional<uint64_t> id,
                                 SourcePresence presence) -> Result<RawSyntaxPtr, SyntaxError> {
    const auto* kind_name = value.get("kind");
    if (!kind_name || !kind_name->is_string()) {
        return error("node has neither a token kind nor a syntax kind");
    }
    auto kind = syntax_kind_from_name(kind_name->as_string());
    if (!kind) {
        return error("unknown syntax kind '" + kind_name->as_string() + "'");
    }

    LayoutData layout{*kind, {}};
    if (const auto* children = value.get("layout")) {
        if (!children->is_array()) {
            return error("layout of " + kind_name->as_string() + " must be an array");
        }
        layout.children.reserve(children->size());
        for (const auto& child : children->as_array()) {
            if (child.is_null()) {
                layout.children.push_back(nullptr);
                continue;
            }
            auto node = read_node(child);
            if (is_err(node)) {
                return node;
            }
            layout.children.push_back(std::move(unwrap(node)));
        }
    }

    return RawSyntax::make_layout(std::move(layout), id, presence);
}

auto JsonTreeReader::read_trivia(const JsonValue* value, Trivia& out)
    -> Result<bool, SyntaxError> {
    if (!value) {
        return true;
    }
    if (!value->is_array()) {
        return error("trivia must be an array");
    }

    for (const auto& piece : value->as_array()) {
        const auto* kind_name = piece.get("kind");
        if (!kind_name || !kind_name->is_string()) {
            return error("trivia piece has no kind");
        }
        auto kind = trivia_kind_from_name(kind_name->as_string());
        if (!kind) {
            return error("unknown trivia kind '" + kind_name->as_string() + "'");
        }

        const auto* piece_value = piece.get("value");
        if (is_count_trivia(*kind)) {
            auto count = piece_value ? piece_value->try_as_u64() : std::nullopt;
            if (!count) {
                return error("trivia " + kind_name->as_string() + " needs a count");
            }
            if (*count > MAX_TRIVIA_REPEAT - repeated_) {
                return error("trivia repeat counts exceed " + std::to_string(MAX_TRIVIA_REPEAT));
            }
            repeated_ += *count;
            out.push_back(TriviaPiece::counted(*kind, *count));
        } else {
            if (!piece_value || !piece_value->is_string()) {
                return error("trivia " + kind_name->as_string() + " needs text");
            }
            out.push_back(TriviaPiece::with_text(*kind, piece_value->as_string()));
        }
    }
    return true;
}

} // namespace

auto read_json_tree(std::string_view bytes, NodeLookupTable& table)
    -> Result<RawSyntaxPtr, SyntaxError> {
    auto document = json::parse_json(bytes);
    if (is_err(document)) {
        return SyntaxError::make("invalid JSON syntax tree: " + unwrap_err(document).to_string());
    }

    JsonTreeReader reader(table);
    return reader.read_node(unwrap(document));
}

} // namespace lth::syntax
