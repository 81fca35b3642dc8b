//! # Action Selection and Format Resolution Tests

#include "cli/options.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace lth;
using namespace lth::cli;
using lth::syntax::SerializationFormat;

namespace {

auto store(const std::vector<std::string>& args) -> ArgumentStore {
    auto result = ArgumentStore::parse(args);
    EXPECT_TRUE(is_ok(result));
    return unwrap(result);
}

auto selected(const std::vector<std::string>& args) -> Action {
    auto result = select_action(store(args));
    EXPECT_TRUE(is_ok(result)) << (is_err(result) ? unwrap_err(result).describe() : "");
    return is_ok(result) ? unwrap(result) : Action::Help;
}

} // namespace

// ============================================================================
// select_action
// ============================================================================

TEST(SelectActionTest, EachActionFlag) {
    EXPECT_EQ(selected({"-deserialize"}), Action::Deserialize);
    EXPECT_EQ(selected({"-deserialize-incremental"}), Action::IncrementalRoundTrip);
    EXPECT_EQ(selected({"-classify-syntax"}), Action::ClassifySyntaxColoring);
    EXPECT_EQ(selected({"-print-source"}), Action::PrintTreeStructure);
    EXPECT_EQ(selected({"-help"}), Action::Help);
}

TEST(SelectActionTest, ValueFlagsDoNotAffectSelection) {
    EXPECT_EQ(selected({"-source-file", "c.swift", "-classify-syntax", "-out", "o.txt"}),
              Action::ClassifySyntaxColoring);
}

TEST(SelectActionTest, FixedPrecedence) {
    EXPECT_EQ(selected({"-deserialize", "-deserialize-incremental"}),
              Action::IncrementalRoundTrip);
    EXPECT_EQ(selected({"-deserialize", "-classify-syntax"}), Action::ClassifySyntaxColoring);
    EXPECT_EQ(selected({"-help", "-print-source", "-deserialize"}), Action::Deserialize);
    EXPECT_EQ(selected({"-help", "-print-source"}), Action::PrintTreeStructure);
}

TEST(SelectActionTest, NoActionFlag) {
    auto result = select_action(store({"-source-file", "c.swift"}));
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, HarnessErrorKind::NoActionSpecified);
    EXPECT_NE(unwrap_err(result).describe().find("No action specified"), std::string::npos);
}

TEST(SelectActionTest, ActionNames) {
    EXPECT_EQ(action_name(Action::IncrementalRoundTrip), "deserialize-incremental");
    EXPECT_EQ(action_name(Action::PrintTreeStructure), "print-source");
}

// ============================================================================
// resolve_format
// ============================================================================

TEST(ResolveFormatTest, DefaultsToJson) {
    auto result = resolve_format(store({"-deserialize"}));
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result), SerializationFormat::Json);
}

TEST(ResolveFormatTest, ExplicitValues) {
    auto json = resolve_format(store({"-serialization-format", "json"}));
    ASSERT_TRUE(is_ok(json));
    EXPECT_EQ(unwrap(json), SerializationFormat::Json);

    auto byte_tree = resolve_format(store({"-serialization-format", "byteTree"}));
    ASSERT_TRUE(is_ok(byte_tree));
    EXPECT_EQ(unwrap(byte_tree), SerializationFormat::ByteTree);
}

TEST(ResolveFormatTest, EmptyValueMeansJson) {
    auto result = resolve_format(store({"-serialization-format", ""}));
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result), SerializationFormat::Json);
}

TEST(ResolveFormatTest, OtherValuesAreRejected) {
    for (const char* value : {"xml", "JSON", "bytetree"}) {
        auto result = resolve_format(store({"-serialization-format", value}));
        ASSERT_TRUE(is_err(result)) << value;
        const auto& error = unwrap_err(result);
        EXPECT_EQ(error.kind, HarnessErrorKind::InvalidArgumentValue);
        EXPECT_EQ(error.value, value);
        EXPECT_EQ(error.describe(),
                  std::string("Invalid value '") + value + "' for argument -serialization-format");
    }
}
