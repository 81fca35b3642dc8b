#include "cli/options.hpp"

#include "cli/flags.hpp"

#include <array>
#include <utility>

namespace lth::cli {

auto action_name(Action action) -> std::string_view {
    switch (action) {
    case Action::Deserialize:
        return "deserialize";
    case Action::IncrementalRoundTrip:
        return "deserialize-incremental";
    case Action::ClassifySyntaxColoring:
        return "classify-syntax";
    case Action::PrintTreeStructure:
        return "print-source";
    case Action::Help:
        return "help";
    }
    return "unknown";
}

auto select_action(const ArgumentStore& args) -> Result<Action, HarnessError> {
    static constexpr std::array<std::pair<std::string_view, Action>, 5> PRECEDENCE = {{
        {flags::DESERIALIZE_INCREMENTAL, Action::IncrementalRoundTrip},
        {flags::CLASSIFY_SYNTAX, Action::ClassifySyntaxColoring},
        {flags::DESERIALIZE, Action::Deserialize},
        {flags::PRINT_SOURCE, Action::PrintTreeStructure},
        {flags::HELP, Action::Help},
    }};

    for (const auto& [flag, action] : PRECEDENCE) {
        if (args.has(flag)) {
            return action;
        }
    }
    return HarnessError::no_action();
}

auto resolve_format(const ArgumentStore& args)
    -> Result<syntax::SerializationFormat, HarnessError> {
    auto value = args.get(flags::SERIALIZATION_FORMAT);
    if (!value || value->empty() || *value == "json") {
        return syntax::SerializationFormat::Json;
    }
    if (*value == "byteTree") {
        return syntax::SerializationFormat::ByteTree;
    }
    return HarnessError::invalid_value(std::string(flags::SERIALIZATION_FORMAT), *value);
}

} // namespace lth::cli
