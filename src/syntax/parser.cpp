#include "syntax/parser.hpp"

#include "log/log.hpp"
#include "syntax/deserializer.hpp"
#include "syntax/process.hpp"

#include <fstream>

namespace lth::syntax {

auto SyntaxTreeParser::resolve_compiler(const std::optional<std::string>& compiler)
    -> Result<std::string, SyntaxError> {
    if (compiler && !compiler->empty()) {
        return *compiler;
    }
    auto found = find_in_path(DEFAULT_COMPILER_NAME);
    if (!found) {
        return SyntaxError::make(std::string("unable to find '") + DEFAULT_COMPILER_NAME +
                                 "' on PATH; pass -swiftc <path>");
    }
    LTH_LOG_INFO("parser", "Using " << *found << " from PATH");
    return *found;
}

auto SyntaxTreeParser::parse(const std::string& source_path,
                             const std::optional<std::string>& compiler)
    -> Result<RawSyntaxPtr, SyntaxError> {
    if (!std::ifstream(source_path, std::ios::binary).is_open()) {
        return SyntaxError::make("cannot read source file '" + source_path + "'");
    }

    auto exe = resolve_compiler(compiler);
    if (is_err(exe)) {
        return unwrap_err(exe);
    }
    const std::string& exe_path = unwrap(exe);

    LTH_LOG_DEBUG("parser", "Running " << exe_path << " -frontend -emit-syntax " << source_path);
    auto run = run_process(exe_path, {"-frontend", "-emit-syntax", source_path});
    if (is_err(run)) {
        return SyntaxError::make("failed to run '" + exe_path + "': " + unwrap_err(run).message);
    }

    const auto& process = unwrap(run);
    if (process.exit_code != 0) {
        std::string message = "'" + exe_path + "' failed to parse '" + source_path +
                              "' (exit code " + std::to_string(process.exit_code) + ")";
        if (!process.stderr_output.empty()) {
            message += ":\n" + process.stderr_output;
        }
        return SyntaxError::make(std::move(message));
    }

    SyntaxTreeDeserializer session;
    auto tree = session.deserialize(process.stdout_output, SerializationFormat::Json);
    if (is_err(tree)) {
        return SyntaxError::make("'" + exe_path + "' produced an unreadable syntax tree: " +
                                 unwrap_err(tree).message);
    }
    return tree;
}

} // namespace lth::syntax
