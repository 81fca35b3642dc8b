#include "cli/utils.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

namespace lth::cli {

auto read_file_bytes(const std::string& path) -> Result<std::string, HarnessError> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return HarnessError::file_access(
            path, "Cannot read file '" + path + "': " + std::strerror(errno));
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return HarnessError::file_access(path, "Error while reading file '" + path + "'");
    }
    return buffer.str();
}

auto write_file(const std::string& path, const std::string& content)
    -> Result<bool, HarnessError> {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return HarnessError::file_access(
            path, "Cannot write file '" + path + "': " + std::strerror(errno));
    }
    file << content;
    file.flush();
    if (!file) {
        return HarnessError::file_access(path, "Error while writing file '" + path + "'");
    }
    return true;
}

auto usage_text() -> std::string {
    std::ostringstream oss;
    oss << "Utility to test syntax tree deserialization and classification.\n"
        << "\n"
        << "Actions (must specify one):\n"
        << "  -deserialize\n"
        << "        Deserialize a full pre-edit syntax tree (-pre-edit-tree) and write\n"
        << "        the source representation of the syntax tree to an out file (-out).\n"
        << "  -deserialize-incremental\n"
        << "        Deserialize a full pre-edit syntax tree (-pre-edit-tree), parse an\n"
        << "        incrementally transferred post-edit syntax tree (-incr-tree) and\n"
        << "        write the source representation of the post-edit syntax tree to an\n"
        << "        out file (-out).\n"
        << "  -classify-syntax\n"
        << "        Parse the given source file (-source-file) and output it with\n"
        << "        tokens classified for syntax colouring.\n"
        << "  -print-source\n"
        << "        Parse the given source file (-source-file) and print its syntax\n"
        << "        tree structure, one <KindSyntax> tag pair per node.\n"
        << "  -help\n"
        << "        Print this help message\n"
        << "\n"
        << "Arguments:\n"
        << "  -source-file FILENAME\n"
        << "        The path to a Swift source file to parse\n"
        << "  -pre-edit-tree FILENAME\n"
        << "        The path to a serialized pre-edit syntax tree\n"
        << "  -incr-tree FILENAME\n"
        << "        The path to a serialized incrementally transferred post-edit\n"
        << "        syntax tree\n"
        << "  -serialization-format {json,byteTree} [default: json]\n"
        << "        The format that shall be used to deserialize the syntax tree.\n"
        << "        Defaults to json.\n"
        << "  -out FILENAME\n"
        << "        The file to which the source representation of the post-edit syntax\n"
        << "        tree shall be written.\n"
        << "  -swiftc FILENAME\n"
        << "        If specified, the path to the swiftc executable to parse the file.\n"
        << "        If not specified, swiftc will be looked up from PATH.\n"
        << "\n"
        << "Logging (written to stderr, never to stdout):\n"
        << "  -log-level {trace,debug,info,warn,error,fatal,off} [default: warn]\n"
        << "  -log-filter SPEC        Per-module levels, e.g. parser=debug,*=warn\n"
        << "  -log-file FILENAME      Also append log records to FILENAME\n"
        << "  -log-format {text,json} [default: text]\n"
        << "  -v, -vv, -vvv           Log at info, debug or trace level\n"
        << "  -q                      Log errors only\n"
        << "  The LTH_LOG environment variable (a level or a filter spec) is used\n"
        << "  when no level or filter is given on the command line.\n";
    return oss.str();
}

} // namespace lth::cli
