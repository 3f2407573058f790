#pragma once

#include <string>

#include "syntax_validator.h"

namespace exec_kernel {

/// CPython's own parser, run in-process.
///
/// The source is compiled to an AST only (the equivalent of ast.parse), so
/// nothing is executed and no bytecode is produced. The first call starts an
/// embedded interpreter unless the library already lives inside one, as it
/// does when loaded through the Python bindings. Calls are serialized on the
/// GIL. Throws std::runtime_error when the interpreter cannot be started.
class PythonParser {
public:
    static SyntaxCheck parse(const std::string& code);

    /// Version of the interpreter doing the parsing, e.g. "3.11.7".
    static std::string version();
};

} // namespace exec_kernel
