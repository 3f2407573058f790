#pragma once

#include <string>

namespace exec_kernel {

struct SyntaxCheck {
    bool valid = true;
    std::string message;
    int line = 0;    // 1-based, 0 if unknown
    int column = 0;  // 1-based, 0 if unknown

    static SyntaxCheck ok() { return {}; }
    static SyntaxCheck error(std::string message, int line, int column);

    /// "Syntax error at line N: <message>"
    std::string describe() const;
};

/// Structural check of source code for one interpreted language.
/// Implementations never execute the code and never spawn anything.
class SyntaxValidator {
public:
    virtual ~SyntaxValidator() = default;

    virtual SyntaxCheck check(const std::string& code) const = 0;
    virtual std::string language() const = 0;
};

/// Validator for Python 3 source.
///
/// A tokenizing pass first rejects unterminated strings, unbalanced or
/// mismatched brackets, bad indentation (including inconsistent tabs and
/// spaces), missing blocks and ':' on compound statements, stray
/// continuation characters and nesting deeper than `max_nesting`. Source
/// that passes is parsed to an AST by CPython (see PythonParser), so grammar
/// errors such as "x = = 1" or "1 = x" are caught too. Throws
/// std::runtime_error when the embedded interpreter cannot be started.
class PythonSyntaxValidator : public SyntaxValidator {
public:
    explicit PythonSyntaxValidator(int max_nesting = 200);

    SyntaxCheck check(const std::string& code) const override;
    std::string language() const override { return "python"; }

private:
    int max_nesting_;
};

} // namespace exec_kernel
