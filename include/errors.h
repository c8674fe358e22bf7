#ifndef ERRORS_H
#define ERRORS_H

#include <stdexcept>
#include <string>

// Which stage stopped the compilation
enum class ErrorKind {
    LEX,
    PARSE,
    CODEGEN
};

std::string errorKindName(ErrorKind kind);

// Base of every error the pipeline raises. line/col are 1-based, 0 when unknown.
class CompileError : public std::runtime_error {
public:
    CompileError(ErrorKind k, const std::string& msg, int ln = 0, int cl = 0)
        : std::runtime_error(msg), kind(k), line(ln), col(cl) {}

    ErrorKind getKind() const { return kind; }
    int getLine() const { return line; }
    int getCol() const { return col; }

private:
    ErrorKind kind;
    int line;
    int col;
};

class LexError : public CompileError {
public:
    LexError(const std::string& msg, int ln, int cl)
        : CompileError(ErrorKind::LEX, msg, ln, cl) {}
};

class ParseError : public CompileError {
public:
    ParseError(const std::string& msg, int ln, int cl)
        : CompileError(ErrorKind::PARSE, msg, ln, cl) {}
};

class CodegenError : public CompileError {
public:
    CodegenError(const std::string& msg, int ln)
        : CompileError(ErrorKind::CODEGEN, msg, ln, 0) {}
};

#endif
