#ifndef COMPILER_H
#define COMPILER_H

#include "errors.h"
#include "symbol_table.h"

#include <string>
#include <vector>

struct CompileResult {
    bool ok = false;
    std::vector<std::string> lines;     // empty unless ok
    SymbolTable symbols;

    // set when !ok
    ErrorKind errorKind = ErrorKind::LEX;
    std::string errorMessage;
    int errorLine = 0;
    int errorCol = 0;
};

// Runs lex, parse and code generation on one source text.
// Errors from any stage end up in the result, never thrown.
CompileResult compile(const std::string& source);

// "LexError: unrecognized character '$' on line 3, column 7"
std::string formatError(const CompileResult& result);

// One line per instruction, each newline terminated
std::string joinLines(const std::vector<std::string>& lines);

#endif
