#include "compiler.h"
#include "codegen.h"
#include "lexer.h"
#include "parser.h"

#include <sstream>

CompileResult compile(const std::string& source){
    CompileResult result;
    try {
        std::vector<Token> tokens = tokenize(source);
        Program program = parse(tokens);

        CodeGenerator generator;
        std::vector<std::string> lines = generator.generate(program);

        result.lines = lines;
        result.symbols = generator.getSymbolTable();
        result.ok = true;
    } catch (const CompileError& e) {
        result = CompileResult();
        result.errorKind = e.getKind();
        result.errorMessage = e.what();
        result.errorLine = e.getLine();
        result.errorCol = e.getCol();
    }
    return result;
}

std::string formatError(const CompileResult& result){
    std::ostringstream oss;
    oss << errorKindName(result.errorKind) << ": " << result.errorMessage;
    if (result.errorLine > 0) {
        oss << " on line " << result.errorLine;
        if (result.errorCol > 0) {
            oss << ", column " << result.errorCol;
        }
    }
    return oss.str();
}

std::string joinLines(const std::vector<std::string>& lines){
    std::string out;
    for (const std::string& line : lines) {
        out += line;
        out += "\n";
    }
    return out;
}
