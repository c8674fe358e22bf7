#include "errors.h"

std::string errorKindName(ErrorKind kind){
    switch (kind) {
        case ErrorKind::LEX:
            return "LexError";
        case ErrorKind::PARSE:
            return "ParseError";
        case ErrorKind::CODEGEN:
            return "CodegenError";
    }
    return "CompileError";
}
