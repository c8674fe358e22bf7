#ifndef PARSER_H
#define PARSER_H

#include "ast.h"
#include "lexer.h"

#include <set>
#include <string>
#include <vector>

// Recursive-descent parser for one main{} block. Throws ParseError.
class Parser {
public:
    explicit Parser(const std::vector<Token>& tokens);

    Program parse();

private:
    // grammar productions
    void statements(std::vector<Statement>& out);
    Statement statement();
    Statement varStmt();
    Statement regStmt();
    Statement registerStmt();
    Statement ifStmt();
    Operand operand();
    Comparator comparator();

    uint16_t literal(Width width, const std::string& context);

    const Token& current() const;
    const Token& advance();
    bool check(TokenType type) const;
    const Token& expect(TokenType type, const std::string& what);

    [[noreturn]] void processError(const std::string& err) const;
    [[noreturn]] void processError(const std::string& err, const Token& at) const;

    std::vector<Token> tokens;
    size_t pos;
    std::set<std::string> declared;     // variable names seen so far
};

Program parse(const std::vector<Token>& tokens);

#endif
