#ifndef LEXER_H
#define LEXER_H

#include <string>
#include <vector>

enum class TokenType {
    MAIN, IF, REG, MALLOC,
    IDENTIFIER, REGISTER, HEX_LITERAL,
    ASSIGN, EQUAL, LT, GT,
    PLUS, MINUS, AMP, PIPE, CARET,
    INCREMENT, DECREMENT,
    LBRACE, RBRACE, LPAREN, RPAREN, SEMICOLON,
    END_OF_FILE
};

struct Token {
    TokenType type;
    std::string lexeme;
    int line;
    int col;
    unsigned value;     // HEX_LITERAL only
    int digits;         // hex digits written after 0x

    Token(TokenType t, const std::string& l, int ln, int cl, unsigned v = 0, int d = 0)
        : type(t), lexeme(l), line(ln), col(cl), value(v), digits(d) {}
};

// Throws LexError on the first character that cannot start a token.
// The returned sequence always ends with an END_OF_FILE token.
std::vector<Token> tokenize(const std::string& source);

// "'{'" style spelling of a token for error messages
std::string describe(const Token& token);

#endif
