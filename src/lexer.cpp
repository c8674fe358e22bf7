#include "lexer.h"
#include "errors.h"

#include <cctype>
#include <iomanip>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

static const std::unordered_map<std::string, TokenType> keywords = {
    {"main", TokenType::MAIN},
    {"if", TokenType::IF},
    {"reg", TokenType::REG},
    {"malloc", TokenType::MALLOC}
};

static const std::unordered_set<std::string> registerNames = {
    "A", "B", "C", "D", "E", "H", "L",
    "BC", "DE", "HL", "SP"
};

static const int MAX_HEX_DIGITS = 4;

static bool isIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

static std::string quoteChar(char c) {
    if (std::isprint(static_cast<unsigned char>(c))) {
        return "'" + std::string(1, c) + "'";
    }
    std::ostringstream oss;
    oss << "0x" << std::uppercase << std::hex << std::setw(2) << std::setfill('0')
        << static_cast<unsigned>(static_cast<unsigned char>(c));
    return oss.str();
}

std::vector<Token> tokenize(const std::string& source) {
    std::vector<Token> tokens;
    size_t i = 0;
    size_t lineStart = 0;
    int line = 1;

    while (i < source.size()) {
        char c = source[i];
        char next = (i + 1 < source.size()) ? source[i + 1] : '\0';
        int col = static_cast<int>(i - lineStart) + 1;

        if (std::isspace(static_cast<unsigned char>(c))) {
            if (c == '\n') {
                line++;
                lineStart = i + 1;
            }
            i++;
            continue;
        }

        // line comment
        if (c == '/' && next == '/') {
            while (i < source.size() && source[i] != '\n') i++;
            continue;
        }

        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
            size_t start = i;
            while (i < source.size() && isIdentChar(source[i])) i++;
            std::string word = source.substr(start, i - start);
            TokenType type = TokenType::IDENTIFIER;
            if (keywords.count(word)) {
                type = keywords.at(word);
            } else if (registerNames.count(word)) {
                type = TokenType::REGISTER;
            }
            tokens.emplace_back(type, word, line, col);
        }
        else if (std::isdigit(static_cast<unsigned char>(c))) {
            if (c != '0' || (next != 'x' && next != 'X')) {
                throw LexError("invalid number literal starting with " + quoteChar(c)
                               + ", use the 0x prefix for hex values", line, col);
            }
            size_t start = i;
            i += 2;
            while (i < source.size() && std::isxdigit(static_cast<unsigned char>(source[i]))) i++;
            std::string text = source.substr(start, i - start);
            int digits = static_cast<int>(text.size()) - 2;

            if (digits == 0) {
                throw LexError("malformed hex literal '" + text + "', expected digits after 0x", line, col);
            }
            if (digits > MAX_HEX_DIGITS) {
                throw LexError("malformed hex literal '" + text + "', at most "
                               + std::to_string(MAX_HEX_DIGITS) + " hex digits allowed", line, col);
            }
            if (i < source.size() && isIdentChar(source[i])) {
                throw LexError("malformed hex literal '" + text + source[i] + "'", line, col);
            }
            unsigned value = static_cast<unsigned>(std::stoul(text.substr(2), nullptr, 16));
            tokens.emplace_back(TokenType::HEX_LITERAL, text, line, col, value, digits);
        }
        else {
            switch (c) {
                case '=':
                    if (next == '=') {
                        tokens.emplace_back(TokenType::EQUAL, "==", line, col);
                        i += 2;
                    } else {
                        tokens.emplace_back(TokenType::ASSIGN, "=", line, col);
                        i++;
                    }
                    break;
                case '+':
                    if (next == '+') {
                        tokens.emplace_back(TokenType::INCREMENT, "++", line, col);
                        i += 2;
                    } else {
                        tokens.emplace_back(TokenType::PLUS, "+", line, col);
                        i++;
                    }
                    break;
                case '-':
                    if (next == '-') {
                        tokens.emplace_back(TokenType::DECREMENT, "--", line, col);
                        i += 2;
                    } else {
                        tokens.emplace_back(TokenType::MINUS, "-", line, col);
                        i++;
                    }
                    break;
                case '<': tokens.emplace_back(TokenType::LT, "<", line, col); i++; break;
                case '>': tokens.emplace_back(TokenType::GT, ">", line, col); i++; break;
                case '&': tokens.emplace_back(TokenType::AMP, "&", line, col); i++; break;
                case '|': tokens.emplace_back(TokenType::PIPE, "|", line, col); i++; break;
                case '^': tokens.emplace_back(TokenType::CARET, "^", line, col); i++; break;
                case '{': tokens.emplace_back(TokenType::LBRACE, "{", line, col); i++; break;
                case '}': tokens.emplace_back(TokenType::RBRACE, "}", line, col); i++; break;
                case '(': tokens.emplace_back(TokenType::LPAREN, "(", line, col); i++; break;
                case ')': tokens.emplace_back(TokenType::RPAREN, ")", line, col); i++; break;
                case ';': tokens.emplace_back(TokenType::SEMICOLON, ";", line, col); i++; break;
                default:
                    throw LexError("unrecognized character " + quoteChar(c), line, col);
            }
        }
    }

    tokens.emplace_back(TokenType::END_OF_FILE, "", line, static_cast<int>(i - lineStart) + 1);
    return tokens;
}

std::string describe(const Token& token) {
    if (token.type == TokenType::END_OF_FILE) {
        return "end of file";
    }
    return "'" + token.lexeme + "'";
}
