/*
parser.cpp
- Recursive descent over the token list produced by tokenize()
- One method per grammar production, each leaves pos on the first token it did not consume
- Register widths and literal ranges are checked here so the code generator only sees valid trees
- Variable names are recorded as they are declared; conditions may only name earlier declarations
*/

#include "parser.h"
#include "errors.h"

#include <sstream>

Parser::Parser(const std::vector<Token>& toks) : tokens(toks), pos(0) {
    if (tokens.empty() || tokens.back().type != TokenType::END_OF_FILE) {
        int line = tokens.empty() ? 1 : tokens.back().line;
        tokens.emplace_back(TokenType::END_OF_FILE, "", line, 0);
    }
}

/* ------------------------------------------------------
    Methods implementing grammar prods
    ------------------------------------------------------ */

Program Parser::parse(){    // prod 1: program := 'main' '{' statements '}' EOF
    if (!check(TokenType::MAIN)) {
        processError("keyword \"main\" expected");
    }
    advance();
    expect(TokenType::LBRACE, "'{' after \"main\"");

    Program program;
    statements(program.statements);
    expect(TokenType::RBRACE, "'}' to close \"main\"");

    if (check(TokenType::MAIN)) {
        processError("duplicate \"main\" block, only one is allowed", current());
    }
    if (!check(TokenType::END_OF_FILE)) {
        processError("no text may follow the \"main\" block");
    }
    return program;
}

void Parser::statements(std::vector<Statement>& out){     // prod 2
    while (!check(TokenType::RBRACE) && !check(TokenType::END_OF_FILE)) {
        out.push_back(statement());
    }
}

Statement Parser::statement(){     // prod 3
    switch (current().type) {
        case TokenType::IDENTIFIER:
            return varStmt();
        case TokenType::REG:
            return regStmt();
        case TokenType::REGISTER:
            return registerStmt();
        case TokenType::IF:
            return ifStmt();
        default:
            processError("statement expected");
    }
}

Statement Parser::varStmt(){       // prod 4: IDENT '=' HEX ';'
    const Token nameTok = advance();

    if (declared.count(nameTok.lexeme)) {
        processError("symbol " + nameTok.lexeme + " is multiply defined", nameTok);
    }
    if (!check(TokenType::ASSIGN)) {
        if (check(TokenType::INCREMENT) || check(TokenType::DECREMENT)) {
            processError("unknown register pair '" + nameTok.lexeme + "'", nameTok);
        }
        processError("'=' expected after variable " + nameTok.lexeme);
    }
    advance();

    uint16_t value = literal(Width::BYTE, "variable " + nameTok.lexeme);
    expect(TokenType::SEMICOLON, "';'");

    declared.insert(nameTok.lexeme);
    return Statement::variableAssignment(nameTok.lexeme, value, nameTok.line);
}

Statement Parser::regStmt(){       // prod 5: 'reg' REG '=' (HEX | 'malloc' '(' HEX ')') ';'
    const Token regKw = advance();

    if (check(TokenType::IDENTIFIER)) {
        processError("unknown register '" + current().lexeme + "'", current());
    }
    const Token regTok = expect(TokenType::REGISTER, "register name after \"reg\"");
    Register reg = Register::A;
    lookupRegister(regTok.lexeme, reg);

    expect(TokenType::ASSIGN, "'=' after register " + regTok.lexeme);

    Statement stmt;
    if (check(TokenType::MALLOC)) {
        if (widthOf(reg) != Width::WORD) {
            processError("malloc() requires a 16-bit register pair, got " + regTok.lexeme, regTok);
        }
        advance();
        expect(TokenType::LPAREN, "'(' after \"malloc\"");
        uint16_t address = literal(Width::WORD, "malloc()");
        expect(TokenType::RPAREN, "')' to close malloc()");
        stmt = Statement::mallocAssignment(reg, address, regKw.line);
    }
    else if (check(TokenType::HEX_LITERAL)) {
        uint16_t value = literal(widthOf(reg), "register " + regTok.lexeme);
        stmt = Statement::registerAssignment(reg, value, regKw.line);
    }
    else {
        processError("hex value or malloc() expected after '='");
    }

    expect(TokenType::SEMICOLON, "';'");
    return stmt;
}

Statement Parser::registerStmt(){  // prod 6: PAIR ('++'|'--') ';'  |  'A' binop 'B' ';'
    const Token regTok = advance();
    Register reg = Register::A;
    lookupRegister(regTok.lexeme, reg);

    Statement stmt;
    if (check(TokenType::INCREMENT) || check(TokenType::DECREMENT)) {
        Direction dir = check(TokenType::INCREMENT) ? Direction::INCREMENT : Direction::DECREMENT;
        if (widthOf(reg) != Width::WORD) {
            processError("increment/decrement requires a 16-bit register pair, got " + regTok.lexeme, regTok);
        }
        advance();
        stmt = Statement::pointerOp(reg, dir, regTok.line);
    }
    else if (check(TokenType::PLUS) || check(TokenType::MINUS) || check(TokenType::AMP)
             || check(TokenType::PIPE) || check(TokenType::CARET)) {
        BinaryOperator op = BinaryOperator::ADD;
        switch (current().type) {
            case TokenType::MINUS: op = BinaryOperator::SUB; break;
            case TokenType::AMP:   op = BinaryOperator::AND; break;
            case TokenType::PIPE:  op = BinaryOperator::OR;  break;
            case TokenType::CARET: op = BinaryOperator::XOR; break;
            default:               op = BinaryOperator::ADD; break;
        }
        if (widthOf(reg) != Width::BYTE) {
            processError("binary operation requires 8-bit registers, got " + regTok.lexeme, regTok);
        }
        if (reg != Register::A) {
            processError("left operand of a binary operation must be the accumulator A, got "
                         + regTok.lexeme, regTok);
        }
        advance();

        if (check(TokenType::IDENTIFIER)) {
            processError("unknown register '" + current().lexeme + "'", current());
        }
        const Token rightTok = expect(TokenType::REGISTER, "register B as second operand");
        Register right = Register::B;
        lookupRegister(rightTok.lexeme, right);
        if (right != Register::B) {
            processError("second operand must be register B, got " + rightTok.lexeme, rightTok);
        }
        stmt = Statement::binaryOp(reg, op, right, regTok.line);
    }
    else if (check(TokenType::ASSIGN)) {
        processError("register name " + regTok.lexeme + " cannot be used as a variable, write \"reg "
                     + regTok.lexeme + " = ...\"", regTok);
    }
    else {
        processError("'++', '--' or binary operator expected after register " + regTok.lexeme);
    }

    expect(TokenType::SEMICOLON, "';'");
    return stmt;
}

Statement Parser::ifStmt(){        // prod 7: 'if' '(' operand cmp operand ')' '{' statements '}'
    const Token ifTok = advance();

    expect(TokenType::LPAREN, "'(' after \"if\"");
    Operand left = operand();
    Comparator cmp = comparator();
    Operand right = operand();
    expect(TokenType::RPAREN, "')' after condition");
    expect(TokenType::LBRACE, "'{' after condition");

    std::vector<Statement> body;
    statements(body);
    expect(TokenType::RBRACE, "'}' to close \"if\" block");

    return Statement::conditional(left, cmp, right, body, ifTok.line);
}

Operand Parser::operand(){         // prod 8: IDENT | REG
    if (check(TokenType::IDENTIFIER)) {
        const Token& tok = current();
        if (!declared.count(tok.lexeme)) {
            processError("reference to undeclared variable: " + tok.lexeme, tok);
        }
        advance();
        return Operand::variable(tok.lexeme);
    }
    if (check(TokenType::REGISTER)) {
        const Token& tok = current();
        Register reg = Register::A;
        lookupRegister(tok.lexeme, reg);
        if (widthOf(reg) != Width::BYTE) {
            processError("register pair " + tok.lexeme + " cannot be compared, 8-bit register expected", tok);
        }
        advance();
        return Operand::registerOperand(reg);
    }
    processError("register or variable name expected in condition");
}

Comparator Parser::comparator(){   // prod 9: '<' | '>' | '=='
    switch (current().type) {
        case TokenType::LT:
            advance();
            return Comparator::LESS;
        case TokenType::GT:
            advance();
            return Comparator::GREATER;
        case TokenType::EQUAL:
            advance();
            return Comparator::EQUAL;
        default:
            processError("comparison '<', '>' or '==' expected");
    }
}

/* ------------------------------------------------------
    Helpers
    ------------------------------------------------------ */

uint16_t Parser::literal(Width width, const std::string& context){
    const Token tok = expect(TokenType::HEX_LITERAL, "hex value for " + context);
    unsigned max = (width == Width::BYTE) ? 0xFF : 0xFFFF;

    if (tok.value > max) {
        std::ostringstream oss;
        oss << (width == Width::BYTE ? "8-bit" : "16-bit") << " value " << tok.lexeme
            << " for " << context << " exceeds maximum (0x" << std::uppercase << std::hex << max << ")";
        processError(oss.str(), tok);
    }
    // three or four digits make a word literal, whatever its value
    if (width == Width::BYTE && tok.digits > 2) {
        processError("word literal " + tok.lexeme + " cannot be stored in 8-bit " + context, tok);
    }
    return static_cast<uint16_t>(tok.value);
}

const Token& Parser::current() const {
    return tokens[pos];
}

const Token& Parser::advance(){
    const Token& tok = tokens[pos];
    if (pos + 1 < tokens.size()) {
        ++pos;
    }
    return tok;
}

bool Parser::check(TokenType type) const {
    return current().type == type;
}

const Token& Parser::expect(TokenType type, const std::string& what){
    if (!check(type)) {
        processError(what + " expected");
    }
    return advance();
}

void Parser::processError(const std::string& err) const {
    processError(err + ", found " + describe(current()), current());
}

void Parser::processError(const std::string& err, const Token& at) const {
    throw ParseError(err, at.line, at.col);
}

/////////////////////////////////////////////////////////////////////////////

Program parse(const std::vector<Token>& tokens){
    Parser parser(tokens);
    return parser.parse();
}
