#ifndef AST_H
#define AST_H

#include <cstdint>
#include <string>
#include <vector>

enum class Register { A, B, C, D, E, H, L, BC, DE, HL, SP };

// BYTE: A B C D E H L, WORD: register pairs
enum class Width { BYTE, WORD };

Width widthOf(Register reg);
std::string registerName(Register reg);
bool lookupRegister(const std::string& name, Register& out);

enum class BinaryOperator { ADD, SUB, AND, OR, XOR };
enum class Comparator { LESS, GREATER, EQUAL };
enum class Direction { INCREMENT, DECREMENT };

// Condition operand: a declared variable or a raw 8-bit register
struct Operand {
    enum Kind { VARIABLE, REGISTER };

    Kind kind = VARIABLE;
    std::string name;
    Register reg = Register::A;     // REGISTER only

    static Operand variable(const std::string& name);
    static Operand registerOperand(Register reg);
};

enum class StatementKind {
    VARIABLE_ASSIGNMENT,    // name = 0x05;
    REGISTER_ASSIGNMENT,    // reg D = 0xAA;
    BINARY_OP,              // A + B;
    POINTER_OP,             // HL++;
    MALLOC_ASSIGNMENT,      // reg HL = malloc(0x6000);
    CONDITIONAL             // if (x < y) { ... }
};

// Tagged node. Only the fields of the active kind are meaningful.
struct Statement {
    StatementKind kind = StatementKind::VARIABLE_ASSIGNMENT;
    int line = 0;

    std::string name;                       // VARIABLE_ASSIGNMENT
    Register reg = Register::A;             // target register, pair, or binary left operand
    Register rightReg = Register::B;        // BINARY_OP
    uint16_t value = 0;                     // literal, or malloc address
    BinaryOperator op = BinaryOperator::ADD;
    Direction direction = Direction::INCREMENT;

    Operand left;                           // CONDITIONAL
    Comparator comparator = Comparator::EQUAL;
    Operand right;
    std::vector<Statement> body;

    static Statement variableAssignment(const std::string& name, uint16_t value, int line = 0);
    static Statement registerAssignment(Register reg, uint16_t value, int line = 0);
    static Statement binaryOp(Register left, BinaryOperator op, Register right, int line = 0);
    static Statement pointerOp(Register pair, Direction direction, int line = 0);
    static Statement mallocAssignment(Register pair, uint16_t address, int line = 0);
    static Statement conditional(const Operand& left, Comparator comparator, const Operand& right,
                                 const std::vector<Statement>& body, int line = 0);
};

struct Program {
    std::vector<Statement> statements;
};

#endif
