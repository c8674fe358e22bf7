#include "ast.h"

#include <map>

static const std::map<std::string, Register> registers = {
    {"A", Register::A}, {"B", Register::B}, {"C", Register::C}, {"D", Register::D},
    {"E", Register::E}, {"H", Register::H}, {"L", Register::L},
    {"BC", Register::BC}, {"DE", Register::DE}, {"HL", Register::HL}, {"SP", Register::SP}
};

Width widthOf(Register reg){
    switch (reg) {
        case Register::BC:
        case Register::DE:
        case Register::HL:
        case Register::SP:
            return Width::WORD;
        default:
            return Width::BYTE;
    }
}

std::string registerName(Register reg){
    for (const auto& pair : registers) {
        if (pair.second == reg) return pair.first;
    }
    return "?";
}

bool lookupRegister(const std::string& name, Register& out){
    auto it = registers.find(name);
    if (it == registers.end()) return false;
    out = it->second;
    return true;
}

/* ------------------------------------------------------
    Node constructors
    ------------------------------------------------------ */

Operand Operand::variable(const std::string& name){
    Operand o;
    o.kind = VARIABLE;
    o.name = name;
    return o;
}

Operand Operand::registerOperand(Register reg){
    Operand o;
    o.kind = REGISTER;
    o.name = registerName(reg);
    o.reg = reg;
    return o;
}

Statement Statement::variableAssignment(const std::string& name, uint16_t value, int line){
    Statement s;
    s.kind = StatementKind::VARIABLE_ASSIGNMENT;
    s.name = name;
    s.value = value;
    s.line = line;
    return s;
}

Statement Statement::registerAssignment(Register reg, uint16_t value, int line){
    Statement s;
    s.kind = StatementKind::REGISTER_ASSIGNMENT;
    s.reg = reg;
    s.value = value;
    s.line = line;
    return s;
}

Statement Statement::binaryOp(Register left, BinaryOperator op, Register right, int line){
    Statement s;
    s.kind = StatementKind::BINARY_OP;
    s.reg = left;
    s.op = op;
    s.rightReg = right;
    s.line = line;
    return s;
}

Statement Statement::pointerOp(Register pair, Direction direction, int line){
    Statement s;
    s.kind = StatementKind::POINTER_OP;
    s.reg = pair;
    s.direction = direction;
    s.line = line;
    return s;
}

Statement Statement::mallocAssignment(Register pair, uint16_t address, int line){
    Statement s;
    s.kind = StatementKind::MALLOC_ASSIGNMENT;
    s.reg = pair;
    s.value = address;
    s.line = line;
    return s;
}

Statement Statement::conditional(const Operand& left, Comparator comparator, const Operand& right,
                                 const std::vector<Statement>& body, int line){
    Statement s;
    s.kind = StatementKind::CONDITIONAL;
    s.left = left;
    s.comparator = comparator;
    s.right = right;
    s.body = body;
    s.line = line;
    return s;
}
