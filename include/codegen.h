#ifndef CODEGEN_H
#define CODEGEN_H

#include "ast.h"
#include "symbol_table.h"

#include <cstdint>
#include <set>
#include <string>
#include <vector>

const uint16_t STATIC_BASE_ADDRESS = 0x8000;
const char* const SKIP_LABEL_PREFIX = "SKIP_";

// Order in which declared variables take registers
const Register ALLOCATION_ORDER[] = {
    Register::A, Register::B, Register::C, Register::D,
    Register::E, Register::H, Register::L
};

// Mutable state of one code generation pass
struct AllocatorState {
    uint16_t nextAddress = STATIC_BASE_ADDRESS;
    unsigned nextLabel = 0;
    std::set<Register> allocated;   // held by a declared variable
    std::set<Register> claimed;     // loaded by an explicit reg statement
};

// Emits 8085 assembly for a parsed program. Throws CodegenError.
class CodeGenerator {
public:
    // Each call starts from a fresh allocator and symbol table
    std::vector<std::string> generate(const Program& program);

    const SymbolTable& getSymbolTable() const { return symbolTable; }
    const AllocatorState& getAllocatorState() const { return state; }

private:
    void code(const Statement& stmt);

    void emitVariableCode(const Statement& stmt);
    void emitRegisterCode(const Statement& stmt);
    void emitBinaryOpCode(const Statement& stmt);
    void emitPointerCode(const Statement& stmt);
    void emitMallocCode(const Statement& stmt);
    void emitConditionalCode(const Statement& stmt);

    void emit(const std::string& instruction, const std::string& operands = "");
    void emitLabel(const std::string& label);

    Register allocateRegister(const Statement& stmt);
    void claim(Register reg);
    Register resolve(const Operand& operand, int line) const;
    std::string getLabel();

    [[noreturn]] void processError(const std::string& err, int line) const;

    SymbolTable symbolTable;
    AllocatorState state;
    std::vector<std::string> lines;
};

std::vector<std::string> generate(const Program& program);

// 0xAA -> "AAH", 0x8000 -> "8000H"
std::string hexByte(unsigned value);
std::string hexWord(unsigned value);

#endif
