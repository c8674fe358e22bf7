/*
codegen.cpp
- Single walk over the tree, appending one string per instruction or label
- Static variables go through the accumulator: MVI A, STA, then MOV into their register
- The first free register in ALLOCATION_ORDER is taken, skipping registers loaded by "reg"
- Every if gets its own SKIP_n label, numbered in source order
*/

#include "codegen.h"
#include "errors.h"

#include <iomanip>
#include <sstream>
#include <utility>

static std::string hexDigits(unsigned value, int width){
    std::ostringstream oss;
    oss << std::uppercase << std::hex << std::setw(width) << std::setfill('0') << value << "H";
    return oss.str();
}

std::string hexByte(unsigned value){
    return hexDigits(value & 0xFF, 2);
}

std::string hexWord(unsigned value){
    return hexDigits(value & 0xFFFF, 4);
}

static Comparator mirror(Comparator cmp){
    switch (cmp) {
        case Comparator::LESS:
            return Comparator::GREATER;
        case Comparator::GREATER:
            return Comparator::LESS;
        case Comparator::EQUAL:
            return Comparator::EQUAL;
    }
    return cmp;
}

std::vector<std::string> CodeGenerator::generate(const Program& program){
    symbolTable.clear();
    state = AllocatorState();
    lines.clear();

    for (const Statement& stmt : program.statements) {
        code(stmt);
    }
    return lines;
}

void CodeGenerator::code(const Statement& stmt){
    switch (stmt.kind) {
        case StatementKind::VARIABLE_ASSIGNMENT:
            emitVariableCode(stmt);
            break;
        case StatementKind::REGISTER_ASSIGNMENT:
            emitRegisterCode(stmt);
            break;
        case StatementKind::BINARY_OP:
            emitBinaryOpCode(stmt);
            break;
        case StatementKind::POINTER_OP:
            emitPointerCode(stmt);
            break;
        case StatementKind::MALLOC_ASSIGNMENT:
            emitMallocCode(stmt);
            break;
        case StatementKind::CONDITIONAL:
            emitConditionalCode(stmt);
            break;
    }
}

/* ------------------------------------------------------
    Emit funcs
    ------------------------------------------------------ */

void CodeGenerator::emitVariableCode(const Statement& stmt){   // name = 0xNN;
    if (symbolTable.contains(stmt.name)) {
        processError("symbol " + stmt.name + " is multiply defined", stmt.line);
    }
    if (stmt.value > 0xFF) {
        processError("static variable " + stmt.name + " does not fit in 8 bits", stmt.line);
    }

    Register reg = allocateRegister(stmt);
    uint16_t address = state.nextAddress++;

    emit("MVI", "A," + hexByte(stmt.value));
    emit("STA", hexWord(address));
    // the accumulator already holds the value
    if (reg != Register::A) {
        emit("MOV", registerName(reg) + ",A");
    }

    symbolTable.insert(SymbolTableEntry(stmt.name, reg, address));
}

void CodeGenerator::emitRegisterCode(const Statement& stmt){   // reg r = 0xNN;
    if (widthOf(stmt.reg) == Width::WORD) {
        emit("LXI", registerName(stmt.reg) + "," + hexWord(stmt.value));
    } else {
        if (stmt.value > 0xFF) {
            processError("value does not fit in register " + registerName(stmt.reg), stmt.line);
        }
        emit("MVI", registerName(stmt.reg) + "," + hexByte(stmt.value));
    }
    claim(stmt.reg);
}

void CodeGenerator::emitBinaryOpCode(const Statement& stmt){   // A op B;
    if (stmt.reg != Register::A || stmt.rightReg != Register::B) {
        processError("binary operation must be of the form A op B", stmt.line);
    }

    std::string mnemonic;
    switch (stmt.op) {
        case BinaryOperator::ADD: mnemonic = "ADD"; break;
        case BinaryOperator::SUB: mnemonic = "SUB"; break;
        case BinaryOperator::AND: mnemonic = "ANA"; break;
        case BinaryOperator::OR:  mnemonic = "ORA"; break;
        case BinaryOperator::XOR: mnemonic = "XRA"; break;
    }
    emit(mnemonic, registerName(stmt.rightReg));
}

void CodeGenerator::emitPointerCode(const Statement& stmt){    // rp++; rp--;
    if (widthOf(stmt.reg) != Width::WORD) {
        processError("increment/decrement requires a register pair, got " + registerName(stmt.reg), stmt.line);
    }
    emit(stmt.direction == Direction::INCREMENT ? "INX" : "DCX", registerName(stmt.reg));
}

void CodeGenerator::emitMallocCode(const Statement& stmt){     // reg rp = malloc(0xNNNN);
    if (widthOf(stmt.reg) != Width::WORD) {
        processError("malloc() requires a register pair, got " + registerName(stmt.reg), stmt.line);
    }
    emit("LXI", registerName(stmt.reg) + "," + hexWord(stmt.value));
    claim(stmt.reg);
}

void CodeGenerator::emitConditionalCode(const Statement& stmt){    // if (l cmp r) { body }
    Register left = resolve(stmt.left, stmt.line);
    Register right = resolve(stmt.right, stmt.line);
    Comparator cmp = stmt.comparator;

    // Loading the left side into A would overwrite a right side held in A
    if (right == Register::A && left != Register::A) {
        std::swap(left, right);
        cmp = mirror(cmp);
    }

    std::string skip = getLabel();

    if (left != Register::A) {
        emit("MOV", "A," + registerName(left));
    }
    emit("CMP", registerName(right));

    switch (cmp) {
        case Comparator::LESS:          // skip unless A < r
            emit("JZ", skip);
            emit("JNC", skip);
            break;
        case Comparator::GREATER:       // skip unless A > r
            emit("JZ", skip);
            emit("JC", skip);
            break;
        case Comparator::EQUAL:
            emit("JNZ", skip);
            break;
    }

    for (const Statement& inner : stmt.body) {
        code(inner);
    }
    emitLabel(skip);
}

void CodeGenerator::emit(const std::string& instruction, const std::string& operands){
    if (operands.empty()) {
        lines.push_back(instruction + ";");
    } else {
        lines.push_back(instruction + " " + operands + ";");
    }
}

void CodeGenerator::emitLabel(const std::string& label){
    lines.push_back(label + ":");
}

/* ------------------------------------------------------
    Allocation
    ------------------------------------------------------ */

Register CodeGenerator::allocateRegister(const Statement& stmt){
    for (Register reg : ALLOCATION_ORDER) {
        if (!state.allocated.count(reg) && !state.claimed.count(reg)) {
            state.allocated.insert(reg);
            return reg;
        }
    }
    processError("no free register left for static variable " + stmt.name
                 + " (at most 7 registers, minus those loaded by \"reg\")", stmt.line);
}

void CodeGenerator::claim(Register reg){
    switch (reg) {
        case Register::BC:
            state.claimed.insert(Register::B);
            state.claimed.insert(Register::C);
            break;
        case Register::DE:
            state.claimed.insert(Register::D);
            state.claimed.insert(Register::E);
            break;
        case Register::HL:
            state.claimed.insert(Register::H);
            state.claimed.insert(Register::L);
            break;
        case Register::SP:
            break;
        default:
            state.claimed.insert(reg);
    }
}

Register CodeGenerator::resolve(const Operand& operand, int line) const {
    if (operand.kind == Operand::REGISTER) {
        if (widthOf(operand.reg) != Width::BYTE) {
            processError("register pair " + registerName(operand.reg) + " cannot be compared", line);
        }
        return operand.reg;
    }

    const SymbolTableEntry* entry = symbolTable.find(operand.name);
    if (entry == nullptr) {
        processError("operand " + operand.name + " does not resolve to a register", line);
    }
    return entry->getRegister();
}

std::string CodeGenerator::getLabel(){
    std::ostringstream oss;
    oss << SKIP_LABEL_PREFIX << state.nextLabel++;
    return oss.str();
}

void CodeGenerator::processError(const std::string& err, int line) const {
    throw CodegenError(err, line);
}

/////////////////////////////////////////////////////////////////////////////

std::vector<std::string> generate(const Program& program){
    CodeGenerator generator;
    return generator.generate(program);
}
