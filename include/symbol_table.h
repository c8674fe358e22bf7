#ifndef SYMBOL_TABLE_H
#define SYMBOL_TABLE_H

#include "ast.h"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

class SymbolTableEntry {
public:
    SymbolTableEntry(const std::string& name, Register reg, uint16_t address)
        : externalName(name), reg(reg), address(address) {}

    const std::string& getExternalName() const { return externalName; }
    Register getRegister() const { return reg; }
    uint16_t getAddress() const { return address; }

private:
    std::string externalName;
    Register reg;
    uint16_t address;
};

// Static variables in declaration order
class SymbolTable {
public:
    bool contains(const std::string& name) const;

    // false if the name is already present; the table is left unchanged
    bool insert(const SymbolTableEntry& entry);

    const SymbolTableEntry* find(const std::string& name) const;
    const std::vector<SymbolTableEntry>& entries() const { return ordered; }
    size_t size() const { return ordered.size(); }
    void clear();

private:
    std::vector<SymbolTableEntry> ordered;
    std::unordered_map<std::string, size_t> index;
};

#endif
