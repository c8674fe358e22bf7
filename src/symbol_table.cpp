#include "symbol_table.h"

bool SymbolTable::contains(const std::string& name) const {
    return index.count(name) != 0;
}

bool SymbolTable::insert(const SymbolTableEntry& entry){
    if (contains(entry.getExternalName())) {
        return false;
    }
    index.emplace(entry.getExternalName(), ordered.size());
    ordered.push_back(entry);
    return true;
}

const SymbolTableEntry* SymbolTable::find(const std::string& name) const {
    auto it = index.find(name);
    if (it == index.end()) return nullptr;
    return &ordered[it->second];
}

void SymbolTable::clear(){
    ordered.clear();
    index.clear();
}
