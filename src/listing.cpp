#include "listing.h"
#include "codegen.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

std::string getTime() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    const std::tm* local = std::localtime(&now);
    if (local == nullptr) {
        return std::string();
    }
    char buf[64];
    if (std::strftime(buf, sizeof(buf), "%c", local)) {
        return std::string(buf);
    }
    return std::string();
}

void Listing::createListingHeader(const std::string& sourceName, const std::string& timeStr){
    listingFile << "C85C:\t" << sourceName << "\t\t" << timeStr << "\n\n";
    listingFile << std::left << "LINE NO."
                << std::setw(23 - std::string("LINE NO.").length()) << " "
                << "SOURCE STATEMENT\n";
    listingFile << "\n";
}

void Listing::listSource(const std::string& source, const CompileResult& result){
    std::istringstream in(source);
    std::string text;
    int lineNo = 0;
    bool errorListed = false;

    while (std::getline(in, text)) {
        ++lineNo;
        listingFile << std::right << std::setw(5) << lineNo << "|" << text << "\n";

        if (!result.ok && result.errorLine == lineNo) {
            listingFile << "\n" << "Error: Line " << lineNo << ": "
                        << errorKindName(result.errorKind) << ": " << result.errorMessage << "\n\n";
            errorListed = true;
        }
    }

    // errors without a usable position go after the last line
    if (!result.ok && !errorListed) {
        listingFile << "\n" << "Error: " << errorKindName(result.errorKind) << ": " << result.errorMessage << "\n\n";
    }
}

void Listing::listSymbols(const SymbolTable& symbols){
    if (symbols.size() == 0) return;

    listingFile << "\n" << std::left
                << std::setw(16) << "SYMBOL"
                << std::setw(10) << "REGISTER"
                << "ADDRESS\n";
    for (const SymbolTableEntry& entry : symbols.entries()) {
        listingFile << std::left
                    << std::setw(16) << entry.getExternalName()
                    << std::setw(10) << registerName(entry.getRegister())
                    << hexWord(entry.getAddress()) << "\n";
    }
}

void Listing::createListingTrailer(int errorCount){
    std::string errorWord = (errorCount == 1) ? "ERROR" : "ERRORS";
    listingFile << "\n" << "COMPILATION TERMINATED\t\t"
                << errorCount << " " << errorWord << " ENCOUNTERED"
                << std::endl;
}

void Listing::write(const std::string& sourceName, const std::string& source,
                    const CompileResult& result, const std::string& timeStr){
    createListingHeader(sourceName, timeStr);
    listSource(source, result);
    if (result.ok) {
        listSymbols(result.symbols);
    }
    createListingTrailer(result.ok ? 0 : 1);
}
