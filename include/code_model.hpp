#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <cstdint>

namespace fs = std::filesystem;

// Languages the parse adapters understand. Everything else is Unknown.
enum class Language {
    Python,
    TypeScript,
    JavaScript,
    Unknown
};

// Map a file extension (with leading dot, any case) to a parseable language
Language languageFromExtension(const std::string& extension);

// Human readable language name for an extension, including non-parseable
// ones ("markdown", "json", ...). Returns "unknown" when unmapped.
std::string languageNameForExtension(const std::string& extension);

// Lower-case name of a parseable language
std::string languageToString(Language language);

// Keyword for function lines in outlines: "def " for Python, "function " otherwise
std::string declarationKeyword(Language language);

// True if the extension belongs to a language with a parse adapter
bool isParseableExtension(const std::string& extension);

// Extensions handled by the parse adapters, in resolver lookup order
const std::vector<std::string>& parseableExtensions();

struct FileDescriptor {
    fs::path path;                  // Absolute path
    std::string relativePath;       // Repo-relative, forward slashes
    std::string extension;          // Lower-case, with leading dot
    uintmax_t sizeBytes = 0;
    Language language = Language::Unknown;
    std::string languageName;       // Display name, covers non-parseable files
};

enum class SymbolKind {
    Function,
    Method,
    Class,
    Variable,
    Import
};

std::string symbolKindToString(SymbolKind kind);

struct Symbol {
    std::string name;
    SymbolKind kind = SymbolKind::Function;
    std::string signature;          // Raw parameter/type text, opaque
    uint32_t startLine = 1;         // 1-indexed, inclusive
    uint32_t endLine = 1;
    std::string docstring;
    std::string parent;             // Enclosing class, empty at module level
};

struct Import {
    std::string module;             // Module reference as written
    std::vector<std::string> items; // Named imports, empty for whole-module imports
    std::string alias;
    bool isRelative = false;
};

struct ParsedFile {
    Language language = Language::Unknown;
    std::vector<Symbol> symbols;
    std::vector<Import> imports;
    std::vector<std::string> exports;
};

// Names starting with an underscore are private by convention
bool isPrivateName(const std::string& name);

// "kind name signature" summary line, e.g. "function compute(x)"
std::string describeSymbol(const Symbol& symbol);
