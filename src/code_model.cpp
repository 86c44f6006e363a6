#include "code_model.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// Display names for every extension the scanner reports on
const std::unordered_map<std::string, std::string>& languageNames() {
    static const std::unordered_map<std::string, std::string> names = {
        {".py", "python"},
        {".pyw", "python"},
        {".ts", "typescript"},
        {".tsx", "typescript"},
        {".js", "javascript"},
        {".jsx", "javascript"},
        {".mjs", "javascript"},
        {".cjs", "javascript"},
        {".json", "json"},
        {".yaml", "yaml"},
        {".yml", "yaml"},
        {".md", "markdown"},
        {".txt", "text"},
        {".html", "html"},
        {".css", "css"},
        {".scss", "scss"},
        {".sql", "sql"},
        {".sh", "shell"},
        {".bash", "shell"},
        {".toml", "toml"},
        {".ini", "ini"},
        {".cfg", "ini"},
        {".xml", "xml"},
        {".go", "go"},
        {".rs", "rust"},
        {".java", "java"},
        {".c", "c"},
        {".cpp", "cpp"},
        {".h", "c"},
        {".hpp", "cpp"}
    };
    return names;
}

} // namespace

Language languageFromExtension(const std::string& extension) {
    const std::string ext = toLower(extension);

    if (ext == ".py" || ext == ".pyw") return Language::Python;
    if (ext == ".ts" || ext == ".tsx") return Language::TypeScript;
    if (ext == ".js" || ext == ".jsx" || ext == ".mjs" || ext == ".cjs") return Language::JavaScript;

    return Language::Unknown;
}

std::string languageNameForExtension(const std::string& extension) {
    const auto& names = languageNames();
    auto it = names.find(toLower(extension));
    return it != names.end() ? it->second : "unknown";
}

std::string languageToString(Language language) {
    switch (language) {
        case Language::Python:
            return "python";
        case Language::TypeScript:
            return "typescript";
        case Language::JavaScript:
            return "javascript";
        case Language::Unknown:
        default:
            return "unknown";
    }
}

std::string declarationKeyword(Language language) {
    return language == Language::Python ? "def " : "function ";
}

bool isParseableExtension(const std::string& extension) {
    return languageFromExtension(extension) != Language::Unknown;
}

const std::vector<std::string>& parseableExtensions() {
    static const std::vector<std::string> extensions = {
        ".py", ".ts", ".tsx", ".js", ".jsx", ".mjs", ".cjs", ".pyw"
    };
    return extensions;
}

std::string symbolKindToString(SymbolKind kind) {
    switch (kind) {
        case SymbolKind::Function:
            return "function";
        case SymbolKind::Method:
            return "method";
        case SymbolKind::Class:
            return "class";
        case SymbolKind::Variable:
            return "variable";
        case SymbolKind::Import:
        default:
            return "import";
    }
}

bool isPrivateName(const std::string& name) {
    return !name.empty() && name[0] == '_';
}

std::string describeSymbol(const Symbol& symbol) {
    return symbolKindToString(symbol.kind) + " " + symbol.name + symbol.signature;
}
