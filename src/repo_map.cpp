#include "repo_map.hpp"
#include <map>
#include <vector>

namespace {

constexpr size_t CLASS_DOC_LENGTH = 100;
constexpr size_t FUNCTION_DOC_LENGTH = 80;

std::string joinItems(const std::vector<std::string>& items, size_t limit) {
    std::string joined;
    for (size_t i = 0; i < items.size() && i < limit; ++i) {
        if (i > 0) {
            joined += ", ";
        }
        joined += items[i];
    }
    return joined;
}

std::string docLine(const std::string& indent, const std::string& docstring, size_t length) {
    std::string text = docstring.substr(0, length);
    for (auto& c : text) {
        if (c == '\n' || c == '\r') {
            c = ' ';
        }
    }
    return indent + "\"\"\"" + text + "...\"\"\"";
}

std::string directoryOf(const std::string& relativePath) {
    const size_t slash = relativePath.rfind('/');
    return slash == std::string::npos ? "" : relativePath.substr(0, slash);
}

std::string fileNameOf(const std::string& relativePath) {
    const size_t slash = relativePath.rfind('/');
    return slash == std::string::npos ? relativePath : relativePath.substr(slash + 1);
}

std::string truncateMap(const std::vector<std::string>& lines, size_t maxTokens) {
    std::string result;
    size_t tokens = 0;

    for (const auto& line : lines) {
        const size_t lineTokens = line.size() / 4 + 1;
        if (tokens + lineTokens > maxTokens) {
            result += "... (truncated)";
            return result;
        }
        result += line;
        result += "\n";
        tokens += lineTokens;
    }

    return result;
}

} // namespace

std::string generateRepoMap(const SymbolIndex& index, const std::string& projectName,
                            const RepoMapOptions& options) {
    std::vector<std::string> lines;
    lines.push_back("# Repository Map: " + projectName);
    lines.push_back("");

    std::map<std::string, std::vector<std::string>> filesByDir;
    for (const auto& [file, symbols] : index.symbolsByFile) {
        filesByDir[directoryOf(file)].push_back(file);
    }

    for (const auto& [dir, files] : filesByDir) {
        lines.push_back(dir.empty() ? "## ./" : "## " + dir + "/");
        lines.push_back("");

        for (const auto& file : files) {
            lines.push_back("### " + fileNameOf(file));

            auto importsIt = index.importsByFile.find(file);
            if (importsIt != index.importsByFile.end() && !importsIt->second.empty()) {
                std::string imports;
                const auto& fileImports = importsIt->second;
                for (size_t i = 0; i < fileImports.size() && i < options.maxImportsPerFile; ++i) {
                    if (i > 0) {
                        imports += ", ";
                    }
                    const Import& imp = fileImports[i];
                    if (imp.items.empty()) {
                        imports += imp.module;
                    } else {
                        imports += "{" + joinItems(imp.items, options.maxItemsPerImport) + "} from " + imp.module;
                    }
                }
                lines.push_back("  imports: " + imports);
            }

            const auto& symbols = index.symbolsByFile.at(file);
            auto languageIt = index.fileLanguages.find(file);
            const std::string keyword = declarationKeyword(
                languageIt != index.fileLanguages.end() ? languageIt->second : Language::Unknown);

            for (const auto& cls : symbols) {
                if (cls.kind != SymbolKind::Class) {
                    continue;
                }

                // Python superclass lists already carry their parentheses
                std::string bases = cls.signature;
                if (!bases.empty() && bases.front() != '(') {
                    bases = "(" + bases + ")";
                }
                lines.push_back("  class " + cls.name + bases + ":");
                if (options.includeDocstrings && !cls.docstring.empty()) {
                    lines.push_back(docLine("    ", cls.docstring, CLASS_DOC_LENGTH));
                }

                for (const auto& method : symbols) {
                    if (method.kind == SymbolKind::Method && method.parent == cls.name) {
                        lines.push_back("    " + keyword + method.name + method.signature);
                    }
                }
            }

            for (const auto& func : symbols) {
                if (func.kind != SymbolKind::Function) {
                    continue;
                }
                lines.push_back("  " + keyword + func.name + func.signature);
                if (options.includeDocstrings && !func.docstring.empty()) {
                    lines.push_back(docLine("    ", func.docstring, FUNCTION_DOC_LENGTH));
                }
            }

            lines.push_back("");
        }
    }

    std::string result;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            result += "\n";
        }
        result += lines[i];
    }

    if (result.size() / 4 > options.maxTokens) {
        return truncateMap(lines, options.maxTokens);
    }

    return result;
}
