#include "context_compressor.hpp"
#include "parse_adapter.hpp"
#include "repository_scanner.hpp"
#include <sstream>
#include <stdexcept>
#include <system_error>

CompressionMode compressionModeFromString(const std::string& value) {
    if (value == "full") return CompressionMode::Full;
    if (value == "signatures") return CompressionMode::Signatures;
    if (value == "smart") return CompressionMode::Smart;
    throw std::invalid_argument("Unknown compression mode: " + value);
}

std::string compressionModeToString(CompressionMode mode) {
    switch (mode) {
        case CompressionMode::Full:
            return "full";
        case CompressionMode::Signatures:
            return "signatures";
        case CompressionMode::Smart:
        default:
            return "smart";
    }
}

ContextCompressor::ContextCompressor(const fs::path& root, const CompressorOptions& options)
    : root_(root),
      options_(options) {
    if (options_.charsPerToken == 0) {
        options_.charsPerToken = 1;
    }
}

size_t ContextCompressor::estimateTokens(const std::string& text) const {
    return text.size() / options_.charsPerToken;
}

CompressionResult ContextCompressor::compress(const std::vector<std::string>& files, CompressionMode mode,
                                              size_t tokenBudget) const {
    CompressionResult result;
    result.mode = mode;

    std::vector<std::string> sections;
    size_t runningTokens = 0;

    for (const auto& file : files) {
        if (tokenBudget > 0 && runningTokens >= tokenBudget) {
            result.omittedFiles.push_back(file);
            continue;
        }

        std::string section = renderFile(file, mode);
        runningTokens += estimateTokens(section);
        sections.push_back(std::move(section));
        result.filesIncluded.push_back(file);
    }

    std::ostringstream ss;
    for (size_t i = 0; i < sections.size(); ++i) {
        if (i > 0) {
            ss << "\n";
        }
        ss << sections[i];
    }

    result.content = ss.str();
    result.estimatedTokens = estimateTokens(result.content);
    return result;
}

std::string ContextCompressor::renderFile(const std::string& relativePath, CompressionMode mode) const {
    const fs::path relative = fs::path(relativePath).lexically_normal();
    const fs::path fullPath = root_ / relative;

    std::error_code ec;
    const bool insideRoot = !relative.empty() && *relative.begin() != ".." && !relative.is_absolute();
    if (!insideRoot || !fs::is_regular_file(fullPath, ec)) {
        return "### " + relativePath + " (not found)\n";
    }

    std::string content;
    try {
        content = readFile(fullPath);
    } catch (const std::exception& e) {
        return "### " + relativePath + " (error: " + e.what() + ")\n";
    }

    if (mode == CompressionMode::Signatures ||
        (mode == CompressionMode::Smart && countLines(content) > options_.smartLineThreshold)) {
        return renderSignatures(relativePath);
    }

    std::ostringstream ss;
    ss << "### " << relativePath << "\n";
    ss << "```\n";
    ss << content;
    if (!content.empty() && content.back() != '\n') {
        ss << "\n";
    }
    ss << "```\n";
    return ss.str();
}

std::string ContextCompressor::renderSignatures(const std::string& relativePath) const {
    std::optional<ParsedFile> parsed = parseFile(root_ / relativePath);
    if (!parsed) {
        return "### " + relativePath + " (could not parse)\n";
    }

    const std::string keyword = declarationKeyword(parsed->language);

    std::ostringstream ss;
    ss << "### " << relativePath << " (signatures only)\n";

    for (const auto& symbol : parsed->symbols) {
        const std::string indent = symbol.parent.empty() ? "" : "    ";

        if (symbol.kind == SymbolKind::Class) {
            ss << indent << "class " << symbol.name << ":\n";
        } else if (symbol.kind == SymbolKind::Function || symbol.kind == SymbolKind::Method) {
            ss << indent << keyword << symbol.name << symbol.signature << "\n";
        }
    }

    return ss.str();
}
