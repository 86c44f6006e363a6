#include "parse_adapter.hpp"
#include "repository_scanner.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <iostream>
#include <limits>

// Tree-sitter helpers

TreeSitterTreePtr parseSource(const TSLanguage* language, const std::string& source) {
    if (!language || source.size() > std::numeric_limits<uint32_t>::max()) {
        return nullptr;
    }

    TreeSitterParserPtr parser(ts_parser_new());
    if (!parser) {
        return nullptr;
    }

    // Fails when the grammar was built for an incompatible ABI version
    if (!ts_parser_set_language(parser.get(), language)) {
        std::cerr << "Warning: tree-sitter grammar version is not supported by the runtime" << std::endl;
        return nullptr;
    }

    return TreeSitterTreePtr(ts_parser_parse_string(
        parser.get(),
        nullptr,
        source.c_str(),
        static_cast<uint32_t>(source.size())));
}

std::string nodeText(TSNode node, const std::string& source) {
    if (ts_node_is_null(node)) {
        return "";
    }

    const uint32_t start = ts_node_start_byte(node);
    const uint32_t end = ts_node_end_byte(node);
    if (start >= source.size() || end <= start) {
        return "";
    }

    return source.substr(start, std::min<size_t>(end, source.size()) - start);
}

std::string nodeType(TSNode node) {
    if (ts_node_is_null(node)) {
        return "";
    }
    return ts_node_type(node);
}

TSNode childByField(TSNode node, const char* fieldName) {
    return ts_node_child_by_field_name(node, fieldName, static_cast<uint32_t>(std::strlen(fieldName)));
}

uint32_t nodeStartLine(TSNode node) {
    return ts_node_start_point(node).row + 1;
}

uint32_t nodeEndLine(TSNode node) {
    return std::max(nodeStartLine(node), ts_node_end_point(node).row + 1);
}

// ParseAdapter

std::optional<ParsedFile> ParseAdapter::parse(const std::string& source) const {
    TreeSitterTreePtr tree = parseSource(grammar(), source);
    if (!tree) {
        return std::nullopt;
    }

    // Anything the grammar could not make sense of rejects the whole file
    TSNode root = ts_tree_root_node(tree.get());
    if (ts_node_is_null(root) || ts_node_has_error(root)) {
        return std::nullopt;
    }

    ParsedFile result;
    result.language = language();

    try {
        extract(root, source, result);
    } catch (const std::exception& e) {
        std::cerr << "Warning: Symbol extraction failed: " << e.what() << std::endl;
        return std::nullopt;
    }

    for (const auto& symbol : result.symbols) {
        if (!isPrivateName(symbol.name)) {
            result.exports.push_back(symbol.name);
        }
    }

    return result;
}

// Registry

ParserRegistry::ParserRegistry() {
    adapters_.push_back(std::make_unique<PythonAdapter>());
    adapters_.push_back(std::make_unique<TypeScriptAdapter>(false));
    adapters_.push_back(std::make_unique<TypeScriptAdapter>(true));
    adapters_.push_back(std::make_unique<JavaScriptAdapter>());

    for (const auto& adapter : adapters_) {
        for (const auto& extension : adapter->extensions()) {
            byExtension_[extension] = adapter.get();
        }
        // First adapter registered for a language is its primary one
        byLanguage_.emplace(adapter->language(), adapter.get());
    }
}

const ParserRegistry& ParserRegistry::instance() {
    static const ParserRegistry registry;
    return registry;
}

const ParseAdapter* ParserRegistry::adapterFor(Language language) const {
    auto it = byLanguage_.find(language);
    return it != byLanguage_.end() ? it->second : nullptr;
}

const ParseAdapter* ParserRegistry::adapterForExtension(const std::string& extension) const {
    std::string ext = extension;
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = byExtension_.find(ext);
    return it != byExtension_.end() ? it->second : nullptr;
}

std::optional<ParsedFile> parseFile(const fs::path& filePath) {
    const ParseAdapter* adapter = ParserRegistry::instance().adapterForExtension(filePath.extension().string());
    if (!adapter) {
        return std::nullopt;
    }

    std::string content;
    try {
        content = readFile(filePath);
    } catch (const std::exception&) {
        return std::nullopt;
    }

    return adapter->parse(content);
}
