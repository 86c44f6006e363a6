#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <tree_sitter/api.h>

// Grammar entry points exported by the tree-sitter language libraries
extern "C" {
const TSLanguage* tree_sitter_python();
const TSLanguage* tree_sitter_typescript();
const TSLanguage* tree_sitter_tsx();
const TSLanguage* tree_sitter_javascript();
}

struct TreeSitterParserDeleter {
    void operator()(TSParser* parser) const {
        if (parser) {
            ts_parser_delete(parser);
        }
    }
};

struct TreeSitterTreeDeleter {
    void operator()(TSTree* tree) const {
        if (tree) {
            ts_tree_delete(tree);
        }
    }
};

using TreeSitterParserPtr = std::unique_ptr<TSParser, TreeSitterParserDeleter>;
using TreeSitterTreePtr = std::unique_ptr<TSTree, TreeSitterTreeDeleter>;

// Parse source with a fresh parser. Returns nullptr if the grammar can't be
// loaded or parsing fails outright.
TreeSitterTreePtr parseSource(const TSLanguage* language, const std::string& source);

// Source text covered by a node
std::string nodeText(TSNode node, const std::string& source);

// Node type as a std::string ("function_definition", "class_body", ...)
std::string nodeType(TSNode node);

// Child for a grammar field name; check the result with ts_node_is_null
TSNode childByField(TSNode node, const char* fieldName);

// 1-indexed first and last line of a node, taken from its source span
uint32_t nodeStartLine(TSNode node);
uint32_t nodeEndLine(TSNode node);
