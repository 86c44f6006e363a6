#include "parse_adapter.hpp"
#include <algorithm>
#include <cctype>

namespace {

std::string stripStringLiteral(const std::string& literal) {
    // Drop string prefixes such as r, b, u, f
    size_t start = 0;
    while (start < literal.size() && std::isalpha(static_cast<unsigned char>(literal[start]))) {
        ++start;
    }

    std::string value = literal.substr(start);

    const auto isQuote = [](char c) { return c == '"' || c == '\''; };
    while (!value.empty() && isQuote(value.front())) {
        value.erase(0, 1);
    }
    while (!value.empty() && isQuote(value.back())) {
        value.pop_back();
    }

    const auto notSpace = [](unsigned char ch) { return !std::isspace(ch); };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), notSpace));
    value.erase(std::find_if(value.rbegin(), value.rend(), notSpace).base(), value.end());
    return value;
}

// First statement of the body when it is a bare string expression
std::string extractDocstring(TSNode definition, const std::string& source) {
    TSNode body = childByField(definition, "body");
    if (ts_node_is_null(body)) {
        return "";
    }

    const uint32_t count = ts_node_named_child_count(body);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode statement = ts_node_named_child(body, i);
        const std::string type = nodeType(statement);
        if (type == "comment") {
            continue;
        }
        if (type != "expression_statement" || ts_node_named_child_count(statement) == 0) {
            return "";
        }

        TSNode expression = ts_node_named_child(statement, 0);
        if (nodeType(expression) != "string") {
            return "";
        }
        return stripStringLiteral(nodeText(expression, source));
    }

    return "";
}

Symbol makeFunction(TSNode node, const std::string& source, const std::string& parentName) {
    TSNode nameNode = childByField(node, "name");
    TSNode paramsNode = childByField(node, "parameters");
    TSNode returnNode = childByField(node, "return_type");

    Symbol symbol;
    symbol.name = ts_node_is_null(nameNode) ? "unknown" : nodeText(nameNode, source);
    symbol.kind = parentName.empty() ? SymbolKind::Function : SymbolKind::Method;
    symbol.signature = ts_node_is_null(paramsNode) ? "()" : nodeText(paramsNode, source);
    if (!ts_node_is_null(returnNode)) {
        symbol.signature += " -> " + nodeText(returnNode, source);
    }
    symbol.startLine = nodeStartLine(node);
    symbol.endLine = nodeEndLine(node);
    symbol.docstring = extractDocstring(node, source);
    symbol.parent = parentName;
    return symbol;
}

void addImportStatement(TSNode node, const std::string& source, ParsedFile& result) {
    // import a.b, c as d
    const uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_named_child(node, i);
        const std::string type = nodeType(child);

        Import imp;
        if (type == "dotted_name") {
            imp.module = nodeText(child, source);
        } else if (type == "aliased_import") {
            imp.module = nodeText(childByField(child, "name"), source);
            imp.alias = nodeText(childByField(child, "alias"), source);
        } else {
            continue;
        }
        result.imports.push_back(imp);
    }
}

void addImportFromStatement(TSNode node, const std::string& source, ParsedFile& result) {
    // from ..pkg.mod import a, b as c
    TSNode moduleNode = childByField(node, "module_name");

    Import imp;
    imp.module = nodeText(moduleNode, source);
    imp.isRelative = !imp.module.empty() && imp.module[0] == '.';

    const uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_named_child(node, i);
        if (!ts_node_is_null(moduleNode) && ts_node_eq(child, moduleNode)) {
            continue;
        }

        const std::string type = nodeType(child);
        if (type == "dotted_name" || type == "aliased_import" || type == "identifier") {
            imp.items.push_back(nodeText(child, source));
        } else if (type == "wildcard_import") {
            imp.items.push_back("*");
        }
    }

    if (!imp.module.empty() || !imp.items.empty()) {
        result.imports.push_back(imp);
    }
}

void visit(TSNode node, const std::string& source, const std::string& parentName, ParsedFile& result) {
    const std::string type = nodeType(node);

    if (type == "function_definition") {
        // Nested functions are part of the body, not separate symbols
        result.symbols.push_back(makeFunction(node, source, parentName));
        return;
    }

    if (type == "class_definition") {
        TSNode nameNode = childByField(node, "name");
        TSNode basesNode = childByField(node, "superclasses");

        Symbol symbol;
        symbol.name = ts_node_is_null(nameNode) ? "unknown" : nodeText(nameNode, source);
        symbol.kind = SymbolKind::Class;
        symbol.signature = nodeText(basesNode, source);
        symbol.startLine = nodeStartLine(node);
        symbol.endLine = nodeEndLine(node);
        symbol.docstring = extractDocstring(node, source);
        symbol.parent = parentName;
        result.symbols.push_back(symbol);

        TSNode body = childByField(node, "body");
        if (!ts_node_is_null(body)) {
            const uint32_t count = ts_node_named_child_count(body);
            for (uint32_t i = 0; i < count; ++i) {
                visit(ts_node_named_child(body, i), source, symbol.name, result);
            }
        }
        return;
    }

    if (type == "import_statement") {
        addImportStatement(node, source, result);
        return;
    }

    if (type == "import_from_statement") {
        addImportFromStatement(node, source, result);
        return;
    }

    const uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        visit(ts_node_named_child(node, i), source, parentName, result);
    }
}

} // namespace

std::vector<std::string> PythonAdapter::extensions() const {
    return {".py", ".pyw"};
}

const TSLanguage* PythonAdapter::grammar() const {
    return tree_sitter_python();
}

void PythonAdapter::extract(TSNode root, const std::string& source, ParsedFile& result) const {
    visit(root, source, "", result);
}
