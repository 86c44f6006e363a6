#include "parse_adapter.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace {

std::string stripQuotes(const std::string& literal) {
    std::string value = literal;
    const auto isQuote = [](char c) { return c == '"' || c == '\'' || c == '`'; };
    while (!value.empty() && isQuote(value.front())) {
        value.erase(0, 1);
    }
    while (!value.empty() && isQuote(value.back())) {
        value.pop_back();
    }
    return value;
}

bool isRelativeModule(const std::string& module) {
    return module == "." || module == ".." ||
           module.compare(0, 2, "./") == 0 || module.compare(0, 3, "../") == 0;
}

// Text of a /** ... */ block without the comment markers and leading stars
std::string cleanJsDoc(const std::string& comment) {
    std::string body = comment.substr(3, comment.size() >= 5 ? comment.size() - 5 : 0);

    std::istringstream iss(body);
    std::string line;
    std::string result;

    while (std::getline(iss, line)) {
        size_t start = line.find_first_not_of(" \t*");
        if (start == std::string::npos) {
            continue;
        }
        size_t end = line.find_last_not_of(" \t\r");
        if (!result.empty()) {
            result += '\n';
        }
        result += line.substr(start, end - start + 1);
    }

    return result;
}

// JSDoc comment directly above a declaration (or above its export statement)
std::string extractJsDoc(TSNode node, const std::string& source) {
    TSNode anchor = node;
    TSNode parent = ts_node_parent(node);
    if (!ts_node_is_null(parent) && nodeType(parent) == "export_statement") {
        anchor = parent;
    }

    TSNode previous = ts_node_prev_named_sibling(anchor);
    if (ts_node_is_null(previous) || nodeType(previous) != "comment") {
        return "";
    }

    const std::string text = nodeText(previous, source);
    if (text.compare(0, 3, "/**") != 0 || text.size() < 5) {
        return "";
    }
    return cleanJsDoc(text);
}

bool isFunctionValue(const std::string& type) {
    return type == "arrow_function" || type == "function_expression" ||
           type == "function" || type == "generator_function";
}

// Parameter list plus TypeScript return annotation
std::string functionSignature(TSNode function, const std::string& source) {
    std::string signature;

    TSNode params = childByField(function, "parameters");
    if (!ts_node_is_null(params)) {
        signature = nodeText(params, source);
    } else {
        // Single unparenthesized arrow parameter
        TSNode single = childByField(function, "parameter");
        signature = ts_node_is_null(single) ? "()" : "(" + nodeText(single, source) + ")";
    }

    TSNode returnType = childByField(function, "return_type");
    if (!ts_node_is_null(returnType)) {
        signature += nodeText(returnType, source);
    }

    return signature;
}

Symbol makeFunction(const std::string& name, TSNode function, TSNode extent,
                    const std::string& source, const std::string& parentName) {
    Symbol symbol;
    symbol.name = name;
    symbol.kind = parentName.empty() ? SymbolKind::Function : SymbolKind::Method;
    symbol.signature = functionSignature(function, source);
    symbol.startLine = nodeStartLine(extent);
    symbol.endLine = nodeEndLine(extent);
    symbol.docstring = extractJsDoc(extent, source);
    symbol.parent = parentName;
    return symbol;
}

void addImportClause(TSNode clause, const std::string& source, Import& imp) {
    const uint32_t count = ts_node_named_child_count(clause);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_named_child(clause, i);
        const std::string type = nodeType(child);

        if (type == "identifier") {
            // Default import
            imp.items.push_back(nodeText(child, source));
        } else if (type == "named_imports") {
            const uint32_t specifiers = ts_node_named_child_count(child);
            for (uint32_t j = 0; j < specifiers; ++j) {
                TSNode specifier = ts_node_named_child(child, j);
                if (nodeType(specifier) != "import_specifier") {
                    continue;
                }
                imp.items.push_back(nodeText(childByField(specifier, "name"), source));
            }
        } else if (type == "namespace_import") {
            // import * as ns from 'm'
            if (ts_node_named_child_count(child) > 0) {
                imp.alias = nodeText(ts_node_named_child(child, 0), source);
            }
        }
    }
}

void addImportStatement(TSNode node, const std::string& source, ParsedFile& result) {
    TSNode sourceNode = childByField(node, "source");
    if (ts_node_is_null(sourceNode)) {
        return;
    }

    Import imp;
    imp.module = stripQuotes(nodeText(sourceNode, source));
    imp.isRelative = isRelativeModule(imp.module);

    const uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_named_child(node, i);
        if (nodeType(child) == "import_clause") {
            addImportClause(child, source, imp);
        }
    }

    if (!imp.module.empty()) {
        result.imports.push_back(imp);
    }
}

// export { a, b } from './m' and export * from './m'
void addReExport(TSNode node, TSNode sourceNode, const std::string& source, ParsedFile& result) {
    Import imp;
    imp.module = stripQuotes(nodeText(sourceNode, source));
    imp.isRelative = isRelativeModule(imp.module);

    const uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_named_child(node, i);
        if (nodeType(child) != "export_clause") {
            continue;
        }
        const uint32_t specifiers = ts_node_named_child_count(child);
        for (uint32_t j = 0; j < specifiers; ++j) {
            TSNode specifier = ts_node_named_child(child, j);
            if (nodeType(specifier) == "export_specifier") {
                imp.items.push_back(nodeText(childByField(specifier, "name"), source));
            }
        }
    }

    if (!imp.module.empty()) {
        result.imports.push_back(imp);
    }
}

// const x = require('./m')
bool addRequireCall(TSNode node, const std::string& source, ParsedFile& result) {
    TSNode function = childByField(node, "function");
    if (nodeType(function) != "identifier" || nodeText(function, source) != "require") {
        return false;
    }

    TSNode arguments = childByField(node, "arguments");
    if (ts_node_is_null(arguments) || ts_node_named_child_count(arguments) == 0) {
        return false;
    }

    TSNode first = ts_node_named_child(arguments, 0);
    if (nodeType(first) != "string") {
        return false;
    }

    Import imp;
    imp.module = stripQuotes(nodeText(first, source));
    imp.isRelative = isRelativeModule(imp.module);
    result.imports.push_back(imp);
    return true;
}

void visit(TSNode node, const std::string& source, const std::string& parentName, ParsedFile& result);

void visitChildren(TSNode node, const std::string& source, const std::string& parentName, ParsedFile& result) {
    const uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        visit(ts_node_named_child(node, i), source, parentName, result);
    }
}

// let/const/var declarations binding a function value become functions
void visitDeclaration(TSNode node, const std::string& source, const std::string& parentName, ParsedFile& result) {
    const uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode declarator = ts_node_named_child(node, i);
        if (nodeType(declarator) != "variable_declarator") {
            visit(declarator, source, parentName, result);
            continue;
        }

        TSNode nameNode = childByField(declarator, "name");
        TSNode value = childByField(declarator, "value");

        if (!ts_node_is_null(value) && isFunctionValue(nodeType(value)) &&
            nodeType(nameNode) == "identifier") {
            result.symbols.push_back(makeFunction(nodeText(nameNode, source), value, node, source, parentName));
            continue;
        }

        if (!ts_node_is_null(value)) {
            visit(value, source, parentName, result);
        }
    }
}

// Class fields holding arrow functions behave like methods
void visitField(TSNode node, const std::string& source, const std::string& parentName, ParsedFile& result) {
    TSNode nameNode = childByField(node, "name");
    if (ts_node_is_null(nameNode)) {
        nameNode = childByField(node, "property");
    }
    TSNode value = childByField(node, "value");

    if (!ts_node_is_null(nameNode) && !ts_node_is_null(value) && isFunctionValue(nodeType(value))) {
        result.symbols.push_back(makeFunction(nodeText(nameNode, source), value, node, source, parentName));
    }
}

void visit(TSNode node, const std::string& source, const std::string& parentName, ParsedFile& result) {
    const std::string type = nodeType(node);

    if (type == "function_declaration" || type == "generator_function_declaration" ||
        type == "method_definition") {
        TSNode nameNode = childByField(node, "name");
        const std::string name = ts_node_is_null(nameNode) ? "anonymous" : nodeText(nameNode, source);
        result.symbols.push_back(makeFunction(name, node, node, source, parentName));
        return;
    }

    if (type == "class_declaration" || type == "abstract_class_declaration") {
        TSNode nameNode = childByField(node, "name");

        Symbol symbol;
        symbol.name = ts_node_is_null(nameNode) ? "anonymous" : nodeText(nameNode, source);
        symbol.kind = SymbolKind::Class;
        symbol.startLine = nodeStartLine(node);
        symbol.endLine = nodeEndLine(node);
        symbol.docstring = extractJsDoc(node, source);
        symbol.parent = parentName;

        const uint32_t count = ts_node_named_child_count(node);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode child = ts_node_named_child(node, i);
            if (nodeType(child) == "class_heritage") {
                symbol.signature = nodeText(child, source);
            }
        }
        result.symbols.push_back(symbol);

        TSNode body = childByField(node, "body");
        if (!ts_node_is_null(body)) {
            const uint32_t members = ts_node_named_child_count(body);
            for (uint32_t i = 0; i < members; ++i) {
                TSNode member = ts_node_named_child(body, i);
                const std::string memberType = nodeType(member);
                if (memberType == "public_field_definition" || memberType == "field_definition") {
                    visitField(member, source, symbol.name, result);
                } else {
                    visit(member, source, symbol.name, result);
                }
            }
        }
        return;
    }

    if (type == "import_statement") {
        addImportStatement(node, source, result);
        return;
    }

    if (type == "export_statement") {
        TSNode sourceNode = childByField(node, "source");
        if (!ts_node_is_null(sourceNode)) {
            addReExport(node, sourceNode, source, result);
            return;
        }
        visitChildren(node, source, parentName, result);
        return;
    }

    if (type == "lexical_declaration" || type == "variable_declaration") {
        visitDeclaration(node, source, parentName, result);
        return;
    }

    if (type == "call_expression" && addRequireCall(node, source, result)) {
        return;
    }

    // Function bodies that were not claimed above are not descended into
    if (isFunctionValue(type)) {
        return;
    }

    visitChildren(node, source, parentName, result);
}

} // namespace

void EcmaScriptAdapter::extract(TSNode root, const std::string& source, ParsedFile& result) const {
    visit(root, source, "", result);
}

std::vector<std::string> TypeScriptAdapter::extensions() const {
    if (jsx_) {
        return {".tsx"};
    }
    return {".ts"};
}

const TSLanguage* TypeScriptAdapter::grammar() const {
    return jsx_ ? tree_sitter_tsx() : tree_sitter_typescript();
}

std::vector<std::string> JavaScriptAdapter::extensions() const {
    return {".js", ".jsx", ".mjs", ".cjs"};
}

const TSLanguage* JavaScriptAdapter::grammar() const {
    return tree_sitter_javascript();
}
