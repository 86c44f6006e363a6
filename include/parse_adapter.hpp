#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <optional>
#include <unordered_map>
#include <filesystem>
#include "code_model.hpp"
#include "tree_sitter_support.hpp"

namespace fs = std::filesystem;

// Base class for per-language symbol and import extraction.
//
// An adapter walks its language's concrete syntax tree and turns it into
// symbols and imports. Adapters hold no mutable state, so one instance can
// serve any number of callers; every parse gets its own tree-sitter parser.
class ParseAdapter {
public:
    virtual ~ParseAdapter() = default;

    // Parse source text. Returns std::nullopt when the content is not valid
    // for this language; partial results are never returned.
    std::optional<ParsedFile> parse(const std::string& source) const;

    virtual Language language() const = 0;

    // Lower-case extensions (with dot) this adapter handles
    virtual std::vector<std::string> extensions() const = 0;

protected:
    virtual const TSLanguage* grammar() const = 0;

    // Fill symbols and imports from an error-free tree
    virtual void extract(TSNode root, const std::string& source, ParsedFile& result) const = 0;
};

// Python: functions, methods, classes, docstrings, import / from-import
class PythonAdapter : public ParseAdapter {
public:
    Language language() const override { return Language::Python; }
    std::vector<std::string> extensions() const override;

protected:
    const TSLanguage* grammar() const override;
    void extract(TSNode root, const std::string& source, ParsedFile& result) const override;
};

// Shared extraction for the ECMAScript family (TypeScript and JavaScript
// grammars expose the same declaration and import node types)
class EcmaScriptAdapter : public ParseAdapter {
protected:
    void extract(TSNode root, const std::string& source, ParsedFile& result) const override;
};

class TypeScriptAdapter : public EcmaScriptAdapter {
public:
    // jsx selects the TSX grammar for .tsx files
    explicit TypeScriptAdapter(bool jsx = false) : jsx_(jsx) {}

    Language language() const override { return Language::TypeScript; }
    std::vector<std::string> extensions() const override;

protected:
    const TSLanguage* grammar() const override;

private:
    bool jsx_;
};

class JavaScriptAdapter : public EcmaScriptAdapter {
public:
    Language language() const override { return Language::JavaScript; }
    std::vector<std::string> extensions() const override;

protected:
    const TSLanguage* grammar() const override;
};

// Process-wide table of ready-to-use adapters, built once on first use and
// never modified afterwards
class ParserRegistry {
public:
    static const ParserRegistry& instance();

    // Primary adapter for a language, nullptr if unsupported
    const ParseAdapter* adapterFor(Language language) const;

    // Adapter for a file extension (any case), nullptr if unsupported
    const ParseAdapter* adapterForExtension(const std::string& extension) const;

    ParserRegistry(const ParserRegistry&) = delete;
    ParserRegistry& operator=(const ParserRegistry&) = delete;

private:
    ParserRegistry();

    std::vector<std::unique_ptr<ParseAdapter>> adapters_;
    std::unordered_map<std::string, const ParseAdapter*> byExtension_;
    std::map<Language, const ParseAdapter*> byLanguage_;
};

// Read and parse a file, choosing the adapter from its extension.
// Unsupported, unreadable or unparseable files yield std::nullopt.
std::optional<ParsedFile> parseFile(const fs::path& filePath);
