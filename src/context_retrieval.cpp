#include "context_retrieval.hpp"
#include "parse_adapter.hpp"
#include "repository_scanner.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <map>
#include <regex>
#include <set>
#include <system_error>
#include <unordered_set>

namespace {

constexpr int EXACT_MATCH_SCORE = 10;
constexpr int PARTIAL_MATCH_SCORE = 5;
constexpr int USAGE_SCORE = 1;

const std::unordered_set<std::string>& stopWords() {
    static const std::unordered_set<std::string> words = {
        "a", "an", "the", "is", "are", "was", "were", "be", "been", "being",
        "have", "has", "had", "do", "does", "did", "will", "would", "could",
        "should", "may", "might", "must", "shall", "can", "need", "dare",
        "i", "you", "he", "she", "it", "we", "they", "what", "which", "who",
        "when", "where", "why", "how", "all", "each", "every", "both", "few",
        "more", "most", "other", "some", "such", "no", "nor", "not", "only",
        "own", "same", "so", "than", "too", "very", "just", "and", "but",
        "if", "or", "because", "as", "until", "while", "of", "at", "by",
        "for", "with", "about", "against", "between", "into", "through",
        "during", "before", "after", "above", "below", "to", "from", "up",
        "down", "in", "out", "on", "off", "over", "under", "again", "further",
        "then", "once", "here", "there", "this", "that", "these", "those",
        "work", "works", "working", "code", "file", "files", "function",
        "find", "show", "get", "make", "explain", "understand"
    };
    return words;
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// Repo-relative path that stays inside the root
bool isInsideRoot(const fs::path& relative) {
    return !relative.empty() && !relative.is_absolute() && *relative.begin() != "..";
}

} // namespace

std::vector<std::string> extractKeywords(const std::string& text) {
    static const std::regex wordPattern(R"(\b[A-Za-z_][A-Za-z0-9_]*\b)");

    std::vector<std::string> keywords;
    std::unordered_set<std::string> seen;

    for (std::sregex_iterator it(text.begin(), text.end(), wordPattern), end; it != end; ++it) {
        const std::string word = it->str();
        if (word.size() <= 2 || stopWords().count(toLower(word))) {
            continue;
        }
        if (seen.insert(word).second) {
            keywords.push_back(word);
        }
    }

    return keywords;
}

ContextRetriever::ContextRetriever(const SymbolIndex& index, const RetrievalOptions& options,
                                   const CallGraphOptions& callGraphOptions)
    : index_(index),
      options_(options),
      analyzer_(index, callGraphOptions) {
    if (options_.charsPerToken == 0) {
        options_.charsPerToken = 1;
    }
}

SmartContext ContextRetriever::smartContext(const std::string& question, size_t maxTokens) const {
    SmartContext context;
    context.question = question;
    context.keywords = extractKeywords(question);

    std::map<std::string, int> scores;
    std::map<std::string, std::set<std::string>> matched;

    for (const auto& keyword : context.keywords) {
        const std::string needle = toLower(keyword);

        for (const auto& [name, locations] : index_.symbolsByName) {
            const std::string lowerName = toLower(name);
            if (lowerName.find(needle) == std::string::npos) {
                continue;
            }
            const int score = lowerName == needle ? EXACT_MATCH_SCORE : PARTIAL_MATCH_SCORE;
            for (const auto& location : locations) {
                scores[location.relativePath] += score;
                matched[location.relativePath].insert(describeSymbol(location.symbol));
            }
        }

        for (const auto& usage : analyzer_.findUsages(keyword)) {
            scores[usage.file] += USAGE_SCORE;
        }
    }

    context.filesAnalyzed = scores.size();

    // Highest score first, ties by path
    std::vector<std::pair<std::string, int>> ranked(scores.begin(), scores.end());
    std::stable_sort(ranked.begin(), ranked.end(),
        [](const auto& a, const auto& b) { return a.second > b.second; });
    if (ranked.size() > options_.maxCandidateFiles) {
        ranked.resize(options_.maxCandidateFiles);
    }

    const size_t maxChars = maxTokens * options_.charsPerToken;
    size_t totalChars = 0;

    for (const auto& [file, score] : ranked) {
        std::string content;
        try {
            content = readFile(index_.root / file);
        } catch (const std::exception& e) {
            std::cerr << "Warning: " << e.what() << std::endl;
            continue;
        }

        if (totalChars + content.size() > maxChars) {
            if (context.files.size() >= options_.truncateBelowFiles) {
                continue;
            }
            content.resize(maxChars - totalChars);
        }

        totalChars += content.size();

        RelevantFile relevant;
        relevant.file = file;
        relevant.score = score;
        const auto& symbols = matched[file];
        relevant.matchedSymbols.assign(symbols.begin(), symbols.end());
        relevant.content = std::move(content);
        context.files.push_back(std::move(relevant));

        if (totalChars >= maxChars) {
            break;
        }
    }

    context.estimatedTokens = totalChars / options_.charsPerToken;
    return context;
}

SearchResults ContextRetriever::search(const std::string& query, size_t topK) const {
    SearchResults results;
    results.query = query;
    results.keywords = extractKeywords(query);

    // One symbol hit per file, one content hit per file:line
    std::set<std::string> seen;

    for (const auto& keyword : results.keywords) {
        const std::string needle = toLower(keyword);

        for (const auto& [name, locations] : index_.symbolsByName) {
            const std::string lowerName = toLower(name);
            if (lowerName.find(needle) == std::string::npos) {
                continue;
            }
            for (const auto& location : locations) {
                if (!seen.insert(location.relativePath).second) {
                    continue;
                }
                SearchHit hit;
                hit.file = location.relativePath;
                hit.line = location.symbol.startLine;
                hit.symbolMatch = true;
                hit.symbol = describeSymbol(location.symbol);
                hit.exact = lowerName == needle;
                results.hits.push_back(hit);
            }
        }
    }

    for (const auto& keyword : results.keywords) {
        const std::vector<Usage> usages = analyzer_.findUsages(keyword);
        const size_t count = std::min(usages.size(), options_.usagesPerKeyword);

        for (size_t i = 0; i < count; ++i) {
            const Usage& usage = usages[i];
            if (!seen.insert(usage.file + ":" + std::to_string(usage.line)).second) {
                continue;
            }
            SearchHit hit;
            hit.file = usage.file;
            hit.line = usage.line;
            hit.content = usage.content;
            hit.usageType = usage.type;
            results.hits.push_back(hit);
        }
    }

    std::stable_sort(results.hits.begin(), results.hits.end(), [](const SearchHit& a, const SearchHit& b) {
        if (a.exact != b.exact) {
            return a.exact;
        }
        return a.symbolMatch && !b.symbolMatch;
    });

    if (results.hits.size() > topK) {
        results.hits.resize(topK);
    }
    return results;
}

FileContext ContextRetriever::fileContext(const std::string& relativePath) const {
    FileContext context;
    context.file = relativePath;

    const fs::path relative = fs::path(relativePath).lexically_normal();
    const fs::path fullPath = index_.root / relative;

    std::error_code ec;
    if (!isInsideRoot(relative) || !fs::is_regular_file(fullPath, ec)) {
        context.error = "File not found: " + relativePath;
        return context;
    }

    try {
        context.content = readFile(fullPath);
    } catch (const std::exception& e) {
        context.error = std::string("Failed to read file: ") + e.what();
        return context;
    }

    context.language = "unknown";
    if (std::optional<ParsedFile> parsed = parseFile(fullPath)) {
        context.language = languageToString(parsed->language);
        for (const auto& symbol : parsed->symbols) {
            context.symbols.push_back(describeSymbol(symbol));
        }
        for (const auto& imp : parsed->imports) {
            context.imports.push_back(imp.module);
        }
    }

    std::set<std::string> seen = {relativePath};

    size_t added = 0;
    for (const auto& target : index_.importGraph.importsOf(relativePath)) {
        if (added >= options_.maxRelatedFiles) {
            break;
        }
        if (!seen.insert(target).second) {
            continue;
        }

        RelatedFile related;
        related.file = target;
        related.relationship = "imports";
        auto symbolsIt = index_.symbolsByFile.find(target);
        if (symbolsIt != index_.symbolsByFile.end()) {
            const auto& symbols = symbolsIt->second;
            for (size_t i = 0; i < symbols.size() && i < options_.maxRelatedSymbols; ++i) {
                related.symbols.push_back(describeSymbol(symbols[i]));
            }
        }
        context.related.push_back(std::move(related));
        ++added;
    }

    added = 0;
    for (const auto& source : index_.importGraph.importedBy(relativePath)) {
        if (added >= options_.maxRelatedFiles) {
            break;
        }
        if (!seen.insert(source).second) {
            continue;
        }

        RelatedFile related;
        related.file = source;
        related.relationship = "used_by";
        context.related.push_back(std::move(related));
        ++added;
    }

    return context;
}
