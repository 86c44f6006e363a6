#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "code_model.hpp"

namespace fs = std::filesystem;

enum class CompressionMode {
    Full,           // Complete file contents
    Signatures,     // Class and function declaration lines only
    Smart           // Signatures for large files, full content for small ones
};

// Parse "full", "signatures" or "smart"; throws std::invalid_argument otherwise
CompressionMode compressionModeFromString(const std::string& value);
std::string compressionModeToString(CompressionMode mode);

struct CompressorOptions {
    size_t smartLineThreshold = 100;   // Smart mode summarizes files longer than this
    size_t charsPerToken = 4;          // Token estimate divisor
};

struct CompressionResult {
    std::string content;
    std::vector<std::string> filesIncluded;
    std::vector<std::string> omittedFiles;   // Dropped once the budget was reached
    size_t estimatedTokens = 0;
    CompressionMode mode = CompressionMode::Smart;
    std::string error;
};

// Renders a list of files into one token-efficient text block
class ContextCompressor {
public:
    explicit ContextCompressor(const fs::path& root, const CompressorOptions& options = CompressorOptions());

    // Render files in order. A positive tokenBudget packs greedily: files are
    // added until the running estimate reaches the budget and the rest are
    // reported as omitted. The last added file may overshoot.
    CompressionResult compress(const std::vector<std::string>& files, CompressionMode mode,
                               size_t tokenBudget = 0) const;

    // Declaration-only view of one file
    std::string renderSignatures(const std::string& relativePath) const;

    size_t estimateTokens(const std::string& text) const;

private:
    fs::path root_;
    CompressorOptions options_;

    std::string renderFile(const std::string& relativePath, CompressionMode mode) const;
};
