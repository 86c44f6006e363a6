#pragma once

#include <string>
#include <vector>
#include "symbol_index.hpp"

enum class RiskLevel {
    Low,
    Medium,
    High
};

std::string riskLevelToString(RiskLevel risk);

struct ChangeImpact {
    std::string file;
    std::vector<std::string> exportedSymbols;     // "kind name signature" of public symbols
    std::vector<std::string> directDependents;    // Files importing the file
    std::vector<std::string> indirectDependents;  // Files importing a direct dependent
    size_t totalAffected = 0;
    RiskLevel risk = RiskLevel::Low;
    std::string recommendation;
    std::string error;
};

// Blast radius of changing one file: two hops back along the import graph
ChangeImpact analyzeChangeImpact(const SymbolIndex& index, const std::string& relativePath);

// Low for no dependents, Medium up to five, High above
RiskLevel classifyRisk(size_t affectedFiles);

std::string riskRecommendation(RiskLevel risk, size_t affectedFiles);
