#include "change_impact.hpp"
#include <set>

namespace {

constexpr size_t MEDIUM_RISK_LIMIT = 5;

} // namespace

std::string riskLevelToString(RiskLevel risk) {
    switch (risk) {
        case RiskLevel::Low:
            return "low";
        case RiskLevel::Medium:
            return "medium";
        case RiskLevel::High:
        default:
            return "high";
    }
}

RiskLevel classifyRisk(size_t affectedFiles) {
    if (affectedFiles == 0) {
        return RiskLevel::Low;
    }
    if (affectedFiles <= MEDIUM_RISK_LIMIT) {
        return RiskLevel::Medium;
    }
    return RiskLevel::High;
}

std::string riskRecommendation(RiskLevel risk, size_t affectedFiles) {
    const std::string count = std::to_string(affectedFiles);

    switch (risk) {
        case RiskLevel::Low:
            return "Safe to modify. No other files depend on this.";
        case RiskLevel::Medium:
            return "Moderate caution. " + count +
                   " files may be affected. Review before changing public interfaces.";
        case RiskLevel::High:
        default:
            return "High impact. " + count +
                   " files depend on this. Consider backward compatibility and thorough testing.";
    }
}

ChangeImpact analyzeChangeImpact(const SymbolIndex& index, const std::string& relativePath) {
    ChangeImpact impact;
    impact.file = relativePath;

    auto symbolsIt = index.symbolsByFile.find(relativePath);
    if (symbolsIt == index.symbolsByFile.end()) {
        impact.error = "File not found in index: " + relativePath;
        return impact;
    }

    for (const auto& symbol : symbolsIt->second) {
        if (isPrivateName(symbol.name)) {
            continue;
        }
        impact.exportedSymbols.push_back(describeSymbol(symbol));
    }

    const auto& direct = index.importGraph.importedBy(relativePath);
    impact.directDependents.assign(direct.begin(), direct.end());

    std::set<std::string> indirect;
    for (const auto& dependent : direct) {
        for (const auto& second : index.importGraph.importedBy(dependent)) {
            if (second != relativePath && direct.count(second) == 0) {
                indirect.insert(second);
            }
        }
    }
    impact.indirectDependents.assign(indirect.begin(), indirect.end());

    impact.totalAffected = impact.directDependents.size() + impact.indirectDependents.size();
    impact.risk = classifyRisk(impact.totalAffected);
    impact.recommendation = riskRecommendation(impact.risk, impact.totalAffected);

    return impact;
}
