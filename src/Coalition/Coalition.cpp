/**
 * @file Coalition.cpp
 * @brief Coalition analysis implementation
 */

#include <QiLandscape/Coalition/Coalition.h>
#include <QiLandscape/Core/Validate.h>

#include <algorithm>
#include <cmath>
#include <iterator>

namespace Qi::Landscape::Coalition {

namespace {

// Half-up rounding for non-negative percentages
int32_t RoundPercent(double value) {
    return static_cast<int32_t>(std::floor(value + 0.5));
}

void ValidateScores(const std::vector<StatementScores>& statements) {
    for (const auto& stmt : statements) {
        for (const auto& [groupId, score] : stmt.groupScores) {
            if (!std::isfinite(score)) {
                throw InvalidArgumentException(
                    "AnalyzeCoalitions: score of group " + std::to_string(groupId) +
                    " on statement '" + stmt.statementId + "' must be finite, got " +
                    Validate::Detail::FormatValue(score));
            }
        }
    }
}

PairwiseAlignment AlignPair(const std::vector<StatementScores>& statements,
                            int32_t groupI, int32_t groupJ,
                            const std::vector<std::string>& labels,
                            double threshold) {
    PairwiseAlignment pair;
    pair.groupIds = {groupI, groupJ};
    pair.groupLabels = {labels[groupI], labels[groupJ]};

    for (const auto& stmt : statements) {
        auto itI = stmt.groupScores.find(groupI);
        auto itJ = stmt.groupScores.find(groupJ);
        if (itI == stmt.groupScores.end() || itJ == stmt.groupScores.end()) {
            continue;
        }

        double pctI = NormalizeAgreementScore(itI->second);
        double pctJ = NormalizeAgreementScore(itJ->second);
        switch (ClassifyPairStance(pctI, pctJ, threshold)) {
            case PairStance::Neutral:      ++pair.neutralCount; break;
            case PairStance::Agreement:    ++pair.agreementCount; break;
            case PairStance::Disagreement: ++pair.disagreementCount; break;
        }
    }

    if (!statements.empty()) {
        pair.alignmentPercentage = RoundPercent(
            static_cast<double>(pair.agreementCount) /
            static_cast<double>(statements.size()) * 100.0);
    }
    return pair;
}

} // anonymous namespace

// =============================================================================
// Score Helpers
// =============================================================================

double NormalizeAgreementScore(double score) {
    if (score >= 0.0 && score <= 1.0) {
        return (score - 0.5) * 200.0;
    }
    return score;
}

PairStance ClassifyPairStance(double normalizedA, double normalizedB, double threshold) {
    if (std::abs(normalizedA) <= threshold || std::abs(normalizedB) <= threshold) {
        return PairStance::Neutral;
    }
    // Both are decisive here, so the sign alone decides
    if ((normalizedA > threshold) == (normalizedB > threshold)) {
        return PairStance::Agreement;
    }
    return PairStance::Disagreement;
}

std::string DefaultGroupLabel(int32_t groupIndex) {
    return "Group " + std::to_string(groupIndex + 1);
}

// =============================================================================
// Analysis
// =============================================================================

CoalitionAnalysis AnalyzeCoalitions(const std::vector<StatementScores>& statements,
                                    int32_t numGroups,
                                    const std::vector<std::string>& groupLabels,
                                    const CoalitionParams& params) {
    QILANDSCAPE_REQUIRE_NON_NEGATIVE(numGroups);
    QILANDSCAPE_REQUIRE_FINITE(params.agreementThreshold);
    QILANDSCAPE_REQUIRE_NON_NEGATIVE(params.maxStrongest);
    if (!groupLabels.empty() && groupLabels.size() < static_cast<size_t>(numGroups)) {
        throw InvalidArgumentException(
            "AnalyzeCoalitions: groupLabels must cover " + std::to_string(numGroups) +
            " groups, got " + std::to_string(groupLabels.size()));
    }
    ValidateScores(statements);

    std::vector<std::string> labels = groupLabels;
    if (labels.empty()) {
        labels.reserve(static_cast<size_t>(numGroups));
        for (int32_t i = 0; i < numGroups; ++i) {
            labels.push_back(DefaultGroupLabel(i));
        }
    }

    CoalitionAnalysis analysis;
    analysis.totalStatements = static_cast<int32_t>(statements.size());

    if (numGroups > 1) {
        analysis.pairwiseAlignment.reserve(
            static_cast<size_t>(numGroups) * static_cast<size_t>(numGroups - 1) / 2);
    }
    for (int32_t i = 0; i < numGroups; ++i) {
        for (int32_t j = i + 1; j < numGroups; ++j) {
            analysis.pairwiseAlignment.push_back(
                AlignPair(statements, i, j, labels, params.agreementThreshold));
        }
    }

    std::stable_sort(analysis.pairwiseAlignment.begin(), analysis.pairwiseAlignment.end(),
        [](const PairwiseAlignment& a, const PairwiseAlignment& b) {
            if (a.alignmentPercentage != b.alignmentPercentage) {
                return a.alignmentPercentage > b.alignmentPercentage;
            }
            return a.agreementCount > b.agreementCount;
        });

    size_t topCount = std::min(analysis.pairwiseAlignment.size(),
                               static_cast<size_t>(params.maxStrongest));
    analysis.strongestCoalitions.assign(analysis.pairwiseAlignment.begin(),
                                        analysis.pairwiseAlignment.begin() + topCount);
    return analysis;
}

std::optional<PairwiseAlignment> GetStrongestCoalition(const CoalitionAnalysis& analysis) {
    if (analysis.strongestCoalitions.empty()) {
        return std::nullopt;
    }
    return analysis.strongestCoalitions.front();
}

bool IsStrongCoalition(int32_t groupId1, int32_t groupId2, const CoalitionAnalysis& analysis) {
    auto it = std::find_if(analysis.pairwiseAlignment.begin(), analysis.pairwiseAlignment.end(),
        [&](const PairwiseAlignment& a) { return a.Involves(groupId1, groupId2); });
    if (it == analysis.pairwiseAlignment.end()) {
        return false;
    }
    return it->alignmentPercentage > STRONG_COALITION_PERCENT;
}

std::vector<PairwiseAlignment> GetCoalitionsAboveThreshold(const CoalitionAnalysis& analysis,
                                                           int32_t minAlignment) {
    std::vector<PairwiseAlignment> result;
    std::copy_if(analysis.pairwiseAlignment.begin(), analysis.pairwiseAlignment.end(),
                 std::back_inserter(result),
                 [minAlignment](const PairwiseAlignment& a) {
                     return a.alignmentPercentage >= minAlignment;
                 });
    return result;
}

// =============================================================================
// Polarization
// =============================================================================

double PolarizationRatio(const CoalitionAnalysis& analysis) {
    const auto& pairs = analysis.pairwiseAlignment;
    if (pairs.empty()) return 0.0;

    int64_t totalDisagreements = 0;
    for (const auto& pair : pairs) {
        totalDisagreements += pair.disagreementCount;
    }

    // Only the first pair stands in for the per-pair statement count
    int32_t statementsPerPair = pairs.front().CountedStatements();
    if (statementsPerPair == 0) {
        statementsPerPair = 1;
    }

    double denominator = static_cast<double>(pairs.size()) * statementsPerPair;
    return static_cast<double>(totalDisagreements) / denominator * 100.0;
}

int32_t CalculatePolarizationLevel(const CoalitionAnalysis& analysis) {
    return RoundPercent(PolarizationRatio(analysis));
}

PolarizationCategory ClassifyPolarization(const CoalitionAnalysis& analysis,
                                          const CoalitionParams& params) {
    double ratio = PolarizationRatio(analysis);
    if (ratio >= params.highPolarization) return PolarizationCategory::High;
    if (ratio >= params.mediumPolarization) return PolarizationCategory::Medium;
    return PolarizationCategory::Low;
}

const char* PolarizationCategoryName(PolarizationCategory category) {
    switch (category) {
        case PolarizationCategory::High:   return "high";
        case PolarizationCategory::Medium: return "medium";
        case PolarizationCategory::Low:    return "low";
    }
    return "low";
}

} // namespace Qi::Landscape::Coalition
