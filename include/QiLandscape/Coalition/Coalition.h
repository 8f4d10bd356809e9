#pragma once

#include <QiLandscape/Core/Export.h>

/**
 * @file Coalition.h
 * @brief Pairwise coalition and polarization analysis between opinion groups
 *
 * Input is one row per statement mapping group id -> agreement score. Scores
 * are either normalized ([0, 1], 0.5 = split) or signed percentages
 * ([-100, 100]); one convention per call.
 *
 * For every pair of groups (i < j) each statement is classified:
 * - skipped:      either score missing (no counter changes)
 * - neutral:      |score| <= threshold for either group
 * - agreement:    both beyond the threshold on the same side
 * - disagreement: both beyond the threshold on opposite sides
 *
 * alignmentPercentage = round(agreementCount / totalStatements * 100), where
 * totalStatements counts every input row, including skipped ones.
 */

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Qi::Landscape::Coalition {

// =============================================================================
// Constants
// =============================================================================

/// Decisive-position cutoff on the [-100, 100] scale
constexpr double AGREEMENT_THRESHOLD = 60.0;

/// Number of pairs reported as strongest coalitions
constexpr int32_t MAX_STRONGEST_COALITIONS = 3;

/// Alignment percentage a pair must exceed to count as a strong coalition
constexpr int32_t STRONG_COALITION_PERCENT = 50;

/// Polarization ratio (percent) at or above which polarization is high
constexpr double HIGH_POLARIZATION = 30.0;

/// Polarization ratio (percent) at or above which polarization is medium
constexpr double MEDIUM_POLARIZATION = 15.0;

// =============================================================================
// Enumerations
// =============================================================================

/**
 * @brief Joint stance of two groups on one statement
 */
enum class PairStance {
    Neutral,        ///< At least one group is not decisive
    Agreement,      ///< Both decisive, same side
    Disagreement    ///< Both decisive, opposite sides
};

/**
 * @brief Coarse polarization bucket for reporting
 */
enum class PolarizationCategory {
    Low,
    Medium,
    High
};

// =============================================================================
// Parameter Structures
// =============================================================================

/**
 * @brief Coalition analysis parameters
 *
 * Defaults reproduce the reference classification exactly.
 */
struct CoalitionParams {
    double agreementThreshold = AGREEMENT_THRESHOLD;        ///< Decisive cutoff ([-100, 100] scale)
    int32_t maxStrongest = MAX_STRONGEST_COALITIONS;        ///< Length of strongestCoalitions
    double highPolarization = HIGH_POLARIZATION;            ///< High bucket lower bound
    double mediumPolarization = MEDIUM_POLARIZATION;        ///< Medium bucket lower bound

    CoalitionParams& SetAgreementThreshold(double t) { agreementThreshold = t; return *this; }
    CoalitionParams& SetMaxStrongest(int32_t n) { maxStrongest = n; return *this; }
    CoalitionParams& SetPolarizationBuckets(double medium, double high) {
        mediumPolarization = medium; highPolarization = high; return *this;
    }
};

// =============================================================================
// Input / Result Structures
// =============================================================================

/**
 * @brief Per-statement agreement scores keyed by group id
 */
struct StatementScores {
    std::string statementId;
    std::map<int32_t, double> groupScores;  ///< groupId -> score; absent = no data

    StatementScores() = default;
    StatementScores(std::string id, std::map<int32_t, double> scores)
        : statementId(std::move(id)), groupScores(std::move(scores)) {}
};

/**
 * @brief Alignment statistics of one group pair
 */
struct PairwiseAlignment {
    std::pair<int32_t, int32_t> groupIds{0, 0};          ///< (lower id, higher id)
    std::pair<std::string, std::string> groupLabels;
    int32_t agreementCount = 0;
    int32_t disagreementCount = 0;
    int32_t neutralCount = 0;
    int32_t alignmentPercentage = 0;                     ///< 0-100

    /// Statements with scores for both groups
    int32_t CountedStatements() const {
        return agreementCount + disagreementCount + neutralCount;
    }

    /// Order-independent pair match
    bool Involves(int32_t groupA, int32_t groupB) const {
        return (groupIds.first == groupA && groupIds.second == groupB) ||
               (groupIds.first == groupB && groupIds.second == groupA);
    }
};

/**
 * @brief Full pairwise table and its strongest prefix
 */
struct CoalitionAnalysis {
    std::vector<PairwiseAlignment> pairwiseAlignment;    ///< Sorted strongest first
    std::vector<PairwiseAlignment> strongestCoalitions;  ///< Prefix of pairwiseAlignment
    int32_t totalStatements = 0;                         ///< Rows in the input
};

// =============================================================================
// Score Helpers
// =============================================================================

/**
 * @brief Map a score onto the [-100, 100] scale
 *
 * Scores within [0, 1] map via (score - 0.5) * 200; anything else is taken
 * as already on the [-100, 100] scale.
 */
QILANDSCAPE_API double NormalizeAgreementScore(double score);

/**
 * @brief Classify two normalized scores for one statement
 *
 * Neutral when either |score| <= threshold.
 */
QILANDSCAPE_API PairStance ClassifyPairStance(double normalizedA, double normalizedB,
                                              double threshold = AGREEMENT_THRESHOLD);

/**
 * @brief Default display label: "Group {index+1}"
 */
QILANDSCAPE_API std::string DefaultGroupLabel(int32_t groupIndex);

// =============================================================================
// Analysis
// =============================================================================

/**
 * @brief Compute pairwise alignment for all groups
 *
 * Produces numGroups*(numGroups-1)/2 pairs sorted by alignmentPercentage
 * descending, then agreementCount descending (stable for full ties, which
 * keep (i, j) generation order). Scores under group ids outside
 * [0, numGroups) are ignored.
 *
 * @param statements Per-statement scores
 * @param numGroups Number of groups (ids 0..numGroups-1)
 * @param groupLabels Labels by group id; empty = DefaultGroupLabel
 * @param params Thresholds
 * @throws InvalidArgumentException if numGroups < 0, a score is not finite,
 *         or groupLabels is non-empty but shorter than numGroups
 */
QILANDSCAPE_API CoalitionAnalysis AnalyzeCoalitions(
    const std::vector<StatementScores>& statements,
    int32_t numGroups,
    const std::vector<std::string>& groupLabels = {},
    const CoalitionParams& params = CoalitionParams());

/**
 * @brief First strongest coalition, if any
 */
QILANDSCAPE_API std::optional<PairwiseAlignment> GetStrongestCoalition(
    const CoalitionAnalysis& analysis);

/**
 * @brief True iff the pair (in either order) aligns on more than 50%
 *
 * Absent pairs are not strong coalitions.
 */
QILANDSCAPE_API bool IsStrongCoalition(int32_t groupId1, int32_t groupId2,
                                       const CoalitionAnalysis& analysis);

/**
 * @brief Pairs with alignmentPercentage >= minAlignment, in table order
 */
QILANDSCAPE_API std::vector<PairwiseAlignment> GetCoalitionsAboveThreshold(
    const CoalitionAnalysis& analysis,
    int32_t minAlignment = STRONG_COALITION_PERCENT);

// =============================================================================
// Polarization
// =============================================================================

/**
 * @brief Unrounded polarization ratio in percent
 *
 * totalDisagreements / (numPairs * firstPairStatements) * 100, where
 * firstPairStatements is CountedStatements() of the FIRST pair only
 * (1 if that is 0). 0 for an empty table.
 */
QILANDSCAPE_API double PolarizationRatio(const CoalitionAnalysis& analysis);

/**
 * @brief Polarization score: PolarizationRatio rounded half up
 *
 * Usually 0-100, but unbounded above when the first pair counts fewer
 * statements than the others.
 */
QILANDSCAPE_API int32_t CalculatePolarizationLevel(const CoalitionAnalysis& analysis);

/**
 * @brief Bucket the unrounded polarization ratio
 */
QILANDSCAPE_API PolarizationCategory ClassifyPolarization(
    const CoalitionAnalysis& analysis,
    const CoalitionParams& params = CoalitionParams());

/**
 * @brief "low", "medium" or "high"
 */
QILANDSCAPE_API const char* PolarizationCategoryName(PolarizationCategory category);

} // namespace Qi::Landscape::Coalition
