/**
 * @file opinion_map_demo.cpp
 * @brief 示例：观点地图 / Example: Opinion Map
 *
 * 演示为每个观点群体生成边界并分析群体间联盟
 * Demonstrates per-group boundaries and pairwise coalition analysis
 *
 * Usage: opinion_map_demo [output.svg]
 */

#include <QiLandscape/QiLandscape.h>

#include <cmath>
#include <cstdio>
#include <string>
#include <vector>

using namespace Qi::Landscape;
using namespace Qi::Landscape::OpinionMap;

// 围绕中心生成散点 / Scatter points around a centre
std::vector<Point2d> Scatter(Point2d center, double spread, int count, int seed) {
    std::vector<Point2d> pts;
    for (int i = 0; i < count; ++i) {
        double a = i * 2.399963 + seed;
        double r = spread * std::sqrt((i + 0.5) / count);
        pts.push_back({center.x + r * std::cos(a), center.y + r * std::sin(a)});
    }
    return pts;
}

void PrintBoundary(const GroupBoundary& b) {
    if (b.IsHull()) {
        printf("   [%d] %-10s HULL   members=%zu vertices=%zu area=%.1f label=(%.1f, %.1f)\n",
               b.groupId, b.label.c_str(), b.memberCount, b.hull.size(), b.area,
               b.labelAnchor.x, b.labelAnchor.y);
    } else {
        printf("   [%d] %-10s CIRCLE members=%zu center=(%.1f, %.1f) r=%.1f\n",
               b.groupId, b.label.c_str(), b.memberCount,
               b.circle.center.x, b.circle.center.y, b.circle.radius);
    }
}

bool WriteSvg(const std::string& path, const OpinionMapResult& map, const OpinionMapParams& params) {
    FILE* f = std::fopen(path.c_str(), "w");
    if (f == nullptr) {
        return false;
    }
    std::fprintf(f, "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"%.0f\" height=\"%.0f\">\n",
                 params.canvasSize.width, params.canvasSize.height);
    for (const auto& b : map.boundaries) {
        if (b.IsHull()) {
            std::fprintf(f, "  <path d=\"%s\" fill=\"#4e79a7\" fill-opacity=\"0.25\" stroke=\"#4e79a7\"/>\n",
                         b.svgPath.c_str());
        } else {
            std::fprintf(f, "  <circle cx=\"%.3f\" cy=\"%.3f\" r=\"%.3f\" fill=\"#f28e2b\" "
                            "fill-opacity=\"0.25\" stroke=\"#f28e2b\"/>\n",
                         b.circle.center.x, b.circle.center.y, b.circle.radius);
        }
        std::fprintf(f, "  <text x=\"%.3f\" y=\"%.3f\" text-anchor=\"middle\">%s</text>\n",
                     b.labelAnchor.x, b.labelAnchor.y, b.label.c_str());
    }
    std::fprintf(f, "</svg>\n");
    std::fclose(f);
    return true;
}

int main(int argc, char* argv[]) {
    printf("=== QiLandscape Sample: Opinion Map (v%s) ===\n\n", GetVersion());

    // 构造输入 / Build the snapshot
    OpinionMapInput input;
    input.clusters = {
        ClusterInput(0, "Reformers", Scatter({-2.0, 1.0}, 1.2, 24, 0)),
        ClusterInput(1, "Moderates", Scatter({1.5, 0.5}, 0.9, 15, 3)),
        ClusterInput(2, "Skeptics", Scatter({0.0, -2.0}, 1.0, 2, 5)),
        ClusterInput(3, "Newcomers", {{2.5, -1.5}}),
    };
    const double scores[][4] = {
        {0.92, 0.85, 0.10, 0.55},
        {0.15, 0.30, 0.95, 0.60},
        {0.88, 0.40, 0.05, 0.90},
        {0.90, 0.86, 0.82, 0.84},
        {0.35, 0.10, 0.90, 0.12},
    };
    for (size_t s = 0; s < sizeof(scores) / sizeof(scores[0]); ++s) {
        Coalition::StatementScores row;
        row.statementId = "stmt-" + std::to_string(s + 1);
        for (int32_t g = 0; g < 4; ++g) {
            row.groupScores[g] = scores[s][g];
        }
        input.statements.push_back(row);
    }

    OpinionMapParams params;
    OpinionMapResult map;
    try {
        Platform::ScopedTimer timer("ComposeOpinionMap");
        map = ComposeOpinionMap(input, params);
    } catch (const Exception& e) {
        printf("Compose failed: %s\n", e.what());
        return 1;
    }

    // 1. 群体边界 / Group boundaries
    printf("\n1. Group boundaries (%zu hulls, %zu circles):\n", map.HullCount(), map.CircleCount());
    for (const auto& b : map.boundaries) {
        PrintBoundary(b);
    }

    // 2. 联盟分析 / Coalitions
    printf("\n2. Pairwise alignment (%d statements):\n", map.coalitions.totalStatements);
    for (const auto& pair : map.coalitions.pairwiseAlignment) {
        printf("   %-10s + %-10s  %3d%%  (agree=%d, disagree=%d, neutral=%d)\n",
               pair.groupLabels.first.c_str(), pair.groupLabels.second.c_str(),
               pair.alignmentPercentage, pair.agreementCount,
               pair.disagreementCount, pair.neutralCount);
    }

    auto strongest = Coalition::GetStrongestCoalition(map.coalitions);
    if (strongest) {
        printf("   Strongest: %s + %s\n",
               strongest->groupLabels.first.c_str(), strongest->groupLabels.second.c_str());
    }

    // 3. 极化程度 / Polarization
    printf("\n3. Polarization: %d (%s)\n", map.polarizationLevel,
           Coalition::PolarizationCategoryName(map.polarizationCategory));

    // 输出 SVG / Write SVG
    std::string outPath = argc > 1 ? argv[1] : "opinion_map.svg";
    if (!WriteSvg(outPath, map, params)) {
        printf("\nFailed to write %s\n", outPath.c_str());
        return 1;
    }
    printf("\nSaved: %s\n", outPath.c_str());
    return 0;
}
