#include "complexity.hpp"

namespace pipeline_generator {

const char* const kDefaultComplexity = "O(n)";

const std::vector<std::string>& complexity_ranking() {
    static const std::vector<std::string> ranking = {
        "O(1)",          "O(log n)",      "O(n)",         "O(n log n)", "O(n * max_order)",
        "O(n * window)", "O(n * depth)",  "O(n^2)",       "O(|Σ|^order)", "Incomputable"};
    return ranking;
}

std::string combine_complexity(const std::vector<std::string>& labels) {
    if (labels.empty()) return kDefaultComplexity;

    const auto& ranking = complexity_ranking();
    int worst_rank = -1;
    std::string worst = labels.front();
    for (const auto& label : labels) {
        for (size_t rank = 0; rank < ranking.size(); ++rank) {
            if (static_cast<int>(rank) > worst_rank && label.find(ranking[rank]) != std::string::npos) {
                worst_rank = static_cast<int>(rank);
                worst = label;
            }
        }
    }
    return worst;
}

} // namespace pipeline_generator
