#ifndef COMPLEXITY_HPP
#define COMPLEXITY_HPP

#include <string>
#include <vector>

namespace pipeline_generator {

// Returned for an empty label list.
extern const char* const kDefaultComplexity;

// Severity ranking, cheapest first.
const std::vector<std::string>& complexity_ranking();

// Picks the label containing the highest-ranked pattern; ties keep the
// earliest label. With no match at all the first label is returned.
std::string combine_complexity(const std::vector<std::string>& labels);

} // namespace pipeline_generator

#endif // COMPLEXITY_HPP
