#include "component.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace component_catalog {

bool Component::valid_at(Stage stage) const {
    return std::find(valid_stages.begin(), valid_stages.end(), stage) != valid_stages.end();
}

std::string to_string(Category category) {
    switch (category) {
        case Category::EntropyMeasure: return "ENTROPY_MEASURE";
        case Category::Transform: return "TRANSFORM";
        case Category::Predictor: return "PREDICTOR";
        case Category::Dictionary: return "DICTIONARY";
        case Category::EntropyCoder: return "ENTROPY_CODER";
        case Category::RunLength: return "RUN_LENGTH";
        case Category::ContextModel: return "CONTEXT_MODEL";
        case Category::Filter: return "FILTER";
        case Category::IntegerCoder: return "INTEGER_CODER";
    }
    return "UNKNOWN";
}

std::string to_string(Stage stage) {
    switch (stage) {
        case Stage::PreFilter: return "pre-filter";
        case Stage::Transform: return "transform";
        case Stage::Modeling: return "modeling";
        case Stage::EntropyCoding: return "entropy-coding";
    }
    return "unknown";
}

bool parse_category(const std::string& text, Category& out) {
    std::string upper = text;
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) {
        return c == '-' ? '_' : static_cast<char>(std::toupper(c));
    });
    for (Category category : kAllCategories) {
        if (to_string(category) == upper) {
            out = category;
            return true;
        }
    }
    return false;
}

bool stage_from_int(int value, Stage& out) {
    if (value < 0 || value > 3) return false;
    out = static_cast<Stage>(value);
    return true;
}

std::string format_value(const ParamValue& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number_float()) {
        double d = value.get<double>();
        if (std::isinf(d)) return d > 0 ? "inf" : "-inf";
        if (std::isnan(d)) return "nan";
        std::ostringstream ss;
        ss << d;
        return ss.str();
    }
    return value.dump();
}

nlohmann::json export_value(const ParamValue& value) {
    if (value.is_number_float() && !std::isfinite(value.get<double>())) {
        return format_value(value);
    }
    return value;
}

} // namespace component_catalog
