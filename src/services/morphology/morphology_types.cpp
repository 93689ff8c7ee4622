#include "services/morphology/morphology_types.hpp"

#include <algorithm>
#include <cctype>

namespace volmorph::services {

std::string operationToString(MorphologicalOperation operation) {
    switch (operation) {
        case MorphologicalOperation::Dilation: return "Dilation";
        case MorphologicalOperation::Erosion: return "Erosion";
        case MorphologicalOperation::Opening: return "Opening";
        case MorphologicalOperation::Closing: return "Closing";
    }
    return "Unknown";
}

std::optional<MorphologicalOperation> operationFromString(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "dilation") return MorphologicalOperation::Dilation;
    if (lower == "erosion") return MorphologicalOperation::Erosion;
    if (lower == "opening") return MorphologicalOperation::Opening;
    if (lower == "closing") return MorphologicalOperation::Closing;
    return std::nullopt;
}

std::string axisToString(Axis axis) {
    switch (axis) {
        case Axis::X: return "X";
        case Axis::Y: return "Y";
        case Axis::Z: return "Z";
    }
    return "?";
}

}  // namespace volmorph::services
