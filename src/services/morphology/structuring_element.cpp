#include "services/morphology/structuring_element.hpp"

#include <format>

namespace volmorph::services {

std::vector<LinearStrel> decompose(const StructuringElement& element) {
    if (const auto* linear = std::get_if<LinearStrel>(&element)) {
        return {*linear};
    }
    return std::get<SeparableStrel>(element).elements();
}

StructuringElement reverse(const StructuringElement& element) {
    return std::visit([](const auto& e) -> StructuringElement { return e.reverse(); },
                      element);
}

Extent3D elementSize(const StructuringElement& element) {
    return std::visit([](const auto& e) { return e.size(); }, element);
}

Extent3D elementOffset(const StructuringElement& element) {
    return std::visit([](const auto& e) { return e.originOffset(); }, element);
}

std::vector<Shift3D> elementShifts(const StructuringElement& element) {
    return std::visit([](const auto& e) { return e.shifts(); }, element);
}

StrelMaskType::Pointer elementMask(const StructuringElement& element) {
    return std::visit([](const auto& e) { return e.mask(); }, element);
}

std::string describe(const StructuringElement& element) {
    if (const auto* linear = std::get_if<LinearStrel>(&element)) {
        return std::format("Linear {} (length {}, offset {})",
                           axisToString(linear->axis()), linear->length(), linear->offset());
    }

    const auto size = elementSize(element);
    const auto& passes = std::get<SeparableStrel>(element).elements();
    return std::format("Separable {}x{}x{} ({} passes)",
                       size[0], size[1], size[2], passes.size());
}

}  // namespace volmorph::services
