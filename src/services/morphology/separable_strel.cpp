#include "services/morphology/separable_strel.hpp"

#include <algorithm>
#include <array>

namespace volmorph::services {

std::expected<SeparableStrel, MorphologyError>
SeparableStrel::create(std::vector<LinearStrel> elements) {
    if (elements.empty()) {
        return std::unexpected(MorphologyError{
            MorphologyError::Code::InvalidParameters,
            "Separable element requires at least one linear element"
        });
    }
    return SeparableStrel(std::move(elements));
}

std::expected<SeparableStrel, MorphologyError>
SeparableStrel::cube(int radiusX, int radiusY, int radiusZ) {
    const std::array<int, 3> radii{radiusX, radiusY, radiusZ};
    const std::array<Axis, 3> axes{Axis::X, Axis::Y, Axis::Z};

    std::vector<LinearStrel> elements;
    for (std::size_t i = 0; i < 3; ++i) {
        auto element = LinearStrel::fromRadius(radii[i], axes[i]);
        if (!element) {
            return std::unexpected(element.error());
        }
        if (!element->isIdentity()) {
            elements.push_back(*element);
        }
    }

    if (elements.empty()) {
        elements.push_back(*LinearStrel::create(1, 0, Axis::X));
    }
    return SeparableStrel(std::move(elements));
}

std::expected<SeparableStrel, MorphologyError>
SeparableStrel::box(int sizeX, int sizeY, int sizeZ) {
    const std::array<int, 3> sizes{sizeX, sizeY, sizeZ};
    const std::array<Axis, 3> axes{Axis::X, Axis::Y, Axis::Z};

    std::vector<LinearStrel> elements;
    for (std::size_t i = 0; i < 3; ++i) {
        auto element = LinearStrel::fromDiameter(sizes[i], axes[i]);
        if (!element) {
            return std::unexpected(element.error());
        }
        elements.push_back(*element);
    }
    return SeparableStrel(std::move(elements));
}

bool SeparableStrel::isIdentity() const noexcept {
    return std::all_of(elements_.begin(), elements_.end(),
                       [](const LinearStrel& e) { return e.isIdentity(); });
}

SeparableStrel SeparableStrel::reverse() const {
    std::vector<LinearStrel> reversed;
    reversed.reserve(elements_.size());
    for (const auto& element : elements_) {
        reversed.push_back(element.reverse());
    }
    return SeparableStrel(std::move(reversed));
}

Extent3D SeparableStrel::size() const noexcept {
    Extent3D extent{1, 1, 1};
    for (const auto& element : elements_) {
        extent[static_cast<std::size_t>(element.axis())] += element.length() - 1;
    }
    return extent;
}

Extent3D SeparableStrel::originOffset() const noexcept {
    Extent3D origin{0, 0, 0};
    for (const auto& element : elements_) {
        origin[static_cast<std::size_t>(element.axis())] += element.offset();
    }
    return origin;
}

std::vector<Shift3D> SeparableStrel::shifts() const {
    std::vector<Shift3D> result{{0, 0, 0}};
    for (const auto& element : elements_) {
        result = addShiftSets(result, element.shifts());
    }
    return result;
}

SeparableStrel::MaskType::Pointer SeparableStrel::mask() const {
    return rasterizeShifts(size(), originOffset(), shifts());
}

}  // namespace volmorph::services
