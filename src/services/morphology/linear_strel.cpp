#include "services/morphology/linear_strel.hpp"
#include "services/morphology/strel_geometry.hpp"

#include <format>
#include <limits>

namespace volmorph::services {

std::expected<LinearStrel, MorphologyError>
LinearStrel::create(int length, int offset, Axis axis) {
    if (length < 1) {
        return std::unexpected(MorphologyError{
            MorphologyError::Code::InvalidParameters,
            std::format("Element length must be positive (got {})", length)
        });
    }

    if (offset < 0) {
        return std::unexpected(MorphologyError{
            MorphologyError::Code::InvalidParameters,
            std::format("Element offset must be non-negative (got {})", offset)
        });
    }

    if (offset >= length) {
        return std::unexpected(MorphologyError{
            MorphologyError::Code::InvalidParameters,
            std::format("Element offset {} must be smaller than length {}", offset, length)
        });
    }

    return LinearStrel(length, offset, axis);
}

std::expected<LinearStrel, MorphologyError>
LinearStrel::fromDiameter(int diameter, Axis axis) {
    if (diameter < 1) {
        return std::unexpected(MorphologyError{
            MorphologyError::Code::InvalidParameters,
            std::format("Element diameter must be positive (got {})", diameter)
        });
    }
    return create(diameter, (diameter - 1) / 2, axis);
}

std::expected<LinearStrel, MorphologyError>
LinearStrel::fromRadius(int radius, Axis axis) {
    if (radius < 0) {
        return std::unexpected(MorphologyError{
            MorphologyError::Code::InvalidParameters,
            std::format("Element radius must be non-negative (got {})", radius)
        });
    }

    constexpr int kMaxRadius = (std::numeric_limits<int>::max() - 1) / 2;
    if (radius > kMaxRadius) {
        return std::unexpected(MorphologyError{
            MorphologyError::Code::InvalidParameters,
            std::format("Element radius {} exceeds the maximum of {}", radius, kMaxRadius)
        });
    }
    return create(2 * radius + 1, radius, axis);
}

LinearStrel LinearStrel::reverse() const noexcept {
    return LinearStrel(length_, length_ - offset_ - 1, axis_);
}

Extent3D LinearStrel::size() const noexcept {
    Extent3D extent{1, 1, 1};
    extent[static_cast<std::size_t>(axis_)] = length_;
    return extent;
}

Extent3D LinearStrel::originOffset() const noexcept {
    Extent3D origin{0, 0, 0};
    origin[static_cast<std::size_t>(axis_)] = offset_;
    return origin;
}

std::vector<Shift3D> LinearStrel::shifts() const {
    const auto dim = static_cast<std::size_t>(axis_);

    std::vector<Shift3D> result;
    result.reserve(static_cast<std::size_t>(length_));
    for (int i = 0; i < length_; ++i) {
        Shift3D shift{0, 0, 0};
        shift[dim] = i - offset_;
        result.push_back(shift);
    }
    return result;
}

LinearStrel::MaskType::Pointer LinearStrel::mask() const {
    return rasterizeShifts(size(), originOffset(), shifts());
}

}  // namespace volmorph::services
