// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

/**
 * @file linear_strel.hpp
 * @brief Axis-aligned linear structuring element
 * @details A LinearStrel is a 1D segment of `length` voxels aligned with one
 *          of the principal axes, with its origin `offset` voxels after the
 *          first sample. It is immutable once created; all factories
 *          validate the length/offset invariants and report violations
 *          through std::expected.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include "morphology_types.hpp"
#include "strel_geometry.hpp"

#include <expected>
#include <vector>

namespace volmorph::services {

/**
 * @brief Linear structuring element along the X, Y or Z axis
 *
 * The element covers the samples at positions `p - offset ... p + shift`
 * along its axis, where `p` is the reference position and
 * `shift = length - offset - 1`.
 *
 * @example
 * @code
 * // Symmetric 5-voxel segment along Z
 * auto strel = LinearStrel::fromRadius(2, Axis::Z);
 * if (strel) {
 *     auto mirrored = strel->reverse();  // same element, offset 2
 * }
 *
 * // Forward-looking segment: origin at the first sample
 * auto forward = LinearStrel::create(4, 0, Axis::X);
 * @endcode
 */
class LinearStrel {
public:
    /// Binary mask type (255 inside the element, 0 elsewhere)
    using MaskType = StrelMaskType;

    /**
     * @brief Create an element from an explicit length and origin offset
     *
     * @param length Number of samples (>= 1)
     * @param offset Origin position within the element (0 <= offset < length)
     * @param axis Element orientation
     * @return Element on success, InvalidParameters error otherwise
     */
    [[nodiscard]] static std::expected<LinearStrel, MorphologyError>
    create(int length, int offset, Axis axis);

    /**
     * @brief Create an element of given diameter, origin at floor((d-1)/2)
     */
    [[nodiscard]] static std::expected<LinearStrel, MorphologyError>
    fromDiameter(int diameter, Axis axis);

    /**
     * @brief Create a symmetric element of length 2r+1, origin at r
     *
     * Radii whose length would not fit in an int are rejected.
     */
    [[nodiscard]] static std::expected<LinearStrel, MorphologyError>
    fromRadius(int radius, Axis axis);

    [[nodiscard]] int length() const noexcept { return length_; }
    [[nodiscard]] int offset() const noexcept { return offset_; }
    [[nodiscard]] Axis axis() const noexcept { return axis_; }

    /// Distance from the origin to the far end of the element
    [[nodiscard]] int shift() const noexcept { return length_ - offset_ - 1; }

    /// A length-1 element leaves every image unchanged
    [[nodiscard]] bool isIdentity() const noexcept { return length_ <= 1; }

    /**
     * @brief Point-reflected element: same length, offset' = length - offset - 1
     */
    [[nodiscard]] LinearStrel reverse() const noexcept;

    /// Bounding size along (x, y, z)
    [[nodiscard]] Extent3D size() const noexcept;

    /// Origin position along (x, y, z)
    [[nodiscard]] Extent3D originOffset() const noexcept;

    /// Shift vectors of every sample relative to the origin, ordered along the axis
    [[nodiscard]] std::vector<Shift3D> shifts() const;

    /// Binary mask of bounding size with every sample set to 255
    [[nodiscard]] MaskType::Pointer mask() const;

    [[nodiscard]] bool operator==(const LinearStrel& other) const noexcept = default;

private:
    LinearStrel(int length, int offset, Axis axis) noexcept
        : length_(length), offset_(offset), axis_(axis) {}

    int length_;
    int offset_;
    Axis axis_;
};

}  // namespace volmorph::services
