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
 * @file separable_strel.hpp
 * @brief 3D structuring element expressed as an ordered set of linear passes
 * @details A separable element is the Minkowski sum of its linear
 *          components. Dilating (resp. eroding) by it equals dilating
 *          (resp. eroding) successively by every component, in any order.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include "linear_strel.hpp"

#include <expected>
#include <utility>
#include <vector>

namespace volmorph::services {

/**
 * @brief Composite structuring element decomposed into linear passes
 *
 * @example
 * @code
 * // 5x5x3 cube centred on its origin
 * auto cube = SeparableStrel::cube(2, 2, 1);
 * if (cube) {
 *     for (const auto& pass : cube->elements()) {
 *         // one LinearStrel per axis
 *     }
 * }
 * @endcode
 */
class SeparableStrel {
public:
    using MaskType = StrelMaskType;

    /**
     * @brief Create a composite from an ordered list of linear elements
     * @return Composite on success, InvalidParameters if the list is empty
     */
    [[nodiscard]] static std::expected<SeparableStrel, MorphologyError>
    create(std::vector<LinearStrel> elements);

    /**
     * @brief Cube (or cuboid) of size (2rx+1) x (2ry+1) x (2rz+1)
     *
     * A zero radius contributes no pass along that axis; an all-zero cube
     * is the identity element.
     */
    [[nodiscard]] static std::expected<SeparableStrel, MorphologyError>
    cube(int radiusX, int radiusY, int radiusZ);

    /**
     * @brief Box of given diameters, origin at floor((d-1)/2) along each axis
     */
    [[nodiscard]] static std::expected<SeparableStrel, MorphologyError>
    box(int sizeX, int sizeY, int sizeZ);

    /// Linear passes in application order (never empty)
    [[nodiscard]] const std::vector<LinearStrel>& elements() const noexcept {
        return elements_;
    }

    /// True when every pass is a length-1 element
    [[nodiscard]] bool isIdentity() const noexcept;

    /// Composite with every component point-reflected
    [[nodiscard]] SeparableStrel reverse() const;

    [[nodiscard]] Extent3D size() const noexcept;
    [[nodiscard]] Extent3D originOffset() const noexcept;
    [[nodiscard]] std::vector<Shift3D> shifts() const;
    [[nodiscard]] MaskType::Pointer mask() const;

    [[nodiscard]] bool operator==(const SeparableStrel& other) const = default;

private:
    explicit SeparableStrel(std::vector<LinearStrel> elements)
        : elements_(std::move(elements)) {}

    std::vector<LinearStrel> elements_;
};

}  // namespace volmorph::services
