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
 * @file morphological_filter.hpp
 * @brief Separable grayscale morphology on 3D volumes
 * @details Composes the in-place linear kernels into dilation, erosion,
 *          opening and closing by any StructuringElement, and derives the
 *          gradient and top-hat operators from them. Arbitrary
 *          (non-separable) elements given as a shift list are processed by
 *          the brute-force neighborhood filter.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include "morphology_types.hpp"
#include "structuring_element.hpp"

#include <expected>
#include <optional>
#include <vector>

#include <itkImage.h>
#include <itkNumericTraits.h>

namespace volmorph::services {

/**
 * @brief Grayscale morphological filter for one voxel type
 *
 * Elements are applied pass by pass, one linear element at a time, directly
 * on the image buffer. Opening is erosion by the element followed by
 * dilation by its reverse; closing is dilation followed by erosion by the
 * reverse.
 *
 * @example
 * @code
 * MorphologicalFilter<unsigned char> filter;
 *
 * auto cube = SeparableStrel::cube(2, 2, 1);
 * if (cube) {
 *     // In place
 *     auto status = filter.apply(image, MorphologicalOperation::Closing, *cube);
 *
 *     // Out of place, reporting progress per scan line
 *     auto result = filter.process(image, MorphologicalOperation::Opening, *cube, {},
 *         [](std::size_t line, std::size_t total) { ... });
 * }
 * @endcode
 *
 * @tparam TPixel Scalar voxel type (unsigned char, short, unsigned short,
 *         int, float or double)
 */
template <typename TPixel>
class MorphologicalFilter {
public:
    using ImageType = itk::Image<TPixel, 3>;
    using PixelType = TPixel;

    /**
     * @brief Border padding configuration
     */
    struct Parameters {
        /// Value of out-of-image samples for dilation (default: lowest value)
        std::optional<PixelType> background;

        /// Value of out-of-image samples for erosion (default: highest value)
        std::optional<PixelType> foreground;

        [[nodiscard]] PixelType backgroundValue() const noexcept {
            return background.value_or(itk::NumericTraits<PixelType>::NonpositiveMin());
        }

        [[nodiscard]] PixelType foregroundValue() const noexcept {
            return foreground.value_or(itk::NumericTraits<PixelType>::max());
        }

        /**
         * @brief Validate parameters
         * @return true if background does not exceed foreground
         */
        [[nodiscard]] bool isValid() const noexcept {
            return !(foregroundValue() < backgroundValue());
        }
    };

    MorphologicalFilter() = default;

    /**
     * @brief Apply an operation in place
     *
     * @param image Image to modify
     * @param operation Operation to apply
     * @param element Separable structuring element
     * @param params Padding configuration
     * @param progress Optional per-line callback; line indices accumulate over
     *        every pass of the operation
     * @return Nothing on success, error on failure
     */
    [[nodiscard]] std::expected<void, MorphologyError> apply(
        typename ImageType::Pointer image,
        MorphologicalOperation operation,
        const StructuringElement& element,
        const Parameters& params = {},
        const LineProgressCallback& progress = {}
    ) const;

    /**
     * @brief Apply an operation to a copy of the input
     *
     * The result keeps the input spacing, origin and direction.
     *
     * @return Filtered copy on success, error on failure
     */
    [[nodiscard]] std::expected<typename ImageType::Pointer, MorphologyError> process(
        typename ImageType::Pointer input,
        MorphologicalOperation operation,
        const StructuringElement& element,
        const Parameters& params = {},
        const LineProgressCallback& progress = {}
    ) const;

    [[nodiscard]] std::expected<void, MorphologyError> dilation(
        typename ImageType::Pointer image,
        const StructuringElement& element,
        const Parameters& params = {},
        const LineProgressCallback& progress = {}
    ) const;

    [[nodiscard]] std::expected<void, MorphologyError> erosion(
        typename ImageType::Pointer image,
        const StructuringElement& element,
        const Parameters& params = {},
        const LineProgressCallback& progress = {}
    ) const;

    [[nodiscard]] std::expected<void, MorphologyError> opening(
        typename ImageType::Pointer image,
        const StructuringElement& element,
        const Parameters& params = {},
        const LineProgressCallback& progress = {}
    ) const;

    [[nodiscard]] std::expected<void, MorphologyError> closing(
        typename ImageType::Pointer image,
        const StructuringElement& element,
        const Parameters& params = {},
        const LineProgressCallback& progress = {}
    ) const;

    /**
     * @brief Morphological gradient: dilation minus erosion
     */
    [[nodiscard]] std::expected<typename ImageType::Pointer, MorphologyError> gradient(
        typename ImageType::Pointer input,
        const StructuringElement& element,
        const Parameters& params = {}
    ) const;

    /**
     * @brief White top-hat: input minus its opening (small bright features)
     */
    [[nodiscard]] std::expected<typename ImageType::Pointer, MorphologyError> whiteTopHat(
        typename ImageType::Pointer input,
        const StructuringElement& element,
        const Parameters& params = {}
    ) const;

    /**
     * @brief Black top-hat: closing minus input (small dark features)
     */
    [[nodiscard]] std::expected<typename ImageType::Pointer, MorphologyError> blackTopHat(
        typename ImageType::Pointer input,
        const StructuringElement& element,
        const Parameters& params = {}
    ) const;

    /**
     * @brief Apply an operation with an arbitrary element given by its shifts
     *
     * Uses brute-force neighborhood scanning; the reversed element of
     * opening/closing is the negated shift list.
     *
     * @param input Input image (left unchanged)
     * @param operation Operation to apply
     * @param shifts Non-empty shift list relative to the element origin
     * @param params Padding configuration
     * @return Filtered image on success, error on failure
     */
    [[nodiscard]] std::expected<typename ImageType::Pointer, MorphologyError> applyGeneric(
        typename ImageType::Pointer input,
        MorphologicalOperation operation,
        const std::vector<Shift3D>& shifts,
        const Parameters& params = {}
    ) const;

    /**
     * @brief Deep copy of an image (pixels and geometry)
     */
    [[nodiscard]] static typename ImageType::Pointer duplicate(typename ImageType::Pointer input);
};

/**
 * @brief Render an element as an 8-bit image
 *
 * The image is 10 voxels larger than the element along each axis; voxels at
 * `center + shift` for every element shift are 255, all others 0.
 *
 * @param element Element to render
 * @return Rendered image on success, error on failure
 */
[[nodiscard]] std::expected<itk::Image<unsigned char, 3>::Pointer, MorphologyError>
renderElement(const StructuringElement& element);

extern template class MorphologicalFilter<unsigned char>;
extern template class MorphologicalFilter<short>;
extern template class MorphologicalFilter<unsigned short>;
extern template class MorphologicalFilter<int>;
extern template class MorphologicalFilter<float>;
extern template class MorphologicalFilter<double>;

}  // namespace volmorph::services
