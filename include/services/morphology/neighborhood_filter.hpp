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
 * @file neighborhood_filter.hpp
 * @brief Dilation and erosion over an arbitrary shift list
 * @details Each output voxel is the extremum of the input voxels at
 *          `position + shift` for every shift of the element, with samples
 *          outside the image replaced by a padding value. The shift list is
 *          converted to an itk::FlatStructuringElement and processed by
 *          ITK's grayscale dilate/erode filters. This path serves elements
 *          that cannot be decomposed into linear passes.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include "morphology_types.hpp"

#include <vector>

#include <itkImage.h>

namespace volmorph::services {

/**
 * @brief Out-of-place neighborhood extremum filter
 *
 * ITK exceptions raised by the underlying filters propagate to the caller.
 *
 * @tparam TPixel Scalar voxel type
 */
template <typename TPixel>
class NeighborhoodFilter {
public:
    using ImageType = itk::Image<TPixel, 3>;
    using PixelType = TPixel;

    /**
     * @brief Neighborhood maximum; a new image with the input geometry
     */
    [[nodiscard]] static typename ImageType::Pointer dilate(
        const ImageType& input,
        const std::vector<Shift3D>& shifts,
        PixelType background
    );

    /**
     * @brief Neighborhood minimum; a new image with the input geometry
     */
    [[nodiscard]] static typename ImageType::Pointer erode(
        const ImageType& input,
        const std::vector<Shift3D>& shifts,
        PixelType foreground
    );

    /// Shifts of the point-reflected element (every vector negated)
    [[nodiscard]] static std::vector<Shift3D> reflect(const std::vector<Shift3D>& shifts);
};

extern template class NeighborhoodFilter<unsigned char>;
extern template class NeighborhoodFilter<short>;
extern template class NeighborhoodFilter<unsigned short>;
extern template class NeighborhoodFilter<int>;
extern template class NeighborhoodFilter<float>;
extern template class NeighborhoodFilter<double>;

}  // namespace volmorph::services
