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
 * @file linear_filter.hpp
 * @brief In-place dilation and erosion by a linear structuring element
 * @details Every scan line parallel to the element axis is processed with
 *          a single sliding-window pass that reads ahead of the output
 *          position and writes behind it in the same buffer. Out-of-grid
 *          samples are taken as a constant padding value. The cost is
 *          O(voxel count) whatever the element length, with O(length)
 *          extra memory.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include "linear_strel.hpp"
#include "morphology_types.hpp"

#include <itkImage.h>

namespace volmorph::services {

/**
 * @brief Separable line kernel for one pixel type
 *
 * Instantiated for unsigned char, short, unsigned short, int, float and
 * double voxels.
 *
 * @tparam TPixel Scalar voxel type
 *
 * @example
 * @code
 * auto strel = LinearStrel::fromRadius(1, Axis::Z);
 * LinearFilter<unsigned char>::dilate(*image, *strel, 0);
 * @endcode
 */
template <typename TPixel>
class LinearFilter {
public:
    using ImageType = itk::Image<TPixel, 3>;
    using PixelType = TPixel;

    /**
     * @brief Replace every voxel by the maximum over the element footprint
     *
     * @param image Image modified in place (buffered region)
     * @param strel Linear element; identity elements leave the image untouched
     * @param background Value of the virtual samples outside the image
     * @param progress Optional callback invoked once per scan line
     */
    static void dilate(
        ImageType& image,
        const LinearStrel& strel,
        PixelType background,
        const LineProgressCallback& progress = {}
    );

    /**
     * @brief Replace every voxel by the minimum over the element footprint
     *
     * @param image Image modified in place (buffered region)
     * @param strel Linear element; identity elements leave the image untouched
     * @param foreground Value of the virtual samples outside the image
     * @param progress Optional callback invoked once per scan line
     */
    static void erode(
        ImageType& image,
        const LinearStrel& strel,
        PixelType foreground,
        const LineProgressCallback& progress = {}
    );

    /// Number of scan lines a pass along @p axis visits
    [[nodiscard]] static std::size_t lineCount(const ImageType& image, Axis axis);
};

extern template class LinearFilter<unsigned char>;
extern template class LinearFilter<short>;
extern template class LinearFilter<unsigned short>;
extern template class LinearFilter<int>;
extern template class LinearFilter<float>;
extern template class LinearFilter<double>;

}  // namespace volmorph::services
