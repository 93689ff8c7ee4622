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

#include "services/morphology/linear_filter.hpp"
#include "services/morphology/local_extremum_buffer.hpp"

#include <algorithm>
#include <array>

namespace volmorph::services {

namespace {

template <typename TPixel>
struct MaxPolicy {
    using BufferType = LocalMaxBuffer<TPixel>;
    static TPixel pick(TPixel a, TPixel b) { return std::max(a, b); }
};

template <typename TPixel>
struct MinPolicy {
    using BufferType = LocalMinBuffer<TPixel>;
    static TPixel pick(TPixel a, TPixel b) { return std::min(a, b); }
};

/**
 * @brief Strided view of the image buffer describing all lines along one axis
 */
struct LineLayout {
    itk::OffsetValueType length = 0;
    itk::OffsetValueType stride = 0;
    std::array<itk::OffsetValueType, 2> count{0, 0};
    std::array<itk::OffsetValueType, 2> step{0, 0};
};

template <typename ImageType>
LineLayout makeLayout(const ImageType& image, Axis axis) {
    const auto size = image.GetBufferedRegion().GetSize();
    const auto* offsets = image.GetOffsetTable();

    const auto a = static_cast<unsigned int>(axis);
    const unsigned int b = (a + 1) % 3;
    const unsigned int c = (a + 2) % 3;

    LineLayout layout;
    layout.length = static_cast<itk::OffsetValueType>(size[a]);
    layout.stride = offsets[a];
    layout.count = {static_cast<itk::OffsetValueType>(size[b]),
                    static_cast<itk::OffsetValueType>(size[c])};
    layout.step = {offsets[b], offsets[c]};
    return layout;
}

/**
 * @brief Sliding-window pass over every line along the element axis
 *
 * Per line, with shift = length - offset - 1:
 *  - the window is seeded with padding and primed with the first
 *    min(shift, depth) samples;
 *  - if the element reaches past the line end, the missing samples are
 *    pushed as padding so the window stays aligned with the footprint;
 *  - sample z + shift is pushed before output z is written;
 *  - the last outputs are completed by pushing padding.
 * Writes at z never overtake the reads at z + shift, so the line is
 * updated in place.
 */
template <typename Policy, typename TPixel>
void filterLines(
    itk::Image<TPixel, 3>& image,
    const LinearStrel& strel,
    TPixel padding,
    const LineProgressCallback& progress
) {
    if (strel.isIdentity()) {
        return;
    }

    const auto layout = makeLayout(image, strel.axis());
    const auto totalLines = static_cast<std::size_t>(layout.count[0] * layout.count[1]);
    if (layout.length == 0 || totalLines == 0) {
        return;
    }

    TPixel* buffer = image.GetBufferPointer();
    const itk::OffsetValueType depth = layout.length;
    const itk::OffsetValueType stride = layout.stride;
    const itk::OffsetValueType shift = strel.shift();
    const itk::OffsetValueType length = strel.length();

    // Single-sample lines: the footprint is the sample plus padding
    if (depth == 1) {
        std::size_t line = 0;
        for (itk::OffsetValueType j = 0; j < layout.count[1]; ++j) {
            for (itk::OffsetValueType i = 0; i < layout.count[0]; ++i) {
                TPixel* voxel = buffer + i * layout.step[0] + j * layout.step[1];
                *voxel = Policy::pick(*voxel, padding);
                if (progress) {
                    progress(line, totalLines);
                }
                ++line;
            }
        }
        return;
    }

    typename Policy::BufferType window(static_cast<std::size_t>(length));

    const itk::OffsetValueType lead = std::min(shift, depth);
    const itk::OffsetValueType overhang = std::min(shift - lead, length);
    const itk::OffsetValueType tailStart = std::max<itk::OffsetValueType>(0, depth - shift);

    std::size_t line = 0;
    for (itk::OffsetValueType j = 0; j < layout.count[1]; ++j) {
        for (itk::OffsetValueType i = 0; i < layout.count[0]; ++i) {
            TPixel* samples = buffer + i * layout.step[0] + j * layout.step[1];

            window.fill(padding);

            for (itk::OffsetValueType z = 0; z < lead; ++z) {
                window.add(samples[z * stride]);
            }

            for (itk::OffsetValueType k = 0; k < overhang; ++k) {
                window.add(padding);
            }

            for (itk::OffsetValueType z = 0; z + shift < depth; ++z) {
                window.add(samples[(z + shift) * stride]);
                samples[z * stride] = window.value();
            }

            for (itk::OffsetValueType z = tailStart; z < depth; ++z) {
                window.add(padding);
                samples[z * stride] = window.value();
            }

            if (progress) {
                progress(line, totalLines);
            }
            ++line;
        }
    }
}

}  // anonymous namespace

template <typename TPixel>
void LinearFilter<TPixel>::dilate(
    ImageType& image,
    const LinearStrel& strel,
    PixelType background,
    const LineProgressCallback& progress
) {
    filterLines<MaxPolicy<TPixel>>(image, strel, background, progress);
}

template <typename TPixel>
void LinearFilter<TPixel>::erode(
    ImageType& image,
    const LinearStrel& strel,
    PixelType foreground,
    const LineProgressCallback& progress
) {
    filterLines<MinPolicy<TPixel>>(image, strel, foreground, progress);
}

template <typename TPixel>
std::size_t LinearFilter<TPixel>::lineCount(const ImageType& image, Axis axis) {
    const auto layout = makeLayout(image, axis);
    return static_cast<std::size_t>(layout.count[0] * layout.count[1]);
}

template class LinearFilter<unsigned char>;
template class LinearFilter<short>;
template class LinearFilter<unsigned short>;
template class LinearFilter<int>;
template class LinearFilter<float>;
template class LinearFilter<double>;

}  // namespace volmorph::services
