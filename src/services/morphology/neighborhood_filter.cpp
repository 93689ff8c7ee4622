#include "services/morphology/neighborhood_filter.hpp"

#include <algorithm>
#include <cstdlib>

#include <itkFlatStructuringElement.h>
#include <itkGrayscaleDilateImageFilter.h>
#include <itkGrayscaleErodeImageFilter.h>

namespace volmorph::services {

namespace {

using KernelType = itk::FlatStructuringElement<3>;

/**
 * @brief Flat kernel whose active offsets are the given shifts
 *
 * ITK dilation reads the input at `position - offset` while erosion reads
 * it at `position + offset`, so dilation kernels are built from the
 * reflected shift list.
 */
KernelType makeKernel(const std::vector<Shift3D>& shifts, bool reflect) {
    KernelType::RadiusType radius;
    radius.Fill(0);
    for (const auto& shift : shifts) {
        for (unsigned int d = 0; d < 3; ++d) {
            const auto extent = static_cast<KernelType::RadiusType::SizeValueType>(
                std::abs(shift[d]));
            radius[d] = std::max(radius[d], extent);
        }
    }

    KernelType kernel;
    kernel.SetRadius(radius);
    std::fill(kernel.Begin(), kernel.End(), false);

    const int sign = reflect ? -1 : 1;
    for (const auto& shift : shifts) {
        KernelType::OffsetType offset;
        for (unsigned int d = 0; d < 3; ++d) {
            offset[d] = sign * shift[d];
        }
        kernel[offset] = true;
    }
    return kernel;
}

template <typename FilterType>
typename FilterType::OutputImageType::Pointer runFilter(
    const typename FilterType::InputImageType& input,
    const KernelType& kernel,
    typename FilterType::InputImageType::PixelType padding
) {
    auto filter = FilterType::New();
    filter->SetInput(&input);
    filter->SetKernel(kernel);
    filter->SetBoundary(padding);
    filter->Update();

    typename FilterType::OutputImageType::Pointer output = filter->GetOutput();
    output->DisconnectPipeline();
    return output;
}

}  // anonymous namespace

template <typename TPixel>
typename NeighborhoodFilter<TPixel>::ImageType::Pointer
NeighborhoodFilter<TPixel>::dilate(
    const ImageType& input,
    const std::vector<Shift3D>& shifts,
    PixelType background
) {
    using FilterType = itk::GrayscaleDilateImageFilter<ImageType, ImageType, KernelType>;
    return runFilter<FilterType>(input, makeKernel(shifts, true), background);
}

template <typename TPixel>
typename NeighborhoodFilter<TPixel>::ImageType::Pointer
NeighborhoodFilter<TPixel>::erode(
    const ImageType& input,
    const std::vector<Shift3D>& shifts,
    PixelType foreground
) {
    using FilterType = itk::GrayscaleErodeImageFilter<ImageType, ImageType, KernelType>;
    return runFilter<FilterType>(input, makeKernel(shifts, false), foreground);
}

template <typename TPixel>
std::vector<Shift3D> NeighborhoodFilter<TPixel>::reflect(const std::vector<Shift3D>& shifts) {
    std::vector<Shift3D> reflected;
    reflected.reserve(shifts.size());
    for (const auto& shift : shifts) {
        reflected.push_back({-shift[0], -shift[1], -shift[2]});
    }
    return reflected;
}

template class NeighborhoodFilter<unsigned char>;
template class NeighborhoodFilter<short>;
template class NeighborhoodFilter<unsigned short>;
template class NeighborhoodFilter<int>;
template class NeighborhoodFilter<float>;
template class NeighborhoodFilter<double>;

}  // namespace volmorph::services
