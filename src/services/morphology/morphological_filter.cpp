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

#include "services/morphology/morphological_filter.hpp"
#include "services/morphology/linear_filter.hpp"
#include "services/morphology/neighborhood_filter.hpp"
#include "core/logging.hpp"

#include <stdexcept>
#include <string>

#include <itkImageDuplicator.h>
#include <itkSubtractImageFilter.h>

namespace volmorph::services {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("MorphologicalFilter");
    return logger;
}

/**
 * @brief Runs a sequence of linear passes and reports cumulative line progress
 */
template <typename TPixel>
class PassRunner {
public:
    using ImageType = itk::Image<TPixel, 3>;

    PassRunner(ImageType& image, const LineProgressCallback& progress, std::size_t totalLines)
        : image_(image), progress_(progress), totalLines_(totalLines) {}

    void dilate(const std::vector<LinearStrel>& passes, TPixel background) {
        for (const auto& pass : passes) {
            LinearFilter<TPixel>::dilate(image_, pass, background, passProgress());
            advance(pass);
        }
    }

    void erode(const std::vector<LinearStrel>& passes, TPixel foreground) {
        for (const auto& pass : passes) {
            LinearFilter<TPixel>::erode(image_, pass, foreground, passProgress());
            advance(pass);
        }
    }

private:
    void advance(const LinearStrel& pass) {
        if (!pass.isIdentity()) {
            linesDone_ += LinearFilter<TPixel>::lineCount(image_, pass.axis());
        }
    }

    LineProgressCallback passProgress() const {
        if (!progress_) {
            return {};
        }
        return [this](std::size_t line, std::size_t) {
            progress_(linesDone_ + line, totalLines_);
        };
    }

    ImageType& image_;
    const LineProgressCallback& progress_;
    std::size_t totalLines_;
    std::size_t linesDone_ = 0;
};

template <typename TPixel>
std::size_t countLines(const itk::Image<TPixel, 3>& image, const std::vector<LinearStrel>& passes) {
    std::size_t total = 0;
    for (const auto& pass : passes) {
        if (!pass.isIdentity()) {
            total += LinearFilter<TPixel>::lineCount(image, pass.axis());
        }
    }
    return total;
}

MorphologyError nullInputError() {
    getLogger()->error("Input image is null");
    return MorphologyError{
        MorphologyError::Code::InvalidInput,
        "Input image is null"
    };
}

MorphologyError invalidPaddingError() {
    getLogger()->error("Background padding exceeds foreground padding");
    return MorphologyError{
        MorphologyError::Code::InvalidParameters,
        "Background padding must not exceed foreground padding"
    };
}

MorphologyError itkError(const itk::ExceptionObject& e) {
    getLogger()->error("ITK exception: {}", e.GetDescription());
    return MorphologyError{
        MorphologyError::Code::ProcessingFailed,
        std::string("ITK exception: ") + e.GetDescription()
    };
}

MorphologyError standardError(const std::exception& e) {
    getLogger()->error("Standard exception: {}", e.what());
    return MorphologyError{
        MorphologyError::Code::InternalError,
        std::string("Standard exception: ") + e.what()
    };
}

template <typename ImageType>
std::expected<typename ImageType::Pointer, MorphologyError>
subtractImages(typename ImageType::Pointer minuend, typename ImageType::Pointer subtrahend) {
    using FilterType = itk::SubtractImageFilter<ImageType, ImageType, ImageType>;
    auto filter = FilterType::New();
    filter->SetInput1(minuend);
    filter->SetInput2(subtrahend);
    filter->Update();
    return filter->GetOutput();
}

}  // anonymous namespace

template <typename TPixel>
std::expected<void, MorphologyError>
MorphologicalFilter<TPixel>::apply(
    typename ImageType::Pointer image,
    MorphologicalOperation operation,
    const StructuringElement& element,
    const Parameters& params,
    const LineProgressCallback& progress
) const {
    if (!image) {
        return std::unexpected(nullInputError());
    }

    if (!params.isValid()) {
        return std::unexpected(invalidPaddingError());
    }

    const auto size = image->GetBufferedRegion().GetSize();
    getLogger()->info("{} with {} on {}x{}x{} volume",
                      operationToString(operation), describe(element),
                      size[0], size[1], size[2]);

    try {
        const auto passes = decompose(element);
        const auto reversedPasses = decompose(reverse(element));

        for (const auto& pass : passes) {
            getLogger()->debug("Pass {}: length {}, offset {}",
                               axisToString(pass.axis()), pass.length(), pass.offset());
        }

        const bool composite = operation == MorphologicalOperation::Opening
                            || operation == MorphologicalOperation::Closing;
        const std::size_t totalLines =
            countLines(*image, passes) * (composite ? 2 : 1);

        PassRunner<TPixel> runner(*image, progress, totalLines);
        switch (operation) {
            case MorphologicalOperation::Dilation:
                runner.dilate(passes, params.backgroundValue());
                break;
            case MorphologicalOperation::Erosion:
                runner.erode(passes, params.foregroundValue());
                break;
            case MorphologicalOperation::Opening:
                runner.erode(passes, params.foregroundValue());
                runner.dilate(reversedPasses, params.backgroundValue());
                break;
            case MorphologicalOperation::Closing:
                runner.dilate(passes, params.backgroundValue());
                runner.erode(reversedPasses, params.foregroundValue());
                break;
        }

        image->Modified();
        return {};
    }
    catch (const itk::ExceptionObject& e) {
        return std::unexpected(itkError(e));
    }
    catch (const std::exception& e) {
        return std::unexpected(standardError(e));
    }
}

template <typename TPixel>
std::expected<typename MorphologicalFilter<TPixel>::ImageType::Pointer, MorphologyError>
MorphologicalFilter<TPixel>::process(
    typename ImageType::Pointer input,
    MorphologicalOperation operation,
    const StructuringElement& element,
    const Parameters& params,
    const LineProgressCallback& progress
) const {
    if (!input) {
        return std::unexpected(nullInputError());
    }

    typename ImageType::Pointer output;
    try {
        output = duplicate(input);
    }
    catch (const itk::ExceptionObject& e) {
        return std::unexpected(itkError(e));
    }
    catch (const std::exception& e) {
        return std::unexpected(standardError(e));
    }

    auto status = apply(output, operation, element, params, progress);
    if (!status) {
        return std::unexpected(status.error());
    }
    return output;
}

template <typename TPixel>
std::expected<void, MorphologyError>
MorphologicalFilter<TPixel>::dilation(
    typename ImageType::Pointer image,
    const StructuringElement& element,
    const Parameters& params,
    const LineProgressCallback& progress
) const {
    return apply(image, MorphologicalOperation::Dilation, element, params, progress);
}

template <typename TPixel>
std::expected<void, MorphologyError>
MorphologicalFilter<TPixel>::erosion(
    typename ImageType::Pointer image,
    const StructuringElement& element,
    const Parameters& params,
    const LineProgressCallback& progress
) const {
    return apply(image, MorphologicalOperation::Erosion, element, params, progress);
}

template <typename TPixel>
std::expected<void, MorphologyError>
MorphologicalFilter<TPixel>::opening(
    typename ImageType::Pointer image,
    const StructuringElement& element,
    const Parameters& params,
    const LineProgressCallback& progress
) const {
    return apply(image, MorphologicalOperation::Opening, element, params, progress);
}

template <typename TPixel>
std::expected<void, MorphologyError>
MorphologicalFilter<TPixel>::closing(
    typename ImageType::Pointer image,
    const StructuringElement& element,
    const Parameters& params,
    const LineProgressCallback& progress
) const {
    return apply(image, MorphologicalOperation::Closing, element, params, progress);
}

template <typename TPixel>
std::expected<typename MorphologicalFilter<TPixel>::ImageType::Pointer, MorphologyError>
MorphologicalFilter<TPixel>::gradient(
    typename ImageType::Pointer input,
    const StructuringElement& element,
    const Parameters& params
) const {
    auto dilated = process(input, MorphologicalOperation::Dilation, element, params);
    if (!dilated) {
        return std::unexpected(dilated.error());
    }
    auto eroded = process(input, MorphologicalOperation::Erosion, element, params);
    if (!eroded) {
        return std::unexpected(eroded.error());
    }

    try {
        return subtractImages<ImageType>(*dilated, *eroded);
    }
    catch (const itk::ExceptionObject& e) {
        return std::unexpected(itkError(e));
    }
    catch (const std::exception& e) {
        return std::unexpected(standardError(e));
    }
}

template <typename TPixel>
std::expected<typename MorphologicalFilter<TPixel>::ImageType::Pointer, MorphologyError>
MorphologicalFilter<TPixel>::whiteTopHat(
    typename ImageType::Pointer input,
    const StructuringElement& element,
    const Parameters& params
) const {
    auto opened = process(input, MorphologicalOperation::Opening, element, params);
    if (!opened) {
        return std::unexpected(opened.error());
    }

    try {
        return subtractImages<ImageType>(input, *opened);
    }
    catch (const itk::ExceptionObject& e) {
        return std::unexpected(itkError(e));
    }
    catch (const std::exception& e) {
        return std::unexpected(standardError(e));
    }
}

template <typename TPixel>
std::expected<typename MorphologicalFilter<TPixel>::ImageType::Pointer, MorphologyError>
MorphologicalFilter<TPixel>::blackTopHat(
    typename ImageType::Pointer input,
    const StructuringElement& element,
    const Parameters& params
) const {
    auto closed = process(input, MorphologicalOperation::Closing, element, params);
    if (!closed) {
        return std::unexpected(closed.error());
    }

    try {
        return subtractImages<ImageType>(*closed, input);
    }
    catch (const itk::ExceptionObject& e) {
        return std::unexpected(itkError(e));
    }
    catch (const std::exception& e) {
        return std::unexpected(standardError(e));
    }
}

template <typename TPixel>
std::expected<typename MorphologicalFilter<TPixel>::ImageType::Pointer, MorphologyError>
MorphologicalFilter<TPixel>::applyGeneric(
    typename ImageType::Pointer input,
    MorphologicalOperation operation,
    const std::vector<Shift3D>& shifts,
    const Parameters& params
) const {
    if (!input) {
        return std::unexpected(nullInputError());
    }

    if (shifts.empty()) {
        getLogger()->error("Generic element has no shifts");
        return std::unexpected(MorphologyError{
            MorphologyError::Code::InvalidParameters,
            "Structuring element must contain at least one shift"
        });
    }

    if (!params.isValid()) {
        return std::unexpected(invalidPaddingError());
    }

    getLogger()->info("{} with generic element ({} shifts)",
                      operationToString(operation), shifts.size());

    using Neighborhood = NeighborhoodFilter<TPixel>;
    const auto reflected = Neighborhood::reflect(shifts);

    try {
        switch (operation) {
            case MorphologicalOperation::Dilation:
                return Neighborhood::dilate(*input, shifts, params.backgroundValue());
            case MorphologicalOperation::Erosion:
                return Neighborhood::erode(*input, shifts, params.foregroundValue());
            case MorphologicalOperation::Opening: {
                auto eroded = Neighborhood::erode(*input, shifts, params.foregroundValue());
                return Neighborhood::dilate(*eroded, reflected, params.backgroundValue());
            }
            case MorphologicalOperation::Closing: {
                auto dilated = Neighborhood::dilate(*input, shifts, params.backgroundValue());
                return Neighborhood::erode(*dilated, reflected, params.foregroundValue());
            }
        }
    }
    catch (const itk::ExceptionObject& e) {
        return std::unexpected(itkError(e));
    }
    catch (const std::exception& e) {
        return std::unexpected(standardError(e));
    }

    return std::unexpected(MorphologyError{
        MorphologyError::Code::InvalidParameters,
        "Unknown morphological operation"
    });
}

template <typename TPixel>
typename MorphologicalFilter<TPixel>::ImageType::Pointer
MorphologicalFilter<TPixel>::duplicate(typename ImageType::Pointer input) {
    using DuplicatorType = itk::ImageDuplicator<ImageType>;
    auto duplicator = DuplicatorType::New();
    duplicator->SetInputImage(input);
    duplicator->Update();
    return duplicator->GetModifiableOutput();
}

std::expected<itk::Image<unsigned char, 3>::Pointer, MorphologyError>
renderElement(const StructuringElement& element) {
    using ImageType = itk::Image<unsigned char, 3>;

    const auto extent = elementSize(element);

    ImageType::SizeType size;
    ImageType::IndexType center;
    for (unsigned int d = 0; d < 3; ++d) {
        size[d] = static_cast<ImageType::SizeValueType>(extent[d] + 10);
        center[d] = static_cast<ImageType::IndexValueType>(size[d] / 2);
    }

    ImageType::IndexType start;
    start.Fill(0);

    ImageType::RegionType region;
    region.SetSize(size);
    region.SetIndex(start);

    auto image = ImageType::New();
    try {
        image->SetRegions(region);
        image->Allocate();
        image->FillBuffer(0);
    }
    catch (const itk::ExceptionObject& e) {
        return std::unexpected(itkError(e));
    }
    catch (const std::exception& e) {
        return std::unexpected(standardError(e));
    }
    image->SetPixel(center, 255);

    // Dilating a point by the reflected element stamps the element itself
    MorphologicalFilter<unsigned char> filter;
    MorphologicalFilter<unsigned char>::Parameters params;
    params.background = 0;
    auto status = filter.dilation(image, reverse(element), params);
    if (!status) {
        return std::unexpected(status.error());
    }
    return image;
}

template class MorphologicalFilter<unsigned char>;
template class MorphologicalFilter<short>;
template class MorphologicalFilter<unsigned short>;
template class MorphologicalFilter<int>;
template class MorphologicalFilter<float>;
template class MorphologicalFilter<double>;

}  // namespace volmorph::services
