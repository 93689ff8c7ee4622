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

#include "../test_utils/volume_generator.hpp"

#include <gtest/gtest.h>

#include <itkImageRegionConstIterator.h>

#include <cstdint>
#include <set>
#include <stdexcept>
#include <vector>

namespace volmorph::services::test {

using test_utils::createCubeVolume;
using test_utils::createLine;
using test_utils::createRandomVolume;
using test_utils::referenceLinearFilter;
using test_utils::toVector;

class MorphologicalFilterTest : public ::testing::Test {
protected:
    using FilterType = MorphologicalFilter<unsigned char>;
    using ImageType = FilterType::ImageType;

    static SeparableStrel makeCube(int rx, int ry, int rz) {
        auto cube = SeparableStrel::cube(rx, ry, rz);
        EXPECT_TRUE(cube.has_value());
        return *cube;
    }

    static std::vector<unsigned char> complement(const std::vector<unsigned char>& values) {
        std::vector<unsigned char> result;
        result.reserve(values.size());
        for (auto v : values) {
            result.push_back(static_cast<unsigned char>(255 - v));
        }
        return result;
    }

    FilterType filter_;
};

// ============================================================================
// Error handling
// ============================================================================

TEST_F(MorphologicalFilterTest, NullInputReturnsError) {
    auto status = filter_.apply(ImageType::Pointer{}, MorphologicalOperation::Dilation,
                                makeCube(1, 1, 1));
    ASSERT_FALSE(status.has_value());
    EXPECT_EQ(status.error().code, MorphologyError::Code::InvalidInput);

    auto result = filter_.process(ImageType::Pointer{}, MorphologicalOperation::Erosion,
                                  makeCube(1, 1, 1));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, MorphologyError::Code::InvalidInput);
}

TEST_F(MorphologicalFilterTest, InvertedPaddingIsRejected) {
    auto image = createRandomVolume<unsigned char>(4, 4, 4, 1);

    FilterType::Parameters params;
    params.background = 200;
    params.foreground = 100;
    EXPECT_FALSE(params.isValid());

    auto status = filter_.closing(image, makeCube(1, 1, 1), params);
    ASSERT_FALSE(status.has_value());
    EXPECT_EQ(status.error().code, MorphologyError::Code::InvalidParameters);
}

TEST_F(MorphologicalFilterTest, DefaultPaddingSpansPixelRange) {
    FilterType::Parameters params;
    EXPECT_TRUE(params.isValid());
    EXPECT_EQ(params.backgroundValue(), 0);
    EXPECT_EQ(params.foregroundValue(), 255);

    MorphologicalFilter<short>::Parameters shortParams;
    EXPECT_EQ(shortParams.backgroundValue(), -32768);
    EXPECT_EQ(shortParams.foregroundValue(), 32767);

    MorphologicalFilter<float>::Parameters floatParams;
    EXPECT_LT(floatParams.backgroundValue(), -1.0e30f);
    EXPECT_GT(floatParams.foregroundValue(), 1.0e30f);
}

TEST_F(MorphologicalFilterTest, GenericRejectsEmptyShiftList) {
    auto image = createRandomVolume<unsigned char>(3, 3, 3, 2);
    auto result = filter_.applyGeneric(image, MorphologicalOperation::Dilation, {});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, MorphologyError::Code::InvalidParameters);
}

TEST_F(MorphologicalFilterTest, ErrorToString) {
    EXPECT_EQ(MorphologyError{}.toString(), "Success");
    EXPECT_TRUE(MorphologyError{}.isSuccess());

    MorphologyError error{MorphologyError::Code::InvalidInput, "Input image is null"};
    EXPECT_FALSE(error.isSuccess());
    EXPECT_EQ(error.toString(), "Invalid input: Input image is null");

    error.code = MorphologyError::Code::InvalidParameters;
    EXPECT_EQ(error.toString(), "Invalid parameters: Input image is null");
}

TEST_F(MorphologicalFilterTest, StandardExceptionMapsToInternalError) {
    auto image = createRandomVolume<unsigned char>(4, 4, 4, 3);
    auto failing = [](std::size_t, std::size_t) {
        throw std::runtime_error("callback failed");
    };

    auto status = filter_.apply(image, MorphologicalOperation::Dilation,
                                makeCube(1, 1, 1), {}, failing);
    ASSERT_FALSE(status.has_value());
    EXPECT_EQ(status.error().code, MorphologyError::Code::InternalError);
    EXPECT_NE(status.error().message.find("callback failed"), std::string::npos);

    auto result = filter_.process(image, MorphologicalOperation::Closing,
                                  makeCube(1, 0, 0), {}, failing);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, MorphologyError::Code::InternalError);
}

TEST_F(MorphologicalFilterTest, ItkExceptionMapsToProcessingFailed) {
    auto image = createRandomVolume<unsigned char>(4, 4, 4, 4);
    auto status = filter_.erosion(image, makeCube(0, 1, 0), {},
        [](std::size_t, std::size_t) {
            throw itk::ExceptionObject(__FILE__, __LINE__, "pipeline aborted");
        });
    ASSERT_FALSE(status.has_value());
    EXPECT_EQ(status.error().code, MorphologyError::Code::ProcessingFailed);
    EXPECT_NE(status.error().message.find("pipeline aborted"), std::string::npos);
}

// ============================================================================
// Single operations
// ============================================================================

TEST_F(MorphologicalFilterTest, DilationGrowsBrightCube) {
    auto image = createCubeVolume<unsigned char>(11, 1, 200);
    ASSERT_TRUE(filter_.dilation(image, makeCube(2, 2, 2)).has_value());

    auto expected = createCubeVolume<unsigned char>(11, 3, 200);
    EXPECT_EQ(toVector(image), toVector(expected));
}

TEST_F(MorphologicalFilterTest, ErosionShrinksBrightCube) {
    auto image = createCubeVolume<unsigned char>(11, 3, 200);
    ASSERT_TRUE(filter_.erosion(image, makeCube(1, 1, 1)).has_value());

    auto expected = createCubeVolume<unsigned char>(11, 2, 200);
    EXPECT_EQ(toVector(image), toVector(expected));
}

TEST_F(MorphologicalFilterTest, LinearElementMatchesReference) {
    auto source = createRandomVolume<unsigned char>(6, 7, 8, 3);
    auto image = createRandomVolume<unsigned char>(6, 7, 8, 3);

    auto strel = LinearStrel::create(5, 1, Axis::Y);
    ASSERT_TRUE(strel.has_value());
    ASSERT_TRUE(filter_.erosion(image, *strel).has_value());

    EXPECT_EQ(toVector(image), referenceLinearFilter(source, 5, 1, 1, false, 255));
}

TEST_F(MorphologicalFilterTest, SeparableMatchesNeighborhoodForAllOperations) {
    const std::vector<SeparableStrel> elements{
        makeCube(1, 1, 1),
        makeCube(2, 0, 1),
        *SeparableStrel::box(4, 3, 2),
    };
    const std::vector<MorphologicalOperation> operations{
        MorphologicalOperation::Dilation, MorphologicalOperation::Erosion,
        MorphologicalOperation::Opening, MorphologicalOperation::Closing};

    std::uint32_t seed = 40;
    for (const auto& element : elements) {
        for (auto operation : operations) {
            auto input = createRandomVolume<unsigned char>(7, 6, 5, seed++);

            auto separable = filter_.process(input, operation, element);
            auto generic = filter_.applyGeneric(input, operation, element.shifts());
            ASSERT_TRUE(separable.has_value());
            ASSERT_TRUE(generic.has_value());

            EXPECT_EQ(toVector(*separable), toVector(*generic))
                << operationToString(operation) << " with " << describe(element);
        }
    }
}

TEST_F(MorphologicalFilterTest, AsymmetricElementUsesReverseForSecondPass) {
    auto strel = LinearStrel::create(3, 0, Axis::X);
    ASSERT_TRUE(strel.has_value());

    auto input = createLine<unsigned char>({0, 0, 9, 9, 9, 0, 0, 9, 0}, 0);
    auto opened = filter_.process(input, MorphologicalOperation::Opening, *strel);
    ASSERT_TRUE(opened.has_value());

    // Runs of at least three samples survive, shorter ones vanish
    EXPECT_EQ(toVector(*opened), (std::vector<unsigned char>{0, 0, 9, 9, 9, 0, 0, 0, 0}));
}

TEST_F(MorphologicalFilterTest, SignedVoxelsUseTypeRangePadding) {
    using ShortFilter = MorphologicalFilter<short>;
    auto image = createLine<short>({-500, -400, -300}, 2);

    ShortFilter filter;
    auto strel = LinearStrel::fromRadius(1, Axis::Z);
    ASSERT_TRUE(strel.has_value());
    ASSERT_TRUE(filter.dilation(image, *strel).has_value());

    // Border voxels are not raised to zero by the padding
    EXPECT_EQ(toVector(image), (std::vector<short>{-400, -300, -300}));
}

// ============================================================================
// Algebraic properties
// ============================================================================

TEST_F(MorphologicalFilterTest, OpeningIsAntiExtensive) {
    for (std::uint32_t seed = 60; seed < 65; ++seed) {
        auto input = createRandomVolume<unsigned char>(8, 7, 6, seed);
        const auto before = toVector(input);

        auto opened = filter_.process(input, MorphologicalOperation::Opening, makeCube(1, 2, 1));
        ASSERT_TRUE(opened.has_value());
        const auto after = toVector(*opened);

        for (std::size_t i = 0; i < before.size(); ++i) {
            EXPECT_LE(after[i], before[i]);
        }
    }
}

TEST_F(MorphologicalFilterTest, ClosingIsExtensive) {
    for (std::uint32_t seed = 70; seed < 75; ++seed) {
        auto input = createRandomVolume<unsigned char>(8, 7, 6, seed);
        const auto before = toVector(input);

        auto closed = filter_.process(input, MorphologicalOperation::Closing, makeCube(2, 1, 1));
        ASSERT_TRUE(closed.has_value());
        const auto after = toVector(*closed);

        for (std::size_t i = 0; i < before.size(); ++i) {
            EXPECT_GE(after[i], before[i]);
        }
    }
}

TEST_F(MorphologicalFilterTest, OpeningIsIdempotent) {
    auto input = createRandomVolume<unsigned char>(9, 8, 7, 80);
    const auto cube = makeCube(1, 1, 1);

    auto once = filter_.process(input, MorphologicalOperation::Opening, cube);
    ASSERT_TRUE(once.has_value());
    auto twice = filter_.process(*once, MorphologicalOperation::Opening, cube);
    ASSERT_TRUE(twice.has_value());

    EXPECT_EQ(toVector(*twice), toVector(*once));
}

TEST_F(MorphologicalFilterTest, ErosionIsDualOfDilation) {
    auto input = createRandomVolume<unsigned char>(7, 7, 7, 90);
    auto inverted = test_utils::createVolume<unsigned char>(7, 7, 7);
    {
        const auto values = complement(toVector(input));
        std::size_t i = 0;
        itk::ImageRegionIterator<ImageType> it(inverted, inverted->GetBufferedRegion());
        for (it.GoToBegin(); !it.IsAtEnd(); ++it) {
            it.Set(values[i++]);
        }
    }

    const auto cube = makeCube(1, 2, 1);
    auto eroded = filter_.process(input, MorphologicalOperation::Erosion, cube);
    auto dilated = filter_.process(inverted, MorphologicalOperation::Dilation, cube);
    ASSERT_TRUE(eroded.has_value());
    ASSERT_TRUE(dilated.has_value());

    EXPECT_EQ(toVector(*eroded), complement(toVector(*dilated)));
}

// ============================================================================
// In place versus out of place
// ============================================================================

TEST_F(MorphologicalFilterTest, ProcessLeavesInputUnchanged) {
    auto input = createRandomVolume<unsigned char>(5, 5, 5, 100);
    ImageType::SpacingType spacing;
    spacing[0] = 0.8;
    spacing[1] = 0.8;
    spacing[2] = 2.5;
    input->SetSpacing(spacing);
    const auto before = toVector(input);

    auto result = filter_.process(input, MorphologicalOperation::Closing, makeCube(1, 1, 1));
    ASSERT_TRUE(result.has_value());

    EXPECT_EQ(toVector(input), before);
    EXPECT_NE((*result).GetPointer(), input.GetPointer());
    EXPECT_EQ((*result)->GetSpacing(), spacing);
}

TEST_F(MorphologicalFilterTest, ApplyMatchesProcess) {
    auto input = createRandomVolume<unsigned char>(6, 5, 4, 110);
    auto copy = FilterType::duplicate(input);

    auto result = filter_.process(input, MorphologicalOperation::Opening, makeCube(1, 1, 0));
    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(filter_.opening(copy, makeCube(1, 1, 0)).has_value());

    EXPECT_EQ(toVector(copy), toVector(*result));
}

TEST_F(MorphologicalFilterTest, IdentityElementLeavesImageUnchanged) {
    auto image = createRandomVolume<unsigned char>(4, 4, 4, 120);
    const auto before = toVector(image);

    ASSERT_TRUE(filter_.closing(image, makeCube(0, 0, 0)).has_value());
    EXPECT_EQ(toVector(image), before);
}

// ============================================================================
// Progress
// ============================================================================

TEST_F(MorphologicalFilterTest, ProgressAccumulatesOverPasses) {
    auto image = createRandomVolume<unsigned char>(4, 3, 5, 130);

    std::size_t calls = 0;
    std::size_t lastLine = 0;
    std::size_t total = 0;
    auto status = filter_.dilation(image, makeCube(1, 1, 1), {},
        [&](std::size_t line, std::size_t totalLines) {
            EXPECT_GE(line, lastLine);
            ++calls;
            lastLine = line;
            total = totalLines;
        });
    ASSERT_TRUE(status.has_value());

    // 15 lines along X, 20 along Y, 12 along Z
    EXPECT_EQ(total, 47u);
    EXPECT_EQ(calls, 47u);
    EXPECT_EQ(lastLine, 46u);
}

TEST_F(MorphologicalFilterTest, CompositeOperationsReportBothHalves) {
    auto image = createRandomVolume<unsigned char>(4, 3, 5, 131);

    std::size_t calls = 0;
    std::size_t total = 0;
    auto status = filter_.opening(image, makeCube(1, 0, 1), {},
        [&](std::size_t, std::size_t totalLines) {
            ++calls;
            total = totalLines;
        });
    ASSERT_TRUE(status.has_value());

    EXPECT_EQ(total, 2u * (15u + 12u));
    EXPECT_EQ(calls, total);
}

// ============================================================================
// Derived operators
// ============================================================================

TEST_F(MorphologicalFilterTest, GradientIsDilationMinusErosion) {
    auto input = createRandomVolume<unsigned char>(6, 6, 6, 140);
    const auto cube = makeCube(1, 1, 1);

    auto gradient = filter_.gradient(input, cube);
    auto dilated = filter_.process(input, MorphologicalOperation::Dilation, cube);
    auto eroded = filter_.process(input, MorphologicalOperation::Erosion, cube);
    ASSERT_TRUE(gradient && dilated && eroded);

    const auto g = toVector(*gradient);
    const auto d = toVector(*dilated);
    const auto e = toVector(*eroded);
    for (std::size_t i = 0; i < g.size(); ++i) {
        EXPECT_EQ(g[i], d[i] - e[i]);
    }
}

TEST_F(MorphologicalFilterTest, GradientOfFlatVolumeIsZeroInside) {
    auto input = createCubeVolume<unsigned char>(9, 4, 100, 100);
    auto gradient = filter_.gradient(input, makeCube(1, 1, 1));
    ASSERT_TRUE(gradient.has_value());

    ImageType::IndexType center;
    center.Fill(4);
    EXPECT_EQ((*gradient)->GetPixel(center), 0);
}

TEST_F(MorphologicalFilterTest, WhiteTopHatExtractsSmallBrightSpot) {
    auto input = test_utils::createVolume<unsigned char>(9, 9, 9);
    input->FillBuffer(20);
    ImageType::IndexType spot;
    spot.Fill(4);
    input->SetPixel(spot, 220);

    auto topHat = filter_.whiteTopHat(input, makeCube(1, 1, 1));
    ASSERT_TRUE(topHat.has_value());

    EXPECT_EQ((*topHat)->GetPixel(spot), 200);
    ImageType::IndexType elsewhere;
    elsewhere.Fill(1);
    EXPECT_EQ((*topHat)->GetPixel(elsewhere), 0);
}

TEST_F(MorphologicalFilterTest, BlackTopHatExtractsSmallDarkSpot) {
    auto input = test_utils::createVolume<unsigned char>(9, 9, 9);
    input->FillBuffer(150);
    ImageType::IndexType spot;
    spot.Fill(4);
    input->SetPixel(spot, 50);

    auto topHat = filter_.blackTopHat(input, makeCube(1, 1, 1));
    ASSERT_TRUE(topHat.has_value());

    EXPECT_EQ((*topHat)->GetPixel(spot), 100);
    ImageType::IndexType elsewhere;
    elsewhere.Fill(7);
    EXPECT_EQ((*topHat)->GetPixel(elsewhere), 0);
}

// ============================================================================
// Element rendering and names
// ============================================================================

TEST_F(MorphologicalFilterTest, RenderElementStampsShiftsAroundCenter) {
    auto strel = LinearStrel::create(3, 0, Axis::X);
    ASSERT_TRUE(strel.has_value());

    auto rendered = renderElement(*strel);
    ASSERT_TRUE(rendered.has_value());

    const auto size = (*rendered)->GetLargestPossibleRegion().GetSize();
    EXPECT_EQ(size[0], 13u);
    EXPECT_EQ(size[1], 11u);
    EXPECT_EQ(size[2], 11u);

    std::set<Shift3D> lit;
    itk::ImageRegionConstIterator<ImageType> it(*rendered, (*rendered)->GetBufferedRegion());
    for (it.GoToBegin(); !it.IsAtEnd(); ++it) {
        if (it.Get() == 255) {
            const auto idx = it.GetIndex();
            lit.insert({static_cast<int>(idx[0]) - 6,
                        static_cast<int>(idx[1]) - 5,
                        static_cast<int>(idx[2]) - 5});
        } else {
            EXPECT_EQ(it.Get(), 0);
        }
    }

    EXPECT_EQ(lit, (std::set<Shift3D>{{0, 0, 0}, {1, 0, 0}, {2, 0, 0}}));
}

TEST_F(MorphologicalFilterTest, RenderCubeHasElementVolume) {
    auto rendered = renderElement(makeCube(1, 2, 0));
    ASSERT_TRUE(rendered.has_value());

    std::size_t lit = 0;
    for (auto v : toVector(*rendered)) {
        if (v == 255) {
            ++lit;
        }
    }
    EXPECT_EQ(lit, 3u * 5u * 1u);
}

TEST(MorphologyTypesTest, OperationNames) {
    EXPECT_EQ(operationToString(MorphologicalOperation::Dilation), "Dilation");
    EXPECT_EQ(operationToString(MorphologicalOperation::Erosion), "Erosion");
    EXPECT_EQ(operationToString(MorphologicalOperation::Opening), "Opening");
    EXPECT_EQ(operationToString(MorphologicalOperation::Closing), "Closing");

    EXPECT_EQ(operationFromString("closing"), MorphologicalOperation::Closing);
    EXPECT_EQ(operationFromString("EROSION"), MorphologicalOperation::Erosion);
    EXPECT_EQ(operationFromString("Opening"), MorphologicalOperation::Opening);
    EXPECT_FALSE(operationFromString("gradient").has_value());

    EXPECT_EQ(axisToString(Axis::Y), "Y");
}

}  // namespace volmorph::services::test
