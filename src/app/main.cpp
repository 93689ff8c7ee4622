#include "core/app_log_level.hpp"
#include "core/logging.hpp"
#include "services/morphology/morphological_filter.hpp"
#include "services/morphology/separable_strel.hpp"

#include <chrono>
#include <cstdlib>
#include <expected>
#include <filesystem>
#include <string>

#include <QCommandLineParser>
#include <QCoreApplication>

#include <itkImageFileReader.h>
#include <itkImageFileWriter.h>
#include <itkImageIOFactory.h>

namespace {

using volmorph::services::MorphologicalFilter;
using volmorph::services::MorphologicalOperation;
using volmorph::services::MorphologyError;
using volmorph::services::SeparableStrel;
using volmorph::services::StructuringElement;

auto& getLogger() {
    static auto logger = volmorph::logging::LoggerFactory::create("volmorph");
    return logger;
}

struct RunOptions {
    std::filesystem::path input;
    std::filesystem::path output;
    MorphologicalOperation operation = MorphologicalOperation::Dilation;
    int radiusX = 2;
    int radiusY = 2;
    int radiusZ = 2;
    std::filesystem::path elementImage;
};

/**
 * @brief Logs coarse percentage progress from per-line callbacks
 */
class ProgressReporter {
public:
    void operator()(std::size_t line, std::size_t totalLines) {
        if (totalLines == 0) return;

        const int percent = static_cast<int>((line + 1) * 100 / totalLines);
        if (percent >= lastPercent_ + 10) {
            lastPercent_ = percent - percent % 10;
            getLogger()->info("Progress: {}%", lastPercent_);
        }
    }

private:
    int lastPercent_ = 0;
};

template <typename ImageType>
std::expected<typename ImageType::Pointer, MorphologyError>
readVolume(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return std::unexpected(MorphologyError{
            MorphologyError::Code::InvalidInput,
            "File not found: " + path.string()
        });
    }

    try {
        using ReaderType = itk::ImageFileReader<ImageType>;
        auto reader = ReaderType::New();
        reader->SetFileName(path.string());
        reader->Update();
        return reader->GetOutput();
    } catch (const itk::ExceptionObject& e) {
        return std::unexpected(MorphologyError{
            MorphologyError::Code::InvalidInput,
            std::string("Failed to read ") + path.string() + ": " + e.GetDescription()
        });
    }
}

template <typename ImageType>
std::expected<void, MorphologyError>
writeVolume(typename ImageType::Pointer image, const std::filesystem::path& path) {
    try {
        using WriterType = itk::ImageFileWriter<ImageType>;
        auto writer = WriterType::New();
        writer->SetInput(image);
        writer->SetFileName(path.string());
        writer->UseCompressionOn();
        writer->Update();
        return {};
    } catch (const itk::ExceptionObject& e) {
        return std::unexpected(MorphologyError{
            MorphologyError::Code::ProcessingFailed,
            std::string("Failed to write ") + path.string() + ": " + e.GetDescription()
        });
    }
}

template <typename TPixel>
std::expected<void, MorphologyError>
runFilter(const RunOptions& options, const StructuringElement& element) {
    using FilterType = MorphologicalFilter<TPixel>;
    using ImageType = typename FilterType::ImageType;

    auto input = readVolume<ImageType>(options.input);
    if (!input) {
        return std::unexpected(input.error());
    }

    ProgressReporter reporter;
    FilterType filter;
    auto result = filter.process(*input, options.operation, element, {},
        [&reporter](std::size_t line, std::size_t total) { reporter(line, total); });
    if (!result) {
        return std::unexpected(result.error());
    }

    return writeVolume<ImageType>(*result, options.output);
}

std::expected<void, MorphologyError>
dispatchByComponentType(const RunOptions& options, const StructuringElement& element) {
    auto imageIO = itk::ImageIOFactory::CreateImageIO(
        options.input.string().c_str(), itk::ImageIOFactory::IOFileModeEnum::ReadMode);
    if (!imageIO) {
        return std::unexpected(MorphologyError{
            MorphologyError::Code::InvalidInput,
            "Unsupported file format: " + options.input.string()
        });
    }

    try {
        imageIO->SetFileName(options.input.string());
        imageIO->ReadImageInformation();
    } catch (const itk::ExceptionObject& e) {
        return std::unexpected(MorphologyError{
            MorphologyError::Code::InvalidInput,
            std::string("Failed to read header: ") + e.GetDescription()
        });
    }

    if (imageIO->GetNumberOfComponents() != 1) {
        return std::unexpected(MorphologyError{
            MorphologyError::Code::InvalidInput,
            "Only scalar volumes are supported"
        });
    }

    using ComponentType = itk::IOComponentEnum;
    switch (imageIO->GetComponentType()) {
        case ComponentType::UCHAR:
            return runFilter<unsigned char>(options, element);
        case ComponentType::SHORT:
            return runFilter<short>(options, element);
        case ComponentType::USHORT:
            return runFilter<unsigned short>(options, element);
        case ComponentType::INT:
            return runFilter<int>(options, element);
        case ComponentType::FLOAT:
            return runFilter<float>(options, element);
        case ComponentType::DOUBLE:
            return runFilter<double>(options, element);
        default:
            break;
    }

    return std::unexpected(MorphologyError{
        MorphologyError::Code::InvalidInput,
        "Unsupported voxel type: "
            + itk::ImageIOBase::GetComponentTypeAsString(imageIO->GetComponentType())
    });
}

std::expected<int, std::string> parseRadius(const QCommandLineParser& parser,
                                            const QCommandLineOption& option) {
    bool ok = false;
    const int value = parser.value(option).toInt(&ok);
    if (!ok || value < 0) {
        return std::unexpected("Invalid radius for --" + option.names().constFirst().toStdString());
    }
    return value;
}

}  // anonymous namespace

/**
 * @brief Command-line entry point
 *
 * Reads a scalar volume, applies a morphological operation with a cube
 * element and writes the result.
 */
int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("volmorph");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("kcenon");

    QCommandLineParser parser;
    parser.setApplicationDescription("Grayscale morphological filtering of 3D volumes");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("input", "Input volume (NRRD, MetaImage, NIfTI)");
    parser.addPositionalArgument("output", "Output volume");

    QCommandLineOption operationOption({"o", "operation"},
        "Dilation, Erosion, Opening or Closing", "name", "Dilation");
    QCommandLineOption radiusXOption("radius-x", "Element radius along X", "voxels", "2");
    QCommandLineOption radiusYOption("radius-y", "Element radius along Y", "voxels", "2");
    QCommandLineOption radiusZOption("radius-z", "Element radius along Z", "voxels", "2");
    QCommandLineOption showElementOption("show-element",
        "Write the structuring element as an 8-bit image", "path");
    QCommandLineOption logLevelOption("log-level",
        "Exception, Error, Information or Debug", "level", "Information");
    QCommandLineOption logDirOption("log-dir", "Directory for rotating log files", "path");

    parser.addOptions({operationOption, radiusXOption, radiusYOption, radiusZOption,
                       showElementOption, logLevelOption, logDirOption});
    parser.process(app);

    volmorph::logging::LogConfig logConfig;
    const auto level =
        volmorph::app_log_level_from_string(parser.value(logLevelOption).toStdString());
    if (!level) {
        parser.showHelp(EXIT_FAILURE);
    }
    logConfig.level = volmorph::to_log_level(*level);
    if (parser.isSet(logDirOption)) {
        logConfig.enableFileLogging = true;
        logConfig.logDirectory = parser.value(logDirOption).toStdString();
    }
    volmorph::logging::LoggerFactory::configure(logConfig);

    const auto positional = parser.positionalArguments();
    if (positional.size() != 2) {
        getLogger()->error("Expected <input> and <output> arguments");
        parser.showHelp(EXIT_FAILURE);
    }

    RunOptions options;
    options.input = positional.at(0).toStdString();
    options.output = positional.at(1).toStdString();

    const auto operation = volmorph::services::operationFromString(
        parser.value(operationOption).toStdString());
    if (!operation) {
        getLogger()->error("Unknown operation: {}", parser.value(operationOption).toStdString());
        return EXIT_FAILURE;
    }
    options.operation = *operation;

    const auto radiusX = parseRadius(parser, radiusXOption);
    const auto radiusY = parseRadius(parser, radiusYOption);
    const auto radiusZ = parseRadius(parser, radiusZOption);
    for (const auto* radius : {&radiusX, &radiusY, &radiusZ}) {
        if (!*radius) {
            getLogger()->error("{}", radius->error());
            return EXIT_FAILURE;
        }
    }
    options.radiusX = *radiusX;
    options.radiusY = *radiusY;
    options.radiusZ = *radiusZ;

    auto cube = SeparableStrel::cube(options.radiusX, options.radiusY, options.radiusZ);
    if (!cube) {
        getLogger()->error("{}", cube.error().toString());
        return EXIT_FAILURE;
    }
    const StructuringElement element = *cube;

    if (parser.isSet(showElementOption)) {
        options.elementImage = parser.value(showElementOption).toStdString();
        auto rendered = volmorph::services::renderElement(element);
        if (!rendered) {
            getLogger()->error("{}", rendered.error().toString());
            return EXIT_FAILURE;
        }
        auto written = writeVolume<itk::Image<unsigned char, 3>>(*rendered, options.elementImage);
        if (!written) {
            getLogger()->error("{}", written.error().toString());
            return EXIT_FAILURE;
        }
        getLogger()->info("Structuring element written to {}", options.elementImage.string());
    }

    const auto start = std::chrono::steady_clock::now();

    auto status = dispatchByComponentType(options, element);
    if (!status) {
        getLogger()->error("{}", status.error().toString());
        volmorph::logging::LoggerFactory::shutdown();
        return EXIT_FAILURE;
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    getLogger()->info("{}: {} ms, result written to {}",
                      volmorph::services::operationToString(options.operation),
                      elapsed.count(), options.output.string());

    volmorph::logging::LoggerFactory::shutdown();
    return EXIT_SUCCESS;
}
