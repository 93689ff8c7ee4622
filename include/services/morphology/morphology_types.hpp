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
 * @file morphology_types.hpp
 * @brief Shared types for volumetric morphological filtering
 * @details Defines the error type returned by morphology services, the
 *          closed set of morphological operations, the principal axes a
 *          linear structuring element can be aligned with, and the
 *          per-line progress callback signature.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace volmorph::services {

/**
 * @brief Error information for morphology operations
 */
struct MorphologyError {
    enum class Code {
        Success,
        InvalidInput,
        InvalidParameters,
        ProcessingFailed,
        InternalError
    };

    Code code = Code::Success;
    std::string message;

    [[nodiscard]] bool isSuccess() const noexcept {
        return code == Code::Success;
    }

    [[nodiscard]] std::string toString() const {
        switch (code) {
            case Code::Success: return "Success";
            case Code::InvalidInput: return "Invalid input: " + message;
            case Code::InvalidParameters: return "Invalid parameters: " + message;
            case Code::ProcessingFailed: return "Processing failed: " + message;
            case Code::InternalError: return "Internal error: " + message;
        }
        return "Unknown error";
    }
};

/**
 * @brief Morphological operation type
 */
enum class MorphologicalOperation {
    Dilation,  ///< Replace each voxel by the neighborhood maximum
    Erosion,   ///< Replace each voxel by the neighborhood minimum
    Opening,   ///< Erosion followed by dilation with the reversed element
    Closing    ///< Dilation followed by erosion with the reversed element
};

/**
 * @brief Principal axis of a linear structuring element
 *
 * The underlying value is the ITK index dimension of the axis.
 */
enum class Axis {
    X = 0,
    Y = 1,
    Z = 2
};

/// Shift vector (dx, dy, dz) relative to the element origin
using Shift3D = std::array<int, 3>;

/// Per-axis extent or origin position (x, y, z)
using Extent3D = std::array<int, 3>;

/// Progress callback invoked once per scan line (line index, total lines)
using LineProgressCallback = std::function<void(std::size_t line, std::size_t totalLines)>;

/**
 * @brief Get string representation of operation type
 */
[[nodiscard]] std::string operationToString(MorphologicalOperation operation);

/**
 * @brief Parse an operation name (case-insensitive)
 * @return Operation, or std::nullopt if the name is unknown
 */
[[nodiscard]] std::optional<MorphologicalOperation>
operationFromString(const std::string& name);

/**
 * @brief Get string representation of axis ("X", "Y" or "Z")
 */
[[nodiscard]] std::string axisToString(Axis axis);

}  // namespace volmorph::services
