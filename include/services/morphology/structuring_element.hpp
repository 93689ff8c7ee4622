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
 * @file structuring_element.hpp
 * @brief Structuring elements accepted by the separable filtering engine
 * @details StructuringElement is a tagged variant over the element kinds the
 *          engine can process in place: a single axis-aligned linear element
 *          (X, Y or Z, carried by LinearStrel::axis()) and a composite of
 *          linear passes. The free functions below expose the geometric
 *          queries shared by every kind.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include "linear_strel.hpp"
#include "separable_strel.hpp"

#include <string>
#include <variant>
#include <vector>

namespace volmorph::services {

/// Element kinds: linear-X / linear-Y / linear-Z, or composite
using StructuringElement = std::variant<LinearStrel, SeparableStrel>;

/**
 * @brief Ordered linear passes implementing the element
 */
[[nodiscard]] std::vector<LinearStrel> decompose(const StructuringElement& element);

/**
 * @brief Point reflection of the element through its origin
 */
[[nodiscard]] StructuringElement reverse(const StructuringElement& element);

/// Bounding size along (x, y, z)
[[nodiscard]] Extent3D elementSize(const StructuringElement& element);

/// Origin position along (x, y, z)
[[nodiscard]] Extent3D elementOffset(const StructuringElement& element);

/// Shift vectors relative to the origin
[[nodiscard]] std::vector<Shift3D> elementShifts(const StructuringElement& element);

/// Binary mask consistent with elementShifts()
[[nodiscard]] StrelMaskType::Pointer elementMask(const StructuringElement& element);

/// Short description for logging, e.g. "Linear Z (length 5, offset 2)"
[[nodiscard]] std::string describe(const StructuringElement& element);

}  // namespace volmorph::services
