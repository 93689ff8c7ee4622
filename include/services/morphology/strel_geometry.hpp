/**
 * @file strel_geometry.hpp
 * @brief Geometry helpers shared by structuring element implementations
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include "morphology_types.hpp"

#include <vector>

#include <itkImage.h>

namespace volmorph::services {

/// Binary structuring element mask (255 inside, 0 outside)
using StrelMaskType = itk::Image<unsigned char, 3>;

/**
 * @brief Rasterize a shift list into a binary mask
 *
 * Each shift is translated by @p origin; the resulting positions must lie
 * inside @p size.
 *
 * @param size Mask size along (x, y, z)
 * @param origin Origin position inside the mask
 * @param shifts Shift vectors relative to the origin
 * @return Allocated mask with covered voxels set to 255
 */
[[nodiscard]] StrelMaskType::Pointer rasterizeShifts(
    const Extent3D& size,
    const Extent3D& origin,
    const std::vector<Shift3D>& shifts
);

/**
 * @brief Minkowski sum of two shift sets, sorted and without duplicates
 */
[[nodiscard]] std::vector<Shift3D> addShiftSets(
    const std::vector<Shift3D>& a,
    const std::vector<Shift3D>& b
);

}  // namespace volmorph::services
