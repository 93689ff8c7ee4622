#include "services/morphology/strel_geometry.hpp"

#include <algorithm>

namespace volmorph::services {

StrelMaskType::Pointer rasterizeShifts(
    const Extent3D& size,
    const Extent3D& origin,
    const std::vector<Shift3D>& shifts
) {
    auto mask = StrelMaskType::New();

    StrelMaskType::SizeType maskSize;
    for (unsigned int d = 0; d < 3; ++d) {
        maskSize[d] = static_cast<StrelMaskType::SizeValueType>(size[d]);
    }

    StrelMaskType::IndexType start;
    start.Fill(0);

    StrelMaskType::RegionType region;
    region.SetSize(maskSize);
    region.SetIndex(start);

    mask->SetRegions(region);
    mask->Allocate();
    mask->FillBuffer(0);

    StrelMaskType::IndexType index;
    for (const auto& shift : shifts) {
        for (unsigned int d = 0; d < 3; ++d) {
            index[d] = origin[d] + shift[d];
        }
        mask->SetPixel(index, 255);
    }

    return mask;
}

std::vector<Shift3D> addShiftSets(
    const std::vector<Shift3D>& a,
    const std::vector<Shift3D>& b
) {
    std::vector<Shift3D> sum;
    sum.reserve(a.size() * b.size());
    for (const auto& u : a) {
        for (const auto& v : b) {
            sum.push_back({u[0] + v[0], u[1] + v[1], u[2] + v[2]});
        }
    }

    // Order by z, then y, then x, matching the mask scan order
    std::sort(sum.begin(), sum.end(), [](const Shift3D& lhs, const Shift3D& rhs) {
        if (lhs[2] != rhs[2]) return lhs[2] < rhs[2];
        if (lhs[1] != rhs[1]) return lhs[1] < rhs[1];
        return lhs[0] < rhs[0];
    });
    sum.erase(std::unique(sum.begin(), sum.end()), sum.end());
    return sum;
}

}  // namespace volmorph::services
