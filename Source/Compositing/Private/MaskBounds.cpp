#include "../Public/MaskBounds.hpp"
#include "../../Assets/Public/TextureData.hpp"

#include <algorithm>

MaskBounds extract_mask_bounds(const TextureData& mask) noexcept
{
    if (mask.empty())
        return {0, 0, mask.width, mask.height};

    std::uint32_t minX = mask.width;
    std::uint32_t minY = mask.height;
    std::uint32_t maxX = 0;
    std::uint32_t maxY = 0;
    bool found = false;

    for (std::uint32_t y = 0; y < mask.height; ++y)
    {
        for (std::uint32_t x = 0; x < mask.width; ++x)
        {
            if (mask.pixel(x, y)[3] == 0)
                continue;

            minX = std::min(minX, x);
            minY = std::min(minY, y);
            maxX = std::max(maxX, x);
            maxY = std::max(maxY, y);
            found = true;
        }
    }

    if (!found)
        return {0, 0, mask.width, mask.height};

    return {minX, minY, maxX - minX + 1, maxY - minY + 1};
}
