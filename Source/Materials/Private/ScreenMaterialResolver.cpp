#include "../Public/ScreenMaterialResolver.hpp"
#include "../../Catalog/Public/DeviceDescriptor.hpp"
#include "../../Viewer/Public/MaterialSurface.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <string>

namespace
{
std::string to_lower(std::string_view text)
{
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}
} // namespace

int ScreenMaterialResolver::score(std::string_view materialName)
{
    const std::string name = to_lower(materialName);
    auto contains = [&](std::string_view token) { return name.find(token) != std::string::npos; };

    int total = 0;
    if (contains("screen") && contains("bg"))
        total += 8;
    else if (contains("screen"))
        total += 6;

    if (contains("display"))
        total += 4;
    if (contains("glass"))
        total -= 3;
    if (contains("panel"))
        total += 2;
    return total;
}

IMaterialSurface* ScreenMaterialResolver::resolve(const DeviceDescriptor& device,
                                                  std::span<IMaterialSurface* const> materials)
{
    if (materials.empty())
        return nullptr;

    m_bindings.seed(device);
    if (const std::string* bound = m_bindings.find(device.id))
    {
        auto it = std::find_if(materials.begin(), materials.end(),
                               [&](const IMaterialSurface* material) { return material && material->name() == *bound; });
        if (it != materials.end())
            return *it;
    }

    IMaterialSurface* best = nullptr;
    int bestScore = std::numeric_limits<int>::min();
    for (IMaterialSurface* material : materials)
    {
        if (!material)
            continue;
        const int current = score(material->name());
        if (!best || current > bestScore)
        {
            best = material;
            bestScore = current;
        }
    }

    if (best)
        m_bindings.bind(device.id, best->name());
    return best;
}
