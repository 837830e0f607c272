#include "world/palette.h"

#include <cmath>
#include <numbers>

namespace subvox::world {

MaterialPalette::MaterialPalette() {
    constexpr float kTwoPi = 2.0f * std::numbers::pi_v<float>;
    constexpr float kThreePi = 3.0f * std::numbers::pi_v<float>;
    for (std::size_t i = 0; i < kPaletteSize; ++i) {
        const float t = static_cast<float>(i) / static_cast<float>(kPaletteSize);
        m_colors[i] = math::Vector4{
            0.2f + (t * 0.6f),
            0.3f + (((std::sin(t * kTwoPi) * 0.5f) + 0.5f) * 0.4f),
            0.4f + (((std::cos(t * kThreePi) * 0.5f) + 0.5f) * 0.4f),
            1.0f
        };
    }
}

std::uint8_t MaterialPalette::indexFor(const core::Cell3i& voxel) {
    // Wrapping 32-bit arithmetic, then |h| mod size.
    const std::uint32_t hx = static_cast<std::uint32_t>(voxel.x) * 73856093u;
    const std::uint32_t hy = static_cast<std::uint32_t>(voxel.y) * 19349663u;
    const std::uint32_t hz = static_cast<std::uint32_t>(voxel.z) * 83492791u;
    const std::int64_t hash = static_cast<std::int32_t>(hx ^ hy ^ hz);
    const std::int64_t magnitude = hash < 0 ? -hash : hash;
    return static_cast<std::uint8_t>(magnitude % static_cast<std::int64_t>(kPaletteSize));
}

const math::Vector4& MaterialPalette::color(std::uint8_t index) const {
    return m_colors[static_cast<std::size_t>(index) % kPaletteSize];
}

const math::Vector4& MaterialPalette::colorFor(const core::Cell3i& voxel) const {
    return color(indexFor(voxel));
}

} // namespace subvox::world
