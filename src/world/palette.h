#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

#include "core/grid3.h"
#include "math/math.h"

// World Palette subsystem
// Responsible for: the shared fixed-size colour palette and the voxel-coordinate hash that indexes it.
// Should NOT do: own GPU materials or vary by sub-voxel.
namespace subvox::world {

constexpr std::size_t kPaletteSize = 64;

class MaterialPalette {
public:
    MaterialPalette();

    // Stable for a voxel position regardless of its pattern or rotation.
    [[nodiscard]] static std::uint8_t indexFor(const core::Cell3i& voxel);

    [[nodiscard]] const math::Vector4& color(std::uint8_t index) const;
    [[nodiscard]] const math::Vector4& colorFor(const core::Cell3i& voxel) const;
    [[nodiscard]] const std::array<math::Vector4, kPaletteSize>& colors() const { return m_colors; }

private:
    std::array<math::Vector4, kPaletteSize> m_colors{};
};

} // namespace subvox::world
