#pragma once

/**
 * @file render_layers.hpp
 * @brief Allocation of render layers that keep each canvas's drawables apart.
 */

#include "brush/error.hpp"
#include "brush/types.hpp"
#include <vector>

namespace brush {

/// @brief Hands out render layers 1..maxLayers-1, reusing the lowest freed layer.
///
/// Layer 0 is reserved and never allocated or freed.
class RenderLayerAllocator {
public:
    explicit RenderLayerAllocator(u32 maxLayers = 4096);

    /// @return DeviceError when every layer is in use.
    Result<u32> allocate();
    /// @brief Release a layer. Freeing layer 0 or an unused layer does nothing.
    void free(u32 layer);
    bool isUsed(u32 layer) const;

    u32 maxLayers() const { return static_cast<u32>(used_.size()); }
    u32 usedCount() const { return usedCount_; }

private:
    std::vector<bool> used_;
    u32 nextFree_ = 1;
    u32 usedCount_ = 0;
};

} // namespace brush
