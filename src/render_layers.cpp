#include "brush/render_layers.hpp"

#include <string>

namespace brush {

RenderLayerAllocator::RenderLayerAllocator(u32 maxLayers)
    : used_(maxLayers < 2 ? 2 : maxLayers, false) {
    used_[0] = true;
}

Result<u32> RenderLayerAllocator::allocate() {
    u32 layer = nextFree_;
    if (layer >= maxLayers()) {
        return Error{ErrorCode::DeviceError,
                     "exceeded maximum of " + std::to_string(maxLayers()) + " render layers"};
    }
    used_[layer] = true;
    ++usedCount_;

    nextFree_ = maxLayers();
    for (u32 l = layer + 1; l < maxLayers(); ++l) {
        if (!used_[l]) {
            nextFree_ = l;
            break;
        }
    }
    return layer;
}

void RenderLayerAllocator::free(u32 layer) {
    if (layer == 0 || layer >= maxLayers() || !used_[layer]) return;
    used_[layer] = false;
    --usedCount_;
    if (layer < nextFree_) nextFree_ = layer;
}

bool RenderLayerAllocator::isUsed(u32 layer) const {
    return layer < maxLayers() && used_[layer];
}

} // namespace brush
