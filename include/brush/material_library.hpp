#pragma once

/**
 * @file material_library.hpp
 * @brief User PBR materials and the cache of materialized batch keys.
 */

#include "brush/error.hpp"
#include "brush/image.hpp"
#include "brush/material.hpp"
#include "brush/render_device.hpp"
#include "brush/types.hpp"
#include <map>
#include <string>
#include <unordered_map>

namespace brush {

/**
 * MaterialLibrary - Creates device materials for user handles and batch keys.
 *
 * materialize() is the expensive step of a batch: Color and Pbr keys are
 * turned into device materials once and cached (keys that differ only in
 * paint color share one material, the color lives in the vertices);
 * Custom keys return their handle without allocating anything.
 */
class MaterialLibrary {
public:
    explicit MaterialLibrary(RenderDevice& device);
    ~MaterialLibrary();

    MaterialLibrary(const MaterialLibrary&) = delete;
    MaterialLibrary& operator=(const MaterialLibrary&) = delete;

    /// @brief Create a lit material with default PBR parameters.
    Result<MaterialId> createPbr();
    /// @brief Set a named property (see setMaterialProperty()) and update the device material.
    /// @return MaterialNotFound for an unknown handle, else the property error.
    Result<void> set(MaterialId material, const std::string& name, const MaterialValue& value);
    Result<void> destroy(MaterialId material);
    bool contains(MaterialId material) const { return user_.count(material.value) != 0; }
    const MaterialDesc* desc(MaterialId material) const;

    /// @brief Device material for a key.
    /// @return MaterialNotFound for an unknown Custom handle, ImageNotFound
    ///         for a missing background image, or the device's error.
    Result<MaterialId> materialize(const MaterialKey& key, const ImageStore& images);

    /// @brief Drop cached materials that sample an image.
    void forgetImage(ImageId image);

    size_t cachedCount() const { return cache_.size(); }

private:
    RenderDevice& device_;
    std::unordered_map<u64, MaterialDesc> user_;
    std::map<MaterialKey, MaterialId> cache_;
};

} // namespace brush
