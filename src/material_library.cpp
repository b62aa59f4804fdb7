#include "brush/material_library.hpp"

#include <string>

namespace brush {

MaterialLibrary::MaterialLibrary(RenderDevice& device) : device_(device) {
}

MaterialLibrary::~MaterialLibrary() {
    for (auto& e : cache_) device_.destroyMaterial(e.second);
    for (auto& e : user_) device_.destroyMaterial(MaterialId{e.first});
}

Result<MaterialId> MaterialLibrary::createPbr() {
    MaterialDesc desc;
    auto id = device_.createMaterial(desc);
    if (!id) return id.error();
    user_[id.value().value] = desc;
    return id.value();
}

Result<void> MaterialLibrary::set(MaterialId material, const std::string& name,
                                  const MaterialValue& value) {
    auto it = user_.find(material.value);
    if (it == user_.end()) {
        return Error{ErrorCode::MaterialNotFound, std::to_string(material.value)};
    }
    MaterialDesc desc = it->second;
    auto applied = setMaterialProperty(desc, name, value);
    if (!applied) return applied;

    auto updated = device_.updateMaterial(material, desc);
    if (!updated) return updated;
    it->second = desc;
    return {};
}

Result<void> MaterialLibrary::destroy(MaterialId material) {
    auto it = user_.find(material.value);
    if (it == user_.end()) {
        return Error{ErrorCode::MaterialNotFound, std::to_string(material.value)};
    }
    device_.destroyMaterial(material);
    user_.erase(it);
    return {};
}

const MaterialDesc* MaterialLibrary::desc(MaterialId material) const {
    auto it = user_.find(material.value);
    return it == user_.end() ? nullptr : &it->second;
}

Result<MaterialId> MaterialLibrary::materialize(const MaterialKey& key, const ImageStore& images) {
    if (key.kind == MaterialKey::Kind::Custom) {
        if (!contains(key.material)) {
            return Error{ErrorCode::MaterialNotFound, std::to_string(key.material.value)};
        }
        return key.material;
    }

    TextureId texture;
    if (key.kind == MaterialKey::Kind::Color && key.backgroundImage.valid()) {
        texture = images.texture(key.backgroundImage);
        if (!texture.valid()) {
            return Error{ErrorCode::ImageNotFound, std::to_string(key.backgroundImage.value)};
        }
    }

    MaterialKey cacheKey = key.appearance();
    auto cached = cache_.find(cacheKey);
    if (cached != cache_.end()) {
        if (device_.hasMaterial(cached->second)) return cached->second;
        cache_.erase(cached);
    }

    auto id = device_.createMaterial(cacheKey.toDesc(texture));
    if (!id) return id.error();
    cache_.emplace(cacheKey, id.value());
    return id.value();
}

void MaterialLibrary::forgetImage(ImageId image) {
    for (auto it = cache_.begin(); it != cache_.end();) {
        if (it->first.kind == MaterialKey::Kind::Color && it->first.backgroundImage == image) {
            device_.destroyMaterial(it->second);
            it = cache_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace brush
