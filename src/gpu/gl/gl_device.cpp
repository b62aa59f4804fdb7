// GL render device - implements RenderDevice for OpenGL.
//
// Only compiled when BRUSH_HAS_GL is defined (via CMake).
// Requires OpenGL 3.3+ core profile.

#include "brush/gpu/gl/gl_device.hpp"
#include "gl_resources.hpp"

#if BRUSH_HAS_GL

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace brush {

namespace {

// Half extent of the depth range, in canvas units.
constexpr float kDepthRange = 10000.0f;

// Sync waits are retried in slices of this many nanoseconds.
constexpr GLuint64 kWaitSliceNs = 1000000000ull;

const char* kMeshVertSrc = R"(
#version 330 core
layout(location = 0) in vec3 aPos;
layout(location = 1) in vec3 aNormal;
layout(location = 2) in vec4 aColor;
layout(location = 3) in vec2 aUv;
uniform mat4 uProjection;
uniform mat4 uModel;
uniform float uDepthOffset;
out vec4 vColor;
out vec2 vUv;
void main() {
    gl_Position = uProjection * uModel * vec4(aPos, 1.0);
    gl_Position.z += uDepthOffset;
    vColor = aColor;
    vUv = aUv;
}
)";

const char* kMeshFragSrc = R"(
#version 330 core
in vec4 vColor;
in vec2 vUv;
uniform vec4 uBaseColor;
uniform vec3 uEmissive;
uniform int uUnlit;
uniform int uUseTexture;
uniform sampler2D uTexture;
uniform int uAlphaMode;
uniform float uAlphaCutoff;
out vec4 FragColor;
void main() {
    vec4 c = vColor * uBaseColor;
    if (uUseTexture == 1) c *= texture(uTexture, vUv);
    if (uUnlit == 0) c.rgb += uEmissive;
    if (uAlphaMode == 1 && c.a < uAlphaCutoff) discard;
    if (uAlphaMode <= 1) c.a = 1.0;
    FragColor = c;
}
)";

Error notFound(const char* what, u64 id) {
    return Error{ErrorCode::DeviceError, std::string(what) + " " + std::to_string(id) + " not found"};
}

void applyBlend(AlphaMode mode) {
    switch (mode) {
        case AlphaMode::Opaque:
        case AlphaMode::Mask:
            glDisable(GL_BLEND);
            return;
        case AlphaMode::Blend:
            glBlendFuncSeparate(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA, GL_ONE, GL_ONE_MINUS_SRC_ALPHA);
            break;
        case AlphaMode::Premultiplied:
            glBlendFuncSeparate(GL_ONE, GL_ONE_MINUS_SRC_ALPHA, GL_ONE, GL_ONE_MINUS_SRC_ALPHA);
            break;
        case AlphaMode::Add:
            glBlendFuncSeparate(GL_SRC_ALPHA, GL_ONE, GL_ZERO, GL_ONE);
            break;
        case AlphaMode::Multiply:
            glBlendFuncSeparate(GL_DST_COLOR, GL_ZERO, GL_ZERO, GL_ONE);
            break;
    }
    glEnable(GL_BLEND);
}

} // namespace

// GlDevice - GL textures with framebuffers, pack-buffer readback, VAO meshes
class GlDevice : public RenderDevice {
public:
    explicit GlDevice(u32 alignment) : alignment_(alignment) {}
    ~GlDevice() override { destroy(); }

    bool init() {
        glewExperimental = GL_TRUE;
        GLenum err = glewInit();
        while (glGetError() != GL_NO_ERROR) {}
        if (err != GLEW_OK && glGetString(GL_VERSION) == nullptr) {
            std::fprintf(stderr, "brush GL: GLEW init failed\n");
            return false;
        }
        if (glGetString(GL_VERSION) == nullptr) {
            std::fprintf(stderr, "brush GL: no GL context\n");
            return false;
        }
        return program_.init(kMeshVertSrc, kMeshFragSrc);
    }

    void destroy() {
        for (auto& e : textures_) e.second.destroy();
        for (auto& e : buffers_) e.second.destroy();
        for (auto& e : meshes_) e.second.destroy();
        textures_.clear();
        buffers_.clear();
        meshes_.clear();
        materials_.clear();
        drawables_.clear();
        program_.destroy();
    }

    u32 copyBytesPerRowAlignment() const override { return alignment_; }

    // --- Textures ---

    Result<TextureId> createTexture(const TextureDesc& desc) override {
        GLFormat fmt;
        if (!glFormatFor(desc.format, &fmt)) {
            return Error{ErrorCode::UnsupportedPixelFormat, pixelFormatName(desc.format)};
        }
        GLRenderTexture tex;
        if (!tex.init(desc.width, desc.height, desc.format, fmt)) {
            tex.destroy();
            return Error{ErrorCode::DeviceError, "framebuffer incomplete"};
        }
        TextureId id{nextId_++};
        textures_.emplace(id.value, tex);
        return id;
    }

    Result<void> resizeTexture(TextureId texture, u32 width, u32 height) override {
        auto it = textures_.find(texture.value);
        if (it == textures_.end()) return notFound("texture", texture.value);
        it->second.allocate(width, height);
        return {};
    }

    void destroyTexture(TextureId texture) override {
        auto it = textures_.find(texture.value);
        if (it == textures_.end()) return;
        it->second.destroy();
        textures_.erase(it);
    }

    bool hasTexture(TextureId texture) const override {
        return textures_.count(texture.value) != 0;
    }

    // --- Readback ---

    Result<BufferId> createReadbackBuffer(size_t size) override {
        GLPackBuffer buffer;
        buffer.init(size);
        BufferId id{nextId_++};
        buffers_.emplace(id.value, buffer);
        return id;
    }

    void destroyBuffer(BufferId buffer) override {
        auto it = buffers_.find(buffer.value);
        if (it == buffers_.end()) return;
        it->second.destroy();
        buffers_.erase(it);
    }

    Result<std::vector<u8>> copyTextureToBuffer(TextureId texture, BufferId buffer) override {
        auto tex = textures_.find(texture.value);
        if (tex == textures_.end()) return notFound("texture", texture.value);
        auto buf = buffers_.find(buffer.value);
        if (buf == buffers_.end()) return notFound("buffer", buffer.value);

        const GLRenderTexture& t = tex->second;
        u32 px = pixelSize(t.pixelFormat).valueOr(0);
        u32 padded = alignBytesPerRow(t.width * px, alignment_);
        size_t needed = size_t(padded) * t.height;
        if (px == 0 || buf->second.size < needed) {
            return Error{ErrorCode::InvalidArgument,
                         "readback buffer holds " + std::to_string(buf->second.size) +
                         " bytes, copy needs " + std::to_string(needed)};
        }

        glBindFramebuffer(GL_READ_FRAMEBUFFER, t.fbo);
        glBindBuffer(GL_PIXEL_PACK_BUFFER, buf->second.pbo);
        glPixelStorei(GL_PACK_ALIGNMENT, 1);
        glPixelStorei(GL_PACK_ROW_LENGTH, GLint(padded / px));
        glReadPixels(0, 0, GLsizei(t.width), GLsizei(t.height), t.format.format, t.format.type,
                     (void*)0);
        glPixelStorei(GL_PACK_ROW_LENGTH, 0);

        // Block until the copy has landed in the pack buffer.
        GLsync fence = glFenceSync(GL_SYNC_GPU_COMMANDS_COMPLETE, 0);
        GLenum status = GL_TIMEOUT_EXPIRED;
        while (status == GL_TIMEOUT_EXPIRED) {
            status = glClientWaitSync(fence, GL_SYNC_FLUSH_COMMANDS_BIT, kWaitSliceNs);
        }
        glDeleteSync(fence);
        if (status == GL_WAIT_FAILED) {
            glBindBuffer(GL_PIXEL_PACK_BUFFER, 0);
            return Error{ErrorCode::DeviceError, "waiting for readback failed"};
        }

        std::vector<u8> bytes(needed);
        const void* mapped = glMapBufferRange(GL_PIXEL_PACK_BUFFER, 0, GLsizeiptr(needed),
                                              GL_MAP_READ_BIT);
        if (!mapped) {
            glBindBuffer(GL_PIXEL_PACK_BUFFER, 0);
            return Error{ErrorCode::DeviceError, "mapping readback buffer failed"};
        }
        std::memcpy(bytes.data(), mapped, needed);
        glUnmapBuffer(GL_PIXEL_PACK_BUFFER);
        glBindBuffer(GL_PIXEL_PACK_BUFFER, 0);
        glBindFramebuffer(GL_READ_FRAMEBUFFER, 0);
        return bytes;
    }

    Result<void> writeTextureRegion(TextureId texture, u32 x, u32 y, u32 width, u32 height,
                                    const std::vector<u8>& bytes) override {
        auto it = textures_.find(texture.value);
        if (it == textures_.end()) return notFound("texture", texture.value);
        const GLRenderTexture& t = it->second;

        u32 px = pixelSize(t.pixelFormat).valueOr(0);
        if (u64(x) + width > t.width || u64(y) + height > t.height ||
            bytes.size() != size_t(width) * height * px) {
            return Error{ErrorCode::InvalidArgument, "texture region does not match data"};
        }

        glBindTexture(GL_TEXTURE_2D, t.texture);
        glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
        glTexSubImage2D(GL_TEXTURE_2D, 0, GLint(x), GLint(y), GLsizei(width), GLsizei(height),
                        t.format.format, t.format.type, bytes.data());
        return {};
    }

    // --- Meshes ---

    Result<MeshId> createMesh(const MeshData& data) override {
        auto valid = data.validate();
        if (!valid) return valid.error();
        GLMesh mesh;
        mesh.init();
        mesh.upload(data);
        MeshId id{nextId_++};
        meshes_.emplace(id.value, mesh);
        return id;
    }

    Result<void> updateMesh(MeshId mesh, const MeshData& data) override {
        auto it = meshes_.find(mesh.value);
        if (it == meshes_.end()) return notFound("mesh", mesh.value);
        auto valid = data.validate();
        if (!valid) return valid;
        it->second.upload(data);
        return {};
    }

    void destroyMesh(MeshId mesh) override {
        auto it = meshes_.find(mesh.value);
        if (it == meshes_.end()) return;
        it->second.destroy();
        meshes_.erase(it);
    }

    bool hasMesh(MeshId mesh) const override { return meshes_.count(mesh.value) != 0; }

    // --- Materials ---

    Result<MaterialId> createMaterial(const MaterialDesc& desc) override {
        MaterialId id{nextId_++};
        materials_.emplace(id.value, desc);
        return id;
    }

    Result<void> updateMaterial(MaterialId material, const MaterialDesc& desc) override {
        auto it = materials_.find(material.value);
        if (it == materials_.end()) return notFound("material", material.value);
        it->second = desc;
        return {};
    }

    void destroyMaterial(MaterialId material) override { materials_.erase(material.value); }

    bool hasMaterial(MaterialId material) const override {
        return materials_.count(material.value) != 0;
    }

    // --- Drawables ---

    Result<EntityId> spawnDrawable(const DrawableDesc& desc) override {
        if (!hasMesh(desc.mesh)) return notFound("mesh", desc.mesh.value);
        if (!hasMaterial(desc.material)) return notFound("material", desc.material.value);
        EntityId id{nextId_++};
        drawables_.emplace(id.value, desc);
        return id;
    }

    void despawnDrawable(EntityId entity) override { drawables_.erase(entity.value); }

    // --- Frame ---

    Result<void> render(TextureId target, u32 layer) override {
        auto tex = textures_.find(target.value);
        if (tex == textures_.end()) return notFound("texture", target.value);
        const GLRenderTexture& t = tex->second;

        std::vector<const DrawableDesc*> queue;
        for (const auto& e : drawables_) {
            if (e.second.layer == layer) queue.push_back(&e.second);
        }
        std::stable_sort(queue.begin(), queue.end(),
                         [](const DrawableDesc* a, const DrawableDesc* b) {
                             return a->depthOffset > b->depthOffset;
                         });

        t.bind();
        glEnable(GL_DEPTH_TEST);
        glDepthFunc(GL_LEQUAL);
        glDepthMask(GL_TRUE);
        glClear(GL_DEPTH_BUFFER_BIT);

        program_.use();
        program_.setProjection(float(t.width), float(t.height), kDepthRange);
        glUniform1i(program_.samplerLoc, 0);

        for (const DrawableDesc* d : queue) {
            auto mesh = meshes_.find(d->mesh.value);
            auto mat = materials_.find(d->material.value);
            if (mesh == meshes_.end() || mat == materials_.end()) continue;
            const MaterialDesc& m = mat->second;

            GLuint sampled = 0;
            if (m.baseColorTexture.valid() && m.baseColorTexture != target) {
                auto st = textures_.find(m.baseColorTexture.value);
                if (st != textures_.end()) sampled = st->second.texture;
            }

            program_.setModel(d->transform);
            glUniform1f(program_.depthOffsetLoc, d->depthOffset / kDepthRange);
            glUniform4f(program_.baseColorLoc, m.baseColor.r, m.baseColor.g, m.baseColor.b,
                        m.baseColor.a);
            glUniform3f(program_.emissiveLoc, m.emissive.r, m.emissive.g, m.emissive.b);
            glUniform1i(program_.unlitLoc, m.unlit ? 1 : 0);
            glUniform1i(program_.useTextureLoc, sampled ? 1 : 0);
            glUniform1i(program_.alphaModeLoc, int(m.alphaMode));
            glUniform1f(program_.alphaCutoffLoc, m.alphaCutoff);

            glActiveTexture(GL_TEXTURE0);
            glBindTexture(GL_TEXTURE_2D, sampled);

            if (m.doubleSided) {
                glDisable(GL_CULL_FACE);
            } else {
                glEnable(GL_CULL_FACE);
                glCullFace(GL_BACK);
            }
            applyBlend(m.alphaMode);

            mesh->second.draw();
        }

        glDisable(GL_BLEND);
        glDisable(GL_CULL_FACE);
        glDisable(GL_DEPTH_TEST);
        glBindFramebuffer(GL_FRAMEBUFFER, 0);

        GLenum err = glGetError();
        if (err != GL_NO_ERROR) {
            return Error{ErrorCode::DeviceError, "GL error " + std::to_string(err)};
        }
        return {};
    }

    Result<void> present(TextureId target) override {
        if (!hasTexture(target)) return notFound("texture", target.value);
        glFlush();
        return {};
    }

private:
    u32 alignment_;
    u64 nextId_ = 1;
    GLShaderProgram program_;
    std::unordered_map<u64, GLRenderTexture> textures_;
    std::unordered_map<u64, GLPackBuffer> buffers_;
    std::unordered_map<u64, GLMesh> meshes_;
    std::unordered_map<u64, MaterialDesc> materials_;
    std::map<u64, DrawableDesc> drawables_;
};

// Factory
namespace RenderDevices {

std::shared_ptr<RenderDevice> MakeGL(u32 copyAlignment) {
    auto device = std::make_shared<GlDevice>(copyAlignment);
    if (!device->init()) return nullptr;
    return device;
}

} // namespace RenderDevices

} // namespace brush

#endif // BRUSH_HAS_GL
