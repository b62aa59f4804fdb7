#pragma once

// GL resource management utilities.
// Internal implementation - not part of public API.

#if BRUSH_HAS_GL

#include "brush/math.hpp"
#include "brush/mesh.hpp"
#include "brush/pixel_codec.hpp"
#include "brush/types.hpp"
#include <GL/glew.h>
#include <cstdio>
#include <cstring>
#include <vector>

namespace brush {

// Shader program management
class GLShaderProgram {
public:
    GLuint program = 0;
    GLint projLoc = -1;
    GLint modelLoc = -1;
    GLint depthOffsetLoc = -1;
    GLint baseColorLoc = -1;
    GLint emissiveLoc = -1;
    GLint unlitLoc = -1;
    GLint useTextureLoc = -1;
    GLint samplerLoc = -1;
    GLint alphaModeLoc = -1;
    GLint alphaCutoffLoc = -1;

    bool init(const char* vertSrc, const char* fragSrc) {
        GLuint vert = compileShader(GL_VERTEX_SHADER, vertSrc);
        GLuint frag = compileShader(GL_FRAGMENT_SHADER, fragSrc);
        if (!vert || !frag) {
            if (vert) glDeleteShader(vert);
            if (frag) glDeleteShader(frag);
            return false;
        }
        program = linkProgram(vert, frag);
        glDeleteShader(vert);
        glDeleteShader(frag);
        if (!program) return false;

        projLoc = glGetUniformLocation(program, "uProjection");
        modelLoc = glGetUniformLocation(program, "uModel");
        depthOffsetLoc = glGetUniformLocation(program, "uDepthOffset");
        baseColorLoc = glGetUniformLocation(program, "uBaseColor");
        emissiveLoc = glGetUniformLocation(program, "uEmissive");
        unlitLoc = glGetUniformLocation(program, "uUnlit");
        useTextureLoc = glGetUniformLocation(program, "uUseTexture");
        samplerLoc = glGetUniformLocation(program, "uTexture");
        alphaModeLoc = glGetUniformLocation(program, "uAlphaMode");
        alphaCutoffLoc = glGetUniformLocation(program, "uAlphaCutoff");
        return true;
    }

    void destroy() {
        if (program) { glDeleteProgram(program); program = 0; }
    }

    void use() const { glUseProgram(program); }

    // Canvas pixel space to clip space. Pixel row 0 lands on framebuffer
    // row 0, so readback rows come out top row first. Larger z is nearer.
    void setProjection(float w, float h, float depthRange) const {
        float m[16];
        std::memset(m, 0, sizeof(m));
        m[0] = 2.0f / w; m[5] = 2.0f / h; m[10] = -1.0f / depthRange;
        m[12] = -1.0f; m[13] = -1.0f; m[15] = 1.0f;
        glUniformMatrix4fv(projLoc, 1, GL_FALSE, m);
    }

    void setModel(const Affine3& t) const {
        const float m[16] = {
            t.xAxis.x, t.xAxis.y, t.xAxis.z, 0.0f,
            t.yAxis.x, t.yAxis.y, t.yAxis.z, 0.0f,
            t.zAxis.x, t.zAxis.y, t.zAxis.z, 0.0f,
            t.translation.x, t.translation.y, t.translation.z, 1.0f,
        };
        glUniformMatrix4fv(modelLoc, 1, GL_FALSE, m);
    }

private:
    static GLuint compileShader(GLenum type, const char* src) {
        GLuint shader = glCreateShader(type);
        glShaderSource(shader, 1, &src, nullptr);
        glCompileShader(shader);
        GLint ok = 0;
        glGetShaderiv(shader, GL_COMPILE_STATUS, &ok);
        if (!ok) {
            char log[512];
            glGetShaderInfoLog(shader, sizeof(log), nullptr, log);
            std::fprintf(stderr, "brush GL: shader error: %s\n", log);
            glDeleteShader(shader);
            return 0;
        }
        return shader;
    }

    static GLuint linkProgram(GLuint vert, GLuint frag) {
        GLuint prog = glCreateProgram();
        glAttachShader(prog, vert);
        glAttachShader(prog, frag);
        glLinkProgram(prog);
        GLint ok = 0;
        glGetProgramiv(prog, GL_LINK_STATUS, &ok);
        if (!ok) {
            char log[512];
            glGetProgramInfoLog(prog, sizeof(log), nullptr, log);
            std::fprintf(stderr, "brush GL: link error: %s\n", log);
            glDeleteProgram(prog);
            return 0;
        }
        return prog;
    }
};

// Upload/readback parameters of a pixel format
struct GLFormat {
    GLenum internalFormat = 0;
    GLenum format = 0;
    GLenum type = 0;
};

inline bool glFormatFor(PixelFormat fmt, GLFormat* out) {
    switch (fmt) {
        case PixelFormat::RGBA8Unorm:     *out = {GL_RGBA8, GL_RGBA, GL_UNSIGNED_BYTE}; return true;
        case PixelFormat::RGBA8UnormSrgb: *out = {GL_SRGB8_ALPHA8, GL_RGBA, GL_UNSIGNED_BYTE}; return true;
        case PixelFormat::BGRA8Unorm:     *out = {GL_RGBA8, GL_BGRA, GL_UNSIGNED_BYTE}; return true;
        case PixelFormat::RGBA16Float:    *out = {GL_RGBA16F, GL_RGBA, GL_HALF_FLOAT}; return true;
        case PixelFormat::RGBA32Float:    *out = {GL_RGBA32F, GL_RGBA, GL_FLOAT}; return true;
        default: return false;
    }
}

// Texture with its own framebuffer and depth attachment
class GLRenderTexture {
public:
    GLuint texture = 0;
    GLuint fbo = 0;
    GLuint depth = 0;
    u32 width = 0;
    u32 height = 0;
    PixelFormat pixelFormat = PixelFormat::RGBA8Unorm;
    GLFormat format;

    bool init(u32 w, u32 h, PixelFormat fmt, const GLFormat& glFmt) {
        pixelFormat = fmt;
        format = glFmt;
        glGenTextures(1, &texture);
        glGenRenderbuffers(1, &depth);
        glGenFramebuffers(1, &fbo);
        allocate(w, h);

        glBindFramebuffer(GL_FRAMEBUFFER, fbo);
        glFramebufferTexture2D(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, GL_TEXTURE_2D, texture, 0);
        glFramebufferRenderbuffer(GL_FRAMEBUFFER, GL_DEPTH_ATTACHMENT, GL_RENDERBUFFER, depth);
        GLenum status = glCheckFramebufferStatus(GL_FRAMEBUFFER);
        glBindFramebuffer(GL_FRAMEBUFFER, 0);
        if (status != GL_FRAMEBUFFER_COMPLETE) {
            std::fprintf(stderr, "brush GL: framebuffer incomplete (0x%x)\n", status);
            return false;
        }
        return true;
    }

    void destroy() {
        if (texture) { glDeleteTextures(1, &texture); texture = 0; }
        if (depth) { glDeleteRenderbuffers(1, &depth); depth = 0; }
        if (fbo) { glDeleteFramebuffers(1, &fbo); fbo = 0; }
    }

    void allocate(u32 w, u32 h) {
        width = w;
        height = h;
        glBindTexture(GL_TEXTURE_2D, texture);
        glTexImage2D(GL_TEXTURE_2D, 0, GLint(format.internalFormat), GLsizei(w), GLsizei(h), 0,
                     format.format, format.type, nullptr);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);

        glBindRenderbuffer(GL_RENDERBUFFER, depth);
        glRenderbufferStorage(GL_RENDERBUFFER, GL_DEPTH_COMPONENT24, GLsizei(w), GLsizei(h));
        glBindRenderbuffer(GL_RENDERBUFFER, 0);
    }

    void bind() const {
        glBindFramebuffer(GL_FRAMEBUFFER, fbo);
        glViewport(0, 0, GLsizei(width), GLsizei(height));
    }
};

// Interleaved vertex of a device mesh
struct GLMeshVertex {
    float px, py, pz;
    float nx, ny, nz;
    float r, g, b, a;
    float u, v;
};

// Vertex/index buffers with VAO
class GLMesh {
public:
    GLuint vao = 0;
    GLuint vbo = 0;
    GLuint ibo = 0;
    GLenum mode = GL_TRIANGLES;
    GLsizei count = 0;
    bool indexed = false;

    void init() {
        glGenVertexArrays(1, &vao);
        glGenBuffers(1, &vbo);
        glGenBuffers(1, &ibo);

        glBindVertexArray(vao);
        glBindBuffer(GL_ARRAY_BUFFER, vbo);
        glVertexAttribPointer(0, 3, GL_FLOAT, GL_FALSE, sizeof(GLMeshVertex), (void*)0);
        glEnableVertexAttribArray(0);
        glVertexAttribPointer(1, 3, GL_FLOAT, GL_FALSE, sizeof(GLMeshVertex), (void*)12);
        glEnableVertexAttribArray(1);
        glVertexAttribPointer(2, 4, GL_FLOAT, GL_FALSE, sizeof(GLMeshVertex), (void*)24);
        glEnableVertexAttribArray(2);
        glVertexAttribPointer(3, 2, GL_FLOAT, GL_FALSE, sizeof(GLMeshVertex), (void*)40);
        glEnableVertexAttribArray(3);
        glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, ibo);
        glBindVertexArray(0);
    }

    void destroy() {
        if (vao) { glDeleteVertexArrays(1, &vao); vao = 0; }
        if (vbo) { glDeleteBuffers(1, &vbo); vbo = 0; }
        if (ibo) { glDeleteBuffers(1, &ibo); ibo = 0; }
    }

    // Custom attributes are not uploaded; missing built-ins get defaults.
    void upload(const MeshData& data) {
        std::vector<GLMeshVertex> verts(data.vertexCount());
        for (size_t i = 0; i < verts.size(); ++i) {
            const Vec3& p = data.positions[i];
            Vec3 n = i < data.normals.size() ? data.normals[i] : Vec3{0, 0, 1};
            Color c = i < data.colors.size() ? data.colors[i] : Color::white();
            Vec2 t = i < data.uvs.size() ? data.uvs[i] : Vec2{};
            verts[i] = {p.x, p.y, p.z, n.x, n.y, n.z, c.r, c.g, c.b, c.a, t.x, t.y};
        }

        glBindVertexArray(vao);
        glBindBuffer(GL_ARRAY_BUFFER, vbo);
        glBufferData(GL_ARRAY_BUFFER, GLsizeiptr(verts.size() * sizeof(GLMeshVertex)),
                     verts.data(), GL_STATIC_DRAW);
        glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, ibo);
        glBufferData(GL_ELEMENT_ARRAY_BUFFER, GLsizeiptr(data.indices.size() * sizeof(u32)),
                     data.indices.data(), GL_STATIC_DRAW);
        glBindVertexArray(0);

        indexed = !data.indices.empty();
        count = GLsizei(indexed ? data.indices.size() : verts.size());
        mode = primitiveMode(data.topology);
    }

    void draw() const {
        glBindVertexArray(vao);
        if (indexed) {
            glDrawElements(mode, count, GL_UNSIGNED_INT, (void*)0);
        } else {
            glDrawArrays(mode, 0, count);
        }
        glBindVertexArray(0);
    }

private:
    static GLenum primitiveMode(Topology t) {
        switch (t) {
            case Topology::PointList:     return GL_POINTS;
            case Topology::LineList:      return GL_LINES;
            case Topology::LineStrip:     return GL_LINE_STRIP;
            case Topology::TriangleList:  return GL_TRIANGLES;
            case Topology::TriangleStrip: return GL_TRIANGLE_STRIP;
        }
        return GL_TRIANGLES;
    }
};

// Pixel-pack buffer used as a readback target
class GLPackBuffer {
public:
    GLuint pbo = 0;
    size_t size = 0;

    void init(size_t bytes) {
        size = bytes;
        glGenBuffers(1, &pbo);
        glBindBuffer(GL_PIXEL_PACK_BUFFER, pbo);
        glBufferData(GL_PIXEL_PACK_BUFFER, GLsizeiptr(bytes), nullptr, GL_STREAM_READ);
        glBindBuffer(GL_PIXEL_PACK_BUFFER, 0);
    }

    void destroy() {
        if (pbo) { glDeleteBuffers(1, &pbo); pbo = 0; }
        size = 0;
    }
};

} // namespace brush

#endif // BRUSH_HAS_GL
