#pragma once

/**
 * @file command.hpp
 * @brief Draw command variants and the per-canvas append-only command buffer.
 */

#include "brush/material.hpp"
#include "brush/tessellation.hpp"
#include "brush/types.hpp"
#include <string>
#include <vector>

namespace brush {

class CommandVisitor;

/// @brief One recorded drawing operation.
///
/// Immutable once recorded. The payload lives in a union selected by type;
/// SetMaterialProperty keeps its name and value beside the union.
struct DrawCommand {
    /// @brief Command type enumeration.
    enum class Type : u8 {
        SetFill,
        ClearFill,
        SetStroke,
        ClearStroke,
        SetStrokeWeight,
        SetMaterialProperty,
        Rect,
        DrawMesh,
        DrawBox,
        DrawSphere,
        BackgroundColor,
        BackgroundImage,
        PushTransform,
        PopTransform,
        ResetTransform,
        Translate,
        Rotate,
        Scale,
        ShearX,
        ShearY,
        UseMaterial
    };

    Type type = Type::PushTransform;

    /// @brief Union of per-command data variants.
    union Data {
        Color color;                                             ///< SetFill, SetStroke, BackgroundColor.
        f32 scalar;                                              ///< SetStrokeWeight, Rotate, ShearX, ShearY.
        struct { f32 x; f32 y; } vec;                            ///< Translate, Scale.
        struct { f32 x; f32 y; f32 w; f32 h; f32 radii[4]; } rect;
        struct { f32 width; f32 height; f32 depth; } box;
        struct { f32 radius; u32 sectors; u32 stacks; } sphere;
        GeometryId geometry;                                     ///< DrawMesh.
        ImageId image;                                           ///< BackgroundImage.
        MaterialId material;                                     ///< UseMaterial.

        Data() : rect{0, 0, 0, 0, {0, 0, 0, 0}} {}
    } data;

    std::string name;        ///< SetMaterialProperty name.
    MaterialValue value;     ///< SetMaterialProperty value.

    static DrawCommand SetFill(Color c);
    static DrawCommand ClearFill();
    static DrawCommand SetStroke(Color c);
    static DrawCommand ClearStroke();
    static DrawCommand SetStrokeWeight(f32 weight);
    static DrawCommand SetMaterialProperty(std::string name, const MaterialValue& value);
    static DrawCommand Rect(f32 x, f32 y, f32 w, f32 h, const CornerRadii& radii = {});
    static DrawCommand DrawMesh(GeometryId geometry);
    static DrawCommand DrawBox(f32 width, f32 height, f32 depth);
    static DrawCommand DrawSphere(f32 radius, u32 sectors, u32 stacks);
    static DrawCommand BackgroundColor(Color c);
    static DrawCommand BackgroundImage(ImageId image);
    static DrawCommand PushTransform();
    static DrawCommand PopTransform();
    static DrawCommand ResetTransform();
    static DrawCommand Translate(f32 x, f32 y);
    static DrawCommand Rotate(f32 angle);
    static DrawCommand Scale(f32 x, f32 y);
    static DrawCommand ShearX(f32 angle);
    static DrawCommand ShearY(f32 angle);
    static DrawCommand UseMaterial(MaterialId material);

    /// @brief True for commands that emit geometry.
    bool isDrawing() const;
};

/// @brief Return the enumerator name of a command type.
const char* commandTypeName(DrawCommand::Type type);

/// @brief Call the visitor method matching cmd.type.
void dispatchCommand(const DrawCommand& cmd, CommandVisitor& visitor);

/// @brief Ordered, append-only log of draw commands awaiting replay.
class CommandBuffer {
public:
    /// @brief Append a command. O(1) amortized.
    void push(DrawCommand cmd) { commands_.push_back(std::move(cmd)); }

    const std::vector<DrawCommand>& commands() const { return commands_; }
    size_t size() const { return commands_.size(); }
    bool empty() const { return commands_.empty(); }
    void clear() { commands_.clear(); }

    /// @brief Move every command out, leaving the buffer empty.
    std::vector<DrawCommand> take();

    /// @brief Replay commands in recording order.
    void accept(CommandVisitor& visitor) const;

private:
    std::vector<DrawCommand> commands_;
};

} // namespace brush
