#include "brush/command.hpp"
#include "brush/command_visitor.hpp"

#include <utility>

namespace brush {

namespace {

DrawCommand make(DrawCommand::Type type) {
    DrawCommand cmd;
    cmd.type = type;
    return cmd;
}

DrawCommand makeScalar(DrawCommand::Type type, f32 v) {
    DrawCommand cmd = make(type);
    cmd.data.scalar = v;
    return cmd;
}

DrawCommand makeColor(DrawCommand::Type type, Color c) {
    DrawCommand cmd = make(type);
    cmd.data.color = c;
    return cmd;
}

DrawCommand makeVec(DrawCommand::Type type, f32 x, f32 y) {
    DrawCommand cmd = make(type);
    cmd.data.vec.x = x;
    cmd.data.vec.y = y;
    return cmd;
}

}

// --- DrawCommand factories ---

DrawCommand DrawCommand::SetFill(Color c) { return makeColor(Type::SetFill, c); }
DrawCommand DrawCommand::ClearFill() { return make(Type::ClearFill); }
DrawCommand DrawCommand::SetStroke(Color c) { return makeColor(Type::SetStroke, c); }
DrawCommand DrawCommand::ClearStroke() { return make(Type::ClearStroke); }
DrawCommand DrawCommand::SetStrokeWeight(f32 weight) { return makeScalar(Type::SetStrokeWeight, weight); }

DrawCommand DrawCommand::SetMaterialProperty(std::string name, const MaterialValue& value) {
    DrawCommand cmd = make(Type::SetMaterialProperty);
    cmd.name = std::move(name);
    cmd.value = value;
    return cmd;
}

DrawCommand DrawCommand::Rect(f32 x, f32 y, f32 w, f32 h, const CornerRadii& radii) {
    DrawCommand cmd = make(Type::Rect);
    cmd.data.rect.x = x;
    cmd.data.rect.y = y;
    cmd.data.rect.w = w;
    cmd.data.rect.h = h;
    for (int i = 0; i < 4; ++i) cmd.data.rect.radii[i] = radii[i];
    return cmd;
}

DrawCommand DrawCommand::DrawMesh(GeometryId geometry) {
    DrawCommand cmd = make(Type::DrawMesh);
    cmd.data.geometry = geometry;
    return cmd;
}

DrawCommand DrawCommand::DrawBox(f32 width, f32 height, f32 depth) {
    DrawCommand cmd = make(Type::DrawBox);
    cmd.data.box.width = width;
    cmd.data.box.height = height;
    cmd.data.box.depth = depth;
    return cmd;
}

DrawCommand DrawCommand::DrawSphere(f32 radius, u32 sectors, u32 stacks) {
    DrawCommand cmd = make(Type::DrawSphere);
    cmd.data.sphere.radius = radius;
    cmd.data.sphere.sectors = sectors;
    cmd.data.sphere.stacks = stacks;
    return cmd;
}

DrawCommand DrawCommand::BackgroundColor(Color c) { return makeColor(Type::BackgroundColor, c); }

DrawCommand DrawCommand::BackgroundImage(ImageId image) {
    DrawCommand cmd = make(Type::BackgroundImage);
    cmd.data.image = image;
    return cmd;
}

DrawCommand DrawCommand::PushTransform() { return make(Type::PushTransform); }
DrawCommand DrawCommand::PopTransform() { return make(Type::PopTransform); }
DrawCommand DrawCommand::ResetTransform() { return make(Type::ResetTransform); }
DrawCommand DrawCommand::Translate(f32 x, f32 y) { return makeVec(Type::Translate, x, y); }
DrawCommand DrawCommand::Rotate(f32 angle) { return makeScalar(Type::Rotate, angle); }
DrawCommand DrawCommand::Scale(f32 x, f32 y) { return makeVec(Type::Scale, x, y); }
DrawCommand DrawCommand::ShearX(f32 angle) { return makeScalar(Type::ShearX, angle); }
DrawCommand DrawCommand::ShearY(f32 angle) { return makeScalar(Type::ShearY, angle); }

DrawCommand DrawCommand::UseMaterial(MaterialId material) {
    DrawCommand cmd = make(Type::UseMaterial);
    cmd.data.material = material;
    return cmd;
}

bool DrawCommand::isDrawing() const {
    switch (type) {
        case Type::Rect:
        case Type::DrawMesh:
        case Type::DrawBox:
        case Type::DrawSphere:
        case Type::BackgroundColor:
        case Type::BackgroundImage:
            return true;
        default:
            return false;
    }
}

const char* commandTypeName(DrawCommand::Type type) {
    using T = DrawCommand::Type;
    switch (type) {
        case T::SetFill:             return "SetFill";
        case T::ClearFill:           return "ClearFill";
        case T::SetStroke:           return "SetStroke";
        case T::ClearStroke:         return "ClearStroke";
        case T::SetStrokeWeight:     return "SetStrokeWeight";
        case T::SetMaterialProperty: return "SetMaterialProperty";
        case T::Rect:                return "Rect";
        case T::DrawMesh:            return "DrawMesh";
        case T::DrawBox:             return "DrawBox";
        case T::DrawSphere:          return "DrawSphere";
        case T::BackgroundColor:     return "BackgroundColor";
        case T::BackgroundImage:     return "BackgroundImage";
        case T::PushTransform:       return "PushTransform";
        case T::PopTransform:        return "PopTransform";
        case T::ResetTransform:      return "ResetTransform";
        case T::Translate:           return "Translate";
        case T::Rotate:              return "Rotate";
        case T::Scale:               return "Scale";
        case T::ShearX:              return "ShearX";
        case T::ShearY:              return "ShearY";
        case T::UseMaterial:         return "UseMaterial";
    }
    return "Unknown";
}

void dispatchCommand(const DrawCommand& cmd, CommandVisitor& visitor) {
    using T = DrawCommand::Type;
    const auto& d = cmd.data;
    switch (cmd.type) {
        case T::SetFill:
            visitor.visitSetFill(d.color);
            break;
        case T::ClearFill:
            visitor.visitClearFill();
            break;
        case T::SetStroke:
            visitor.visitSetStroke(d.color);
            break;
        case T::ClearStroke:
            visitor.visitClearStroke();
            break;
        case T::SetStrokeWeight:
            visitor.visitSetStrokeWeight(d.scalar);
            break;
        case T::SetMaterialProperty:
            visitor.visitSetMaterialProperty(cmd.name, cmd.value);
            break;
        case T::Rect:
            visitor.visitRect(d.rect.x, d.rect.y, d.rect.w, d.rect.h,
                              {d.rect.radii[0], d.rect.radii[1], d.rect.radii[2], d.rect.radii[3]});
            break;
        case T::DrawMesh:
            visitor.visitDrawMesh(d.geometry);
            break;
        case T::DrawBox:
            visitor.visitDrawBox(d.box.width, d.box.height, d.box.depth);
            break;
        case T::DrawSphere:
            visitor.visitDrawSphere(d.sphere.radius, d.sphere.sectors, d.sphere.stacks);
            break;
        case T::BackgroundColor:
            visitor.visitBackgroundColor(d.color);
            break;
        case T::BackgroundImage:
            visitor.visitBackgroundImage(d.image);
            break;
        case T::PushTransform:
            visitor.visitPushTransform();
            break;
        case T::PopTransform:
            visitor.visitPopTransform();
            break;
        case T::ResetTransform:
            visitor.visitResetTransform();
            break;
        case T::Translate:
            visitor.visitTranslate(d.vec.x, d.vec.y);
            break;
        case T::Rotate:
            visitor.visitRotate(d.scalar);
            break;
        case T::Scale:
            visitor.visitScale(d.vec.x, d.vec.y);
            break;
        case T::ShearX:
            visitor.visitShearX(d.scalar);
            break;
        case T::ShearY:
            visitor.visitShearY(d.scalar);
            break;
        case T::UseMaterial:
            visitor.visitUseMaterial(d.material);
            break;
    }
}

// --- CommandBuffer ---

std::vector<DrawCommand> CommandBuffer::take() {
    std::vector<DrawCommand> out;
    out.swap(commands_);
    return out;
}

void CommandBuffer::accept(CommandVisitor& visitor) const {
    for (const auto& cmd : commands_) {
        dispatchCommand(cmd, visitor);
    }
}

} // namespace brush
