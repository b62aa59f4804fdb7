#pragma once

/**
 * @file command_visitor.hpp
 * @brief Visitor interface for replaying recorded draw commands.
 */

#include "brush/material.hpp"
#include "brush/tessellation.hpp"
#include "brush/types.hpp"
#include <string>

namespace brush {

/// @brief Visitor interface for replaying recorded draw commands.
///
/// Implement this interface to process commands dispatched by
/// CommandBuffer::accept() or dispatchCommand(), in recording order.
class CommandVisitor {
public:
    virtual ~CommandVisitor() = default;

    // Paint state
    virtual void visitSetFill(Color color) = 0;
    virtual void visitClearFill() = 0;
    virtual void visitSetStroke(Color color) = 0;
    virtual void visitClearStroke() = 0;
    virtual void visitSetStrokeWeight(f32 weight) = 0;
    virtual void visitSetMaterialProperty(const std::string& name, const MaterialValue& value) = 0;
    virtual void visitUseMaterial(MaterialId material) = 0;

    // Shapes
    /// @brief Visit a rectangle with corner radii (top-left, top-right, bottom-right, bottom-left).
    virtual void visitRect(f32 x, f32 y, f32 w, f32 h, const CornerRadii& radii) = 0;
    virtual void visitDrawMesh(GeometryId geometry) = 0;
    virtual void visitDrawBox(f32 width, f32 height, f32 depth) = 0;
    virtual void visitDrawSphere(f32 radius, u32 sectors, u32 stacks) = 0;
    virtual void visitBackgroundColor(Color color) = 0;
    virtual void visitBackgroundImage(ImageId image) = 0;

    // Transform
    virtual void visitPushTransform() = 0;
    virtual void visitPopTransform() = 0;
    virtual void visitResetTransform() = 0;
    virtual void visitTranslate(f32 x, f32 y) = 0;
    virtual void visitRotate(f32 angle) = 0;
    virtual void visitScale(f32 x, f32 y) = 0;
    virtual void visitShearX(f32 angle) = 0;
    virtual void visitShearY(f32 angle) = 0;
};

} // namespace brush
