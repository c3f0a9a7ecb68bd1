#pragma once

#include <cstdint>
#include <string>

#include "visual/Palette.h"

struct AnimationClip;

using RenderNode = std::uint32_t;
inline constexpr RenderNode kInvalidRenderNode = 0;

enum class NodeKind : std::uint8_t {
  Rect,
  Label,
};

struct NodeDesc {
  NodeKind kind = NodeKind::Rect;
  float width = 0.0F;   // px
  float height = 0.0F;  // px
  Visual::Color color{};
  std::string text;  // Label only
};

// Draw-tree collaborator. Coordinates are pixels. The core never reads state back.
class SceneGraph {
 public:
  virtual ~SceneGraph() = default;

  virtual RenderNode create(const NodeDesc& desc) = 0;
  virtual void attach(RenderNode node, RenderNode parent) = 0;
  virtual void detach(RenderNode node) = 0;
  virtual void setTransform(RenderNode node, float x, float y) = 0;
  virtual void setAlpha(RenderNode node, float alpha) = 0;
  virtual void setFlipX(RenderNode node, bool flip) = 0;
  virtual void playClip(RenderNode node, const std::string& name, const AnimationClip& clip) = 0;
  virtual void destroy(RenderNode node) = 0;

  // Container that world-space nodes attach under.
  virtual RenderNode worldLayer() const = 0;
};
