#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include <SDL3/SDL_render.h>

#include "render/SceneGraph.h"

// SceneGraph backed by SDL3. Nodes are coloured rects or debug-font labels in
// world pixels; draw() renders attached nodes in attach order.
class SdlSceneGraph final : public SceneGraph {
 public:
  struct Node {
    NodeDesc desc;
    RenderNode parent = kInvalidRenderNode;
    bool attached = false;
    float x = 0.0F;
    float y = 0.0F;
    float alpha = 1.0F;
    bool flipX = false;
    std::string clip;
    float clipFps = 0.0F;
  };

  SdlSceneGraph();

  RenderNode create(const NodeDesc& desc) override;
  void attach(RenderNode node, RenderNode parent) override;
  void detach(RenderNode node) override;
  void setTransform(RenderNode node, float x, float y) override;
  void setAlpha(RenderNode node, float alpha) override;
  void setFlipX(RenderNode node, bool flip) override;
  void playClip(RenderNode node, const std::string& name, const AnimationClip& clip) override;
  void destroy(RenderNode node) override;
  RenderNode worldLayer() const override { return world_; }

  void draw(SDL_Renderer* renderer, float camX, float camY) const;

  [[nodiscard]] const Node* find(RenderNode node) const;
  [[nodiscard]] std::size_t nodeCount() const { return nodes_.size(); }
  [[nodiscard]] std::size_t attachedCount() const { return order_.size(); }

 private:
  Node& at(RenderNode node);

  std::unordered_map<RenderNode, Node> nodes_;
  std::vector<RenderNode> order_;  // attached nodes, attach order
  RenderNode world_ = kInvalidRenderNode;
  RenderNode next_ = 1;
};
