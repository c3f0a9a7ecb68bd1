#include "render/SdlSceneGraph.h"

#include <algorithm>
#include <format>
#include <stdexcept>

#include "animation/Animation.h"
#include "visual/Shapes.h"

SdlSceneGraph::SdlSceneGraph() {
  world_ = create(NodeDesc{});
}

SdlSceneGraph::Node& SdlSceneGraph::at(RenderNode node) {
  auto it = nodes_.find(node);
  if (it == nodes_.end())
    throw std::out_of_range(std::format("unknown render node {}", node));
  return it->second;
}

const SdlSceneGraph::Node* SdlSceneGraph::find(RenderNode node) const {
  auto it = nodes_.find(node);
  return (it != nodes_.end()) ? &it->second : nullptr;
}

RenderNode SdlSceneGraph::create(const NodeDesc& desc) {
  const RenderNode id = next_++;
  nodes_.emplace(id, Node{desc});
  return id;
}

void SdlSceneGraph::attach(RenderNode node, RenderNode parent) {
  Node& n = at(node);
  (void)at(parent);
  if (n.attached)
    detach(node);
  n.parent = parent;
  n.attached = true;
  order_.push_back(node);
}

void SdlSceneGraph::detach(RenderNode node) {
  Node& n = at(node);
  if (!n.attached)
    return;
  n.attached = false;
  n.parent = kInvalidRenderNode;
  std::erase(order_, node);
}

void SdlSceneGraph::setTransform(RenderNode node, float x, float y) {
  Node& n = at(node);
  n.x = x;
  n.y = y;
}

void SdlSceneGraph::setAlpha(RenderNode node, float alpha) {
  at(node).alpha = std::clamp(alpha, 0.0F, 1.0F);
}

void SdlSceneGraph::setFlipX(RenderNode node, bool flip) {
  at(node).flipX = flip;
}

void SdlSceneGraph::playClip(RenderNode node, const std::string& name, const AnimationClip& clip) {
  Node& n = at(node);
  n.clip = name;
  n.clipFps = clip.fps;
}

void SdlSceneGraph::destroy(RenderNode node) {
  if (node == world_)
    throw std::invalid_argument("the world layer can't be destroyed");
  detach(node);
  nodes_.erase(node);
}

void SdlSceneGraph::draw(SDL_Renderer* renderer, float camX, float camY) const {
  SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
  Visual::ShapeRenderer shapes(renderer);

  for (RenderNode id : order_) {
    const Node& n = nodes_.at(id);
    const Visual::Color color = Visual::withOpacity(n.desc.color, n.alpha);
    if (color.a == 0)
      continue;

    // anchor is the body centre
    const float left = n.x - camX - n.desc.width * 0.5F;
    const float top = n.y - camY - n.desc.height * 0.5F;
    switch (n.desc.kind) {
      case NodeKind::Rect:
        shapes.fillRect(left, top, n.desc.width, n.desc.height, color);
        // facing marker on the leading edge
        shapes.fillRect(n.flipX ? left : left + n.desc.width - 3.0F, top + 4.0F, 3.0F, 3.0F,
                        Visual::darken(color, 0.5F));
        break;
      case NodeKind::Label:
        shapes.text(left, top, n.desc.text.c_str(), color);
        break;
    }
  }
}
