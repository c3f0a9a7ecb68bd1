#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

struct AnimationClip {
  std::vector<std::string> frames;  // texture/frame names, owned by the asset side
  float fps = 8.0F;
  bool loop = true;
};

// Read-only name -> clip lookup shared by every entity using the same art.
class AnimationTable {
 public:
  bool loadFromToml(const char* path);
  bool parse(std::string_view text, const char* sourceName = nullptr);

  // Throws ConfigurationError for a clip with no frames or a non-positive fps.
  void add(std::string name, AnimationClip clip);

  [[nodiscard]] const AnimationClip* find(const std::string& name) const;
  [[nodiscard]] bool contains(const std::string& name) const { return find(name) != nullptr; }
  [[nodiscard]] std::size_t size() const { return clips_.size(); }

 private:
  bool load(std::string_view source, const char* name, bool fromFile);

  std::unordered_map<std::string, AnimationClip> clips_;
};
