#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

#include <fastgltf/core.hpp>
#include <fastgltf/types.hpp>
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

namespace vrmi::assets {

std::vector<std::uint8_t> base64Decode(std::string_view in);

std::optional<std::size_t> pickImageIndex(const fastgltf::Texture &texture);

// Encoded bytes of an image, wherever the asset keeps them. Empty when the
// source cannot be resolved.
std::vector<std::uint8_t>
extractImageBytes(const fastgltf::Asset &gltf, const fastgltf::Image &image,
                  const std::filesystem::path &baseDir);

struct NodePose {
  glm::vec3 translation{0.0f};
  glm::quat rotation{1.0f, 0.0f, 0.0f, 0.0f};
};

// Local translation / rotation of a node; matrix nodes are decomposed.
NodePose toNodePose(const fastgltf::Node &node);

} // namespace vrmi::assets
