#include "vrmi/assets/GltfUtils.hpp"

#include "vrmi/core/logger.hpp"

#include <cctype>
#include <cstring>
#include <fstream>
#include <span>

#include <fastgltf/tools.hpp>
#include <glm/gtc/type_ptr.hpp>

namespace vrmi::assets {

namespace {

bool readFileBytes(const std::filesystem::path &p,
                   std::vector<std::uint8_t> &out) {
  std::ifstream file(p, std::ios::binary);
  if (!file) {
    return false;
  }
  file.seekg(0, std::ios::end);
  const std::streamsize size = file.tellg();
  if (size <= 0) {
    return false;
  }
  file.seekg(0, std::ios::beg);
  out.resize(static_cast<size_t>(size));
  file.read(reinterpret_cast<char *>(out.data()), size);
  return file.good();
}

std::span<const std::uint8_t> asBytes(std::span<const std::byte> bytes) {
  return {reinterpret_cast<const std::uint8_t *>(bytes.data()), bytes.size()};
}

std::filesystem::path resolvePath(const fastgltf::sources::URI &uri,
                                  const std::filesystem::path &baseDir) {
  return (baseDir / uri.uri.fspath()).lexically_normal();
}

// Bytes of a whole buffer. External buffers that were not loaded with the
// asset are read from disk.
std::vector<std::uint8_t> bufferBytes(const fastgltf::Buffer &buffer,
                                      const std::filesystem::path &baseDir) {
  std::vector<std::uint8_t> out;
  std::visit(fastgltf::visitor{
                 [&](const fastgltf::sources::Array &a) {
                   auto bytes = asBytes(a.bytes);
                   out.assign(bytes.begin(), bytes.end());
                 },
                 [&](const fastgltf::sources::Vector &v) {
                   auto bytes = asBytes(v.bytes);
                   out.assign(bytes.begin(), bytes.end());
                 },
                 [&](const fastgltf::sources::ByteView &b) {
                   auto bytes = asBytes(b.bytes);
                   out.assign(bytes.begin(), bytes.end());
                 },
                 [&](const fastgltf::sources::URI &u) {
                   if (!readFileBytes(resolvePath(u, baseDir), out)) {
                     out.clear();
                   }
                 },
                 [&](auto &) {}},
             buffer.data);
  return out;
}

} // namespace

std::vector<std::uint8_t> base64Decode(std::string_view in) {
  static const auto lookup = []() {
    std::vector<int> t(256, -1);
    constexpr std::string_view alphabet =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    for (size_t i = 0; i < alphabet.size(); ++i) {
      t[static_cast<std::uint8_t>(alphabet[i])] = static_cast<int>(i);
    }
    return t;
  }();

  std::vector<std::uint8_t> out;
  out.reserve((in.size() * 3) / 4);

  std::uint32_t buf = 0;
  int bits = 0;
  for (unsigned char c : in) {
    if (c == '=') {
      break;
    }
    if (std::isspace(c) != 0 || lookup[c] == -1) {
      continue;
    }
    buf = (buf << 6) | static_cast<std::uint32_t>(lookup[c]);
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      out.push_back(static_cast<std::uint8_t>((buf >> bits) & 0xFF));
    }
  }
  return out;
}

std::optional<std::size_t> pickImageIndex(const fastgltf::Texture &texture) {
  if (texture.imageIndex.has_value()) {
    return texture.imageIndex.value();
  }
  if (texture.webpImageIndex.has_value()) {
    return texture.webpImageIndex.value();
  }
  return std::nullopt;
}

std::vector<std::uint8_t>
extractImageBytes(const fastgltf::Asset &gltf, const fastgltf::Image &image,
                  const std::filesystem::path &baseDir) {
  std::vector<std::uint8_t> bytes;

  std::visit(
      fastgltf::visitor{
          [&](const fastgltf::sources::Array &a) {
            auto view = asBytes(a.bytes);
            bytes.assign(view.begin(), view.end());
          },
          [&](const fastgltf::sources::Vector &v) {
            auto view = asBytes(v.bytes);
            bytes.assign(view.begin(), view.end());
          },
          [&](const fastgltf::sources::ByteView &b) {
            auto view = asBytes(b.bytes);
            bytes.assign(view.begin(), view.end());
          },
          [&](const fastgltf::sources::BufferView &viewSrc) {
            if (viewSrc.bufferViewIndex >= gltf.bufferViews.size()) {
              return;
            }
            const auto &bv = gltf.bufferViews[viewSrc.bufferViewIndex];
            if (bv.bufferIndex >= gltf.buffers.size()) {
              return;
            }
            const auto whole = bufferBytes(gltf.buffers[bv.bufferIndex], baseDir);
            if (bv.byteOffset + bv.byteLength > whole.size()) {
              return;
            }
            bytes.assign(whole.begin() + static_cast<std::ptrdiff_t>(bv.byteOffset),
                         whole.begin() + static_cast<std::ptrdiff_t>(bv.byteOffset + bv.byteLength));
          },
          [&](const fastgltf::sources::URI &uriSrc) {
            if (uriSrc.uri.scheme() == "data") {
              const auto s = uriSrc.uri.path();
              const auto comma = s.find(',');
              if (comma != std::string_view::npos) {
                bytes = base64Decode(s.substr(comma + 1));
              }
              return;
            }
            if (!readFileBytes(resolvePath(uriSrc, baseDir), bytes)) {
              bytes.clear();
            }
          },
          [&](auto &) {}},
      image.data);

  if (bytes.empty()) {
    core::Logger::Asset.warn("Image '{}' has no resolvable bytes",
                             std::string_view(image.name));
  }
  return bytes;
}

NodePose toNodePose(const fastgltf::Node &node) {
  NodePose pose;
  std::visit(fastgltf::visitor{
                 [&](const fastgltf::TRS &trs) {
                   pose.translation = glm::make_vec3(trs.translation.data());
                   pose.rotation = glm::quat(trs.rotation[3], trs.rotation[0],
                                             trs.rotation[1], trs.rotation[2]);
                 },
                 [&](const fastgltf::math::fmat4x4 &m) {
                   const glm::mat4 matrix = glm::make_mat4(m.data());
                   pose.translation = glm::vec3(matrix[3]);
                   const glm::mat3 basis(glm::normalize(glm::vec3(matrix[0])),
                                         glm::normalize(glm::vec3(matrix[1])),
                                         glm::normalize(glm::vec3(matrix[2])));
                   pose.rotation = glm::normalize(glm::quat_cast(basis));
                 }},
             node.transform);
  return pose;
}

} // namespace vrmi::assets
