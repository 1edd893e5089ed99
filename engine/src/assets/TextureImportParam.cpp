#include "vrmi/assets/TextureImportParam.hpp"

namespace vrmi::assets {

    std::string_view toString(TextureImportKind kind) {
        switch (kind) {
        case TextureImportKind::sRGB:
            return "sRGB";
        case TextureImportKind::Linear:
            return "Linear";
        case TextureImportKind::NormalMap:
            return "NormalMap";
        case TextureImportKind::StandardMap:
            return "StandardMap";
        }
        return "Unknown";
    }

    TextureImportName TextureImportName::make(TextureImportKind kind, std::string gltfName,
                                              std::string_view occlusionName) {
        TextureImportName name;
        name.kind = kind;
        switch (kind) {
        case TextureImportKind::NormalMap:
            name.convertedName = gltfName + ".normal";
            break;
        case TextureImportKind::StandardMap:
            if (!occlusionName.empty() && occlusionName != gltfName) {
                name.convertedName = gltfName + "+" + std::string(occlusionName) + ".standard";
            } else {
                name.convertedName = gltfName + ".standard";
            }
            break;
        default:
            name.convertedName = gltfName;
            break;
        }
        name.gltfName = std::move(gltfName);
        return name;
    }

} // namespace vrmi::assets
