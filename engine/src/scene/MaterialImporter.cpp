#include "vrmi/scene/MaterialImporter.hpp"

#include "vrmi/core/logger.hpp"
#include "vrmi/core/profiler.hpp"

namespace vrmi::scene
{
    MaterialHandle MaterialImporter::importMaterial(const MaterialDescription& material)
    {
        runtime::MaterialDescriptor desc;
        desc.name = material.name;
        desc.baseColorFactor = material.baseColorFactor;
        desc.metallicFactor = material.metallicFactor;
        desc.roughnessFactor = material.roughnessFactor;
        desc.normalScale = material.normalScale;
        desc.occlusionStrength = material.occlusionStrength;
        desc.emissiveFactor = material.emissiveFactor;
        desc.alphaMode = material.alphaMode;
        desc.alphaCutoff = material.alphaCutoff;
        desc.doubleSided = material.doubleSided;

        const bool hasTextures = material.baseColorTexture || material.normalTexture ||
            material.metallicRoughnessTexture || material.occlusionTexture || material.emissiveTexture;

        if (m_params == nullptr)
        {
            if (hasTextures)
            {
                core::Logger::Asset.warn("Material '{}' references textures but no texture source is attached",
                                         material.name);
            }
            return m_device.createMaterial(desc);
        }

        if (material.baseColorTexture)
        {
            desc.baseColorTexture = m_textures.getTexture(m_params->createSRGB(*material.baseColorTexture));
        }
        if (material.normalTexture)
        {
            desc.normalTexture = m_textures.getTexture(m_params->createNormal(*material.normalTexture));
        }
        if (material.metallicRoughnessTexture || material.occlusionTexture)
        {
            desc.standardTexture = m_textures.getTexture(
                m_params->createStandard(material.metallicRoughnessTexture, material.occlusionTexture,
                                         material.metallicFactor, material.roughnessFactor));
        }
        if (material.emissiveTexture)
        {
            desc.emissiveTexture = m_textures.getTexture(m_params->createSRGB(*material.emissiveTexture));
        }

        return m_device.createMaterial(desc);
    }

    std::vector<MaterialHandle> MaterialImporter::importAll(const Model& model)
    {
        VRMI_PROFILE_FUNCTION();

        std::vector<MaterialHandle> materials;
        materials.reserve(model.materials.size());
        for (const auto& material : model.materials)
        {
            materials.push_back(importMaterial(material));
        }
        core::Logger::Asset.debug("Imported {} materials ({} textures cached)", materials.size(),
                                  m_textures.textures().size());
        return materials;
    }

} // namespace vrmi::scene
