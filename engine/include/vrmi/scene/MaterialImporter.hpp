#pragma once

#include "vrmi/assets/TextureFactory.hpp"
#include "vrmi/assets/TextureImportParamFactory.hpp"
#include "vrmi/runtime/RuntimeDevice.hpp"
#include "vrmi/scene/Model.hpp"

#include <vector>

namespace vrmi::scene
{
    /**
     * @brief Creates the engine materials of a Model
     *
     * Texture slots are resolved through the TextureFactory. Without a
     * parameter factory (models assembled in code) texture slots are ignored.
     */
    class MaterialImporter
    {
    public:
        MaterialImporter(runtime::RuntimeDevice& device, assets::TextureFactory& textures,
                         const assets::TextureImportParamFactory* params)
            : m_device(device), m_textures(textures), m_params(params)
        {
        }

        MaterialHandle importMaterial(const MaterialDescription& material);

        // One handle per source material, in source order
        std::vector<MaterialHandle> importAll(const Model& model);

    private:
        runtime::RuntimeDevice& m_device;
        assets::TextureFactory& m_textures;
        const assets::TextureImportParamFactory* m_params;
    };

} // namespace vrmi::scene
