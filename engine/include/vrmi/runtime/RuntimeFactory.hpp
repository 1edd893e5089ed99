#pragma once

#include "RuntimeDevice.hpp"

#include <memory>

namespace vrmi::runtime
{
    class RuntimeFactory
    {
    public:
        // Create the scene device for a backend
        static std::unique_ptr<RuntimeDevice> createDevice(RuntimeBackend backend);
    };

} // namespace vrmi::runtime
