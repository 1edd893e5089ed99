#include "vrmi/runtime/RuntimeFactory.hpp"

#include "vrmi/core/logger.hpp"
#include "vrmi/runtime/null/NullRuntimeDevice.hpp"

#include <cpptrace/cpptrace.hpp>

namespace vrmi::runtime
{
    std::unique_ptr<RuntimeDevice> RuntimeFactory::createDevice(RuntimeBackend backend)
    {
        switch (backend)
        {
        case RuntimeBackend::Null:
            core::Logger::Runtime.info("Creating null runtime device");
            return std::make_unique<NullRuntimeDevice>();
        }
        throw cpptrace::invalid_argument("RuntimeFactory: unsupported backend");
    }

} // namespace vrmi::runtime
