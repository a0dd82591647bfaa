#include "odfpack/OdfPack.hpp"

#include "odfpack/utils/Logger.hpp"
#include <iostream>

namespace odfpack {

ODFPACK_API bool initialize(const std::string& log_file_path, bool enable_console) {
    try {
        Logger::getInstance().initialize(log_file_path, Logger::Level::INFO, enable_console);
        ODFPACK_LOG_INFO("OdfPack library initialized successfully");
        ODFPACK_LOG_INFO("Version: {}", getVersion());
        return true;
    } catch (const std::exception& e) {
        if (enable_console) {
            std::cerr << "Failed to initialize OdfPack: " << e.what() << std::endl;
        }
        return false;
    }
}

ODFPACK_API void cleanup() {
    ODFPACK_LOG_INFO("OdfPack library cleanup completed");
    core::ErrorManager::getInstance().resetStatistics();
}

ODFPACK_API std::unique_ptr<package::Container> openDocument(const core::Path& path) {
    auto container = std::make_unique<package::Container>(path);
    ODFPACK_LOG_DEBUG("Opened document: {}", path.string());
    return container;
}

ODFPACK_API std::unique_ptr<package::Container> createDocument() {
    return std::make_unique<package::Container>();
}

} // namespace odfpack
