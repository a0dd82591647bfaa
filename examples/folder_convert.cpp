#include "odfpack/utils/ModuleLoggers.hpp"
/**
 * @file folder_convert.cpp
 * @brief ODF 文件与展开目录互相转换
 * 
 * 用法: folder_convert <input> [output] [--backup]
 *   input 为 .odt/.ods 等文件时展开为 <output>.folder，
 *   input 为 .folder 目录时打包为 <output>（默认去掉 .folder 后缀）。
 */

#include "odfpack/OdfPack.hpp"
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    using namespace odfpack;
    
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <input> [output] [--backup]" << std::endl;
        return 2;
    }
    
    std::string input = argv[1];
    std::string output;
    bool backup = false;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--backup") {
            backup = true;
        } else if (output.empty()) {
            output = arg;
        } else {
            std::cerr << "Unexpected argument: " << arg << std::endl;
            return 2;
        }
    }
    
    odfpack::initialize("", true);
    
    try {
        package::Container container{core::Path(input)};
        
        package::Container::SaveOptions options;
        options.backup = backup;
        options.packaging = container.packaging() == package::Packaging::Zip ? "folder" : "zip";
        
        core::Path target(output.empty() ? input : output);
        container.save(target, options);
        
        EXAMPLE_INFO("Converted {} ({}) to {} packaging", input, container.mimetype(), options.packaging);
    } catch (const core::OdfPackException& e) {
        EXAMPLE_ERROR("Conversion failed: {}", e.getDetailedMessage());
        odfpack::cleanup();
        return 1;
    }
    
    odfpack::cleanup();
    return 0;
}
