#include "odfpack/package/Packaging.hpp"
#include "odfpack/core/Exception.hpp"
#include <algorithm>
#include <cctype>
#include <fmt/format.h>

namespace odfpack {
namespace package {

const char* toString(Packaging packaging) noexcept {
    return packaging == Packaging::Folder ? "folder" : "zip";
}

Packaging parsePackaging(const std::string& value) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    
    auto begin = std::find_if_not(value.begin(), value.end(), is_space);
    auto end = std::find_if_not(value.rbegin(), value.rend(), is_space).base();
    std::string cleaned = (begin < end) ? std::string(begin, end) : std::string();
    std::transform(cleaned.begin(), cleaned.end(), cleaned.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    
    if (cleaned == "zip") {
        return Packaging::Zip;
    }
    if (cleaned == "folder") {
        return Packaging::Folder;
    }
    
    ODFPACK_THROW(core::ParameterException,
                  fmt::format("Packaging of type \"{}\" is not supported", value),
                  "packaging", core::ErrorCode::UnsupportedPackaging);
}

}} // namespace odfpack::package
