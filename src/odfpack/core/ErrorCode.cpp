#include "odfpack/core/ErrorCode.hpp"

namespace odfpack {
namespace core {

Error::Error(ErrorCode c) : code(c), message(toString(c)) {}

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:                    return "Success";
        case ErrorCode::InvalidArgument:       return "Invalid argument";
        case ErrorCode::InternalError:         return "Internal error";
        case ErrorCode::FileNotFound:          return "File not found";
        case ErrorCode::FileAccessDenied:      return "File access denied";
        case ErrorCode::FileCorrupted:         return "File corrupted";
        case ErrorCode::FileWriteError:        return "File write error";
        case ErrorCode::FileReadError:         return "File read error";
        case ErrorCode::InvalidFormat:         return "Invalid format";
        case ErrorCode::UnknownMimetype:       return "Unknown mimetype";
        case ErrorCode::MissingMimetype:       return "Mimetype is not defined";
        case ErrorCode::UnsupportedPackaging:  return "Unsupported packaging";
        case ErrorCode::UnsupportedSource:     return "Unsupported source";
        case ErrorCode::UnsupportedTarget:     return "Unsupported target";
        case ErrorCode::PartDeleted:           return "Part is deleted";
        case ErrorCode::ManifestEntryNotFound: return "Manifest entry not found";
        case ErrorCode::InvalidPartPath:       return "Part path leaves the package";
        case ErrorCode::ZipError:              return "ZIP error";
        case ErrorCode::XmlParseError:         return "XML parse error";
        case ErrorCode::XmlInvalidFormat:      return "Invalid XML format";
        default:                               return "Unknown error";
    }
}

const char* toName(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:                    return "Ok";
        case ErrorCode::InvalidArgument:       return "InvalidArgument";
        case ErrorCode::InternalError:         return "InternalError";
        case ErrorCode::FileNotFound:          return "FileNotFound";
        case ErrorCode::FileAccessDenied:      return "FileAccessDenied";
        case ErrorCode::FileCorrupted:         return "FileCorrupted";
        case ErrorCode::FileWriteError:        return "FileWriteError";
        case ErrorCode::FileReadError:         return "FileReadError";
        case ErrorCode::InvalidFormat:         return "InvalidFormat";
        case ErrorCode::UnknownMimetype:       return "UnknownMimetype";
        case ErrorCode::MissingMimetype:       return "MissingMimetype";
        case ErrorCode::UnsupportedPackaging:  return "UnsupportedPackaging";
        case ErrorCode::UnsupportedSource:     return "UnsupportedSource";
        case ErrorCode::UnsupportedTarget:     return "UnsupportedTarget";
        case ErrorCode::PartDeleted:           return "PartDeleted";
        case ErrorCode::ManifestEntryNotFound: return "ManifestEntryNotFound";
        case ErrorCode::InvalidPartPath:       return "InvalidPartPath";
        case ErrorCode::ZipError:              return "ZipError";
        case ErrorCode::XmlParseError:         return "XmlParseError";
        case ErrorCode::XmlInvalidFormat:      return "XmlInvalidFormat";
        default:                               return "Unknown";
    }
}

}} // namespace odfpack::core
