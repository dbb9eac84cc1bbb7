#include "util/Expected.hpp"

#include "core/Constants.hpp"

namespace folio {

int exitCodeFor(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return Constants::EXIT_OK;
        case ErrorCode::BuildFailed:
        case ErrorCode::ConversionFailed:
        case ErrorCode::Cancelled: return Constants::EXIT_BUILD_FAILED;
        case ErrorCode::InvalidArgs: return Constants::EXIT_USAGE;
        case ErrorCode::ConfigError:
        case ErrorCode::NotFound:
        case ErrorCode::Forbidden: return Constants::EXIT_CONFIG;
        case ErrorCode::MetadataError: return Constants::EXIT_METADATA;
        case ErrorCode::IoError: return Constants::EXIT_IO;
        case ErrorCode::Timeout:
        case ErrorCode::InternalError: return Constants::EXIT_INTERNAL;
    }
    return Constants::EXIT_INTERNAL;
}

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "none";
        case ErrorCode::InvalidArgs: return "invalid-args";
        case ErrorCode::ConfigError: return "config";
        case ErrorCode::NotFound: return "not-found";
        case ErrorCode::Forbidden: return "forbidden";
        case ErrorCode::IoError: return "io";
        case ErrorCode::ConversionFailed: return "conversion";
        case ErrorCode::BuildFailed: return "build";
        case ErrorCode::MetadataError: return "metadata";
        case ErrorCode::Timeout: return "timeout";
        case ErrorCode::Cancelled: return "cancelled";
        case ErrorCode::InternalError: return "internal";
    }
    return "unknown";
}

}
