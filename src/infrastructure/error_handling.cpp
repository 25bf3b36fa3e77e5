#include "infrastructure/error_handling.h"
#include "utils/logger.h"

namespace leetshell {

const char* errorToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::TERMINAL_UNSUPPORTED: return "Terminal unsupported";
        case ErrorCode::TERMINAL_TOO_SMALL: return "Terminal too small";
        case ErrorCode::TERMINAL_IO: return "Terminal I/O error";
        case ErrorCode::NOT_FOUND: return "Not found";
        case ErrorCode::PREMIUM_ONLY: return "Premium only";
        case ErrorCode::INVALID_ARGUMENT: return "Invalid argument";
        case ErrorCode::INVALID_STATE: return "Invalid state";
        case ErrorCode::INTERNAL_ERROR: return "Internal error";
        default: return "Unknown error";
    }
}

std::string describe(const Error& error) {
    std::string msg = errorToString(error.code);
    if (!error.message.empty()) {
        msg += ": " + error.message;
    }
    if (!error.context.empty()) {
        msg += " [" + error.context + "]";
    }
    return msg;
}

Error makeError(ErrorCode code, const std::string& message) {
    Error err(code, message);
    utils::Logger::log(utils::LogLevel::DEBUG, "error", describe(err));
    return err;
}

Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    Error err(code, message);
    err.context = context;
    utils::Logger::log(utils::LogLevel::DEBUG, "error", describe(err));
    return err;
}

}
