#include "errors.hpp"

namespace mcphost {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                 return "None";
        case ErrorKind::ListenerBind:         return "ListenerBindError";
        case ErrorKind::CallbackTimeout:      return "CallbackTimeoutError";
        case ErrorKind::BrowserLaunchWarning: return "BrowserLaunchWarning";
        case ErrorKind::CallbackError:        return "CallbackError";
        case ErrorKind::MissingCode:          return "MissingCodeError";
        case ErrorKind::StateMismatch:        return "StateMismatchError";
        case ErrorKind::TokenExchangeHttp:    return "TokenExchangeHttpError";
        case ErrorKind::TokenParse:           return "TokenParseError";
        case ErrorKind::StreamConnect:        return "StreamConnectError";
        case ErrorKind::StreamRead:           return "StreamReadError";
        case ErrorKind::MessageParse:         return "MessageParseError";
    }
    return "Unknown";
}

bool is_fatal(ErrorKind kind) {
    return kind != ErrorKind::None &&
           kind != ErrorKind::BrowserLaunchWarning &&
           kind != ErrorKind::MessageParse;
}

} // namespace mcphost
