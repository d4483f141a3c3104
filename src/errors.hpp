#pragma once
#include <string>

namespace mcphost {

// Failure categories reported by the authorization flow and the stream client.
// BrowserLaunchWarning and MessageParse are recovered locally and never end a run.
enum class ErrorKind {
    None,
    ListenerBind,
    CallbackTimeout,
    BrowserLaunchWarning,
    CallbackError,
    MissingCode,
    StateMismatch,
    TokenExchangeHttp,
    TokenParse,
    StreamConnect,
    StreamRead,
    MessageParse
};

// Stable name used in diagnostics, e.g. "StateMismatchError".
const char* error_kind_name(ErrorKind kind);

// True for kinds that terminate the current attempt.
bool is_fatal(ErrorKind kind);

} // namespace mcphost
