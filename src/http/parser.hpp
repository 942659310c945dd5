// Switchyard HTTP Parser - Header
// Zero-copy request parser around llhttp

#pragma once

#include "http.hpp"

#include <llhttp.h>

#include <cstddef>
#include <optional>
#include <span>
#include <string_view>
#include <utility>

namespace switchyard::http {

/// Parse result
enum class ParseResult : uint8_t {
    Complete,      // Request fully parsed (including upgrade requests)
    Incomplete,    // Need more data
    Error          // Parse error
};

/// HTTP/1.1 request parser (wraps llhttp)
class Parser {
public:
    Parser();
    ~Parser() = default;

    // Non-copyable, non-movable (llhttp keeps a pointer to ctx_)
    Parser(const Parser&) = delete;
    Parser& operator=(const Parser&) = delete;

    /// Parse HTTP request from buffer
    /// Returns ParseResult and number of bytes consumed.
    /// On Complete, 'request' holds views into 'data': keep the buffer alive.
    /// For an upgrade request, consumed stops at the end of the headers.
    [[nodiscard]] std::pair<ParseResult, size_t> parse_request(
        std::span<const uint8_t> data,
        Request& request);

    /// Reset parser state for next request
    void reset();

    /// Get last error message
    [[nodiscard]] std::string_view error_message() const noexcept;

    [[nodiscard]] llhttp_errno_t error_code() const noexcept;

private:
    static int on_url(llhttp_t* parser, const char* at, size_t length);
    static int on_header_field(llhttp_t* parser, const char* at, size_t length);
    static int on_header_value(llhttp_t* parser, const char* at, size_t length);
    static int on_headers_complete(llhttp_t* parser);
    static int on_body(llhttp_t* parser, const char* at, size_t length);
    static int on_message_complete(llhttp_t* parser);

    llhttp_t parser_;
    llhttp_settings_t settings_;

    // Parsing context (used by callbacks)
    struct Context {
        Request* request = nullptr;
        std::string_view current_header_field;
        bool headers_complete = false;
        bool message_complete = false;
        llhttp_errno_t error = HPE_OK;
    };

    Context ctx_;
};

/// Helper: Parse entire HTTP request (convenience wrapper)
/// Returns std::nullopt on error or if the request is incomplete
[[nodiscard]] std::optional<Request> parse_http_request(std::span<const uint8_t> data);

} // namespace switchyard::http
