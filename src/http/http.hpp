/*
 * Copyright 2025 Switchyard Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Switchyard HTTP Protocol - Header
// Minimal HTTP/1.1 value types for the connect endpoint and admin API

#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace switchyard::http {

/// HTTP methods
enum class Method : uint8_t {
    GET,
    POST,
    PUT,
    DELETE,
    HEAD,
    OPTIONS,
    PATCH,
    UNKNOWN
};

/// HTTP status codes used by the control plane
enum class StatusCode : uint16_t {
    SwitchingProtocols = 101,
    OK = 200,
    Accepted = 202,
    BadRequest = 400,
    Unauthorized = 401,
    NotFound = 404,
    MethodNotAllowed = 405,
    RequestTimeout = 408,
    PayloadTooLarge = 413,
    RequestHeaderFieldsTooLarge = 431,
    TooManyRequests = 429,
    InternalServerError = 500,
    ServiceUnavailable = 503,
};

/// HTTP header (name-value pair)
/// Both name and value are views into the request buffer (zero-copy)
struct Header {
    std::string_view name;
    std::string_view value;
};

/// HTTP request (zero-copy, all views into the caller's buffer)
struct Request {
    Method method = Method::UNKNOWN;

    std::string_view uri;
    std::string_view path;   // URI without query string
    std::string_view query;  // Query string (if present)

    std::vector<Header> headers;
    std::span<const uint8_t> body;

    // Helper: Find header by name (case-insensitive)
    [[nodiscard]] const Header* find_header(std::string_view name) const noexcept;

    // Helper: Get header value or default
    [[nodiscard]] std::string_view get_header(std::string_view name,
                                              std::string_view default_value = {}) const noexcept;

    [[nodiscard]] bool has_header(std::string_view name) const noexcept;
};

/// Convert Method to string
[[nodiscard]] std::string_view to_string(Method method) noexcept;

/// Convert StatusCode to reason phrase
[[nodiscard]] std::string_view to_reason_phrase(StatusCode code) noexcept;

/// Case-insensitive header name comparison
[[nodiscard]] bool header_name_equals(std::string_view a, std::string_view b) noexcept;

/// Serialize a complete "Connection: close" response
[[nodiscard]] std::string build_response(StatusCode status, std::string_view content_type,
                                         std::string_view body);

/// JSON error body used by the control-plane endpoints: {"error":..., "message":...}
[[nodiscard]] std::string build_error_response(StatusCode status, std::string_view error,
                                               std::string_view message);

}  // namespace switchyard::http
