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

// Switchyard HTTP Protocol - Implementation

#include "http.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>

namespace switchyard::http {

const Header* Request::find_header(std::string_view name) const noexcept {
    for (const auto& header : headers) {
        if (header_name_equals(header.name, name)) {
            return &header;
        }
    }
    return nullptr;
}

std::string_view Request::get_header(std::string_view name,
                                     std::string_view default_value) const noexcept {
    const Header* header = find_header(name);
    return header ? header->value : default_value;
}

bool Request::has_header(std::string_view name) const noexcept {
    return find_header(name) != nullptr;
}

std::string_view to_string(Method method) noexcept {
    switch (method) {
        case Method::GET:
            return "GET";
        case Method::POST:
            return "POST";
        case Method::PUT:
            return "PUT";
        case Method::DELETE:
            return "DELETE";
        case Method::HEAD:
            return "HEAD";
        case Method::OPTIONS:
            return "OPTIONS";
        case Method::PATCH:
            return "PATCH";
        case Method::UNKNOWN:
            break;
    }
    return "UNKNOWN";
}

std::string_view to_reason_phrase(StatusCode code) noexcept {
    switch (code) {
        case StatusCode::SwitchingProtocols:
            return "Switching Protocols";
        case StatusCode::OK:
            return "OK";
        case StatusCode::Accepted:
            return "Accepted";
        case StatusCode::BadRequest:
            return "Bad Request";
        case StatusCode::Unauthorized:
            return "Unauthorized";
        case StatusCode::NotFound:
            return "Not Found";
        case StatusCode::MethodNotAllowed:
            return "Method Not Allowed";
        case StatusCode::RequestTimeout:
            return "Request Timeout";
        case StatusCode::PayloadTooLarge:
            return "Payload Too Large";
        case StatusCode::RequestHeaderFieldsTooLarge:
            return "Request Header Fields Too Large";
        case StatusCode::TooManyRequests:
            return "Too Many Requests";
        case StatusCode::InternalServerError:
            return "Internal Server Error";
        case StatusCode::ServiceUnavailable:
            return "Service Unavailable";
    }
    return "Unknown";
}

bool header_name_equals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }

    return std::equal(a.begin(), a.end(), b.begin(), [](char ca, char cb) {
        return std::tolower(static_cast<unsigned char>(ca)) ==
               std::tolower(static_cast<unsigned char>(cb));
    });
}

std::string build_response(StatusCode status, std::string_view content_type,
                           std::string_view body) {
    std::string response = fmt::format(
        "HTTP/1.1 {} {}\r\n"
        "Content-Type: {}\r\n"
        "Content-Length: {}\r\n"
        "Connection: close\r\n"
        "Server: Switchyard/0.1.0\r\n"
        "\r\n",
        static_cast<uint16_t>(status), to_reason_phrase(status), content_type, body.size());
    response.append(body);
    return response;
}

std::string build_error_response(StatusCode status, std::string_view error,
                                 std::string_view message) {
    nlohmann::json body{{"error", error}, {"message", message}};
    return build_response(status, "application/json", body.dump());
}

}  // namespace switchyard::http
