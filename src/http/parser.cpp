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

// Switchyard HTTP Parser - Implementation

#include "parser.hpp"

namespace switchyard::http {

Parser::Parser() {
    llhttp_settings_init(&settings_);

    settings_.on_url = on_url;
    settings_.on_header_field = on_header_field;
    settings_.on_header_value = on_header_value;
    settings_.on_headers_complete = on_headers_complete;
    settings_.on_body = on_body;
    settings_.on_message_complete = on_message_complete;

    llhttp_init(&parser_, HTTP_REQUEST, &settings_);
    parser_.data = &ctx_;
}

std::pair<ParseResult, size_t> Parser::parse_request(
    std::span<const uint8_t> data,
    Request& request) {

    ctx_.request = &request;
    ctx_.error = HPE_OK;

    llhttp_errno_t err = llhttp_execute(
        &parser_,
        reinterpret_cast<const char*>(data.data()),
        data.size());

    size_t consumed = data.size();

    if (err == HPE_PAUSED_UPGRADE) {
        // Upgrade requests stop right after the headers; the rest belongs to the
        // upgraded protocol
        const char* stop_pos = llhttp_get_error_pos(&parser_);
        if (stop_pos) {
            consumed = static_cast<size_t>(
                reinterpret_cast<const uint8_t*>(stop_pos) - data.data());
        }
        return {ctx_.headers_complete ? ParseResult::Complete : ParseResult::Error, consumed};
    }

    if (err != HPE_OK) {
        const char* error_pos = llhttp_get_error_pos(&parser_);
        if (error_pos) {
            consumed = static_cast<size_t>(
                reinterpret_cast<const uint8_t*>(error_pos) - data.data());
        }
        ctx_.error = err;
        return {ParseResult::Error, consumed};
    }

    if (ctx_.message_complete) {
        return {ParseResult::Complete, consumed};
    }

    return {ParseResult::Incomplete, consumed};
}

void Parser::reset() {
    llhttp_init(&parser_, HTTP_REQUEST, &settings_);
    parser_.data = &ctx_;
    ctx_ = Context{};
}

std::string_view Parser::error_message() const noexcept {
    if (ctx_.error == HPE_OK) {
        return "";
    }
    return llhttp_errno_name(ctx_.error);
}

llhttp_errno_t Parser::error_code() const noexcept {
    return ctx_.error;
}

// Callbacks

int Parser::on_url(llhttp_t* parser, const char* at, size_t length) {
    auto* ctx = static_cast<Context*>(parser->data);
    if (!ctx->request) return -1;

    ctx->request->uri = std::string_view(at, length);

    size_t query_pos = ctx->request->uri.find('?');
    if (query_pos != std::string_view::npos) {
        ctx->request->path = ctx->request->uri.substr(0, query_pos);
        ctx->request->query = ctx->request->uri.substr(query_pos + 1);
    } else {
        ctx->request->path = ctx->request->uri;
        ctx->request->query = {};
    }
    return 0;
}

int Parser::on_header_field(llhttp_t* parser, const char* at, size_t length) {
    auto* ctx = static_cast<Context*>(parser->data);
    if (!ctx->request) return -1;

    ctx->current_header_field = std::string_view(at, length);
    return 0;
}

int Parser::on_header_value(llhttp_t* parser, const char* at, size_t length) {
    auto* ctx = static_cast<Context*>(parser->data);
    if (!ctx->request) return -1;

    ctx->request->headers.push_back(Header{ctx->current_header_field, std::string_view(at, length)});
    return 0;
}

int Parser::on_headers_complete(llhttp_t* parser) {
    auto* ctx = static_cast<Context*>(parser->data);
    if (!ctx->request) return -1;

    switch (llhttp_get_method(parser)) {
        case HTTP_GET: ctx->request->method = Method::GET; break;
        case HTTP_POST: ctx->request->method = Method::POST; break;
        case HTTP_PUT: ctx->request->method = Method::PUT; break;
        case HTTP_DELETE: ctx->request->method = Method::DELETE; break;
        case HTTP_HEAD: ctx->request->method = Method::HEAD; break;
        case HTTP_OPTIONS: ctx->request->method = Method::OPTIONS; break;
        case HTTP_PATCH: ctx->request->method = Method::PATCH; break;
        default: ctx->request->method = Method::UNKNOWN; break;
    }

    ctx->headers_complete = true;
    return 0;
}

int Parser::on_body(llhttp_t* parser, const char* at, size_t length) {
    auto* ctx = static_cast<Context*>(parser->data);
    if (!ctx->request) return -1;

    // Single-buffer parsing: the body arrives in one callback
    ctx->request->body = std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(at), length);
    return 0;
}

int Parser::on_message_complete(llhttp_t* parser) {
    auto* ctx = static_cast<Context*>(parser->data);
    ctx->message_complete = true;
    return 0;
}

std::optional<Request> parse_http_request(std::span<const uint8_t> data) {
    Parser parser;
    Request request;

    auto [result, consumed] = parser.parse_request(data, request);
    (void)consumed;

    if (result == ParseResult::Complete) {
        return request;
    }

    return std::nullopt;
}

} // namespace switchyard::http
