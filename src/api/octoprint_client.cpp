// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file octoprint_client.cpp
 * @brief OctoPrint connection API over libhv HTTP
 *
 * Unlike the fire-and-forget REST helpers elsewhere, these calls block the
 * caller: the reconciler needs the answer within the same tick. The request
 * timeout is kept below the poll interval for that reason.
 */

#include "octoprint_client.h"

#include "app_constants.h"

#include "hv/herr.h"
#include "hv/json.hpp"
#include "hv/requests.h"
#include "spdlog/spdlog.h"

#include <cerrno>
#include <cstdlib>

using json = nlohmann::json;

namespace printdeck {

namespace {

constexpr const char* CONNECTION_PATH = "/api/connection";

/**
 * @brief Translate a libhv client error into a PrinterError
 *
 * libhv reports socket failures as negative errno values.
 */
PrinterError transport_error(const char* method, const std::string& url, int ret) {
    int err = std::abs(ret);
    PrinterErrorType type = PrinterErrorType::CONNECTION_FAILED;
    if (err == ECONNREFUSED) {
        type = PrinterErrorType::CONNECTION_REFUSED;
    } else if (err == ETIMEDOUT) {
        type = PrinterErrorType::TIMEOUT;
    }
    return PrinterError::make(type, std::string(method) + " " + url + ": " + hv_strerror(err));
}

/**
 * @brief Build an HTTP_ERROR from a non-2xx response
 *
 * OctoPrint puts a human-readable reason in {"error": "..."} when it has one.
 */
PrinterError http_error(const char* method, const std::string& url, HttpResponse& resp) {
    int status = static_cast<int>(resp.status_code);
    std::string message =
        std::string(method) + " " + url + ": HTTP " + std::to_string(status) + " " +
        resp.status_message();

    if (!resp.body.empty()) {
        try {
            auto body = json::parse(resp.body);
            if (body.contains("error") && body["error"].is_string()) {
                message += ": " + body["error"].get<std::string>();
            }
        } catch (const json::exception& e) {
            spdlog::trace("[OctoPrint] Error body is not JSON: {}", e.what());
        }
    }

    return PrinterError::make(PrinterErrorType::HTTP_ERROR, message, status);
}

} // namespace

OctoPrintClient::OctoPrintClient(std::string endpoint, std::string api_key)
    : endpoint_(std::move(endpoint)), api_key_(std::move(api_key)) {
    while (!endpoint_.empty() && endpoint_.back() == '/') {
        endpoint_.pop_back();
    }
}

std::string OctoPrintClient::build_url(const std::string& path) const {
    if (path.empty() || path[0] == '/') {
        return endpoint_ + path;
    }
    return endpoint_ + "/" + path;
}

PrinterError OctoPrintClient::get_connection_state(ConnectionState& state) {
    std::string url = build_url(CONNECTION_PATH);

    auto req = std::make_shared<HttpRequest>();
    req->method = HTTP_GET;
    req->url = url;
    req->timeout = AppConstants::Connection::REQUEST_TIMEOUT_SEC;
    if (has_api_key()) {
        req->headers["X-Api-Key"] = api_key_;
    }

    auto resp = std::make_shared<HttpResponse>();
    int ret = http_client_send(req.get(), resp.get());
    if (ret != 0) {
        return transport_error("GET", url, ret);
    }

    if (resp->status_code < 200 || resp->status_code >= 300) {
        return http_error("GET", url, *resp);
    }

    try {
        auto body = json::parse(resp->body);
        std::string label = body.at("current").at("state").get<std::string>();
        state = ConnectionState::from_label(label);
        spdlog::trace("[OctoPrint] Connection state: {}", label);
    } catch (const json::exception& e) {
        return PrinterError::make(PrinterErrorType::PARSE_ERROR,
                                  "GET " + url + ": invalid response: " + e.what(),
                                  static_cast<int>(resp->status_code));
    }

    return PrinterError{};
}

PrinterError OctoPrintClient::connect() {
    std::string url = build_url(CONNECTION_PATH);

    auto req = std::make_shared<HttpRequest>();
    req->method = HTTP_POST;
    req->url = url;
    req->timeout = AppConstants::Connection::REQUEST_TIMEOUT_SEC;
    req->content_type = APPLICATION_JSON;
    if (has_api_key()) {
        req->headers["X-Api-Key"] = api_key_;
    }
    req->body = json{{"command", "connect"}}.dump();

    spdlog::debug("[OctoPrint] POST {} (connect)", url);

    auto resp = std::make_shared<HttpResponse>();
    int ret = http_client_send(req.get(), resp.get());
    if (ret != 0) {
        return transport_error("POST", url, ret);
    }

    // OctoPrint answers 204 No Content on success
    if (resp->status_code < 200 || resp->status_code >= 300) {
        return http_error("POST", url, *resp);
    }

    return PrinterError{};
}

} // namespace printdeck
