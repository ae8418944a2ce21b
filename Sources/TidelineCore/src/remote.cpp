#include "tideline/remote.hpp"
#include "tideline/log.hpp"
#include <cctype>

namespace tideline {

const char* to_string(remote_error_kind kind) noexcept {
    switch (kind) {
        case remote_error_kind::transient_network: return "transient_network";
        case remote_error_kind::server: return "server";
        case remote_error_kind::conflict: return "conflict";
        case remote_error_kind::auth: return "auth";
        case remote_error_kind::validation: return "validation";
        case remote_error_kind::unknown: return "unknown";
    }
    return "unknown";
}

bool remote_error::is_retryable() const noexcept {
    return classified_error{kind_, {}}.is_retryable();
}

remote_error remote_error::from_status(int http_status, const std::string& code, const std::string& message) {
    remote_error_kind kind = remote_error_kind::unknown;

    if (code == "23505" || code == "23503") {
        kind = remote_error_kind::conflict;
    } else if (code == "42501" || http_status == 401 || http_status == 403) {
        kind = remote_error_kind::auth;
    } else if (http_status == 409) {
        kind = remote_error_kind::conflict;
    } else if (http_status == 400 || http_status == 422) {
        kind = remote_error_kind::validation;
    } else if (http_status == 0 || http_status == 408 || http_status == 429) {
        kind = remote_error_kind::transient_network;
    } else if (http_status >= 500 && http_status < 600) {
        kind = remote_error_kind::server;
    }

    std::string text = "Remote request failed (status " + std::to_string(http_status);
    if (!code.empty()) text += ", code " + code;
    text += ")";
    if (!message.empty()) text += ": " + message;
    return remote_error(kind, text, code);
}

classified_error classify_error(const std::exception_ptr& error) {
    if (!error) {
        return {remote_error_kind::unknown, "no error"};
    }
    try {
        std::rethrow_exception(error);
    } catch (const remote_error& e) {
        return {e.kind(), e.what()};
    } catch (const std::exception& e) {
        return {remote_error_kind::unknown, e.what()};
    } catch (...) {
        return {remote_error_kind::unknown, "non-standard exception"};
    }
}

// ============================================================================
// rest_remote_data_api
// ============================================================================

std::string percent_encode(std::string_view text) {
    static const char hex[] = "0123456789ABCDEF";
    std::string encoded;
    encoded.reserve(text.size());
    for (unsigned char c : text) {
        // RFC 3986 unreserved characters pass through
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded += static_cast<char>(c);
        } else {
            encoded += '%';
            encoded += hex[c >> 4];
            encoded += hex[c & 0xF];
        }
    }
    return encoded;
}

std::string rest_remote_data_api::table_url(const std::string& table) const {
    return base_url_ + "/" + percent_encode(table);
}

std::string rest_remote_data_api::row_url(const std::string& table, const std::string& record_id) const {
    return table_url(table) + "?id=eq." + percent_encode(record_id);
}

void rest_remote_data_api::create(const std::string& table, const record& row, completion done) {
    http_request request;
    request.method = "POST";
    request.url = table_url(table);
    request.set_json_body(row.dump());
    send(std::move(request), std::move(done));
}

void rest_remote_data_api::update(const std::string& table, const std::string& record_id,
                                  const record& partial, completion done) {
    http_request request;
    request.method = "PATCH";
    request.url = row_url(table, record_id);
    request.set_json_body(partial.dump());
    send(std::move(request), std::move(done));
}

void rest_remote_data_api::remove(const std::string& table, const std::string& record_id, completion done) {
    http_request request;
    request.method = "DELETE";
    request.url = row_url(table, record_id);
    send(std::move(request), std::move(done));
}

void rest_remote_data_api::send(http_request request, completion done) {
    for (const auto& [name, value] : headers_) {
        request.headers.emplace(name, value);
    }

    const std::string method = request.method;
    const std::string url = request.url;
    client_->send_async(request, [done = std::move(done), method, url](http_response response) {
        if (!done) return;
        if (response.is_success()) {
            done(nullptr);
            return;
        }

        std::string code;
        std::string message;
        auto body = nlohmann::json::parse(response.body_string(), nullptr, false);
        if (body.is_object()) {
            if (body.contains("code") && body["code"].is_string()) code = body["code"].get<std::string>();
            if (body.contains("message") && body["message"].is_string()) message = body["message"].get<std::string>();
        }
        LOG_DEBUG("remote", "%s %s -> %d %s", method.c_str(), url.c_str(), response.status_code, code.c_str());
        done(std::make_exception_ptr(remote_error::from_status(response.status_code, code, message)));
    });
}

} // namespace tideline
