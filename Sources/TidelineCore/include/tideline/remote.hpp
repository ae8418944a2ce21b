#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <deque>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace tideline {

using HeadersMap = std::map<std::string, std::string>;

// ============================================================================
// Remote error taxonomy
// ============================================================================

enum class remote_error_kind : int {
    transient_network = 0,  ///< timeout, unreachable, rate limited
    server = 1,             ///< 5xx
    conflict = 2,           ///< unique / foreign-key violation
    auth = 3,               ///< missing or insufficient credentials
    validation = 4,         ///< malformed payload
    unknown = 5
};

const char* to_string(remote_error_kind kind) noexcept;

class remote_error : public std::runtime_error {
public:
    remote_error(remote_error_kind kind, const std::string& msg, std::string code = {})
        : std::runtime_error(msg), kind_(kind), code_(std::move(code)) {}

    [[nodiscard]] remote_error_kind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& code() const noexcept { return code_; }

    /// Transient, server and unknown failures are worth another attempt.
    [[nodiscard]] bool is_retryable() const noexcept;

    /// Build an error from an HTTP status and an optional database error code
    /// ("23505" unique violation, "23503" foreign-key violation, "42501" permission).
    static remote_error from_status(int http_status, const std::string& code = {},
                                    const std::string& message = {});

private:
    remote_error_kind kind_;
    std::string code_;
};

struct classified_error {
    remote_error_kind kind = remote_error_kind::unknown;
    std::string message;

    [[nodiscard]] bool is_retryable() const noexcept {
        return kind == remote_error_kind::transient_network ||
               kind == remote_error_kind::server ||
               kind == remote_error_kind::unknown;
    }
};

/// Classify an asynchronous failure. remote_error keeps its kind; anything
/// else is reported as unknown (and therefore retryable).
classified_error classify_error(const std::exception_ptr& error);

// ============================================================================
// Remote data API - row-level create/update/delete over named tables
// ============================================================================
//
// Each call is one round trip. The completion receives nullptr on success or
// the failure as an exception_ptr, and may be invoked on any thread.

class remote_data_api {
public:
    using completion = std::function<void(std::exception_ptr)>;

    virtual ~remote_data_api() = default;

    virtual void create(const std::string& table, const record& row, completion done) = 0;
    virtual void update(const std::string& table, const std::string& record_id,
                        const record& partial, completion done) = 0;
    virtual void remove(const std::string& table, const std::string& record_id, completion done) = 0;
};

// ============================================================================
// HTTP Client Interface
// ============================================================================
//
// Abstract interface for HTTP operations, supplied by the host platform.

struct http_response {
    int status_code = 0;  ///< 0 = no response (unreachable / timed out)
    HeadersMap headers;
    std::vector<uint8_t> body;

    bool is_success() const { return status_code >= 200 && status_code < 300; }
    std::string body_string() const {
        return std::string(body.begin(), body.end());
    }
};

struct http_request {
    std::string method = "GET";
    std::string url;
    HeadersMap headers;
    std::vector<uint8_t> body;

    void set_body(const std::string& s) {
        body = std::vector<uint8_t>(s.begin(), s.end());
    }

    void set_json_body(const std::string& json) {
        set_body(json);
        headers["Content-Type"] = "application/json";
    }
};

class http_client {
public:
    virtual ~http_client() = default;

    using completion_handler = std::function<void(http_response)>;
    virtual void send_async(const http_request& request, completion_handler handler) = 0;
};

// ============================================================================
// rest_remote_data_api - remote_data_api over a REST row endpoint
// ============================================================================
//
// create -> POST   {base}/{table}
// update -> PATCH  {base}/{table}?id=eq.{record_id}
// remove -> DELETE {base}/{table}?id=eq.{record_id}
// Non-2xx responses are mapped with remote_error::from_status, reading the
// database error code from the JSON body's "code" field when present.
// Table names and record ids are percent-encoded.

/// Percent-encodes everything but RFC 3986 unreserved characters.
std::string percent_encode(std::string_view text);

class rest_remote_data_api : public remote_data_api {
public:
    rest_remote_data_api(std::shared_ptr<http_client> client, std::string base_url, HeadersMap headers = {})
        : client_(std::move(client)), base_url_(std::move(base_url)), headers_(std::move(headers)) {}

    void create(const std::string& table, const record& row, completion done) override;
    void update(const std::string& table, const std::string& record_id,
                const record& partial, completion done) override;
    void remove(const std::string& table, const std::string& record_id, completion done) override;

private:
    void send(http_request request, completion done);
    std::string table_url(const std::string& table) const;
    std::string row_url(const std::string& table, const std::string& record_id) const;

    std::shared_ptr<http_client> client_;
    std::string base_url_;
    HeadersMap headers_;
};

// ============================================================================
// Mock implementations for testing
// ============================================================================

class mock_remote_data_api : public remote_data_api {
public:
    struct call {
        operation_kind kind;
        std::string table;
        std::optional<std::string> record_id;
        record payload;
    };

    void create(const std::string& table, const record& row, completion done) override {
        dispatch({operation_kind::create, table, std::nullopt, row}, std::move(done));
    }

    void update(const std::string& table, const std::string& record_id,
                const record& partial, completion done) override {
        dispatch({operation_kind::update, table, record_id, partial}, std::move(done));
    }

    void remove(const std::string& table, const std::string& record_id, completion done) override {
        dispatch({operation_kind::remove, table, record_id, nullptr}, std::move(done));
    }

    // Test helpers

    /// The next `count` calls complete with `error`.
    void fail_next(size_t count, std::exception_ptr error) {
        for (size_t i = 0; i < count; ++i) scripted_.push_back(error);
    }

    /// Every call without a scripted result completes with `error` (nullptr resets).
    void fail_always(std::exception_ptr error) { default_result_ = std::move(error); }

    /// Hold completions until complete_next() is called.
    void set_deferred(bool deferred) { deferred_ = deferred; }

    [[nodiscard]] size_t deferred_count() const { return pending_.size(); }

    /// Complete the oldest held call with its scripted result.
    void complete_next() {
        if (pending_.empty()) return;
        auto [done, result] = std::move(pending_.front());
        pending_.pop_front();
        if (done) done(result);
    }

    void complete_all() {
        while (!pending_.empty()) complete_next();
    }

    [[nodiscard]] const std::vector<call>& calls() const { return calls_; }
    [[nodiscard]] size_t call_count() const { return calls_.size(); }
    void clear_calls() { calls_.clear(); }

private:
    void dispatch(call c, completion done) {
        calls_.push_back(std::move(c));
        std::exception_ptr result = default_result_;
        if (!scripted_.empty()) {
            result = scripted_.front();
            scripted_.pop_front();
        }
        if (deferred_) {
            pending_.emplace_back(std::move(done), result);
            return;
        }
        if (done) done(result);
    }

    std::vector<call> calls_;
    std::deque<std::exception_ptr> scripted_;
    std::exception_ptr default_result_;
    bool deferred_ = false;
    std::deque<std::pair<completion, std::exception_ptr>> pending_;
};

class mock_http_client : public http_client {
public:
    void send_async(const http_request& request, completion_handler handler) override {
        sent_requests_.push_back(request);
        http_response response{200, {}, {}};
        if (!responses_.empty()) {
            response = responses_.front();
            responses_.pop_front();
        }
        if (handler) handler(response);
    }

    // Test helpers
    void enqueue_response(int status, const std::string& body = {}) {
        http_response response;
        response.status_code = status;
        response.body = std::vector<uint8_t>(body.begin(), body.end());
        responses_.push_back(std::move(response));
    }

    const std::vector<http_request>& get_sent_requests() const {
        return sent_requests_;
    }

private:
    std::deque<http_response> responses_;
    std::vector<http_request> sent_requests_;
};

} // namespace tideline

#endif // __cplusplus
