/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <json/json.h>
#include <seastar/core/sstring.hh>
#include <seastar/http/reply.hh>
#include <seastar/http/request.hh>

#include "utils/gdrive/transport.hh"
#include "utils/http.hh"

namespace tests {

using namespace seastar;

// In-process stand-in for the upload service. Keeps the state of every
// session it grants, answers the way the real service does, and fails on
// demand.
class fake_drive : public gdrive::transport {
public:
    struct fault {
        enum class kind {
            // the connection breaks before any reply
            transport_error,
            // the given status and body instead of the normal answer
            status,
            // the request is processed and answered, then the connection breaks
            broken_reply,
            // the request is processed, then the connection breaks before the status
            lost_reply,
        };
        kind what;
        int status = 0;
        sstring body;
        std::map<sstring, sstring> headers;
        int error = 0;
    };

    static fault transport_error(int err = ECONNRESET) { return fault{.what = fault::kind::transport_error, .error = err}; }
    static fault status(int code, sstring body = "", std::map<sstring, sstring> headers = {}) {
        return fault{.what = fault::kind::status, .status = code, .body = std::move(body), .headers = std::move(headers)};
    }
    static fault broken_reply(int err = EPIPE) { return fault{.what = fault::kind::broken_reply, .error = err}; }
    static fault lost_reply(int err = ECONNRESET) { return fault{.what = fault::kind::lost_reply, .error = err}; }
    // Body of the service's error document for reason
    static sstring error_body(int code, std::string_view reason, std::string_view message = "error");

    struct request_record {
        sstring method;
        sstring url;
        std::unordered_map<sstring, sstring> query;
        std::map<sstring, sstring> headers;
        sstring body;

        sstring header(const sstring& name) const;
    };

    struct session_state {
        uint64_t total = 0;
        sstring content_type;
        Json::Value metadata;
        sstring file_id;
        sstring data;
        bool completed = false;
    };

private:
    utils::http::url_info _endpoint;
    std::map<sstring, session_state> _sessions;
    unsigned _session_nr = 0;
    std::deque<fault> _negotiation_faults;
    std::deque<fault> _probe_faults;
    std::map<uint64_t, std::deque<fault>> _chunk_faults;
    bool _omit_location = false;
    std::optional<sstring> _location_override;
    bool _never_complete = false;
    int _completion_status = 201;
    sstring _next_file_id = "f1";
    std::vector<request_record> _requests;
    std::vector<sstring> _content_ranges;
    bool _closed = false;

    struct response {
        int status;
        std::map<sstring, sstring> headers;
        sstring body;
    };

    static bool is_session_target(std::string_view url);
    future<request_record> capture(http::request& req);
    std::optional<fault> next_fault(const request_record& rec);
    response process(const request_record& rec);
    response negotiate(const request_record& rec);
    response session_request(session_state& s, const request_record& rec);
    response completion(const session_state& s) const;
    static response resume_incomplete(const session_state& s);

public:
    explicit fake_drive(std::string_view upload_url = "https://www.googleapis.com/upload/drive/v3/files");

    future<> make_request(http::request req, http::experimental::client::reply_handler handle, abort_source* as) override;
    future<> close() override;

    void fail_negotiation(fault f, unsigned times = 1);
    void fail_probe(fault f, unsigned times = 1);
    // Applies to the request(s) that send the chunk starting at offset.
    void fail_chunk(uint64_t offset, fault f, unsigned times = 1);
    void omit_location(bool v = true) { _omit_location = v; }
    void set_location(sstring location) { _location_override = std::move(location); }
    // Keeps answering 308 even once every byte arrived.
    void never_complete(bool v = true) { _never_complete = v; }
    void set_completion_status(int status) { _completion_status = status; }
    void set_next_file_id(sstring id) { _next_file_id = std::move(id); }

    // Makes the service hold the first bytes of a session, as if an
    // earlier process had sent them.
    void preload(const sstring& session_uri, sstring data);
    // Forgets a session; later requests to it get 404.
    void expire(const sstring& session_uri);

    const std::vector<request_record>& requests() const noexcept { return _requests; }
    // Content-Range values of the requests sent to sessions, in order.
    const std::vector<sstring>& content_ranges() const noexcept { return _content_ranges; }
    size_t negotiations() const;
    size_t session_requests() const { return _content_ranges.size(); }
    const session_state& session(const sstring& session_uri) const;
    sstring last_session_uri() const;
    bool closed() const noexcept { return _closed; }
};

} // namespace tests
