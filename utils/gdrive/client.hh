/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <seastar/core/abort_source.hh>
#include <seastar/core/future.hh>
#include <seastar/core/iostream.hh>
#include <seastar/core/metrics_registration.hh>
#include <seastar/core/shared_ptr.hh>
#include <seastar/core/sstring.hh>
#include <seastar/http/client.hh>
#include <seastar/http/request.hh>
#include <seastar/net/tls.hh>

#include "utils/gdrive/config.hh"
#include "utils/gdrive/file_metadata.hh"
#include "utils/gdrive/pacer.hh"
#include "utils/gdrive/transport.hh"
#include "utils/http.hh"
#include "utils/log.hh"

using namespace seastar;

namespace gdrive {

extern logging::logger gdrive_log;

// A resumable upload slot granted by the service.
struct upload_session {
    sstring uri;
    uint64_t total_size = 0;
    sstring content_type;
    // The metadata the session was negotiated with.
    file_metadata info;
};

struct upload_progress {
    uint64_t total = 0;
    uint64_t uploaded = 0;
};

// Decorates every outgoing request with credentials. Obtaining and
// refreshing them is up to the implementation.
class authorizer {
public:
    virtual ~authorizer() = default;
    virtual future<> authorize(http::request& req) = 0;
};

class bearer_token_authorizer : public authorizer {
    sstring _token;
public:
    explicit bearer_token_authorizer(sstring token) : _token(std::move(token)) {}
    void set_token(sstring token) { _token = std::move(token); }
    future<> authorize(http::request& req) override;
};

class client : public enable_shared_from_this<client> {
public:
    struct stats {
        // every request sent to the service, attempts included
        uint64_t requests = 0;
        uint64_t sessions_started = 0;
        uint64_t chunks_sent = 0;
        uint64_t chunk_retries = 0;
        uint64_t bytes_committed = 0;
        uint64_t uploads_completed = 0;
        uint64_t uploads_failed = 0;
    };

private:
    upload_config_ptr _cfg;
    utils::http::url_info _endpoint;
    std::unique_ptr<transport> _transport;
    shared_ptr<pacer> _pacer;
    bool _own_pacer;
    shared_ptr<authorizer> _auth;
    stats _stats;
    seastar::metrics::metric_groups _metrics;

    struct private_tag {};

    void register_metrics();
    static shared_ptr<pacer> make_pacer(const upload_config& cfg);

    friend class resumable_upload;

public:
    client(std::unique_ptr<transport> t, upload_config_ptr cfg, shared_ptr<pacer> p, shared_ptr<authorizer> auth, private_tag);

    // Talks to cfg->upload_url over the network.
    static shared_ptr<client> make(upload_config_ptr cfg, shared_ptr<pacer> p = {}, shared_ptr<authorizer> auth = {},
                                   shared_ptr<tls::certificate_credentials> creds = {});
    static shared_ptr<client> make(std::unique_ptr<transport> t, upload_config_ptr cfg, shared_ptr<pacer> p = {}, shared_ptr<authorizer> auth = {});

    upload_config_ptr config() const noexcept { return _cfg; }
    // Takes effect for uploads started afterwards. The endpoint cannot change.
    void update_config(upload_config_ptr cfg);
    shared_ptr<pacer> get_pacer() const noexcept { return _pacer; }
    const stats& get_stats() const noexcept { return _stats; }

    // Negotiates a session for size bytes of content_type. An empty file_id
    // creates a new object, otherwise the content of file_id is replaced.
    future<upload_session> start_upload(uint64_t size, sstring content_type, sstring file_id, file_metadata metadata, abort_source* as = nullptr);

    // Negotiates a session and sends all of source through it. The source is
    // closed in any case.
    future<file_metadata> upload(input_stream<char> source, uint64_t size, sstring content_type, sstring file_id, file_metadata metadata,
                                 upload_progress* progress = nullptr, abort_source* as = nullptr);

    // Sends all of source, from offset 0, through a session obtained from
    // start_upload(). The source is closed in any case.
    future<file_metadata> upload(upload_session session, input_stream<char> source, upload_progress* progress = nullptr, abort_source* as = nullptr);

    // Continues an interrupted session: asks the service how much it holds,
    // skips that much of source (which must start at offset 0) and sends
    // the rest. A session that has received nothing yet answers without a
    // Range and fails with protocol_error; send it with upload() instead.
    future<file_metadata> resume_upload(upload_session session, input_stream<char> source, upload_progress* progress = nullptr, abort_source* as = nullptr);

    // The number of bytes of the session the service has committed.
    future<uint64_t> get_upload_status(upload_session session, abort_source* as = nullptr);

    // A POST to the session URI. Throws negotiation_error if it points
    // somewhere other than the configured endpoint.
    http::request make_session_request(const upload_session& session) const;

    // A single exchange, authorized, without retries.
    future<> make_request(http::request req, http::experimental::client::reply_handler handle, abort_source* as = nullptr);

    future<> close();
};

} // namespace gdrive
