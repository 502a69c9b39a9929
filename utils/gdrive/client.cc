/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <fmt/format.h>
#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <tuple>
#include <seastar/core/coroutine.hh>
#include <seastar/core/metrics.hh>
#include <seastar/coroutine/exception.hh>
#include <seastar/http/request.hh>
#include <seastar/util/short_streams.hh>

#include "utils/gdrive/client.hh"
#include "utils/gdrive/client_helpers/resumable_upload.hh"
#include "utils/gdrive/drive_error.hh"
#include "utils/gdrive/utils/client_utils.hh"

using namespace std::chrono_literals;

namespace gdrive {

logging::logger gdrive_log("gdrive");

future<> bearer_token_authorizer::authorize(http::request& req) {
    req._headers["Authorization"] = seastar::format("Bearer {}", _token);
    return make_ready_future<>();
}

client::client(std::unique_ptr<transport> t, upload_config_ptr cfg, shared_ptr<pacer> p, shared_ptr<authorizer> auth, private_tag)
        : _cfg(std::move(cfg))
        , _endpoint(utils::http::parse_simple_url(_cfg->upload_url))
        , _transport(std::move(t))
        , _pacer(std::move(p))
        , _own_pacer(!_pacer)
        , _auth(std::move(auth)) {
    if (!_endpoint.query.empty()) {
        throw std::invalid_argument(fmt::format("upload_url {} must not carry a query, use extra_parameters", _cfg->upload_url));
    }
    if (_own_pacer) {
        _pacer = make_pacer(*_cfg);
    }
    register_metrics();
}

shared_ptr<client> client::make(upload_config_ptr cfg, shared_ptr<pacer> p, shared_ptr<authorizer> auth, shared_ptr<tls::certificate_credentials> creds) {
    auto url = utils::http::parse_simple_url(cfg->upload_url);
    auto factory = std::make_unique<utils::http::dns_connection_factory>(url, gdrive_log, std::move(creds));
    // One chunk per session is in flight, so the pacer's concurrency is
    // what bounds the connections in use.
    unsigned max_connections = cfg->max_connections.value_or(cfg->max_concurrent_calls);
    auto t = std::make_unique<http_transport>(std::move(factory), max_connections);
    return seastar::make_shared<client>(std::move(t), std::move(cfg), std::move(p), std::move(auth), private_tag{});
}

shared_ptr<client> client::make(std::unique_ptr<transport> t, upload_config_ptr cfg, shared_ptr<pacer> p, shared_ptr<authorizer> auth) {
    return seastar::make_shared<client>(std::move(t), std::move(cfg), std::move(p), std::move(auth), private_tag{});
}

shared_ptr<pacer> client::make_pacer(const upload_config& cfg) {
    auto strategy = std::make_unique<default_retry_strategy>(cfg.max_retries,
            std::chrono::milliseconds(cfg.backoff_scale_ms), std::chrono::milliseconds(cfg.max_backoff_ms));
    return seastar::make_shared<backoff_pacer>(std::move(strategy), cfg.max_concurrent_calls);
}

void client::update_config(upload_config_ptr cfg) {
    auto url = utils::http::parse_simple_url(cfg->upload_url);
    if (url.host != _endpoint.host || url.port != _endpoint.port || url.scheme != _endpoint.scheme) {
        throw std::runtime_error("Updating the upload endpoint host, port or scheme is not possible");
    }
    if (!url.query.empty()) {
        throw std::invalid_argument(fmt::format("upload_url {} must not carry a query, use extra_parameters", cfg->upload_url));
    }
    _endpoint = std::move(url);
    _cfg = std::move(cfg);
    // Calls already running keep their own reference to the old one
    if (_own_pacer) {
        _pacer = make_pacer(*_cfg);
    }
    gdrive_log.debug("Config updated: {}", *_cfg);
}

void client::register_metrics() {
    namespace sm = seastar::metrics;
    static unsigned instance_nr = 0;
    auto ep_label = sm::label("endpoint")(_endpoint.host);
    auto id_label = sm::label("client")(instance_nr++);
    _metrics.add_group("gdrive", {
        sm::make_counter("total_sessions", [this] { return _stats.sessions_started; },
                sm::description("Total number of upload sessions negotiated"), {ep_label, id_label}),
        sm::make_counter("total_chunks_sent", [this] { return _stats.chunks_sent; },
                sm::description("Total number of chunk requests sent, retries included"), {ep_label, id_label}),
        sm::make_counter("total_chunk_retries", [this] { return _stats.chunk_retries; },
                sm::description("Total number of chunks sent again after a failed attempt"), {ep_label, id_label}),
        sm::make_counter("total_bytes_committed", [this] { return _stats.bytes_committed; },
                sm::description("Total number of bytes acknowledged by the service"), {ep_label, id_label}),
        sm::make_counter("total_uploads_completed", [this] { return _stats.uploads_completed; },
                sm::description("Total number of uploads the service confirmed"), {ep_label, id_label}),
        sm::make_counter("total_uploads_failed", [this] { return _stats.uploads_failed; },
                sm::description("Total number of uploads that ended with an error"), {ep_label, id_label}),
        sm::make_counter("total_requests", [this] { return _stats.requests; },
                sm::description("Total number of requests sent to the service, retries included"), {ep_label, id_label}),
    });
}

future<> client::make_request(http::request req, http::experimental::client::reply_handler handle, abort_source* as) {
    if (_auth) {
        co_await _auth->authorize(req);
    }
    gdrive_log.trace("{} {}", req._method, req._url);
    ++_stats.requests;
    co_await _transport->make_request(std::move(req), std::move(handle), as);
}

http::request client::make_session_request(const upload_session& session) const {
    utils::http::url_info url;
    try {
        url = utils::http::parse_simple_url(session.uri);
    } catch (const std::invalid_argument& e) {
        throw negotiation_error(fmt::format("unusable upload session URI \"{}\": {}", session.uri, e.what()));
    }
    if (url.host != _endpoint.host || url.port != _endpoint.port || url.scheme != _endpoint.scheme) {
        throw negotiation_error(fmt::format("upload session URI \"{}\" does not belong to {}", session.uri, _endpoint.host));
    }
    // The query is taken verbatim; it is already encoded.
    return http::request::make("POST", url.host, url.target());
}

future<upload_session> client::start_upload(uint64_t size, sstring content_type, sstring file_id, file_metadata metadata, abort_source* as) {
    auto cfg = _cfg;
    auto p = _pacer;
    auto body = metadata.to_json();
    const bool update = !file_id.empty();
    sstring location;

    co_await p->call([&] () -> future<> {
        auto path = update ? fmt::format("{}/{}", _endpoint.path, file_id) : _endpoint.path;
        auto req = http::request::make(update ? "PATCH" : "POST", _endpoint.host, sstring(path));
        req.query_parameters["alt"] = "json";
        req.query_parameters["uploadType"] = "resumable";
        req.query_parameters["fields"] = cfg->fields;
        if (cfg->team_drive) {
            req.query_parameters["supportsAllDrives"] = "true";
        }
        if (cfg->keep_revision_forever) {
            req.query_parameters["keepRevisionForever"] = "true";
        }
        if (update) {
            req.query_parameters["setModifiedDate"] = "true";
        }
        for (const auto& [k, v] : cfg->extra_parameters) {
            req.query_parameters[k] = v;
        }
        req.write_body("json", sstring(body));
        req._headers["Content-Type"] = "application/json; charset=UTF-8";
        req._headers["X-Upload-Content-Type"] = content_type;
        req._headers["X-Upload-Content-Length"] = seastar::format("{}", size);

        co_await make_request(std::move(req), [&location] (const http::reply& rep, input_stream<char>&& in_) -> future<> {
            auto in = std::move(in_);
            auto reply_body = co_await util::read_entire_stream_contiguous(in);
            if (http::reply::classify_status(rep._status) != http::reply::status_class::success) {
                co_await coroutine::return_exception(drive_exception(drive_error::from_reply(rep._status, reply_body)));
            }
            location = rep.get_header("Location");
        }, as);
    }, classify_error, as);

    if (location.empty()) {
        gdrive_log.warn("Negotiation reply for a {} byte upload has no Location header", size);
        throw negotiation_error("upload session URI missing from the negotiation reply");
    }
    upload_session session{
        .uri = std::move(location),
        .total_size = size,
        .content_type = std::move(content_type),
        .info = std::move(metadata),
    };
    // Validate now, no chunk has been sent yet
    std::ignore = make_session_request(session);
    ++_stats.sessions_started;
    gdrive_log.info("Started upload session for {} bytes{}", size, update ? fmt::format(" replacing {}", file_id) : std::string());
    co_return session;
}

future<file_metadata> client::upload(input_stream<char> source, uint64_t size, sstring content_type, sstring file_id, file_metadata metadata,
                                     upload_progress* progress, abort_source* as) {
    std::optional<upload_session> session;
    std::exception_ptr ex;
    try {
        session = co_await start_upload(size, std::move(content_type), std::move(file_id), std::move(metadata), as);
    } catch (...) {
        ex = std::current_exception();
    }
    if (ex) {
        ++_stats.uploads_failed;
        co_await source.close();
        co_await coroutine::return_exception_ptr(std::move(ex));
    }
    co_return co_await upload(std::move(*session), std::move(source), progress, as);
}

future<file_metadata> client::upload(upload_session session, input_stream<char> source, upload_progress* progress, abort_source* as) {
    resumable_upload up(shared_from_this(), std::move(session), std::move(source), progress, as);
    co_return co_await up.upload();
}

future<file_metadata> client::resume_upload(upload_session session, input_stream<char> source, upload_progress* progress, abort_source* as) {
    resumable_upload up(shared_from_this(), std::move(session), std::move(source), progress, as);
    co_return co_await up.resume();
}

future<uint64_t> client::get_upload_status(upload_session session, abort_source* as) {
    resumable_upload up(shared_from_this(), std::move(session), input_stream<char>(), nullptr, as);
    co_return co_await up.transfer_status();
}

future<> client::close() {
    co_await _transport->close();
}

} // namespace gdrive
