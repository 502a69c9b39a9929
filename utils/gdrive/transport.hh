/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <memory>
#include <seastar/core/abort_source.hh>
#include <seastar/core/future.hh>
#include <seastar/http/client.hh>
#include <seastar/http/request.hh>

namespace gdrive {

// One HTTP exchange. The handler gets the status and headers together with
// the body stream; any exception it or the connection throws comes back
// from make_request().
class transport {
public:
    virtual ~transport() = default;
    virtual seastar::future<> make_request(seastar::http::request req, seastar::http::experimental::client::reply_handler handle, seastar::abort_source* as) = 0;
    virtual seastar::future<> close() = 0;
};

// Real network, through seastar's pooled client. The client itself never
// retries; that is up to the pacer.
class http_transport : public transport {
    seastar::http::experimental::client _http;

public:
    http_transport(std::unique_ptr<seastar::http::experimental::connection_factory> factory, unsigned max_conn);

    seastar::future<> make_request(seastar::http::request req, seastar::http::experimental::client::reply_handler handle, seastar::abort_source* as) override;
    seastar::future<> close() override;
};

} // namespace gdrive
