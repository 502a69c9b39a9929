/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "transport.hh"

using namespace seastar;

namespace gdrive {

http_transport::http_transport(std::unique_ptr<http::experimental::connection_factory> factory, unsigned max_conn)
    : _http(std::move(factory), max_conn, http::experimental::client::retry_requests::no) {
}

future<> http_transport::make_request(http::request req, http::experimental::client::reply_handler handle, abort_source* as) {
    if (as) {
        return _http.make_request(std::move(req), std::move(handle), *as, std::nullopt);
    }
    return _http.make_request(std::move(req), std::move(handle), std::nullopt);
}

future<> http_transport::close() {
    return _http.close();
}

} // namespace gdrive
