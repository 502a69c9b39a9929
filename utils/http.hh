/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <seastar/core/future.hh>
#include <seastar/core/lowres_clock.hh>
#include <seastar/core/semaphore.hh>
#include <seastar/core/shared_ptr.hh>
#include <seastar/http/client.hh>
#include <seastar/net/inet_address.hh>
#include <seastar/net/tls.hh>
#include <string>
#include <string_view>
#include <vector>

#include "utils/log.hh"

namespace utils::http {

using namespace seastar;

future<shared_ptr<tls::certificate_credentials>> system_trust_credentials();

struct url_info {
    std::string scheme;
    std::string host;
    std::string path;
    std::string query; // without the leading '?'
    uint16_t port;

    bool is_https() const;
    // What goes on the request line: path, and "?query" when there is one.
    std::string target() const;
};

url_info parse_simple_url(std::string_view uri);

// Resolves the host lazily and hands out connections round-robin over the
// resolved addresses, re-resolving once the records expire. TLS is used when asked for, with the system trust
// store unless explicit credentials are supplied.
class dns_connection_factory : public seastar::http::experimental::connection_factory {
    std::string _host;
    uint16_t _port;
    bool _use_https;
    logging::logger& _logger;
    shared_ptr<tls::certificate_credentials> _creds;
    std::vector<net::inet_address> _addr_list;
    size_t _addr_pos = 0;
    // Resolved addresses are reused until the shortest record TTL runs out
    lowres_clock::time_point _addr_expiry;
    semaphore _init_semaphore{1};

    bool addresses_valid() const noexcept;
    future<> init_addresses();
    future<net::inet_address> get_address();
    future<shared_ptr<tls::certificate_credentials>> get_creds();
    // Forget the resolved addresses so the next connection re-resolves.
    void reset_addresses() noexcept;

public:
    dns_connection_factory(std::string host, uint16_t port, bool use_https, logging::logger& logger, shared_ptr<tls::certificate_credentials> = {});
    dns_connection_factory(const url_info& url, logging::logger& logger, shared_ptr<tls::certificate_credentials> = {});

    // A failed connect drops the resolved addresses before rethrowing.
    virtual future<connected_socket> make(abort_source*) override;
};

} // namespace utils::http
