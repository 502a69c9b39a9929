/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

/*
 * Copyright (C) 2026-present ScyllaDB
 */

#include "http.hh"

#include <boost/regex.hpp>
#include <fmt/format.h>
#include <seastar/core/coroutine.hh>
#include <seastar/net/api.hh>
#include <seastar/net/dns.hh>
#include <algorithm>
#include <ranges>
#include <stdexcept>
#include <strings.h>

namespace utils::http {

future<shared_ptr<tls::certificate_credentials>> system_trust_credentials() {
    static thread_local shared_ptr<tls::certificate_credentials> system_trust_credentials;
    if (!system_trust_credentials) {
        // can race, and overwrite the object. that is fine.
        auto cred = make_shared<tls::certificate_credentials>();
        co_await cred->set_system_trust();
        system_trust_credentials = std::move(cred);
    }
    co_return system_trust_credentials;
}

dns_connection_factory::dns_connection_factory(std::string host, uint16_t port, bool use_https, logging::logger& logger, shared_ptr<tls::certificate_credentials> creds)
    : _host(std::move(host))
    , _port(port)
    , _use_https(use_https)
    , _logger(logger)
    , _creds(std::move(creds))
{}

dns_connection_factory::dns_connection_factory(const url_info& url, logging::logger& logger, shared_ptr<tls::certificate_credentials> creds)
    : dns_connection_factory(url.host, url.port, url.is_https(), logger, std::move(creds))
{}

future<> dns_connection_factory::init_addresses() {
    auto hent = co_await net::dns::get_host_by_name(_host, net::inet_address::family::INET);
    if (hent.addr_entries.empty()) {
        throw std::runtime_error(fmt::format("No addresses resolved for {}", _host));
    }
    auto ttl = std::ranges::min_element(hent.addr_entries, [](const net::hostent::address_entry& lhs, const net::hostent::address_entry& rhs) {
                   return lhs.ttl < rhs.ttl;
               })->ttl;
    _addr_list = hent.addr_entries | std::views::transform(&net::hostent::address_entry::addr) | std::ranges::to<std::vector>();
    // A zero TTL means the record is good for this connection only (RFC 1035, 3.2.1)
    _addr_expiry = lowres_clock::now() + ttl;
    _logger.debug("Resolved {} to {} address(es), ttl={}s", _host, _addr_list.size(), ttl.count());
}

bool dns_connection_factory::addresses_valid() const noexcept {
    return !_addr_list.empty() && lowres_clock::now() < _addr_expiry;
}

future<net::inet_address> dns_connection_factory::get_address() {
    if (!addresses_valid()) [[unlikely]] {
        auto units = co_await get_units(_init_semaphore, 1);
        if (!addresses_valid()) {
            if (!_addr_list.empty()) {
                _logger.debug("Host resolution expired, re-resolving host {}", _host);
            }
            co_await init_addresses();
        }
    }
    co_return _addr_list[_addr_pos++ % _addr_list.size()];
}

future<shared_ptr<tls::certificate_credentials>> dns_connection_factory::get_creds() {
    if (_use_https && !_creds) {
        _creds = co_await system_trust_credentials();
    }
    co_return _use_https ? _creds : nullptr;
}

void dns_connection_factory::reset_addresses() noexcept {
    _addr_list.clear();
    _addr_pos = 0;
}

future<connected_socket> dns_connection_factory::make(abort_source*) {
    auto socket_addr = socket_address(co_await get_address(), _port);
    auto creds = co_await get_creds();
    try {
        if (creds) {
            _logger.debug("Making new HTTPS connection addr={} host={}", socket_addr, _host);
            co_return co_await tls::connect(creds, socket_addr, tls::tls_options{.server_name = _host});
        }
        _logger.debug("Making new HTTP connection addr={} host={}", socket_addr, _host);
        co_return co_await seastar::connect(socket_addr, {}, transport::TCP);
    } catch (...) {
        _logger.debug("Connection to {} failed, dropping resolved addresses of {}", socket_addr, _host);
        reset_addresses();
        throw;
    }
}

static const char HTTPS[] = "https";

url_info parse_simple_url(std::string_view uri) {
    // scheme://host[:port][/path][?query], with numeric ipv6 hosts wrapped in
    // "[]" as in http://[2001:db8:4006:812::200e]:8080/upload?id=1
    static boost::regex simple_url(R"foo(([a-zA-Z]+):\/\/((?:\[[^\]]+\])|[^\/:?]+)(:\d+)?(\/[^?]*)?(?:\?(.*))?)foo");

    boost::smatch m;
    std::string tmp(uri);

    if (!boost::regex_match(tmp, m, simple_url)) {
        throw std::invalid_argument(fmt::format("Could not parse URI {}", uri));
    }

    auto scheme = m[1].str();
    auto host = m[2].str();
    auto port = m[3].str();
    auto path = m[4].str();
    auto query = m[5].str();

    bool https = (strcasecmp(scheme.c_str(), HTTPS) == 0);

    if (host.size() > 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    unsigned long port_number = https ? 443 : 80;
    if (!port.empty()) {
        try {
            port_number = std::stoul(port.substr(1));
        } catch (const std::out_of_range&) {
            port_number = 0;
        }
        if (port_number == 0 || port_number > 65535) {
            throw std::invalid_argument(fmt::format("Invalid port in URI {}", uri));
        }
    }
    return url_info {
        .scheme = std::move(scheme),
        .host = std::move(host),
        .path = path.empty() ? std::string("/") : std::move(path),
        .query = std::move(query),
        .port = uint16_t(port_number),
    };
}

bool url_info::is_https() const {
    return strcasecmp(scheme.c_str(), HTTPS) == 0;
}

std::string url_info::target() const {
    if (query.empty()) {
        return path;
    }
    return fmt::format("{}?{}", path, query);
}

} // namespace utils::http
