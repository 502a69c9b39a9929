/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <boost/test/unit_test.hpp>
#include <cerrno>
#include <exception>
#include <seastar/core/abort_source.hh>
#include <seastar/core/timed_out_error.hh>
#include <seastar/testing/thread_test_case.hh>
#include <system_error>

#include "utils/gdrive/drive_error.hh"
#include "utils/gdrive/file_metadata.hh"
#include "utils/gdrive/pacer.hh"
#include "utils/gdrive/retry_strategy.hh"
#include "utils/gdrive/utils/client_utils.hh"
#include "utils/http.hh"
#include "utils/http_client_error_processing.hh"

using namespace seastar;
using namespace std::chrono_literals;
using gdrive::drive_error_type;
using gdrive::retryable;

static auto status(int code) {
    return static_cast<http::reply::status_type>(code);
}

static std::string error_doc(int code, std::string_view reason, std::string_view message) {
    return fmt::format(R"({{"error": {{"code": {}, "message": "{}", "errors": [{{"domain": "usageLimits", "reason": "{}", "message": "{}"}}]}}}})",
            code, message, reason, message);
}

SEASTAR_THREAD_TEST_CASE(test_parse_error_document) {
    auto err = gdrive::drive_error::parse(error_doc(403, "userRateLimitExceeded", "User Rate Limit Exceeded"));
    BOOST_REQUIRE(err);
    BOOST_REQUIRE(err->get_error_type() == drive_error_type::USER_RATE_LIMIT_EXCEEDED);
    BOOST_REQUIRE_EQUAL(err->get_error_message(), "User Rate Limit Exceeded");
    BOOST_REQUIRE(err->is_retryable() == retryable::yes);
    BOOST_REQUIRE_EQUAL(err->status(), 403);

    err = gdrive::drive_error::parse(R"({"error": {"code": 400, "message": "odd"}})");
    BOOST_REQUIRE(err);
    BOOST_REQUIRE(err->get_error_type() == drive_error_type::UNKNOWN);
    BOOST_REQUIRE_EQUAL(err->get_error_message(), "odd");

    BOOST_REQUIRE(!gdrive::drive_error::parse(""));
    BOOST_REQUIRE(!gdrive::drive_error::parse("<html>Bad Gateway</html>"));
    BOOST_REQUIRE(!gdrive::drive_error::parse(R"({"kind": "drive#file"})"));
    BOOST_REQUIRE(!gdrive::drive_error::parse("[1, 2]"));
}

SEASTAR_THREAD_TEST_CASE(test_status_classification) {
    for (int code : {408, 429, 500, 502, 503, 504, 509}) {
        BOOST_TEST_INFO("status " << code);
        BOOST_REQUIRE(gdrive::drive_error::from_http_code(status(code)).is_retryable() == retryable::yes);
    }
    for (int code : {400, 401, 403, 404, 409, 411, 413, 416, 501}) {
        BOOST_TEST_INFO("status " << code);
        BOOST_REQUIRE(gdrive::drive_error::from_http_code(status(code)).is_retryable() == retryable::no);
    }
    auto err = gdrive::drive_error::from_http_code(status(503));
    BOOST_REQUIRE(err.get_error_type() == drive_error_type::HTTP_SERVICE_UNAVAILABLE);
    BOOST_REQUIRE_EQUAL(err.status(), 503);
    BOOST_REQUIRE(gdrive::drive_error::from_http_code(status(418)).get_error_type() == drive_error_type::HTTP_UNEXPECTED_STATUS);
}

SEASTAR_THREAD_TEST_CASE(test_reply_reason_refines_status) {
    // throttling is reported as 403
    auto err = gdrive::drive_error::from_reply(status(403), error_doc(403, "rateLimitExceeded", "Rate Limit Exceeded"));
    BOOST_REQUIRE(err.get_error_type() == drive_error_type::RATE_LIMIT_EXCEEDED);
    BOOST_REQUIRE(err.is_retryable() == retryable::yes);
    BOOST_REQUIRE_EQUAL(err.status(), 403);

    err = gdrive::drive_error::from_reply(status(403), error_doc(403, "storageQuotaExceeded", "quota"));
    BOOST_REQUIRE(err.get_error_type() == drive_error_type::STORAGE_QUOTA_EXCEEDED);
    BOOST_REQUIRE(err.is_retryable() == retryable::no);
    BOOST_REQUIRE_EQUAL(err.get_error_message(), "quota");

    err = gdrive::drive_error::from_reply(status(500), error_doc(500, "backendError", "Backend Error"));
    BOOST_REQUIRE(err.get_error_type() == drive_error_type::BACKEND_ERROR);
    BOOST_REQUIRE(err.is_retryable() == retryable::yes);

    // an unknown reason keeps what the status says
    err = gdrive::drive_error::from_reply(status(503), error_doc(503, "somethingNew", "later"));
    BOOST_REQUIRE(err.get_error_type() == drive_error_type::HTTP_SERVICE_UNAVAILABLE);
    BOOST_REQUIRE(err.is_retryable() == retryable::yes);
    BOOST_REQUIRE_EQUAL(err.get_error_message(), "later");

    err = gdrive::drive_error::from_reply(status(502), "<html>Bad Gateway</html>");
    BOOST_REQUIRE(err.get_error_type() == drive_error_type::HTTP_BAD_GATEWAY);
    BOOST_REQUIRE(err.is_retryable() == retryable::yes);
}

SEASTAR_THREAD_TEST_CASE(test_classify_error) {
    auto classify = [] (auto ex) {
        return gdrive::classify_error(std::make_exception_ptr(std::move(ex)));
    };
    BOOST_REQUIRE(classify(std::system_error(ECONNRESET, std::system_category())) == retryable::yes);
    BOOST_REQUIRE(classify(std::system_error(EPIPE, std::system_category())) == retryable::yes);
    BOOST_REQUIRE(classify(std::system_error(ENOENT, std::system_category())) == retryable::no);
    BOOST_REQUIRE(classify(timed_out_error()) == retryable::yes);
    BOOST_REQUIRE(classify(abort_requested_exception()) == retryable::no);
    BOOST_REQUIRE(classify(gdrive::protocol_error("bad range")) == retryable::no);
    BOOST_REQUIRE(classify(gdrive::negotiation_error("no location")) == retryable::no);
    BOOST_REQUIRE(classify(gdrive::incomplete_upload_error(404)) == retryable::no);
    BOOST_REQUIRE(classify(gdrive::short_read_error(10, 5)) == retryable::no);
    BOOST_REQUIRE(classify(std::runtime_error("whatever")) == retryable::no);
    BOOST_REQUIRE(classify(gdrive::drive_exception(gdrive::drive_error::from_http_code(status(503)))) == retryable::yes);
    BOOST_REQUIRE(classify(gdrive::drive_exception(gdrive::drive_error::from_http_code(status(400)))) == retryable::no);

    auto err = gdrive::drive_error::from_system_error(std::system_error(ECONNRESET, std::system_category()));
    BOOST_REQUIRE(err.get_error_type() == drive_error_type::NETWORK_CONNECTION);
    BOOST_REQUIRE_EQUAL(err.status(), gdrive::status_transport_failure);
}

template <typename Outer, typename Inner>
static std::exception_ptr nested(Outer outer, Inner inner) {
    try {
        try {
            throw inner;
        } catch (...) {
            std::throw_with_nested(outer);
        }
    } catch (...) {
        return std::current_exception();
    }
}

SEASTAR_THREAD_TEST_CASE(test_classify_nested_error) {
    // the outermost level that says anything wins
    auto eptr = nested(std::runtime_error("writing chunk"), std::system_error(ECONNRESET, std::system_category()));
    BOOST_REQUIRE_EQUAL(utils::http::nested_exception_chain(eptr).size(), 2);
    BOOST_REQUIRE(gdrive::classify_error(eptr) == retryable::yes);

    eptr = nested(gdrive::protocol_error("bad range"), std::system_error(ECONNRESET, std::system_category()));
    BOOST_REQUIRE(gdrive::classify_error(eptr) == retryable::no);

    eptr = nested(std::runtime_error("outer"), std::runtime_error("inner"));
    BOOST_REQUIRE(gdrive::classify_error(eptr) == retryable::no);

    // a level that is not a std::exception ends the chain
    eptr = nested(std::runtime_error("outer"), 42);
    BOOST_REQUIRE_EQUAL(utils::http::nested_exception_chain(eptr).size(), 1);
    BOOST_REQUIRE(gdrive::classify_error(std::make_exception_ptr(42)) == retryable::no);
    BOOST_REQUIRE(utils::http::nested_exception_chain(nullptr).empty());
}

SEASTAR_THREAD_TEST_CASE(test_parse_simple_url) {
    auto url = utils::http::parse_simple_url("https://www.googleapis.com/upload/drive/v3/files?uploadType=resumable&upload_id=x");
    BOOST_REQUIRE_EQUAL(url.host, "www.googleapis.com");
    BOOST_REQUIRE_EQUAL(url.port, 443);
    BOOST_REQUIRE_EQUAL(url.target(), "/upload/drive/v3/files?uploadType=resumable&upload_id=x");

    url = utils::http::parse_simple_url("http://[::1]:8080");
    BOOST_REQUIRE_EQUAL(url.host, "::1");
    BOOST_REQUIRE_EQUAL(url.port, 8080);
    BOOST_REQUIRE_EQUAL(url.target(), "/");

    BOOST_REQUIRE_THROW(utils::http::parse_simple_url("http://host:0/"), std::invalid_argument);
    BOOST_REQUIRE_THROW(utils::http::parse_simple_url("http://host:65536/"), std::invalid_argument);
    BOOST_REQUIRE_THROW(utils::http::parse_simple_url("http://host:99999999999999999999/"), std::invalid_argument);
    BOOST_REQUIRE_THROW(utils::http::parse_simple_url("host/path"), std::invalid_argument);
}

SEASTAR_THREAD_TEST_CASE(test_error_messages) {
    BOOST_REQUIRE_EQUAL(std::string(gdrive::incomplete_upload_error(503).what()), "Incomplete upload - retry, last error 503");
    BOOST_REQUIRE_EQUAL(gdrive::incomplete_upload_error(404, "gone").last_status(), 404);
    gdrive::drive_exception ex(gdrive::drive_error::from_reply(status(400), error_doc(400, "invalid", "Invalid field")));
    BOOST_REQUIRE_EQUAL(std::string(ex.what()), "Drive request failed. Code: INVALID_ARGUMENT. Status: 400. Reason: Invalid field");
}

SEASTAR_THREAD_TEST_CASE(test_backoff_delays) {
    gdrive::default_retry_strategy strategy(5, 100ms, 2000ms);
    BOOST_REQUIRE_EQUAL(strategy.delay_before_retry(0).count(), 0);
    BOOST_REQUIRE_EQUAL(strategy.delay_before_retry(1).count(), 200);
    BOOST_REQUIRE_EQUAL(strategy.delay_before_retry(2).count(), 400);
    BOOST_REQUIRE_EQUAL(strategy.delay_before_retry(4).count(), 1600);
    BOOST_REQUIRE_EQUAL(strategy.delay_before_retry(5).count(), 2000);
    BOOST_REQUIRE_EQUAL(strategy.delay_before_retry(64).count(), 2000);

    BOOST_REQUIRE(strategy.should_retry(retryable::yes, 0) == retryable::yes);
    BOOST_REQUIRE(strategy.should_retry(retryable::yes, 4) == retryable::yes);
    BOOST_REQUIRE(strategy.should_retry(retryable::yes, 5) == retryable::no);
    BOOST_REQUIRE(strategy.should_retry(retryable::no, 0) == retryable::no);
    BOOST_REQUIRE_EQUAL(strategy.get_max_retries(), 5);
}

static gdrive::backoff_pacer make_pacer(uint32_t max_retries) {
    return gdrive::backoff_pacer(std::make_unique<gdrive::default_retry_strategy>(max_retries, 0ms, 0ms), 1);
}

SEASTAR_THREAD_TEST_CASE(test_pacer_retries_transient_failures) {
    auto pacer = make_pacer(5);
    int attempts = 0;
    pacer.call([&] () -> future<> {
        if (++attempts < 3) {
            return make_exception_future<>(std::system_error(ECONNRESET, std::system_category()));
        }
        return make_ready_future<>();
    }, gdrive::classify_error).get();
    BOOST_REQUIRE_EQUAL(attempts, 3);
    BOOST_REQUIRE_EQUAL(pacer.calls(), 3);
    BOOST_REQUIRE_EQUAL(pacer.retries(), 2);
}

SEASTAR_THREAD_TEST_CASE(test_pacer_gives_up) {
    auto pacer = make_pacer(2);
    int attempts = 0;
    BOOST_REQUIRE_THROW(pacer.call([&] () -> future<> {
        ++attempts;
        return make_exception_future<>(gdrive::drive_exception(gdrive::drive_error::from_http_code(status(503))));
    }, gdrive::classify_error).get(), gdrive::drive_exception);
    // the first attempt and two retries
    BOOST_REQUIRE_EQUAL(attempts, 3);
    BOOST_REQUIRE_EQUAL(pacer.retries(), 2);

    attempts = 0;
    BOOST_REQUIRE_THROW(pacer.call([&] () -> future<> {
        ++attempts;
        return make_exception_future<>(gdrive::protocol_error("garbage"));
    }, gdrive::classify_error).get(), gdrive::protocol_error);
    BOOST_REQUIRE_EQUAL(attempts, 1);
}

SEASTAR_THREAD_TEST_CASE(test_pacer_custom_classifier) {
    auto pacer = make_pacer(3);
    int attempts = 0;
    BOOST_REQUIRE_THROW(pacer.call([&] () -> future<> {
        ++attempts;
        return make_exception_future<>(std::system_error(ECONNRESET, std::system_category()));
    }, [] (std::exception_ptr) { return retryable::no; }).get(), std::system_error);
    BOOST_REQUIRE_EQUAL(attempts, 1);
}

SEASTAR_THREAD_TEST_CASE(test_pacer_abort) {
    gdrive::backoff_pacer pacer(std::make_unique<gdrive::default_retry_strategy>(10, 1000ms, 10000ms), 1);
    abort_source as;
    int attempts = 0;
    auto f = pacer.call([&] () -> future<> {
        if (++attempts == 2) {
            as.request_abort();
        }
        return make_exception_future<>(std::system_error(ECONNRESET, std::system_category()));
    }, gdrive::classify_error, &as);
    BOOST_REQUIRE_THROW(f.get(), abort_requested_exception);
    BOOST_REQUIRE_EQUAL(attempts, 2);

    BOOST_REQUIRE_THROW(pacer.call([&] { ++attempts; return make_ready_future<>(); }, gdrive::classify_error, &as).get(), abort_requested_exception);
    BOOST_REQUIRE_EQUAL(attempts, 2);
}

SEASTAR_THREAD_TEST_CASE(test_content_range) {
    BOOST_REQUIRE_EQUAL(gdrive::format_content_range(0, 8, 20), "bytes 0-7/20");
    BOOST_REQUIRE_EQUAL(gdrive::format_content_range(16, 4, 20), "bytes 16-19/20");
    BOOST_REQUIRE_EQUAL(gdrive::format_content_range(0, 0, 20), "bytes */20");
    BOOST_REQUIRE_EQUAL(gdrive::format_content_range(0, 0, 0), "bytes */0");
}

SEASTAR_THREAD_TEST_CASE(test_committed_range) {
    BOOST_REQUIRE_EQUAL(gdrive::parse_committed_range("bytes=0-42"), 43);
    BOOST_REQUIRE_EQUAL(gdrive::parse_committed_range("0-0"), 1);
    BOOST_REQUIRE_EQUAL(gdrive::parse_committed_range("0-1048575"), 1 << 20);
    for (auto bad : {"", "bytes=", "bytes=5-10", "bytes=0-", "bytes 0-10", "0-10/20", "bytes=0-x"}) {
        BOOST_TEST_INFO("range " << bad);
        BOOST_REQUIRE_THROW(gdrive::parse_committed_range(bad), gdrive::protocol_error);
    }
}

SEASTAR_THREAD_TEST_CASE(test_file_metadata) {
    auto md = gdrive::file_metadata::parse(R"({"kind": "drive#file", "id": "abc", "name": "report.pdf",
            "mimeType": "application/pdf", "size": "1234", "md5Checksum": "0cc175b9c0f1b6a831c399e269772661",
            "parents": ["p1", "p2"], "starred": true})");
    BOOST_REQUIRE_EQUAL(md.id(), "abc");
    BOOST_REQUIRE_EQUAL(md.name(), "report.pdf");
    BOOST_REQUIRE_EQUAL(md.mime_type(), "application/pdf");
    BOOST_REQUIRE_EQUAL(md.md5_checksum(), "0cc175b9c0f1b6a831c399e269772661");
    BOOST_REQUIRE_EQUAL(md.size().value(), 1234u);
    BOOST_REQUIRE_EQUAL(md.parents().size(), 2);
    BOOST_REQUIRE_EQUAL(md.parents()[1], "p2");
    // unknown fields survive
    BOOST_REQUIRE(md.json()["starred"].asBool());
    BOOST_REQUIRE(md.description().empty());

    BOOST_REQUIRE(!gdrive::file_metadata::parse(R"({"id": "x"})").size());
    BOOST_REQUIRE_EQUAL(gdrive::file_metadata::parse(R"({"size": 77})").size().value(), 77u);
    BOOST_REQUIRE_THROW(gdrive::file_metadata::parse("[]"), gdrive::protocol_error);
    BOOST_REQUIRE_THROW(gdrive::file_metadata::parse("{\"id\":"), gdrive::protocol_error);
}

SEASTAR_THREAD_TEST_CASE(test_build_file_metadata) {
    gdrive::file_metadata md;
    BOOST_REQUIRE(md.empty());
    md.set_name("a.txt").set_mime_type("text/plain").add_parent("root").add_parent("shared").set_property("origin", "backup");
    auto back = gdrive::file_metadata::parse(md.to_json());
    BOOST_REQUIRE_EQUAL(back.name(), "a.txt");
    BOOST_REQUIRE_EQUAL(back.mime_type(), "text/plain");
    BOOST_REQUIRE_EQUAL(back.parents().size(), 2);
    BOOST_REQUIRE_EQUAL(back.json()["properties"]["origin"].asString(), "backup");
    BOOST_REQUIRE_EQUAL(fmt::format("{}", back), "{id=, name=a.txt}");
}
