#include <gtest/gtest.h>

#include "cli.hpp"
#include "fakes.hpp"

#include <chrono>

using namespace api;
using namespace api::cli;
using namespace std::chrono_literals;

TEST(CliArgs, DefaultsToGetWithClientTimeout) {
    Arguments args = parse_args({"users"});
    EXPECT_EQ(args.endpoint, "users");
    EXPECT_EQ(args.method, "GET");
    EXPECT_TRUE(args.body.empty());
    EXPECT_TRUE(args.headers.empty());
    EXPECT_EQ(args.options.timeout, ClientOptions::kDefaultTimeout);
    EXPECT_FALSE(args.help);
}

TEST(CliArgs, ParsesMethodBodyHeadersAndTimeout) {
    Arguments args = parse_args({"-X", "PUT", "-d", "{}", "-H", "X-Trace:  abc ", "-H", "Accept: text/plain",
                                 "-t", "3", "items"});
    EXPECT_EQ(args.method, "PUT");
    EXPECT_EQ(args.body, "{}");
    EXPECT_EQ(args.headers.Get("x-trace").value_or(""), "abc");
    EXPECT_EQ(args.headers.Get("Accept").value_or(""), "text/plain");
    EXPECT_EQ(args.options.timeout, 3s);
    EXPECT_EQ(args.endpoint, "items");
}

TEST(CliArgs, ZeroTimeoutDisablesIt) {
    EXPECT_EQ(parse_args({"-t", "0", "items"}).options.timeout.count(), 0);
}

TEST(CliArgs, RejectsBadTimeouts) {
    EXPECT_THROW(parse_args({"-t", "-5", "items"}), UsageError);
    EXPECT_THROW(parse_args({"-t", "ten", "items"}), UsageError);
    EXPECT_THROW(parse_args({"-t", "", "items"}), UsageError);
    EXPECT_THROW(parse_args({"items", "-t"}), UsageError);
}

TEST(CliArgs, RejectsMalformedHeader) {
    EXPECT_THROW(parse_args({"-H", "no-colon", "items"}), UsageError);
    EXPECT_THROW(parse_args({"-H", ": value", "items"}), UsageError);
}

TEST(CliArgs, RequiresExactlyOneEndpoint) {
    EXPECT_THROW(parse_args({}), UsageError);
    EXPECT_THROW(parse_args({"-X", "GET"}), UsageError);
    EXPECT_THROW(parse_args({"a", "b"}), UsageError);
    EXPECT_THROW(parse_args({"--verbose", "a"}), UsageError);
}

TEST(CliArgs, HelpNeedsNoEndpoint) {
    EXPECT_TRUE(parse_args({"--help"}).help);
    EXPECT_TRUE(parse_args({"-h"}).help);
}

TEST(CliRequest, BodyDefaultsToJsonContentType) {
    Arguments args = parse_args({"-X", "POST", "-d", R"({"a":1})", "items"});
    Request req = build_request(args, "http://example.test/items");
    EXPECT_EQ(req.method, "POST");
    EXPECT_EQ(req.url, "http://example.test/items");
    EXPECT_EQ(req.body, R"({"a":1})");
    EXPECT_EQ(req.headers.Get("Content-Type").value_or(""), "application/json");
}

TEST(CliRequest, ExplicitContentTypeIsKept) {
    Arguments args = parse_args({"-d", "x=1", "-H", "Content-Type: text/plain", "items"});
    Request req = build_request(args, "http://example.test/items");
    EXPECT_EQ(req.headers.Get("Content-Type").value_or(""), "text/plain");
}

TEST(CliRequest, GetWithoutBodyHasNoContentType) {
    Request req = build_request(parse_args({"items"}), "http://example.test/items");
    EXPECT_FALSE(req.headers.Has("Content-Type"));
}

TEST(CliExitCode, MapsResults) {
    Result ok;
    ok.response = api::testing::text_response(200, "ok");
    EXPECT_EQ(exit_code(ok), kExitOk);

    Result created;
    created.response = api::testing::text_response(201, "");
    EXPECT_EQ(exit_code(created), kExitOk);

    Result not_found;
    not_found.response = api::testing::text_response(404, "missing");
    EXPECT_EQ(exit_code(not_found), kExitHttpError);

    Result failed;
    failed.error = cancellation_error(context_errc::canceled);
    EXPECT_EQ(exit_code(failed), kExitRequestError);

    Result failed_read;
    failed_read.response = api::testing::text_response(200, "partial");
    failed_read.error = Error(ErrorKind::Read, std::make_error_code(std::errc::connection_reset), "reset");
    EXPECT_EQ(exit_code(failed_read), kExitRequestError);
}
