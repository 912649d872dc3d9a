// Command line parsing into hookrelay::CliCtx and the exit code mapping used
// by the entrypoint.

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "hookrelay_common.hpp"
#include "my_error_codes.hpp"
#include "supervisor/listen_supervisor.hpp"

namespace hookrelay {

namespace {

std::unique_ptr<CliCtx> Parse(std::vector<std::string> args) {
  args.insert(args.begin(), "hookrelay");
  auto r = ParseCommandLine(args);
  EXPECT_TRUE(r.is_ok()) << (r.is_err() ? r.error().what : "");
  if (r.is_err()) {
    return nullptr;
  }
  return std::move(r.value());
}

int ParseErrorCode(std::vector<std::string> args) {
  args.insert(args.begin(), "hookrelay");
  auto r = ParseCommandLine(args);
  EXPECT_TRUE(r.is_err());
  return r.is_err() ? r.error().code : 0;
}

} // namespace

TEST(CliCtxTest, ListenPositionals) {
  auto ctx = Parse({"listen", "3000", "shop,billing", "/hooks"});
  ASSERT_TRUE(ctx);
  EXPECT_EQ(ctx->params.subcmd, "listen");
  EXPECT_EQ(ctx->positional_count(), 4u);

  auto request = ctx->bootstrap_request();
  EXPECT_EQ(request.target, "3000");
  EXPECT_EQ(request.source_query, "shop,billing");
  EXPECT_EQ(request.connection_filter, "/hooks");
  EXPECT_FALSE(request.path.has_value());
  EXPECT_EQ(ctx->output_mode, OutputMode::Interactive);
  EXPECT_EQ(ctx->params.profiles, std::vector<std::string>{"default"});
}

TEST(CliCtxTest, OptionsAreCollected) {
  auto ctx = Parse({"listen", "http://localhost:8080/api", "shop", "--path",
                    "/webhooks", "--output", "compact", "--ws-base",
                    "ws://127.0.0.1:9000/ws", "--credentials", "/tmp/cred.json",
                    "-c", "/etc/hookrelay"});
  ASSERT_TRUE(ctx);
  EXPECT_EQ(ctx->output_mode, OutputMode::Compact);
  ASSERT_TRUE(ctx->bootstrap_request().path.has_value());
  EXPECT_EQ(*ctx->bootstrap_request().path, "/webhooks");
  EXPECT_EQ(ctx->params.ws_base, "ws://127.0.0.1:9000/ws");
  ASSERT_TRUE(ctx->params.credentials.has_value());
  EXPECT_EQ(ctx->params.credentials->string(), "/tmp/cred.json");
  ASSERT_EQ(ctx->params.config_dirs.size(), 1u);
  EXPECT_EQ(ctx->params.config_dirs[0].string(), "/etc/hookrelay");
}

TEST(CliCtxTest, OverridesApplyToListenConfig) {
  ListenConfig config;
  config.use_wss = true;
  config.request_timeout_ms = 30000;
  config.max_concurrent_attempts = 16;

  auto untouched = Parse({"listen", "3000"});
  ASSERT_TRUE(untouched);
  untouched->apply_overrides(config);
  EXPECT_TRUE(config.use_wss);
  EXPECT_EQ(config.request_timeout_ms, 30000);
  EXPECT_EQ(config.max_concurrent_attempts, 16);

  auto ctx = Parse({"listen", "3000", "--no-wss", "--request-timeout", "2.5",
                    "--max-connections", "4"});
  ASSERT_TRUE(ctx);
  ctx->apply_overrides(config);
  EXPECT_FALSE(config.use_wss);
  EXPECT_EQ(config.request_timeout_ms, 2500);
  EXPECT_EQ(config.max_concurrent_attempts, 4);
}

TEST(CliCtxTest, VerbosityAndSilent) {
  auto ctx = Parse({"listen", "3000"});
  ASSERT_TRUE(ctx);
  EXPECT_EQ(ctx->verbosity_level(), 3u);
  EXPECT_FALSE(ctx->is_specified_by_user("verbose"));

  ctx = Parse({"listen", "3000", "--verbose", "debug"});
  ASSERT_TRUE(ctx);
  EXPECT_EQ(ctx->verbosity_level(), 4u);
  EXPECT_TRUE(ctx->is_specified_by_user("verbose"));

  ctx = Parse({"listen", "3000", "--verbose", "vv"});
  ASSERT_TRUE(ctx);
  EXPECT_EQ(ctx->verbosity_level(), 2u);

  // silent wins over verbose
  ctx = Parse({"listen", "3000", "--silent", "--verbose", "trace"});
  ASSERT_TRUE(ctx);
  EXPECT_EQ(ctx->verbosity_level(), 0u);
}

TEST(CliCtxTest, HelpAndVersionShowText) {
  EXPECT_EQ(ParseErrorCode({"--help"}), my_errors::GENERAL::SHOW_OPT_DESC);
  EXPECT_EQ(ParseErrorCode({"--version"}), my_errors::GENERAL::SHOW_OPT_DESC);
  EXPECT_EQ(ParseErrorCode({}), my_errors::GENERAL::SHOW_OPT_DESC);

  auto r = ParseCommandLine({"hookrelay", "-h"});
  ASSERT_TRUE(r.is_err());
  EXPECT_NE(r.error().what.find("hookrelay listen"), std::string::npos);
  EXPECT_NE(r.error().what.find("--request-timeout"), std::string::npos);
  // hidden options stay out of the help text
  EXPECT_EQ(r.error().what.find("--ws-base"), std::string::npos);
}

TEST(CliCtxTest, MalformedInputIsInvalidArgument) {
  const int bad = my_errors::GENERAL::INVALID_ARGUMENT;
  EXPECT_EQ(ParseErrorCode({"serve", "3000"}), bad);
  EXPECT_EQ(ParseErrorCode({"listen"}), bad);
  EXPECT_EQ(ParseErrorCode({"listen", "3000", "a", "b", "c"}), bad);
  EXPECT_EQ(ParseErrorCode({"listen", "3000", "--request-timeout", "0"}), bad);
  EXPECT_EQ(ParseErrorCode({"listen", "3000", "--max-connections", "-1"}), bad);
  EXPECT_EQ(ParseErrorCode({"listen", "3000", "--output", "fancy"}), bad);
  EXPECT_EQ(ParseErrorCode({"listen", "3000", "--no-such-flag"}), bad);
}

TEST(ExitCodeTest, MapsErrorFamilies) {
  using monad::make_error;
  EXPECT_EQ(ExitCodeFor(make_error(my_errors::GENERAL::UNAUTHORIZED, "")),
            exit_codes::kUnauthorized);
  EXPECT_EQ(ExitCodeFor(make_error(my_errors::LISTEN::REAUTH_REQUIRED, "")),
            exit_codes::kUnauthorized);
  EXPECT_EQ(ExitCodeFor(make_error(my_errors::LISTEN::SESSION_REVOKED, "")),
            exit_codes::kUnauthorized);
  EXPECT_EQ(ExitCodeFor(make_error(my_errors::GENERAL::INVALID_ARGUMENT, "")),
            exit_codes::kBadArgument);
  EXPECT_EQ(ExitCodeFor(make_error(my_errors::GENERAL::CONFLICT, "")),
            exit_codes::kBadArgument);
  EXPECT_EQ(ExitCodeFor(make_error(my_errors::GENERAL::NOT_FOUND, "")),
            exit_codes::kBadArgument);
  EXPECT_EQ(ExitCodeFor(make_error(my_errors::NETWORK::REMOTE_UNAVAILABLE, "")),
            exit_codes::kRuntimeFailure);
  EXPECT_EQ(ExitCodeFor(make_error(my_errors::LISTEN::DRAIN_TIMEOUT, "")),
            exit_codes::kRuntimeFailure);
}

} // namespace hookrelay
