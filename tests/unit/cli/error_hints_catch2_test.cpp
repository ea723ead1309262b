// CLI Error Hints tests
//
// Tests for error_hints.h - hint selection for failed clawdesk commands.

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <clawdesk/cli/error_hints.h>
#include <clawdesk/core/types.h>

using namespace clawdesk;
using namespace clawdesk::cli;
using Catch::Matchers::ContainsSubstring;

// ============================================================================
// getErrorHint() - message patterns
// ============================================================================

TEST_CASE("ErrorHints - missing agent binary", "[cli][error_hints]") {
    auto hint = getErrorHint(ErrorCode::ProcessSpawnError,
                             "Failed to start /home/u/.bambooclaw/bambooclaw: No such file");
    CHECK(hint.hint == "Install the agent or point daemon.binary / CLAWDESK_DAEMON_BIN at it");
    CHECK(hint.command == "clawdesk probe bambooclaw");

    auto notOnPath = getErrorHint(ErrorCode::FileNotFound, "bambooclaw not found in PATH");
    CHECK(notOnPath.command == "clawdesk probe bambooclaw");
}

TEST_CASE("ErrorHints - agent name alone does not trigger the install hint",
          "[cli][error_hints]") {
    auto hint = getErrorHint(ErrorCode::PermissionDenied, "cannot signal bambooclaw (pid 42)");
    CHECK_THAT(hint.hint, ContainsSubstring("elevated privileges"));
    CHECK(hint.command.empty());
}

// ============================================================================
// getErrorHint() - code fallbacks
// ============================================================================

TEST_CASE("ErrorHints - code based hints", "[cli][error_hints]") {
    CHECK(getErrorHint(ErrorCode::ProcessSpawnError, "node exited").command ==
          "clawdesk platform");
    CHECK_THAT(getErrorHint(ErrorCode::NetworkError, "reset").hint,
               ContainsSubstring("partial files are left in place"));
    CHECK_THAT(getErrorHint(ErrorCode::Timeout, "slow").hint,
               ContainsSubstring("network connectivity"));
    CHECK_THAT(getErrorHint(ErrorCode::HttpError, "HTTP 404").hint,
               ContainsSubstring("verify the URL"));
    CHECK_THAT(getErrorHint(ErrorCode::IoError, "disk").hint, ContainsSubstring("disk space"));
    CHECK_THAT(getErrorHint(ErrorCode::UnsupportedPlatform, "haiku").hint,
               ContainsSubstring("windows, macos and linux"));
}

TEST_CASE("ErrorHints - no hint for plain argument errors", "[cli][error_hints]") {
    auto hint = getErrorHint(ErrorCode::InvalidArgument, "Unknown prerequisite: gcc");
    CHECK(hint.hint.empty());
    CHECK(hint.command.empty());
}

// ============================================================================
// formatErrorWithHint()
// ============================================================================

TEST_CASE("ErrorHints - formatted output", "[cli][error_hints]") {
    SECTION("message, hint and command") {
        auto text = formatErrorWithHint(ErrorCode::FileNotFound, "bambooclaw not found in PATH");
        CHECK(text == "[FAIL] bambooclaw not found in PATH\n"
                      "  hint: Install the agent or point daemon.binary / CLAWDESK_DAEMON_BIN at it\n"
                      "  try:  clawdesk probe bambooclaw");
    }

    SECTION("message only") {
        CHECK(formatErrorWithHint(ErrorCode::InvalidArgument, "bad header") ==
              "[FAIL] bad header");
    }

    SECTION("hint without command") {
        auto text = formatErrorWithHint(ErrorCode::HttpError, "HTTP 500");
        CHECK_THAT(text, ContainsSubstring("\n  hint: "));
        CHECK_THAT(text, !ContainsSubstring("try:"));
    }
}
