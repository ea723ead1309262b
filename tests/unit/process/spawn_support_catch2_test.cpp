#include <catch2/catch_test_macros.hpp>

#include <clawdesk/process/detail/spawn_support.h>

using clawdesk::process::detail::quoteWindowsArg;

// Command-line quoting is a pure string transform, so it is checked on every host.
TEST_CASE("Windows argument quoting follows the MSVCRT rules", "[process][quoting]") {
    SECTION("plain arguments pass through") {
        CHECK(quoteWindowsArg(L"bambooclaw.exe") == L"bambooclaw.exe");
        CHECK(quoteWindowsArg(L"C:\\agent\\bin") == L"C:\\agent\\bin");
    }

    SECTION("empty argument becomes an empty quoted string") {
        CHECK(quoteWindowsArg(L"") == L"\"\"");
    }

    SECTION("whitespace forces quotes without touching inner backslashes") {
        CHECK(quoteWindowsArg(L"C:\\Program Files\\clawdesk") ==
              L"\"C:\\Program Files\\clawdesk\"");
    }

    SECTION("embedded quote is escaped") {
        CHECK(quoteWindowsArg(L"say \"hi\"") == L"\"say \\\"hi\\\"\"");
    }

    SECTION("backslashes before a quote are doubled plus one") {
        // a\"b  ->  "a\\\"b"
        CHECK(quoteWindowsArg(L"a\\\"b") == L"\"a\\\\\\\"b\"");
        // a\\"b  ->  "a\\\\\"b"
        CHECK(quoteWindowsArg(L"a\\\\\"b") == L"\"a\\\\\\\\\\\"b\"");
    }

    SECTION("trailing backslashes are doubled before the closing quote") {
        CHECK(quoteWindowsArg(L"C:\\My Dir\\") == L"\"C:\\My Dir\\\\\"");
    }
}

#ifndef _WIN32
#include <fcntl.h>
#include <unistd.h>

TEST_CASE("openCloexecPipe sets close-on-exec on both ends", "[process][spawn]") {
    int fds[2] = {-1, -1};
    REQUIRE(clawdesk::process::detail::openCloexecPipe(fds) == 0);
    CHECK((::fcntl(fds[0], F_GETFD) & FD_CLOEXEC) != 0);
    CHECK((::fcntl(fds[1], F_GETFD) & FD_CLOEXEC) != 0);
    ::close(fds[0]);
    ::close(fds[1]);
}
#endif
