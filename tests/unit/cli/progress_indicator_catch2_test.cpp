#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <clawdesk/cli/progress_indicator.h>

#include <sstream>

using clawdesk::cli::ProgressIndicator;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;

TEST_CASE("ProgressIndicator renders determinate styles", "[cli][progress]") {
    std::ostringstream out;

    SECTION("percentage") {
        ProgressIndicator p(ProgressIndicator::Style::Percentage, &out);
        p.start("Downloading agent.tar.gz");
        p.update(45, 100);
        CHECK(p.renderLine() == "[ 45%] Downloading agent.tar.gz (45/100)");
    }

    SECTION("bar with byte counts") {
        ProgressIndicator p(ProgressIndicator::Style::Bar, &out);
        p.setShowBytes(true);
        p.start("fetch");
        p.update(512, 1024);
        auto line = p.renderLine();
        CHECK_THAT(line, StartsWith("[==========          ] [ 50%] fetch"));
        CHECK_THAT(line, ContainsSubstring("512 B/1.0 KB"));
    }
}

TEST_CASE("ProgressIndicator falls back to a spinner without a total", "[cli][progress]") {
    std::ostringstream out;
    ProgressIndicator p(ProgressIndicator::Style::Bar, &out);
    p.start("stream");
    CHECK(p.renderLine() == "| stream");
    p.setUpdateInterval(0);
    p.update(300);
    CHECK_THAT(p.renderLine(), ContainsSubstring("stream (300)"));
    CHECK_THAT(p.renderLine(), !ContainsSubstring("%"));
}

TEST_CASE("ProgressIndicator writes plain lines to a non-terminal", "[cli][progress]") {
    std::ostringstream out;
    ProgressIndicator p(ProgressIndicator::Style::Percentage, &out);
    CHECK_FALSE(p.isActive());

    p.start("copy");
    CHECK(p.isActive());
    // Throttled: not yet due and not finished.
    p.update(10, 100);
    // Completion always renders.
    p.update(100, 100);
    p.stop();
    CHECK_FALSE(p.isActive());

    const auto text = out.str();
    CHECK(text == "| copy\n[100%] copy (100/100)\n");
    CHECK(text.find('\r') == std::string::npos);

    // Updates after stop are ignored.
    p.update(5, 10);
    CHECK(out.str() == text);
}
