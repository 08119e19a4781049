#include <catch2/catch_test_macros.hpp>

#include "translation.hpp"

TEST_CASE("Translation helpers", "[translate]") {

    SECTION("PromptCarriesWord") {
        auto p = translation::make_prompt("serendipity");
        REQUIRE(p.ends_with("Word: serendipity"));
        REQUIRE(p.find("russian") != std::string::npos);
    }

    SECTION("StripMarkdown") {
        REQUIRE(translation::strip_markdown("**Translation:** *кошка*\n---\nExample") ==
                "Translation: кошка\n\nExample");
        REQUIRE(translation::strip_markdown("plain - text") == "plain - text");
    }

    SECTION("Head") {
        REQUIRE(translation::head("a\nb\nc\nd", 2) == "a\nb");
        REQUIRE(translation::head("a\nb", 20) == "a\nb");
        REQUIRE(translation::head("", 3).empty());
    }

    SECTION("SummaryJoinsFirstLines") {
        REQUIRE(translation::summary("cat  -  кошка\n\nExample:\nThe cat sat.") ==
                "cat - кошка Example:");
        REQUIRE(translation::summary("  one\ttwo  \n") == "one two");
        REQUIRE(translation::summary("\n\n\n").empty());
    }
}
