#include <catch2/catch_test_macros.hpp>

#include "capture/image_host.hpp"

TEST_CASE("Image host response parsing", "[upload]") {

    SECTION("DefaultHostOrder") {
        auto hosts = default_image_hosts();
        REQUIRE(hosts.size() == 3);
        REQUIRE(hosts[0].name == "0x0.st");
        REQUIRE(hosts[1].name == "file.io");
        REQUIRE(hosts[2].name == "tmpfiles.org");
        REQUIRE(hosts[2].endpoint == "https://tmpfiles.org/api/v1/upload");
    }

    SECTION("PlainBodyIsTrimmed") {
        REQUIRE(extract_plain_url("https://0x0.st/Hx3a.png\n") == "https://0x0.st/Hx3a.png");
        REQUIRE_FALSE(extract_plain_url(" \n").has_value());
    }

    SECTION("FileIoLink") {
        REQUIRE(extract_fileio_link(R"({"success":true,"key":"abc","link":"https://file.io/abc"})") ==
                "https://file.io/abc");
        REQUIRE_FALSE(extract_fileio_link(R"({"success":false,"link":null})").has_value());
        REQUIRE_FALSE(extract_fileio_link(R"({"success":false})").has_value());
        REQUIRE_FALSE(extract_fileio_link("<html>502 Bad Gateway</html>").has_value());
    }

    SECTION("TmpfilesUrlUpgradedToHttps") {
        auto url = extract_tmpfiles_url(
            R"({"status":"success","data":{"url":"http://tmpfiles.org/123/shot.png"}})");
        REQUIRE(url == "https://tmpfiles.org/123/shot.png");
    }

    SECTION("TmpfilesMissingData") {
        REQUIRE_FALSE(extract_tmpfiles_url(R"({"status":"error"})").has_value());
        REQUIRE_FALSE(extract_tmpfiles_url(R"({"data":{"url":null}})").has_value());
        REQUIRE_FALSE(extract_tmpfiles_url("not json").has_value());
    }
}
