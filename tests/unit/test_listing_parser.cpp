#include <catch2/catch.hpp>

#include <ctime>

#include "transport/ListingParser.hpp"

using namespace transport;

namespace {
    core::utils::Timestamp utc(int year, int month, int day, int hour = 0, int minute = 0) {
        std::tm tm{};
        tm.tm_year = year - 1900;
        tm.tm_mon = month - 1;
        tm.tm_mday = day;
        tm.tm_hour = hour;
        tm.tm_min = minute;
        return std::chrono::system_clock::from_time_t(timegm(&tm));
    }
}

TEST_CASE("Listing line with an explicit year", "[listing]") {
    const auto now = utc(2025, 10, 18);
    auto entry = parseListingLine("-rw-r--r--    1 root  root  1048576 Mar 14  2024 benchy.3mf", "/cache", now);

    REQUIRE(entry);
    REQUIRE(entry->name == "benchy.3mf");
    REQUIRE(entry->path == "/cache/benchy.3mf");
    REQUIRE_FALSE(entry->isDirectory);
    REQUIRE(entry->size == 1048576);
    REQUIRE(entry->modified == utc(2024, 3, 14));
}

TEST_CASE("Year-less dates never land in the future", "[listing]") {
    const auto now = utc(2025, 2, 10, 12, 0);

    auto past = parseListingLine("-rw-r--r-- 1 u g 10 Jan 05 08:30 a.3mf", "/", now);
    REQUIRE(past);
    REQUIRE(past->modified == utc(2025, 1, 5, 8, 30));

    auto rolledBack = parseListingLine("-rw-r--r-- 1 u g 10 Dec 24 18:00 b.3mf", "/", now);
    REQUIRE(rolledBack);
    REQUIRE(rolledBack->modified == utc(2024, 12, 24, 18, 0));
}

TEST_CASE("Names with spaces are kept whole", "[listing]") {
    auto entry = parseListingLine("-rw-r--r-- 1 u g 42 Jan 01 2024 my first print.gcode.3mf", "/model/",
                                  std::chrono::system_clock::now());
    REQUIRE(entry);
    REQUIRE(entry->name == "my first print.gcode.3mf");
    REQUIRE(entry->path == "/model/my first print.gcode.3mf");
}

TEST_CASE("Directories and malformed lines", "[listing]") {
    const auto now = std::chrono::system_clock::now();

    auto dir = parseListingLine("drwxr-xr-x 2 u g 4096 Jan 01 2024 timelapse", "/", now);
    REQUIRE(dir);
    REQUIRE(dir->isDirectory);
    REQUIRE(dir->size == 0);

    REQUIRE_FALSE(parseListingLine("total 12", "/", now));
    REQUIRE_FALSE(parseListingLine("-rw-r--r-- 1 u g 42 Jan 01", "/", now));

    auto badDate = parseListingLine("-rw-r--r-- 1 u g 42 Foo 99 2024 x.3mf", "/", now);
    REQUIRE(badDate);
    REQUIRE_FALSE(badDate->modified);
}

TEST_CASE("Full listing skips blank and short lines", "[listing]") {
    const std::string listing =
            "total 2\r\n"
            "-rw-r--r-- 1 u g 100 Jan 01 2024 a.3mf\r\n"
            "\r\n"
            "drwxr-xr-x 2 u g 0 Jan 01 2024 cache\r\n";

    auto entries = parseListing(listing, "/", std::chrono::system_clock::now());
    REQUIRE(entries.size() == 2);
    REQUIRE(entries[0].name == "a.3mf");
    REQUIRE(entries[1].isDirectory);
}

TEST_CASE("Storage estimate only counts file sizes", "[listing]") {
    REQUIRE(listingLineFileSize("-rw-r--r-- 1 u g 2048 Jan 01 2024 a.3mf") == 2048u);
    REQUIRE_FALSE(listingLineFileSize("drwxr-xr-x 2 u g 4096 Jan 01 2024 cache"));
    REQUIRE_FALSE(listingLineFileSize("garbage"));
}

TEST_CASE("Impossible dates carry no modification time", "[listing]") {
    const auto now = utc(2025, 10, 18);

    auto feb31 = parseListingLine("-rw-r--r-- 1 u g 42 Feb 31 2024 x.3mf", "/", now);
    REQUIRE(feb31);
    REQUIRE(feb31->name == "x.3mf");
    REQUIRE_FALSE(feb31->modified);

    auto apr31 = parseListingLine("-rw-r--r-- 1 u g 42 Apr 31 2024 x.3mf", "/", now);
    REQUIRE(apr31);
    REQUIRE_FALSE(apr31->modified);

    REQUIRE_FALSE(parseListingLine("-rw-r--r-- 1 u g 42 Feb 29 2023 x.3mf", "/", now)->modified);

    auto leapDay = parseListingLine("-rw-r--r-- 1 u g 42 Feb 29 2024 x.3mf", "/", now);
    REQUIRE(leapDay->modified == utc(2024, 2, 29));

    SECTION("a year-less leap day falls back to the previous year") {
        auto entry = parseListingLine("-rw-r--r-- 1 u g 42 Feb 29 10:00 x.3mf", "/", utc(2025, 3, 10));
        REQUIRE(entry->modified == utc(2024, 2, 29, 10, 0));
    }
}
