#include <doctest/doctest.h>

#include <cmath>
#include <limits>

#include <flotilla/serial.hpp>
#include <flotilla/types.hpp>

TEST_CASE("serial: accepts DDDDDDDD-DD") {
    auto s = flotilla::Serial::parse("41158662-03");
    REQUIRE(s.is_ok());
    CHECK(s.value().str() == "41158662-03");
    CHECK(flotilla::Serial::is_valid("00000000-00"));
}

TEST_CASE("serial: rejects everything else") {
    for (const char *bad : {"", "hello", "A1", "4115866-203", "41158662-3", "41158662-033", "41158662_03",
                            " 41158662-03", "41158662-03 ", "4115866a-03", "41158662-0x"}) {
        auto s = flotilla::Serial::parse(bad);
        REQUIRE(s.is_err());
        CHECK(s.error().kind == flotilla::ErrorKind::InvalidSerial);
    }
}

TEST_CASE("serial: default value is valid") {
    flotilla::Serial s;
    CHECK(flotilla::Serial::is_valid(s.str()));
}

TEST_CASE("heading: named directions") {
    CHECK(flotilla::Heading::from_name("east").value() == flotilla::Heading::east());
    CHECK(flotilla::Heading::from_name("forward").value() == flotilla::Heading::east());
    CHECK(flotilla::Heading::from_name("west").value() == flotilla::Heading::west());
    CHECK(flotilla::Heading::from_name("up").value() == flotilla::Heading::north());
    CHECK(flotilla::Heading::from_name("down").value() == flotilla::Heading::south());

    auto bad = flotilla::Heading::from_name("onwards");
    REQUIRE(bad.is_err());
    CHECK(bad.error().kind == flotilla::ErrorKind::InvalidMovement);
}

TEST_CASE("heading: vectors are normalized") {
    auto h = flotilla::Heading::from_vector(3.0, 4.0);
    REQUIRE(h.is_ok());
    CHECK(h.value().dx == doctest::Approx(0.6));
    CHECK(h.value().dy == doctest::Approx(0.8));
    CHECK(h.value().is_valid());

    CHECK(flotilla::Heading::from_vector(0.0, 0.0).is_err());
    CHECK(flotilla::Heading::from_vector(std::numeric_limits<double>::infinity(), 1.0).is_err());
}

TEST_CASE("heading: huge finite vectors still normalize") {
    auto h = flotilla::Heading::from_vector(1.5e308, 1.5e308);
    REQUIRE(h.is_ok());
    CHECK(h.value().is_valid());
    CHECK(h.value().dx == doctest::Approx(std::sqrt(0.5)));
    CHECK(h.value().dy == doctest::Approx(std::sqrt(0.5)));

    auto tiny = flotilla::Heading::from_vector(0.0, -1e-310);
    REQUIRE(tiny.is_ok());
    CHECK(tiny.value() == flotilla::Heading::south());
}

TEST_CASE("heading: angles") {
    auto h = flotilla::Heading::from_angle(std::acos(-1.0) / 2.0);
    REQUIRE(h.is_ok());
    CHECK(h.value().dx == doctest::Approx(0.0));
    CHECK(h.value().dy == doctest::Approx(1.0));
    CHECK(h.value().angle_rad() == doctest::Approx(std::acos(-1.0) / 2.0));

    CHECK(flotilla::Heading::from_angle(std::numeric_limits<double>::quiet_NaN()).is_err());
}

TEST_CASE("heading: malformed headings are detected") {
    CHECK_FALSE((flotilla::Heading{2.0, 0.0}.is_valid()));
    CHECK_FALSE((flotilla::Heading{0.0, 0.0}.is_valid()));
    CHECK_FALSE((flotilla::Heading{std::numeric_limits<double>::quiet_NaN(), 1.0}.is_valid()));
    CHECK(flotilla::Heading{}.is_valid());
}
