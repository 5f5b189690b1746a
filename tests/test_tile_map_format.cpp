#include <catch2/catch.hpp>

#include <limits>

#include "eo_tiles/errors.hpp"
#include "eo_tiles/tile_map_format.hpp"

using namespace eo_tiles;

TEST_CASE("parse_tile_line decodes a well-formed line") {
    const auto entry = parse_tile_line("31TGM x=2.0,y=40.0,w=1.0,h=1.0", 1);
    REQUIRE(entry.has_value());
    REQUIRE(entry->tile_id == "31TGM");
    REQUIRE(entry->rectangle == Rectangle{2.0, 40.0, 1.0, 1.0});
}

TEST_CASE("parse_tile_line tolerates surrounding whitespace and CRLF") {
    const auto entry = parse_tile_line("  013033\tx=-77.5, y=38.25 ,w=2.75,h=-1.5\r", 4);
    REQUIRE(entry.has_value());
    REQUIRE(entry->tile_id == "013033");
    REQUIRE(entry->rectangle == Rectangle{-77.5, 38.25, 2.75, -1.5});
}

TEST_CASE("parse_tile_line skips blank lines") {
    REQUIRE_FALSE(parse_tile_line("", 1).has_value());
    REQUIRE_FALSE(parse_tile_line("   \r", 2).has_value());
}

TEST_CASE("parse_tile_line splits the identifier at the first space only") {
    // The identifier text also appears inside a value; only the leading token is removed.
    const auto entry = parse_tile_line("1 x=1.1,y=11.0,w=1.0,h=1.0", 1);
    REQUIRE(entry.has_value());
    REQUIRE(entry->tile_id == "1");
    REQUIRE(entry->rectangle == Rectangle{1.1, 11.0, 1.0, 1.0});
}

TEST_CASE("parse_tile_line rejects malformed lines") {
    SECTION("missing identifier separator") {
        REQUIRE_THROWS_AS(parse_tile_line("31TGMx=2.0,y=40.0,w=1.0,h=1.0", 3), ParseError);
    }

    SECTION("missing h field") {
        try {
            (void)parse_tile_line("31TGM x=2.0,y=40.0,w=1.0", 7);
            FAIL("expected ParseError");
        } catch (const ParseError& error) {
            REQUIRE(error.line() == 7);
            REQUIRE_THAT(error.what(), Catch::Contains("line 7") && Catch::Contains("3 fields"));
        }
    }

    SECTION("fields out of order") {
        REQUIRE_THROWS_WITH(parse_tile_line("31TGM y=40.0,x=2.0,w=1.0,h=1.0", 1), Catch::Contains("expected field 'x'"));
    }

    SECTION("unparsable number") {
        REQUIRE_THROWS_WITH(parse_tile_line("31TGM x=2.0,y=forty,w=1.0,h=1.0", 1), Catch::Contains("field 'y' is not a number"));
        REQUIRE_THROWS_AS(parse_tile_line("31TGM x=2.0,y=40.0,w=1.0abc,h=1.0", 1), ParseError);
        REQUIRE_THROWS_AS(parse_tile_line("31TGM x=2.0,y=40.0,w=1.0,h=", 1), ParseError);
    }
}

TEST_CASE("parse_tile_line keeps subnormal and overflowing values") {
    const auto entry = parse_tile_line("T x=4.9E-324,y=1e-310,w=1e400,h=-1e400", 1);
    REQUIRE(entry.has_value());
    REQUIRE(entry->rectangle.x == std::numeric_limits<double>::denorm_min());
    REQUIRE(entry->rectangle.y == 1e-310);
    REQUIRE(entry->rectangle.width == std::numeric_limits<double>::infinity());
    REQUIRE(entry->rectangle.height == -std::numeric_limits<double>::infinity());
}

TEST_CASE("parse_decimal requires the whole text to be a number") {
    REQUIRE(parse_decimal("-77.125") == -77.125);
    REQUIRE_FALSE(parse_decimal("").has_value());
    REQUIRE_FALSE(parse_decimal("abc").has_value());
    REQUIRE_FALSE(parse_decimal("1.0abc").has_value());
}

TEST_CASE("format_tile_line renders the canonical line") {
    REQUIRE(format_tile_line("31TGM", Rectangle{2.0, 40.0, 1.0, 1.0}) == "31TGM x=2.0,y=40.0,w=1.0,h=1.0\n");
    REQUIRE(format_tile_line("013033", Rectangle{-77.125, 38.5, 2.75, -0.5}) == "013033 x=-77.125,y=38.5,w=2.75,h=-0.5\n");
}

TEST_CASE("format_coordinate output parses back to the same double") {
    const double value = GENERATE(0.1, 2.0, -179.99999, 12.345678901234567, 1e-7, 6.02214076e23,
                                  std::numeric_limits<double>::max(), std::numeric_limits<double>::denorm_min());
    const std::string str_value = format_coordinate(value);
    const auto entry = parse_tile_line("T x=" + str_value + ",y=0.0,w=0.0,h=0.0", 1);
    REQUIRE(entry.has_value());
    REQUIRE(entry->rectangle.x == value);
}
