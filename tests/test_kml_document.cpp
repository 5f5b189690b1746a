#include <catch2/catch.hpp>

#include <sstream>

#include "logging_test_fixture.hpp"
#include "eo_tiles/errors.hpp"
#include "eo_tiles/kml_document.hpp"

using namespace eo_tiles;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    eo_tiles::test::ensure_logger_initialized();
    return true;
}();

std::vector<KmlPlacemark> read_text(const std::string& text) {
    std::istringstream input{text};
    return read_kml_placemarks(input);
}
}  // namespace

TEST_CASE("read_kml_placemarks flattens placemark data") {
    const auto list_placemarks = read_text(R"KML(<?xml version="1.0" encoding="UTF-8"?>
<kml xmlns="http://www.opengis.net/kml/2.2">
  <Document>
    <Folder>
      <Placemark>
        <name> 31TGM </name>
        <description>TILE_ID 31TGM</description>
        <ExtendedData>
          <Data name="EPSG"><value>32631</value></Data>
          <SchemaData schemaUrl="#wrs"><SimpleData name="MODE">D</SimpleData></SchemaData>
        </ExtendedData>
        <MultiGeometry>
          <Polygon>
            <outerBoundaryIs><LinearRing><coordinates>
              2.0,40.0,0 3.0,40.0,0
              3.0,41.0,0 2.0,41.0,0 2.0,40.0,0
            </coordinates></LinearRing></outerBoundaryIs>
            <innerBoundaryIs><LinearRing><coordinates>-50,-50 50,50</coordinates></LinearRing></innerBoundaryIs>
          </Polygon>
          <Point><coordinates>2.5,40.5,0</coordinates></Point>
        </MultiGeometry>
      </Placemark>
      <Placemark>
        <name>label only</name>
        <Point><coordinates>0,0</coordinates></Point>
      </Placemark>
    </Folder>
  </Document>
</kml>)KML");

    REQUIRE(list_placemarks.size() == 2);

    const KmlPlacemark& tile = list_placemarks.front();
    REQUIRE(tile.name == "31TGM");
    REQUIRE(tile.description == "TILE_ID 31TGM");
    REQUIRE(tile.extended_data.at("EPSG") == "32631");
    REQUIRE(tile.extended_data.at("MODE") == "D");
    REQUIRE(tile.polygon_envelopes.size() == 1);
    REQUIRE(tile.polygon_envelopes.front() == Rectangle{2.0, 40.0, 1.0, 1.0});

    REQUIRE(list_placemarks.back().polygon_envelopes.empty());
}

TEST_CASE("read_kml_placemarks accepts prefixed element names") {
    const auto list_placemarks = read_text(R"KML(<kml:kml xmlns:kml="http://www.opengis.net/kml/2.2">
  <kml:Placemark><kml:name>13_33</kml:name>
    <kml:Polygon><kml:outerBoundaryIs><kml:LinearRing>
      <kml:coordinates>-77.5,38.0 -75.0,38.0 -75.0,40.0 -77.5,40.0</kml:coordinates>
    </kml:LinearRing></kml:outerBoundaryIs></kml:Polygon>
  </kml:Placemark>
</kml:kml>)KML");

    REQUIRE(list_placemarks.size() == 1);
    REQUIRE(list_placemarks.front().name == "13_33");
    REQUIRE(list_placemarks.front().polygon_envelopes.front() == Rectangle{-77.5, 38.0, 2.5, 2.0});
}

TEST_CASE("read_kml_placemarks rejects malformed documents") {
    REQUIRE_THROWS_AS(read_text(""), ParseError);
    REQUIRE_THROWS_AS(read_text("<kml><Document><Placemark></Document></kml>"), ParseError);
    REQUIRE_THROWS_WITH(
        read_text("<kml><Placemark><name>31TGM</name><Polygon><outerBoundaryIs><LinearRing>"
                  "<coordinates>2.0;40.0 3.0,41.0</coordinates>"
                  "</LinearRing></outerBoundaryIs></Polygon></Placemark></kml>"),
        Catch::Contains("malformed KML coordinate tuple"));
}

TEST_CASE("read_kml_placemarks reports a failing stream as an I/O error") {
    test::FailingStreambuf failing_buffer{"<kml><Document><Placemark><name>31TGM</name>"};
    std::istream input{&failing_buffer};
    REQUIRE_THROWS_AS(read_kml_placemarks(input), IoError);
}

TEST_CASE("coordinates_envelope spans every tuple") {
    REQUIRE(coordinates_envelope("10,20 12,25,100\n\t11,19") == Rectangle{10.0, 19.0, 2.0, 6.0});
    REQUIRE_THROWS_AS(coordinates_envelope("   "), ParseError);
    REQUIRE_THROWS_AS(coordinates_envelope("10,abc"), ParseError);
}
