#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MAIN
#include <boost/test/unit_test.hpp>

#include <vector>
#include "coordinates.h"
#include "coordinates_geom.h"
#include "transform.h"

BOOST_AUTO_TEST_SUITE(CoordinatesSuite)

BOOST_AUTO_TEST_CASE(MercatorFromLngLat) {
	MercatorCoordinate centre = MercatorCoordinate::fromLngLat(0, 0);
	BOOST_CHECK_CLOSE(centre.x, 0.5, 1e-9);
	BOOST_CHECK_SMALL(centre.y - 0.5, 1e-12);

	MercatorCoordinate west = MercatorCoordinate::fromLngLat(-180, 0);
	BOOST_CHECK_SMALL(west.x, 1e-12);

	// north is up, so y shrinks as latitude grows
	MercatorCoordinate north = MercatorCoordinate::fromLngLat(10, 60);
	BOOST_CHECK(north.y < 0.5);
	BOOST_CHECK_CLOSE(north.lon(), 10.0, 1e-6);
	BOOST_CHECK_CLOSE(north.lat(), 60.0, 1e-6);
}

BOOST_AUTO_TEST_CASE(TileIDs) {
	OverscaledTileID id(5, -2, 4, 3, 7);
	BOOST_CHECK_EQUAL(id.key(), "5/-2/4/3/7");
	BOOST_CHECK(id.wrapped() == OverscaledTileID(5, 0, 4, 3, 7));
	BOOST_CHECK(id.unwrapTo(1) == OverscaledTileID(5, 1, 4, 3, 7));
	BOOST_CHECK(id.wrapped() != id);

	BOOST_CHECK(CanonicalTileID(4, 3, 7).isChildOf(CanonicalTileID(2, 0, 1)));
	BOOST_CHECK(!CanonicalTileID(4, 3, 7).isChildOf(CanonicalTileID(2, 1, 1)));
	BOOST_CHECK(CanonicalTileID(4, 3, 7).isChildOf(CanonicalTileID(0, 0, 0)));
	BOOST_CHECK(!CanonicalTileID(2, 0, 1).isChildOf(CanonicalTileID(2, 0, 1)));

	// overscaled tiles descend from the same canonical tile at lower overscale
	BOOST_CHECK(OverscaledTileID(6, 0, 4, 3, 7).isChildOf(OverscaledTileID(4, 0, 4, 3, 7)));
	BOOST_CHECK(!OverscaledTileID(6, 1, 4, 3, 7).isChildOf(OverscaledTileID(4, 0, 4, 3, 7)));
}

BOOST_AUTO_TEST_CASE(SortCoarseFirst) {
	std::vector<OverscaledTileID> ids = {
		OverscaledTileID(3, 0, 3, 1, 1),
		OverscaledTileID(1, 1, 1, 0, 0),
		OverscaledTileID(1, 0, 1, 1, 0),
		OverscaledTileID(2, 0, 2, 0, 1)
	};
	sortTileIDs(ids);
	BOOST_CHECK(ids[0] == OverscaledTileID(1, 0, 1, 1, 0));
	BOOST_CHECK(ids[1] == OverscaledTileID(1, 1, 1, 0, 0));
	BOOST_CHECK(ids[2] == OverscaledTileID(2, 0, 2, 0, 1));
	BOOST_CHECK(ids[3] == OverscaledTileID(3, 0, 3, 1, 1));
}

BOOST_AUTO_TEST_CASE(TilePoint) {
	OverscaledTileID id(1, 0, 1, 1, 0);
	auto p = id.getTilePoint(MercatorCoordinate(0.75, 0.25));
	BOOST_CHECK_CLOSE(p.first, EXTENT / 2.0, 1e-9);
	BOOST_CHECK_CLOSE(p.second, EXTENT / 2.0, 1e-9);

	// the same place one world to the right
	auto q = id.unwrapTo(1).getTilePoint(MercatorCoordinate(1.75, 0.25));
	BOOST_CHECK_CLOSE(q.first, EXTENT / 2.0, 1e-9);
}

BOOST_AUTO_TEST_CASE(Boxes) {
	std::vector<Point> points = { Point(1, 5), Point(3, 2), Point(-1, 4) };
	Box box = boundsFromPoints(points);
	BOOST_CHECK_EQUAL(box.min_corner().x(), -1);
	BOOST_CHECK_EQUAL(box.min_corner().y(), 2);
	BOOST_CHECK_EQUAL(box.max_corner().x(), 3);
	BOOST_CHECK_EQUAL(box.max_corner().y(), 5);
	BOOST_CHECK_EQUAL(boxWidth(box), 4);
	BOOST_CHECK_EQUAL(boxHeight(box), 3);

	Box inner = box;
	shrinkBox(inner, 0.5);
	BOOST_CHECK(boxCovers(box, inner));
	BOOST_CHECK(!boxCovers(inner, box));

	Box doubled = mapBox(box, [](const Point &p) { return Point(p.x() * 2, p.y() * 2); });
	BOOST_CHECK_EQUAL(boxWidth(doubled), 8);

	// an empty point list intersects nothing
	Box empty = boundsFromPoints(std::vector<Point>());
	BOOST_CHECK(!isValidBox(empty));
	BOOST_CHECK(!boxIntersects(empty, EXTENT_BOUNDS));

	// touching counts
	Box edge(Point(EXTENT, 10), Point(EXTENT + 10, 20));
	BOOST_CHECK(boxIntersects(edge, EXTENT_BOUNDS));
	expandBox(edge, -1);
	BOOST_CHECK(!boxIntersects(edge, EXTENT_BOUNDS));
}

BOOST_AUTO_TEST_CASE(ScreenToMercator) {
	MercatorTransform transform(0, 0, 1, 400, 300);
	BOOST_CHECK_CLOSE(transform.worldSize(), 1024.0, 1e-9);

	MercatorCoordinate c = transform.screenPointToMercatorCoordinate(Point(200, 150), nullptr);
	BOOST_CHECK_CLOSE(c.x, 0.5, 1e-9);

	MercatorCoordinate right = transform.screenPointToMercatorCoordinate(Point(200 + 512, 150), nullptr);
	BOOST_CHECK_CLOSE(right.x, 1.0, 1e-9);

	// one world only: x wraps round
	MercatorTransform single(0, 0, 1, 400, 300, false);
	MercatorCoordinate wrapped = single.screenPointToMercatorCoordinate(Point(200 + 768, 150), nullptr);
	BOOST_CHECK_CLOSE(wrapped.x, 0.25, 1e-9);

	// a single point reaches straight back to the camera
	std::vector<Point> line = transform.getCameraQueryGeometry({ Point(10, 20) });
	BOOST_REQUIRE_EQUAL(line.size(), 2);
	BOOST_CHECK_CLOSE(line[1].x(), 200.0, 1e-9);
	BOOST_CHECK_CLOSE(line[1].y(), 150.0, 1e-9);
}

BOOST_AUTO_TEST_SUITE_END()
