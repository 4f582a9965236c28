#include "coordinates_geom.h"

const Box EXTENT_BOUNDS(Point(0, 0), Point(EXTENT, EXTENT));

Box boundsFromPoints(std::vector<Point> const &points) {
	Box box;
	geom::assign_inverse(box);
	for (auto const &p : points) {
		geom::expand(box, p);
	}
	return box;
}

Box boundsFromPoints(std::vector<MercatorCoordinate> const &coords) {
	Box box;
	geom::assign_inverse(box);
	for (auto const &c : coords) {
		geom::expand(box, toPoint(c));
	}
	return box;
}

bool isValidBox(Box const &box) {
	return box.min_corner().x() <= box.max_corner().x() &&
	       box.min_corner().y() <= box.max_corner().y();
}

double boxWidth(Box const &box) { return box.max_corner().x() - box.min_corner().x(); }
double boxHeight(Box const &box) { return box.max_corner().y() - box.min_corner().y(); }

void shrinkBox(Box &box, double distance) {
	expandBox(box, -distance);
}

void expandBox(Box &box, double distance) {
	box.min_corner().x(box.min_corner().x() - distance);
	box.min_corner().y(box.min_corner().y() - distance);
	box.max_corner().x(box.max_corner().x() + distance);
	box.max_corner().y(box.max_corner().y() + distance);
}

bool boxCovers(Box const &outer, Box const &inner) {
	if (!isValidBox(outer) || !isValidBox(inner)) return false;
	return geom::covered_by(inner, outer);
}

bool boxIntersects(Box const &a, Box const &b) {
	if (!isValidBox(a) || !isValidBox(b)) return false;
	return geom::intersects(a, b);
}
