
#ifndef _COORDINATES_GEOM_H
#define _COORDINATES_GEOM_H

#include "coordinates.h"
#include "geom.h"

// ------------------------------------------------------
// Bounding-box helpers for query geometries. Boxes are axis-aligned, and an
// empty point list gives an inverse (invalid) box that intersects nothing.

// The local coordinate space of a single tile
extern const Box EXTENT_BOUNDS;

Box boundsFromPoints(std::vector<Point> const &points);
Box boundsFromPoints(std::vector<MercatorCoordinate> const &coords);

bool isValidBox(Box const &box);
double boxWidth(Box const &box);
double boxHeight(Box const &box);

// Move every edge inwards (shrink) or outwards (expand) by `distance`
void shrinkBox(Box &box, double distance);
void expandBox(Box &box, double distance);

// Transform the four corners of `box` and return their envelope
template<class Fn>
Box mapBox(Box const &box, Fn fn) {
	std::vector<Point> corners;
	corners.reserve(4);
	corners.emplace_back(fn(Point(box.min_corner().x(), box.min_corner().y())));
	corners.emplace_back(fn(Point(box.max_corner().x(), box.min_corner().y())));
	corners.emplace_back(fn(Point(box.max_corner().x(), box.max_corner().y())));
	corners.emplace_back(fn(Point(box.min_corner().x(), box.max_corner().y())));
	return boundsFromPoints(corners);
}

// True if `inner` lies within `outer`, boundaries included
bool boxCovers(Box const &outer, Box const &inner);

// True if the boxes overlap or touch
bool boxIntersects(Box const &a, Box const &b);

inline Point toPoint(MercatorCoordinate const &coord) { return Point(coord.x, coord.y); }
inline Point toPoint(std::pair<double,double> const &p) { return Point(p.first, p.second); }

#endif
