/*! \file */
#ifndef _TRANSFORM_H
#define _TRANSFORM_H

#include <vector>
#include "coordinates.h"
#include "geom.h"

// Elevation model of the map. Tile queries only pass it through to the
// transform, which may use it to unproject screen points onto terrain.
class Terrain;

// The view state a spatial query is evaluated against: how screen pixels map
// onto the Mercator plane at the current zoom.
class QueryTransform {

public:
	virtual ~QueryTransform() {}

	virtual double zoom() const = 0;

	// False for projections (e.g. a globe) that show a single copy of the
	// world, whose screen-to-Mercator mapping wraps x into [0, 1).
	virtual bool allowWorldCopies() const = 0;

	// Widen a screen-space query so it also covers anything between the
	// queried area and the camera, which 3D content could poke into.
	virtual std::vector<Point> getCameraQueryGeometry(const std::vector<Point> &queryGeometry) const = 0;

	virtual MercatorCoordinate screenPointToMercatorCoordinate(const Point &p, const Terrain *terrain) const = 0;
};

// A flat Web Mercator viewport looking straight down at `center`, with the
// camera tilted by `pitch` degrees only for the purposes of camera queries.
class MercatorTransform : public QueryTransform {

public:
	MercatorTransform(double lon, double lat, double zoom, double width, double height,
	                  bool renderWorldCopies = true, double pitch = 0, uint32_t tileSize = 512);

	double zoom() const override { return zoom_; }
	bool allowWorldCopies() const override { return renderWorldCopies; }
	std::vector<Point> getCameraQueryGeometry(const std::vector<Point> &queryGeometry) const override;
	MercatorCoordinate screenPointToMercatorCoordinate(const Point &p, const Terrain *terrain) const override;

	Point centerPoint() const { return Point(width / 2, height / 2); }
	Point getCameraPoint() const;
	// Size of the whole world in screen pixels
	double worldSize() const;

private:
	MercatorCoordinate center;
	double zoom_;
	double width, height;
	bool renderWorldCopies;
	double pitch;
	uint32_t tileSize;
};

#endif //_TRANSFORM_H
