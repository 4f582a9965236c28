#include "transform.h"
#include "coordinates_geom.h"
#include <cmath>

MercatorTransform::MercatorTransform(double lon, double lat, double zoom, double width, double height,
                                     bool renderWorldCopies, double pitch, uint32_t tileSize)
	: center(MercatorCoordinate::fromLngLat(lon, lat)),
	  zoom_(zoom), width(width), height(height),
	  renderWorldCopies(renderWorldCopies), pitch(pitch), tileSize(tileSize) {
}

double MercatorTransform::worldSize() const {
	return tileSize * std::pow(2.0, zoom_);
}

Point MercatorTransform::getCameraPoint() const {
	const double yOffset = std::tan(deg2rad(pitch)) * (height / 2);
	Point c = centerPoint();
	return Point(c.x(), c.y() + yOffset);
}

std::vector<Point> MercatorTransform::getCameraQueryGeometry(const std::vector<Point> &queryGeometry) const {
	const Point c = getCameraPoint();

	if (queryGeometry.size() == 1) {
		return { queryGeometry[0], c };
	}

	std::vector<Point> points(queryGeometry);
	points.push_back(c);
	Box box = boundsFromPoints(points);
	const double minX = box.min_corner().x(), minY = box.min_corner().y();
	const double maxX = box.max_corner().x(), maxY = box.max_corner().y();
	return {
		Point(minX, minY),
		Point(maxX, minY),
		Point(maxX, maxY),
		Point(minX, maxY),
		Point(minX, minY)
	};
}

MercatorCoordinate MercatorTransform::screenPointToMercatorCoordinate(const Point &p, const Terrain *) const {
	const double scale = worldSize();
	double x = center.x + (p.x() - width / 2) / scale;
	double y = center.y + (p.y() - height / 2) / scale;
	if (!renderWorldCopies) {
		x -= std::floor(x);
	}
	return MercatorCoordinate(x, y);
}
