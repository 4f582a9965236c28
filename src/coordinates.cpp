#include "coordinates.h"
#include <math.h>
#include <algorithm>

double deg2rad(double deg) { return (M_PI/180.0) * deg; }
double rad2deg(double rad) { return (180.0/M_PI) * rad; }

// Project latitude (spherical Mercator)
static inline double clamp(double value, double limit) {
	return (value < -limit ? -limit : (value > limit ? limit : value));
}
double lat2latp(double lat) { return rad2deg(log(tan(deg2rad(clamp(lat,85.06)+90.0)/2.0))); }
double latp2lat(double latp) { return rad2deg(atan(exp(deg2rad(latp)))*2.0)-90.0; }

// Tile conversions
double lon2tilexf(double lon, uint8_t z) { return scalbn((lon+180.0) * (1/360.0), (int)z); }
double latp2tileyf(double latp, uint8_t z) { return scalbn((180.0-latp) * (1/360.0), (int)z); }
double lat2tileyf(double lat, uint8_t z) { return latp2tileyf(lat2latp(lat), z); }

// A z0 tile covers the whole Mercator plane, so its fractional tile
// position is the Mercator coordinate.
MercatorCoordinate MercatorCoordinate::fromLngLat(double lon, double lat, double altitude) {
	return MercatorCoordinate(lon2tilexf(lon, 0), lat2tileyf(lat, 0), altitude);
}

double MercatorCoordinate::lon() const { return x * 360.0 - 180.0; }
double MercatorCoordinate::lat() const { return latp2lat(180.0 - y * 360.0); }

bool CanonicalTileID::isChildOf(const CanonicalTileID &parent) const {
	if (parent.z >= z) return false;
	// z0 covers everything; avoids a shift by the full width below
	if (parent.z == 0) return true;
	const uint8_t dz = z - parent.z;
	return parent.x == (x >> dz) && parent.y == (y >> dz);
}

OverscaledTileID::OverscaledTileID(uint8_t overscaledZ, int16_t wrap, uint8_t z, uint32_t x, uint32_t y)
	: overscaledZ(overscaledZ), wrap(wrap), canonical(z, x, y) {
}

OverscaledTileID::OverscaledTileID(uint8_t overscaledZ, int16_t wrap, CanonicalTileID canonical)
	: overscaledZ(overscaledZ), wrap(wrap), canonical(canonical) {
}

OverscaledTileID OverscaledTileID::unwrapTo(int16_t wrap) const {
	return OverscaledTileID(overscaledZ, wrap, canonical);
}

OverscaledTileID OverscaledTileID::wrapped() const {
	return unwrapTo(0);
}

bool OverscaledTileID::isChildOf(const OverscaledTileID &parent) const {
	if (wrap != parent.wrap || overscaledZ <= parent.overscaledZ)
		return false;
	// An overscaled tile is a child of the same canonical tile at a lower overscale
	if (canonical == parent.canonical)
		return true;
	return canonical.isChildOf(parent.canonical);
}

std::string OverscaledTileID::key() const {
	return std::to_string(overscaledZ) + "/" + std::to_string(wrap) + "/" +
	       std::to_string(canonical.z) + "/" + std::to_string(canonical.x) + "/" + std::to_string(canonical.y);
}

std::pair<double,double> OverscaledTileID::getTilePoint(const MercatorCoordinate &coord) const {
	const double tilesAtZoom = scalbn(1.0, canonical.z);
	const double x = coord.x - wrap;
	return std::make_pair(
		(x * tilesAtZoom - canonical.x) * EXTENT,
		(coord.y * tilesAtZoom - canonical.y) * EXTENT);
}

void sortTileIDs(std::vector<OverscaledTileID> &tileIDs) {
	std::sort(tileIDs.begin(), tileIDs.end());
}
