/*! \file */
#ifndef _COORDINATES_H
#define _COORDINATES_H

// Lightweight types and functions for tile identifiers and coordinates, for
// classes that don't need to pull in boost::geometry.
//
// Things that pull in boost::geometry should go in coordinates_geom.h

#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include <functional>

// Tile-local coordinates run from 0 to EXTENT along each axis.
constexpr int32_t EXTENT = 8192;

double deg2rad(double deg);
double rad2deg(double rad);

// Project latitude (spherical Mercator)
double lat2latp(double lat);
double latp2lat(double latp);

// Tile conversions
double lon2tilexf(double lon, uint8_t z);
double latp2tileyf(double latp, uint8_t z);
double lat2tileyf(double lat, uint8_t z);

// A position on the Mercator plane, where the world spans 0..1 on both axes.
// x < 0 or x >= 1 denotes a position on another world copy.
struct MercatorCoordinate {
	double x, y, z;

	MercatorCoordinate(): x(0), y(0), z(0) {}
	MercatorCoordinate(double x, double y, double z = 0): x(x), y(y), z(z) {}

	static MercatorCoordinate fromLngLat(double lon, double lat, double altitude = 0);
	double lon() const;
	double lat() const;
};

class CanonicalTileID {

public:
	uint8_t z;
	uint32_t x, y;

	CanonicalTileID(): z(0), x(0), y(0) {}
	CanonicalTileID(uint8_t z, uint32_t x, uint32_t y): z(z), x(x), y(y) {}

	bool isChildOf(const CanonicalTileID &parent) const;

	bool operator ==(const CanonicalTileID &other) const {
		return z == other.z && x == other.x && y == other.y;
	}
	bool operator !=(const CanonicalTileID &other) const { return !(*this == other); }
	bool operator <(const CanonicalTileID &other) const {
		if (z != other.z) return z < other.z;
		if (x != other.x) return x < other.x;
		return y < other.y;
	}
};

// A tile as it is placed in a view: a canonical tile, the zoom it is rendered
// at (greater than the canonical zoom when overscaled), and the world copy it
// sits on.
class OverscaledTileID {

public:
	uint8_t overscaledZ;
	int16_t wrap;
	CanonicalTileID canonical;

	OverscaledTileID(): overscaledZ(0), wrap(0) {}
	OverscaledTileID(uint8_t overscaledZ, int16_t wrap, uint8_t z, uint32_t x, uint32_t y);
	OverscaledTileID(uint8_t overscaledZ, int16_t wrap, CanonicalTileID canonical);

	// The same tile moved to world copy `wrap`
	OverscaledTileID unwrapTo(int16_t wrap) const;
	// The same tile on the primary world copy
	OverscaledTileID wrapped() const;
	bool isChildOf(const OverscaledTileID &parent) const;
	std::string key() const;

	// Position of `coord` in this tile's local coordinate space (0..EXTENT)
	std::pair<double,double> getTilePoint(const MercatorCoordinate &coord) const;

	bool operator ==(const OverscaledTileID &other) const {
		return overscaledZ == other.overscaledZ && wrap == other.wrap && canonical == other.canonical;
	}
	bool operator !=(const OverscaledTileID &other) const { return !(*this == other); }

	// Coarser tiles sort before finer ones; ties break on world copy, then
	// canonical position.
	bool operator <(const OverscaledTileID &other) const {
		if (overscaledZ != other.overscaledZ) return overscaledZ < other.overscaledZ;
		if (wrap != other.wrap) return wrap < other.wrap;
		return canonical < other.canonical;
	}
};

void sortTileIDs(std::vector<OverscaledTileID> &tileIDs);

namespace std {
	template<> struct hash<CanonicalTileID> {
		size_t operator()(const CanonicalTileID & obj) const {
			size_t h = hash<uint32_t>()(obj.x);
			h = h * 31 + hash<uint32_t>()(obj.y);
			return h * 31 + obj.z;
		}
	};
	template<> struct hash<OverscaledTileID> {
		size_t operator()(const OverscaledTileID & obj) const {
			size_t h = hash<CanonicalTileID>()(obj.canonical);
			h = h * 31 + hash<int16_t>()(obj.wrap);
			return h * 31 + obj.overscaledZ;
		}
	};
}

#endif //_COORDINATES_H
