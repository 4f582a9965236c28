/*! \file */
#ifndef _TILE_DATA_H
#define _TILE_DATA_H

#include <map>
#include <memory>
#include <string>
#include <vector>
#include <boost/optional.hpp>
#include "coordinates.h"
#include "feature.h"

// The decoded or still-encoded content of a tile, as handed over by the
// tile producer. Encoded bytes come from vector tile sources; a feature
// list comes from GeoJSON sources, which are tiled without encoding.
class TileData {

public:
	std::shared_ptr<const std::string> rawData;
	std::shared_ptr<const FeatureCollection> vectorData;

	TileData() {}
	explicit TileData(std::string raw);
	explicit TileData(FeatureCollection features);

	bool hasData() const { return rawData != nullptr || vectorData != nullptr; }
};

// A resident tile. Owns its payload and the symbol fade-out hold, which
// keeps a tile that has stopped being ideal around for `duration` ms so its
// labels can fade out rather than vanish.
//
// Times are milliseconds on a monotonic clock supplied by the caller.
class Tile {

public:
	OverscaledTileID tileID;
	std::shared_ptr<const TileData> data;
	bool hasSymbolBuckets;
	// extra distance around a query, in pixels at tileSize, that features
	// drawn from this tile may reach (e.g. wide lines, icons)
	double queryPadding;
	uint32_t tileSize;

	Tile(OverscaledTileID tileID, uint32_t tileSize = 512);

	bool hasData() const { return data && data->hasData(); }

	bool holdingForSymbolFade() const { return symbolFadeHoldUntil.is_initialized(); }
	// True once the hold has lasted `duration`, or if there is no hold
	bool symbolFadeFinished(double now) const;
	void setSymbolHoldDuration(double duration, double now);
	void clearSymbolFadeHold();

private:
	boost::optional<double> symbolFadeHoldUntil;
};

typedef std::map<OverscaledTileID, std::shared_ptr<Tile>> TileMap;

#endif //_TILE_DATA_H
