/*! \file */
#ifndef _VECTOR_TILE_STRATEGY_H
#define _VECTOR_TILE_STRATEGY_H

#include <functional>
#include <set>
#include <vector>
#include "coordinates.h"
#include "geom.h"
#include "tile_data.h"
#include "transform.h"

typedef std::set<OverscaledTileID> TileIDSet;

///\brief A resident tile matched by a spatial query
struct TileResult {
	std::shared_ptr<Tile> tile;
	OverscaledTileID tileID;
	// The query, and the query widened towards the camera, in tile-local units
	std::vector<Point> queryGeometry;
	std::vector<Point> cameraQueryGeometry;
	// 2^(view zoom - tile zoom)
	double scale;
};

///\brief Decides how long vector tiles stay resident, and which of them a query touches
class VectorTileStrategy {

public:
	// Run after the ideal tiles for this update have been worked out.
	// `retain` holds every tile that should survive this update. Tiles not in
	// it are dropped straight away unless they have symbols, in which case
	// they are held for `fadeDuration` ms first. Returns the tiles the caller
	// should now remove.
	std::vector<OverscaledTileID> onFinishUpdate(TileMap &tiles, const TileIDSet &retain,
	                                             double fadeDuration, double now) const;

	// Tiles held for a symbol fade only stay visible for symbol layers
	bool isTileRenderable(const Tile *tile, bool symbolLayer) const;

	std::vector<OverscaledTileID> getTilesHoldingForSymbolFade(const TileMap &tiles) const;

	// Find the resident tiles which may hold features within the screen-space
	// polygon `pointQueryGeometry`, coarsest tiles first.
	std::vector<TileResult> tilesIn(const TileMap &tiles,
	                                const std::vector<Point> &pointQueryGeometry,
	                                double maxPitchScaleFactor,
	                                bool has3DLayer,
	                                const QueryTransform *transform,
	                                const Terrain *terrain) const;

	// Project a screen-space polygon onto the Mercator plane. With
	// `checkWrap`, a polygon which crossed the antimeridian (and so wrapped
	// around to cover the rest of the world instead) is moved back into one piece.
	std::vector<MercatorCoordinate> transformBbox(const std::vector<Point> &geometry,
	                                              std::function<MercatorCoordinate(const Point&)> project,
	                                              bool checkWrap) const;
};

#endif //_VECTOR_TILE_STRATEGY_H
