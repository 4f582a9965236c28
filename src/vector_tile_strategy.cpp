#include "vector_tile_strategy.h"
#include "coordinates_geom.h"
#include <algorithm>
#include <cmath>

using namespace std;

vector<OverscaledTileID> VectorTileStrategy::onFinishUpdate(TileMap &tiles, const TileIDSet &retain,
                                                            double fadeDuration, double now) const {
	vector<OverscaledTileID> removeIds;

	for (auto &entry : tiles) {
		Tile &tile = *entry.second;

		// retained, so a later fade hold starts from scratch
		if (retain.count(entry.first)) {
			tile.clearSymbolFadeHold();
			continue;
		}

		if (!tile.hasSymbolBuckets) {
			removeIds.push_back(entry.first);
			continue;
		}

		// hold tiles with symbols until their fade is over, then remove
		if (!tile.holdingForSymbolFade()) {
			tile.setSymbolHoldDuration(fadeDuration, now);
		} else if (tile.symbolFadeFinished(now)) {
			tile.clearSymbolFadeHold();
			removeIds.push_back(entry.first);
		}
	}

	return removeIds;
}

bool VectorTileStrategy::isTileRenderable(const Tile *tile, bool symbolLayer) const {
	return tile && tile->hasData() && (symbolLayer || !tile->holdingForSymbolFade());
}

vector<OverscaledTileID> VectorTileStrategy::getTilesHoldingForSymbolFade(const TileMap &tiles) const {
	vector<OverscaledTileID> ids;
	for (const auto &entry : tiles) {
		if (entry.second->holdingForSymbolFade())
			ids.push_back(entry.first);
	}
	return ids;
}

vector<TileResult> VectorTileStrategy::tilesIn(const TileMap &tiles,
                                               const vector<Point> &pointQueryGeometry,
                                               double maxPitchScaleFactor,
                                               bool has3DLayer,
                                               const QueryTransform *transform,
                                               const Terrain *terrain) const {
	vector<TileResult> tileResults;
	if (!transform) return tileResults;

	const bool allowWorldCopies = transform->allowWorldCopies();

	const vector<Point> cameraPointQueryGeometry = has3DLayer ?
		transform->getCameraQueryGeometry(pointQueryGeometry) :
		pointQueryGeometry;

	auto project = [transform, terrain](const Point &p) {
		return transform->screenPointToMercatorCoordinate(p, terrain);
	};
	const vector<MercatorCoordinate> queryGeometry = transformBbox(pointQueryGeometry, project, !allowWorldCopies);
	const vector<MercatorCoordinate> cameraQueryGeometry = transformBbox(cameraPointQueryGeometry, project, !allowWorldCopies);
	const Box cameraBounds = boundsFromPoints(cameraQueryGeometry);

	// Coarse tiles first, so results from finer tiles draw over them
	vector<OverscaledTileID> sortedIDs;
	sortedIDs.reserve(tiles.size());
	for (const auto &entry : tiles) sortedIDs.push_back(entry.first);
	sortTileIDs(sortedIDs);

	for (const auto &id : sortedIDs) {
		const shared_ptr<Tile> &tile = tiles.at(id);

		// a tile closer to ideal already covers a tile held for fading
		if (tile->holdingForSymbolFade()) continue;

		// without world copies, a query near the antimeridian may reach the
		// tile from either side
		vector<OverscaledTileID> placements;
		if (allowWorldCopies) {
			placements.push_back(tile->tileID);
		} else {
			placements.push_back(tile->tileID.unwrapTo(-1));
			placements.push_back(tile->tileID.unwrapTo(0));
		}

		const double scale = pow(2.0, transform->zoom() - tile->tileID.overscaledZ);
		const double queryPadding = maxPitchScaleFactor * tile->queryPadding * EXTENT / tile->tileSize / scale;

		for (const auto &tileID : placements) {
			Box tileSpaceBounds = mapBox(cameraBounds, [&tileID](const Point &p) {
				return toPoint(tileID.getTilePoint(MercatorCoordinate(p.x(), p.y())));
			});
			expandBox(tileSpaceBounds, queryPadding);

			if (!boxIntersects(tileSpaceBounds, EXTENT_BOUNDS)) continue;

			TileResult result;
			result.tile = tile;
			result.tileID = allowWorldCopies ? tileID : tileID.unwrapTo(0);
			for (const auto &c : queryGeometry)
				result.queryGeometry.push_back(toPoint(tileID.getTilePoint(c)));
			for (const auto &c : cameraQueryGeometry)
				result.cameraQueryGeometry.push_back(toPoint(tileID.getTilePoint(c)));
			result.scale = scale;
			tileResults.push_back(move(result));
		}
	}

	return tileResults;
}

vector<MercatorCoordinate> VectorTileStrategy::transformBbox(const vector<Point> &geometry,
                                                             function<MercatorCoordinate(const Point&)> project,
                                                             bool checkWrap) const {
	vector<MercatorCoordinate> transformed;
	transformed.reserve(geometry.size());
	for (const auto &p : geometry) transformed.push_back(project(p));

	if (!checkWrap || geometry.empty()) return transformed;

	// A box from 179°E to 179°W projects to one from 179°W to 179°E, covering
	// everything except what it should. Shrinking the box slightly on screen
	// moves its projected edges inwards, unless it has wrapped, in which case
	// they move outside the projected bounds.
	Box bounds = boundsFromPoints(geometry);
	shrinkBox(bounds, min(boxWidth(bounds), boxHeight(bounds)) * 0.001);
	const Box projected = mapBox(bounds, [&project](const Point &p) { return toPoint(project(p)); });

	const Box newBounds = boundsFromPoints(transformed);

	if (!boxCovers(newBounds, projected)) {
		for (auto &coord : transformed) {
			if (coord.x > 0.5) coord.x -= 1;
		}
	}
	return transformed;
}
