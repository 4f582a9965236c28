#include "tile_cache.h"

TileCache::TileCache(int64_t maxEntries, RemoveHook onRemove)
	: cache(maxEntries, std::move(onRemove)) {
}

TileCache::TilePtr TileCache::get(const OverscaledTileID &tileID) {
	boost::optional<TilePtr> tile = cache.get(tileID.wrapped());
	if (!tile) return nullptr;

	// the cached tile may have been stored from a different world copy
	(*tile)->tileID = tileID;
	return *tile;
}

bool TileCache::has(const OverscaledTileID &tileID) const {
	return cache.has(tileID.wrapped());
}

void TileCache::set(const OverscaledTileID &tileID, TilePtr tile) {
	cache.set(tileID.wrapped(), std::move(tile));
}

void TileCache::remove(const OverscaledTileID &tileID) {
	cache.remove(tileID.wrapped());
}

void TileCache::setMaxSize(int64_t maxEntries) {
	cache.setMaxSize(maxEntries);
}

void TileCache::filter(std::function<bool(const TilePtr&)> keep) {
	cache.filter(keep);
}

void TileCache::clear() {
	cache.clear();
}
