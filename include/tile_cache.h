#ifndef _TILE_CACHE_H
#define _TILE_CACHE_H

#include <memory>
#include "bounded_cache.h"
#include "tile_data.h"

// Keeps recently used tiles after they stop being displayed, up to a fixed
// number of tiles.
//
// A tile's content doesn't depend on which copy of the world it's drawn on,
// so tiles are stored under their wrapped id and shared between world
// copies. get() hands the tile back relabelled with the caller's id.
class TileCache {

public:
	typedef std::shared_ptr<Tile> TilePtr;
	typedef BoundedCache<OverscaledTileID, TilePtr, std::hash<OverscaledTileID>>::RemoveHook RemoveHook;

	TileCache(int64_t maxEntries, RemoveHook onRemove = RemoveHook());

	TilePtr get(const OverscaledTileID &tileID);
	bool has(const OverscaledTileID &tileID) const;
	void set(const OverscaledTileID &tileID, TilePtr tile);
	void remove(const OverscaledTileID &tileID);

	void setMaxSize(int64_t maxEntries);
	void filter(std::function<bool(const TilePtr&)> keep);
	void clear();

	size_t size() const { return cache.size(); }
	size_t maxSize() const { return cache.maxSize(); }

private:
	BoundedCache<OverscaledTileID, TilePtr, std::hash<OverscaledTileID>> cache;
};

#endif //_TILE_CACHE_H
