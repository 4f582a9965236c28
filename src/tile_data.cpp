#include "tile_data.h"

TileData::TileData(std::string raw)
	: rawData(std::make_shared<const std::string>(std::move(raw))) {
}

TileData::TileData(FeatureCollection features)
	: vectorData(std::make_shared<const FeatureCollection>(std::move(features))) {
}

Tile::Tile(OverscaledTileID tileID, uint32_t tileSize)
	: tileID(tileID), hasSymbolBuckets(false), queryPadding(1), tileSize(tileSize) {
}

bool Tile::symbolFadeFinished(double now) const {
	return !symbolFadeHoldUntil || *symbolFadeHoldUntil <= now;
}

void Tile::setSymbolHoldDuration(double duration, double now) {
	symbolFadeHoldUntil = now + duration;
}

void Tile::clearSymbolFadeHold() {
	symbolFadeHoldUntil = boost::none;
}
