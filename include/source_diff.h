/*! \file */
#ifndef _SOURCE_DIFF_H
#define _SOURCE_DIFF_H

#include <string>
#include <vector>
#include "feature.h"
#include "ordered_map.h"

/*
	Incremental updates to a GeoJSON source.

	A source which passes isUpdateable() is turned into a WorkingSet (features
	indexed by id) once; SourceDiffs are then applied to the working set in
	place. Diffs which queue up while a previous one is still being applied can
	be collapsed with mergeSourceDiffs() into one diff with the same effect.

	Malformed-but-plausible diffs are not errors: an added feature without an
	id, or an update/remove for an unknown id, is skipped.
*/

struct PropertyUpdate {
	std::string key;
	PropertyValue value;

	PropertyUpdate() {}
	PropertyUpdate(std::string key, PropertyValue value): key(std::move(key)), value(std::move(value)) {}
	bool operator==(const PropertyUpdate &other) const { return key == other.key && value == other.value; }
};

// Changes to one feature. Applied as: new geometry, then
// removeAllProperties, then removeProperties, then addOrUpdateProperties
// (later pairs win over earlier ones with the same key).
struct FeatureDiff {
	FeatureID id;
	// nullptr if the geometry is unchanged
	std::shared_ptr<const Geometry> newGeometry;
	bool removeAllProperties = false;
	std::vector<std::string> removeProperties;
	std::vector<PropertyUpdate> addOrUpdateProperties;

	FeatureDiff() {}
	explicit FeatureDiff(FeatureID id): id(std::move(id)) {}

	bool changesGeometry() const { return newGeometry != nullptr; }
	bool changesProperties() const {
		return removeAllProperties || !removeProperties.empty() || !addOrUpdateProperties.empty();
	}
};

// A set of changes to a source, always applied in the order
// removeAll, remove, add, update. Empty sequences mean "no change".
struct SourceDiff {
	bool removeAll = false;
	std::vector<FeatureID> remove;
	std::vector<FeaturePtr> add;
	std::vector<FeatureDiff> update;

	bool empty() const {
		return !removeAll && remove.empty() && add.empty() && update.empty();
	}
};

// Features indexed by id, in the order they were added
typedef OrderedMap<FeatureID, FeaturePtr, FeatureIDHash> WorkingSet;

// True for null, a single feature with an id, or a feature collection in
// which every feature has an id and no id repeats.
bool isUpdateableGeoJSON(const UpdateableGeoJSON &data, const PromoteID &promoteId = boost::none);

// Index the features of `data` by id. Only meaningful if isUpdateableGeoJSON(data).
WorkingSet toUpdateable(const UpdateableGeoJSON &data, const PromoteID &promoteId = boost::none);

// Apply `diff` to `updateable` in place. Features are never modified: an
// update replaces the stored feature with a changed copy, so other holders
// of the old FeaturePtr are unaffected.
void applySourceDiff(WorkingSet &updateable, const SourceDiff &diff, const PromoteID &promoteId = boost::none);

// One diff with the same effect as applying `prevDiff` and then `nextDiff`.
// Either may be absent.
SourceDiff mergeSourceDiffs(const boost::optional<SourceDiff> &prevDiff,
                            const boost::optional<SourceDiff> &nextDiff,
                            const PromoteID &promoteId = boost::none);

// One feature diff with the same effect as applying `prev` and then `next`
// to the same feature.
FeatureDiff mergeFeatureDiffs(const FeatureDiff &prev, const FeatureDiff &next);

// Features of a working set as a collection, in working-set order
FeatureCollection toFeatureCollection(const WorkingSet &updateable);

#endif //_SOURCE_DIFF_H
