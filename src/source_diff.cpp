#include "source_diff.h"
#include <unordered_set>

namespace {
	typedef OrderedMap<FeatureID, bool, FeatureIDHash> IDSet;

	// Diff fields indexed by id, for constant-time conflict lookups while merging
	struct HashedDiff {
		bool removeAll = false;
		IDSet remove;
		OrderedMap<FeatureID, FeaturePtr, FeatureIDHash> add;
		OrderedMap<FeatureID, FeatureDiff, FeatureIDHash> update;
	};

	HashedDiff diffToHashed(const SourceDiff &diff, const PromoteID &promoteId) {
		HashedDiff hashed;
		hashed.removeAll = diff.removeAll;
		for (const auto &id : diff.remove) {
			hashed.remove.set(id, true);
		}
		for (const auto &feature : diff.add) {
			if (!feature) continue;
			// applySourceDiff would skip a feature without an id anyway
			boost::optional<FeatureID> id = getFeatureId(*feature, promoteId);
			if (id) hashed.add.set(*id, feature);
		}
		for (const auto &update : diff.update) {
			// several updates to one feature are applied in turn
			const FeatureDiff *existing = hashed.update.find(update.id);
			if (existing) {
				hashed.update.set(update.id, mergeFeatureDiffs(*existing, update));
			} else {
				hashed.update.set(update.id, update);
			}
		}
		return hashed;
	}

	SourceDiff hashedToDiff(const HashedDiff &hashed) {
		SourceDiff diff;
		diff.removeAll = hashed.removeAll;
		for (const auto &entry : hashed.remove) diff.remove.push_back(entry.first);
		for (const auto &entry : hashed.add) diff.add.push_back(entry.second);
		for (const auto &entry : hashed.update) diff.update.push_back(entry.second);
		return diff;
	}

	struct IsUpdateable : boost::static_visitor<bool> {
		const PromoteID &promoteId;
		IsUpdateable(const PromoteID &promoteId): promoteId(promoteId) {}

		// null can be updated
		bool operator()(const boost::blank&) const { return true; }

		bool operator()(const FeaturePtr &feature) const {
			return feature && getFeatureId(*feature, promoteId);
		}

		// every feature needs an id, and the ids must be unique, so that
		// no feature is silently dropped by another with the same id
		bool operator()(const FeatureCollection &features) const {
			std::unordered_set<FeatureID, FeatureIDHash> seenIds;
			for (const auto &feature : features) {
				if (!feature) return false;
				boost::optional<FeatureID> id = getFeatureId(*feature, promoteId);
				if (!id) return false;
				if (!seenIds.insert(*id).second) return false;
			}
			return true;
		}
	};

	struct ToUpdateable : boost::static_visitor<WorkingSet> {
		const PromoteID &promoteId;
		ToUpdateable(const PromoteID &promoteId): promoteId(promoteId) {}

		WorkingSet operator()(const boost::blank&) const { return WorkingSet(); }

		WorkingSet operator()(const FeaturePtr &feature) const {
			WorkingSet rv;
			add(rv, feature);
			return rv;
		}

		WorkingSet operator()(const FeatureCollection &features) const {
			WorkingSet rv;
			for (const auto &feature : features) add(rv, feature);
			return rv;
		}

		void add(WorkingSet &rv, const FeaturePtr &feature) const {
			if (!feature) return;
			boost::optional<FeatureID> id = getFeatureId(*feature, promoteId);
			if (id) rv.set(*id, feature);
		}
	};

	template<typename T>
	void append(std::vector<T> &dest, const std::vector<T> &src) {
		dest.insert(dest.end(), src.begin(), src.end());
	}
}

bool isUpdateableGeoJSON(const UpdateableGeoJSON &data, const PromoteID &promoteId) {
	return boost::apply_visitor(IsUpdateable(promoteId), data);
}

WorkingSet toUpdateable(const UpdateableGeoJSON &data, const PromoteID &promoteId) {
	return boost::apply_visitor(ToUpdateable(promoteId), data);
}

void applySourceDiff(WorkingSet &updateable, const SourceDiff &diff, const PromoteID &promoteId) {
	if (diff.removeAll) {
		updateable.clear();
	}

	for (const auto &id : diff.remove) {
		updateable.erase(id);
	}

	for (const auto &feature : diff.add) {
		if (!feature) continue;
		boost::optional<FeatureID> id = getFeatureId(*feature, promoteId);
		if (id) updateable.set(*id, feature);
	}

	for (const auto &update : diff.update) {
		FeaturePtr *stored = updateable.find(update.id);
		if (!stored) continue;

		const bool changeGeometry = update.changesGeometry();
		const bool changeProps = update.changesProperties();

		// nothing to do; the stored feature is left exactly as it was
		if (!changeGeometry && !changeProps) continue;

		// copy once, since we'll modify it
		std::shared_ptr<Feature> feature = std::make_shared<Feature>(**stored);

		if (changeGeometry) {
			feature->geometry = update.newGeometry;
		}

		if (changeProps) {
			std::shared_ptr<PropertyMap> properties;
			if (update.removeAllProperties || !feature->properties) {
				properties = std::make_shared<PropertyMap>();
			} else {
				properties = std::make_shared<PropertyMap>(*feature->properties);
			}

			for (const auto &key : update.removeProperties) {
				properties->erase(key);
			}

			for (const auto &pair : update.addOrUpdateProperties) {
				(*properties)[pair.key] = pair.value;
			}
			feature->properties = properties;
		}

		*stored = feature;
	}
}

SourceDiff mergeSourceDiffs(const boost::optional<SourceDiff> &prevDiff,
                            const boost::optional<SourceDiff> &nextDiff,
                            const PromoteID &promoteId) {
	if (!prevDiff) return nextDiff ? *nextDiff : SourceDiff();
	if (!nextDiff) return *prevDiff;

	HashedDiff prev = diffToHashed(*prevDiff, promoteId);
	HashedDiff next = diffToHashed(*nextDiff, promoteId);

	// Features added or updated by prev are wiped by next's removeAll
	if (next.removeAll) {
		prev.add.clear();
		prev.update.clear();
	}

	// Features added or updated by prev and then removed by next
	for (const auto &entry : next.remove) {
		prev.add.erase(entry.first);
		prev.update.erase(entry.first);
	}

	// Features updated by both: fold prev's changes into next's entry
	for (auto &entry : next.update) {
		const FeatureDiff *prevUpdate = prev.update.find(entry.first);
		if (!prevUpdate) continue;

		entry.second = mergeFeatureDiffs(*prevUpdate, entry.second);
		prev.update.erase(entry.first);
	}

	HashedDiff merged;
	merged.removeAll = prev.removeAll || next.removeAll;
	merged.remove = std::move(prev.remove);
	for (const auto &entry : next.remove) merged.remove.set(entry.first, true);
	merged.add = std::move(prev.add);
	for (const auto &entry : next.add) merged.add.set(entry.first, entry.second);
	merged.update = std::move(prev.update);
	for (const auto &entry : next.update) merged.update.set(entry.first, entry.second);

	// A feature both removed and added ends up added
	for (const auto &entry : merged.add) {
		merged.remove.erase(entry.first);
	}

	return hashedToDiff(merged);
}

FeatureDiff mergeFeatureDiffs(const FeatureDiff &prev, const FeatureDiff &next) {
	FeatureDiff merged = prev;

	if (next.newGeometry) {
		merged.newGeometry = next.newGeometry;
	}
	append(merged.addOrUpdateProperties, next.addOrUpdateProperties);
	append(merged.removeProperties, next.removeProperties);
	if (next.removeAllProperties) {
		merged.removeAllProperties = true;
	}

	return merged;
}

FeatureCollection toFeatureCollection(const WorkingSet &updateable) {
	FeatureCollection rv;
	rv.reserve(updateable.size());
	for (const auto &entry : updateable) {
		rv.push_back(entry.second);
	}
	return rv;
}
