#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MAIN
#include <boost/test/unit_test.hpp>

#include <memory>
#include <string>
#include <vector>
#include "source_diff.h"

namespace {
	FeaturePtr makeFeature(FeatureID id, double x, double y, PropertyMap properties = PropertyMap()) {
		return std::make_shared<const Feature>(id, Point(x, y), properties);
	}

	FeatureID intId(int64_t id) { return FeatureID(id); }
	FeatureID strId(const std::string &id) { return FeatureID(id); }

	const PropertyValue& property(const WorkingSet &ws, const FeatureID &id, const std::string &key) {
		const FeaturePtr *feature = ws.find(id);
		BOOST_REQUIRE(feature);
		const PropertyValue *value = (*feature)->getProperty(key);
		BOOST_REQUIRE(value);
		return *value;
	}

	FeatureDiff setProperty(FeatureID id, const std::string &key, PropertyValue value) {
		FeatureDiff diff(id);
		diff.addOrUpdateProperties.emplace_back(key, value);
		return diff;
	}

	// A small source with integer and string ids
	WorkingSet sampleWorkingSet() {
		FeatureCollection features;
		PropertyMap p1; p1["name"] = std::string("one"); p1["rank"] = int64_t(1);
		PropertyMap p2; p2["name"] = std::string("two");
		PropertyMap p3; p3["name"] = std::string("three"); p3["rank"] = int64_t(3);
		features.push_back(makeFeature(intId(1), 0, 0, p1));
		features.push_back(makeFeature(intId(2), 1, 1, p2));
		features.push_back(makeFeature(strId("3"), 2, 2, p3));
		return toUpdateable(features);
	}

	bool sameFeatures(const WorkingSet &a, const WorkingSet &b) {
		if (a.size() != b.size()) return false;
		for (const auto &entry : a) {
			const FeaturePtr *other = b.find(entry.first);
			if (!other || **other != *entry.second) return false;
		}
		return true;
	}

	void checkMergeEquivalent(const SourceDiff &prev, const SourceDiff &next) {
		WorkingSet sequential = sampleWorkingSet();
		applySourceDiff(sequential, prev);
		applySourceDiff(sequential, next);

		WorkingSet merged = sampleWorkingSet();
		applySourceDiff(merged, mergeSourceDiffs(prev, next));

		BOOST_CHECK(sameFeatures(sequential, merged));
	}
}

BOOST_AUTO_TEST_SUITE(SourceDiffSuite)

BOOST_AUTO_TEST_CASE(Updateable) {
	BOOST_CHECK(isUpdateableGeoJSON(boost::blank()));
	BOOST_CHECK(toUpdateable(boost::blank()).empty());

	BOOST_CHECK(isUpdateableGeoJSON(makeFeature(intId(1), 0, 0)));
	BOOST_CHECK(!isUpdateableGeoJSON(std::make_shared<const Feature>()));

	// integer 5 and string "5" are different ids
	FeatureCollection distinct = { makeFeature(intId(5), 0, 0), makeFeature(strId("5"), 0, 0) };
	BOOST_CHECK(isUpdateableGeoJSON(distinct));
	BOOST_CHECK_EQUAL(toUpdateable(distinct).size(), 2);

	FeatureCollection duplicate = { makeFeature(intId(5), 0, 0), makeFeature(intId(5), 1, 1) };
	BOOST_CHECK(!isUpdateableGeoJSON(duplicate));

	FeatureCollection missing = { makeFeature(intId(5), 0, 0), std::make_shared<const Feature>() };
	BOOST_CHECK(!isUpdateableGeoJSON(missing));
}

BOOST_AUTO_TEST_CASE(PromotedIds) {
	PropertyMap a; a["ref"] = std::string("a");
	PropertyMap b; b["ref"] = 7.0;
	PropertyMap c; c["ref"] = 7.5;
	const PromoteID promoteId = std::string("ref");

	FeatureCollection features = { makeFeature(intId(1), 0, 0, a), makeFeature(intId(1), 0, 0, b) };
	// intrinsic ids clash, promoted ones don't
	BOOST_CHECK(!isUpdateableGeoJSON(features));
	BOOST_CHECK(isUpdateableGeoJSON(features, promoteId));

	WorkingSet ws = toUpdateable(features, promoteId);
	BOOST_CHECK(ws.contains(strId("a")));
	// 7.0 is an integer id
	BOOST_CHECK(ws.contains(intId(7)));

	features.push_back(makeFeature(intId(2), 0, 0, c));
	BOOST_CHECK(!isUpdateableGeoJSON(features, promoteId));

	// promoted ids are used when applying, too
	SourceDiff diff;
	diff.remove.push_back(strId("a"));
	PropertyMap d; d["ref"] = int64_t(9);
	diff.add.push_back(makeFeature(intId(1), 0, 0, d));
	applySourceDiff(ws, diff, promoteId);
	BOOST_CHECK(!ws.contains(strId("a")));
	BOOST_CHECK(ws.contains(intId(9)));
	BOOST_CHECK_EQUAL(ws.size(), 2);
}

BOOST_AUTO_TEST_CASE(FeatureEqualityKeepsParts) {
	Point a(0, 0), b(1, 0), c(1, 1), d(0, 1);

	MultiLinestring split1(2), split2(2);
	split1[0].push_back(a); split1[0].push_back(b); split1[1].push_back(c);
	split2[0].push_back(a); split2[1].push_back(b); split2[1].push_back(c);
	Feature lines1(intId(1), split1, PropertyMap());
	Feature lines2(intId(1), split2, PropertyMap());
	Feature lines3(intId(1), split1, PropertyMap());
	BOOST_CHECK(lines1 != lines2);
	BOOST_CHECK(lines1 == lines3);

	// the same vertices, with the hole folded into the outer ring
	Polygon holed, flat;
	holed.outer().push_back(a); holed.outer().push_back(b); holed.outer().push_back(c);
	holed.inners().resize(1);
	holed.inners()[0].push_back(d);
	flat.outer().push_back(a); flat.outer().push_back(b); flat.outer().push_back(c); flat.outer().push_back(d);
	Feature poly1(intId(2), holed, PropertyMap());
	Feature poly2(intId(2), flat, PropertyMap());
	BOOST_CHECK(poly1 != poly2);
}

BOOST_AUTO_TEST_CASE(ApplyOrder) {
	WorkingSet ws = sampleWorkingSet();

	// fields are applied as removeAll, remove, add, update whatever order they're given in
	SourceDiff diff;
	diff.update.push_back(setProperty(intId(1), "k", std::string("v")));
	diff.add.push_back(makeFeature(intId(1), 5, 5));
	diff.removeAll = true;
	applySourceDiff(ws, diff);

	BOOST_REQUIRE_EQUAL(ws.size(), 1);
	BOOST_CHECK(property(ws, intId(1), "k") == PropertyValue(std::string("v")));
	BOOST_CHECK((*ws.find(intId(1)))->getProperty("name") == nullptr);
}

BOOST_AUTO_TEST_CASE(ApplySkipsUnknownIds) {
	WorkingSet ws = sampleWorkingSet();

	SourceDiff diff;
	diff.remove.push_back(intId(42));
	diff.remove.push_back(intId(3));        // the feature has string id "3"
	diff.add.push_back(std::make_shared<const Feature>());
	diff.update.push_back(setProperty(intId(99), "k", int64_t(1)));
	applySourceDiff(ws, diff);

	BOOST_CHECK_EQUAL(ws.size(), 3);
	BOOST_CHECK(ws.contains(strId("3")));
	BOOST_CHECK(!ws.contains(intId(99)));
}

BOOST_AUTO_TEST_CASE(UpdateNoOpKeepsFeature) {
	WorkingSet ws = sampleWorkingSet();
	const FeaturePtr before = *ws.find(intId(2));

	SourceDiff diff;
	diff.update.push_back(FeatureDiff(intId(2)));
	applySourceDiff(ws, diff);

	BOOST_CHECK(*ws.find(intId(2)) == before);
}

BOOST_AUTO_TEST_CASE(UpdateCopiesOnWrite) {
	WorkingSet ws = sampleWorkingSet();
	const FeaturePtr before = *ws.find(intId(1));

	FeatureDiff update(intId(1));
	update.removeProperties.push_back("rank");
	update.addOrUpdateProperties.emplace_back("name", std::string("uno"));
	update.addOrUpdateProperties.emplace_back("name", std::string("eins"));
	update.newGeometry = std::make_shared<const Geometry>(Linestring{ Point(0, 0), Point(1, 1) });
	SourceDiff diff;
	diff.update.push_back(update);
	applySourceDiff(ws, diff);

	const FeaturePtr after = *ws.find(intId(1));
	BOOST_CHECK(after != before);
	// later pairs win
	BOOST_CHECK(property(ws, intId(1), "name") == PropertyValue(std::string("eins")));
	BOOST_CHECK(after->getProperty("rank") == nullptr);
	BOOST_CHECK_EQUAL(after->geometry->which(), 3);

	// the old feature is untouched
	BOOST_CHECK(*before->getProperty("name") == PropertyValue(std::string("one")));
	BOOST_CHECK(before->getProperty("rank") != nullptr);
	BOOST_CHECK_EQUAL(before->geometry->which(), 1);

	// a geometry-only change shares the property map
	FeatureDiff move(intId(2));
	move.newGeometry = std::make_shared<const Geometry>(Point(9, 9));
	const FeaturePtr two = *ws.find(intId(2));
	SourceDiff moveDiff;
	moveDiff.update.push_back(move);
	applySourceDiff(ws, moveDiff);
	BOOST_CHECK((*ws.find(intId(2)))->properties == two->properties);
}

BOOST_AUTO_TEST_CASE(RemoveAllProperties) {
	WorkingSet ws = sampleWorkingSet();
	FeatureDiff update(strId("3"));
	update.removeAllProperties = true;
	update.addOrUpdateProperties.emplace_back("fresh", true);
	SourceDiff diff;
	diff.update.push_back(update);
	applySourceDiff(ws, diff);

	const FeaturePtr three = *ws.find(strId("3"));
	BOOST_CHECK_EQUAL(three->properties->size(), 1);
	BOOST_CHECK(property(ws, strId("3"), "fresh") == PropertyValue(true));
}

BOOST_AUTO_TEST_CASE(MergeMissingSides) {
	SourceDiff diff;
	diff.remove.push_back(intId(1));

	BOOST_CHECK(mergeSourceDiffs(boost::none, boost::none).empty());
	BOOST_CHECK_EQUAL(mergeSourceDiffs(diff, boost::none).remove.size(), 1);
	BOOST_CHECK_EQUAL(mergeSourceDiffs(boost::none, diff).remove.size(), 1);
}

BOOST_AUTO_TEST_CASE(MergeRemoveWinsOverStaleUpdate) {
	SourceDiff prev;
	prev.update.push_back(setProperty(intId(1), "a", int64_t(1)));
	SourceDiff next;
	next.remove.push_back(intId(1));

	SourceDiff merged = mergeSourceDiffs(prev, next);
	BOOST_REQUIRE_EQUAL(merged.remove.size(), 1);
	BOOST_CHECK(merged.remove[0] == intId(1));
	BOOST_CHECK(merged.update.empty());
	checkMergeEquivalent(prev, next);
}

BOOST_AUTO_TEST_CASE(MergeAddSupersedesRemove) {
	SourceDiff prev;
	prev.remove.push_back(intId(1));
	prev.remove.push_back(intId(2));
	SourceDiff next;
	next.add.push_back(makeFeature(intId(1), 7, 7));

	SourceDiff merged = mergeSourceDiffs(prev, next);
	BOOST_REQUIRE_EQUAL(merged.remove.size(), 1);
	BOOST_CHECK(merged.remove[0] == intId(2));
	BOOST_REQUIRE_EQUAL(merged.add.size(), 1);
	checkMergeEquivalent(prev, next);
}

BOOST_AUTO_TEST_CASE(MergeRemoveAllDropsEarlierChanges) {
	SourceDiff prev;
	prev.add.push_back(makeFeature(intId(10), 1, 1));
	prev.update.push_back(setProperty(intId(2), "x", int64_t(1)));
	SourceDiff next;
	next.removeAll = true;
	next.add.push_back(makeFeature(intId(11), 1, 1));

	SourceDiff merged = mergeSourceDiffs(prev, next);
	BOOST_CHECK(merged.removeAll);
	BOOST_REQUIRE_EQUAL(merged.add.size(), 1);
	BOOST_CHECK(*merged.add[0]->id == intId(11));
	BOOST_CHECK(merged.update.empty());
	checkMergeEquivalent(prev, next);
}

BOOST_AUTO_TEST_CASE(MergeFoldsUpdatesToOneFeature) {
	SourceDiff prev;
	FeatureDiff first = setProperty(intId(1), "a", int64_t(1));
	first.removeProperties.push_back("rank");
	prev.update.push_back(first);
	prev.update.push_back(setProperty(intId(2), "b", int64_t(2)));

	SourceDiff next;
	FeatureDiff second = setProperty(intId(1), "a", int64_t(2));
	second.newGeometry = std::make_shared<const Geometry>(Point(4, 4));
	next.update.push_back(second);

	SourceDiff merged = mergeSourceDiffs(prev, next);
	BOOST_REQUIRE_EQUAL(merged.update.size(), 2);
	const FeatureDiff *folded = nullptr;
	for (const auto &u : merged.update) if (u.id == intId(1)) folded = &u;
	BOOST_REQUIRE(folded);
	BOOST_CHECK(folded->newGeometry);
	BOOST_REQUIRE_EQUAL(folded->addOrUpdateProperties.size(), 2);
	BOOST_CHECK(folded->addOrUpdateProperties[1].value == PropertyValue(int64_t(2)));
	BOOST_REQUIRE_EQUAL(folded->removeProperties.size(), 1);
	checkMergeEquivalent(prev, next);
}

BOOST_AUTO_TEST_CASE(MergeKeepsRepeatedUpdates) {
	SourceDiff prev;
	prev.update.push_back(setProperty(intId(1), "a", int64_t(1)));
	prev.update.push_back(setProperty(intId(1), "b", int64_t(2)));
	SourceDiff next;
	next.remove.push_back(intId(99));

	SourceDiff merged = mergeSourceDiffs(prev, next);
	BOOST_REQUIRE_EQUAL(merged.update.size(), 1);
	BOOST_CHECK_EQUAL(merged.update[0].addOrUpdateProperties.size(), 2);

	WorkingSet ws = sampleWorkingSet();
	applySourceDiff(ws, merged);
	BOOST_CHECK(property(ws, intId(1), "a") == PropertyValue(int64_t(1)));
	BOOST_CHECK(property(ws, intId(1), "b") == PropertyValue(int64_t(2)));
}

BOOST_AUTO_TEST_CASE(MergeFeatureDiffs) {
	FeatureDiff prev = setProperty(intId(1), "a", int64_t(1));
	prev.newGeometry = std::make_shared<const Geometry>(Point(1, 1));
	FeatureDiff next(intId(1));
	next.removeAllProperties = true;
	next.removeProperties.push_back("b");

	FeatureDiff merged = mergeFeatureDiffs(prev, next);
	BOOST_CHECK(merged.removeAllProperties);
	BOOST_CHECK(merged.newGeometry == prev.newGeometry);
	BOOST_CHECK_EQUAL(merged.addOrUpdateProperties.size(), 1);
	BOOST_CHECK_EQUAL(merged.removeProperties.size(), 1);
}

BOOST_AUTO_TEST_CASE(MergeEquivalence) {
	// a handful of pairs mixing every kind of change
	std::vector<std::pair<SourceDiff, SourceDiff>> pairs;

	{
		SourceDiff prev, next;
		prev.add.push_back(makeFeature(intId(4), 3, 3));
		next.update.push_back(setProperty(intId(4), "new", std::string("yes")));
		pairs.emplace_back(prev, next);
	}
	{
		SourceDiff prev, next;
		prev.remove.push_back(strId("3"));
		next.update.push_back(setProperty(intId(2), "name", std::string("deux")));
		next.remove.push_back(intId(1));
		pairs.emplace_back(prev, next);
	}
	{
		SourceDiff prev, next;
		prev.removeAll = true;
		prev.add.push_back(makeFeature(intId(8), 0, 0));
		next.add.push_back(makeFeature(intId(8), 1, 1));
		next.update.push_back(setProperty(intId(8), "k", int64_t(8)));
		pairs.emplace_back(prev, next);
	}
	{
		SourceDiff prev, next;
		FeatureDiff clear(intId(1));
		clear.removeAllProperties = true;
		prev.update.push_back(clear);
		next.update.push_back(setProperty(intId(1), "only", 1.5));
		FeatureDiff move(strId("3"));
		move.newGeometry = std::make_shared<const Geometry>(Point(-1, -1));
		next.update.push_back(move);
		pairs.emplace_back(prev, next);
	}
	{
		SourceDiff prev, next;
		prev.update.push_back(setProperty(intId(2), "name", std::string("a")));
		next.update.push_back(setProperty(intId(2), "name", std::string("b")));
		next.add.push_back(makeFeature(intId(5), 5, 5));
		pairs.emplace_back(prev, next);
	}
	{
		// two updates to one feature within the same diff
		SourceDiff prev, next;
		prev.update.push_back(setProperty(intId(1), "a", int64_t(1)));
		prev.update.push_back(setProperty(intId(1), "b", int64_t(2)));
		next.remove.push_back(intId(99));
		pairs.emplace_back(prev, next);
	}

	for (const auto &pair : pairs) {
		checkMergeEquivalent(pair.first, pair.second);
	}
}

BOOST_AUTO_TEST_CASE(WorkingSetOrder) {
	WorkingSet ws = sampleWorkingSet();
	SourceDiff diff;
	diff.add.push_back(makeFeature(intId(0), 0, 0));
	diff.update.push_back(setProperty(intId(1), "k", int64_t(1)));
	applySourceDiff(ws, diff);

	// updates keep their place, additions go to the end
	FeatureCollection features = toFeatureCollection(ws);
	BOOST_REQUIRE_EQUAL(features.size(), 4);
	BOOST_CHECK(*features[0]->id == intId(1));
	BOOST_CHECK(*features[2]->id == strId("3"));
	BOOST_CHECK(*features[3]->id == intId(0));
}

BOOST_AUTO_TEST_SUITE_END()
