/*! \file */
#ifndef _FEATURE_H
#define _FEATURE_H

#include <map>
#include <memory>
#include <string>
#include <vector>
#include <boost/optional.hpp>
#include <boost/variant.hpp>
#include <boost/functional/hash.hpp>
#include "geom.h"

#include "rapidjson/document.h"

// A feature is identified by an integer or a string. The two kinds never
// compare equal: 5 and "5" are different ids.
typedef boost::variant<int64_t, std::string> FeatureID;
typedef boost::hash<FeatureID> FeatureIDHash;

// Arrays and objects found in property values are kept as serialised JSON,
// alongside the parsed document so that writing doesn't parse it again.
struct RawJSON {
	std::string json;
	std::shared_ptr<const rapidjson::Document> document;

	RawJSON() {}
	// Throws std::runtime_error if `json` doesn't parse
	explicit RawJSON(std::string json);
	bool operator==(const RawJSON &other) const { return json == other.json; }
};

// A property value. boost::blank stands for JSON null.
// NB: construct string values from std::string, since a string literal
// would silently convert to bool.
typedef boost::variant<boost::blank, bool, int64_t, double, std::string, RawJSON> PropertyValue;
typedef std::map<std::string, PropertyValue> PropertyMap;

// A GeoJSON feature. Geometry and properties are immutable once built and
// shared between copies of the feature; modifying either means building a
// new one (see applySourceDiff).
class Feature {

public:
	boost::optional<FeatureID> id;
	std::shared_ptr<const Geometry> geometry;
	// nullptr for "properties": null
	std::shared_ptr<const PropertyMap> properties;

	Feature();
	Feature(boost::optional<FeatureID> id, Geometry geometry, PropertyMap properties);

	const PropertyValue* getProperty(const std::string &key) const;
	bool operator==(const Feature &other) const;
	bool operator!=(const Feature &other) const { return !(*this == other); }
};

typedef std::shared_ptr<const Feature> FeaturePtr;
typedef std::vector<FeaturePtr> FeatureCollection;

// The shape a GeoJSON source must have to be updated incrementally: nothing
// at all, a single feature, or a feature collection.
typedef boost::variant<boost::blank, FeaturePtr, FeatureCollection> UpdateableGeoJSON;

// Property used as the feature id instead of the intrinsic "id" member.
typedef boost::optional<std::string> PromoteID;

// An integer-valued number or a string can identify a feature; anything else can't.
boost::optional<FeatureID> toFeatureID(const PropertyValue &value);

// The id of `feature`: its promoted property if `promoteId` is set, its
// intrinsic id otherwise. boost::none if it has no usable id.
boost::optional<FeatureID> getFeatureId(const Feature &feature, const PromoteID &promoteId);

#endif //_FEATURE_H
