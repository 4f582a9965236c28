/*! \file */
#ifndef _GEOJSON_PROCESSOR_H
#define _GEOJSON_PROCESSOR_H

#include <string>
#include <vector>
#include "geom.h"
#include "feature.h"
#include "source_diff.h"

#include "rapidjson/document.h"

// Reads GeoJSON sources and source diffs into their in-memory form.
//
// Invalid JSON, or JSON of the wrong shape at the top level, throws
// std::runtime_error. Within a diff, entries that can't be understood
// (an id that is neither a string nor an integer, say) are skipped.
class GeoJSONProcessor {

public:
	// A Feature, a FeatureCollection, or null
	UpdateableGeoJSON readSource(const std::string &json);
	UpdateableGeoJSON readSourceFile(const std::string &filename);

	// A single diff object, or an array of them
	std::vector<SourceDiff> readDiffs(const std::string &json);
	std::vector<SourceDiff> readDiffFile(const std::string &filename);

	SourceDiff readDiff(const rapidjson::Value &value);
	FeaturePtr readFeature(const rapidjson::Value &value);
	Geometry readGeometry(const rapidjson::Value &value);
	PropertyValue readValue(const rapidjson::Value &value);

private:
	rapidjson::Document parse(const std::string &json);
	UpdateableGeoJSON readSourceDocument(const rapidjson::Value &doc);

	FeatureDiff readFeatureDiff(const rapidjson::Value &value, bool &valid);
	PropertyMap readProperties(const rapidjson::Value &pr);
	boost::optional<FeatureID> readFeatureID(const rapidjson::Value &value);

	template <bool Flag, typename T>
	Polygon polygonFromGeoJSONArray(const rapidjson::GenericArray<Flag, T> &coords);

	template <bool Flag, typename T>
	std::vector<Point> pointsFromGeoJSONArray(const rapidjson::GenericArray<Flag, T> &arr);

	Point pointFromGeoJSONArray(const rapidjson::Value &pt);
};

#endif //_GEOJSON_PROCESSOR_H
