#include "geojson_processor.h"

#include "helpers.h"
#include <iostream>

#include "rapidjson/document.h"
#include "rapidjson/writer.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/error/en.h"

using namespace std;

rapidjson::Document GeoJSONProcessor::parse(const std::string &json) {
	rapidjson::Document doc;
	doc.Parse(json.data(), json.size());
	if (doc.HasParseError()) {
		throw std::runtime_error("Invalid JSON file: " + std::string(rapidjson::GetParseError_En(doc.GetParseError())) +
		                         " at offset " + std::to_string(doc.GetErrorOffset()));
	}
	return doc;
}

UpdateableGeoJSON GeoJSONProcessor::readSource(const std::string &json) {
	rapidjson::Document doc = parse(json);
	return readSourceDocument(doc);
}

UpdateableGeoJSON GeoJSONProcessor::readSourceFile(const std::string &filename) {
	return readSource(readFile(filename));
}

UpdateableGeoJSON GeoJSONProcessor::readSourceDocument(const rapidjson::Value &doc) {
	if (doc.IsNull()) return boost::blank();

	if (!doc.IsObject() || !doc.HasMember("type") || !doc["type"].IsString()) {
		throw std::runtime_error("Top-level GeoJSON value must be an object with a type.");
	}

	std::string type = doc["type"].GetString();
	if (type == "Feature") {
		return readFeature(doc);
	}

	if (type == "FeatureCollection") {
		auto f = doc.FindMember("features");
		if (f == doc.MemberEnd() || !f->value.IsArray()) {
			throw std::runtime_error("FeatureCollection has no features array.");
		}
		FeatureCollection features;
		features.reserve(f->value.Size());
		for (auto &feature : f->value.GetArray()) {
			features.emplace_back(readFeature(feature));
		}
		return features;
	}

	throw std::runtime_error("Top-level GeoJSON object must be a Feature or a FeatureCollection, not " + type + ".");
}

FeaturePtr GeoJSONProcessor::readFeature(const rapidjson::Value &value) {
	if (!value.IsObject()) {
		throw std::runtime_error("GeoJSON feature must be an object.");
	}

	auto feature = std::make_shared<Feature>();

	auto id = value.FindMember("id");
	if (id != value.MemberEnd()) {
		feature->id = readFeatureID(id->value);
	}

	auto geometry = value.FindMember("geometry");
	if (geometry != value.MemberEnd()) {
		feature->geometry = std::make_shared<const Geometry>(readGeometry(geometry->value));
	}

	auto pr = value.FindMember("properties");
	if (pr != value.MemberEnd() && pr->value.IsObject()) {
		feature->properties = std::make_shared<const PropertyMap>(readProperties(pr->value));
	}

	return feature;
}

Geometry GeoJSONProcessor::readGeometry(const rapidjson::Value &geometry) {
	if (geometry.IsNull()) return boost::blank();

	if (!geometry.IsObject() || !geometry.HasMember("type") || !geometry["type"].IsString()) {
		throw std::runtime_error("GeoJSON geometry must be an object with a type.");
	}

	std::string geomType = geometry["type"].GetString();
	if (geomType == "GeometryCollection") {
		std::cerr << "GeometryCollection not currently supported." << std::endl;
		return boost::blank();
	}

	auto c = geometry.FindMember("coordinates");
	if (c == geometry.MemberEnd() || !c->value.IsArray()) {
		throw std::runtime_error(geomType + " has no coordinates array.");
	}
	auto coords = c->value.GetArray();

	// Convert each type of GeoJSON geometry into its Boost.Geometry equivalent
	if (geomType == "Point") {
		// coordinates is [x,y]
		return pointFromGeoJSONArray(c->value);

	} else if (geomType == "MultiPoint") {
		// coordinates is [[x,y],[x,y],[x,y]...]
		std::vector<Point> points = pointsFromGeoJSONArray(coords);
		return MultiPoint(points.begin(), points.end());

	} else if (geomType == "LineString") {
		// coordinates is [[x,y],[x,y],[x,y]...]
		Linestring ls;
		geom::assign_points(ls, pointsFromGeoJSONArray(coords));
		return ls;

	} else if (geomType == "MultiLineString") {
		// coordinates is [ LineString, LineString, LineString... ]
		MultiLinestring mls;
		for (auto &pts : coords) {
			if (!pts.IsArray()) throw std::runtime_error("Invalid MultiLineString coordinates.");
			Linestring ls;
			geom::assign_points(ls, pointsFromGeoJSONArray(pts.GetArray()));
			mls.emplace_back(std::move(ls));
		}
		return mls;

	} else if (geomType == "Polygon") {
		// coordinates is [ Ring, Ring, Ring... ]
		// where Ring is [[x,y],[x,y],[x,y]...]
		return polygonFromGeoJSONArray(coords);

	} else if (geomType == "MultiPolygon") {
		// coordinates is [ Polygon, Polygon, Polygon... ]
		MultiPolygon mp;
		for (auto &p : coords) {
			if (!p.IsArray()) throw std::runtime_error("Invalid MultiPolygon coordinates.");
			mp.emplace_back(polygonFromGeoJSONArray(p.GetArray()));
		}
		return mp;
	}

	std::cerr << "Unknown geometry type " << geomType << ", treated as null." << std::endl;
	return boost::blank();
}

template <bool Flag, typename T>
Polygon GeoJSONProcessor::polygonFromGeoJSONArray(const rapidjson::GenericArray<Flag, T> &coords) {
	Polygon poly;
	bool first = true;
	for (auto &r : coords) {
		if (!r.IsArray()) throw std::runtime_error("Invalid Polygon coordinates.");
		Ring ring;
		geom::assign_points(ring, pointsFromGeoJSONArray(r.GetArray()));
		if (first) { poly.outer() = std::move(ring); first = false; }
		else { poly.inners().emplace_back(std::move(ring)); }
	}
	return poly;
}

template <bool Flag, typename T>
std::vector<Point> GeoJSONProcessor::pointsFromGeoJSONArray(const rapidjson::GenericArray<Flag, T> &arr) {
	std::vector<Point> points;
	points.reserve(arr.Size());
	for (auto &pt : arr) {
		points.emplace_back(pointFromGeoJSONArray(pt));
	}
	return points;
}

Point GeoJSONProcessor::pointFromGeoJSONArray(const rapidjson::Value &pt) {
	// Any altitude is dropped
	if (!pt.IsArray() || pt.Size() < 2 || !pt[0].IsNumber() || !pt[1].IsNumber()) {
		throw std::runtime_error("GeoJSON position must be an array of at least two numbers.");
	}
	return Point(pt[0].GetDouble(), pt[1].GetDouble());
}

PropertyMap GeoJSONProcessor::readProperties(const rapidjson::Value &pr) {
	PropertyMap properties;
	for (rapidjson::Value::ConstMemberIterator it = pr.MemberBegin(); it != pr.MemberEnd(); ++it) {
		properties[it->name.GetString()] = readValue(it->value);
	}
	return properties;
}

PropertyValue GeoJSONProcessor::readValue(const rapidjson::Value &value) {
	if (value.IsNull()) return boost::blank();
	if (value.IsBool()) return value.GetBool();
	if (value.IsInt64()) return static_cast<int64_t>(value.GetInt64());
	if (value.IsNumber()) return value.GetDouble();
	if (value.IsString()) return std::string(value.GetString(), value.GetStringLength());

	// something different, so keep it as JSON text
	rapidjson::StringBuffer strbuf;
	rapidjson::Writer<rapidjson::StringBuffer> writer(strbuf);
	value.Accept(writer);
	return RawJSON(std::string(strbuf.GetString(), strbuf.GetSize()));
}

boost::optional<FeatureID> GeoJSONProcessor::readFeatureID(const rapidjson::Value &value) {
	if (value.IsString()) return FeatureID(std::string(value.GetString(), value.GetStringLength()));
	if (value.IsInt64()) return FeatureID(static_cast<int64_t>(value.GetInt64()));
	if (value.IsNumber()) return toFeatureID(PropertyValue(value.GetDouble()));
	return boost::none;
}

// ----	Diffs

std::vector<SourceDiff> GeoJSONProcessor::readDiffs(const std::string &json) {
	rapidjson::Document doc = parse(json);
	std::vector<SourceDiff> diffs;

	if (doc.IsArray()) {
		for (auto &d : doc.GetArray()) {
			diffs.emplace_back(readDiff(d));
		}
	} else {
		diffs.emplace_back(readDiff(doc));
	}
	return diffs;
}

std::vector<SourceDiff> GeoJSONProcessor::readDiffFile(const std::string &filename) {
	return readDiffs(readFile(filename));
}

SourceDiff GeoJSONProcessor::readDiff(const rapidjson::Value &value) {
	if (!value.IsObject()) {
		throw std::runtime_error("Source diff must be an object.");
	}

	SourceDiff diff;

	auto removeAll = value.FindMember("removeAll");
	if (removeAll != value.MemberEnd() && removeAll->value.IsBool()) {
		diff.removeAll = removeAll->value.GetBool();
	}

	auto remove = value.FindMember("remove");
	if (remove != value.MemberEnd() && remove->value.IsArray()) {
		for (auto &id : remove->value.GetArray()) {
			boost::optional<FeatureID> featureId = readFeatureID(id);
			if (featureId) diff.remove.push_back(*featureId);
			else if (verbose) std::cerr << "Skipping remove entry without a usable id" << std::endl;
		}
	}

	auto add = value.FindMember("add");
	if (add != value.MemberEnd() && add->value.IsArray()) {
		for (auto &feature : add->value.GetArray()) {
			if (!feature.IsObject()) continue;
			diff.add.emplace_back(readFeature(feature));
		}
	}

	auto update = value.FindMember("update");
	if (update != value.MemberEnd() && update->value.IsArray()) {
		for (auto &u : update->value.GetArray()) {
			bool valid = false;
			FeatureDiff featureDiff = readFeatureDiff(u, valid);
			if (valid) diff.update.emplace_back(std::move(featureDiff));
			else if (verbose) std::cerr << "Skipping update entry without a usable id" << std::endl;
		}
	}

	return diff;
}

FeatureDiff GeoJSONProcessor::readFeatureDiff(const rapidjson::Value &value, bool &valid) {
	FeatureDiff diff;
	valid = false;
	if (!value.IsObject()) return diff;

	auto id = value.FindMember("id");
	if (id == value.MemberEnd()) return diff;
	boost::optional<FeatureID> featureId = readFeatureID(id->value);
	if (!featureId) return diff;
	diff.id = *featureId;
	valid = true;

	auto newGeometry = value.FindMember("newGeometry");
	if (newGeometry != value.MemberEnd() && !newGeometry->value.IsNull()) {
		diff.newGeometry = std::make_shared<const Geometry>(readGeometry(newGeometry->value));
	}

	auto removeAll = value.FindMember("removeAllProperties");
	if (removeAll != value.MemberEnd() && removeAll->value.IsBool()) {
		diff.removeAllProperties = removeAll->value.GetBool();
	}

	auto removeProperties = value.FindMember("removeProperties");
	if (removeProperties != value.MemberEnd() && removeProperties->value.IsArray()) {
		for (auto &key : removeProperties->value.GetArray()) {
			if (key.IsString()) diff.removeProperties.emplace_back(key.GetString(), key.GetStringLength());
		}
	}

	auto addOrUpdate = value.FindMember("addOrUpdateProperties");
	if (addOrUpdate != value.MemberEnd() && addOrUpdate->value.IsArray()) {
		for (auto &pair : addOrUpdate->value.GetArray()) {
			if (!pair.IsObject()) continue;
			auto key = pair.FindMember("key");
			if (key == pair.MemberEnd() || !key->value.IsString()) continue;
			auto v = pair.FindMember("value");
			PropertyValue propertyValue = v == pair.MemberEnd() ? PropertyValue() : readValue(v->value);
			diff.addOrUpdateProperties.emplace_back(
				std::string(key->value.GetString(), key->value.GetStringLength()), propertyValue);
		}
	}

	return diff;
}
