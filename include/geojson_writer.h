/*! \file */
#ifndef _GEOJSON_WRITER_H
#define _GEOJSON_WRITER_H

/*
	GeoJSON writer for features and source diffs, using RapidJSON.

	Example:
		GeoJSONWriter gj;
		gj.addFeatures(toFeatureCollection(workingSet));
		gj.finalise();
		std::cout << gj.toString() << std::endl;

	Or use gj.toFile("output.geojson") to write to file, gj.toFile(name, true)
	to gzip it. Calling writeDiff() instead of finalise() produces a diff
	object in the same shape the reader accepts.
*/

#include <iostream>
#include <string>
#include "geom.h"
#include "feature.h"
#include "source_diff.h"
#include "helpers.h"

#include "rapidjson/document.h"
#include "rapidjson/writer.h"
#include "rapidjson/stringbuffer.h"

struct GeoJSONWriter {
	rapidjson::Document document;
	std::vector<FeaturePtr> features;
	int maxDecimalPlaces;

	GeoJSONWriter(int maxDecimalPlaces = 7): maxDecimalPlaces(maxDecimalPlaces) {
		document.SetObject();
	}
	void addFeature(const FeaturePtr &feature) {
		features.emplace_back(feature);
	}
	void addFeatures(const FeatureCollection &collection) {
		features.insert(features.end(), collection.begin(), collection.end());
	}

	struct SerialiseGeometry : public boost::static_visitor<> {
		rapidjson::Value *obj;
		rapidjson::Document::AllocatorType *alloc;

		SerialiseGeometry(rapidjson::Value *obj, rapidjson::Document::AllocatorType *alloc) :
			obj(obj), alloc(alloc) {}

		rapidjson::Value pointToArray(const Point &point) {
			rapidjson::Value pt(rapidjson::kArrayType);
			pt.PushBack(point.x(), *alloc);
			pt.PushBack(point.y(), *alloc);
			return pt;
		}
		template <typename T>
		rapidjson::Value pointsToArray(const T &points) {
			rapidjson::Value arr(rapidjson::kArrayType);
			for (auto &point : points) arr.PushBack(pointToArray(point), *alloc);
			return arr;
		}
		rapidjson::Value polygonToArray(const Polygon &p) {
			rapidjson::Value coordinates(rapidjson::kArrayType);
			coordinates.PushBack(pointsToArray(p.outer()), *alloc);
			for (auto &inner : p.inners()) {
				coordinates.PushBack(pointsToArray(inner), *alloc);
			}
			return coordinates;
		}
		void finish(rapidjson::Value &coordinates, const char *type) {
			obj->SetObject();
			obj->AddMember("type", rapidjson::Value().SetString(type, *alloc), *alloc);
			obj->AddMember("coordinates", coordinates, *alloc);
		}

		void operator()(const boost::blank &) { obj->SetNull(); }
		void operator()(const Point &p) {
			rapidjson::Value coordinates = pointToArray(p);
			finish(coordinates, "Point");
		}
		void operator()(const MultiPoint &mp) {
			rapidjson::Value coordinates = pointsToArray(mp);
			finish(coordinates, "MultiPoint");
		}
		void operator()(const Linestring &ls) {
			rapidjson::Value coordinates = pointsToArray(ls);
			finish(coordinates, "LineString");
		}
		void operator()(const MultiLinestring &mls) {
			rapidjson::Value coordinates(rapidjson::kArrayType);
			for (auto &ls : mls) coordinates.PushBack(pointsToArray(ls), *alloc);
			finish(coordinates, "MultiLineString");
		}
		void operator()(const Polygon &p) {
			rapidjson::Value coordinates = polygonToArray(p);
			finish(coordinates, "Polygon");
		}
		void operator()(const MultiPolygon &mp) {
			rapidjson::Value coordinates(rapidjson::kArrayType);
			for (auto &polygon : mp) coordinates.PushBack(polygonToArray(polygon), *alloc);
			finish(coordinates, "MultiPolygon");
		}
	};

	struct SerialiseValue : public boost::static_visitor<> {
		rapidjson::Value *out;
		rapidjson::Document::AllocatorType *alloc;

		SerialiseValue(rapidjson::Value *out, rapidjson::Document::AllocatorType *alloc): out(out), alloc(alloc) {}

		void operator()(const boost::blank &) { out->SetNull(); }
		void operator()(bool b) { out->SetBool(b); }
		void operator()(int64_t i) { out->SetInt64(i); }
		void operator()(double d) { out->SetDouble(d); }
		void operator()(const std::string &s) { out->SetString(s.data(), s.size(), *alloc); }
		void operator()(const RawJSON &raw) {
			if (raw.document) out->CopyFrom(*raw.document, *alloc);
			else out->SetNull();
		}
	};

	rapidjson::Value serialiseGeometry(const Geometry &geometry) {
		rapidjson::Value value;
		SerialiseGeometry visitor(&value, &document.GetAllocator());
		boost::apply_visitor(visitor, geometry);
		return value;
	}

	rapidjson::Value serialiseValue(const PropertyValue &value) {
		rapidjson::Value out;
		SerialiseValue visitor(&out, &document.GetAllocator());
		boost::apply_visitor(visitor, value);
		return out;
	}

	rapidjson::Value serialiseFeatureID(const FeatureID &id) {
		rapidjson::Value out;
		if (const int64_t *i = boost::get<int64_t>(&id)) {
			out.SetInt64(*i);
		} else {
			const std::string &s = boost::get<std::string>(id);
			out.SetString(s.data(), s.size(), document.GetAllocator());
		}
		return out;
	}

	rapidjson::Value serialiseFeature(const Feature &feature) {
		auto &alloc = document.GetAllocator();
		rapidjson::Value obj(rapidjson::kObjectType);
		obj.AddMember("type", "Feature", alloc);
		if (feature.id) obj.AddMember("id", serialiseFeatureID(*feature.id), alloc);
		// properties
		rapidjson::Value properties;
		if (feature.properties) {
			properties.SetObject();
			for (auto &kv : *feature.properties) {
				properties.AddMember(rapidjson::Value(kv.first.data(), kv.first.size(), alloc), serialiseValue(kv.second), alloc);
			}
		}
		obj.AddMember("properties", properties, alloc);
		// geometry
		rapidjson::Value geometry;
		if (feature.geometry) geometry = serialiseGeometry(*feature.geometry);
		obj.AddMember("geometry", geometry, alloc);
		return obj;
	}

	// Complete the FeatureCollection with the features added so far
	void finalise() {
		auto &alloc = document.GetAllocator();
		document.SetObject();
		document.AddMember("type", "FeatureCollection", alloc);
		rapidjson::Value array(rapidjson::kArrayType);
		for (auto &feature : features) {
			array.PushBack(serialiseFeature(*feature), alloc);
		}
		document.AddMember("features", array, alloc);
		features.clear();
	}

	// Replace the document with a diff object. Empty members are left out.
	void writeDiff(const SourceDiff &diff) {
		auto &alloc = document.GetAllocator();
		document.SetObject();
		if (diff.removeAll) document.AddMember("removeAll", true, alloc);

		if (!diff.remove.empty()) {
			rapidjson::Value remove(rapidjson::kArrayType);
			for (auto &id : diff.remove) remove.PushBack(serialiseFeatureID(id), alloc);
			document.AddMember("remove", remove, alloc);
		}

		if (!diff.add.empty()) {
			rapidjson::Value add(rapidjson::kArrayType);
			for (auto &feature : diff.add) add.PushBack(serialiseFeature(*feature), alloc);
			document.AddMember("add", add, alloc);
		}

		if (!diff.update.empty()) {
			rapidjson::Value update(rapidjson::kArrayType);
			for (auto &u : diff.update) {
				rapidjson::Value obj(rapidjson::kObjectType);
				obj.AddMember("id", serialiseFeatureID(u.id), alloc);
				if (u.newGeometry) obj.AddMember("newGeometry", serialiseGeometry(*u.newGeometry), alloc);
				if (u.removeAllProperties) obj.AddMember("removeAllProperties", true, alloc);
				if (!u.removeProperties.empty()) {
					rapidjson::Value keys(rapidjson::kArrayType);
					for (auto &key : u.removeProperties) keys.PushBack(rapidjson::Value(key.data(), key.size(), alloc), alloc);
					obj.AddMember("removeProperties", keys, alloc);
				}
				if (!u.addOrUpdateProperties.empty()) {
					rapidjson::Value pairs(rapidjson::kArrayType);
					for (auto &p : u.addOrUpdateProperties) {
						rapidjson::Value pair(rapidjson::kObjectType);
						pair.AddMember("key", rapidjson::Value(p.key.data(), p.key.size(), alloc), alloc);
						pair.AddMember("value", serialiseValue(p.value), alloc);
						pairs.PushBack(pair, alloc);
					}
					obj.AddMember("addOrUpdateProperties", pairs, alloc);
				}
				update.PushBack(obj, alloc);
			}
			document.AddMember("update", update, alloc);
		}
	}

	std::string toString() const {
		rapidjson::StringBuffer buffer;
		rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
		writer.SetMaxDecimalPlaces(maxDecimalPlaces);
		document.Accept(writer);
		std::string json(buffer.GetString(), buffer.GetSize());
		return json;
	}
	void toFile(const std::string &filename, bool compress = false) const {
		writeFile(filename, toString(), compress);
	}
};

#endif //_GEOJSON_WRITER_H
