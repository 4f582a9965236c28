#include "feature.h"
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

namespace {
	struct FeatureIDConverter : boost::static_visitor<boost::optional<FeatureID>> {
		boost::optional<FeatureID> operator()(int64_t v) const { return FeatureID(v); }
		boost::optional<FeatureID> operator()(const std::string &v) const { return FeatureID(v); }
		boost::optional<FeatureID> operator()(double v) const {
			// 3.0 is the same id as 3
			if (std::isfinite(v) && std::trunc(v) == v &&
			    v >= static_cast<double>(std::numeric_limits<int64_t>::min()) &&
			    v < static_cast<double>(std::numeric_limits<int64_t>::max()))
				return FeatureID(static_cast<int64_t>(v));
			return boost::none;
		}
		template<typename T>
		boost::optional<FeatureID> operator()(const T&) const { return boost::none; }
	};

	typedef std::vector<std::pair<double,double>> CoordinateList;
	// polygons, each a list of rings; a line or a point list is a single ring
	typedef std::vector<std::vector<CoordinateList>> GeometryParts;

	template<typename T>
	CoordinateList coordinates(const T &points) {
		CoordinateList rv;
		for (const auto &p : points) rv.emplace_back(p.x(), p.y());
		return rv;
	}

	std::vector<CoordinateList> rings(const Polygon &polygon) {
		std::vector<CoordinateList> rv;
		rv.push_back(coordinates(polygon.outer()));
		for (const auto &inner : polygon.inners()) rv.push_back(coordinates(inner));
		return rv;
	}

	GeometryParts singleRing(CoordinateList ring) {
		GeometryParts rv(1);
		rv[0].push_back(std::move(ring));
		return rv;
	}

	// The vertices of a geometry, grouped by part and ring
	struct CollectParts : boost::static_visitor<GeometryParts> {
		GeometryParts operator()(const boost::blank&) const { return GeometryParts(); }
		GeometryParts operator()(const Point &p) const {
			return singleRing(CoordinateList(1, std::make_pair(p.x(), p.y())));
		}
		GeometryParts operator()(const MultiPoint &mp) const { return singleRing(coordinates(mp)); }
		GeometryParts operator()(const Linestring &ls) const { return singleRing(coordinates(ls)); }
		GeometryParts operator()(const MultiLinestring &mls) const {
			GeometryParts rv(1);
			for (const auto &ls : mls) rv[0].push_back(coordinates(ls));
			return rv;
		}
		GeometryParts operator()(const Polygon &p) const { return GeometryParts(1, rings(p)); }
		GeometryParts operator()(const MultiPolygon &mp) const {
			GeometryParts rv;
			for (const auto &polygon : mp) rv.push_back(rings(polygon));
			return rv;
		}
	};

	bool sameGeometry(const Geometry &a, const Geometry &b) {
		if (a.which() != b.which()) return false;
		return boost::apply_visitor(CollectParts(), a) == boost::apply_visitor(CollectParts(), b);
	}
}

RawJSON::RawJSON(std::string json)
	: json(std::move(json)) {
	auto parsed = std::make_shared<rapidjson::Document>();
	parsed->Parse(this->json.data(), this->json.size());
	if (parsed->HasParseError()) {
		throw std::runtime_error("Property value is not valid JSON: " + this->json);
	}
	document = parsed;
}

Feature::Feature()
	: geometry(std::make_shared<const Geometry>()) {
}

Feature::Feature(boost::optional<FeatureID> id, Geometry geometry, PropertyMap properties)
	: id(std::move(id)),
	  geometry(std::make_shared<const Geometry>(std::move(geometry))),
	  properties(std::make_shared<const PropertyMap>(std::move(properties))) {
}

const PropertyValue* Feature::getProperty(const std::string &key) const {
	if (!properties) return nullptr;
	auto it = properties->find(key);
	if (it == properties->end()) return nullptr;
	return &it->second;
}

bool Feature::operator==(const Feature &other) const {
	if (id != other.id) return false;

	if (geometry != other.geometry) {
		Geometry none;
		if (!sameGeometry(geometry ? *geometry : none, other.geometry ? *other.geometry : none))
			return false;
	}

	if (properties == other.properties) return true;
	PropertyMap empty;
	const PropertyMap &a = properties ? *properties : empty;
	const PropertyMap &b = other.properties ? *other.properties : empty;
	return a == b;
}

boost::optional<FeatureID> toFeatureID(const PropertyValue &value) {
	return boost::apply_visitor(FeatureIDConverter(), value);
}

boost::optional<FeatureID> getFeatureId(const Feature &feature, const PromoteID &promoteId) {
	if (!promoteId) return feature.id;

	const PropertyValue *value = feature.getProperty(*promoteId);
	if (!value) return boost::none;
	return toFeatureID(*value);
}
