#include <iostream>
#include "shared_data.h"
#include "geojson_writer.h"
#include "helpers.h"

using namespace std;

// *****************************************************************

Config::Config() {
	coalesceDiffs = false;
	maxDecimalPlaces = 7;
	compressOutput = false;
}

Config::~Config() { }

void Config::readConfig(rapidjson::Document &jsonConfig) {
	if (!jsonConfig.IsObject()) {
		throw runtime_error("Config file must contain a JSON object.");
	}
	if (!jsonConfig.HasMember("settings")) return;

	rapidjson::Value &settings = jsonConfig["settings"];
	if (!settings.IsObject()) {
		throw runtime_error("\"settings\" should be an object in JSON file.");
	}

	if (settings.HasMember("promote_id")) {
		if (settings["promote_id"].IsNull()) {
			promoteId.clear();
		} else if (settings["promote_id"].IsString()) {
			promoteId = settings["promote_id"].GetString();
		} else {
			throw runtime_error("\"promote_id\" should be a string or null in JSON file.");
		}
	}
	if (settings.HasMember("coalesce_diffs")) {
		if (!settings["coalesce_diffs"].IsBool()) throw runtime_error("\"coalesce_diffs\" should be true or false in JSON file.");
		coalesceDiffs = settings["coalesce_diffs"].GetBool();
	}
	if (settings.HasMember("max_decimal_places")) {
		if (!settings["max_decimal_places"].IsInt() || settings["max_decimal_places"].GetInt() < 1) {
			throw runtime_error("\"max_decimal_places\" should be a positive integer in JSON file.");
		}
		maxDecimalPlaces = settings["max_decimal_places"].GetInt();
	}
	if (settings.HasMember("compress_output")) {
		if (!settings["compress_output"].IsBool()) throw runtime_error("\"compress_output\" should be true or false in JSON file.");
		compressOutput = settings["compress_output"].GetBool();
	}
}

void Config::applyOptions(const OptionsParser::Options &options) {
	if (!options.promoteId.empty()) promoteId = options.promoteId;
	if (options.coalesce) coalesceDiffs = true;
	if (ends_with(options.outputFile, ".gz")) compressOutput = true;
}

PromoteID Config::getPromoteId() const {
	if (promoteId.empty()) return boost::none;
	return promoteId;
}

// *****************************************************************

SharedData::SharedData(Config &configIn, const std::string &outputFile)
	: config(configIn), outputFile(outputFile), diffsApplied(0) {
}

SharedData::~SharedData() { }

void SharedData::load(const UpdateableGeoJSON &source) {
	PromoteID promoteId = config.getPromoteId();
	if (!isUpdateableGeoJSON(source, promoteId)) {
		throw runtime_error("Source can't be updated incrementally: every feature needs a unique " +
			(promoteId ? "\"" + *promoteId + "\" property" : std::string("id")) + ".");
	}
	features = toUpdateable(source, promoteId);
	if (verbose) cout << "Loaded " << features.size() << " features" << endl;
}

void SharedData::apply(const SourceDiff &diff) {
	applySourceDiff(features, diff, config.getPromoteId());
	diffsApplied++;
	if (verbose) cout << "Applied diff " << diffsApplied << ", now " << features.size() << " features" << endl;
}

void SharedData::writeOutput() const {
	GeoJSONWriter writer(config.maxDecimalPlaces);
	writer.addFeatures(toFeatureCollection(features));
	writer.finalise();
	writer.toFile(outputFile, config.compressOutput);
}

void SharedData::writeDiff(const SourceDiff &diff, const std::string &filename) const {
	GeoJSONWriter writer(config.maxDecimalPlaces);
	writer.writeDiff(diff);
	writer.toFile(filename, ends_with(filename, ".gz"));
}
