/*! \file */

// C++ includes
#include <iostream>
#include <vector>
#include <string>
#include <stdexcept>
#include <chrono>

#include <boost/optional.hpp>

#include "rapidjson/document.h"

// Tilekeeper code
#include "helpers.h"
#include "feature.h"
#include "source_diff.h"
#include "options_parser.h"
#include "shared_data.h"
#include "geojson_processor.h"

// Namespaces
using namespace std;

/**
 *\brief The Main function is responsible for command line processing, loading the source and applying diffs.
 *
 * Diffs are applied one by one in the order given, or coalesced into a single diff
 * (--coalesce) and applied once. The updated source is written as a FeatureCollection.
 */
int main(const int argc, const char* argv[]) {
	// ----	Read command-line options
	OptionsParser::Options options;
	try {
		options = OptionsParser::parse(argc, argv);
	} catch (OptionsParser::OptionException& e) {
		cerr << e.what() << endl;
		return 1;
	}

	if (options.showHelp) { OptionsParser::showHelp(); return 0; }

	if (options.quiet) {
		// Suppress anything written to std out
		std::cout.setstate(std::ios_base::failbit);
	}

	verbose = options.verbose;

	// ----	Read JSON config

	class Config config;
	if (!options.jsonFile.empty()) {
		try {
			rapidjson::Document jsonConfig;
			std::string json = readFile(options.jsonFile);
			jsonConfig.Parse(json.data(), json.size());
			if (jsonConfig.HasParseError()) { cerr << "Invalid JSON file." << endl; return -1; }
			config.readConfig(jsonConfig);
		} catch (std::runtime_error &e) {
			cerr << "Couldn't read config: " << e.what() << endl;
			return -1;
		}
	}
	config.applyOptions(options);

	auto start = std::chrono::steady_clock::now();
	SharedData sharedData(config, options.outputFile);
	GeoJSONProcessor processor;

	try {
		// ----	Load the source

		cout << "Reading " << options.inputFile << endl;
		sharedData.load(processor.readSourceFile(options.inputFile));
		cout << "Source has " << sharedData.features.size() << " features" << endl;

		// ----	Read diffs

		vector<SourceDiff> diffs;
		for (const string &diffFile : options.diffFiles) {
			vector<SourceDiff> fileDiffs = processor.readDiffFile(diffFile);
			if (verbose) cout << "Read " << fileDiffs.size() << " diff(s) from " << diffFile << endl;
			diffs.insert(diffs.end(), fileDiffs.begin(), fileDiffs.end());
		}

		// ----	Apply them

		if (config.coalesceDiffs) {
			boost::optional<SourceDiff> pending;
			for (const SourceDiff &diff : diffs) {
				pending = mergeSourceDiffs(pending, diff, config.getPromoteId());
			}
			if (pending) {
				cout << "Coalesced " << diffs.size() << " diff(s): " << pending->remove.size() << " removals, "
				     << pending->add.size() << " additions, " << pending->update.size() << " updates" << endl;
				sharedData.apply(*pending);
			}
			if (!options.mergedDiffFile.empty()) {
				sharedData.writeDiff(pending ? *pending : SourceDiff(), options.mergedDiffFile);
				cout << "Wrote merged diff to " << options.mergedDiffFile << endl;
			}
		} else {
			for (const SourceDiff &diff : diffs) sharedData.apply(diff);
		}

		// ----	Write output

		sharedData.writeOutput();
	} catch (std::runtime_error &e) {
		cerr << e.what() << endl;
		return 1;
	}

	auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
	cout << "Wrote " << sharedData.features.size() << " features to " << options.outputFile
	     << " in " << elapsed.count() << "ms" << endl;
	return 0;
}
