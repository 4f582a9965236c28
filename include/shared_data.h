/*! \file */
#ifndef _SHARED_DATA_H
#define _SHARED_DATA_H

#include <cstdint>
#include <string>
#include <vector>

#include "rapidjson/document.h"

#include "options_parser.h"
#include "source_diff.h"

///\brief Config read from JSON to control behavior of program
class Config {

public:
	std::string promoteId;          // empty: use each feature's own id
	bool coalesceDiffs;
	int maxDecimalPlaces;
	bool compressOutput;

	Config();
	virtual ~Config();

	void readConfig(rapidjson::Document &jsonConfig);
	// Command-line options override the JSON file
	void applyOptions(const OptionsParser::Options &options);

	PromoteID getPromoteId() const;
};

///\brief The source being updated, and where it goes when we're done
class SharedData {

public:
	Config &config;
	WorkingSet features;
	std::string outputFile;
	uint64_t diffsApplied;

	SharedData(Config &configIn, const std::string &outputFile);
	virtual ~SharedData();

	void load(const UpdateableGeoJSON &source);
	void apply(const SourceDiff &diff);
	void writeOutput() const;
	void writeDiff(const SourceDiff &diff, const std::string &filename) const;
};

#endif //_SHARED_DATA_H
