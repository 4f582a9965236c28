#include "options_parser.h"

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include "helpers.h"

#ifndef TK_VERSION
#define TK_VERSION (version not set)
#endif
#define STR1(x)  #x
#define STR(x)  STR1(x)

using namespace std;
namespace po = boost::program_options;

po::options_description getParser(OptionsParser::Options& options) {
	po::options_description desc("tilekeeper " STR(TK_VERSION) "\nApply incremental diffs to a GeoJSON source\n\nAvailable options");
	desc.add_options()
		("help",                                                                    "show help message")
		("input",      po::value< string >(&options.inputFile),                     "source .geojson file (may be gzipped)")
		("diff",       po::value< vector<string> >(&options.diffFiles),             "diff .json file, applied in the order given")
		("output",     po::value< string >(&options.outputFile),                    "target .geojson file")
		("merged-diff",po::value< string >(&options.mergedDiffFile),                "write the coalesced diff to this file")
		("coalesce",   po::bool_switch(&options.coalesce),                          "merge all diffs into one before applying")
		("promote-id", po::value< string >(&options.promoteId),                     "property to use as the feature id")
		("config",     po::value< string >(&options.jsonFile),                      "config JSON file")
		("quiet",      po::bool_switch(&options.quiet),                             "quiet, suppress standard output")
		("verbose",    po::bool_switch(&options.verbose),                           "verbose error output");
	return desc;
}

void OptionsParser::showHelp() {
	Options options;
	auto parser = getParser(options);
	std::cout << parser << std::endl;
}

OptionsParser::Options OptionsParser::parse(const int argc, const char* argv[]) {
	Options options;

	po::options_description desc = getParser(options);
	po::positional_options_description p;
	p.add("input", 1).add("output", 1);

	po::variables_map vm;
	try {
		po::store(po::command_line_parser(argc, argv).options(desc).positional(p).run(), vm);
	} catch (const po::unknown_option& ex) {
		throw OptionException{"Unknown option: " + ex.get_option_name()};
	} catch (const po::error& ex) {
		throw OptionException{ex.what()};
	}
	po::notify(vm);

	if (vm.count("help")) {
		options.showHelp = true;
		return options;
	}
	if (vm.count("input") == 0) {
		throw OptionException{ "You must specify an input file. Run with --help to find out more." };
	}
	if (vm.count("output") == 0) {
		throw OptionException{ "You must specify an output file. Run with --help to find out more." };
	}

	// A merged diff only exists when diffs are coalesced
	if (!options.mergedDiffFile.empty()) options.coalesce = true;

	// ---- Check files
	if (!boost::filesystem::exists(options.inputFile)) {
		throw OptionException{ "Couldn't open input: " + options.inputFile };
	}
	for (const auto& diffFile : options.diffFiles) {
		if (!boost::filesystem::exists(diffFile)) {
			throw OptionException{ "Couldn't open diff: " + diffFile };
		}
	}
	if (!options.jsonFile.empty() && !boost::filesystem::exists(options.jsonFile)) {
		throw OptionException{ "Couldn't open .json config: " + options.jsonFile };
	}

	return options;
}
