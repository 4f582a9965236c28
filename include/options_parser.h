#ifndef OPTIONS_PARSER_H
#define OPTIONS_PARSER_H

#include <exception>
#include <string>
#include <vector>

namespace OptionsParser {
	struct OptionException : std::exception {
		OptionException(std::string message): message(message) {}

		/// Returns the explanatory string.
		const char* what() const noexcept override {
				return message.data();
		}

		private:
			std::string message;
	};

	struct Options {
		std::string inputFile;
		std::vector<std::string> diffFiles;
		std::string outputFile;
		std::string mergedDiffFile;
		std::string jsonFile;
		// empty unless --promote-id was given
		std::string promoteId;

		bool coalesce = false;
		bool showHelp = false;
		bool verbose = false;
		bool quiet = false;
	};

	Options parse(const int argc, const char* argv[]);
	void showHelp();
};

#endif
