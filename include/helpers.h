/*! \file */
#ifndef _HELPERS_H
#define _HELPERS_H

#include <zlib.h>
#include <algorithm>
#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

// General helper routines

// Global verbose switch
extern bool verbose;

inline bool ends_with(std::string const & value, std::string const & ending) {
	if (ending.size() > value.size()) return false;
	return std::equal(ending.rbegin(), ending.rend(), value.rbegin());
}

inline std::vector<std::string> split_string(std::string &inputStr, char sep) {
	std::stringstream ss(inputStr);
	std::string item;
	std::vector<std::string> res;
	while (std::getline(ss, item, sep)) { res.push_back(item); }
	return res;
}

std::string decompress_string(const std::string& str, bool asGzip = false);

std::string compress_string(const std::string& str,
                            int compressionlevel = Z_DEFAULT_COMPRESSION,
                            bool asGzip = false);

uint64_t getFileSize(std::string filename);

// Read a whole file; .gz files are decompressed.
std::string readFile(const std::string &filename);

// Write `contents` to a file, gzipped if `compress` is set.
void writeFile(const std::string &filename, const std::string &contents, bool compress = false);

#endif //_HELPERS_H
