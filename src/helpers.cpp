#include <string>
#include <stdexcept>
#include <algorithm>
#include <iostream>
#include <fstream>
#include <sstream>
#include <cstring>

#include <sys/stat.h>
#include "helpers.h"

#ifdef _MSC_VER
#define stat64 __stat64
#endif

#if defined(__APPLE__)
#define stat64 stat
#endif

#define MOD_GZIP_ZLIB_WINDOWSIZE 15
#define MOD_GZIP_ZLIB_CFACTOR 9
#define MOD_GZIP_ZLIB_BSIZE 8096

using namespace std;

bool verbose = false;

// Compress a STL string using zlib with given compression level, and return the binary data
std::string compress_string(const std::string& str,
                            int compressionlevel,
                            bool asGzip) {
	z_stream zs;                        // z_stream is zlib's control structure
	memset(&zs, 0, sizeof(zs));

	if (asGzip) {
		if (deflateInit2(&zs, compressionlevel, Z_DEFLATED,
		                 MOD_GZIP_ZLIB_WINDOWSIZE + 16, MOD_GZIP_ZLIB_CFACTOR, Z_DEFAULT_STRATEGY) != Z_OK)
			throw runtime_error("deflateInit2 failed while compressing.");
	} else {
		if (deflateInit(&zs, compressionlevel) != Z_OK)
			throw runtime_error("deflateInit failed while compressing.");
	}

	zs.next_in = (Bytef*)str.data();
	zs.avail_in = str.size();           // set the z_stream's input

	int ret;
	char outbuffer[32768];
	std::string outstring;

	// retrieve the compressed bytes blockwise
	do {
		zs.next_out = reinterpret_cast<Bytef*>(outbuffer);
		zs.avail_out = sizeof(outbuffer);

		ret = deflate(&zs, Z_FINISH);

		if (outstring.size() < zs.total_out) {
			// append the block to the output string
			outstring.append(outbuffer, zs.total_out - outstring.size());
		}
	} while (ret == Z_OK);

	deflateEnd(&zs);

	if (ret != Z_STREAM_END) {          // an error occurred that was not EOF
		std::ostringstream oss;
		oss << "Exception during zlib compression: (" << ret << ") " << (zs.msg ? zs.msg : "");
		throw runtime_error(oss.str());
	}

	return outstring;
}

// Decompress an STL string using zlib and return the original data.
std::string decompress_string(const std::string& str, bool asGzip) {
	z_stream zs;                        // z_stream is zlib's control structure
	memset(&zs, 0, sizeof(zs));

	if (asGzip) {
		if (inflateInit2(&zs, 16+MAX_WBITS) != Z_OK)
			throw runtime_error("inflateInit2 failed while decompressing.");
	} else {
		if (inflateInit(&zs) != Z_OK)
			throw runtime_error("inflateInit failed while decompressing.");
	}

	zs.next_in = (Bytef*)str.data();
	zs.avail_in = str.size();

	int ret;
	char outbuffer[32768];
	std::string outstring;

	// get the decompressed bytes blockwise using repeated calls to inflate
	do {
		zs.next_out = reinterpret_cast<Bytef*>(outbuffer);
		zs.avail_out = sizeof(outbuffer);

		ret = inflate(&zs, 0);

		if (outstring.size() < zs.total_out) {
			outstring.append(outbuffer, zs.total_out - outstring.size());
		}

	} while (ret == Z_OK);

	inflateEnd(&zs);

	if (ret != Z_STREAM_END) {          // an error occurred that was not EOF
		std::ostringstream oss;
		oss << "Exception during zlib decompression: (" << ret << ") " << (zs.msg ? zs.msg : "");
		throw runtime_error(oss.str());
	}

	return outstring;
}

uint64_t getFileSize(std::string filename) {
	struct stat64 statBuf;
	int rc = stat64(filename.c_str(), &statBuf);

	if (rc == 0) return statBuf.st_size;

	throw std::runtime_error("unable to stat " + filename);
}

std::string readFile(const std::string &filename) {
	const uint64_t size = getFileSize(filename);
	ifstream infile(filename, ios::in | ios::binary);
	if (!infile) throw runtime_error("Couldn't open " + filename);

	std::string contents;
	contents.resize(size);
	if (size > 0 && !infile.read(&contents[0], size))
		throw runtime_error("Couldn't read " + filename);

	if (ends_with(filename, ".gz") || ends_with(filename, ".GZ"))
		return decompress_string(contents, true);
	return contents;
}

void writeFile(const std::string &filename, const std::string &contents, bool compress) {
	ofstream outfile(filename, ios::out | ios::binary | ios::trunc);
	if (!outfile) throw runtime_error("Couldn't open " + filename + " for writing");

	if (compress) {
		std::string compressed = compress_string(contents, Z_DEFAULT_COMPRESSION, true);
		outfile.write(compressed.data(), compressed.size());
	} else {
		outfile.write(contents.data(), contents.size());
	}
	if (!outfile) throw runtime_error("Couldn't write " + filename);
}
