/**
 * Crops a raster to the extent of the polygons in a vector file.
 */
#include <string>
#include <iostream>

#include "ndvitools.h"
#include "util.hpp"
#include "clip.hpp"

using namespace ndvitools::util;
using namespace ndvitools::clip;
using namespace ndvitools::clip::config;

void usage() {
	std::cerr << "Usage: ndviclip [options] -s <boundary file> -o <output raster> <input raster>\n"
		<< "    -s <file>        A vector file containing the clip polygons. Reprojected\n"
		<< "                     to the raster's reference system if necessary.\n"
		<< "    -o <file>        The output raster.\n"
		<< "    -l <layer>       The layer in the boundary file. Defaults to the first.\n"
		<< "    -v               Verbose messages.\n"
		<< "    -q               Only warnings and errors.\n";
}

int main(int argc, char **argv) {

	try {

		ClipConfig config;

		for(int i = 1; i < argc; ++i) {
			std::string arg(argv[i]);
			if(arg == "-s") {
				config.boundaryFilename = Util::nextArg(i, argc, argv);
			} else if(arg == "-o") {
				config.outputFilename = Util::nextArg(i, argc, argv);
			} else if(arg == "-l") {
				config.layerName = Util::nextArg(i, argc, argv);
			} else if(arg == "-v") {
				n_loglevel(N_LOG_DEBUG);
			} else if(arg == "-q") {
				n_loglevel(N_LOG_WARN);
			} else {
				config.inputFilename = arg;
			}
		}

		Clipper c;
		c.clip(config);

	} catch(const std::exception &e) {
		n_error(e.what());
		usage();
		return 1;
	}

	return 0;
}
