/**
 * Computes NDVI from the red and near-infrared bands of a raster and
 * optionally clips the result to a polygon boundary.
 */
#include <string>
#include <iostream>
#include <cstdlib>
#include <vector>

#include <boost/filesystem.hpp>

#include "ndvitools.h"
#include "util.hpp"
#include "spectral.hpp"
#include "clip.hpp"

using namespace ndvitools::util;
using namespace ndvitools::spectral;
using namespace ndvitools::spectral::config;
using namespace ndvitools::clip;
using namespace ndvitools::clip::config;

void usage() {
	std::cerr << "Usage: ndvi [options] <input raster> <output raster>\n"
		<< "    -r <band>        The red band (1-based).\n"
		<< "    -n <band>        The near-infrared band (1-based).\n"
		<< "    -nd <value>      The nodata value for the output. Default -9999.\n"
		<< "    -sensor <name>   Use the band numbers of a known sensor: sentinel2\n"
		<< "                     (red 4, NIR 8), landsat8 or landsat9 (red 4, NIR 5).\n"
		<< "                     -r and -n override the preset.\n"
		<< "    -c <file>        Clip the NDVI raster to the polygons in this vector\n"
		<< "                     file (shapefile, GeoJSON or zipped shapefile.)\n"
		<< "    -co <file>       The clipped output. Defaults to the output file name\n"
		<< "                     with _clipped appended to the stem.\n"
		<< "    -l <layer>       The layer in the clip file. Defaults to the first.\n"
		<< "    -v               Verbose messages.\n"
		<< "    -q               Only warnings and errors.\n";
}

std::string clippedName(const std::string &filename) {
	boost::filesystem::path p(filename);
	boost::filesystem::path name(p.stem().string() + "_clipped" + p.extension().string());
	return (p.parent_path() / name).string();
}

int main(int argc, char **argv) {

	try {

		NdviConfig config;
		ClipConfig clipConfig;
		std::string sensor;
		int red = 0;
		int nir = 0;
		std::vector<std::string> files;

		for(int i = 1; i < argc; ++i) {
			std::string arg(argv[i]);
			if(arg == "-r") {
				red = atoi(Util::nextArg(i, argc, argv));
			} else if(arg == "-n") {
				nir = atoi(Util::nextArg(i, argc, argv));
			} else if(arg == "-nd") {
				config.nodata = atof(Util::nextArg(i, argc, argv));
			} else if(arg == "-sensor") {
				sensor = Util::nextArg(i, argc, argv);
			} else if(arg == "-c") {
				clipConfig.boundaryFilename = Util::nextArg(i, argc, argv);
			} else if(arg == "-co") {
				clipConfig.outputFilename = Util::nextArg(i, argc, argv);
			} else if(arg == "-l") {
				clipConfig.layerName = Util::nextArg(i, argc, argv);
			} else if(arg == "-v") {
				n_loglevel(N_LOG_DEBUG);
			} else if(arg == "-q") {
				n_loglevel(N_LOG_WARN);
			} else {
				files.push_back(arg);
			}
		}

		if(files.size() != 2)
			n_argerr("An input and an output file are required.");

		config.inputFilename = files[0];
		config.outputFilename = files[1];
		if(!sensor.empty())
			config.setSensor(sensor);
		if(red > 0)
			config.redBand = red;
		if(nir > 0)
			config.nirBand = nir;

		Spectral s;
		std::string output = s.generateNdvi(config);

		if(!clipConfig.boundaryFilename.empty()) {
			clipConfig.inputFilename = output;
			if(clipConfig.outputFilename.empty())
				clipConfig.outputFilename = clippedName(output);
			Clipper c;
			c.clip(clipConfig);
		}

	} catch(const std::exception &e) {
		n_error(e.what());
		usage();
		return 1;
	}

	return 0;
}
