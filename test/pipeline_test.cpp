#undef NDEBUG

#include <iostream>
#include <cassert>
#include <cstdint>
#include <string>
#include <vector>
#include <fstream>

#include <boost/filesystem.hpp>

#include <ogr_spatialref.h>

#include "ndvitools.h"
#include "util.hpp"
#include "raster.hpp"
#include "spectral.hpp"
#include "testutil.hpp"

using namespace ndvitools;
using namespace ndvitools::util;
using namespace ndvitools::raster;
using namespace ndvitools::spectral;
using namespace ndvitools::spectral::config;
using testutil::near;

// A 4x3 UInt16 raster with three bands (green, red, NIR) and nodata 0.
RasterProfile sceneProfile() {
	RasterProfile p;
	p.cols = 4;
	p.rows = 3;
	p.bands = 3;
	p.type = GDT_UInt16;
	p.trans[0] = 300000;
	p.trans[1] = 30;
	p.trans[3] = 5000000;
	p.trans[5] = -30;
	p.projection = testutil::epsgWkt(32633);
	p.hasNodata = true;
	p.nodata = 0;
	return p;
}

const std::vector<double> GREEN = {
	500, 500, 500, 500,
	500, 500, 500, 500,
	500, 500, 500, 500
};

// Cells 1 and 6 are nodata in red; cells 6 and 11 in NIR.
const std::vector<double> RED = {
	100, 0,   300, 400,
	250, 600, 0,   120,
	90,  80,  70,  60
};

const std::vector<double> NIR = {
	300, 500, 300, 100,
	750, 200, 0,   480,
	910, 20,  130, 0
};

void test_raster_access() {
	std::cout << "Testing raster access..." << std::endl;

	std::string file = testutil::tmpName(".tif");
	RasterProfile p = sceneProfile();
	p.bands = 2;
	{
		Raster<double> r(file, p);
		assert(r.getBandNum() == 1);
		assert(r.type() == GDT_UInt16);
		assert(r.hasNodata() && r.nodata() == 0);
		r.fill(7);
		r.set(2, 1, 9);
		r.setBand(2);
		assert(r.getBandNum() == 2);
		r.fill(3);
		r.close();
		r.close();
	}
	{
		Raster<double> r(file, 1, true);
		assert(r.bandCount() == 2);
		assert(r.resolutionX() == 30 && r.resolutionY() == -30);
		Bounds b = r.bounds();
		assert(b.minx() == 300000 && b.maxx() == 300120);
		assert(b.miny() == 4999910 && b.maxy() == 5000000);
		assert(r.get(0, 0) == 7);
		assert(r.get(2, 1) == 9);
		assert(r.get((size_t) 6) == 9);
		r.set(0, 0, 11);
		r.setBand(2);
		assert(r.get(3, 2) == 3);

		bool thrown = false;
		try {
			r.setBand(3);
		} catch(const BandIndexError &e) {
			thrown = true;
		}
		assert(thrown);
	}
	{
		Raster<uint16_t> r(file);
		assert(r.get(0, 0) == 11);
		RasterProfile q = r.profile();
		assert(q.resolutionX() == 30 && q.resolutionY() == -30);
		assert(q.isNorthUp());
		assert(q.toCentroidX(0) == 300015 && q.toCentroidY(0) == 4999985);
	}

	Util::rm(file);
	std::cout << "  passed" << std::endl;
}

void test_masking_and_stats() {
	std::cout << "Testing nodata masking and statistics..." << std::endl;

	std::string in = testutil::tmpName(".tif");
	std::string out = testutil::tmpName(".tif");
	testutil::writeRaster(in, sceneProfile(), {GREEN, RED, NIR});

	Spectral s;
	NdviConfig config;
	config.inputFilename = in;
	config.outputFilename = out;
	config.redBand = 2;
	config.nirBand = 3;
	assert(s.generateNdvi(config) == out);
	assert(Util::exists(out));

	Raster<double> r(out);
	double sum = 0;
	double min = 10, max = -10;
	size_t valid = 0;
	for(size_t i = 0; i < RED.size(); ++i) {
		if(i == 1 || i == 6 || i == 11) {
			assert(r.get(i) == -9999.0);
		} else {
			double expected = (NIR[i] - RED[i]) / (NIR[i] + RED[i]);
			// Stored as Float32.
			assert(near(r.get(i), expected, 1e-6));
			sum += expected;
			min = n_min(min, expected);
			max = n_max(max, expected);
			++valid;
		}
	}

	const NdviStats &stats = s.stats();
	assert(!stats.empty());
	assert(valid == 9);
	assert(stats.count == 9);
	assert(near(stats.mean, sum / valid, 1e-12));
	assert(near(stats.min, min, 1e-12));
	assert(near(stats.max, max, 1e-12));
	assert(stats.stddev > 0);

	Util::rm(in);
	Util::rm(out);
	std::cout << "  passed" << std::endl;
}

void test_output_profile() {
	std::cout << "Testing output profile..." << std::endl;

	std::string in = testutil::tmpName(".tif");
	std::string out = testutil::tmpName(".tif");
	RasterProfile src = sceneProfile();
	testutil::writeRaster(in, src, {GREEN, RED, NIR});

	generateNdviRaster(in, out, 2, 3, -5.0);

	Raster<double> r(out);
	RasterProfile p = r.profile();
	assert(p.driver == "GTiff");
	assert(p.cols == src.cols && p.rows == src.rows);
	assert(p.bands == 1);
	assert(p.type == GDT_Float32);
	for(int i = 0; i < 6; ++i)
		assert(p.trans[i] == src.trans[i]);
	assert(p.hasNodata && p.nodata == -5.0);
	assert(r.description() == "NDVI");
	assert(r.get(1) == -5.0);

	OGRSpatialReference a, b;
	a.importFromWkt(src.projection.c_str());
	b.importFromWkt(p.projection.c_str());
	assert(a.IsSame(&b));

	Util::rm(in);
	Util::rm(out);
	std::cout << "  passed" << std::endl;
}

void test_no_nodata() {
	std::cout << "Testing input without nodata..." << std::endl;

	RasterProfile p;
	p.cols = 3;
	p.rows = 1;
	p.bands = 2;
	p.type = GDT_Float32;
	p.hasNodata = false;

	std::string in = testutil::tmpName(".tif");
	std::string out = testutil::tmpName(".tif");
	// Zeros are data here; 0/0 gives 0.
	testutil::writeRaster(in, p, {{0, 0.2, 0.1}, {0, 0.6, 0.1}});

	Spectral s;
	NdviConfig config;
	config.inputFilename = in;
	config.outputFilename = out;
	config.redBand = 1;
	config.nirBand = 2;
	s.generateNdvi(config);

	assert(s.stats().count == 3);
	Raster<double> r(out);
	assert(r.get(0) == 0.0);
	assert(near(r.get(1), 0.5, 1e-6));
	assert(r.get(2) == 0.0);

	Util::rm(in);
	Util::rm(out);
	std::cout << "  passed" << std::endl;
}

void test_all_masked() {
	std::cout << "Testing fully masked input..." << std::endl;

	RasterProfile p = sceneProfile();
	p.bands = 2;
	std::string in = testutil::tmpName(".tif");
	std::string out = testutil::tmpName(".tif");
	std::vector<double> zeros(RED.size(), 0.0);
	testutil::writeRaster(in, p, {zeros, NIR});

	Spectral s;
	NdviConfig config;
	config.inputFilename = in;
	config.outputFilename = out;
	config.redBand = 1;
	config.nirBand = 2;
	s.generateNdvi(config);

	assert(s.stats().empty());
	assert(s.stats().count == 0);
	Raster<double> r(out);
	for(size_t i = 0; i < r.size(); ++i)
		assert(r.get(i) == -9999.0);

	Util::rm(in);
	Util::rm(out);
	std::cout << "  passed" << std::endl;
}

void test_errors_leave_no_output() {
	std::cout << "Testing failures..." << std::endl;

	std::string in = testutil::tmpName(".tif");
	std::string out = testutil::tmpName(".tif");
	testutil::writeRaster(in, sceneProfile(), {GREEN, RED, NIR});

	bool thrown = false;
	try {
		generateNdviRaster(in, out, 0, 3);
	} catch(const BandIndexError &e) {
		thrown = true;
	}
	assert(thrown);
	assert(!Util::exists(out));

	thrown = false;
	try {
		generateNdviRaster(in, out, 2, 4);
	} catch(const BandIndexError &e) {
		std::cout << "  caught: " << e.what() << std::endl;
		thrown = true;
	}
	assert(thrown);
	assert(!Util::exists(out));

	thrown = false;
	try {
		generateNdviRaster(testutil::tmpName(".tif"), out, 2, 3);
	} catch(const InputNotFound &e) {
		std::cout << "  caught: " << e.what() << std::endl;
		thrown = true;
	}
	assert(thrown);
	assert(!Util::exists(out));

	std::string bad = testutil::tmpName("") + "/missing/ndvi.tif";
	thrown = false;
	try {
		generateNdviRaster(in, bad, 2, 3);
	} catch(const WriteFailure &e) {
		std::cout << "  caught: " << e.what() << std::endl;
		thrown = true;
	}
	assert(thrown);
	assert(!Util::exists(bad));

	thrown = false;
	try {
		generateNdviRaster(in, in, 2, 3);
	} catch(const std::invalid_argument &e) {
		thrown = true;
	}
	assert(thrown);

	Util::rm(in);
	std::cout << "  passed" << std::endl;
}

void test_fractional_nodata() {
	std::cout << "Testing fractional nodata on Float32 input..." << std::endl;

	// 0.1 has no exact single precision form; cells holding it must still
	// be masked.
	RasterProfile p;
	p.cols = 3;
	p.rows = 1;
	p.bands = 2;
	p.type = GDT_Float32;
	p.hasNodata = true;
	p.nodata = 0.1;
	assert(p.typedNodata() != 0.1);
	assert(p.typedNodata() == (double) (float) 0.1);

	std::string in = testutil::tmpName(".tif");
	std::string out = testutil::tmpName(".tif");
	testutil::writeRaster(in, p, {{0.1, 0.2, 0.3}, {0.5, 0.1, 0.9}});

	Spectral s;
	NdviConfig config;
	config.inputFilename = in;
	config.outputFilename = out;
	config.redBand = 1;
	config.nirBand = 2;
	s.generateNdvi(config);

	assert(s.stats().count == 1);
	assert(near(s.stats().mean, 0.5, 1e-6));
	Raster<double> r(out);
	assert(r.get(0) == -9999.0);
	assert(r.get(1) == -9999.0);
	assert(near(r.get(2), 0.5, 1e-6));

	Util::rm(in);
	Util::rm(out);
	std::cout << "  passed" << std::endl;
}

void test_existing_output_kept() {
	std::cout << "Testing that existing files are not removed on failure..." << std::endl;

	std::string in = testutil::tmpName(".tif");
	testutil::writeRaster(in, sceneProfile(), {GREEN, RED, NIR});

	// The output names an existing directory with a file in it.
	std::string dir = testutil::tmpName("");
	boost::filesystem::create_directories(dir);
	std::string keep = (boost::filesystem::path(dir) / "scene.tif").string();
	{
		std::ofstream f(keep.c_str());
		f << "keep";
	}

	bool thrown = false;
	try {
		generateNdviRaster(in, dir, 2, 3);
	} catch(const WriteFailure &e) {
		std::cout << "  caught: " << e.what() << std::endl;
		thrown = true;
	}
	assert(thrown);
	assert(boost::filesystem::is_directory(dir));
	assert(Util::exists(keep));

	// Removal is never recursive.
	assert(!Util::rm(dir));
	assert(Util::exists(keep));

	boost::filesystem::remove_all(dir);
	Util::rm(in);
	std::cout << "  passed" << std::endl;
}

void test_config() {
	std::cout << "Testing configuration..." << std::endl;

	NdviConfig config;
	config.setSensor("Sentinel2");
	assert(config.redBand == 4 && config.nirBand == 8);
	config.setSensor("landsat8");
	assert(config.redBand == 4 && config.nirBand == 5);
	config.setSensor("LANDSAT9");
	assert(config.redBand == 4 && config.nirBand == 5);

	bool thrown = false;
	try {
		config.setSensor("modis");
	} catch(const std::invalid_argument &e) {
		thrown = true;
	}
	assert(thrown);

	assert(Util::vsiPath("data/aoi.zip") == "/vsizip/data/aoi.zip");
	assert(Util::vsiPath("data/AOI.ZIP") == "/vsizip/data/AOI.ZIP");
	assert(Util::vsiPath("/vsizip/data/aoi.zip") == "/vsizip/data/aoi.zip");
	assert(Util::vsiPath("data/aoi.shp") == "data/aoi.shp");

	char prog[] = "ndvi";
	char flag[] = "-r";
	char value[] = "4";
	char *args[] = {prog, flag, value};
	int i = 1;
	assert(std::string(Util::nextArg(i, 3, args)) == "4");
	assert(i == 2);

	// A flag with no value.
	i = 1;
	thrown = false;
	try {
		Util::nextArg(i, 2, args);
	} catch(const std::invalid_argument &e) {
		thrown = true;
	}
	assert(thrown);
	assert(i == 1);

	std::cout << "  passed" << std::endl;
}

int main(int argc, char **argv) {
	n_loglevel(N_LOG_WARN);

	test_raster_access();
	test_masking_and_stats();
	test_output_profile();
	test_no_nodata();
	test_all_masked();
	test_errors_leave_no_output();
	test_fractional_nodata();
	test_existing_output_kept();
	test_config();

	std::cout << "All pipeline tests passed." << std::endl;
	return 0;
}
