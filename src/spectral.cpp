#include <string>
#include <iostream>
#include <iomanip>
#include <sstream>

#include <boost/algorithm/string/case_conv.hpp>

#include "ndvitools.h"
#include "util.hpp"
#include "raster.hpp"
#include "spectral.hpp"

using namespace ndvitools;
using namespace ndvitools::util;
using namespace ndvitools::raster;
using namespace ndvitools::spectral;
using namespace ndvitools::spectral::config;

void NdviConfig::setSensor(const std::string &sensor) {
	std::string s = boost::algorithm::to_lower_copy(sensor);
	if(s == "sentinel2") {
		redBand = 4;
		nirBand = 8;
	} else if(s == "landsat8" || s == "landsat9") {
		redBand = 4;
		nirBand = 5;
	} else {
		n_argerr("Unknown sensor: " << sensor << ". Try sentinel2, landsat8 or landsat9.");
	}
}

NdviStats::NdviStats() :
	count(0),
	min(0), max(0),
	mean(0), stddev(0) {
}

bool NdviStats::empty() const {
	return count == 0;
}

void NdviStats::print(std::ostream &out) const {
	if(empty()) {
		out << "NDVI Statistics: no valid cells; statistics not computed.";
		return;
	}
	out << std::fixed << std::setprecision(4)
		<< "NDVI Statistics (" << count << " cells):"
		<< " Min: " << min
		<< "; Max: " << max
		<< "; Mean: " << mean
		<< "; Std: " << stddev;
}

template <class T>
void ndvitools::spectral::ndvi(Grid<T> &red, Grid<T> &nir, MemRaster<double> &out) {
	if(!red.sameShape(nir))
		n_throw(ShapeMismatch, "The red and NIR grids differ in shape: " 
			<< red.cols() << "x" << red.rows() << " vs " << nir.cols() << "x" << nir.rows());
	out.init(red.cols(), red.rows());
	for(size_t i = 0; i < red.size(); ++i) {
		double r = (double) red.get(i);
		double n = (double) nir.get(i);
		double d = n + r;
		out.set(i, d == 0.0 ? 0.0 : (n - r) / d);
	}
}

std::string Spectral::generateNdvi(const NdviConfig &config) {
	n_debug("generateNdvi [config]");

	config.check();

	m_stats = NdviStats();

	n_info("Reading input raster: " << config.inputFilename);
	Raster<double> src(config.inputFilename);
	RasterProfile profile = src.profile();
	n_debug(" - " << profile.cols << "x" << profile.rows << "; bands: " << profile.bands 
		<< "; type: " << GDALGetDataTypeName(profile.type) << "; bounds: " << profile.bounds().print());

	n_info("Reading red band (band " << config.redBand << ")...");
	MemRaster<double> red(profile.cols, profile.rows);
	src.setBand(config.redBand);
	src.readBlock(red);

	n_info("Reading NIR band (band " << config.nirBand << ")...");
	MemRaster<double> nir(profile.cols, profile.rows);
	src.setBand(config.nirBand);
	src.readBlock(nir);

	// Cells where either band holds the dataset's nodata value.
	MemRaster<uint8_t> mask(profile.cols, profile.rows);
	mask.fill(0);
	size_t masked = 0;
	if(profile.hasNodata) {
		double nodata = profile.typedNodata();
		for(size_t i = 0; i < mask.size(); ++i) {
			if(red.get(i) == nodata || nir.get(i) == nodata) {
				mask.set(i, 1);
				++masked;
			}
		}
	}
	n_debug(" - masked cells: " << masked);

	n_info("Calculating NDVI...");
	MemRaster<double> out;
	ndvi(red, nir, out);
	out.nodata(config.nodata);
	for(size_t i = 0; i < out.size(); ++i) {
		if(mask.get(i))
			out.set(i, config.nodata);
	}

	RasterProfile outProfile(profile);
	outProfile.bands = 1;
	outProfile.type = GDT_Float32;
	outProfile.hasNodata = true;
	outProfile.nodata = config.nodata;

	n_info("Writing NDVI raster to: " << config.outputFilename);
	// Only a file created here is removed on failure.
	bool created = false;
	try {
		Raster<double> dst(config.outputFilename, outProfile);
		created = true;
		dst.description("NDVI");
		dst.writeBlock(out);
		dst.close();
	} catch(...) {
		if(created) {
			n_debug("Removing incomplete output " << config.outputFilename);
			Util::rm(config.outputFilename);
		}
		throw;
	}

	out.computeStats(mask);
	if(out.hasStats()) {
		m_stats.count = out.count();
		m_stats.min = out.min();
		m_stats.max = out.max();
		m_stats.mean = out.mean();
		m_stats.stddev = out.stddev();
	}
	std::stringstream ss;
	m_stats.print(ss);
	n_info(ss.str());

	n_info("NDVI raster successfully created: " << config.outputFilename);
	return config.outputFilename;
}

const NdviStats &Spectral::stats() const {
	return m_stats;
}

std::string ndvitools::spectral::generateNdviRaster(const std::string &inputFilename, const std::string &outputFilename,
	int redBand, int nirBand, double nodata) {
	NdviConfig config;
	config.inputFilename = inputFilename;
	config.outputFilename = outputFilename;
	config.redBand = redBand;
	config.nirBand = nirBand;
	config.nodata = nodata;
	Spectral s;
	return s.generateNdvi(config);
}

template void ndvitools::spectral::ndvi<double>(Grid<double> &, Grid<double> &, MemRaster<double> &);
template void ndvitools::spectral::ndvi<float>(Grid<float> &, Grid<float> &, MemRaster<double> &);
template void ndvitools::spectral::ndvi<uint32_t>(Grid<uint32_t> &, Grid<uint32_t> &, MemRaster<double> &);
template void ndvitools::spectral::ndvi<int32_t>(Grid<int32_t> &, Grid<int32_t> &, MemRaster<double> &);
template void ndvitools::spectral::ndvi<uint16_t>(Grid<uint16_t> &, Grid<uint16_t> &, MemRaster<double> &);
template void ndvitools::spectral::ndvi<int16_t>(Grid<int16_t> &, Grid<int16_t> &, MemRaster<double> &);
template void ndvitools::spectral::ndvi<uint8_t>(Grid<uint8_t> &, Grid<uint8_t> &, MemRaster<double> &);
