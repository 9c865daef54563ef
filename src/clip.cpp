/*
 * Crops a raster to the footprint of a polygon boundary.
 */

#include <string>
#include <vector>
#include <memory>
#include <cmath>

#include <ogr_spatialref.h>

#include <geos/geom/GeometryFactory.h>
#include <geos/geom/Geometry.h>
#include <geos/geom/Point.h>
#include <geos/geom/Coordinate.h>
#include <geos/geom/Envelope.h>
#include <geos/geom/prep/PreparedGeometry.h>
#include <geos/geom/prep/PreparedGeometryFactory.h>

#include "ndvitools.h"
#include "util.hpp"
#include "raster.hpp"
#include "vector.hpp"
#include "clip.hpp"

namespace gg = geos::geom;

using namespace ndvitools;
using namespace ndvitools::util;
using namespace ndvitools::raster;
using namespace ndvitools::vector;
using namespace ndvitools::clip;
using namespace ndvitools::clip::config;

namespace {

	// Tolerance, in cells, for snapping window edges to cell boundaries.
	const double WINDOW_EPS = 1e-6;

	std::string crsName(const std::string &wkt) {
		if(wkt.empty())
			return "(none)";
		OGRSpatialReference srs;
		if(srs.importFromWkt(wkt.c_str()) != OGRERR_NONE || srs.GetName() == nullptr)
			return "(unknown)";
		return srs.GetName();
	}

} // anon

ClipWindow::ClipWindow() :
	col(0), row(0),
	cols(0), rows(0) {
}

ClipWindow ClipWindow::compute(const RasterProfile &profile, const Bounds &bounds) {
	if(!profile.isNorthUp())
		n_argerr("Rotated rasters are not supported.");

	double c0 = profile.toColF(bounds.minx());
	double c1 = profile.toColF(bounds.maxx());
	double r0 = profile.toRowF(bounds.miny());
	double r1 = profile.toRowF(bounds.maxy());

	double col0 = n_max(0.0, std::floor(n_min(c0, c1) + WINDOW_EPS));
	double col1 = n_min((double) profile.cols, std::ceil(n_max(c0, c1) - WINDOW_EPS));
	double row0 = n_max(0.0, std::floor(n_min(r0, r1) + WINDOW_EPS));
	double row1 = n_min((double) profile.rows, std::ceil(n_max(r0, r1) - WINDOW_EPS));

	if(col1 <= col0 || row1 <= row0)
		n_throw(EmptyIntersection, "The boundary " << bounds.print() << " does not overlap the raster " 
			<< profile.bounds().print());

	ClipWindow w;
	w.col = (int32_t) col0;
	w.row = (int32_t) row0;
	w.cols = (int32_t) (col1 - col0);
	w.rows = (int32_t) (row1 - row0);
	return w;
}

std::string Clipper::clip(const ClipConfig &config) {
	n_debug("clip [config]");

	config.check();

	Boundary boundary(config.boundaryFilename, config.layerName);

	Raster<double> src(config.inputFilename);
	RasterProfile profile = src.profile();

	// The boundary is brought to the raster's reference system, never
	// the reverse.
	std::unique_ptr<Boundary> reprojected;
	const Boundary *bnd = &boundary;
	if(!boundary.sameCRS(profile.projection)) {
		n_info("Reprojecting boundary from " << crsName(boundary.projection()) << " to " << crsName(profile.projection));
		reprojected = boundary.reproject(profile.projection);
		bnd = reprojected.get();
	}

	gg::GeometryFactory::Ptr gf = gg::GeometryFactory::create();
	std::unique_ptr<gg::Geometry> footprint = bnd->footprint(*gf);

	Bounds rb = profile.bounds();
	gg::Envelope renv(rb.minx(), rb.maxx(), rb.miny(), rb.maxy());
	std::unique_ptr<gg::Geometry> extent(gf->toGeometry(&renv));
	if(footprint->isEmpty() || !footprint->intersects(extent.get()))
		n_throw(EmptyIntersection, "The boundary does not overlap the raster " << rb.print());

	ClipWindow win = ClipWindow::compute(profile, bnd->bounds());
	n_debug(" - window: " << win.col << ", " << win.row << "; " << win.cols << "x" << win.rows);

	n_info("Clipping raster...");

	// Flag the cells whose centres are inside the footprint.
	MemRaster<uint8_t> inside(win.cols, win.rows);
	{
		std::unique_ptr<gg::prep::PreparedGeometry> prep(gg::prep::PreparedGeometryFactory::prepare(footprint.get()));
		for(int32_t r = 0; r < win.rows; ++r) {
			double y = profile.toCentroidY(win.row + r);
			for(int32_t c = 0; c < win.cols; ++c) {
				double x = profile.toCentroidX(win.col + c);
				std::unique_ptr<gg::Point> pt(gf->createPoint(gg::Coordinate(x, y)));
				inside.set(c, r, prep->intersects(pt.get()) ? 1 : 0);
			}
		}
	}

	double fill = profile.hasNodata ? profile.nodata : 0.0;

	// Read every band before anything is written.
	std::vector<std::unique_ptr<MemRaster<double> > > bands;
	std::vector<std::string> descs;
	for(int32_t b = 1; b <= profile.bands; ++b) {
		n_trace("Reading band " << b);
		src.setBand(b);
		std::unique_ptr<MemRaster<double> > buf(new MemRaster<double>(win.cols, win.rows));
		src.readBlock(win.col, win.row, *buf);
		for(size_t i = 0; i < buf->size(); ++i) {
			if(!inside.get(i))
				buf->set(i, fill);
		}
		bands.push_back(std::move(buf));
		descs.push_back(src.description());
	}

	RasterProfile outProfile(profile);
	outProfile.cols = win.cols;
	outProfile.rows = win.rows;
	outProfile.trans[0] = profile.toX(win.col);
	outProfile.trans[3] = profile.toY(win.row);

	bool created = false;
	try {
		Raster<double> dst(config.outputFilename, outProfile);
		created = true;
		for(int32_t b = 1; b <= outProfile.bands; ++b) {
			dst.setBand(b);
			if(!descs[b - 1].empty())
				dst.description(descs[b - 1]);
			dst.writeBlock(*bands[b - 1]);
		}
		dst.close();
	} catch(...) {
		if(created) {
			n_debug("Removing incomplete output " << config.outputFilename);
			Util::rm(config.outputFilename);
		}
		throw;
	}

	n_info("Clipped raster saved to: " << config.outputFilename);
	return config.outputFilename;
}

std::string ndvitools::clip::clipNdviByShapefile(const std::string &rasterFilename, const std::string &boundaryFilename,
	const std::string &outputFilename) {
	ClipConfig config;
	config.inputFilename = rasterFilename;
	config.boundaryFilename = boundaryFilename;
	config.outputFilename = outputFilename;
	Clipper c;
	return c.clip(config);
}
