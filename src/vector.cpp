#include <string>
#include <vector>
#include <memory>
#include <sstream>

#include <gdal_priv.h>
#include <ogr_spatialref.h>
#include <ogr_geometry.h>
#include <ogrsf_frmts.h>
#include <cpl_error.h>

#include <geos/geom/GeometryFactory.h>
#include <geos/geom/Geometry.h>
#include <geos/geom/GeometryCollection.h>
#include <geos/io/WKBReader.h>

#include "ndvitools.h"
#include "util.hpp"
#include "vector.hpp"

namespace gg = geos::geom;

using namespace ndvitools;
using namespace ndvitools::util;
using namespace ndvitools::vector;

namespace {

	// Closes a GDAL dataset when it goes out of scope.
	struct GDALDatasetDeleter {
		void operator()(GDALDataset *ds) const {
			if(ds)
				GDALClose(ds);
		}
	};

	typedef std::unique_ptr<GDALDataset, GDALDatasetDeleter> GDALDatasetPtr;

	struct CTDeleter {
		void operator()(OGRCoordinateTransformation *ct) const {
			OGRCoordinateTransformation::DestroyCT(ct);
		}
	};

} // anon

Boundary::Boundary() :
	m_hasSrs(false) {
}

Boundary::Boundary(const std::string &filename, const std::string &layerName) :
	m_hasSrs(false) {

	if(filename.empty())
		n_argerr("A boundary file is required.");

	std::string path = Util::vsiPath(filename);
	n_debug("Boundary open: " << path << "; layer: " << layerName);

	GDALAllRegister();
	GDALDatasetPtr ds((GDALDataset *) GDALOpenEx(path.c_str(), GDAL_OF_VECTOR | GDAL_OF_READONLY, 
		nullptr, nullptr, nullptr));
	if(!ds)
		n_throw(InputNotFound, "Couldn't open boundary " << filename << ": " << CPLGetLastErrorMsg());

	OGRLayer *layer;
	if(layerName.empty()) {
		layer = ds->GetLayerCount() > 0 ? ds->GetLayer(0) : nullptr;
	} else {
		layer = ds->GetLayerByName(layerName.c_str());
	}
	if(layer == nullptr)
		n_throw(InputNotFound, "Couldn't get layer " << (layerName.empty() ? "0" : layerName) << " from " << filename);

	const OGRSpatialReference *srs = layer->GetSpatialRef();
	if(srs) {
		m_srs = *srs;
		m_srs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
		m_hasSrs = true;
	}

	layer->ResetReading();
	OGRFeature *f;
	while((f = layer->GetNextFeature()) != nullptr) {
		OGRFeatureUniquePtr feat(f);
		OGRGeometry *g = feat->StealGeometry();
		if(g == nullptr)
			continue;
		OGRGeometryUniquePtr geom(g);
		OGRwkbGeometryType type = wkbFlatten(geom->getGeometryType());
		if(type != wkbPolygon && type != wkbMultiPolygon)
			n_argerr("Geometry must be polygon or multipolygon; found " << OGRGeometryTypeToName(type) 
				<< " in feature " << feat->GetFID() << ".");
		m_geoms.push_back(std::move(geom));
	}

	n_debug("Loaded " << m_geoms.size() << " geometries from " << filename);
}

size_t Boundary::size() const {
	return m_geoms.size();
}

const OGRGeometry &Boundary::geometry(size_t idx) const {
	if(idx >= m_geoms.size())
		n_argerr("Geometry index out of bounds: " << idx);
	return *m_geoms[idx];
}

bool Boundary::hasCRS() const {
	return m_hasSrs;
}

std::string Boundary::projection() const {
	if(!m_hasSrs)
		return std::string();
	char *wkt = nullptr;
	m_srs.exportToWkt(&wkt);
	std::string proj(wkt ? wkt : "");
	CPLFree(wkt);
	return proj;
}

bool Boundary::sameCRS(const std::string &wkt) const {
	if(wkt.empty() || !m_hasSrs)
		return wkt.empty() && !m_hasSrs;
	OGRSpatialReference other;
	if(other.importFromWkt(wkt.c_str()) != OGRERR_NONE)
		return false;
	other.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
	return m_srs.IsSame(&other) != 0;
}

std::unique_ptr<Boundary> Boundary::reproject(const std::string &wkt) const {
	if(!m_hasSrs)
		n_throw(CRSMismatchUnresolved, "The boundary has no coordinate reference system; it can't be reprojected.");
	if(wkt.empty())
		n_throw(CRSMismatchUnresolved, "The target has no coordinate reference system; the boundary can't be reprojected.");

	OGRSpatialReference dst;
	if(dst.importFromWkt(wkt.c_str()) != OGRERR_NONE)
		n_throw(CRSMismatchUnresolved, "Failed to read the target reference system.");
	dst.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);

	std::unique_ptr<OGRCoordinateTransformation, CTDeleter> ct(OGRCreateCoordinateTransformation(&m_srs, &dst));
	if(!ct)
		n_throw(CRSMismatchUnresolved, "Failed to create a transformation: " << CPLGetLastErrorMsg());

	std::unique_ptr<Boundary> out(new Boundary());
	out->m_srs = dst;
	out->m_hasSrs = true;
	for(const OGRGeometryUniquePtr &geom : m_geoms) {
		OGRGeometryUniquePtr g(geom->clone());
		if(g->transform(ct.get()) != OGRERR_NONE)
			n_throw(CRSMismatchUnresolved, "Failed to transform a geometry: " << CPLGetLastErrorMsg());
		out->m_geoms.push_back(std::move(g));
	}
	return out;
}

Bounds Boundary::bounds() const {
	Bounds b;
	b.collapse();
	for(const OGRGeometryUniquePtr &geom : m_geoms) {
		OGREnvelope env;
		geom->getEnvelope(&env);
		b.extend(env.MinX, env.MinY);
		b.extend(env.MaxX, env.MaxY);
	}
	return b;
}

std::unique_ptr<gg::Geometry> Boundary::footprint(const gg::GeometryFactory &gf) const {
	if(m_geoms.empty())
		n_throw(EmptyIntersection, "No geometries were found.");

	geos::io::WKBReader reader(gf);
	std::vector<std::unique_ptr<gg::Geometry> > parts;
	for(const OGRGeometryUniquePtr &geom : m_geoms) {
		OGRGeometryUniquePtr flat(geom->clone());
		flat->flattenTo2D();
		std::vector<unsigned char> wkb(flat->WkbSize());
		if(flat->exportToWkb(wkbNDR, wkb.data()) != OGRERR_NONE)
			n_runerr("Failed to export a geometry to WKB.");
		std::istringstream in(std::string(wkb.begin(), wkb.end()));
		parts.push_back(reader.read(in));
	}

	std::unique_ptr<gg::GeometryCollection> coll(gf.createGeometryCollection(std::move(parts)));
	return coll->Union();
}
