/*
 * vector.hpp
 *
 * Polygon boundaries read through OGR, and a simple single-layer
 * polygon writer.
 */

#ifndef VECTOR_HPP_
#define VECTOR_HPP_

#include <string>
#include <vector>
#include <memory>
#include <utility>

#include <geos/geom/GeometryFactory.h>
#include <geos/geom/Geometry.h>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/case_conv.hpp>

#include <gdal_priv.h>
#include <ogr_spatialref.h>
#include <ogr_geometry.h>
#include <ogrsf_frmts.h>

#include "ndvitools.h"
#include "util.hpp"

namespace ndvitools {

	namespace vector {

		/**
		 * One or more polygon geometries and the reference system they
		 * are expressed in. Attributes are not retained. Instances are not
		 * modified after loading; reprojection produces a new Boundary.
		 */
		class DLL_EXPORT Boundary {
		private:
			std::vector<OGRGeometryUniquePtr> m_geoms;
			OGRSpatialReference m_srs;
			bool m_hasSrs;

			Boundary();

		public:
			/**
			 * Load the polygons from the named layer of the given file, or
			 * the first layer if no name is given. Zip archives are read through
			 * GDAL's virtual file system. Throws InputNotFound if the file or 
			 * layer can't be opened, and invalid_argument if a geometry is not 
			 * a polygon or multipolygon.
			 */
			Boundary(const std::string &filename, const std::string &layerName = std::string());

			Boundary(const Boundary &) = delete;

			Boundary &operator=(const Boundary &) = delete;

			/** The number of geometries. */
			size_t size() const;

			const OGRGeometry &geometry(size_t idx) const;

			/** True if the boundary has a reference system. */
			bool hasCRS() const;

			/** The reference system as WKT, or an empty string. */
			std::string projection() const;

			/**
			 * True if the given WKT describes the same reference system as this
			 * boundary's. Two missing reference systems are the same.
			 */
			bool sameCRS(const std::string &wkt) const;

			/**
			 * Return a copy of this boundary with the geometries transformed into
			 * the reference system given as WKT. Throws CRSMismatchUnresolved if
			 * either side lacks a reference system or the transformation fails.
			 */
			std::unique_ptr<Boundary> reproject(const std::string &wkt) const;

			/** The envelope of all geometries. */
			ndvitools::util::Bounds bounds() const;

			/**
			 * The union of all geometries as a GEOS geometry built by the given
			 * factory.
			 */
			std::unique_ptr<geos::geom::Geometry> footprint(const geos::geom::GeometryFactory &gf) const;

		};

		/**
		 * Represents a vector file with a single polygon layer that allows the 
		 * caller to easily create and add geometries with an ID attribute.
		 * The file is closed when the instance is destroyed.
		 */
		class Vector {
		protected:
			GDALDataset *m_ds;
			OGRLayer *m_layer;

			void makePolygon(const std::vector<std::pair<double, double> > &ring, OGRPolygon &poly) const {
				if(ring.size() < 3)
					n_argerr("A polygon ring needs at least three vertices.");
				OGRLinearRing lr;
				for(const auto &pt : ring)
					lr.addPoint(pt.first, pt.second);
				lr.closeRings();
				poly.addRing(&lr);
			}

			void addGeometry(const OGRGeometry &geom, int id) {
				OGRFeatureUniquePtr feat(OGRFeature::CreateFeature(m_layer->GetLayerDefn()));
				feat->SetField("id", id);
				feat->SetGeometry(&geom);
				if(m_layer->CreateFeature(feat.get()) != OGRERR_NONE)
					n_throw(WriteFailure, "Failed to add feature " << id << ".");
			}

		public:
			/**
			 * Construct a Vector with the given output file name and projection
			 * information. The projection may be WKT or an EPSG code in the form
			 * "epsg:<code>".
			 */
			Vector(const std::string &filename, const std::string &proj, 
				const std::string &vecType = std::string("ESRI Shapefile")) :
				m_ds(nullptr), m_layer(nullptr) {

				using namespace boost::algorithm;

				GDALAllRegister();

				OGRSpatialReference gproj;
				bool hasProj = false;
				if(!proj.empty()) {
					std::string chunk = proj.substr(0, 5);
					to_lower(chunk);
					OGRErr err;
					if(starts_with(chunk, "epsg:")) {
						err = gproj.importFromEPSG(atoi(proj.substr(5).c_str()));
					} else {
						err = gproj.importFromWkt(proj.c_str());
					}
					if(err != OGRERR_NONE)
						n_argerr("Invalid projection: " << proj);
					gproj.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
					hasProj = true;
				}

				GDALDriver *drv = GetGDALDriverManager()->GetDriverByName(vecType.c_str());
				if(!drv)
					n_throw(WriteFailure, "Failed to load the " << vecType << " driver.");
				if(!(m_ds = drv->Create(filename.c_str(), 0, 0, 0, GDT_Unknown, nullptr)))
					n_throw(WriteFailure, "Failed to create vector data source " << filename << ".");
				if(!(m_layer = m_ds->CreateLayer("boundary", hasProj ? &gproj : nullptr, wkbPolygon, nullptr))) {
					GDALClose(m_ds);
					n_throw(WriteFailure, "Failed to create vector layer in " << filename << ".");
				}
				OGRFieldDefn field("id", OFTInteger);
				if(m_layer->CreateField(&field) != OGRERR_NONE) {
					GDALClose(m_ds);
					n_throw(WriteFailure, "Failed to create the id field in " << filename << ".");
				}
			}

			Vector(const Vector &) = delete;

			Vector &operator=(const Vector &) = delete;

			/**
			 * Add a polygon with a single ring given as x/y pairs. The ring is
			 * closed if the last vertex differs from the first.
			 */
			void addPolygon(const std::vector<std::pair<double, double> > &ring, int id = 0) {
				OGRPolygon poly;
				makePolygon(ring, poly);
				addGeometry(poly, id);
			}

			/**
			 * Add a multipolygon with one single-ring part per entry.
			 */
			void addMultiPolygon(const std::vector<std::vector<std::pair<double, double> > > &rings, int id = 0) {
				if(rings.empty())
					n_argerr("A multipolygon needs at least one part.");
				OGRMultiPolygon multi;
				for(const auto &ring : rings) {
					OGRPolygon poly;
					makePolygon(ring, poly);
					multi.addGeometry(&poly);
				}
				addGeometry(multi, id);
			}

			~Vector() {
				if(m_ds)
					GDALClose(m_ds);
			}
		};

	} // vector

} // ndvitools

#endif
