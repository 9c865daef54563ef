#ifndef __SPECTRAL_HPP__
#define __SPECTRAL_HPP__

#include <string>
#include <ostream>

#include "ndvitools.h"
#include "raster.hpp"

namespace ndvitools {

    namespace spectral {

        namespace config {

            class NdviConfig {
            public:
                std::string inputFilename;
                std::string outputFilename;
                int redBand;
                int nirBand;
                double nodata;

                NdviConfig() :
                redBand(0),
                nirBand(0),
                nodata(-9999.0) {
                }

                // Set the red and NIR bands for a known sensor: sentinel2,
                // landsat8 or landsat9. Case-insensitive.
                void setSensor(const std::string &sensor);

                void check() const {
                    if (inputFilename.empty())
                        n_argerr("The input filename must be given.");
                    if (outputFilename.empty())
                        n_argerr("The output filename must be given.");
                    if (inputFilename == outputFilename)
                        n_argerr("The output file must differ from the input file.");
                    if (redBand < 1)
                        n_throw(BandIndexError, "The red band must be 1 or greater; got " << redBand << ".");
                    if (nirBand < 1)
                        n_throw(BandIndexError, "The NIR band must be 1 or greater; got " << nirBand << ".");
                    if (redBand == nirBand)
                        n_warn("The red and NIR bands are the same; NDVI will be zero everywhere.");
                }

            };

        } // config

        // Statistics over the valid (unmasked) cells of an NDVI grid.
        class DLL_EXPORT NdviStats {
        public:
            size_t count;
            double min;
            double max;
            double mean;
            double stddev;

            NdviStats();

            // True if there were no valid cells, in which case the other
            // values are meaningless.
            bool empty() const;

            void print(std::ostream &out) const;
        };

        // Compute NDVI = (nir - red) / (nir + red) for each cell. Values are
        // widened to double before any arithmetic. Where nir + red is zero,
        // the result is zero. The output is resized to match the inputs.
        // Throws ShapeMismatch if red and nir differ in shape.
        template <class T>
        void ndvi(ndvitools::raster::Grid<T> &red, ndvitools::raster::Grid<T> &nir, 
            ndvitools::raster::MemRaster<double> &out);

        class DLL_EXPORT Spectral {
        private:
            NdviStats m_stats;

        public:
            // Read the red and NIR bands from the input, compute NDVI, mask
            // cells where either band is the input's nodata value and write a
            // single-band Float32 raster. Returns the output filename.
            std::string generateNdvi(const ndvitools::spectral::config::NdviConfig &config);

            // The statistics from the last call to generateNdvi.
            const NdviStats &stats() const;

        };

        std::string generateNdviRaster(const std::string &inputFilename, const std::string &outputFilename,
            int redBand, int nirBand, double nodata = -9999.0);

    } // spectral

} // ndvitools


#endif
