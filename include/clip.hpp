#ifndef __CLIP_HPP__
#define __CLIP_HPP__

#include <string>

#include "ndvitools.h"
#include "util.hpp"
#include "raster.hpp"

namespace ndvitools {

    namespace clip {

        namespace config {

            class ClipConfig {
            public:
                std::string inputFilename;
                std::string boundaryFilename;
                std::string layerName;
                std::string outputFilename;

                void check() const {
                    if (inputFilename.empty())
                        n_argerr("The input raster must be given.");
                    if (boundaryFilename.empty())
                        n_argerr("The boundary file must be given.");
                    if (outputFilename.empty())
                        n_argerr("The output filename must be given.");
                    if (inputFilename == outputFilename)
                        n_argerr("The output file must differ from the input file.");
                }
            };

        } // config

        // A rectangular block of cells in a raster.
        class DLL_EXPORT ClipWindow {
        public:
            int32_t col;
            int32_t row;
            int32_t cols;
            int32_t rows;

            ClipWindow();

            // Compute the smallest window of whole cells in the raster that
            // covers the given bounds, truncated to the raster's extent. Edges
            // within a millionth of a cell of a cell boundary snap to it. 
            // Throws EmptyIntersection if the result has no cells. The
            // raster must be north-up.
            static ClipWindow compute(const ndvitools::raster::RasterProfile &profile, 
                const ndvitools::util::Bounds &bounds);
        };

        class DLL_EXPORT Clipper {
        public:
            // Crop the input raster to the extent of the boundary's geometries,
            // reprojecting the boundary into the raster's reference system 
            // if they differ. Cells in the window whose centres fall outside 
            // the geometries are set to nodata (or zero if the raster has 
            // none). Returns the output filename.
            std::string clip(const ndvitools::clip::config::ClipConfig &config);
        };

        std::string clipNdviByShapefile(const std::string &rasterFilename, const std::string &boundaryFilename,
            const std::string &outputFilename);

    } // clip

} // ndvitools

#endif
