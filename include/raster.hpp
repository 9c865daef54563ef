/**
 * raster.hpp
 *
 * Grids held in memory or backed by a GDAL band, and the
 * dataset-level metadata shared by every band of a raster.
 */

#ifndef INCLUDE_RASTER_HPP_
#define INCLUDE_RASTER_HPP_

#include <string>
#include <cstdint>

#include <gdal_priv.h>

#include "ndvitools.h"
#include "util.hpp"

namespace ndvitools {

    namespace raster {

        // Dataset-level properties of a raster: everything needed to
        // create a new dataset that lines up with an existing one.
        class DLL_EXPORT RasterProfile {
        public:
            std::string driver;     // GDAL driver short name.
            int32_t cols;
            int32_t rows;
            int32_t bands;
            GDALDataType type;
            double trans[6];        // GDAL geotransform.
            std::string projection; // WKT; empty if the raster has no CRS.
            bool hasNodata;
            double nodata;

            RasterProfile();

            double resolutionX() const;

            double resolutionY() const;

            // True if the transform has no rotation terms.
            bool isNorthUp() const;

            // Returns the x-coordinate of the left edge of the given column.
            double toX(int32_t col) const;

            // Returns the y-coordinate of the top edge of the given row.
            double toY(int32_t row) const;

            double toCentroidX(int32_t col) const;

            double toCentroidY(int32_t row) const;

            // Fractional column containing x.
            double toColF(double x) const;

            // Fractional row containing y.
            double toRowF(double y) const;

            // The raster's extent in map units.
            ndvitools::util::Bounds bounds() const;

            // The nodata value as it is stored in a cell of this raster's
            // pixel type, e.g. rounded to single precision for Float32.
            double typedNodata() const;
        };

        // Abstract class for grids (rasters).

        template <class T>
        class DLL_EXPORT Grid {
        protected:
            double m_min;
            double m_max;
            double m_mean;
            double m_stddev;
            double m_variance;
            double m_sum;
            size_t m_count;
            bool m_stats;

        public:
            Grid();

            virtual ~Grid() {}

            // Return the number of rows in the dataset.
            virtual int32_t rows() const = 0;

            // Return the number of columns in the dataset.
            virtual int32_t cols() const = 0;

            // Return the number of cells in the dataset.
            virtual size_t size() const = 0;

            // Fill the entire dataset with the given value.
            virtual void fill(const T value) = 0;

            // Return a pointer to an in-memory grid of the raster data.
            // Throw an exception if this is not possible.
            virtual T *grid() = 0;

            // Returns true if this class has a complete, in-memory
            // grid that can be manipulated.
            virtual bool hasGrid() const = 0;

            // Return the value held at the given index in the grid.
            // Not const because the get operation might imply (e.g.) an I/O
            // operation in the subclass.
            virtual T get(size_t idx) = 0;

            virtual T get(int32_t col, int32_t row) = 0;

            virtual void set(size_t idx, const T value) = 0;

            virtual void set(int32_t col, int32_t row, const T value) = 0;

            virtual bool has(int32_t col, int32_t row) const = 0;

            virtual bool has(size_t idx) const = 0;

            virtual T nodata() const = 0;

            virtual void nodata(const T nodata) = 0;

            // Read a region of this grid, starting at col/row, into the given
            // block. The region is the size of the block, truncated at the
            // edges of this grid.
            virtual void readBlock(int32_t col, int32_t row, Grid<T> &block) = 0;

            virtual void readBlock(Grid<T> &block) = 0;

            // Write the given block into this grid, starting at col/row.
            virtual void writeBlock(int32_t col, int32_t row, Grid<T> &block) = 0;

            virtual void writeBlock(Grid<T> &block) = 0;

            // True if the other grid has the same number of rows and columns.
            template <class U>
            bool sameShape(const Grid<U> &other) const {
                return cols() == other.cols() && rows() == other.rows();
            }

            // Computes descriptive statistics for the cells whose mask value
            // is zero. Masked cells are skipped entirely. If every cell is 
            // masked, the count is zero and no statistics are available.
            void computeStats(Grid<uint8_t> &mask);

            // True if statistics were computed over at least one cell.
            bool hasStats() const;

            // The number of cells that contributed to the statistics.
            size_t count() const;

            double min() const;

            double max() const;

            double mean() const;

            // Population standard deviation.
            double stddev() const;

            double variance() const;

        };

        // A convenience class for managing a grid of values.
        // Handles allocation and deallocation of memory.

        template <class T>
        class DLL_EXPORT MemRaster : public Grid<T> {
        private:
            T *m_grid;
            int32_t m_cols;
            int32_t m_rows;
            T m_nodata;

            // Checks if the grid has been initialized. Throws exception otherwise.
            void checkInit() const;

            void freeMem();

        public:
            MemRaster();

            MemRaster(int32_t cols, int32_t rows);

            template <class U>
            MemRaster(Grid<U> &tpl) : MemRaster() {
                init(tpl.cols(), tpl.rows());
            }

            MemRaster(const MemRaster<T> &) = delete;

            MemRaster<T> &operator=(const MemRaster<T> &) = delete;

            ~MemRaster();

            // Return a pointer to the allocated memory.
            T *grid();

            bool hasGrid() const;

            int32_t rows() const;

            int32_t cols() const;

            size_t size() const;

            template <class U>
            void init(Grid<U> &tpl) {
                init(tpl.cols(), tpl.rows());
            }

            // Initialize with the given number of cols and rows.
            // (Re)allocates memory for the internal grid.
            void init(int32_t cols, int32_t rows);

            void fill(const T value);

            T get(size_t idx);

            T get(int32_t col, int32_t row);

            void set(int32_t col, int32_t row, const T value);

            void set(size_t idx, const T value);

            bool has(int32_t col, int32_t row) const;

            bool has(size_t idx) const;

            T nodata() const;

            void nodata(const T nodata);

            void readBlock(int32_t col, int32_t row, Grid<T> &block);

            void readBlock(Grid<T> &block);

            void writeBlock(int32_t col, int32_t row, Grid<T> &block);

            void writeBlock(Grid<T> &block);

        };

        // A single band of a GDAL dataset. Values are converted between the
        // dataset's pixel type and T by GDAL. The dataset is closed when the
        // instance is destroyed.

        template <class T>
        class DLL_EXPORT Raster : public Grid<T> {
        private:
            int32_t m_cols, m_rows; // Raster cols/rows
            int32_t m_bandn;        // The band number
            bool m_writable;        // True if the raster is writable
            GDALDataset *m_ds;      // GDAL dataset
            GDALRasterBand *m_band; // GDAL band
            T m_nodata;             // Nodata value.
            bool m_hasNodata;       // True if the current band declares nodata.
            double m_trans[6];      // Raster transform
            std::string m_filename; // Raster filename

            // Get the GDAL type for the given c++ type.
            GDALDataType getType(double v) const;

            GDALDataType getType(float v) const;

            GDALDataType getType(uint32_t v) const;

            GDALDataType getType(int32_t v) const;

            GDALDataType getType(uint16_t v) const;

            GDALDataType getType(int16_t v) const;

            GDALDataType getType(uint8_t v) const;

            // Get the GDAL type for the template type.
            GDALDataType getType() const;

            // Read or write a window of the current band to or from buf,
            // which must hold cols * rows values.
            void io(GDALRWFlag flag, int32_t col, int32_t row, int32_t cols, int32_t rows, T *buf);

            // Load the dimensions, transform and nodata state.
            void loadBand();

        public:

            // Open the given raster and load the given band. Set the writable argument to true
            // to enable writing.
            Raster(const std::string &filename, int32_t band = 1, bool writable = false);

            // Create a new raster (overwriting any existing file) with the 
            // driver, dimensions, band count, pixel type, transform, projection
            // and nodata given in the profile. Band 1 is selected.
            Raster(const std::string &filename, const RasterProfile &profile);

            Raster(const Raster<T> &) = delete;

            Raster<T> &operator=(const Raster<T> &) = delete;

            // Return the dataset-level properties of this raster. The nodata
            // value is that of band 1.
            RasterProfile profile() const;

            // Return the filename for this raster.
            std::string filename() const;

            // Return the number of bands in the raster.
            int32_t bandCount() const;

            // Set the band number. Throws BandIndexError if the band does
            // not exist.
            void setBand(int32_t band);

            // Returns the current band number.
            int32_t getBandNum() const;

            // Returns the current band's description.
            std::string description() const;

            // Sets the current band's description.
            void description(const std::string &desc);

            // Write the projection data to the given string object.
            void projection(std::string &proj) const;

            // Return the GDAL datatype of the raster.
            GDALDataType type() const;

            // Return the raster's geographic bounds.
            ndvitools::util::Bounds bounds() const;

            double resolutionX() const;

            double resolutionY() const;

            // True if the current band declares a nodata value.
            bool hasNodata() const;

            T nodata() const;

            void nodata(const T nodata);

            int32_t cols() const;

            int32_t rows() const;

            size_t size() const;

            void fill(const T value);

            T *grid();

            bool hasGrid() const;

            T get(int32_t col, int32_t row);

            T get(size_t idx);

            void set(int32_t col, int32_t row, const T v);

            void set(size_t idx, const T v);

            bool has(int32_t col, int32_t row) const;

            bool has(size_t idx) const;

            void readBlock(int32_t col, int32_t row, Grid<T> &block);

            void readBlock(Grid<T> &block);

            void writeBlock(int32_t col, int32_t row, Grid<T> &block);

            void writeBlock(Grid<T> &block);

            // Flush cached writes to the dataset. Throws WriteFailure
            // if GDAL reports an error.
            void flush();

            // Flush and close the dataset. Throws WriteFailure if GDAL reports
            // an error while finishing a writable dataset. The instance can't
            // be used afterwards; further calls to close do nothing.
            void close();

            ~Raster();

        };

    } // raster

} // ndvitools


#endif
