#include <string>
#include <cstring>
#include <cstdlib>
#include <cmath>
#include <algorithm>

#include <gdal_priv.h>
#include <cpl_conv.h>
#include <cpl_error.h>

#include "util.hpp"
#include "raster.hpp"

using namespace ndvitools;
using namespace ndvitools::util;
using namespace ndvitools::raster;


// Implementations for RasterProfile
RasterProfile::RasterProfile() :
	driver("GTiff"),
	cols(0), rows(0),
	bands(0),
	type(GDT_Unknown),
	hasNodata(false),
	nodata(0) {
	auto lst = std::initializer_list<double>({0.0, 1.0, 0.0, 0.0, 0.0, -1.0});
	std::copy(lst.begin(), lst.end(), trans);
}

double RasterProfile::resolutionX() const {
	return trans[1];
}

double RasterProfile::resolutionY() const {
	return trans[5];
}

bool RasterProfile::isNorthUp() const {
	return trans[2] == 0.0 && trans[4] == 0.0;
}

double RasterProfile::toX(int32_t col) const {
	return trans[0] + col * trans[1];
}

double RasterProfile::toY(int32_t row) const {
	return trans[3] + row * trans[5];
}

double RasterProfile::toCentroidX(int32_t col) const {
	return toX(col) + trans[1] / 2.0;
}

double RasterProfile::toCentroidY(int32_t row) const {
	return toY(row) + trans[5] / 2.0;
}

double RasterProfile::toColF(double x) const {
	return (x - trans[0]) / trans[1];
}

double RasterProfile::toRowF(double y) const {
	return (y - trans[3]) / trans[5];
}

Bounds RasterProfile::bounds() const {
	double x0 = toX(0), x1 = toX(cols);
	double y0 = toY(0), y1 = toY(rows);
	return Bounds(n_min(x0, x1), n_min(y0, y1), n_max(x0, x1), n_max(y0, y1));
}

double RasterProfile::typedNodata() const {
	if(type == GDT_Unknown)
		return nodata;
	return GDALAdjustValueToDataType(type, nodata, nullptr, nullptr);
}


// Implementations for the Grid class
template <class T>
Grid<T>::Grid() :
	m_min(0), m_max(0),
	m_mean(0), m_stddev(0), m_variance(0),
	m_sum(0),
	m_count(0),
	m_stats(false) {
}

template <class T>
void Grid<T>::computeStats(Grid<uint8_t> &mask) {
	if(!sameShape(mask))
		n_throw(ShapeMismatch, "The mask must have the same shape as the grid: " 
			<< mask.cols() << "x" << mask.rows() << " vs " << cols() << "x" << rows());
	m_sum = 0;
	m_count = 0;
	m_stats = false;
	double m = 0;
	double s = 0;
	// Welford's method for variance.
	for(size_t i = 0; i < size(); ++i) {
		if(mask.get(i))
			continue;
		double v = (double) get(i);
		if(m_count == 0) {
			m_min = m_max = v;
		} else {
			m_min = n_min(m_min, v);
			m_max = n_max(m_max, v);
		}
		++m_count;
		double oldm = m;
		m = m + (v - m) / m_count;
		s = s + (v - m) * (v - oldm);
		m_sum += v;
	}
	if(m_count == 0)
		return;
	m_mean = m;
	m_variance = s / m_count;
	m_stddev = std::sqrt(m_variance);
	m_stats = true;
}

template <class T>
bool Grid<T>::hasStats() const {
	return m_stats;
}

template <class T>
size_t Grid<T>::count() const {
	return m_count;
}

template <class T>
double Grid<T>::min() const {
	if(!m_stats)
		n_runerr("Statistics are not available.");
	return m_min;
}

template <class T>
double Grid<T>::max() const {
	if(!m_stats)
		n_runerr("Statistics are not available.");
	return m_max;
}

template <class T>
double Grid<T>::mean() const {
	if(!m_stats)
		n_runerr("Statistics are not available.");
	return m_mean;
}

template <class T>
double Grid<T>::stddev() const {
	if(!m_stats)
		n_runerr("Statistics are not available.");
	return m_stddev;
}

template <class T>
double Grid<T>::variance() const {
	if(!m_stats)
		n_runerr("Statistics are not available.");
	return m_variance;
}


// Implementations for MemRaster
template <class T>
void MemRaster<T>::checkInit() const {
	if(m_grid == nullptr)
		n_runerr("This instance has not been initialized.");
}

template <class T>
MemRaster<T>::MemRaster() :
	m_grid(nullptr),
	m_cols(-1), m_rows(-1),
	m_nodata(0) {
}

template <class T>
MemRaster<T>::MemRaster(int32_t cols, int32_t rows) : MemRaster() {
	init(cols, rows);
}

template <class T>
MemRaster<T>::~MemRaster() {
	freeMem();
}

template <class T>
T *MemRaster<T>::grid() {
	return m_grid;
}

template <class T>
bool MemRaster<T>::hasGrid() const {
	return true;
}

template <class T>
void MemRaster<T>::freeMem() {
	if(m_grid) {
		std::free(m_grid);
		m_grid = nullptr;
	}
}

template <class T>
int32_t MemRaster<T>::rows() const {
	return m_rows;
}

template <class T>
int32_t MemRaster<T>::cols() const {
	return m_cols;
}

template <class T>
size_t MemRaster<T>::size() const {
	return (size_t) m_rows * m_cols;
}

template <class T>
void MemRaster<T>::init(int32_t cols, int32_t rows) {
	if(cols <= 0 || rows <= 0)
		n_argerr("Invalid row or column count: " << cols << ", " << rows);
	if(cols != m_cols || rows != m_rows || m_grid == nullptr) {
		freeMem();
		m_cols = cols;
		m_rows = rows;
		m_grid = (T *) std::calloc(size(), sizeof(T));
		if(!m_grid)
			n_runerr("Failed to allocate memory for " << cols << "x" << rows << " grid.");
	}
}

template <class T>
void MemRaster<T>::fill(const T value) {
	checkInit();
	std::fill(m_grid, m_grid + size(), value);
}

template <class T>
T MemRaster<T>::get(size_t idx) {
	checkInit();
	if(idx >= size())
		n_argerr("Index out of bounds: " << idx << "; size: " << size());
	return m_grid[idx];
}

template <class T>
T MemRaster<T>::get(int32_t col, int32_t row) {
	if(!has(col, row))
		n_argerr("Cell out of bounds: " << col << ", " << row);
	return get((size_t) row * m_cols + col);
}

template <class T>
void MemRaster<T>::set(int32_t col, int32_t row, const T value) {
	if(!has(col, row))
		n_argerr("Cell out of bounds: " << col << ", " << row);
	set((size_t) row * m_cols + col, value);
}

template <class T>
void MemRaster<T>::set(size_t idx, const T value) {
	checkInit();
	if(idx >= size())
		n_argerr("Index out of bounds: " << idx << "; size: " << size());
	m_grid[idx] = value;
}

template <class T>
bool MemRaster<T>::has(int32_t col, int32_t row) const {
	return col >= 0 && col < m_cols && row >= 0 && row < m_rows;
}

template <class T>
bool MemRaster<T>::has(size_t idx) const {
	return idx < size();
}

template <class T>
T MemRaster<T>::nodata() const {
	return m_nodata;
}

template <class T>
void MemRaster<T>::nodata(T nodata) {
	m_nodata = nodata;
}

template <class T>
void MemRaster<T>::readBlock(int32_t col, int32_t row, Grid<T> &block) {
	if(&block == this)
		n_argerr("Recursive call to readBlock.");
	if(!has(col, row))
		n_argerr("Invalid source column or row: " << col << ", " << row);
	checkInit();
	int32_t cols = n_min(m_cols - col, block.cols());
	int32_t rows = n_min(m_rows - row, block.rows());
	if(block.hasGrid()) {
		for(int32_t r = 0; r < rows; ++r) {
			std::memcpy(
				(block.grid() + (size_t) r * block.cols()),
				(m_grid       + (size_t) (row + r) * m_cols + col),
				cols * sizeof(T)
			);
		}
	} else {
		for(int32_t r = 0; r < rows; ++r) {
			for(int32_t c = 0; c < cols; ++c)
				block.set(c, r, get(c + col, r + row));
		}
	}
}

template <class T>
void MemRaster<T>::readBlock(Grid<T> &block) {
	readBlock(0, 0, block);
}

template <class T>
void MemRaster<T>::writeBlock(int32_t col, int32_t row, Grid<T> &block) {
	if(&block == this)
		n_argerr("Recursive call to writeBlock.");
	if(!has(col, row))
		n_argerr("Invalid destination column or row: " << col << ", " << row);
	checkInit();
	int32_t cols = n_min(m_cols - col, block.cols());
	int32_t rows = n_min(m_rows - row, block.rows());
	if(block.hasGrid()) {
		for(int32_t r = 0; r < rows; ++r) {
			std::memcpy(
				(m_grid       + (size_t) (r + row) * m_cols + col),
				(block.grid() + (size_t) r * block.cols()),
				cols * sizeof(T)
			);
		}
	} else {
		for(int32_t r = 0; r < rows; ++r) {
			for(int32_t c = 0; c < cols; ++c)
				set(c + col, r + row, block.get(c, r));
		}
	}
}

template <class T>
void MemRaster<T>::writeBlock(Grid<T> &block) {
	writeBlock(0, 0, block);
}


// Implementations for Raster
template <class T>
GDALDataType Raster<T>::getType(double) const {
	return GDT_Float64;
}

template <class T>
GDALDataType Raster<T>::getType(float) const {
	return GDT_Float32;
}

template <class T>
GDALDataType Raster<T>::getType(uint32_t) const {
	return GDT_UInt32;
}

template <class T>
GDALDataType Raster<T>::getType(int32_t) const {
	return GDT_Int32;
}

template <class T>
GDALDataType Raster<T>::getType(uint16_t) const {
	return GDT_UInt16;
}

template <class T>
GDALDataType Raster<T>::getType(int16_t) const {
	return GDT_Int16;
}

template <class T>
GDALDataType Raster<T>::getType(uint8_t) const {
	return GDT_Byte;
}

template <class T>
GDALDataType Raster<T>::getType() const {
	return getType((T) 0);
}

template <class T>
Raster<T>::Raster(const std::string &filename, int32_t band, bool writable) :
	m_cols(-1), m_rows(-1),
	m_bandn(0),
	m_writable(writable),
	m_ds(nullptr), m_band(nullptr),
	m_nodata(0),
	m_hasNodata(false),
	m_filename(filename) {

	if(filename.empty())
		n_argerr("Filename must be given.");

	n_debug("Raster open: " << filename << "; band: " << band << "; writable: " << writable);

	// Attempt to open the dataset.
	GDALAllRegister();
	m_ds = (GDALDataset *) GDALOpenEx(filename.c_str(), 
		GDAL_OF_RASTER | (writable ? GDAL_OF_UPDATE : GDAL_OF_READONLY), 
		nullptr, nullptr, nullptr);
	if(m_ds == nullptr)
		n_throw(InputNotFound, "Failed to open raster " << filename << ": " << CPLGetLastErrorMsg());

	if(m_ds->GetGeoTransform(m_trans) != CE_None)
		n_debug("No transform on " << filename << "; using the default.");
	m_rows = m_ds->GetRasterYSize();
	m_cols = m_ds->GetRasterXSize();
	try {
		setBand(band);
	} catch(...) {
		// The destructor won't run; release the dataset here.
		GDALClose(m_ds);
		m_ds = nullptr;
		throw;
	}
}

template <class T>
Raster<T>::Raster(const std::string &filename, const RasterProfile &profile) :
	m_cols(-1), m_rows(-1),
	m_bandn(0),
	m_writable(true),
	m_ds(nullptr), m_band(nullptr),
	m_nodata(0),
	m_hasNodata(false),
	m_filename(filename) {

	n_debug("Raster create: " << filename << ", " << profile.driver << ", " << profile.cols << "x" << profile.rows 
		<< "x" << profile.bands << ", " << GDALGetDataTypeName(profile.type));

	if(filename.empty())
		n_argerr("Filename must be given.");
	if(profile.cols < 1 || profile.rows < 1 || profile.bands < 1)
		n_throw(WriteFailure, "Invalid raster dimensions: " << profile.cols << "x" << profile.rows << "x" << profile.bands);
	if(profile.type == GDT_Unknown)
		n_throw(WriteFailure, "The pixel type must be given.");

	GDALAllRegister();
	GDALDriver *drv = GetGDALDriverManager()->GetDriverByName(profile.driver.c_str());
	if(drv == nullptr)
		n_throw(WriteFailure, "Unknown raster driver: " << profile.driver);
	if(!CPLFetchBool(drv->GetMetadata(), GDAL_DCAP_CREATE, false))
		n_throw(WriteFailure, "The " << profile.driver << " driver cannot create rasters.");

	// Create GDAL dataset.
	m_ds = drv->Create(filename.c_str(), profile.cols, profile.rows, profile.bands, profile.type, nullptr);
	if(m_ds == nullptr)
		n_throw(WriteFailure, "Failed to create " << filename << ": " << CPLGetLastErrorMsg());

	try {
		std::copy(profile.trans, profile.trans + 6, m_trans);
		if(m_ds->SetGeoTransform(m_trans) != CE_None)
			n_throw(WriteFailure, "Failed to set the transform on " << filename);
		if(!profile.projection.empty() && m_ds->SetProjection(profile.projection.c_str()) != CE_None)
			n_throw(WriteFailure, "Failed to set the projection on " << filename);

		if(profile.hasNodata) {
			for(int32_t b = 1; b <= profile.bands; ++b) {
				if(m_ds->GetRasterBand(b)->SetNoDataValue(profile.nodata) != CE_None)
					n_throw(WriteFailure, "Failed to set nodata on band " << b << " of " << filename);
			}
		}

		m_rows = m_ds->GetRasterYSize();
		m_cols = m_ds->GetRasterXSize();
		setBand(1);
	} catch(...) {
		GDALClose(m_ds);
		m_ds = nullptr;
		throw;
	}
}

template <class T>
void Raster<T>::loadBand() {
	int success = 0;
	double nd = m_band->GetNoDataValue(&success);
	m_hasNodata = success != 0;
	m_nodata = m_hasNodata ? (T) nd : (T) 0;
}

template <class T>
RasterProfile Raster<T>::profile() const {
	RasterProfile p;
	GDALDriver *drv = m_ds->GetDriver();
	if(drv)
		p.driver = drv->GetDescription();
	p.cols = m_cols;
	p.rows = m_rows;
	p.bands = bandCount();
	p.type = m_ds->GetRasterBand(1)->GetRasterDataType();
	std::copy(m_trans, m_trans + 6, p.trans);
	projection(p.projection);
	int success = 0;
	double nd = m_ds->GetRasterBand(1)->GetNoDataValue(&success);
	p.hasNodata = success != 0;
	p.nodata = p.hasNodata ? nd : 0;
	return p;
}

template <class T>
std::string Raster<T>::filename() const {
	return m_filename;
}

template <class T>
int32_t Raster<T>::bandCount() const {
	return m_ds->GetRasterCount();
}

template <class T>
void Raster<T>::setBand(int32_t band) {
	if(band < 1 || band > bandCount())
		n_throw(BandIndexError, "Band " << band << " is out of range for " << m_filename 
			<< "; valid bands are 1.." << bandCount());
	if(band == m_bandn)
		return;
	flush();
	GDALRasterBand *b = m_ds->GetRasterBand(band);
	if(b == nullptr)
		n_throw(BandIndexError, "Failed to get band " << band << " of " << m_filename);
	m_band = b;
	m_bandn = band;
	loadBand();
}

template <class T>
int32_t Raster<T>::getBandNum() const {
	return m_bandn;
}

template <class T>
std::string Raster<T>::description() const {
	return std::string(m_band->GetDescription());
}

template <class T>
void Raster<T>::description(const std::string &desc) {
	if(!m_writable)
		n_runerr("This raster is not writable.");
	m_band->SetDescription(desc.c_str());
}

template <class T>
void Raster<T>::projection(std::string &proj) const {
	const char *ref = m_ds->GetProjectionRef();
	proj.assign(ref ? ref : "");
}

template <class T>
GDALDataType Raster<T>::type() const {
	return m_band->GetRasterDataType();
}

template <class T>
Bounds Raster<T>::bounds() const {
	return profile().bounds();
}

template <class T>
double Raster<T>::resolutionX() const {
	return m_trans[1];
}

template <class T>
double Raster<T>::resolutionY() const {
	return m_trans[5];
}

template <class T>
bool Raster<T>::hasNodata() const {
	return m_hasNodata;
}

template <class T>
T Raster<T>::nodata() const {
	return m_nodata;
}

template <class T>
void Raster<T>::nodata(T nodata) {
	if(!m_writable)
		n_runerr("This raster is not writable.");
	if(m_band->SetNoDataValue((double) nodata) != CE_None)
		n_throw(WriteFailure, "Failed to set nodata on " << m_filename);
	m_nodata = nodata;
	m_hasNodata = true;
}

template <class T>
int32_t Raster<T>::cols() const {
	return m_cols;
}

template <class T>
int32_t Raster<T>::rows() const {
	return m_rows;
}

template <class T>
size_t Raster<T>::size() const {
	return (size_t) m_cols * m_rows;
}

template <class T>
void Raster<T>::io(GDALRWFlag flag, int32_t col, int32_t row, int32_t cols, int32_t rows, T *buf) {
	if(m_band->RasterIO(flag, col, row, cols, rows, buf, cols, rows, getType(), 0, 0) != CE_None) {
		if(flag == GF_Write) {
			n_throw(WriteFailure, "Failed to write to band " << m_bandn << " of " << m_filename 
				<< ": " << CPLGetLastErrorMsg());
		} else {
			n_runerr("Failed to read from band " << m_bandn << " of " << m_filename 
				<< ": " << CPLGetLastErrorMsg());
		}
	}
}

template <class T>
void Raster<T>::fill(T value) {
	if(!m_writable)
		n_runerr("This raster is not writable.");
	MemRaster<T> line(m_cols, 1);
	line.fill(value);
	for(int32_t r = 0; r < m_rows; ++r)
		io(GF_Write, 0, r, m_cols, 1, line.grid());
}

template <class T>
T *Raster<T>::grid() {
	n_implerr("grid() Not implemented in Raster.");
}

template <class T>
bool Raster<T>::hasGrid() const {
	return false;
}

template <class T>
T Raster<T>::get(int32_t col, int32_t row) {
	if(!has(col, row))
		n_argerr("Cell out of bounds: " << col << ", " << row);
	T v;
	io(GF_Read, col, row, 1, 1, &v);
	return v;
}

template <class T>
T Raster<T>::get(size_t idx) {
	if(idx >= size())
		n_argerr("Index out of bounds.");
	return get((int32_t) (idx % m_cols), (int32_t) (idx / m_cols));
}

template <class T>
void Raster<T>::set(int32_t col, int32_t row, T v) {
	if(!m_writable)
		n_runerr("This raster is not writable.");
	if(!has(col, row))
		n_argerr("Cell out of bounds: " << col << ", " << row);
	io(GF_Write, col, row, 1, 1, &v);
}

template <class T>
void Raster<T>::set(size_t idx, T v) {
	if(idx >= size())
		n_argerr("Index out of bounds.");
	set((int32_t) (idx % m_cols), (int32_t) (idx / m_cols), v);
}

template <class T>
bool Raster<T>::has(int32_t col, int32_t row) const {
	return col >= 0 && col < m_cols && row >= 0 && row < m_rows;
}

template <class T>
bool Raster<T>::has(size_t idx) const {
	return idx < size();
}

template <class T>
void Raster<T>::readBlock(int32_t col, int32_t row, Grid<T> &grd) {
	if(&grd == this)
		n_runerr("Recursive call to readBlock.");
	int32_t cols = n_min(m_cols - col, grd.cols());
	int32_t rows = n_min(m_rows - row, grd.rows());
	if(col < 0 || row < 0 || cols < 1 || rows < 1)
		n_argerr("Zero read size.");
	if(grd.hasGrid() && cols == grd.cols() && rows == grd.rows()) {
		io(GF_Read, col, row, cols, rows, grd.grid());
	} else {
		MemRaster<T> mr(cols, rows);
		io(GF_Read, col, row, cols, rows, mr.grid());
		grd.writeBlock(0, 0, mr);
	}
}

template <class T>
void Raster<T>::readBlock(Grid<T> &block) {
	readBlock(0, 0, block);
}

template <class T>
void Raster<T>::writeBlock(int32_t col, int32_t row, Grid<T> &grd) {
	if(&grd == this)
		n_runerr("Recursive call to writeBlock.");
	if(!m_writable)
		n_runerr("This raster is not writable.");
	int32_t cols = n_min(m_cols - col, grd.cols());
	int32_t rows = n_min(m_rows - row, grd.rows());
	if(col < 0 || row < 0 || cols < 1 || rows < 1)
		n_argerr("Zero write size.");
	if(grd.hasGrid() && cols == grd.cols() && rows == grd.rows()) {
		io(GF_Write, col, row, cols, rows, grd.grid());
	} else {
		MemRaster<T> mr(cols, rows);
		grd.readBlock(0, 0, mr);
		io(GF_Write, col, row, cols, rows, mr.grid());
	}
}

template <class T>
void Raster<T>::writeBlock(Grid<T> &block) {
	writeBlock(0, 0, block);
}

template <class T>
void Raster<T>::flush() {
	if(!m_writable || m_ds == nullptr)
		return;
	CPLErrorReset();
	m_ds->FlushCache();
	if(CPLGetLastErrorType() == CE_Failure || CPLGetLastErrorType() == CE_Fatal)
		n_throw(WriteFailure, "Failed to flush " << m_filename << ": " << CPLGetLastErrorMsg());
}

template <class T>
void Raster<T>::close() {
	if(m_ds == nullptr)
		return;
	flush();
	GDALDataset *ds = m_ds;
	m_ds = nullptr;
	m_band = nullptr;
	// Some drivers finish writing the file at close.
	CPLErrorReset();
	GDALClose(ds);
	if(m_writable && (CPLGetLastErrorType() == CE_Failure || CPLGetLastErrorType() == CE_Fatal))
		n_throw(WriteFailure, "Failed to close " << m_filename << ": " << CPLGetLastErrorMsg());
}

template <class T>
Raster<T>::~Raster() {
	if(m_ds)
		GDALClose(m_ds);
}


template class ndvitools::raster::Grid<double>;
template class ndvitools::raster::Grid<float>;
template class ndvitools::raster::Grid<uint32_t>;
template class ndvitools::raster::Grid<int32_t>;
template class ndvitools::raster::Grid<uint16_t>;
template class ndvitools::raster::Grid<int16_t>;
template class ndvitools::raster::Grid<uint8_t>;

template class ndvitools::raster::MemRaster<double>;
template class ndvitools::raster::MemRaster<float>;
template class ndvitools::raster::MemRaster<uint32_t>;
template class ndvitools::raster::MemRaster<int32_t>;
template class ndvitools::raster::MemRaster<uint16_t>;
template class ndvitools::raster::MemRaster<int16_t>;
template class ndvitools::raster::MemRaster<uint8_t>;

template class ndvitools::raster::Raster<double>;
template class ndvitools::raster::Raster<float>;
template class ndvitools::raster::Raster<uint32_t>;
template class ndvitools::raster::Raster<int32_t>;
template class ndvitools::raster::Raster<uint16_t>;
template class ndvitools::raster::Raster<int16_t>;
template class ndvitools::raster::Raster<uint8_t>;
