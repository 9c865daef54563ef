#ifndef __NDVITOOLS_H__
#define __NDVITOOLS_H__

#include <limits>
#include <exception>
#include <stdexcept>
#include <string>
#include <iostream>
#include <sstream>
#include <iomanip>

#ifdef _MSC_VER
#define DLL_EXPORT __declspec(dllexport)
#else
#define DLL_EXPORT
#endif

#define N_DBL_MAX_POS (std::numeric_limits<double>::max())
#define N_DBL_MAX_NEG (std::numeric_limits<double>::lowest())

#define n_min(a, b) ((a) > (b) ? (b) : (a))
#define n_max(a, b) ((a) < (b) ? (b) : (a))

extern int n__loglevel;

#define N_LOG_TRACE 6
#define N_LOG_DEBUG 5
#define N_LOG_INFO 4
#define N_LOG_WARN 3
#define N_LOG_ERROR 2
#define N_LOG_NONE 0

#define n_loglevel(x) {n__loglevel = x;}

#define n_log(x, y) { if(n__loglevel >= y) std::cerr << std::setprecision(12) << x << std::endl; }
#define n_trace(x) n_log("TRACE:   " << x, N_LOG_TRACE)
#define n_debug(x) n_log("DEBUG:   " << x, N_LOG_DEBUG)
#define n_info(x)  n_log("INFO:    " << x, N_LOG_INFO)
#define n_warn(x)  n_log("WARNING: " << x, N_LOG_WARN)
#define n_error(x) n_log("ERROR:   " << x, N_LOG_ERROR)

#define n_throw(cls, x) {std::stringstream _ss; _ss << x; throw cls(_ss.str());}
#define n_argerr(x) n_throw(std::invalid_argument, x)
#define n_implerr(x) n_throw(std::runtime_error, x)
#define n_runerr(x) n_throw(std::runtime_error, x)

namespace ndvitools {

	// The input raster or vector source could not be opened.
	class InputNotFound : public std::runtime_error {
	public:
		InputNotFound(const std::string &msg) : std::runtime_error(msg) {}
	};

	// A band number outside 1..count was requested.
	class BandIndexError : public std::out_of_range {
	public:
		BandIndexError(const std::string &msg) : std::out_of_range(msg) {}
	};

	// Two grids that must have the same dimensions do not.
	class ShapeMismatch : public std::invalid_argument {
	public:
		ShapeMismatch(const std::string &msg) : std::invalid_argument(msg) {}
	};

	// No transformation could be established between two reference systems.
	class CRSMismatchUnresolved : public std::runtime_error {
	public:
		CRSMismatchUnresolved(const std::string &msg) : std::runtime_error(msg) {}
	};

	// A clip geometry does not overlap the raster.
	class EmptyIntersection : public std::runtime_error {
	public:
		EmptyIntersection(const std::string &msg) : std::runtime_error(msg) {}
	};

	// An output dataset could not be created or written.
	class WriteFailure : public std::runtime_error {
	public:
		WriteFailure(const std::string &msg) : std::runtime_error(msg) {}
	};

} // ndvitools

#endif
