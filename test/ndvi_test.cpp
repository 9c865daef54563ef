#undef NDEBUG

#include <iostream>
#include <cassert>
#include <cstdint>
#include <vector>

#include "ndvitools.h"
#include "raster.hpp"
#include "spectral.hpp"
#include "testutil.hpp"

using namespace ndvitools;
using namespace ndvitools::raster;
using namespace ndvitools::spectral;
using testutil::near;

template <class T>
void load(MemRaster<T> &grid, int32_t cols, int32_t rows, const std::vector<T> &values) {
	grid.init(cols, rows);
	for(size_t i = 0; i < values.size(); ++i)
		grid.set(i, values[i]);
}

void test_known_values() {
	std::cout << "Testing known values..." << std::endl;

	MemRaster<double> red, nir, out;
	load<double>(red, 2, 2, {0, 100, 200, 50});
	load<double>(nir, 2, 2, {0, 200, 100, 150});
	ndvi(red, nir, out);

	assert(out.cols() == 2 && out.rows() == 2);
	assert(out.get(0, 0) == 0.0);
	assert(near(out.get(1, 0), 1.0 / 3.0, 1e-12));
	assert(near(out.get(0, 1), -1.0 / 3.0, 1e-12));
	assert(near(out.get(1, 1), 0.5, 1e-12));

	// Inputs are untouched.
	assert(red.get(1, 1) == 50 && nir.get(1, 1) == 150);

	std::cout << "  passed" << std::endl;
}

void test_zero_denominator() {
	std::cout << "Testing zero denominator..." << std::endl;

	MemRaster<float> red, nir;
	MemRaster<double> out;
	load<float>(red, 3, 1, {0, 5, -5});
	load<float>(nir, 3, 1, {0, -5, 5});
	ndvi(red, nir, out);
	for(size_t i = 0; i < out.size(); ++i)
		assert(out.get(i) == 0.0);

	std::cout << "  passed" << std::endl;
}

void test_antisymmetry() {
	std::cout << "Testing antisymmetry..." << std::endl;

	MemRaster<double> a, b, ab, ba;
	load<double>(a, 3, 2, {1, 7, 0.25, 300, 12, 0});
	load<double>(b, 3, 2, {9, 2, 0.75, 100, 12, 4});
	ndvi(a, b, ab);
	ndvi(b, a, ba);
	for(size_t i = 0; i < ab.size(); ++i) {
		assert(near(ab.get(i), -ba.get(i), 1e-15));
		assert(ab.get(i) >= -1.0 && ab.get(i) <= 1.0);
	}

	std::cout << "  passed" << std::endl;
}

void test_integer_widening() {
	std::cout << "Testing integer widening..." << std::endl;

	// The sum overflows uint16 and the difference is fractional.
	MemRaster<uint16_t> red, nir;
	MemRaster<double> out;
	load<uint16_t>(red, 2, 1, {40000, 1});
	load<uint16_t>(nir, 2, 1, {60000, 2});
	ndvi(red, nir, out);
	assert(near(out.get(0), 0.2, 1e-12));
	assert(near(out.get(1), 1.0 / 3.0, 1e-12));

	MemRaster<uint8_t> r8, n8;
	load<uint8_t>(r8, 1, 1, {200});
	load<uint8_t>(n8, 1, 1, {250});
	ndvi(r8, n8, out);
	assert(near(out.get(0), 50.0 / 450.0, 1e-12));

	std::cout << "  passed" << std::endl;
}

void test_negative_inputs() {
	std::cout << "Testing negative inputs..." << std::endl;

	// No clamping: values outside [-1, 1] are possible.
	MemRaster<int16_t> red, nir;
	MemRaster<double> out;
	load<int16_t>(red, 2, 1, {-10, -3});
	load<int16_t>(nir, 2, 1, {20, 1});
	ndvi(red, nir, out);
	assert(near(out.get(0), 3.0, 1e-12));
	assert(near(out.get(1), -2.0, 1e-12));

	std::cout << "  passed" << std::endl;
}

void test_shape_mismatch() {
	std::cout << "Testing shape mismatch..." << std::endl;

	MemRaster<int32_t> red(3, 2), nir(2, 3);
	red.fill(1);
	nir.fill(1);
	MemRaster<double> out;
	bool thrown = false;
	try {
		ndvi(red, nir, out);
	} catch(const ShapeMismatch &e) {
		std::cout << "  caught: " << e.what() << std::endl;
		thrown = true;
	}
	assert(thrown);

	std::cout << "  passed" << std::endl;
}

void test_masked_stats() {
	std::cout << "Testing masked statistics..." << std::endl;

	MemRaster<double> grid;
	load<double>(grid, 3, 2, {1, 2, -9999, 3, 4, -9999});
	MemRaster<uint8_t> mask;
	load<uint8_t>(mask, 3, 2, {0, 0, 1, 0, 0, 1});
	grid.computeStats(mask);
	assert(grid.hasStats());
	assert(grid.count() == 4);
	assert(grid.min() == 1.0 && grid.max() == 4.0);
	assert(near(grid.mean(), 2.5, 1e-12));
	assert(near(grid.variance(), 1.25, 1e-12));
	assert(near(grid.stddev(), std::sqrt(1.25), 1e-12));

	mask.fill(1);
	grid.computeStats(mask);
	assert(!grid.hasStats());
	assert(grid.count() == 0);

	std::cout << "  passed" << std::endl;
}

int main(int argc, char **argv) {
	n_loglevel(N_LOG_WARN);

	test_known_values();
	test_zero_denominator();
	test_antisymmetry();
	test_integer_widening();
	test_negative_inputs();
	test_shape_mismatch();
	test_masked_stats();

	std::cout << "All NDVI tests passed." << std::endl;
	return 0;
}
