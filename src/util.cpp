#include <string>
#include <sstream>

#include <boost/filesystem.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/case_conv.hpp>

#include "ndvitools.h"
#include "util.hpp"

using namespace ndvitools::util;

int n__loglevel = N_LOG_INFO;

Bounds::Bounds() : Bounds(N_DBL_MAX_NEG, N_DBL_MAX_NEG, N_DBL_MAX_POS, N_DBL_MAX_POS) {
}

Bounds::Bounds(double minx, double miny, double maxx, double maxy) :
	m_minx(minx), m_miny(miny),
	m_maxx(maxx), m_maxy(maxy) {
}

double Bounds::minx() const {
	return m_minx;
}

void Bounds::minx(double minx) {
	m_minx = minx;
}

double Bounds::miny() const {
	return m_miny;
}

void Bounds::miny(double miny) {
	m_miny = miny;
}

double Bounds::maxx() const {
	return m_maxx;
}

void Bounds::maxx(double maxx) {
	m_maxx = maxx;
}

double Bounds::maxy() const {
	return m_maxy;
}

void Bounds::maxy(double maxy) {
	m_maxy = maxy;
}

void Bounds::extend(double x, double y) {
	m_minx = n_min(x, m_minx);
	m_maxx = n_max(x, m_maxx);
	m_miny = n_min(y, m_miny);
	m_maxy = n_max(y, m_maxy);
}

void Bounds::collapse() {
	minx(N_DBL_MAX_POS);
	miny(N_DBL_MAX_POS);
	maxx(N_DBL_MAX_NEG);
	maxy(N_DBL_MAX_NEG);
}

std::string Bounds::print() const {
	std::stringstream s;
	print(s);
	return s.str();
}

void Bounds::print(std::ostream &str) const {
	str << "[Bounds: " << minx() << ", " << miny() << "; " << maxx() << ", " << maxy() << "]";
}

bool Util::rm(const std::string &name) {
	using namespace boost::filesystem;
	path p(name);
	boost::system::error_code ec;
	return boost::filesystem::remove(p, ec);
}

const char *Util::nextArg(int &i, int argc, char **argv) {
	if(i + 1 >= argc)
		n_argerr("Missing value for " << argv[i] << ".");
	return argv[++i];
}

bool Util::exists(const std::string &name) {
	boost::system::error_code ec;
	return boost::filesystem::exists(boost::filesystem::path(name), ec);
}

std::string Util::extension(const std::string &name) {
	std::string ext = boost::filesystem::path(name).extension().string();
	boost::algorithm::to_lower(ext);
	return ext;
}

std::string Util::vsiPath(const std::string &name) {
	using namespace boost::algorithm;
	if(starts_with(name, "/vsi"))
		return name;
	if(extension(name) == ".zip")
		return "/vsizip/" + name;
	return name;
}

const std::string Util::tmpFile() {
	return Util::tmpFile("");
}

const std::string Util::tmpFile(const std::string &root) {
	using namespace boost::filesystem;
	path p = unique_path();
	if(!root.empty()) {
		path r(root);
		return (r / p).string();
	}
	return (temp_directory_path() / p).string();
}
