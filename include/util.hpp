#ifndef __UTIL_HPP__
#define __UTIL_HPP__

#include <string>
#include <ostream>

#include "ndvitools.h"

namespace ndvitools {

    namespace util {

        // An axis-aligned rectangle in map units.
        class DLL_EXPORT Bounds {
        private:
            double m_minx, m_miny;
            double m_maxx, m_maxy;
        public:
            Bounds();

            Bounds(double minx, double miny, double maxx, double maxy);

            double minx() const;

            void minx(double minx);

            double miny() const;

            void miny(double miny);

            double maxx() const;

            void maxx(double maxx);

            double maxy() const;

            void maxy(double maxy);

            void extend(double x, double y);

            // Invert the bounds so that the next call to extend
            // sets them.
            void collapse();

            std::string print() const;

            void print(std::ostream &str) const;

        };

        class DLL_EXPORT Util {
        public:

            // Return a unique file name, optionally rooted in the given directory.
            static const std::string tmpFile(const std::string &root);
            static const std::string tmpFile();

            // Remove the file or empty directory. Returns true if something
            // was removed.
            static bool rm(const std::string &name);

            // Return the value following the flag at argv[i] and advance i.
            // Throws invalid_argument if the flag is the last argument.
            static const char *nextArg(int &i, int argc, char **argv);

            static bool exists(const std::string &name);

            // Return the file's extension, lower case, with the dot.
            static std::string extension(const std::string &name);

            // Rewrite archive paths so that GDAL reads them through its
            // virtual file system (e.g. zipped shapefiles).
            static std::string vsiPath(const std::string &name);

        };

    } // util

} // ndvitools

#endif
