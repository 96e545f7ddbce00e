#include "gpx_writer.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <locale>
#include <sstream>
#include <stdexcept>

namespace dashgpx {
    std::string GpxWriter::format(const std::vector<TrackReading> &points) {
        std::ostringstream oss;
        oss.imbue(std::locale::classic());
        oss << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
        oss << "<gpx version=\"1.1\" creator=\"DashcamExtractor\" xmlns=\"http://www.topografix.com/GPX/1/1\">\n";
        oss << "  <trk>\n    <trkseg>\n";
        oss << std::fixed << std::setprecision(6);
        for (const auto &p: points) {
            oss << "      <trkpt lat=\"" << p.latitude << "\" lon=\"" << p.longitude << "\">"
                    << "<time>" << formatIsoUtc(p.timestamp) << "</time></trkpt>\n";
        }
        oss << "    </trkseg>\n  </trk>\n</gpx>\n";
        return oss.str();
    }

    void GpxWriter::write(const std::vector<TrackReading> &points, const std::string &gpx_path) {
        std::ofstream file(gpx_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw std::runtime_error("cannot open GPX output: " + gpx_path);
        }
        file << format(points);
        file.flush();
        if (!file) {
            throw std::runtime_error("failed writing GPX output: " + gpx_path);
        }
        std::cout << "[GPX] wrote " << points.size() << " points: " << gpx_path << std::endl;
    }
} // namespace dashgpx
