#pragma once

#include <algorithm>
#include <istream>
#include <string>
#include <unordered_map>

#include <datapod/datapod.hpp>

namespace flotilla {
    namespace reports {

        /// A distinct sensor-failure pattern and how often it was seen.
        ///
        /// Sensor lines hold one status character per sensor; `0` marks a failed sensor.
        struct SensorFault {
            std::string pattern;
            dp::usize failed_sensors = 0;
            dp::usize occurrences = 0;
        };

        /// Count fault patterns in a sensor log. Lines without a `0` are healthy and ignored.
        /// Output keeps the order in which patterns first appear.
        inline dp::Vector<SensorFault> count_sensor_faults(std::istream &in) {
            dp::Vector<SensorFault> out;
            std::unordered_map<std::string, dp::usize> index;
            std::string line;
            while (std::getline(in, line)) {
                if (!line.empty() && line.back() == '\r') {
                    line.pop_back();
                }
                const auto failed = static_cast<dp::usize>(std::count(line.begin(), line.end(), '0'));
                if (failed == 0) {
                    continue;
                }
                auto it = index.find(line);
                if (it != index.end()) {
                    ++out[it->second].occurrences;
                    continue;
                }
                index.emplace(line, out.size());
                out.push_back(SensorFault{line, failed, 1});
            }
            return out;
        }

    } // namespace reports
} // namespace flotilla
