#pragma once

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>

#include <echo/echo.hpp>

#include <datapod/datapod.hpp>

#include "flotilla/error.hpp"
#include "flotilla/registry.hpp"
#include "flotilla/reports/movement_orders.hpp"
#include "flotilla/reports/sensor_faults.hpp"

namespace flotilla {
    namespace reports {

        /// Read-only view of a report directory:
        ///
        ///   <root>/MovementReports/<serial>.txt   movement orders, one per line
        ///   <root>/Sensordata/<serial>.txt        sensor status lines
        ///
        /// Nothing is ever written back.
        class ReportArchive {
          public:
            explicit ReportArchive(std::filesystem::path root) : root_(std::move(root)) {}

            inline const std::filesystem::path &root() const { return root_; }
            inline std::filesystem::path movement_dir() const { return root_ / "MovementReports"; }
            inline std::filesystem::path sensor_dir() const { return root_ / "Sensordata"; }

            /// File stems under MovementReports, sorted. Stems are not validated here.
            inline Result<dp::Vector<std::string>> unit_serials() const {
                const auto dir = movement_dir();
                std::error_code ec;
                if (!std::filesystem::is_directory(dir, ec)) {
                    return Result<dp::Vector<std::string>>::err(
                        Error::io("no movement report directory at " + dir.string()));
                }

                dp::Vector<std::string> out;
                const std::filesystem::directory_iterator end;
                for (std::filesystem::directory_iterator it(dir, ec); !ec && it != end; it.increment(ec)) {
                    std::error_code type_ec;
                    if (it->is_regular_file(type_ec)) {
                        out.push_back(it->path().stem().string());
                    }
                }
                if (ec) {
                    return Result<dp::Vector<std::string>>::err(
                        Error::io("cannot list " + dir.string() + ": " + ec.message()));
                }
                std::sort(out.begin(), out.end());
                return Result<dp::Vector<std::string>>::ok(out);
            }

            inline Result<MovementOrders> movement_orders(const std::string &serial) const {
                const auto path = movement_dir() / (serial + ".txt");
                std::ifstream in(path);
                if (!in) {
                    return Result<MovementOrders>::err(Error::io("no movement report at " + path.string()));
                }
                return Result<MovementOrders>::ok(parse_movement_orders(in, path.string()));
            }

            inline Result<dp::Vector<SensorFault>> sensor_faults(const std::string &serial) const {
                const auto path = sensor_dir() / (serial + ".txt");
                std::ifstream in(path);
                if (!in) {
                    return Result<dp::Vector<SensorFault>>::err(Error::io("no sensor data at " + path.string()));
                }
                return Result<dp::Vector<SensorFault>>::ok(count_sensor_faults(in));
            }

          private:
            std::filesystem::path root_;
        };

        /// Register a unit at the origin for every movement report in the archive.
        ///
        /// Stems that are not valid serials, or are already registered, are skipped with a
        /// warning. Returns how many units were created.
        inline Result<dp::usize> register_units(Registry &registry, const ReportArchive &archive) {
            auto serials = archive.unit_serials();
            if (serials.is_err()) {
                return Result<dp::usize>::err(serials.error());
            }

            dp::usize created = 0;
            for (const auto &serial : serials.value()) {
                auto res = registry.create(serial);
                if (res.is_err()) {
                    echo::warn("archive: skipping '", serial, "': ", res.error().message);
                    continue;
                }
                ++created;
            }
            echo::trace("archive: registered ", created, " units from ", archive.root().string());
            return Result<dp::usize>::ok(created);
        }

        /// Drive one unit through every order in its movement report.
        inline Result<Report> replay_movements(Registry &registry, const ReportArchive &archive,
                                               const std::string &serial) {
            if (!registry.contains(serial)) {
                return Result<Report>::err(Error::not_found("unit '" + serial + "' not found"));
            }
            auto orders = archive.movement_orders(serial);
            if (orders.is_err()) {
                return Result<Report>::err(orders.error());
            }

            for (const auto &order : orders.value().orders) {
                auto moved = registry.move(serial, order.heading, order.distance);
                if (moved.is_err()) {
                    return moved;
                }
            }
            echo::trace("archive: replayed ", orders.value().orders.size(), " orders for ", serial);
            return registry.report(serial);
        }

    } // namespace reports
} // namespace flotilla
