#pragma once

#include <cmath>
#include <cstdlib>
#include <istream>
#include <sstream>
#include <string>

#include <echo/echo.hpp>

#include <datapod/datapod.hpp>

#include "flotilla/types.hpp"

namespace flotilla {
    namespace reports {

        /// One `<direction> <distance>` line of a movement report.
        struct MovementOrder {
            std::string direction;
            Heading heading{};
            dp::f64 distance = 0.0;
        };

        struct MovementOrders {
            dp::Vector<MovementOrder> orders;
            dp::usize skipped = 0; // malformed lines
        };

        static inline bool all_digits(const std::string &s) {
            if (s.empty()) {
                return false;
            }
            for (const char c : s) {
                if (c < '0' || c > '9') {
                    return false;
                }
            }
            return true;
        }

        /// Parse a movement report.
        ///
        /// Each line must hold exactly a direction name and a whole, non-negative distance.
        /// Blank lines are ignored; anything else is skipped with a warning.
        inline MovementOrders parse_movement_orders(std::istream &in, const std::string &source = "report") {
            MovementOrders out;
            std::string line;
            dp::usize line_no = 0;
            while (std::getline(in, line)) {
                ++line_no;

                std::istringstream fields(line);
                std::string direction;
                std::string distance;
                std::string extra;
                if (!(fields >> direction)) {
                    continue;
                }
                const bool shaped = static_cast<bool>(fields >> distance) && !(fields >> extra);
                if (!shaped || !all_digits(distance)) {
                    echo::warn(source, ":", line_no, ": malformed movement order, skipping");
                    ++out.skipped;
                    continue;
                }
                auto heading = Heading::from_name(direction);
                if (heading.is_err()) {
                    echo::warn(source, ":", line_no, ": ", heading.error().message, ", skipping");
                    ++out.skipped;
                    continue;
                }

                const double value = std::strtod(distance.c_str(), nullptr);
                if (!std::isfinite(value)) {
                    echo::warn(source, ":", line_no, ": distance out of range, skipping");
                    ++out.skipped;
                    continue;
                }

                MovementOrder order;
                order.direction = direction;
                order.heading = heading.value();
                order.distance = static_cast<dp::f64>(value);
                out.orders.push_back(order);
            }
            return out;
        }

    } // namespace reports
} // namespace flotilla
