#pragma once

#include <memory>
#include <string>
#include <utility>

#include <datapod/datapod.hpp>

#include "flotilla/model/movement_log.hpp"
#include "flotilla/serial.hpp"
#include "flotilla/types.hpp"

namespace flotilla {

    class Registry;

    namespace model {

        /// One simulated mobile unit.
        ///
        /// Units are owned by a Registry and never handed out; everything they expose to
        /// callers goes through `to_report()`. Construction and mutation are private to the
        /// Registry, which validates inputs before calling in.
        class Unit {
          public:
            Unit(const Unit &) = delete;
            Unit &operator=(const Unit &) = delete;

            inline const Serial &serial() const { return serial_; }
            inline const Position &position() const { return position_; }

            inline Report to_report() const {
                Report r;
                r.serial = serial_.str();
                r.position = position_;
                r.recent_movements = log_.snapshot();
                return r;
            }

          private:
            friend class flotilla::Registry;

            Unit(Serial serial, Position initial, dp::usize log_capacity)
                : serial_(std::move(serial)), position_(initial), log_(log_capacity) {}

            // std::make_unique cannot reach the private constructor.
            static std::unique_ptr<Unit> make(Serial serial, Position initial, dp::usize log_capacity) {
                return std::unique_ptr<Unit>(new Unit(std::move(serial), initial, log_capacity));
            }

            // Uniqueness is checked by the Registry; the unit only knows the format rule.
            inline Result<Serial> set_serial(const std::string &value) {
                auto parsed = Serial::parse(value);
                if (parsed.is_err()) {
                    return parsed;
                }
                serial_ = parsed.value();
                return parsed;
            }

            // Inputs are validated by the Registry (finite, non-negative distance; unit heading).
            inline MovementRecord apply_move(const Heading &heading, dp::f64 distance) {
                MovementRecord rec;
                rec.before = position_;
                rec.after.x = position_.x + distance * heading.dx;
                rec.after.y = position_.y + distance * heading.dy;
                rec.heading = heading;
                rec.distance = distance;

                position_ = rec.after;
                log_.append(rec);
                return rec;
            }

            Serial serial_;
            Position position_;
            MovementLog log_;
        };

    } // namespace model
} // namespace flotilla
