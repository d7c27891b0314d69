#pragma once

#include <cmath>
#include <string>

#include <datapod/datapod.hpp>

#include "flotilla/error.hpp"

namespace flotilla {

    // =============================================================================================
    // Plane geometry
    // =============================================================================================

    struct Position {
        dp::f64 x = 0.0;
        dp::f64 y = 0.0;

        bool operator==(const Position &o) const { return x == o.x && y == o.y; }
        bool operator!=(const Position &o) const { return !(*this == o); }

        /// Squared distance from the base (origin).
        dp::f64 base_distance_sq() const { return x * x + y * y; }

        bool near(const Position &o, dp::f64 tolerance) const {
            return std::fabs(x - o.x) <= tolerance && std::fabs(y - o.y) <= tolerance;
        }
    };

    /// Normalized direction of travel as a unit vector.
    ///
    /// Angles are radians, counter-clockwise from +x. Named directions:
    ///   east / forward  -> +x
    ///   west            -> -x
    ///   north / up      -> +y
    ///   south / down    -> -y
    struct Heading {
        static constexpr dp::f64 kNormTolerance = 1e-9;

        dp::f64 dx = 1.0;
        dp::f64 dy = 0.0;

        static Heading east() { return Heading{1.0, 0.0}; }
        static Heading west() { return Heading{-1.0, 0.0}; }
        static Heading north() { return Heading{0.0, 1.0}; }
        static Heading south() { return Heading{0.0, -1.0}; }

        static Result<Heading> from_angle(dp::f64 angle_rad) {
            if (!std::isfinite(angle_rad)) {
                return Result<Heading>::err(Error::invalid_movement("heading angle is not finite"));
            }
            return Result<Heading>::ok(Heading{std::cos(angle_rad), std::sin(angle_rad)});
        }

        static Result<Heading> from_vector(dp::f64 x, dp::f64 y) {
            if (!std::isfinite(x) || !std::isfinite(y)) {
                return Result<Heading>::err(Error::invalid_movement("heading vector is not finite"));
            }
            const dp::f64 scale = std::fmax(std::fabs(x), std::fabs(y));
            if (scale == 0.0) {
                return Result<Heading>::err(Error::invalid_movement("heading vector is zero"));
            }
            // Scale first so hypot cannot overflow near DBL_MAX.
            const dp::f64 sx = x / scale;
            const dp::f64 sy = y / scale;
            const dp::f64 norm = std::hypot(sx, sy);
            return Result<Heading>::ok(Heading{sx / norm, sy / norm});
        }

        static Result<Heading> from_name(const std::string &name) {
            if (name == "east" || name == "forward") {
                return Result<Heading>::ok(east());
            }
            if (name == "west") {
                return Result<Heading>::ok(west());
            }
            if (name == "north" || name == "up") {
                return Result<Heading>::ok(north());
            }
            if (name == "south" || name == "down") {
                return Result<Heading>::ok(south());
            }
            return Result<Heading>::err(Error::invalid_movement("unknown direction '" + name + "'"));
        }

        bool is_valid() const {
            if (!std::isfinite(dx) || !std::isfinite(dy)) {
                return false;
            }
            return std::fabs(std::hypot(dx, dy) - 1.0) <= kNormTolerance;
        }

        dp::f64 angle_rad() const { return std::atan2(dy, dx); }

        bool operator==(const Heading &o) const { return dx == o.dx && dy == o.dy; }
        bool operator!=(const Heading &o) const { return !(*this == o); }
    };

    // =============================================================================================
    // Snapshots handed to callers
    // =============================================================================================

    /// One displacement event: `after = before + distance * heading`.
    struct MovementRecord {
        Position before{};
        Position after{};
        Heading heading{};
        dp::f64 distance = 0.0;

        bool operator==(const MovementRecord &o) const {
            return before == o.before && after == o.after && heading == o.heading && distance == o.distance;
        }
        bool operator!=(const MovementRecord &o) const { return !(*this == o); }
    };

    /// Value snapshot of one unit. `recent_movements` is oldest first.
    struct Report {
        std::string serial;
        Position position{};
        dp::Vector<MovementRecord> recent_movements;
    };

    /// A move that ended on a position already held by another unit.
    struct Collision {
        std::string serial;
        std::string other;
        Position position{};
    };

} // namespace flotilla
