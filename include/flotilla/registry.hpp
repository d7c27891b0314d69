#pragma once

#include <algorithm>
#include <cmath>
#include <memory>
#include <string>
#include <unordered_map>

#include <echo/echo.hpp>

#include <datapod/datapod.hpp>
#include <datapod/pods/adapters/optional.hpp>
#include <datapod/pods/adapters/result.hpp>

#include "flotilla/error.hpp"
#include "flotilla/model/unit.hpp"
#include "flotilla/serial.hpp"
#include "flotilla/types.hpp"

namespace flotilla {

    struct Config {
        // Movement records retained per unit.
        dp::usize log_capacity = 50;

        // Two positions closer than this on both axes count as the same spot
        // (collisions, line-of-fire).
        dp::f64 position_tolerance = 1e-9;
    };

    /// Sole owner of all units.
    ///
    /// Every operation is all-or-nothing: on error the registry and every unit are left
    /// exactly as they were. Callers only ever receive Report snapshots.
    ///
    /// Iteration order (list_reports, serials, rankings tie-break) is insertion order;
    /// rename keeps a unit in its original slot.
    class Registry {
      public:
        Registry() = default;
        explicit Registry(Config config) : config_(config) {}

        Registry(const Registry &) = delete;
        Registry &operator=(const Registry &) = delete;
        Registry(Registry &&) = default;
        Registry &operator=(Registry &&) = default;

        // -----------------------------------------------------------------------------------------
        // Lifecycle
        // -----------------------------------------------------------------------------------------

        inline Result<Report> create(const std::string &serial, Position initial = {}) {
            auto parsed = Serial::parse(serial);
            if (parsed.is_err()) {
                return Result<Report>::err(parsed.error());
            }
            if (units_.find(serial) != units_.end()) {
                return Result<Report>::err(Error::duplicate_serial("unit '" + serial + "' already registered"));
            }

            auto unit = model::Unit::make(parsed.value(), initial, config_.log_capacity);
            auto report = unit->to_report();
            units_.emplace(serial, std::move(unit));
            order_.push_back(serial);

            echo::trace("created unit ", serial, " at ", initial.x, ",", initial.y);
            return Result<Report>::ok(report);
        }

        inline Result<Report> move(const std::string &serial, const Heading &heading, dp::f64 distance) {
            auto *unit = find(serial);
            if (!unit) {
                return not_found<Report>(serial);
            }
            if (!std::isfinite(distance) || distance < 0.0) {
                return Result<Report>::err(Error::invalid_movement("distance must be a finite, non-negative number"));
            }
            if (!heading.is_valid()) {
                return Result<Report>::err(Error::invalid_movement("heading is not a unit vector"));
            }

            const auto rec = unit->apply_move(heading, distance);
            echo::trace("moved unit ", serial, " to ", rec.after.x, ",", rec.after.y);
            note_collision(*unit);
            return Result<Report>::ok(unit->to_report());
        }

        inline Result<Report> move(const std::string &serial, const std::string &direction, dp::f64 distance) {
            if (!find(serial)) {
                return not_found<Report>(serial);
            }
            auto heading = Heading::from_name(direction);
            if (heading.is_err()) {
                return Result<Report>::err(heading.error());
            }
            return move(serial, heading.value(), distance);
        }

        inline Result<Report> rename(const std::string &serial, const std::string &new_serial) {
            auto it = units_.find(serial);
            if (it == units_.end()) {
                return not_found<Report>(serial);
            }
            if (!Serial::is_valid(new_serial)) {
                return Result<Report>::err(Serial::parse(new_serial).error());
            }
            if (new_serial == serial) {
                return Result<Report>::ok(it->second->to_report());
            }
            if (units_.find(new_serial) != units_.end()) {
                return Result<Report>::err(
                    Error::duplicate_serial("cannot rename " + serial + ": '" + new_serial + "' already registered"));
            }

            // set_serial repeats the format check; on failure the node goes back under its old key.
            auto node = units_.extract(it);
            auto renamed = node.mapped()->set_serial(new_serial);
            if (renamed.is_err()) {
                units_.insert(std::move(node));
                return Result<Report>::err(renamed.error());
            }
            node.key() = new_serial;
            auto inserted = units_.insert(std::move(node));
            std::replace(order_.begin(), order_.end(), serial, new_serial);

            echo::trace("renamed unit ", serial, " -> ", new_serial);
            return Result<Report>::ok(inserted.position->second->to_report());
        }

        /// Destroys the unit. The returned report is its final state.
        inline Result<Report> remove(const std::string &serial) {
            auto it = units_.find(serial);
            if (it == units_.end()) {
                return not_found<Report>(serial);
            }
            auto last = it->second->to_report();
            units_.erase(it);
            order_.erase(std::find(order_.begin(), order_.end(), serial));

            echo::trace("removed unit ", serial);
            return Result<Report>::ok(last);
        }

        // -----------------------------------------------------------------------------------------
        // Queries
        // -----------------------------------------------------------------------------------------

        inline Result<Report> report(const std::string &serial) const {
            const auto *unit = find(serial);
            if (!unit) {
                return not_found<Report>(serial);
            }
            return Result<Report>::ok(unit->to_report());
        }

        inline dp::Vector<Report> list_reports() const {
            dp::Vector<Report> out;
            out.reserve(order_.size());
            for (const auto &serial : order_) {
                out.push_back(units_.at(serial)->to_report());
            }
            return out;
        }

        inline dp::Vector<std::string> serials() const { return order_; }

        inline bool contains(const std::string &serial) const { return units_.find(serial) != units_.end(); }
        inline dp::usize size() const { return order_.size(); }
        inline bool empty() const { return order_.empty(); }
        inline const Config &config() const { return config_; }

        /// Collisions recorded so far, oldest first. Entries outlive the units they name.
        inline const dp::Vector<Collision> &collisions() const { return collisions_; }

        // -----------------------------------------------------------------------------------------
        // Rankings (base is the origin; "height" is y). Ties go to the earliest-inserted unit.
        // -----------------------------------------------------------------------------------------

        inline Result<Report> closest() const {
            return pick([](const Position &a, const Position &b) { return a.base_distance_sq() < b.base_distance_sq(); });
        }

        inline Result<Report> furthest() const {
            return pick([](const Position &a, const Position &b) { return a.base_distance_sq() > b.base_distance_sq(); });
        }

        inline Result<Report> lowest() const {
            return pick([](const Position &a, const Position &b) { return a.y < b.y; });
        }

        inline Result<Report> highest() const {
            return pick([](const Position &a, const Position &b) { return a.y > b.y; });
        }

        /// Nearest other unit lying on the ray from `serial` along `heading`.
        ///
        /// A unit sitting on the shooter's own position counts as in line.
        inline Result<dp::Optional<Report>> first_in_line(const std::string &serial, const Heading &heading) const {
            const auto *shooter = find(serial);
            if (!shooter) {
                return not_found<dp::Optional<Report>>(serial);
            }
            if (!heading.is_valid()) {
                return Result<dp::Optional<Report>>::err(Error::invalid_movement("heading is not a unit vector"));
            }

            const auto &from = shooter->position();
            const model::Unit *hit = nullptr;
            dp::f64 hit_range = 0.0;
            for (const auto &other_serial : order_) {
                if (other_serial == serial) {
                    continue;
                }
                const auto &unit = *units_.at(other_serial);
                const dp::f64 rx = unit.position().x - from.x;
                const dp::f64 ry = unit.position().y - from.y;
                const dp::f64 along = rx * heading.dx + ry * heading.dy;
                const dp::f64 across = rx * heading.dy - ry * heading.dx;
                if (along < -config_.position_tolerance || std::fabs(across) > config_.position_tolerance) {
                    continue;
                }
                if (!hit || along < hit_range) {
                    hit = &unit;
                    hit_range = along;
                }
            }

            dp::Optional<Report> out;
            if (hit) {
                out = hit->to_report();
            }
            return Result<dp::Optional<Report>>::ok(out);
        }

      private:
        Config config_{};
        std::unordered_map<std::string, std::unique_ptr<model::Unit>> units_;
        dp::Vector<std::string> order_;
        dp::Vector<Collision> collisions_;

        inline model::Unit *find(const std::string &serial) {
            auto it = units_.find(serial);
            return it == units_.end() ? nullptr : it->second.get();
        }

        inline const model::Unit *find(const std::string &serial) const {
            auto it = units_.find(serial);
            return it == units_.end() ? nullptr : it->second.get();
        }

        template <typename T> static Result<T> not_found(const std::string &serial) {
            return Result<T>::err(Error::not_found("unit '" + serial + "' not found"));
        }

        template <typename Better> inline Result<Report> pick(Better better) const {
            if (order_.empty()) {
                return Result<Report>::err(Error::no_units("no units registered"));
            }
            const model::Unit *best = units_.at(order_[0]).get();
            for (const auto &serial : order_) {
                const auto *unit = units_.at(serial).get();
                if (better(unit->position(), best->position())) {
                    best = unit;
                }
            }
            return Result<Report>::ok(best->to_report());
        }

        inline void note_collision(const model::Unit &moved) {
            for (const auto &serial : order_) {
                if (serial == moved.serial().str()) {
                    continue;
                }
                const auto &other = *units_.at(serial);
                if (other.position().near(moved.position(), config_.position_tolerance)) {
                    collisions_.push_back(Collision{moved.serial().str(), serial, moved.position()});
                    echo::warn("unit ", moved.serial().str(), " collided with ", serial, " at ", moved.position().x,
                               ",", moved.position().y);
                    return;
                }
            }
        }
    };

} // namespace flotilla
