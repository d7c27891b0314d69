#include <argu/argu.hpp>
#include <echo/echo.hpp>
#include <flotilla.hpp>

#include <cstdlib>
#include <iostream>
#include <string>

namespace {
    void print_unit(const char *label, const flotilla::Result<flotilla::Report> &res) {
        if (res.is_err()) {
            echo(label, ": ", res.error().message);
            return;
        }
        const auto &r = res.value();
        echo(label, ": ", r.serial, " at ", r.position.x, ",", r.position.y);
    }
} // namespace

int main(int argc, char *argv[]) {

    std::string root;
    std::string limit_arg;
    auto cmd = argu::Command("fleet_showcase")
                   .version("0.1.0")
                   .about("Register units from a report archive, replay their movements and print fleet state")
                   .auto_exit()
                   .arg(argu::Arg("root")
                            .positional()
                            .help("Archive directory holding MovementReports/ and Sensordata/")
                            .value_of(root)
                            .value_name("ROOT")
                            .default_value("."))
                   .arg(argu::Arg("limit")
                            .positional()
                            .help("Replay at most this many units (0 = all)")
                            .value_of(limit_arg)
                            .value_name("LIMIT")
                            .default_value("0"));

    auto result = cmd.parse(argc, argv);
    if (!result) {
        return result.exit();
    }

    const auto limit = static_cast<dp::usize>(std::strtoul(limit_arg.c_str(), nullptr, 10));

    flotilla::Registry registry;
    flotilla::reports::ReportArchive archive(root);

    auto registered = flotilla::reports::register_units(registry, archive);
    if (registered.is_err()) {
        std::cerr << "failed to load archive: " << registered.error().message << "\n";
        return 1;
    }
    echo("Registered ", registered.value(), " units from ", archive.root().string());

    dp::usize replayed = 0;
    std::string last;
    for (const auto &serial : registry.serials()) {
        if (limit != 0 && replayed >= limit) {
            break;
        }
        auto res = flotilla::reports::replay_movements(registry, archive, serial);
        if (res.is_err()) {
            std::cerr << "replay error: " << res.error().message << "\n";
            continue;
        }
        last = serial;
        ++replayed;
    }
    echo("Replayed movements for ", replayed, " units");

    if (!last.empty()) {
        auto rep = registry.report(last);
        if (rep.is_ok()) {
            echo("Movement log for ", last, " (", rep.value().recent_movements.size(), "/",
                 registry.config().log_capacity, " entries):");
            for (const auto &m : rep.value().recent_movements) {
                echo("  ", m.before.x, ",", m.before.y, " -> ", m.after.x, ",", m.after.y, " dist=", m.distance);
            }
        }

        auto faults = archive.sensor_faults(last);
        if (faults.is_ok()) {
            echo("Sensor fault patterns for ", last, ": ", faults.value().size());
            for (const auto &f : faults.value()) {
                echo("  failed=", f.failed_sensors, " seen=", f.occurrences);
            }
        } else {
            echo("Sensor faults unavailable: ", faults.error().message);
        }
    }

    if (registry.collisions().empty()) {
        echo("Collisions: none");
    }
    for (const auto &c : registry.collisions()) {
        echo("Collision: ", c.serial, " hit ", c.other, " at ", c.position.x, ",", c.position.y);
    }

    print_unit("Closest", registry.closest());
    print_unit("Furthest", registry.furthest());
    print_unit("Highest", registry.highest());
    print_unit("Lowest", registry.lowest());

    dp::usize blocked = 0;
    for (const auto &serial : registry.serials()) {
        auto line = registry.first_in_line(serial, flotilla::Heading::east());
        if (line.is_ok() && line.value().has_value()) {
            ++blocked;
        }
    }
    echo(registry.size() - blocked, " units have a clear line of fire east, ", blocked, " blocked");

    return 0;
}
