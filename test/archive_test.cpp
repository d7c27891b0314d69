#include <doctest/doctest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include <flotilla/reports/archive.hpp>

namespace fs = std::filesystem;

namespace {
    struct TempArchive {
        fs::path root;

        explicit TempArchive(const std::string &name) : root(fs::temp_directory_path() / name) {
            fs::remove_all(root);
            fs::create_directories(root / "MovementReports");
            fs::create_directories(root / "Sensordata");
        }

        ~TempArchive() {
            std::error_code ec;
            fs::remove_all(root, ec);
        }

        void write(const fs::path &rel, const std::string &text) const {
            std::ofstream out(root / rel);
            out << text;
        }
    };

    flotilla::Position pos(dp::f64 x, dp::f64 y) { return flotilla::Position{x, y}; }
} // namespace

TEST_CASE("archive: registers one unit per valid report") {
    TempArchive tmp("flotilla_archive_register");
    tmp.write("MovementReports/78532608-69.txt", "up 1\n");
    tmp.write("MovementReports/41158662-03.txt", "forward 2\n");
    tmp.write("MovementReports/not-a-serial.txt", "up 1\n");

    flotilla::reports::ReportArchive archive(tmp.root);
    auto stems = archive.unit_serials();
    REQUIRE(stems.is_ok());
    REQUIRE(stems.value().size() == 3);
    CHECK(stems.value()[0] == "41158662-03");

    flotilla::Registry reg;
    REQUIRE(reg.create("41158662-03").is_ok());

    auto created = flotilla::reports::register_units(reg, archive);
    REQUIRE(created.is_ok());
    CHECK(created.value() == 1);
    CHECK(reg.size() == 2);
    CHECK(reg.contains("78532608-69"));
}

TEST_CASE("archive: replays movement orders through the registry") {
    TempArchive tmp("flotilla_archive_replay");
    tmp.write("MovementReports/78532608-69.txt", "up 5\nforward 3\nbogus line here\ndown 2\n");

    flotilla::reports::ReportArchive archive(tmp.root);
    flotilla::Registry reg;
    REQUIRE(flotilla::reports::register_units(reg, archive).is_ok());

    auto r = flotilla::reports::replay_movements(reg, archive, "78532608-69");
    REQUIRE(r.is_ok());
    CHECK(r.value().position == pos(3.0, 3.0));
    CHECK(r.value().recent_movements.size() == 3);
}

TEST_CASE("archive: replay needs a registered unit and a report") {
    TempArchive tmp("flotilla_archive_missing");
    flotilla::reports::ReportArchive archive(tmp.root);
    flotilla::Registry reg;

    auto missing_unit = flotilla::reports::replay_movements(reg, archive, "78532608-69");
    REQUIRE(missing_unit.is_err());
    CHECK(missing_unit.error().kind == flotilla::ErrorKind::NotFound);

    REQUIRE(reg.create("78532608-69").is_ok());
    auto missing_file = flotilla::reports::replay_movements(reg, archive, "78532608-69");
    REQUIRE(missing_file.is_err());
    CHECK(missing_file.error().kind == flotilla::ErrorKind::Io);
    CHECK(reg.report("78532608-69").value().recent_movements.size() == 0);
}

TEST_CASE("archive: sensor faults per unit") {
    TempArchive tmp("flotilla_archive_sensors");
    tmp.write("Sensordata/78532608-69.txt", "1101\n1111\n1101\n");

    flotilla::reports::ReportArchive archive(tmp.root);
    auto faults = archive.sensor_faults("78532608-69");
    REQUIRE(faults.is_ok());
    REQUIRE(faults.value().size() == 1);
    CHECK(faults.value()[0].occurrences == 2);

    auto none = archive.sensor_faults("41158662-03");
    REQUIRE(none.is_err());
    CHECK(none.error().kind == flotilla::ErrorKind::Io);
}

TEST_CASE("archive: missing movement directory is an io error") {
    flotilla::reports::ReportArchive archive(fs::temp_directory_path() / "flotilla_archive_does_not_exist");
    auto stems = archive.unit_serials();
    REQUIRE(stems.is_err());
    CHECK(stems.error().kind == flotilla::ErrorKind::Io);
}
