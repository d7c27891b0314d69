#include <doctest/doctest.h>

#include <flotilla/model/movement_log.hpp>

namespace {
    flotilla::MovementRecord step_east(dp::f64 from_x) {
        flotilla::MovementRecord r;
        r.before = flotilla::Position{from_x, 0.0};
        r.after = flotilla::Position{from_x + 1.0, 0.0};
        r.heading = flotilla::Heading::east();
        r.distance = 1.0;
        return r;
    }
} // namespace

TEST_CASE("movement_log: keeps records in insertion order below capacity") {
    flotilla::model::MovementLog log(4);
    CHECK(log.empty());
    CHECK(log.latest() == nullptr);

    log.append(step_east(0.0));
    log.append(step_east(1.0));

    const auto snap = log.snapshot();
    REQUIRE(snap.size() == 2);
    CHECK(snap[0] == step_east(0.0));
    CHECK(snap[1] == step_east(1.0));
    CHECK(log.capacity() == 4);
    REQUIRE(log.latest() != nullptr);
    CHECK(*log.latest() == step_east(1.0));
}

TEST_CASE("movement_log: evicts oldest once full") {
    flotilla::model::MovementLog log(3);
    for (int i = 0; i < 7; ++i) {
        log.append(step_east(static_cast<dp::f64>(i)));
    }

    const auto snap = log.snapshot();
    REQUIRE(snap.size() == 3);
    CHECK(snap[0] == step_east(4.0));
    CHECK(snap[1] == step_east(5.0));
    CHECK(snap[2] == step_east(6.0));
    CHECK(*log.latest() == step_east(6.0));
}

TEST_CASE("movement_log: zero capacity drops everything") {
    flotilla::model::MovementLog log(0);
    log.append(step_east(0.0));
    log.append(step_east(1.0));

    CHECK(log.size() == 0);
    CHECK(log.snapshot().size() == 0);
    CHECK(log.latest() == nullptr);
}

TEST_CASE("movement_log: snapshot is a copy") {
    flotilla::model::MovementLog log(2);
    log.append(step_east(0.0));

    const auto before = log.snapshot();
    log.append(step_east(1.0));
    log.append(step_east(2.0));

    REQUIRE(before.size() == 1);
    CHECK(before[0] == step_east(0.0));
}
