/*
 * Tests for applier.hpp: report mapping, idempotence and sink failures.
 */

#include <catch2/catch.hpp>
#include "applier.hpp"
#include "test_support.hpp"

using namespace deck_relay;
using deck_relay::test::RecordingPadSink;

TEST_CASE("applier - maps sticks, triggers and buttons onto the report", "[applier]") {
    ButtonSet b;
    b.set(Button::A, true);
    b.set(Button::DpadUp, true);
    StateModel s(0.5f, -0.3f, 1.0f, -1.0f, 1.0f, 0.5f, b, 1000);

    PadReport r = toReport(s);
    REQUIRE(r.thumb_lx == 16384);
    REQUIRE(r.thumb_ly == -9830);
    REQUIRE(r.thumb_rx == 32767);
    REQUIRE(r.thumb_ry == -32767);
    REQUIRE(r.left_trigger == 255);
    REQUIRE(r.right_trigger == 128);
    REQUIRE(r.buttons == (0x1000 | 0x0001));
}

TEST_CASE("applier - neutral state gives an empty report", "[applier]") {
    PadReport r = toReport(StateModel());
    REQUIRE(r == PadReport());
}

TEST_CASE("applier - applying the same state twice submits identical reports", "[applier][idempotent]") {
    RecordingPadSink sink;
    Applier applier(sink);

    ButtonSet b;
    b.set(Button::RB, true);
    StateModel s(-0.25f, 0.75f, 0.1f, 0.0f, 0.3f, 0.0f, b, 42);

    REQUIRE(applier.apply(s) == SinkError::None);
    REQUIRE(applier.apply(s) == SinkError::None);

    auto reports = sink.reports();
    REQUIRE(reports.size() == 2);
    REQUIRE(reports[0] == reports[1]);
    REQUIRE(applier.lastReport() == reports[1]);
    REQUIRE(applier.appliedCount() == 2);
}

TEST_CASE("applier - sink not created is NotReady", "[applier][error]") {
    RecordingPadSink sink;
    sink.setReady(false);
    Applier applier(sink);

    REQUIRE(applier.apply(StateModel()) == SinkError::NotReady);
    REQUIRE(sink.count() == 0);

    // Later states go through once the device exists
    sink.setReady(true);
    REQUIRE(applier.apply(StateModel()) == SinkError::None);
    REQUIRE(sink.count() == 1);
}

TEST_CASE("applier - write failures are reported", "[applier][error]") {
    RecordingPadSink sink;
    sink.setFailWrites(true);
    Applier applier(sink);

    REQUIRE(applier.apply(StateModel()) == SinkError::WriteFailure);
    REQUIRE(applier.appliedCount() == 0);
    REQUIRE(std::string(sinkErrorName(SinkError::WriteFailure)) == "write failure");
}
