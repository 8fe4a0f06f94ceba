// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 AutoZ Project
// Dual-Point Prober Tests
//
// Verifies: fixed move/probe order at hop height, probe offset applied to
// XY targets, envelope check before motion, no-trigger abort with hop,
// motion error propagation, re-entrancy guard, state machine end states.

#include <gtest/gtest.h>
#include "calibration/dual_point_prober.h"
#include "fake_machine.h"

#include <cmath>
#include <vector>

using autoz::CalError;
using autoz::CalibrationConfig;
using autoz::CalStatus;
using autoz::DualPointProber;
using autoz::ProbePoint;
using autoz::ProbeSample;
using autoz::Vec2;
using autoz::hal::MotionError;
using autoz::test::FakeMachine;

static constexpr float kNan = NAN;

// ============================================================================
// Nominal Sequence
// ============================================================================

TEST(DualPointProber, SequenceOrderAndTargets) {
    FakeMachine m;
    m.probeResults = {2.00f, 2.80f};
    const CalibrationConfig cfg = autoz::test::make_test_config();
    DualPointProber prober(m, m);

    ProbeSample endstop;
    ProbeSample bed;
    const CalStatus status = prober.probe_two_points(cfg, &endstop, &bed);

    ASSERT_TRUE(status.ok());
    EXPECT_EQ(prober.state(), DualPointProber::State::DONE);

    // hop, xy endstop, hop, xy bed, hop
    ASSERT_EQ(m.moves.size(), 5u);
    EXPECT_TRUE(m.is_hop(m.moves[0], 10.0f));
    EXPECT_FLOAT_EQ(m.moves[0].speed, 15.0f);

    EXPECT_TRUE(m.is_xy_move(m.moves[1]));
    EXPECT_TRUE(std::isnan(m.moves[1].z));
    EXPECT_FLOAT_EQ(m.moves[1].x, 257.5f);   // 232.5 - (-25)
    EXPECT_FLOAT_EQ(m.moves[1].y, 300.0f);
    EXPECT_FLOAT_EQ(m.moves[1].speed, 50.0f);

    EXPECT_TRUE(m.is_hop(m.moves[2], 10.0f));

    EXPECT_FLOAT_EQ(m.moves[3].x, 175.0f);
    EXPECT_FLOAT_EQ(m.moves[3].y, 150.0f);
    EXPECT_FLOAT_EQ(m.moves[3].speed, 50.0f);

    EXPECT_TRUE(m.is_hop(m.moves[4], 10.0f));
    EXPECT_FLOAT_EQ(m.z, 10.0f);

    ASSERT_EQ(m.probes.size(), 2u);
    EXPECT_EQ(m.probes[0], Vec2(257.5f, 300.0f));
    EXPECT_EQ(m.probes[1], Vec2(175.0f, 150.0f));

    // Samples are tagged with the probe tip position, not the toolhead
    EXPECT_EQ(endstop.point, ProbePoint::ENDSTOP);
    EXPECT_EQ(endstop.position, cfg.endstopPosition);
    EXPECT_FLOAT_EQ(endstop.z, 2.00f);
    EXPECT_EQ(bed.point, ProbePoint::BED);
    EXPECT_EQ(bed.position, cfg.centerPosition);
    EXPECT_FLOAT_EQ(bed.z, 2.80f);
}

TEST(DualPointProber, CanRunAgainAfterDone) {
    FakeMachine m;
    m.probeResults = {2.0f, 2.5f, 2.1f, 2.6f};
    const CalibrationConfig cfg = autoz::test::make_test_config();
    DualPointProber prober(m, m);

    ProbeSample endstop;
    ProbeSample bed;
    ASSERT_TRUE(prober.probe_two_points(cfg, &endstop, &bed).ok());
    ASSERT_TRUE(prober.probe_two_points(cfg, &endstop, &bed).ok());
    EXPECT_FLOAT_EQ(endstop.z, 2.1f);
    EXPECT_FLOAT_EQ(bed.z, 2.6f);
    EXPECT_EQ(m.moves.size(), 10u);
}

struct HookLog {
    std::vector<ProbePoint> points;
    std::vector<size_t> moveCountAtCall;
    FakeMachine* machine;
};

static void record_point(ProbePoint point, void* ctx) {
    HookLog* log = static_cast<HookLog*>(ctx);
    log->points.push_back(point);
    log->moveCountAtCall.push_back(log->machine->moves.size());
}

TEST(DualPointProber, PointHookBeforeEachTravel) {
    FakeMachine m;
    m.probeResults = {2.0f, 2.5f};
    const CalibrationConfig cfg = autoz::test::make_test_config();
    DualPointProber prober(m, m);

    HookLog log{{}, {}, &m};
    prober.set_point_hook(record_point, &log);

    ProbeSample endstop;
    ProbeSample bed;
    ASSERT_TRUE(prober.probe_two_points(cfg, &endstop, &bed).ok());

    ASSERT_EQ(log.points.size(), 2u);
    EXPECT_EQ(log.points[0], ProbePoint::ENDSTOP);
    EXPECT_EQ(log.points[1], ProbePoint::BED);
    EXPECT_EQ(log.moveCountAtCall[0], 1u);  // after first hop
    EXPECT_EQ(log.moveCountAtCall[1], 3u);  // after hop following endstop probe
}

// ============================================================================
// No Trigger
// ============================================================================

TEST(DualPointProber, EndstopNoTriggerHopsAndAborts) {
    FakeMachine m;   // no scripted results: first probe times out
    const CalibrationConfig cfg = autoz::test::make_test_config();
    DualPointProber prober(m, m);

    ProbeSample endstop;
    endstop.z = -99.0f;
    ProbeSample bed;
    const CalStatus status = prober.probe_two_points(cfg, &endstop, &bed);

    EXPECT_EQ(status.error, CalError::PROBE_NO_TRIGGER);
    EXPECT_EQ(status.point, ProbePoint::ENDSTOP);
    EXPECT_FALSE(status.recoveryFailed);
    EXPECT_EQ(prober.state(), DualPointProber::State::ABORTED);
    EXPECT_FALSE(prober.is_active());

    // hop, xy endstop, recovery hop; bed never visited
    ASSERT_EQ(m.moves.size(), 3u);
    EXPECT_TRUE(m.is_hop(m.moves.back(), 10.0f));
    EXPECT_FLOAT_EQ(m.z, 10.0f);
    EXPECT_EQ(m.probes.size(), 1u);
    EXPECT_FLOAT_EQ(endstop.z, -99.0f);  // discarded
}

TEST(DualPointProber, BedNoTriggerDiscardsEndstopSample) {
    FakeMachine m;
    m.probeResults = {2.0f, kNan};
    const CalibrationConfig cfg = autoz::test::make_test_config();
    DualPointProber prober(m, m);

    ProbeSample endstop;
    ProbeSample bed;
    const CalStatus status = prober.probe_two_points(cfg, &endstop, &bed);

    EXPECT_EQ(status.error, CalError::PROBE_NO_TRIGGER);
    EXPECT_EQ(status.point, ProbePoint::BED);
    EXPECT_EQ(endstop.point, ProbePoint::NONE);
    // hop, xy endstop, hop, xy bed, recovery hop
    ASSERT_EQ(m.moves.size(), 5u);
    EXPECT_TRUE(m.is_hop(m.moves.back(), 10.0f));
}

// ============================================================================
// Out of Range
// ============================================================================

TEST(DualPointProber, EndstopOutOfRangeBeforeAnyMotion) {
    FakeMachine m;
    m.probeResults = {2.0f, 2.5f};
    CalibrationConfig cfg = autoz::test::make_test_config();
    cfg.endstopPosition = Vec2(290.0f, 300.0f);   // toolhead x = 315
    DualPointProber prober(m, m);

    ProbeSample endstop;
    ProbeSample bed;
    const CalStatus status = prober.probe_two_points(cfg, &endstop, &bed);

    EXPECT_EQ(status.error, CalError::PROBE_OUT_OF_RANGE);
    EXPECT_EQ(status.point, ProbePoint::ENDSTOP);
    EXPECT_TRUE(m.moves.empty());
    EXPECT_TRUE(m.probes.empty());
}

TEST(DualPointProber, BedOutOfRangeBeforeAnyMotion) {
    FakeMachine m;
    m.probeResults = {2.0f, 2.5f};
    CalibrationConfig cfg = autoz::test::make_test_config();
    cfg.centerPosition = Vec2(150.0f, 301.0f);
    DualPointProber prober(m, m);

    ProbeSample endstop;
    ProbeSample bed;
    const CalStatus status = prober.probe_two_points(cfg, &endstop, &bed);

    EXPECT_EQ(status.error, CalError::PROBE_OUT_OF_RANGE);
    EXPECT_EQ(status.point, ProbePoint::BED);
    EXPECT_TRUE(m.moves.empty());
}

TEST(DualPointProber, RejectsNonPositiveHopSpeed) {
    FakeMachine m;
    CalibrationConfig cfg = autoz::test::make_test_config();
    cfg.hopSpeed = 0.0f;
    DualPointProber prober(m, m);

    ProbeSample endstop;
    ProbeSample bed;
    EXPECT_EQ(prober.probe_two_points(cfg, &endstop, &bed).error, CalError::INVALID_CONFIG);
    EXPECT_TRUE(m.moves.empty());
}

TEST(DualPointProber, RejectsHopAboveZMax) {
    FakeMachine m;
    CalibrationConfig cfg = autoz::test::make_test_config();
    cfg.hopHeight = 300.0f;
    DualPointProber prober(m, m);

    ProbeSample endstop;
    ProbeSample bed;
    EXPECT_EQ(prober.probe_two_points(cfg, &endstop, &bed).error, CalError::INVALID_CONFIG);
    EXPECT_TRUE(m.moves.empty());
}

// ============================================================================
// Motion Errors
// ============================================================================

TEST(DualPointProber, FirstHopFailureNoRecoveryMove) {
    FakeMachine m;
    m.probeResults = {2.0f, 2.5f};
    m.failMoveIndex = 0;
    m.failMoveWith = MotionError::NOT_HOMED;
    const CalibrationConfig cfg = autoz::test::make_test_config();
    DualPointProber prober(m, m);

    ProbeSample endstop;
    ProbeSample bed;
    const CalStatus status = prober.probe_two_points(cfg, &endstop, &bed);

    EXPECT_EQ(status.error, CalError::MOTION_FAILED);
    EXPECT_EQ(status.motion, MotionError::NOT_HOMED);
    EXPECT_EQ(m.moves.size(), 1u);
    EXPECT_TRUE(m.probes.empty());
}

TEST(DualPointProber, TravelFailurePropagatedWithRecoveryHop) {
    FakeMachine m;
    m.probeResults = {2.0f, 2.5f};
    m.failMoveIndex = 1;
    m.failMoveWith = MotionError::ABORTED;
    const CalibrationConfig cfg = autoz::test::make_test_config();
    DualPointProber prober(m, m);

    ProbeSample endstop;
    ProbeSample bed;
    const CalStatus status = prober.probe_two_points(cfg, &endstop, &bed);

    EXPECT_EQ(status.error, CalError::MOTION_FAILED);
    EXPECT_EQ(status.motion, MotionError::ABORTED);
    ASSERT_EQ(m.moves.size(), 3u);
    EXPECT_TRUE(m.is_hop(m.moves[2], 10.0f));
    EXPECT_TRUE(m.probes.empty());
    EXPECT_EQ(prober.state(), DualPointProber::State::ABORTED);
}

TEST(DualPointProber, FailedRecoveryHopFlagged) {
    FakeMachine m;        // endstop probe times out
    m.failMoveIndex = 2;  // recovery hop
    const CalibrationConfig cfg = autoz::test::make_test_config();
    DualPointProber prober(m, m);

    ProbeSample endstop;
    ProbeSample bed;
    const CalStatus status = prober.probe_two_points(cfg, &endstop, &bed);

    // Original cause kept, recovery failure carried alongside
    EXPECT_EQ(status.error, CalError::PROBE_NO_TRIGGER);
    EXPECT_EQ(status.point, ProbePoint::ENDSTOP);
    EXPECT_TRUE(status.recoveryFailed);
    EXPECT_EQ(m.moves.size(), 3u);
}

TEST(DualPointProber, HopFailureIsNotRetried) {
    FakeMachine m;
    m.probeResults = {2.0f, 2.5f};
    m.failMoveIndex = 2;   // hop after endstop probe
    const CalibrationConfig cfg = autoz::test::make_test_config();
    DualPointProber prober(m, m);

    ProbeSample endstop;
    ProbeSample bed;
    const CalStatus status = prober.probe_two_points(cfg, &endstop, &bed);

    EXPECT_EQ(status.error, CalError::MOTION_FAILED);
    EXPECT_EQ(status.motion, MotionError::FAULT);
    EXPECT_EQ(m.moves.size(), 3u);
    EXPECT_EQ(m.probes.size(), 1u);
}

// ============================================================================
// Re-entrancy
// ============================================================================

class ReentrantMachine : public FakeMachine {
public:
    DualPointProber* prober = nullptr;
    const CalibrationConfig* cfg = nullptr;
    CalStatus nested;
    bool nestedCalled = false;

    MotionError move_to(float tx, float ty, float tz, float speed) override {
        if (!nestedCalled && prober != nullptr) {
            nestedCalled = true;
            ProbeSample a;
            ProbeSample b;
            nested = prober->probe_two_points(*cfg, &a, &b);
        }
        return FakeMachine::move_to(tx, ty, tz, speed);
    }
};

TEST(DualPointProber, NestedCallReturnsBusy) {
    ReentrantMachine m;
    m.probeResults = {2.0f, 2.5f};
    const CalibrationConfig cfg = autoz::test::make_test_config();
    DualPointProber prober(m, m);
    m.prober = &prober;
    m.cfg = &cfg;

    ProbeSample endstop;
    ProbeSample bed;
    const CalStatus status = prober.probe_two_points(cfg, &endstop, &bed);

    ASSERT_TRUE(m.nestedCalled);
    EXPECT_EQ(m.nested.error, CalError::BUSY);
    EXPECT_TRUE(status.ok());
    EXPECT_EQ(m.moves.size(), 5u);
}

TEST(DualPointProber, StateNames) {
    EXPECT_STREQ(DualPointProber::state_name(DualPointProber::State::IDLE), "IDLE");
    EXPECT_STREQ(DualPointProber::state_name(DualPointProber::State::PROBED_BED), "PROBED_BED");
    EXPECT_STREQ(DualPointProber::state_name(DualPointProber::State::ABORTED), "ABORTED");
}
