///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "../opencl/opencl_evaluator.hpp"
#include "../opencl/opencl_solver.hpp"
#include "../sequential/sequential_solver.hpp"
#include "../sequential/single_day_search.hpp"
#include "demo_instances.hpp"
#include "test_helpers.hpp"
#include "doctest.h"
#include <memory>
#include <stdexcept>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/// Device context, or null when this machine has no usable OpenCL platform.
static std::unique_ptr<BusyOverlapOpenCLContext> openDevice() {
    try {
        return std::unique_ptr<BusyOverlapOpenCLContext>(new BusyOverlapOpenCLContext());
    } catch (const std::runtime_error& e) {
        MESSAGE("OpenCL unavailable: " << e.what());
        return nullptr;
    }
}


///////////////////////////
///        TESTS        ///
///////////////////////////
TEST_CASE("OpenCL evaluator: Device table matches host table") {
    std::unique_ptr<BusyOverlapOpenCLContext> device = openDevice();
    if (!device) return;

    DemoScenario demo = makeDemoScenario(DemoSize::M);
    const std::vector<Participant>& roster = demo.request.participants;
    BusySnapshot busy = demo.calendar.fetch(roster, busyFetchRange(demo.request));
    std::vector<TimeChunk> windows = requestSessionWindows(demo.request);
    BusyOverlapTable expected = buildBusyOverlapTable(roster, busy, windows, demo.request.options);

    for (int batchSize : {1, 7, 512}) {
        INFO("batchSize=" << batchSize);
        BusyOverlapTable table(roster.size(), windows);
        device->fillOverlapTable(table, roster, busy, demo.request.options, batchSize);

        REQUIRE(table.windows().size() == expected.windows().size());
        for (size_t p = 0; p < roster.size(); ++p) {
            for (const TimeChunk& w : table.windows()) {
                CHECK(table.find(p, w.start, w.end) == expected.find(p, w.start, w.end));
            }
        }
    }
}

TEST_CASE("OpenCL evaluator: Touching busy time is not an overlap") {
    std::unique_ptr<BusyOverlapOpenCLContext> device = openDevice();
    if (!device) return;

    std::vector<Participant> roster = {makeTestParticipant("a"), makeTestParticipant("b")};
    BusySnapshot busy;
    busy["a"] = {makeBusy("ev-1", at(monday(), 10), at(monday(), 11))};
    busy["b"] = {makeBusy("ev-2", at(monday(), 9, 30), at(monday(), 9, 45))};
    std::vector<TimeChunk> windows = {{at(monday(), 9), at(monday(), 10)}, {at(monday(), 10), at(monday(), 11)}};

    BusyOverlapTable table(roster.size(), windows);
    device->fillOverlapTable(table, roster, busy, SearchOptions{}, 1);

    CHECK(table.find(0, windows[0].start, windows[0].end) == false);
    CHECK(table.find(0, windows[1].start, windows[1].end) == true);
    CHECK(table.find(1, windows[0].start, windows[0].end) == true);
    CHECK(table.find(1, windows[1].start, windows[1].end) == false);
}

TEST_CASE("OpenCL solver: Matches sequential solver") {
    if (!openDevice()) return;

    DemoScenario demo = makeDemoScenario(DemoSize::S);
    BusySnapshot busy = demo.calendar.fetch(demo.request.participants, busyFetchRange(demo.request));

    SequentialSlotSolver sequential;
    OpenCLPrefilterSolver device(64);
    SlotSearchResult expected = sequential.findSlots(demo.request, busy);
    SlotSearchResult actual = device.findSlots(demo.request, busy);

    REQUIRE(actual.combinations.size() == expected.combinations.size());
    for (size_t i = 0; i < expected.combinations.size(); ++i) {
        CHECK(actual.combinations[i].id == expected.combinations[i].id);
    }
}
