/*
 * pipeline_test.cpp
 *
 * End-to-end tests: commands enter through the inbound channel, flow
 * through the router and both dispatchers on their own threads, and reach
 * a recording remote session.
 *
 * Exit code: 0 = all tests passed, non-zero = failure.
 */

#include "exec/cancellation.hpp"
#include "exec/primitives/channel.hpp"
#include "modules/dispatch/pipeline.hpp"
#include "support/recording_session.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <glog/logging.h>

using namespace cmdpipe;
using namespace cmdpipe::model;
using namespace cmdpipe::modules::dispatch;
using cmdpipe::exec::CancellationToken;
using cmdpipe::exec::primitives::make_channel;
using cmdpipe::modules::remote::ExecutionContext;
using cmdpipe::testing::RecordedCall;
using cmdpipe::testing::RecordingSession;

// ---------------------------------------------------------------------------
// Minimal test harness (same conventions as channel_test.cpp)
// ---------------------------------------------------------------------------

static int g_total  = 0;
static int g_passed = 0;
static int g_failed = 0;

#define TEST(name) static void name()

#define RUN(name)                                          \
    do {                                                   \
        ++g_total;                                         \
        std::printf("  %-55s", #name " ");                 \
        name();                                            \
        ++g_passed;                                        \
        std::printf("PASS\n");                             \
    } while (0)

#define EXPECT(cond)                                               \
    do {                                                           \
        if (!(cond)) {                                             \
            ++g_failed;                                            \
            std::printf("FAIL\n  assertion failed: %s\n"          \
                        "  at %s:%d\n", #cond, __FILE__, __LINE__);\
            std::abort();                                          \
        }                                                          \
    } while (0)

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static ExecutionContext context_for(const std::shared_ptr<RecordingSession>& session) {
    ExecutionContext ctx;
    ctx.session = session;
    return ctx;
}

// Feeds the commands, closes the inbound channel and waits for everything.
struct Run {
    std::shared_ptr<RecordingSession> session = std::make_shared<RecordingSession>();
    PipelineConfig config{};

    void operator()(const std::vector<Command>& commands) {
        auto [tx, rx] = make_channel<Command>();
        Pipeline pipeline(std::move(rx), context_for(session), config);
        pipeline.start();
        for (const auto& cmd : commands) {
            EXPECT(tx.send(cmd));
        }
        tx.close();
        pipeline.join();
        pipeline.drain_workers();

        EXPECT(pipeline.finished());
        EXPECT(pipeline.shutdown_token().is_cancelled());
        dropped_finished  = pipeline.droppable_stats().finished();
        ordered_finished  = pipeline.guaranteed_stats().finished();
        aborted           = pipeline.droppable_stats().aborted.load() +
                            pipeline.guaranteed_stats().aborted.load();
    }

    std::vector<RecordedCall> of(const std::string& method) const {
        std::vector<RecordedCall> out;
        for (auto& call : session->calls()) {
            if (call.method == method) out.push_back(call);
        }
        return out;
    }

    uint64_t dropped_finished{0};
    uint64_t ordered_finished{0};
    uint64_t aborted{0};
};

// ---------------------------------------------------------------------------
// Scenarios
// ---------------------------------------------------------------------------

TEST(test_small_resize_is_floored_end_to_end) {
    Run run;
    run({Resize{5, 1}});

    const auto resizes = run.of("ui_try_resize");
    EXPECT(resizes.size() == 1u);
    EXPECT(resizes[0].a == 10 && resizes[0].b == 3);
    EXPECT(run.dropped_finished == 1u);
}

TEST(test_guaranteed_order_end_to_end) {
    Run run;
    run.session->set_latency(std::chrono::milliseconds(10));
    run({Keyboard{"a"}, Keyboard{"b"}, Quit{}});

    const auto calls = run.session->calls();
    EXPECT(calls.size() == 3u);
    EXPECT(calls[0].text == "a");
    EXPECT(calls[1].text == "b");
    EXPECT(calls[2].text == "qa!");
    EXPECT(run.session->max_in_flight() == 1);
    EXPECT(run.ordered_finished == 3u);
}

TEST(test_focus_lost_failure_is_contained_end_to_end) {
    Run run;
    run.session->fail("command");
    run({FocusLost{}, Keyboard{"j"}});

    const auto commands = run.of("command");
    EXPECT(commands.size() == 1u);
    EXPECT(commands[0].text ==
           "if exists('#FocusLost') | doautocmd <nomodeline> FocusLost | endif");
    EXPECT(run.of("input").size() == 1u);
    EXPECT(run.aborted == 1u);
}

TEST(test_failed_file_drop_is_silent_end_to_end) {
    Run run;
    run.session->fail("command");
    run({FileDrop{"/tmp/x.txt"}, Keyboard{"dd"}, Keyboard{"u"}});

    const auto commands = run.of("command");
    EXPECT(commands.size() == 1u);
    EXPECT(commands[0].text == "e /tmp/x.txt");
    const auto inputs = run.of("input");
    EXPECT(inputs.size() == 2u);
    EXPECT(inputs[0].text == "dd" && inputs[1].text == "u");
    EXPECT(run.aborted == 0u);
}

// Droppable commands interleaved with guaranteed ones: the guaranteed
// subsequence is intact; the final resize always reaches the session.
TEST(test_mixed_stream_keeps_guaranteed_order_and_final_state) {
    Run run;
    run.config.worker_threads = 1;  // droppable executions in submission order

    std::vector<Command> commands;
    for (uint32_t i = 0; i < 200; ++i) {
        commands.push_back(Resize{100 + i, 50 + i});
        if (i % 20 == 0) {
            commands.push_back(Keyboard{std::to_string(i)});
        }
    }
    run(commands);

    const auto inputs = run.of("input");
    EXPECT(inputs.size() == 10u);
    for (std::size_t k = 0; k < inputs.size(); ++k) {
        EXPECT(inputs[k].text == std::to_string(k * 20));
    }

    const auto resizes = run.of("ui_try_resize");
    EXPECT(!resizes.empty());
    EXPECT(resizes.size() <= 200u);
    EXPECT(resizes.back().a == 299 && resizes.back().b == 249);
}

// ---------------------------------------------------------------------------
// Shutdown
// ---------------------------------------------------------------------------

TEST(test_inbound_closure_shuts_everything_down) {
    auto session = std::make_shared<RecordingSession>();
    auto [tx, rx] = make_channel<Command>();
    CancellationToken shutdown;

    Pipeline pipeline(std::move(rx), context_for(session), PipelineConfig{}, shutdown);
    pipeline.start();
    EXPECT(!shutdown.is_cancelled());

    tx.close();
    pipeline.join();

    EXPECT(shutdown.is_cancelled());
    EXPECT(pipeline.finished());
    EXPECT(pipeline.heartbeat(0) >= 1u);
    EXPECT(pipeline.heartbeat(1) >= 1u);
    EXPECT(pipeline.heartbeat(2) >= 1u);
    EXPECT(session->count() == 0u);
}

// A harness-owned token cancelled up front: the pipeline winds down without
// the inbound channel ever closing.
TEST(test_injected_cancellation_stops_pipeline) {
    auto session = std::make_shared<RecordingSession>();
    auto [tx, rx] = make_channel<Command>();
    CancellationToken shutdown;
    shutdown.cancel();

    Pipeline pipeline(std::move(rx), context_for(session), PipelineConfig{}, shutdown);
    pipeline.start();
    pipeline.join();

    EXPECT(pipeline.finished());
    EXPECT(pipeline.router().routed_guaranteed() == 0u);
    EXPECT(session->count() == 0u);
    EXPECT(tx.is_open());
}

TEST(test_independent_pipelines_do_not_share_shutdown) {
    auto [tx1, rx1] = make_channel<Command>();
    auto [tx2, rx2] = make_channel<Command>();
    auto s1 = std::make_shared<RecordingSession>();
    auto s2 = std::make_shared<RecordingSession>();

    Pipeline p1(std::move(rx1), context_for(s1));
    Pipeline p2(std::move(rx2), context_for(s2));
    p1.start();
    p2.start();

    tx1.close();
    p1.join();
    EXPECT(p1.shutdown_token().is_cancelled());
    EXPECT(!p2.shutdown_token().is_cancelled());

    EXPECT(tx2.send(Keyboard{"still alive"}));
    EXPECT(s2->wait_for(1));
    tx2.close();
    p2.join();
}

// ---------------------------------------------------------------------------
// Configuration
// ---------------------------------------------------------------------------

TEST(test_config_rejects_zero_workers) {
    auto [tx, rx] = make_channel<Command>();
    PipelineConfig config{};
    config.worker_threads = 0;
    bool thrown = false;
    try {
        Pipeline pipeline(std::move(rx), context_for(std::make_shared<RecordingSession>()), config);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    EXPECT(thrown);
}

TEST(test_config_rejects_missing_session) {
    auto [tx, rx] = make_channel<Command>();
    bool thrown = false;
    try {
        Pipeline pipeline(std::move(rx), ExecutionContext{});
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    EXPECT(thrown);
}

TEST(test_config_resize_minimums_reach_execution) {
    Run run;
    run.config.min_width  = 40;
    run.config.min_height = 12;
    run({Resize{5, 1}});

    const auto resizes = run.of("ui_try_resize");
    EXPECT(resizes.size() == 1u);
    EXPECT(resizes[0].a == 40 && resizes[0].b == 12);
}

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------

int main(int, char** argv) {
    FLAGS_logtostderr = true;
    google::InitGoogleLogging(argv[0]);

    std::printf("=== pipeline end-to-end tests ===\n\n");

    std::printf("--- scenarios ---\n");
    RUN(test_small_resize_is_floored_end_to_end);
    RUN(test_guaranteed_order_end_to_end);
    RUN(test_focus_lost_failure_is_contained_end_to_end);
    RUN(test_failed_file_drop_is_silent_end_to_end);
    RUN(test_mixed_stream_keeps_guaranteed_order_and_final_state);

    std::printf("\n--- shutdown ---\n");
    RUN(test_inbound_closure_shuts_everything_down);
    RUN(test_injected_cancellation_stops_pipeline);
    RUN(test_independent_pipelines_do_not_share_shutdown);

    std::printf("\n--- configuration ---\n");
    RUN(test_config_rejects_zero_workers);
    RUN(test_config_rejects_missing_session);
    RUN(test_config_resize_minimums_reach_execution);

    std::printf("\n=== Results: %d/%d passed ===\n", g_passed, g_total);
    return (g_failed == 0) ? 0 : 1;
}
