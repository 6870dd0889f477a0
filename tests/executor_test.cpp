#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <mutex>
#include <thread>
#include "test_env.hpp"

using namespace ebs;
using namespace std::chrono_literals;

namespace {

using Clock = std::chrono::steady_clock;

struct SpanLog {
    struct Span {
        std::string tag;
        Clock::time_point enter;
        Clock::time_point exit;
    };
    std::mutex m;
    std::vector<Span> spans;
};

std::shared_ptr<const BuiltinRegistry> span_builtins(std::shared_ptr<SpanLog> log){
    BuiltinRegistry::Builder b;
    register_standard_builtins(b);
    b.add("test.span", [log](std::vector<Value>& a, ExecContext&) -> Value {
        SpanLog::Span s;
        s.tag = display_string(a.at(0));
        s.enter = Clock::now();
        std::this_thread::sleep_for(1ms);
        s.exit = Clock::now();
        std::lock_guard<std::mutex> lk(log->m);
        log->spans.push_back(std::move(s));
        return Value();
    }, 1, 1);
    return b.build();
}

// Polls until `pred` holds or the deadline passes.
template<typename Pred>
bool wait_for(Pred pred, std::chrono::milliseconds limit = 5000ms){
    auto deadline = Clock::now() + limit;
    while(Clock::now() < deadline){
        if(pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

InterpreterOptions quiet(std::ostringstream& out){
    InterpreterOptions o;
    o.out = &out;
    return o;
}

} // namespace

TEST(SerialExecutor, RunsTasksInSubmissionOrder){
    SerialExecutor ex;
    std::vector<int> order;
    std::vector<std::future<void>> done;
    for(int i=0;i<20;++i) done.push_back(ex.submit([&order, i]{ order.push_back(i); }));
    for(auto& f : done) f.get();
    ASSERT_EQ(order.size(), 20u);
    EXPECT_TRUE(std::is_sorted(order.begin(), order.end()));
}

TEST(SerialExecutor, RunSyncIsReentrantOnTheWorker){
    SerialExecutor ex;
    int v = ex.run_sync([&]{
        EXPECT_TRUE(ex.on_worker_thread());
        return ex.run_sync([]{ return 41; }) + 1;
    });
    EXPECT_EQ(v, 42);
    EXPECT_FALSE(ex.on_worker_thread());
}

TEST(SerialExecutor, ExceptionsReachTheSubmitter){
    SerialExecutor ex;
    auto f = ex.submit([]() -> int { throw InterpreterError(ErrorKind::Io, "boom"); });
    EXPECT_THROW(f.get(), InterpreterError);
    EXPECT_EQ(ex.run_sync([]{ return 1; }), 1);
}

TEST(SerialExecutor, ShutdownDropsQueuedWork){
    SerialExecutor ex;
    std::promise<void> gate;
    auto gate_future = gate.get_future().share();
    ex.post([gate_future]{ gate_future.wait(); });
    auto dropped = ex.submit([]{ return 1; });
    std::thread releaser([&]{ std::this_thread::sleep_for(20ms); gate.set_value(); });
    ex.shutdown();
    releaser.join();
    EXPECT_THROW(dropped.get(), std::future_error);
}

TEST(Callbacks, ConcurrentSubmissionsNeverInterleave){
    auto log = std::make_shared<SpanLog>();
    std::ostringstream out;
    Interpreter interp(span_builtins(log), quiet(out));
    interp.load(parse("function work(tag) {\n"
                      "  for (var i = 0; i < 4; i++) { call test.span(tag); }\n"
                      "}"));

    constexpr int kPerSource = 6;
    auto source = [&](const char* prefix){
        std::vector<std::future<Value>> pending;
        for(int i=0;i<kPerSource;++i) pending.push_back(interp.submit_callback("work", {Value(prefix + std::to_string(i))}));
        for(auto& f : pending) f.get();
    };
    std::thread a(source, "a");
    std::thread b(source, "b");
    a.join();
    b.join();

    std::lock_guard<std::mutex> lk(log->m);
    ASSERT_EQ(log->spans.size(), static_cast<size_t>(2 * kPerSource * 4));
    for(size_t i=1;i<log->spans.size(); ++i){
        EXPECT_GE(log->spans[i].enter, log->spans[i-1].exit) << "span " << i << " overlaps its predecessor";
    }
    // Each callback's spans form one contiguous run.
    for(size_t i=0;i<log->spans.size(); i+=4){
        for(size_t j=1;j<4;++j) EXPECT_EQ(log->spans[i+j].tag, log->spans[i].tag);
    }
}

TEST(Callbacks, HostCallsWaitForTheRunningUnit){
    auto log = std::make_shared<SpanLog>();
    std::ostringstream out;
    Interpreter interp(span_builtins(log), quiet(out));
    interp.load(parse("varset st inout { var n: int = 0; }\n"
                      "function bump() { call test.span(\"cb\"); st.n += 1; }\n"
                      "for (var i = 0; i < 10; i++) { call test.span(\"run\"); st.n += 1; }"));
    auto running = std::async(std::launch::async, [&]{ return interp.run(); });
    auto cb = interp.submit_callback("bump");
    running.get();
    cb.get();
    EXPECT_EQ(interp.get_var("st.n").as_int(), 11);
    std::lock_guard<std::mutex> lk(log->m);
    ASSERT_EQ(log->spans.size(), 11u);
    // The callback ran either entirely before or entirely after the unit.
    EXPECT_TRUE(log->spans.front().tag=="cb" || log->spans.back().tag=="cb");
}

TEST(Cancellation, StopRequestEndsAnInfiniteLoop){
    std::ostringstream out;
    Interpreter interp(standard_builtins(), quiet(out));
    interp.load(parse("var spins = 0;\nwhile true { spins++; }"));
    auto running = std::async(std::launch::async, [&]{ return interp.run(); });
    // Keep asking until the unit notices; a request that lands before the unit starts is reset by it.
    bool finished = wait_for([&]{
        interp.request_stop();
        return running.wait_for(0ms)==std::future_status::ready;
    });
    ASSERT_TRUE(finished);
    EXPECT_EQ(running.get().status, ExecutionResult::Status::Cancelled);
}

TEST(Cancellation, TryCannotSwallowCancellation){
    std::ostringstream out;
    Interpreter interp(standard_builtins(), quiet(out));
    interp.load(parse("while true { try { call thread.sleep(50); } exceptions { when ANY_ERROR { } } }"));
    auto running = std::async(std::launch::async, [&]{ return interp.run(); });
    ASSERT_TRUE(wait_for([&]{
        interp.request_stop();
        return running.wait_for(0ms)==std::future_status::ready;
    }));
    EXPECT_EQ(running.get().status, ExecutionResult::Status::Cancelled);
}

TEST(Timers, FireCallbacksUntilStopped){
    std::ostringstream out;
    Interpreter interp(standard_builtins(), quiet(out));
    interp.run(parse("varset st inout { var ticks: int = 0; var last: string; }\n"
                     "function on_tick(timer) {\n"
                     "  st.ticks += 1;\n"
                     "  st.last = timer;\n"
                     "  if st.ticks >= 3 { call thread.timerstop(timer); }\n"
                     "}\n"
                     "function pump_running() { return thread.timerisrunning(\"pump\"); }\n"
                     "call thread.timerstart(\"pump\", 10, \"on_tick\");"));
    ASSERT_TRUE(wait_for([&]{ return interp.get_var("st.ticks").as_int() >= 3; }));
    EXPECT_EQ(interp.get_var("st.last").as_string(), "pump");
    std::this_thread::sleep_for(60ms);
    int64_t settled = interp.get_var("st.ticks").as_int();
    std::this_thread::sleep_for(60ms);
    EXPECT_EQ(interp.get_var("st.ticks").as_int(), settled);
    EXPECT_FALSE(interp.call_function("pump_running").as_bool());
}

TEST(Timers, CallbackErrorsReachTheHook){
    std::ostringstream out;
    std::mutex m;
    std::vector<std::string> failures;
    InterpreterOptions opts = quiet(out);
    opts.on_callback_error = [&](const std::string& function, const ScriptError& e){
        std::lock_guard<std::mutex> lk(m);
        failures.push_back(function + ": " + e.message());
    };
    Interpreter interp(standard_builtins(), opts);
    interp.run(parse("function broken(timer) { call thread.timerstop(timer); raise exception MATH_ERROR(\"bad tick\"); }\n"
                     "call thread.timerstart(\"t\", 5, \"broken\");"));
    ASSERT_TRUE(wait_for([&]{ std::lock_guard<std::mutex> lk(m); return !failures.empty(); }));
    std::lock_guard<std::mutex> lk(m);
    EXPECT_EQ(failures.front(), "broken: bad tick");
}

TEST(TimerService, StartStopAndReplace){
    std::mutex m;
    std::vector<std::string> fired;
    TimerService timers([&](const std::string& timer, const std::string& callback){
        std::lock_guard<std::mutex> lk(m);
        fired.push_back(timer + ":" + callback);
    });
    timers.start("a", 5ms, "first");
    timers.start("a", 5ms, "second");
    EXPECT_TRUE(timers.is_running("a"));
    ASSERT_TRUE(wait_for([&]{ return timers.fire_count("a") >= 2; }));
    EXPECT_TRUE(timers.stop("a"));
    EXPECT_FALSE(timers.stop("a"));
    EXPECT_FALSE(timers.is_running("a"));
    std::lock_guard<std::mutex> lk(m);
    ASSERT_FALSE(fired.empty());
    EXPECT_EQ(fired.back(), "a:second");
}
