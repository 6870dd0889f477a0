#include "ebs/stdlib.hpp"
#include "ebs/executor.hpp"
#include <algorithm>
#include <chrono>
#include <thread>

namespace ebs {

void register_thread_builtins(BuiltinRegistry::Builder& b){
    // timerstart(name, periodMs, callback): `callback(name)` is queued every period.
    b.add("thread.timerstart", [](std::vector<Value>& a, ExecContext& ctx) -> Value {
        const std::string& name = arg_string(a, 0, "thread.timerstart");
        int64_t period = arg_int(a, 1, "thread.timerstart");
        const std::string& callback = arg_string(a, 2, "thread.timerstart");
        if(name.empty()) throw HostError("thread.timerstart: timer name is empty", ErrorKind::Validation);
        if(period <= 0) throw HostError("thread.timerstart: period must be positive, got " + std::to_string(period), ErrorKind::Validation);
        ctx.timers().start(name, std::chrono::milliseconds(period), callback);
        return Value(name);
    }, 3, 3);
    b.add("thread.timerstop", [](std::vector<Value>& a, ExecContext& ctx) -> Value {
        return Value(ctx.timers().stop(arg_string(a, 0, "thread.timerstop")));
    }, 1, 1);
    b.add("thread.timerisrunning", [](std::vector<Value>& a, ExecContext& ctx) -> Value {
        return Value(ctx.timers().is_running(arg_string(a, 0, "thread.timerisrunning")));
    }, 1, 1);
    // Sleeps in short slices so a stop request is noticed.
    b.add("thread.sleep", [](std::vector<Value>& a, ExecContext& ctx) -> Value {
        int64_t ms = arg_int(a, 0, "thread.sleep");
        if(ms < 0) throw HostError("thread.sleep: negative duration", ErrorKind::Validation);
        auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
        while(!ctx.stop_requested()){
            auto now = std::chrono::steady_clock::now();
            if(now >= until) break;
            std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(until - now, std::chrono::milliseconds(10)));
        }
        return Value();
    }, 1, 1);
}

} // namespace ebs
