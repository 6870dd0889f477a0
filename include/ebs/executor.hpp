// Script-thread executor and the timer service that re-enters it.
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace ebs {

// One worker thread draining a FIFO of tasks: the logical thread of a script
// instance. Tasks never overlap. Work submitted from the worker itself through
// run_sync executes inline instead of deadlocking on its own queue.
class SerialExecutor {
public:
    explicit SerialExecutor(bool trace = false);
    ~SerialExecutor();
    SerialExecutor(const SerialExecutor&) = delete;
    SerialExecutor& operator=(const SerialExecutor&) = delete;

    template<typename F>
    auto submit(F f) -> std::future<std::invoke_result_t<F>> {
        using R = std::invoke_result_t<F>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::move(f));
        auto fut = task->get_future();
        post([task]{ (*task)(); });
        return fut;
    }

    template<typename F>
    auto run_sync(F f) -> std::invoke_result_t<F> {
        if(on_worker_thread()) return f();
        return submit(std::move(f)).get();
    }

    // Fire-and-forget. After shutdown the task is dropped, which breaks any
    // promise it owns.
    void post(std::function<void()> task);

    bool on_worker_thread() const { return std::this_thread::get_id()==worker_id_; }
    size_t pending() const;
    // Finishes the running task, discards queued ones and joins the worker.
    void shutdown();

private:
    void worker_loop();

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> queue_;
    bool stopping_ = false;
    bool trace_ = false;
    std::thread worker_;
    std::thread::id worker_id_;
};

// Named repeating timers. Each timer thread only posts callbacks; it never runs
// script code itself.
class TimerService {
public:
    using FireFn = std::function<void(const std::string& timer, const std::string& callback)>;

    explicit TimerService(FireFn fire, bool trace = false): fire_(std::move(fire)), trace_(trace) {}
    ~TimerService(){ stop_all(); }
    TimerService(const TimerService&) = delete;
    TimerService& operator=(const TimerService&) = delete;

    // Starting a name that is already running replaces the old timer.
    void start(const std::string& name, std::chrono::milliseconds period, const std::string& callback);
    bool stop(const std::string& name);
    bool is_running(const std::string& name) const;
    int64_t fire_count(const std::string& name) const;
    std::vector<std::string> names() const;
    void stop_all();

private:
    struct Timer {
        std::string name;
        std::string callback;
        std::chrono::milliseconds period{0};
        std::mutex m;
        std::condition_variable cv;
        bool stopped = false;
        std::atomic<int64_t> fires{0};
        std::thread th;
    };
    static void halt(const std::shared_ptr<Timer>& t);

    FireFn fire_;
    bool trace_ = false;
    mutable std::mutex mtx_;
    std::unordered_map<std::string, std::shared_ptr<Timer>> timers_;
};

} // namespace ebs
