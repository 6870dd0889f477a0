#include "ebs/executor.hpp"
#include <algorithm>
#include <cstdio>

namespace ebs {

SerialExecutor::SerialExecutor(bool trace): trace_(trace) {
    worker_ = std::thread([this]{ worker_loop(); });
    worker_id_ = worker_.get_id();
}

SerialExecutor::~SerialExecutor(){ shutdown(); }

void SerialExecutor::post(std::function<void()> task){
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if(stopping_) return;
        queue_.push_back(std::move(task));
        if(trace_) std::fprintf(stderr, "[callback][queue] posted depth=%zu\n", queue_.size());
    }
    cv_.notify_one();
}

size_t SerialExecutor::pending() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return queue_.size();
}

void SerialExecutor::shutdown(){
    std::deque<std::function<void()>> dropped;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if(stopping_ && !worker_.joinable()) return;
        stopping_ = true;
        dropped.swap(queue_);
    }
    cv_.notify_all();
    if(worker_.joinable() && !on_worker_thread()) worker_.join();
    if(trace_ && !dropped.empty()) std::fprintf(stderr, "[callback][queue] shutdown dropped %zu task(s)\n", dropped.size());
}

void SerialExecutor::worker_loop(){
    while(true){
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lk(mtx_);
            cv_.wait(lk, [&]{ return stopping_ || !queue_.empty(); });
            if(stopping_) return;
            task = std::move(queue_.front());
            queue_.pop_front();
        }
        task();
    }
}

void TimerService::start(const std::string& name, std::chrono::milliseconds period, const std::string& callback){
    auto t = std::make_shared<Timer>();
    t->name = name;
    t->callback = callback;
    t->period = period;
    FireFn fire = fire_;
    bool trace = trace_;
    t->th = std::thread([t, fire, trace]{
        std::unique_lock<std::mutex> lk(t->m);
        auto next = std::chrono::steady_clock::now() + t->period;
        while(!t->cv.wait_until(lk, next, [&]{ return t->stopped; })){
            lk.unlock();
            if(trace) std::fprintf(stderr, "[timer][fire] %s -> %s\n", t->name.c_str(), t->callback.c_str());
            fire(t->name, t->callback);
            ++t->fires;
            lk.lock();
            next += t->period;
        }
    });
    std::shared_ptr<Timer> old;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = timers_.find(name);
        if(it!=timers_.end()){ old = it->second; it->second = t; }
        else timers_.emplace(name, t);
    }
    if(old) halt(old);
    if(trace_) std::fprintf(stderr, "[timer][start] %s every %lldms\n", name.c_str(), static_cast<long long>(period.count()));
}

void TimerService::halt(const std::shared_ptr<Timer>& t){
    {
        std::lock_guard<std::mutex> lk(t->m);
        t->stopped = true;
    }
    t->cv.notify_all();
    if(t->th.joinable()){
        if(t->th.get_id()==std::this_thread::get_id()) t->th.detach();
        else t->th.join();
    }
}

bool TimerService::stop(const std::string& name){
    std::shared_ptr<Timer> t;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = timers_.find(name);
        if(it==timers_.end()) return false;
        t = it->second;
        timers_.erase(it);
    }
    halt(t);
    if(trace_) std::fprintf(stderr, "[timer][stop] %s\n", name.c_str());
    return true;
}

bool TimerService::is_running(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return timers_.count(name) > 0;
}

int64_t TimerService::fire_count(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = timers_.find(name);
    return it==timers_.end() ? 0 : it->second->fires.load();
}

std::vector<std::string> TimerService::names() const {
    std::vector<std::string> out;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        for(const auto& kv : timers_) out.push_back(kv.first);
    }
    std::sort(out.begin(), out.end());
    return out;
}

void TimerService::stop_all(){
    std::unordered_map<std::string, std::shared_ptr<Timer>> all;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        all.swap(timers_);
    }
    for(auto& kv : all) halt(kv.second);
}

} // namespace ebs
