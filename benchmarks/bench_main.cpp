#include "ebs/ebs.hpp"
#include <chrono>
#include <iostream>
#include <sstream>
#include <vector>
#include <cstdlib>

using Clock = std::chrono::steady_clock;

struct RunResult { double ms_parse; double ms_run; size_t statements; };

static RunResult bench_case(const char* name, const std::string &program, const std::shared_ptr<const ebs::BuiltinRegistry>& builtins){
    auto t0 = Clock::now();
    ebs::ProgramPtr prog;
    try {
        prog = ebs::parse(program, name);
    } catch(const ebs::ScriptError& e){
        std::cerr << "[bench] case '" << name << "' failed to parse: " << e.what() << "\n";
        return {0.0, 0.0, 0};
    }
    auto t1 = Clock::now();
    std::ostringstream sink;
    ebs::InterpreterOptions opts;
    opts.out = &sink;
    ebs::Interpreter interp(builtins, opts);
    try {
        interp.run(prog);
    } catch(const ebs::ScriptError& e){
        std::cerr << "[bench] case '" << name << "' failed at run time: " << e.what() << "\n";
    }
    auto t2 = Clock::now();
    double ms_parse = std::chrono::duration<double, std::milli>(t1 - t0).count();
    double ms_run = std::chrono::duration<double, std::milli>(t2 - t1).count();
    return { ms_parse, ms_run, prog->body.size() };
}

int main(){
    // Keep tracing off so timings measure evaluation only.
#ifdef _WIN32
    _putenv_s("EBS_TRACE_EXEC", "0");
#else
    setenv("EBS_TRACE_EXEC", "0", 1);
#endif
    auto builtins = ebs::standard_builtins();

    struct Case { const char* name; std::string prog; };
    std::vector<Case> cases;

    // Case 1: tight integer loop
    cases.push_back({
        "loop_arith",
        "var sum: int = 0;\n"
        "for (var i = 0; i < 100000; i++) { sum += i % 7; }\n"
        "return sum;\n"
    });

    // Case 2: nested record construction and conversion
    cases.push_back({
        "record_convert",
        "Point typeof record{x: int, y: int};\n"
        "Seg typeof record{a: Point, b: Point, label: string};\n"
        "var segs: Seg[] = [];\n"
        "for (var i = 0; i < 2000; i++) {\n"
        "  segs[i] = {\"a\": {\"x\": i, \"y\": \"1\"}, \"b\": {\"x\": 2, \"y\": i}, \"label\": i};\n"
        "}\n"
        "return segs.length;\n"
    });

    // Case 3: recursive calls
    cases.push_back({
        "fib",
        "function fib(n: int) return int { if n < 2 { return n; } return fib(n - 1) + fib(n - 2); }\n"
        "return fib(20);\n"
    });

    // Case 4: builtin-heavy string work
    cases.push_back({
        "strings",
        "var parts: string[] = [];\n"
        "for (var i = 0; i < 5000; i++) { call array.push(parts, str.upper(\"item\" + i)); }\n"
        "return str.length(str.join(parts, \",\"));\n"
    });

    std::cout << "name,ms_parse,ms_run,statements\n";
    for(const auto &c : cases){
        auto r = bench_case(c.name, c.prog, builtins);
        std::cout << c.name << "," << r.ms_parse << "," << r.ms_run << "," << r.statements << "\n";
    }
    return 0;
}
