#include "ebs/stdlib.hpp"
#include <cmath>

namespace ebs {

namespace {

// Integral results stay int when every input was int.
Value fold(std::vector<Value>& a, const char* fn, bool want_max){
    Value best;
    for(size_t i=0;i<a.size(); ++i){
        arg_number(a, i, fn);
        if(best.is_null()){ best = a[i]; continue; }
        bool better = want_max ? a[i].as_number() > best.as_number() : a[i].as_number() < best.as_number();
        if(better) best = a[i];
    }
    bool all_int = true;
    for(const auto& v : a) all_int = all_int && v.is_int();
    if(!all_int && best.is_int()) return Value(static_cast<double>(best.as_int()));
    return best;
}

Value rounded(double d, const char* fn){
    if(!std::isfinite(d) || std::fabs(d) >= 9.2e18) throw HostError(std::string(fn) + ": result out of int range", ErrorKind::Math);
    return Value(static_cast<int64_t>(d));
}

} // namespace

void register_math_builtins(BuiltinRegistry::Builder& b){
    b.add("math.abs", [](std::vector<Value>& a, ExecContext&) -> Value {
        arg_number(a, 0, "math.abs");
        if(a[0].is_int()) return Value(a[0].as_int() < 0 ? -a[0].as_int() : a[0].as_int());
        return Value(std::fabs(a[0].as_double()));
    }, 1, 1);
    b.add("math.min", [](std::vector<Value>& a, ExecContext&) -> Value { return fold(a, "math.min", false); }, 1, kVariadic);
    b.add("math.max", [](std::vector<Value>& a, ExecContext&) -> Value { return fold(a, "math.max", true); }, 1, kVariadic);
    b.add("math.floor", [](std::vector<Value>& a, ExecContext&) -> Value {
        return rounded(std::floor(arg_number(a, 0, "math.floor")), "math.floor");
    }, 1, 1);
    b.add("math.ceil", [](std::vector<Value>& a, ExecContext&) -> Value {
        return rounded(std::ceil(arg_number(a, 0, "math.ceil")), "math.ceil");
    }, 1, 1);
    b.add("math.round", [](std::vector<Value>& a, ExecContext&) -> Value {
        return rounded(std::round(arg_number(a, 0, "math.round")), "math.round");
    }, 1, 1);
    b.add("math.sqrt", [](std::vector<Value>& a, ExecContext&) -> Value {
        double d = arg_number(a, 0, "math.sqrt");
        if(d < 0) throw HostError("math.sqrt: negative argument", ErrorKind::Math);
        return Value(std::sqrt(d));
    }, 1, 1);
    b.add("math.pow", [](std::vector<Value>& a, ExecContext&) -> Value {
        return Value(std::pow(arg_number(a, 0, "math.pow"), arg_number(a, 1, "math.pow")));
    }, 2, 2);
}

} // namespace ebs
