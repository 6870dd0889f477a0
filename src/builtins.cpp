#include "ebs/builtins.hpp"
#include "ebs/strings.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace ebs {

namespace {

bool valid_segment(std::string_view s){
    if(s.empty()) return false;
    if(!(std::isalpha((unsigned char)s[0]) || s[0]=='_')) return false;
    for(char c : s) if(!(std::isalnum((unsigned char)c) || c=='_')) return false;
    return true;
}

bool valid_name(std::string_view name){
    size_t dot = name.find('.');
    if(dot==std::string_view::npos) return false;
    size_t start = 0;
    while(true){
        size_t end = name.find('.', start);
        if(!valid_segment(name.substr(start, end==std::string_view::npos ? std::string_view::npos : end - start))) return false;
        if(end==std::string_view::npos) return true;
        start = end + 1;
    }
}

[[noreturn]] void bad_arg(const char* fn, size_t i, const char* want, const Value& got){
    throw HostError(std::string(fn) + ": argument " + std::to_string(i + 1) + " must be " + want + ", got " + got.type_name(), ErrorKind::Type);
}

} // namespace

BuiltinRegistry::Builder& BuiltinRegistry::Builder::add(std::string_view name, BuiltinFn fn, size_t min_args, size_t max_args, bool writes_back){
    if(!valid_name(name)) throw registry_error("invalid builtin name '" + std::string(name) + "' (expected namespace.function)");
    if(!fn) throw registry_error("builtin '" + std::string(name) + "' has no handler");
    if(min_args > max_args) throw registry_error("builtin '" + std::string(name) + "' has min arity above max arity");
    std::string key = to_lower(name);
    if(entries_.count(key)) throw registry_error("builtin '" + std::string(name) + "' is already registered");
    entries_.emplace(key, BuiltinEntry{key, std::move(fn), min_args, max_args, writes_back});
    return *this;
}

bool BuiltinRegistry::Builder::contains(std::string_view name) const {
    return entries_.count(to_lower(name)) > 0;
}

std::shared_ptr<const BuiltinRegistry> BuiltinRegistry::Builder::build(){
    auto reg = std::shared_ptr<BuiltinRegistry>(new BuiltinRegistry());
    reg->entries_ = std::move(entries_);
    entries_.clear();
    return reg;
}

const BuiltinEntry* BuiltinRegistry::find(std::string_view name) const {
    auto it = entries_.find(to_lower(name));
    return it==entries_.end() ? nullptr : &it->second;
}

std::vector<std::string> BuiltinRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for(const auto& kv : entries_) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
}

std::shared_ptr<const BuiltinRegistry> BuiltinRegistry::empty(){
    static const std::shared_ptr<const BuiltinRegistry> none = Builder().build();
    return none;
}

const std::string& arg_string(const std::vector<Value>& args, size_t i, const char* fn){
    if(i >= args.size() || !args[i].is_string()) bad_arg(fn, i, "a string", i < args.size() ? args[i] : Value());
    return args[i].as_string();
}

int64_t arg_int(const std::vector<Value>& args, size_t i, const char* fn){
    if(i < args.size()){
        if(args[i].is_int()) return args[i].as_int();
        if(args[i].is_double() && std::trunc(args[i].as_double())==args[i].as_double()) return static_cast<int64_t>(args[i].as_double());
    }
    bad_arg(fn, i, "an int", i < args.size() ? args[i] : Value());
}

double arg_number(const std::vector<Value>& args, size_t i, const char* fn){
    if(i >= args.size() || !args[i].is_number()) bad_arg(fn, i, "a number", i < args.size() ? args[i] : Value());
    return args[i].as_number();
}

bool arg_bool(const std::vector<Value>& args, size_t i, const char* fn){
    if(i >= args.size() || !args[i].is_bool()) bad_arg(fn, i, "a bool", i < args.size() ? args[i] : Value());
    return args[i].as_bool();
}

} // namespace ebs
