#include "ebs/stdlib.hpp"
#include "ebs/strings.hpp"
#include "ebs/type_check.hpp"
#include <cctype>

namespace ebs {

namespace {

std::string trim(const std::string& s){
    size_t b = 0, e = s.size();
    while(b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while(e > b && std::isspace(static_cast<unsigned char>(s[e-1]))) --e;
    return s.substr(b, e - b);
}

size_t checked_pos(int64_t pos, size_t size, const char* fn, const char* what){
    if(pos < 0 || static_cast<size_t>(pos) > size)
        throw HostError(std::string(fn) + ": " + what + " " + std::to_string(pos) + " out of range for length " + std::to_string(size), ErrorKind::Index);
    return static_cast<size_t>(pos);
}

} // namespace

void register_string_builtins(BuiltinRegistry::Builder& b){
    b.add("str.length", [](std::vector<Value>& a, ExecContext&) -> Value {
        return Value(static_cast<int64_t>(arg_string(a, 0, "str.length").size()));
    }, 1, 1);
    b.add("str.upper", [](std::vector<Value>& a, ExecContext&) -> Value {
        return Value(to_upper(arg_string(a, 0, "str.upper")));
    }, 1, 1);
    b.add("str.lower", [](std::vector<Value>& a, ExecContext&) -> Value {
        return Value(to_lower(arg_string(a, 0, "str.lower")));
    }, 1, 1);
    b.add("str.trim", [](std::vector<Value>& a, ExecContext&) -> Value {
        return Value(trim(arg_string(a, 0, "str.trim")));
    }, 1, 1);
    // substring(s, begin[, end]); end is exclusive.
    b.add("str.substring", [](std::vector<Value>& a, ExecContext&) -> Value {
        const std::string& s = arg_string(a, 0, "str.substring");
        size_t begin = checked_pos(arg_int(a, 1, "str.substring"), s.size(), "str.substring", "begin index");
        size_t end = a.size() > 2 && !a[2].is_null() ? checked_pos(arg_int(a, 2, "str.substring"), s.size(), "str.substring", "end index") : s.size();
        if(end < begin) throw HostError("str.substring: end index precedes begin index", ErrorKind::Index);
        return Value(s.substr(begin, end - begin));
    }, 2, 3);
    b.add("str.indexof", [](std::vector<Value>& a, ExecContext&) -> Value {
        const std::string& s = arg_string(a, 0, "str.indexof");
        const std::string& needle = arg_string(a, 1, "str.indexof");
        size_t from = a.size() > 2 ? checked_pos(arg_int(a, 2, "str.indexof"), s.size(), "str.indexof", "start index") : 0;
        size_t pos = s.find(needle, from);
        return Value(pos==std::string::npos ? int64_t{-1} : static_cast<int64_t>(pos));
    }, 2, 3);
    b.add("str.contains", [](std::vector<Value>& a, ExecContext&) -> Value {
        return Value(arg_string(a, 0, "str.contains").find(arg_string(a, 1, "str.contains"))!=std::string::npos);
    }, 2, 2);
    b.add("str.startswith", [](std::vector<Value>& a, ExecContext&) -> Value {
        const std::string& s = arg_string(a, 0, "str.startswith");
        const std::string& p = arg_string(a, 1, "str.startswith");
        return Value(s.compare(0, p.size(), p)==0 && s.size() >= p.size());
    }, 2, 2);
    b.add("str.endswith", [](std::vector<Value>& a, ExecContext&) -> Value {
        const std::string& s = arg_string(a, 0, "str.endswith");
        const std::string& p = arg_string(a, 1, "str.endswith");
        return Value(s.size() >= p.size() && s.compare(s.size() - p.size(), p.size(), p)==0);
    }, 2, 2);
    // Replaces every occurrence.
    b.add("str.replace", [](std::vector<Value>& a, ExecContext&) -> Value {
        std::string s = arg_string(a, 0, "str.replace");
        const std::string& from = arg_string(a, 1, "str.replace");
        const std::string& to = arg_string(a, 2, "str.replace");
        if(from.empty()) return Value(s);
        size_t pos = 0;
        while((pos = s.find(from, pos))!=std::string::npos){
            s.replace(pos, from.size(), to);
            pos += to.size();
        }
        return Value(s);
    }, 3, 3);
    b.add("str.split", [](std::vector<Value>& a, ExecContext&) -> Value {
        const std::string& s = arg_string(a, 0, "str.split");
        const std::string& sep = arg_string(a, 1, "str.split");
        std::vector<Value> parts;
        if(sep.empty()){
            for(char c : s) parts.emplace_back(std::string(1, c));
            return make_array(std::move(parts));
        }
        size_t start = 0, pos;
        while((pos = s.find(sep, start))!=std::string::npos){
            parts.emplace_back(s.substr(start, pos - start));
            start = pos + sep.size();
        }
        parts.emplace_back(s.substr(start));
        return make_array(std::move(parts));
    }, 2, 2);
    b.add("str.join", [](std::vector<Value>& a, ExecContext&) -> Value {
        if(!a[0].is_array()) throw HostError("str.join: argument 1 must be an array, got " + a[0].type_name(), ErrorKind::Type);
        std::string sep = a.size() > 1 ? arg_string(a, 1, "str.join") : std::string();
        std::string out;
        const auto& items = a[0].as_array().items;
        for(size_t i=0;i<items.size(); ++i){
            if(i) out += sep;
            out += display_string(items[i]);
        }
        return Value(out);
    }, 1, 2);
    b.add("str.tostring", [](std::vector<Value>& a, ExecContext&) -> Value {
        return Value(display_string(a[0]));
    }, 1, 1);
    b.add("str.toint", [](std::vector<Value>& a, ExecContext& ctx) -> Value {
        try {
            return TypeChecker(ctx.types()).convert(*DataType::integer(), a[0]);
        } catch(const TypeError& e) {
            throw HostError("str.toint: " + e.message(), ErrorKind::Type);
        }
    }, 1, 1);
    b.add("str.todouble", [](std::vector<Value>& a, ExecContext& ctx) -> Value {
        try {
            return TypeChecker(ctx.types()).convert(*DataType::floating(), a[0]);
        } catch(const TypeError& e) {
            throw HostError("str.todouble: " + e.message(), ErrorKind::Type);
        }
    }, 1, 1);
}

} // namespace ebs
