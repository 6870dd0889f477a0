#include "ebs/type_check.hpp"
#include "ebs/strings.hpp"
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace ebs {

namespace {

std::string trim(const std::string& s){
    size_t b = s.find_first_not_of(" \t\r\n");
    if(b==std::string::npos) return {};
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e-b+1);
}

std::optional<int64_t> parse_int(const std::string& text){
    std::string s = trim(text);
    if(s.empty()) return std::nullopt;
    errno = 0; char* end = nullptr;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if(errno==ERANGE || !end || *end!='\0') return std::nullopt;
    return static_cast<int64_t>(v);
}

std::optional<double> parse_double(const std::string& text){
    std::string s = trim(text);
    if(s.empty()) return std::nullopt;
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if(!end || *end!='\0') return std::nullopt;
    return v;
}

std::string prefix(const std::string& path){ return path.empty() ? std::string() : path + ": "; }

} // namespace

const RecordType& TypeChecker::record_or_throw(const DataType& t, const std::string& path) const {
    const RecordType* rec = reg_.find_record(t.name);
    if(!rec) throw TypeError(prefix(path) + "unknown record type '" + t.name + "'", {}, "E3201");
    return *rec;
}

void TypeChecker::mismatch(const DataType& t, const Value& v, const std::string& path) const {
    throw TypeError(prefix(path) + "expected " + reg_.to_string(t) + ", got " + v.type_name(), {}, "E3202");
}

std::optional<TypeError> TypeChecker::validate(const DataType& t, const Value& v) const {
    std::optional<TypeError> err;
    validate_at(t, v, "", err);
    return err;
}

bool TypeChecker::validate_at(const DataType& t, const Value& v, const std::string& path, std::optional<TypeError>& err) const {
    auto fail = [&](std::string msg, const char* code = "E3202"){ err.emplace(prefix(path) + std::move(msg), SourceLoc{}, code); return false; };
    auto expected = [&]{ return fail("expected " + reg_.to_string(t) + ", got " + v.type_name()); };
    if(v.is_null()) return true;
    switch(t.kind){
        case TypeKind::Any: case TypeKind::Json: return true;
        case TypeKind::Bool: return v.is_bool() ? true : expected();
        case TypeKind::Int: return v.is_int() ? true : expected();
        case TypeKind::Double: return v.is_number() ? true : expected();
        case TypeKind::String: return v.is_string() ? true : expected();
        case TypeKind::Handle:
            return v.is_handle() && iequals(v.as_handle()->kind(), t.name) ? true : expected();
        case TypeKind::Array: case TypeKind::Queue: {
            const std::vector<Value>* items = nullptr;
            if(t.kind==TypeKind::Array && v.is_array()) items = &v.as_array().items;
            else if(t.kind==TypeKind::Queue && v.is_queue()) items = &v.as_queue().items;
            if(!items) return expected();
            if(t.capacity && items->size() > *t.capacity)
                return fail("array of " + std::to_string(items->size()) + " elements exceeds capacity " + std::to_string(*t.capacity), "E3203");
            for(size_t i=0;i<items->size(); ++i)
                if(!validate_at(*t.elem, (*items)[i], index_path(path, i), err)) return false;
            return true;
        }
        case TypeKind::Map: {
            const std::vector<Entry>* entries = nullptr;
            if(v.is_map()) entries = &v.as_map().entries;
            else if(v.is_object() && v.as_object().record.empty()) entries = &v.as_object().fields;
            if(!entries) return expected();
            for(const auto& e : *entries){
                if(t.key && t.key->kind==TypeKind::Int && !parse_int(e.key))
                    return fail("map key '" + e.key + "' is not an int", "E3204");
                if(!validate_at(*t.elem, e.value, field_path(path, e.key), err)) return false;
            }
            return true;
        }
        case TypeKind::Record: {
            if(!v.is_object()) return expected();
            const RecordType* rec = reg_.find_record(t.name);
            if(!rec) return fail("unknown record type '" + t.name + "'", "E3201");
            const auto& obj = v.as_object();
            for(const auto& e : obj.fields){
                if(!rec->find(e.key)) return fail("field '" + e.key + "' is not declared in record type '" + reg_.to_string(t) + "'", "E3205");
            }
            for(const auto& f : rec->fields){
                const Value* fv = obj.find(f.name);
                if(!fv){ err.emplace(field_path(path, f.name) + ": missing field", SourceLoc{}, "E3206"); return false; }
                if(!validate_at(*f.type, *fv, field_path(path, f.name), err)) return false;
            }
            return true;
        }
    }
    return true;
}

Value TypeChecker::convert(const DataType& t, const Value& v) const {
    return convert_at(t, v, "");
}

Value TypeChecker::convert_at(const DataType& t, const Value& v, const std::string& path) const {
    if(v.is_null()) return default_value(t);
    switch(t.kind){
        case TypeKind::Any: case TypeKind::Json: return v;
        case TypeKind::Bool:
            if(v.is_bool()) return v;
            if(v.is_string()){
                if(iequals(trim(v.as_string()), "true")) return Value(true);
                if(iequals(trim(v.as_string()), "false")) return Value(false);
            }
            mismatch(t, v, path);
        case TypeKind::Int:
            if(v.is_int()) return v;
            if(v.is_double()){
                double d = v.as_double();
                if(std::isfinite(d) && std::trunc(d)==d && std::fabs(d) < 9.2e18) return Value(static_cast<int64_t>(d));
            }
            if(v.is_string()){ if(auto i = parse_int(v.as_string())) return Value(*i); }
            mismatch(t, v, path);
        case TypeKind::Double:
            if(v.is_double()) return v;
            if(v.is_int()) return Value(static_cast<double>(v.as_int()));
            if(v.is_string()){ if(auto d = parse_double(v.as_string())) return Value(*d); }
            mismatch(t, v, path);
        case TypeKind::String:
            if(v.is_string()) return v;
            if(v.is_bool() || v.is_number()) return Value(display_string(v));
            mismatch(t, v, path);
        case TypeKind::Handle:
            if(v.is_handle() && iequals(v.as_handle()->kind(), t.name)) return v;
            mismatch(t, v, path);
        case TypeKind::Array: case TypeKind::Queue: {
            const std::vector<Value>* items = nullptr;
            if(v.is_array()) items = &v.as_array().items;
            else if(v.is_queue()) items = &v.as_queue().items;
            if(!items) mismatch(t, v, path);
            if(t.capacity && items->size() > *t.capacity)
                throw TypeError(prefix(path) + "array of " + std::to_string(items->size()) + " elements exceeds capacity " + std::to_string(*t.capacity), {}, "E3203");
            std::vector<Value> out;
            out.reserve(t.capacity ? *t.capacity : items->size());
            for(size_t i=0;i<items->size(); ++i) out.push_back(convert_at(*t.elem, (*items)[i], index_path(path, i)));
            if(t.capacity) while(out.size() < *t.capacity) out.push_back(default_value(*t.elem));
            if(t.kind==TypeKind::Queue) return Value(QueueValue{std::move(out)});
            return make_array(std::move(out));
        }
        case TypeKind::Map: {
            const std::vector<Entry>* entries = nullptr;
            if(v.is_map()) entries = &v.as_map().entries;
            else if(v.is_object()) entries = &v.as_object().fields;
            if(!entries) mismatch(t, v, path);
            MapValue out;
            for(const auto& e : *entries){
                std::string key = e.key;
                if(t.key && t.key->kind==TypeKind::Int){
                    auto k = parse_int(key);
                    if(!k) throw TypeError(prefix(path) + "map key '" + key + "' is not an int", {}, "E3204");
                    key = std::to_string(*k);
                }
                out.set(std::move(key), convert_at(*t.elem, e.value, field_path(path, e.key)));
            }
            return Value(std::move(out));
        }
        case TypeKind::Record: return convert_record(t, v, path);
    }
    return v;
}

Value TypeChecker::convert_record(const DataType& t, const Value& v, const std::string& path) const {
    const RecordType& rec = record_or_throw(t, path);
    const std::vector<Entry>* entries = nullptr;
    if(v.is_object()) entries = &v.as_object().fields;
    else if(v.is_map()) entries = &v.as_map().entries;
    if(!entries) mismatch(t, v, path);
    // Undeclared fields are rejected rather than dropped.
    for(const auto& e : *entries){
        if(!rec.find(e.key))
            throw TypeError(prefix(path) + "field '" + e.key + "' is not declared in record type '" + reg_.to_string(t) + "'", {}, "E3205");
    }
    ObjectValue out;
    out.record = rec.name;
    out.fields.reserve(rec.fields.size());
    for(const auto& f : rec.fields){
        const Value* src = nullptr;
        for(const auto& e : *entries) if(iequals(e.key, f.name)){ src = &e.value; break; }
        Value fv = src ? convert_at(*f.type, *src, field_path(path, f.name)) : default_value(*f.type);
        out.fields.push_back(Entry{f.name, std::move(fv)});
    }
    return Value(std::move(out));
}

Value TypeChecker::default_value(const DataType& t) const {
    switch(t.kind){
        case TypeKind::Bool: return Value(false);
        case TypeKind::Int: return Value(int64_t{0});
        case TypeKind::Double: return Value(0.0);
        case TypeKind::String: return Value(std::string());
        case TypeKind::Array: {
            std::vector<Value> items;
            if(t.capacity){ items.reserve(*t.capacity); for(size_t i=0;i<*t.capacity; ++i) items.push_back(default_value(*t.elem)); }
            return make_array(std::move(items));
        }
        case TypeKind::Queue: return Value(QueueValue{});
        case TypeKind::Map: return Value(MapValue{});
        case TypeKind::Record: {
            const RecordType& rec = record_or_throw(t, "");
            ObjectValue out;
            out.record = rec.name;
            for(const auto& f : rec.fields) out.fields.push_back(Entry{f.name, default_value(*f.type)});
            return Value(std::move(out));
        }
        case TypeKind::Any: case TypeKind::Json: case TypeKind::Handle: break;
    }
    return Value();
}

} // namespace ebs
