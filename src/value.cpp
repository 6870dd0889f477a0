#include "ebs/value.hpp"
#include "ebs/strings.hpp"
#include "ebs/diagnostics_json.hpp"
#include <sstream>

namespace ebs {

Value* ObjectValue::find(std::string_view key){
    for(auto& e : fields) if(e.key==key) return &e.value;
    for(auto& e : fields) if(iequals(e.key, key)) return &e.value;
    return nullptr;
}
const Value* ObjectValue::find(std::string_view key) const {
    return const_cast<ObjectValue*>(this)->find(key);
}
void ObjectValue::set(std::string key, Value v){
    if(Value* slot = find(key)){ *slot = std::move(v); return; }
    fields.push_back(Entry{std::move(key), std::move(v)});
}

Value* MapValue::find(std::string_view key){
    for(auto& e : entries) if(e.key==key) return &e.value;
    return nullptr;
}
const Value* MapValue::find(std::string_view key) const {
    return const_cast<MapValue*>(this)->find(key);
}
void MapValue::set(std::string key, Value v){
    if(Value* slot = find(key)){ *slot = std::move(v); return; }
    entries.push_back(Entry{std::move(key), std::move(v)});
}
bool MapValue::erase(std::string_view key){
    for(auto it = entries.begin(); it!=entries.end(); ++it){
        if(it->key==key){ entries.erase(it); return true; }
    }
    return false;
}

std::string Value::type_name() const {
    struct V {
        std::string operator()(std::monostate) const { return "null"; }
        std::string operator()(bool) const { return "bool"; }
        std::string operator()(int64_t) const { return "int"; }
        std::string operator()(double) const { return "double"; }
        std::string operator()(const std::string&) const { return "string"; }
        std::string operator()(const ArrayValue&) const { return "array"; }
        std::string operator()(const ObjectValue& o) const {
            if(o.record.empty()) return "json";
            return o.record.find('#')==std::string::npos ? o.record : "record"; // anonymous records: "record#N"
        }
        std::string operator()(const QueueValue&) const { return "queue"; }
        std::string operator()(const MapValue&) const { return "map"; }
        std::string operator()(const HandlePtr& h) const { return h ? h->kind() : "null"; }
    };
    return std::visit(V{}, data);
}

bool values_equal(const Value& a, const Value& b){
    if(a.is_number() && b.is_number()){
        if(a.is_int() && b.is_int()) return a.as_int()==b.as_int();
        return a.as_number()==b.as_number();
    }
    if(a.data.index()!=b.data.index()) return false;
    struct V {
        const Value& rhs;
        bool operator()(std::monostate) const { return true; }
        bool operator()(bool x) const { return x==rhs.as_bool(); }
        bool operator()(int64_t x) const { return x==rhs.as_int(); }
        bool operator()(double x) const { return x==rhs.as_double(); }
        bool operator()(const std::string& s) const { return s==rhs.as_string(); }
        bool operator()(const ArrayValue& x) const { return seq_equal(x.items, rhs.as_array().items); }
        bool operator()(const QueueValue& x) const { return seq_equal(x.items, rhs.as_queue().items); }
        bool operator()(const ObjectValue& x) const {
            const auto& y = rhs.as_object();
            if(x.fields.size()!=y.fields.size()) return false;
            for(const auto& e : x.fields){
                const Value* other = y.find(e.key);
                if(!other || !values_equal(e.value, *other)) return false;
            }
            return true;
        }
        bool operator()(const MapValue& x) const {
            const auto& y = rhs.as_map();
            if(x.entries.size()!=y.entries.size()) return false;
            for(const auto& e : x.entries){
                const Value* other = y.find(e.key);
                if(!other || !values_equal(e.value, *other)) return false;
            }
            return true;
        }
        bool operator()(const HandlePtr& h) const { return h==rhs.as_handle(); }
        static bool seq_equal(const std::vector<Value>& x, const std::vector<Value>& y){
            if(x.size()!=y.size()) return false;
            for(size_t i=0;i<x.size(); ++i) if(!values_equal(x[i], y[i])) return false;
            return true;
        }
    };
    return std::visit(V{b}, a.data);
}

namespace {
void write_display(std::ostringstream& os, const Value& v, bool nested){
    if(v.is_string()){ if(nested) os<<json_escape(v.as_string()); else os<<v.as_string(); return; }
    if(v.is_null()){ os<<"null"; return; }
    if(v.is_bool()){ os<<(v.as_bool()?"true":"false"); return; }
    if(v.is_int()){ os<<v.as_int(); return; }
    if(v.is_double()){ os<<format_double(v.as_double()); return; }
    if(v.is_handle()){ os<<(v.as_handle() ? v.as_handle()->describe() : std::string("null")); return; }
    auto write_seq = [&](const std::vector<Value>& items){
        os<<"[";
        for(size_t i=0;i<items.size(); ++i){ if(i) os<<", "; write_display(os, items[i], true); }
        os<<"]";
    };
    auto write_entries = [&](const std::vector<Entry>& entries){
        os<<"{";
        for(size_t i=0;i<entries.size(); ++i){
            if(i) os<<", ";
            os<<json_escape(entries[i].key)<<": ";
            write_display(os, entries[i].value, true);
        }
        os<<"}";
    };
    if(v.is_array()) write_seq(v.as_array().items);
    else if(v.is_queue()) write_seq(v.as_queue().items);
    else if(v.is_object()) write_entries(v.as_object().fields);
    else if(v.is_map()) write_entries(v.as_map().entries);
}
} // namespace

std::string display_string(const Value& v){
    std::ostringstream os;
    write_display(os, v, false);
    return os.str();
}

} // namespace ebs
