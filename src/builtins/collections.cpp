#include "ebs/stdlib.hpp"
#include <algorithm>

namespace ebs {

namespace {

std::vector<Value>& array_arg(std::vector<Value>& a, const char* fn){
    if(a[0].is_null()) throw HostError(std::string(fn) + ": array is null", ErrorKind::Null);
    if(!a[0].is_array()) throw HostError(std::string(fn) + ": argument 1 must be an array, got " + a[0].type_name(), ErrorKind::Type);
    return a[0].as_array().items;
}

std::vector<Value>& queue_arg(std::vector<Value>& a, const char* fn){
    if(a[0].is_null()) throw HostError(std::string(fn) + ": queue is null", ErrorKind::Null);
    if(!a[0].is_queue()) throw HostError(std::string(fn) + ": argument 1 must be a queue, got " + a[0].type_name(), ErrorKind::Type);
    return a[0].as_queue().items;
}

// Maps and plain JSON objects share the keyed builtins.
std::vector<Entry>& keyed_arg(std::vector<Value>& a, const char* fn){
    if(a[0].is_null()) throw HostError(std::string(fn) + ": map is null", ErrorKind::Null);
    if(a[0].is_map()) return a[0].as_map().entries;
    if(a[0].is_object()) return a[0].as_object().fields;
    throw HostError(std::string(fn) + ": argument 1 must be a map, got " + a[0].type_name(), ErrorKind::Type);
}

std::string key_arg(const std::vector<Value>& a, size_t i){
    return a[i].is_string() ? a[i].as_string() : display_string(a[i]);
}

std::vector<Entry>::iterator find_key(std::vector<Entry>& entries, const std::string& key){
    return std::find_if(entries.begin(), entries.end(), [&](const Entry& e){ return e.key==key; });
}

size_t index_arg(const std::vector<Value>& a, size_t i, size_t limit, const char* fn){
    int64_t idx = arg_int(a, i, fn);
    if(idx < 0 || static_cast<size_t>(idx) > limit)
        throw HostError(std::string(fn) + ": index " + std::to_string(idx) + " out of range", ErrorKind::Index);
    return static_cast<size_t>(idx);
}

bool contains(const std::vector<Value>& items, const Value& v){
    for(const auto& it : items) if(values_equal(it, v)) return true;
    return false;
}

bool less_than(const Value& x, const Value& y){
    if(x.is_number() && y.is_number()) return x.as_number() < y.as_number();
    if(x.is_string() && y.is_string()) return x.as_string() < y.as_string();
    throw HostError("array.sort: cannot order " + x.type_name() + " and " + y.type_name(), ErrorKind::Type);
}

void register_array(BuiltinRegistry::Builder& b){
    b.add("array.push", [](std::vector<Value>& a, ExecContext&) -> Value {
        array_arg(a, "array.push").push_back(a[1]);
        return Value();
    }, 2, 2, true);
    b.add("array.pop", [](std::vector<Value>& a, ExecContext&) -> Value {
        auto& items = array_arg(a, "array.pop");
        if(items.empty()) throw HostError("array.pop: array is empty", ErrorKind::Index);
        Value last = std::move(items.back());
        items.pop_back();
        return last;
    }, 1, 1, true);
    b.add("array.insert", [](std::vector<Value>& a, ExecContext&) -> Value {
        auto& items = array_arg(a, "array.insert");
        size_t at = index_arg(a, 1, items.size(), "array.insert");
        items.insert(items.begin() + static_cast<std::ptrdiff_t>(at), a[2]);
        return Value();
    }, 3, 3, true);
    b.add("array.remove", [](std::vector<Value>& a, ExecContext&) -> Value {
        auto& items = array_arg(a, "array.remove");
        if(items.empty()) throw HostError("array.remove: array is empty", ErrorKind::Index);
        size_t at = index_arg(a, 1, items.size() - 1, "array.remove");
        Value removed = std::move(items[at]);
        items.erase(items.begin() + static_cast<std::ptrdiff_t>(at));
        return removed;
    }, 2, 2, true);
    b.add("array.indexof", [](std::vector<Value>& a, ExecContext&) -> Value {
        const auto& items = array_arg(a, "array.indexof");
        for(size_t i=0;i<items.size(); ++i) if(values_equal(items[i], a[1])) return Value(static_cast<int64_t>(i));
        return Value(int64_t{-1});
    }, 2, 2);
    b.add("array.contains", [](std::vector<Value>& a, ExecContext&) -> Value {
        return Value(contains(array_arg(a, "array.contains"), a[1]));
    }, 2, 2);
    b.add("array.size", [](std::vector<Value>& a, ExecContext&) -> Value {
        return Value(static_cast<int64_t>(array_arg(a, "array.size").size()));
    }, 1, 1);
    b.add("array.clear", [](std::vector<Value>& a, ExecContext&) -> Value {
        array_arg(a, "array.clear").clear();
        return Value();
    }, 1, 1, true);
    // sort(arr[, descending])
    b.add("array.sort", [](std::vector<Value>& a, ExecContext&) -> Value {
        auto& items = array_arg(a, "array.sort");
        bool descending = a.size() > 1 && arg_bool(a, 1, "array.sort");
        std::stable_sort(items.begin(), items.end(), [&](const Value& x, const Value& y){
            return descending ? less_than(y, x) : less_than(x, y);
        });
        return Value();
    }, 1, 2, true);
}

void register_queue(BuiltinRegistry::Builder& b){
    b.add("queue.enqueue", [](std::vector<Value>& a, ExecContext&) -> Value {
        queue_arg(a, "queue.enqueue").push_back(a[1]);
        return Value();
    }, 2, 2, true);
    // Empty queue yields null.
    b.add("queue.dequeue", [](std::vector<Value>& a, ExecContext&) -> Value {
        auto& items = queue_arg(a, "queue.dequeue");
        if(items.empty()) return Value();
        Value front = std::move(items.front());
        items.erase(items.begin());
        return front;
    }, 1, 1, true);
    b.add("queue.peek", [](std::vector<Value>& a, ExecContext&) -> Value {
        const auto& items = queue_arg(a, "queue.peek");
        return items.empty() ? Value() : items.front();
    }, 1, 1);
    b.add("queue.isempty", [](std::vector<Value>& a, ExecContext&) -> Value {
        return Value(queue_arg(a, "queue.isempty").empty());
    }, 1, 1);
    b.add("queue.size", [](std::vector<Value>& a, ExecContext&) -> Value {
        return Value(static_cast<int64_t>(queue_arg(a, "queue.size").size()));
    }, 1, 1);
    b.add("queue.clear", [](std::vector<Value>& a, ExecContext&) -> Value {
        queue_arg(a, "queue.clear").clear();
        return Value();
    }, 1, 1, true);
    b.add("queue.contains", [](std::vector<Value>& a, ExecContext&) -> Value {
        return Value(contains(queue_arg(a, "queue.contains"), a[1]));
    }, 2, 2);
    b.add("queue.toarray", [](std::vector<Value>& a, ExecContext&) -> Value {
        return make_array(queue_arg(a, "queue.toarray"));
    }, 1, 1);
}

void register_map(BuiltinRegistry::Builder& b){
    b.add("map.put", [](std::vector<Value>& a, ExecContext&) -> Value {
        auto& entries = keyed_arg(a, "map.put");
        std::string key = key_arg(a, 1);
        auto it = find_key(entries, key);
        if(it!=entries.end()) it->value = a[2];
        else entries.push_back(Entry{key, a[2]});
        return Value();
    }, 3, 3, true);
    b.add("map.get", [](std::vector<Value>& a, ExecContext&) -> Value {
        auto& entries = keyed_arg(a, "map.get");
        auto it = find_key(entries, key_arg(a, 1));
        if(it!=entries.end()) return it->value;
        return a.size() > 2 ? a[2] : Value();
    }, 2, 3);
    b.add("map.has", [](std::vector<Value>& a, ExecContext&) -> Value {
        auto& entries = keyed_arg(a, "map.has");
        return Value(find_key(entries, key_arg(a, 1))!=entries.end());
    }, 2, 2);
    b.add("map.remove", [](std::vector<Value>& a, ExecContext&) -> Value {
        auto& entries = keyed_arg(a, "map.remove");
        auto it = find_key(entries, key_arg(a, 1));
        if(it==entries.end()) return Value();
        Value removed = std::move(it->value);
        entries.erase(it);
        return removed;
    }, 2, 2, true);
    b.add("map.keys", [](std::vector<Value>& a, ExecContext&) -> Value {
        std::vector<Value> keys;
        for(const auto& e : keyed_arg(a, "map.keys")) keys.emplace_back(e.key);
        return make_array(std::move(keys));
    }, 1, 1);
    b.add("map.values", [](std::vector<Value>& a, ExecContext&) -> Value {
        std::vector<Value> values;
        for(const auto& e : keyed_arg(a, "map.values")) values.push_back(e.value);
        return make_array(std::move(values));
    }, 1, 1);
    b.add("map.size", [](std::vector<Value>& a, ExecContext&) -> Value {
        return Value(static_cast<int64_t>(keyed_arg(a, "map.size").size()));
    }, 1, 1);
}

} // namespace

void register_collection_builtins(BuiltinRegistry::Builder& b){
    register_array(b);
    register_queue(b);
    register_map(b);
}

} // namespace ebs
