#include "ebs/types.hpp"
#include "ebs/strings.hpp"
#include <functional>
#include <unordered_set>

namespace ebs {

namespace {
TypePtr make(TypeKind k){ auto t = std::make_shared<DataType>(); t->kind = k; return t; }
} // namespace

TypePtr DataType::any(){ static const TypePtr t = make(TypeKind::Any); return t; }
TypePtr DataType::boolean(){ static const TypePtr t = make(TypeKind::Bool); return t; }
TypePtr DataType::integer(){ static const TypePtr t = make(TypeKind::Int); return t; }
TypePtr DataType::floating(){ static const TypePtr t = make(TypeKind::Double); return t; }
TypePtr DataType::string(){ static const TypePtr t = make(TypeKind::String); return t; }
TypePtr DataType::json(){ static const TypePtr t = make(TypeKind::Json); return t; }

TypePtr DataType::array_of(TypePtr elem, std::optional<size_t> capacity){
    auto t = std::make_shared<DataType>(); t->kind = TypeKind::Array; t->elem = elem ? std::move(elem) : any(); t->capacity = capacity; return t;
}
TypePtr DataType::queue_of(TypePtr elem){
    auto t = std::make_shared<DataType>(); t->kind = TypeKind::Queue; t->elem = elem ? std::move(elem) : any(); return t;
}
TypePtr DataType::map_of(TypePtr key, TypePtr value){
    auto t = std::make_shared<DataType>(); t->kind = TypeKind::Map; t->key = key ? std::move(key) : string(); t->elem = value ? std::move(value) : any(); return t;
}
TypePtr DataType::record(std::string name){
    auto t = std::make_shared<DataType>(); t->kind = TypeKind::Record; t->name = std::move(name); return t;
}
TypePtr DataType::handle(std::string kind){
    auto t = std::make_shared<DataType>(); t->kind = TypeKind::Handle; t->name = std::move(kind); return t;
}

const FieldDef* RecordType::find(std::string_view field) const {
    for(const auto& f : fields) if(iequals(f.name, field)) return &f;
    return nullptr;
}

void TypeRegistry::define_record(RecordType rec){
    std::string key = to_lower(rec.name);
    if(records_.count(key)) throw TypeError("record type '" + rec.name + "' is already defined", {}, "E3101");
    std::unordered_set<std::string> seen;
    for(const auto& f : rec.fields){
        if(!seen.insert(to_lower(f.name)).second)
            throw TypeError("duplicate field '" + f.name + "' in record type '" + rec.name + "'", {}, "E3102");
    }
    records_.emplace(key, std::move(rec));
    order_.push_back(key);
    try {
        check_acyclic(key);
    } catch(const TypeError&) {
        records_.erase(key);
        order_.pop_back();
        throw;
    }
}

TypePtr TypeRegistry::define_anonymous_record(std::vector<FieldDef> fields){
    RecordType rec;
    rec.name = "record#" + std::to_string(++anon_counter_);
    rec.fields = std::move(fields);
    rec.anonymous = true;
    std::string name = rec.name;
    define_record(std::move(rec));
    return DataType::record(name);
}

const RecordType* TypeRegistry::find_record(std::string_view name) const {
    auto it = records_.find(to_lower(name));
    return it==records_.end() ? nullptr : &it->second;
}

void TypeRegistry::define_alias(const std::string& name, TypePtr type){
    std::string key = to_lower(name);
    if(aliases_.count(key)) throw TypeError("type '" + name + "' is already defined", {}, "E3103");
    // An alias whose definition names itself can only be satisfied by a record of the same name.
    std::function<bool(const DataType&)> self_ref = [&](const DataType& t)->bool{
        if(t.kind==TypeKind::Record && iequals(t.name, name) && !find_record(t.name)) return true;
        return (t.elem && self_ref(*t.elem)) || (t.key && self_ref(*t.key));
    };
    if(type && self_ref(*type)) throw TypeError("type '" + name + "' refers to itself", {}, "E3104");
    aliases_.emplace(key, std::move(type));
}

TypePtr TypeRegistry::find_alias(std::string_view name) const {
    auto it = aliases_.find(to_lower(name));
    return it==aliases_.end() ? nullptr : it->second;
}

TypePtr TypeRegistry::lookup(std::string_view name) const {
    if(auto a = find_alias(name)) return a;
    if(auto r = find_record(name)) return DataType::record(r->name);
    return nullptr;
}

void TypeRegistry::check_acyclic(const std::string& root) const {
    // Depth-first walk over record references; a name already on the path closes a cycle.
    std::vector<std::string> path;
    std::unordered_set<std::string> done;
    std::function<void(const std::string&)> visit;
    std::function<void(const DataType&)> visit_type = [&](const DataType& t){
        if(t.kind==TypeKind::Record) visit(to_lower(t.name));
        if(t.elem) visit_type(*t.elem);
        if(t.key) visit_type(*t.key);
    };
    visit = [&](const std::string& key){
        for(size_t i=0;i<path.size();++i){
            if(path[i]==key){
                std::string chain;
                for(size_t j=i;j<path.size();++j) chain += find_record(path[j])->name + " -> ";
                chain += find_record(key)->name;
                throw TypeError("record type cycle: " + chain, {}, "E3105");
            }
        }
        if(done.count(key)) return;
        auto it = records_.find(key);
        if(it==records_.end()) return; // unresolved; reported when a value is checked against it
        path.push_back(key);
        for(const auto& f : it->second.fields) if(f.type) visit_type(*f.type);
        path.pop_back();
        done.insert(key);
    };
    visit(root);
}

std::string TypeRegistry::to_string(const DataType& t) const {
    switch(t.kind){
        case TypeKind::Any: return "any";
        case TypeKind::Bool: return "bool";
        case TypeKind::Int: return "int";
        case TypeKind::Double: return "double";
        case TypeKind::String: return "string";
        case TypeKind::Json: return "json";
        case TypeKind::Handle: return t.name;
        case TypeKind::Array: {
            if(!t.capacity && (!t.elem || t.elem->kind==TypeKind::Any)) return "array";
            std::string s = to_string(t.elem);
            return t.capacity ? s + "[" + std::to_string(*t.capacity) + "]" : s + "[]";
        }
        case TypeKind::Queue:
            if(!t.elem || t.elem->kind==TypeKind::Any) return "queue";
            return "queue<" + to_string(t.elem) + ">";
        case TypeKind::Map:
            if((!t.key || t.key->kind==TypeKind::String) && (!t.elem || t.elem->kind==TypeKind::Any)) return "map";
            return "map<" + to_string(t.key) + ", " + to_string(t.elem) + ">";
        case TypeKind::Record: {
            const RecordType* rec = find_record(t.name);
            if(!rec || !rec->anonymous) return rec ? rec->name : t.name;
            std::string s = "record{";
            for(size_t i=0;i<rec->fields.size(); ++i){
                if(i) s += ", ";
                s += rec->fields[i].name + ": " + to_string(rec->fields[i].type);
            }
            return s + "}";
        }
    }
    return "any";
}

bool same_type(const DataType& a, const TypeRegistry& ra, const DataType& b, const TypeRegistry& rb){
    if(a.kind!=b.kind || a.capacity!=b.capacity) return false;
    auto same_ptr = [&](const TypePtr& x, const TypePtr& y){
        if(!x || !y) return (!x || x->kind==TypeKind::Any) && (!y || y->kind==TypeKind::Any);
        return same_type(*x, ra, *y, rb);
    };
    switch(a.kind){
        case TypeKind::Array: case TypeKind::Queue: return same_ptr(a.elem, b.elem);
        case TypeKind::Map: return same_ptr(a.key, b.key) && same_ptr(a.elem, b.elem);
        case TypeKind::Handle: return iequals(a.name, b.name);
        case TypeKind::Record: {
            const RecordType* x = ra.find_record(a.name);
            const RecordType* y = rb.find_record(b.name);
            if(!x || !y) return iequals(a.name, b.name);
            if(x->anonymous!=y->anonymous) return false;
            if(!x->anonymous && !iequals(x->name, y->name)) return false;
            if(x->fields.size()!=y->fields.size()) return false;
            for(size_t i=0;i<x->fields.size(); ++i){
                if(x->fields[i].name!=y->fields[i].name) return false;
                if(!same_ptr(x->fields[i].type, y->fields[i].type)) return false;
            }
            return true;
        }
        default: return true;
    }
}

} // namespace ebs
