#include "ebs/stdlib.hpp"
#include "ebs/diagnostics_json.hpp"
#include "ebs/parser.hpp"
#include "ebs/strings.hpp"
#include <charconv>
#include <cmath>

namespace ebs {

namespace {

// JSON text is parsed with the script expression grammar; only literal nodes are accepted.
Value literal_value(const Expr& e){
    if(auto lit = std::get_if<LiteralExpr>(&e.data)) return lit->value;
    if(auto arr = std::get_if<ArrayLiteral>(&e.data)){
        std::vector<Value> items;
        items.reserve(arr->elements.size());
        for(const auto& el : arr->elements) items.push_back(literal_value(*el));
        return make_array(std::move(items));
    }
    if(auto obj = std::get_if<ObjectLiteral>(&e.data)){
        ObjectValue out;
        for(const auto& kv : obj->entries) out.fields.push_back(Entry{kv.first, literal_value(*kv.second)});
        return Value(std::move(out));
    }
    if(auto u = std::get_if<UnaryExpr>(&e.data)){
        if(u->op==UnaryOp::Neg){
            Value v = literal_value(*u->operand);
            if(v.is_int()) return Value(-v.as_int());
            if(v.is_double()) return Value(-v.as_double());
        }
    }
    throw HostError("json.parse: unexpected expression at line " + std::to_string(e.loc.line) + ", column " + std::to_string(e.loc.col), ErrorKind::Parse);
}

void stringify(const Value& v, std::string& out){
    struct V {
        std::string& out;
        void operator()(std::monostate){ out += "null"; }
        void operator()(bool b){ out += b ? "true" : "false"; }
        void operator()(int64_t i){ out += std::to_string(i); }
        void operator()(double d){ out += std::isfinite(d) ? format_double(d) : std::string("null"); }
        void operator()(const std::string& s){ out += json_escape(s); }
        void operator()(const ArrayValue& a){ list(a.items); }
        void operator()(const QueueValue& q){ list(q.items); }
        void operator()(const ObjectValue& o){ entries(o.fields); }
        void operator()(const MapValue& m){ entries(m.entries); }
        void operator()(const HandlePtr& h){ out += h ? json_escape(h->describe()) : std::string("null"); }
        void list(const std::vector<Value>& items){
            out += '[';
            for(size_t i=0;i<items.size(); ++i){
                if(i) out += ',';
                stringify(items[i], out);
            }
            out += ']';
        }
        void entries(const std::vector<Entry>& es){
            out += '{';
            for(size_t i=0;i<es.size(); ++i){
                if(i) out += ',';
                out += json_escape(es[i].key);
                out += ':';
                stringify(es[i].value, out);
            }
            out += '}';
        }
    };
    std::visit(V{out}, v.data);
}

// "a.b[2].c" -> the addressed value, or nullptr when any step is missing.
const Value* walk(const Value& root, const std::string& path){
    const Value* cur = &root;
    size_t i = 0;
    while(i < path.size() && cur){
        if(path[i]=='.'){ ++i; continue; }
        if(path[i]=='['){
            size_t close = path.find(']', i);
            if(close==std::string::npos) throw HostError("json: unterminated index in path '" + path + "'", ErrorKind::Parse);
            std::string digits = path.substr(i + 1, close - i - 1);
            if(digits.empty() || digits.find_first_not_of("0123456789")!=std::string::npos)
                throw HostError("json: bad index '" + digits + "' in path '" + path + "'", ErrorKind::Parse);
            size_t idx = 0;
            auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), idx);
            if(ec!=std::errc() || end!=digits.data() + digits.size())
                throw HostError("json: index '" + digits + "' out of range in path '" + path + "'", ErrorKind::Index);
            const std::vector<Value>* items = cur->is_array() ? &cur->as_array().items : cur->is_queue() ? &cur->as_queue().items : nullptr;
            cur = items && idx < items->size() ? &(*items)[idx] : nullptr;
            i = close + 1;
            continue;
        }
        size_t end = path.find_first_of(".[", i);
        std::string key = path.substr(i, end==std::string::npos ? std::string::npos : end - i);
        if(cur->is_object()) cur = cur->as_object().find(key);
        else if(cur->is_map()) cur = cur->as_map().find(key);
        else cur = nullptr;
        i = end==std::string::npos ? path.size() : end;
    }
    return cur;
}

} // namespace

void register_json_builtins(BuiltinRegistry::Builder& b){
    b.add("json.parse", [](std::vector<Value>& a, ExecContext&) -> Value {
        const std::string& text = arg_string(a, 0, "json.parse");
        ExprPtr e;
        try {
            e = Parser().parse_expression(text);
        } catch(const ScriptError& err) {
            throw HostError("json.parse: " + err.message(), ErrorKind::Parse);
        }
        return literal_value(*e);
    }, 1, 1);
    b.add("json.stringify", [](std::vector<Value>& a, ExecContext&) -> Value {
        std::string out;
        stringify(a[0], out);
        return Value(out);
    }, 1, 1);
    b.add("json.get", [](std::vector<Value>& a, ExecContext&) -> Value {
        const Value* v = walk(a[0], arg_string(a, 1, "json.get"));
        if(v) return *v;
        return a.size() > 2 ? a[2] : Value();
    }, 2, 3);
    b.add("json.has", [](std::vector<Value>& a, ExecContext&) -> Value {
        return Value(walk(a[0], arg_string(a, 1, "json.has"))!=nullptr);
    }, 2, 2);
}

} // namespace ebs
