#include "ebs/stdlib.hpp"
#include "ebs/strings.hpp"
#include "ebs/type_check.hpp"

namespace ebs {

namespace {

// Type names accepted by types.*; records and aliases come from the running program.
TypePtr type_arg(const std::vector<Value>& a, size_t i, ExecContext& ctx, const char* fn){
    std::string name = to_lower(arg_string(a, i, fn));
    if(name=="any") return DataType::any();
    if(name=="bool" || name=="boolean") return DataType::boolean();
    if(name=="int" || name=="integer" || name=="long" || name=="byte") return DataType::integer();
    if(name=="double" || name=="float") return DataType::floating();
    if(name=="string") return DataType::string();
    if(name=="json") return DataType::json();
    if(name=="array") return DataType::array_of(DataType::any());
    if(name=="queue") return DataType::queue_of(DataType::any());
    if(name=="map") return DataType::map_of(DataType::string(), DataType::any());
    if(TypePtr t = ctx.types().lookup(name)) return t;
    throw HostError(std::string(fn) + ": unknown type '" + a[i].as_string() + "'", ErrorKind::NotFound);
}

} // namespace

void register_host_builtins(BuiltinRegistry::Builder& b){
    b.add("vars.get", [](std::vector<Value>& a, ExecContext& ctx) -> Value {
        return ctx.read_var(arg_string(a, 0, "vars.get"));
    }, 1, 1);
    b.add("vars.set", [](std::vector<Value>& a, ExecContext& ctx) -> Value {
        ctx.write_var(arg_string(a, 0, "vars.set"), a[1]);
        return Value();
    }, 2, 2);
    b.add("vars.list", [](std::vector<Value>&, ExecContext& ctx) -> Value {
        std::vector<Value> out;
        for(auto& p : ctx.list_vars()) out.emplace_back(std::move(p));
        return make_array(std::move(out));
    }, 0, 0);
    // validate(value, typeName) -> "" when the value matches, otherwise the first mismatch.
    b.add("types.validate", [](std::vector<Value>& a, ExecContext& ctx) -> Value {
        TypePtr t = type_arg(a, 1, ctx, "types.validate");
        auto err = TypeChecker(ctx.types()).validate(*t, a[0]);
        return Value(err ? err->message() : std::string());
    }, 2, 2);
    b.add("types.convert", [](std::vector<Value>& a, ExecContext& ctx) -> Value {
        TypePtr t = type_arg(a, 1, ctx, "types.convert");
        try {
            return TypeChecker(ctx.types()).convert(*t, a[0]);
        } catch(const TypeError& e) {
            throw HostError("types.convert: " + e.message(), ErrorKind::Type);
        }
    }, 2, 2);
}

void register_standard_builtins(BuiltinRegistry::Builder& b){
    register_string_builtins(b);
    register_collection_builtins(b);
    register_json_builtins(b);
    register_math_builtins(b);
    register_thread_builtins(b);
    register_host_builtins(b);
}

std::shared_ptr<const BuiltinRegistry> standard_builtins(){
    BuiltinRegistry::Builder b;
    register_standard_builtins(b);
    return b.build();
}

} // namespace ebs
