#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include "ebs/ebs.hpp"

using namespace ebs;

static bool read_file(const std::string& path, std::string& out){
    std::ifstream ifs(path);
    if(!ifs) return false;
    std::stringstream ss; ss << ifs.rdbuf();
    out = ss.str();
    return true;
}

// --set values are read as script literals; anything that does not parse is taken as a plain string.
static Value binding_value(const std::string& text){
    try {
        auto e = Parser().parse_expression(text);
        if(auto lit = std::get_if<LiteralExpr>(&e->data)) return lit->value;
    } catch(const ScriptError&) {
        // not a literal
    }
    return Value(text);
}

static int usage(){
    std::cerr << "usage: ebs_run <file> [--check] [--pretty] [--name container] [--set path=value]...\n";
    return 1;
}

int main(int argc, char** argv){
    if(argc < 2) return usage();
    std::string file;
    bool check_only = false, pretty = false;
    InterpreterOptions options;
    Bindings bindings;
    for(int i=1;i<argc;++i){
        std::string a = argv[i];
        if(a=="--check") check_only = true;
        else if(a=="--pretty") pretty = true;
        else if(a=="--name" && i + 1 < argc) options.name = argv[++i];
        else if(a=="--set" && i + 1 < argc){
            std::string kv = argv[++i];
            size_t eq = kv.find('=');
            if(eq==std::string::npos || eq==0){ std::cerr << "--set expects path=value, got '" << kv << "'\n"; return 1; }
            bindings.emplace_back(kv.substr(0, eq), binding_value(kv.substr(eq + 1)));
        }
        else if(!a.empty() && a[0]=='-') return usage();
        else if(file.empty()) file = a;
        else return usage();
    }
    if(file.empty()) return usage();

    std::string src;
    if(!read_file(file, src)){ std::cerr << "failed to read file '" << file << "'\n"; return 1; }

    ProgramPtr program;
    try {
        program = Parser().parse(src, file);
    } catch(const ScriptError& e) {
        std::cerr << file << ":" << e.loc().line << ":" << e.loc().col << ": " << e.category() << " " << e.code() << ": " << e.message() << "\n";
        maybe_print_json(e, options.env);
        return 2;
    }
    if(pretty){
        std::cout << to_source(*program);
        return 0;
    }
    if(check_only){
        if(options.env.diagJson) std::cerr << diagnostics_success_json() << "\n";
        std::cout << "ok\n";
        return 0;
    }

    try {
        Interpreter interp(standard_builtins(), options);
        ExecutionResult r = interp.run(program, bindings);
        if(r.status==ExecutionResult::Status::Returned && !r.value.is_null()) std::cout << "Result: " << display_string(r.value) << "\n";
        if(r.status==ExecutionResult::Status::Cancelled) std::cerr << "[exec] cancelled\n";
        for(const auto& path : interp.list_vars())
            std::cout << path << " = " << display_string(interp.get_var(path)) << "\n";
    } catch(const ScriptError& e) {
        std::cerr << file << ":" << e.loc().line << ":" << e.loc().col << ": " << e.category() << " " << e.code() << ": " << e.message() << "\n";
        maybe_print_json(e, options.env);
        return 3;
    }
    return 0;
}
