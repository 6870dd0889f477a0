#include "ebs/diagnostics_json.hpp"
#include <sstream>
#include <cstdio>

namespace ebs {

std::string json_escape(const std::string& s){
    std::ostringstream o; o<<'"';
    for(char c: s){
        switch(c){
            case '"': o<<"\\\""; break; case '\\': o<<"\\\\"; break;
            case '\n': o<<"\\n"; break; case '\r': o<<"\\r"; break; case '\t': o<<"\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){ char buf[7]; std::snprintf(buf,sizeof(buf),"\\u%04X", (unsigned char)c); o<<buf; }
                else { o<<c; }
                break;
        }
    }
    o<<'"';
    return o.str();
}

std::string diagnostics_to_json(const ScriptError& e){
    std::ostringstream os;
    os<<"{\"success\":false,\"errors\":[{"
        "\"code\":"<<json_escape(e.code())
      <<",\"category\":"<<json_escape(e.category())
      <<",\"kind\":"<<json_escape(error_kind_name(e.kind()))
      <<",\"message\":"<<json_escape(e.message())
      <<",\"line\":"<<e.loc().line
      <<",\"col\":"<<e.loc().col
      <<"}]}";
    return os.str();
}

std::string diagnostics_success_json(){
    return "{\"success\":true,\"errors\":[]}";
}

void maybe_print_json(const ScriptError& e, const RuntimeEnv& env){
    if(env.diagJson){
        auto js=diagnostics_to_json(e);
        std::fprintf(stderr, "%s\n", js.c_str());
    }
}

} // namespace ebs
