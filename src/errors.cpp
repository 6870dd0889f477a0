#include "ebs/errors.hpp"
#include "ebs/strings.hpp"

namespace ebs {

namespace {
struct KindName { ErrorKind kind; const char* name; };
constexpr KindName kKindNames[] = {
    {ErrorKind::Any, "ANY_ERROR"}, {ErrorKind::Io, "IO_ERROR"}, {ErrorKind::Db, "DB_ERROR"},
    {ErrorKind::Type, "TYPE_ERROR"}, {ErrorKind::Null, "NULL_ERROR"}, {ErrorKind::Index, "INDEX_ERROR"},
    {ErrorKind::Math, "MATH_ERROR"}, {ErrorKind::Parse, "PARSE_ERROR"}, {ErrorKind::Network, "NETWORK_ERROR"},
    {ErrorKind::NotFound, "NOT_FOUND_ERROR"}, {ErrorKind::Access, "ACCESS_ERROR"}, {ErrorKind::Validation, "VALIDATION_ERROR"},
};

std::string with_location(const std::string& msg, SourceLoc loc){
    if(!loc.known()) return msg;
    return msg + " (line " + std::to_string(loc.line) + ", col " + std::to_string(loc.col) + ")";
}
} // namespace

const char* error_kind_name(ErrorKind k){
    for(const auto& kn : kKindNames) if(kn.kind==k) return kn.name;
    return "ANY_ERROR";
}

std::optional<ErrorKind> error_kind_from_name(std::string_view name){
    std::string up = to_upper(name);
    for(const auto& kn : kKindNames) if(up==kn.name) return kn.kind;
    return std::nullopt;
}

ScriptError::ScriptError(std::string code, ErrorKind kind, std::string message, SourceLoc loc)
    : std::runtime_error(with_location(message, loc)), code_(std::move(code)), kind_(kind), message_(std::move(message)), loc_(loc) {}

} // namespace ebs
