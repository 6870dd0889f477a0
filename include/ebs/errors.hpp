// Error taxonomy shared by every stage of the engine.
#pragma once
#include <stdexcept>
#include <string>
#include <string_view>
#include <optional>

namespace ebs
{

    struct SourceLoc
    {
        int line = 0;
        int col = 0;
        bool known() const { return line > 0; }
    };

    // Script-visible error categories. `when` handlers match on these names.
    enum class ErrorKind
    {
        Any,
        Io,
        Db,
        Type,
        Null,
        Index,
        Math,
        Parse,
        Network,
        NotFound,
        Access,
        Validation
    };

    const char *error_kind_name(ErrorKind k);
    std::optional<ErrorKind> error_kind_from_name(std::string_view name);

    class ScriptError : public std::runtime_error
    {
    public:
        ScriptError(std::string code, ErrorKind kind, std::string message, SourceLoc loc = {});

        const std::string &code() const noexcept { return code_; }
        ErrorKind kind() const noexcept { return kind_; }
        // Message without the location suffix that what() carries.
        const std::string &message() const noexcept { return message_; }
        SourceLoc loc() const noexcept { return loc_; }
        virtual const char *category() const noexcept = 0;

    private:
        std::string code_;
        ErrorKind kind_;
        std::string message_;
        SourceLoc loc_;
    };

    struct LexError : ScriptError
    {
        LexError(std::string message, SourceLoc loc) : ScriptError("E1001", ErrorKind::Parse, std::move(message), loc) {}
        const char *category() const noexcept override { return "LexError"; }
    };

    struct ParseError : ScriptError
    {
        ParseError(std::string message, SourceLoc loc, std::string code = "E2001") : ScriptError(std::move(code), ErrorKind::Parse, std::move(message), loc) {}
        const char *category() const noexcept override { return "ParseError"; }
    };

    struct TypeError : ScriptError
    {
        TypeError(std::string message, SourceLoc loc = {}, std::string code = "E3001") : ScriptError(std::move(code), ErrorKind::Type, std::move(message), loc) {}
        const char *category() const noexcept override { return "TypeError"; }
    };

    struct ScopeViolationError : ScriptError
    {
        ScopeViolationError(std::string message, SourceLoc loc = {}) : ScriptError("E4001", ErrorKind::Access, std::move(message), loc) {}
        const char *category() const noexcept override { return "ScopeViolationError"; }
    };

    class InterpreterError : public ScriptError
    {
    public:
        InterpreterError(ErrorKind kind, std::string message, SourceLoc loc = {}, std::string custom_name = {})
            : ScriptError("E5001", kind, std::move(message), loc), custom_name_(std::move(custom_name)) {}
        const char *category() const noexcept override { return "InterpreterError"; }
        // Set for `raise exception NAME(...)` when NAME is not a standard kind.
        const std::string &custom_name() const noexcept { return custom_name_; }

    private:
        std::string custom_name_;
    };

    struct UnknownBuiltinError : ScriptError
    {
        UnknownBuiltinError(std::string message, SourceLoc loc) : ScriptError("E6001", ErrorKind::NotFound, std::move(message), loc) {}
        const char *category() const noexcept override { return "UnknownBuiltinError"; }
    };

    // Thrown by builtin handlers; the interpreter rewraps it as InterpreterError.
    struct HostError : ScriptError
    {
        explicit HostError(std::string message, ErrorKind kind = ErrorKind::Any) : ScriptError("E6002", kind, std::move(message)) {}
        const char *category() const noexcept override { return "HostError"; }
    };

    struct registry_error : std::runtime_error
    {
        using std::runtime_error::runtime_error;
    };

} // namespace ebs
