#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include "ebs/ast.hpp"
#include "ebs/token.hpp"

namespace ebs {

struct ParseResult {
    bool success{false};
    ProgramPtr program;        // set when success
    std::string error_message; // If !success, human-readable message
    std::string error_code;
    int line{0};
    int column{0};
};

// Text of an imported file. `name` identifies the file for duplicate and cycle
// detection (the filesystem loader uses the canonical path).
struct ImportSource {
    std::string name;
    std::string text;
};

// Resolves `import "path";` written in the file named `from`; nullopt when unreadable.
using ImportLoader = std::function<std::optional<ImportSource>(const std::string& path, const std::string& from)>;

// Reads imports from disk relative to the importing file's directory.
std::optional<ImportSource> load_import_file(const std::string& path, const std::string& from);

class Parser {
public:
    // `types` may carry record types registered by the host. Each parse works on a
    // copy of it, so the host registry is never modified.
    explicit Parser(std::shared_ptr<TypeRegistry> types = nullptr): types_(std::move(types)) {}

    // Throws LexError, ParseError, or TypeError (invalid/cyclic type declarations).
    ProgramPtr parse(std::string_view src, std::string_view filename = "<memory>") const;

    // Same, reporting failure through the result instead of throwing.
    ParseResult parse_string(std::string_view src, std::string_view filename = "<memory>") const;

    // Parses a single expression covering the whole input (used for JSON text).
    ExprPtr parse_expression(std::string_view src) const;

    Parser& set_import_loader(ImportLoader loader){ loader_ = std::move(loader); return *this; }

private:
    std::shared_ptr<TypeRegistry> types_;
    ImportLoader loader_ = load_import_file;
};

inline ProgramPtr parse(std::string_view src, std::string_view filename = "<memory>", std::shared_ptr<TypeRegistry> types = nullptr){
    return Parser(std::move(types)).parse(src, filename);
}

} // namespace ebs
