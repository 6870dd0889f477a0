// Standard builtin modules. Hosts opt in per registry; nothing is registered implicitly.
#pragma once
#include "ebs/builtins.hpp"

namespace ebs {

void register_string_builtins(BuiltinRegistry::Builder& b);     // str.*
void register_collection_builtins(BuiltinRegistry::Builder& b); // array.*, queue.*, map.*
void register_json_builtins(BuiltinRegistry::Builder& b);       // json.*
void register_math_builtins(BuiltinRegistry::Builder& b);       // math.*
void register_thread_builtins(BuiltinRegistry::Builder& b);     // thread.*
void register_host_builtins(BuiltinRegistry::Builder& b);       // vars.*, types.*

// All of the above.
void register_standard_builtins(BuiltinRegistry::Builder& b);

// Convenience: a frozen registry holding only the standard modules.
std::shared_ptr<const BuiltinRegistry> standard_builtins();

} // namespace ebs
