// Umbrella header: front-end, type system, runtime and standard builtins.
#pragma once
#include "ebs/errors.hpp"
#include "ebs/value.hpp"
#include "ebs/types.hpp"
#include "ebs/type_check.hpp"
#include "ebs/token.hpp"
#include "ebs/lexer.hpp"
#include "ebs/ast.hpp"
#include "ebs/parser.hpp"
#include "ebs/pretty.hpp"
#include "ebs/environment.hpp"
#include "ebs/builtins.hpp"
#include "ebs/stdlib.hpp"
#include "ebs/executor.hpp"
#include "ebs/interpreter.hpp"
#include "ebs/runtime_env.hpp"
#include "ebs/diagnostics_json.hpp"
