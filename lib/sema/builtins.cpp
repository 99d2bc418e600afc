// tova/sema/builtins.cpp - Predeclared name sets
#include "tova/sema/builtins.hpp"

#include <algorithm>
#include <unordered_set>

namespace tova::builtins
{

namespace
{

using NameSet = std::unordered_set<std::string_view>;

}  // namespace

const std::vector<std::string_view> & stdlib_names()
{
  static const std::vector<std::string_view> names = {
    // I/O and collections
    "print", "len", "range", "enumerate", "sum", "sorted", "reversed", "zip", "min", "max",
    "filter", "map", "find", "any", "all", "flat_map", "reduce", "unique", "group_by", "chunk",
    "flatten", "take", "drop", "first", "last", "count", "partition",
    // Math
    "abs", "floor", "ceil", "round", "clamp", "sqrt", "pow", "random",
    // Strings
    "upper", "lower", "trim", "split", "join", "replace", "repeat", "contains", "starts_with",
    "ends_with", "chars", "words", "lines", "capitalize",
    // Objects
    "keys", "values", "entries", "merge", "freeze", "clone",
    // Conversions and misc
    "sleep", "type_of", "toInt", "toFloat", "toString", "assert", "assert_eq",
    // Classes and namespaces
    "Counter", "DefaultDict", "Deque", "json", "collections",
  };
  return names;
}

const std::vector<std::string_view> & runtime_names()
{
  static const std::vector<std::string_view> names = {
    "Ok", "Err", "Some", "None", "Result", "Option", "db", "server", "client", "shared",
  };
  return names;
}

const std::vector<std::string_view> & js_global_names()
{
  static const std::vector<std::string_view> names = {
    "console", "document", "window", "globalThis", "self",
    "JSON", "Math", "Date", "RegExp", "Error", "TypeError", "RangeError",
    "Promise", "Set", "Map", "WeakSet", "WeakMap", "Symbol",
    "Array", "Object", "String", "Number", "Boolean", "Function",
    "parseInt", "parseFloat", "isNaN", "isFinite", "NaN", "Infinity",
    "undefined", "null", "true", "false",
    "setTimeout", "setInterval", "clearTimeout", "clearInterval",
    "queueMicrotask", "structuredClone",
    "URL", "URLSearchParams", "Headers", "Request", "Response",
    "FormData", "Blob", "File", "FileReader",
    "AbortController", "AbortSignal",
    "TextEncoder", "TextDecoder",
    "crypto", "performance", "navigator", "location", "history",
    "localStorage", "sessionStorage",
    "fetch", "alert", "confirm", "prompt",
    "Bun", "Deno", "process", "require", "module", "exports", "__dirname", "__filename",
    "Buffer", "atob", "btoa",
  };
  return names;
}

bool is_stdlib_name(std::string_view name)
{
  static const NameSet set(stdlib_names().begin(), stdlib_names().end());
  return set.count(name) != 0;
}

bool is_runtime_name(std::string_view name)
{
  const auto & names = runtime_names();
  return std::find(names.begin(), names.end(), name) != names.end();
}

bool is_js_global(std::string_view name)
{
  static const NameSet set(js_global_names().begin(), js_global_names().end());
  return set.count(name) != 0;
}

bool is_known_global(std::string_view name)
{
  return is_stdlib_name(name) || is_runtime_name(name) || is_js_global(name);
}

}  // namespace tova::builtins
