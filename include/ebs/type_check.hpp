// Structural validation and coercion of runtime values against declared types.
#pragma once
#include <optional>
#include <string>
#include "ebs/types.hpp"
#include "ebs/value.hpp"

namespace ebs {

class TypeChecker {
public:
    explicit TypeChecker(const TypeRegistry& reg): reg_(reg){}

    // Strict shape check. Returns the first mismatch as "path: expected T, got U".
    // null matches every type, int matches double, records need every declared field
    // and nothing undeclared.
    std::optional<TypeError> validate(const DataType& t, const Value& v) const;

    // Greedy coercion of scalar leaves (string<->number, bool<->string, int<->double),
    // element-wise through arrays/queues/maps and field-wise through records.
    // null becomes the type's default. Throws TypeError naming the failing path.
    Value convert(const DataType& t, const Value& v) const;

    Value default_value(const DataType& t) const;

private:
    const TypeRegistry& reg_;
    bool validate_at(const DataType& t, const Value& v, const std::string& path, std::optional<TypeError>& err) const;
    Value convert_at(const DataType& t, const Value& v, const std::string& path) const;
    Value convert_record(const DataType& t, const Value& v, const std::string& path) const;
    [[noreturn]] void mismatch(const DataType& t, const Value& v, const std::string& path) const;
    const RecordType& record_or_throw(const DataType& t, const std::string& path) const;
};

inline std::optional<TypeError> validate(const DataType& t, const Value& v, const TypeRegistry& reg){ return TypeChecker(reg).validate(t, v); }
inline Value convert(const DataType& t, const Value& v, const TypeRegistry& reg){ return TypeChecker(reg).convert(t, v); }
inline Value default_value(const DataType& t, const TypeRegistry& reg){ return TypeChecker(reg).default_value(t); }

// "a.b" / "a[3]" path helpers used by the checker and by interpreter diagnostics.
inline std::string field_path(const std::string& base, const std::string& field){ return base.empty() ? field : base + "." + field; }
inline std::string index_path(const std::string& base, size_t i){ return base + "[" + std::to_string(i) + "]"; }

} // namespace ebs
