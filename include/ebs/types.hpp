// Declared types: scalar kinds, arrays, queues, maps, handles and name-addressed records.
#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include "ebs/errors.hpp"

namespace ebs
{

    enum class TypeKind
    {
        Any,
        Bool,
        Int,
        Double,
        String,
        Array,
        Record,
        Json,
        Queue,
        Map,
        Handle
    };

    struct DataType;
    using TypePtr = std::shared_ptr<const DataType>;

    struct DataType
    {
        TypeKind kind = TypeKind::Any;
        TypePtr elem;                   // Array, Queue, Map (value type)
        TypePtr key;                    // Map
        std::optional<size_t> capacity; // Array: fixed capacity, nullopt = dynamic
        std::string name;               // Record: registry name; Handle: handle kind ("image")

        bool is_scalar() const { return kind == TypeKind::Bool || kind == TypeKind::Int || kind == TypeKind::Double || kind == TypeKind::String; }

        static TypePtr any();
        static TypePtr boolean();
        static TypePtr integer();
        static TypePtr floating();
        static TypePtr string();
        static TypePtr json();
        static TypePtr array_of(TypePtr elem, std::optional<size_t> capacity = std::nullopt);
        static TypePtr queue_of(TypePtr elem);
        static TypePtr map_of(TypePtr key, TypePtr value);
        static TypePtr record(std::string name);
        static TypePtr handle(std::string kind);
    };

    struct FieldDef
    {
        std::string name;
        TypePtr type;
    };

    struct RecordType
    {
        std::string name;
        std::vector<FieldDef> fields;
        bool anonymous = false; // inline `record{...}` with a synthesized name

        // Case-insensitive field lookup; nullptr when undeclared.
        const FieldDef *find(std::string_view field) const;
    };

    // Named record definitions and `typeof` aliases for one program. Records refer
    // to each other by name, so definitions form a graph that is checked for cycles
    // whenever a record is added.
    class TypeRegistry
    {
    public:
        // Throws TypeError on redefinition or when the definition closes a cycle.
        void define_record(RecordType rec);
        // Registers an inline record under a fresh synthesized name and returns a reference to it.
        TypePtr define_anonymous_record(std::vector<FieldDef> fields);
        const RecordType *find_record(std::string_view name) const;
        bool has_record(std::string_view name) const { return find_record(name) != nullptr; }

        void define_alias(const std::string &name, TypePtr type);
        TypePtr find_alias(std::string_view name) const;

        // Resolves an alias or record name (case-insensitive); nullptr if unknown.
        TypePtr lookup(std::string_view name) const;

        // Source spelling of a type; anonymous records print their field list.
        std::string to_string(const DataType &t) const;
        std::string to_string(const TypePtr &t) const { return t ? to_string(*t) : std::string("any"); }

        size_t record_count() const { return records_.size(); }

    private:
        void check_acyclic(const std::string &root) const;
        std::unordered_map<std::string, RecordType> records_; // key: lower-case name
        std::unordered_map<std::string, TypePtr> aliases_;    // key: lower-case name
        std::vector<std::string> order_;                      // definition order (lower-case)
        uint32_t anon_counter_ = 0;
    };

    // Structural equality; record references compare by the shape of the records they name.
    bool same_type(const DataType &a, const TypeRegistry &ra, const DataType &b, const TypeRegistry &rb);

} // namespace ebs
