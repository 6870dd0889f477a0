// Runtime values. Composite payloads are held by value so assignment copies the
// whole structure; host handles are shared.
#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ebs
{

    struct Value;
    struct Entry;

    // Opaque host resource (image, window, ...). Shared between every Value that holds it.
    class HostHandle
    {
    public:
        virtual ~HostHandle() = default;
        virtual std::string kind() const = 0;
        virtual std::string describe() const { return "<" + kind() + ">"; }
    };
    using HandlePtr = std::shared_ptr<HostHandle>;

    struct ArrayValue
    {
        std::vector<Value> items;
    };

    // Record values carry their record type name; plain JSON objects leave it empty.
    struct ObjectValue
    {
        std::string record;
        std::vector<Entry> fields;

        Value *find(std::string_view key);
        const Value *find(std::string_view key) const;
        void set(std::string key, Value v);
    };

    struct QueueValue
    {
        std::vector<Value> items; // front at index 0
    };

    struct MapValue
    {
        std::vector<Entry> entries; // insertion ordered, exact key match

        Value *find(std::string_view key);
        const Value *find(std::string_view key) const;
        void set(std::string key, Value v);
        bool erase(std::string_view key);
    };

    struct Value
    {
        using Storage = std::variant<std::monostate, bool, int64_t, double, std::string, ArrayValue, ObjectValue, QueueValue, MapValue, HandlePtr>;
        Storage data;

        Value() = default;
        Value(bool b) : data(b) {}
        Value(int i) : data(int64_t{i}) {}
        Value(int64_t i) : data(i) {}
        Value(double d) : data(d) {}
        Value(std::string s) : data(std::move(s)) {}
        Value(const char *s) : data(std::string(s)) {}
        Value(ArrayValue a) : data(std::move(a)) {}
        Value(ObjectValue o) : data(std::move(o)) {}
        Value(QueueValue q) : data(std::move(q)) {}
        Value(MapValue m) : data(std::move(m)) {}
        Value(HandlePtr h) : data(std::move(h)) {}

        bool is_null() const { return std::holds_alternative<std::monostate>(data); }
        bool is_bool() const { return std::holds_alternative<bool>(data); }
        bool is_int() const { return std::holds_alternative<int64_t>(data); }
        bool is_double() const { return std::holds_alternative<double>(data); }
        bool is_number() const { return is_int() || is_double(); }
        bool is_string() const { return std::holds_alternative<std::string>(data); }
        bool is_array() const { return std::holds_alternative<ArrayValue>(data); }
        bool is_object() const { return std::holds_alternative<ObjectValue>(data); }
        bool is_queue() const { return std::holds_alternative<QueueValue>(data); }
        bool is_map() const { return std::holds_alternative<MapValue>(data); }
        bool is_handle() const { return std::holds_alternative<HandlePtr>(data); }

        bool as_bool() const { return std::get<bool>(data); }
        int64_t as_int() const { return std::get<int64_t>(data); }
        double as_double() const { return std::get<double>(data); }
        double as_number() const { return is_int() ? static_cast<double>(as_int()) : as_double(); }
        const std::string &as_string() const { return std::get<std::string>(data); }
        const ArrayValue &as_array() const { return std::get<ArrayValue>(data); }
        ArrayValue &as_array() { return std::get<ArrayValue>(data); }
        const ObjectValue &as_object() const { return std::get<ObjectValue>(data); }
        ObjectValue &as_object() { return std::get<ObjectValue>(data); }
        const QueueValue &as_queue() const { return std::get<QueueValue>(data); }
        QueueValue &as_queue() { return std::get<QueueValue>(data); }
        const MapValue &as_map() const { return std::get<MapValue>(data); }
        MapValue &as_map() { return std::get<MapValue>(data); }
        const HandlePtr &as_handle() const { return std::get<HandlePtr>(data); }

        // "int", "string", record name for records, "json" for plain objects, ...
        std::string type_name() const;
    };

    struct Entry
    {
        std::string key;
        Value value;
    };

    inline Value make_array(std::vector<Value> items) { return Value(ArrayValue{std::move(items)}); }

    // Structural equality; int and double compare numerically.
    bool values_equal(const Value &a, const Value &b);

    // Text used by `print`, string concatenation and numeric->string conversion.
    // Top-level strings are unquoted; nested values use JSON-like notation.
    std::string display_string(const Value &v);

} // namespace ebs
