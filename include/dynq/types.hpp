// Static type universe of the query language.
#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace dynq
{

    class record_type;

    enum class type_kind
    {
        Null,   // type of the `null` literal
        Object,
        Boolean,
        Char,
        String,
        SByte,
        Byte,
        Int16,
        UInt16,
        Int32,
        UInt32,
        Int64,
        UInt64,
        Single,
        Double,
        Decimal,
        DateTime,
        TimeSpan,
        Guid,
        Static,   // Math / Convert holders; never instantiated
        Nullable,
        Record,
        Sequence
    };

    struct type
    {
        type_kind kind{type_kind::Object};
        std::string name;
        const type *element{nullptr};       // Nullable: underlying; Sequence: element
        const record_type *record{nullptr}; // Record
    };

    using type_ref = const type *;

    // Interning registry: every distinct type has exactly one address, so type
    // identity is pointer equality. Shared by every parse in the process.
    class type_context
    {
    public:
        static type_context &instance();

        type_ref get_base(type_kind k) const;
        type_ref get_nullable(type_ref underlying);
        type_ref get_sequence(type_ref element);
        // Case-insensitive lookup over the predefined names and their C# aliases.
        std::optional<type_ref> find_predefined(std::string_view name) const;
        type_ref math() const { return math_.get(); }
        type_ref convert() const { return convert_.get(); }

    private:
        type_context();
        type_ref seed(type_kind k, const char *name);

        std::map<int, std::unique_ptr<type>> base_;
        std::unique_ptr<type> math_;
        std::unique_ptr<type> convert_;
        std::unordered_map<type_ref, std::unique_ptr<type>> nullable_cache_;
        std::unordered_map<type_ref, std::unique_ptr<type>> sequence_cache_;
        std::unordered_map<std::string, type_ref> names_;
        std::mutex mu_;
    };

    // Shorthands over the process-wide context.
    type_ref base_type(type_kind k);
    type_ref nullable_of(type_ref t);
    type_ref sequence_of(type_ref t);

    inline type_ref bool_type() { return base_type(type_kind::Boolean); }
    inline type_ref int_type() { return base_type(type_kind::Int32); }
    inline type_ref string_type() { return base_type(type_kind::String); }
    inline type_ref object_type() { return base_type(type_kind::Object); }
    inline type_ref null_type() { return base_type(type_kind::Null); }

    bool is_nullable(type_ref t);
    // Underlying type of a nullable, otherwise t itself.
    type_ref non_nullable(type_ref t);
    bool is_value_type(type_ref t);
    // Char, integral, Single, Double and Decimal.
    bool is_numeric(type_ref t);
    bool is_signed_integral(type_ref t);
    bool is_unsigned_integral(type_ref t);
    bool is_integral(type_ref t);
    bool is_record(type_ref t);
    bool is_sequence(type_ref t);

    // Display name: .NET names with `?` for nullable forms, IEnumerable<T> for sequences.
    std::string type_name(type_ref t);

} // namespace dynq
