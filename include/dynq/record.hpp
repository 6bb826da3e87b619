// Record types: schemas for entity rows and for generated projection shapes.
#pragma once
#include "dynq/types.hpp"
#include "dynq/value.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace dynq {

struct property {
    std::string name;
    type_ref type{nullptr};
};

class record_type {
public:
    record_type(std::string name, std::vector<property> props);
    virtual ~record_type() = default;
    record_type(const record_type&) = delete;
    record_type& operator=(const record_type&) = delete;

    const std::string& name() const { return type_.name; }
    type_ref as_type() const { return &type_; }
    const std::vector<property>& properties() const { return props_; }
    // Case-insensitive; exact-case matches win when names differ only by case.
    std::optional<size_t> find_property(std::string_view name) const;

    virtual value get(const void* object, size_t index) const = 0;
    // Identity unless overridden.
    virtual bool equals(const void* a, const void* b) const { return a == b; }
    virtual size_t hash(const void* object) const { return std::hash<const void*>{}(object); }
    std::string to_string(const void* object) const;

protected:
    void set_properties(std::vector<property> props){ props_ = std::move(props); }

private:
    type type_;
    std::vector<property> props_;
};

struct dynamic_record {
    std::vector<value> fields;
};

// A generated projection type. Instances are dynamic_record property bags;
// equality is structural and the hash is the XOR of the field hashes.
class dynamic_record_type : public record_type {
public:
    using record_type::record_type;
    // Missing trailing fields take the default value of their property type.
    value make(std::vector<value> fields) const;
    value get(const void* object, size_t index) const override;
    bool equals(const void* a, const void* b) const override;
    size_t hash(const void* object) const override;
};

// Process-wide memo of generated record types keyed by signature. The key is
// the (name, type) multiset, so field order does not produce distinct types.
// Lookups share a reader lock; a miss synthesizes under the writer lock after
// re-checking, so each signature is synthesized at most once.
class record_factory {
public:
    static record_factory& instance();

    // Throws std::invalid_argument on duplicate or empty property names.
    const dynamic_record_type* get(const std::vector<property>& props);
    size_t size() const;

private:
    record_factory() = default;

    struct signature {
        std::vector<std::pair<std::string, type_ref>> fields; // sorted by name
        bool operator==(const signature& o) const { return fields == o.fields; }
    };
    struct signature_hash {
        size_t operator()(const signature& s) const;
    };
    static signature make_signature(const std::vector<property>& props);

    mutable std::shared_mutex mu_;
    std::unordered_map<signature, std::unique_ptr<dynamic_record_type>, signature_hash> classes_;
    std::atomic<int> class_count_{0};
};

inline const dynamic_record_type* compile_record_type(const std::vector<property>& props){
    return record_factory::instance().get(props);
}

} // namespace dynq
