// Mapping of C++ entity structs onto record types.
//
// An entity is described once by specializing entity_traits<T>:
//
//   template<> struct dynq::entity_traits<Conference> {
//       static void describe(dynq::entity_map<Conference>& m){
//           m.name("Conference");
//           m.key("ConferenceId", &Conference::conference_id);
//           m.field("Name", &Conference::name);
//       }
//   };
//
// Members may be primitives, std::optional<primitive>, other mapped entities
// or std::vector of mapped entities.
#pragma once
#include "dynq/record.hpp"
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace dynq {

// Specialized per entity type; the empty primary marks "not an entity".
template<class T> struct entity_traits {};
template<class T> class entity_map;
template<class T> class entity_type;

template<class T, class = void> struct is_entity : std::false_type {};
template<class T>
struct is_entity<T, std::void_t<decltype(entity_traits<T>::describe(std::declval<entity_map<T>&>()))>> : std::true_type {};

// Static type and value conversion of a member type.
template<class M, class = void> struct value_traits;

template<class CPP, type_kind Kind>
struct primitive_value_traits {
    static type_ref static_type(){ return base_type(Kind); }
    static value to_value(const CPP& x){ return value(x); }
};

template<> struct value_traits<bool> : primitive_value_traits<bool, type_kind::Boolean> {};
template<> struct value_traits<char> : primitive_value_traits<char, type_kind::Char> {};
template<> struct value_traits<std::string> : primitive_value_traits<std::string, type_kind::String> {};
template<> struct value_traits<int8_t> : primitive_value_traits<int8_t, type_kind::SByte> {};
template<> struct value_traits<uint8_t> : primitive_value_traits<uint8_t, type_kind::Byte> {};
template<> struct value_traits<int16_t> : primitive_value_traits<int16_t, type_kind::Int16> {};
template<> struct value_traits<uint16_t> : primitive_value_traits<uint16_t, type_kind::UInt16> {};
template<> struct value_traits<int32_t> : primitive_value_traits<int32_t, type_kind::Int32> {};
template<> struct value_traits<uint32_t> : primitive_value_traits<uint32_t, type_kind::UInt32> {};
template<> struct value_traits<int64_t> : primitive_value_traits<int64_t, type_kind::Int64> {};
template<> struct value_traits<uint64_t> : primitive_value_traits<uint64_t, type_kind::UInt64> {};
template<> struct value_traits<float> : primitive_value_traits<float, type_kind::Single> {};
template<> struct value_traits<double> : primitive_value_traits<double, type_kind::Double> {};
template<> struct value_traits<decimal_t> : primitive_value_traits<decimal_t, type_kind::Decimal> {};
template<> struct value_traits<date_time> : primitive_value_traits<date_time, type_kind::DateTime> {};
template<> struct value_traits<time_span> : primitive_value_traits<time_span, type_kind::TimeSpan> {};
template<> struct value_traits<guid> : primitive_value_traits<guid, type_kind::Guid> {};

template<class M> struct value_traits<std::optional<M>, std::enable_if_t<!is_entity<M>::value>> {
    static type_ref static_type(){ return nullable_of(value_traits<M>::static_type()); }
    static value to_value(const std::optional<M>& x){ return x ? value_traits<M>::to_value(*x) : value{}; }
};

template<class E> struct value_traits<E, std::enable_if_t<is_entity<E>::value>> {
    static type_ref static_type(){ return entity_type<E>::instance().as_type(); }
    static value to_value(const E& x){ return entity_type<E>::instance().wrap(x); }
};

template<class E> struct value_traits<std::optional<E>, std::enable_if_t<is_entity<E>::value>> {
    static type_ref static_type(){ return entity_type<E>::instance().as_type(); }
    static value to_value(const std::optional<E>& x){ return x ? entity_type<E>::instance().wrap(*x) : value{}; }
};

template<class E> struct value_traits<std::vector<E>, std::enable_if_t<is_entity<E>::value>> {
    static type_ref static_type(){ return sequence_of(entity_type<E>::instance().as_type()); }
    static value to_value(const std::vector<E>& xs){
        std::vector<value> items;
        items.reserve(xs.size());
        for(const auto& x : xs) items.push_back(entity_type<E>::instance().wrap(x));
        return make_sequence(entity_type<E>::instance().as_type(), std::move(items));
    }
};

template<class T>
class entity_map {
public:
    struct column {
        property prop;
        std::function<value(const T&)> read;
        bool key{false};
    };

    entity_map& name(std::string n){ name_ = std::move(n); return *this; }

    template<class M>
    entity_map& field(std::string field_name, M T::*member){
        columns_.push_back(column{property{std::move(field_name), value_traits<M>::static_type()},
                                  [member](const T& row){ return value_traits<M>::to_value(row.*member); }, false});
        return *this;
    }

    template<class M>
    entity_map& key(std::string field_name, M T::*member){
        field(std::move(field_name), member);
        columns_.back().key = true;
        return *this;
    }

    const std::string& entity_name() const { return name_; }
    const std::vector<column>& columns() const { return columns_; }

private:
    std::string name_;
    std::vector<column> columns_;
};

// Record type of a mapped entity. Rows are borrowed, so a wrapped value is
// only valid while the row it was made from is alive.
template<class T>
class entity_type : public record_type {
public:
    static const entity_type& instance(){
        static const entity_type inst(describe());
        return inst;
    }

    value wrap(const T& row) const {
        record_ref ref;
        ref.type = this;
        ref.object = &row;
        return value(std::move(ref));
    }

    value get(const void* object, size_t index) const override {
        return map_.columns().at(index).read(*static_cast<const T*>(object));
    }

    // Reads the key column of a row; throws std::logic_error if none is declared.
    value key_of(const T& row) const {
        for(const auto& c : map_.columns())
            if(c.key) return c.read(row);
        throw std::logic_error("entity '" + name() + "' declares no key");
    }
    bool has_key() const {
        for(const auto& c : map_.columns())
            if(c.key) return true;
        return false;
    }

private:
    static entity_map<T> describe(){
        entity_map<T> m;
        entity_traits<T>::describe(m);
        return m;
    }
    static std::vector<property> props_of(const entity_map<T>& m){
        std::vector<property> props;
        for(const auto& c : m.columns()) props.push_back(c.prop);
        return props;
    }
    explicit entity_type(entity_map<T> m)
        : record_type(m.entity_name(), props_of(m)), map_(std::move(m)) {}

    entity_map<T> map_;
};

template<class T>
type_ref entity_type_of(){ return entity_type<T>::instance().as_type(); }

} // namespace dynq
