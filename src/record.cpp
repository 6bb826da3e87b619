#include "dynq/record.hpp"
#include <algorithm>
#include <cctype>
#include <mutex>
#include <set>
#include <stdexcept>

namespace dynq {

namespace {
bool iequals(std::string_view a, std::string_view b){
    if(a.size() != b.size()) return false;
    for(size_t i = 0; i < a.size(); ++i)
        if(std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
    return true;
}
}

record_type::record_type(std::string name, std::vector<property> props)
    : props_(std::move(props)) {
    type_.kind = type_kind::Record;
    type_.name = std::move(name);
    type_.record = this;
}

std::optional<size_t> record_type::find_property(std::string_view name) const {
    std::optional<size_t> folded;
    for(size_t i = 0; i < props_.size(); ++i){
        if(props_[i].name == name) return i;
        if(!folded && iequals(props_[i].name, name)) folded = i;
    }
    return folded;
}

std::string record_type::to_string(const void* object) const {
    std::string out = "{";
    for(size_t i = 0; i < props_.size(); ++i){
        if(i) out += ", ";
        out += props_[i].name;
        out += '=';
        out += to_display(get(object, i));
    }
    return out + "}";
}

value dynamic_record_type::make(std::vector<value> fields) const {
    const auto& props = properties();
    if(fields.size() > props.size()) throw std::invalid_argument("too many fields for record type " + name());
    for(size_t i = fields.size(); i < props.size(); ++i) fields.push_back(default_value(props[i].type));
    auto rec = std::make_shared<dynamic_record>();
    rec->fields = std::move(fields);
    record_ref ref;
    ref.type = this;
    ref.object = rec.get();
    ref.owner = std::move(rec);
    return value(std::move(ref));
}

value dynamic_record_type::get(const void* object, size_t index) const {
    return static_cast<const dynamic_record*>(object)->fields.at(index);
}

bool dynamic_record_type::equals(const void* a, const void* b) const {
    const auto& fa = static_cast<const dynamic_record*>(a)->fields;
    const auto& fb = static_cast<const dynamic_record*>(b)->fields;
    if(fa.size() != fb.size()) return false;
    for(size_t i = 0; i < fa.size(); ++i)
        if(!values_equal(fa[i], fb[i])) return false;
    return true;
}

size_t dynamic_record_type::hash(const void* object) const {
    size_t h = 0;
    for(const auto& f : static_cast<const dynamic_record*>(object)->fields) h ^= hash_value(f);
    return h;
}

record_factory& record_factory::instance(){
    static record_factory factory;
    return factory;
}

record_factory::signature record_factory::make_signature(const std::vector<property>& props){
    signature sig;
    std::set<std::string> seen;
    for(const auto& p : props){
        if(p.name.empty()) throw std::invalid_argument("record property name is empty");
        if(!p.type) throw std::invalid_argument("record property '" + p.name + "' has no type");
        // names resolve case-insensitively, so duplicates are judged the same way
        std::string folded = p.name;
        for(auto& c : folded) c = (char)std::tolower((unsigned char)c);
        if(!seen.insert(folded).second) throw std::invalid_argument("duplicate record property '" + p.name + "'");
        sig.fields.emplace_back(p.name, p.type);
    }
    std::sort(sig.fields.begin(), sig.fields.end(),
              [](const auto& a, const auto& b){ return a.first < b.first; });
    return sig;
}

size_t record_factory::signature_hash::operator()(const signature& s) const {
    size_t h = 0;
    for(const auto& [name, t] : s.fields)
        h ^= std::hash<std::string>{}(name) ^ (std::hash<type_ref>{}(t) << 1);
    return h;
}

const dynamic_record_type* record_factory::get(const std::vector<property>& props){
    signature sig = make_signature(props);
    {
        std::shared_lock<std::shared_mutex> rd(mu_);
        if(auto it = classes_.find(sig); it != classes_.end()) return it->second.get();
    }
    std::unique_lock<std::shared_mutex> wr(mu_);
    // another writer may have synthesized it between the two locks
    if(auto it = classes_.find(sig); it != classes_.end()) return it->second.get();
    std::string name = "DynamicClass" + std::to_string(++class_count_);
    auto cls = std::make_unique<dynamic_record_type>(std::move(name), props);
    const dynamic_record_type* out = cls.get();
    classes_.emplace(std::move(sig), std::move(cls));
    return out;
}

size_t record_factory::size() const {
    std::shared_lock<std::shared_mutex> rd(mu_);
    return classes_.size();
}

} // namespace dynq
