// In-memory unit of work: one keyed entity store per mapped C++ type.
#pragma once
#include "dynq/entity.hpp"
#include "dynq/errors.hpp"
#include <algorithm>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace dynq {

class entity_set_base {
public:
    virtual ~entity_set_base() = default;
    virtual size_t size() const = 0;
};

// Rows of one entity type in insertion order. Readers share the lock; every
// mutation runs as one exclusive critical section.
template<class T>
class entity_set : public entity_set_base {
public:
    size_t size() const override {
        std::shared_lock<std::shared_mutex> lock(mu_);
        return rows_.size();
    }

    // f(const std::vector<T>&) runs under the reader lock.
    template<class F>
    auto read(F&& f) const {
        std::shared_lock<std::shared_mutex> lock(mu_);
        return f(static_cast<const std::vector<T>&>(rows_));
    }

    T add(T row){
        std::unique_lock<std::shared_mutex> lock(mu_);
        if(type().has_key()){
            if(locate(type().key_of(row)) != rows_.end())
                throw store_error("duplicate key " + to_display(type().key_of(row)) + " for entity '" + type().name() + "'");
        }
        rows_.push_back(row);
        return row;
    }

    T update(T row){
        std::unique_lock<std::shared_mutex> lock(mu_);
        auto it = locate(require_key(row));
        if(it == rows_.end()) throw missing(row);
        *it = row;
        return row;
    }

    void remove(const T& row){
        std::unique_lock<std::shared_mutex> lock(mu_);
        auto it = locate(require_key(row));
        if(it == rows_.end()) throw missing(row);
        rows_.erase(it);
    }

    // Removes every row matching pred as of the moment the lock is taken.
    // pred runs over all rows first; if it throws, the set is unchanged.
    size_t remove_where(const std::function<bool(const T&)>& pred){
        std::unique_lock<std::shared_mutex> lock(mu_);
        std::vector<bool> doomed;
        doomed.reserve(rows_.size());
        size_t removed = 0;
        for(const auto& r : rows_){
            doomed.push_back(pred(r));
            if(doomed.back()) ++removed;
        }
        if(removed == 0) return 0;
        std::vector<T> kept;
        kept.reserve(rows_.size() - removed);
        for(size_t i = 0; i < rows_.size(); ++i)
            if(!doomed[i]) kept.push_back(std::move(rows_[i]));
        rows_.swap(kept);
        return removed;
    }

private:
    static const entity_type<T>& type(){ return entity_type<T>::instance(); }

    value require_key(const T& row) const {
        if(!type().has_key()) throw store_error("entity '" + type().name() + "' declares no key");
        return type().key_of(row);
    }
    typename std::vector<T>::iterator locate(const value& key){
        return std::find_if(rows_.begin(), rows_.end(), [&](const T& r){ return values_equal(type().key_of(r), key); });
    }
    store_error missing(const T& row) const {
        return store_error("no " + type().name() + " with key " + to_display(type().key_of(row)));
    }

    mutable std::shared_mutex mu_;
    std::vector<T> rows_;
};

class data_context {
public:
    data_context() = default;
    data_context(const data_context&) = delete;
    data_context& operator=(const data_context&) = delete;

    // Created on first use.
    template<class T>
    entity_set<T>& set(){
        std::lock_guard<std::mutex> lock(mu_);
        auto& slot = sets_[std::type_index(typeid(T))];
        if(!slot) slot = std::make_unique<entity_set<T>>();
        return static_cast<entity_set<T>&>(*slot);
    }

private:
    std::mutex mu_;
    std::unordered_map<std::type_index, std::unique_ptr<entity_set_base>> sets_;
};

} // namespace dynq
