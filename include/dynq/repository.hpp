// Generic repository over an entity set of a data_context.
#pragma once
#include "dynq/data_context.hpp"
#include "dynq/env.hpp"
#include "dynq/query.hpp"
#include <algorithm>
#include <cstdio>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace dynq {

template<class T>
class repository {
public:
    explicit repository(std::shared_ptr<data_context> ctx = std::make_shared<data_context>())
        : ctx_(std::move(ctx)) {
        if(!ctx_) throw std::invalid_argument("repository: context is null");
    }
    virtual ~repository() = default;

    data_context& context() const { return *ctx_; }

    virtual T create(T entity){
        trace("create");
        return set().add(std::move(entity));
    }

    virtual T update(T entity){
        trace("update");
        return set().update(std::move(entity));
    }

    virtual void remove(const T& entity){
        trace("remove");
        set().remove(entity);
    }

    // Deletes the matching rows in one critical section; returns how many.
    virtual size_t remove(const predicate<T>& where){
        where.prepare();
        size_t n = set().remove_where([&](const T& row){ return where(row); });
        trace("remove where", where, n);
        return n;
    }
    size_t remove(const std::string& where, std::vector<bound_value> values){
        return remove(predicate<T>(where, std::move(values)));
    }

    // Single-or-default: more than one match is a store_error.
    virtual std::optional<T> find_one(const predicate<T>& where){
        if(where.empty()) return std::nullopt;
        where.prepare();
        std::optional<T> found = set().read([&](const std::vector<T>& rows){
            std::optional<T> hit;
            for(const auto& r : rows){
                if(!where(r)) continue;
                if(hit) throw store_error("Sequence contains more than one matching element");
                hit = r;
            }
            return hit;
        });
        trace("find_one", where, found ? 1 : 0);
        return found;
    }
    std::optional<T> find_one(const std::string& where, std::vector<bound_value> values){
        return find_one(predicate<T>(where, std::move(values)));
    }

    virtual std::vector<T> find_all(){
        return set().read([](const std::vector<T>& rows){ return rows; });
    }

    // Filter, then order, then page (when the query carries paging) or limit.
    virtual std::vector<T> find_all(const query<T>& q){
        q.prepare();
        std::vector<T> out = set().read([&](const std::vector<T>& rows){
            std::vector<const T*> picked = select(rows, q);
            size_t first = 0, n = picked.size();
            if(auto p = q.paging()) window(p->first, p->second, first, n);
            else if(auto lim = q.limit()) n = std::min(n, *lim);
            return copy(picked, first, n);
        });
        trace("find_all", q.where_clause(), out.size());
        return out;
    }

    virtual std::vector<T> find_all(const predicate<T>& where, const order_by_clause<T>& order = {}){
        query<T> q(where);
        q.order_by(order);
        return find_all(q);
    }
    std::vector<T> find_all(const std::string& where, std::vector<bound_value> values){
        return find_all(predicate<T>(where, std::move(values)));
    }
    std::vector<T> find_all(const char* where, std::vector<bound_value> values){
        return find_all(std::string(where), std::move(values));
    }

    // Page of the filtered and ordered rows; total_count is the number of
    // rows in the store, filtered or not.
    virtual std::vector<T> find_all(const query<T>& q, size_t page_index, size_t page_size, size_t& total_count){
        if(page_index < 1 || page_size < 1) throw std::invalid_argument("find_all: page index and size must be positive");
        q.prepare();
        std::vector<T> out = set().read([&](const std::vector<T>& rows){
            std::vector<const T*> picked = select(rows, q);
            total_count = rows.size();
            size_t first = 0, n = 0;
            window(page_index, page_size, first, n);
            n = first >= picked.size() ? 0 : std::min(n, picked.size() - first);
            return copy(picked, first, n);
        });
        trace("find_all page", q.where_clause(), out.size());
        return out;
    }

    virtual size_t count(const predicate<T>& where = {}){
        if(where.empty()) return set().size();
        where.prepare();
        size_t n = set().read([&](const std::vector<T>& rows){
            return (size_t)std::count_if(rows.begin(), rows.end(), [&](const T& r){ return where(r); });
        });
        trace("count", where, n);
        return n;
    }
    size_t count(const std::string& where, std::vector<bound_value> values){
        return count(predicate<T>(where, std::move(values)));
    }

    // Stops at the first match.
    virtual bool exists(const predicate<T>& where){
        where.prepare();
        bool hit = set().read([&](const std::vector<T>& rows){
            return std::any_of(rows.begin(), rows.end(), [&](const T& r){ return where(r); });
        });
        trace("exists", where, hit ? 1 : 0);
        return hit;
    }
    bool exists(const std::string& where, std::vector<bound_value> values){
        return exists(predicate<T>(where, std::move(values)));
    }

protected:
    entity_set<T>& set() const { return ctx_->template set<T>(); }

private:
    static std::vector<const T*> select(const std::vector<T>& rows, const query<T>& q){
        std::vector<const T*> picked;
        for(const auto& r : rows)
            if(q.where_clause()(r)) picked.push_back(&r);
        q.order(picked);
        return picked;
    }
    static void window(size_t page_index, size_t page_size, size_t& first, size_t& n){
        first = (page_index - 1) * page_size;
        n = page_size;
    }
    static std::vector<T> copy(const std::vector<const T*>& picked, size_t first, size_t n){
        std::vector<T> out;
        for(size_t i = first; i < picked.size() && i < first + n; ++i) out.push_back(*picked[i]);
        return out;
    }

    void trace(const char* step) const {
        if(!detect_env().trace_query) return;
        std::fprintf(stderr, "[dbg][query] %s %s\n", entity_type<T>::instance().name().c_str(), step);
    }
    void trace(const char* step, const predicate<T>& where, size_t rows) const {
        if(!detect_env().trace_query) return;
        const char* how = where.empty() ? "<all>" : where.is_textual() ? where.text().c_str() : "<typed>";
        std::fprintf(stderr, "[dbg][query] %s %s where %s -> %zu rows\n",
                     entity_type<T>::instance().name().c_str(), step, how, rows);
    }

    std::shared_ptr<data_context> ctx_;
};

} // namespace dynq
