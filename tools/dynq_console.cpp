#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>
#include "conference_model.hpp"
#include "dynq/diagnostics.hpp"
#include "dynq/errors.hpp"

using namespace conference;

static void usage(){
    std::cerr << "usage: dynq_console [--where <predicate>] [--order <ordering>] [--page <n>] [--size <n>] [--seed <n>]\n";
}

static void print_row(const Conference& c){
    std::cout << "  " << c.conference_id << "  " << c.name << "  status=" << c.status
              << "  participants=" << c.participants_num << "\n";
}

// The walk-through: one line per repository feature.
static int run_scenarios(conference_repository& repo){
    std::cout << "Count: " << repo.count() << "\n";

    auto small = repo.find_all([](const Conference& c){ return c.participants_num < 100; });
    std::cout << "FindAll: " << small.size() << "\n";

    auto one = repo.find_one([](const Conference& c){ return c.conference_id == 48; });
    if(!one){ std::cerr << "conference 48 missing\n"; return 1; }
    std::cout << "FindOne: " << one->participants_num << "\n";

    one->participants_num++;
    repo.update(*one);
    auto again = repo.find_one("ConferenceId == @0", {dynq::bind(48)});
    std::cout << "FindOne: " << again->participants_num << "\n";

    size_t removed = repo.remove([](const Conference& c){ return c.conference_id == 47; });
    std::cout << "Delete: " << removed << " Count: " << repo.count() << "\n";

    dynq::query<Conference> q1([](const Conference& c){ return c.conference_id < 150 || c.name.find("Query") != std::string::npos; });
    q1.where_and([](const Conference& c){ return c.status == 2; });
    q1.limit(3);
    std::cout << "FindAll Query: " << repo.find_all(q1).size() << "\n";

    dynq::query<Conference> q2([](const Conference& c){ return c.participants_num > 1; });
    q2.order_by(&Conference::status).then_by_descending(&Conference::conference_id);
    auto ordered = repo.find_all(q2);
    std::cout << "FindAll OrderBy: " << ordered.size() << "\n";
    for(size_t i = 0; i < ordered.size() && i < 3; ++i) print_row(ordered[i]);

    dynq::query<Conference> q3([](const Conference& c){ return c.participants_num > 1; });
    q3.order_by(&Conference::status).then_by_descending(&Conference::conference_id);
    size_t total = 0;
    auto page = repo.find_all(q3, 2, 20, total);
    std::cout << "FindAll Paging: " << page.size() << " of " << total << " stored\n";

    dynq::query<Conference> q4("ConferenceId < 100");
    q4.where_and("Status = {0}", 1);
    q4.order_by("ConferenceId DESC");
    auto dynamic = repo.find_all(q4);
    std::cout << "FindAll DynamicQuery: " << dynamic.size() << "\n";
    for(size_t i = 0; i < dynamic.size() && i < 3; ++i) print_row(dynamic[i]);

    std::cout << "Exists: " << (repo.exists("Sessions.Any(Attendees > 50)") ? "true" : "false") << "\n";
    return 0;
}

static int run_adhoc(conference_repository& repo, const std::string& where, const std::string& order, size_t page, size_t size){
    dynq::query<Conference> q;
    if(!where.empty()) q.where(where);
    if(!order.empty()) q.order_by(order.c_str());
    std::string failing = where;
    try {
        q.where_clause().prepare();
        failing = order;
        q.prepare();
        std::vector<Conference> rows;
        size_t total = 0;
        if(page > 0) rows = repo.find_all(q, page, size, total);
        else { rows = repo.find_all(q); total = repo.count(); }
        for(const auto& c : rows) print_row(c);
        std::cout << rows.size() << " rows, " << total << " stored\n";
        return 0;
    } catch(const dynq::query_error& e){
        std::cerr << dynq::render_caret(e, failing);
        return 2;
    } catch(const dynq::evaluation_error& e){
        std::cerr << "error[" << e.code() << "]: " << e.what() << "\n";
        return 2;
    }
}

int main(int argc, char** argv){
    std::string where, order;
    size_t page = 0, size = 10;
    int seed_count = 200;
    bool adhoc = false;
    for(int i = 1; i < argc; ++i){
        std::string a = argv[i];
        if(i + 1 >= argc){ usage(); return 1; }
        std::string v = argv[++i];
        if(a == "--where"){ where = v; adhoc = true; }
        else if(a == "--order"){ order = v; adhoc = true; }
        else if(a == "--page"){ page = std::strtoul(v.c_str(), nullptr, 10); adhoc = true; }
        else if(a == "--size"){ size = std::strtoul(v.c_str(), nullptr, 10); adhoc = true; }
        else if(a == "--seed"){ seed_count = std::atoi(v.c_str()); }
        else { usage(); return 1; }
    }
    if(adhoc && page > 0 && size == 0){ usage(); return 1; }

    conference_repository repo;
    seed(repo, seed_count);
    if(adhoc) return run_adhoc(repo, where, order, page, size);
    try {
        return run_scenarios(repo);
    } catch(const dynq::store_error& e){
        std::cerr << "[diag] store: " << e.what() << "\n";
        return 3;
    }
}
