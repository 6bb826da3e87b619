// Conference domain used by the console harness, the benchmark and the tests.
#pragma once
#include "dynq/entity.hpp"
#include "dynq/repository.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace conference {

struct Session {
    int32_t session_id{0};
    std::string title;
    int32_t attendees{0};
};

struct Conference {
    int32_t conference_id{0};
    std::string name;
    int32_t participants_num{0};
    int32_t status{0};
    uint8_t track{0};
    double rating{0};
    dynq::date_time start_date;
    std::optional<double> budget;
    std::vector<Session> sessions;
};

} // namespace conference

namespace dynq {

template<> struct entity_traits<conference::Session> {
    static void describe(entity_map<conference::Session>& m){
        m.name("Session");
        m.key("SessionId", &conference::Session::session_id);
        m.field("Title", &conference::Session::title);
        m.field("Attendees", &conference::Session::attendees);
    }
};

template<> struct entity_traits<conference::Conference> {
    static void describe(entity_map<conference::Conference>& m){
        m.name("Conference");
        m.key("ConferenceId", &conference::Conference::conference_id);
        m.field("Name", &conference::Conference::name);
        m.field("ParticipantsNum", &conference::Conference::participants_num);
        m.field("Status", &conference::Conference::status);
        m.field("Track", &conference::Conference::track);
        m.field("Rating", &conference::Conference::rating);
        m.field("StartDate", &conference::Conference::start_date);
        m.field("Budget", &conference::Conference::budget);
        m.field("Sessions", &conference::Conference::sessions);
    }
};

} // namespace dynq

namespace conference {

class conference_repository : public dynq::repository<Conference> {
public:
    using dynq::repository<Conference>::repository;

    // Conferences in the given status, busiest first.
    std::vector<Conference> find_by_status(int32_t status);
};

// Deterministic store contents: ids 1..n with cycling status, names and sessions.
void seed(conference_repository& repo, int n);
Conference make_conference(int32_t id);

} // namespace conference
