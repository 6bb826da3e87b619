#include "conference_model.hpp"

namespace conference {

namespace {
const char* const names[] = {"Systems Summit", "Query Days", "Compiler Camp", "Storage Forum", "Parser Week"};
}

std::vector<Conference> conference_repository::find_by_status(int32_t status){
    dynq::query<Conference> q("Status == @0", status);
    q.order_by_descending(&Conference::participants_num).then_by(&Conference::conference_id);
    return find_all(q);
}

Conference make_conference(int32_t id){
    Conference c;
    c.conference_id = id;
    c.name = std::string(names[id % 5]) + " " + std::to_string(2000 + id % 25);
    c.participants_num = (id * 37) % 250;
    c.status = id % 3;
    c.track = (uint8_t)(id % 7);
    c.rating = (id % 10) / 2.0;
    c.start_date = dynq::date_time::from_civil(2020 + id % 5, 1 + id % 12, 1 + id % 28);
    if(id % 4 != 0) c.budget = 1000.0 * (id % 9);
    for(int s = 0; s < id % 4; ++s)
        c.sessions.push_back(Session{id * 10 + s, "Session " + std::to_string(s), (id + s * 13) % 60});
    return c;
}

void seed(conference_repository& repo, int n){
    for(int32_t id = 1; id <= n; ++id) repo.create(make_conference(id));
}

} // namespace conference
