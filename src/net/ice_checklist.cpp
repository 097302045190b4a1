#include "net/ice_checklist.hpp"

#include <algorithm>

namespace agora::net {

std::string_view ice_role_to_string(IceRole role) {
    switch (role) {
        case IceRole::CONTROLLING: return "controlling";
        case IceRole::CONTROLLED: return "controlled";
        default: return "unknown";
    }
}

std::string_view pair_state_to_string(PairState state) {
    switch (state) {
        case PairState::WAITING: return "waiting";
        case PairState::IN_PROGRESS: return "in_progress";
        case PairState::SUCCEEDED: return "succeeded";
        case PairState::FAILED: return "failed";
        default: return "unknown";
    }
}

CheckList::CheckList(IceRole role, uint32_t max_in_flight, bool force_relay)
    : role_(role)
    , max_in_flight_(std::max<uint32_t>(max_in_flight, 1))
    , force_relay_(force_relay) {}

// ============================================================================
// Candidates and pairing
// ============================================================================

std::optional<Candidate> CheckList::representative(PathId path) const {
    const Candidate* best = nullptr;
    const Candidate* reflexive = nullptr;

    for (const auto& entry : locals_) {
        if (entry.path != path) continue;
        const auto& c = entry.candidate;
        switch (c.kind) {
            case CandidateKind::HOST:
            case CandidateKind::RELAYED:
                if (!best || c.priority > best->priority) best = &c;
                break;
            case CandidateKind::SERVER_REFLEXIVE:
            case CandidateKind::PEER_REFLEXIVE:
                if (!reflexive) reflexive = &c;
                break;
        }
    }

    if (best) return *best;
    if (reflexive) {
        // Reflexive candidates are sent from their base
        Candidate base = *reflexive;
        base.kind = CandidateKind::HOST;
        base.address = reflexive->base;
        base.priority = candidate_priority(CandidateKind::HOST, local_preference(reflexive->priority),
                                           reflexive->component);
        return base;
    }
    return std::nullopt;
}

bool CheckList::pairable(PathId path, const Candidate& local, const Candidate& remote) const {
    if (force_relay_ && (path == DIRECT_PATH || is_stream_path(path))) return false;
    if (local.transport != remote.transport) return false;
    if (remote.transport == TransportProtocol::TCP) {
        auto it = stream_peers_.find(path);
        return it != stream_peers_.end() && it->second == remote.address;
    }
    return local.address.address().is_v4() == remote.address.address().is_v4();
}

uint64_t CheckList::compute_priority(const Candidate& local, const Candidate& remote) const {
    if (role_ == IceRole::CONTROLLING) {
        return pair_priority(local.priority, remote.priority);
    }
    return pair_priority(remote.priority, local.priority);
}

std::optional<uint32_t> CheckList::make_pair(PathId path, const Candidate& local, const Candidate& remote) {
    if (selected_) return std::nullopt;
    if (!pairable(path, local, remote)) return std::nullopt;
    if (find_pair(path, remote.address)) return std::nullopt;

    CandidatePair pair;
    pair.id = next_id_++;
    pair.path = path;
    pair.local = local;
    pair.remote = remote;
    pair.priority = compute_priority(local, remote);
    pairs_.push_back(pair);
    return pair.id;
}

void CheckList::sort_pairs() {
    std::stable_sort(pairs_.begin(), pairs_.end(), [](const CandidatePair& a, const CandidatePair& b) {
        if (a.priority != b.priority) return a.priority > b.priority;
        if (a.remote.address.address() != b.remote.address.address()) {
            return a.remote.address.address() < b.remote.address.address();
        }
        return a.remote.address.port() < b.remote.address.port();
    });
}

std::vector<uint32_t> CheckList::add_local(const Candidate& candidate, PathId path) {
    std::vector<uint32_t> created;
    bool had_representative = representative(path).has_value();
    locals_.push_back({path, candidate});

    // Later locals on an already paired path collapse onto the same socket
    if (had_representative) return created;

    auto local = representative(path);
    if (!local) return created;

    for (const auto& remote : remotes_) {
        if (auto id = make_pair(path, *local, remote)) {
            created.push_back(*id);
        }
    }
    sort_pairs();
    return created;
}

std::vector<uint32_t> CheckList::add_stream(const Candidate& local, PathId path, const udp::endpoint& peer) {
    std::vector<uint32_t> created;
    if (stream_peers_.contains(path)) return created;
    stream_peers_[path] = peer;
    locals_.push_back({path, local});

    for (const auto& remote : remotes_) {
        if (auto id = make_pair(path, local, remote)) {
            created.push_back(*id);
        }
    }
    sort_pairs();
    return created;
}

std::vector<uint32_t> CheckList::add_remote(const Candidate& candidate) {
    std::vector<uint32_t> created;

    auto existing = std::find_if(remotes_.begin(), remotes_.end(), [&](const Candidate& c) {
        return c.address == candidate.address && c.transport == candidate.transport;
    });

    if (existing != remotes_.end()) {
        if (existing->kind != CandidateKind::PEER_REFLEXIVE) {
            return created;
        }
        // Peer signalled an address we first learned from a check
        *existing = candidate;
        for (auto& pair : pairs_) {
            if (pair.remote.address == candidate.address && pair.remote.transport == candidate.transport) {
                pair.remote = candidate;
                pair.priority = compute_priority(pair.local, pair.remote);
            }
        }
    } else {
        remotes_.push_back(candidate);
    }

    std::vector<PathId> paths;
    for (const auto& entry : locals_) {
        if (std::find(paths.begin(), paths.end(), entry.path) == paths.end()) {
            paths.push_back(entry.path);
        }
    }
    for (auto path : paths) {
        if (auto local = representative(path)) {
            if (auto id = make_pair(path, *local, candidate)) {
                created.push_back(*id);
            }
        }
    }
    sort_pairs();
    return created;
}

std::optional<uint32_t> CheckList::add_peer_reflexive(const udp::endpoint& from, uint32_t priority,
                                                      PathId path) {
    if (auto id = find_pair(path, from)) return id;

    auto local = representative(path);
    if (!local) return std::nullopt;

    const auto transport = stream_peers_.contains(path) ? TransportProtocol::TCP : TransportProtocol::UDP;
    auto existing = std::find_if(remotes_.begin(), remotes_.end(), [&](const Candidate& c) {
        return c.address == from && c.transport == transport;
    });

    Candidate remote;
    if (existing != remotes_.end()) {
        remote = *existing;
    } else {
        remote.kind = CandidateKind::PEER_REFLEXIVE;
        remote.transport = transport;
        remote.address = from;
        remote.base = from;
        remote.priority = priority != 0 ? priority
                                        : candidate_priority(CandidateKind::PEER_REFLEXIVE, 0);
        if (selected_) return std::nullopt;
        remotes_.push_back(remote);
    }

    auto id = make_pair(path, *local, remote);
    sort_pairs();
    return id;
}

// ============================================================================
// Scheduling
// ============================================================================

CandidatePair* CheckList::find(uint32_t id) {
    auto it = std::find_if(pairs_.begin(), pairs_.end(), [id](const CandidatePair& p) { return p.id == id; });
    return it == pairs_.end() ? nullptr : &*it;
}

const CandidatePair* CheckList::find_pair(uint32_t id) const {
    auto it = std::find_if(pairs_.begin(), pairs_.end(), [id](const CandidatePair& p) { return p.id == id; });
    return it == pairs_.end() ? nullptr : &*it;
}

std::optional<uint32_t> CheckList::find_pair(PathId path, const udp::endpoint& remote) const {
    for (const auto& pair : pairs_) {
        if (pair.path == path && pair.remote.address == remote) return pair.id;
    }
    return std::nullopt;
}

size_t CheckList::in_flight() const {
    return static_cast<size_t>(std::count_if(pairs_.begin(), pairs_.end(), [](const CandidatePair& p) {
        return p.state == PairState::IN_PROGRESS;
    }));
}

std::optional<uint32_t> CheckList::next_check() {
    if (selected_) return std::nullopt;
    if (in_flight() >= max_in_flight_) return std::nullopt;

    CandidatePair* next = nullptr;
    while (!triggered_.empty() && !next) {
        auto* p = find(triggered_.front());
        triggered_.pop_front();
        if (p && p->triggered && p->state == PairState::WAITING) next = p;
    }
    if (!next) {
        for (auto& p : pairs_) {
            if (p.state == PairState::WAITING) {
                next = &p;
                break;
            }
        }
    }
    if (!next) return std::nullopt;

    next->state = PairState::IN_PROGRESS;
    next->triggered = false;
    ++next->attempts;
    return next->id;
}

bool CheckList::on_success(uint32_t id, std::chrono::milliseconds rtt) {
    auto* p = find(id);
    if (!p) return false;
    if (selected_ && *selected_ != id) return false;
    if (p->state == PairState::SUCCEEDED || p->state == PairState::FAILED) return false;

    p->state = PairState::SUCCEEDED;
    p->rtt = rtt;
    return true;
}

bool CheckList::on_failure(uint32_t id) {
    auto* p = find(id);
    if (!p || p->state != PairState::IN_PROGRESS) return false;
    p->state = PairState::FAILED;
    return true;
}

bool CheckList::trigger(uint32_t id) {
    if (selected_) return false;
    auto* p = find(id);
    if (!p) return false;
    if (p->state != PairState::WAITING && p->state != PairState::FAILED) return false;

    p->state = PairState::WAITING;
    if (!p->triggered) {
        p->triggered = true;
        triggered_.push_back(id);
    }
    return true;
}

bool CheckList::nominate(uint32_t id) {
    auto* p = find(id);
    if (!p) return false;
    if (selected_) return *selected_ == id;

    p->nominated = true;
    if (p->state == PairState::SUCCEEDED) {
        return promote(id);
    }
    trigger(id);
    return false;
}

std::optional<uint32_t> CheckList::best_succeeded() const {
    for (const auto& p : pairs_) {
        if (p.state == PairState::SUCCEEDED) return p.id;
    }
    return std::nullopt;
}

bool CheckList::promote(uint32_t id) {
    if (selected_) return false;
    auto* p = find(id);
    if (!p || p->state != PairState::SUCCEEDED) return false;

    selected_ = id;
    p->nominated = true;
    for (auto& other : pairs_) {
        if (other.id != id) other.state = PairState::FAILED;
    }
    triggered_.clear();
    return true;
}

const CandidatePair* CheckList::selected_pair() const {
    return selected_ ? find_pair(*selected_) : nullptr;
}

bool CheckList::exhausted() const {
    return std::none_of(pairs_.begin(), pairs_.end(), [](const CandidatePair& p) {
        return p.state == PairState::WAITING || p.state == PairState::IN_PROGRESS;
    });
}

bool CheckList::all_failed() const {
    return !pairs_.empty() && std::all_of(pairs_.begin(), pairs_.end(), [](const CandidatePair& p) {
        return p.state == PairState::FAILED;
    });
}

} // namespace agora::net
