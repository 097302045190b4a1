#pragma once

#include "net/candidate.hpp"
#include "net/datagram_mux.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string_view>
#include <vector>

namespace agora::net {

enum class IceRole : uint8_t {
    CONTROLLING = 0,
    CONTROLLED = 1,
};

std::string_view ice_role_to_string(IceRole role);

enum class PairState : uint8_t {
    WAITING = 0,
    IN_PROGRESS = 1,
    SUCCEEDED = 2,
    FAILED = 3,
};

std::string_view pair_state_to_string(PairState state);

struct CandidatePair {
    uint32_t id = 0;
    PathId path = DIRECT_PATH;
    Candidate local;
    Candidate remote;
    uint64_t priority = 0;
    PairState state = PairState::WAITING;
    uint32_t attempts = 0;
    bool nominated = false;
    bool triggered = false;
    std::optional<std::chrono::milliseconds> rtt;
};

/**
 * CheckList - pair states, scheduling and promotion for one attempt
 *
 * Pure state machine without I/O; IceAgent feeds it events. Pairs are keyed
 * by (path, remote address): every path has exactly one local
 * representative (the primary host candidate for the direct socket, the
 * allocation for a relay path, the stream's own end for a TCP path), so a
 * server-reflexive local collapses onto its base. Pairs stay sorted by descending priority, ties going to the
 * lower remote address.
 */
class CheckList {
public:
    CheckList(IceRole role, uint32_t max_in_flight, bool force_relay = false);

    IceRole role() const { return role_; }

    // Add a local candidate gathered on `path`; returns ids of new pairs
    std::vector<uint32_t> add_local(const Candidate& candidate, PathId path);

    // Add the local end of a connected TCP stream. Its path pairs only
    // with TCP remotes at `peer`. Returns ids of new pairs.
    std::vector<uint32_t> add_stream(const Candidate& local, PathId path, const udp::endpoint& peer);

    // Add a signalled remote candidate; returns ids of new pairs
    std::vector<uint32_t> add_remote(const Candidate& candidate);

    // Remote learned from an incoming check on `path`. Returns the pair
    // for (path, from), creating a peer-reflexive remote if needed.
    std::optional<uint32_t> add_peer_reflexive(const udp::endpoint& from, uint32_t priority, PathId path);

    // Next pair to check: triggered pairs first, then priority order.
    // Marks it IN_PROGRESS. nullopt when nothing is due, the in-flight
    // bound is reached or a pair has been promoted.
    std::optional<uint32_t> next_check();

    // false when the event did not change the pair
    bool on_success(uint32_t id, std::chrono::milliseconds rtt);
    bool on_failure(uint32_t id);

    // Schedule a triggered check (incoming request on the pair)
    bool trigger(uint32_t id);

    // Remote nominated the pair (controlled side). Promotes it right away
    // when already succeeded, otherwise triggers a check and promotes on
    // success.
    bool nominate(uint32_t id);

    std::optional<uint32_t> best_succeeded() const;

    // Atomic, once per attempt, never a failed pair. Every other pair
    // becomes FAILED.
    bool promote(uint32_t id);

    std::optional<uint32_t> selected() const { return selected_; }
    const CandidatePair* selected_pair() const;

    // Nothing waiting or in progress
    bool exhausted() const;
    // At least one pair and every pair FAILED
    bool all_failed() const;

    const CandidatePair* find_pair(uint32_t id) const;
    std::optional<uint32_t> find_pair(PathId path, const udp::endpoint& remote) const;

    const std::vector<CandidatePair>& pairs() const { return pairs_; }
    const std::vector<Candidate>& remote_candidates() const { return remotes_; }
    size_t in_flight() const;

private:
    struct LocalEntry {
        PathId path;
        Candidate candidate;
    };

    CandidatePair* find(uint32_t id);
    std::optional<Candidate> representative(PathId path) const;
    bool pairable(PathId path, const Candidate& local, const Candidate& remote) const;
    std::optional<uint32_t> make_pair(PathId path, const Candidate& local, const Candidate& remote);
    uint64_t compute_priority(const Candidate& local, const Candidate& remote) const;
    void sort_pairs();

    IceRole role_;
    uint32_t max_in_flight_;
    bool force_relay_;

    std::vector<LocalEntry> locals_;
    std::vector<Candidate> remotes_;
    std::map<PathId, udp::endpoint> stream_peers_;
    std::vector<CandidatePair> pairs_;
    std::deque<uint32_t> triggered_;
    std::optional<uint32_t> selected_;
    uint32_t next_id_ = 1;
};

} // namespace agora::net
