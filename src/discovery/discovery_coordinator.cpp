/**
 * @file discovery_coordinator.cpp
 * @brief DiscoveryCoordinator implementation.
 * @author BeaconMesh contributors
 */

#include "discovery/discovery_coordinator.hpp"
#include "telemetry/event_journal.hpp"

#include <algorithm>
#include <condition_variable>
#include <set>
#include <unistd.h>

namespace beacon_mesh {

namespace {

constexpr std::string_view COMPONENT = "coordinator";
constexpr uint32_t POLL_SLICE_MS = 100;

/// Sleep in small slices so stop requests are observed promptly.
void wait_slice(std::stop_token& stop, std::chrono::milliseconds duration) {
    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock(mutex);
    cv.wait_for(lock, stop, duration, [] { return false; });
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Construction / Destruction
// ─────────────────────────────────────────────

DiscoveryCoordinator::DiscoveryCoordinator(Config config,
                                           MachineDescriptor local,
                                           Logger& logger,
                                           EventJournal* journal,
                                           std::shared_ptr<IPortProbe> probe)
    : config_(std::move(config))
    , logger_(logger)
    , journal_(journal)
    , local_(std::move(local))
    , registry_(local_.machine_id, std::chrono::milliseconds(config_.discovery.silence_window_ms))
    , ports_(config_.ports,
             probe ? std::move(probe) : std::make_shared<SystemPortProbe>(logger),
             logger, journal)
    , broadcaster_(config_.discovery.targets, config_.discovery.port, logger)
    , listener_(registry_, local_.machine_id, logger)
    , server_(config_.cluster.max_message_size_bytes) {
    local_.websocket_port = config_.cluster.port;
    local_.status = MachineStatus::Online;
}

DiscoveryCoordinator::~DiscoveryCoordinator() {
    stop();
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

Result<void> DiscoveryCoordinator::start() {
    if (running_.load()) {
        return Error{ErrorKind::Internal, "Coordinator already running"};
    }
    if (auto valid = validate_config(config_); !valid) {
        return valid;
    }

    const auto cluster_port = config_.cluster.port;
    auto claim = ports_.claim(cluster_port, config_.ports.cluster_service, static_cast<int>(::getpid()));
    if (!claim.success) {
        return Error{ErrorKind::ResourceConflict, claim.message};
    }
    cluster_port_claimed_ = true;

    if (auto listening = server_.listen("0.0.0.0", cluster_port); !listening) {
        shutdown_components();
        return listening;
    }

    registry_.upsert(local_);
    registry_.set_listener([this](const MachineDescriptor& d, RegistryEvent event,
                                  const std::string& previous_hostname) {
        if (!journal_) return;
        switch (event) {
            case RegistryEvent::Inserted:
                if (d.machine_id != local_.machine_id) journal_->record_peer_discovered(d);
                break;
            case RegistryEvent::Revived:
                journal_->record_peer_revived(d.machine_id);
                break;
            case RegistryEvent::Collision:
                journal_->record_peer_collision(d.machine_id, previous_hostname, d.hostname);
                break;
            case RegistryEvent::WentOffline:
                journal_->record_peer_offline(d.machine_id);
                break;
            case RegistryEvent::Refreshed:
                break;
        }
    });

    listener_.on_beacon([this](const MachineDescriptor& peer, RegistryEvent event) {
        handle_beacon(peer, event);
    });
    if (auto listening = listener_.listen("0.0.0.0", config_.discovery.port,
                                          config_.discovery.multicast_group); !listening) {
        shutdown_components();
        return listening;
    }

    running_.store(true);

    if (auto broadcasting = broadcaster_.run([this] { return local_; },
            std::chrono::milliseconds(config_.discovery.beacon_interval_ms)); !broadcasting) {
        running_.store(false);
        shutdown_components();
        return broadcasting;
    }

    accept_thread_ = std::jthread([this](std::stop_token stop) { accept_loop(stop); });
    sweep_thread_ = std::jthread([this](std::stop_token stop) { sweep_loop(stop); });
    maintenance_thread_ = std::jthread([this](std::stop_token stop) { maintenance_loop(stop); });

    logger_.info(COMPONENT, "Started as " + local_.machine_id + " (" + local_.primary_ip
                            + "), cluster port " + std::to_string(cluster_port)
                            + ", discovery port " + std::to_string(config_.discovery.port));
    return Result<void>{};
}

void DiscoveryCoordinator::stop() {
    if (!running_.exchange(false)) return;

    auto deadline = std::chrono::steady_clock::now()
                  + std::chrono::milliseconds(config_.cluster.shutdown_deadline_ms);
    logger_.info(COMPONENT, "Stopping");

    broadcaster_.stop();
    listener_.stop();
    for (auto* thread : {&accept_thread_, &sweep_thread_, &maintenance_thread_}) {
        if (thread->joinable()) {
            thread->request_stop();
            thread->join();
        }
    }

    std::vector<std::shared_ptr<ClusterLink>> links;
    {
        std::lock_guard lock(links_mutex_);
        links.swap(links_);
        backoff_.clear();
    }
    for (auto& link : links) {
        link->close(CloseReason::LocalShutdown);
    }

    // Links observe the close within one poll slice; wait for them up to the deadline
    while (std::chrono::steady_clock::now() < deadline) {
        bool all_closed = std::all_of(links.begin(), links.end(), [](const auto& link) {
            return link->state() == LinkState::Closed;
        });
        if (all_closed) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    if (std::chrono::steady_clock::now() >= deadline) {
        logger_.warn(COMPONENT, "Shutdown deadline reached; forcing remaining links down");
    }
    links.clear();

    shutdown_components();
    logger_.info(COMPONENT, "Stopped");
}

void DiscoveryCoordinator::shutdown_components() {
    broadcaster_.stop();
    listener_.stop();
    server_.close();

    if (cluster_port_claimed_) {
        cluster_port_claimed_ = false;
        auto released = ports_.release(config_.cluster.port);
        if (!released.success) {
            logger_.debug(COMPONENT, released.message);
        }
    }
}

// ─────────────────────────────────────────────
// Discovery surface
// ─────────────────────────────────────────────

std::vector<MachineDescriptor> DiscoveryCoordinator::discover_now() {
    std::set<MachineId> before;
    for (const auto& peer : registry_.list_online()) {
        before.insert(peer.machine_id);
    }

    broadcaster_.send_now();

    auto deadline = std::chrono::steady_clock::now()
                  + std::chrono::milliseconds(config_.discovery.discover_window_ms);
    while (running_.load() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(POLL_SLICE_MS));
    }

    std::vector<MachineDescriptor> found;
    for (auto& peer : registry_.list_online()) {
        if (!before.contains(peer.machine_id)) {
            found.push_back(std::move(peer));
        }
    }
    logger_.info(COMPONENT, "Discovery window closed, " + std::to_string(found.size()) + " new peer(s)");
    return found;
}

std::vector<PeerView> DiscoveryCoordinator::list_peers() const {
    auto machines = registry_.snapshot();

    std::vector<PeerView> peers;
    std::lock_guard lock(links_mutex_);
    for (auto& descriptor : machines) {
        if (descriptor.machine_id == local_.machine_id) continue;

        PeerView view{std::move(descriptor), std::nullopt, std::nullopt};
        for (const auto& link : links_) {
            if (link->peer_id() != view.descriptor.machine_id) continue;
            auto state = link->state();
            // Prefer a connected link over one still dialing
            if (!view.link_state || (is_connected(state) && !is_connected(*view.link_state))) {
                view.link_state = state;
                view.link_direction = link->direction();
            }
        }
        peers.push_back(std::move(view));
    }

    std::sort(peers.begin(), peers.end(), [](const PeerView& a, const PeerView& b) {
        return a.descriptor.machine_id < b.descriptor.machine_id;
    });
    return peers;
}

std::optional<LinkState> DiscoveryCoordinator::link_state(const MachineId& peer) const {
    for (const auto& view : list_peers()) {
        if (view.descriptor.machine_id == peer) return view.link_state;
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────
// Messaging
// ─────────────────────────────────────────────

Result<void> DiscoveryCoordinator::send_to(const MachineId& peer, ClusterMessage message) {
    std::shared_ptr<ClusterLink> link;
    {
        std::lock_guard lock(links_mutex_);
        link = connected_link_locked(peer);
    }
    if (!link) {
        return Error{ErrorKind::NotFound, "No connected link to " + peer};
    }

    if (message.source_machine_id.empty()) message.source_machine_id = local_.machine_id;
    message.target_machine_id = peer;
    return link->send(message);
}

size_t DiscoveryCoordinator::broadcast(const ClusterMessage& message) {
    std::vector<std::shared_ptr<ClusterLink>> targets;
    {
        std::lock_guard lock(links_mutex_);
        std::set<MachineId> seen;
        for (const auto& link : links_) {
            if (!is_connected(link->state())) continue;
            if (seen.insert(link->peer_id()).second) targets.push_back(link);
        }
    }

    size_t delivered = 0;
    for (const auto& link : targets) {
        auto sent = link->send(message);
        if (sent) {
            ++delivered;
        } else {
            logger_.warn(COMPONENT, "Broadcast to " + link->peer_id() + " failed: " + sent.error().message);
        }
    }
    return delivered;
}

void DiscoveryCoordinator::on_message(MessageHandler handler) {
    std::lock_guard lock(handler_mutex_);
    message_handler_ = std::move(handler);
}

// ─────────────────────────────────────────────
// Beacons and dialing
// ─────────────────────────────────────────────

void DiscoveryCoordinator::handle_beacon(const MachineDescriptor& peer, RegistryEvent event) {
    std::lock_guard lock(links_mutex_);
    if (!running_.load()) return;

    if (event == RegistryEvent::Inserted || event == RegistryEvent::Revived) {
        backoff_.erase(peer.machine_id);
    }
    if (has_live_link_locked(peer.machine_id)) return;

    if (auto it = backoff_.find(peer.machine_id);
        it != backoff_.end() && std::chrono::steady_clock::now() < it->second.next_attempt) {
        return;
    }
    dial_locked(peer);
}

void DiscoveryCoordinator::dial_locked(const MachineDescriptor& peer) {
    if (peer.primary_ip.empty() || peer.websocket_port == 0) {
        logger_.warn(COMPONENT, "Peer " + peer.machine_id + " advertises no cluster endpoint");
        return;
    }

    logger_.debug(COMPONENT, "Dialing " + peer.machine_id + " at " + peer.primary_ip + ":"
                             + std::to_string(peer.websocket_port));
    adopt_locked(std::make_shared<ClusterLink>(
        link_options(), peer.machine_id, peer.primary_ip, peer.websocket_port,
        [this] { return local_; }, link_callbacks(), logger_));
}

void DiscoveryCoordinator::adopt_locked(std::shared_ptr<ClusterLink> link) {
    links_.push_back(link);
    link->start();
}

LinkOptions DiscoveryCoordinator::link_options() const {
    return LinkOptions{
        .local_id = local_.machine_id,
        .heartbeat_interval_ms = config_.cluster.heartbeat_interval_ms,
        .handshake_timeout_ms = config_.cluster.handshake_timeout_ms,
        .connect_timeout_ms = config_.cluster.connect_timeout_ms,
        .max_message_size = config_.cluster.max_message_size_bytes,
    };
}

ClusterLink::Callbacks DiscoveryCoordinator::link_callbacks() {
    return ClusterLink::Callbacks{
        .on_state = [this](ClusterLink& link, LinkState from, LinkState to) {
            on_link_state(link, from, to);
        },
        .on_message = [this](ClusterLink& link, const ClusterMessage& message) {
            on_link_message(link, message);
        },
    };
}

// ─────────────────────────────────────────────
// Link events
// ─────────────────────────────────────────────

void DiscoveryCoordinator::on_link_state(ClusterLink& link, LinkState from, LinkState to) {
    auto peer = link.peer_id();
    if (journal_ && !peer.empty()) {
        journal_->record_link_transition(peer, link.direction(), from, to,
            to == LinkState::Closed ? to_string(link.close_reason()) : std::string_view{});
    }

    switch (to) {
        case LinkState::Established:
            if (from == LinkState::Degraded) {
                registry_.set_status(peer, MachineStatus::Online);
                break;
            }
            if (auto descriptor = link.peer_descriptor()) {
                descriptor->last_seen = std::chrono::steady_clock::now();
                registry_.upsert(std::move(*descriptor));
            }
            {
                std::lock_guard lock(links_mutex_);
                backoff_.erase(peer);
            }
            resolve_duplicates(peer);
            break;

        case LinkState::Degraded:
            registry_.set_status(peer, MachineStatus::Degraded);
            break;

        case LinkState::Closed: {
            if (peer.empty()) break;
            bool still_connected;
            {
                std::lock_guard lock(links_mutex_);
                still_connected = has_connected_link_locked(peer);
            }
            if (!still_connected) {
                // Liveness falls back to beacons and the expiry sweep
                registry_.set_status(peer, MachineStatus::Online);
            }
            if (!is_intentional(link.close_reason()) && running_.load()) {
                schedule_reconnect(peer);
            }
            break;
        }

        default:
            break;
    }
}

void DiscoveryCoordinator::on_link_message(ClusterLink& link, const ClusterMessage& message) {
    auto peer = link.peer_id();
    registry_.touch(peer, std::chrono::steady_clock::now());

    if (message.type == MessageType::Heartbeat || message.type == MessageType::Registration) {
        return;
    }
    if (message.target_machine_id && *message.target_machine_id != local_.machine_id) {
        logger_.debug(COMPONENT, "Dropped message for " + *message.target_machine_id + " from " + peer);
        return;
    }

    MessageHandler handler;
    {
        std::lock_guard lock(handler_mutex_);
        handler = message_handler_;
    }
    if (handler) handler(message);
}

void DiscoveryCoordinator::resolve_duplicates(const MachineId& peer) {
    std::lock_guard lock(links_mutex_);

    std::vector<std::shared_ptr<ClusterLink>> connected;
    for (const auto& link : links_) {
        if (link->peer_id() == peer && is_connected(link->state())) {
            connected.push_back(link);
        }
    }
    if (connected.size() < 2) return;

    // Keep the connection dialed by the lower machine id; both ends compute
    // the same answer. Between two dials from one side the newer one wins.
    auto winner = *std::min_element(connected.begin(), connected.end(),
        [](const auto& a, const auto& b) {
            auto ia = a->initiator_id();
            auto ib = b->initiator_id();
            if (ia != ib) return ia < ib;
            return a->serial() > b->serial();
        });

    for (const auto& link : connected) {
        if (link == winner) continue;
        logger_.info(COMPONENT, "Duplicate link to " + peer + " (dialed by "
                                + link->initiator_id() + ") closed; keeping link dialed by "
                                + winner->initiator_id());
        link->close(CloseReason::Duplicate);
    }
}

void DiscoveryCoordinator::schedule_reconnect(const MachineId& peer) {
    std::lock_guard lock(links_mutex_);
    if (has_live_link_locked(peer)) return;

    const auto initial = std::chrono::milliseconds(config_.cluster.reconnect_initial_ms);
    const auto cap = std::chrono::milliseconds(config_.cluster.reconnect_max_ms);

    auto [it, inserted] = backoff_.try_emplace(peer, Backoff{initial, {}});
    if (!inserted) {
        it->second.delay = std::min(it->second.delay * 2, cap);
    }
    it->second.next_attempt = std::chrono::steady_clock::now() + it->second.delay;

    logger_.debug(COMPONENT, "Reconnect to " + peer + " in "
                             + std::to_string(it->second.delay.count()) + " ms");
}

// ─────────────────────────────────────────────
// Background loops
// ─────────────────────────────────────────────

void DiscoveryCoordinator::accept_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        auto accepted = server_.accept(POLL_SLICE_MS);
        if (!accepted) {
            logger_.warn(COMPONENT, accepted.error().message);
            wait_slice(stop, std::chrono::milliseconds(POLL_SLICE_MS));
            continue;
        }
        if (!accepted.value()) continue;

        std::lock_guard lock(links_mutex_);
        if (!running_.load()) return;
        adopt_locked(std::make_shared<ClusterLink>(
            link_options(), std::move(accepted.value()),
            [this] { return local_; }, link_callbacks(), logger_));
    }
}

void DiscoveryCoordinator::sweep_loop(std::stop_token stop) {
    const auto interval = std::chrono::milliseconds(config_.discovery.sweep_interval_ms);
    while (!stop.stop_requested()) {
        wait_slice(stop, interval);
        if (stop.stop_requested()) break;

        for (const auto& id : registry_.expire_stale(std::chrono::steady_clock::now())) {
            logger_.info(COMPONENT, "Peer " + id + " is offline");
        }
    }
}

void DiscoveryCoordinator::maintenance_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        wait_slice(stop, std::chrono::milliseconds(POLL_SLICE_MS));

        std::vector<std::shared_ptr<ClusterLink>> reaped;
        {
            std::lock_guard lock(links_mutex_);
            auto closed = std::stable_partition(links_.begin(), links_.end(), [](const auto& link) {
                return link->state() != LinkState::Closed;
            });
            reaped.assign(std::make_move_iterator(closed), std::make_move_iterator(links_.end()));
            links_.erase(closed, links_.end());

            auto now = std::chrono::steady_clock::now();
            for (auto it = backoff_.begin(); it != backoff_.end();) {
                const auto& peer = it->first;
                if (has_live_link_locked(peer) || registry_.is_offline(peer)) {
                    it = backoff_.erase(it);
                    continue;
                }
                if (now >= it->second.next_attempt) {
                    auto descriptor = registry_.get(peer);
                    if (descriptor) {
                        dial_locked(descriptor.value());
                    }
                    // Pushed out until the dial resolves; a failure reschedules it
                    it->second.next_attempt = now + it->second.delay;
                }
                ++it;
            }
        }
        // Joining closed links happens here, outside the lock
        reaped.clear();
    }
}

// ─────────────────────────────────────────────
// Link queries (links_mutex_ held)
// ─────────────────────────────────────────────

bool DiscoveryCoordinator::has_live_link_locked(const MachineId& peer) const {
    return std::any_of(links_.begin(), links_.end(), [&peer](const auto& link) {
        // A link not yet started still counts as a pending dial
        return link->peer_id() == peer && link->state() != LinkState::Closed;
    });
}

bool DiscoveryCoordinator::has_connected_link_locked(const MachineId& peer) const {
    return connected_link_locked(peer) != nullptr;
}

std::shared_ptr<ClusterLink> DiscoveryCoordinator::connected_link_locked(const MachineId& peer) const {
    std::shared_ptr<ClusterLink> best;
    for (const auto& link : links_) {
        if (link->peer_id() != peer) continue;
        auto state = link->state();
        if (state == LinkState::Established) return link;
        if (state == LinkState::Degraded && !best) best = link;
    }
    return best;
}

}  // namespace beacon_mesh
