#ifndef QUEUE_SIMULATOR_HPP
#define QUEUE_SIMULATOR_HPP

#include <iostream>
#include <vector>
#include <deque>
#include <map>
#include <array>
#include <string>
#include <memory>
#include <functional>
#include <random>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <cmath>
#include <algorithm>
#include <limits>
#include <optional>
#include <variant>
#include <stdexcept>
#include <cstdint>

namespace QueueSimulator {

// ============================================================================
// FORWARD DECLARATIONS
// ============================================================================

class SimulationEngine;

// ============================================================================
// UTILITY CLASSES
// ============================================================================

// Simulated time, in the caller's rate units (rates are "per time unit")
using SimTime = double;

// Reported waits and service times are scaled from time units to minutes
constexpr double MINUTES_PER_TIME_UNIT = 60.0;

// Stop time used by the command line when none is given
constexpr SimTime DEFAULT_HORIZON = 8.0;

// Rejected before any replication starts
class InvalidConfiguration : public std::invalid_argument {
public:
    explicit InvalidConfiguration(const std::string& what)
        : std::invalid_argument("invalid configuration: " + what) {}
};

// Broken engine state: no selectable event, departure from an idle server,
// pop from an empty queue
class EngineInvariantViolation : public std::logic_error {
public:
    explicit EngineInvariantViolation(const std::string& what)
        : std::logic_error("engine invariant violated: " + what) {}
};

// JSON-like configuration structure
class Config {
public:
    using Value = std::variant<int, double, std::string, bool,
                               std::vector<Config>, std::map<std::string, Config>>;
private:
    Value value_;

public:
    Config() : value_(0) {}
    Config(int v) : value_(v) {}
    Config(double v) : value_(v) {}
    Config(const std::string& v) : value_(v) {}
    Config(const char* v) : value_(std::string(v)) {}
    Config(bool v) : value_(v) {}
    Config(std::vector<Config> v) : value_(std::move(v)) {}
    Config(std::map<std::string, Config> v) : value_(std::move(v)) {}

    template<typename T>
    bool holds() const { return std::holds_alternative<T>(value_); }

    template<typename T>
    T get() const { return std::get<T>(value_); }

    template<typename T>
    T get(const T& default_val) const {
        if (auto* v = std::get_if<T>(&value_)) return *v;
        return default_val;
    }

    // Numeric read that accepts both int and double leaves
    double number(double default_val) const {
        if (auto* d = std::get_if<double>(&value_)) return *d;
        if (auto* i = std::get_if<int>(&value_)) return *i;
        return default_val;
    }

    Config& operator[](const std::string& key) {
        if (!std::holds_alternative<std::map<std::string, Config>>(value_)) {
            value_ = std::map<std::string, Config>{};
        }
        return std::get<std::map<std::string, Config>>(value_)[key];
    }

    const Config& operator[](const std::string& key) const {
        static const Config empty;
        if (auto* m = std::get_if<std::map<std::string, Config>>(&value_)) {
            auto it = m->find(key);
            if (it != m->end()) return it->second;
        }
        return empty;
    }

    bool contains(const std::string& key) const {
        if (auto* m = std::get_if<std::map<std::string, Config>>(&value_)) {
            return m->find(key) != m->end();
        }
        return false;
    }
};

// ============================================================================
// RANDOM VARIATES
// ============================================================================

// Source of the two random quantities the engine consumes. The engine only
// ever talks to this interface so tests can script every draw.
class VariateSource {
public:
    virtual ~VariateSource() = default;

    // Exponential sample with the given mean, always finite and >= 0
    virtual double exponential(double mean) = 0;

    // Uniform index in [0, n)
    virtual size_t pick(size_t n) = 0;
};

// Seed drawn once per process from random_device mixed with the clock
inline uint64_t freshSeed() {
    std::random_device rd;
    uint64_t entropy = (static_cast<uint64_t>(rd()) << 32) ^ rd();
    auto ticks = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    return entropy ^ static_cast<uint64_t>(ticks);
}

// Variates over any uniform random bit generator constructible from a seed
template<typename Engine>
class BasicRandomGenerator : public VariateSource {
    uint64_t seed_;
    Engine engine_;

public:
    BasicRandomGenerator() : BasicRandomGenerator(freshSeed()) {}
    explicit BasicRandomGenerator(uint64_t seed) : seed_(seed), engine_(seed) {}

    Engine& engine() { return engine_; }

    uint64_t seed() const { return seed_; }

    // Uniform on the open interval (0, 1). A zero draw is thrown away and
    // redrawn, since log(0) would put an infinite time on the calendar.
    double uniform() {
        std::uniform_real_distribution<double> dist(0.0, 1.0);
        double u = dist(engine_);
        while (u <= 0.0) {
            u = dist(engine_);
        }
        return u;
    }

    // Inverse transform: -mean * ln(U)
    double exponential(double mean) override {
        return -mean * std::log(uniform());
    }

    size_t pick(size_t n) override {
        if (n == 0) throw std::invalid_argument("pick from an empty range");
        std::uniform_int_distribution<size_t> dist(0, n - 1);
        return dist(engine_);
    }
};

using RandomGenerator = BasicRandomGenerator<std::mt19937_64>;

// ============================================================================
// STATISTICAL COLLECTORS
// ============================================================================

// Running sample statistics over one metric, one sample per replication
class TimeSeriesStats {
    size_t count_ = 0;
    double sum_ = 0;
    double sum_sq_ = 0;
    double min_ = std::numeric_limits<double>::max();
    double max_ = std::numeric_limits<double>::lowest();

public:
    void record(double value) {
        ++count_;
        sum_ += value;
        sum_sq_ += value * value;
        min_ = std::min(min_, value);
        max_ = std::max(max_, value);
    }

    size_t count() const { return count_; }
    double sum() const { return sum_; }
    double mean() const { return count_ == 0 ? 0 : sum_ / count_; }
    double min() const { return count_ == 0 ? 0 : min_; }
    double max() const { return count_ == 0 ? 0 : max_; }

    double variance() const {
        if (count_ < 2) return 0;
        double n = static_cast<double>(count_);
        // Identical samples can round to a tiny negative value
        return std::max(0.0, (sum_sq_ - (sum_ * sum_) / n) / (n - 1));
    }

    double stddev() const { return std::sqrt(variance()); }

    // 95% confidence interval
    std::pair<double, double> confidenceInterval95() const {
        if (count_ < 2) return {mean(), mean()};
        double se = stddev() / std::sqrt(static_cast<double>(count_));
        return {mean() - 1.96 * se, mean() + 1.96 * se};
    }

    double halfWidth95() const {
        auto [low, high] = confidenceInterval95();
        return (high - low) / 2;
    }
};

// ============================================================================
// SERVER STATE
// ============================================================================

// Occupancy, FIFO wait queue and the five statistical accumulators of one
// server. Rebuilt from scratch for every replication.
class ServerState {
    bool busy_ = false;
    SimTime busy_since_ = 0;

    std::deque<SimTime> queue_;    // arrival timestamps, oldest first
    size_t queue_length_ = 0;

    SimTime area_updated_at_ = 0;
    double area_under_queue_length_ = 0;
    long completed_count_ = 0;
    double cumulative_wait_ = 0;
    double cumulative_service_ = 0;
    double cumulative_busy_time_ = 0;

public:
    bool isBusy() const { return busy_; }
    SimTime busySince() const { return busy_since_; }
    const std::deque<SimTime>& queue() const { return queue_; }
    size_t queueLength() const { return queue_length_; }

    double areaUnderQueueLength() const { return area_under_queue_length_; }
    long completedCount() const { return completed_count_; }
    double cumulativeWait() const { return cumulative_wait_; }
    double cumulativeService() const { return cumulative_service_; }
    double cumulativeBusyTime() const { return cumulative_busy_time_; }

    void startService(SimTime now) {
        busy_ = true;
        busy_since_ = now;
    }

    void endService(SimTime now) {
        cumulative_busy_time_ += now - busy_since_;
        busy_ = false;
    }

    // Must run before every change to queue_length_: the integral is taken
    // over the length that held since the last change. With more than one
    // server this intentionally differs from integrating only the last
    // global clock step (current - previous).
    void accumulateArea(SimTime now) {
        area_under_queue_length_ += (now - area_updated_at_) * queue_length_;
        area_updated_at_ = now;
    }

    void enqueue(SimTime arrival_time) {
        queue_.push_back(arrival_time);
        ++queue_length_;
    }

    SimTime dequeue() {
        if (queue_.empty()) {
            throw EngineInvariantViolation("dequeue from an empty server queue");
        }
        SimTime arrival_time = queue_.front();
        queue_.pop_front();
        --queue_length_;
        return arrival_time;
    }

    void recordCompletion() { ++completed_count_; }
    void recordWait(double wait) { cumulative_wait_ += wait; }
    void recordService(double duration) { cumulative_service_ += duration; }

    // Busy time including a busy period still open at `end`
    double busyTimeAt(SimTime end) const {
        return cumulative_busy_time_ + (busy_ ? end - busy_since_ : 0);
    }

    // Queue-length integral over [0, end], closing the trailing segment
    double areaAt(SimTime end) const {
        return area_under_queue_length_ + (end - area_updated_at_) * queue_length_;
    }
};

// ============================================================================
// EVENT SYSTEM
// ============================================================================

enum class EventKind {
    ARRIVAL,
    DEPARTURE
};

inline const char* toString(EventKind kind) {
    switch (kind) {
        case EventKind::ARRIVAL: return "arrival";
        case EventKind::DEPARTURE: return "departure";
    }
    return "unknown";
}

// A recurring occurrence on the simulated calendar. Exactly one instance per
// stream lives for the whole run; reset() clears it between replications.
class Schedulable {
    std::string name_;
    double mean_interval_;
    SimTime scheduled_time_ = 0;
    bool enabled_ = false;

public:
    Schedulable(std::string name, double mean_interval)
        : name_(std::move(name))
        , mean_interval_(mean_interval) {}

    virtual ~Schedulable() = default;

    const std::string& name() const { return name_; }
    double meanInterval() const { return mean_interval_; }
    SimTime scheduledTime() const { return scheduled_time_; }
    bool isEnabled() const { return enabled_; }

    virtual EventKind kind() const = 0;
    virtual void fire(SimulationEngine& engine) = 0;

    // The only writer of scheduled_time_
    SimTime schedule(SimTime clock, VariateSource& rng) {
        enabled_ = true;
        scheduled_time_ = rng.exponential(mean_interval_) + clock;
        return scheduled_time_;
    }

    void enable() { enabled_ = true; }
    void disable() { enabled_ = false; }

    void reset() {
        enabled_ = false;
        scheduled_time_ = 0;
    }
};

// Customer stream feeding all servers
class ArrivalEvent : public Schedulable {
public:
    explicit ArrivalEvent(double mean_interarrival)
        : Schedulable("arrival", mean_interarrival) {}

    EventKind kind() const override { return EventKind::ARRIVAL; }
    void fire(SimulationEngine& engine) override;
};

// Service completions of one server
class DepartureEvent : public Schedulable {
    size_t server_id_;

public:
    DepartureEvent(size_t server_id, double mean_service)
        : Schedulable("departure" + std::to_string(server_id), mean_service)
        , server_id_(server_id) {}

    size_t serverId() const { return server_id_; }

    EventKind kind() const override { return EventKind::DEPARTURE; }
    void fire(SimulationEngine& engine) override;
};

// One arrival slot and one departure slot per server, indexed by server id.
// Iteration order (arrival first, then departures by id) is the tie-break
// order of the event selection.
class EventRegistry {
    ArrivalEvent arrival_;
    std::vector<DepartureEvent> departures_;

public:
    EventRegistry(size_t num_servers, double mean_interarrival, double mean_service)
        : arrival_(mean_interarrival) {
        departures_.reserve(num_servers);
        for (size_t i = 0; i < num_servers; ++i) {
            departures_.emplace_back(i, mean_service);
        }
    }

    ArrivalEvent& arrival() { return arrival_; }
    const ArrivalEvent& arrival() const { return arrival_; }

    DepartureEvent& departure(size_t server_id) { return departures_.at(server_id); }
    const DepartureEvent& departure(size_t server_id) const { return departures_.at(server_id); }

    size_t numDepartures() const { return departures_.size(); }

    template<typename Fn>
    void forEach(Fn&& fn) {
        fn(static_cast<Schedulable&>(arrival_));
        for (auto& d : departures_) fn(static_cast<Schedulable&>(d));
    }

    void resetAll() {
        forEach([](Schedulable& e) { e.reset(); });
    }
};

// ============================================================================
// SIMULATION ENGINE
// ============================================================================

struct SimulationClock {
    SimTime current = 0;
    SimTime previous = 0;
};

// Per-server averages of one replication, or of many after averaging
struct ServerReport {
    double average_wait = 0;          // minutes
    double average_queue_length = 0;  // customers
    double utilization_percent = 0;
    double average_service_time = 0;  // minutes

    ServerReport& operator+=(const ServerReport& other) {
        average_wait += other.average_wait;
        average_queue_length += other.average_queue_length;
        utilization_percent += other.utilization_percent;
        average_service_time += other.average_service_time;
        return *this;
    }

    ServerReport& operator/=(double n) {
        average_wait /= n;
        average_queue_length /= n;
        utilization_percent /= n;
        average_service_time /= n;
        return *this;
    }
};

// Emitted after every handler, for observers that rebuild the run
struct TraceEntry {
    SimTime time;
    EventKind kind;
    size_t server_id;
    size_t queue_length;              // after the handler
    bool busy;                        // after the handler
    std::optional<SimTime> enqueued;  // timestamp pushed onto the queue
    std::optional<SimTime> dequeued;  // timestamp popped off the queue
};

using TraceHook = std::function<void(const TraceEntry&)>;

class SimulationEngine {
    // Model
    size_t num_servers_;
    std::shared_ptr<VariateSource> rng_;
    EventRegistry events_;

    // Replication state
    std::vector<ServerState> servers_;
    SimulationClock clock_;
    uint64_t events_processed_ = 0;

    TraceHook trace_hook_;

public:
    SimulationEngine(size_t num_servers, double mean_interarrival, double mean_service,
                     std::shared_ptr<VariateSource> rng)
        : num_servers_(num_servers)
        , rng_(std::move(rng))
        , events_(num_servers, mean_interarrival, mean_service)
        , servers_(num_servers) {
        if (num_servers_ == 0) {
            throw InvalidConfiguration("at least one server is required");
        }
        if (!(mean_interarrival > 0) || !(mean_service > 0)) {
            throw InvalidConfiguration("mean interarrival and service times must be positive");
        }
        if (!rng_) {
            throw std::invalid_argument("simulation engine needs a variate source");
        }
    }

    // Events hold addresses handed out as seeds
    SimulationEngine(const SimulationEngine&) = delete;
    SimulationEngine& operator=(const SimulationEngine&) = delete;

    // Accessors
    size_t numServers() const { return num_servers_; }
    const SimulationClock& clock() const { return clock_; }
    SimTime currentTime() const { return clock_.current; }
    uint64_t eventsProcessed() const { return events_processed_; }

    const ServerState& server(size_t server_id) const { return servers_.at(server_id); }
    const std::vector<ServerState>& servers() const { return servers_; }

    ArrivalEvent& arrivalEvent() { return events_.arrival(); }
    DepartureEvent& departureEvent(size_t server_id) { return events_.departure(server_id); }

    void setTraceHook(TraceHook hook) { trace_hook_ = std::move(hook); }

    // Fresh replication: new server states, clock at zero, every event reset,
    // then each seed event scheduled from time zero. An event left out of
    // `seed_events` stays disabled for the whole replication.
    void initialize(const std::vector<Schedulable*>& seed_events) {
        servers_.assign(num_servers_, ServerState{});
        clock_ = SimulationClock{};
        events_processed_ = 0;
        events_.resetAll();

        for (Schedulable* e : seed_events) {
            if (!e) throw std::invalid_argument("null seed event");
            e->schedule(clock_.current, *rng_);
        }
    }

    // Enabled event with the smallest scheduled time, earliest registered on
    // ties; nullptr when every event is disabled
    Schedulable* selectNextEvent() {
        Schedulable* next = nullptr;
        events_.forEach([&](Schedulable& e) {
            if (!e.isEnabled()) return;
            if (!next || e.scheduledTime() < next->scheduledTime()) {
                next = &e;
            }
        });
        return next;
    }

    // One simulated time step
    void advanceAndFire() {
        Schedulable* next = selectNextEvent();
        if (!next) {
            std::ostringstream ss;
            ss << "no enabled event at t=" << clock_.current
               << " (was the arrival stream seeded?)";
            throw EngineInvariantViolation(ss.str());
        }

        clock_.previous = clock_.current;
        clock_.current = next->scheduledTime();
        next->fire(*this);
        events_processed_++;
    }

    void runUntil(SimTime stop_time) {
        while (clock_.current < stop_time) {
            advanceAndFire();
        }
    }

    // Random idle server if any is idle, otherwise the first server with the
    // shortest queue
    size_t findFreeServer() {
        std::vector<size_t> idle;
        size_t shortest = 0;
        for (size_t s = 0; s < num_servers_; ++s) {
            if (!servers_[s].isBusy()) {
                idle.push_back(s);
            }
            if (servers_[s].queueLength() < servers_[shortest].queueLength()) {
                shortest = s;
            }
        }

        if (idle.empty()) return shortest;
        if (idle.size() == 1) return idle.front();
        return idle[rng_->pick(idle.size())];
    }

    void handleArrival() {
        const SimTime now = clock_.current;
        const size_t server_id = findFreeServer();

        // The stream continues whatever happens to this customer
        events_.arrival().schedule(now, *rng_);

        ServerState& server = servers_[server_id];
        std::optional<SimTime> enqueued;
        if (!server.isBusy()) {
            server.startService(now);
            server.recordCompletion();
            SimTime departure = events_.departure(server_id).schedule(now, *rng_);
            server.recordService(departure - now);
        } else {
            server.accumulateArea(now);
            server.enqueue(now);
            enqueued = now;
        }

        trace(EventKind::ARRIVAL, server_id, enqueued, std::nullopt);
    }

    void handleDeparture(size_t server_id) {
        const SimTime now = clock_.current;
        ServerState& server = servers_.at(server_id);
        if (!server.isBusy()) {
            std::ostringstream ss;
            ss << "departure from idle server " << server_id << " at t=" << now;
            throw EngineInvariantViolation(ss.str());
        }

        std::optional<SimTime> dequeued;
        if (server.queueLength() == 0) {
            events_.departure(server_id).disable();
            server.endService(now);
        } else {
            SimTime departure = events_.departure(server_id).schedule(now, *rng_);
            server.recordService(departure - now);

            server.accumulateArea(now);
            SimTime arrived = server.dequeue();
            server.recordWait(now - arrived);
            server.recordCompletion();
            dequeued = arrived;
        }

        trace(EventKind::DEPARTURE, server_id, std::nullopt, dequeued);
    }

    // Per-server statistics at the current clock. An open busy period and
    // the trailing queue-length segment are closed at the clock value.
    std::vector<ServerReport> report() const {
        const SimTime elapsed = clock_.current;
        std::vector<ServerReport> result;
        result.reserve(num_servers_);

        for (const auto& server : servers_) {
            ServerReport r;
            const long completed = server.completedCount();
            if (completed > 0) {
                r.average_wait = (server.cumulativeWait() / completed) * MINUTES_PER_TIME_UNIT;
                r.average_service_time =
                    (server.cumulativeService() / completed) * MINUTES_PER_TIME_UNIT;
            }
            if (elapsed > 0) {
                r.average_queue_length = server.areaAt(elapsed) / elapsed;
                r.utilization_percent = (server.busyTimeAt(elapsed) / elapsed) * 100;
            }
            result.push_back(r);
        }
        return result;
    }

private:
    void trace(EventKind kind, size_t server_id,
               std::optional<SimTime> enqueued, std::optional<SimTime> dequeued) {
        if (!trace_hook_) return;
        const ServerState& server = servers_[server_id];
        trace_hook_(TraceEntry{clock_.current, kind, server_id,
                               server.queueLength(), server.isBusy(),
                               enqueued, dequeued});
    }
};

inline void ArrivalEvent::fire(SimulationEngine& engine) {
    engine.handleArrival();
}

inline void DepartureEvent::fire(SimulationEngine& engine) {
    engine.handleDeparture(server_id_);
}

// ============================================================================
// SIMULATION CONFIGURATION
// ============================================================================

struct SimulationConfig {
    int num_servers = 1;
    double arrival_rate = 0;     // customers per time unit
    double service_rate = 0;     // customers per time unit, per server
    int replications = 1;
    SimTime horizon = DEFAULT_HORIZON;
    std::optional<uint64_t> seed;

    double meanInterarrival() const { return 1.0 / arrival_rate; }
    double meanService() const { return 1.0 / service_rate; }

    void validate() const {
        if (num_servers < 1) {
            throw InvalidConfiguration("number of servers must be >= 1, got " +
                                       std::to_string(num_servers));
        }
        if (!std::isfinite(arrival_rate) || arrival_rate <= 0) {
            throw InvalidConfiguration("arrival rate must be positive");
        }
        if (!std::isfinite(service_rate) || service_rate <= 0) {
            throw InvalidConfiguration("service rate must be positive");
        }
        if (replications < 1) {
            throw InvalidConfiguration("number of replications must be >= 1, got " +
                                       std::to_string(replications));
        }
        if (!std::isfinite(horizon) || horizon <= 0) {
            throw InvalidConfiguration("stop horizon must be positive");
        }
    }

    static SimulationConfig fromConfig(const Config& config) {
        for (const char* key : {"num_servers", "arrival_rate", "service_rate", "replications"}) {
            if (!config.contains(key)) {
                throw InvalidConfiguration(std::string("missing '") + key + "'");
            }
        }

        SimulationConfig c;
        c.num_servers = requireInt(config, "num_servers");
        c.arrival_rate = requireNumber(config, "arrival_rate");
        c.service_rate = requireNumber(config, "service_rate");
        c.replications = requireInt(config, "replications");
        if (config.contains("horizon")) {
            c.horizon = requireNumber(config, "horizon");
        }
        if (config.contains("seed")) {
            c.seed = parseSeed(config["seed"]);
        }
        return c;
    }

private:
    static int requireInt(const Config& config, const std::string& key) {
        const Config& v = config[key];
        if (!v.holds<int>()) {
            throw InvalidConfiguration("'" + key + "' must be an integer");
        }
        return v.get<int>();
    }

    static double requireNumber(const Config& config, const std::string& key) {
        const Config& v = config[key];
        if (!v.holds<int>() && !v.holds<double>()) {
            throw InvalidConfiguration("'" + key + "' must be a number");
        }
        return v.number(0);
    }

    static uint64_t parseSeed(const Config& v) {
        if (v.holds<int>() && v.get<int>() >= 0) {
            return static_cast<uint64_t>(v.get<int>());
        }
        if (v.holds<std::string>()) {
            const std::string& text = v.get<std::string>();
            if (!text.empty() && std::all_of(text.begin(), text.end(),
                                             [](char ch) { return ch >= '0' && ch <= '9'; })) {
                try {
                    return std::stoull(text);
                } catch (const std::out_of_range&) {
                    throw InvalidConfiguration("'seed' is out of range");
                }
            }
        }
        throw InvalidConfiguration("'seed' must be a non-negative integer");
    }
};

// ============================================================================
// REPLICATION DRIVER
// ============================================================================

struct ReplicationResult {
    std::vector<ServerReport> averages;     // component-wise sum / N
    std::vector<ServerReport> half_widths;  // 95% confidence half-widths
    int replications = 0;
    uint64_t events_processed = 0;
};

using ReplicationCallback = std::function<void(int, const std::vector<ServerReport>&)>;

class ReplicationDriver {
    SimulationConfig config_;
    SimulationEngine engine_;
    ReplicationCallback on_replication_;

public:
    ReplicationDriver(const SimulationConfig& config, std::shared_ptr<VariateSource> rng)
        : config_(validated(config))
        , engine_(static_cast<size_t>(config.num_servers),
                  config.meanInterarrival(), config.meanService(), std::move(rng)) {}

    const SimulationConfig& config() const { return config_; }
    SimulationEngine& engine() { return engine_; }

    void setReplicationCallback(ReplicationCallback cb) { on_replication_ = std::move(cb); }

    std::vector<ServerReport> runReplication() {
        engine_.initialize({&engine_.arrivalEvent()});
        engine_.runUntil(config_.horizon);
        return engine_.report();
    }

    ReplicationResult run() {
        const size_t servers = engine_.numServers();
        std::vector<ServerReport> sums(servers);
        std::vector<std::array<TimeSeriesStats, 4>> spread(servers);

        ReplicationResult result;
        for (int rep = 0; rep < config_.replications; ++rep) {
            auto report = runReplication();
            result.events_processed += engine_.eventsProcessed();

            for (size_t s = 0; s < servers; ++s) {
                sums[s] += report[s];
                spread[s][0].record(report[s].average_wait);
                spread[s][1].record(report[s].average_queue_length);
                spread[s][2].record(report[s].utilization_percent);
                spread[s][3].record(report[s].average_service_time);
            }

            if (on_replication_) on_replication_(rep, report);
        }

        result.replications = config_.replications;
        result.averages = sums;
        for (auto& avg : result.averages) {
            avg /= static_cast<double>(config_.replications);
        }

        result.half_widths.resize(servers);
        for (size_t s = 0; s < servers; ++s) {
            result.half_widths[s].average_wait = spread[s][0].halfWidth95();
            result.half_widths[s].average_queue_length = spread[s][1].halfWidth95();
            result.half_widths[s].utilization_percent = spread[s][2].halfWidth95();
            result.half_widths[s].average_service_time = spread[s][3].halfWidth95();
        }
        return result;
    }

private:
    static const SimulationConfig& validated(const SimulationConfig& config) {
        config.validate();
        return config;
    }
};

// ============================================================================
// REPORT GENERATOR
// ============================================================================

class ReportGenerator {
public:
    static void printServerReport(const ReplicationResult& result,
                                  const SimulationConfig& config,
                                  std::ostream& out = std::cout) {
        out << "\n";
        printBanner(out, "MULTI-SERVER QUEUE REPORT");
        out << "Servers: " << config.num_servers
            << "   Arrival rate: " << formatDouble(config.arrival_rate)
            << "   Service rate: " << formatDouble(config.service_rate) << "\n";
        out << "Replications: " << result.replications
            << "   Horizon: " << formatDouble(config.horizon)
            << "   Events: " << result.events_processed << "\n";
        out << std::string(70, '=') << "\n";

        const bool with_ci = result.replications > 1;
        for (size_t i = 0; i < result.averages.size(); ++i) {
            const auto& avg = result.averages[i];
            const auto& hw = result.half_widths[i];
            printSection(out, "SERVER " + std::to_string(i));
            printMetric(out, "Average Wait",
                        withSpread(avg.average_wait, hw.average_wait, with_ci) + " min");
            printMetric(out, "Average Queue Length",
                        withSpread(avg.average_queue_length, hw.average_queue_length, with_ci) +
                        " customers");
            printMetric(out, "Utilization",
                        withSpread(avg.utilization_percent, hw.utilization_percent, with_ci) + " %");
            printMetric(out, "Average Service Time",
                        withSpread(avg.average_service_time, hw.average_service_time, with_ci) +
                        " min");
        }

        out << "\n" << std::string(70, '=') << "\n";
    }

    static void printReplication(int replication, const std::vector<ServerReport>& report,
                                 std::ostream& out = std::cout) {
        out << "Replication " << (replication + 1) << "\n";
        for (size_t i = 0; i < report.size(); ++i) {
            const auto& r = report[i];
            out << "  server " << i
                << "  wait " << formatDouble(r.average_wait) << " min"
                << "  queue " << formatDouble(r.average_queue_length)
                << "  util " << formatDouble(r.utilization_percent) << "%"
                << "  service " << formatDouble(r.average_service_time) << " min\n";
        }
    }

    static std::string generateJSON(const ReplicationResult& result,
                                    const SimulationConfig& config,
                                    std::optional<uint64_t> seed = std::nullopt) {
        std::ostringstream ss;
        ss << "{\n";
        ss << "  \"config\": {\n";
        ss << "    \"num_servers\": " << config.num_servers << ",\n";
        ss << "    \"arrival_rate\": " << config.arrival_rate << ",\n";
        ss << "    \"service_rate\": " << config.service_rate << ",\n";
        ss << "    \"replications\": " << config.replications << ",\n";
        ss << "    \"horizon\": " << config.horizon << ",\n";
        ss << "    \"seed\": ";
        if (seed) {
            ss << *seed;
        } else {
            ss << "null";
        }
        ss << "\n";
        ss << "  },\n";
        ss << "  \"events_processed\": " << result.events_processed << ",\n";
        ss << "  \"servers\": [\n";
        for (size_t i = 0; i < result.averages.size(); ++i) {
            const auto& avg = result.averages[i];
            const auto& hw = result.half_widths[i];
            ss << "    {\n";
            ss << "      \"id\": " << i << ",\n";
            ss << "      \"average_wait\": " << avg.average_wait << ",\n";
            ss << "      \"average_queue_length\": " << avg.average_queue_length << ",\n";
            ss << "      \"utilization_percent\": " << avg.utilization_percent << ",\n";
            ss << "      \"average_service_time\": " << avg.average_service_time << ",\n";
            ss << "      \"ci95\": {\n";
            ss << "        \"average_wait\": " << hw.average_wait << ",\n";
            ss << "        \"average_queue_length\": " << hw.average_queue_length << ",\n";
            ss << "        \"utilization_percent\": " << hw.utilization_percent << ",\n";
            ss << "        \"average_service_time\": " << hw.average_service_time << "\n";
            ss << "      }\n";
            ss << "    }" << (i + 1 < result.averages.size() ? "," : "") << "\n";
        }
        ss << "  ]\n";
        ss << "}\n";
        return ss.str();
    }

private:
    static void printBanner(std::ostream& out, const std::string& title) {
        out << std::string(70, '=') << "\n";
        out << "  " << title << "\n";
        out << std::string(70, '=') << "\n";
    }

    static void printSection(std::ostream& out, const std::string& title) {
        out << "\n " << title << "\n";
        out << std::string(40, '-') << "\n";
    }

    template<typename T>
    static void printMetric(std::ostream& out, const std::string& name, T value) {
        out << "  " << std::left << std::setw(25) << name << ": " << value << "\n";
    }

    static std::string withSpread(double value, double half_width, bool with_ci) {
        if (!with_ci) return formatDouble(value);
        return formatDouble(value) + " +/- " + formatDouble(half_width);
    }

    static std::string formatDouble(double v) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(4) << v;
        return ss.str();
    }
};

// ============================================================================
// COMMAND LINE
// ============================================================================

// Builds the variate source for a resolved seed
using SourceFactory = std::function<std::shared_ptr<VariateSource>(uint64_t)>;

namespace detail {

inline void printUsage(std::ostream& err) {
    err << "usage: queue_simulator"
        << " [--json] [--verbose] [servers arrival_rate service_rate replications"
           " [horizon [seed]]]\n"
        << "  with no positional arguments the four required values are prompted for\n";
}

// Whole-token numeric parse; "3x" is an error rather than 3
inline Config parseNumber(const std::string& text, bool integral) {
    size_t used = 0;
    if (integral) {
        int v = std::stoi(text, &used);
        if (used != text.size()) throw std::invalid_argument("not an integer: " + text);
        return Config(v);
    }
    double v = std::stod(text, &used);
    if (used != text.size()) throw std::invalid_argument("not a number: " + text);
    return Config(v);
}

inline std::string prompt(std::istream& in, std::ostream& out, const std::string& question) {
    out << question << std::flush;
    std::string answer;
    if (!(in >> answer)) {
        throw std::runtime_error("input ended before all values were read");
    }
    return answer;
}

}  // namespace detail

// Whole program behind main(). With --json, stdout carries only the JSON
// document; the seed banner, prompts and verbose lines go to `err`.
// Returns the process exit status.
inline int runCommandLine(const std::vector<std::string>& args,
                          std::istream& in, std::ostream& out, std::ostream& err,
                          SourceFactory make_source = {}) {
    bool json = false;
    bool verbose = false;
    std::vector<std::string> positional;

    for (const auto& arg : args) {
        if (arg == "--json") {
            json = true;
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            detail::printUsage(err);
            return 0;
        } else {
            positional.push_back(arg);
        }
    }

    if (!positional.empty() && (positional.size() < 4 || positional.size() > 6)) {
        detail::printUsage(err);
        return 1;
    }

    std::ostream& log = json ? err : out;

    SimulationConfig config;
    try {
        if (positional.empty()) {
            positional.push_back(detail::prompt(in, log, "Number of servers: "));
            positional.push_back(detail::prompt(in, log, "Arrival rate: "));
            positional.push_back(detail::prompt(in, log, "Service rate: "));
            positional.push_back(detail::prompt(in, log, "Number of replications: "));
        }

        Config raw;
        raw["num_servers"] = detail::parseNumber(positional[0], true);
        raw["arrival_rate"] = detail::parseNumber(positional[1], false);
        raw["service_rate"] = detail::parseNumber(positional[2], false);
        raw["replications"] = detail::parseNumber(positional[3], true);
        if (positional.size() > 4) raw["horizon"] = detail::parseNumber(positional[4], false);
        if (positional.size() > 5) raw["seed"] = positional[5];

        config = SimulationConfig::fromConfig(raw);
        config.validate();
    } catch (const std::exception& e) {
        err << "error: " << e.what() << "\n";
        return 1;
    }

    const uint64_t seed = config.seed ? *config.seed : freshSeed();
    log << "Using seed " << seed << "\n";

    try {
        std::shared_ptr<VariateSource> source;
        if (make_source) {
            source = make_source(seed);
        } else {
            source = std::make_shared<RandomGenerator>(seed);
        }
        ReplicationDriver driver(config, source);
        if (verbose) {
            driver.setReplicationCallback([&log](int rep, const std::vector<ServerReport>& report) {
                ReportGenerator::printReplication(rep, report, log);
            });
        }

        ReplicationResult result = driver.run();

        if (json) {
            out << ReportGenerator::generateJSON(result, config, seed);
        } else {
            ReportGenerator::printServerReport(result, config, out);
        }
    } catch (const EngineInvariantViolation& e) {
        err << "simulation aborted: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        err << "error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

}  // namespace QueueSimulator

#endif  // QUEUE_SIMULATOR_HPP
