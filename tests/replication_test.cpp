#include "queue_simulator.hpp"
#include "scripted_variates.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <memory>

using namespace QueueSimulator;

namespace {

SimulationConfig makeConfig(int servers, double lambda, double mu, int reps, SimTime horizon) {
    SimulationConfig config;
    config.num_servers = servers;
    config.arrival_rate = lambda;
    config.service_rate = mu;
    config.replications = reps;
    config.horizon = horizon;
    return config;
}

}  // namespace

TEST(ReplicationDriverTest, RejectsInvalidConfigurationUpFront) {
    auto rng = std::make_shared<ScriptedVariates>();
    EXPECT_THROW(ReplicationDriver(makeConfig(0, 1, 1, 1, 8), rng), InvalidConfiguration);
    EXPECT_THROW(ReplicationDriver(makeConfig(1, 0, 1, 1, 8), rng), InvalidConfiguration);
    EXPECT_THROW(ReplicationDriver(makeConfig(1, 1, -1, 1, 8), rng), InvalidConfiguration);
    EXPECT_THROW(ReplicationDriver(makeConfig(1, 1, 1, 0, 8), rng), InvalidConfiguration);
    EXPECT_THROW(ReplicationDriver(makeConfig(1, 1, 1, 1, 0), rng), InvalidConfiguration);
    EXPECT_EQ(rng->exponentialCalls(), 0u);
}

TEST(ReplicationDriverTest, IdenticalReplicationsAverageToThemselves) {
    // Deterministic draws: every replication is the busy-until-horizon run
    auto rng = std::make_shared<ScriptedVariates>();
    ReplicationDriver driver(makeConfig(1, 1.0, 0.01, 3, 5.0), rng);

    int callbacks = 0;
    driver.setReplicationCallback([&](int rep, const std::vector<ServerReport>& report) {
        EXPECT_EQ(rep, callbacks);
        ASSERT_EQ(report.size(), 1u);
        ++callbacks;
    });

    ReplicationResult result = driver.run();
    EXPECT_EQ(callbacks, 3);
    EXPECT_EQ(result.replications, 3);
    EXPECT_EQ(result.events_processed, 15u);
    ASSERT_EQ(result.averages.size(), 1u);
    EXPECT_NEAR(result.averages[0].utilization_percent, 80.0, 1e-9);
    EXPECT_NEAR(result.averages[0].average_queue_length, 1.2, 1e-9);
    EXPECT_NEAR(result.averages[0].average_wait, 0.0, 1e-9);
    EXPECT_NEAR(result.averages[0].average_service_time, 6000.0, 1e-6);
    EXPECT_NEAR(result.half_widths[0].utilization_percent, 0.0, 1e-6);
}

TEST(ReplicationDriverTest, AveragesAreComponentWiseMeans) {
    auto rng = std::make_shared<RandomGenerator>(31337);
    SimulationConfig config = makeConfig(2, 3.0, 2.0, 5, 8.0);
    ReplicationDriver driver(config, rng);

    std::vector<ServerReport> sums(2);
    driver.setReplicationCallback([&](int, const std::vector<ServerReport>& report) {
        for (size_t s = 0; s < report.size(); ++s) sums[s] += report[s];
    });
    ReplicationResult result = driver.run();

    ASSERT_EQ(result.averages.size(), 2u);
    ASSERT_EQ(result.half_widths.size(), 2u);
    for (size_t s = 0; s < 2; ++s) {
        EXPECT_DOUBLE_EQ(result.averages[s].average_wait, sums[s].average_wait / 5);
        EXPECT_DOUBLE_EQ(result.averages[s].average_queue_length, sums[s].average_queue_length / 5);
        EXPECT_DOUBLE_EQ(result.averages[s].utilization_percent, sums[s].utilization_percent / 5);
        EXPECT_DOUBLE_EQ(result.averages[s].average_service_time, sums[s].average_service_time / 5);
        EXPECT_GE(result.half_widths[s].utilization_percent, 0.0);
    }
}

TEST(ReplicationDriverTest, ReplicationsStartFromScratch) {
    auto rng = std::make_shared<RandomGenerator>(8);
    ReplicationDriver driver(makeConfig(2, 4.0, 1.0, 1, 20.0), rng);

    driver.runReplication();
    const SimulationEngine& engine = driver.engine();
    EXPECT_GE(engine.currentTime(), 20.0);

    driver.engine().initialize({&driver.engine().arrivalEvent()});
    for (const auto& s : engine.servers()) {
        EXPECT_FALSE(s.isBusy());
        EXPECT_EQ(s.completedCount(), 0);
        EXPECT_EQ(s.queueLength(), 0u);
    }
}

TEST(ReplicationDriverTest, SingleServerConvergesToMM1Values) {
    // Mean interarrival 5, mean service 3: rho = 0.6, Lq = rho^2 / (1 - rho)
    const double rho = 0.6;
    const double lq = rho * rho / (1 - rho);
    const double wq = lq / 0.2;

    auto rng = std::make_shared<RandomGenerator>(20240601);
    ReplicationDriver driver(makeConfig(1, 1.0 / 5.0, 1.0 / 3.0, 30, 10000.0), rng);
    ReplicationResult result = driver.run();

    const ServerReport& r = result.averages[0];
    EXPECT_NEAR(r.utilization_percent, rho * 100, 3.0);
    EXPECT_NEAR(r.average_queue_length, lq, 0.15);
    EXPECT_NEAR(r.average_wait, wq * MINUTES_PER_TIME_UNIT, 40.0);
    EXPECT_NEAR(r.average_service_time, 3.0 * MINUTES_PER_TIME_UNIT, 10.0);
    EXPECT_GT(result.half_widths[0].utilization_percent, 0.0);
}

TEST(ReplicationDriverTest, UtilizationStaysWithinBoundsUnderOverload) {
    auto rng = std::make_shared<RandomGenerator>(77);
    ReplicationDriver driver(makeConfig(3, 10.0, 1.0, 10, 50.0), rng);
    ReplicationResult result = driver.run();
    for (const auto& r : result.averages) {
        EXPECT_GE(r.utilization_percent, 0.0);
        EXPECT_LE(r.utilization_percent, 100.0);
        EXPECT_GT(r.average_queue_length, 0.0);
    }
}

TEST(TimeSeriesStatsTest, MeanSpreadAndInterval) {
    TimeSeriesStats stats;
    EXPECT_EQ(stats.mean(), 0.0);
    EXPECT_EQ(stats.halfWidth95(), 0.0);

    for (double v : {2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0}) stats.record(v);
    EXPECT_EQ(stats.count(), 8u);
    EXPECT_DOUBLE_EQ(stats.mean(), 5.0);
    EXPECT_NEAR(stats.variance(), 32.0 / 7.0, 1e-12);
    EXPECT_DOUBLE_EQ(stats.min(), 2.0);
    EXPECT_DOUBLE_EQ(stats.max(), 9.0);
    EXPECT_NEAR(stats.halfWidth95(), 1.96 * std::sqrt(32.0 / 7.0) / std::sqrt(8.0), 1e-12);

    TimeSeriesStats flat;
    for (int i = 0; i < 5; ++i) flat.record(0.1);
    EXPECT_GE(flat.variance(), 0.0);
}
