/*
 * Sensornet: energy-aware routing for wireless sensor networks
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * Test suite for the sensornet module: event scheduler, energy model,
 * topology, id cache, the four protocol engines, whole-run scenarios,
 * configuration and metrics.
 */

#include "ns3/sensornet-energy-model.h"
#include "ns3/sensornet-engine-context.h"
#include "ns3/sensornet-event-scheduler.h"
#include "ns3/sensornet-helper.h"
#include "ns3/sensornet-id-cache.h"
#include "ns3/sensornet-metrics.h"
#include "ns3/sensornet-protocol-engine.h"
#include "ns3/sensornet-simulation.h"
#include "ns3/sensornet-topology.h"

#include "ns3/random-variable-stream.h"
#include "ns3/test.h"
#include "ns3/uinteger.h"

#include <algorithm>
#include <iterator>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <utility>

namespace ns3
{
namespace sensornet
{

namespace
{

/// Config with a large battery so nothing dies during short runs
SimulationConfig
LongLivedConfig(const std::string& protocol, uint32_t nodes, uint32_t rounds)
{
    SimulationConfig config;
    config.protocolName = protocol;
    config.nodeCount = nodes;
    config.initialEnergy = 10;
    config.roundHorizon = rounds;
    return config;
}

Ptr<Simulation>
RunConfig(const SimulationConfig& config)
{
    Ptr<Simulation> sim = CreateObject<Simulation>();
    sim->SetConfig(config);
    sim->Run();
    return sim;
}

std::string
Serialize(const std::vector<Outcome>& outcomes)
{
    std::ostringstream os;
    for (const auto& o : outcomes)
    {
        os << o << "\n";
    }
    return os.str();
}

/// Positions of a square grid, row by row
std::vector<Vector>
Grid(uint32_t side, double spacing, double offset)
{
    std::vector<Vector> positions;
    for (uint32_t row = 0; row < side; ++row)
    {
        for (uint32_t col = 0; col < side; ++col)
        {
            positions.emplace_back(offset + col * spacing, offset + row * spacing, 0);
        }
    }
    return positions;
}

/**
 * Drives one protocol engine round by round without a Simulation, so a
 * test can fail nodes between rounds or between two events of a round.
 */
class EngineHarness
{
  public:
    EngineHarness(const SimulationConfig& config, ProtocolEngine::Variant engine)
        : m_topology(config.positions, config.initialEnergy, config.baseStation, config.radioRange),
          m_energy(config.energy),
          m_rng(CreateObject<UniformRandomVariable>()),
          m_engine(std::move(engine)),
          m_context(m_scheduler,
                    m_topology,
                    m_energy,
                    m_rng,
                    config.GetEffectiveHopDelay(),
                    config.dataPacketBits,
                    config.controlPacketBits),
          m_roundPeriod(config.roundPeriod)
    {
        m_rng->SetStream(config.randomSeed);
    }

    void StartRound(uint32_t round)
    {
        Time start = m_scheduler.Now();
        m_roundEnd = start + m_roundPeriod;
        m_context.BeginRound(round, start);
        Record(m_engine.OnRoundStart(m_context));
    }

    /// Fire the pending events scheduled before @p time
    void RunUntil(Time time)
    {
        while (!m_scheduler.IsEmpty() && m_scheduler.PeekNextTime() < time)
        {
            std::optional<Event> ev = m_scheduler.PopNext();
            Record(m_engine.OnEvent(*ev, m_context));
        }
    }

    /**
     * Fire events of the current round until one of the given type fired.
     * @param type the event type to stop after
     * @return false if the round ended first
     */
    bool RunThrough(MessageType type)
    {
        while (!m_scheduler.IsEmpty() && m_scheduler.PeekNextTime() < m_roundEnd)
        {
            std::optional<Event> ev = m_scheduler.PopNext();
            Record(m_engine.OnEvent(*ev, m_context));
            if (ev->type == type)
            {
                return true;
            }
        }
        return false;
    }

    void EndRound()
    {
        RunUntil(m_roundEnd);
        m_scheduler.AdvanceTo(m_roundEnd);
        Record(m_engine.OnRoundEnd(m_context));
    }

    void RunRound(uint32_t round)
    {
        StartRound(round);
        EndRound();
    }

    Topology& GetTopology()
    {
        return m_topology;
    }

    EngineContext& GetContext()
    {
        return m_context;
    }

    const ProtocolEngine& GetEngine() const
    {
        return m_engine;
    }

    const std::vector<Outcome>& GetOutcomes() const
    {
        return m_outcomes;
    }

    /// @return the deliveries recorded during @p round
    std::vector<Outcome> Deliveries(uint32_t round) const
    {
        std::vector<Outcome> out;
        for (const auto& o : m_outcomes)
        {
            if (o.kind == OutcomeKind::PACKET_DELIVERED && o.round == round)
            {
                out.push_back(o);
            }
        }
        return out;
    }

  private:
    void Record(const std::vector<Outcome>& outcomes)
    {
        m_outcomes.insert(m_outcomes.end(), outcomes.begin(), outcomes.end());
    }

    EventScheduler m_scheduler;
    Topology m_topology;
    EnergyModel m_energy;
    Ptr<UniformRandomVariable> m_rng;
    ProtocolEngine m_engine;
    EngineContext m_context;
    Time m_roundPeriod;
    Time m_roundEnd;
    std::vector<Outcome> m_outcomes;
};

/**
 * Two disjoint three-hop paths from node 4 to the sink:
 * 4 -> 2 -> 0 -> sink and 4 -> 3 -> 1 -> sink.  Only nodes 0 and 1 hear
 * the sink.  Both paths tie on latency and hops, so node 0 wins on id.
 */
SimulationConfig
TwoPathConfig()
{
    SimulationConfig config = LongLivedConfig("DirectedDiffusion", 5, 1);
    config.baseStation = Vector(50, 100, 0);
    config.positions = {Vector(35, 80, 0),
                        Vector(66, 80, 0),
                        Vector(35, 55, 0),
                        Vector(66, 55, 0),
                        Vector(50, 35, 0)};
    config.diffusion.sinkRange = 30;
    return config;
}

DiffusionEngine
TwoPathEngine(const SimulationConfig& config)
{
    return DiffusionEngine(config.diffusion, config.nodeCount, config.radioRange);
}

bool
HasGradient(const DiffusionEngine& dd, uint32_t node, uint32_t neighbor)
{
    const std::vector<Gradient>& gradients = dd.GetGradients(node);
    return std::any_of(gradients.begin(), gradients.end(), [neighbor](const Gradient& g) {
        return g.neighbor == neighbor;
    });
}

uint32_t
ReinforcedLastHop(const DiffusionEngine& dd, uint32_t source)
{
    for (const auto& p : dd.GetSinkPaths(source))
    {
        if (p.reinforced)
        {
            return p.lastHop;
        }
    }
    return NO_NODE;
}

} // namespace

// ============================================================================
// 1. EventSchedulerTest
// ============================================================================

/**
 * @ingroup sensornet-test
 * @brief Test case for the event scheduler: ordering, ties, cancel, advance
 */
struct EventSchedulerTest : public TestCase
{
    EventSchedulerTest()
        : TestCase("Sensornet EventScheduler")
    {
    }

    void DoRun() override
    {
        EventScheduler scheduler;
        NS_TEST_EXPECT_MSG_EQ(scheduler.IsEmpty(), true, "New queue is empty");
        NS_TEST_EXPECT_MSG_EQ(scheduler.PopNext().has_value(), false, "Nothing to pop");

        scheduler.Schedule(Seconds(2), Event(SENSORNET_SENSE, 1, NO_NODE));
        scheduler.Schedule(Seconds(1), Event(SENSORNET_SENSE, 2, NO_NODE));
        // equal timestamps fire in insertion order
        scheduler.Schedule(Seconds(3), Event(SENSORNET_SENSE, 3, NO_NODE));
        scheduler.Schedule(Seconds(3), Event(SENSORNET_SENSE, 4, NO_NODE));
        EventHandle cancelled = scheduler.Schedule(Seconds(3), Event(SENSORNET_SENSE, 5, NO_NODE));
        scheduler.Schedule(Seconds(3), Event(SENSORNET_SENSE, 6, NO_NODE));
        NS_TEST_EXPECT_MSG_EQ(scheduler.GetNPending(), 6, "Six events pending");
        NS_TEST_EXPECT_MSG_EQ(scheduler.PeekNextTime(), Seconds(1), "Earliest event first");

        NS_TEST_EXPECT_MSG_EQ(scheduler.IsPending(cancelled), true, "Pending before cancel");
        scheduler.Cancel(cancelled);
        NS_TEST_EXPECT_MSG_EQ(scheduler.IsPending(cancelled), false, "Gone after cancel");
        scheduler.Cancel(cancelled);
        NS_TEST_EXPECT_MSG_EQ(scheduler.GetNPending(), 5, "Second cancel is a no-op");

        uint32_t expected[] = {2, 1, 3, 4, 6};
        Time last = Time(0);
        for (uint32_t origin : expected)
        {
            std::optional<Event> ev = scheduler.PopNext();
            NS_TEST_ASSERT_MSG_EQ(ev.has_value(), true, "Event available");
            NS_TEST_EXPECT_MSG_EQ(ev->origin, origin, "Events fire in (time, insertion) order");
            NS_TEST_EXPECT_MSG_EQ(scheduler.Now(), ev->time, "Clock follows popped event");
            NS_TEST_EXPECT_MSG_EQ((ev->time >= last), true, "Time never moves backward");
            last = ev->time;
        }
        NS_TEST_EXPECT_MSG_EQ(scheduler.IsEmpty(), true, "Queue drained");

        scheduler.AdvanceTo(Seconds(10));
        NS_TEST_EXPECT_MSG_EQ(scheduler.Now(), Seconds(10), "AdvanceTo moves the clock");
        EventHandle h = scheduler.Schedule(Seconds(10), Event(SENSORNET_ROUND_START, NO_NODE, NO_NODE));
        NS_TEST_EXPECT_MSG_EQ(scheduler.IsPending(h), true, "Scheduling at Now() is allowed");
        scheduler.AdvanceTo(Seconds(10));
        scheduler.Clear();
        NS_TEST_EXPECT_MSG_EQ(scheduler.IsEmpty(), true, "Clear drops everything");
        NS_TEST_EXPECT_MSG_EQ(scheduler.Now(), Seconds(10), "Clear keeps the clock");
        NS_TEST_EXPECT_MSG_EQ(scheduler.IsPending(h), false, "Cleared events are released");
        NS_TEST_EXPECT_MSG_EQ(scheduler.GetNPending(), 0, "No handle left behind");

        // handles stay unique across a clear; the queue is released with the scheduler
        EventHandle after = scheduler.Schedule(Seconds(11), Event(SENSORNET_SENSE, 7, NO_NODE));
        NS_TEST_EXPECT_MSG_NE(after, h, "Fresh handle");
        NS_TEST_EXPECT_MSG_EQ(scheduler.PeekNextTime(), Seconds(11), "Queue usable after a clear");
    }
};

// ============================================================================
// 2. EnergyModelTest
// ============================================================================

/**
 * @ingroup sensornet-test
 * @brief Test case for the first order radio model and energy clamping
 */
struct EnergyModelTest : public TestCase
{
    EnergyModelTest()
        : TestCase("Sensornet EnergyModel")
    {
    }

    void DoRun() override
    {
        EnergyModel model;
        NS_TEST_EXPECT_MSG_EQ_TOL(model.GetCrossoverDistance(),
                                  87.7058,
                                  1e-3,
                                  "Crossover is sqrt(fs / mp)");
        NS_TEST_EXPECT_MSG_EQ_TOL(model.TransmitCost(10, 4000),
                                  2.04e-4,
                                  1e-12,
                                  "Free space below the crossover");
        NS_TEST_EXPECT_MSG_EQ_TOL(model.TransmitCost(100, 4000),
                                  7.2e-4,
                                  1e-12,
                                  "Multipath above the crossover");
        NS_TEST_EXPECT_MSG_EQ_TOL(model.ReceiveCost(4000), 2e-4, 1e-12, "Receive cost");
        NS_TEST_EXPECT_MSG_EQ_TOL(model.AggregationCost(8000), 4e-5, 1e-12, "Fusion cost");
        NS_TEST_EXPECT_MSG_EQ_TOL(model.SensingCost(4000), 2e-5, 1e-12, "Sensing cost");
        NS_TEST_EXPECT_MSG_EQ((model.TransmitCost(50, 4000) < model.TransmitCost(51, 4000)),
                              true,
                              "Cost grows with distance");

        EnergyParameters fixed;
        fixed.crossover = 50;
        EnergyModel custom(fixed);
        NS_TEST_EXPECT_MSG_EQ(custom.GetCrossoverDistance(), 50, "Explicit crossover is kept");

        SensorNode node(0, Vector(0, 0, 0), 1e-4);
        EnergyResult r = model.Apply(node, 4e-5);
        NS_TEST_EXPECT_MSG_EQ(r.completed, true, "Affordable charge completes");
        NS_TEST_EXPECT_MSG_EQ(r.died, false, "Node survives");
        NS_TEST_EXPECT_MSG_EQ_TOL(node.GetEnergy(), 6e-5, 1e-15, "Charge deducted");

        r = model.Apply(node, 2e-4);
        NS_TEST_EXPECT_MSG_EQ(r.completed, false, "Unaffordable charge does not complete");
        NS_TEST_EXPECT_MSG_EQ(r.died, true, "Node dies on the unaffordable charge");
        NS_TEST_EXPECT_MSG_EQ(node.GetEnergy(), 0, "Energy clamps at zero");
        NS_TEST_EXPECT_MSG_EQ(node.IsAlive(), false, "Node is dead");

        r = model.Apply(node, 1e-6);
        NS_TEST_EXPECT_MSG_EQ(r.died, false, "Death is reported once");
        NS_TEST_EXPECT_MSG_EQ(r.completed, false, "Dead nodes cannot act");
        NS_TEST_EXPECT_MSG_EQ(node.GetEnergy(), 0, "Energy never goes negative");
    }
};

// ============================================================================
// 3. TopologyTest
// ============================================================================

/**
 * @ingroup sensornet-test
 * @brief Test case for neighbor queries and adjacency invalidation on death
 */
struct TopologyTest : public TestCase
{
    TopologyTest()
        : TestCase("Sensornet Topology")
    {
    }

    void DoRun() override
    {
        std::vector<Vector> positions = {Vector(0, 0, 0),
                                         Vector(10, 0, 0),
                                         Vector(50, 0, 0),
                                         Vector(20, 0, 0)};
        Topology topology(positions, 1.0, Vector(100, 0, 0), 20);
        NS_TEST_EXPECT_MSG_EQ(topology.GetNNodes(), 4, "Four nodes");
        NS_TEST_EXPECT_MSG_EQ(topology.Distance(0, 2), 50, "Node distance");
        NS_TEST_EXPECT_MSG_EQ(topology.DistanceToBaseStation(2), 50, "Base station distance");

        std::vector<uint32_t> n0 = topology.NeighborsWithin(0, 20);
        NS_TEST_ASSERT_MSG_EQ(n0.size(), 2, "Node 0 has two neighbors in range");
        NS_TEST_EXPECT_MSG_EQ(n0[0], 1, "Ascending ids");
        NS_TEST_EXPECT_MSG_EQ(n0[1], 3, "Range is inclusive");
        NS_TEST_EXPECT_MSG_EQ(topology.NeighborsWithin(2, 20).size(), 0, "Node 2 is isolated");
        NS_TEST_EXPECT_MSG_EQ(topology.NeighborsWithin(0, 60).size(),
                              3,
                              "Wider range sees everyone");
        NS_TEST_EXPECT_MSG_EQ(topology.NodesWithin(Vector(15, 0, 0), 5).size(),
                              2,
                              "Nodes around a point");

        topology.MarkDead(1);
        NS_TEST_EXPECT_MSG_EQ(topology.IsAlive(1), false, "Node 1 dead");
        NS_TEST_EXPECT_MSG_EQ(topology.GetNAliveNodes(), 3, "Three alive");
        n0 = topology.NeighborsWithin(0, 20);
        NS_TEST_ASSERT_MSG_EQ(n0.size(), 1, "Dead neighbor disappears");
        NS_TEST_EXPECT_MSG_EQ(n0[0], 3, "Remaining neighbor");
        NS_TEST_EXPECT_MSG_EQ(topology.NeighborsWithin(1, 20).size(), 0, "Dead node has none");
        std::vector<uint32_t> alive = topology.GetAliveNodes();
        NS_TEST_EXPECT_MSG_EQ(std::count(alive.begin(), alive.end(), 1u),
                              0,
                              "Dead node never listed alive");
        NS_TEST_EXPECT_MSG_EQ_TOL(topology.GetResidualEnergy(), 3.0, 1e-12, "Residual energy");

        // drained through the energy model, not MarkDead
        EnergyModel model;
        model.Apply(topology.GetNode(3), 5.0);
        NS_TEST_EXPECT_MSG_EQ(topology.NeighborsWithin(0, 20).size(),
                              0,
                              "Drained node drops out of the cached adjacency");
    }
};

// ============================================================================
// 4. IdCacheTest
// ============================================================================

/**
 * @ingroup sensornet-test
 * @brief Test case for duplicate suppression with expiry
 */
struct IdCacheTest : public TestCase
{
    IdCacheTest()
        : TestCase("Sensornet IdCache")
    {
    }

    void DoRun() override
    {
        IdCache cache(Seconds(5));
        Time now = Seconds(1);
        NS_TEST_EXPECT_MSG_EQ(cache.IsDuplicate(7, 1, now), false, "First time is not duplicate");
        NS_TEST_EXPECT_MSG_EQ(cache.IsDuplicate(7, 1, now), true, "Second time is duplicate");
        NS_TEST_EXPECT_MSG_EQ(cache.IsDuplicate(7, 2, now), false, "Different id");
        NS_TEST_EXPECT_MSG_EQ(cache.IsDuplicate(8, 1, now), false, "Different context");
        NS_TEST_EXPECT_MSG_EQ(cache.GetSize(now), 3, "Cache has 3 entries");
        NS_TEST_EXPECT_MSG_EQ(cache.Contains(7, 1, Seconds(6)), true, "Alive at expiry time");

        NS_TEST_EXPECT_MSG_EQ(cache.IsDuplicate(7, 1, Seconds(7)),
                              false,
                              "Entry expired, should not be duplicate");
        NS_TEST_EXPECT_MSG_EQ(cache.GetSize(Seconds(7)), 1, "Expired entries purged");
        cache.Clear();
        NS_TEST_EXPECT_MSG_EQ(cache.GetSize(Seconds(7)), 0, "Cleared");
        cache.SetLifetime(Seconds(1));
        NS_TEST_EXPECT_MSG_EQ(cache.GetLifeTime(), Seconds(1), "Lifetime updated");
    }
};

// ============================================================================
// 5. LeachThresholdTest
// ============================================================================

/**
 * @ingroup sensornet-test
 * @brief Test case for the LEACH election threshold and cycle length
 */
struct LeachThresholdTest : public TestCase
{
    LeachThresholdTest()
        : TestCase("Sensornet LEACH threshold")
    {
    }

    void DoRun() override
    {
        NS_TEST_EXPECT_MSG_EQ(LeachEngine::CycleLength(0.05), 20, "1/P rounds per cycle");
        NS_TEST_EXPECT_MSG_EQ(LeachEngine::CycleLength(1.0), 1, "P = 1 elects everyone");
        NS_TEST_EXPECT_MSG_EQ_TOL(LeachEngine::Threshold(0.05, 0), 0.05, 1e-12, "T at cycle start");
        NS_TEST_EXPECT_MSG_EQ_TOL(LeachEngine::Threshold(0.1, 5), 0.2, 1e-12, "T mid-cycle");
        NS_TEST_EXPECT_MSG_EQ_TOL(LeachEngine::Threshold(0.05, 19), 1.0, 1e-12, "T at cycle end");
        NS_TEST_EXPECT_MSG_EQ_TOL(LeachEngine::Threshold(0.05, 20), 0.05, 1e-12, "T wraps");
        for (uint32_t r = 0; r < 40; ++r)
        {
            double t = LeachEngine::Threshold(0.05, r);
            NS_TEST_EXPECT_MSG_EQ((t > 0 && t <= 1), true, "T stays in (0, 1] at round " << r);
        }
    }
};

// ============================================================================
// 6. LeachRotationTest
// ============================================================================

/**
 * @ingroup sensornet-test
 * @brief Test case for LEACH head fraction convergence and the rotation window
 */
struct LeachRotationTest : public TestCase
{
    LeachRotationTest()
        : TestCase("Sensornet LEACH rotation")
    {
    }

    void DoRun() override
    {
        SimulationConfig config = LongLivedConfig("LEACH", 100, 200);
        config.initialEnergy = 1000;
        config.randomSeed = 3;
        Ptr<Simulation> sim = RunConfig(config);
        NS_TEST_ASSERT_MSG_EQ(sim->GetCompletedRounds(), 200, "All rounds ran");

        const LeachEngine* leach = sim->GetEngine().Get<LeachEngine>();
        NS_TEST_ASSERT_MSG_NE(leach, nullptr, "LEACH engine");
        const auto& history = leach->GetHeadHistory();
        NS_TEST_ASSERT_MSG_EQ(history.size(), 200, "One head set per round");

        uint64_t total = 0;
        std::map<uint32_t, uint32_t> lastElected;
        for (uint32_t round = 0; round < history.size(); ++round)
        {
            NS_TEST_EXPECT_MSG_GT(history[round].size(), 0, "Round " << round << " has a head");
            total += history[round].size();
            for (uint32_t head : history[round])
            {
                auto last = lastElected.find(head);
                if (last != lastElected.end())
                {
                    NS_TEST_EXPECT_MSG_GT_OR_EQ(round - last->second,
                                                20,
                                                "Node " << head << " re-elected too early");
                }
                lastElected[head] = round;
            }
        }
        double average = static_cast<double>(total) / history.size();
        NS_TEST_EXPECT_MSG_EQ_TOL(average, 5.0, 0.5, "Average heads per round converges to P*N");

        MetricsCollector metrics(100, 1000);
        metrics.RecordAll(sim->GetOutcomes());
        NS_TEST_EXPECT_MSG_EQ_TOL(metrics.Summary().averageClusterHeads,
                                  average,
                                  1e-9,
                                  "Round outcomes report the head count");
        sim->Dispose();
    }
};

// ============================================================================
// 7. PegasisChainTest
// ============================================================================

/**
 * @ingroup sensornet-test
 * @brief Test case for greedy chain construction on a line (Scenario A)
 */
struct PegasisChainTest : public TestCase
{
    PegasisChainTest()
        : TestCase("Sensornet PEGASIS chain on a line")
    {
    }

    void DoRun() override
    {
        std::vector<Vector> line = {Vector(0, 0, 0),
                                    Vector(10, 0, 0),
                                    Vector(20, 0, 0),
                                    Vector(30, 0, 0),
                                    Vector(40, 0, 0)};
        Topology topology(line, 0.5, Vector(50, 0, 0), 30);
        std::vector<uint32_t> chain = PegasisEngine::BuildChain(topology);
        std::vector<uint32_t> expected = {0, 1, 2, 3, 4};
        NS_TEST_EXPECT_MSG_EQ((chain == expected), true, "Chain runs from the far end inward");

        SimulationConfig config;
        config.protocolName = "PEGASIS";
        config.nodeCount = 5;
        config.areaWidth = 50;
        config.areaHeight = 50;
        config.baseStation = Vector(50, 0, 0);
        config.positions = line;
        config.roundHorizon = 1;
        Ptr<Simulation> sim = RunConfig(config);

        const PegasisEngine* pegasis = sim->GetEngine().Get<PegasisEngine>();
        NS_TEST_ASSERT_MSG_NE(pegasis, nullptr, "PEGASIS engine");
        NS_TEST_EXPECT_MSG_EQ((pegasis->GetChain() == expected), true, "Run builds the same chain");
        NS_TEST_EXPECT_MSG_EQ(pegasis->GetLeader(), 0, "Round 0 leader is chain[0]");

        uint32_t delivered = 0;
        for (const auto& o : sim->GetOutcomes())
        {
            if (o.kind == OutcomeKind::PACKET_DELIVERED)
            {
                ++delivered;
                NS_TEST_EXPECT_MSG_EQ(o.contributions, 5, "Leader uplinks every reading fused");
                NS_TEST_EXPECT_MSG_EQ(o.hops, 5, "Four chain hops and the uplink");
            }
            NS_TEST_EXPECT_MSG_NE(o.kind, OutcomeKind::PACKET_DROPPED, "Nothing is lost");
        }
        NS_TEST_EXPECT_MSG_EQ(delivered, 1, "A single long-range transmission");
        sim->Dispose();
    }
};

// ============================================================================
// 8. PegasisCoverageTest
// ============================================================================

/**
 * @ingroup sensornet-test
 * @brief Test case for chain coverage of the live nodes, before and after deaths
 */
struct PegasisCoverageTest : public TestCase
{
    PegasisCoverageTest()
        : TestCase("Sensornet PEGASIS chain coverage")
    {
    }

    void DoRun() override
    {
        SimulationConfig config = LongLivedConfig("PEGASIS", 60, 3);
        config.randomSeed = 11;
        Ptr<Simulation> sim = RunConfig(config);
        const PegasisEngine* pegasis = sim->GetEngine().Get<PegasisEngine>();
        NS_TEST_ASSERT_MSG_NE(pegasis, nullptr, "PEGASIS engine");

        std::vector<uint32_t> chain = pegasis->GetChain();
        std::sort(chain.begin(), chain.end());
        NS_TEST_EXPECT_MSG_EQ((chain == sim->GetTopology().GetAliveNodes()),
                              true,
                              "Every live node appears exactly once");
        NS_TEST_EXPECT_MSG_EQ(pegasis->GetBuildCount(), 1, "No death, no rebuild");
        NS_TEST_EXPECT_MSG_EQ(pegasis->GetLeader(), pegasis->GetChain()[2], "Round-robin leader");

        std::vector<Vector> positions;
        for (const auto& s : sim->GetSnapshot())
        {
            positions.push_back(s.position);
        }
        Topology topology(positions, 1.0, config.baseStation, config.radioRange);
        for (uint32_t dead : {0u, 7u, 31u, 59u})
        {
            topology.MarkDead(dead);
        }
        chain = PegasisEngine::BuildChain(topology);
        NS_TEST_EXPECT_MSG_EQ(chain.size(), topology.GetNAliveNodes(), "Chain length is the live count");
        std::sort(chain.begin(), chain.end());
        NS_TEST_EXPECT_MSG_EQ((std::adjacent_find(chain.begin(), chain.end()) == chain.end()),
                              true,
                              "No duplicates");
        NS_TEST_EXPECT_MSG_EQ((chain == topology.GetAliveNodes()), true, "No dead member");
        sim->Dispose();
    }
};

// ============================================================================
// 9. DiffusionReinforcementTest
// ============================================================================

/**
 * @ingroup sensornet-test
 * @brief Test case for a single reinforced path per source with the best latency
 */
struct DiffusionReinforcementTest : public TestCase
{
    DiffusionReinforcementTest()
        : TestCase("Sensornet Directed Diffusion reinforcement")
    {
    }

    void DoRun() override
    {
        SimulationConfig config = LongLivedConfig("DirectedDiffusion", 25, 1);
        config.positions = Grid(5, 20, 10);
        config.randomSeed = 5;
        Ptr<Simulation> sim = RunConfig(config);
        const DiffusionEngine* dd = sim->GetEngine().Get<DiffusionEngine>();
        NS_TEST_ASSERT_MSG_NE(dd, nullptr, "Diffusion engine");
        NS_TEST_EXPECT_MSG_EQ(dd->GetInterestSequence(), 1, "One interest so far");
        NS_TEST_EXPECT_MSG_EQ(dd->GetSources().size(), 5, "Five sources drawn");
        NS_TEST_EXPECT_MSG_EQ_TOL(dd->GetSinkRange(), 90, 1e-12, "Sink range defaults to 3x range");

        const Topology& topology = sim->GetTopology();
        uint32_t checked = 0;
        for (uint32_t src : dd->GetSources())
        {
            std::vector<PathRecord> paths = dd->GetSinkPaths(src);
            NS_TEST_ASSERT_MSG_GT(paths.size(), 0, "Source " << src << " reached the sink");

            const PathRecord* reinforced = nullptr;
            uint32_t count = 0;
            Time best = Time::Max();
            for (const auto& p : paths)
            {
                if (p.reinforced)
                {
                    reinforced = &p;
                    ++count;
                }
                if (topology.IsAlive(p.lastHop) && p.latency < best)
                {
                    best = p.latency;
                }
            }
            NS_TEST_ASSERT_MSG_EQ(count, 1, "Exactly one reinforced path for source " << src);
            NS_TEST_EXPECT_MSG_EQ(reinforced->latency, best, "Reinforced path has the best latency");
            NS_TEST_EXPECT_MSG_EQ(dd->GetReinforcedHop(reinforced->lastHop, src),
                                  BASE_STATION,
                                  "The chosen neighbor forwards to the sink");

            // follow the reinforced hops from the source to the sink
            uint32_t node = src;
            uint32_t steps = 0;
            while (node != BASE_STATION && node != NO_NODE && steps <= 25)
            {
                node = dd->GetReinforcedHop(node, src);
                ++steps;
            }
            NS_TEST_EXPECT_MSG_EQ(node, BASE_STATION, "Reinforced path leads to the sink");
            ++checked;
        }
        NS_TEST_EXPECT_MSG_EQ(checked, 5, "All sources checked");

        uint32_t delivered = 0;
        for (const auto& o : sim->GetOutcomes())
        {
            if (o.kind == OutcomeKind::PACKET_DELIVERED)
            {
                ++delivered;
            }
        }
        NS_TEST_EXPECT_MSG_EQ(delivered, 5, "Each exploratory reading delivered once");
        sim->Dispose();
    }
};

// ============================================================================
// 10. DiffusionSteadyStateTest
// ============================================================================

/**
 * @ingroup sensornet-test
 * @brief Test case for data on reinforced paths between interests
 */
struct DiffusionSteadyStateTest : public TestCase
{
    DiffusionSteadyStateTest()
        : TestCase("Sensornet Directed Diffusion steady state")
    {
    }

    void DoRun() override
    {
        SimulationConfig config = LongLivedConfig("Diffusion", 25, 4);
        config.positions = Grid(5, 20, 10);
        config.diffusion.reinforcedRate = 2;
        Ptr<Simulation> sim = RunConfig(config);

        MetricsCollector metrics(25, 10);
        metrics.RecordAll(sim->GetOutcomes());
        MetricsSummary s = metrics.Summary();
        // 5 exploratory readings, then 3 rounds of 5 sources x 2 readings
        NS_TEST_EXPECT_MSG_EQ(s.readingsDelivered, 35, "Every reading reaches the sink");
        NS_TEST_EXPECT_MSG_EQ(s.readingsDropped, 0, "No loss without deaths");
        sim->Dispose();
    }
};

// ============================================================================
// 11. GearProgressTest
// ============================================================================

/**
 * @ingroup sensornet-test
 * @brief Test case for greedy progress and hole recovery of a GEAR query
 *
 * Node 1 has no neighbor closer to the region than itself, so the query
 * detours through node 2 before greedy forwarding resumes.
 */
struct GearProgressTest : public TestCase
{
    GearProgressTest()
        : TestCase("Sensornet GEAR progress and recovery")
    {
    }

    void DoRun() override
    {
        SimulationConfig config = LongLivedConfig("GEAR", 6, 1);
        config.baseStation = Vector(5, 50, 0);
        config.positions = {Vector(10, 50, 0),
                            Vector(40, 50, 0),
                            Vector(40, 75, 0),
                            Vector(65, 85, 0),
                            Vector(85, 65, 0),
                            Vector(90, 55, 0)};
        config.gear.regions = {TargetRegion{Vector(90, 50, 0), 10}};
        Ptr<Simulation> sim = RunConfig(config);
        const GearEngine* gear = sim->GetEngine().Get<GearEngine>();
        NS_TEST_ASSERT_MSG_NE(gear, nullptr, "GEAR engine");
        NS_TEST_ASSERT_MSG_EQ(gear->GetQueryIds().size(), 1, "One query per region");

        uint64_t query = gear->GetQueryIds().front();
        NS_TEST_EXPECT_MSG_EQ(gear->GetQueryRegion(query), 0, "Query targets region 0");
        std::vector<GearHop> trace = gear->GetTrace(query);
        NS_TEST_ASSERT_MSG_EQ(trace.size(), 6, "Query visits every node once");

        uint32_t expected[] = {0, 1, 2, 3, 4, 5};
        for (uint32_t i = 0; i < trace.size(); ++i)
        {
            NS_TEST_EXPECT_MSG_EQ(trace[i].node, expected[i], "Hop " << i);
            NS_TEST_EXPECT_MSG_EQ(trace[i].recovery, i == 1, "Only node 1 needs recovery");
        }

        const Topology& topology = sim->GetTopology();
        Vector center(90, 50, 0);
        for (uint32_t i = 0; i + 1 < trace.size(); ++i)
        {
            if (!trace[i].recovery)
            {
                NS_TEST_EXPECT_MSG_LT(trace[i + 1].distanceToRegion,
                                      trace[i].distanceToRegion,
                                      "Greedy hop from " << trace[i].node << " makes progress");
                continue;
            }
            for (uint32_t n : topology.NeighborsWithin(trace[i].node, config.radioRange))
            {
                NS_TEST_EXPECT_MSG_GT_OR_EQ(topology.DistanceTo(n, center),
                                            trace[i].distanceToRegion,
                                            "Recovery only when no neighbor is closer");
            }
        }

        std::vector<uint32_t> reached = gear->GetReached(query);
        NS_TEST_EXPECT_MSG_EQ((std::find(reached.begin(), reached.end(), 5) != reached.end()),
                              true,
                              "Node 5 lies in the region");
        NS_TEST_EXPECT_MSG_GT_OR_EQ(gear->GetLearnedCost(1, 0), 0, "Node 1 learned a cost");

        uint32_t delivered = 0;
        for (const auto& o : sim->GetOutcomes())
        {
            if (o.kind == OutcomeKind::PACKET_DELIVERED)
            {
                ++delivered;
                NS_TEST_EXPECT_MSG_EQ(o.source, 5, "Reply comes from the region");
            }
        }
        NS_TEST_EXPECT_MSG_EQ(delivered, 1, "The region answered");
        sim->Dispose();
    }
};

// ============================================================================
// 12. DeterminismTest
// ============================================================================

/**
 * @ingroup sensornet-test
 * @brief Test case for identical outcome streams from identical configurations
 */
struct DeterminismTest : public TestCase
{
    DeterminismTest()
        : TestCase("Sensornet determinism")
    {
    }

    void DoRun() override
    {
        for (const char* protocol : {"LEACH", "DirectedDiffusion", "GEAR", "PEGASIS"})
        {
            SimulationConfig config;
            config.protocolName = protocol;
            config.nodeCount = 30;
            config.initialEnergy = 0.05;
            config.roundHorizon = 30;
            config.randomSeed = 9;
            Ptr<Simulation> a = RunConfig(config);
            Ptr<Simulation> b = RunConfig(config);
            NS_TEST_EXPECT_MSG_GT(a->GetOutcomes().size(), 0, protocol << " produced outcomes");
            NS_TEST_EXPECT_MSG_EQ(Serialize(a->GetOutcomes()),
                                  Serialize(b->GetOutcomes()),
                                  protocol << " runs are reproducible");
            a->Dispose();
            b->Dispose();
        }
    }
};

// ============================================================================
// 13. LeachLifetimeTest
// ============================================================================

/**
 * @ingroup sensornet-test
 * @brief Test case for a reproducible LEACH lifetime with 100 nodes
 */
struct LeachLifetimeTest : public TestCase
{
    LeachLifetimeTest()
        : TestCase("Sensornet LEACH lifetime")
    {
    }

    void DoRun() override
    {
        SimulationConfig config;
        config.protocolName = "LEACH";
        config.nodeCount = 100;
        config.initialEnergy = 0.5;
        config.leach.clusterHeadFraction = 0.05;
        config.roundHorizon = 500;
        config.randomSeed = 42;

        MetricsSummary summary[2];
        std::string streams[2];
        for (uint32_t i = 0; i < 2; ++i)
        {
            Ptr<Simulation> sim = RunConfig(config);
            MetricsCollector metrics(config.nodeCount, config.initialEnergy);
            metrics.RecordAll(sim->GetOutcomes());
            summary[i] = metrics.Summary();
            streams[i] = Serialize(sim->GetOutcomes());
            sim->Dispose();
        }
        NS_TEST_EXPECT_MSG_EQ(summary[0].firstDeathRound.has_value(),
                              summary[1].firstDeathRound.has_value(),
                              "Both runs agree on whether a node died");
        if (summary[0].firstDeathRound && summary[1].firstDeathRound)
        {
            NS_TEST_EXPECT_MSG_EQ(*summary[0].firstDeathRound,
                                  *summary[1].firstDeathRound,
                                  "Same first death round");
        }
        NS_TEST_EXPECT_MSG_EQ(summary[0].readingsDelivered,
                              summary[1].readingsDelivered,
                              "Same deliveries");
        NS_TEST_EXPECT_MSG_EQ(streams[0], streams[1], "Same outcome stream");
        NS_TEST_EXPECT_MSG_GT(summary[0].readingsDelivered, 0, "Readings reached the sink");
    }
};

// ============================================================================
// 14. LoneNodeTest
// ============================================================================

/**
 * @ingroup sensornet-test
 * @brief Test case for a single node that cannot afford its uplink
 */
struct LoneNodeTest : public TestCase
{
    LoneNodeTest()
        : TestCase("Sensornet lone node drains")
    {
    }

    void DoRun() override
    {
        SimulationConfig config;
        config.protocolName = "LEACH";
        config.nodeCount = 1;
        config.positions = {Vector(0, 0, 0)};
        config.baseStation = Vector(100, 0, 0);
        config.initialEnergy = 1e-4;
        config.roundHorizon = 10;
        Ptr<Simulation> sim = RunConfig(config);
        const std::vector<Outcome>& outcomes = sim->GetOutcomes();

        auto died = std::find_if(outcomes.begin(), outcomes.end(), [](const Outcome& o) {
            return o.kind == OutcomeKind::NODE_DIED;
        });
        NS_TEST_ASSERT_MSG_EQ((died != outcomes.end()), true, "The node died");
        NS_TEST_EXPECT_MSG_EQ(died->node, 0, "Node 0 died");
        auto dropped = std::next(died);
        NS_TEST_ASSERT_MSG_EQ((dropped != outcomes.end()), true, "A drop follows the death");
        NS_TEST_EXPECT_MSG_EQ(dropped->kind, OutcomeKind::PACKET_DROPPED, "Reading dropped");
        NS_TEST_EXPECT_MSG_EQ(dropped->reason, DropReason::SENDER_DIED, "Sender could not afford it");
        NS_TEST_EXPECT_MSG_EQ(dropped->contributions, 1, "One reading lost");
        NS_TEST_EXPECT_MSG_EQ(dropped->time, died->time, "Death and drop at the same instant");
        NS_TEST_EXPECT_MSG_EQ(std::count_if(outcomes.begin(),
                                            outcomes.end(),
                                            [](const Outcome& o) {
                                                return o.kind == OutcomeKind::PACKET_DELIVERED;
                                            }),
                              0,
                              "Nothing delivered");
        NS_TEST_EXPECT_MSG_EQ(sim->IsFinished(), true, "Run ends with the last node");
        NS_TEST_EXPECT_MSG_EQ(sim->GetCompletedRounds(), 1, "Only the first round completes");
        sim->Dispose();
    }
};

// ============================================================================
// 15. EnergyInvariantTest
// ============================================================================

/**
 * @ingroup sensornet-test
 * @brief Test case for energy and death bookkeeping over a run to exhaustion
 */
struct EnergyInvariantTest : public TestCase
{
    EnergyInvariantTest()
        : TestCase("Sensornet energy invariants")
    {
    }

    void DoRun() override
    {
        for (const char* protocol : {"LEACH", "PEGASIS"})
        {
            SimulationConfig config;
            config.protocolName = protocol;
            config.nodeCount = 20;
            config.initialEnergy = 0.01;
            config.roundHorizon = 5000;
            config.randomSeed = 17;
            Ptr<Simulation> sim = CreateObject<Simulation>();
            sim->SetConfig(config);
            sim->Setup();

            double lastResidual = 20 * 0.01;
            uint32_t lastRound = 0;
            while (sim->Step())
            {
                if (sim->GetCompletedRounds() == lastRound)
                {
                    continue;
                }
                lastRound = sim->GetCompletedRounds();
                double residual = 0;
                for (const auto& s : sim->GetSnapshot())
                {
                    NS_TEST_EXPECT_MSG_GT_OR_EQ(s.remainingEnergy, 0, "Energy never negative");
                    NS_TEST_EXPECT_MSG_EQ(s.alive, s.remainingEnergy > 0, "Alive iff energy left");
                    residual += s.remainingEnergy;
                }
                NS_TEST_EXPECT_MSG_LT_OR_EQ(residual, lastResidual + 1e-12, "Energy only decreases");
                lastResidual = residual;
            }

            std::set<uint32_t> dead;
            for (const auto& o : sim->GetOutcomes())
            {
                if (o.kind == OutcomeKind::NODE_DIED)
                {
                    NS_TEST_EXPECT_MSG_EQ(dead.insert(o.node).second,
                                          true,
                                          protocol << ": node " << o.node << " died twice");
                }
            }
            NS_TEST_EXPECT_MSG_EQ(sim->IsFinished(), true, protocol << " run finished");
            NS_TEST_EXPECT_MSG_EQ(sim->GetTopology().GetNAliveNodes(),
                                  20 - dead.size(),
                                  protocol << ": alive count matches reported deaths");
            NS_TEST_EXPECT_MSG_EQ(dead.size(), 20, protocol << ": every node eventually dies");
            sim->Dispose();
        }
    }
};

// ============================================================================
// 16. ConfigValidationTest
// ============================================================================

/**
 * @ingroup sensornet-test
 * @brief Test case for configuration validation
 */
struct ConfigValidationTest : public TestCase
{
    ConfigValidationTest()
        : TestCase("Sensornet configuration validation")
    {
    }

    void Expect(const SimulationConfig& config, bool valid, const std::string& what)
    {
        std::string reason;
        NS_TEST_EXPECT_MSG_EQ(config.Validate(reason), valid, what << ": " << reason);
        NS_TEST_EXPECT_MSG_EQ(reason.empty(), valid, what << " reports a reason when invalid");
    }

    void DoRun() override
    {
        SimulationConfig base;
        Expect(base, true, "Defaults");

        SimulationConfig c = base;
        c.nodeCount = 0;
        Expect(c, false, "No nodes");

        c = base;
        c.initialEnergy = 0;
        Expect(c, false, "No energy");

        c = base;
        c.areaWidth = -1;
        Expect(c, false, "Negative width");

        c = base;
        c.protocolName = "AODV";
        Expect(c, false, "Unknown protocol");

        c = base;
        c.protocolName = "directed-diffusion";
        Expect(c, true, "Protocol names are case and dash insensitive");

        c = base;
        c.hopDelay = MilliSeconds(100);
        Expect(c, false, "Round too short for the phase slots");

        c = base;
        c.leach.clusterHeadFraction = 0;
        Expect(c, false, "Zero head fraction");

        c = base;
        c.leach.framesPerRound = 1000;
        Expect(c, false, "Too many frames");

        c = base;
        c.gear.alpha = 1.5;
        Expect(c, false, "Alpha out of range");

        c = base;
        c.nodeCount = 2;
        c.positions = {Vector(1, 1, 0)};
        Expect(c, false, "Position count mismatch");

        c.positions.emplace_back(150, 1, 0);
        Expect(c, false, "Position outside the field");

        c.positions.back() = Vector(99, 1, 0);
        Expect(c, true, "Explicit positions");

        NS_TEST_EXPECT_MSG_EQ(SimulationConfig::SlotBudget(100), 416, "4N + 16 slots");
        NS_TEST_EXPECT_MSG_EQ(base.GetEffectiveHopDelay() * SimulationConfig::SlotBudget(100) <=
                                  base.roundPeriod,
                              true,
                              "Derived hop delay fits the round");
        NS_TEST_EXPECT_MSG_EQ(base.GetGearRegions().size(), 2, "Two default GEAR regions");
    }
};

// ============================================================================
// 17. MetricsTest
// ============================================================================

/**
 * @ingroup sensornet-test
 * @brief Test case for lifetime and delivery figures
 */
struct MetricsTest : public TestCase
{
    MetricsTest()
        : TestCase("Sensornet metrics")
    {
    }

    void DoRun() override
    {
        SensorPacket three;
        three.contributions = 3;
        SensorPacket one;
        one.contributions = 1;

        MetricsCollector metrics(4, 1.0);
        metrics.Record(Outcome::PacketDelivered(Seconds(0.5), 0, three));
        metrics.Record(Outcome::RoundCompleted(Seconds(1), 0, 4, 3.5, 1));
        metrics.Record(Outcome::NodeDied(Seconds(2.5), 2, 0));
        metrics.Record(Outcome::PacketDropped(Seconds(2.5), 2, 0, one, DropReason::SENDER_DIED));
        metrics.Record(Outcome::NodeDied(Seconds(5.5), 5, 1));
        metrics.Record(Outcome::RoundCompleted(Seconds(6), 5, 2, 3.0, 3));

        MetricsSummary s = metrics.Summary();
        NS_TEST_ASSERT_MSG_EQ(s.firstDeathRound.has_value(), true, "A node died");
        NS_TEST_EXPECT_MSG_EQ(*s.firstDeathRound, 2, "First death round");
        NS_TEST_EXPECT_MSG_EQ(*s.firstDeathTime, Seconds(2.5), "First death time");
        NS_TEST_ASSERT_MSG_EQ(s.halfDeathRound.has_value(), true, "Half the nodes died");
        NS_TEST_EXPECT_MSG_EQ(*s.halfDeathRound, 5, "Half death round");
        NS_TEST_EXPECT_MSG_EQ(s.lastDeathRound.has_value(), false, "Two nodes survive");
        NS_TEST_EXPECT_MSG_EQ(s.rounds, 2, "Completed rounds");
        NS_TEST_EXPECT_MSG_EQ_TOL(s.deliveryRatio, 0.75, 1e-12, "Three of four readings delivered");
        NS_TEST_EXPECT_MSG_EQ_TOL(s.energyConsumed, 1.0, 1e-12, "Consumed energy");
        NS_TEST_EXPECT_MSG_EQ_TOL(s.energyPerReading, 1.0 / 3, 1e-12, "Energy per reading");
        NS_TEST_EXPECT_MSG_EQ_TOL(s.averageClusterHeads, 2.0, 1e-12, "Average heads");
        NS_TEST_EXPECT_MSG_EQ(s.dropsByReason[DropReason::SENDER_DIED], 1, "Drops by reason");
        NS_TEST_EXPECT_MSG_EQ(s.aliveHistory.size(), 2, "Alive history per round");

        std::ostringstream os;
        metrics.Print(os);
        NS_TEST_EXPECT_MSG_EQ(os.str().empty(), false, "Summary prints");

        // a collector on the trace source sees the same stream as the batch
        SimulationConfig config = LongLivedConfig("PEGASIS", 20, 10);
        config.initialEnergy = 0.02;
        Ptr<Simulation> sim = CreateObject<Simulation>();
        sim->SetConfig(config);
        MetricsCollector streamed(20, 0.02);
        streamed.ConnectTo(sim);
        sim->Run();
        MetricsCollector batch(20, 0.02);
        batch.RecordAll(sim->GetOutcomes());
        std::ostringstream a;
        std::ostringstream b;
        streamed.Print(a);
        batch.Print(b);
        NS_TEST_EXPECT_MSG_EQ(a.str(), b.str(), "Streamed and batch figures agree");
        NS_TEST_EXPECT_MSG_EQ(streamed.Summary().rounds, sim->GetCompletedRounds(), "Round count");
        sim->Dispose();
    }
};

// ============================================================================
// 18. HelperTest
// ============================================================================

/**
 * @ingroup sensornet-test
 * @brief Test case for the helper, attributes and stream assignment
 */
struct HelperTest : public TestCase
{
    HelperTest()
        : TestCase("Sensornet helper")
    {
    }

    void DoRun() override
    {
        SensornetHelper helper;
        helper.Set("NodeCount", UintegerValue(12));
        helper.Set("RoundHorizon", UintegerValue(5));
        Ptr<Simulation> a = helper.Create("PEGASIS");
        Ptr<Simulation> b = helper.Create("LEACH");

        SimulationConfig config = a->GetConfig();
        NS_TEST_EXPECT_MSG_EQ(config.nodeCount, 12, "Attribute reaches the run");
        NS_TEST_EXPECT_MSG_EQ(config.protocolName, "PEGASIS", "Protocol attribute");
        NS_TEST_EXPECT_MSG_EQ(b->GetConfig().protocolName, "LEACH", "Second run protocol");

        int64_t streams = helper.AssignStreams({a, b}, 7);
        NS_TEST_EXPECT_MSG_EQ(streams, 2, "One stream per run");
        NS_TEST_EXPECT_MSG_EQ(a->GetConfig().randomSeed, 7, "First stream");
        NS_TEST_EXPECT_MSG_EQ(b->GetConfig().randomSeed, 8, "Second stream");

        // snapshots before and after a run
        a->Setup();
        NS_TEST_ASSERT_MSG_EQ(a->GetSnapshot().size(), 12, "One entry per node");
        for (const auto& s : a->GetSnapshot())
        {
            NS_TEST_EXPECT_MSG_EQ(s.alive, true, "Everyone alive at start");
            NS_TEST_EXPECT_MSG_EQ_TOL(s.remainingEnergy, 0.5, 1e-12, "Full battery");
        }
        a->Run();
        NS_TEST_EXPECT_MSG_EQ(a->GetCompletedRounds(), 5, "Horizon respected");
        for (const auto& s : a->GetSnapshot())
        {
            NS_TEST_EXPECT_MSG_EQ(s.alive, a->GetTopology().IsAlive(s.id), "Snapshot matches");
        }
        a->Dispose();
        b->Dispose();
    }
};

// ============================================================================
// 19. DiffusionDeadNeighborTest
// ============================================================================

/**
 * @ingroup sensornet-test
 * @brief Test case for reinforcement falling back when the chosen neighbor died
 *
 * Node 0 dies after the sink picked it, before its reinforcement arrives;
 * the sink then reinforces the path through node 1.
 */
struct DiffusionDeadNeighborTest : public TestCase
{
    DiffusionDeadNeighborTest()
        : TestCase("Sensornet Directed Diffusion reinforcement around a dead neighbor")
    {
    }

    void DoRun() override
    {
        SimulationConfig config = TwoPathConfig();
        EngineHarness h(config, TwoPathEngine(config));
        h.StartRound(0);
        NS_TEST_ASSERT_MSG_EQ(h.RunThrough(SENSORNET_GRADIENT_UPDATE), true, "Gradient update fired");
        const DiffusionEngine* dd = h.GetEngine().Get<DiffusionEngine>();
        NS_TEST_ASSERT_MSG_NE(dd, nullptr, "Diffusion engine");
        NS_TEST_EXPECT_MSG_EQ(ReinforcedLastHop(*dd, 4), 0, "Sink first picks node 0");

        h.GetTopology().MarkDead(0);
        h.EndRound();

        NS_TEST_EXPECT_MSG_EQ(ReinforcedLastHop(*dd, 4), 1, "Sink falls back to node 1");
        NS_TEST_EXPECT_MSG_EQ(dd->GetReinforcedHop(4, 4), 3, "Source forwards to node 3");
        NS_TEST_EXPECT_MSG_EQ(dd->GetReinforcedHop(3, 4), 1, "Node 3 forwards to node 1");
        NS_TEST_EXPECT_MSG_EQ(dd->GetReinforcedHop(1, 4), BASE_STATION, "Node 1 reaches the sink");
        NS_TEST_EXPECT_MSG_EQ(dd->GetReinforcedHop(2, 4), NO_NODE, "Dead branch stays unreinforced");
    }
};

// ============================================================================
// 20. DiffusionNegativeReinforcementTest
// ============================================================================

/**
 * @ingroup sensornet-test
 * @brief Test case for the sink switching its preferred neighbor
 *
 * Node 2 dies between interests, so the second interest only finds the
 * path through node 1.  The sink negatively reinforces node 0, which must
 * drop both its reinforced hop and its gradient toward the sink.
 */
struct DiffusionNegativeReinforcementTest : public TestCase
{
    DiffusionNegativeReinforcementTest()
        : TestCase("Sensornet Directed Diffusion negative reinforcement")
    {
    }

    void DoRun() override
    {
        SimulationConfig config = TwoPathConfig();
        config.diffusion.interestInterval = 1;
        EngineHarness h(config, TwoPathEngine(config));
        const DiffusionEngine* dd = h.GetEngine().Get<DiffusionEngine>();
        NS_TEST_ASSERT_MSG_NE(dd, nullptr, "Diffusion engine");

        h.RunRound(0);
        NS_TEST_EXPECT_MSG_EQ(ReinforcedLastHop(*dd, 4), 0, "First interest prefers node 0");
        NS_TEST_EXPECT_MSG_EQ(dd->GetReinforcedHop(0, 4), BASE_STATION, "Node 0 reinforced");
        NS_TEST_EXPECT_MSG_EQ(HasGradient(*dd, 0, BASE_STATION), true, "Gradient toward the sink");

        h.GetTopology().MarkDead(2);
        h.RunRound(1);
        NS_TEST_EXPECT_MSG_EQ(dd->GetInterestSequence(), 2, "Second interest");
        NS_TEST_EXPECT_MSG_EQ(ReinforcedLastHop(*dd, 4), 1, "Sink switched to node 1");
        NS_TEST_EXPECT_MSG_EQ(dd->GetReinforcedHop(0, 4), NO_NODE, "Old reinforced hop removed");
        NS_TEST_EXPECT_MSG_EQ(HasGradient(*dd, 0, BASE_STATION),
                              false,
                              "Old gradient toward the sink pruned");
        NS_TEST_EXPECT_MSG_EQ(dd->GetReinforcedHop(0, 0),
                              BASE_STATION,
                              "Node 0 keeps its own reinforced path");

        uint32_t fromSource = 0;
        for (const auto& o : h.Deliveries(1))
        {
            if (o.source == 4)
            {
                ++fromSource;
            }
        }
        NS_TEST_EXPECT_MSG_EQ(fromSource, 1, "Source 4 still reaches the sink");
    }
};

// ============================================================================
// 21. DiffusionGradientTimeoutTest
// ============================================================================

/**
 * @ingroup sensornet-test
 * @brief Test case for pruning of gradients that carried no data
 */
struct DiffusionGradientTimeoutTest : public TestCase
{
    DiffusionGradientTimeoutTest()
        : TestCase("Sensornet Directed Diffusion gradient timeout")
    {
    }

    void DoRun() override
    {
        SimulationConfig config = TwoPathConfig();
        config.diffusion.gradientTimeout = 1;
        config.diffusion.interestInterval = 10;
        EngineHarness h(config, TwoPathEngine(config));
        const DiffusionEngine* dd = h.GetEngine().Get<DiffusionEngine>();
        NS_TEST_ASSERT_MSG_NE(dd, nullptr, "Diffusion engine");

        h.RunRound(0);
        h.RunRound(1);
        NS_TEST_EXPECT_MSG_EQ(HasGradient(*dd, 0, 2), true, "Idle gradient survives one round");
        NS_TEST_EXPECT_MSG_EQ(HasGradient(*dd, 4, 3), true, "Idle gradient at the source too");

        h.RunRound(2);
        NS_TEST_EXPECT_MSG_EQ(HasGradient(*dd, 0, 2), false, "Idle gradient timed out");
        NS_TEST_EXPECT_MSG_EQ(HasGradient(*dd, 4, 3), false, "Unused branch timed out");
        NS_TEST_EXPECT_MSG_EQ(HasGradient(*dd, 0, BASE_STATION), true, "Data keeps it alive");
        NS_TEST_EXPECT_MSG_EQ(HasGradient(*dd, 4, 2), true, "Reinforced branch kept");
        NS_TEST_EXPECT_MSG_EQ(dd->GetReinforcedHop(4, 4), 2, "Reinforced hop kept");
        NS_TEST_EXPECT_MSG_EQ(h.Deliveries(2).size(), 5, "Every source still delivers");
    }
};

// ============================================================================
// 22. DiffusionInterestSupersedeTest
// ============================================================================

/**
 * @ingroup sensornet-test
 * @brief Test case for a newer interest replacing the gradients of the old one
 */
struct DiffusionInterestSupersedeTest : public TestCase
{
    DiffusionInterestSupersedeTest()
        : TestCase("Sensornet Directed Diffusion newer interest supersedes gradients")
    {
    }

    void DoRun() override
    {
        SimulationConfig config = TwoPathConfig();
        config.diffusion.interestInterval = 1;
        EngineHarness h(config, TwoPathEngine(config));
        const DiffusionEngine* dd = h.GetEngine().Get<DiffusionEngine>();
        NS_TEST_ASSERT_MSG_NE(dd, nullptr, "Diffusion engine");

        h.RunRound(0);
        NS_TEST_EXPECT_MSG_EQ(dd->GetGradients(4).size(), 2, "Source heard both relays");
        NS_TEST_EXPECT_MSG_EQ(HasGradient(*dd, 4, 2), true, "Gradient toward node 2");

        // well inside the timeout, so only the new interest can remove it
        h.GetTopology().MarkDead(2);
        h.RunRound(1);
        NS_TEST_EXPECT_MSG_EQ(dd->GetInterestSequence(), 2, "Second interest");
        NS_TEST_EXPECT_MSG_EQ(dd->GetGradients(4).size(), 1, "Only the fresh gradient remains");
        NS_TEST_EXPECT_MSG_EQ(HasGradient(*dd, 4, 2), false, "Stale gradient dropped");
        NS_TEST_EXPECT_MSG_EQ(HasGradient(*dd, 4, 3), true, "Fresh gradient toward node 3");
    }
};

// ============================================================================
// 23. LeachDeadHeadTest
// ============================================================================

/**
 * @ingroup sensornet-test
 * @brief Test case for members uplinking directly once their head died
 */
struct LeachDeadHeadTest : public TestCase
{
    LeachDeadHeadTest()
        : TestCase("Sensornet LEACH member of a dead cluster head")
    {
    }

    void DoRun() override
    {
        SimulationConfig config = LongLivedConfig("LEACH", 9, 1);
        config.positions = Grid(3, 10, 40);
        config.leach.clusterHeadFraction = 0.2;
        EngineHarness h(config,
                        LeachEngine(config.leach, config.nodeCount, config.GetFieldDiagonal()));
        const LeachEngine* leach = h.GetEngine().Get<LeachEngine>();
        NS_TEST_ASSERT_MSG_NE(leach, nullptr, "LEACH engine");

        h.StartRound(0);
        // advertise, join and schedule phases
        h.RunUntil(h.GetContext().SlotTime(4));
        uint32_t member = NO_NODE;
        for (uint32_t id = 0; id < config.nodeCount && member == NO_NODE; ++id)
        {
            if (leach->GetClusterHead(id) != NO_NODE)
            {
                member = id;
            }
        }
        NS_TEST_ASSERT_MSG_NE(member, NO_NODE, "Some node joined a cluster");
        uint32_t head = leach->GetClusterHead(member);
        h.GetTopology().MarkDead(head);
        h.EndRound();

        bool direct = false;
        for (const auto& o : h.Deliveries(0))
        {
            NS_TEST_EXPECT_MSG_NE(o.source, head, "Dead head delivers nothing");
            if (o.source == member)
            {
                direct = true;
                NS_TEST_EXPECT_MSG_EQ(o.contributions, 1, "Own reading only");
                NS_TEST_EXPECT_MSG_EQ(o.hops, 1, "Straight to the base station");
            }
        }
        NS_TEST_EXPECT_MSG_EQ(direct, true, "Member " << member << " sent directly");
        for (const auto& o : h.GetOutcomes())
        {
            NS_TEST_EXPECT_MSG_NE(o.kind, OutcomeKind::PACKET_DROPPED, "No reading lost");
        }
    }
};

// ============================================================================
// 24. LeachForcedHeadTest
// ============================================================================

/**
 * @ingroup sensornet-test
 * @brief Test case for the forced cluster head when nobody draws below T
 *
 * With a vanishing P no draw succeeds, so every round forces the eligible
 * node with the least energy.
 */
struct LeachForcedHeadTest : public TestCase
{
    LeachForcedHeadTest()
        : TestCase("Sensornet LEACH forced lowest-energy cluster head")
    {
    }

    void DoRun() override
    {
        SimulationConfig config = LongLivedConfig("LEACH", 4, 2);
        config.positions = {Vector(40, 40, 0),
                            Vector(60, 40, 0),
                            Vector(40, 60, 0),
                            Vector(60, 60, 0)};
        config.leach.clusterHeadFraction = 1e-9;
        EngineHarness h(config,
                        LeachEngine(config.leach, config.nodeCount, config.GetFieldDiagonal()));
        const LeachEngine* leach = h.GetEngine().Get<LeachEngine>();
        NS_TEST_ASSERT_MSG_NE(leach, nullptr, "LEACH engine");

        EnergyModel model;
        model.Apply(h.GetTopology().GetNode(2), 9);
        model.Apply(h.GetTopology().GetNode(1), 5);

        h.RunRound(0);
        std::vector<uint32_t> first = {2};
        NS_TEST_EXPECT_MSG_EQ((leach->GetHeadHistory().at(0) == first),
                              true,
                              "Least charged node forced");

        h.RunRound(1);
        NS_TEST_EXPECT_MSG_EQ(leach->IsEligible(2, 1), false, "Node 2 waits out its cycle");
        std::vector<uint32_t> second = {1};
        NS_TEST_EXPECT_MSG_EQ((leach->GetHeadHistory().at(1) == second),
                              true,
                              "Least charged eligible node forced next");
    }
};

// ============================================================================
// 25. GearRegionFloodTest
// ============================================================================

/**
 * @ingroup sensornet-test
 * @brief Test case for duplicate suppression of the in-region flood
 *
 * Nodes 3, 4 and 5 lie in the region and hear each other, so each hears
 * the flood more than once but answers only once.
 */
struct GearRegionFloodTest : public TestCase
{
    GearRegionFloodTest()
        : TestCase("Sensornet GEAR in-region flood duplicates")
    {
    }

    void DoRun() override
    {
        SimulationConfig config = LongLivedConfig("GEAR", 6, 1);
        config.baseStation = Vector(5, 50, 0);
        config.positions = {Vector(10, 50, 0),
                            Vector(35, 50, 0),
                            Vector(60, 50, 0),
                            Vector(75, 50, 0),
                            Vector(80, 58, 0),
                            Vector(85, 45, 0)};
        config.gear.regions = {TargetRegion{Vector(80, 50, 0), 15}};
        Ptr<Simulation> sim = RunConfig(config);
        const GearEngine* gear = sim->GetEngine().Get<GearEngine>();
        NS_TEST_ASSERT_MSG_NE(gear, nullptr, "GEAR engine");
        NS_TEST_ASSERT_MSG_EQ(gear->GetQueryIds().size(), 1, "One query");

        std::vector<uint32_t> reached = gear->GetReached(gear->GetQueryIds().front());
        std::vector<uint32_t> expected = {3, 4, 5};
        NS_TEST_EXPECT_MSG_EQ((reached == expected), true, "Each region node reached once");

        std::set<uint32_t> repliers;
        uint32_t delivered = 0;
        for (const auto& o : sim->GetOutcomes())
        {
            if (o.kind == OutcomeKind::PACKET_DELIVERED)
            {
                ++delivered;
                repliers.insert(o.source);
            }
            NS_TEST_EXPECT_MSG_NE(o.kind, OutcomeKind::PACKET_DROPPED, "No reply lost");
        }
        NS_TEST_EXPECT_MSG_EQ(delivered, 3, "One reply per region node");
        NS_TEST_EXPECT_MSG_EQ(repliers.size(), 3, "From three distinct nodes");
        sim->Dispose();
    }
};

// ============================================================================
// 26. GearVisitedTest
// ============================================================================

/**
 * @ingroup sensornet-test
 * @brief Test case for greedy forwarding skipping nodes the query visited
 *
 * Node 1 is a hole, so the query detours to node 2.  The only neighbor of
 * node 2 closer to the region is node 1 again; the query must keep
 * detouring through node 3 instead of bouncing back.
 */
struct GearVisitedTest : public TestCase
{
    GearVisitedTest()
        : TestCase("Sensornet GEAR greedy step skips visited nodes")
    {
    }

    void DoRun() override
    {
        SimulationConfig config = LongLivedConfig("GEAR", 7, 1);
        config.baseStation = Vector(5, 50, 0);
        config.positions = {Vector(10, 50, 0),
                            Vector(38, 50, 0),
                            Vector(40, 25, 0),
                            Vector(45, 0, 0),
                            Vector(70, 5, 0),
                            Vector(85, 25, 0),
                            Vector(95, 48, 0)};
        config.gear.regions = {TargetRegion{Vector(95, 50, 0), 5}};
        Ptr<Simulation> sim = RunConfig(config);
        const GearEngine* gear = sim->GetEngine().Get<GearEngine>();
        NS_TEST_ASSERT_MSG_NE(gear, nullptr, "GEAR engine");
        NS_TEST_ASSERT_MSG_EQ(gear->GetQueryIds().size(), 1, "One query");

        uint64_t query = gear->GetQueryIds().front();
        std::vector<GearHop> trace = gear->GetTrace(query);
        NS_TEST_ASSERT_MSG_EQ(trace.size(), 7, "Query visits every node once");
        for (uint32_t i = 0; i < trace.size(); ++i)
        {
            NS_TEST_EXPECT_MSG_EQ(trace[i].node, i, "Hop " << i);
            NS_TEST_EXPECT_MSG_EQ(trace[i].recovery, i == 1 || i == 2, "Recovery at " << i);
        }
        std::vector<uint32_t> reached = gear->GetReached(query);
        NS_TEST_EXPECT_MSG_EQ((reached == std::vector<uint32_t>{6}), true, "Region reached");

        uint32_t delivered = 0;
        for (const auto& o : sim->GetOutcomes())
        {
            if (o.kind == OutcomeKind::PACKET_DELIVERED)
            {
                ++delivered;
                NS_TEST_EXPECT_MSG_EQ(o.source, 6, "Reply from the region");
            }
        }
        NS_TEST_EXPECT_MSG_EQ(delivered, 1, "The region answered");
        sim->Dispose();
    }
};

// ============================================================================
// 27. PegasisRebuildTest
// ============================================================================

/**
 * @ingroup sensornet-test
 * @brief Test case for chain rebuilds after deaths, down to a single node
 */
struct PegasisRebuildTest : public TestCase
{
    PegasisRebuildTest()
        : TestCase("Sensornet PEGASIS rebuild after a member death")
    {
    }

    void DoRun() override
    {
        SimulationConfig config = LongLivedConfig("PEGASIS", 5, 3);
        config.baseStation = Vector(50, 0, 0);
        config.positions = {Vector(0, 0, 0),
                            Vector(10, 0, 0),
                            Vector(20, 0, 0),
                            Vector(30, 0, 0),
                            Vector(40, 0, 0)};
        EngineHarness h(config, PegasisEngine(config.pegasis));
        const PegasisEngine* pegasis = h.GetEngine().Get<PegasisEngine>();
        NS_TEST_ASSERT_MSG_NE(pegasis, nullptr, "PEGASIS engine");

        h.RunRound(0);
        NS_TEST_EXPECT_MSG_EQ(pegasis->GetBuildCount(), 1, "Built once");
        NS_TEST_EXPECT_MSG_EQ(pegasis->GetChain().size(), 5, "Whole line chained");

        h.GetTopology().MarkDead(2);
        h.RunRound(1);
        std::vector<uint32_t> rebuilt = {0, 1, 3, 4};
        NS_TEST_EXPECT_MSG_EQ(pegasis->GetBuildCount(), 2, "Death forces a rebuild");
        NS_TEST_EXPECT_MSG_EQ((pegasis->GetChain() == rebuilt), true, "Chain skips the dead node");
        NS_TEST_EXPECT_MSG_EQ(pegasis->GetLeader(), 1, "Round 1 leader is chain[1]");
        std::vector<Outcome> second = h.Deliveries(1);
        NS_TEST_ASSERT_MSG_EQ(second.size(), 1, "One uplink");
        NS_TEST_EXPECT_MSG_EQ(second.front().contributions, 4, "Every live reading fused");

        h.GetTopology().MarkDead(0);
        h.GetTopology().MarkDead(1);
        h.GetTopology().MarkDead(3);
        h.RunRound(2);
        NS_TEST_EXPECT_MSG_EQ(pegasis->GetBuildCount(), 3, "Rebuilt again");
        NS_TEST_EXPECT_MSG_EQ(pegasis->GetChain().size(), 1, "Single survivor");
        NS_TEST_EXPECT_MSG_EQ(pegasis->GetLeader(), 4, "Survivor leads");
        std::vector<Outcome> last = h.Deliveries(2);
        NS_TEST_ASSERT_MSG_EQ(last.size(), 1, "Survivor uplinks");
        NS_TEST_EXPECT_MSG_EQ(last.front().source, 4, "Its own reading");
        NS_TEST_EXPECT_MSG_EQ(last.front().contributions, 1, "Nothing to fuse");
        NS_TEST_EXPECT_MSG_EQ(last.front().hops, 1, "Straight to the base station");
    }
};

// ============================================================================
// 28. ProtocolKindTest
// ============================================================================

/**
 * @ingroup sensornet-test
 * @brief Test case for the protocol kind reported by each engine
 */
struct ProtocolKindTest : public TestCase
{
    ProtocolKindTest()
        : TestCase("Sensornet protocol engine kind")
    {
    }

    void DoRun() override
    {
        std::map<std::string, ProtocolKind> expected = {
            {"LEACH", ProtocolKind::LEACH},
            {"DirectedDiffusion", ProtocolKind::DIRECTED_DIFFUSION},
            {"GEAR", ProtocolKind::GEAR},
            {"PEGASIS", ProtocolKind::PEGASIS}};
        for (const auto& [name, kind] : expected)
        {
            Ptr<Simulation> sim = RunConfig(LongLivedConfig(name, 10, 1));
            NS_TEST_EXPECT_MSG_EQ(sim->GetEngine().GetKind(), kind, name);
            sim->Dispose();
        }
    }
};

/**
 * @ingroup sensornet-test
 * @brief Sensornet TestSuite
 */
class SensornetTestSuite : public TestSuite
{
  public:
    SensornetTestSuite()
        : TestSuite("sensornet", Type::UNIT)
    {
        AddTestCase(new EventSchedulerTest, TestCase::Duration::QUICK);
        AddTestCase(new EnergyModelTest, TestCase::Duration::QUICK);
        AddTestCase(new TopologyTest, TestCase::Duration::QUICK);
        AddTestCase(new IdCacheTest, TestCase::Duration::QUICK);
        AddTestCase(new LeachThresholdTest, TestCase::Duration::QUICK);
        AddTestCase(new LeachRotationTest, TestCase::Duration::QUICK);
        AddTestCase(new PegasisChainTest, TestCase::Duration::QUICK);
        AddTestCase(new PegasisCoverageTest, TestCase::Duration::QUICK);
        AddTestCase(new DiffusionReinforcementTest, TestCase::Duration::QUICK);
        AddTestCase(new DiffusionSteadyStateTest, TestCase::Duration::QUICK);
        AddTestCase(new GearProgressTest, TestCase::Duration::QUICK);
        AddTestCase(new DeterminismTest, TestCase::Duration::QUICK);
        AddTestCase(new LeachLifetimeTest, TestCase::Duration::EXTENSIVE);
        AddTestCase(new LoneNodeTest, TestCase::Duration::QUICK);
        AddTestCase(new EnergyInvariantTest, TestCase::Duration::QUICK);
        AddTestCase(new ConfigValidationTest, TestCase::Duration::QUICK);
        AddTestCase(new MetricsTest, TestCase::Duration::QUICK);
        AddTestCase(new HelperTest, TestCase::Duration::QUICK);
        AddTestCase(new DiffusionDeadNeighborTest, TestCase::Duration::QUICK);
        AddTestCase(new DiffusionNegativeReinforcementTest, TestCase::Duration::QUICK);
        AddTestCase(new DiffusionGradientTimeoutTest, TestCase::Duration::QUICK);
        AddTestCase(new DiffusionInterestSupersedeTest, TestCase::Duration::QUICK);
        AddTestCase(new LeachDeadHeadTest, TestCase::Duration::QUICK);
        AddTestCase(new LeachForcedHeadTest, TestCase::Duration::QUICK);
        AddTestCase(new GearRegionFloodTest, TestCase::Duration::QUICK);
        AddTestCase(new GearVisitedTest, TestCase::Duration::QUICK);
        AddTestCase(new PegasisRebuildTest, TestCase::Duration::QUICK);
        AddTestCase(new ProtocolKindTest, TestCase::Duration::QUICK);
    }
};

static SensornetTestSuite g_sensornetTestSuite; ///< the test suite

} // namespace sensornet
} // namespace ns3
