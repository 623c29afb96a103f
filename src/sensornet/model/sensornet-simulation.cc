/*
 * Sensornet: energy-aware routing for wireless sensor networks
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * Simulation driver: builds one run from its attributes and walks the event
 * queue round by round, forwarding engine outcomes to the trace source.
 */
#include "sensornet-simulation.h"

#include "ns3/abort.h"
#include "ns3/double.h"
#include "ns3/integer.h"
#include "ns3/log.h"
#include "ns3/string.h"
#include "ns3/trace-source-accessor.h"
#include "ns3/uinteger.h"

#include <sstream>

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("SensornetSimulation");

namespace sensornet
{

NS_OBJECT_ENSURE_REGISTERED(Simulation);

Simulation::Simulation()
    : m_nodeCount(100),
      m_areaWidth(100),
      m_areaHeight(100),
      m_initialEnergy(0.5),
      m_baseStation(Vector(50, 150, 0)),
      m_protocol("LEACH"),
      m_randomSeed(1),
      m_roundHorizon(1000),
      m_roundPeriod(Seconds(1)),
      m_hopDelay(Time(0)),
      m_radioRange(30),
      m_dataBits(4000),
      m_controlBits(100),
      m_electronics(50e-9),
      m_freeSpace(10e-12),
      m_multipath(0.0013e-12),
      m_crossover(0),
      m_aggregation(5e-9),
      m_sensing(5e-9),
      m_leachFraction(0.05),
      m_leachFrames(1),
      m_leachRadius(0),
      m_diffusionInterval(5),
      m_diffusionSources(5),
      m_diffusionSinkRange(0),
      m_diffusionTimeout(10),
      m_diffusionRate(1),
      m_gearAlpha(0.5),
      m_gearRadius(15),
      m_gearInterval(1),
      m_gearSinkRange(0),
      m_leaderPolicy("RoundRobin"),
      m_pegasisRebuild(0),
      m_setup(false),
      m_finished(false),
      m_completedRounds(0)
{
    NS_LOG_FUNCTION(this);
    m_uniformRandomVariable = CreateObject<UniformRandomVariable>();
}

Simulation::~Simulation()
{
    NS_LOG_FUNCTION(this);
}

TypeId
Simulation::GetTypeId()
{
    static TypeId tid =
        TypeId("ns3::sensornet::Simulation")
            .SetParent<Object>()
            .SetGroupName("Sensornet")
            .AddConstructor<Simulation>()
            .AddAttribute("NodeCount",
                          "Number of sensor nodes.",
                          UintegerValue(100),
                          MakeUintegerAccessor(&Simulation::m_nodeCount),
                          MakeUintegerChecker<uint32_t>(1))
            .AddAttribute("AreaWidth",
                          "Width of the deployment field in meters.",
                          DoubleValue(100),
                          MakeDoubleAccessor(&Simulation::m_areaWidth),
                          MakeDoubleChecker<double>())
            .AddAttribute("AreaHeight",
                          "Height of the deployment field in meters.",
                          DoubleValue(100),
                          MakeDoubleAccessor(&Simulation::m_areaHeight),
                          MakeDoubleChecker<double>())
            .AddAttribute("InitialEnergy",
                          "Initial energy of every node in joules.",
                          DoubleValue(0.5),
                          MakeDoubleAccessor(&Simulation::m_initialEnergy),
                          MakeDoubleChecker<double>())
            .AddAttribute("BaseStation",
                          "Position of the base station; it may lie outside the field.",
                          VectorValue(Vector(50, 150, 0)),
                          MakeVectorAccessor(&Simulation::m_baseStation),
                          MakeVectorChecker())
            .AddAttribute("Protocol",
                          "Routing protocol: LEACH, DirectedDiffusion, GEAR or PEGASIS.",
                          StringValue("LEACH"),
                          MakeStringAccessor(&Simulation::m_protocol),
                          MakeStringChecker())
            .AddAttribute("RandomSeed",
                          "Random stream used by the run. Equal seeds give equal runs.",
                          IntegerValue(1),
                          MakeIntegerAccessor(&Simulation::m_randomSeed),
                          MakeIntegerChecker<int64_t>(0))
            .AddAttribute("RoundHorizon",
                          "Maximum number of rounds.",
                          UintegerValue(1000),
                          MakeUintegerAccessor(&Simulation::m_roundHorizon),
                          MakeUintegerChecker<uint32_t>(1))
            .AddAttribute("RoundPeriod",
                          "Duration of one round.",
                          TimeValue(Seconds(1)),
                          MakeTimeAccessor(&Simulation::m_roundPeriod),
                          MakeTimeChecker())
            .AddAttribute("HopDelay",
                          "Length of one phase slot. Zero derives it from the round period.",
                          TimeValue(Time(0)),
                          MakeTimeAccessor(&Simulation::m_hopDelay),
                          MakeTimeChecker())
            .AddAttribute("RadioRange",
                          "One-hop communication range in meters.",
                          DoubleValue(30),
                          MakeDoubleAccessor(&Simulation::m_radioRange),
                          MakeDoubleChecker<double>())
            .AddAttribute("DataPacketSize",
                          "Size of a data packet in bits.",
                          UintegerValue(4000),
                          MakeUintegerAccessor(&Simulation::m_dataBits),
                          MakeUintegerChecker<uint32_t>())
            .AddAttribute("ControlPacketSize",
                          "Size of a control packet in bits.",
                          UintegerValue(100),
                          MakeUintegerAccessor(&Simulation::m_controlBits),
                          MakeUintegerChecker<uint32_t>())
            .AddAttribute("ElectronicsEnergy",
                          "Energy of the radio electronics per bit (J/bit).",
                          DoubleValue(50e-9),
                          MakeDoubleAccessor(&Simulation::m_electronics),
                          MakeDoubleChecker<double>(0))
            .AddAttribute("FreeSpaceAmplifier",
                          "Free space amplifier energy (J/bit/m^2).",
                          DoubleValue(10e-12),
                          MakeDoubleAccessor(&Simulation::m_freeSpace),
                          MakeDoubleChecker<double>())
            .AddAttribute("MultipathAmplifier",
                          "Multipath amplifier energy (J/bit/m^4).",
                          DoubleValue(0.0013e-12),
                          MakeDoubleAccessor(&Simulation::m_multipath),
                          MakeDoubleChecker<double>())
            .AddAttribute("CrossoverDistance",
                          "Distance where the amplifier model switches. Zero derives it.",
                          DoubleValue(0),
                          MakeDoubleAccessor(&Simulation::m_crossover),
                          MakeDoubleChecker<double>(0))
            .AddAttribute("AggregationEnergy",
                          "Data fusion energy per bit (J/bit).",
                          DoubleValue(5e-9),
                          MakeDoubleAccessor(&Simulation::m_aggregation),
                          MakeDoubleChecker<double>(0))
            .AddAttribute("SensingEnergy",
                          "Sensing energy per bit (J/bit).",
                          DoubleValue(5e-9),
                          MakeDoubleAccessor(&Simulation::m_sensing),
                          MakeDoubleChecker<double>(0))
            .AddAttribute("LeachClusterHeadFraction",
                          "Desired fraction of cluster heads per round.",
                          DoubleValue(0.05),
                          MakeDoubleAccessor(&Simulation::m_leachFraction),
                          MakeDoubleChecker<double>(0.0, 1.0))
            .AddAttribute("LeachFramesPerRound",
                          "Steady-state TDMA frames per LEACH round.",
                          UintegerValue(1),
                          MakeUintegerAccessor(&Simulation::m_leachFrames),
                          MakeUintegerChecker<uint32_t>())
            .AddAttribute("LeachClusterRadius",
                          "Reach of a cluster head advertisement. Zero covers the field.",
                          DoubleValue(0),
                          MakeDoubleAccessor(&Simulation::m_leachRadius),
                          MakeDoubleChecker<double>(0))
            .AddAttribute("DiffusionInterestInterval",
                          "Rounds between interest floods.",
                          UintegerValue(5),
                          MakeUintegerAccessor(&Simulation::m_diffusionInterval),
                          MakeUintegerChecker<uint32_t>())
            .AddAttribute("DiffusionSourceCount",
                          "Number of sources drawn for each interest.",
                          UintegerValue(5),
                          MakeUintegerAccessor(&Simulation::m_diffusionSources),
                          MakeUintegerChecker<uint32_t>())
            .AddAttribute("DiffusionSinkRange",
                          "Nodes within this distance hear the sink. Zero uses 3x the radio range.",
                          DoubleValue(0),
                          MakeDoubleAccessor(&Simulation::m_diffusionSinkRange),
                          MakeDoubleChecker<double>(0))
            .AddAttribute("DiffusionGradientTimeout",
                          "Rounds an unused gradient survives.",
                          UintegerValue(10),
                          MakeUintegerAccessor(&Simulation::m_diffusionTimeout),
                          MakeUintegerChecker<uint32_t>())
            .AddAttribute("DiffusionReinforcedRate",
                          "Readings per round a source sends on its reinforced path.",
                          UintegerValue(1),
                          MakeUintegerAccessor(&Simulation::m_diffusionRate),
                          MakeUintegerChecker<uint32_t>())
            .AddAttribute("GearAlpha",
                          "Weight of distance against inverse residual energy.",
                          DoubleValue(0.5),
                          MakeDoubleAccessor(&Simulation::m_gearAlpha),
                          MakeDoubleChecker<double>(0.0, 1.0))
            .AddAttribute("GearRegionRadius",
                          "Radius of the default target regions in meters.",
                          DoubleValue(15),
                          MakeDoubleAccessor(&Simulation::m_gearRadius),
                          MakeDoubleChecker<double>())
            .AddAttribute("GearQueryInterval",
                          "Rounds between query waves.",
                          UintegerValue(1),
                          MakeUintegerAccessor(&Simulation::m_gearInterval),
                          MakeUintegerChecker<uint32_t>())
            .AddAttribute("GearSinkRange",
                          "Replies within this distance uplink directly. Zero uses 3x the "
                          "radio range.",
                          DoubleValue(0),
                          MakeDoubleAccessor(&Simulation::m_gearSinkRange),
                          MakeDoubleChecker<double>(0))
            .AddAttribute("PegasisLeaderPolicy",
                          "Chain leader rotation: RoundRobin or Energy.",
                          StringValue("RoundRobin"),
                          MakeStringAccessor(&Simulation::m_leaderPolicy),
                          MakeStringChecker())
            .AddAttribute("PegasisRebuildInterval",
                          "Rebuild the chain every N rounds. Zero rebuilds only on member death.",
                          UintegerValue(0),
                          MakeUintegerAccessor(&Simulation::m_pegasisRebuild),
                          MakeUintegerChecker<uint32_t>())
            .AddTraceSource("Outcome",
                            "An outcome was produced (death, delivery, drop, round end).",
                            MakeTraceSourceAccessor(&Simulation::m_outcomeTrace),
                            "ns3::sensornet::Simulation::OutcomeTracedCallback");
    return tid;
}

void
Simulation::SetNodePositions(const std::vector<Vector>& positions)
{
    NS_LOG_FUNCTION(this << positions.size());
    m_positions = positions;
}

void
Simulation::SetConfig(const SimulationConfig& config)
{
    NS_LOG_FUNCTION(this);
    m_nodeCount = config.nodeCount;
    m_areaWidth = config.areaWidth;
    m_areaHeight = config.areaHeight;
    m_initialEnergy = config.initialEnergy;
    m_baseStation = config.baseStation;
    m_protocol = config.protocolName;
    m_randomSeed = config.randomSeed;
    m_roundHorizon = config.roundHorizon;
    m_roundPeriod = config.roundPeriod;
    m_hopDelay = config.hopDelay;
    m_radioRange = config.radioRange;
    m_dataBits = config.dataPacketBits;
    m_controlBits = config.controlPacketBits;
    m_positions = config.positions;

    m_electronics = config.energy.electronics;
    m_freeSpace = config.energy.freeSpace;
    m_multipath = config.energy.multipath;
    m_crossover = config.energy.crossover;
    m_aggregation = config.energy.aggregation;
    m_sensing = config.energy.sensing;

    m_leachFraction = config.leach.clusterHeadFraction;
    m_leachFrames = config.leach.framesPerRound;
    m_leachRadius = config.leach.clusterRadius;

    m_diffusionInterval = config.diffusion.interestInterval;
    m_diffusionSources = config.diffusion.sourceCount;
    m_diffusionSinkRange = config.diffusion.sinkRange;
    m_diffusionTimeout = config.diffusion.gradientTimeout;
    m_diffusionRate = config.diffusion.reinforcedRate;

    m_gearAlpha = config.gear.alpha;
    m_gearRadius = config.gear.regionRadius;
    m_gearInterval = config.gear.queryInterval;
    m_gearSinkRange = config.gear.sinkRange;
    m_gearRegions = config.gear.regions;

    std::ostringstream policy;
    policy << config.pegasis.leaderPolicy;
    m_leaderPolicy = policy.str();
    m_pegasisRebuild = config.pegasis.rebuildInterval;
}

SimulationConfig
Simulation::GetConfig() const
{
    SimulationConfig config;
    config.nodeCount = m_nodeCount;
    config.areaWidth = m_areaWidth;
    config.areaHeight = m_areaHeight;
    config.initialEnergy = m_initialEnergy;
    config.baseStation = m_baseStation;
    config.protocolName = m_protocol;
    config.randomSeed = m_randomSeed;
    config.roundHorizon = m_roundHorizon;
    config.roundPeriod = m_roundPeriod;
    config.hopDelay = m_hopDelay;
    config.radioRange = m_radioRange;
    config.dataPacketBits = m_dataBits;
    config.controlPacketBits = m_controlBits;
    config.positions = m_positions;

    config.energy.electronics = m_electronics;
    config.energy.freeSpace = m_freeSpace;
    config.energy.multipath = m_multipath;
    config.energy.crossover = m_crossover;
    config.energy.aggregation = m_aggregation;
    config.energy.sensing = m_sensing;

    config.leach.clusterHeadFraction = m_leachFraction;
    config.leach.framesPerRound = m_leachFrames;
    config.leach.clusterRadius = m_leachRadius;

    config.diffusion.interestInterval = m_diffusionInterval;
    config.diffusion.sourceCount = m_diffusionSources;
    config.diffusion.sinkRange = m_diffusionSinkRange;
    config.diffusion.gradientTimeout = m_diffusionTimeout;
    config.diffusion.reinforcedRate = m_diffusionRate;

    config.gear.alpha = m_gearAlpha;
    config.gear.regionRadius = m_gearRadius;
    config.gear.queryInterval = m_gearInterval;
    config.gear.sinkRange = m_gearSinkRange;
    config.gear.regions = m_gearRegions;

    if (!ParseLeaderPolicy(m_leaderPolicy, config.pegasis.leaderPolicy))
    {
        NS_FATAL_ERROR("Unknown PEGASIS leader policy: " << m_leaderPolicy);
    }
    config.pegasis.rebuildInterval = m_pegasisRebuild;
    return config;
}

ProtocolEngine::Variant
Simulation::CreateEngine(const SimulationConfig& config)
{
    ProtocolKind kind = ProtocolKind::LEACH;
    if (!ParseProtocolKind(config.protocolName, kind))
    {
        NS_FATAL_ERROR("Unknown protocol: " << config.protocolName);
    }
    switch (kind)
    {
    case ProtocolKind::LEACH:
        return LeachEngine(config.leach, config.nodeCount, config.GetFieldDiagonal());
    case ProtocolKind::DIRECTED_DIFFUSION:
        return DiffusionEngine(config.diffusion, config.nodeCount, config.radioRange);
    case ProtocolKind::GEAR:
        return GearEngine(config.gear,
                          config.nodeCount,
                          config.radioRange,
                          config.GetGearRegions(),
                          config.baseStation);
    case ProtocolKind::PEGASIS:
        return PegasisEngine(config.pegasis);
    }
    NS_FATAL_ERROR("Unhandled protocol kind " << kind);
}

void
Simulation::Setup()
{
    NS_LOG_FUNCTION(this);
    if (m_setup)
    {
        return;
    }

    SimulationConfig config = GetConfig();
    std::string reason;
    if (!config.Validate(reason))
    {
        NS_FATAL_ERROR("Invalid simulation configuration: " << reason);
    }
    m_config = config;
    m_uniformRandomVariable->SetStream(config.randomSeed);

    std::vector<Vector> positions = config.positions;
    if (positions.empty())
    {
        positions.reserve(config.nodeCount);
        for (uint32_t i = 0; i < config.nodeCount; ++i)
        {
            double x = m_uniformRandomVariable->GetValue(0, config.areaWidth);
            double y = m_uniformRandomVariable->GetValue(0, config.areaHeight);
            positions.emplace_back(x, y, 0);
        }
    }

    m_scheduler = std::make_unique<EventScheduler>();
    m_topology = std::make_unique<Topology>(positions,
                                            config.initialEnergy,
                                            config.baseStation,
                                            config.radioRange);
    m_energy = std::make_unique<EnergyModel>(config.energy);
    m_engine = std::make_unique<ProtocolEngine>(CreateEngine(config));
    m_context = std::make_unique<EngineContext>(*m_scheduler,
                                                *m_topology,
                                                *m_energy,
                                                m_uniformRandomVariable,
                                                config.GetEffectiveHopDelay(),
                                                config.dataPacketBits,
                                                config.controlPacketBits);

    NS_LOG_INFO("Run set up: " << m_engine->GetKind() << ", " << config.nodeCount
                               << " nodes, hop delay " << config.GetEffectiveHopDelay().As(Time::US)
                               << ", horizon " << config.roundHorizon << " rounds");

    Event start(SENSORNET_ROUND_START, NO_NODE, NO_NODE);
    start.round = 0;
    m_scheduler->Schedule(Time(0), start);
    m_outcomes.clear();
    m_completedRounds = 0;
    m_finished = false;
    TakeSnapshot();
    m_setup = true;
}

bool
Simulation::Step()
{
    if (!m_setup)
    {
        Setup();
    }
    if (m_finished)
    {
        return false;
    }

    std::optional<Event> ev = m_scheduler->PopNext();
    if (!ev.has_value())
    {
        NS_LOG_LOGIC("Event queue drained");
        m_finished = true;
        return false;
    }

    switch (ev->type)
    {
    case SENSORNET_ROUND_START:
        StartRound(ev->round);
        break;
    case SENSORNET_ROUND_END:
        EndRound(ev->round);
        break;
    default:
        Record(m_engine->OnEvent(*ev, *m_context));
        break;
    }
    return !m_finished;
}

const std::vector<Outcome>&
Simulation::Run()
{
    NS_LOG_FUNCTION(this);
    Setup();
    while (Step())
    {
    }
    NS_LOG_INFO("Run finished after " << m_completedRounds << " rounds, "
                                      << m_topology->GetNAliveNodes() << " nodes alive, "
                                      << m_outcomes.size() << " outcomes");
    return m_outcomes;
}

void
Simulation::StartRound(uint32_t round)
{
    NS_LOG_FUNCTION(this << round);
    if (m_engine->IsTerminal(*m_topology))
    {
        NS_LOG_INFO("No progress possible at round " << round << ", stopping");
        m_finished = true;
        m_scheduler->Clear();
        return;
    }

    Time start = m_scheduler->Now();
    m_context->BeginRound(round, start);
    Record(m_engine->OnRoundStart(*m_context));

    Event end(SENSORNET_ROUND_END, NO_NODE, NO_NODE);
    end.round = round;
    m_scheduler->Schedule(start + m_config.roundPeriod, end);
}

void
Simulation::EndRound(uint32_t round)
{
    NS_LOG_FUNCTION(this << round);
    Record(m_engine->OnRoundEnd(*m_context));

    Time now = m_scheduler->Now();
    Record({Outcome::RoundCompleted(now,
                                    round,
                                    m_topology->GetNAliveNodes(),
                                    m_topology->GetResidualEnergy(),
                                    m_engine->GetClusterHeadCount())});
    TakeSnapshot();
    m_completedRounds = round + 1;

    if (m_completedRounds >= m_config.roundHorizon || m_engine->IsTerminal(*m_topology))
    {
        NS_LOG_LOGIC("Stopping after round " << round);
        m_finished = true;
        m_scheduler->Clear();
        return;
    }

    Event next(SENSORNET_ROUND_START, NO_NODE, NO_NODE);
    next.round = round + 1;
    m_scheduler->Schedule(now, next);
}

void
Simulation::Record(const std::vector<Outcome>& outcomes)
{
    for (const auto& o : outcomes)
    {
        NS_LOG_DEBUG(o);
        m_outcomes.push_back(o);
        m_outcomeTrace(o);
    }
}

void
Simulation::TakeSnapshot()
{
    m_snapshot.clear();
    m_snapshot.reserve(m_topology->GetNNodes());
    for (uint32_t i = 0; i < m_topology->GetNNodes(); ++i)
    {
        const SensorNode& node = m_topology->GetNode(i);
        m_snapshot.push_back(
            {i, node.GetPosition(), node.GetRole(), node.GetEnergy(), node.IsAlive()});
    }
}

const Topology&
Simulation::GetTopology() const
{
    NS_ABORT_MSG_UNLESS(m_topology, "Simulation::Setup() has not run");
    return *m_topology;
}

const ProtocolEngine&
Simulation::GetEngine() const
{
    NS_ABORT_MSG_UNLESS(m_engine, "Simulation::Setup() has not run");
    return *m_engine;
}

Time
Simulation::GetHopDelay() const
{
    return GetConfig().GetEffectiveHopDelay();
}

int64_t
Simulation::AssignStreams(int64_t stream)
{
    NS_LOG_FUNCTION(this << stream);
    m_randomSeed = stream;
    m_uniformRandomVariable->SetStream(stream);
    return 1;
}

void
Simulation::DoDispose()
{
    NS_LOG_FUNCTION(this);
    m_context.reset();
    m_engine.reset();
    m_energy.reset();
    m_topology.reset();
    m_scheduler.reset();
    m_uniformRandomVariable = nullptr;
    Object::DoDispose();
}

} // namespace sensornet
} // namespace ns3
