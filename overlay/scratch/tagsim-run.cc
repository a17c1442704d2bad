// scratch/tagsim-run.cc
//
// Backscatter tag network run: loads a scenario (exciters, tags, state
// programs, events), runs it on the ns-3 simulator with the periodic
// feedback solve, and prints per-tag voltage ranges.
//
// Run:    ./tagsim-run --config=scenario.json --simTime=2 --logFile=logs/run.ndjson
//
// Notes:
// - Command-line physics values win over the scenario's "physics" block,
//   which wins over attribute defaults.
// - --exportScenario writes the loaded scenario back out before running.

#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>

#include "ns3/core-module.h"

#include "config-loader.h"
#include "feedback-loop.h"
#include "log-sink.h"
#include "tag-manager.h"
#include "tagsim-error.h"
#include "tagsim-simulation.h"
#include "timer-scheduler.h"

using namespace ns3;

// ------------------------------ CLI knobs -----------------------------------
static std::string g_config = "";
static double g_simTime = 1.0;
static double g_feedbackInterval = 0.0;  // 0 keeps the scenario / attribute value
static std::string g_feedbackModel = "";
static double g_noiseStd = -1.0;         // negative keeps the scenario value
static double g_powerOnThresholdDbm = std::numeric_limits<double>::quiet_NaN();
static bool g_feedback = true;
static std::string g_logFile = "logs/tagsim.ndjson";
static bool g_traceInstructions = false;
static std::string g_exportScenario = "";
static uint32_t g_rngSeed = 1;
static uint32_t g_rngRun = 1;
static bool g_verbose = false;

static std::string DumpFlagsTagsim() {
  std::ostringstream s;
  s << "config=" << g_config << "\n";
  s << "simTime=" << g_simTime << "\n";
  s << "feedback=" << g_feedback << "\n";
  s << "feedbackInterval=" << g_feedbackInterval << "\n";
  s << "feedbackModel=" << g_feedbackModel << "\n";
  s << "noiseStd=" << g_noiseStd << "\n";
  s << "powerOnThresholdDbm=" << g_powerOnThresholdDbm << "\n";
  s << "logFile=" << g_logFile << "\n";
  s << "RngSeed=" << g_rngSeed << "\n";
  s << "RngRun=" << g_rngRun << "\n";
  return s.str();
}

static void EnableVerboseLogging() {
  const LogLevel level = LogLevel(LOG_LEVEL_INFO | LOG_PREFIX_TIME | LOG_PREFIX_FUNC);
  for (const char* c : {"TagsimTimerScheduler", "TagsimStateMachine", "TagsimTagMachine",
                        "TagsimTag", "TagsimTagManager", "TagsimPhysicsEngine",
                        "TagsimFeedbackLoop", "TagsimEvent", "TagsimSimulation",
                        "TagsimConfig", "TagsimLogSink"}) {
    LogComponentEnable(c, level);
  }
}

// Command-line overrides, applied after the scenario's physics block.
static nlohmann::json CliPhysicsOverrides() {
  nlohmann::json p = nlohmann::json::object();
  if (!std::isnan(g_powerOnThresholdDbm)) {
    p["power_on_threshold_dbm"] = g_powerOnThresholdDbm;
  }
  if (g_noiseStd >= 0.0) {
    p["noise_std"] = g_noiseStd;
  }
  if (!g_feedbackModel.empty()) {
    p["feedback_model"] = g_feedbackModel;
  }
  if (g_feedbackInterval > 0.0) {
    p["feedback_interval"] = g_feedbackInterval;
  }
  return p;
}

static void PrintSummary(const tagsim::Simulation& sim) {
  std::ostringstream out;
  out << "\n==== TAG VOLTAGES ====\n";
  const auto& ranges = sim.GetFeedbackLoop()->GetVoltageRanges();
  for (const auto& tag : sim.GetTagManager()->GetTags()) {
    out << std::left << std::setw(12) << tag->GetName() << std::right;
    auto it = ranges.find(tag->GetName());
    if (it == ranges.end() || it->second.samples == 0) {
      out << "  (no samples)\n";
      continue;
    }
    const auto& r = it->second;
    out << std::setprecision(6) << "  min(V): " << r.min << "  max(V): " << r.max
        << "  depth(V): " << (r.max - r.min) << "  samples: " << r.samples << "\n";
  }
  out << "\n==== RUN ====\n";
  out << "FeedbackTicks: " << sim.GetFeedbackLoop()->GetTickCount()
      << "  ChannelSolves: " << sim.GetTagManager()->GetPhysicsEngine()->GetSolveCount()
      << "  TimersFired: " << sim.GetTimerScheduler()->GetFiredCount()
      << "  EventsDispatched: " << sim.GetEventRunner()->GetNDispatched() << "\n";
  std::cout << out.str();
}

// ------------------------------ Main ----------------------------------------
int main(int argc, char* argv[]) {
  CommandLine cmd;
  cmd.AddValue("config", "Scenario JSON file.", g_config);
  cmd.AddValue("simTime", "Simulated run time (s).", g_simTime);
  cmd.AddValue("feedback", "Run the periodic feedback solve.", g_feedback);
  cmd.AddValue("feedbackInterval", "Feedback solve period (s), 0 keeps the scenario value.", g_feedbackInterval);
  cmd.AddValue("feedbackModel", "self_consistent or single_bounce.", g_feedbackModel);
  cmd.AddValue("noiseStd", "Voltage noise std-dev (V), negative keeps the scenario value.", g_noiseStd);
  cmd.AddValue("powerOnThresholdDbm", "Tag power-on threshold (dBm).", g_powerOnThresholdDbm);
  cmd.AddValue("logFile", "NDJSON structured log output.", g_logFile);
  cmd.AddValue("traceInstructions", "Log every instruction dispatch.", g_traceInstructions);
  cmd.AddValue("exportScenario", "Write the loaded scenario to this JSON file.", g_exportScenario);
  cmd.AddValue("RngSeed", "ns-3 master RNG seed.", g_rngSeed);
  cmd.AddValue("RngRun", "ns-3 RNG run number.", g_rngRun);
  cmd.AddValue("verbose", "Enable INFO logging on all tagsim components.", g_verbose);
  cmd.Parse(argc, argv);

  if (g_verbose) {
    EnableVerboseLogging();
  }
  RngSeedManager::SetSeed(g_rngSeed);
  RngSeedManager::SetRun(g_rngRun);

  try
  {
    if (g_config.empty()) {
      throw tagsim::ConfigError("--config is required");
    }
    if (!(g_simTime > 0.0)) {
      throw tagsim::ConfigError("--simTime must be positive");
    }

    Ptr<tagsim::LogSink> sink = Create<tagsim::NdjsonLogSink>(g_logFile, g_traceInstructions);
    Ptr<tagsim::TimerScheduler> timers = CreateObject<tagsim::TimerScheduler>();

    tagsim::ConfigLoader loader(timers, sink);
    tagsim::Scenario scenario = loader.LoadFile(g_config);

    Ptr<tagsim::TagManager> manager = tagsim::ConfigLoader::BuildTagManager(scenario);
    Ptr<tagsim::PhysicsEngine> engine = manager->GetPhysicsEngine();
    engine->SetLogSink(sink);
    engine->AssignStreams(0);

    Ptr<tagsim::Simulation> sim = CreateObject<tagsim::Simulation>();
    sim->Setup(manager, timers, sink);
    sim->SetEvents(scenario.events);
    sim->EnableFeedbackLoop(g_feedback);
    tagsim::ConfigLoader::ApplyPhysics(scenario.physics, *engine, *sim->GetFeedbackLoop());
    tagsim::ConfigLoader::ApplyPhysics(CliPhysicsOverrides(), *engine, *sim->GetFeedbackLoop());

    if (!g_exportScenario.empty()) {
      tagsim::ScenarioWriter::WriteFile(
          g_exportScenario,
          tagsim::ScenarioWriter::ToJson(*manager, *scenario.states, sim->GetEventRunner()->GetEvents(),
                                         PeekPointer(sim->GetFeedbackLoop())));
    }

    std::cout << "# FLAGS\n" << DumpFlagsTagsim();
    std::cout << "[RUN] " << manager->GetNTags() << " tags, " << scenario.states->GetNStates()
              << " states, " << scenario.events.size() << " events, until t=" << g_simTime << " s\n";

    sim->Run(Seconds(g_simTime));
    PrintSummary(*sim);

    sim->Dispose();
    Simulator::Destroy();
    return 0;
  }
  catch (const std::exception& ex)
  {
    std::cerr << "[FATAL] exception: " << ex.what() << "\n";
  }

  Simulator::Destroy();
  return 1;
}
