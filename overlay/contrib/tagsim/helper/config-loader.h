#pragma once

#include "feedback-loop.h"
#include "log-sink.h"
#include "physics-engine.h"
#include "state-machine.h"
#include "tag-event.h"
#include "tag-manager.h"
#include "timer-scheduler.h"

#include <nlohmann/json.hpp>

#include <complex>
#include <string>
#include <vector>

namespace tagsim {

// Everything a scenario file describes, built but not yet registered.
struct Scenario
{
  ns3::Ptr<StateSerializer> states;
  std::vector<ns3::Ptr<Exciter>> exciters;
  std::string mainExciter;
  std::vector<ns3::Ptr<Tag>> tags;
  std::vector<ns3::Ptr<Event>> events;
  nlohmann::json physics = nlohmann::json::object();
  nlohmann::json defaults = nlohmann::json::object();
};

class ConfigLoader
{
public:
  ConfigLoader(ns3::Ptr<TimerScheduler> timers, ns3::Ptr<LogSink> sink);

  // Throws ConfigError with the offending field in the message.
  Scenario LoadFile(const std::string& path) const;
  Scenario Load(const nlohmann::json& doc) const;

  // Registers exciters and tags with a fresh manager.
  static ns3::Ptr<TagManager> BuildTagManager(const Scenario& scenario);
  static void ApplyPhysics(const nlohmann::json& physics, PhysicsEngine& engine, FeedbackLoop& loop);

  // A number (ohms, real) or [re, im].
  static std::complex<double> ParseImpedance(const nlohmann::json& v, const std::string& context);

private:
  ns3::Ptr<Exciter> ParseExciter(const std::string& name, const nlohmann::json& j) const;
  ns3::Ptr<Tag> ParseTag(const std::string& name,
                         const nlohmann::json& j,
                         const nlohmann::json& defaults,
                         ns3::Ptr<StateSerializer> states) const;

  ns3::Ptr<TimerScheduler> m_timers;
  ns3::Ptr<LogSink> m_sink;
};

// Writes a live scenario in the layout ConfigLoader reads.
class ScenarioWriter
{
public:
  static nlohmann::json ToJson(const TagManager& manager,
                               const StateSerializer& states,
                               const std::vector<ns3::Ptr<Event>>& events,
                               const FeedbackLoop* loop = nullptr);
  static void WriteFile(const std::string& path, const nlohmann::json& doc);
};

} // namespace tagsim
