#include "config-loader.h"

#include "ns3/log.h"
#include "tagsim-error.h"

#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <stdexcept>

namespace tagsim {

NS_LOG_COMPONENT_DEFINE("TagsimConfig");

namespace {

const nlohmann::json&
Require(const nlohmann::json& obj, const char* key, const std::string& context)
{
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null())
  {
    throw ConfigError(context + ": field '" + key + "' is required");
  }
  return *it;
}

double
RequireNumber(const nlohmann::json& obj, const char* key, const std::string& context)
{
  const nlohmann::json& v = Require(obj, key, context);
  if (!v.is_number())
  {
    throw ConfigError(context + "." + key + ": expected a number, got " + v.dump());
  }
  return v.get<double>();
}

ns3::Vector
ParsePosition(const nlohmann::json& j, const std::string& context)
{
  return ns3::Vector(RequireNumber(j, "x", context),
                     RequireNumber(j, "y", context),
                     RequireNumber(j, "z", context));
}

} // namespace

ConfigLoader::ConfigLoader(ns3::Ptr<TimerScheduler> timers, ns3::Ptr<LogSink> sink)
  : m_timers(timers),
    m_sink(sink)
{
}

std::complex<double>
ConfigLoader::ParseImpedance(const nlohmann::json& v, const std::string& context)
{
  if (v.is_number())
  {
    return {v.get<double>(), 0.0};
  }
  if (v.is_array() && v.size() == 2 && v[0].is_number() && v[1].is_number())
  {
    return {v[0].get<double>(), v[1].get<double>()};
  }
  throw ConfigError(context + ": impedance must be a number or [re, im], got " + v.dump());
}

Scenario
ConfigLoader::LoadFile(const std::string& path) const
{
  std::ifstream in(path);
  if (!in.is_open())
  {
    throw ConfigError("cannot open scenario file " + path);
  }
  nlohmann::json doc;
  try
  {
    in >> doc;
  }
  catch (const nlohmann::json::parse_error& ex)
  {
    throw ConfigError(path + ": " + ex.what());
  }
  NS_LOG_INFO("loaded scenario " << path);
  return Load(doc);
}

Scenario
ConfigLoader::Load(const nlohmann::json& doc) const
{
  if (!doc.is_object())
  {
    throw ConfigError("scenario: expected a JSON object");
  }
  Scenario sc;
  sc.states = ns3::Create<StateSerializer>();

  try
  {
    sc.states->LoadJson(Require(doc, "states", "scenario"));

    if (doc.contains("physics"))
    {
      sc.physics = doc.at("physics");
    }
    if (doc.contains("default"))
    {
      sc.defaults = doc.at("default");
      if (!sc.defaults.is_object())
      {
        throw ConfigError("default: expected an object");
      }
    }

    const nlohmann::json& exciters = Require(doc, "exciters", "scenario");
    if (!exciters.is_object() || exciters.empty())
    {
      throw ConfigError("exciters: expected at least one exciter");
    }
    for (auto it = exciters.begin(); it != exciters.end(); ++it)
    {
      sc.exciters.push_back(ParseExciter(it.key(), it.value()));
    }
    if (doc.contains("main_exciter"))
    {
      const nlohmann::json& main = doc.at("main_exciter");
      if (!main.is_string() || !exciters.contains(main.get<std::string>()))
      {
        throw ConfigError("main_exciter: " + main.dump() + " does not name an exciter");
      }
      sc.mainExciter = main.get<std::string>();
    }
    else
    {
      sc.mainExciter = sc.exciters.front()->GetName();
    }

    const nlohmann::json& tags = Require(doc, "tags", "scenario");
    if (!tags.is_object())
    {
      throw ConfigError("tags: expected an object keyed by tag name");
    }
    for (auto it = tags.begin(); it != tags.end(); ++it)
    {
      sc.tags.push_back(ParseTag(it.key(), it.value(), sc.defaults, sc.states));
    }

    if (doc.contains("events"))
    {
      sc.events = LoadEvents(doc.at("events"));
    }
  }
  catch (const nlohmann::json::exception& ex)
  {
    throw ConfigError(std::string("scenario: ") + ex.what());
  }

  NS_LOG_INFO("scenario has " << sc.exciters.size() << " exciters, " << sc.tags.size() << " tags, "
                              << sc.states->GetNStates() << " states, " << sc.events.size()
                              << " events");
  return sc;
}

ns3::Ptr<Exciter>
ConfigLoader::ParseExciter(const std::string& name, const nlohmann::json& j) const
{
  const std::string ctx = "exciters." + name;
  if (!j.is_object())
  {
    throw ConfigError(ctx + ": expected an object");
  }
  return ns3::CreateObject<Exciter>(name,
                                    ParsePosition(j, ctx),
                                    RequireNumber(j, "power", ctx),
                                    RequireNumber(j, "gain", ctx),
                                    ParseImpedance(Require(j, "impedance", ctx), ctx + ".impedance"),
                                    RequireNumber(j, "frequency", ctx));
}

ns3::Ptr<Tag>
ConfigLoader::ParseTag(const std::string& name,
                       const nlohmann::json& j,
                       const nlohmann::json& defaults,
                       ns3::Ptr<StateSerializer> states) const
{
  const std::string ctx = "tags." + name;
  if (!j.is_object())
  {
    throw ConfigError(ctx + ": expected an object");
  }
  nlohmann::json merged = defaults;
  merged.update(j);

  std::vector<std::complex<double>> chips;
  const nlohmann::json& chipList = Require(merged, "chip_impedances", ctx);
  if (!chipList.is_array())
  {
    throw ConfigError(ctx + ".chip_impedances: expected an array");
  }
  for (size_t i = 0; i < chipList.size(); ++i)
  {
    chips.push_back(ParseImpedance(chipList[i], ctx + ".chip_impedances[" + std::to_string(i) + "]"));
  }

  std::unique_ptr<TagMachine> machine;
  try
  {
    machine = TagMachine::FromJson(Require(merged, "machine", ctx), states, m_timers, m_sink);
  }
  catch (const ConfigError& ex)
  {
    throw ConfigError(ctx + ": " + ex.what());
  }

  const double power = merged.contains("power") ? RequireNumber(merged, "power", ctx) : 0.0;
  ns3::Ptr<Tag> tag = ns3::CreateObject<Tag>(name,
                                             ParsePosition(merged, ctx),
                                             power,
                                             RequireNumber(merged, "gain", ctx),
                                             ParseImpedance(Require(merged, "impedance", ctx), ctx + ".impedance"),
                                             RequireNumber(merged, "frequency", ctx),
                                             std::move(chips),
                                             std::move(machine));

  if (merged.contains("mode"))
  {
    const nlohmann::json& mode = merged.at("mode");
    if (!mode.is_string())
    {
      throw ConfigError(ctx + ".mode: expected a string, got " + mode.dump());
    }
    std::optional<int64_t> index;
    if (merged.contains("reflection_index"))
    {
      const nlohmann::json& ri = merged.at("reflection_index");
      if (!ri.is_number_integer())
      {
        throw ConfigError(ctx + ".reflection_index: expected an integer, got " + ri.dump());
      }
      index = ri.get<int64_t>();
    }
    try
    {
      tag->SetMode(TagMode::FromString(mode.get<std::string>(), index));
    }
    catch (const std::out_of_range& ex)
    {
      throw ConfigError(ctx + ": " + ex.what());
    }
  }
  if (merged.contains("power_on_threshold_dbm"))
  {
    tag->SetPowerOnThresholdDbm(RequireNumber(merged, "power_on_threshold_dbm", ctx));
  }
  return tag;
}

ns3::Ptr<TagManager>
ConfigLoader::BuildTagManager(const Scenario& scenario)
{
  ns3::Ptr<TagManager> manager = ns3::CreateObject<TagManager>();
  for (const auto& ex : scenario.exciters)
  {
    manager->AddExciter(ex);
  }
  if (!scenario.mainExciter.empty())
  {
    manager->SetMainExciter(scenario.mainExciter);
  }
  manager->AddTags(scenario.tags);
  return manager;
}

void
ConfigLoader::ApplyPhysics(const nlohmann::json& physics, PhysicsEngine& engine, FeedbackLoop& loop)
{
  if (physics.is_null())
  {
    return;
  }
  if (!physics.is_object())
  {
    throw ConfigError("physics: expected an object");
  }
  const std::string ctx = "physics";
  if (physics.contains("power_on_threshold_dbm"))
  {
    engine.SetPowerOnThresholdDbm(RequireNumber(physics, "power_on_threshold_dbm", ctx));
  }
  if (physics.contains("noise_std"))
  {
    const double sigma = RequireNumber(physics, "noise_std", ctx);
    if (sigma < 0.0)
    {
      throw ConfigError("physics.noise_std: must not be negative");
    }
    engine.SetNoiseStd(sigma);
  }
  if (physics.contains("passive_reflection"))
  {
    engine.SetPassiveReflection(RequireNumber(physics, "passive_reflection", ctx));
  }
  if (physics.contains("feedback_model"))
  {
    const nlohmann::json& model = physics.at("feedback_model");
    const std::string m = model.is_string() ? ToLower(model.get<std::string>()) : "";
    if (m == "self_consistent")
    {
      engine.SetSelfConsistent(true);
    }
    else if (m == "single_bounce")
    {
      engine.SetSelfConsistent(false);
    }
    else
    {
      throw ConfigError("physics.feedback_model: expected self_consistent or single_bounce, got " +
                        model.dump());
    }
  }
  if (physics.contains("feedback_interval"))
  {
    const double s = RequireNumber(physics, "feedback_interval", ctx);
    if (s <= 0.0)
    {
      throw ConfigError("physics.feedback_interval: must be positive");
    }
    loop.SetInterval(ns3::Seconds(s));
  }
}

nlohmann::json
ScenarioWriter::ToJson(const TagManager& manager,
                       const StateSerializer& states,
                       const std::vector<ns3::Ptr<Event>>& events,
                       const FeedbackLoop* loop)
{
  nlohmann::json doc = nlohmann::json::object();

  ns3::Ptr<PhysicsEngine> engine = manager.GetPhysicsEngine();
  nlohmann::json physics = {{"power_on_threshold_dbm", engine->GetPowerOnThresholdDbm()},
                            {"noise_std", engine->GetNoiseStd()},
                            {"passive_reflection", engine->GetPassiveReflection()},
                            {"feedback_model",
                             engine->IsSelfConsistent() ? "self_consistent" : "single_bounce"}};
  if (loop)
  {
    physics["feedback_interval"] = loop->GetInterval().GetSeconds();
  }
  doc["physics"] = physics;

  nlohmann::json exciters = nlohmann::json::object();
  for (const auto& kv : manager.GetExciters())
  {
    exciters[kv.first] = kv.second->ToJson();
  }
  doc["exciters"] = exciters;
  if (ns3::Ptr<Exciter> main = manager.GetMainExciter())
  {
    doc["main_exciter"] = main->GetName();
  }

  nlohmann::json tags = nlohmann::json::object();
  for (const auto& tag : manager.GetTags())
  {
    tags[tag->GetName()] = tag->ToJson();
  }
  doc["tags"] = tags;
  doc["states"] = states.ToJson();

  nlohmann::json evs = nlohmann::json::array();
  for (const auto& ev : events)
  {
    evs.push_back(ev->ToJson());
  }
  doc["events"] = evs;
  return doc;
}

void
ScenarioWriter::WriteFile(const std::string& path, const nlohmann::json& doc)
{
  std::filesystem::path p(path);
  if (p.has_parent_path())
  {
    std::filesystem::create_directories(p.parent_path());
  }
  std::ofstream out(path, std::ios::out | std::ios::trunc);
  if (!out.is_open())
  {
    throw std::runtime_error("cannot write scenario to " + path);
  }
  out << doc.dump(2) << "\n";
  NS_LOG_INFO("scenario written to " << path);
}

} // namespace tagsim
