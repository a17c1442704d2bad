#pragma once

#include "tag.h"

#include "ns3/nstime.h"
#include "ns3/ptr.h"
#include "ns3/simple-ref-count.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tagsim {

class TagManager;

// A scheduled change to the scenario. Arguments other than event_type and
// time stay as JSON so they can be written back out unchanged.
class Event : public ns3::SimpleRefCount<Event>
{
public:
  Event(std::string eventType, ns3::Time time, nlohmann::json args);
  virtual ~Event() = default;

  const std::string& GetEventType() const { return m_eventType; }
  ns3::Time GetTime() const { return m_time; }
  const nlohmann::json& GetArgs() const { return m_args; }
  // Hash of the arguments serialized with sorted keys.
  uint64_t GetArgsHash() const { return m_argsHash; }

  // Resolves references against the loaded scenario. Runs before any
  // simulated time passes.
  virtual void Prepare(TagManager& manager) = 0;
  virtual void Run() = 0;

  nlohmann::json ToJson() const;
  std::string ToString() const;

protected:
  const nlohmann::json& GetRequiredArg(const std::string& name) const;
  const nlohmann::json* GetArg(const std::string& name) const;

private:
  std::string m_eventType;
  ns3::Time m_time;
  nlohmann::json m_args;
  uint64_t m_argsHash;
};

class TagEvent : public Event
{
public:
  TagEvent(std::string eventType, ns3::Time time, nlohmann::json args);

  void Prepare(TagManager& manager) override;
  ns3::Ptr<Tag> GetTag() const { return m_tag; }
  const std::string& GetTagName() const { return m_tagName; }

protected:
  ns3::Ptr<Tag> RequireTag() const;
  // Throws ConfigError if the tag cannot take this mode or bit pattern.
  void CheckMode(TagMode mode) const;
  void CheckTransmission(const std::vector<uint8_t>& bits) const;

private:
  std::string m_tagName;
  ns3::Ptr<Tag> m_tag;
};

class TagSetModeEvent : public TagEvent
{
public:
  static constexpr const char* kType = "tag_set_mode";

  TagSetModeEvent(ns3::Time time, nlohmann::json args);
  void Prepare(TagManager& manager) override;
  void Run() override;

  TagMode GetMode() const { return m_mode; }
  const std::optional<std::vector<uint8_t>>& GetTransmission() const { return m_transmission; }

private:
  TagMode m_mode;
  std::optional<std::vector<uint8_t>> m_transmission;
};

class TagSetTransmissionEvent : public TagEvent
{
public:
  static constexpr const char* kType = "tag_set_transmission";

  TagSetTransmissionEvent(ns3::Time time, nlohmann::json args);
  void Prepare(TagManager& manager) override;
  void Run() override;

  const std::vector<uint8_t>& GetTransmission() const { return m_transmission; }

private:
  std::vector<uint8_t> m_transmission;
};

// Only '0' and '1' are accepted.
std::vector<uint8_t> ParseTransmission(const nlohmann::json& value, const std::string& context);

class EventTypes
{
public:
  using Creator = std::function<ns3::Ptr<Event>(ns3::Time, nlohmann::json)>;

  // {"event_type": ..., "time": <s>, ...args}. Type names are matched
  // case-insensitively.
  static ns3::Ptr<Event> CreateEvent(const nlohmann::json& data);
  static bool IsKnown(const std::string& eventType);

private:
  static const std::map<std::string, Creator>& Registry();
};

// Time, then lower-cased type, then argument hash.
bool EventOrderLess(const ns3::Ptr<Event>& a, const ns3::Ptr<Event>& b);
void SortEvents(std::vector<ns3::Ptr<Event>>& events);
std::vector<ns3::Ptr<Event>> LoadEvents(const nlohmann::json& list);

std::string ToLower(std::string s);

} // namespace tagsim
