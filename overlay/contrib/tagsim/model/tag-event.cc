#include "tag-event.h"

#include "tag-manager.h"
#include "tagsim-error.h"

#include "ns3/log.h"
#include "ns3/simulator.h"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace tagsim {

NS_LOG_COMPONENT_DEFINE("TagsimEvent");

namespace {

uint64_t
HashString(const std::string& s)
{
  uint64_t h = 1469598103934665603ULL;
  for (unsigned char c : s)
  {
    h ^= c;
    h *= 1099511628211ULL;
  }
  return h;
}

std::optional<int64_t>
OptionalIndex(const nlohmann::json* v, const std::string& context)
{
  if (!v || v->is_null())
  {
    return std::nullopt;
  }
  if (!v->is_number_integer())
  {
    throw ConfigError(context + ": reflection_index must be an integer, got " + v->dump());
  }
  return v->get<int64_t>();
}

} // namespace

std::string
ToLower(std::string s)
{
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

Event::Event(std::string eventType, ns3::Time time, nlohmann::json args)
  : m_eventType(std::move(eventType)),
    m_time(time),
    m_args(std::move(args)),
    m_argsHash(HashString(m_args.dump()))
{
  if (m_time.IsStrictlyNegative())
  {
    throw ConfigError(ToString() + ": time must not be negative");
  }
}

nlohmann::json
Event::ToJson() const
{
  nlohmann::json j = m_args;
  j["event_type"] = m_eventType;
  j["time"] = m_time.GetSeconds();
  return j;
}

std::string
Event::ToString() const
{
  std::ostringstream oss;
  oss << m_eventType << " at " << m_time.GetSeconds() << "s " << m_args.dump();
  return oss.str();
}

const nlohmann::json*
Event::GetArg(const std::string& name) const
{
  auto it = m_args.find(name);
  if (it == m_args.end() || it->is_null())
  {
    return nullptr;
  }
  return &*it;
}

const nlohmann::json&
Event::GetRequiredArg(const std::string& name) const
{
  const nlohmann::json* v = GetArg(name);
  if (!v)
  {
    throw ConfigError(ToString() + ": field '" + name + "' is required, but no value was found");
  }
  return *v;
}

TagEvent::TagEvent(std::string eventType, ns3::Time time, nlohmann::json args)
  : Event(std::move(eventType), time, std::move(args))
{
  const nlohmann::json& tag = GetRequiredArg("tag");
  if (!tag.is_string())
  {
    throw ConfigError(ToString() + ": 'tag' must be a tag name, got " + tag.dump());
  }
  m_tagName = tag.get<std::string>();
}

void
TagEvent::Prepare(TagManager& manager)
{
  try
  {
    m_tag = manager.GetByName(m_tagName);
  }
  catch (const std::invalid_argument&)
  {
    throw ConfigError(ToString() + ": references unknown tag '" + m_tagName + "'");
  }
}

ns3::Ptr<Tag>
TagEvent::RequireTag() const
{
  if (!m_tag)
  {
    throw std::logic_error(ToString() + ": run before prepare");
  }
  return m_tag;
}

void
TagEvent::CheckMode(TagMode mode) const
{
  const uint32_t nModes = RequireTag()->GetNModes();
  if (mode.GetReflectionIndex() >= nModes)
  {
    throw ConfigError(ToString() + ": reflection_index " + std::to_string(mode.GetReflectionIndex()) +
                      " outside the chip table of tag '" + m_tagName + "' (" +
                      std::to_string(nModes - 1) + " chip impedances)");
  }
}

void
TagEvent::CheckTransmission(const std::vector<uint8_t>& bits) const
{
  if (bits.size() > kMemorySize)
  {
    throw ConfigError(ToString() + ": transmission of " + std::to_string(bits.size()) +
                      " bits exceeds the " + std::to_string(kMemorySize) +
                      "-word processing memory of tag '" + m_tagName + "'");
  }
}

std::vector<uint8_t>
ParseTransmission(const nlohmann::json& value, const std::string& context)
{
  if (!value.is_string())
  {
    throw ConfigError(context + ": transmission must be a string of 0 and 1, got " + value.dump());
  }
  const std::string s = value.get<std::string>();
  std::vector<uint8_t> bits;
  bits.reserve(s.size());
  for (char c : s)
  {
    if (c == '0')
    {
      bits.push_back(0);
    }
    else if (c == '1')
    {
      bits.push_back(1);
    }
    else
    {
      throw ConfigError(context + ": transmission contains characters that are not 0 or 1. Found " + s);
    }
  }
  return bits;
}

TagSetModeEvent::TagSetModeEvent(ns3::Time time, nlohmann::json args)
  : TagEvent(kType, time, std::move(args))
{
  const nlohmann::json& mode = GetRequiredArg("mode");
  if (!mode.is_string())
  {
    throw ConfigError(ToString() + ": mode must be a string, got " + mode.dump());
  }
  m_mode = TagMode::FromString(mode.get<std::string>(), OptionalIndex(GetArg("reflection_index"), ToString()));
  if (const nlohmann::json* tx = GetArg("transmission"))
  {
    m_transmission = ParseTransmission(*tx, ToString());
  }
}

void
TagSetModeEvent::Prepare(TagManager& manager)
{
  TagEvent::Prepare(manager);
  CheckMode(m_mode);
  if (m_transmission)
  {
    CheckTransmission(*m_transmission);
  }
}

void
TagSetModeEvent::Run()
{
  ns3::Ptr<Tag> tag = RequireTag();
  NS_LOG_INFO("applying " << ToString() << " to " << tag->GetName());
  tag->SetMode(m_mode);
  if (m_transmission)
  {
    tag->SetTransmission(*m_transmission);
  }
}

TagSetTransmissionEvent::TagSetTransmissionEvent(ns3::Time time, nlohmann::json args)
  : TagEvent(kType, time, std::move(args))
{
  m_transmission = ParseTransmission(GetRequiredArg("transmission"), ToString());
}

void
TagSetTransmissionEvent::Prepare(TagManager& manager)
{
  TagEvent::Prepare(manager);
  CheckTransmission(m_transmission);
}

void
TagSetTransmissionEvent::Run()
{
  ns3::Ptr<Tag> tag = RequireTag();
  NS_LOG_INFO("applying " << ToString() << " to " << tag->GetName());
  tag->SetTransmission(m_transmission);
}

const std::map<std::string, EventTypes::Creator>&
EventTypes::Registry()
{
  static const std::map<std::string, Creator> registry = {
    {TagSetModeEvent::kType,
     [](ns3::Time t, nlohmann::json a) -> ns3::Ptr<Event> {
       return ns3::Create<TagSetModeEvent>(t, std::move(a));
     }},
    {TagSetTransmissionEvent::kType,
     [](ns3::Time t, nlohmann::json a) -> ns3::Ptr<Event> {
       return ns3::Create<TagSetTransmissionEvent>(t, std::move(a));
     }},
  };
  return registry;
}

bool
EventTypes::IsKnown(const std::string& eventType)
{
  return Registry().count(ToLower(eventType)) != 0;
}

ns3::Ptr<Event>
EventTypes::CreateEvent(const nlohmann::json& data)
{
  if (!data.is_object())
  {
    throw ConfigError("event must be an object, got " + data.dump());
  }
  if (!data.contains("event_type") || !data.at("event_type").is_string())
  {
    throw ConfigError("event " + data.dump() + ": field 'event_type' is required");
  }
  const char* timeKey = data.contains("time") ? "time" : "delay";
  if (!data.contains(timeKey) || !data.at(timeKey).is_number())
  {
    throw ConfigError("event " + data.dump() + ": field 'time' is required and must be a number");
  }

  const std::string type = ToLower(data.at("event_type").get<std::string>());
  auto it = Registry().find(type);
  if (it == Registry().end())
  {
    throw ConfigError("unknown event_type '" + data.at("event_type").get<std::string>() + "'");
  }

  nlohmann::json args = data;
  args.erase("event_type");
  args.erase(timeKey);
  return it->second(ns3::Seconds(data.at(timeKey).get<double>()), std::move(args));
}

bool
EventOrderLess(const ns3::Ptr<Event>& a, const ns3::Ptr<Event>& b)
{
  if (a->GetTime() != b->GetTime())
  {
    return a->GetTime() < b->GetTime();
  }
  const std::string ta = ToLower(a->GetEventType());
  const std::string tb = ToLower(b->GetEventType());
  if (ta != tb)
  {
    return ta < tb;
  }
  return a->GetArgsHash() < b->GetArgsHash();
}

void
SortEvents(std::vector<ns3::Ptr<Event>>& events)
{
  std::stable_sort(events.begin(), events.end(), EventOrderLess);
}

std::vector<ns3::Ptr<Event>>
LoadEvents(const nlohmann::json& list)
{
  std::vector<ns3::Ptr<Event>> events;
  if (list.is_null())
  {
    return events;
  }
  if (!list.is_array())
  {
    throw ConfigError("events: expected an array");
  }
  for (const auto& data : list)
  {
    events.push_back(EventTypes::CreateEvent(data));
  }
  SortEvents(events);
  return events;
}

} // namespace tagsim
