#include "tag-manager.h"

#include "tagsim-error.h"

#include "ns3/log.h"

#include <stdexcept>

namespace tagsim {

NS_LOG_COMPONENT_DEFINE("TagsimTagManager");
NS_OBJECT_ENSURE_REGISTERED(TagManager);

ns3::TypeId
TagManager::GetTypeId()
{
  static ns3::TypeId tid = ns3::TypeId("tagsim::TagManager")
                             .SetParent<ns3::Object>()
                             .SetGroupName("Tagsim")
                             .AddConstructor<TagManager>();
  return tid;
}

TagManager::TagManager()
{
  NS_LOG_FUNCTION(this);
  m_engine = ns3::CreateObject<PhysicsEngine>();
}

TagManager::~TagManager()
{
  NS_LOG_FUNCTION(this);
}

void
TagManager::DoDispose()
{
  for (auto& kv : m_tags)
  {
    kv.second->SetTagManager(nullptr);
    kv.second->Dispose();
  }
  m_tags.clear();
  m_exciters.clear();
  if (m_engine)
  {
    m_engine->Dispose();
    m_engine = nullptr;
  }
  ns3::Object::DoDispose();
}

void
TagManager::SetPhysicsEngine(ns3::Ptr<PhysicsEngine> engine)
{
  m_engine = engine;
  if (m_engine && !m_main.empty())
  {
    m_engine->SetExciter(m_exciters.at(m_main));
  }
}

void
TagManager::AddExciter(ns3::Ptr<Exciter> exciter)
{
  NS_LOG_FUNCTION(this << exciter->GetName());
  if (!m_exciters.emplace(exciter->GetName(), exciter).second)
  {
    throw ConfigError("duplicate exciter name '" + exciter->GetName() + "'");
  }
  if (m_main.empty())
  {
    SetMainExciter(exciter->GetName());
  }
}

void
TagManager::SetMainExciter(const std::string& name)
{
  auto it = m_exciters.find(name);
  if (it == m_exciters.end())
  {
    throw std::invalid_argument("no exciter named '" + name + "'");
  }
  m_main = name;
  if (m_engine)
  {
    m_engine->SetExciter(it->second);
  }
}

ns3::Ptr<Exciter>
TagManager::GetMainExciter() const
{
  return m_main.empty() ? nullptr : m_exciters.at(m_main);
}

ns3::Ptr<Exciter>
TagManager::GetExciter(const std::string& name) const
{
  auto it = m_exciters.find(name);
  if (it == m_exciters.end())
  {
    throw std::invalid_argument("no exciter named '" + name + "'");
  }
  return it->second;
}

void
TagManager::AddTag(ns3::Ptr<Tag> tag)
{
  NS_LOG_FUNCTION(this << tag->GetName());
  if (!m_tags.emplace(tag->GetName(), tag).second)
  {
    throw ConfigError("duplicate tag name '" + tag->GetName() + "'");
  }
  tag->SetTagManager(this);
}

void
TagManager::AddTags(const std::vector<ns3::Ptr<Tag>>& tags)
{
  for (const auto& t : tags)
  {
    AddTag(t);
  }
}

void
TagManager::RemoveByName(const std::string& name)
{
  auto it = m_tags.find(name);
  if (it == m_tags.end())
  {
    throw std::invalid_argument("no tag named '" + name + "'");
  }
  it->second->SetTagManager(nullptr);
  m_tags.erase(it);
}

ns3::Ptr<Tag>
TagManager::GetByName(const std::string& name) const
{
  auto it = m_tags.find(name);
  if (it == m_tags.end())
  {
    throw std::invalid_argument("no tag named '" + name + "'");
  }
  return it->second;
}

TagList
TagManager::GetTags() const
{
  TagList out;
  out.reserve(m_tags.size());
  for (const auto& kv : m_tags)
  {
    out.push_back(kv.second);
  }
  return out;
}

double
TagManager::GetReceivedVoltage(const Tag& asking)
{
  const double v = m_engine->VoltageAtTag(GetTags(), asking);
  NS_LOG_LOGIC(asking.GetName() << " reads " << v << " V");
  asking.GetTagMachine().GetLogger().Log(
    "read_voltage",
    {{"voltage", v}, {"mode", {{"chip_index", asking.GetMode().GetReflectionIndex()}}}});
  return v;
}

} // namespace tagsim
