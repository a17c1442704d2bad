#pragma once

#include "physics-engine.h"
#include "tag.h"

#include "ns3/object.h"
#include "ns3/ptr.h"

#include <map>
#include <string>
#include <vector>

namespace tagsim {

// Registry of the tags and exciters of one simulation. Tags are kept
// ordered by name; that order is the channel order of every solve.
class TagManager : public ns3::Object
{
public:
  static ns3::TypeId GetTypeId();

  TagManager();
  ~TagManager() override;

  void SetPhysicsEngine(ns3::Ptr<PhysicsEngine> engine);
  ns3::Ptr<PhysicsEngine> GetPhysicsEngine() const { return m_engine; }

  // The first exciter added becomes the main one.
  void AddExciter(ns3::Ptr<Exciter> exciter);
  void SetMainExciter(const std::string& name);
  ns3::Ptr<Exciter> GetMainExciter() const;
  ns3::Ptr<Exciter> GetExciter(const std::string& name) const;
  const std::map<std::string, ns3::Ptr<Exciter>>& GetExciters() const { return m_exciters; }

  void AddTag(ns3::Ptr<Tag> tag);
  void AddTags(const std::vector<ns3::Ptr<Tag>>& tags);
  // Setup-time only.
  void RemoveByName(const std::string& name);
  // Throws std::invalid_argument if no tag has this name.
  ns3::Ptr<Tag> GetByName(const std::string& name) const;
  bool HasTag(const std::string& name) const { return m_tags.count(name) != 0; }
  TagList GetTags() const;
  uint32_t GetNTags() const { return static_cast<uint32_t>(m_tags.size()); }

  // Voltage seen by a tag that samples its envelope detector itself.
  double GetReceivedVoltage(const Tag& asking);

protected:
  void DoDispose() override;

private:
  std::map<std::string, ns3::Ptr<Tag>> m_tags;
  std::map<std::string, ns3::Ptr<Exciter>> m_exciters;
  std::string m_main;
  ns3::Ptr<PhysicsEngine> m_engine;
};

} // namespace tagsim
