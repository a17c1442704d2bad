#pragma once

#include "log-sink.h"
#include "tag-manager.h"

#include "ns3/event-id.h"
#include "ns3/nstime.h"
#include "ns3/object.h"

#include <cstdint>
#include <map>
#include <string>

namespace tagsim {

// Periodically solves the channel for every tag and hands each tag's
// processing machine the voltage at its envelope detector.
class FeedbackLoop : public ns3::Object
{
public:
  static ns3::TypeId GetTypeId();

  FeedbackLoop();
  ~FeedbackLoop() override;

  void Setup(ns3::Ptr<TagManager> manager, ns3::Ptr<LogSink> sink);
  void SetInterval(ns3::Time interval) { m_interval = interval; }
  ns3::Time GetInterval() const { return m_interval; }
  void SetStartDelay(ns3::Time delay) { m_startDelay = delay; }

  void Start();
  void Stop();
  bool IsRunning() const { return m_tickEv.IsPending(); }

  // One solve-and-inject pass at the current time.
  void Step();
  uint64_t GetTickCount() const { return m_ticks; }

  struct VoltageRange
  {
    double min{0.0};
    double max{0.0};
    uint64_t samples{0};
  };
  const std::map<std::string, VoltageRange>& GetVoltageRanges() const { return m_ranges; }

protected:
  void DoDispose() override;

private:
  void Tick();

  ns3::Ptr<TagManager> m_manager;
  ns3::Ptr<LogSink> m_sink;
  ns3::Time m_interval;
  ns3::Time m_startDelay;
  ns3::EventId m_tickEv;
  uint64_t m_ticks{0};
  std::map<std::string, VoltageRange> m_ranges;
};

} // namespace tagsim
