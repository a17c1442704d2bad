#pragma once

#include "feedback-loop.h"
#include "log-sink.h"
#include "tag-event.h"
#include "tag-manager.h"
#include "timer-scheduler.h"

#include "ns3/event-id.h"
#include "ns3/nstime.h"
#include "ns3/object.h"

#include <cstdint>
#include <vector>

namespace tagsim {

// Dispatches scenario events in order, one ns-3 event per distinct time.
class EventRunner : public ns3::Object
{
public:
  static ns3::TypeId GetTypeId();

  EventRunner();
  ~EventRunner() override;

  void SetLogSink(ns3::Ptr<LogSink> sink) { m_sink = sink; }
  // Sorted on entry.
  void SetEvents(std::vector<ns3::Ptr<Event>> events);
  const std::vector<ns3::Ptr<Event>>& GetEvents() const { return m_events; }

  // Prepares every event against the manager. Throws ConfigError.
  void Prepare(TagManager& manager);
  void Start();
  uint32_t GetNDispatched() const { return static_cast<uint32_t>(m_next); }

protected:
  void DoDispose() override;

private:
  void ScheduleNext();
  void DispatchDue();

  std::vector<ns3::Ptr<Event>> m_events;
  size_t m_next{0};
  ns3::EventId m_ev;
  ns3::Ptr<LogSink> m_sink;
};

// Owns one scenario's live objects and runs it on the ns-3 simulator.
class Simulation : public ns3::Object
{
public:
  static ns3::TypeId GetTypeId();

  Simulation();
  ~Simulation() override;

  void Setup(ns3::Ptr<TagManager> manager, ns3::Ptr<TimerScheduler> timers, ns3::Ptr<LogSink> sink);
  void SetEvents(std::vector<ns3::Ptr<Event>> events);
  void EnableFeedbackLoop(bool on) { m_feedbackEnabled = on; }

  ns3::Ptr<TagManager> GetTagManager() const { return m_manager; }
  ns3::Ptr<TimerScheduler> GetTimerScheduler() const { return m_timers; }
  ns3::Ptr<FeedbackLoop> GetFeedbackLoop() const { return m_feedback; }
  ns3::Ptr<EventRunner> GetEventRunner() const { return m_runner; }

  // Prepares events, then starts the tag machines, the event chain and
  // the feedback loop at the current simulated time.
  void Start();
  // Start() followed by Simulator::Run() until the given absolute time.
  void Run(ns3::Time until);

protected:
  void DoDispose() override;

private:
  ns3::Ptr<TagManager> m_manager;
  ns3::Ptr<TimerScheduler> m_timers;
  ns3::Ptr<LogSink> m_sink;
  ns3::Ptr<FeedbackLoop> m_feedback;
  ns3::Ptr<EventRunner> m_runner;
  bool m_feedbackEnabled{true};
  bool m_started{false};
};

} // namespace tagsim
