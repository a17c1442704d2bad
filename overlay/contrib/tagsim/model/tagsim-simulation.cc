#include "tagsim-simulation.h"

#include "ns3/abort.h"
#include "ns3/log.h"
#include "ns3/simulator.h"

namespace tagsim {

NS_LOG_COMPONENT_DEFINE("TagsimSimulation");
NS_OBJECT_ENSURE_REGISTERED(EventRunner);
NS_OBJECT_ENSURE_REGISTERED(Simulation);

ns3::TypeId
EventRunner::GetTypeId()
{
  static ns3::TypeId tid = ns3::TypeId("tagsim::EventRunner")
                             .SetParent<ns3::Object>()
                             .SetGroupName("Tagsim")
                             .AddConstructor<EventRunner>();
  return tid;
}

EventRunner::EventRunner()
{
  NS_LOG_FUNCTION(this);
}

EventRunner::~EventRunner()
{
  NS_LOG_FUNCTION(this);
}

void
EventRunner::DoDispose()
{
  m_ev.Cancel();
  m_events.clear();
  m_sink = nullptr;
  ns3::Object::DoDispose();
}

void
EventRunner::SetEvents(std::vector<ns3::Ptr<Event>> events)
{
  m_events = std::move(events);
  SortEvents(m_events);
  m_next = 0;
}

void
EventRunner::Prepare(TagManager& manager)
{
  for (const auto& ev : m_events)
  {
    ev->Prepare(manager);
  }
}

void
EventRunner::Start()
{
  NS_LOG_FUNCTION(this << m_events.size());
  ScheduleNext();
}

void
EventRunner::ScheduleNext()
{
  if (m_next >= m_events.size())
  {
    return;
  }
  const ns3::Time now = ns3::Simulator::Now();
  const ns3::Time at = m_events[m_next]->GetTime();
  // Events already in the past run now, in order.
  const ns3::Time delay = at > now ? at - now : ns3::Time(0);
  m_ev = ns3::Simulator::Schedule(delay, &EventRunner::DispatchDue, this);
}

void
EventRunner::DispatchDue()
{
  const ns3::Time now = ns3::Simulator::Now();
  while (m_next < m_events.size() && m_events[m_next]->GetTime() <= now)
  {
    ns3::Ptr<Event> ev = m_events[m_next++];
    NS_LOG_INFO("event dispatched: " << ev->ToString());
    if (m_sink)
    {
      m_sink->Log("event_dispatched: " + ev->GetEventType(), ev->ToJson());
    }
    ev->Run();
  }
  ScheduleNext();
}

ns3::TypeId
Simulation::GetTypeId()
{
  static ns3::TypeId tid = ns3::TypeId("tagsim::Simulation")
                             .SetParent<ns3::Object>()
                             .SetGroupName("Tagsim")
                             .AddConstructor<Simulation>();
  return tid;
}

Simulation::Simulation()
{
  NS_LOG_FUNCTION(this);
  m_feedback = ns3::CreateObject<FeedbackLoop>();
  m_runner = ns3::CreateObject<EventRunner>();
}

Simulation::~Simulation()
{
  NS_LOG_FUNCTION(this);
}

void
Simulation::DoDispose()
{
  if (m_feedback)
  {
    m_feedback->Dispose();
  }
  if (m_runner)
  {
    m_runner->Dispose();
  }
  if (m_manager)
  {
    m_manager->Dispose();
  }
  if (m_timers)
  {
    m_timers->Dispose();
  }
  m_feedback = nullptr;
  m_runner = nullptr;
  m_manager = nullptr;
  m_timers = nullptr;
  m_sink = nullptr;
  ns3::Object::DoDispose();
}

void
Simulation::Setup(ns3::Ptr<TagManager> manager, ns3::Ptr<TimerScheduler> timers, ns3::Ptr<LogSink> sink)
{
  m_manager = manager;
  m_timers = timers;
  m_sink = sink;
  m_feedback->Setup(manager, sink);
  m_runner->SetLogSink(sink);
}

void
Simulation::SetEvents(std::vector<ns3::Ptr<Event>> events)
{
  m_runner->SetEvents(std::move(events));
}

void
Simulation::Start()
{
  NS_LOG_FUNCTION(this);
  NS_ABORT_MSG_IF(!m_manager, "Simulation::Start before Setup");
  NS_ABORT_MSG_IF(m_started, "Simulation already started");
  m_started = true;

  m_runner->Prepare(*m_manager);

  for (const auto& tag : m_manager->GetTags())
  {
    tag->Run();
  }
  m_runner->Start();
  if (m_feedbackEnabled)
  {
    m_feedback->Start();
  }
  NS_LOG_INFO("started " << m_manager->GetNTags() << " tags, " << m_runner->GetEvents().size()
                         << " events");
}

void
Simulation::Run(ns3::Time until)
{
  Start();
  ns3::Simulator::Stop(until - ns3::Simulator::Now());
  ns3::Simulator::Run();
}

} // namespace tagsim
