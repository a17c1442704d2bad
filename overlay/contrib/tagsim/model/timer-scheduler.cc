#include "timer-scheduler.h"

#include "ns3/abort.h"
#include "ns3/log.h"
#include "ns3/simulator.h"

namespace tagsim {

NS_LOG_COMPONENT_DEFINE("TagsimTimerScheduler");
NS_OBJECT_ENSURE_REGISTERED(TimerScheduler);

ns3::TypeId
TimerScheduler::GetTypeId()
{
  static ns3::TypeId tid = ns3::TypeId("tagsim::TimerScheduler")
                             .SetParent<ns3::Object>()
                             .SetGroupName("Tagsim")
                             .AddConstructor<TimerScheduler>();
  return tid;
}

TimerScheduler::TimerScheduler()
  : m_wakeAt(ns3::Time::Max())
{
  NS_LOG_FUNCTION(this);
}

TimerScheduler::~TimerScheduler()
{
  NS_LOG_FUNCTION(this);
}

void
TimerScheduler::DoDispose()
{
  m_wakeEv.Cancel();
  m_live.clear();
  m_heap = decltype(m_heap)();
  m_wakeAt = ns3::Time::Max();
  ns3::Object::DoDispose();
}

void
TimerScheduler::SetTimer(TimerAcceptor* owner, ns3::Time delay)
{
  NS_LOG_FUNCTION(this << owner << delay);
  NS_ABORT_MSG_IF(owner == nullptr, "TimerScheduler::SetTimer: null owner");
  NS_ABORT_MSG_IF(delay.IsStrictlyNegative(), "TimerScheduler::SetTimer: negative delay " << delay);

  auto it = m_live.find(owner);
  if (it != m_live.end())
  {
    it->second->canceled = true;
  }

  auto t = std::make_shared<Timer>();
  t->holder = owner;
  t->nextRun = ns3::Simulator::Now() + delay;
  t->seq = m_nextSeq++;
  m_live[owner] = t;
  m_heap.push(t);

  // Wake() re-arms once it has drained everything due.
  if (!m_draining)
  {
    Rearm();
  }
}

void
TimerScheduler::CancelTimer(const TimerAcceptor* owner)
{
  NS_LOG_FUNCTION(this << owner);
  auto it = m_live.find(owner);
  if (it == m_live.end())
  {
    return;
  }
  it->second->canceled = true;
  m_live.erase(it);
  if (!m_draining)
  {
    Rearm();
  }
}

bool
TimerScheduler::HasPendingTimer(const TimerAcceptor* owner) const
{
  return m_live.find(owner) != m_live.end();
}

ns3::Time
TimerScheduler::GetExpiry(const TimerAcceptor* owner) const
{
  auto it = m_live.find(owner);
  return it == m_live.end() ? ns3::Time::Max() : it->second->nextRun;
}

ns3::Time
TimerScheduler::GetNextWake() const
{
  return m_wakeEv.IsPending() ? m_wakeAt : ns3::Time::Max();
}

void
TimerScheduler::DropCanceledHead()
{
  while (!m_heap.empty() && m_heap.top()->canceled)
  {
    m_heap.pop();
  }
}

void
TimerScheduler::Rearm()
{
  DropCanceledHead();
  if (m_heap.empty())
  {
    m_wakeEv.Cancel();
    m_wakeAt = ns3::Time::Max();
    NS_LOG_LOGIC("idle, no wake armed");
    return;
  }

  const ns3::Time next = m_heap.top()->nextRun;
  if (m_wakeEv.IsPending() && m_wakeAt == next)
  {
    return;
  }
  m_wakeEv.Cancel();
  m_wakeAt = next;
  m_wakeEv = ns3::Simulator::Schedule(next - ns3::Simulator::Now(), &TimerScheduler::Wake, this);
  NS_LOG_LOGIC("wake armed for " << next.As(ns3::Time::S));
}

void
TimerScheduler::Wake()
{
  NS_LOG_FUNCTION(this);
  const ns3::Time now = ns3::Simulator::Now();
  m_wakeAt = ns3::Time::Max();
  m_draining = true;
  try
  {
    while (!m_heap.empty() && m_heap.top()->nextRun <= now)
    {
      TimerPtr t = m_heap.top();
      m_heap.pop();
      if (t->canceled)
      {
        continue;
      }
      m_live.erase(t->holder);
      ++m_fired;
      t->holder->OnTimer();
    }
  }
  catch (...)
  {
    m_draining = false;
    throw;
  }
  m_draining = false;
  Rearm();
}

} // namespace tagsim
