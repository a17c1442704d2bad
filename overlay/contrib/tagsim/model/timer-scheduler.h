#pragma once

#include "ns3/event-id.h"
#include "ns3/nstime.h"
#include "ns3/object.h"

#include <cstdint>
#include <memory>
#include <queue>
#include <unordered_map>
#include <vector>

namespace tagsim {

// Anything that can hold a pending timer on the shared scheduler.
class TimerAcceptor
{
public:
  virtual ~TimerAcceptor() = default;
  virtual void OnTimer() = 0;
};

// One pending timer per owner, all serviced by a single wake event on the
// ns-3 simulator. Setting a timer for an owner replaces the one it holds.
// With nothing pending no wake is armed, so the scheduler adds no events
// to an otherwise idle simulation.
class TimerScheduler : public ns3::Object
{
public:
  static ns3::TypeId GetTypeId();

  TimerScheduler();
  ~TimerScheduler() override;

  // Fires owner->OnTimer() at Now() + delay. A zero delay fires at the
  // current instant but never from inside this call.
  void SetTimer(TimerAcceptor* owner, ns3::Time delay);
  void CancelTimer(const TimerAcceptor* owner);

  bool HasPendingTimer(const TimerAcceptor* owner) const;
  ns3::Time GetExpiry(const TimerAcceptor* owner) const;
  uint32_t GetNPending() const { return static_cast<uint32_t>(m_live.size()); }
  uint64_t GetFiredCount() const { return m_fired; }
  // Time::Max() while idle.
  ns3::Time GetNextWake() const;

protected:
  void DoDispose() override;

private:
  struct Timer
  {
    TimerAcceptor* holder{nullptr};
    ns3::Time nextRun;
    uint64_t seq{0};
    bool canceled{false};
  };
  using TimerPtr = std::shared_ptr<Timer>;

  struct Later
  {
    bool operator()(const TimerPtr& a, const TimerPtr& b) const
    {
      if (a->nextRun != b->nextRun)
      {
        return a->nextRun > b->nextRun;
      }
      return a->seq > b->seq;
    }
  };

  void Wake();
  void Rearm();
  void DropCanceledHead();

  std::priority_queue<TimerPtr, std::vector<TimerPtr>, Later> m_heap;
  std::unordered_map<const TimerAcceptor*, TimerPtr> m_live;
  ns3::EventId m_wakeEv;
  ns3::Time m_wakeAt;
  uint64_t m_nextSeq{0};
  uint64_t m_fired{0};
  bool m_draining{false};
};

} // namespace tagsim
