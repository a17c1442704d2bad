#include "feedback-loop.h"

#include "ns3/abort.h"
#include "ns3/log.h"
#include "ns3/nstime.h"
#include "ns3/simulator.h"

#include <algorithm>

namespace tagsim {

NS_LOG_COMPONENT_DEFINE("TagsimFeedbackLoop");
NS_OBJECT_ENSURE_REGISTERED(FeedbackLoop);

ns3::TypeId
FeedbackLoop::GetTypeId()
{
  static ns3::TypeId tid = ns3::TypeId("tagsim::FeedbackLoop")
                             .SetParent<ns3::Object>()
                             .SetGroupName("Tagsim")
                             .AddConstructor<FeedbackLoop>()
                             .AddAttribute("Interval",
                                           "Simulated time between two solves.",
                                           ns3::TimeValue(ns3::MilliSeconds(1)),
                                           ns3::MakeTimeAccessor(&FeedbackLoop::m_interval),
                                           ns3::MakeTimeChecker())
                             .AddAttribute("StartDelay",
                                           "Delay from Start() to the first solve.",
                                           ns3::TimeValue(ns3::Seconds(0)),
                                           ns3::MakeTimeAccessor(&FeedbackLoop::m_startDelay),
                                           ns3::MakeTimeChecker());
  return tid;
}

FeedbackLoop::FeedbackLoop()
  : m_interval(ns3::MilliSeconds(1)),
    m_startDelay(ns3::Seconds(0))
{
  NS_LOG_FUNCTION(this);
}

FeedbackLoop::~FeedbackLoop()
{
  NS_LOG_FUNCTION(this);
}

void
FeedbackLoop::DoDispose()
{
  m_tickEv.Cancel();
  m_manager = nullptr;
  m_sink = nullptr;
  ns3::Object::DoDispose();
}

void
FeedbackLoop::Setup(ns3::Ptr<TagManager> manager, ns3::Ptr<LogSink> sink)
{
  m_manager = manager;
  m_sink = sink;
}

void
FeedbackLoop::Start()
{
  NS_LOG_FUNCTION(this);
  NS_ABORT_MSG_IF(!m_manager, "FeedbackLoop::Start before Setup");
  NS_ABORT_MSG_IF(!m_interval.IsStrictlyPositive(), "FeedbackLoop interval must be positive");
  m_tickEv.Cancel();
  m_tickEv = ns3::Simulator::Schedule(m_startDelay, &FeedbackLoop::Tick, this);
}

void
FeedbackLoop::Stop()
{
  m_tickEv.Cancel();
}

void
FeedbackLoop::Tick()
{
  Step();
  m_tickEv = ns3::Simulator::Schedule(m_interval, &FeedbackLoop::Tick, this);
}

void
FeedbackLoop::Step()
{
  const TagList tags = m_manager->GetTags();
  if (tags.empty())
  {
    return;
  }
  ++m_ticks;

  ns3::Ptr<PhysicsEngine> engine = m_manager->GetPhysicsEngine();
  ns3::Ptr<Exciter> exciter = m_manager->GetMainExciter();
  // Modes are read once, before any tag reacts to this tick's voltages.
  const std::vector<double> volts = engine->VoltagesAtTags(tags);

  for (size_t i = 0; i < tags.size(); ++i)
  {
    const Tag& tag = *tags[i];
    VoltageRange& r = m_ranges[tag.GetName()];
    if (r.samples == 0)
    {
      r.min = r.max = volts[i];
    }
    else
    {
      r.min = std::min(r.min, volts[i]);
      r.max = std::max(r.max, volts[i]);
    }
    ++r.samples;

    if (m_sink)
    {
      m_sink->Log("voltage",
                  {{"tag", tag.GetName()},
                   {"voltage", volts[i]},
                   {"mode", {{"chip_index", tag.GetMode().GetReflectionIndex()}}},
                   {"distance_from_sender", PhysicsEngine::Distance(*exciter, tag)},
                   {"sender_frequency", exciter->GetFrequency()}});
    }
  }

  for (size_t i = 0; i < tags.size(); ++i)
  {
    tags[i]->GetTagMachine().GetProcessingMachine().OnRecvVoltage(volts[i]);
  }
  NS_LOG_LOGIC("tick " << m_ticks << " injected " << tags.size() << " voltages");
}

} // namespace tagsim
