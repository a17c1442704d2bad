#include "instruction.h"
#include "tag-event.h"
#include "tag-manager.h"
#include "tagsim-error.h"
#include "tagsim-simulation.h"
#include "tagsim-test-helpers.h"

#include "ns3/simulator.h"
#include "ns3/test.h"

#include <cstdint>
#include <string>
#include <vector>

using namespace ns3;
using namespace tagsim;
using namespace tagsim::test;

namespace {

bool
ThrowsConfigError(const nlohmann::json& data)
{
  try
  {
    EventTypes::CreateEvent(data);
  }
  catch (const ConfigError&)
  {
    return true;
  }
  return false;
}

std::vector<std::string>
Dump(const std::vector<Ptr<Event>>& events)
{
  std::vector<std::string> out;
  for (const auto& ev : events)
  {
    out.push_back(ev->ToJson().dump());
  }
  return out;
}

Ptr<TagManager>
MakeIdleManager(Ptr<StateSerializer> states, Ptr<TimerScheduler> timers, Ptr<LogSink> sink)
{
  Ptr<TagManager> manager = CreateObject<TagManager>();
  manager->AddExciter(MakeExciter());
  manager->AddTag(MakeTag("TX1", Vector(1.0, 0, 0), states, IdleMachine(), timers, sink));
  manager->AddTag(MakeTag("TX2", Vector(1.2, 0, 0), states, IdleMachine(), timers, sink));
  manager->AddTag(MakeTag("RX1", Vector(1.1, 0.1, 0), states, IdleMachine(), timers, sink));
  return manager;
}

} // namespace

class EventOrderTestCase : public TestCase
{
public:
  EventOrderTestCase()
    : TestCase("Events sort by time, type and arguments regardless of input order")
  {
  }

private:
  void DoRun() override
  {
    const nlohmann::json a = {{"event_type", "tag_set_mode"}, {"time", 0.02}, {"tag", "TX1"}, {"mode", "LISTEN"}};
    const nlohmann::json b = {{"event_type", "TAG_SET_TRANSMISSION"}, {"time", 0.01}, {"tag", "TX1"}, {"transmission", "101"}};
    const nlohmann::json c = {{"event_type", "tag_set_mode"}, {"time", 0.01}, {"tag", "TX1"}, {"mode", "LISTEN"}};
    const nlohmann::json d = {{"event_type", "tag_set_mode"}, {"time", 0.01}, {"tag", "TX2"}, {"mode", "LISTEN"}};

    const std::vector<Ptr<Event>> forward = LoadEvents(nlohmann::json::array({a, b, c, d}));
    const std::vector<Ptr<Event>> backward = LoadEvents(nlohmann::json::array({d, c, b, a}));
    NS_TEST_ASSERT_MSG_EQ((Dump(forward) == Dump(backward)), true, "input order does not matter");

    NS_TEST_ASSERT_MSG_EQ(forward[0]->GetEventType(), "tag_set_mode", "same time: mode before transmission");
    NS_TEST_ASSERT_MSG_EQ(forward[1]->GetEventType(), "tag_set_mode", "same time and type");
    NS_TEST_ASSERT_MSG_EQ(forward[2]->GetEventType(), "tag_set_transmission", "type matched case-insensitively");
    NS_TEST_ASSERT_MSG_EQ(forward[3]->GetTime(), Seconds(0.02), "latest last");
    NS_TEST_ASSERT_MSG_EQ((forward[0]->GetArgsHash() < forward[1]->GetArgsHash()), true, "ties broken by hash");
  }
};

class EventParseTestCase : public TestCase
{
public:
  EventParseTestCase()
    : TestCase("Event fields parse into modes and transmissions")
  {
  }

private:
  void DoRun() override
  {
    Ptr<Event> ev = EventTypes::CreateEvent(
      {{"event_type", "Tag_Set_Mode"}, {"delay", 0.5}, {"tag", "TX1"}, {"mode", "transmit"},
       {"reflection_index", 2}, {"transmission", "0110"}});
    NS_TEST_ASSERT_MSG_EQ(ev->GetTime(), Seconds(0.5), "delay is an alias for time");
    NS_TEST_ASSERT_MSG_EQ(ev->GetEventType(), "tag_set_mode", "canonical type name");

    Ptr<TagSetModeEvent> mode = DynamicCast<TagSetModeEvent>(ev);
    NS_TEST_ASSERT_MSG_EQ(bool(mode), true, "mode event");
    NS_TEST_ASSERT_MSG_EQ(mode->GetMode(), TagMode(2), "reflection index");
    NS_TEST_ASSERT_MSG_EQ(mode->GetTagName(), "TX1", "tag name");
    NS_TEST_ASSERT_MSG_EQ((*mode->GetTransmission() == std::vector<uint8_t>{0, 1, 1, 0}), true, "bits");

    const nlohmann::json j = ev->ToJson();
    NS_TEST_ASSERT_MSG_EQ(j["time"].get<double>(), 0.5, "written as time");
    NS_TEST_ASSERT_MSG_EQ(j.contains("delay"), false, "alias not written back");
    NS_TEST_ASSERT_MSG_EQ(EventTypes::CreateEvent(j)->GetArgsHash(), ev->GetArgsHash(), "same arguments");

    NS_TEST_ASSERT_MSG_EQ(EventTypes::IsKnown("TAG_SET_TRANSMISSION"), true, "known type");
    NS_TEST_ASSERT_MSG_EQ(EventTypes::IsKnown("tag_move"), false, "unknown type");
    NS_TEST_ASSERT_MSG_EQ(LoadEvents(nlohmann::json()).empty(), true, "no events section");
  }
};

class EventErrorTestCase : public TestCase
{
public:
  EventErrorTestCase()
    : TestCase("Malformed events are configuration errors")
  {
  }

private:
  void DoRun() override
  {
    NS_TEST_ASSERT_MSG_EQ(ThrowsConfigError({{"event_type", "tag_set_transmission"}, {"time", 0.0},
                                             {"tag", "TX1"}, {"transmission", "0120"}}),
                          true, "non-binary transmission");
    NS_TEST_ASSERT_MSG_EQ(ThrowsConfigError({{"event_type", "tag_set_transmission"}, {"time", 0.0},
                                             {"tag", "TX1"}}),
                          true, "missing transmission");
    NS_TEST_ASSERT_MSG_EQ(ThrowsConfigError({{"event_type", "tag_set_mode"}, {"time", 0.0}, {"mode", "LISTEN"}}),
                          true, "missing tag");
    NS_TEST_ASSERT_MSG_EQ(ThrowsConfigError({{"event_type", "tag_set_mode"}, {"time", 0.0}, {"tag", "TX1"}}),
                          true, "missing mode");
    NS_TEST_ASSERT_MSG_EQ(ThrowsConfigError({{"event_type", "tag_set_mode"}, {"time", 0.0}, {"tag", "TX1"},
                                             {"mode", "TRANSMIT"}}),
                          true, "TRANSMIT without an index");
    NS_TEST_ASSERT_MSG_EQ(ThrowsConfigError({{"event_type", "tag_set_mode"}, {"time", 0.0}, {"tag", "TX1"},
                                             {"mode", "TRANSMIT"}, {"reflection_index", 0}}),
                          true, "TRANSMIT on the listening index");
    NS_TEST_ASSERT_MSG_EQ(ThrowsConfigError({{"event_type", "tag_set_mode"}, {"time", 0.0}, {"tag", "TX1"},
                                             {"mode", "SLEEP"}}),
                          true, "unknown mode");
    NS_TEST_ASSERT_MSG_EQ(ThrowsConfigError({{"event_type", "tag_set_mode"}, {"time", -1.0}, {"tag", "TX1"},
                                             {"mode", "LISTEN"}}),
                          true, "negative time");
    NS_TEST_ASSERT_MSG_EQ(ThrowsConfigError({{"event_type", "tag_set_mode"}, {"tag", "TX1"}, {"mode", "LISTEN"}}),
                          true, "missing time");
    NS_TEST_ASSERT_MSG_EQ(ThrowsConfigError({{"event_type", "tag_move"}, {"time", 0.0}, {"tag", "TX1"}}),
                          true, "unknown type");

    Ptr<StateSerializer> states = StatesFromJson(IdleStatesJson());
    Ptr<TimerScheduler> timers = CreateObject<TimerScheduler>();
    Ptr<TagManager> manager = MakeIdleManager(states, timers, Create<NullLogSink>());
    Ptr<Event> ev = EventTypes::CreateEvent(
      {{"event_type", "tag_set_mode"}, {"time", 0.0}, {"tag", "NOPE"}, {"mode", "LISTEN"}});
    bool threw = false;
    try
    {
      ev->Prepare(*manager);
    }
    catch (const ConfigError&)
    {
      threw = true;
    }
    NS_TEST_ASSERT_MSG_EQ(threw, true, "unknown tag found at prepare");

    NS_TEST_ASSERT_MSG_EQ(ThrowsConfigError({{"event_type", "tag_set_mode"}, {"time", 0.0}, {"tag", "TX1"},
                                             {"mode", "TRANSMIT"}, {"reflection_index", int64_t{4294967297}}}),
                          true, "reflection_index beyond 32 bits");

    // Three chip impedances give modes 0..3.
    ev = EventTypes::CreateEvent(
      {{"event_type", "tag_set_mode"}, {"time", 0.0}, {"tag", "TX2"}, {"mode", "TRANSMIT"}, {"reflection_index", 5}});
    threw = false;
    try
    {
      ev->Prepare(*manager);
    }
    catch (const ConfigError&)
    {
      threw = true;
    }
    NS_TEST_ASSERT_MSG_EQ(threw, true, "reflection_index outside the chip table found at prepare");

    ev = EventTypes::CreateEvent(
      {{"event_type", "tag_set_mode"}, {"time", 0.0}, {"tag", "TX2"}, {"mode", "TRANSMIT"}, {"reflection_index", 3}});
    ev->Prepare(*manager);

    const std::string tooLong(kMemorySize + 1, '1');
    ev = EventTypes::CreateEvent(
      {{"event_type", "tag_set_transmission"}, {"time", 0.0}, {"tag", "TX1"}, {"transmission", tooLong}});
    threw = false;
    try
    {
      ev->Prepare(*manager);
    }
    catch (const ConfigError&)
    {
      threw = true;
    }
    NS_TEST_ASSERT_MSG_EQ(threw, true, "transmission longer than processing memory found at prepare");

    ev = EventTypes::CreateEvent({{"event_type", "tag_set_mode"}, {"time", 0.0}, {"tag", "TX1"}, {"mode", "LISTEN"},
                                  {"transmission", tooLong}});
    threw = false;
    try
    {
      ev->Prepare(*manager);
    }
    catch (const ConfigError&)
    {
      threw = true;
    }
    NS_TEST_ASSERT_MSG_EQ(threw, true, "mode event transmission checked too");

    ev = EventTypes::CreateEvent({{"event_type", "tag_set_transmission"}, {"time", 0.0}, {"tag", "TX1"},
                                  {"transmission", std::string(kMemorySize, '0')}});
    ev->Prepare(*manager);
    Simulator::Destroy();
  }
};

class EventRunLoopTestCase : public TestCase
{
public:
  EventRunLoopTestCase()
    : TestCase("The run loop applies events at their times")
  {
  }

private:
  void DoRun() override
  {
    Ptr<StateSerializer> states = StatesFromJson(R"({
      "idle": {},
      "rx":   {"transitions": {"on_transmission": [["mov", 0, 7], "rx"]}}
    })");
    Ptr<TimerScheduler> timers = CreateObject<TimerScheduler>();
    Ptr<RecordingLogSink> sink = Create<RecordingLogSink>();
    Ptr<TagManager> manager = MakeIdleManager(states, timers, sink);
    manager->AddTag(MakeTag("TX3", Vector(0.8, 0, 0), states, {"idle", "rx", "idle"}, timers, sink));

    Ptr<Simulation> sim = CreateObject<Simulation>();
    sim->Setup(manager, timers, sink);
    sim->EnableFeedbackLoop(false);
    sim->SetEvents(LoadEvents(nlohmann::json::parse(R"([
      {"event_type": "tag_set_mode", "time": 0.02, "tag": "TX2", "mode": "LISTEN"},
      {"event_type": "tag_set_mode", "time": 0.01, "tag": "TX2", "mode": "TRANSMIT", "reflection_index": 3},
      {"event_type": "tag_set_transmission", "time": 0.0, "tag": "TX3", "transmission": "10110"}
    ])")));

    Ptr<Tag> tx2 = manager->GetByName("TX2");
    uint32_t atStart = 99;
    uint32_t between = 99;
    uint32_t after = 99;
    Simulator::Schedule(MilliSeconds(5), [&]() { atStart = tx2->GetMode().GetReflectionIndex(); });
    Simulator::Schedule(MilliSeconds(15), [&]() { between = tx2->GetMode().GetReflectionIndex(); });
    Simulator::Schedule(MilliSeconds(25), [&]() { after = tx2->GetMode().GetReflectionIndex(); });

    sim->Run(MilliSeconds(30));

    NS_TEST_ASSERT_MSG_EQ(atStart, 0, "listening before the first event");
    NS_TEST_ASSERT_MSG_EQ(between, 3, "transmitting on chip 3");
    NS_TEST_ASSERT_MSG_EQ(after, 0, "listening again");
    NS_TEST_ASSERT_MSG_EQ(sim->GetEventRunner()->GetNDispatched(), 3, "all events ran");
    NS_TEST_ASSERT_MSG_EQ(sink->Find("event_dispatched: tag_set_mode").size(), 2, "mode events logged");
    NS_TEST_ASSERT_MSG_EQ(sink->Find("mode_change").size(), 2, "two mode changes");

    Ptr<Tag> tx3 = manager->GetByName("TX3");
    NS_TEST_ASSERT_MSG_EQ(tx3->GetTagMachine().GetProcessingMachine().GetRegister(0), 5.0,
                          "transmission delivered after the machines started");
    NS_TEST_ASSERT_MSG_EQ(tx3->GetTagMachine().GetProcessingMachine().GetMemory(3), 1.0, "bit 3");
    NS_TEST_ASSERT_MSG_EQ(sim->GetFeedbackLoop()->GetTickCount(), 0, "feedback disabled");

    sim->Dispose();
    Simulator::Destroy();
  }
};

class EventTestSuite : public TestSuite
{
public:
  EventTestSuite()
    : TestSuite("tagsim-event", Type::UNIT)
  {
    AddTestCase(new EventOrderTestCase, TestCase::Duration::QUICK);
    AddTestCase(new EventParseTestCase, TestCase::Duration::QUICK);
    AddTestCase(new EventErrorTestCase, TestCase::Duration::QUICK);
    AddTestCase(new EventRunLoopTestCase, TestCase::Duration::QUICK);
  }
};

static EventTestSuite g_eventTestSuite;
