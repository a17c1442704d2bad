#include "tag-machine.h"
#include "tag-manager.h"
#include "tagsim-error.h"
#include "tagsim-test-helpers.h"

#include "ns3/simulator.h"
#include "ns3/test.h"

#include <stdexcept>

using namespace ns3;
using namespace tagsim;
using namespace tagsim::test;

class PrepareOrderTestCase : public TestCase
{
public:
  PrepareOrderTestCase()
    : TestCase("Prepare initializes output, then processing, then input")
  {
  }

private:
  void DoRun() override
  {
    Ptr<StateSerializer> states = StatesFromJson(R"({
      "in":   {"transitions": {"init": [["load_imm", 0, 1], "in"]}},
      "proc": {"transitions": {"init": [["load_imm", 0, 2], "proc"]}},
      "out":  {"transitions": {"init": [["load_imm", 0, 3], "out"]}}
    })");
    Ptr<RecordingLogSink> sink = Create<RecordingLogSink>();
    Ptr<TimerScheduler> timers = CreateObject<TimerScheduler>();
    Ptr<Tag> tag = MakeTag("T1", Vector(1, 0, 0), states, {"in", "proc", "out"}, timers, sink);

    tag->Run();
    auto traces = sink->Find("dispatch");
    NS_TEST_ASSERT_MSG_EQ(traces.size(), 3, "one dispatch per machine");
    NS_TEST_ASSERT_MSG_EQ(traces[0].fields["machine"].get<std::string>(), "output", "output first");
    NS_TEST_ASSERT_MSG_EQ(traces[1].fields["machine"].get<std::string>(), "processing", "processing second");
    NS_TEST_ASSERT_MSG_EQ(traces[2].fields["machine"].get<std::string>(), "input", "input last");
    NS_TEST_ASSERT_MSG_EQ(traces[0].fields["tag"].get<std::string>(), "T1", "records carry the tag");
    Simulator::Destroy();
  }
};

class CrossMachinePipelineTestCase : public TestCase
{
public:
  CrossMachinePipelineTestCase()
    : TestCase("Input timer, processing arithmetic and output antenna form a pipeline")
  {
  }

private:
  void DoRun() override
  {
    Ptr<StateSerializer> states = StatesFromJson(R"({
      "in":      {"transitions": {"init": [["sequence", ["load_imm", 1, 0.001], ["set_timer", 1]], "in_wait"]}},
      "in_wait": {"transitions": {"on_timer": [["sequence", ["load_imm", 0, 2], ["send_bit", 0]], "in_done"]}},
      "in_done": {},
      "proc":    {"transitions": {"on_recv_bit": [["sequence", ["mov", 1, 7], ["load_imm", 2, 1],
                                                  ["add", 3, 1, 2], ["send_int_out", 3]], "proc"]}},
      "out":     {"transitions": {"init": [["set_listen"], "out"],
                                  "on_recv_int": [["set_antenna", 7], "out"]}}
    })");
    Ptr<RecordingLogSink> sink = Create<RecordingLogSink>();
    Ptr<TimerScheduler> timers = CreateObject<TimerScheduler>();
    Ptr<Tag> tag = MakeTag("T1", Vector(1, 0, 0), states, {"in", "proc", "out"}, timers, sink);

    tag->Run();
    NS_TEST_ASSERT_MSG_EQ(tag->GetMode().IsListening(), true, "listening until the timer fires");
    NS_TEST_ASSERT_MSG_EQ(tag->GetTagMachine().GetInputMachine().GetTimer().IsPending(), true,
                          "input timer armed by init");

    Simulator::Stop(MilliSeconds(10));
    Simulator::Run();

    NS_TEST_ASSERT_MSG_EQ(tag->GetMode().GetReflectionIndex(), 2, "bit 1 + 1 selects chip 2");
    NS_TEST_ASSERT_MSG_EQ(tag->GetTagMachine().GetProcessingMachine().GetRegister(kRecvRegister), 1.0,
                          "send_bit delivers a nonzero register as 1");
    auto changes = sink->Find("mode_change");
    NS_TEST_ASSERT_MSG_EQ(changes.size(), 1, "one mode change logged");
    NS_TEST_ASSERT_MSG_EQ(changes[0].fields["mode"]["chip_index"].get<uint32_t>(), 2, "logged chip index");
    NS_TEST_ASSERT_MSG_EQ(tag->GetTagMachine().GetInputMachine().GetState().GetName(), "in_done",
                          "input finished");
    Simulator::Destroy();
  }
};

class VoltageReadTestCase : public TestCase
{
public:
  VoltageReadTestCase()
    : TestCase("Input machine reads the envelope voltage through the manager")
  {
  }

private:
  void DoRun() override
  {
    Ptr<StateSerializer> states = StatesFromJson(R"({
      "in":    {"transitions": {"init": [["sequence", ["save_voltage", 0], ["send_int", 0], ["forward_voltage"]], "in"]}},
      "proc":  {"transitions": {"on_recv_int": [["mov", 1, 7], "proc2"]}},
      "proc2": {"transitions": {"on_recv_voltage": [["mov", 2, 7], "proc2"]}},
      "idle":  {}
    })");
    Ptr<RecordingLogSink> sink = Create<RecordingLogSink>();
    Ptr<TimerScheduler> timers = CreateObject<TimerScheduler>();
    Ptr<TagManager> manager = CreateObject<TagManager>();
    manager->AddExciter(MakeExciter());
    Ptr<Tag> tag = MakeTag("T1", Vector(1, 0, 0), states, {"in", "proc", "idle"}, timers, sink);
    manager->AddTag(tag);

    const double expected = manager->GetPhysicsEngine()->VoltageAtTag(manager->GetTags(), *tag);
    NS_TEST_ASSERT_MSG_GT(expected, 0.0, "an illuminated tag sees a voltage");

    tag->Run();
    ProcessingMachine& proc = tag->GetTagMachine().GetProcessingMachine();
    NS_TEST_ASSERT_MSG_EQ_TOL(tag->GetTagMachine().GetInputMachine().GetRegister(0), expected, 1e-15,
                              "save_voltage");
    NS_TEST_ASSERT_MSG_EQ_TOL(proc.GetRegister(1), expected, 1e-15, "send_int carried the voltage");
    NS_TEST_ASSERT_MSG_EQ_TOL(proc.GetRegister(2), expected, 1e-15, "forward_voltage");
    NS_TEST_ASSERT_MSG_EQ(sink->Find("read_voltage").size(), 2, "both reads logged");
    Simulator::Destroy();
  }
};

class IdleTagTestCase : public TestCase
{
public:
  IdleTagTestCase()
    : TestCase("A tag without timers or inputs does nothing after prepare")
  {
  }

private:
  void DoRun() override
  {
    Ptr<StateSerializer> states = StatesFromJson(R"({
      "in":   {"transitions": {"init": [["load_imm", 0, 1], "in"]}},
      "proc": {"transitions": {"init": [["load_imm", 0, 1], "proc"]}},
      "out":  {"transitions": {"init": [["set_listen"], "out"]}}
    })");
    Ptr<TimerScheduler> timers = CreateObject<TimerScheduler>();
    Ptr<Tag> tag = MakeTag("T1", Vector(1, 0, 0), states, {"in", "proc", "out"}, timers, Create<NullLogSink>());
    tag->Run();

    TagMachine& tm = tag->GetTagMachine();
    const uint64_t in = tm.GetInputMachine().GetDispatchCount();
    const uint64_t proc = tm.GetProcessingMachine().GetDispatchCount();
    const uint64_t out = tm.GetOutputMachine().GetDispatchCount();

    Simulator::Stop(Seconds(5));
    Simulator::Run();

    NS_TEST_ASSERT_MSG_EQ(tm.GetInputMachine().GetDispatchCount(), in, "input dispatched after prepare");
    NS_TEST_ASSERT_MSG_EQ(tm.GetProcessingMachine().GetDispatchCount(), proc, "processing dispatched");
    NS_TEST_ASSERT_MSG_EQ(tm.GetOutputMachine().GetDispatchCount(), out, "output dispatched");
    NS_TEST_ASSERT_MSG_EQ(timers->GetFiredCount(), 0, "no timer fired");
    NS_TEST_ASSERT_MSG_EQ(timers->GetNextWake(), Time::Max(), "scheduler stayed idle");
    Simulator::Destroy();
  }
};

class ProcessingMemoryTestCase : public TestCase
{
public:
  ProcessingMemoryTestCase()
    : TestCase("Transmission bits land in processing memory")
  {
  }

private:
  void DoRun() override
  {
    Ptr<StateSerializer> states = StatesFromJson(R"({
      "proc": {"transitions": {"on_transmission": [["sequence",
                 ["mov", 0, 7], ["load_imm", 1, 2], ["load_mem", 2, 1],
                 ["store_mem_imm", 10, 5], ["load_imm", 3, 11], ["store_mem", 3, 0],
                 ["send_int_log", 0]], "proc"]}},
      "idle": {}
    })");
    Ptr<RecordingLogSink> sink = Create<RecordingLogSink>();
    Ptr<TimerScheduler> timers = CreateObject<TimerScheduler>();
    Ptr<Tag> tag = MakeTag("T1", Vector(1, 0, 0), states, {"idle", "proc", "idle"}, timers, sink);
    tag->Run();

    tag->SetTransmission({1, 0, 1, 1});
    ProcessingMachine& proc = tag->GetTagMachine().GetProcessingMachine();
    NS_TEST_ASSERT_MSG_EQ(proc.GetRegister(0), 4.0, "bit count in the receive register");
    NS_TEST_ASSERT_MSG_EQ(proc.GetRegister(2), 1.0, "bit 2 loaded from memory");
    NS_TEST_ASSERT_MSG_EQ(proc.GetMemory(1), 0.0, "bit 1");
    NS_TEST_ASSERT_MSG_EQ(proc.GetMemory(10), 5.0, "store_mem_imm");
    NS_TEST_ASSERT_MSG_EQ(proc.GetMemory(11), 4.0, "store_mem through a register address");

    auto logged = sink->Find("send_int_log");
    NS_TEST_ASSERT_MSG_EQ(logged.size(), 1, "send_int_log record");
    NS_TEST_ASSERT_MSG_EQ(logged[0].fields["value"].get<int64_t>(), 4, "logged value");
    NS_TEST_ASSERT_MSG_EQ(logged[0].fields["tag"].get<std::string>(), "T1", "logged tag");
    Simulator::Destroy();
  }
};

class QueueProcessingTestCase : public TestCase
{
public:
  QueueProcessingTestCase()
    : TestCase("queue_processing wakes the processing machine")
  {
  }

private:
  void DoRun() override
  {
    Ptr<StateSerializer> states = StatesFromJson(R"({
      "out":  {"transitions": {"init": [["queue_processing"], "out"]}},
      "proc": {"transitions": {"on_queue_up": [["load_imm", 5, 7], "proc"]}},
      "idle": {}
    })");
    Ptr<TimerScheduler> timers = CreateObject<TimerScheduler>();
    Ptr<Tag> tag = MakeTag("T1", Vector(1, 0, 0), states, {"idle", "proc", "out"}, timers, Create<NullLogSink>());
    tag->Run();
    NS_TEST_ASSERT_MSG_EQ(tag->GetTagMachine().GetProcessingMachine().GetRegister(5), 7.0, "on_queue_up ran");
    Simulator::Destroy();
  }
};

class RoleValidationTestCase : public TestCase
{
public:
  RoleValidationTestCase()
    : TestCase("Machines reject programs using another role's instructions")
  {
  }

private:
  void DoRun() override
  {
    Ptr<StateSerializer> states = StatesFromJson(R"({
      "in":   {"transitions": {"init": [["set_antenna", 0], "in"]}},
      "proc": {"transitions": {"init": [["set_timer", 0], "proc"]}},
      "idle": {}
    })");
    Ptr<TimerScheduler> timers = CreateObject<TimerScheduler>();

    bool threw = false;
    try
    {
      TagMachine tm(states, {"in", "idle", "idle"}, timers, Create<NullLogSink>());
    }
    catch (const ConfigError&)
    {
      threw = true;
    }
    NS_TEST_ASSERT_MSG_EQ(threw, true, "input machine cannot set the antenna");

    threw = false;
    try
    {
      TagMachine tm(states, {"idle", "proc", "idle"}, timers, Create<NullLogSink>());
    }
    catch (const ConfigError&)
    {
      threw = true;
    }
    NS_TEST_ASSERT_MSG_EQ(threw, true, "processing machine has no timer");
    Simulator::Destroy();
  }
};

class AntennaRangeTestCase : public TestCase
{
public:
  AntennaRangeTestCase()
    : TestCase("set_antenna outside the chip table is out of range")
  {
  }

private:
  void DoRun() override
  {
    Ptr<StateSerializer> states = StatesFromJson(R"({
      "out":  {"transitions": {"init": [["sequence", ["load_imm", 0, 9], ["set_antenna", 0]], "out"]}},
      "idle": {}
    })");
    Ptr<TimerScheduler> timers = CreateObject<TimerScheduler>();
    Ptr<Tag> tag = MakeTag("T1", Vector(1, 0, 0), states, {"idle", "idle", "out"}, timers, Create<NullLogSink>());
    bool threw = false;
    try
    {
      tag->Run();
    }
    catch (const std::out_of_range&)
    {
      threw = true;
    }
    NS_TEST_ASSERT_MSG_EQ(threw, true, "index 9 with three chips");
    NS_TEST_ASSERT_MSG_EQ(tag->GetMode().IsListening(), true, "mode unchanged");

    // 2^32 + 1 would wrap to chip 1 if narrowed before the range check.
    Ptr<StateSerializer> wide = StatesFromJson(R"({
      "out":  {"transitions": {"init": [["sequence", ["load_imm", 0, 4294967297], ["set_antenna", 0]], "out"]}},
      "idle": {}
    })");
    Ptr<Tag> wrapped = MakeTag("T2", Vector(1, 0, 0), wide, {"idle", "idle", "out"}, timers, Create<NullLogSink>());
    threw = false;
    try
    {
      wrapped->Run();
    }
    catch (const std::out_of_range&)
    {
      threw = true;
    }
    NS_TEST_ASSERT_MSG_EQ(threw, true, "index 2^32 + 1 does not wrap");
    NS_TEST_ASSERT_MSG_EQ(wrapped->GetMode().IsListening(), true, "wrapped index leaves the mode alone");

    Ptr<StateSerializer> fractional = StatesFromJson(R"({
      "out":  {"transitions": {"init": [["sequence", ["load_imm", 0, 1.5], ["set_antenna", 0]], "out"]}},
      "idle": {}
    })");
    Ptr<Tag> half = MakeTag("T3", Vector(1, 0, 0), fractional, {"idle", "idle", "out"}, timers, Create<NullLogSink>());
    threw = false;
    try
    {
      half->Run();
    }
    catch (const std::out_of_range&)
    {
      threw = true;
    }
    NS_TEST_ASSERT_MSG_EQ(threw, true, "fractional index rejected");
    Simulator::Destroy();
  }
};

class SetTimerZeroDelayTestCase : public TestCase
{
public:
  SetTimerZeroDelayTestCase()
    : TestCase("set_timer with a zero delay fires at the current time")
  {
  }

private:
  void DoRun() override
  {
    Ptr<StateSerializer> states = StatesFromJson(R"({
      "in":      {"transitions": {"init": [["sequence", ["load_imm", 1, 0], ["set_timer", 1]], "in_wait"]}},
      "in_wait": {"transitions": {"on_timer": [["load_imm", 2, 1], "in_done"]}},
      "in_done": {},
      "idle":    {}
    })");
    Ptr<TimerScheduler> timers = CreateObject<TimerScheduler>();
    Ptr<Tag> tag = MakeTag("T1", Vector(1, 0, 0), states, {"in", "idle", "idle"}, timers, Create<NullLogSink>());

    tag->Run();
    NS_TEST_ASSERT_MSG_EQ(tag->GetTagMachine().GetInputMachine().GetTimer().IsPending(), true,
                          "zero delay arms the timer");
    Simulator::Run();
    NS_TEST_ASSERT_MSG_EQ(tag->GetTagMachine().GetInputMachine().GetState().GetName(), "in_done",
                          "timer fired");
    NS_TEST_ASSERT_MSG_EQ(Simulator::Now(), Seconds(0), "no time elapsed");
    NS_TEST_ASSERT_MSG_EQ(timers->GetFiredCount(), 1, "one expiry");
    Simulator::Destroy();
  }
};

class TagMachineJsonTestCase : public TestCase
{
public:
  TagMachineJsonTestCase()
    : TestCase("Tag machines serialize their initial state names")
  {
  }

private:
  void DoRun() override
  {
    Ptr<StateSerializer> states = StatesFromJson(R"({
      "in":   {"transitions": {"init": [["load_imm", 0, 1], "in2"]}},
      "in2":  {},
      "proc": {},
      "out":  {}
    })");
    Ptr<TimerScheduler> timers = CreateObject<TimerScheduler>();
    Ptr<Tag> tag = MakeTag("T1", Vector(1, 0, 0), states, {"in", "proc", "out"}, timers, Create<NullLogSink>());
    tag->Run();
    NS_TEST_ASSERT_MSG_EQ(tag->GetTagMachine().GetInputMachine().GetState().GetName(), "in2", "moved on");

    nlohmann::json j = tag->GetTagMachine().ToJson();
    NS_TEST_ASSERT_MSG_EQ(j["input"].get<std::string>(), "in", "initial, not live, input state");

    auto rebuilt = TagMachine::FromJson(j, states, timers, Create<NullLogSink>());
    NS_TEST_ASSERT_MSG_EQ(&rebuilt->GetInputMachine().GetState(),
                          &tag->GetTagMachine().GetInputMachine().GetInitState(),
                          "rebuilt machine shares the State object");
    NS_TEST_ASSERT_MSG_EQ(rebuilt->ToJson().dump(), j.dump(), "same triplet");
    Simulator::Destroy();
  }
};

class TagMachineTestSuite : public TestSuite
{
public:
  TagMachineTestSuite()
    : TestSuite("tagsim-tag-machine", Type::UNIT)
  {
    AddTestCase(new PrepareOrderTestCase, TestCase::Duration::QUICK);
    AddTestCase(new CrossMachinePipelineTestCase, TestCase::Duration::QUICK);
    AddTestCase(new VoltageReadTestCase, TestCase::Duration::QUICK);
    AddTestCase(new IdleTagTestCase, TestCase::Duration::QUICK);
    AddTestCase(new ProcessingMemoryTestCase, TestCase::Duration::QUICK);
    AddTestCase(new QueueProcessingTestCase, TestCase::Duration::QUICK);
    AddTestCase(new RoleValidationTestCase, TestCase::Duration::QUICK);
    AddTestCase(new AntennaRangeTestCase, TestCase::Duration::QUICK);
    AddTestCase(new SetTimerZeroDelayTestCase, TestCase::Duration::QUICK);
    AddTestCase(new TagMachineJsonTestCase, TestCase::Duration::QUICK);
  }
};

static TagMachineTestSuite g_tagMachineTestSuite;
