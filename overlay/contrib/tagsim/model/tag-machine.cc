#include "tag-machine.h"

#include "tag.h"
#include "tagsim-error.h"

#include "ns3/abort.h"
#include "ns3/log.h"
#include "ns3/nstime.h"

#include <cmath>
#include <stdexcept>

namespace tagsim {

NS_LOG_COMPONENT_DEFINE("TagsimTagMachine");

MachineTimer::MachineTimer(ExecuteMachine& machine, ns3::Ptr<TimerScheduler> scheduler)
  : m_machine(machine),
    m_scheduler(scheduler)
{
}

MachineTimer::~MachineTimer()
{
  Cancel();
}

void
MachineTimer::Set(double seconds)
{
  NS_ABORT_MSG_IF(!(seconds >= 0.0),
                  m_machine.GetRole() << " machine: set_timer with negative delay " << seconds);
  m_scheduler->SetTimer(this, ns3::Seconds(seconds));
}

void
MachineTimer::Cancel()
{
  if (m_scheduler)
  {
    m_scheduler->CancelTimer(this);
  }
}

bool
MachineTimer::IsPending() const
{
  return m_scheduler && m_scheduler->HasPendingTimer(this);
}

void
MachineTimer::OnTimer()
{
  m_machine.AcceptSymbol("on_timer");
}

InputMachine::InputMachine(ns3::Ptr<StateSerializer> states,
                           const std::string& initState,
                           TagMachine& owner,
                           ProcessingMachine& processing,
                           ns3::Ptr<TimerScheduler> scheduler)
  : ExecuteMachine(states, initState, "input", &owner.GetLogger()),
    m_owner(owner),
    m_processing(processing),
    m_timer(*this, scheduler)
{
}

bool
InputMachine::Supports(Opcode op) const
{
  switch (op)
  {
  case Opcode::SetTimer:
  case Opcode::SaveVoltage:
  case Opcode::SendBit:
  case Opcode::SendInt:
  case Opcode::ForwardVoltage:
    return true;
  default:
    return ExecuteMachine::Supports(op);
  }
}

void
InputMachine::ExecuteSpecial(const Instruction& ins)
{
  const uint32_t r = ins.operand[0];
  switch (ins.op)
  {
  case Opcode::SetTimer:
    m_timer.Set(Reg(r));
    break;
  case Opcode::SaveVoltage:
    Reg(r) = m_owner.ReadVoltage();
    break;
  case Opcode::SendBit:
    m_processing.OnRecvBit(Reg(r) != 0.0);
    break;
  case Opcode::SendInt:
    m_processing.OnRecvInt(Reg(r));
    break;
  case Opcode::ForwardVoltage:
    m_processing.OnRecvVoltage(m_owner.ReadVoltage());
    break;
  default:
    ExecuteMachine::ExecuteSpecial(ins);
  }
}

ProcessingMachine::ProcessingMachine(ns3::Ptr<StateSerializer> states,
                                     const std::string& initState,
                                     TagMachine& owner,
                                     OutputMachine& output)
  : ExecuteMachine(states, initState, "processing", &owner.GetLogger()),
    m_owner(owner),
    m_output(output)
{
}

void
ProcessingMachine::OnRecvBit(bool bit)
{
  Receive("on_recv_bit", bit ? 1.0 : 0.0);
}

void
ProcessingMachine::OnRecvInt(double value)
{
  Receive("on_recv_int", value);
}

void
ProcessingMachine::OnRecvVoltage(double volts)
{
  Receive("on_recv_voltage", volts);
}

void
ProcessingMachine::OnQueueUp()
{
  AcceptSymbol("on_queue_up");
}

void
ProcessingMachine::LoadTransmission(const std::vector<uint8_t>& bits)
{
  if (bits.size() > kMemorySize)
  {
    throw ConfigError("transmission of " + std::to_string(bits.size()) + " bits exceeds " +
                      std::to_string(kMemorySize) + " words of memory");
  }
  for (size_t i = 0; i < bits.size(); ++i)
  {
    m_mem[i] = bits[i] ? 1.0 : 0.0;
  }
  Receive("on_transmission", static_cast<double>(bits.size()));
}

double
ProcessingMachine::GetMemory(uint32_t addr) const
{
  if (addr >= kMemorySize)
  {
    throw std::out_of_range("memory address " + std::to_string(addr));
  }
  return m_mem[addr];
}

uint32_t
ProcessingMachine::AddressFrom(double value) const
{
  if (!(value >= 0.0) || std::trunc(value) != value || value >= kMemorySize)
  {
    throw std::out_of_range("memory address " + std::to_string(value));
  }
  return static_cast<uint32_t>(value);
}

bool
ProcessingMachine::Supports(Opcode op) const
{
  switch (op)
  {
  case Opcode::SendIntOut:
  case Opcode::SendIntLog:
  case Opcode::StoreMemImm:
  case Opcode::StoreMem:
  case Opcode::LoadMem:
    return true;
  default:
    return ExecuteMachine::Supports(op);
  }
}

void
ProcessingMachine::ExecuteSpecial(const Instruction& ins)
{
  const auto& r = ins.operand;
  switch (ins.op)
  {
  case Opcode::SendIntOut:
    m_output.OnRecvInt(Reg(r[0]));
    break;
  case Opcode::SendIntLog:
    m_owner.GetLogger().Log("send_int_log", {{"value", NumberToJson(Reg(r[0]))}});
    break;
  case Opcode::StoreMemImm:
    m_mem[r[0]] = ins.imm;
    break;
  case Opcode::StoreMem:
    m_mem[AddressFrom(Reg(r[0]))] = Reg(r[1]);
    break;
  case Opcode::LoadMem:
    Reg(r[0]) = m_mem[AddressFrom(Reg(r[1]))];
    break;
  default:
    ExecuteMachine::ExecuteSpecial(ins);
  }
}

OutputMachine::OutputMachine(ns3::Ptr<StateSerializer> states,
                             const std::string& initState,
                             TagMachine& owner,
                             ns3::Ptr<TimerScheduler> scheduler)
  : ExecuteMachine(states, initState, "output", &owner.GetLogger()),
    m_owner(owner),
    m_timer(*this, scheduler)
{
}

void
OutputMachine::OnRecvInt(double value)
{
  Receive("on_recv_int", value);
}

bool
OutputMachine::Supports(Opcode op) const
{
  switch (op)
  {
  case Opcode::SetTimer:
  case Opcode::SetAntenna:
  case Opcode::SetListen:
  case Opcode::QueueProcessing:
    return true;
  default:
    return ExecuteMachine::Supports(op);
  }
}

void
OutputMachine::ExecuteSpecial(const Instruction& ins)
{
  const uint32_t r = ins.operand[0];
  switch (ins.op)
  {
  case Opcode::SetTimer:
    m_timer.Set(Reg(r));
    break;
  case Opcode::SetAntenna: {
    const double v = Reg(r);
    if (!(v >= 0.0) || std::trunc(v) != v || v >= static_cast<double>(m_owner.GetTag().GetNModes()))
    {
      throw std::out_of_range("set_antenna: bad chip index " + std::to_string(v));
    }
    m_owner.GetTag().SetMode(TagMode(static_cast<uint32_t>(v)));
    break;
  }
  case Opcode::SetListen:
    m_owner.GetTag().SetMode(TagMode::Listening());
    break;
  case Opcode::QueueProcessing:
    NS_ASSERT_MSG(m_processing, "output machine not wired to a processing machine");
    m_processing->OnQueueUp();
    break;
  default:
    ExecuteMachine::ExecuteSpecial(ins);
  }
}

TagMachine::TagMachine(ns3::Ptr<StateSerializer> states,
                       const InitStates& init,
                       ns3::Ptr<TimerScheduler> scheduler,
                       ns3::Ptr<LogSink> sink)
  : m_init(init),
    m_logger(sink, "")
{
  m_output = std::make_unique<OutputMachine>(states, init.output, *this, scheduler);
  m_processing = std::make_unique<ProcessingMachine>(states, init.processing, *this, *m_output);
  m_input = std::make_unique<InputMachine>(states, init.input, *this, *m_processing, scheduler);
  m_output->SetProcessing(m_processing.get());

  m_output->Validate();
  m_processing->Validate();
  m_input->Validate();
}

TagMachine::~TagMachine()
{
  // Input points at processing which points at output.
  m_input.reset();
  m_processing.reset();
  m_output.reset();
}

void
TagMachine::SetTag(Tag* tag)
{
  m_tag = tag;
  m_logger.SetTagName(tag ? tag->GetName() : "");
}

Tag&
TagMachine::GetTag() const
{
  if (!m_tag)
  {
    throw std::logic_error("tag machine is not attached to a tag");
  }
  return *m_tag;
}

void
TagMachine::Prepare()
{
  NS_LOG_FUNCTION(this << m_logger.GetTagName());
  m_output->AcceptSymbol("init");
  m_processing->AcceptSymbol("init");
  m_input->AcceptSymbol("init");
}

double
TagMachine::ReadVoltage() const
{
  return GetTag().ReadVoltage();
}

nlohmann::json
TagMachine::ToJson() const
{
  return {{"input", m_init.input}, {"processing", m_init.processing}, {"output", m_init.output}};
}

std::unique_ptr<TagMachine>
TagMachine::FromJson(const nlohmann::json& j,
                     ns3::Ptr<StateSerializer> states,
                     ns3::Ptr<TimerScheduler> scheduler,
                     ns3::Ptr<LogSink> sink)
{
  if (!j.is_object())
  {
    throw ConfigError("tag machine: expected {input, processing, output}");
  }
  InitStates init;
  for (const char* key : {"input", "processing", "output"})
  {
    if (!j.contains(key) || !j.at(key).is_string())
    {
      throw ConfigError(std::string("tag machine: '") + key + "' must name a state");
    }
  }
  init.input = j.at("input").get<std::string>();
  init.processing = j.at("processing").get<std::string>();
  init.output = j.at("output").get<std::string>();
  return std::make_unique<TagMachine>(states, init, scheduler, sink);
}

} // namespace tagsim
