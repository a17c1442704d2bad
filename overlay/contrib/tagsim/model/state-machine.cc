#include "state-machine.h"

#include "log-sink.h"
#include "tagsim-error.h"

#include "ns3/log.h"

#include <cmath>
#include <set>
#include <stdexcept>

namespace tagsim {

NS_LOG_COMPONENT_DEFINE("TagsimStateMachine");

State::State(std::string name)
  : m_name(std::move(name))
{
}

void
State::SetTransition(const std::string& symbol, Instruction instruction, uint32_t next)
{
  m_transitions[symbol] = Transition{std::move(instruction), next};
}

void
State::RemoveTransition(const std::string& symbol)
{
  m_transitions.erase(symbol);
}

const Transition*
State::FollowSymbol(const std::string& symbol) const
{
  auto it = m_transitions.find(symbol);
  return it == m_transitions.end() ? nullptr : &it->second;
}

bool
State::DoesAcceptSymbol(const std::string& symbol) const
{
  return m_transitions.count(symbol) != 0;
}

uint32_t
StateSerializer::GetStateId(const std::string& name)
{
  auto it = m_ids.find(name);
  if (it != m_ids.end())
  {
    return it->second;
  }
  const uint32_t id = static_cast<uint32_t>(m_states.size());
  m_states.emplace_back(name);
  m_ids.emplace(name, id);
  return id;
}

uint32_t
StateSerializer::LookupStateId(const std::string& name) const
{
  auto it = m_ids.find(name);
  if (it == m_ids.end())
  {
    throw ConfigError("unknown state '" + name + "'");
  }
  return it->second;
}

State&
StateSerializer::GetState(uint32_t id)
{
  return m_states.at(id);
}

const State&
StateSerializer::GetState(uint32_t id) const
{
  return m_states.at(id);
}

void
StateSerializer::SetTransition(const std::string& from,
                               const std::string& symbol,
                               Instruction instruction,
                               const std::string& to)
{
  const uint32_t src = GetStateId(from);
  const uint32_t dst = GetStateId(to);
  m_states[src].SetTransition(symbol, std::move(instruction), dst);
}

nlohmann::json
StateSerializer::ToJson() const
{
  nlohmann::json out = nlohmann::json::object();
  for (const auto& state : m_states)
  {
    nlohmann::json trans = nlohmann::json::object();
    for (const auto& kv : state.GetTransitions())
    {
      trans[kv.first] = nlohmann::json::array({kv.second.instruction.ToJson(),
                                               m_states[kv.second.next].GetName()});
    }
    out[state.GetName()] = {{"transitions", trans}};
  }
  return out;
}

void
StateSerializer::LoadJson(const nlohmann::json& states)
{
  if (!states.is_object())
  {
    throw ConfigError("states: expected an object keyed by state name");
  }
  for (auto it = states.begin(); it != states.end(); ++it)
  {
    GetStateId(it.key());
  }
  for (auto it = states.begin(); it != states.end(); ++it)
  {
    const std::string& from = it.key();
    if (!it.value().is_object())
    {
      throw ConfigError("states." + from + ": expected an object");
    }
    if (!it.value().contains("transitions"))
    {
      continue;
    }
    const nlohmann::json& transitions = it.value().at("transitions");
    if (!transitions.is_object())
    {
      throw ConfigError("states." + from + ".transitions: expected an object keyed by symbol");
    }
    for (auto tr = transitions.begin(); tr != transitions.end(); ++tr)
    {
      const std::string where = "states." + from + "." + tr.key();
      const nlohmann::json& entry = tr.value();
      if (!entry.is_array() || entry.size() != 2 || !entry[1].is_string())
      {
        throw ConfigError(where + ": expected [instruction, next_state]");
      }
      const std::string to = entry[1].get<std::string>();
      if (!states.contains(to))
      {
        throw ConfigError(where + ": next state '" + to + "' is not defined");
      }
      Instruction ins;
      try
      {
        ins = Instruction::FromJson(entry[0]);
      }
      catch (const ConfigError& ex)
      {
        throw ConfigError(where + ": " + ex.what());
      }
      SetTransition(from, tr.key(), std::move(ins), to);
    }
  }
}

StateMachine::StateMachine(ns3::Ptr<StateSerializer> states, const std::string& initState)
  : m_states(states),
    m_init(states->LookupStateId(initState)),
    m_current(m_init)
{
}

std::optional<Instruction>
StateMachine::Transition(const std::string& symbol)
{
  const tagsim::Transition* t = m_states->GetState(m_current).FollowSymbol(symbol);
  if (!t)
  {
    return std::nullopt;
  }
  Instruction ins = t->instruction;
  m_current = t->next;
  return ins;
}

ExecuteMachine::ExecuteMachine(ns3::Ptr<StateSerializer> states,
                               const std::string& initState,
                               std::string role,
                               const TagLogger* logger)
  : StateMachine(states, initState),
    m_logger(logger),
    m_role(std::move(role))
{
}

double
ExecuteMachine::GetRegister(uint32_t idx) const
{
  if (idx >= kRegisterCount)
  {
    throw std::out_of_range("register index " + std::to_string(idx));
  }
  return m_reg[idx];
}

void
ExecuteMachine::SetRegister(uint32_t idx, double value)
{
  if (idx >= kRegisterCount)
  {
    throw std::out_of_range("register index " + std::to_string(idx));
  }
  m_reg[idx] = value;
}

void
ExecuteMachine::AcceptSymbol(const std::string& symbol)
{
  m_pending.push_back(symbol);
  if (m_draining)
  {
    return;
  }

  struct DrainGuard
  {
    bool& flag;
    ~DrainGuard() { flag = false; }
  } guard{m_draining};
  m_draining = true;

  while (!m_pending.empty())
  {
    const std::string sym = std::move(m_pending.front());
    m_pending.pop_front();

    const std::string from = GetState().GetName();
    std::optional<Instruction> ins = Transition(sym);
    if (!ins)
    {
      NS_LOG_LOGIC(m_role << " ignores '" << sym << "' in state " << from);
      continue;
    }
    if (m_logger)
    {
      m_logger->Trace("dispatch",
                      {{"machine", m_role},
                       {"state", from},
                       {"symbol", sym},
                       {"next", GetState().GetName()},
                       {"instruction", ins->ToJson()}});
    }
    Execute(*ins);
  }
}

void
ExecuteMachine::Receive(const std::string& symbol, double value)
{
  m_reg[kRecvRegister] = value;
  AcceptSymbol(symbol);
}

void
ExecuteMachine::Execute(const Instruction& ins)
{
  if (ins.op != Opcode::Sequence)
  {
    ++m_dispatched;
  }
  const auto& r = ins.operand;
  switch (ins.op)
  {
  case Opcode::Sequence:
    for (const auto& sub : ins.body)
    {
      Execute(sub);
    }
    break;
  case Opcode::Mov:
    m_reg[r[0]] = m_reg[r[1]];
    break;
  case Opcode::LoadImm:
    m_reg[r[0]] = ins.imm;
    break;
  case Opcode::Add:
    m_reg[r[0]] = m_reg[r[1]] + m_reg[r[2]];
    break;
  case Opcode::Sub:
    m_reg[r[0]] = m_reg[r[1]] - m_reg[r[2]];
    break;
  case Opcode::Floor:
    m_reg[r[0]] = std::trunc(m_reg[r[0]]);
    break;
  case Opcode::Abs:
    m_reg[r[0]] = std::fabs(m_reg[r[0]]);
    break;
  case Opcode::Compare: {
    const double a = m_reg[r[0]];
    const double b = m_reg[r[1]];
    AcceptSymbol(a < b ? "lt" : (a > b ? "gt" : "eq"));
    break;
  }
  case Opcode::SelfTrigger:
    AcceptSymbol(ins.symbol);
    break;
  case Opcode::SetTimer:
  case Opcode::SaveVoltage:
  case Opcode::SendBit:
  case Opcode::SendInt:
  case Opcode::ForwardVoltage:
  case Opcode::SendIntOut:
  case Opcode::SendIntLog:
  case Opcode::StoreMemImm:
  case Opcode::StoreMem:
  case Opcode::LoadMem:
  case Opcode::SetAntenna:
  case Opcode::SetListen:
  case Opcode::QueueProcessing:
    CheckSupported(ins, GetState().GetName());
    ExecuteSpecial(ins);
    break;
  }
}

void
ExecuteMachine::ExecuteSpecial(const Instruction& ins)
{
  throw ConfigError(m_role + " machine cannot execute '" + std::string(OpcodeName(ins.op)) + "'");
}

bool
ExecuteMachine::Supports(Opcode op) const
{
  switch (op)
  {
  case Opcode::Sequence:
  case Opcode::Mov:
  case Opcode::LoadImm:
  case Opcode::Add:
  case Opcode::Sub:
  case Opcode::Floor:
  case Opcode::Abs:
  case Opcode::Compare:
  case Opcode::SelfTrigger:
    return true;
  default:
    return false;
  }
}

void
ExecuteMachine::CheckSupported(const Instruction& ins, const std::string& where) const
{
  if (!Supports(ins.op))
  {
    throw ConfigError(m_role + " machine cannot execute '" + std::string(OpcodeName(ins.op)) +
                      "' (state " + where + ")");
  }
  for (const auto& sub : ins.body)
  {
    CheckSupported(sub, where);
  }
}

void
ExecuteMachine::Validate() const
{
  std::set<uint32_t> seen;
  std::vector<uint32_t> stack{m_init};
  while (!stack.empty())
  {
    const uint32_t id = stack.back();
    stack.pop_back();
    if (!seen.insert(id).second)
    {
      continue;
    }
    const State& st = m_states->GetState(id);
    for (const auto& kv : st.GetTransitions())
    {
      CheckSupported(kv.second.instruction, st.GetName() + "/" + kv.first);
      stack.push_back(kv.second.next);
    }
  }
}

} // namespace tagsim
