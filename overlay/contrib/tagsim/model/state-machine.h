#pragma once

#include "instruction.h"

#include "ns3/ptr.h"
#include "ns3/simple-ref-count.h"

#include <nlohmann/json.hpp>

#include <array>
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tagsim {

class TagLogger;

struct Transition
{
  Instruction instruction;
  uint32_t next{0};
};

class State
{
public:
  explicit State(std::string name);

  const std::string& GetName() const { return m_name; }
  void SetTransition(const std::string& symbol, Instruction instruction, uint32_t next);
  void RemoveTransition(const std::string& symbol);
  const Transition* FollowSymbol(const std::string& symbol) const;
  bool DoesAcceptSymbol(const std::string& symbol) const;
  const std::map<std::string, Transition>& GetTransitions() const { return m_transitions; }

private:
  std::string m_name;
  std::map<std::string, Transition> m_transitions;
};

// Owns every State of a scenario. States refer to each other by index, so
// cycles and self-loops are plain data. Machines share the arena through a
// Ptr and name their current state by index.
class StateSerializer : public ns3::SimpleRefCount<StateSerializer>
{
public:
  // Returns the id for name, creating an empty state on first use.
  uint32_t GetStateId(const std::string& name);
  // Throws ConfigError if no state has this name.
  uint32_t LookupStateId(const std::string& name) const;
  bool HasState(const std::string& name) const { return m_ids.count(name) != 0; }

  State& GetState(uint32_t id);
  const State& GetState(uint32_t id) const;
  uint32_t GetNStates() const { return static_cast<uint32_t>(m_states.size()); }

  void SetTransition(const std::string& from,
                     const std::string& symbol,
                     Instruction instruction,
                     const std::string& to);

  // {"<state>": {"transitions": {"<symbol>": [<instruction>, "<next state>"]}}}
  nlohmann::json ToJson() const;
  // Every next-state must name a state defined in the same document.
  void LoadJson(const nlohmann::json& states);

private:
  std::vector<State> m_states;
  std::map<std::string, uint32_t> m_ids;
};

class StateMachine
{
public:
  StateMachine(ns3::Ptr<StateSerializer> states, const std::string& initState);
  virtual ~StateMachine() = default;

  const State& GetState() const { return m_states->GetState(m_current); }
  const State& GetInitState() const { return m_states->GetState(m_init); }
  ns3::Ptr<StateSerializer> GetStates() const { return m_states; }

  // Moves along the transition for symbol. Without one, nothing changes.
  std::optional<Instruction> Transition(const std::string& symbol);

protected:
  ns3::Ptr<StateSerializer> m_states;
  uint32_t m_init;
  uint32_t m_current;
};

// State machine plus an 8-register file. Symbols produced while a dispatch
// is running are queued and handled after it, in arrival order.
class ExecuteMachine : public StateMachine
{
public:
  ExecuteMachine(ns3::Ptr<StateSerializer> states,
                 const std::string& initState,
                 std::string role,
                 const TagLogger* logger);

  void AcceptSymbol(const std::string& symbol);

  double GetRegister(uint32_t idx) const;
  void SetRegister(uint32_t idx, double value);
  uint64_t GetDispatchCount() const { return m_dispatched; }
  const std::string& GetRole() const { return m_role; }

  virtual bool Supports(Opcode op) const;
  // Walks every state reachable from the initial one and throws ConfigError
  // on the first instruction this machine cannot execute.
  void Validate() const;

protected:
  void Execute(const Instruction& ins);
  // Role-specific opcodes.
  virtual void ExecuteSpecial(const Instruction& ins);
  void Receive(const std::string& symbol, double value);
  double& Reg(uint32_t idx) { return m_reg[idx]; }

  const TagLogger* m_logger;

private:
  void CheckSupported(const Instruction& ins, const std::string& where) const;

  std::array<double, kRegisterCount> m_reg{};
  std::deque<std::string> m_pending;
  bool m_draining{false};
  uint64_t m_dispatched{0};
  std::string m_role;
};

} // namespace tagsim
