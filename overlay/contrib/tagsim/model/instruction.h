#pragma once

#include <nlohmann/json.hpp>

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace tagsim {

constexpr uint32_t kRegisterCount = 8;
// Register that receives values delivered by another machine or the feedback loop.
constexpr uint32_t kRecvRegister = 7;
constexpr uint32_t kMemorySize = 64;

enum class Opcode : uint8_t
{
  Sequence,
  Mov,
  LoadImm,
  Add,
  Sub,
  Floor,
  Abs,
  Compare,
  SelfTrigger,
  SetTimer,
  SaveVoltage,
  SendBit,
  SendInt,
  ForwardVoltage,
  SendIntOut,
  SendIntLog,
  StoreMemImm,
  StoreMem,
  LoadMem,
  SetAntenna,
  SetListen,
  QueueProcessing,
};

const char* OpcodeName(Opcode op);
bool OpcodeFromName(const std::string& name, Opcode& out);

// A parsed machine instruction. Scenario files write it as a JSON array,
// e.g. ["add", 0, 1, 2] or ["sequence", [...], [...]].
struct Instruction
{
  Opcode op{Opcode::Sequence};
  std::array<uint32_t, 3> operand{{0, 0, 0}}; // register indices or a memory address
  double imm{0.0};
  std::string symbol;
  std::vector<Instruction> body;

  // Throws ConfigError for unknown names, wrong arity or bad operands.
  static Instruction FromJson(const nlohmann::json& j);
  nlohmann::json ToJson() const;
  std::string ToString() const { return ToJson().dump(); }

  bool operator==(const Instruction& o) const;
  bool operator!=(const Instruction& o) const { return !(*this == o); }
};

} // namespace tagsim
