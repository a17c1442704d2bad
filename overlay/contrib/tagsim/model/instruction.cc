#include "instruction.h"

#include "log-sink.h"
#include "tagsim-error.h"

#include <cmath>
#include <sstream>

namespace tagsim {

namespace {

// Operand signature letters:
//   r  register index, a  memory address, i  immediate number, s  symbol
struct OpcodeInfo
{
  Opcode op;
  const char* name;
  const char* sig;
};

const OpcodeInfo kOpcodes[] = {
  {Opcode::Sequence, "sequence", nullptr},
  {Opcode::Mov, "mov", "rr"},
  {Opcode::LoadImm, "load_imm", "ri"},
  {Opcode::Add, "add", "rrr"},
  {Opcode::Sub, "sub", "rrr"},
  {Opcode::Floor, "floor", "r"},
  {Opcode::Abs, "abs", "r"},
  {Opcode::Compare, "compare", "rr"},
  {Opcode::SelfTrigger, "self_trigger", "s"},
  {Opcode::SetTimer, "set_timer", "r"},
  {Opcode::SaveVoltage, "save_voltage", "r"},
  {Opcode::SendBit, "send_bit", "r"},
  {Opcode::SendInt, "send_int", "r"},
  {Opcode::ForwardVoltage, "forward_voltage", ""},
  {Opcode::SendIntOut, "send_int_out", "r"},
  {Opcode::SendIntLog, "send_int_log", "r"},
  {Opcode::StoreMemImm, "store_mem_imm", "ai"},
  {Opcode::StoreMem, "store_mem", "rr"},
  {Opcode::LoadMem, "load_mem", "rr"},
  {Opcode::SetAntenna, "set_antenna", "r"},
  {Opcode::SetListen, "set_listen", ""},
  {Opcode::QueueProcessing, "queue_processing", ""},
};

const OpcodeInfo& Info(Opcode op)
{
  for (const auto& info : kOpcodes)
  {
    if (info.op == op)
    {
      return info;
    }
  }
  throw std::logic_error("opcode missing from table");
}

uint32_t ParseIndex(const nlohmann::json& v, uint32_t limit, const char* what, const std::string& ctx)
{
  if (!v.is_number())
  {
    throw ConfigError(ctx + ": " + what + " must be a number, got " + v.dump());
  }
  const double d = v.get<double>();
  if (d < 0 || std::trunc(d) != d || d >= limit)
  {
    std::ostringstream oss;
    oss << ctx << ": " << what << " " << v.dump() << " outside [0, " << limit << ")";
    throw ConfigError(oss.str());
  }
  return static_cast<uint32_t>(d);
}

} // namespace

const char*
OpcodeName(Opcode op)
{
  return Info(op).name;
}

bool
OpcodeFromName(const std::string& name, Opcode& out)
{
  for (const auto& info : kOpcodes)
  {
    if (name == info.name)
    {
      out = info.op;
      return true;
    }
  }
  return false;
}

Instruction
Instruction::FromJson(const nlohmann::json& j)
{
  if (!j.is_array() || j.empty() || !j[0].is_string())
  {
    throw ConfigError("instruction must be an array starting with a name, got " + j.dump());
  }
  const std::string name = j[0].get<std::string>();
  Instruction ins;
  if (!OpcodeFromName(name, ins.op))
  {
    throw ConfigError("unknown instruction '" + name + "'");
  }

  if (ins.op == Opcode::Sequence)
  {
    for (size_t k = 1; k < j.size(); ++k)
    {
      ins.body.push_back(FromJson(j[k]));
    }
    return ins;
  }

  const std::string sig = Info(ins.op).sig;
  if (j.size() != sig.size() + 1)
  {
    std::ostringstream oss;
    oss << "instruction '" << name << "' takes " << sig.size() << " argument(s), got " << j.size() - 1;
    throw ConfigError(oss.str());
  }

  uint32_t slot = 0;
  for (size_t k = 0; k < sig.size(); ++k)
  {
    const nlohmann::json& arg = j[k + 1];
    switch (sig[k])
    {
    case 'r':
      ins.operand[slot++] = ParseIndex(arg, kRegisterCount, "register", name);
      break;
    case 'a':
      ins.operand[slot++] = ParseIndex(arg, kMemorySize, "memory address", name);
      break;
    case 'i':
      if (!arg.is_number())
      {
        throw ConfigError(name + ": immediate must be a number, got " + arg.dump());
      }
      ins.imm = arg.get<double>();
      break;
    case 's':
      if (!arg.is_string())
      {
        throw ConfigError(name + ": symbol must be a string, got " + arg.dump());
      }
      ins.symbol = arg.get<std::string>();
      break;
    }
  }
  return ins;
}

nlohmann::json
Instruction::ToJson() const
{
  nlohmann::json j = nlohmann::json::array();
  j.push_back(OpcodeName(op));
  if (op == Opcode::Sequence)
  {
    for (const auto& sub : body)
    {
      j.push_back(sub.ToJson());
    }
    return j;
  }
  uint32_t slot = 0;
  for (const char* c = Info(op).sig; *c; ++c)
  {
    switch (*c)
    {
    case 'r':
    case 'a':
      j.push_back(operand[slot++]);
      break;
    case 'i':
      j.push_back(NumberToJson(imm));
      break;
    case 's':
      j.push_back(symbol);
      break;
    }
  }
  return j;
}

bool
Instruction::operator==(const Instruction& o) const
{
  return op == o.op && operand == o.operand && imm == o.imm && symbol == o.symbol && body == o.body;
}

} // namespace tagsim
