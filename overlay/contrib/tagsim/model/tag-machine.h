#pragma once

#include "log-sink.h"
#include "state-machine.h"
#include "timer-scheduler.h"

#include "ns3/ptr.h"

#include <array>
#include <memory>
#include <string>
#include <vector>

namespace tagsim {

class Tag;
class TagMachine;
class ProcessingMachine;
class OutputMachine;

// Timer capability for machines that schedule themselves. Accepts
// "on_timer" into its machine when the shared scheduler fires it.
class MachineTimer : public TimerAcceptor
{
public:
  MachineTimer(ExecuteMachine& machine, ns3::Ptr<TimerScheduler> scheduler);
  ~MachineTimer() override;

  MachineTimer(const MachineTimer&) = delete;
  MachineTimer& operator=(const MachineTimer&) = delete;

  void Set(double seconds);
  void Cancel();
  bool IsPending() const;
  void OnTimer() override;

private:
  ExecuteMachine& m_machine;
  ns3::Ptr<TimerScheduler> m_scheduler;
};

class InputMachine : public ExecuteMachine
{
public:
  InputMachine(ns3::Ptr<StateSerializer> states,
               const std::string& initState,
               TagMachine& owner,
               ProcessingMachine& processing,
               ns3::Ptr<TimerScheduler> scheduler);

  bool Supports(Opcode op) const override;
  MachineTimer& GetTimer() { return m_timer; }

protected:
  void ExecuteSpecial(const Instruction& ins) override;

private:
  TagMachine& m_owner;
  ProcessingMachine& m_processing;
  MachineTimer m_timer;
};

class ProcessingMachine : public ExecuteMachine
{
public:
  ProcessingMachine(ns3::Ptr<StateSerializer> states,
                    const std::string& initState,
                    TagMachine& owner,
                    OutputMachine& output);

  void OnRecvBit(bool bit);
  void OnRecvInt(double value);
  void OnRecvVoltage(double volts);
  void OnQueueUp();
  // Copies a bit pattern into memory (bit i at address i), puts its
  // length in the receive register and accepts "on_transmission".
  void LoadTransmission(const std::vector<uint8_t>& bits);

  double GetMemory(uint32_t addr) const;
  bool Supports(Opcode op) const override;

protected:
  void ExecuteSpecial(const Instruction& ins) override;

private:
  uint32_t AddressFrom(double value) const;

  TagMachine& m_owner;
  OutputMachine& m_output;
  std::array<double, kMemorySize> m_mem{};
};

class OutputMachine : public ExecuteMachine
{
public:
  OutputMachine(ns3::Ptr<StateSerializer> states,
                const std::string& initState,
                TagMachine& owner,
                ns3::Ptr<TimerScheduler> scheduler);

  void SetProcessing(ProcessingMachine* processing) { m_processing = processing; }
  void OnRecvInt(double value);

  bool Supports(Opcode op) const override;
  MachineTimer& GetTimer() { return m_timer; }

protected:
  void ExecuteSpecial(const Instruction& ins) override;

private:
  TagMachine& m_owner;
  ProcessingMachine* m_processing{nullptr};
  MachineTimer m_timer;
};

// The three cooperating machines of one tag.
class TagMachine
{
public:
  struct InitStates
  {
    std::string input;
    std::string processing;
    std::string output;
  };

  TagMachine(ns3::Ptr<StateSerializer> states,
             const InitStates& init,
             ns3::Ptr<TimerScheduler> scheduler,
             ns3::Ptr<LogSink> sink);
  ~TagMachine();

  TagMachine(const TagMachine&) = delete;
  TagMachine& operator=(const TagMachine&) = delete;

  void SetTag(Tag* tag);
  Tag& GetTag() const;
  bool HasTag() const { return m_tag != nullptr; }

  // Accepts "init" into output, processing and input, in that order.
  void Prepare();

  double ReadVoltage() const;

  InputMachine& GetInputMachine() { return *m_input; }
  ProcessingMachine& GetProcessingMachine() { return *m_processing; }
  OutputMachine& GetOutputMachine() { return *m_output; }
  const TagLogger& GetLogger() const { return m_logger; }
  const InitStates& GetInitStates() const { return m_init; }

  // Names the initial states, not wherever the machines are now.
  nlohmann::json ToJson() const;
  static std::unique_ptr<TagMachine> FromJson(const nlohmann::json& j,
                                              ns3::Ptr<StateSerializer> states,
                                              ns3::Ptr<TimerScheduler> scheduler,
                                              ns3::Ptr<LogSink> sink);

private:
  InitStates m_init;
  TagLogger m_logger;
  Tag* m_tag{nullptr};
  std::unique_ptr<OutputMachine> m_output;
  std::unique_ptr<ProcessingMachine> m_processing;
  std::unique_ptr<InputMachine> m_input;
};

} // namespace tagsim
