#pragma once

#include "tag-machine.h"

#include "ns3/object.h"
#include "ns3/vector.h"

#include <nlohmann/json.hpp>

#include <complex>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tagsim {

class TagManager;

// Index into a tag's chip-impedance table. Index 0 is the listening
// configuration (antenna connected to the envelope detector).
class TagMode
{
public:
  static constexpr uint32_t kListeningIndex = 0;

  TagMode() = default;
  explicit TagMode(uint32_t index)
    : m_index(index)
  {
  }

  static TagMode Listening() { return TagMode(kListeningIndex); }
  // "LISTEN" or "TRANSMIT" (any case). TRANSMIT needs an index >= 1.
  static TagMode FromString(const std::string& mode, std::optional<int64_t> reflectionIndex);

  bool IsListening() const { return m_index == kListeningIndex; }
  uint32_t GetReflectionIndex() const { return m_index; }
  std::string ToString() const { return IsListening() ? "LISTEN" : "TRANSMIT"; }

  bool operator==(const TagMode& o) const { return m_index == o.m_index; }
  bool operator!=(const TagMode& o) const { return m_index != o.m_index; }

private:
  uint32_t m_index{kListeningIndex};
};

std::ostream& operator<<(std::ostream& os, const TagMode& mode);

// Anything that takes part in the RF computation. Gains are given in dBi
// and stored linear; power is in mW and frequency in Hz.
class PhysicsObject : public ns3::Object
{
public:
  static ns3::TypeId GetTypeId();

  PhysicsObject(std::string name,
                const ns3::Vector& position,
                double powerMw,
                double gainDbi,
                std::complex<double> impedance,
                double frequencyHz);

  const std::string& GetName() const { return m_name; }
  const ns3::Vector& GetPosition() const { return m_position; }
  double GetPower() const { return m_power; }
  double GetGain() const { return m_gain; }
  double GetGainDbi() const { return m_gainDbi; }
  std::complex<double> GetImpedance() const { return m_impedance; }
  double GetFrequency() const { return m_frequency; }
  double GetWavelength() const;

protected:
  nlohmann::json BaseToJson() const;

private:
  std::string m_name;
  ns3::Vector m_position;
  double m_power;
  double m_gainDbi;
  double m_gain;
  std::complex<double> m_impedance;
  double m_frequency;
};

class Exciter : public PhysicsObject
{
public:
  static ns3::TypeId GetTypeId();

  Exciter(std::string name,
          const ns3::Vector& position,
          double powerMw,
          double gainDbi,
          std::complex<double> impedance,
          double frequencyHz);

  nlohmann::json ToJson() const { return BaseToJson(); }
};

class Tag : public PhysicsObject
{
public:
  static ns3::TypeId GetTypeId();

  Tag(std::string name,
      const ns3::Vector& position,
      double powerMw,
      double gainDbi,
      std::complex<double> impedance,
      double frequencyHz,
      std::vector<std::complex<double>> chipImpedances,
      std::unique_ptr<TagMachine> machine);
  ~Tag() override;

  TagMode GetMode() const { return m_mode; }
  // Throws std::out_of_range if the index has no chip impedance.
  void SetMode(TagMode mode);
  void SetModeListen() { SetMode(TagMode::Listening()); }
  void SetModeReflect(uint32_t index) { SetMode(TagMode(index)); }
  // Same as SetMode but writes no mode_change record. Used for what-if solves.
  void SetModeSilently(TagMode mode);

  uint32_t GetNModes() const { return static_cast<uint32_t>(m_chipImpedances.size()) + 1; }
  std::complex<double> GetChipImpedance(uint32_t index) const;
  // Chip impedance of the current (non-listening) mode.
  std::complex<double> GetChipImpedance() const { return GetChipImpedance(m_mode.GetReflectionIndex()); }
  const std::vector<std::complex<double>>& GetChipImpedances() const { return m_chipImpedances; }

  void SetPowerOnThresholdDbm(double dbm) { m_threshold = dbm; }
  void ClearPowerOnThreshold() { m_threshold.reset(); }
  const std::optional<double>& GetPowerOnThresholdDbm() const { return m_threshold; }

  // Loads bits into the processing machine's memory.
  void SetTransmission(const std::vector<uint8_t>& bits);
  const std::vector<uint8_t>& GetTransmission() const { return m_transmission; }

  void SetTagManager(TagManager* manager) { m_manager = manager; }
  TagManager* GetTagManager() const { return m_manager; }

  // Starts the tag machine.
  void Run();
  double ReadVoltage();

  TagMachine& GetTagMachine() { return *m_machine; }
  const TagMachine& GetTagMachine() const { return *m_machine; }

  nlohmann::json ToJson() const;

protected:
  void DoDispose() override;

private:
  TagMode m_mode;
  std::vector<std::complex<double>> m_chipImpedances;
  std::optional<double> m_threshold;
  std::vector<uint8_t> m_transmission;
  std::unique_ptr<TagMachine> m_machine;
  TagManager* m_manager{nullptr};
};

nlohmann::json ImpedanceToJson(std::complex<double> z);

} // namespace tagsim
