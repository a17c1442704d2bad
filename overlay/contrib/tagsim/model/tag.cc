#include "tag.h"

#include "tag-manager.h"
#include "tagsim-error.h"

#include "ns3/abort.h"
#include "ns3/log.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace tagsim {

NS_LOG_COMPONENT_DEFINE("TagsimTag");
NS_OBJECT_ENSURE_REGISTERED(PhysicsObject);
NS_OBJECT_ENSURE_REGISTERED(Exciter);
NS_OBJECT_ENSURE_REGISTERED(Tag);

namespace {
constexpr double kSpeedOfLight = 299792458.0;
}

TagMode
TagMode::FromString(const std::string& mode, std::optional<int64_t> reflectionIndex)
{
  std::string upper = mode;
  std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  if (upper == "LISTEN")
  {
    return Listening();
  }
  if (upper == "TRANSMIT")
  {
    if (!reflectionIndex)
    {
      throw ConfigError("TRANSMIT mode requires a reflection_index");
    }
    if (*reflectionIndex < 1 || *reflectionIndex > std::numeric_limits<uint32_t>::max())
    {
      throw ConfigError("TRANSMIT reflection_index must be between 1 and " +
                        std::to_string(std::numeric_limits<uint32_t>::max()) + ", got " +
                        std::to_string(*reflectionIndex));
    }
    return TagMode(static_cast<uint32_t>(*reflectionIndex));
  }
  throw ConfigError("unknown tag mode '" + mode + "'");
}

std::ostream&
operator<<(std::ostream& os, const TagMode& mode)
{
  return os << mode.ToString() << "(" << mode.GetReflectionIndex() << ")";
}

nlohmann::json
ImpedanceToJson(std::complex<double> z)
{
  if (z.imag() == 0.0)
  {
    return NumberToJson(z.real());
  }
  return nlohmann::json::array({z.real(), z.imag()});
}

ns3::TypeId
PhysicsObject::GetTypeId()
{
  static ns3::TypeId tid =
    ns3::TypeId("tagsim::PhysicsObject").SetParent<ns3::Object>().SetGroupName("Tagsim");
  return tid;
}

PhysicsObject::PhysicsObject(std::string name,
                             const ns3::Vector& position,
                             double powerMw,
                             double gainDbi,
                             std::complex<double> impedance,
                             double frequencyHz)
  : m_name(std::move(name)),
    m_position(position),
    m_power(powerMw),
    m_gainDbi(gainDbi),
    m_gain(std::pow(10.0, gainDbi / 10.0)),
    m_impedance(impedance),
    m_frequency(frequencyHz)
{
  if (!(frequencyHz > 0.0))
  {
    throw ConfigError(m_name + ": frequency must be positive");
  }
}

double
PhysicsObject::GetWavelength() const
{
  return kSpeedOfLight / m_frequency;
}

nlohmann::json
PhysicsObject::BaseToJson() const
{
  return {{"x", m_position.x},
          {"y", m_position.y},
          {"z", m_position.z},
          {"power", m_power},
          {"gain", m_gainDbi},
          {"impedance", ImpedanceToJson(m_impedance)},
          {"frequency", m_frequency}};
}

ns3::TypeId
Exciter::GetTypeId()
{
  static ns3::TypeId tid =
    ns3::TypeId("tagsim::Exciter").SetParent<PhysicsObject>().SetGroupName("Tagsim");
  return tid;
}

Exciter::Exciter(std::string name,
                 const ns3::Vector& position,
                 double powerMw,
                 double gainDbi,
                 std::complex<double> impedance,
                 double frequencyHz)
  : PhysicsObject(std::move(name), position, powerMw, gainDbi, impedance, frequencyHz)
{
}

ns3::TypeId
Tag::GetTypeId()
{
  static ns3::TypeId tid =
    ns3::TypeId("tagsim::Tag").SetParent<PhysicsObject>().SetGroupName("Tagsim");
  return tid;
}

Tag::Tag(std::string name,
         const ns3::Vector& position,
         double powerMw,
         double gainDbi,
         std::complex<double> impedance,
         double frequencyHz,
         std::vector<std::complex<double>> chipImpedances,
         std::unique_ptr<TagMachine> machine)
  : PhysicsObject(std::move(name), position, powerMw, gainDbi, impedance, frequencyHz),
    m_chipImpedances(std::move(chipImpedances)),
    m_machine(std::move(machine))
{
  NS_ABORT_MSG_IF(!m_machine, "Tag " << GetName() << " constructed without a tag machine");
  m_machine->SetTag(this);
}

Tag::~Tag()
{
  NS_LOG_FUNCTION(this);
}

void
Tag::DoDispose()
{
  m_manager = nullptr;
  m_machine.reset();
  PhysicsObject::DoDispose();
}

std::complex<double>
Tag::GetChipImpedance(uint32_t index) const
{
  if (index == TagMode::kListeningIndex || index > m_chipImpedances.size())
  {
    throw std::out_of_range(GetName() + ": no chip impedance for index " + std::to_string(index));
  }
  return m_chipImpedances[index - 1];
}

void
Tag::SetModeSilently(TagMode mode)
{
  if (mode.GetReflectionIndex() > m_chipImpedances.size())
  {
    throw std::out_of_range(GetName() + ": antenna index " +
                            std::to_string(mode.GetReflectionIndex()) + " outside chip table of " +
                            std::to_string(m_chipImpedances.size()));
  }
  m_mode = mode;
}

void
Tag::SetMode(TagMode mode)
{
  if (mode.GetReflectionIndex() > m_chipImpedances.size())
  {
    throw std::out_of_range(GetName() + ": antenna index " +
                            std::to_string(mode.GetReflectionIndex()) + " outside chip table of " +
                            std::to_string(m_chipImpedances.size()));
  }
  if (mode == m_mode)
  {
    return;
  }
  NS_LOG_INFO(GetName() << " mode " << m_mode << " -> " << mode);
  m_mode = mode;
  m_machine->GetLogger().Log("mode_change",
                             {{"mode",
                               {{"chip_index", mode.GetReflectionIndex()},
                                {"listening", mode.IsListening()}}}});
}

void
Tag::SetTransmission(const std::vector<uint8_t>& bits)
{
  m_transmission = bits;
  m_machine->GetProcessingMachine().LoadTransmission(bits);
}

void
Tag::Run()
{
  m_machine->Prepare();
}

double
Tag::ReadVoltage()
{
  if (!m_manager)
  {
    throw std::logic_error(GetName() + ": read_voltage on a tag not registered with a manager");
  }
  return m_manager->GetReceivedVoltage(*this);
}

nlohmann::json
Tag::ToJson() const
{
  nlohmann::json j = BaseToJson();
  nlohmann::json chips = nlohmann::json::array();
  for (const auto& z : m_chipImpedances)
  {
    chips.push_back(ImpedanceToJson(z));
  }
  j["chip_impedances"] = chips;
  j["machine"] = m_machine->ToJson();
  j["mode"] = m_mode.ToString();
  if (!m_mode.IsListening())
  {
    j["reflection_index"] = m_mode.GetReflectionIndex();
  }
  if (m_threshold)
  {
    j["power_on_threshold_dbm"] = *m_threshold;
  }
  return j;
}

} // namespace tagsim
