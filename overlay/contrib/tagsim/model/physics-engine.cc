#include "physics-engine.h"

#include "ns3/boolean.h"
#include "ns3/double.h"
#include "ns3/log.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace tagsim {

NS_LOG_COMPONENT_DEFINE("TagsimPhysicsEngine");
NS_OBJECT_ENSURE_REGISTERED(PhysicsEngine);

namespace {

constexpr double kPi = 3.14159265358979323846;

// FNV-1a over raw bytes.
class Fnv1a
{
public:
  void Add(const void* data, size_t len)
  {
    const auto* p = static_cast<const unsigned char*>(data);
    for (size_t i = 0; i < len; ++i)
    {
      m_h ^= p[i];
      m_h *= 1099511628211ULL;
    }
  }
  void Add(double v) { Add(&v, sizeof(v)); }
  void Add(std::complex<double> z)
  {
    Add(z.real());
    Add(z.imag());
  }
  void Add(const std::string& s)
  {
    Add(s.data(), s.size());
    const unsigned char sep = 0xff;
    Add(&sep, 1);
  }
  void Add(const PhysicsObject& o)
  {
    Add(o.GetName());
    Add(o.GetPosition().x);
    Add(o.GetPosition().y);
    Add(o.GetPosition().z);
    Add(o.GetGain());
    Add(o.GetImpedance());
    Add(o.GetFrequency());
  }
  uint64_t Get() const { return m_h; }

private:
  uint64_t m_h{1469598103934665603ULL};
};

} // namespace

ns3::TypeId
PhysicsEngine::GetTypeId()
{
  static ns3::TypeId tid =
    ns3::TypeId("tagsim::PhysicsEngine")
      .SetParent<ns3::Object>()
      .SetGroupName("Tagsim")
      .AddConstructor<PhysicsEngine>()
      .AddAttribute("PowerOnThresholdDbm",
                    "Incident exciter power below which a tag only scatters passively (dBm).",
                    ns3::DoubleValue(-100.0),
                    ns3::MakeDoubleAccessor(&PhysicsEngine::m_powerOnThresholdDbm),
                    ns3::MakeDoubleChecker<double>())
      .AddAttribute("NoiseStd",
                    "Standard deviation of additive Gaussian noise on tag voltages (V).",
                    ns3::DoubleValue(0.0),
                    ns3::MakeDoubleAccessor(&PhysicsEngine::m_noiseStd),
                    ns3::MakeDoubleChecker<double>(0.0))
      .AddAttribute("PassiveReflection",
                    "Reflection coefficient of a listening or unpowered tag.",
                    ns3::DoubleValue(0.01),
                    ns3::MakeDoubleAccessor(&PhysicsEngine::m_passiveReflection),
                    ns3::MakeDoubleChecker<double>())
      .AddAttribute("SelfConsistent",
                    "Solve the coupled backscatter system instead of summing single bounces.",
                    ns3::BooleanValue(true),
                    ns3::MakeBooleanAccessor(&PhysicsEngine::m_selfConsistent),
                    ns3::MakeBooleanChecker());
  return tid;
}

PhysicsEngine::PhysicsEngine()
  : m_powerOnThresholdDbm(-100.0),
    m_noiseStd(0.0),
    m_passiveReflection(0.01),
    m_selfConsistent(true)
{
  NS_LOG_FUNCTION(this);
  m_noise = ns3::CreateObject<ns3::NormalRandomVariable>();
}

PhysicsEngine::~PhysicsEngine()
{
  NS_LOG_FUNCTION(this);
}

void
PhysicsEngine::DoDispose()
{
  m_exciter = nullptr;
  m_sink = nullptr;
  m_noise = nullptr;
  m_cacheValid = false;
  ns3::Object::DoDispose();
}

void
PhysicsEngine::SetExciter(ns3::Ptr<Exciter> exciter)
{
  NS_LOG_FUNCTION(this << (exciter ? exciter->GetName() : std::string("<none>")));
  m_exciter = exciter;
  m_cacheValid = false;
}

int64_t
PhysicsEngine::AssignStreams(int64_t stream)
{
  m_noise->SetStream(stream);
  return 1;
}

double
PhysicsEngine::Attenuation(double distance, double wavelength, double txGain, double rxGain)
{
  if (distance <= 0.0)
  {
    return 0.0;
  }
  auto friis = [&](double d) {
    const double x = wavelength / (4.0 * kPi * d);
    return txGain * rxGain * x * x;
  };
  const double r0 = wavelength / (2.0 * kPi);
  double a;
  if (distance >= r0)
  {
    a = friis(distance);
  }
  else
  {
    const double ratio = r0 / distance;
    a = friis(r0) * ratio * ratio * ratio;
  }
  return std::min(a, 1.0);
}

double
PhysicsEngine::Distance(const PhysicsObject& a, const PhysicsObject& b)
{
  const ns3::Vector& p = a.GetPosition();
  const ns3::Vector& q = b.GetPosition();
  const double dx = p.x - q.x;
  const double dy = p.y - q.y;
  const double dz = p.z - q.z;
  return std::sqrt(dx * dx + dy * dy + dz * dz);
}

std::complex<double>
PhysicsEngine::SignalPhasor(const PhysicsObject& tx, const PhysicsObject& rx) const
{
  const double d = Distance(tx, rx);
  const double lambda = tx.GetWavelength();
  const double amp = std::sqrt(Attenuation(d, lambda, tx.GetGain(), rx.GetGain()));
  return std::polar(amp, 2.0 * kPi * d / lambda);
}

double
PhysicsEngine::IncidentPowerDbm(const Tag& tag) const
{
  if (!m_exciter)
  {
    throw std::logic_error("PhysicsEngine: no exciter set");
  }
  const double mw = m_exciter->GetPower() * Attenuation(Distance(*m_exciter, tag),
                                                        m_exciter->GetWavelength(),
                                                        m_exciter->GetGain(),
                                                        tag.GetGain());
  if (mw <= 0.0)
  {
    return -std::numeric_limits<double>::infinity();
  }
  return 10.0 * std::log10(mw);
}

bool
PhysicsEngine::IsPowered(const Tag& tag) const
{
  const double threshold = tag.GetPowerOnThresholdDbm().value_or(m_powerOnThresholdDbm);
  return IncidentPowerDbm(tag) >= threshold;
}

std::complex<double>
PhysicsEngine::ActiveReflectionCoefficient(const Tag& tag) const
{
  const std::complex<double> zc = tag.GetChipImpedance();
  const std::complex<double> za = tag.GetImpedance();
  const std::complex<double> den = zc + za;
  const std::complex<double> gamma = (zc - std::conj(za)) / den;
  if (std::abs(den) < 1e-12 || !std::isfinite(gamma.real()) || !std::isfinite(gamma.imag()))
  {
    ReportDegradation("reflection coefficient undefined, using 0",
                      {{"tag", tag.GetName()},
                       {"chip_index", tag.GetMode().GetReflectionIndex()},
                       {"chip_impedance", ImpedanceToJson(zc)},
                       {"antenna_impedance", ImpedanceToJson(za)}});
    return {0.0, 0.0};
  }
  return gamma;
}

std::complex<double>
PhysicsEngine::EffectiveReflectionCoefficient(const Tag& tag) const
{
  if (tag.GetMode().IsListening() || !IsPowered(tag))
  {
    return {m_passiveReflection, 0.0};
  }
  return ActiveReflectionCoefficient(tag);
}

uint64_t
PhysicsEngine::ChannelKey(const TagList& tags, const std::vector<std::complex<double>>& gammas) const
{
  Fnv1a h;
  h.Add(*m_exciter);
  h.Add(m_exciter->GetPower());
  for (size_t i = 0; i < tags.size(); ++i)
  {
    h.Add(*tags[i]);
    h.Add(gammas[i]);
  }
  return h.Get();
}

const PhysicsEngine::ChannelSolution&
PhysicsEngine::Solve(const TagList& tags)
{
  if (!m_exciter)
  {
    throw std::logic_error("PhysicsEngine: no exciter set");
  }
  const size_t n = tags.size();
  std::vector<std::complex<double>> gammas;
  gammas.reserve(n);
  for (const auto& t : tags)
  {
    gammas.push_back(EffectiveReflectionCoefficient(*t));
  }

  const uint64_t key = ChannelKey(tags, gammas);
  if (m_cacheValid && m_cache.key == key && m_cache.order.size() == n)
  {
    return m_cache;
  }

  ChannelSolution sol;
  sol.key = key;
  sol.order.reserve(n);
  sol.h = Eigen::MatrixXcd::Zero(n, n);
  sol.gamma = Eigen::VectorXcd::Zero(n);
  sol.exciter = Eigen::VectorXcd::Zero(n);

  bool anyReflection = false;
  for (size_t i = 0; i < n; ++i)
  {
    sol.order.push_back(tags[i]->GetName());
    sol.gamma(i) = gammas[i];
    sol.exciter(i) = SignalPhasor(*m_exciter, *tags[i]);
    anyReflection = anyReflection || gammas[i] != std::complex<double>(0.0, 0.0);
    for (size_t j = 0; j < n; ++j)
    {
      if (i != j)
      {
        sol.h(i, j) = SignalPhasor(*tags[j], *tags[i]);
      }
    }
  }

  if (!anyReflection)
  {
    sol.field = sol.exciter;
  }
  else
  {
    const Eigen::MatrixXcd hg = sol.h * sol.gamma.asDiagonal();
    const Eigen::MatrixXcd a = Eigen::MatrixXcd::Identity(n, n) - hg;
    Eigen::FullPivLU<Eigen::MatrixXcd> lu(a);
    if (lu.isInvertible())
    {
      sol.field = lu.solve(sol.exciter);
    }
    else
    {
      ReportDegradation("feedback matrix singular, using single-bounce field",
                        {{"tags", static_cast<uint64_t>(n)}});
      sol.field = sol.exciter + hg * sol.exciter;
      sol.singleBounce = true;
    }
  }

  ++m_solves;
  NS_LOG_LOGIC("solved channel for " << n << " tags, key " << key);
  m_cache = std::move(sol);
  m_cacheValid = true;
  return m_cache;
}

double
PhysicsEngine::FieldToVoltage(std::complex<double> impedance, std::complex<double> field)
{
  const double vPeak = std::sqrt(std::abs(impedance * std::abs(field)) / kVoltageNormalization);
  return vPeak / std::sqrt(2.0);
}

double
PhysicsEngine::VoltageAtTagNoFeedback(const TagList& tags, const Tag& rx) const
{
  if (!m_exciter)
  {
    throw std::logic_error("PhysicsEngine: no exciter set");
  }
  std::complex<double> sum = SignalPhasor(*m_exciter, rx);
  for (const auto& t : tags)
  {
    if (t->GetName() == rx.GetName() || t->GetMode().IsListening())
    {
      continue;
    }
    sum += SignalPhasor(*m_exciter, *t) * EffectiveReflectionCoefficient(*t) * SignalPhasor(*t, rx);
  }
  return FieldToVoltage(rx.GetImpedance(), sum);
}

double
PhysicsEngine::NoiselessVoltage(const TagList& tags, const Tag& rx)
{
  if (!m_selfConsistent)
  {
    return VoltageAtTagNoFeedback(tags, rx);
  }
  const ChannelSolution& sol = Solve(tags);
  for (size_t i = 0; i < sol.order.size(); ++i)
  {
    if (sol.order[i] == rx.GetName())
    {
      return FieldToVoltage(rx.GetImpedance(), sol.field(i));
    }
  }
  throw std::invalid_argument("tag '" + rx.GetName() + "' is not part of the channel");
}

double
PhysicsEngine::ApplyNoise(double vRms)
{
  if (m_noiseStd <= 0.0)
  {
    return vRms;
  }
  return std::max(0.0, vRms + m_noise->GetValue(0.0, m_noiseStd * m_noiseStd));
}

double
PhysicsEngine::VoltageAtTag(const TagList& tags, const Tag& rx)
{
  return ApplyNoise(NoiselessVoltage(tags, rx));
}

std::vector<double>
PhysicsEngine::VoltagesAtTags(const TagList& tags)
{
  std::vector<double> out;
  out.reserve(tags.size());
  if (!m_selfConsistent)
  {
    for (const auto& t : tags)
    {
      out.push_back(ApplyNoise(VoltageAtTagNoFeedback(tags, *t)));
    }
    return out;
  }
  const ChannelSolution& sol = Solve(tags);
  for (size_t i = 0; i < tags.size(); ++i)
  {
    out.push_back(ApplyNoise(FieldToVoltage(tags[i]->GetImpedance(), sol.field(i))));
  }
  return out;
}

double
PhysicsEngine::ModulationDepthForTxRx(const TagList& tags,
                                      Tag& tx,
                                      const Tag& rx,
                                      TagMode modeA,
                                      TagMode modeB)
{
  const TagMode saved = tx.GetMode();
  double va = 0.0;
  double vb = 0.0;
  try
  {
    tx.SetModeSilently(modeA);
    va = NoiselessVoltage(tags, rx);
    tx.SetModeSilently(modeB);
    vb = NoiselessVoltage(tags, rx);
  }
  catch (...)
  {
    tx.SetModeSilently(saved);
    throw;
  }
  tx.SetModeSilently(saved);
  return std::fabs(va - vb);
}

void
PhysicsEngine::ReportDegradation(const std::string& what, const nlohmann::json& fields) const
{
  NS_LOG_WARN(what << " " << fields.dump());
  if (m_sink)
  {
    m_sink->Log(what, fields);
  }
}

} // namespace tagsim
