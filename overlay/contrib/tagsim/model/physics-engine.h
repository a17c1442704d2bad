#pragma once

#include "log-sink.h"
#include "tag.h"

#include "ns3/object.h"
#include "ns3/ptr.h"
#include "ns3/random-variable-stream.h"

#include <Eigen/Dense>

#include <complex>
#include <cstdint>
#include <string>
#include <vector>

namespace tagsim {

using TagList = std::vector<ns3::Ptr<Tag>>;

// RF model of the exciter field and the backscatter coupling between tags.
//
// Every tag re-radiates what reaches it scaled by its effective reflection
// coefficient, so the field S at the tags satisfies
//   S = h + H * Gamma * S
// where h is the direct exciter illumination and H the tag-to-tag channel.
// Solving (I - H Gamma) S = h accounts for every order of reflection.
class PhysicsEngine : public ns3::Object
{
public:
  static ns3::TypeId GetTypeId();

  static constexpr double kSpeedOfLight = 299792458.0;
  // Calibration constant of the envelope-detector model, not an impedance.
  static constexpr double kVoltageNormalization = 500.0;

  PhysicsEngine();
  ~PhysicsEngine() override;

  void SetExciter(ns3::Ptr<Exciter> exciter);
  ns3::Ptr<Exciter> GetExciter() const { return m_exciter; }
  void SetLogSink(ns3::Ptr<LogSink> sink) { m_sink = sink; }

  void SetSelfConsistent(bool on) { m_selfConsistent = on; }
  bool IsSelfConsistent() const { return m_selfConsistent; }
  void SetNoiseStd(double sigma) { m_noiseStd = sigma; }
  double GetNoiseStd() const { return m_noiseStd; }
  void SetPowerOnThresholdDbm(double dbm) { m_powerOnThresholdDbm = dbm; }
  double GetPowerOnThresholdDbm() const { return m_powerOnThresholdDbm; }
  void SetPassiveReflection(double gamma) { m_passiveReflection = gamma; }
  double GetPassiveReflection() const { return m_passiveReflection; }

  int64_t AssignStreams(int64_t stream);

  // Friis beyond wavelength/(2 pi), cubic falloff inside it. Gains are linear.
  static double Attenuation(double distance, double wavelength, double txGain = 1.0, double rxGain = 1.0);
  static double Distance(const PhysicsObject& a, const PhysicsObject& b);
  std::complex<double> SignalPhasor(const PhysicsObject& tx, const PhysicsObject& rx) const;

  // Exciter power arriving at the tag, in dBm.
  double IncidentPowerDbm(const Tag& tag) const;
  bool IsPowered(const Tag& tag) const;
  std::complex<double> ActiveReflectionCoefficient(const Tag& tag) const;
  std::complex<double> EffectiveReflectionCoefficient(const Tag& tag) const;

  struct ChannelSolution
  {
    std::vector<std::string> order;
    Eigen::MatrixXcd h;
    Eigen::VectorXcd gamma;
    Eigen::VectorXcd exciter;
    Eigen::VectorXcd field;
    uint64_t key{0};
    bool singleBounce{false};
  };

  // Field at every tag of the list, reusing the last solve when neither
  // geometry nor any reflection coefficient changed.
  const ChannelSolution& Solve(const TagList& tags);

  // RMS voltage at rx, using the configured model, noise included.
  double VoltageAtTag(const TagList& tags, const Tag& rx);
  // One solve for the whole list, one noise sample per tag.
  std::vector<double> VoltagesAtTags(const TagList& tags);
  // Sum of independent single-bounce contributions, no noise.
  double VoltageAtTagNoFeedback(const TagList& tags, const Tag& rx) const;
  // |V(rx) with tx in modeA - V(rx) with tx in modeB|, without noise.
  // The tx mode is restored afterwards and no mode_change record is written.
  double ModulationDepthForTxRx(const TagList& tags, Tag& tx, const Tag& rx, TagMode modeA, TagMode modeB);

  static double FieldToVoltage(std::complex<double> impedance, std::complex<double> field);

  void InvalidateCache() { m_cacheValid = false; }
  uint64_t GetSolveCount() const { return m_solves; }

protected:
  void DoDispose() override;

private:
  double NoiselessVoltage(const TagList& tags, const Tag& rx);
  double ApplyNoise(double vRms);
  uint64_t ChannelKey(const TagList& tags, const std::vector<std::complex<double>>& gammas) const;
  void ReportDegradation(const std::string& what, const nlohmann::json& fields) const;

  ns3::Ptr<Exciter> m_exciter;
  ns3::Ptr<LogSink> m_sink;
  ns3::Ptr<ns3::NormalRandomVariable> m_noise;

  double m_powerOnThresholdDbm;
  double m_noiseStd;
  double m_passiveReflection;
  bool m_selfConsistent;

  ChannelSolution m_cache;
  bool m_cacheValid{false};
  uint64_t m_solves{0};
};

} // namespace tagsim
