#include "log-sink.h"

#include "ns3/log.h"
#include "ns3/simulator.h"

#include <cmath>
#include <cstdint>
#include <filesystem>
#include <limits>

namespace tagsim {

NS_LOG_COMPONENT_DEFINE("TagsimLogSink");

void
LogSink::Trace(const std::string&, const nlohmann::json&)
{
}

NdjsonLogSink::NdjsonLogSink(const std::string& path, bool traceEnabled)
  : m_path(path),
    m_trace(traceEnabled)
{
  try
  {
    std::filesystem::path p(m_path);
    if (p.has_parent_path())
    {
      std::filesystem::create_directories(p.parent_path());
    }
  }
  catch (const std::filesystem::filesystem_error& ex)
  {
    NS_LOG_WARN("cannot create log directory for " << m_path << ": " << ex.what());
  }
  m_fp = std::fopen(m_path.c_str(), "w");
  if (!m_fp)
  {
    std::perror("open log file");
  }
}

NdjsonLogSink::~NdjsonLogSink()
{
  if (m_fp)
  {
    std::fclose(m_fp);
  }
}

void
NdjsonLogSink::Log(const std::string& message, const nlohmann::json& fields)
{
  Write("INFO", message, fields);
}

void
NdjsonLogSink::Trace(const std::string& message, const nlohmann::json& fields)
{
  if (m_trace)
  {
    Write("DEBUG", message, fields);
  }
}

void
NdjsonLogSink::Write(const char* level, const std::string& message, const nlohmann::json& fields)
{
  nlohmann::json rec = nlohmann::json::object();
  rec["time"] = ns3::Simulator::Now().GetSeconds();
  rec["level"] = level;
  rec["msg"] = message;
  if (fields.is_object())
  {
    for (auto it = fields.begin(); it != fields.end(); ++it)
    {
      rec[it.key()] = it.value();
    }
  }
  WriteLine(rec.dump());
}

void
NdjsonLogSink::WriteLine(const std::string& json)
{
  if (!m_fp)
  {
    return;
  }
  std::fputs(json.c_str(), m_fp);
  std::fputc('\n', m_fp);
  std::fflush(m_fp);
}

TagLogger::TagLogger(ns3::Ptr<LogSink> sink, std::string tagName)
  : m_sink(sink),
    m_tag(std::move(tagName))
{
}

void
TagLogger::Log(const std::string& message, nlohmann::json fields) const
{
  if (!m_sink)
  {
    return;
  }
  fields["tag"] = m_tag;
  m_sink->Log(message, fields);
}

void
TagLogger::Trace(const std::string& message, nlohmann::json fields) const
{
  if (!m_sink)
  {
    return;
  }
  fields["tag"] = m_tag;
  m_sink->Trace(message, fields);
}

nlohmann::json
NumberToJson(double value)
{
  if (std::isfinite(value) && std::trunc(value) == value &&
      std::fabs(value) < static_cast<double>(std::numeric_limits<int64_t>::max()))
  {
    return static_cast<int64_t>(value);
  }
  return value;
}

} // namespace tagsim
