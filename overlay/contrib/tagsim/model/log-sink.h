#pragma once

#include "ns3/simple-ref-count.h"
#include "ns3/ptr.h"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <string>

namespace tagsim {

// Structured log collaborator. The core never opens files itself; it hands
// a message and a JSON object of fields to whatever sink it was given.
class LogSink : public ns3::SimpleRefCount<LogSink>
{
public:
  virtual ~LogSink() = default;

  virtual void Log(const std::string& message, const nlohmann::json& fields) = 0;

  // Instruction dispatch traces. Dropped unless a sink overrides this.
  virtual void Trace(const std::string& message, const nlohmann::json& fields);
};

class NullLogSink : public LogSink
{
public:
  void Log(const std::string&, const nlohmann::json&) override {}
};

// One JSON object per line: {"time": <sim s>, "level": ..., "msg": ..., fields...}
class NdjsonLogSink : public LogSink
{
public:
  explicit NdjsonLogSink(const std::string& path = "logs/tagsim.ndjson", bool traceEnabled = false);
  ~NdjsonLogSink() override;

  void Log(const std::string& message, const nlohmann::json& fields) override;
  void Trace(const std::string& message, const nlohmann::json& fields) override;

  bool IsOpen() const { return m_fp != nullptr; }
  const std::string& GetPath() const { return m_path; }

private:
  void Write(const char* level, const std::string& message, const nlohmann::json& fields);
  void WriteLine(const std::string& json);

  std::string m_path;
  std::FILE* m_fp{nullptr};
  bool m_trace{false};
};

// Adds the owning tag's name to every record, like a per-tag logger adapter.
class TagLogger
{
public:
  TagLogger() = default;
  TagLogger(ns3::Ptr<LogSink> sink, std::string tagName);

  void SetTagName(const std::string& name) { m_tag = name; }
  const std::string& GetTagName() const { return m_tag; }
  ns3::Ptr<LogSink> GetSink() const { return m_sink; }

  void Log(const std::string& message, nlohmann::json fields = nlohmann::json::object()) const;
  void Trace(const std::string& message, nlohmann::json fields = nlohmann::json::object()) const;

private:
  ns3::Ptr<LogSink> m_sink;
  std::string m_tag;
};

// Register values are doubles; integral ones are logged as JSON integers.
nlohmann::json NumberToJson(double value);

} // namespace tagsim
