#include "trust/Codec.h"
#include <cstdint>

namespace trust {

using nlohmann::json;

namespace {
constexpr const char* kContinuousFields[] = {
    "typing_speed", "key_hold_time", "mouse_velocity",
    "click_interval", "scroll_depth", "network_latency",
};

double* sample_slot(BehaviorSample& s, SignalId id) {
  switch (id) {
    case SignalId::TypingSpeed: return &s.typing_speed;
    case SignalId::KeyHoldTime: return &s.key_hold_time;
    case SignalId::MouseVelocity: return &s.mouse_velocity;
    case SignalId::ClickInterval: return &s.click_interval;
    case SignalId::ScrollDepth: return &s.scroll_depth;
    case SignalId::NetworkLatency: return &s.network_latency;
    default: return nullptr;
  }
}

std::optional<double>* baseline_slot(BaselineProfile& b, SignalId id) {
  switch (id) {
    case SignalId::TypingSpeed: return &b.typing_speed;
    case SignalId::KeyHoldTime: return &b.key_hold_time;
    case SignalId::MouseVelocity: return &b.mouse_velocity;
    case SignalId::ClickInterval: return &b.click_interval;
    case SignalId::ScrollDepth: return &b.scroll_depth;
    case SignalId::NetworkLatency: return &b.network_latency;
    case SignalId::TimeOfDay: return &b.time_of_day;
    default: return nullptr;
  }
}

template <typename Parse>
Parse input_fail(InputError e, const std::string& field) {
  Parse p{};
  p.ok = false;
  p.error = e;
  p.field = field;
  return p;
}

template <typename Parse>
Parse config_fail(ConfigError e, const std::string& detail) {
  Parse p{};
  p.ok = false;
  p.error = e;
  p.detail = detail;
  return p;
}

// Absent key and explicit null both read as absent.
const json* find_field(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return nullptr;
  return &*it;
}

bool read_number(const json& j, const char* key, double& out, std::string& err_field) {
  const json* v = find_field(j, key);
  if (!v) return true;
  if (!v->is_number()) {
    err_field = key;
    return false;
  }
  out = v->get<double>();
  return true;
}

std::optional<MissingHashPolicy> policy_from_name(const std::string& name) {
  if (name == "zero_points") return MissingHashPolicy::ZeroPoints;
  if (name == "rescale") return MissingHashPolicy::Rescale;
  return std::nullopt;
}

json error_response(InputError error, const std::string& field) {
  json out = json::object();
  out["accepted"] = false;
  out["error"] = input_error_name(error);
  out["field"] = field;
  return out;
}

const char* policy_name(MissingHashPolicy p) {
  return p == MissingHashPolicy::Rescale ? "rescale" : "zero_points";
}

ConfigParse parse_signal_table(const json& arr, ScoringConfig& cfg) {
  if (!arr.is_array()) return config_fail<ConfigParse>(ConfigError::MalformedConfig, "signals");
  cfg.signals.clear();
  for (const auto& entry : arr) {
    if (!entry.is_object()) return config_fail<ConfigParse>(ConfigError::MalformedConfig, "signals");
    const json* name = find_field(entry, "name");
    if (!name || !name->is_string()) {
      return config_fail<ConfigParse>(ConfigError::MalformedConfig, "name");
    }
    auto id = signal_from_name(name->get<std::string>());
    if (!id) return config_fail<ConfigParse>(ConfigError::UnknownSignal, name->get<std::string>());

    const json* kind = find_field(entry, "kind");
    if (!kind || !kind->is_string()) {
      return config_fail<ConfigParse>(ConfigError::MalformedConfig, "kind");
    }
    auto k = kind_from_name(kind->get<std::string>());
    if (!k) return config_fail<ConfigParse>(ConfigError::UnknownKind, kind->get<std::string>());

    const json* weight = find_field(entry, "weight");
    if (!weight || !weight->is_number()) {
      return config_fail<ConfigParse>(ConfigError::MalformedConfig, "weight");
    }

    SignalSpec spec{};
    spec.id = *id;
    spec.kind = *k;
    spec.weight = weight->get<double>();
    std::string bad;
    if (!read_number(entry, "d_max", spec.d_max, bad) ||
        !read_number(entry, "cap", spec.cap, bad) ||
        !read_number(entry, "max_hours", spec.max_hours, bad)) {
      return config_fail<ConfigParse>(ConfigError::MalformedConfig, bad);
    }
    cfg.signals.push_back(spec);
  }
  ConfigParse ok{};
  ok.ok = true;
  ok.error = ConfigError::None;
  return ok;
}
} // namespace

SampleParse parse_sample(const json& j) {
  if (!j.is_object()) return input_fail<SampleParse>(InputError::MalformedPayload, "");
  SampleParse res{};
  for (const char* key : kContinuousFields) {
    const json* v = find_field(j, key);
    if (!v) return input_fail<SampleParse>(InputError::MissingField, key);
    if (!v->is_number()) return input_fail<SampleParse>(InputError::WrongType, key);
    *sample_slot(res.sample, *signal_from_name(key)) = v->get<double>();
  }
  for (const char* key : {"device_hash", "location_hash"}) {
    const json* v = find_field(j, key);
    if (!v) return input_fail<SampleParse>(InputError::MissingField, key);
    if (!v->is_string()) return input_fail<SampleParse>(InputError::WrongType, key);
    std::string& slot = std::string(key) == "device_hash" ? res.sample.device_hash
                                                          : res.sample.location_hash;
    slot = v->get<std::string>();
  }
  const json* hour = find_field(j, "time_of_day");
  if (!hour) return input_fail<SampleParse>(InputError::MissingField, "time_of_day");
  if (!hour->is_number_integer()) {
    return input_fail<SampleParse>(InputError::WrongType, "time_of_day");
  }
  if (hour->is_number_unsigned()) {
    auto h = hour->get<uint64_t>();
    if (h > 23) return input_fail<SampleParse>(InputError::OutOfRange, "time_of_day");
    res.sample.time_of_day = static_cast<int>(h);
  } else {
    auto h = hour->get<int64_t>();
    if (h < 0 || h > 23) return input_fail<SampleParse>(InputError::OutOfRange, "time_of_day");
    res.sample.time_of_day = static_cast<int>(h);
  }
  res.ok = true;
  res.error = InputError::None;
  return res;
}

SampleParse parse_sample(const std::string& text) {
  try {
    return parse_sample(json::parse(text));
  } catch (const json::exception&) {
    return input_fail<SampleParse>(InputError::MalformedPayload, "");
  }
}

BaselineParse parse_baseline(const json& j) {
  if (!j.is_object()) return input_fail<BaselineParse>(InputError::MalformedPayload, "");
  BaselineParse res{};
  for (size_t i = 0; i < kSignalCount; ++i) {
    auto id = static_cast<SignalId>(i);
    const char* key = signal_name(id);
    const json* v = find_field(j, key);
    if (!v) continue;
    if (is_hash_signal(id)) {
      if (!v->is_string()) return input_fail<BaselineParse>(InputError::WrongType, key);
      auto& slot = id == SignalId::DeviceHash ? res.baseline.device_hash
                                              : res.baseline.location_hash;
      slot = v->get<std::string>();
      continue;
    }
    if (!v->is_number()) return input_fail<BaselineParse>(InputError::WrongType, key);
    *baseline_slot(res.baseline, id) = v->get<double>();
  }
  res.ok = true;
  res.error = InputError::None;
  return res;
}

ConfigParse parse_scoring_config(const json& j) {
  if (!j.is_object()) return config_fail<ConfigParse>(ConfigError::MalformedConfig, "");
  ConfigParse res{};
  res.config = default_scoring_config();
  try {
    std::string bad;
    if (!read_number(j, "epsilon", res.config.epsilon, bad)) {
      return config_fail<ConfigParse>(ConfigError::MalformedConfig, bad);
    }
    if (const json* p = find_field(j, "missing_hash_policy")) {
      if (!p->is_string()) {
        return config_fail<ConfigParse>(ConfigError::MalformedConfig, "missing_hash_policy");
      }
      auto policy = policy_from_name(p->get<std::string>());
      if (!policy) {
        return config_fail<ConfigParse>(ConfigError::MalformedConfig, "missing_hash_policy");
      }
      res.config.missing_hash = *policy;
    }
    if (const json* signals = find_field(j, "signals")) {
      auto table = parse_signal_table(*signals, res.config);
      if (!table.ok) return table;
    }
  } catch (const json::exception& e) {
    return config_fail<ConfigParse>(ConfigError::MalformedConfig, e.what());
  }

  auto check = check_config(res.config);
  if (!check.ok) {
    return config_fail<ConfigParse>(check.reason,
                                     check.signal ? signal_name(*check.signal) : "");
  }
  res.ok = true;
  res.error = ConfigError::None;
  return res;
}

GateConfigParse parse_gate_config(const json& j) {
  if (!j.is_object()) return config_fail<GateConfigParse>(ConfigError::MalformedConfig, "");
  GateConfigParse res{};
  if (const json* scoring = find_field(j, "scoring")) {
    auto sc = parse_scoring_config(*scoring);
    if (!sc.ok) return config_fail<GateConfigParse>(sc.error, sc.detail);
    res.config.scoring = sc.config;
  }
  for (const char* key : {"threshold", "low_risk_margin"}) {
    const json* v = find_field(j, key);
    if (!v) continue;
    if (!v->is_number_integer()) return config_fail<GateConfigParse>(ConfigError::MalformedConfig, key);
    auto n = v->get<int64_t>();
    if (n < 0 || n > 100) return config_fail<GateConfigParse>(ConfigError::MalformedConfig, key);
    int& slot = std::string(key) == "threshold" ? res.config.threshold : res.config.low_risk_margin;
    slot = static_cast<int>(n);
  }
  std::string bad;
  if (!read_number(j, "weak_signal_ratio", res.config.weak_signal_ratio, bad) ||
      res.config.weak_signal_ratio < 0.0 || res.config.weak_signal_ratio > 1.0) {
    return config_fail<GateConfigParse>(ConfigError::MalformedConfig, "weak_signal_ratio");
  }
  res.ok = true;
  res.error = ConfigError::None;
  return res;
}

GateConfigParse parse_gate_config(const std::string& text) {
  try {
    return parse_gate_config(json::parse(text));
  } catch (const json::exception& e) {
    return config_fail<GateConfigParse>(ConfigError::MalformedConfig, e.what());
  }
}

json handle_eval_request(const AuthGate& gate, const std::string& line) {
  json req;
  try {
    req = json::parse(line);
  } catch (const json::exception&) {
    return error_response(InputError::MalformedPayload, "");
  }
  if (!req.is_object()) return error_response(InputError::MalformedPayload, "");
  const json* behavior = find_field(req, "behavior");
  if (!behavior) return error_response(InputError::MissingField, "behavior");
  auto sample = parse_sample(*behavior);
  if (!sample.ok) return error_response(sample.error, sample.field);

  BaselineProfile baseline{};
  if (const json* stored = find_field(req, "baseline")) {
    auto parsed = parse_baseline(*stored);
    if (!parsed.ok) return error_response(parsed.error, parsed.field);
    baseline = parsed.baseline;
  }
  return to_json(gate.evaluate(sample.sample, baseline));
}

json to_json(const ScoreResult& r) {
  json out = json::object();
  out["trust_score"] = r.total;
  out["raw"] = r.raw;
  out["sub_scores"] = r.sub_scores;
  out["matched_flags"] = r.matched_flags;
  out["excluded"] = r.excluded;
  return out;
}

json to_json(const AuthDecision& d) {
  json out = json::object();
  out["accepted"] = d.accepted();
  out["threshold"] = d.threshold;
  if (d.verdict == Verdict::Invalid) {
    out["error"] = input_error_name(d.error);
    out["field"] = d.signal ? signal_name(*d.signal) : "";
    return out;
  }
  out["trust_score"] = d.trust_score;
  out["risk_level"] = risk_level_name(d.risk);
  out["sub_scores"] = d.result.sub_scores;
  out["matched_flags"] = d.result.matched_flags;
  json weak = json::array();
  for (auto id : d.weak_signals) weak.push_back(signal_name(id));
  out["weak_signals"] = weak;
  if (!d.result.excluded.empty()) out["excluded"] = d.result.excluded;
  return out;
}

json to_json(const ScoringConfig& cfg) {
  json out = json::object();
  out["epsilon"] = cfg.epsilon;
  out["missing_hash_policy"] = policy_name(cfg.missing_hash);
  json signals = json::array();
  for (const auto& s : cfg.signals) {
    json entry = json::object();
    entry["name"] = signal_name(s.id);
    entry["weight"] = s.weight;
    entry["kind"] = kind_name(s.kind);
    switch (s.kind) {
      case SignalKind::Deviation: entry["d_max"] = s.d_max; break;
      case SignalKind::HardCap: entry["cap"] = s.cap; break;
      case SignalKind::CircularProximity: entry["max_hours"] = s.max_hours; break;
      case SignalKind::BinaryMatch: break;
    }
    signals.push_back(entry);
  }
  out["signals"] = signals;
  return out;
}

} // namespace trust
