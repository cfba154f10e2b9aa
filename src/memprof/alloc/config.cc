// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "memprof/alloc/config.h"

#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <utility>

#include "memprof/logging/logging.h"

namespace memprof { namespace alloc {

Config parse_config(const char* conf) {
  Config cfg;
  if (!conf || !*conf) return cfg;
  auto is_space = [](char c){ return c==' '||c=='\t'||c=='\n' || c=='\r'; };
  std::string s(conf);
  std::size_t i = 0;
  auto trim = [&](std::string& t){ std::size_t a=0; while (a<t.size() && is_space(t[a])) ++a; std::size_t b=t.size(); while (b>a && is_space(t[b-1])) --b; t = t.substr(a, b-a); };
  auto to_uint = [&](const std::string& t, std::size_t& out)->bool{
    if (t.empty() || t[0] == '-') return false; char* end=nullptr; errno=0; unsigned long long x = std::strtoull(t.c_str(), &end, 10);
    if (errno!=0 || (end && *end!='\0')) return false; out = static_cast<std::size_t>(x); return true; };
  auto to_bool = [&](const std::string& t, bool& out)->bool{
    std::string u=t; for (auto& c: u) c = (char)std::tolower(c);
    if (u=="1"||u=="true"||u=="yes") { out=true; return true; }
    if (u=="0"||u=="false"||u=="no") { out=false; return true; }
    return false; };
  auto split_patterns = [&](const std::string& v){
    std::vector<std::string> out;
    std::size_t p = 0;
    while (p <= v.size()) {
      std::size_t q = v.find('|', p);
      if (q == std::string::npos) q = v.size();
      std::string item = v.substr(p, q - p);
      trim(item);
      if (!item.empty()) out.push_back(std::move(item));
      p = q + 1;
    }
    return out; };
  auto bad_value = [](const std::string& key, const std::string& val) {
    MEMPROF_LOG(WARNING) << "[memprof][config] ignoring malformed value '" << val << "' for key '" << key << "'";
  };
  while (i < s.size()) {
    while (i < s.size() && (is_space(s[i]) || s[i]==',')) ++i; if (i>=s.size()) break;
    std::size_t k0=i; while (i<s.size() && s[i] != '=' && s[i] != ',') ++i; if (i>=s.size()|| s[i] != '=') break; std::string key = s.substr(k0, i-k0); ++i;
    std::size_t v0=i; while (i<s.size() && s[i] != ',') ++i; std::string val = s.substr(v0, i-v0);
    trim(key); trim(val);
    if (key == "enabled") { bool b=false; if (to_bool(val, b)) cfg.enabled = b; else bad_value(key, val); }
    else if (key == "lock_timeout_us") {
      std::size_t v=0;
      if (to_uint(val, v)) {
        const auto cap = static_cast<std::size_t>(kMaxLockTimeout.count());
        if (v > cap) {
          MEMPROF_LOG(WARNING) << "[memprof][config] lock_timeout_us=" << val << " clamped to " << cap;
          v = cap;
        }
        cfg.lock_timeout = std::chrono::microseconds(static_cast<std::int64_t>(v));
      } else {
        bad_value(key, val);
      }
    }
    else if (key == "size_threshold") { std::size_t v=0; if (to_uint(val, v)) cfg.size_threshold = v; else bad_value(key, val); }
    else if (key == "classifier_fallback") { bool b=false; if (to_bool(val, b)) cfg.classifier_fallback = b; else bad_value(key, val); }
    else if (key == "classifier_max_frames") {
      std::size_t v=0;
      if (to_uint(val, v)) {
        if (v < 1) v = 1;
        if (v > kMaxClassifierFrames) v = kMaxClassifierFrames;
        cfg.classifier_max_frames = v;
      } else {
        bad_value(key, val);
      }
    }
    else if (key == "internal_patterns") { cfg.internal_patterns = split_patterns(val); }
    else if (key == "log_sealed_writes") { bool b=false; if (to_bool(val, b)) cfg.log_sealed_writes = b; else bad_value(key, val); }
    else { MEMPROF_LOG(WARNING) << "[memprof][config] unknown key '" << key << "'"; }
  }
  return cfg;
}

Config config_from_env() {
  return parse_config(std::getenv(kConfigEnvVar));
}

}} // namespace memprof::alloc
