#include "trace.h"

#include "graph_phase.h"
#include "util.h"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <sstream>
#include <string>

namespace sdkgraph {

namespace {

std::tm make_utc_tm(std::time_t time) {
  std::tm result{};
  gmtime_r(&time, &result);
  return result;
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
  auto const seconds{ std::chrono::time_point_cast<std::chrono::seconds>(tp) };
  auto const millis{
    std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds).count()
  };

  std::time_t const timestamp{ std::chrono::system_clock::to_time_t(seconds) };
  std::tm const utc_tm{ make_utc_tm(timestamp) };

  char base[32]{};
  if (std::strftime(base, sizeof base, "%Y-%m-%dT%H:%M:%S", &utc_tm) == 0) { return {}; }

  char buffer[64]{};
  int const written{ std::snprintf(buffer,
                                   sizeof buffer,
                                   "%s.%03lldZ",
                                   base,
                                   static_cast<long long>(millis)) };
  if (written <= 0) { return {}; }

  return std::string{ buffer, static_cast<std::size_t>(written) };
}

void append_json_string(std::string &out, std::string_view value) {
  for (char const ch : value) {
    switch (ch) {
      case '\\': out.append("\\\\"); break;
      case '"': out.append("\\\""); break;
      case '\b': out.append("\\b"); break;
      case '\f': out.append("\\f"); break;
      case '\n': out.append("\\n"); break;
      case '\r': out.append("\\r"); break;
      case '\t': out.append("\\t"); break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20) {
          char escape[7]{};
          std::snprintf(escape,
                        sizeof escape,
                        "\\u%04x",
                        static_cast<unsigned int>(static_cast<unsigned char>(ch)));
          out.append(escape);
        } else {
          out.push_back(ch);
        }
        break;
    }
  }
}

void append_kv(std::string &out, char const *key, std::string_view value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":\"");
  append_json_string(out, value);
  out.push_back('"');
}

void append_kv(std::string &out, char const *key, std::int64_t value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":");
  out.append(std::to_string(value));
}

void append_phase(std::string &out, char const *key, graph_phase phase) {
  append_kv(out, key, graph_phase_name(phase));

  char number_key[64]{};
  std::snprintf(number_key, sizeof number_key, "%s_num", key);
  append_kv(out, number_key, static_cast<std::int64_t>(static_cast<int>(phase)));
}

}  // namespace

pass_trace_scope::pass_trace_scope(std::string pass_name,
                                   graph_phase phase_value,
                                   std::chrono::steady_clock::time_point start_time)
    : pass{ std::move(pass_name) }, phase{ phase_value }, start{ start_time } {
  SDKGRAPH_TRACE_PASS_START(pass, phase);
}

pass_trace_scope::~pass_trace_scope() {
  auto const duration_ms{ std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - start)
                              .count() };
  SDKGRAPH_TRACE_PASS_COMPLETE(pass,
                               phase,
                               modules_visited,
                               static_cast<std::int64_t>(duration_ms));
}

#define TRACE_NAME(type) \
  [](trace_events::type const &) -> std::string_view { return #type; }

std::string_view trace_event_name(trace_event_t const &event) {
  return std::visit(
      match{
          TRACE_NAME(pass_start),
          TRACE_NAME(pass_complete),
          TRACE_NAME(module_registered),
          TRACE_NAME(dependency_added),
          TRACE_NAME(dependency_replaced),
          TRACE_NAME(member_assigned),
          TRACE_NAME(requirements_propagated),
          TRACE_NAME(module_failed),
      },
      event);
}

#undef TRACE_NAME

std::string trace_event_to_string(trace_event_t const &event) {
  return std::visit(
      match{
          [](trace_events::pass_start const &value) {
            std::ostringstream oss;
            oss << "pass_start pass=" << value.pass
                << " phase=" << graph_phase_name(value.phase);
            return oss.str();
          },
          [](trace_events::pass_complete const &value) {
            std::ostringstream oss;
            oss << "pass_complete pass=" << value.pass
                << " phase=" << graph_phase_name(value.phase)
                << " modules_visited=" << value.modules_visited
                << " duration_ms=" << value.duration_ms;
            return oss.str();
          },
          [](trace_events::module_registered const &value) {
            std::ostringstream oss;
            oss << "module_registered module=" << value.module
                << " variant=" << value.variant << " type=" << value.type;
            return oss.str();
          },
          [](trace_events::dependency_added const &value) {
            std::ostringstream oss;
            oss << "dependency_added parent=" << value.parent
                << " dependency=" << value.dependency << " variant=" << value.variant
                << " tag=" << value.tag;
            return oss.str();
          },
          [](trace_events::dependency_replaced const &value) {
            std::ostringstream oss;
            oss << "dependency_replaced dependent=" << value.dependent
                << " from=" << value.from << " to=" << value.to
                << " variant=" << value.variant;
            return oss.str();
          },
          [](trace_events::member_assigned const &value) {
            std::ostringstream oss;
            oss << "member_assigned member=" << value.member
                << " variant=" << value.variant << " sdk=" << value.sdk;
            return oss.str();
          },
          [](trace_events::requirements_propagated const &value) {
            std::ostringstream oss;
            oss << "requirements_propagated parent=" << value.parent
                << " dependency=" << value.dependency << " variant=" << value.variant
                << " sdks=" << value.sdks;
            return oss.str();
          },
          [](trace_events::module_failed const &value) {
            std::ostringstream oss;
            oss << "module_failed module=" << value.module
                << " variant=" << value.variant << " message=" << value.message;
            return oss.str();
          },
      },
      event);
}

std::string trace_event_to_json(trace_event_t const &event) {
  std::string output;
  output.reserve(256);

  output.append("{\"ts\":\"");
  output.append(format_timestamp(std::chrono::system_clock::now()));
  output.append("\",\"event\":\"");
  output.append(trace_event_name(event));
  output.push_back('"');

  std::visit(
      match{
          [&](trace_events::pass_start const &value) {
            append_kv(output, "pass", value.pass);
            append_phase(output, "phase", value.phase);
          },
          [&](trace_events::pass_complete const &value) {
            append_kv(output, "pass", value.pass);
            append_phase(output, "phase", value.phase);
            append_kv(output, "modules_visited", value.modules_visited);
            append_kv(output, "duration_ms", value.duration_ms);
          },
          [&](trace_events::module_registered const &value) {
            append_kv(output, "module", value.module);
            append_kv(output, "variant", value.variant);
            append_kv(output, "type", value.type);
          },
          [&](trace_events::dependency_added const &value) {
            append_kv(output, "parent", value.parent);
            append_kv(output, "dependency", value.dependency);
            append_kv(output, "variant", value.variant);
            append_kv(output, "tag", value.tag);
          },
          [&](trace_events::dependency_replaced const &value) {
            append_kv(output, "dependent", value.dependent);
            append_kv(output, "from", value.from);
            append_kv(output, "to", value.to);
            append_kv(output, "variant", value.variant);
          },
          [&](trace_events::member_assigned const &value) {
            append_kv(output, "member", value.member);
            append_kv(output, "variant", value.variant);
            append_kv(output, "sdk", value.sdk);
          },
          [&](trace_events::requirements_propagated const &value) {
            append_kv(output, "parent", value.parent);
            append_kv(output, "dependency", value.dependency);
            append_kv(output, "variant", value.variant);
            append_kv(output, "sdks", value.sdks);
          },
          [&](trace_events::module_failed const &value) {
            append_kv(output, "module", value.module);
            append_kv(output, "variant", value.variant);
            append_kv(output, "message", value.message);
          },
      },
      event);

  output.push_back('}');
  return output;
}

}  // namespace sdkgraph
