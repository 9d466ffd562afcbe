#pragma once

#include "graph_phase.h"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace sdkgraph {

namespace trace_events {

struct pass_start {
  std::string pass;
  graph_phase phase;
};

struct pass_complete {
  std::string pass;
  graph_phase phase;
  std::int64_t modules_visited;
  std::int64_t duration_ms;
};

struct module_registered {
  std::string module;
  std::string variant;
  std::string type;
};

struct dependency_added {
  std::string parent;
  std::string dependency;
  std::string variant;
  std::string tag;
};

struct dependency_replaced {
  std::string dependent;
  std::string from;
  std::string to;
  std::string variant;
};

struct member_assigned {
  std::string member;
  std::string variant;
  std::string sdk;
};

struct requirements_propagated {
  std::string parent;
  std::string dependency;
  std::string variant;
  std::string sdks;
};

struct module_failed {
  std::string module;
  std::string variant;
  std::string message;
};

}  // namespace trace_events

using trace_event_t = std::variant<trace_events::pass_start,
                                   trace_events::pass_complete,
                                   trace_events::module_registered,
                                   trace_events::dependency_added,
                                   trace_events::dependency_replaced,
                                   trace_events::member_assigned,
                                   trace_events::requirements_propagated,
                                   trace_events::module_failed>;

std::string_view trace_event_name(trace_event_t const &event);
std::string trace_event_to_string(trace_event_t const &event);
std::string trace_event_to_json(trace_event_t const &event);

namespace tui {
extern bool g_trace_enabled;
void trace(trace_event_t event);

inline bool trace_enabled() { return g_trace_enabled; }
}  // namespace tui

struct pass_trace_scope {
  std::string pass;
  graph_phase phase;
  std::int64_t modules_visited{ 0 };
  std::chrono::steady_clock::time_point start;

  pass_trace_scope(std::string pass_name,
                   graph_phase phase_value,
                   std::chrono::steady_clock::time_point start_time);
  ~pass_trace_scope();
};

}  // namespace sdkgraph

#define SDKGRAPH_TRACE_UNLIKELY [[unlikely]]

#define SDKGRAPH_TRACE_EMIT(event_expr) \
  do { \
    if (::sdkgraph::tui::g_trace_enabled) SDKGRAPH_TRACE_UNLIKELY { \
        ::sdkgraph::tui::trace event_expr; \
      } \
  } while (0)

#define SDKGRAPH_TRACE_PASS_START(pass_value, phase_value) \
  SDKGRAPH_TRACE_EMIT((::sdkgraph::trace_events::pass_start{ \
      .pass = (pass_value), \
      .phase = (phase_value), \
  }))

#define SDKGRAPH_TRACE_PASS_COMPLETE(pass_value, phase_value, visited_value, duration_value) \
  SDKGRAPH_TRACE_EMIT((::sdkgraph::trace_events::pass_complete{ \
      .pass = (pass_value), \
      .phase = (phase_value), \
      .modules_visited = (visited_value), \
      .duration_ms = (duration_value), \
  }))

#define SDKGRAPH_TRACE_MODULE_REGISTERED(module_value, variant_value, type_value) \
  SDKGRAPH_TRACE_EMIT((::sdkgraph::trace_events::module_registered{ \
      .module = (module_value), \
      .variant = (variant_value), \
      .type = (type_value), \
  }))

#define SDKGRAPH_TRACE_DEPENDENCY_ADDED(parent_value, dependency_value, variant_value, tag_value) \
  SDKGRAPH_TRACE_EMIT((::sdkgraph::trace_events::dependency_added{ \
      .parent = (parent_value), \
      .dependency = (dependency_value), \
      .variant = (variant_value), \
      .tag = (tag_value), \
  }))

#define SDKGRAPH_TRACE_DEPENDENCY_REPLACED(dependent_value, from_value, to_value, variant_value) \
  SDKGRAPH_TRACE_EMIT((::sdkgraph::trace_events::dependency_replaced{ \
      .dependent = (dependent_value), \
      .from = (from_value), \
      .to = (to_value), \
      .variant = (variant_value), \
  }))

#define SDKGRAPH_TRACE_MEMBER_ASSIGNED(member_value, variant_value, sdk_value) \
  SDKGRAPH_TRACE_EMIT((::sdkgraph::trace_events::member_assigned{ \
      .member = (member_value), \
      .variant = (variant_value), \
      .sdk = (sdk_value), \
  }))

#define SDKGRAPH_TRACE_REQUIREMENTS_PROPAGATED(parent_value, \
                                               dependency_value, \
                                               variant_value, \
                                               sdks_value) \
  SDKGRAPH_TRACE_EMIT((::sdkgraph::trace_events::requirements_propagated{ \
      .parent = (parent_value), \
      .dependency = (dependency_value), \
      .variant = (variant_value), \
      .sdks = (sdks_value), \
  }))

#define SDKGRAPH_TRACE_MODULE_FAILED(module_value, variant_value, message_value) \
  SDKGRAPH_TRACE_EMIT((::sdkgraph::trace_events::module_failed{ \
      .module = (module_value), \
      .variant = (variant_value), \
      .message = (message_value), \
  }))
