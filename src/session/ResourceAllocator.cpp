#include "ResourceAllocator.hpp"

namespace ft {
const int ResourceAllocator::DEFAULT_PORT_BASE;
const int ResourceAllocator::DEFAULT_PORT_SPAN;

ResourceAllocator::ResourceAllocator(int _portBase, int _portSpan,
                                     const string& _host)
    : portBase(_portBase > 1024 ? _portBase : DEFAULT_PORT_BASE),
      portSpan(_portSpan > 100 ? _portSpan : DEFAULT_PORT_SPAN),
      host(_host.empty() ? "127.0.0.1" : _host) {
  if (portBase != _portBase || portSpan != _portSpan) {
    LOG(WARNING) << "Port range " << _portBase << "+" << _portSpan
                 << " rejected, using " << portBase << "+" << portSpan;
  }
}

optional<ResourceAssignment> ResourceAllocator::allocate(
    const string& taskId) {
  auto it = assignments.find(taskId);
  if (it != assignments.end()) {
    return it->second;
  }

  for (int offset = 0; offset < portSpan; offset++) {
    int candidate = portBase + offset;
    if (portsInUse.count(candidate)) {
      continue;
    }
    portsInUse.insert(candidate);

    ResourceAssignment assignment;
    assignment.set_task_id(taskId);
    assignment.set_session_id(sole::uuid4().str());
    assignment.set_port(candidate);
    assignment.set_host(host);
    assignment.set_base_url("http://" + host + ":" + to_string(candidate));
    assignment.set_assigned_at(nowMillis());
    assignments[taskId] = assignment;
    VLOG(1) << "Assigned port " << candidate << " to " << taskId;
    return assignment;
  }

  LOG(WARNING) << "No free port in [" << portBase << ", "
               << portBase + portSpan << ") for " << taskId;
  return nullopt;
}

void ResourceAllocator::release(const string& taskId) {
  auto it = assignments.find(taskId);
  if (it == assignments.end()) {
    return;
  }
  portsInUse.erase(it->second.port());
  assignments.erase(it);
}

optional<ResourceAssignment> ResourceAllocator::getAssignment(
    const string& taskId) const {
  auto it = assignments.find(taskId);
  if (it == assignments.end()) {
    return nullopt;
  }
  return it->second;
}

vector<ResourceAssignment> ResourceAllocator::listAssignments() const {
  vector<ResourceAssignment> result;
  for (const auto& it : assignments) {
    result.push_back(it.second);
  }
  return result;
}

map<string, string> ResourceAllocator::buildResourceEnv(
    const ResourceAssignment& assignment) {
  string port = to_string(assignment.port());
  return {
      {"FLEETTERM_TASK_ID", assignment.task_id()},
      {"FLEETTERM_SESSION_ID", assignment.session_id()},
      {"FLEETTERM_PORT", port},
      {"PORT", port},
      {"FLEETTERM_HOST", assignment.host()},
      {"FLEETTERM_BASE_URL", assignment.base_url()},
      {"ASPNETCORE_URLS", assignment.base_url()},
  };
}
}  // namespace ft
