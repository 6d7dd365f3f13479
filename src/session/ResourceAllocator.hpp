#ifndef __FT_RESOURCE_ALLOCATOR_HPP__
#define __FT_RESOURCE_ALLOCATOR_HPP__

#include "Headers.hpp"

namespace ft {
/**
 * @brief Hands out one local port and session id per task.
 *
 * Ports come from `[base, base + span)`; the lowest free one is used, so a
 * released port is reused by the next allocation.
 */
class ResourceAllocator {
 public:
  static const int DEFAULT_PORT_BASE = 4100;
  static const int DEFAULT_PORT_SPAN = 4000;

  /**
   * @param portBase Used only if above 1024, else DEFAULT_PORT_BASE.
   * @param portSpan Used only if above 100, else DEFAULT_PORT_SPAN.
   */
  ResourceAllocator(int portBase = DEFAULT_PORT_BASE,
                    int portSpan = DEFAULT_PORT_SPAN,
                    const string& host = "127.0.0.1");

  /**
   * @brief Returns the task's assignment, creating it on first use.
   * @return nullopt when every port in the range is taken.
   */
  optional<ResourceAssignment> allocate(const string& taskId);

  /** @brief Frees the task's port. Unknown tasks are ignored. */
  void release(const string& taskId);

  optional<ResourceAssignment> getAssignment(const string& taskId) const;

  vector<ResourceAssignment> listAssignments() const;

  /** @brief Environment variables that tell the session's tools its port. */
  static map<string, string> buildResourceEnv(
      const ResourceAssignment& assignment);

  int getPortBase() const { return portBase; }
  int getPortSpan() const { return portSpan; }

 protected:
  int portBase;
  int portSpan;
  string host;
  map<string, ResourceAssignment> assignments;
  set<int> portsInUse;
};
}  // namespace ft

#endif  // __FT_RESOURCE_ALLOCATOR_HPP__
