#pragma once
#include <map>
#include <string>
#include <vector>
#include "binding_store.h"
#include "discovery_types.h"

DeviceType entryDeviceType(bool reachable, const Classification* classified);
MacStatus entryMacStatus(bool reachable, bool hasBinding, const std::string& boundMac,
                         const std::string& observedMac);

struct StageResults {
  std::map<std::string, bool> reachable;
  std::map<std::string, std::string> neighbors;
  std::map<std::string, Classification> classified;
};

class StateReconciler {
public:
  // prior: the previous pass, used only to carry serial numbers forward.
  StateReconciler(const BindingStore& bindings, const DiscoveryCache& prior);

  DiscoveryEntry reconcileOne(const std::string& ip, const StageResults& stages) const;
  // One entry per target, in target order.
  std::vector<DiscoveryEntry> reconcile(const std::vector<std::string>& targets,
                                        const StageResults& stages) const;

private:
  const BindingStore& bindings;
  std::map<std::string, std::string> priorSerials;
};
