#include "state_reconciler.h"

DeviceType entryDeviceType(bool reachable, const Classification* classified)
{
  if (!reachable) return DeviceType::Unreachable;
  return classified ? classified->type : DeviceType::Other;
}

MacStatus entryMacStatus(bool reachable, bool hasBinding, const std::string& boundMac,
                         const std::string& observedMac)
{
  if (!hasBinding) return MacStatus::NoBinding;
  if (!reachable) return MacStatus::Unreachable;
  // Alive but absent from the neighbor table: taken as a tentative match.
  if (observedMac.empty()) return MacStatus::Match;
  return toLower(observedMac) == toLower(boundMac) ? MacStatus::Match : MacStatus::Mismatch;
}

StateReconciler::StateReconciler(const BindingStore& b, const DiscoveryCache& prior) : bindings(b)
{
  for (const auto& e : prior.entries) {
    if (e.serial.length()) priorSerials[e.ip] = e.serial;
  }
}

DiscoveryEntry StateReconciler::reconcileOne(const std::string& ip, const StageResults& stages) const
{
  DiscoveryEntry e;
  e.ip = ip;

  auto alive = stages.reachable.find(ip);
  bool reachable = alive != stages.reachable.end() && alive->second;
  auto neigh = stages.neighbors.find(ip);
  if (neigh != stages.neighbors.end()) e.discovered_mac = neigh->second;
  auto cls = stages.classified.find(ip);
  const Classification* classified = cls == stages.classified.end() ? nullptr : &cls->second;

  const Binding* binding = bindings.findByIp(ip);
  e.has_binding = binding != nullptr;
  if (binding) {
    e.hostname = binding->hostname;
    e.binding_mac = binding->mac;
    e.role = binding->role;
  } else if (const DeviceIdentity* id = bindings.identityByIp(ip)) {
    e.hostname = id->hostname;
  }
  if (e.role.empty() && e.hostname.length()) e.role = bindings.roleForHostname(e.hostname);

  e.device_type = entryDeviceType(reachable, classified);
  e.mac_status = entryMacStatus(reachable, e.has_binding, e.binding_mac, e.discovered_mac);

  if (reachable && classified) e.serial = classified->serial;
  if (e.serial.empty()) {
    auto prior = priorSerials.find(ip);
    if (prior != priorSerials.end()) e.serial = prior->second;
    else if (binding) e.serial = binding->serial;
  }

  if (reachable) e.source = e.discovered_mac.length() ? "Ping+ARP" : "Ping";
  e.post_provision = PostProvision::None;
  return e;
}

std::vector<DiscoveryEntry> StateReconciler::reconcile(const std::vector<std::string>& targets,
                                                       const StageResults& stages) const
{
  std::vector<DiscoveryEntry> entries;
  entries.reserve(targets.size());
  for (const auto& ip : targets) entries.push_back(reconcileOne(ip, stages));
  return entries;
}
