#include <qcsim/store/circuit_repository.hpp>

#include <qcsim/crypto/sha256.hpp>
#include <qcsim/quantum/circuit_json.hpp>

namespace qcsim::store {

std::string fingerprint(const quantum::Circuit& circuit) {
    // nlohmann::json objects are key-sorted, so dump() is canonical
    return crypto::to_hex(crypto::sha256(quantum::circuit_to_json(circuit).dump()));
}

std::string InMemoryCircuitRepository::put(const quantum::Circuit& circuit) {
    std::string id = fingerprint(circuit);
    std::lock_guard<std::mutex> lock(mutex_);
    circuits_.emplace(id, circuit);
    return id;
}

std::optional<quantum::Circuit> InMemoryCircuitRepository::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = circuits_.find(id);
    if (it == circuits_.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> InMemoryCircuitRepository::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(circuits_.size());
    for (const auto& kv : circuits_) ids.push_back(kv.first);
    return ids;
}

bool InMemoryCircuitRepository::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return circuits_.erase(id) > 0;
}

std::size_t InMemoryCircuitRepository::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return circuits_.size();
}

} // namespace qcsim::store
