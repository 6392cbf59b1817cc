#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <qcsim/quantum/circuit.hpp>

namespace qcsim::store {

// Hex SHA-256 of the circuit's canonical JSON encoding
std::string fingerprint(const quantum::Circuit& circuit);

// Storage seam for circuits. Ids are content fingerprints, so a stored
// circuit never changes under its id.
class CircuitRepository {
public:
    virtual ~CircuitRepository() = default;
    virtual std::string put(const quantum::Circuit& circuit) = 0;
    virtual std::optional<quantum::Circuit> get(const std::string& id) const = 0;
    virtual std::vector<std::string> list() const = 0;
    virtual bool remove(const std::string& id) = 0;
};

class InMemoryCircuitRepository : public CircuitRepository {
public:
    std::string put(const quantum::Circuit& circuit) override;
    std::optional<quantum::Circuit> get(const std::string& id) const override;
    std::vector<std::string> list() const override;
    bool remove(const std::string& id) override;

    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, quantum::Circuit> circuits_;
};

} // namespace qcsim::store
