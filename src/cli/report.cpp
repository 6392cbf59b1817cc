#include <qcsim/cli/report.hpp>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include <qcsim/quantum/circuit_json.hpp>
#include <qcsim/quantum/statistics.hpp>

namespace qcsim::cli {

// |q_{n-1}...q_0>
static std::string basis_label(std::size_t index, int num_qubits) {
    std::string bits(static_cast<std::size_t>(num_qubits), '0');
    for (int q = 0; q < num_qubits; ++q) {
        if ((index >> q) & 1ULL) bits[static_cast<std::size_t>(num_qubits - 1 - q)] = '1';
    }
    return fmt::format("|{}>", bits);
}

static void print_text_report(logging::Logger& log, const RunResult& run,
                              const quantum::StateSummary& summary, bool amplitudes) {
    const auto& circuit = run.circuit;
    const auto& state = run.state;
    log.info(fmt::format("{} [{}]: {} qubits, {} gates, depth {}", run.path, run.id.substr(0, 12),
                         circuit.num_qubits(), circuit.gates().size(), circuit.depth()));
    for (std::size_t i = 0; i < state.probabilities.size(); ++i) {
        if (state.probabilities[i] < 1e-12) continue;
        if (amplitudes) {
            const auto& a = state.amplitudes[i];
            log.info(fmt::format("  {}  p={:.6f}  amp=({:+.6f}, {:+.6f})", basis_label(i, state.num_qubits),
                                 state.probabilities[i], a.real(), a.imag()));
        } else {
            log.info(fmt::format("  {}  p={:.6f}", basis_label(i, state.num_qubits), state.probabilities[i]));
        }
    }
    log.info(fmt::format("  entanglement(q0|rest)={:.6f} bits  coherence={:.6e}  norm drift={:.3e}",
                         summary.entanglement, summary.coherence, summary.norm_deviation));
    const auto& specs = circuit.measurements();
    for (std::size_t i = 0; i < specs.size(); ++i) {
        log.info(fmt::format("  measure q{} ({}): P(0)={:.6f} P(1)={:.6f}", specs[i].qubit,
                             quantum::basis_name(specs[i].basis),
                             summary.measurement_probabilities[i][0],
                             summary.measurement_probabilities[i][1]));
    }
}

void write_report(std::FILE* out, logging::Logger& log, const config::SimConfig& cfg,
                  const std::vector<RunResult>& runs, bool amplitudes) {
    const bool as_json = cfg.output == "json";
    nlohmann::json report = nlohmann::json::array();
    for (const auto& run : runs) {
        auto summary = quantum::summarize(run.state, run.circuit.measurements());
        if (summary.norm_deviation > cfg.norm_tolerance) {
            log.warn(fmt::format("{}: state norm drifted by {:.3e} (tolerance {:.1e})", run.path,
                                 summary.norm_deviation, cfg.norm_tolerance));
        }
        if (as_json) {
            auto entry = quantum::summary_to_json(run.state, run.circuit, summary, amplitudes);
            entry["file"] = run.path;
            entry["id"] = run.id;
            report.push_back(std::move(entry));
        } else {
            print_text_report(log, run, summary, amplitudes);
        }
    }
    if (as_json) {
        fmt::print(out, "{}\n", report.dump(2));
        std::fflush(out);
    }
}

} // namespace qcsim::cli
