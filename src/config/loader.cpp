#include <qcsim/config/loader.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include <qcsim/config/validator.hpp>

namespace qcsim::config {

static std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r");
    if (begin == std::string::npos) return {};
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(begin, end - begin + 1);
}

static bool parse_int(const std::string& key, const std::string& val, int& out,
                      std::vector<std::string>& errs) {
    try {
        std::size_t pos = 0;
        int v = std::stoi(val, &pos);
        if (pos != val.size()) throw std::invalid_argument("trailing characters");
        out = v;
        return true;
    } catch (const std::exception&) {
        errs.push_back(fmt::format("'{}' must be an integer: '{}'", key, val));
        return false;
    }
}

static bool parse_double(const std::string& key, const std::string& val, double& out,
                         std::vector<std::string>& errs) {
    try {
        std::size_t pos = 0;
        double v = std::stod(val, &pos);
        if (pos != val.size()) throw std::invalid_argument("trailing characters");
        out = v;
        return true;
    } catch (const std::exception&) {
        errs.push_back(fmt::format("'{}' must be a number: '{}'", key, val));
        return false;
    }
}

static void load_key_value(SimConfig& cfg, const std::string& text, std::vector<std::string>& errs) {
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = trim(line.substr(0, eq));
        std::string val = trim(line.substr(eq + 1));
        if (key == "max_qubits") parse_int(key, val, cfg.max_qubits, errs);
        else if (key == "workers") parse_int(key, val, cfg.workers, errs);
        else if (key == "norm_tolerance") parse_double(key, val, cfg.norm_tolerance, errs);
        else if (key == "output") cfg.output = val;
    }
}

std::vector<std::string> load_from_file(SimConfig& cfg, const std::string& path) {
    std::vector<std::string> errs;
    std::ifstream in(path);
    if (!in.good()) return errs; // optional

    std::stringstream buffer; buffer << in.rdbuf();
    std::string text = buffer.str();
    auto first_non_space = text.find_first_not_of(" \t\n\r");
    if (first_non_space == std::string::npos) return errs;

    if (text[first_non_space] == '{') {
        // JSON
        try {
            nlohmann::json j = nlohmann::json::parse(text);
            auto expect_integer = [&](const char* key) {
                if (j.contains(key) && !j.at(key).is_number_integer()) {
                    errs.push_back(fmt::format("'{}' must be an integer", key));
                }
            };
            expect_integer("max_qubits");
            expect_integer("workers");
            if (j.contains("norm_tolerance") && !j.at("norm_tolerance").is_number()) {
                errs.push_back("'norm_tolerance' must be a number");
            }
            if (j.contains("output") && !j.at("output").is_string()) {
                errs.push_back("'output' must be a string");
            }
            if (!errs.empty()) return errs;

            std::string e;
            if (j.contains("max_qubits") && !validate_max_qubits(j.at("max_qubits").get<int>(), e)) {
                errs.push_back(e);
            }
            if (j.contains("workers") && !validate_workers(j.at("workers").get<int>(), e)) {
                errs.push_back(e);
            }
            if (j.contains("output") && !validate_output(j.at("output").get<std::string>(), e)) {
                errs.push_back(e);
            }
            if (!errs.empty()) return errs;

            if (j.contains("max_qubits")) cfg.max_qubits = j.at("max_qubits").get<int>();
            if (j.contains("workers")) cfg.workers = j.at("workers").get<int>();
            if (j.contains("norm_tolerance")) cfg.norm_tolerance = j.at("norm_tolerance").get<double>();
            if (j.contains("output")) cfg.output = j.at("output").get<std::string>();
        } catch (const std::exception& ex) {
            errs.push_back(fmt::format("Failed to read {}: {}", path, ex.what()));
        }
    } else {
        load_key_value(cfg, text, errs);
    }
    return errs;
}

std::vector<std::string> apply_env_overrides(SimConfig& cfg) {
    std::vector<std::string> errs;
    if (const char* v = std::getenv("QCSIM_MAX_QUBITS")) parse_int("QCSIM_MAX_QUBITS", v, cfg.max_qubits, errs);
    if (const char* v = std::getenv("QCSIM_WORKERS")) parse_int("QCSIM_WORKERS", v, cfg.workers, errs);
    if (const char* v = std::getenv("QCSIM_NORM_TOLERANCE")) parse_double("QCSIM_NORM_TOLERANCE", v, cfg.norm_tolerance, errs);
    if (const char* v = std::getenv("QCSIM_OUTPUT")) cfg.output = v;
    return errs;
}

std::vector<std::string> validate_final(const SimConfig& cfg) {
    std::vector<std::string> errs;
    std::string e;
    if (!validate_max_qubits(cfg.max_qubits, e)) errs.push_back(e);
    if (!validate_workers(cfg.workers, e)) errs.push_back(e);
    if (!validate_norm_tolerance(cfg.norm_tolerance, e)) errs.push_back(e);
    if (!validate_output(cfg.output, e)) errs.push_back(e);
    return errs;
}

} // namespace qcsim::config
