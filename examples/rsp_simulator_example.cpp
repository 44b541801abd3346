/**
 * M2M Remote SIM Provisioning simulator example
 *
 * Builds SM-DP, SM-SR and one eUICC in process, provisions a telecom
 * profile through the four phases and prints the report, the entity
 * status probes and the recorded phase timings.
 *
 * Usage: rsp_simulator_example [config.json]
 */

#include <rsp/orchestrator.h>
#include <rsp/simulator_config.h>
#include <rsp/monitoring/metrics_system.h>
#include <iostream>
#include <iomanip>
#include <memory>

using namespace rsp;

namespace {

void print_timings(const monitoring::InMemoryMetricsCollector& metrics) {
    auto snapshot = metrics.get_metrics();
    std::cout << "\nPhase timings:" << std::endl;
    for (const auto& name : metrics.recorded_names()) {
        const auto& stats = snapshot.durations[name];
        std::cout << "  " << std::left << std::setw(22) << name
                  << std::fixed << std::setprecision(3)
                  << stats.last_seconds * 1000.0 << " ms" << std::endl;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        SimulatorConfig config;
        if (argc >= 2) {
            auto loaded = load_simulator_config(argv[1]);
            if (!loaded) {
                std::cerr << "Cannot load configuration " << argv[1] << ": "
                          << error_message(loaded.error()) << std::endl;
                return 1;
            }
            config = *loaded;
        }

        std::cout << "M2M RSP Simulator" << std::endl;
        std::cout << "=================" << std::endl;

        auto metrics = std::make_shared<monitoring::InMemoryMetricsCollector>();
        auto simulator = build_simulator(config, metrics);
        if (!simulator) {
            std::cerr << "Simulator setup failed: " << error_message(simulator.error()) << std::endl;
            return 1;
        }

        ProvisioningReport report = (*simulator)->orchestrator->run();

        std::cout << "\nProvisioning report:" << std::endl;
        std::cout << report.to_json().dump(2) << std::endl;

        std::cout << "\nEntity status:" << std::endl;
        std::cout << (*simulator)->smdp->status().dump(2) << std::endl;
        std::cout << (*simulator)->smsr->status().dump(2) << std::endl;
        std::cout << (*simulator)->euicc->status().dump(2) << std::endl;

        if (report.success) {
            auto installed = (*simulator)->euicc->installed_profile(report.iccid);
            if (installed) {
                std::cout << "\nProfile on eUICC: " << installed->dump() << std::endl;
            }
        }

        print_timings(*metrics);
        return report.success ? 0 : 2;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
