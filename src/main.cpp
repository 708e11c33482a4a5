// main.cpp
#include <iostream>
#include <memory>
#include <string>
#include <iomanip>
#include <chrono>
#include <stdexcept>
#include <new>

#include "include/lebwohl_lasher_model.hpp"

namespace {

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " [--L <size>] [--T <temperature>] [--steps <sweeps>]"
              << " [--seed <uint>] [--interval <sweeps>] [--T-end <temperature>]"
              << std::endl;
}

}

int main(int argc, char* argv[]) {
    // Default parameter values
    int L = 50;
    double T = 0.5;
    int steps = 1000;
    int interval = 100;
    bool has_seed = false;
    unsigned int seed = 0;
    bool has_T_end = false;
    double T_end = 0.0;

    // Parse command-line arguments
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--L" && i + 1 < argc) L = std::stoi(argv[++i]);
            else if (arg == "--T" && i + 1 < argc) T = std::stod(argv[++i]);
            else if (arg == "--steps" && i + 1 < argc) steps = std::stoi(argv[++i]);
            else if (arg == "--interval" && i + 1 < argc) interval = std::stoi(argv[++i]);
            else if (arg == "--seed" && i + 1 < argc) {
                seed = static_cast<unsigned int>(std::stoul(argv[++i]));
                has_seed = true;
            }
            else if (arg == "--T-end" && i + 1 < argc) {
                T_end = std::stod(argv[++i]);
                has_T_end = true;
            }
            else {
                std::cerr << "Unknown or incomplete argument: " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::logic_error& e) {
        // std::stoi and friends throw invalid_argument / out_of_range
        std::cerr << "Invalid numeric argument: " << e.what() << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    if (steps < 0 || interval <= 0 || (has_T_end && !(T_end > 0.0))) {
        std::cerr << "steps must be >= 0, interval > 0 and T-end > 0" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    std::unique_ptr<LebwohlLasherModel> sim;
    try {
        sim = has_seed ? std::make_unique<LebwohlLasherModel>(L, T, seed)
                       : std::make_unique<LebwohlLasherModel>(L, T);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        print_usage(argv[0]);
        return 1;
    } catch (const std::bad_alloc&) {
        std::cerr << "Error: not enough memory for a " << L << "x" << L << " lattice" << std::endl;
        return 1;
    }

    // Trajectory is streamed, only the running values are kept.
    double energy = sim->compute_energy();
    double ratio = 0.5;     // ideal value
    double ratio_sum = 0.0;

    std::cout << std::fixed << std::setprecision(4);
    std::cout << "step,T,energy,acceptance" << "\n";
    std::cout << 0 << "," << T << "," << energy << "," << ratio << "\n";

    auto start = std::chrono::steady_clock::now();
    try {
        for (long long it = 1; it <= steps; ++it) {
            if (has_T_end && steps > 1) {
                // linear ramp from T at step 1 to T_end at the last step
                double Ts = T + (T_end - T) * (it - 1) / (steps - 1);
                sim->set_T(Ts);
            } else if (has_T_end) {
                sim->set_T(T_end);
            }
            ratio = sim->metropolis_sweep();
            energy = sim->compute_energy();
            ratio_sum += ratio;

            if (it % interval == 0) {
                std::cout << it << "," << sim->get_T() << "," << energy << "," << ratio << "\n";
            }
        }
    } catch (const std::bad_alloc&) {
        // the sweep keeps its L*L proposal batch in memory
        std::cerr << "Error: not enough memory for a sweep of " << L << "x" << L << " proposals" << std::endl;
        return 1;
    }
    auto stop = std::chrono::steady_clock::now();
    double runtime = std::chrono::duration<double>(stop - start).count();

    double mean_ratio = steps > 0 ? ratio_sum / steps : 0.0;

    std::cout << "Program: " << argv[0]
              << " | Size: " << L
              << " | Steps: " << steps
              << " | T*: " << std::setprecision(3) << sim->get_T()
              << " | Energy: " << std::setprecision(4) << energy
              << " | Acceptance: " << std::setprecision(3) << mean_ratio
              << " | Time: " << std::setprecision(6) << runtime << " s"
              << std::endl;

    return 0;
}
