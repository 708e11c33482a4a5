// lebwohl_lasher_model.hpp
#pragma once

#include <vector>
#include <random>
#include "lebwohl_lasher_kernel.hpp"

// Throws std::invalid_argument unless the lattice is N x N with N > 0.
void check_lattice_shape(const Lattice& lattice, int N);
// Throws std::out_of_range unless 0 <= x,y < N.
void check_site_index(int x, int y, int N);

class LebwohlLasherModel {
public:
    // Largest side for which L*L still fits in an int.
    static constexpr int max_size = 46340;

    LebwohlLasherModel(int L, double T);
    LebwohlLasherModel(int L, double T, unsigned int seed);

    double metropolis_sweep();           // returns acceptance ratio
    double compute_energy() const;
    double site_energy(int i, int j) const;
    const Lattice& get_lattice() const { return lattice; }
    void set_lattice(const Lattice& new_lattice);
    void set_seed(unsigned int seed);
    void set_T(double T_new);
    double get_T() const { return T; }
    int size() const { return L; }

private:
    int L;                  // Lattice size (LxL)
    double T;               // Reduced temperature
    Lattice lattice;        // Angle values: theta_i in [0, 2pi) at start

    std::mt19937 gen;
    std::uniform_real_distribution<double> dist_angle; // [0, 2pi)

    void check_params() const;
    void init_lattice();
};
