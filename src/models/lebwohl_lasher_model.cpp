// lebwohl_lasher_model.cpp
#include "../include/lebwohl_lasher_model.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

void check_lattice_shape(const Lattice& lattice, int N) {
    if (N <= 0 || lattice.size() != static_cast<size_t>(N)) {
        throw std::invalid_argument("Lattice is not " + std::to_string(N) + "x" + std::to_string(N));
    }
    for (const auto& row : lattice) {
        if (row.size() != static_cast<size_t>(N)) {
            throw std::invalid_argument("Lattice is not " + std::to_string(N) + "x" + std::to_string(N));
        }
    }
}

void check_site_index(int x, int y, int N) {
    if (x < 0 || x >= N || y < 0 || y >= N) {
        throw std::out_of_range("Site index outside the lattice");
    }
}

LebwohlLasherModel::LebwohlLasherModel(int L, double T)
    : LebwohlLasherModel(L, T, std::random_device{}())
{
}

LebwohlLasherModel::LebwohlLasherModel(int L, double T, unsigned int seed)
    : L(L), T(T),
      gen(seed),
      dist_angle(0.0, 2.0 * M_PI)
{
    check_params();
    lattice.assign(L, std::vector<double>(L));
    init_lattice();
}

void LebwohlLasherModel::check_params() const {
    if (L <= 0 || L > max_size) {
        throw std::invalid_argument("Lattice size must be in [1, " + std::to_string(max_size)
                                    + "], got " + std::to_string(L));
    }
    if (!(T > 0.0)) {
        throw std::invalid_argument("Temperature must be > 0, got " + std::to_string(T));
    }
}

void LebwohlLasherModel::init_lattice() {
    for (int i = 0; i < L; ++i) {
        for (int j = 0; j < L; ++j) {
            lattice[i][j] = dist_angle(gen);
        }
    }
}

double LebwohlLasherModel::metropolis_sweep() {
    return mc_step(lattice, T, L, gen);
}

double LebwohlLasherModel::compute_energy() const {
    return lattice_energy(lattice, L);
}

double LebwohlLasherModel::site_energy(int i, int j) const {
    check_site_index(i, j, L);
    return ::site_energy(lattice, i, j, L);
}

void LebwohlLasherModel::set_lattice(const Lattice& new_lattice) {
    check_lattice_shape(new_lattice, L);
    lattice = new_lattice;
}

void LebwohlLasherModel::set_seed(unsigned int seed) {
    gen.seed(seed);
}

void LebwohlLasherModel::set_T(double T_new) {
    if (!(T_new > 0.0)) {
        throw std::invalid_argument("Temperature must be > 0, got " + std::to_string(T_new));
    }
    T = T_new;
}
