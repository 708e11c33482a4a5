// lebwohl_lasher_kernel.hpp
#pragma once

#include <vector>
#include <random>

// Angle grid indexed lattice[x][y], owned by the caller.
using Lattice = std::vector<std::vector<double>>;

// Floored modulo: always in [0, n) for n > 0, also for negative i.
int wrap_index(int i, int n);

// Reduced energy of site (x, y) against its four periodic neighbours.
// Requires 0 <= x,y < N and an N x N lattice. Result lies in [-4, 2].
double site_energy(const Lattice& lattice, int x, int y, int N);

// Sum of site_energy over the whole lattice, row by row.
// Every bond is counted once from each end.
double lattice_energy(const Lattice& lattice, int N);

// One Metropolis sweep of N*N proposals at reduced temperature Ts.
// Mutates the lattice in place and returns the acceptance ratio in [0, 1].
// Requires Ts > 0 and N > 0; neither is checked here.
double mc_step(Lattice& lattice, double Ts, int N, std::mt19937& gen);
