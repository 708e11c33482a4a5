// lebwohl_lasher_kernel.cpp
#include "../include/lebwohl_lasher_kernel.hpp"
#include <cmath>
#include <cstddef>

int wrap_index(int i, int n) {
    int r = i % n;
    return r < 0 ? r + n : r;
}

namespace {

inline double pair_energy(double theta) {
    double c = std::cos(theta);
    return 0.5 * (1.0 - 3.0 * c * c);
}

}

double site_energy(const Lattice& lattice, int x, int y, int N) {
    int xp = wrap_index(x + 1, N);
    int xm = wrap_index(x - 1, N);
    int yp = wrap_index(y + 1, N);
    int ym = wrap_index(y - 1, N);

    double phi = lattice[x][y];
    double en = 0.0;
    en += pair_energy(phi - lattice[xp][y]);
    en += pair_energy(phi - lattice[xm][y]);
    en += pair_energy(phi - lattice[x][yp]);
    en += pair_energy(phi - lattice[x][ym]);
    return en;
}

double lattice_energy(const Lattice& lattice, int N) {
    double energy = 0.0;
    for (int i = 0; i < N; ++i) {
        for (int j = 0; j < N; ++j) {
            energy += site_energy(lattice, i, j, N);
        }
    }
    return energy;
}

double mc_step(Lattice& lattice, double Ts, int N, std::mt19937& gen) {
    const std::size_t n_proposals = static_cast<std::size_t>(N) * static_cast<std::size_t>(N);
    const double scale = 0.1 + Ts;

    std::uniform_int_distribution<int> dist_site(0, N - 1);
    std::normal_distribution<double> dist_angle(0.0, scale);
    std::uniform_real_distribution<double> dist_real(0.0, 1.0);

    // Whole batch is drawn before the lattice is touched: x, then y, then angles.
    std::vector<int> xran(n_proposals);
    std::vector<int> yran(n_proposals);
    std::vector<double> aran(n_proposals);
    for (int& ix : xran) ix = dist_site(gen);
    for (int& iy : yran) iy = dist_site(gen);
    for (double& ang : aran) ang = dist_angle(gen);

    std::size_t accept = 0;
    for (std::size_t k = 0; k < n_proposals; ++k) {
        int ix = xran[k];
        int iy = yran[k];
        double ang = aran[k];

        double en0 = site_energy(lattice, ix, iy, N);
        lattice[ix][iy] += ang;
        double en1 = site_energy(lattice, ix, iy, N);

        if (en1 <= en0) {
            ++accept;
        } else {
            double boltz = std::exp(-(en1 - en0) / Ts);
            if (boltz >= dist_real(gen)) {
                ++accept;
            } else {
                lattice[ix][iy] -= ang;
            }
        }
    }

    return static_cast<double>(accept) / n_proposals;
}
