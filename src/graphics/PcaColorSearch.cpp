#include "graphics/PcaColorSearch.h"
#include <algorithm>
#include <cmath>

namespace TermCanvas::Graphics {

namespace {

using Matrix3 = std::array<std::array<double, 3>, 3>;

constexpr int kMaxJacobiSweeps = 50;
constexpr double kEpsilon = 1e-9;

// Cyclic Jacobi rotation for a symmetric 3x3 matrix. On return the
// diagonal of a holds the eigenvalues and the columns of v the eigenvectors.
void JacobiEigen(Matrix3 a, std::array<double, 3>& eigenvalues, Matrix3& v) {
    for (int i = 0; i < 3; ++i) {
        for (int j = 0; j < 3; ++j) {
            v[i][j] = (i == j) ? 1.0 : 0.0;
        }
    }

    for (int sweep = 0; sweep < kMaxJacobiSweeps; ++sweep) {
        double off = std::fabs(a[0][1]) + std::fabs(a[0][2]) + std::fabs(a[1][2]);
        if (off < kEpsilon) {
            break;
        }

        for (int p = 0; p < 2; ++p) {
            for (int q = p + 1; q < 3; ++q) {
                if (std::fabs(a[p][q]) < kEpsilon) {
                    continue;
                }

                double theta = (a[q][q] - a[p][p]) / (2.0 * a[p][q]);
                double t = (theta >= 0 ? 1.0 : -1.0) /
                           (std::fabs(theta) + std::sqrt(theta * theta + 1.0));
                double c = 1.0 / std::sqrt(t * t + 1.0);
                double s = t * c;

                // A' = J^T A J
                for (int k = 0; k < 3; ++k) {
                    double akp = a[k][p];
                    double akq = a[k][q];
                    a[k][p] = c * akp - s * akq;
                    a[k][q] = s * akp + c * akq;
                }
                for (int k = 0; k < 3; ++k) {
                    double apk = a[p][k];
                    double aqk = a[q][k];
                    a[p][k] = c * apk - s * aqk;
                    a[q][k] = s * apk + c * aqk;
                }
                for (int k = 0; k < 3; ++k) {
                    double vkp = v[k][p];
                    double vkq = v[k][q];
                    v[k][p] = c * vkp - s * vkq;
                    v[k][q] = s * vkp + c * vkq;
                }
            }
        }
    }

    for (int i = 0; i < 3; ++i) {
        eigenvalues[i] = a[i][i];
    }
}

int Channel(uint32_t color, int shift) {
    return static_cast<int>((color >> shift) & 0xFF);
}

} // namespace

PcaColorSearch::PcaColorSearch(const std::vector<uint32_t>& palette) {
    if (palette.empty()) {
        return;
    }

    const double n = static_cast<double>(palette.size());
    std::array<double, 3> mean = {0.0, 0.0, 0.0};
    for (uint32_t color : palette) {
        mean[0] += Channel(color, 16);
        mean[1] += Channel(color, 8);
        mean[2] += Channel(color, 0);
    }
    for (double& m : mean) {
        m /= n;
    }

    Matrix3 covariance = {};
    for (uint32_t color : palette) {
        double d[3] = {
            Channel(color, 16) - mean[0],
            Channel(color, 8) - mean[1],
            Channel(color, 0) - mean[2]
        };
        for (int i = 0; i < 3; ++i) {
            for (int j = 0; j < 3; ++j) {
                covariance[i][j] += d[i] * d[j];
            }
        }
    }
    for (auto& row : covariance) {
        for (double& value : row) {
            value /= n;
        }
    }

    std::array<double, 3> eigenvalues;
    Matrix3 eigenvectors;
    JacobiEigen(covariance, eigenvalues, eigenvectors);

    int principal = static_cast<int>(
        std::max_element(eigenvalues.begin(), eigenvalues.end()) - eigenvalues.begin());
    if (eigenvalues[principal] > kEpsilon) {
        std::array<double, 3> axis = {
            eigenvectors[0][principal], eigenvectors[1][principal], eigenvectors[2][principal]
        };
        double length = std::sqrt(axis[0] * axis[0] + axis[1] * axis[1] + axis[2] * axis[2]);
        if (length > kEpsilon) {
            for (double& component : axis) {
                component /= length;
            }
            m_axis = axis;
        }
    }

    m_entries.reserve(palette.size());
    for (size_t i = 0; i < palette.size(); ++i) {
        int r = Channel(palette[i], 16);
        int g = Channel(palette[i], 8);
        int b = Channel(palette[i], 0);
        m_entries.push_back({Project(r, g, b), static_cast<int>(i), r, g, b});
    }
    std::sort(m_entries.begin(), m_entries.end(), [](const Entry& a, const Entry& b) {
        return a.projection < b.projection ||
               (a.projection == b.projection && a.index < b.index);
    });
}

int PcaColorSearch::FindNearest(uint32_t color) const {
    if (m_entries.empty()) {
        return -1;
    }

    int r = Channel(color, 16);
    int g = Channel(color, 8);
    int b = Channel(color, 0);
    double projection = Project(r, g, b);

    auto start = std::lower_bound(m_entries.begin(), m_entries.end(), projection,
        [](const Entry& e, double value) { return e.projection < value; });
    int up = static_cast<int>(start - m_entries.begin());
    int down = up - 1;

    int bestIndex = -1;
    int bestDist = 0;

    auto consider = [&](const Entry& e) {
        int dr = e.r - r;
        int dg = e.g - g;
        int db = e.b - b;
        int dist = dr * dr + dg * dg + db * db;
        if (bestIndex < 0 || dist < bestDist || (dist == bestDist && e.index < bestIndex)) {
            bestIndex = e.index;
            bestDist = dist;
        }
    };

    // Small slack keeps rounding in the projections from pruning a tie
    auto pruned = [&](const Entry& e) {
        double axisDist = e.projection - projection;
        return bestIndex >= 0 && axisDist * axisDist > bestDist + 1e-6;
    };

    const int count = static_cast<int>(m_entries.size());
    while (up < count || down >= 0) {
        if (up < count) {
            if (pruned(m_entries[up])) {
                up = count;
            } else {
                consider(m_entries[up]);
                ++up;
            }
        }
        if (down >= 0) {
            if (pruned(m_entries[down])) {
                down = -1;
            } else {
                consider(m_entries[down]);
                --down;
            }
        }
    }

    return bestIndex;
}

} // namespace TermCanvas::Graphics
