#pragma once

/**
 * Profile-likelihood elbow detection on a scree plot.
 *
 * Values at or below `threshold` are dropped and the rest are sorted in
 * descending order. Each round scans every split d of the remaining sequence,
 * models the first d values and the rest as two Normals with their own means
 * and one pooled standard deviation (ddof = 1, computed once per round), and
 * keeps the split with the largest summed Normal density. The next round runs
 * on the values after that split. Elbows are absolute positions in the sorted
 * sequence. If the data runs out before `num_elbows` rounds complete, a final
 * elbow at the sequence length is appended.
 *
 * The search is greedy and sums plain densities (not log densities); both are
 * required to reproduce reference outputs and must not be "improved".
 *
 * References:
 * - Zhu & Ghodsi, "Automatic dimensionality selection from the scree plot via
 *   the use of profile likelihood", CSDA 51(2), 2006
 */

#include <Eigen/Dense>
#include <cstddef>
#include <vector>

namespace graphembed {

std::vector<size_t> find_elbows(const std::vector<double>& values,
                                size_t num_elbows = 1,
                                double threshold = 0.0);

// Runs on the per-column population standard deviation of an n x p matrix
std::vector<size_t> find_elbows(const Eigen::MatrixXd& values,
                                size_t num_elbows = 1,
                                double threshold = 0.0);

} // namespace graphembed
