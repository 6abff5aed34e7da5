#pragma once
#include <Eigen/Dense>
#include <vector>

namespace specclean {
	using Real     = double;
	using Vector   = Eigen::VectorXd;
	using Matrix   = Eigen::MatrixXd;
	using Index    = Eigen::Index;
	using IndexVec = std::vector<Index>;
	using Bitmask  = std::vector<int>;    // packed APOGEE_PIXMASK flags per pixel

	// error assigned to flagged pixels, weight 1/σ ≈ 1e-10 in the fit
	constexpr Real kSentinelError = 1e10;

	// pixels per APOGEE apStar spectrum
	constexpr Index kApogeeNpix = 8575;
} // namespace specclean
