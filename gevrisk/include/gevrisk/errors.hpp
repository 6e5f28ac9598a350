#pragma once

#include <stdexcept>
#include <string>

namespace gevrisk {

/**
 * @brief Maximum-likelihood fitting failed or the sample cannot be fitted.
 *
 * Recovered per window: the window's statistics become absent.
 */
class FitError : public std::runtime_error {
public:
	explicit FitError(const std::string &message) : std::runtime_error(message) {
	}
};

/**
 * @brief An observation series is too short for a requested window.
 *
 * Recovered exactly like FitError.
 */
class InsufficientDataError : public std::runtime_error {
public:
	explicit InsufficientDataError(const std::string &message) : std::runtime_error(message) {
	}
};

/**
 * @brief Input tables are structurally inconsistent. Aborts the run.
 */
class MalformedInputError : public std::runtime_error {
public:
	explicit MalformedInputError(const std::string &message) : std::runtime_error(message) {
	}
};

} // namespace gevrisk
