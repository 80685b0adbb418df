#ifndef ERRORS_H
#define ERRORS_H

#include <stdexcept>
#include <string>

// bad grid dimensions or command-line values, fatal at startup
struct ConfigurationError : public std::runtime_error {
	explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

// a compute/render program failed to build or a dispatch failed
struct ParallelEvaluatorFailure : public std::runtime_error {
	explicit ParallelEvaluatorFailure(const std::string& what) : std::runtime_error(what) {}
};

// lookup of a name that is not in the catalog
struct PatternNotFound : public std::runtime_error {
	explicit PatternNotFound(const std::string& name)
		: std::runtime_error("Pattern not found: " + name), _name(name) {}

	const std::string& name() const { return _name; }

private:
	std::string _name;
};

#endif
