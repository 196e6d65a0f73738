//-----------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------
//
// PoverlapErrors - Exceptions raised by the interval
// transforms and the permutation engine. The command
// driver catches these at the subprogram boundary.
//
#ifndef POVERLAPERRORS_H
#define POVERLAPERRORS_H

#include <stdexcept>
#include <string>

class PoverlapError : public std::runtime_error
{
    public:
        explicit PoverlapError(const std::string& msg) : std::runtime_error(msg) {}
};

// Invalid parameters: a non-positive sample size or trial count,
// a missing genome file or a label that does not occur in the input
class ConfigurationError : public PoverlapError
{
    public:
        explicit ConfigurationError(const std::string& msg) : PoverlapError(msg) {}
};

// An empty interval set was given where records are required
class DegenerateInputError : public PoverlapError
{
    public:
        explicit DegenerateInputError(const std::string& msg) : PoverlapError(msg) {}
};

// The overlap counter or the genome shuffler could not produce a result
class ExternalServiceError : public PoverlapError
{
    public:
        explicit ExternalServiceError(const std::string& msg) : PoverlapError(msg) {}
};

// Malformed BED or genome file
class ParseError : public PoverlapError
{
    public:
        explicit ParseError(const std::string& msg) : PoverlapError(msg) {}
};

#endif
