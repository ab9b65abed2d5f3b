#pragma once

#include <stdexcept>
#include <string>

// Base of every hard failure raised by the generator
class VaspflowError : public std::runtime_error
{
public:
    explicit VaspflowError(const std::string &what) : std::runtime_error(what) {}
};

// no structural-model file in the working directory
class InputMissingError : public VaspflowError
{
public:
    explicit InputMissingError(const std::string &what) : VaspflowError(what) {}
};

// more than one structural-model file
class InputAmbiguousError : public VaspflowError
{
public:
    explicit InputAmbiguousError(const std::string &what) : VaspflowError(what) {}
};

// NEB endpoints differ in element order or counts
class CompositionMismatchError : public VaspflowError
{
public:
    explicit CompositionMismatchError(const std::string &what) : VaspflowError(what) {}
};

class UnsupportedMethodError : public VaspflowError
{
public:
    explicit UnsupportedMethodError(const std::string &what) : VaspflowError(what) {}
};

class UnsupportedStageError : public VaspflowError
{
public:
    explicit UnsupportedStageError(const std::string &what) : VaspflowError(what) {}
};

class UnsupportedTaskError : public VaspflowError
{
public:
    explicit UnsupportedTaskError(const std::string &what) : VaspflowError(what) {}
};

// Con-TS needs exactly two constrained atoms
class ConstraintCountError : public VaspflowError
{
public:
    explicit ConstraintCountError(const std::string &what) : VaspflowError(what) {}
};

class CapabilityError : public VaspflowError
{
public:
    explicit CapabilityError(const std::string &what) : VaspflowError(what) {}
};

// out-of-range or conflicting command-line values
class InvalidOptionError : public VaspflowError
{
public:
    explicit InvalidOptionError(const std::string &what) : VaspflowError(what) {}
};

// malformed INCAR / POSCAR / KPATH / XSD text
class FormatError : public VaspflowError
{
public:
    explicit FormatError(const std::string &what) : VaspflowError(what) {}
};
