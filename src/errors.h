// errors.h - Exception types raised by the tagstyle library
#pragma once

#include <stdexcept>
#include <string>

namespace tagstyle {

// Base class, catch this to handle any tagstyle failure
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Flag combination out of range, or an ill-formed flag table
class FlagError : public Error {
public:
    explicit FlagError(const std::string& what) : Error(what) {}
};

// Ill-formed markup, e.g. a phrase that is never closed
class ParseError : public Error {
public:
    explicit ParseError(const std::string& what) : Error(what) {}
};

// Positional style requested that was not supplied
class ArgumentError : public Error {
public:
    explicit ArgumentError(const std::string& what) : Error(what) {}
};

// Broken invariant inside the library itself, never caused by input
class InternalError : public Error {
public:
    explicit InternalError(const std::string& what) : Error(what) {}
};

} // namespace tagstyle
