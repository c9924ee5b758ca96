#ifndef __ERRORS_HPP__
#define __ERRORS_HPP__

#include <stdexcept>
#include <string>

// Base class of every error raised by the library.
class ImplicitError : public std::runtime_error {
  public:
    explicit ImplicitError(const std::string& message) : std::runtime_error(message) {}
};

// predict / evaluate on a model that has no parameter tables yet
class NotFitted : public ImplicitError {
  public:
    explicit NotFitted(const std::string& message = "Model must be fitted first.") : ImplicitError(message) {}
};

// user or item id outside the bounds of a matrix or of the trained tables
class InvalidIndex : public ImplicitError {
  public:
    explicit InvalidIndex(const std::string& message) : ImplicitError(message) {}
};

class EmptyInput : public ImplicitError {
  public:
    explicit EmptyInput(const std::string& message) : ImplicitError(message) {}
};

class InvalidConfiguration : public ImplicitError {
  public:
    explicit InvalidConfiguration(const std::string& message) : ImplicitError(message) {}
};

#endif
