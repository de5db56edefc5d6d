/**
 * @file exceptions.h
 * @brief Standard Exception Hierarchy
 *
 * Exceptions raised inside an authentication attempt are "unexpected
 * failures": the decision engine routes them through the failure hook and,
 * if unhandled, hands them back to the caller untouched.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace certauth {
namespace common {

/**
 * @brief Base exception for all certauth exceptions
 */
class CertAuthException : public std::runtime_error {
public:
    explicit CertAuthException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Certificate or CRL could not be decoded
 */
class ParsingException : public CertAuthException {
public:
    explicit ParsingException(const std::string& message)
        : CertAuthException("Parsing error: " + message) {}
};

/**
 * @brief Configuration error
 */
class ConfigException : public CertAuthException {
public:
    explicit ConfigException(const std::string& message)
        : CertAuthException("Configuration error: " + message) {}
};

/**
 * @brief Path-validation primitive failed internally (not a validation verdict)
 */
class ChainEngineException : public CertAuthException {
public:
    explicit ChainEngineException(const std::string& message)
        : CertAuthException("Chain engine error: " + message) {}
};

/**
 * @brief Hook produced something the engine cannot use
 */
class HookException : public CertAuthException {
public:
    explicit HookException(const std::string& message)
        : CertAuthException("Hook error: " + message) {}
};

/**
 * @brief Caller cancelled the attempt or its deadline passed
 */
class OperationCancelledException : public CertAuthException {
public:
    explicit OperationCancelledException(const std::string& message)
        : CertAuthException("Operation cancelled: " + message) {}
};

} // namespace common
} // namespace certauth
