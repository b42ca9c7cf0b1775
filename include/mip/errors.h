#pragma once
/*
===============================================================================
ERRORS — Exception types raised by the MIP modeling DSL
===============================================================================

OVERVIEW
--------
Every contract violation is reported synchronously with an exception. Each
kind derives from the standard exception of its category so callers may
catch either the precise kind or the std:: base.

    TypeMismatch         : std::invalid_argument  operand outside {Var, LinExpr, real}
    LengthMismatch       : std::invalid_argument  parallel sequences of different size
    InvalidVariableType  : std::invalid_argument  type outside {B, C, I}
    InvalidSense         : std::domain_error      sense outside {"", =, <, >} or misplaced
    ModelMismatch        : std::logic_error       handles of different models mixed

Missing solution values are not errors; they are reported as std::nullopt.

===============================================================================
*/

#include <stdexcept>
#include <string>

namespace mip {

    class TypeMismatch : public std::invalid_argument {
    public:
        explicit TypeMismatch(const std::string& what)
            : std::invalid_argument(what) {
        }
    };

    class LengthMismatch : public std::invalid_argument {
    public:
        explicit LengthMismatch(const std::string& what)
            : std::invalid_argument(what) {
        }
    };

    class InvalidVariableType : public std::invalid_argument {
    public:
        explicit InvalidVariableType(const std::string& what)
            : std::invalid_argument(what) {
        }
    };

    class InvalidSense : public std::domain_error {
    public:
        explicit InvalidSense(const std::string& what)
            : std::domain_error(what) {
        }
    };

    /// Raised when an expression or literal refers to variables of a model
    /// other than the one it is combined with or registered in.
    class ModelMismatch : public std::logic_error {
    public:
        explicit ModelMismatch(const std::string& what)
            : std::logic_error(what) {
        }
    };

} // namespace mip
