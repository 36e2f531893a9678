/// @file jot.hpp
/// @brief Umbrella header for the jot-cpp library.
///
/// Include this single header for access to all public types:
/// Operation and its variants, Value, the object convenience operations,
/// serialization, the random generators, logging and Error.

#pragma once

#include <jot-cpp/error.hpp>
#include <jot-cpp/log.hpp>
#include <jot-cpp/objects.hpp>
#include <jot-cpp/op.hpp>
#include <jot-cpp/random.hpp>
#include <jot-cpp/serialization.hpp>
#include <jot-cpp/value.hpp>
