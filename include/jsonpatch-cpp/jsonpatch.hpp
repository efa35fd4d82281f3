/// @file jsonpatch.hpp
/// @brief Umbrella header for the jsonpatch-cpp library.
///
/// Include this single header for access to all public types:
/// Value, Operation, Patch, ApplyOptions, Error and Exception, plus
/// create_patch, apply_patch, encode_patch/decode_patch and equal.

#pragma once

#include <jsonpatch-cpp/apply.hpp>
#include <jsonpatch-cpp/diff.hpp>
#include <jsonpatch-cpp/error.hpp>
#include <jsonpatch-cpp/json.hpp>
#include <jsonpatch-cpp/operation.hpp>
#include <jsonpatch-cpp/pointer.hpp>
#include <jsonpatch-cpp/value.hpp>
